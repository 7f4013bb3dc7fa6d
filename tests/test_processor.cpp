/*
 * test_processor.cpp: Hybrid sweep orchestration
 */

#include <gtest/gtest.h>

#include "helpers.hpp"
#include "processor.hpp"

#include <algorithm>
#include <iterator>
#include <string>

using arch::Machine;
using proc::SeedOrigin;
using testutil::section;
using testutil::shared_image;
using testutil::symbol;

namespace {

proc::Analysis analyse(std::shared_ptr<const image::Image> img,
                       proc::ProcessorConfig cfg = {})
{
    std::atomic<bool> cancel{false};
    proc::RunStatus st = proc::RunStatus::NO_CODE;
    auto out = proc::Processor(cfg).run(std::move(img), cancel, &st);
    EXPECT_EQ(st, proc::RunStatus::OK);
    EXPECT_TRUE(out.has_value());
    return out ? std::move(*out) : proc::Analysis{};
}

std::vector<uint64_t> addresses(const proc::Analysis &an)
{
    std::vector<uint64_t> out;
    for (auto &insn : an.stream)
        out.push_back(insn.address);
    return out;
}

void expect_disjoint(const proc::Stream &stream)
{
    for (size_t i = 1; i < stream.size(); i++)
        EXPECT_LE(stream[i - 1].end(), stream[i].address) << "entry " << i;
}

} // namespace

TEST(Processor, FollowsJumpIntoAnotherSection)
{
    auto img = shared_image(Machine::X86_64, 0x1000,
                            {section(".text", 0x1000, {0x89, 0xc8, 0xe9, 0xf9, 0x0f, 0x00, 0x00}),
                             section(".text2", 0x2000, {0xc3})});
    auto an = analyse(img);

    ASSERT_EQ(an.seeds.size(), 2u);
    EXPECT_EQ(an.seeds[0], (proc::Seed{0x1000, SeedOrigin::ENTRY}));
    EXPECT_EQ(an.seeds[1], (proc::Seed{0x2000, SeedOrigin::DISCOVERED}));
    EXPECT_EQ(addresses(an), (std::vector<uint64_t>{0x1000, 0x1002, 0x2000}));
    EXPECT_EQ(an.stream[2].flow, arch::Flow::RETURN);
    EXPECT_EQ(an.stats.rounds, 2u);
    EXPECT_EQ(an.stats.instructions, 3u);
}

TEST(Processor, InvalidBytesBecomeEntriesAndDecodingResumes)
{
    auto img = shared_image(Machine::X86_64, 0x1000,
                            {section(".text", 0x1000, {0x89, 0xc8, 0x89, 0xc8, 0x06, 0xc3})});
    auto an = analyse(img);

    ASSERT_EQ(an.stream.size(), 4u);
    EXPECT_TRUE(an.stream[2].is_error);
    EXPECT_EQ(an.stream[2].address, 0x1004u);
    EXPECT_EQ(an.stream[2].length, 1u);
    EXPECT_EQ(an.stream[3].address, 0x1005u);
    EXPECT_EQ(an.stats.invalid, 1u);
}

TEST(Processor, InvalidRunLimitAbandonsSweep)
{
    std::vector<uint8_t> code = {0x89, 0xc8, 0x06, 0x06, 0x06, 0xc3};
    proc::ProcessorConfig cfg;
    cfg.invalid_run_limit = 2;
    auto an = analyse(shared_image(Machine::X86_64, 0x1000, {section(".text", 0x1000, code)}),
                      cfg);
    EXPECT_EQ(addresses(an), (std::vector<uint64_t>{0x1000}));
    EXPECT_EQ(an.stats.data_runs, 1u);

    auto full = analyse(shared_image(Machine::X86_64, 0x1000, {section(".text", 0x1000, code)}));
    EXPECT_EQ(full.stream.size(), 5u);
    EXPECT_EQ(full.stats.data_runs, 0u);
}

TEST(Processor, JumpAcrossPaddingSeedsTargetInSameSection)
{
    std::vector<uint8_t> code(0x1001, 0xcc);
    const uint8_t head[] = {0x89, 0xc8, 0xe9, 0xf9, 0x0f, 0x00, 0x00};
    std::copy(std::begin(head), std::end(head), code.begin());
    code[0x1000] = 0xc3;
    auto an = analyse(shared_image(Machine::X86_64, 0x1000, {section(".text", 0x1000, code)}));

    ASSERT_EQ(an.seeds.size(), 2u);
    EXPECT_EQ(an.seeds[0], (proc::Seed{0x1000, SeedOrigin::ENTRY}));
    EXPECT_EQ(an.seeds[1], (proc::Seed{0x2000, SeedOrigin::DISCOVERED}));
    EXPECT_EQ(addresses(an), (std::vector<uint64_t>{0x1000, 0x1002, 0x2000}));
}

TEST(Processor, SweepPastBranchIsOptIn)
{
    std::vector<uint8_t> code(0x11, 0x90);
    const uint8_t head[] = {0xe9, 0x0b, 0x00, 0x00, 0x00, 0xc3};
    std::copy(std::begin(head), std::end(head), code.begin());
    code[0x10] = 0xc3;
    auto make = [&] {
        return shared_image(Machine::X86_64, 0x1000, {section(".text", 0x1000, code)});
    };

    auto plain = analyse(make());
    EXPECT_EQ(addresses(plain), (std::vector<uint64_t>{0x1000, 0x1010}));

    proc::ProcessorConfig cfg;
    cfg.sweep_past_branch = true;
    auto linear = analyse(make(), cfg);
    EXPECT_EQ(addresses(linear), (std::vector<uint64_t>{0x1000, 0x1005, 0x1010}));
}

TEST(Processor, BranchIntoOwnRunEndsSweep)
{
    auto an = analyse(shared_image(Machine::X86_64, 0x1000,
                                   {section(".text", 0x1000, {0xeb, 0xfe, 0x90, 0x90})}));
    EXPECT_EQ(addresses(an), (std::vector<uint64_t>{0x1000}));
}

TEST(Processor, OverlapKeepsConfirmedEntries)
{
    /* Entry at 0x1001 is "ret"; a symbol at 0x1000 decodes "mov eax, 0xc3" across it */
    std::vector<uint8_t> code = {0xb8, 0xc3, 0x00, 0x00, 0x00, 0xc3};
    auto img = shared_image(Machine::X86_64, 0x1001, {section(".text", 0x1000, code)},
                            {symbol(0x1000, "outer")});
    auto an = analyse(img);

    ASSERT_EQ(an.stream.size(), 2u);
    EXPECT_TRUE(an.stream[0].is_error);
    EXPECT_EQ(an.stream[0].address, 0x1000u);
    EXPECT_EQ(an.stream[0].length, 1u);
    EXPECT_EQ(an.stream[1].address, 0x1001u);
    EXPECT_EQ(an.stream[1].flow, arch::Flow::RETURN);
    EXPECT_EQ(an.stats.truncated_runs, 1u);
    EXPECT_EQ(an.stats.discarded, 2u);
}

TEST(Processor, OverlapDiscardPolicyDropsRun)
{
    std::vector<uint8_t> code = {0xb8, 0xc3, 0x00, 0x00, 0x00, 0xc3};
    auto img = shared_image(Machine::X86_64, 0x1001, {section(".text", 0x1000, code)},
                            {symbol(0x1000, "outer")});
    proc::ProcessorConfig cfg;
    cfg.overlap = proc::OverlapPolicy::DISCARD_RUN;
    auto an = analyse(img, cfg);

    EXPECT_EQ(addresses(an), (std::vector<uint64_t>{0x1001}));
    EXPECT_EQ(an.stats.discarded, 2u);
}

TEST(Processor, StreamIsDisjointAndIndependentOfWorkerCount)
{
    std::vector<uint8_t> code(1024);
    uint32_t x = 0x2545f491;
    for (auto &b : code) {
        x ^= x << 13;
        x ^= x >> 17;
        x ^= x << 5;
        b = (uint8_t)x;
    }
    std::vector<image::Symbol> syms;
    for (uint64_t a = 0x1000; a < 0x1400; a += 37)
        syms.push_back(symbol(a, "f" + std::to_string(a)));

    for (auto policy : {proc::OverlapPolicy::KEEP_CONFIRMED, proc::OverlapPolicy::DISCARD_RUN}) {
        proc::ProcessorConfig one, many;
        one.workers = 1;
        many.workers = 4;
        one.overlap = many.overlap = policy;
        auto a = analyse(shared_image(Machine::X86_64, 0x1000,
                                      {section(".text", 0x1000, code)}, syms), one);
        auto b = analyse(shared_image(Machine::X86_64, 0x1000,
                                      {section(".text", 0x1000, code)}, syms), many);
        expect_disjoint(a.stream);
        EXPECT_EQ(a.stream, b.stream);
        EXPECT_EQ(a.seeds, b.seeds);
    }
}

TEST(Processor, MipsDelaySlotFollowsReturn)
{
    auto img = shared_image(Machine::MIPS, 0x400000,
                            {section(".text", 0x400000,
                                     testutil::words_le({0x03e00008, 0x00000000, 0x27bdfff8}))});
    auto an = analyse(img);
    EXPECT_EQ(addresses(an), (std::vector<uint64_t>{0x400000, 0x400004}));
}

TEST(Processor, FollowsCodePointersWhenEnabled)
{
    std::vector<uint8_t> code(0x11, 0x90);
    const uint8_t head[] = {0xff, 0x25, 0xfa, 0x1f, 0x00, 0x00, 0xc3};
    std::copy(std::begin(head), std::end(head), code.begin());
    code[0x10] = 0xc3;
    std::vector<uint8_t> table = {0x10, 0x10, 0, 0, 0, 0, 0, 0};
    auto make = [&] {
        return shared_image(Machine::X86_64, 0x1000,
                            {section(".text", 0x1000, code),
                             section(".data", 0x3000, table, image::PERM_R)});
    };

    auto plain = analyse(make());
    EXPECT_EQ(addresses(plain), (std::vector<uint64_t>{0x1000, 0x1006}));

    proc::ProcessorConfig cfg;
    cfg.indirect = proc::IndirectPolicy::FOLLOW_POINTERS;
    auto followed = analyse(make(), cfg);
    EXPECT_TRUE(followed.find(0x1010).has_value());
    ASSERT_EQ(followed.seeds.size(), 2u);
    EXPECT_EQ(followed.seeds[1], (proc::Seed{0x1010, SeedOrigin::POINTER}));
}

TEST(Processor, SectionStartsSeedWithoutEntryOrSymbols)
{
    auto img = shared_image(Machine::X86_64, 0,
                            {section(".text", 0x1000, {0xc3}),
                             section(".more", 0x2000, {0x90, 0xc3})});
    auto an = analyse(img);
    ASSERT_EQ(an.seeds.size(), 2u);
    EXPECT_EQ(an.seeds[0].addr, 0x1000u);
    EXPECT_EQ(an.seeds[1].addr, 0x2000u);
    EXPECT_EQ(an.stream.size(), 3u);
}

TEST(Processor, CancelledRunReturnsNothing)
{
    auto img = shared_image(Machine::X86_64, 0x1000, {section(".text", 0x1000, {0xc3})});
    std::atomic<bool> cancel{true};
    proc::RunStatus st = proc::RunStatus::OK;
    EXPECT_FALSE(proc::Processor().run(img, cancel, &st).has_value());
    EXPECT_EQ(st, proc::RunStatus::CANCELLED);
}

TEST(Processor, RejectsImagesWithoutCode)
{
    std::atomic<bool> cancel{false};
    proc::RunStatus st = proc::RunStatus::OK;

    auto data_only = shared_image(Machine::X86_64, 0,
                                  {section(".data", 0x1000, {1, 2}, image::PERM_R)});
    EXPECT_FALSE(proc::Processor().run(data_only, cancel, &st).has_value());
    EXPECT_EQ(st, proc::RunStatus::NO_CODE);

    auto unknown = shared_image(Machine::UNKNOWN, 0x1000, {section(".text", 0x1000, {0xc3})});
    EXPECT_FALSE(proc::Processor().run(unknown, cancel, &st).has_value());
    EXPECT_EQ(st, proc::RunStatus::NO_ARCH);
}

TEST(Processor, AnalysisQueries)
{
    auto an = analyse(shared_image(Machine::X86_64, 0x1000,
                                   {section(".text", 0x1000, {0x89, 0xc8, 0x55, 0xc3})}));
    EXPECT_EQ(an.find(0x1002), std::optional<size_t>(1));
    EXPECT_FALSE(an.find(0x1001).has_value());
    EXPECT_EQ(an.containing(0x1001), std::optional<size_t>(0));
    EXPECT_FALSE(an.containing(0x1004).has_value());
    EXPECT_EQ(an.lower_bound(0x1001), 0u);
    EXPECT_EQ(an.lower_bound(0x1003), 2u);
    EXPECT_EQ(an.lower_bound(0x5000), an.stream.size());
}
