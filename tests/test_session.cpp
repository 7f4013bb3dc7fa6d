/*
 * test_session.cpp: Loaded-binary session
 */

#include <gtest/gtest.h>

#include "helpers.hpp"
#include "session.hpp"

using arch::Machine;
using session::LoadError;
using testutil::section;
using testutil::shared_image;
using testutil::TempFile;

namespace {

std::shared_ptr<const image::Image> small_x86()
{
    return shared_image(Machine::X86_64, 0x1000,
                        {section(".text", 0x1000, {0x89, 0xc8, 0xe9, 0xf9, 0x0f, 0x00, 0x00}),
                         section(".text2", 0x2000, {0xc3})});
}

} // namespace

TEST(Session, EmptyBeforeFirstLoad)
{
    session::Session ses;
    EXPECT_EQ(ses.current(), nullptr);
    EXPECT_FALSE(ses.resolve_reference(0x1000).has_value());
}

TEST(Session, LoadPublishesState)
{
    session::Session ses;
    auto st = ses.load(small_x86(), vault::Builder{}, "small");
    ASSERT_TRUE(st.ok()) << st.message;

    auto cur = ses.current();
    ASSERT_NE(cur, nullptr);
    EXPECT_EQ(cur->name, "small");
    EXPECT_EQ(cur->generation, 1u);
    EXPECT_EQ(cur->analysis.stream.size(), 3u);
    EXPECT_EQ(cur->listing->size(), 8u);
    EXPECT_GT(cur->hex->size(), 0u);
}

TEST(Session, ResolveReferenceOnlyAtEntryStarts)
{
    session::Session ses;
    ASSERT_TRUE(ses.load(small_x86(), vault::Builder{}, "small").ok());

    auto row = ses.resolve_reference(0x2000);
    ASSERT_TRUE(row.has_value());
    EXPECT_EQ(ses.current()->listing->row(*row).address, 0x2000u);
    EXPECT_FALSE(ses.resolve_reference(0x1001).has_value());
    EXPECT_FALSE(ses.resolve_reference(0x5000).has_value());
}

TEST(Session, HeldStateResolvesAgainstItsOwnListing)
{
    session::Session ses;
    ASSERT_TRUE(ses.load(small_x86(), vault::Builder{}, "old").ok());
    auto held = ses.current();
    auto old_row = held->listing->row_of_entry(0x2000);
    ASSERT_TRUE(old_row.has_value());

    /* The next image has nothing at 0x2000 and a different row layout */
    auto other = shared_image(Machine::X86_64, 0x2000,
                              {section(".text", 0x1ff0, std::vector<uint8_t>(0x20, 0x90))});
    ASSERT_TRUE(ses.load(other, vault::Builder{}, "new").ok());

    EXPECT_NE(ses.resolve_reference(0x2000), old_row);
    EXPECT_EQ(held->listing->row_of_entry(0x2000), old_row);
    EXPECT_EQ(held->listing->row(*old_row).address, 0x2000u);
}

TEST(Session, FailedLoadKeepsPreviousState)
{
    session::Session ses;
    ASSERT_TRUE(ses.load(small_x86(), vault::Builder{}, "good").ok());
    auto before = ses.current();

    auto data_only = shared_image(Machine::X86_64, 0,
                                  {section(".data", 0x1000, {1, 2, 3}, image::PERM_R)});
    auto st = ses.load(data_only, vault::Builder{}, "bad");
    EXPECT_EQ(st.code, LoadError::NO_CODE);
    EXPECT_EQ(ses.current(), before);

    st = ses.load(nullptr, vault::Builder{}, "null");
    EXPECT_EQ(st.code, LoadError::BAD_IMAGE);
    EXPECT_EQ(ses.current()->name, "good");
}

TEST(Session, GenerationAdvancesPerLoad)
{
    session::Session ses;
    ASSERT_TRUE(ses.load(small_x86(), vault::Builder{}, "one").ok());
    auto first = ses.current();
    ASSERT_TRUE(ses.load(small_x86(), vault::Builder{}, "two").ok());
    EXPECT_EQ(ses.current()->generation, 2u);
    EXPECT_EQ(first->name, "one");
    EXPECT_EQ(first->listing->size(), 8u);
}

TEST(Session, ConfigAppliesToNextLoad)
{
    session::Session ses;
    proc::ProcessorConfig cfg;
    cfg.overlap = proc::OverlapPolicy::DISCARD_RUN;
    cfg.workers = 1;
    ses.set_config(cfg);
    EXPECT_EQ(ses.config().overlap, proc::OverlapPolicy::DISCARD_RUN);

    auto img = shared_image(Machine::X86_64, 0x1001,
                            {section(".text", 0x1000, {0xb8, 0xc3, 0x00, 0x00, 0x00, 0xc3})},
                            {testutil::symbol(0x1000, "outer")});
    ASSERT_TRUE(ses.load(img, vault::Builder{}, "overlap").ok());
    EXPECT_EQ(ses.current()->analysis.stream.size(), 1u);
}

TEST(Session, LoadFileWithDefaultDebugPath)
{
    TempFile bin(testutil::bytes_str({0x55, 0x89, 0xc8, 0xc3}));
    TempFile dbg(loader::default_debug_path(bin.path()),
                 R"([{"kind": "function", "name": "_Z5startv", "addr": "0x1000", "end": "0x1004"}])");

    session::Session ses;
    session::LoadOptions opts;
    opts.path = bin.path();
    opts.raw.machine = Machine::X86_64;
    opts.raw.base = 0x1000;
    auto st = ses.load_file(opts);
    ASSERT_TRUE(st.ok()) << st.message;

    auto cur = ses.current();
    EXPECT_EQ(cur->name, bin.path());
    EXPECT_STREQ(cur->vault.symbol_at(0x1000), "start()");
    EXPECT_EQ(cur->listing->row(0).kind, scroll::RowKind::SECTION);
    EXPECT_EQ(cur->listing->row(1).text(), "start():");
}

TEST(Session, LoadFileErrors)
{
    session::Session ses;
    session::LoadOptions opts;
    opts.path = "/nonexistent/dissect/file";
    opts.raw.machine = Machine::X86_64;
    EXPECT_EQ(ses.load_file(opts).code, LoadError::IO);

    TempFile bin(testutil::bytes_str({0xc3}));
    opts.path = bin.path();
    opts.raw.machine = arch::Machine::UNKNOWN;
    EXPECT_EQ(ses.load_file(opts).code, LoadError::BAD_IMAGE);

    TempFile bad_dbg(R"({"kind": "function", "addr": 1})");
    opts.raw.machine = Machine::X86_64;
    opts.debug_path = bad_dbg.path();
    auto st = ses.load_file(opts);
    EXPECT_EQ(st.code, LoadError::BAD_DEBUG);
    EXPECT_NE(st.message.find("without end"), std::string::npos);

    EXPECT_EQ(ses.current(), nullptr);
    EXPECT_STREQ(session::error_name(LoadError::BAD_DEBUG), "bad_debug");
}
