/*
 * test_scroll.cpp: Listing rows and the scroll buffer
 */

#include <gtest/gtest.h>

#include "helpers.hpp"
#include "scroll.hpp"

#include <iterator>
#include <string>
#include <vector>

using arch::Machine;
using scroll::Direction;
using scroll::RowKind;
using testutil::section;
using testutil::shared_image;
using testutil::symbol;

namespace {

/* Image, analysis and vault kept alive together for a listing */
struct Fixture {
    std::shared_ptr<const image::Image> image;
    proc::Analysis analysis;
    vault::Vault   vault;

    explicit Fixture(std::shared_ptr<const image::Image> img,
                     const vault::Builder &debug = {})
        : image(std::move(img))
    {
        std::atomic<bool> cancel{false};
        analysis = *proc::Processor().run(image, cancel);
        vault = debug.build(image);
    }
};

std::shared_ptr<const image::Image> arm_image()
{
    return shared_image(Machine::ARM, 0x8000,
                        {section(".text", 0x8000, testutil::words_le({0xe1a00001, 0xe12fff1e}))});
}

std::shared_ptr<const image::Image> nop_sled(size_t count, uint64_t label_every)
{
    std::vector<uint8_t> code(count, 0x90);
    code.push_back(0xc3);
    std::vector<image::Symbol> syms;
    for (uint64_t a = 0; a < count; a += label_every)
        syms.push_back(symbol(0x10000 + a, "L" + std::to_string(a)));
    return shared_image(Machine::X86_64, 0x10000, {section(".text", 0x10000, code)}, syms);
}

} // namespace

TEST(Listing, RowsIncludeSectionMarkersAndEntryLabel)
{
    Fixture fx(arm_image());
    scroll::ListingSource src(fx.analysis, fx.vault);

    ASSERT_EQ(src.size(), 5u);
    auto start = src.row(0);
    EXPECT_EQ(start.kind, RowKind::SECTION);
    EXPECT_EQ(start.text(), "; section .text 00008000-00008008");
    EXPECT_EQ(start.address, 0x8000u);

    auto label = src.row(1);
    EXPECT_EQ(label.kind, RowKind::LABEL);
    EXPECT_EQ(label.text(), "entry:");
    EXPECT_EQ(label.address, 0x8000u);

    auto mov = src.row(2);
    EXPECT_EQ(mov.kind, RowKind::INSTRUCTION);
    EXPECT_EQ(mov.text(), "00008000  01 00 a0 e1  mov r0, r1");
    EXPECT_EQ(src.row(3).address, 0x8004u);

    auto end = src.row(4);
    EXPECT_EQ(end.kind, RowKind::SECTION);
    EXPECT_EQ(end.text(), "; end of section .text");
    EXPECT_EQ(end.index, 4u);
}

TEST(Listing, AnchorInsideInstructionResolvesToItsStart)
{
    Fixture fx(arm_image());
    scroll::ListingSource src(fx.analysis, fx.vault);
    scroll::ScrollBuffer<scroll::ListingSource> buf(src);

    buf.set_anchor(0x8005);
    auto rows = buf.peek(1);
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0].address, 0x8004u);
    EXPECT_EQ(rows[0].kind, RowKind::INSTRUCTION);

    buf.set_anchor(0x8000);
    EXPECT_EQ(buf.cursor(), 1);
    EXPECT_EQ(buf.peek(1)[0].kind, RowKind::LABEL);
}

TEST(Listing, AnchorOutsideCodeClamps)
{
    Fixture fx(arm_image());
    scroll::ListingSource src(fx.analysis, fx.vault);
    EXPECT_EQ(src.row_for(0x9000), 4u);
    EXPECT_EQ(src.row_for(0x100), 1u);
}

TEST(Listing, FunctionNamesAndLocationsFromVault)
{
    vault::Builder debug;
    debug.add_function({0x8000, 0x8008, "start_func"});
    vault::DebugRecord rec;
    rec.start = 0x8004;
    rec.end = 0x8008;
    rec.file = "start.s";
    rec.line = 12;
    debug.add_record(rec);
    Fixture fx(arm_image(), debug);
    scroll::ListingSource src(fx.analysis, fx.vault);

    EXPECT_EQ(src.row(1).text(), "start_func:");
    auto bx = src.row(3);
    ASSERT_TRUE(bx.location.has_value());
    EXPECT_EQ(bx.location->file, "start.s");
    EXPECT_EQ(bx.location->line, 12u);
    EXPECT_EQ(bx.location->function, "start_func");
}

TEST(Listing, ReferencesResolveAgainstTheStream)
{
    auto img = shared_image(Machine::X86_64, 0x1000,
                            {section(".text", 0x1000, {0x89, 0xc8, 0xe9, 0xf9, 0x0f, 0x00, 0x00}),
                             section(".text2", 0x2000, {0xc3})});
    Fixture fx(img);
    scroll::ListingSource src(fx.analysis, fx.vault);

    auto jmp = src.row(src.row_for(0x1002));
    ASSERT_FALSE(jmp.tokens.empty());
    EXPECT_EQ(jmp.tokens.back().kind, tokens::Kind::ADDRESS);
    EXPECT_EQ(jmp.tokens.back().target, 0x2000u);
    EXPECT_EQ(src.row_of_entry(0x2000), std::optional<size_t>(src.size() - 2));
    EXPECT_FALSE(src.row_of_entry(0x1001).has_value());
}

TEST(Listing, RowsAgreeWithAddressesAcrossCheckpoints)
{
    Fixture fx(nop_sled(1000, 50));
    scroll::ListingSource src(fx.analysis, fx.vault);
    EXPECT_EQ(src.size(), 1001u + 20u + 2u);

    for (uint64_t off = 0; off < 1000; off += 7) {
        uint64_t addr = 0x10000 + off;
        size_t r = src.row_for(addr);
        if (off % 50 == 0) {
            EXPECT_EQ(src.row(r).kind, RowKind::LABEL) << off;
            r++;
        }
        EXPECT_EQ(src.row(r).address, addr) << off;
        EXPECT_EQ(src.row(r).index, r);
    }
}

TEST(Listing, UndecodedBytesBecomeByteRows)
{
    /* jmp over two padding bytes to a ret, then trailing padding no sweep reaches */
    std::vector<uint8_t> code = {0xeb, 0x02, 0xcc, 0xcc, 0xc3};
    code.insert(code.end(), 11, 0xcc);
    Fixture fx(shared_image(Machine::X86_64, 0x1000, {section(".text", 0x1000, code)}));
    scroll::ListingSource src(fx.analysis, fx.vault);

    ASSERT_EQ(fx.analysis.stream.size(), 2u);
    ASSERT_EQ(src.size(), 8u);
    EXPECT_EQ(src.row(2).address, 0x1000u);

    auto pad = src.row(3);
    EXPECT_EQ(pad.kind, RowKind::BYTES);
    EXPECT_EQ(pad.address, 0x1002u);
    EXPECT_EQ(pad.text(), "000000001002  cc cc");

    EXPECT_EQ(src.row(4).address, 0x1004u);
    EXPECT_EQ(src.row(4).kind, RowKind::INSTRUCTION);

    /* trailing bytes split at GAP_ROW_BYTES boundaries */
    EXPECT_EQ(src.row(5).text(), "000000001005  cc cc cc");
    EXPECT_EQ(src.row(6).text(), "000000001008  cc cc cc cc cc cc cc cc");
    EXPECT_EQ(src.row(7).kind, RowKind::SECTION);

    EXPECT_EQ(src.row_for(0x1003), 3u);
    EXPECT_EQ(src.row_for(0x100c), 6u);
    EXPECT_FALSE(src.row_of_entry(0x1002).has_value());
    EXPECT_EQ(src.row_of_entry(0x1004), std::optional<size_t>(4));
}

TEST(Listing, SectionMarkersOnlyForCodeSections)
{
    auto img = shared_image(Machine::X86_64, 0x1000,
                            {section(".text", 0x1000, {0xc3}),
                             section(".data", 0x1800, {1, 2, 3}, image::PERM_R),
                             section(".init", 0x2000, {0x90, 0xc3})},
                            {symbol(0x2000, "init")});
    Fixture fx(img);
    scroll::ListingSource src(fx.analysis, fx.vault);

    std::vector<std::string> markers;
    for (size_t r = 0; r < src.size(); r++)
        if (src.row(r).kind == RowKind::SECTION)
            markers.push_back(src.row(r).text());
    EXPECT_EQ(markers, (std::vector<std::string>{
                  "; section .text 000000001000-000000001001",
                  "; end of section .text",
                  "; section .init 000000002000-000000002002",
                  "; end of section .init"}));

    /* data addresses anchor to the next code */
    EXPECT_EQ(src.row(src.row_for(0x1801)).text(), "init:");
}

TEST(Listing, RowsAgreeAcrossCheckpointsWithGaps)
{
    std::vector<uint8_t> code;
    for (int i = 0; i < 200; i++) {
        const uint8_t hop[] = {0xeb, 0x02, 0xcc, 0xcc};
        code.insert(code.end(), std::begin(hop), std::end(hop));
    }
    code.push_back(0xc3);
    Fixture fx(shared_image(Machine::X86_64, 0x1000, {section(".text", 0x1000, code)}));
    scroll::ListingSource src(fx.analysis, fx.vault);

    ASSERT_EQ(fx.analysis.stream.size(), 201u);
    EXPECT_EQ(src.size(), 1u + 1u + 200u * 2u + 1u + 1u);

    for (uint64_t k = 0; k < 200; k += 9) {
        uint64_t addr = 0x1000 + 4 * k;
        auto r = src.row_of_entry(addr);
        ASSERT_TRUE(r.has_value()) << k;
        if (k == 0) r = *r + 1;
        EXPECT_EQ(src.row(*r).address, addr) << k;
        EXPECT_EQ(src.row(*r).kind, RowKind::INSTRUCTION) << k;
        EXPECT_EQ(src.row(*r + 1).kind, RowKind::BYTES) << k;
        EXPECT_EQ(src.row(*r + 1).address, addr + 2) << k;
        EXPECT_EQ(src.row_for(addr + 3), *r + 1) << k;
    }
}

TEST(ScrollBuffer, ExtendForwardThenBackReturnsToStart)
{
    Fixture fx(nop_sled(200, 64));
    scroll::ListingSource src(fx.analysis, fx.vault);
    scroll::ScrollBuffer<scroll::ListingSource> buf(src);

    buf.set_row(10);
    auto fwd = buf.extend(Direction::FORWARD, 5);
    ASSERT_EQ(fwd.size(), 5u);
    EXPECT_EQ(fwd.front().index, 10u);
    EXPECT_EQ(buf.cursor(), 15);

    auto back = buf.extend(Direction::BACKWARD, 5);
    ASSERT_EQ(back.size(), 5u);
    EXPECT_EQ(back.front().index, 10u);
    EXPECT_EQ(buf.cursor(), 10);
    EXPECT_EQ(buf.peek(1)[0].index, 10u);
}

TEST(ScrollBuffer, EdgesAreOmittedNotWrapped)
{
    Fixture fx(arm_image());
    scroll::ListingSource src(fx.analysis, fx.vault);
    scroll::ScrollBuffer<scroll::ListingSource> buf(src);

    buf.set_row(0);
    EXPECT_TRUE(buf.extend(Direction::BACKWARD, 4).empty());
    EXPECT_EQ(buf.cursor(), -4);
    auto rows = buf.extend(Direction::FORWARD, 10);
    EXPECT_EQ(rows.size(), 5u);
    EXPECT_EQ(buf.cursor(), 6);
}

TEST(ScrollBuffer, EvictsRowsFarFromCursor)
{
    Fixture fx(nop_sled(4000, 100));
    scroll::ListingSource src(fx.analysis, fx.vault);
    scroll::ScrollBuffer<scroll::ListingSource> buf(src, 16);

    buf.set_row(0);
    for (int i = 0; i < 30; i++) {
        buf.extend(Direction::FORWARD, 40);
        EXPECT_LE(buf.cached(), 2 * buf.keep_distance() + 1);
    }
    EXPECT_FALSE(buf.is_cached(0));
    EXPECT_TRUE(buf.is_cached((size_t)buf.cursor() - 1));
}

TEST(HexRows, SpansAlignedToSixteenBytes)
{
    auto img = shared_image(Machine::X86_64, 0x1000,
                            {section(".text", 0x1000, std::vector<uint8_t>(0x20, 0xc3)),
                             section(".data", 0x2008, {'h', 'i', 0x00, 0x7f},
                                     image::PERM_R)});
    scroll::HexSource hex(*img);

    ASSERT_EQ(hex.size(), 3u);
    EXPECT_EQ(hex.row_for(0x1015), 1u);
    EXPECT_EQ(hex.row_for(0x2009), 2u);
    EXPECT_EQ(hex.row_for(0x1800), 2u);
    EXPECT_EQ(hex.row_for(0x9000), 2u);

    auto row = hex.row(2);
    EXPECT_EQ(row.kind, RowKind::BYTES);
    EXPECT_EQ(row.address, 0x2000u);
    ASSERT_EQ(row.tokens.size(), 5u);
    EXPECT_EQ(row.tokens[0].text, "000000002000");
    EXPECT_EQ(row.tokens[4].text, "        hi..    ");
}

TEST(HexRows, SectionsSharingARowShareOneSpan)
{
    auto img = shared_image(Machine::X86_64, 0x1000,
                            {section(".a", 0x1000, {1, 2, 3, 4}),
                             section(".b", 0x1008, {5, 6, 7, 8}, image::PERM_R)});
    scroll::HexSource hex(*img);

    ASSERT_EQ(hex.size(), 1u);
    EXPECT_EQ(hex.row_for(0x100a), 0u);
    auto row = hex.row(0);
    ASSERT_EQ(row.tokens.size(), 5u);
    EXPECT_EQ(row.tokens[2].text.substr(0, 11), "01 02 03 04");
    EXPECT_EQ(row.tokens[2].text.substr(12, 11), "           ");
    EXPECT_EQ(row.tokens[2].text.substr(24, 11), "05 06 07 08");
    EXPECT_EQ(row.tokens[4].text, "....    ....    ");
}

TEST(HexRows, BufferOverHexSource)
{
    auto img = shared_image(Machine::X86_64, 0x1000,
                            {section(".text", 0x1000, std::vector<uint8_t>(0x100, 0x90))});
    scroll::HexSource hex(*img);
    scroll::ScrollBuffer<scroll::HexSource> buf(hex, 4);

    buf.set_anchor(0x1047);
    auto rows = buf.extend(Direction::FORWARD, 2);
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0].address, 0x1040u);
    EXPECT_EQ(rows[1].address, 0x1050u);
}
