/*
 * test_image.cpp: Binary image model
 */

#include <gtest/gtest.h>

#include "helpers.hpp"

using arch::Machine;
using image::SymbolKind;
using testutil::section;
using testutil::symbol;

TEST(Image, SectionsSortedAndOverlapsDropped)
{
    std::vector<image::Section> secs;
    secs.push_back(section(".data", 0x3000, {1, 2, 3, 4}, image::PERM_R | image::PERM_W));
    secs.push_back(section(".text", 0x1000, {0xc3, 0xc3}));
    secs.push_back(section(".bogus", 0x1001, {0x90}));
    secs.push_back(section(".empty", 0x5000, {}));
    auto img = image::make_image(Machine::X86_64, false, 0x1000, std::move(secs), {});

    ASSERT_EQ(img.sections.size(), 2u);
    EXPECT_EQ(img.sections[0].name, ".text");
    EXPECT_EQ(img.sections[1].name, ".data");
    EXPECT_EQ(img.section_for(0x1001), &img.sections[0]);
    EXPECT_EQ(img.section_for(0x1002), nullptr);
    EXPECT_TRUE(img.sections[0].executable());
    EXPECT_FALSE(img.sections[1].executable());
}

TEST(Image, EntrySymbolAddedWhenUnnamed)
{
    auto img = image::make_image(Machine::X86_64, false, 0x1001,
                                 {section(".text", 0x1000, {0x90, 0xc3})}, {});
    const image::Symbol *s = img.symbol_at(0x1001);
    ASSERT_NE(s, nullptr);
    EXPECT_EQ(s->kind, SymbolKind::ENTRY);
    EXPECT_EQ(s->name, "entry");
}

TEST(Image, NamedEntryKeepsItsSymbol)
{
    auto img = image::make_image(Machine::X86_64, false, 0x1000,
                                 {section(".text", 0x1000, {0xc3})},
                                 {symbol(0x1000, "_start")});
    ASSERT_EQ(img.symbols.size(), 1u);
    EXPECT_EQ(img.symbols[0].name, "_start");
}

TEST(Image, DuplicateAddressesPreferFunctions)
{
    auto img = image::make_image(Machine::X86_64, false, 0x1000,
                                 {section(".text", 0x1000, {0xc3, 0xc3})},
                                 {symbol(0x1001, ".Ltmp0", SymbolKind::LABEL),
                                  symbol(0x1001, "helper"),
                                  symbol(0x1001, "loop", SymbolKind::LABEL)});
    const image::Symbol *s = img.symbol_at(0x1001);
    ASSERT_NE(s, nullptr);
    EXPECT_EQ(s->name, "helper");
}

TEST(Image, DemangledDisplayNames)
{
    EXPECT_EQ(image::demangle("_Z3foov"), "foo()");
    EXPECT_EQ(image::demangle("main"), "main");

    auto img = image::make_image(Machine::X86_64, false, 0x1000,
                                 {section(".text", 0x1000, {0xc3})},
                                 {symbol(0x1000, "_Z3foov")});
    EXPECT_EQ(img.symbols[0].display, "foo()");
}

TEST(Image, IntrinsicSymbols)
{
    EXPECT_TRUE(image::is_intrinsic(".L42"));
    EXPECT_TRUE(image::is_intrinsic("GCC_except_table7"));
    EXPECT_TRUE(image::is_intrinsic(""));
    EXPECT_FALSE(image::is_intrinsic("main"));
}

TEST(Image, SymbolBeforeSkipsIntrinsicsAndStaysInSection)
{
    auto img = image::make_image(Machine::X86_64, false, 0x2000,
                                 {section(".text", 0x1000, std::vector<uint8_t>(0x20, 0x90)),
                                  section(".init", 0x2000, {0xc3, 0xc3})},
                                 {symbol(0x1000, "first"),
                                  symbol(0x1010, ".L1", SymbolKind::LABEL)});
    const image::Symbol *s = img.symbol_before(0x1018);
    ASSERT_NE(s, nullptr);
    EXPECT_EQ(s->name, "first");
    EXPECT_EQ(img.symbol_before(0x2001)->name, "entry");
    EXPECT_EQ(img.symbol_before(0x5000), nullptr);
}

TEST(Image, ReadsStopAtBackedData)
{
    image::Section bss = section(".bss", 0x4000, {0xaa});
    bss.size = 0x100;
    bss.perms = image::PERM_R | image::PERM_W;
    auto img = image::make_image(Machine::X86_64, false, 0, {bss}, {});

    EXPECT_EQ(img.bytes_from(0x4000).size(), 1u);
    EXPECT_TRUE(img.bytes_from(0x4010).empty());
    uint8_t b = 0;
    EXPECT_TRUE(img.read(0x4000, &b, 1));
    EXPECT_EQ(b, 0xaa);
    uint16_t w;
    EXPECT_FALSE(img.read(0x4000, &w, 2));
}

TEST(Image, PointerByteOrder)
{
    std::vector<uint8_t> data = {0x78, 0x56, 0x34, 0x12};
    auto le = image::make_image(Machine::MIPS, false, 0,
                                {section(".data", 0x100, data, image::PERM_R)}, {});
    auto be = image::make_image(Machine::MIPS, true, 0,
                                {section(".data", 0x100, data, image::PERM_R)}, {});
    ASSERT_TRUE(le.read_pointer(0x100, 4).has_value());
    EXPECT_EQ(*le.read_pointer(0x100, 4), 0x12345678u);
    EXPECT_EQ(*be.read_pointer(0x100, 4), 0x78563412u);
    EXPECT_EQ(be.decode_flags(), arch::DECODE_BIG_ENDIAN);
    EXPECT_FALSE(le.read_pointer(0x102, 4).has_value());
}
