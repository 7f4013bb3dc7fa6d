/*
 * test_vault.cpp: Debug vault
 */

#include <gtest/gtest.h>

#include "helpers.hpp"
#include "vault.hpp"

using vault::DebugRecord;

namespace {

DebugRecord record(uint64_t start, uint64_t end, const char *file, uint32_t line,
                   const char *function = "")
{
    DebugRecord r;
    r.start = start;
    r.end = end;
    r.file = file;
    r.line = line;
    r.function = function;
    return r;
}

} // namespace

TEST(Vault, FirstRegistrationWinsOnIdenticalRanges)
{
    vault::Builder b;
    b.add_record(record(0x3000, 0x3010, "a.c", 10));
    b.add_record(record(0x3000, 0x3010, "b.c", 20));
    vault::Vault v = b.build();

    ASSERT_EQ(v.records().size(), 1u);
    ASSERT_EQ(v.conflicts().size(), 1u);
    EXPECT_TRUE(v.conflicts()[0].rejected);
    EXPECT_EQ(v.conflicts()[0].incoming.file, "b.c");
    EXPECT_EQ(v.conflicts()[0].kept_start, 0x3000u);

    auto loc = v.lookup(0x3005);
    ASSERT_TRUE(loc.has_value());
    EXPECT_EQ(loc->file, "a.c");
    EXPECT_EQ(loc->line, 10u);
}

TEST(Vault, PartialOverlapIsClipped)
{
    vault::Builder b;
    b.add_record(record(0x1000, 0x1008, "a.c", 1));
    b.add_record(record(0x1004, 0x1010, "a.c", 2));
    vault::Vault v = b.build();

    ASSERT_EQ(v.records().size(), 2u);
    EXPECT_EQ(v.records()[1].start, 0x1008u);
    EXPECT_EQ(v.records()[1].end, 0x1010u);
    ASSERT_EQ(v.conflicts().size(), 1u);
    EXPECT_FALSE(v.conflicts()[0].rejected);
    EXPECT_EQ(v.lookup(0x1006)->line, 1u);
    EXPECT_EQ(v.lookup(0x100c)->line, 2u);
}

TEST(Vault, RecordsNeverOverlapAfterBuild)
{
    vault::Builder b;
    uint64_t starts[] = {0x40, 0x10, 0x38, 0x00, 0x20, 0x18};
    uint32_t line = 1;
    for (uint64_t s : starts)
        b.add_record(record(s, s + 0x18, "x.c", line++));
    vault::Vault v = b.build();

    for (size_t i = 1; i < v.records().size(); i++)
        EXPECT_LE(v.records()[i - 1].end, v.records()[i].start);
    EXPECT_EQ(v.lookup(0x05)->line, 4u);
}

TEST(Vault, EmptyRecordsIgnored)
{
    vault::Builder b;
    b.add_record(record(0x10, 0x10, "a.c", 1));
    EXPECT_TRUE(b.build().records().empty());
}

TEST(Vault, LookupFallsBackToFunction)
{
    vault::Builder b;
    b.add_function({0x2000, 0x2040, "parse()"});
    b.add_record(record(0x2000, 0x2004, "parse.c", 7));
    vault::Vault v = b.build();

    auto in_line = v.lookup(0x2002);
    ASSERT_TRUE(in_line.has_value());
    EXPECT_EQ(in_line->function, "parse()");
    EXPECT_EQ(in_line->symbol, "parse()");

    auto no_line = v.lookup(0x2010);
    ASSERT_TRUE(no_line.has_value());
    EXPECT_EQ(no_line->line, 0u);
    EXPECT_EQ(no_line->function, "parse()");

    EXPECT_FALSE(v.lookup(0x3000).has_value());
}

TEST(Vault, LineEntries)
{
    vault::Builder b;
    b.add_line({0x10, 0x14, "main.c", 3});
    vault::Vault v = b.build();
    EXPECT_EQ(v.lookup(0x12)->file, "main.c");
    EXPECT_TRUE(v.lookup(0x12)->symbol.empty());
}

TEST(Vault, NearestSymbol)
{
    auto img = testutil::shared_image(arch::Machine::X86_64, 0x1000,
                                      {testutil::section(".text", 0x1000,
                                                         std::vector<uint8_t>(0x100, 0x90))},
                                      {testutil::symbol(0x1000, "_start"),
                                       testutil::symbol(0x1080, "_Z3foov")});
    vault::Builder b;
    b.add_function({0x1040, 0x1060, "helper"});
    vault::Vault v = b.build(img);

    auto fn = v.nearest_symbol(0x1048);
    ASSERT_TRUE(fn.has_value());
    EXPECT_EQ(fn->name, "helper");
    EXPECT_EQ(fn->offset, 8u);

    auto sym = v.nearest_symbol(0x1090);
    ASSERT_TRUE(sym.has_value());
    EXPECT_EQ(sym->name, "foo()");
    EXPECT_EQ(sym->offset, 0x10u);

    EXPECT_FALSE(v.nearest_symbol(0x9000).has_value());
}

TEST(Vault, SymbolAtPrefersFunctionStart)
{
    auto img = testutil::shared_image(arch::Machine::X86_64, 0x1000,
                                      {testutil::section(".text", 0x1000,
                                                         std::vector<uint8_t>(0x40, 0x90))},
                                      {testutil::symbol(0x1010, "raw_name"),
                                       testutil::symbol(0x1020, ".L5",
                                                        image::SymbolKind::LABEL)});
    vault::Builder b;
    b.add_function({0x1010, 0x1020, "pretty"});
    vault::Vault v = b.build(img);

    EXPECT_STREQ(v.symbol_at(0x1010), "pretty");
    EXPECT_STREQ(v.symbol_at(0x1000), "entry");
    EXPECT_EQ(v.symbol_at(0x1020), nullptr);
    EXPECT_EQ(v.symbol_at(0x1011), nullptr);
}

TEST(Vault, OverlappingFunctionsKeepFirst)
{
    vault::Builder b;
    b.add_function({0x100, 0x200, "outer"});
    b.add_function({0x180, 0x280, "inner"});
    vault::Vault v = b.build();
    ASSERT_EQ(v.functions().size(), 2u);
    EXPECT_EQ(v.function_at(0x190)->name, "outer");
    EXPECT_EQ(v.function_at(0x210)->name, "inner");
    EXPECT_EQ(v.function_at(0x210)->start, 0x200u);
}

TEST(Vault, TypeRecordsPassThrough)
{
    vault::Builder b;
    b.add_type({"point", "struct { int x; int y; }"});
    vault::Vault v = b.build();
    ASSERT_EQ(v.type_records().size(), 1u);
    EXPECT_EQ(v.type_records()[0].name, "point");
}
