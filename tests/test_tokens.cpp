/*
 * test_tokens.cpp: Instruction tokenizer
 */

#include <gtest/gtest.h>

#include "helpers.hpp"

#include <cstring>
#include <set>

using arch::Machine;
using tokens::Kind;

namespace {

struct FakeListing {
    std::set<uint64_t> insns;
    uint64_t           symbol_addr = 0;
    const char        *symbol = nullptr;
};

tokens::Resolver resolver_for(const FakeListing &l)
{
    tokens::Resolver r;
    r.ctx = &l;
    r.symbol_at = [](const void *ctx, uint64_t addr) -> const char * {
        auto *fl = static_cast<const FakeListing *>(ctx);
        return fl->symbol && addr == fl->symbol_addr ? fl->symbol : nullptr;
    };
    r.is_instruction = [](const void *ctx, uint64_t addr) {
        return static_cast<const FakeListing *>(ctx)->insns.count(addr) != 0;
    };
    return r;
}

arch::Instruction jump_to_2000()
{
    return testutil::decode(Machine::X86_64, {0xe9, 0xf9, 0x0f, 0x00, 0x00}, 0x1002);
}

} // namespace

TEST(Tokens, KindsOfAPlainInstruction)
{
    auto insn = testutil::decode(Machine::X86_64, {0x89, 0xc8});
    auto toks = tokens::tokenize(testutil::arch_of(Machine::X86_64), insn);
    ASSERT_EQ(toks.size(), 5u);
    EXPECT_EQ(toks[0].kind, Kind::MNEMONIC);
    EXPECT_EQ(toks[1].kind, Kind::DELIMITER);
    EXPECT_EQ(toks[2].kind, Kind::REGISTER);
    EXPECT_EQ(toks[2].text, "eax");
    EXPECT_EQ(toks[3].text, ", ");
    EXPECT_EQ(toks[4].kind, Kind::REGISTER);
    for (auto &t : toks)
        EXPECT_FALSE(t.has_target);
}

TEST(Tokens, UnresolvedReferenceWithoutResolver)
{
    auto toks = tokens::tokenize(testutil::arch_of(Machine::X86_64), jump_to_2000());
    ASSERT_FALSE(toks.empty());
    const tokens::Token &ref = toks.back();
    EXPECT_EQ(ref.kind, Kind::UNRESOLVED);
    EXPECT_EQ(ref.text, "0x2000");
    EXPECT_TRUE(ref.has_target);
    EXPECT_EQ(ref.target, 0x2000u);
    EXPECT_EQ(tokens::to_text(toks), "jmp 0x2000");
}

TEST(Tokens, ReferenceToDecodedInstruction)
{
    FakeListing l;
    l.insns.insert(0x2000);
    auto r = resolver_for(l);
    auto toks = tokens::tokenize(testutil::arch_of(Machine::X86_64), jump_to_2000(), &r);
    EXPECT_EQ(toks.back().kind, Kind::ADDRESS);
    EXPECT_EQ(toks.back().text, "0x2000");
}

TEST(Tokens, ReferenceBySymbolName)
{
    FakeListing l;
    l.insns.insert(0x2000);
    l.symbol_addr = 0x2000;
    l.symbol = "main";
    auto r = resolver_for(l);
    auto toks = tokens::tokenize(testutil::arch_of(Machine::X86_64), jump_to_2000(), &r);
    EXPECT_EQ(toks.back().kind, Kind::SYMBOL);
    EXPECT_EQ(toks.back().target, 0x2000u);
    EXPECT_EQ(tokens::to_text(toks), "jmp main");
}

TEST(Tokens, PcRelativeOperandGetsComment)
{
    auto insn = testutil::decode(Machine::X86_64,
                                 {0x48, 0x8d, 0x05, 0x10, 0x00, 0x00, 0x00}, 0x1000);
    auto toks = tokens::tokenize(testutil::arch_of(Machine::X86_64), insn);
    bool comment = false;
    for (auto &t : toks)
        if (t.kind == Kind::COMMENT) comment = true;
    EXPECT_TRUE(comment);
    EXPECT_TRUE(toks.back().has_target);
    EXPECT_EQ(toks.back().target, 0x1017u);
}

TEST(Tokens, InvalidEntry)
{
    auto insn = testutil::decode(Machine::X86_64, {0x06});
    auto toks = tokens::tokenize(testutil::arch_of(Machine::X86_64), insn);
    ASSERT_EQ(toks.size(), 1u);
    EXPECT_EQ(toks[0].kind, Kind::INVALID);
    EXPECT_EQ(toks[0].text, "??");
}

TEST(Tokens, ArmImmediatesCarryHashPrefix)
{
    auto insn = testutil::decode(Machine::ARM, testutil::words_le({0xe3a00005}), 0x8000);
    EXPECT_EQ(testutil::text(Machine::ARM, insn), "mov r0, #0x5");
}

TEST(Tokens, Formatting)
{
    EXPECT_EQ(tokens::format_address(0x1000, 8), "00001000");
    EXPECT_EQ(tokens::format_address(0xdeadbeef, 12), "0000deadbeef");
    auto insn = testutil::decode(Machine::X86_64, {0x89, 0xc8});
    EXPECT_EQ(tokens::format_bytes(insn), "89 c8");
    EXPECT_STREQ(tokens::kind_name(Kind::UNRESOLVED), "unresolved");
}
