/*
 * test_arm.cpp: ARM (A32) decoder
 */

#include <gtest/gtest.h>

#include "helpers.hpp"

using arch::Flow;
using arch::Machine;
using testutil::decode;
using testutil::text;
using testutil::words_be;
using testutil::words_le;

TEST(Arm, RegisterMove)
{
    auto insn = decode(Machine::ARM, words_le({0xe1a00001}), 0x8000);
    EXPECT_EQ(insn.length, 4);
    EXPECT_EQ(text(Machine::ARM, insn), "mov r0, r1");
}

TEST(Arm, BxLrIsReturn)
{
    auto insn = decode(Machine::ARM, words_le({0xe12fff1e}), 0x8000);
    EXPECT_EQ(insn.mnemonic, "bx");
    EXPECT_EQ(insn.flow, Flow::RETURN);
}

TEST(Arm, BxOtherRegisterIsIndirect)
{
    auto insn = decode(Machine::ARM, words_le({0xe12fff13}), 0x8000);
    EXPECT_EQ(insn.flow, Flow::INDIRECT);
}

TEST(Arm, BranchTargets)
{
    auto b = decode(Machine::ARM, words_le({0xeafffffe}), 0x8000);
    EXPECT_EQ(b.flow, Flow::BRANCH);
    EXPECT_EQ(b.target, 0x8000u);

    auto beq = decode(Machine::ARM, words_le({0x0a000000}), 0x8000);
    EXPECT_EQ(beq.mnemonic, "beq");
    EXPECT_EQ(beq.flow, Flow::COND_BRANCH);
    EXPECT_EQ(beq.target, 0x8008u);

    auto bl = decode(Machine::ARM, words_le({0xeb000001}), 0x8000);
    EXPECT_EQ(bl.flow, Flow::CALL);
    EXPECT_EQ(bl.target, 0x800cu);
}

TEST(Arm, PushAndPopRegisterLists)
{
    auto push = decode(Machine::ARM, words_le({0xe92d4010}), 0x8000);
    EXPECT_EQ(text(Machine::ARM, push), "push {r4, lr}");
    EXPECT_EQ(push.flow, Flow::NONE);

    auto pop = decode(Machine::ARM, words_le({0xe8bd8010}), 0x8000);
    EXPECT_EQ(text(Machine::ARM, pop), "pop {r4, pc}");
    EXPECT_EQ(pop.flow, Flow::RETURN);
}

TEST(Arm, LiteralLoadResolvesPcRelativeAddress)
{
    auto insn = decode(Machine::ARM, words_le({0xe59f0004}), 0x8000);
    ASSERT_EQ(insn.operands.size(), 2u);
    const arch::Operand &mem = insn.operands[1];
    EXPECT_TRUE(mem.flags & arch::OPF_PCREL);
    EXPECT_EQ(mem.target, 0x800cu);
    EXPECT_EQ(text(Machine::ARM, insn), "ldr r0, [pc, #4]  ; 0x800c");
}

TEST(Arm, BigEndianWordOrder)
{
    auto insn = decode(Machine::ARM, words_be({0xe12fff1e}), 0x8000,
                       arch::DECODE_BIG_ENDIAN);
    EXPECT_EQ(insn.mnemonic, "bx");
    EXPECT_EQ(insn.flow, Flow::RETURN);
}

TEST(Arm, ShortBufferIsInvalid)
{
    auto insn = decode(Machine::ARM, {0x1e, 0xff}, 0x8000);
    EXPECT_TRUE(insn.is_error);
    EXPECT_EQ(insn.length, 2);
}

TEST(Arm, LengthIsAlwaysOneWord)
{
    const arch::Arch &a = testutil::arch_of(Machine::ARM);
    uint32_t w = 0x12345678;
    for (int i = 0; i < 2000; i++) {
        w = w * 1103515245u + 12345u;
        auto bytes = words_le({w});
        auto insn = arch::decode(a, bytes, 0x8000);
        EXPECT_EQ(insn.length, 4u) << std::hex << w;
        EXPECT_EQ(insn, arch::decode(a, bytes, 0x8000));
    }
}
