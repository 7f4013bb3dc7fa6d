/*
 * test_aarch64.cpp: AArch64 decoder
 */

#include <gtest/gtest.h>

#include "helpers.hpp"

using arch::Flow;
using arch::Machine;
using testutil::decode;
using testutil::text;
using testutil::words_le;

TEST(AArch64, ReturnAndNop)
{
    auto ret = decode(Machine::AARCH64, words_le({0xd65f03c0}));
    EXPECT_EQ(ret.mnemonic, "ret");
    EXPECT_EQ(ret.flow, Flow::RETURN);

    auto nop = decode(Machine::AARCH64, words_le({0xd503201f}));
    EXPECT_EQ(text(Machine::AARCH64, nop), "nop");
    EXPECT_EQ(nop.flow, Flow::NONE);
}

TEST(AArch64, DirectBranches)
{
    auto b = decode(Machine::AARCH64, words_le({0x14000002}), 0x1000);
    EXPECT_EQ(b.flow, Flow::BRANCH);
    EXPECT_EQ(b.target, 0x1008u);

    auto bl = decode(Machine::AARCH64, words_le({0x94000004}), 0x1000);
    EXPECT_EQ(bl.mnemonic, "bl");
    EXPECT_EQ(bl.flow, Flow::CALL);
    EXPECT_EQ(bl.target, 0x1010u);

    auto bne = decode(Machine::AARCH64, words_le({0x54000041}), 0x1000);
    EXPECT_EQ(bne.mnemonic, "b.ne");
    EXPECT_EQ(bne.flow, Flow::COND_BRANCH);
    EXPECT_EQ(bne.target, 0x1008u);
}

TEST(AArch64, LiteralLoadRendersTargetAddress)
{
    auto insn = decode(Machine::AARCH64, words_le({0x58000040}), 0x1000);
    ASSERT_EQ(insn.operands.size(), 2u);
    EXPECT_TRUE(insn.operands[1].flags & arch::OPF_PCREL);
    EXPECT_EQ(insn.operands[1].target, 0x1008u);
    EXPECT_EQ(text(Machine::AARCH64, insn), "ldr x0, 0x1008");
}

TEST(AArch64, MoveFromStackPointer)
{
    auto insn = decode(Machine::AARCH64, words_le({0x910003e0}));
    EXPECT_EQ(text(Machine::AARCH64, insn), "mov x0, sp");
}

TEST(AArch64, LengthIsAlwaysOneWord)
{
    const arch::Arch &a = testutil::arch_of(Machine::AARCH64);
    uint32_t w = 0xdeadbeef;
    for (int i = 0; i < 2000; i++) {
        w ^= w << 13;
        w ^= w >> 17;
        w ^= w << 5;
        auto bytes = words_le({w});
        auto insn = arch::decode(a, bytes, 0x1000);
        EXPECT_EQ(insn.length, 4u) << std::hex << w;
        if (insn.is_error)
            EXPECT_EQ(insn.mnemonic, "??");
    }
}
