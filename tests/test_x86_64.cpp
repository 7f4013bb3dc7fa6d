/*
 * test_x86_64.cpp: x86-64 decoder
 */

#include <gtest/gtest.h>

#include "helpers.hpp"

using arch::Flow;
using arch::Machine;
using testutil::decode;
using testutil::text;

TEST(X86_64, RegisterMove)
{
    auto insn = decode(Machine::X86_64, {0x89, 0xc8});
    EXPECT_FALSE(insn.is_error);
    EXPECT_EQ(insn.length, 2);
    EXPECT_EQ(insn.mnemonic, "mov");
    EXPECT_EQ(insn.flow, Flow::NONE);
    EXPECT_EQ(text(Machine::X86_64, insn), "mov eax, ecx");
}

TEST(X86_64, PushDefaultsTo64Bit)
{
    auto insn = decode(Machine::X86_64, {0x55});
    EXPECT_EQ(insn.length, 1);
    EXPECT_EQ(text(Machine::X86_64, insn), "push rbp");
}

TEST(X86_64, StackStoreWithDisplacement)
{
    auto insn = decode(Machine::X86_64, {0x89, 0x7d, 0xfc});
    EXPECT_EQ(insn.length, 3);
    EXPECT_EQ(text(Machine::X86_64, insn), "mov dword ptr [rbp - 0x4], edi");
}

TEST(X86_64, Return)
{
    auto insn = decode(Machine::X86_64, {0xc3});
    EXPECT_EQ(insn.length, 1);
    EXPECT_EQ(insn.flow, Flow::RETURN);
    EXPECT_FALSE(insn.has_target);
}

TEST(X86_64, JumpRel32)
{
    auto insn = decode(Machine::X86_64, {0xe9, 0xf9, 0x0f, 0x00, 0x00}, 0x1002);
    EXPECT_EQ(insn.length, 5);
    EXPECT_EQ(insn.flow, Flow::BRANCH);
    ASSERT_TRUE(insn.has_target);
    EXPECT_EQ(insn.target, 0x2000u);
}

TEST(X86_64, CallRel32)
{
    auto insn = decode(Machine::X86_64, {0xe8, 0x10, 0x00, 0x00, 0x00}, 0x1000);
    EXPECT_EQ(insn.flow, Flow::CALL);
    ASSERT_TRUE(insn.has_target);
    EXPECT_EQ(insn.target, 0x1015u);
}

TEST(X86_64, ConditionalJumpRel8)
{
    auto insn = decode(Machine::X86_64, {0x75, 0xfe}, 0x1000);
    EXPECT_EQ(insn.mnemonic, "jne");
    EXPECT_EQ(insn.flow, Flow::COND_BRANCH);
    ASSERT_TRUE(insn.has_target);
    EXPECT_EQ(insn.target, 0x1000u);
}

TEST(X86_64, IndirectJumpThroughMemory)
{
    auto insn = decode(Machine::X86_64, {0xff, 0x25, 0x00, 0x10, 0x00, 0x00}, 0x1000);
    EXPECT_EQ(insn.length, 6);
    EXPECT_EQ(insn.flow, Flow::INDIRECT);
    EXPECT_FALSE(insn.has_target);
}

TEST(X86_64, RipRelativeOperand)
{
    auto insn = decode(Machine::X86_64, {0x48, 0x8d, 0x05, 0x10, 0x00, 0x00, 0x00}, 0x1000);
    ASSERT_FALSE(insn.is_error);
    EXPECT_EQ(insn.length, 7);
    ASSERT_EQ(insn.operands.size(), 2u);
    const arch::Operand &mem = insn.operands[1];
    EXPECT_EQ(mem.kind, arch::OperandKind::MEM);
    EXPECT_TRUE(mem.flags & arch::OPF_PCREL);
    EXPECT_EQ(mem.target, 0x1017u);
    EXPECT_EQ(text(Machine::X86_64, insn), "lea rax, [rip + 0x10]  ; 0x1017");
}

TEST(X86_64, InvalidOpcodeIsOneByte)
{
    auto insn = decode(Machine::X86_64, {0x06, 0xc3});
    EXPECT_TRUE(insn.is_error);
    EXPECT_EQ(insn.length, 1);
    EXPECT_EQ(insn.mnemonic, "??");
    EXPECT_EQ(text(Machine::X86_64, insn), "??");
}

TEST(X86_64, TruncatedInstructionCoversRemainingBytes)
{
    auto insn = decode(Machine::X86_64, {0xe9, 0x00});
    EXPECT_TRUE(insn.is_error);
    EXPECT_EQ(insn.length, 2);
}

TEST(X86_64, EveryOpcodeDecodesToBoundedLength)
{
    const arch::Arch &a = testutil::arch_of(Machine::X86_64);
    for (unsigned op = 0; op < 256; op++) {
        std::vector<uint8_t> buf(16, 0);
        buf[0] = (uint8_t)op;
        auto insn = arch::decode(a, buf, 0x4000);
        EXPECT_GE(insn.length, 1u) << "opcode " << op;
        EXPECT_LE(insn.length, a.max_insn_size) << "opcode " << op;
        EXPECT_EQ(insn, arch::decode(a, buf, 0x4000)) << "opcode " << op;
    }
}

TEST(X86_64, LinearDisassembly)
{
    std::vector<uint8_t> bytes = {0x55, 0x89, 0xc8, 0xc3};
    auto insns = arch::disassemble(bytes, 0x1000, Machine::X86_64);
    ASSERT_EQ(insns.size(), 3u);
    EXPECT_EQ(insns[0].address, 0x1000u);
    EXPECT_EQ(insns[1].address, 0x1001u);
    EXPECT_EQ(insns[2].address, 0x1003u);
    EXPECT_EQ(insns[2].flow, Flow::RETURN);
}
