/*
 * test_arch.cpp: Architecture table and decode contract
 */

#include <gtest/gtest.h>

#include "helpers.hpp"

#include <cstring>

using arch::Machine;

TEST(Arch, LookupByNameAndAlias)
{
    ASSERT_NE(arch::arch_by_name("x86_64"), nullptr);
    EXPECT_EQ(arch::arch_by_name("x64")->machine, Machine::X86_64);
    EXPECT_EQ(arch::arch_by_name("amd64")->machine, Machine::X86_64);
    EXPECT_EQ(arch::arch_by_name("arm64")->machine, Machine::AARCH64);
    EXPECT_EQ(arch::arch_by_name("rv64")->machine, Machine::RISCV64);
    EXPECT_EQ(arch::arch_by_name("mipsel")->machine, Machine::MIPS);
    EXPECT_EQ(arch::arch_by_name("z80"), nullptr);
}

TEST(Arch, TableIsConsistent)
{
    for (const arch::Arch &a : arch::all_archs()) {
        EXPECT_EQ(arch::arch_for_machine(a.machine), &a) << a.name;
        EXPECT_STREQ(arch::arch_by_name(a.name)->name, a.name);
        EXPECT_GE(a.max_insn_size, a.alignment) << a.name;
        EXPECT_TRUE(a.pointer_size == 4 || a.pointer_size == 8) << a.name;
    }
    EXPECT_EQ(arch::arch_for_machine(Machine::UNKNOWN), nullptr);
}

TEST(Arch, EmptyInputStillYieldsAnEntry)
{
    for (const arch::Arch &a : arch::all_archs()) {
        std::vector<uint8_t> one = {0xff};
        auto insn = arch::decode(a, one, 0x100);
        EXPECT_TRUE(insn.is_error) << a.name;
        EXPECT_EQ(insn.length, 1u) << a.name;
        EXPECT_EQ(insn.address, 0x100u) << a.name;
    }
}

TEST(Arch, MakeInvalidClampsLength)
{
    std::vector<uint8_t> bytes = {1, 2, 3};
    auto zero = arch::make_invalid(bytes, 0x10, 0);
    EXPECT_EQ(zero.length, 1u);
    auto big = arch::make_invalid(bytes, 0x10, 9);
    EXPECT_EQ(big.length, 3u);
    EXPECT_EQ(big.bytes[2], 3);
    EXPECT_EQ(big.mnemonic, "??");
}
