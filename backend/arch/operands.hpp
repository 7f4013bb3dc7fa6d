/*
 * operands.hpp: Operand construction helpers shared by the decoders
 */

#ifndef DS_ARCH_OPERANDS_H
#define DS_ARCH_OPERANDS_H

#include "arch.hpp"

#include <cstring>

namespace arch {

inline Operand op_reg(const char *name, uint8_t flags = 0)
{
    Operand o;
    o.kind = OperandKind::REG;
    o.reg = name;
    o.flags = flags;
    return o;
}

/* Immediate: value must already be sign-extended when is_signed. */
inline Operand op_imm(int64_t value, uint8_t width, bool is_signed,
                      bool hex = true)
{
    Operand o;
    o.kind = OperandKind::IMM;
    o.value = value;
    o.width = width;
    o.is_signed = is_signed;
    o.flags = hex ? OPF_HEX : 0;
    return o;
}

inline Operand op_mem(const char *base, int64_t disp, uint8_t disp_width,
                      uint8_t size = 0)
{
    Operand o;
    o.kind = OperandKind::MEM;
    o.reg = base;
    o.value = disp;
    o.width = disp_width;
    o.size = size;
    return o;
}

inline Operand op_rel(uint64_t target)
{
    Operand o;
    o.kind = OperandKind::REL;
    o.target = target;
    return o;
}

inline int64_t sign_extend(uint64_t v, unsigned bits)
{
    if (bits >= 64) return (int64_t)v;
    uint64_t m = 1ull << (bits - 1);
    v &= (1ull << bits) - 1;
    return (int64_t)((v ^ m) - m);
}

/* Read a 32-bit instruction word honouring DECODE_BIG_ENDIAN. */
inline uint32_t read_word32(std::span<const uint8_t> data, uint32_t flags)
{
    if (flags & DECODE_BIG_ENDIAN)
        return ((uint32_t)data[0] << 24) | ((uint32_t)data[1] << 16)
             | ((uint32_t)data[2] << 8)  |  (uint32_t)data[3];
    return  (uint32_t)data[0]        | ((uint32_t)data[1] << 8)
         | ((uint32_t)data[2] << 16) | ((uint32_t)data[3] << 24);
}

/* Finish a fixed-width entry: set address, length and raw bytes. */
inline Instruction &finish(Instruction &insn, std::span<const uint8_t> data,
                           uint64_t addr, unsigned len)
{
    insn.address = addr;
    insn.length = (uint8_t)len;
    std::memcpy(insn.bytes.data(), data.data(), len);
    return insn;
}

} // namespace arch

#endif // DS_ARCH_OPERANDS_H
