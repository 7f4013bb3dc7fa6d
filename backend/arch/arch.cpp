/*
 * arch.cpp: Architecture dispatcher
 */

#include "arch.hpp"
#include "operands.hpp"

#include <algorithm>
#include <cstring>
#include <strings.h>

namespace arch {

// Forward declarations for arch-specific decoders
Instruction dec_x86_64(std::span<const uint8_t> data, uint64_t addr,
                       uint32_t flags);
Instruction dec_arm(std::span<const uint8_t> data, uint64_t addr,
                    uint32_t flags);
Instruction dec_aarch64(std::span<const uint8_t> data, uint64_t addr,
                        uint32_t flags);
Instruction dec_riscv(std::span<const uint8_t> data, uint64_t addr,
                      uint32_t flags);
Instruction dec_mips(std::span<const uint8_t> data, uint64_t addr,
                     uint32_t flags);

static const Arch arch_table[] = {
    { Machine::X86_64,  "x86_64",  15, 1, 0, 8, 12, dec_x86_64  },
    { Machine::ARM,     "arm",      4, 4, 0, 4,  8, dec_arm     },
    { Machine::AARCH64, "aarch64",  4, 4, 0, 8, 12, dec_aarch64 },
    { Machine::RISCV64, "riscv64",  4, 4, 0, 8, 12, dec_riscv   },
    { Machine::MIPS,    "mips",     4, 4, 1, 4,  8, dec_mips    },
};

const Arch *arch_for_machine(Machine machine)
{
    for (auto &a : arch_table)
        if (a.machine == machine)
            return &a;
    return nullptr;
}

const Arch *arch_by_name(const char *name)
{
    if (!name) return nullptr;
    for (auto &a : arch_table)
        if (strcasecmp(a.name, name) == 0)
            return &a;

    /* Common aliases */
    if (strcasecmp(name, "x64") == 0 || strcasecmp(name, "amd64") == 0)
        return arch_for_machine(Machine::X86_64);
    if (strcasecmp(name, "arm64") == 0)
        return arch_for_machine(Machine::AARCH64);
    if (strcasecmp(name, "riscv") == 0 || strcasecmp(name, "rv64") == 0)
        return arch_for_machine(Machine::RISCV64);
    if (strcasecmp(name, "arm32") == 0 || strcasecmp(name, "a32") == 0)
        return arch_for_machine(Machine::ARM);
    if (strcasecmp(name, "mips32") == 0 || strcasecmp(name, "mipsel") == 0)
        return arch_for_machine(Machine::MIPS);
    return nullptr;
}

std::span<const Arch> all_archs()
{
    return arch_table;
}

Instruction make_invalid(std::span<const uint8_t> data, uint64_t addr,
                         unsigned len)
{
    unsigned avail = (unsigned)std::min<size_t>(data.size(), MAX_INSN_BYTES);
    if (len > avail) len = avail;
    if (len == 0) len = 1;

    Instruction insn;
    insn.address = addr;
    insn.length = (uint8_t)len;
    insn.is_error = true;
    insn.mnemonic = "??";
    std::memcpy(insn.bytes.data(), data.data(), std::min(len, avail));
    return insn;
}

Instruction decode(const Arch &arch, std::span<const uint8_t> data,
                   uint64_t addr, uint32_t flags)
{
    if (data.empty())
        return make_invalid(data, addr, 1);

    Instruction insn = arch.decode_fn(data, addr, flags);
    if (insn.length == 0)
        return make_invalid(data, addr, 1);
    return insn;
}

std::vector<Instruction> disassemble(std::span<const uint8_t> data,
                                     uint64_t base_addr,
                                     Machine machine,
                                     uint32_t flags)
{
    std::vector<Instruction> out;
    const Arch *a = arch_for_machine(machine);
    if (!a) return out;

    size_t pos = 0;
    while (pos < data.size()) {
        out.push_back(decode(*a, data.subspan(pos), base_addr + pos, flags));
        pos += out.back().length;
    }
    return out;
}

const char *flow_name(Flow flow)
{
    switch (flow) {
    case Flow::NONE:        return "none";
    case Flow::BRANCH:      return "branch";
    case Flow::COND_BRANCH: return "cond_branch";
    case Flow::CALL:        return "call";
    case Flow::RETURN:      return "return";
    case Flow::INDIRECT:    return "indirect";
    }
    return "none";
}

const char *machine_name(Machine machine)
{
    const Arch *a = arch_for_machine(machine);
    return a ? a->name : "unknown";
}

} // namespace arch
