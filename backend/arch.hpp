/*
 * arch.hpp: Architecture module
 *
 * Structured instruction decoders for x86-64, ARM (A32), AArch64,
 * RISC-V (RV64) and MIPS32.  Every backend implements the same
 * contract: decode one instruction at a byte offset, purely, and
 * represent undecodable bytes as an invalid entry instead of failing.
 */

#ifndef DS_ARCH_H
#define DS_ARCH_H

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace arch {

enum class Machine : uint8_t {
    UNKNOWN,
    X86_64,
    ARM,
    AARCH64,
    RISCV64,
    MIPS,
};

/* Control-flow classification of a decoded instruction. */
enum class Flow : uint8_t {
    NONE,
    BRANCH,         // Unconditional direct branch
    COND_BRANCH,    // Conditional direct branch
    CALL,           // Direct call
    RETURN,
    INDIRECT,       // Branch or call through a register or memory
};

enum class OperandKind : uint8_t {
    REG,
    IMM,
    MEM,
    REL,
};

/* Memory addressing mode (ARM/AArch64 writeback forms). */
enum class MemMode : uint8_t {
    OFFSET,         // [base, #disp]
    PRE_INDEX,      // [base, #disp]!
    POST_INDEX,     // [base], #disp
};

/* Operand flags */
enum : uint8_t {
    OPF_HEX        = 1 << 0,   // IMM: render in hex
    OPF_WRITEBACK  = 1 << 1,   // REG: base register written back ("r0!")
    OPF_LIST_FIRST = 1 << 2,   // REG: first entry of a register list
    OPF_LIST_LAST  = 1 << 3,   // REG: last entry of a register list
    OPF_PCREL      = 1 << 4,   // MEM: address relative to PC, target is valid
    OPF_NEGATE     = 1 << 5,   // MEM: index register subtracted (A32)
};

struct Operand {
    OperandKind kind      = OperandKind::REG;
    uint8_t     flags     = 0;
    uint8_t     width     = 0;        // IMM: encoded bits; MEM: displacement bits
    bool        is_signed = false;    // IMM: encoded as a signed field
    uint8_t     size      = 0;        // MEM: access size in bytes (0 = implicit)
    uint8_t     scale     = 1;        // MEM: index scale
    MemMode     mode      = MemMode::OFFSET;
    uint8_t     shift_amount = 0;     // REG/MEM index: shift or extend amount
    const char *reg       = nullptr;  // REG: register; MEM: base (nullptr = none)
    const char *index     = nullptr;  // MEM: index register
    const char *segment   = nullptr;  // MEM: segment override (x86)
    const char *shift     = nullptr;  // REG/MEM index: "lsl", "uxtw", ...
    const char *shift_reg = nullptr;  // REG: register-specified shift (A32)
    int64_t     value     = 0;        // IMM value (sign-extended when signed) or displacement
    uint64_t    target    = 0;        // REL target; MEM effective address when OPF_PCREL

    bool operator==(const Operand &) const = default;
};

constexpr unsigned MAX_INSN_BYTES = 15;

/*
 * One decode result.  is_error marks an invalid opcode: length is then
 * the number of bytes the decoder attempted (at least 1) and the
 * mnemonic is "??".
 */
struct Instruction {
    uint64_t    address    = 0;
    uint8_t     length     = 0;
    bool        is_error   = false;
    Flow        flow       = Flow::NONE;
    bool        has_target = false;   // Direct branch/call target known
    uint64_t    target     = 0;
    std::string mnemonic;
    std::vector<Operand> operands;
    std::array<uint8_t, MAX_INSN_BYTES> bytes {};

    uint64_t end() const { return address + length; }

    bool operator==(const Instruction &) const = default;
};

/* Decode flags */
enum : uint32_t {
    DECODE_BIG_ENDIAN = 1u << 0,      // MIPS/ARM big-endian word order
};

/* ---- Architecture descriptor ---- */

struct Arch {
    Machine     machine;
    const char *name;                 // "x86_64", "arm", ...
    unsigned    max_insn_size;        // Maximum instruction size in bytes
    unsigned    alignment;            // Instruction alignment in bytes
    unsigned    branch_delay_slots;   // 1 = MIPS-style delay slot
    unsigned    pointer_size;         // Bytes per code pointer
    unsigned    addr_digits;          // Hex digits for the address column
    Instruction (*decode_fn)(std::span<const uint8_t> data, uint64_t addr,
                             uint32_t flags);
};

const Arch *arch_for_machine(Machine machine);
const Arch *arch_by_name(const char *name);
std::span<const Arch> all_archs();

/*
 * Decode a single instruction at addr from the start of data.
 * Never fails: invalid or truncated input yields an entry with
 * is_error set and length >= 1.
 */
Instruction decode(const Arch &arch, std::span<const uint8_t> data,
                   uint64_t addr, uint32_t flags = 0);

/* Linear disassembly of a whole buffer (hex views, tests). */
std::vector<Instruction> disassemble(std::span<const uint8_t> data,
                                     uint64_t base_addr,
                                     Machine machine,
                                     uint32_t flags = 0);

/* Build an invalid entry covering len bytes (clamped to 1..data size). */
Instruction make_invalid(std::span<const uint8_t> data, uint64_t addr,
                         unsigned len);

const char *flow_name(Flow flow);
const char *machine_name(Machine machine);

} // namespace arch

#endif // DS_ARCH_H
