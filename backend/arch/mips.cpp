/*
 * mips.cpp: MIPS32 architecture data
 *
 * Disassembler covering the MIPS32 base set: SPECIAL, SPECIAL2, SPECIAL3
 * bitfield ops, REGIMM, jumps, branches (including branch-likely),
 * immediates, loads/stores, COP0 and the COP1 move/branch subset.
 * Every branch and jump has one delay slot.  Words are little endian
 * unless DECODE_BIG_ENDIAN is set.
 */

#include "arch.hpp"
#include "operands.hpp"

#include <initializer_list>

namespace arch {

/* ======================================================================== */
/* Register names                                                            */
/* ======================================================================== */

static const char *const gpr_name[32] = {
    "zero", "at", "v0", "v1", "a0", "a1", "a2", "a3",
    "t0",   "t1", "t2", "t3", "t4", "t5", "t6", "t7",
    "s0",   "s1", "s2", "s3", "s4", "s5", "s6", "s7",
    "t8",   "t9", "k0", "k1", "gp", "sp", "fp", "ra",
};

static const char *const fpr_name[32] = {
    "f0",  "f1",  "f2",  "f3",  "f4",  "f5",  "f6",  "f7",
    "f8",  "f9",  "f10", "f11", "f12", "f13", "f14", "f15",
    "f16", "f17", "f18", "f19", "f20", "f21", "f22", "f23",
    "f24", "f25", "f26", "f27", "f28", "f29", "f30", "f31",
};

/* COP0 register names (select 0) */
static const char *const cop0_name[32] = {
    "Index",    "Random",   "EntryLo0", "EntryLo1",
    "Context",  "PageMask", "Wired",    "HWREna",
    "BadVAddr", "Count",    "EntryHi",  "Compare",
    "Status",   "Cause",    "EPC",      "PRId",
    "Config",   "LLAddr",   "WatchLo",  "WatchHi",
    "cop0r20",  "cop0r21",  "cop0r22",  "Debug",
    "DEPC",     "PerfCnt",  "ErrCtl",   "CacheErr",
    "TagLo",    "TagHi",    "ErrorEPC", "DESAVE",
};

/* ======================================================================== */
/* Field extraction                                                          */
/* ======================================================================== */

static inline unsigned field_op(uint32_t w)     { return (w >> 26) & 0x3F; }
static inline unsigned field_rs(uint32_t w)     { return (w >> 21) & 0x1F; }
static inline unsigned field_rt(uint32_t w)     { return (w >> 16) & 0x1F; }
static inline unsigned field_rd(uint32_t w)     { return (w >> 11) & 0x1F; }
static inline unsigned field_shamt(uint32_t w)  { return (w >>  6) & 0x1F; }
static inline unsigned field_funct(uint32_t w)  { return  w        & 0x3F; }
static inline uint16_t field_imm16(uint32_t w)  { return (uint16_t)w; }
static inline uint32_t field_target(uint32_t w) { return  w & 0x03FFFFFF; }

static inline uint64_t branch_target(uint32_t w, uint64_t addr)
{
    return (addr + 4 + ((int64_t)(int16_t)field_imm16(w) << 2)) & 0xFFFFFFFF;
}

/* ======================================================================== */
/* Operand helpers                                                           */
/* ======================================================================== */

static inline Operand gpr(unsigned r) { return op_reg(gpr_name[r]); }

static inline Operand simm16(uint32_t w)
{
    return op_imm((int16_t)field_imm16(w), 16, true, false);
}

static inline Operand uimm16(uint32_t w)
{
    return op_imm(field_imm16(w), 16, false);
}

static inline Operand shamt(uint32_t w)
{
    return op_imm(field_shamt(w), 5, false, false);
}

static inline Operand mem16(uint32_t w, uint8_t size)
{
    return op_mem(gpr_name[field_rs(w)], (int16_t)field_imm16(w), 16, size);
}

static void set(Instruction &insn, const char *m, std::initializer_list<Operand> ops,
                Flow flow = Flow::NONE)
{
    insn.mnemonic = m;
    insn.operands.assign(ops);
    insn.flow = flow;
}

static void set_branch(Instruction &insn, const char *m, std::initializer_list<Operand> ops,
                       uint64_t target, Flow flow)
{
    set(insn, m, ops, flow);
    insn.operands.push_back(op_rel(target));
    insn.has_target = true;
    insn.target = target;
}

/* ======================================================================== */
/* SPECIAL (op=0x00) decoder                                                 */
/* ======================================================================== */

static bool decode_special(Instruction &insn, uint32_t w)
{
    unsigned rd = field_rd(w);
    unsigned rs = field_rs(w);
    unsigned rt = field_rt(w);
    unsigned sa = field_shamt(w);

    switch (field_funct(w)) {
    /* Shift immediate */
    case 0x00: // SLL
        if (w == 0)
            set(insn, "nop", {});
        else if (w == 0x00000040)
            set(insn, "ssnop", {});
        else if (w == 0x000000C0)
            set(insn, "ehb", {});
        else
            set(insn, "sll", { gpr(rd), gpr(rt), shamt(w) });
        return true;
    case 0x02:
        set(insn, rs == 1 ? "rotr" : "srl", { gpr(rd), gpr(rt), shamt(w) });
        return true;
    case 0x03:
        set(insn, "sra", { gpr(rd), gpr(rt), shamt(w) });
        return true;

    /* Shift variable */
    case 0x04: set(insn, "sllv", { gpr(rd), gpr(rt), gpr(rs) }); return true;
    case 0x06: set(insn, sa == 1 ? "rotrv" : "srlv", { gpr(rd), gpr(rt), gpr(rs) }); return true;
    case 0x07: set(insn, "srav", { gpr(rd), gpr(rt), gpr(rs) }); return true;

    /* Jump register */
    case 0x08: // JR
        if (rs == 31)
            set(insn, "jr", { gpr(rs) }, Flow::RETURN);
        else
            set(insn, "jr", { gpr(rs) }, Flow::INDIRECT);
        return true;
    case 0x09: // JALR
        if (rd == 31)
            set(insn, "jalr", { gpr(rs) }, Flow::INDIRECT);
        else
            set(insn, "jalr", { gpr(rd), gpr(rs) }, Flow::INDIRECT);
        return true;

    /* Conditional moves */
    case 0x0A: set(insn, "movz", { gpr(rd), gpr(rs), gpr(rt) }); return true;
    case 0x0B: set(insn, "movn", { gpr(rd), gpr(rs), gpr(rt) }); return true;

    /* System */
    case 0x0C:
        set(insn, "syscall", {});
        return true;
    case 0x0D:
        set(insn, "break", {});
        return true;
    case 0x0F:
        set(insn, "sync", {});
        return true;

    /* HI/LO */
    case 0x10: set(insn, "mfhi", { gpr(rd) }); return true;
    case 0x11: set(insn, "mthi", { gpr(rs) }); return true;
    case 0x12: set(insn, "mflo", { gpr(rd) }); return true;
    case 0x13: set(insn, "mtlo", { gpr(rs) }); return true;

    /* Multiply/divide */
    case 0x18: set(insn, "mult",  { gpr(rs), gpr(rt) }); return true;
    case 0x19: set(insn, "multu", { gpr(rs), gpr(rt) }); return true;
    case 0x1A: set(insn, "div",   { gpr(rs), gpr(rt) }); return true;
    case 0x1B: set(insn, "divu",  { gpr(rs), gpr(rt) }); return true;

    /* ALU register-register */
    case 0x20: set(insn, "add", { gpr(rd), gpr(rs), gpr(rt) }); return true;
    case 0x21: // ADDU
        if (rt == 0)
            set(insn, "move", { gpr(rd), gpr(rs) });
        else if (rs == 0)
            set(insn, "move", { gpr(rd), gpr(rt) });
        else
            set(insn, "addu", { gpr(rd), gpr(rs), gpr(rt) });
        return true;
    case 0x22:
        if (rs == 0)
            set(insn, "neg", { gpr(rd), gpr(rt) });
        else
            set(insn, "sub", { gpr(rd), gpr(rs), gpr(rt) });
        return true;
    case 0x23:
        if (rs == 0)
            set(insn, "negu", { gpr(rd), gpr(rt) });
        else
            set(insn, "subu", { gpr(rd), gpr(rs), gpr(rt) });
        return true;
    case 0x24: set(insn, "and", { gpr(rd), gpr(rs), gpr(rt) }); return true;
    case 0x25: // OR
        if (rt == 0)
            set(insn, "move", { gpr(rd), gpr(rs) });
        else if (rs == 0)
            set(insn, "move", { gpr(rd), gpr(rt) });
        else
            set(insn, "or", { gpr(rd), gpr(rs), gpr(rt) });
        return true;
    case 0x26: set(insn, "xor", { gpr(rd), gpr(rs), gpr(rt) }); return true;
    case 0x27:
        if (rt == 0)
            set(insn, "not", { gpr(rd), gpr(rs) });
        else
            set(insn, "nor", { gpr(rd), gpr(rs), gpr(rt) });
        return true;
    case 0x2A: set(insn, "slt",  { gpr(rd), gpr(rs), gpr(rt) }); return true;
    case 0x2B: set(insn, "sltu", { gpr(rd), gpr(rs), gpr(rt) }); return true;

    /* Traps */
    case 0x30: set(insn, "tge",  { gpr(rs), gpr(rt) }); return true;
    case 0x31: set(insn, "tgeu", { gpr(rs), gpr(rt) }); return true;
    case 0x32: set(insn, "tlt",  { gpr(rs), gpr(rt) }); return true;
    case 0x33: set(insn, "tltu", { gpr(rs), gpr(rt) }); return true;
    case 0x34: set(insn, "teq",  { gpr(rs), gpr(rt) }); return true;
    case 0x36: set(insn, "tne",  { gpr(rs), gpr(rt) }); return true;

    default:
        return false;
    }
}

/* ======================================================================== */
/* SPECIAL2 (op=0x1C) and SPECIAL3 (op=0x1F) decoders                        */
/* ======================================================================== */

static bool decode_special2(Instruction &insn, uint32_t w)
{
    unsigned rd = field_rd(w);
    unsigned rs = field_rs(w);
    unsigned rt = field_rt(w);

    switch (field_funct(w)) {
    case 0x00: set(insn, "madd",  { gpr(rs), gpr(rt) }); return true;
    case 0x01: set(insn, "maddu", { gpr(rs), gpr(rt) }); return true;
    case 0x02: set(insn, "mul",   { gpr(rd), gpr(rs), gpr(rt) }); return true;
    case 0x04: set(insn, "msub",  { gpr(rs), gpr(rt) }); return true;
    case 0x05: set(insn, "msubu", { gpr(rs), gpr(rt) }); return true;
    case 0x20: set(insn, "clz",   { gpr(rd), gpr(rs) }); return true;
    case 0x21: set(insn, "clo",   { gpr(rd), gpr(rs) }); return true;
    case 0x3F: set(insn, "sdbbp", {}); return true;
    default:   return false;
    }
}

static bool decode_special3(Instruction &insn, uint32_t w)
{
    unsigned rd = field_rd(w);
    unsigned rs = field_rs(w);
    unsigned rt = field_rt(w);
    unsigned sa = field_shamt(w);

    switch (field_funct(w)) {
    case 0x00: // EXT rt, rs, pos, size
        set(insn, "ext", { gpr(rt), gpr(rs), op_imm(sa, 5, false, false),
                           op_imm(rd + 1, 5, false, false) });
        return true;
    case 0x04: // INS rt, rs, pos, size
        if (rd < sa) return false;
        set(insn, "ins", { gpr(rt), gpr(rs), op_imm(sa, 5, false, false),
                           op_imm(rd - sa + 1, 5, false, false) });
        return true;
    case 0x20: // BSHFL
        switch (sa) {
        case 0x02: set(insn, "wsbh", { gpr(rd), gpr(rt) }); return true;
        case 0x10: set(insn, "seb",  { gpr(rd), gpr(rt) }); return true;
        case 0x18: set(insn, "seh",  { gpr(rd), gpr(rt) }); return true;
        default:   return false;
        }
    case 0x3B: // RDHWR
        set(insn, "rdhwr", { gpr(rt), op_imm(rd, 5, false, false) });
        return true;
    default:
        return false;
    }
}

/* ======================================================================== */
/* REGIMM (op=0x01) decoder                                                  */
/* ======================================================================== */

static bool decode_regimm(Instruction &insn, uint32_t w, uint64_t addr)
{
    unsigned rs = field_rs(w);
    uint64_t target = branch_target(w, addr);

    switch (field_rt(w)) {
    case 0x00: set_branch(insn, "bltz",  { gpr(rs) }, target, Flow::COND_BRANCH); return true;
    case 0x01:
        if (rs == 0)
            set_branch(insn, "b", {}, target, Flow::BRANCH);
        else
            set_branch(insn, "bgez", { gpr(rs) }, target, Flow::COND_BRANCH);
        return true;
    case 0x02: set_branch(insn, "bltzl", { gpr(rs) }, target, Flow::COND_BRANCH); return true;
    case 0x03: set_branch(insn, "bgezl", { gpr(rs) }, target, Flow::COND_BRANCH); return true;
    case 0x08: set(insn, "tgei",  { gpr(rs), simm16(w) }); return true;
    case 0x09: set(insn, "tgeiu", { gpr(rs), simm16(w) }); return true;
    case 0x0A: set(insn, "tlti",  { gpr(rs), simm16(w) }); return true;
    case 0x0B: set(insn, "tltiu", { gpr(rs), simm16(w) }); return true;
    case 0x0C: set(insn, "teqi",  { gpr(rs), simm16(w) }); return true;
    case 0x0E: set(insn, "tnei",  { gpr(rs), simm16(w) }); return true;
    case 0x10: set_branch(insn, "bltzal", { gpr(rs) }, target, Flow::CALL); return true;
    case 0x11:
        if (rs == 0)
            set_branch(insn, "bal", {}, target, Flow::CALL);
        else
            set_branch(insn, "bgezal", { gpr(rs) }, target, Flow::CALL);
        return true;
    case 0x12: set_branch(insn, "bltzall", { gpr(rs) }, target, Flow::CALL); return true;
    case 0x13: set_branch(insn, "bgezall", { gpr(rs) }, target, Flow::CALL); return true;
    case 0x1F: set(insn, "synci", { mem16(w, 0) }); return true;
    default:
        return false;
    }
}

/* ======================================================================== */
/* COP0 (op=0x10) and COP1 (op=0x11) decoders                                */
/* ======================================================================== */

static bool decode_cop0(Instruction &insn, uint32_t w)
{
    unsigned rt = field_rt(w);
    unsigned rd = field_rd(w);

    switch (field_rs(w)) {
    case 0x00:
        set(insn, "mfc0", { gpr(rt), op_reg(cop0_name[rd]) });
        return true;
    case 0x04:
        set(insn, "mtc0", { gpr(rt), op_reg(cop0_name[rd]) });
        return true;
    case 0x0B: // MFMC0
        set(insn, (w & 0x20) ? "ei" : "di", { gpr(rt) });
        return true;
    default:
        break;
    }

    if (!(w & (1u << 25)))
        return false;

    /* CO: coprocessor operation */
    switch (field_funct(w)) {
    case 0x01: set(insn, "tlbr",  {}); return true;
    case 0x02: set(insn, "tlbwi", {}); return true;
    case 0x06: set(insn, "tlbwr", {}); return true;
    case 0x08: set(insn, "tlbp",  {}); return true;
    case 0x10: set(insn, "rfe",   {}); return true;
    case 0x18: set(insn, "eret",  {}, Flow::RETURN); return true;
    case 0x1F: set(insn, "deret", {}, Flow::RETURN); return true;
    case 0x20: set(insn, "wait",  {}); return true;
    default:   return false;
    }
}

static bool decode_cop1(Instruction &insn, uint32_t w, uint64_t addr)
{
    unsigned rt = field_rt(w);
    unsigned fs = field_rd(w);

    switch (field_rs(w)) {
    case 0x00: set(insn, "mfc1",  { gpr(rt), op_reg(fpr_name[fs]) }); return true;
    case 0x02: set(insn, "cfc1",  { gpr(rt), op_imm(fs, 5, false, false) }); return true;
    case 0x03: set(insn, "mfhc1", { gpr(rt), op_reg(fpr_name[fs]) }); return true;
    case 0x04: set(insn, "mtc1",  { gpr(rt), op_reg(fpr_name[fs]) }); return true;
    case 0x06: set(insn, "ctc1",  { gpr(rt), op_imm(fs, 5, false, false) }); return true;
    case 0x07: set(insn, "mthc1", { gpr(rt), op_reg(fpr_name[fs]) }); return true;
    case 0x08: { // BC1x
        static const char *const n[4] = { "bc1f", "bc1t", "bc1fl", "bc1tl" };
        set_branch(insn, n[rt & 3], {}, branch_target(w, addr), Flow::COND_BRANCH);
        return true;
    }
    default:
        return false;
    }
}

/* ======================================================================== */
/* Main disassembler                                                         */
/* ======================================================================== */

static bool decode_word(Instruction &insn, uint32_t w, uint64_t addr)
{
    unsigned rs = field_rs(w);
    unsigned rt = field_rt(w);

    switch (field_op(w)) {
    case 0x00: return decode_special(insn, w);
    case 0x01: return decode_regimm(insn, w, addr);

    case 0x02: { // J
        uint64_t t = ((addr + 4) & 0xF0000000) | ((uint64_t)field_target(w) << 2);
        set_branch(insn, "j", {}, t, Flow::BRANCH);
        return true;
    }
    case 0x03: { // JAL
        uint64_t t = ((addr + 4) & 0xF0000000) | ((uint64_t)field_target(w) << 2);
        set_branch(insn, "jal", {}, t, Flow::CALL);
        return true;
    }

    case 0x04: // BEQ
        if (rs == 0 && rt == 0)
            set_branch(insn, "b", {}, branch_target(w, addr), Flow::BRANCH);
        else if (rt == 0)
            set_branch(insn, "beqz", { gpr(rs) }, branch_target(w, addr), Flow::COND_BRANCH);
        else
            set_branch(insn, "beq", { gpr(rs), gpr(rt) }, branch_target(w, addr), Flow::COND_BRANCH);
        return true;
    case 0x05: // BNE
        if (rt == 0)
            set_branch(insn, "bnez", { gpr(rs) }, branch_target(w, addr), Flow::COND_BRANCH);
        else
            set_branch(insn, "bne", { gpr(rs), gpr(rt) }, branch_target(w, addr), Flow::COND_BRANCH);
        return true;
    case 0x06:
        set_branch(insn, "blez", { gpr(rs) }, branch_target(w, addr), Flow::COND_BRANCH);
        return true;
    case 0x07:
        set_branch(insn, "bgtz", { gpr(rs) }, branch_target(w, addr), Flow::COND_BRANCH);
        return true;

    /* Arithmetic immediate */
    case 0x08: set(insn, "addi", { gpr(rt), gpr(rs), simm16(w) }); return true;
    case 0x09: // ADDIU
        if (rs == 0)
            set(insn, "li", { gpr(rt), simm16(w) });
        else
            set(insn, "addiu", { gpr(rt), gpr(rs), simm16(w) });
        return true;
    case 0x0A: set(insn, "slti",  { gpr(rt), gpr(rs), simm16(w) }); return true;
    case 0x0B: set(insn, "sltiu", { gpr(rt), gpr(rs), simm16(w) }); return true;

    /* Logical immediate (hex) */
    case 0x0C: set(insn, "andi", { gpr(rt), gpr(rs), uimm16(w) }); return true;
    case 0x0D: // ORI
        if (rs == 0)
            set(insn, "li", { gpr(rt), uimm16(w) });
        else
            set(insn, "ori", { gpr(rt), gpr(rs), uimm16(w) });
        return true;
    case 0x0E: set(insn, "xori", { gpr(rt), gpr(rs), uimm16(w) }); return true;
    case 0x0F: set(insn, "lui",  { gpr(rt), uimm16(w) }); return true;

    /* Coprocessors */
    case 0x10: return decode_cop0(insn, w);
    case 0x11: return decode_cop1(insn, w, addr);

    /* Branch likely */
    case 0x14:
        if (rt == 0)
            set_branch(insn, "beqzl", { gpr(rs) }, branch_target(w, addr), Flow::COND_BRANCH);
        else
            set_branch(insn, "beql", { gpr(rs), gpr(rt) }, branch_target(w, addr), Flow::COND_BRANCH);
        return true;
    case 0x15:
        if (rt == 0)
            set_branch(insn, "bnezl", { gpr(rs) }, branch_target(w, addr), Flow::COND_BRANCH);
        else
            set_branch(insn, "bnel", { gpr(rs), gpr(rt) }, branch_target(w, addr), Flow::COND_BRANCH);
        return true;
    case 0x16:
        set_branch(insn, "blezl", { gpr(rs) }, branch_target(w, addr), Flow::COND_BRANCH);
        return true;
    case 0x17:
        set_branch(insn, "bgtzl", { gpr(rs) }, branch_target(w, addr), Flow::COND_BRANCH);
        return true;

    case 0x1C: return decode_special2(insn, w);
    case 0x1F: return decode_special3(insn, w);

    /* Loads */
    case 0x20: set(insn, "lb",  { gpr(rt), mem16(w, 1) }); return true;
    case 0x21: set(insn, "lh",  { gpr(rt), mem16(w, 2) }); return true;
    case 0x22: set(insn, "lwl", { gpr(rt), mem16(w, 4) }); return true;
    case 0x23: set(insn, "lw",  { gpr(rt), mem16(w, 4) }); return true;
    case 0x24: set(insn, "lbu", { gpr(rt), mem16(w, 1) }); return true;
    case 0x25: set(insn, "lhu", { gpr(rt), mem16(w, 2) }); return true;
    case 0x26: set(insn, "lwr", { gpr(rt), mem16(w, 4) }); return true;

    /* Stores */
    case 0x28: set(insn, "sb",  { gpr(rt), mem16(w, 1) }); return true;
    case 0x29: set(insn, "sh",  { gpr(rt), mem16(w, 2) }); return true;
    case 0x2A: set(insn, "swl", { gpr(rt), mem16(w, 4) }); return true;
    case 0x2B: set(insn, "sw",  { gpr(rt), mem16(w, 4) }); return true;
    case 0x2E: set(insn, "swr", { gpr(rt), mem16(w, 4) }); return true;
    case 0x2F: set(insn, "cache", { op_imm(rt, 5, false), mem16(w, 0) }); return true;

    /* Atomics, prefetch and coprocessor load/store */
    case 0x30: set(insn, "ll",   { gpr(rt), mem16(w, 4) }); return true;
    case 0x31: set(insn, "lwc1", { op_reg(fpr_name[rt]), mem16(w, 4) }); return true;
    case 0x33: set(insn, "pref", { op_imm(rt, 5, false, false), mem16(w, 0) }); return true;
    case 0x35: set(insn, "ldc1", { op_reg(fpr_name[rt]), mem16(w, 8) }); return true;
    case 0x38: set(insn, "sc",   { gpr(rt), mem16(w, 4) }); return true;
    case 0x39: set(insn, "swc1", { op_reg(fpr_name[rt]), mem16(w, 4) }); return true;
    case 0x3D: set(insn, "sdc1", { op_reg(fpr_name[rt]), mem16(w, 8) }); return true;

    default:
        return false;
    }
}

Instruction dec_mips(std::span<const uint8_t> data, uint64_t addr,
                     uint32_t flags)
{
    if (data.size() < 4)
        return make_invalid(data, addr, (unsigned)data.size());

    uint32_t w = read_word32(data, flags);

    Instruction insn;
    if (!decode_word(insn, w, addr))
        return make_invalid(data, addr, 4);
    return finish(insn, data, addr, 4);
}

} // namespace arch
