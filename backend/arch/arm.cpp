/*
 * arm.cpp: ARM (A32) architecture data
 *
 * Disassembler covering the ARMv7 A32 integer set: data processing with
 * immediate and shifted-register operands, multiply and long multiply,
 * word/byte and halfword/signed/doubleword loads and stores, LDM/STM
 * (push/pop), branches, BX/BLX, SVC, MOVW/MOVT, CLZ, exclusives, MRS/MSR
 * and the NOP hint space.  UAL syntax; condition suffix follows the S
 * suffix.  Coprocessor and VFP/NEON encodings are reported invalid.
 */

#include "arch.hpp"
#include "operands.hpp"

#include <initializer_list>

namespace arch {

/* ======================================================================== */
/* Register and condition names                                              */
/* ======================================================================== */

static const char *const reg_name[16] = {
    "r0", "r1", "r2",  "r3",  "r4", "r5", "r6", "r7",
    "r8", "r9", "r10", "r11", "r12", "sp", "lr", "pc",
};

static const char *const cond_name[16] = {
    "eq", "ne", "cs", "cc", "mi", "pl", "vs", "vc",
    "hi", "ls", "ge", "lt", "gt", "le", "",   "",
};

static const char *const shift_name[4] = { "lsl", "lsr", "asr", "ror" };

static const char *const dp_name[16] = {
    "and", "eor", "sub", "rsb", "add", "adc", "sbc", "rsc",
    "tst", "teq", "cmp", "cmn", "orr", "mov", "bic", "mvn",
};

enum : unsigned { REG_SP = 13, REG_LR = 14, REG_PC = 15, COND_AL = 14 };

/* ======================================================================== */
/* Field extraction                                                          */
/* ======================================================================== */

static inline unsigned field_cond(uint32_t w) { return  w >> 28; }
static inline unsigned field_rn(uint32_t w)   { return (w >> 16) & 0xF; }
static inline unsigned field_rd(uint32_t w)   { return (w >> 12) & 0xF; }
static inline unsigned field_rs(uint32_t w)   { return (w >>  8) & 0xF; }
static inline unsigned field_rm(uint32_t w)   { return  w        & 0xF; }
static inline bool     bit(uint32_t w, unsigned n) { return (w >> n) & 1; }

/* ======================================================================== */
/* Operand helpers                                                           */
/* ======================================================================== */

static inline Operand reg(unsigned r) { return op_reg(reg_name[r]); }

static inline Operand imm(int64_t v, uint8_t width, bool is_signed = false,
                          bool hex = true)
{
    return op_imm(v, width, is_signed, hex);
}

/* Build "mnemonic[s]<cond>" into insn */
static void name(Instruction &insn, const char *base, uint32_t w,
                 bool s = false)
{
    insn.mnemonic = base;
    if (s) insn.mnemonic += 's';
    insn.mnemonic += cond_name[field_cond(w)];
}

static void set_ops(Instruction &insn, std::initializer_list<Operand> ops)
{
    insn.operands.assign(ops);
}

/* Shifted register operand (bits 11:0 with bit 25 clear) */
static bool shifted_reg(uint32_t w, Operand &out)
{
    unsigned type = (w >> 5) & 3;
    out = reg(field_rm(w));
    if (bit(w, 4)) {
        if (bit(w, 7)) return false;
        out.shift = shift_name[type];
        out.shift_reg = reg_name[field_rs(w)];
        return true;
    }
    unsigned amount = (w >> 7) & 0x1F;
    if (amount == 0) {
        if (type == 0) return true;             // no shift
        if (type == 3) { out.shift = "rrx"; return true; }
        amount = 32;                            // lsr/asr #32
    }
    out.shift = shift_name[type];
    out.shift_amount = (uint8_t)amount;
    return true;
}

/* Rotated 8-bit immediate (bits 11:0 with bit 25 set) */
static uint32_t rotated_imm(uint32_t w)
{
    uint32_t v = w & 0xFF;
    unsigned rot = ((w >> 8) & 0xF) * 2;
    return rot ? (v >> rot) | (v << (32 - rot)) : v;
}

/* ======================================================================== */
/* Branches and miscellaneous                                                */
/* ======================================================================== */

static bool decode_branch(Instruction &insn, uint32_t w, uint64_t addr)
{
    int64_t off = sign_extend(w & 0x00FFFFFF, 24) << 2;
    uint64_t target = (addr + 8 + off) & 0xFFFFFFFF;
    bool link = bit(w, 24);

    name(insn, link ? "bl" : "b", w);
    if (link)
        insn.flow = Flow::CALL;
    else if (field_cond(w) == COND_AL)
        insn.flow = Flow::BRANCH;
    else
        insn.flow = Flow::COND_BRANCH;
    insn.has_target = true;
    insn.target = target;
    set_ops(insn, { op_rel(target) });
    return true;
}

/* cond == 1111: unconditional space */
static bool decode_uncond(Instruction &insn, uint32_t w, uint64_t addr)
{
    if ((w & 0xFE000000) == 0xFA000000) {       // BLX imm
        int64_t off = (sign_extend(w & 0x00FFFFFF, 24) << 2) | (bit(w, 24) << 1);
        uint64_t target = (addr + 8 + off) & 0xFFFFFFFF;
        insn.mnemonic = "blx";
        insn.flow = Flow::CALL;
        insn.has_target = true;
        insn.target = target;
        set_ops(insn, { op_rel(target) });
        return true;
    }
    if ((w & 0xFF70F000) == 0xF550F000) {       // PLD imm
        int64_t off = w & 0xFFF;
        insn.mnemonic = "pld";
        set_ops(insn, { op_mem(reg_name[field_rn(w)], bit(w, 23) ? off : -off, 12) });
        return true;
    }
    if (w == 0xF57FF01F) { insn.mnemonic = "clrex"; return true; }
    if ((w & 0xFFFFFFF0) == 0xF57FF040) { insn.mnemonic = "dsb"; return true; }
    if ((w & 0xFFFFFFF0) == 0xF57FF050) { insn.mnemonic = "dmb"; return true; }
    if ((w & 0xFFFFFFF0) == 0xF57FF060) { insn.mnemonic = "isb"; return true; }
    return false;
}

static bool decode_misc(Instruction &insn, uint32_t w)
{
    /* BX / BLX register */
    if ((w & 0x0FFFFFF0) == 0x012FFF10) {
        unsigned rm = field_rm(w);
        name(insn, "bx", w);
        insn.flow = rm == REG_LR ? Flow::RETURN : Flow::INDIRECT;
        set_ops(insn, { reg(rm) });
        return true;
    }
    if ((w & 0x0FFFFFF0) == 0x012FFF30) {
        name(insn, "blx", w);
        insn.flow = Flow::INDIRECT;
        set_ops(insn, { reg(field_rm(w)) });
        return true;
    }
    /* CLZ */
    if ((w & 0x0FFF0FF0) == 0x016F0F10) {
        name(insn, "clz", w);
        set_ops(insn, { reg(field_rd(w)), reg(field_rm(w)) });
        return true;
    }
    /* MRS */
    if ((w & 0x0FBF0FFF) == 0x010F0000) {
        name(insn, "mrs", w);
        set_ops(insn, { reg(field_rd(w)), op_reg(bit(w, 22) ? "spsr" : "apsr") });
        return true;
    }
    /* MSR register */
    if ((w & 0x0FB0FFF0) == 0x0120F000) {
        static const char *const cpsr_fields[16] = {
            "cpsr", "cpsr_c", "cpsr_x", "cpsr_xc", "cpsr_s", "cpsr_sc",
            "cpsr_sx", "cpsr_sxc", "cpsr_f", "cpsr_fc", "cpsr_fx", "cpsr_fxc",
            "cpsr_fs", "cpsr_fsc", "cpsr_fsx", "cpsr_fsxc",
        };
        static const char *const spsr_fields[16] = {
            "spsr", "spsr_c", "spsr_x", "spsr_xc", "spsr_s", "spsr_sc",
            "spsr_sx", "spsr_sxc", "spsr_f", "spsr_fc", "spsr_fx", "spsr_fxc",
            "spsr_fs", "spsr_fsc", "spsr_fsx", "spsr_fsxc",
        };
        unsigned mask = (w >> 16) & 0xF;
        name(insn, "msr", w);
        set_ops(insn, { op_reg(bit(w, 22) ? spsr_fields[mask] : cpsr_fields[mask]),
                        reg(field_rm(w)) });
        return true;
    }
    /* BKPT */
    if ((w & 0xFFF000F0) == 0xE1200070) {
        insn.mnemonic = "bkpt";
        set_ops(insn, { imm(((w >> 4) & 0xFFF0) | (w & 0xF), 16) });
        return true;
    }
    /* LDREX / STREX */
    if ((w & 0x0FF00FFF) == 0x01900F9F) {
        name(insn, "ldrex", w);
        set_ops(insn, { reg(field_rd(w)), op_mem(reg_name[field_rn(w)], 0, 0, 4) });
        return true;
    }
    if ((w & 0x0FF00FF0) == 0x01800F90) {
        name(insn, "strex", w);
        set_ops(insn, { reg(field_rd(w)), reg(field_rm(w)),
                        op_mem(reg_name[field_rn(w)], 0, 0, 4) });
        return true;
    }
    return false;
}

/* ======================================================================== */
/* Multiply                                                                  */
/* ======================================================================== */

static bool decode_multiply(Instruction &insn, uint32_t w)
{
    bool s = bit(w, 20);
    unsigned rd = field_rn(w);          // multiply puts Rd in bits 19:16
    unsigned ra = field_rd(w);
    unsigned rs = field_rs(w);
    unsigned rm = field_rm(w);

    if ((w & 0x0FC000F0) == 0x00000090) {
        if (bit(w, 21)) {
            name(insn, "mla", w, s);
            set_ops(insn, { reg(rd), reg(rm), reg(rs), reg(ra) });
        } else {
            name(insn, "mul", w, s);
            set_ops(insn, { reg(rd), reg(rm), reg(rs) });
        }
        return true;
    }
    if ((w & 0x0FF000F0) == 0x00600090) {
        name(insn, "mls", w);
        set_ops(insn, { reg(rd), reg(rm), reg(rs), reg(ra) });
        return true;
    }
    if ((w & 0x0F8000F0) == 0x00800090) {
        static const char *const n[4] = { "umull", "umlal", "smull", "smlal" };
        name(insn, n[(w >> 21) & 3], w, s);
        set_ops(insn, { reg(ra), reg(rd), reg(rm), reg(rs) });
        return true;
    }
    return false;
}

/* ======================================================================== */
/* Loads and stores                                                          */
/* ======================================================================== */

static void set_mode(Operand &m, uint32_t w)
{
    bool p = bit(w, 24);
    bool wb = bit(w, 21);
    m.mode = !p ? MemMode::POST_INDEX : wb ? MemMode::PRE_INDEX : MemMode::OFFSET;
}

/* PC-relative literal: effective address known at decode time */
static void mark_literal(Operand &m, unsigned rn, uint64_t addr)
{
    if (rn == REG_PC && m.mode == MemMode::OFFSET && !m.index) {
        m.flags |= OPF_PCREL;
        m.target = (addr + 8 + m.value) & 0xFFFFFFFF;
    }
}

static bool decode_extra_ldst(Instruction &insn, uint32_t w, uint64_t addr)
{
    unsigned sh = (w >> 5) & 3;
    bool load = bit(w, 20);
    bool up = bit(w, 23);
    unsigned rn = field_rn(w);
    unsigned rt = field_rd(w);

    const char *base;
    uint8_t size;
    bool pair = false;
    if (load) {
        static const char *const n[4] = { nullptr, "ldrh", "ldrsb", "ldrsh" };
        static const uint8_t sz[4] = { 0, 2, 1, 2 };
        base = n[sh];
        size = sz[sh];
    } else {
        static const char *const n[4] = { nullptr, "strh", "ldrd", "strd" };
        static const uint8_t sz[4] = { 0, 2, 8, 8 };
        base = n[sh];
        size = sz[sh];
        pair = sh >= 2;
    }
    if (!base) return false;
    if (pair && (rt & 1)) return false;

    Operand m;
    if (bit(w, 22)) {
        int64_t off = ((w >> 4) & 0xF0) | (w & 0xF);
        m = op_mem(reg_name[rn], up ? off : -off, 8, size);
    } else {
        m = op_mem(reg_name[rn], 0, 0, size);
        m.index = reg_name[field_rm(w)];
        if (!up) m.flags |= OPF_NEGATE;
    }
    set_mode(m, w);
    mark_literal(m, rn, addr);

    name(insn, base, w);
    if (pair)
        set_ops(insn, { reg(rt), reg(rt + 1), m });
    else
        set_ops(insn, { reg(rt), m });
    if (load && !pair && rt == REG_PC)
        insn.flow = Flow::INDIRECT;
    return true;
}

static bool decode_ldst(Instruction &insn, uint32_t w, uint64_t addr)
{
    bool reg_off = bit(w, 25);
    bool p = bit(w, 24);
    bool up = bit(w, 23);
    bool byte = bit(w, 22);
    bool wb = bit(w, 21);
    bool load = bit(w, 20);
    unsigned rn = field_rn(w);
    unsigned rt = field_rd(w);

    if (reg_off && bit(w, 4))
        return false;                   // media instructions

    /* push/pop of a single register */
    if (!reg_off && !byte && rn == REG_SP) {
        if (load && !p && up && !wb && (w & 0xFFF) == 4) {
            name(insn, "pop", w);
            Operand r = reg(rt);
            r.flags = OPF_LIST_FIRST | OPF_LIST_LAST;
            set_ops(insn, { r });
            if (rt == REG_PC) insn.flow = Flow::RETURN;
            return true;
        }
        if (!load && p && !up && wb && (w & 0xFFF) == 4) {
            name(insn, "push", w);
            Operand r = reg(rt);
            r.flags = OPF_LIST_FIRST | OPF_LIST_LAST;
            set_ops(insn, { r });
            return true;
        }
    }

    Operand m;
    if (!reg_off) {
        int64_t off = w & 0xFFF;
        m = op_mem(reg_name[rn], up ? off : -off, 12, byte ? 1 : 4);
    } else {
        Operand sr;
        if (!shifted_reg(w & ~0x10u, sr)) return false;
        m = op_mem(reg_name[rn], 0, 0, byte ? 1 : 4);
        m.index = sr.reg;
        m.shift = sr.shift;
        m.shift_amount = sr.shift_amount;
        if (!up) m.flags |= OPF_NEGATE;
    }
    set_mode(m, w);
    mark_literal(m, rn, addr);

    const char *base;
    if (!p && wb)
        base = load ? (byte ? "ldrbt" : "ldrt") : (byte ? "strbt" : "strt");
    else
        base = load ? (byte ? "ldrb" : "ldr") : (byte ? "strb" : "str");
    if (!p && wb) m.mode = MemMode::POST_INDEX;

    name(insn, base, w);
    set_ops(insn, { reg(rt), m });
    if (load && rt == REG_PC)
        insn.flow = Flow::INDIRECT;
    return true;
}

static bool decode_block(Instruction &insn, uint32_t w)
{
    bool p = bit(w, 24);
    bool up = bit(w, 23);
    bool user = bit(w, 22);
    bool wb = bit(w, 21);
    bool load = bit(w, 20);
    unsigned rn = field_rn(w);
    unsigned list = w & 0xFFFF;

    if (list == 0) return false;

    bool has_pc = list & (1u << REG_PC);
    bool stack = rn == REG_SP && wb && !user;

    std::vector<Operand> regs;
    for (unsigned r = 0; r < 16; r++)
        if (list & (1u << r))
            regs.push_back(reg(r));
    regs.front().flags |= OPF_LIST_FIRST;
    regs.back().flags |= OPF_LIST_LAST;

    if (stack && load && !p && up) {
        name(insn, "pop", w);
        insn.operands = std::move(regs);
        if (has_pc) insn.flow = Flow::RETURN;
        return true;
    }
    if (stack && !load && p && !up) {
        name(insn, "push", w);
        insn.operands = std::move(regs);
        return true;
    }

    static const char *const ldm_name[4] = { "ldmda", "ldm", "ldmdb", "ldmib" };
    static const char *const stm_name[4] = { "stmda", "stm", "stmdb", "stmib" };
    unsigned mode = (p ? 2 : 0) | (up ? 1 : 0);
    name(insn, load ? ldm_name[mode] : stm_name[mode], w);

    Operand base = reg(rn);
    if (wb) base.flags |= OPF_WRITEBACK;
    insn.operands.push_back(base);
    for (auto &r : regs)
        insn.operands.push_back(r);
    if (load && has_pc)
        insn.flow = rn == REG_SP ? Flow::RETURN : Flow::INDIRECT;
    return true;
}

/* ======================================================================== */
/* Data processing                                                           */
/* ======================================================================== */

static bool decode_dp(Instruction &insn, uint32_t w)
{
    unsigned op = (w >> 21) & 0xF;
    bool s = bit(w, 20);
    unsigned rn = field_rn(w);
    unsigned rd = field_rd(w);
    bool compare = op >= 8 && op <= 11;

    if (compare && !s)
        return false;                   // misc space handled elsewhere

    Operand src;
    if (bit(w, 25)) {
        uint32_t v = rotated_imm(w);
        src = imm(v, 32);
    } else if (!shifted_reg(w, src)) {
        return false;
    }

    if (op == 13 || op == 15) {         // MOV / MVN
        if (op == 13 && !bit(w, 25) && src.shift) {
            /* mov with shift: UAL shift alias */
            const char *alias = src.shift;
            Operand rm = reg(field_rm(w));
            name(insn, alias, w, s);
            if (src.shift_reg)
                set_ops(insn, { reg(rd), rm, op_reg(src.shift_reg) });
            else if (src.shift_amount)
                set_ops(insn, { reg(rd), rm, imm(src.shift_amount, 5, false, false) });
            else
                set_ops(insn, { reg(rd), rm });
        } else {
            name(insn, dp_name[op], w, s);
            set_ops(insn, { reg(rd), src });
        }
        if (rd == REG_PC) {
            bool ret = op == 13 && !bit(w, 25) && field_rm(w) == REG_LR && !src.shift;
            insn.flow = ret ? Flow::RETURN : Flow::INDIRECT;
        }
        return true;
    }

    if (compare) {
        name(insn, dp_name[op], w);
        set_ops(insn, { reg(rn), src });
        return true;
    }

    name(insn, dp_name[op], w, s);
    set_ops(insn, { reg(rd), reg(rn), src });
    if (rd == REG_PC)
        insn.flow = Flow::INDIRECT;
    return true;
}

/* ======================================================================== */
/* Main disassembler                                                         */
/* ======================================================================== */

static bool decode_word(Instruction &insn, uint32_t w, uint64_t addr)
{
    if (field_cond(w) == 0xF)
        return decode_uncond(insn, w, addr);

    unsigned cls = (w >> 25) & 7;

    switch (cls) {
    case 0:
        /* multiply and extra load/store share bit 7 = bit 4 = 1 */
        if ((w & 0x90) == 0x90) {
            if (((w >> 5) & 3) == 0)
                return decode_multiply(insn, w) || decode_misc(insn, w);
            return decode_extra_ldst(insn, w, addr);
        }
        if ((w & 0x01900000) == 0x01000000)
            return decode_misc(insn, w);
        return decode_dp(insn, w);
    case 1:
        if ((w & 0x0FF00000) == 0x03000000 || (w & 0x0FF00000) == 0x03400000) {
            uint32_t v = ((w >> 4) & 0xF000) | (w & 0xFFF);
            name(insn, bit(w, 22) ? "movt" : "movw", w);
            set_ops(insn, { reg(field_rd(w)), imm(v, 16) });
            return true;
        }
        if ((w & 0x0FFFFF00) == 0x0320F000) {
            static const char *const hint[5] = { "nop", "yield", "wfe", "wfi", "sev" };
            unsigned h = w & 0xFF;
            if (h > 4) return false;
            name(insn, hint[h], w);
            return true;
        }
        if ((w & 0x01900000) == 0x01000000)
            return false;               // MSR immediate and unallocated
        return decode_dp(insn, w);
    case 2:
    case 3:
        if ((w & 0x0FF000F0) == 0x07F000F0) {
            insn.mnemonic = "udf";
            set_ops(insn, { imm(((w >> 4) & 0xFFF0) | (w & 0xF), 16) });
            return true;
        }
        return decode_ldst(insn, w, addr);
    case 4:
        return decode_block(insn, w);
    case 5:
        return decode_branch(insn, w, addr);
    case 7:
        if (bit(w, 24)) {
            name(insn, "svc", w);
            set_ops(insn, { imm(w & 0x00FFFFFF, 24) });
            return true;
        }
        return false;
    default:
        return false;                   // coprocessor
    }
}

Instruction dec_arm(std::span<const uint8_t> data, uint64_t addr,
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
