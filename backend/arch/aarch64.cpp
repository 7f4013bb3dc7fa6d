/*
 * aarch64.cpp: AArch64 (A64) architecture data
 *
 * Disassembler covering the A64 integer set: branches (B/BL, B.cond,
 * CBZ/CBNZ, TBZ/TBNZ, BR/BLR/RET), PC-relative addressing, add/sub and
 * logical (immediate, shifted and extended register), move wide,
 * bitfield and extract with their aliases, conditional select and
 * compare, 1/2/3-source data processing, loads and stores (unsigned
 * offset, pre/post index, unscaled, register offset, literal, pairs,
 * exclusives) including FP/SIMD register transfers, and the system
 * space (hints, barriers, exceptions, MRS/MSR, common cache ops).
 */

#include "arch.hpp"
#include "operands.hpp"

#include <bit>
#include <cstdio>
#include <initializer_list>

namespace arch {

/* ======================================================================== */
/* Register names                                                            */
/* ======================================================================== */

static const char *const xreg_name[32] = {
    "x0",  "x1",  "x2",  "x3",  "x4",  "x5",  "x6",  "x7",
    "x8",  "x9",  "x10", "x11", "x12", "x13", "x14", "x15",
    "x16", "x17", "x18", "x19", "x20", "x21", "x22", "x23",
    "x24", "x25", "x26", "x27", "x28", "x29", "x30", "xzr",
};

static const char *const wreg_name[32] = {
    "w0",  "w1",  "w2",  "w3",  "w4",  "w5",  "w6",  "w7",
    "w8",  "w9",  "w10", "w11", "w12", "w13", "w14", "w15",
    "w16", "w17", "w18", "w19", "w20", "w21", "w22", "w23",
    "w24", "w25", "w26", "w27", "w28", "w29", "w30", "wzr",
};

static const char *const cond_name[16] = {
    "eq", "ne", "hs", "lo", "mi", "pl", "vs", "vc",
    "hi", "ls", "ge", "lt", "gt", "le", "al", "nv",
};

static const char *const bcond_name[16] = {
    "b.eq", "b.ne", "b.hs", "b.lo", "b.mi", "b.pl", "b.vs", "b.vc",
    "b.hi", "b.ls", "b.ge", "b.lt", "b.gt", "b.le", "b.al", "b.nv",
};

static const char *const shift_name[4] = { "lsl", "lsr", "asr", "ror" };

static const char *const extend_name[8] = {
    "uxtb", "uxth", "uxtw", "uxtx", "sxtb", "sxth", "sxtw", "sxtx",
};

/* FP/SIMD scalar register names: b, h, s, d, q */
enum FpKind { FP_B, FP_H, FP_S, FP_D, FP_Q };

static const char *fp_reg(unsigned kind, unsigned n)
{
    static char names[5][32][5];
    static const bool ready = [] {
        static const char prefix[5] = { 'b', 'h', 's', 'd', 'q' };
        for (unsigned k = 0; k < 5; k++)
            for (unsigned i = 0; i < 32; i++)
                snprintf(names[k][i], sizeof(names[k][i]), "%c%u", prefix[k], i);
        return true;
    }();
    (void)ready;
    return names[kind][n & 31];
}

/* ======================================================================== */
/* Field extraction                                                          */
/* ======================================================================== */

static inline unsigned field_rd(uint32_t w) { return  w        & 0x1F; }
static inline unsigned field_rn(uint32_t w) { return (w >>  5) & 0x1F; }
static inline unsigned field_ra(uint32_t w) { return (w >> 10) & 0x1F; }
static inline unsigned field_rm(uint32_t w) { return (w >> 16) & 0x1F; }
static inline bool     bit(uint32_t w, unsigned n) { return (w >> n) & 1; }

/* ======================================================================== */
/* Operand helpers                                                           */
/* ======================================================================== */

/* General register; r == 31 is the zero register unless sp is allowed */
static Operand gpr(unsigned r, bool sf, bool sp = false)
{
    if (r == 31 && sp)
        return op_reg(sf ? "sp" : "wsp");
    return op_reg(sf ? xreg_name[r] : wreg_name[r]);
}

static inline Operand imm(int64_t v, uint8_t width, bool is_signed = false,
                          bool hex = true)
{
    return op_imm(v, width, is_signed, hex);
}

static inline Operand base_reg_mem(unsigned rn, int64_t off, uint8_t width,
                                   uint8_t size)
{
    return op_mem(rn == 31 ? "sp" : xreg_name[rn], off, width, size);
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

static Operand shifted(unsigned r, bool sf, unsigned type, unsigned amount)
{
    Operand o = gpr(r, sf);
    if (amount) {
        o.shift = shift_name[type];
        o.shift_amount = (uint8_t)amount;
    }
    return o;
}

/* ======================================================================== */
/* Logical immediate bitmask                                                 */
/* ======================================================================== */

static bool decode_bitmask(unsigned n, unsigned imms, unsigned immr, bool sf,
                           uint64_t &out)
{
    unsigned combined = (n << 6) | (~imms & 0x3F);
    if (combined == 0) return false;
    unsigned len = (unsigned)std::bit_width(combined) - 1;
    if (len < 1) return false;
    if (!sf && n) return false;

    unsigned size = 1u << len;
    unsigned levels = size - 1;
    unsigned s = imms & levels;
    unsigned r = immr & levels;
    if (s == levels) return false;

    uint64_t welem = (s + 1 == 64) ? ~0ull : ((1ull << (s + 1)) - 1);
    uint64_t mask = size == 64 ? ~0ull : ((1ull << size) - 1);
    uint64_t elem = r ? (((welem >> r) | (welem << (size - r))) & mask) : welem;

    uint64_t v = 0;
    for (unsigned i = 0; i < 64; i += size)
        v |= elem << i;
    if (!sf) v &= 0xFFFFFFFF;
    out = v;
    return true;
}

/* ======================================================================== */
/* Branches, exceptions and system                                           */
/* ======================================================================== */

static bool decode_branch_sys(Instruction &insn, uint32_t w, uint64_t addr)
{
    /* B / BL */
    if ((w & 0x7C000000) == 0x14000000) {
        uint64_t target = addr + (sign_extend(w & 0x03FFFFFF, 26) << 2);
        if (bit(w, 31))
            set_branch(insn, "bl", {}, target, Flow::CALL);
        else
            set_branch(insn, "b", {}, target, Flow::BRANCH);
        return true;
    }
    /* B.cond */
    if ((w & 0xFF000010) == 0x54000000) {
        uint64_t target = addr + (sign_extend((w >> 5) & 0x7FFFF, 19) << 2);
        unsigned c = w & 0xF;
        set_branch(insn, bcond_name[c], {}, target,
                   c >= 14 ? Flow::BRANCH : Flow::COND_BRANCH);
        return true;
    }
    /* CBZ / CBNZ */
    if ((w & 0x7E000000) == 0x34000000) {
        uint64_t target = addr + (sign_extend((w >> 5) & 0x7FFFF, 19) << 2);
        set_branch(insn, bit(w, 24) ? "cbnz" : "cbz", { gpr(field_rd(w), bit(w, 31)) },
                   target, Flow::COND_BRANCH);
        return true;
    }
    /* TBZ / TBNZ */
    if ((w & 0x7E000000) == 0x36000000) {
        uint64_t target = addr + (sign_extend((w >> 5) & 0x3FFF, 14) << 2);
        unsigned bitno = (bit(w, 31) << 5) | ((w >> 19) & 0x1F);
        set_branch(insn, bit(w, 24) ? "tbnz" : "tbz",
                   { gpr(field_rd(w), bitno >= 32), imm(bitno, 6, false, false) },
                   target, Flow::COND_BRANCH);
        return true;
    }
    /* Unconditional branch (register) */
    if ((w & 0xFFFFFC1F) == 0xD61F0000) {
        set(insn, "br", { gpr(field_rn(w), true) }, Flow::INDIRECT);
        return true;
    }
    if ((w & 0xFFFFFC1F) == 0xD63F0000) {
        set(insn, "blr", { gpr(field_rn(w), true) }, Flow::INDIRECT);
        return true;
    }
    if ((w & 0xFFFFFC1F) == 0xD65F0000) {
        if (field_rn(w) == 30)
            set(insn, "ret", {}, Flow::RETURN);
        else
            set(insn, "ret", { gpr(field_rn(w), true) }, Flow::RETURN);
        return true;
    }
    if (w == 0xD65F0BFF) { set(insn, "retaa", {}, Flow::RETURN); return true; }
    if (w == 0xD65F0FFF) { set(insn, "retab", {}, Flow::RETURN); return true; }
    if (w == 0xD69F03E0) { set(insn, "eret", {}, Flow::RETURN); return true; }

    /* Exception generation */
    if ((w & 0xFF000000) == 0xD4000000) {
        unsigned opc = (w >> 21) & 7;
        unsigned ll = w & 0x1F;
        Operand i16 = imm((w >> 5) & 0xFFFF, 16);
        if (opc == 0 && ll == 1) { set(insn, "svc", { i16 }); return true; }
        if (opc == 0 && ll == 2) { set(insn, "hvc", { i16 }); return true; }
        if (opc == 0 && ll == 3) { set(insn, "smc", { i16 }); return true; }
        if (opc == 1 && ll == 0) { set(insn, "brk", { i16 }); return true; }
        if (opc == 2 && ll == 0) { set(insn, "hlt", { i16 }); return true; }
        return false;
    }
    return false;
}

struct SysReg { uint16_t enc; const char *name; };

/* Encoding: op0(2) op1(3) CRn(4) CRm(4) op2(3) */
#define SR(op0, op1, crn, crm, op2) \
    (uint16_t)(((op0) << 14) | ((op1) << 11) | ((crn) << 7) | ((crm) << 3) | (op2))

static const SysReg sys_regs[] = {
    { SR(3, 0, 0, 0, 0),  "midr_el1"   },
    { SR(3, 0, 0, 0, 5),  "mpidr_el1"  },
    { SR(3, 0, 1, 0, 0),  "sctlr_el1"  },
    { SR(3, 0, 2, 0, 0),  "ttbr0_el1"  },
    { SR(3, 0, 2, 0, 1),  "ttbr1_el1"  },
    { SR(3, 0, 2, 0, 2),  "tcr_el1"    },
    { SR(3, 0, 4, 0, 0),  "spsr_el1"   },
    { SR(3, 0, 4, 0, 1),  "elr_el1"    },
    { SR(3, 0, 4, 1, 0),  "sp_el0"     },
    { SR(3, 0, 4, 2, 2),  "currentel"  },
    { SR(3, 0, 5, 2, 0),  "esr_el1"    },
    { SR(3, 0, 6, 0, 0),  "far_el1"    },
    { SR(3, 0, 10, 2, 0), "mair_el1"   },
    { SR(3, 0, 12, 0, 0), "vbar_el1"   },
    { SR(3, 0, 13, 0, 4), "tpidr_el1"  },
    { SR(3, 3, 0, 0, 1),  "ctr_el0"    },
    { SR(3, 3, 0, 0, 7),  "dczid_el0"  },
    { SR(3, 3, 4, 2, 0),  "nzcv"       },
    { SR(3, 3, 4, 2, 1),  "daif"       },
    { SR(3, 3, 4, 4, 0),  "fpcr"       },
    { SR(3, 3, 4, 4, 1),  "fpsr"       },
    { SR(3, 3, 13, 0, 2), "tpidr_el0"  },
    { SR(3, 3, 13, 0, 3), "tpidrro_el0" },
    { SR(3, 3, 14, 0, 0), "cntfrq_el0" },
    { SR(3, 3, 14, 0, 1), "cntpct_el0" },
    { SR(3, 3, 14, 0, 2), "cntvct_el0" },
};

#undef SR

static Operand sysreg_operand(uint32_t w)
{
    uint16_t enc = (uint16_t)((w >> 5) & 0xFFFF);
    for (auto &s : sys_regs)
        if (s.enc == enc)
            return op_reg(s.name);
    return imm(enc, 16);
}

static bool decode_system(Instruction &insn, uint32_t w)
{
    /* Hints */
    if ((w & 0xFFFFF01F) == 0xD503201F) {
        unsigned h = (w >> 5) & 0x7F;
        switch (h) {
        case 0x00: set(insn, "nop", {}); return true;
        case 0x01: set(insn, "yield", {}); return true;
        case 0x02: set(insn, "wfe", {}); return true;
        case 0x03: set(insn, "wfi", {}); return true;
        case 0x04: set(insn, "sev", {}); return true;
        case 0x05: set(insn, "sevl", {}); return true;
        case 0x19: set(insn, "paciasp", {}); return true;
        case 0x1B: set(insn, "pacibsp", {}); return true;
        case 0x1D: set(insn, "autiasp", {}); return true;
        case 0x1F: set(insn, "autibsp", {}); return true;
        case 0x20: set(insn, "bti", {}); return true;
        case 0x22: set(insn, "bti", { op_reg("c") }); return true;
        case 0x24: set(insn, "bti", { op_reg("j") }); return true;
        case 0x26: set(insn, "bti", { op_reg("jc") }); return true;
        default:   set(insn, "hint", { imm(h, 7) }); return true;
        }
    }
    /* Barriers */
    if ((w & 0xFFFFF0FF) == 0xD503305F) { set(insn, "clrex", {}); return true; }
    if ((w & 0xFFFFF0FF) == 0xD503309F) { set(insn, "dsb", { imm((w >> 8) & 0xF, 4) }); return true; }
    if ((w & 0xFFFFF0FF) == 0xD50330BF) { set(insn, "dmb", { imm((w >> 8) & 0xF, 4) }); return true; }
    if ((w & 0xFFFFF0FF) == 0xD50330DF) { set(insn, "isb", {}); return true; }

    /* MRS / MSR register */
    if ((w & 0xFFF00000) == 0xD5300000) {
        set(insn, "mrs", { gpr(field_rd(w), true), sysreg_operand(w) });
        return true;
    }
    if ((w & 0xFFF00000) == 0xD5100000) {
        set(insn, "msr", { sysreg_operand(w), gpr(field_rd(w), true) });
        return true;
    }

    /* SYS: common cache maintenance */
    if ((w & 0xFFF80000) == 0xD5080000) {
        unsigned op = (w >> 5) & 0x3FFF;     // op1:CRn:CRm:op2
        const char *n = nullptr;
        const char *kind = "dc";
        switch (op) {
        case (3u << 11) | (7u << 7) | (4u << 3)  | 1: n = "zva";   break;
        case (3u << 11) | (7u << 7) | (10u << 3) | 1: n = "cvac";  break;
        case (3u << 11) | (7u << 7) | (11u << 3) | 1: n = "cvau";  break;
        case (3u << 11) | (7u << 7) | (14u << 3) | 1: n = "civac"; break;
        case (0u << 11) | (7u << 7) | (6u << 3)  | 1: n = "ivac";  break;
        case (3u << 11) | (7u << 7) | (5u << 3)  | 1: n = "ivau"; kind = "ic"; break;
        default: return false;
        }
        set(insn, kind, { op_reg(n), gpr(field_rd(w), true) });
        return true;
    }
    return false;
}

/* ======================================================================== */
/* Data processing: immediate                                                */
/* ======================================================================== */

static bool decode_dp_imm(Instruction &insn, uint32_t w, uint64_t addr)
{
    bool sf = bit(w, 31);
    unsigned rd = field_rd(w);
    unsigned rn = field_rn(w);

    /* ADR / ADRP */
    if ((w & 0x1F000000) == 0x10000000) {
        int64_t v = sign_extend(((w >> 3) & 0x1FFFFC) | ((w >> 29) & 3), 21);
        if (bit(w, 31))
            set(insn, "adrp", { gpr(rd, true), op_rel((addr & ~0xFFFull) + (v << 12)) });
        else
            set(insn, "adr", { gpr(rd, true), op_rel(addr + v) });
        return true;
    }

    /* Add/sub immediate */
    if ((w & 0x1F800000) == 0x11000000) {
        bool sub = bit(w, 30);
        bool s = bit(w, 29);
        unsigned sh = bit(w, 22) ? 12 : 0;
        uint32_t i12 = (w >> 10) & 0xFFF;
        Operand iv = imm(i12, 12);
        if (sh) {
            iv.shift = "lsl";
            iv.shift_amount = 12;
        }

        if (!sub && !s && i12 == 0 && !sh && (rd == 31 || rn == 31)) {
            set(insn, "mov", { gpr(rd, sf, true), gpr(rn, sf, true) });
            return true;
        }
        if (s && rd == 31) {
            set(insn, sub ? "cmp" : "cmn", { gpr(rn, sf, true), iv });
            return true;
        }
        static const char *const n[4] = { "add", "adds", "sub", "subs" };
        set(insn, n[(sub ? 2 : 0) | (s ? 1 : 0)], { gpr(rd, sf, !s), gpr(rn, sf, true), iv });
        return true;
    }

    /* Logical immediate */
    if ((w & 0x1F800000) == 0x12000000) {
        unsigned opc = (w >> 29) & 3;
        uint64_t v;
        if (!decode_bitmask(bit(w, 22), (w >> 10) & 0x3F, (w >> 16) & 0x3F, sf, v))
            return false;
        Operand iv = imm((int64_t)v, sf ? 64 : 32);
        if (opc == 1 && rn == 31) {
            set(insn, "mov", { gpr(rd, sf, true), iv });
            return true;
        }
        if (opc == 3 && rd == 31) {
            set(insn, "tst", { gpr(rn, sf), iv });
            return true;
        }
        static const char *const n[4] = { "and", "orr", "eor", "ands" };
        set(insn, n[opc], { gpr(rd, sf, opc != 3), gpr(rn, sf), iv });
        return true;
    }

    /* Move wide */
    if ((w & 0x1F800000) == 0x12800000) {
        unsigned opc = (w >> 29) & 3;
        unsigned hw = (w >> 21) & 3;
        uint64_t i16 = (w >> 5) & 0xFFFF;
        if (opc == 1) return false;
        if (!sf && hw > 1) return false;
        unsigned shift = hw * 16;

        if (opc == 3) {
            Operand iv = imm((int64_t)i16, 16);
            if (shift) {
                iv.shift = "lsl";
                iv.shift_amount = (uint8_t)shift;
            }
            set(insn, "movk", { gpr(rd, sf), iv });
            return true;
        }
        uint64_t v = i16 << shift;
        if (opc == 0) v = ~v;
        if (!sf) v &= 0xFFFFFFFF;
        if (opc == 0 && i16 == 0 && hw != 0) {
            /* movn #0, lsl #n has no mov alias */
            Operand iv = imm(0, 16);
            iv.shift = "lsl";
            iv.shift_amount = (uint8_t)shift;
            set(insn, "movn", { gpr(rd, sf), iv });
            return true;
        }
        if (opc == 0)
            set(insn, "mov", { gpr(rd, sf), imm(sf ? (int64_t)v : (int64_t)(int32_t)v,
                                                 sf ? 64 : 32, true) });
        else
            set(insn, "mov", { gpr(rd, sf), imm((int64_t)v, sf ? 64 : 32) });
        return true;
    }

    /* Bitfield */
    if ((w & 0x1F800000) == 0x13000000) {
        unsigned opc = (w >> 29) & 3;
        bool n = bit(w, 22);
        unsigned immr = (w >> 16) & 0x3F;
        unsigned imms = (w >> 10) & 0x3F;
        unsigned size = sf ? 64 : 32;
        if (opc == 3 || n != sf) return false;
        if (!sf && (immr >= 32 || imms >= 32)) return false;

        Operand d = gpr(rd, sf);
        Operand s = gpr(rn, sf);
        auto u = [](unsigned v) { return imm(v, 6, false, false); };

        if (opc == 0) {             // SBFM
            if (imms == size - 1) {
                set(insn, "asr", { d, s, u(immr) });
            } else if (immr == 0 && imms == 7) {
                set(insn, "sxtb", { d, gpr(rn, false) });
            } else if (immr == 0 && imms == 15) {
                set(insn, "sxth", { d, gpr(rn, false) });
            } else if (immr == 0 && imms == 31 && sf) {
                set(insn, "sxtw", { d, gpr(rn, false) });
            } else if (imms < immr) {
                set(insn, "sbfiz", { d, s, u(size - immr), u(imms + 1) });
            } else {
                set(insn, "sbfx", { d, s, u(immr), u(imms - immr + 1) });
            }
        } else if (opc == 1) {      // BFM
            if (imms < immr)
                set(insn, "bfi", { d, s, u(size - immr), u(imms + 1) });
            else
                set(insn, "bfxil", { d, s, u(immr), u(imms - immr + 1) });
        } else {                    // UBFM
            if (imms == size - 1) {
                set(insn, "lsr", { d, s, u(immr) });
            } else if (imms + 1 == immr) {
                set(insn, "lsl", { d, s, u(size - 1 - imms) });
            } else if (immr == 0 && imms == 7 && !sf) {
                set(insn, "uxtb", { d, s });
            } else if (immr == 0 && imms == 15 && !sf) {
                set(insn, "uxth", { d, s });
            } else if (imms < immr) {
                set(insn, "ubfiz", { d, s, u(size - immr), u(imms + 1) });
            } else {
                set(insn, "ubfx", { d, s, u(immr), u(imms - immr + 1) });
            }
        }
        return true;
    }

    /* Extract */
    if ((w & 0x1F800000) == 0x13800000) {
        unsigned lsb = (w >> 10) & 0x3F;
        unsigned rm = field_rm(w);
        if (bit(w, 22) != sf || (!sf && lsb >= 32)) return false;
        if (rn == rm)
            set(insn, "ror", { gpr(rd, sf), gpr(rn, sf), imm(lsb, 6, false, false) });
        else
            set(insn, "extr", { gpr(rd, sf), gpr(rn, sf), gpr(rm, sf),
                                imm(lsb, 6, false, false) });
        return true;
    }
    return false;
}

/* ======================================================================== */
/* Data processing: register                                                 */
/* ======================================================================== */

static bool decode_dp_reg(Instruction &insn, uint32_t w)
{
    bool sf = bit(w, 31);
    unsigned rd = field_rd(w);
    unsigned rn = field_rn(w);
    unsigned rm = field_rm(w);

    /* Logical shifted register */
    if ((w & 0x1F000000) == 0x0A000000) {
        unsigned opc = (w >> 29) & 3;
        bool n = bit(w, 21);
        unsigned type = (w >> 22) & 3;
        unsigned amount = (w >> 10) & 0x3F;
        if (!sf && amount >= 32) return false;
        Operand src = shifted(rm, sf, type, amount);

        if (opc == 1 && !n && rn == 31 && amount == 0) {
            set(insn, "mov", { gpr(rd, sf), gpr(rm, sf) });
            return true;
        }
        if (opc == 1 && n && rn == 31) {
            set(insn, "mvn", { gpr(rd, sf), src });
            return true;
        }
        if (opc == 3 && !n && rd == 31) {
            set(insn, "tst", { gpr(rn, sf), src });
            return true;
        }
        static const char *const names[8] = {
            "and", "bic", "orr", "orn", "eor", "eon", "ands", "bics",
        };
        set(insn, names[opc * 2 + (n ? 1 : 0)], { gpr(rd, sf), gpr(rn, sf), src });
        return true;
    }

    /* Add/sub shifted register */
    if ((w & 0x1F200000) == 0x0B000000) {
        bool sub = bit(w, 30);
        bool s = bit(w, 29);
        unsigned type = (w >> 22) & 3;
        unsigned amount = (w >> 10) & 0x3F;
        if (type == 3 || (!sf && amount >= 32)) return false;
        Operand src = shifted(rm, sf, type, amount);

        if (s && rd == 31) {
            set(insn, sub ? "cmp" : "cmn", { gpr(rn, sf), src });
            return true;
        }
        if (sub && rn == 31) {
            set(insn, s ? "negs" : "neg", { gpr(rd, sf), src });
            return true;
        }
        static const char *const n[4] = { "add", "adds", "sub", "subs" };
        set(insn, n[(sub ? 2 : 0) | (s ? 1 : 0)], { gpr(rd, sf), gpr(rn, sf), src });
        return true;
    }

    /* Add/sub extended register */
    if ((w & 0x1F200000) == 0x0B200000) {
        bool sub = bit(w, 30);
        bool s = bit(w, 29);
        unsigned option = (w >> 13) & 7;
        unsigned amount = (w >> 10) & 7;
        if (amount > 4 || ((w >> 22) & 3) != 0) return false;

        bool wide = (option & 3) == 3;
        Operand src = gpr(rm, sf && wide);
        bool is_lsl = (rd == 31 || rn == 31) && option == (sf ? 3u : 2u);
        if (is_lsl) {
            if (amount) {
                src.shift = "lsl";
                src.shift_amount = (uint8_t)amount;
            }
        } else {
            src.shift = extend_name[option];
            src.shift_amount = (uint8_t)amount;
        }

        if (s && rd == 31) {
            set(insn, sub ? "cmp" : "cmn", { gpr(rn, sf, true), src });
            return true;
        }
        static const char *const n[4] = { "add", "adds", "sub", "subs" };
        set(insn, n[(sub ? 2 : 0) | (s ? 1 : 0)],
            { gpr(rd, sf, !s), gpr(rn, sf, true), src });
        return true;
    }

    /* Conditional compare */
    if ((w & 0x1FE00000) == 0x1A400000) {
        if (!bit(w, 29) || bit(w, 10) || bit(w, 4)) return false;
        const char *n = bit(w, 30) ? "ccmp" : "ccmn";
        Operand second = bit(w, 11) ? imm(rm, 5, false, false) : gpr(rm, sf);
        set(insn, n, { gpr(rn, sf), second, imm(w & 0xF, 4, false, false),
                       op_reg(cond_name[(w >> 12) & 0xF]) });
        return true;
    }

    /* Conditional select */
    if ((w & 0x1FE00000) == 0x1A800000) {
        if (bit(w, 29) || bit(w, 11)) return false;
        unsigned op = (bit(w, 30) << 1) | bit(w, 10);
        unsigned c = (w >> 12) & 0xF;
        Operand cn = op_reg(cond_name[c]);
        Operand inv = op_reg(cond_name[c ^ 1]);

        if (c < 14) {
            if (op == 1 && rn == 31 && rm == 31) {
                set(insn, "cset", { gpr(rd, sf), inv });
                return true;
            }
            if (op == 2 && rn == 31 && rm == 31) {
                set(insn, "csetm", { gpr(rd, sf), inv });
                return true;
            }
            if (op == 1 && rn == rm && rn != 31) {
                set(insn, "cinc", { gpr(rd, sf), gpr(rn, sf), inv });
                return true;
            }
            if (op == 2 && rn == rm && rn != 31) {
                set(insn, "cinv", { gpr(rd, sf), gpr(rn, sf), inv });
                return true;
            }
            if (op == 3 && rn == rm) {
                set(insn, "cneg", { gpr(rd, sf), gpr(rn, sf), inv });
                return true;
            }
        }
        static const char *const n[4] = { "csel", "csinc", "csinv", "csneg" };
        set(insn, n[op], { gpr(rd, sf), gpr(rn, sf), gpr(rm, sf), cn });
        return true;
    }

    /* Data processing, 2 source */
    if ((w & 0x5FE00000) == 0x1AC00000) {
        const char *n;
        switch ((w >> 10) & 0x3F) {
        case 0x02: n = "udiv"; break;
        case 0x03: n = "sdiv"; break;
        case 0x08: n = "lsl";  break;
        case 0x09: n = "lsr";  break;
        case 0x0A: n = "asr";  break;
        case 0x0B: n = "ror";  break;
        default:   return false;
        }
        set(insn, n, { gpr(rd, sf), gpr(rn, sf), gpr(rm, sf) });
        return true;
    }

    /* Data processing, 1 source */
    if ((w & 0x5FFF0000) == 0x5AC00000) {
        const char *n;
        switch ((w >> 10) & 0x3F) {
        case 0: n = "rbit"; break;
        case 1: n = "rev16"; break;
        case 2: n = sf ? "rev32" : "rev"; break;
        case 3: if (!sf) return false; n = "rev"; break;
        case 4: n = "clz"; break;
        case 5: n = "cls"; break;
        default: return false;
        }
        set(insn, n, { gpr(rd, sf), gpr(rn, sf) });
        return true;
    }

    /* Data processing, 3 source */
    if ((w & 0x1F000000) == 0x1B000000) {
        unsigned op31 = (w >> 21) & 7;
        bool o0 = bit(w, 15);
        unsigned ra = field_ra(w);

        if (op31 == 0) {
            if (ra == 31)
                set(insn, o0 ? "mneg" : "mul", { gpr(rd, sf), gpr(rn, sf), gpr(rm, sf) });
            else
                set(insn, o0 ? "msub" : "madd",
                    { gpr(rd, sf), gpr(rn, sf), gpr(rm, sf), gpr(ra, sf) });
            return true;
        }
        if (!sf) return false;
        switch (op31) {
        case 1:
        case 5: {
            bool uns = op31 == 5;
            if (ra == 31 && !o0)
                set(insn, uns ? "umull" : "smull", { gpr(rd, true), gpr(rn, false), gpr(rm, false) });
            else if (ra == 31)
                set(insn, uns ? "umnegl" : "smnegl", { gpr(rd, true), gpr(rn, false), gpr(rm, false) });
            else
                set(insn, uns ? (o0 ? "umsubl" : "umaddl") : (o0 ? "smsubl" : "smaddl"),
                    { gpr(rd, true), gpr(rn, false), gpr(rm, false), gpr(ra, true) });
            return true;
        }
        case 2:
        case 6:
            if (o0) return false;
            set(insn, op31 == 6 ? "umulh" : "smulh", { gpr(rd, true), gpr(rn, true), gpr(rm, true) });
            return true;
        default:
            return false;
        }
    }
    return false;
}

/* ======================================================================== */
/* Loads and stores                                                          */
/* ======================================================================== */

/*
 * Register and mnemonic selection for single-register loads/stores.
 * Returns false for unallocated size/opc combinations.
 */
struct LdstForm {
    const char *name;       // ldr/str/ldrb/... (scaled form)
    Operand     rt;
    uint8_t     size;       // access size in bytes
    bool        prefetch;
};

static bool ldst_form(uint32_t w, LdstForm &f)
{
    unsigned size = (w >> 30) & 3;
    bool v = bit(w, 26);
    unsigned opc = (w >> 22) & 3;
    unsigned rt = field_rd(w);
    f.prefetch = false;

    if (v) {
        unsigned kind;
        if (opc & 2) {
            if (size != 0) return false;
            kind = FP_Q;
        } else {
            kind = size;
        }
        f.name = (opc & 1) ? "ldr" : "str";
        f.rt = op_reg(fp_reg(kind, rt));
        f.size = (uint8_t)(1u << (kind == FP_Q ? 4 : kind));
        return true;
    }

    static const char *const names[4][4] = {
        { "strb", "ldrb", "ldrsb", "ldrsb" },
        { "strh", "ldrh", "ldrsh", "ldrsh" },
        { "str",  "ldr",  "ldrsw", nullptr },
        { "str",  "ldr",  "prfm",  nullptr },
    };
    f.name = names[size][opc];
    if (!f.name) return false;
    f.size = (uint8_t)(1u << size);

    if (size == 3 && opc == 2) {
        f.prefetch = true;
        f.rt = imm(rt, 5);
        return true;
    }
    bool x;
    if (opc == 2)
        x = true;                       // sign-extend to 64
    else if (opc == 3)
        x = false;                      // sign-extend to 32
    else
        x = size == 3;
    f.rt = gpr(rt, x);
    return true;
}

/* ldr -> ldur, ldrsb -> ldursb, prfm -> prfum */
static std::string unscaled_name(const char *n)
{
    std::string s = n;
    if (s == "prfm") return "prfum";
    if (s.compare(0, 3, "ldr") == 0 || s.compare(0, 3, "str") == 0)
        return s.substr(0, 2) + "u" + s.substr(2);
    return s;
}

static bool decode_ldst(Instruction &insn, uint32_t w, uint64_t addr)
{
    unsigned rn = field_rn(w);

    /* Load register (literal) */
    if ((w & 0x3B000000) == 0x18000000) {
        unsigned opc = (w >> 30) & 3;
        bool v = bit(w, 26);
        unsigned rt = field_rd(w);
        uint64_t target = addr + (sign_extend((w >> 5) & 0x7FFFF, 19) << 2);
        Operand lit = op_mem(nullptr, 0, 0);
        lit.flags |= OPF_PCREL;
        lit.target = target;

        if (v) {
            static const unsigned kind[4] = { FP_S, FP_D, FP_Q, 0 };
            if (opc == 3) return false;
            lit.size = (uint8_t)(opc == 0 ? 4 : opc == 1 ? 8 : 16);
            set(insn, "ldr", { op_reg(fp_reg(kind[opc], rt)), lit });
            return true;
        }
        switch (opc) {
        case 0: lit.size = 4; set(insn, "ldr", { gpr(rt, false), lit }); return true;
        case 1: lit.size = 8; set(insn, "ldr", { gpr(rt, true), lit }); return true;
        case 2: lit.size = 4; set(insn, "ldrsw", { gpr(rt, true), lit }); return true;
        default: set(insn, "prfm", { imm(rt, 5), lit }); return true;
        }
    }

    /* Load/store pair */
    if ((w & 0x3A000000) == 0x28000000) {
        unsigned opc = (w >> 30) & 3;
        bool v = bit(w, 26);
        unsigned idx = (w >> 23) & 3;
        bool load = bit(w, 22);
        unsigned rt = field_rd(w);
        unsigned rt2 = field_ra(w);
        int64_t imm7 = sign_extend((w >> 15) & 0x7F, 7);

        Operand r1, r2;
        unsigned scale;
        const char *n;
        if (v) {
            if (opc == 3) return false;
            unsigned kind = opc == 0 ? FP_S : opc == 1 ? FP_D : FP_Q;
            scale = opc + 2;
            r1 = op_reg(fp_reg(kind, rt));
            r2 = op_reg(fp_reg(kind, rt2));
            n = idx == 0 ? (load ? "ldnp" : "stnp") : (load ? "ldp" : "stp");
        } else {
            if (opc == 3) return false;
            if (opc == 1) {
                if (!load || idx == 0) return false;
                n = "ldpsw";
                scale = 2;
                r1 = gpr(rt, true);
                r2 = gpr(rt2, true);
            } else {
                bool x = opc == 2;
                scale = x ? 3 : 2;
                r1 = gpr(rt, x);
                r2 = gpr(rt2, x);
                n = idx == 0 ? (load ? "ldnp" : "stnp") : (load ? "ldp" : "stp");
            }
        }
        Operand m = base_reg_mem(rn, imm7 << scale, 7, (uint8_t)(2u << scale));
        m.is_signed = true;
        m.mode = idx == 1 ? MemMode::POST_INDEX : idx == 3 ? MemMode::PRE_INDEX
                                                           : MemMode::OFFSET;
        set(insn, n, { r1, r2, m });
        return true;
    }

    /* Load/store exclusive and acquire/release */
    if ((w & 0x3F000000) == 0x08000000) {
        unsigned size = (w >> 30) & 3;
        bool o2 = bit(w, 23);
        bool load = bit(w, 22);
        bool o1 = bit(w, 21);
        bool o0 = bit(w, 15);
        unsigned rs = field_rm(w);
        unsigned rt = field_rd(w);
        if (o1) return false;           // pair exclusives and CAS not decoded

        static const char *const sfx[4] = { "b", "h", "", "" };
        bool x = size == 3;
        Operand m = base_reg_mem(rn, 0, 0, (uint8_t)(1u << size));
        std::string n;
        if (!o2) {
            n = load ? (o0 ? "ldaxr" : "ldxr") : (o0 ? "stlxr" : "stxr");
            n += sfx[size];
            if (load)
                set(insn, "", { gpr(rt, x), m });
            else
                set(insn, "", { gpr(rs, false), gpr(rt, x), m });
        } else {
            if (!o0) return false;      // LORegion forms
            n = load ? "ldar" : "stlr";
            n += sfx[size];
            set(insn, "", { gpr(rt, x), m });
        }
        insn.mnemonic = n;
        return true;
    }

    /* Unsigned offset */
    if ((w & 0x3B000000) == 0x39000000) {
        LdstForm f;
        if (!ldst_form(w, f)) return false;
        uint64_t off = (uint64_t)((w >> 10) & 0xFFF) * f.size;
        set(insn, f.name, { f.rt, base_reg_mem(rn, (int64_t)off, 12, f.size) });
        return true;
    }

    /* Register offset */
    if ((w & 0x3B200C00) == 0x38200800) {
        LdstForm f;
        if (!ldst_form(w, f)) return false;
        unsigned option = (w >> 13) & 7;
        if (!(option & 2)) return false;
        bool s = bit(w, 12);
        unsigned scale = 0;
        while ((1u << scale) < f.size) scale++;

        Operand m = base_reg_mem(rn, 0, 0, f.size);
        m.index = (option & 1) ? xreg_name[field_rm(w)] : wreg_name[field_rm(w)];
        if (option == 3) {
            if (s) {
                m.shift = "lsl";
                m.shift_amount = (uint8_t)scale;
            }
        } else {
            m.shift = extend_name[option];
            m.shift_amount = (uint8_t)(s ? scale : 0);
        }
        set(insn, f.name, { f.rt, m });
        return true;
    }

    /* Unscaled, post-index, pre-index */
    if ((w & 0x3B200000) == 0x38000000) {
        unsigned idx = (w >> 10) & 3;
        if (idx == 2) return false;     // unprivileged forms
        LdstForm f;
        if (!ldst_form(w, f)) return false;
        if (f.prefetch && idx != 0) return false;
        int64_t imm9 = sign_extend((w >> 12) & 0x1FF, 9);
        Operand m = base_reg_mem(rn, imm9, 9, f.size);
        m.is_signed = true;
        if (idx == 1)
            m.mode = MemMode::POST_INDEX;
        else if (idx == 3)
            m.mode = MemMode::PRE_INDEX;
        if (idx == 0) {
            std::string n = unscaled_name(f.name);
            set(insn, "", { f.rt, m });
            insn.mnemonic = n;
        } else {
            set(insn, f.name, { f.rt, m });
        }
        return true;
    }
    return false;
}

/* ======================================================================== */
/* Main disassembler                                                         */
/* ======================================================================== */

static bool decode_word(Instruction &insn, uint32_t w, uint64_t addr)
{
    unsigned op0 = (w >> 25) & 0xF;

    switch (op0) {
    case 0x8: case 0x9:                 // data processing, immediate
        return decode_dp_imm(insn, w, addr);
    case 0xA: case 0xB:                 // branches, exceptions, system
        if ((w & 0xFFC00000) == 0xD5000000)
            return decode_system(insn, w);
        return decode_branch_sys(insn, w, addr);
    case 0x4: case 0x6: case 0xC: case 0xE:     // loads and stores
        return decode_ldst(insn, w, addr);
    case 0x5: case 0xD:                 // data processing, register
        return decode_dp_reg(insn, w);
    default:
        return false;                   // SIMD/FP data processing, SVE, reserved
    }
}

Instruction dec_aarch64(std::span<const uint8_t> data, uint64_t addr,
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
