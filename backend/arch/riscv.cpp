/*
 * riscv.cpp: RISC-V (RV64) architecture data
 *
 * Disassembler covering RV64I, M, A, Zicsr, Zifencei and the F/D
 * load/store forms, with the standard assembler aliases (nop, li, mv,
 * not, neg, j, jr, ret, beqz/bnez, sext.w, csrr/csrw, ...).  All
 * encodings are 32 bits wide; compressed (C) encodings are not decoded.
 */

#include "arch.hpp"
#include "operands.hpp"

#include <initializer_list>

namespace arch {

/* ======================================================================== */
/* Register names                                                            */
/* ======================================================================== */

static const char *const xreg_name[32] = {
    "zero", "ra", "sp",  "gp",  "tp", "t0", "t1", "t2",
    "s0",   "s1", "a0",  "a1",  "a2", "a3", "a4", "a5",
    "a6",   "a7", "s2",  "s3",  "s4", "s5", "s6", "s7",
    "s8",   "s9", "s10", "s11", "t3", "t4", "t5", "t6",
};

static const char *const freg_name[32] = {
    "ft0", "ft1", "ft2",  "ft3",  "ft4", "ft5", "ft6",  "ft7",
    "fs0", "fs1", "fa0",  "fa1",  "fa2", "fa3", "fa4",  "fa5",
    "fa6", "fa7", "fs2",  "fs3",  "fs4", "fs5", "fs6",  "fs7",
    "fs8", "fs9", "fs10", "fs11", "ft8", "ft9", "ft10", "ft11",
};

/* FENCE predecessor/successor sets, indexed by the 4-bit iorw field */
static const char *const fence_set[16] = {
    "0",  "w",  "r",  "rw",  "o",  "ow",  "or",  "orw",
    "i",  "iw", "ir", "irw", "io", "iow", "ior", "iorw",
};

struct CsrName { uint16_t num; const char *name; };

static const CsrName csr_names[] = {
    { 0x001, "fflags"   }, { 0x002, "frm"      }, { 0x003, "fcsr"     },
    { 0x100, "sstatus"  }, { 0x104, "sie"      }, { 0x105, "stvec"    },
    { 0x106, "scounteren" },
    { 0x140, "sscratch" }, { 0x141, "sepc"     }, { 0x142, "scause"   },
    { 0x143, "stval"    }, { 0x144, "sip"      }, { 0x180, "satp"     },
    { 0x300, "mstatus"  }, { 0x301, "misa"     }, { 0x302, "medeleg"  },
    { 0x303, "mideleg"  }, { 0x304, "mie"      }, { 0x305, "mtvec"    },
    { 0x306, "mcounteren" },
    { 0x340, "mscratch" }, { 0x341, "mepc"     }, { 0x342, "mcause"   },
    { 0x343, "mtval"    }, { 0x344, "mip"      },
    { 0xB00, "mcycle"   }, { 0xB02, "minstret" },
    { 0xC00, "cycle"    }, { 0xC01, "time"     }, { 0xC02, "instret"  },
    { 0xF11, "mvendorid" }, { 0xF12, "marchid" }, { 0xF13, "mimpid"   },
    { 0xF14, "mhartid"  },
};

static const char *csr_name(unsigned num)
{
    for (auto &c : csr_names)
        if (c.num == num)
            return c.name;
    return nullptr;
}

/* ======================================================================== */
/* Field extraction                                                          */
/* ======================================================================== */

static inline unsigned field_opcode(uint32_t w) { return  w        & 0x7F; }
static inline unsigned field_rd(uint32_t w)     { return (w >>  7) & 0x1F; }
static inline unsigned field_funct3(uint32_t w) { return (w >> 12) & 0x07; }
static inline unsigned field_rs1(uint32_t w)    { return (w >> 15) & 0x1F; }
static inline unsigned field_rs2(uint32_t w)    { return (w >> 20) & 0x1F; }
static inline unsigned field_funct7(uint32_t w) { return  w >> 25; }

static inline int32_t imm_i(uint32_t w) { return (int32_t)w >> 20; }

static inline int32_t imm_s(uint32_t w)
{
    return (int32_t)(((int32_t)w >> 25) << 5) | (int32_t)((w >> 7) & 0x1F);
}

static inline int32_t imm_b(uint32_t w)
{
    uint32_t v = ((w >> 31) & 1) << 12
               | ((w >>  7) & 1) << 11
               | ((w >> 25) & 0x3F) << 5
               | ((w >>  8) & 0x0F) << 1;
    return (int32_t)sign_extend(v, 13);
}

static inline int32_t imm_j(uint32_t w)
{
    uint32_t v = ((w >> 31) & 1) << 20
               | ((w >> 12) & 0xFF) << 12
               | ((w >> 20) & 1) << 11
               | ((w >> 21) & 0x3FF) << 1;
    return (int32_t)sign_extend(v, 21);
}

/* ======================================================================== */
/* Operand helpers                                                           */
/* ======================================================================== */

static inline Operand xr(unsigned r) { return op_reg(xreg_name[r]); }
static inline Operand fr(unsigned r) { return op_reg(freg_name[r]); }

static inline Operand simm(int64_t v, uint8_t width)
{
    return op_imm(v, width, true, false);
}

static inline Operand uimm(uint64_t v, uint8_t width, bool hex = false)
{
    return op_imm((int64_t)v, width, false, hex);
}

static inline Operand mem(unsigned base, int32_t disp, uint8_t size)
{
    return op_mem(xreg_name[base], disp, 12, size);
}

/* Register-indirect memory operand with no displacement, "(a0)" */
static inline Operand mem0(unsigned base, uint8_t size)
{
    return op_mem(xreg_name[base], 0, 0, size);
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
/* Control transfer                                                          */
/* ======================================================================== */

static bool decode_jal(Instruction &insn, uint32_t w, uint64_t addr)
{
    unsigned rd = field_rd(w);
    uint64_t target = addr + (int64_t)imm_j(w);

    if (rd == 0)
        set_branch(insn, "j", {}, target, Flow::BRANCH);
    else if (rd == 1)
        set_branch(insn, "jal", {}, target, Flow::CALL);
    else
        set_branch(insn, "jal", { xr(rd) }, target, Flow::CALL);
    return true;
}

static bool decode_jalr(Instruction &insn, uint32_t w)
{
    if (field_funct3(w) != 0) return false;
    unsigned rd = field_rd(w);
    unsigned rs1 = field_rs1(w);
    int32_t imm = imm_i(w);

    if (rd == 0 && rs1 == 1 && imm == 0)
        set(insn, "ret", {}, Flow::RETURN);
    else if (rd == 0 && imm == 0)
        set(insn, "jr", { xr(rs1) }, Flow::INDIRECT);
    else if (rd == 0)
        set(insn, "jr", { mem(rs1, imm, 0) }, Flow::INDIRECT);
    else if (rd == 1 && imm == 0)
        set(insn, "jalr", { xr(rs1) }, Flow::INDIRECT);
    else
        set(insn, "jalr", { xr(rd), mem(rs1, imm, 0) }, Flow::INDIRECT);
    return true;
}

static bool decode_branch(Instruction &insn, uint32_t w, uint64_t addr)
{
    unsigned rs1 = field_rs1(w);
    unsigned rs2 = field_rs2(w);
    uint64_t target = addr + (int64_t)imm_b(w);
    const Flow cb = Flow::COND_BRANCH;

    switch (field_funct3(w)) {
    case 0: // BEQ
        if (rs2 == 0)
            set_branch(insn, "beqz", { xr(rs1) }, target, cb);
        else
            set_branch(insn, "beq", { xr(rs1), xr(rs2) }, target, cb);
        return true;
    case 1: // BNE
        if (rs2 == 0)
            set_branch(insn, "bnez", { xr(rs1) }, target, cb);
        else
            set_branch(insn, "bne", { xr(rs1), xr(rs2) }, target, cb);
        return true;
    case 4: // BLT
        if (rs2 == 0)
            set_branch(insn, "bltz", { xr(rs1) }, target, cb);
        else if (rs1 == 0)
            set_branch(insn, "bgtz", { xr(rs2) }, target, cb);
        else
            set_branch(insn, "blt", { xr(rs1), xr(rs2) }, target, cb);
        return true;
    case 5: // BGE
        if (rs2 == 0)
            set_branch(insn, "bgez", { xr(rs1) }, target, cb);
        else if (rs1 == 0)
            set_branch(insn, "blez", { xr(rs2) }, target, cb);
        else
            set_branch(insn, "bge", { xr(rs1), xr(rs2) }, target, cb);
        return true;
    case 6:
        set_branch(insn, "bltu", { xr(rs1), xr(rs2) }, target, cb);
        return true;
    case 7:
        set_branch(insn, "bgeu", { xr(rs1), xr(rs2) }, target, cb);
        return true;
    default:
        return false;
    }
}

/* ======================================================================== */
/* Loads and stores                                                          */
/* ======================================================================== */

static bool decode_load(Instruction &insn, uint32_t w)
{
    static const char *const n[8] = { "lb", "lh", "lw", "ld", "lbu", "lhu", "lwu", nullptr };
    static const uint8_t size[8] = { 1, 2, 4, 8, 1, 2, 4, 0 };
    unsigned f3 = field_funct3(w);
    if (!n[f3]) return false;
    set(insn, n[f3], { xr(field_rd(w)), mem(field_rs1(w), imm_i(w), size[f3]) });
    return true;
}

static bool decode_store(Instruction &insn, uint32_t w)
{
    static const char *const n[8] = { "sb", "sh", "sw", "sd", nullptr, nullptr, nullptr, nullptr };
    static const uint8_t size[8] = { 1, 2, 4, 8, 0, 0, 0, 0 };
    unsigned f3 = field_funct3(w);
    if (!n[f3]) return false;
    set(insn, n[f3], { xr(field_rs2(w)), mem(field_rs1(w), imm_s(w), size[f3]) });
    return true;
}

static bool decode_fp_load(Instruction &insn, uint32_t w)
{
    unsigned f3 = field_funct3(w);
    if (f3 != 2 && f3 != 3) return false;
    set(insn, f3 == 2 ? "flw" : "fld",
        { fr(field_rd(w)), mem(field_rs1(w), imm_i(w), f3 == 2 ? 4 : 8) });
    return true;
}

static bool decode_fp_store(Instruction &insn, uint32_t w)
{
    unsigned f3 = field_funct3(w);
    if (f3 != 2 && f3 != 3) return false;
    set(insn, f3 == 2 ? "fsw" : "fsd",
        { fr(field_rs2(w)), mem(field_rs1(w), imm_s(w), f3 == 2 ? 4 : 8) });
    return true;
}

/* ======================================================================== */
/* Integer computation                                                       */
/* ======================================================================== */

static bool decode_op_imm(Instruction &insn, uint32_t w)
{
    unsigned rd = field_rd(w);
    unsigned rs1 = field_rs1(w);
    int32_t imm = imm_i(w);
    unsigned shamt = (w >> 20) & 0x3F;
    unsigned funct6 = w >> 26;

    switch (field_funct3(w)) {
    case 0: // ADDI
        if (rd == 0 && rs1 == 0 && imm == 0)
            set(insn, "nop", {});
        else if (rs1 == 0)
            set(insn, "li", { xr(rd), simm(imm, 12) });
        else if (imm == 0)
            set(insn, "mv", { xr(rd), xr(rs1) });
        else
            set(insn, "addi", { xr(rd), xr(rs1), simm(imm, 12) });
        return true;
    case 1: // SLLI
        if (funct6 != 0) return false;
        set(insn, "slli", { xr(rd), xr(rs1), uimm(shamt, 6) });
        return true;
    case 2:
        set(insn, "slti", { xr(rd), xr(rs1), simm(imm, 12) });
        return true;
    case 3:
        if (imm == 1)
            set(insn, "seqz", { xr(rd), xr(rs1) });
        else
            set(insn, "sltiu", { xr(rd), xr(rs1), simm(imm, 12) });
        return true;
    case 4:
        if (imm == -1)
            set(insn, "not", { xr(rd), xr(rs1) });
        else
            set(insn, "xori", { xr(rd), xr(rs1), simm(imm, 12) });
        return true;
    case 5: // SRLI/SRAI
        if (funct6 == 0x00)
            set(insn, "srli", { xr(rd), xr(rs1), uimm(shamt, 6) });
        else if (funct6 == 0x10)
            set(insn, "srai", { xr(rd), xr(rs1), uimm(shamt, 6) });
        else
            return false;
        return true;
    case 6:
        set(insn, "ori", { xr(rd), xr(rs1), simm(imm, 12) });
        return true;
    case 7:
        set(insn, "andi", { xr(rd), xr(rs1), simm(imm, 12) });
        return true;
    }
    return false;
}

static bool decode_op_imm32(Instruction &insn, uint32_t w)
{
    unsigned rd = field_rd(w);
    unsigned rs1 = field_rs1(w);
    int32_t imm = imm_i(w);
    unsigned shamt = field_rs2(w);
    unsigned f7 = field_funct7(w);

    switch (field_funct3(w)) {
    case 0:
        if (imm == 0)
            set(insn, "sext.w", { xr(rd), xr(rs1) });
        else
            set(insn, "addiw", { xr(rd), xr(rs1), simm(imm, 12) });
        return true;
    case 1:
        if (f7 != 0) return false;
        set(insn, "slliw", { xr(rd), xr(rs1), uimm(shamt, 5) });
        return true;
    case 5:
        if (f7 == 0x00)
            set(insn, "srliw", { xr(rd), xr(rs1), uimm(shamt, 5) });
        else if (f7 == 0x20)
            set(insn, "sraiw", { xr(rd), xr(rs1), uimm(shamt, 5) });
        else
            return false;
        return true;
    default:
        return false;
    }
}

static bool decode_op(Instruction &insn, uint32_t w)
{
    static const char *const base[8] = { "add", "sll", "slt", "sltu", "xor", "srl", "or", "and" };
    static const char *const mext[8] = { "mul", "mulh", "mulhsu", "mulhu", "div", "divu", "rem", "remu" };
    unsigned rd = field_rd(w);
    unsigned rs1 = field_rs1(w);
    unsigned rs2 = field_rs2(w);
    unsigned f3 = field_funct3(w);

    switch (field_funct7(w)) {
    case 0x00:
        if (f3 == 3 && rs1 == 0)
            set(insn, "snez", { xr(rd), xr(rs2) });
        else
            set(insn, base[f3], { xr(rd), xr(rs1), xr(rs2) });
        return true;
    case 0x20:
        if (f3 == 0 && rs1 == 0)
            set(insn, "neg", { xr(rd), xr(rs2) });
        else if (f3 == 0)
            set(insn, "sub", { xr(rd), xr(rs1), xr(rs2) });
        else if (f3 == 5)
            set(insn, "sra", { xr(rd), xr(rs1), xr(rs2) });
        else
            return false;
        return true;
    case 0x01:
        set(insn, mext[f3], { xr(rd), xr(rs1), xr(rs2) });
        return true;
    default:
        return false;
    }
}

static bool decode_op32(Instruction &insn, uint32_t w)
{
    unsigned rd = field_rd(w);
    unsigned rs1 = field_rs1(w);
    unsigned rs2 = field_rs2(w);
    unsigned f3 = field_funct3(w);

    switch (field_funct7(w)) {
    case 0x00:
        switch (f3) {
        case 0: set(insn, "addw", { xr(rd), xr(rs1), xr(rs2) }); return true;
        case 1: set(insn, "sllw", { xr(rd), xr(rs1), xr(rs2) }); return true;
        case 5: set(insn, "srlw", { xr(rd), xr(rs1), xr(rs2) }); return true;
        default: return false;
        }
    case 0x20:
        if (f3 == 0 && rs1 == 0)
            set(insn, "negw", { xr(rd), xr(rs2) });
        else if (f3 == 0)
            set(insn, "subw", { xr(rd), xr(rs1), xr(rs2) });
        else if (f3 == 5)
            set(insn, "sraw", { xr(rd), xr(rs1), xr(rs2) });
        else
            return false;
        return true;
    case 0x01: {
        static const char *const n[8] = { "mulw", nullptr, nullptr, nullptr,
                                          "divw", "divuw", "remw", "remuw" };
        if (!n[f3]) return false;
        set(insn, n[f3], { xr(rd), xr(rs1), xr(rs2) });
        return true;
    }
    default:
        return false;
    }
}

/* ======================================================================== */
/* Atomics (A extension)                                                     */
/* ======================================================================== */

static bool decode_amo(Instruction &insn, uint32_t w)
{
    unsigned f3 = field_funct3(w);
    if (f3 != 2 && f3 != 3) return false;
    unsigned rd = field_rd(w);
    unsigned rs1 = field_rs1(w);
    unsigned rs2 = field_rs2(w);
    uint8_t size = f3 == 2 ? 4 : 8;

    const char *op;
    switch (w >> 27) {
    case 0x02: op = "lr";      break;
    case 0x03: op = "sc";      break;
    case 0x01: op = "amoswap"; break;
    case 0x00: op = "amoadd";  break;
    case 0x04: op = "amoxor";  break;
    case 0x0C: op = "amoand";  break;
    case 0x08: op = "amoor";   break;
    case 0x10: op = "amomin";  break;
    case 0x14: op = "amomax";  break;
    case 0x18: op = "amominu"; break;
    case 0x1C: op = "amomaxu"; break;
    default:   return false;
    }
    if ((w >> 27) == 0x02 && rs2 != 0) return false;

    std::string m = op;
    m += f3 == 2 ? ".w" : ".d";
    bool aq = w & (1u << 26);
    bool rl = w & (1u << 25);
    if (aq && rl) m += ".aqrl";
    else if (aq)  m += ".aq";
    else if (rl)  m += ".rl";

    if ((w >> 27) == 0x02)
        set(insn, "", { xr(rd), mem0(rs1, size) });
    else
        set(insn, "", { xr(rd), xr(rs2), mem0(rs1, size) });
    insn.mnemonic = m;
    return true;
}

/* ======================================================================== */
/* System, CSR and fences                                                    */
/* ======================================================================== */

static Operand csr_operand(unsigned num)
{
    if (const char *n = csr_name(num))
        return op_reg(n);
    return uimm(num, 12, true);
}

static bool decode_system(Instruction &insn, uint32_t w)
{
    unsigned rd = field_rd(w);
    unsigned rs1 = field_rs1(w);
    unsigned f3 = field_funct3(w);
    unsigned csr = w >> 20;

    if (f3 == 0) {
        if (field_funct7(w) == 0x09 && rd == 0) {
            set(insn, "sfence.vma", { xr(rs1), xr(field_rs2(w)) });
            return true;
        }
        if (rd != 0 || rs1 != 0) return false;
        switch (csr) {
        case 0x000: set(insn, "ecall", {}); return true;
        case 0x001: set(insn, "ebreak", {}); return true;
        case 0x102: set(insn, "sret", {}, Flow::RETURN); return true;
        case 0x302: set(insn, "mret", {}, Flow::RETURN); return true;
        case 0x105: set(insn, "wfi", {}); return true;
        default:    return false;
        }
    }
    if (f3 == 4) return false;

    bool imm_form = f3 >= 5;
    Operand src = imm_form ? uimm(rs1, 5) : xr(rs1);
    unsigned kind = f3 & 3;     // 1 = rw, 2 = rs, 3 = rc

    if (kind == 2 && rs1 == 0 && !imm_form) {
        set(insn, "csrr", { xr(rd), csr_operand(csr) });
        return true;
    }
    if (rd == 0) {
        static const char *const reg_alias[4] = { nullptr, "csrw", "csrs", "csrc" };
        static const char *const imm_alias[4] = { nullptr, "csrwi", "csrsi", "csrci" };
        set(insn, imm_form ? imm_alias[kind] : reg_alias[kind], { csr_operand(csr), src });
        return true;
    }
    static const char *const reg_name[4] = { nullptr, "csrrw", "csrrs", "csrrc" };
    static const char *const imm_name[4] = { nullptr, "csrrwi", "csrrsi", "csrrci" };
    set(insn, imm_form ? imm_name[kind] : reg_name[kind], { xr(rd), csr_operand(csr), src });
    return true;
}

static bool decode_misc_mem(Instruction &insn, uint32_t w)
{
    switch (field_funct3(w)) {
    case 0: {
        unsigned pred = (w >> 24) & 0xF;
        unsigned succ = (w >> 20) & 0xF;
        if (pred == 0xF && succ == 0xF)
            set(insn, "fence", {});
        else if ((w >> 28) == 0x8 && pred == 0x3 && succ == 0x3)
            set(insn, "fence.tso", {});
        else
            set(insn, "fence", { op_reg(fence_set[pred]), op_reg(fence_set[succ]) });
        return true;
    }
    case 1:
        set(insn, "fence.i", {});
        return true;
    default:
        return false;
    }
}

/* ======================================================================== */
/* Main disassembler                                                         */
/* ======================================================================== */

static bool decode_word(Instruction &insn, uint32_t w, uint64_t addr)
{
    if ((w & 3) != 3) return false;         // compressed encoding

    switch (field_opcode(w)) {
    case 0x37:
        set(insn, "lui", { xr(field_rd(w)), uimm(w >> 12, 20, true) });
        return true;
    case 0x17:
        set(insn, "auipc", { xr(field_rd(w)), uimm(w >> 12, 20, true) });
        return true;
    case 0x6F: return decode_jal(insn, w, addr);
    case 0x67: return decode_jalr(insn, w);
    case 0x63: return decode_branch(insn, w, addr);
    case 0x03: return decode_load(insn, w);
    case 0x23: return decode_store(insn, w);
    case 0x07: return decode_fp_load(insn, w);
    case 0x27: return decode_fp_store(insn, w);
    case 0x13: return decode_op_imm(insn, w);
    case 0x1B: return decode_op_imm32(insn, w);
    case 0x33: return decode_op(insn, w);
    case 0x3B: return decode_op32(insn, w);
    case 0x2F: return decode_amo(insn, w);
    case 0x0F: return decode_misc_mem(insn, w);
    case 0x73: return decode_system(insn, w);
    default:   return false;
    }
}

Instruction dec_riscv(std::span<const uint8_t> data, uint64_t addr,
                      uint32_t /*flags*/)
{
    if (data.size() < 4)
        return make_invalid(data, addr, (unsigned)data.size());

    uint32_t w = read_word32(data, 0);

    Instruction insn;
    if (!decode_word(insn, w, addr))
        return make_invalid(data, addr, 4);
    return finish(insn, data, addr, 4);
}

} // namespace arch
