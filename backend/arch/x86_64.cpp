/*
 * x86_64.cpp: x86-64 architecture data
 *
 * Disassembler: table-driven, 256-entry one-byte opcode map with operand
 * specifiers, group opcodes decoded from ModRM.reg, and a two-byte (0F)
 * map covering general-purpose, system and common SSE instructions.
 * Intel operand order.  Length is determined from prefixes, ModRM, SIB,
 * displacement and immediates; anything unknown becomes an invalid entry
 * covering the bytes consumed so far.
 */

#include "arch.hpp"
#include "operands.hpp"

#include <cstring>

namespace arch {

/* ======================================================================== */
/* Register names                                                            */
/* ======================================================================== */

static const char *const reg8_rex[16] = {
    "al",  "cl",  "dl",   "bl",   "spl",  "bpl",  "sil",  "dil",
    "r8b", "r9b", "r10b", "r11b", "r12b", "r13b", "r14b", "r15b",
};

static const char *const reg8_legacy[8] = {
    "al", "cl", "dl", "bl", "ah", "ch", "dh", "bh",
};

static const char *const reg16[16] = {
    "ax",  "cx",  "dx",   "bx",   "sp",   "bp",   "si",   "di",
    "r8w", "r9w", "r10w", "r11w", "r12w", "r13w", "r14w", "r15w",
};

static const char *const reg32[16] = {
    "eax", "ecx", "edx",  "ebx",  "esp",  "ebp",  "esi",  "edi",
    "r8d", "r9d", "r10d", "r11d", "r12d", "r13d", "r14d", "r15d",
};

static const char *const reg64[16] = {
    "rax", "rcx", "rdx", "rbx", "rsp", "rbp", "rsi", "rdi",
    "r8",  "r9",  "r10", "r11", "r12", "r13", "r14", "r15",
};

static const char *const xmm_name[16] = {
    "xmm0", "xmm1", "xmm2",  "xmm3",  "xmm4",  "xmm5",  "xmm6",  "xmm7",
    "xmm8", "xmm9", "xmm10", "xmm11", "xmm12", "xmm13", "xmm14", "xmm15",
};

static const char *const sreg_name[8] = {
    "es", "cs", "ss", "ds", "fs", "gs", nullptr, nullptr,
};

static const char *const st_name[8] = {
    "st(0)", "st(1)", "st(2)", "st(3)", "st(4)", "st(5)", "st(6)", "st(7)",
};

static const char *const cc_suffix[16] = {
    "o", "no", "b", "ae", "e", "ne", "be", "a",
    "s", "ns", "p", "np", "l", "ge", "le", "g",
};

/* Mnemonic strings for condition-code families, indexed by cc */
static const char *const jcc_name[16] = {
    "jo", "jno", "jb", "jae", "je", "jne", "jbe", "ja",
    "js", "jns", "jp", "jnp", "jl", "jge", "jle", "jg",
};

static const char *const setcc_name[16] = {
    "seto", "setno", "setb", "setae", "sete", "setne", "setbe", "seta",
    "sets", "setns", "setp", "setnp", "setl", "setge", "setle", "setg",
};

static const char *const cmovcc_name[16] = {
    "cmovo", "cmovno", "cmovb", "cmovae", "cmove", "cmovne", "cmovbe", "cmova",
    "cmovs", "cmovns", "cmovp", "cmovnp", "cmovl", "cmovge", "cmovle", "cmovg",
};

/* ======================================================================== */
/* Operand specifiers                                                        */
/* ======================================================================== */

enum : uint8_t {
    S_NONE,
    S_Eb,       // r/m8
    S_Ev,       // r/m16/32/64 by operand size
    S_Ew,       // r/m16
    S_Ed,       // r/m32
    S_Gb,       // reg8 from ModRM.reg
    S_Gv,       // reg16/32/64 from ModRM.reg
    S_M,        // memory only, no access size (LEA)
    S_Ib,       // imm8, unsigned
    S_Ibs,      // imm8, sign-extended to operand size
    S_Iw,       // imm16
    S_Iz,       // imm16/32 (sign-extended to 64 for 64-bit operand size)
    S_Iv,       // imm16/32/64
    S_Jb,       // rel8
    S_Jz,       // rel32
    S_AL,
    S_rAX,      // ax/eax/rax by operand size
    S_CL,
    S_DX,       // dx port register
    S_ONE,      // constant 1 (shift groups)
    S_Zb,       // reg8 from opcode low bits
    S_Zv,       // reg from opcode low bits, operand size
    S_Ob,       // moffs8
    S_Ov,       // moffs by operand size
    S_Sw,       // segment register from ModRM.reg
};

/* Entry flags */
enum : uint8_t {
    F_NONE   = 0,
    F_D64    = 1 << 0,   // default 64-bit operand size (push/pop/near branches)
    F_STRING = 1 << 1,   // string instruction: size suffix, rep prefixes
    F_STRCMP = 1 << 2,   // string compare: repe/repne
    F_GROUP  = 1 << 3,   // mnemonic selected by ModRM.reg (see group field)
    F_PFX    = 1 << 4,   // prefix byte (never reaches the opcode decoder)
};

struct OpEntry {
    const char *mnem;     // nullptr = undefined in 64-bit mode
    uint8_t     a, b, c;  // operand specifiers
    uint8_t     flags;
    Flow        flow;
    uint8_t     group;    // group number when F_GROUP
};

#define UND              { nullptr, S_NONE, S_NONE, S_NONE, F_NONE, Flow::NONE, 0 }
#define PFX              { nullptr, S_NONE, S_NONE, S_NONE, F_PFX,  Flow::NONE, 0 }
#define O0(m)            { m, S_NONE, S_NONE, S_NONE, F_NONE, Flow::NONE, 0 }
#define O1(m, a)         { m, a, S_NONE, S_NONE, F_NONE, Flow::NONE, 0 }
#define O2(m, a, b)      { m, a, b, S_NONE, F_NONE, Flow::NONE, 0 }
#define O3(m, a, b, c)   { m, a, b, c, F_NONE, Flow::NONE, 0 }
#define OF(m, a, b, f)   { m, a, b, S_NONE, f, Flow::NONE, 0 }
#define BR(m, a, fl, f)  { m, a, S_NONE, S_NONE, f, fl, 0 }
#define GRP(n, a, b, f)  { "", a, b, S_NONE, (uint8_t)(F_GROUP | (f)), Flow::NONE, n }

/* Arithmetic row: op Eb,Gb / Ev,Gv / Gb,Eb / Gv,Ev / AL,Ib / rAX,Iz */
#define ALU(m) \
    O2(m, S_Eb, S_Gb), O2(m, S_Ev, S_Gv), O2(m, S_Gb, S_Eb), \
    O2(m, S_Gv, S_Ev), O2(m, S_AL, S_Ib), O2(m, S_rAX, S_Iz)

enum : uint8_t {
    G_1 = 1,    // 80/81/83: add or adc sbb and sub xor cmp
    G_1A,       // 8F: pop
    G_2,        // C0/C1/D0-D3: rotates and shifts
    G_3,        // F6/F7: test not neg mul imul div idiv
    G_4,        // FE: inc dec
    G_5,        // FF: inc dec call jmp push
    G_11,       // C6/C7: mov
};

static const OpEntry one_byte[256] = {
    // 0x00-0x0F
    ALU("add"),                                     // 00-05
    UND, UND,                                       // 06 07
    ALU("or"),                                      // 08-0D
    UND,                                            // 0E
    UND,                                            // 0F (escape, handled separately)

    // 0x10-0x1F
    ALU("adc"),                                     // 10-15
    UND, UND,                                       // 16 17
    ALU("sbb"),                                     // 18-1D
    UND, UND,                                       // 1E 1F

    // 0x20-0x2F
    ALU("and"),                                     // 20-25
    PFX,                                            // 26 ES
    UND,                                            // 27
    ALU("sub"),                                     // 28-2D
    PFX,                                            // 2E CS
    UND,                                            // 2F

    // 0x30-0x3F
    ALU("xor"),                                     // 30-35
    PFX,                                            // 36 SS
    UND,                                            // 37
    ALU("cmp"),                                     // 38-3D
    PFX,                                            // 3E DS
    UND,                                            // 3F

    // 0x40-0x4F: REX
    PFX, PFX, PFX, PFX, PFX, PFX, PFX, PFX,
    PFX, PFX, PFX, PFX, PFX, PFX, PFX, PFX,

    // 0x50-0x5F
    OF("push", S_Zv, S_NONE, F_D64), OF("push", S_Zv, S_NONE, F_D64),
    OF("push", S_Zv, S_NONE, F_D64), OF("push", S_Zv, S_NONE, F_D64),
    OF("push", S_Zv, S_NONE, F_D64), OF("push", S_Zv, S_NONE, F_D64),
    OF("push", S_Zv, S_NONE, F_D64), OF("push", S_Zv, S_NONE, F_D64),
    OF("pop",  S_Zv, S_NONE, F_D64), OF("pop",  S_Zv, S_NONE, F_D64),
    OF("pop",  S_Zv, S_NONE, F_D64), OF("pop",  S_Zv, S_NONE, F_D64),
    OF("pop",  S_Zv, S_NONE, F_D64), OF("pop",  S_Zv, S_NONE, F_D64),
    OF("pop",  S_Zv, S_NONE, F_D64), OF("pop",  S_Zv, S_NONE, F_D64),

    // 0x60-0x6F
    UND, UND, UND,                                  // 60 61 62
    O2("movsxd", S_Gv, S_Ed),                       // 63
    PFX, PFX, PFX, PFX,                             // 64 FS, 65 GS, 66, 67
    OF("push", S_Iz, S_NONE, F_D64),                // 68
    O3("imul", S_Gv, S_Ev, S_Iz),                   // 69
    OF("push", S_Ibs, S_NONE, F_D64),               // 6A
    O3("imul", S_Gv, S_Ev, S_Ibs),                  // 6B
    OF("ins",  S_NONE, S_NONE, F_STRING),           // 6C (byte form)
    OF("ins",  S_NONE, S_NONE, F_STRING),           // 6D
    OF("outs", S_NONE, S_NONE, F_STRING),           // 6E (byte form)
    OF("outs", S_NONE, S_NONE, F_STRING),           // 6F

    // 0x70-0x7F: jcc rel8 (mnemonic from jcc_name)
    BR("", S_Jb, Flow::COND_BRANCH, F_NONE), BR("", S_Jb, Flow::COND_BRANCH, F_NONE),
    BR("", S_Jb, Flow::COND_BRANCH, F_NONE), BR("", S_Jb, Flow::COND_BRANCH, F_NONE),
    BR("", S_Jb, Flow::COND_BRANCH, F_NONE), BR("", S_Jb, Flow::COND_BRANCH, F_NONE),
    BR("", S_Jb, Flow::COND_BRANCH, F_NONE), BR("", S_Jb, Flow::COND_BRANCH, F_NONE),
    BR("", S_Jb, Flow::COND_BRANCH, F_NONE), BR("", S_Jb, Flow::COND_BRANCH, F_NONE),
    BR("", S_Jb, Flow::COND_BRANCH, F_NONE), BR("", S_Jb, Flow::COND_BRANCH, F_NONE),
    BR("", S_Jb, Flow::COND_BRANCH, F_NONE), BR("", S_Jb, Flow::COND_BRANCH, F_NONE),
    BR("", S_Jb, Flow::COND_BRANCH, F_NONE), BR("", S_Jb, Flow::COND_BRANCH, F_NONE),

    // 0x80-0x8F
    GRP(G_1, S_Eb, S_Ib, F_NONE),                   // 80
    GRP(G_1, S_Ev, S_Iz, F_NONE),                   // 81
    UND,                                            // 82
    GRP(G_1, S_Ev, S_Ibs, F_NONE),                  // 83
    O2("test", S_Eb, S_Gb),                         // 84
    O2("test", S_Ev, S_Gv),                         // 85
    O2("xchg", S_Eb, S_Gb),                         // 86
    O2("xchg", S_Ev, S_Gv),                         // 87
    O2("mov",  S_Eb, S_Gb),                         // 88
    O2("mov",  S_Ev, S_Gv),                         // 89
    O2("mov",  S_Gb, S_Eb),                         // 8A
    O2("mov",  S_Gv, S_Ev),                         // 8B
    O2("mov",  S_Ev, S_Sw),                         // 8C
    O2("lea",  S_Gv, S_M),                          // 8D
    O2("mov",  S_Sw, S_Ew),                         // 8E
    GRP(G_1A, S_Ev, S_NONE, F_D64),                 // 8F

    // 0x90-0x9F
    O0("nop"),                                      // 90 (xchg r8 with REX.B)
    O2("xchg", S_Zv, S_rAX), O2("xchg", S_Zv, S_rAX),
    O2("xchg", S_Zv, S_rAX), O2("xchg", S_Zv, S_rAX),
    O2("xchg", S_Zv, S_rAX), O2("xchg", S_Zv, S_rAX),
    O2("xchg", S_Zv, S_rAX),                        // 91-97
    O0("cwde"),                                     // 98 (cbw/cwde/cdqe)
    O0("cdq"),                                      // 99 (cwd/cdq/cqo)
    UND,                                            // 9A
    O0("fwait"),                                    // 9B
    OF("pushf", S_NONE, S_NONE, F_D64),             // 9C
    OF("popf",  S_NONE, S_NONE, F_D64),             // 9D
    O0("sahf"),                                     // 9E
    O0("lahf"),                                     // 9F

    // 0xA0-0xAF
    O2("mov", S_AL, S_Ob),                          // A0
    O2("mov", S_rAX, S_Ov),                         // A1
    O2("mov", S_Ob, S_AL),                          // A2
    O2("mov", S_Ov, S_rAX),                         // A3
    OF("movs", S_NONE, S_NONE, F_STRING),           // A4 (byte form)
    OF("movs", S_NONE, S_NONE, F_STRING),           // A5
    OF("cmps", S_NONE, S_NONE, F_STRING | F_STRCMP),// A6 (byte form)
    OF("cmps", S_NONE, S_NONE, F_STRING | F_STRCMP),// A7
    O2("test", S_AL, S_Ib),                         // A8
    O2("test", S_rAX, S_Iz),                        // A9
    OF("stos", S_NONE, S_NONE, F_STRING),           // AA (byte form)
    OF("stos", S_NONE, S_NONE, F_STRING),           // AB
    OF("lods", S_NONE, S_NONE, F_STRING),           // AC (byte form)
    OF("lods", S_NONE, S_NONE, F_STRING),           // AD
    OF("scas", S_NONE, S_NONE, F_STRING | F_STRCMP),// AE (byte form)
    OF("scas", S_NONE, S_NONE, F_STRING | F_STRCMP),// AF

    // 0xB0-0xBF
    O2("mov", S_Zb, S_Ib), O2("mov", S_Zb, S_Ib),
    O2("mov", S_Zb, S_Ib), O2("mov", S_Zb, S_Ib),
    O2("mov", S_Zb, S_Ib), O2("mov", S_Zb, S_Ib),
    O2("mov", S_Zb, S_Ib), O2("mov", S_Zb, S_Ib),
    O2("mov", S_Zv, S_Iv), O2("mov", S_Zv, S_Iv),
    O2("mov", S_Zv, S_Iv), O2("mov", S_Zv, S_Iv),
    O2("mov", S_Zv, S_Iv), O2("mov", S_Zv, S_Iv),
    O2("mov", S_Zv, S_Iv), O2("mov", S_Zv, S_Iv),

    // 0xC0-0xCF
    GRP(G_2, S_Eb, S_Ib, F_NONE),                   // C0
    GRP(G_2, S_Ev, S_Ib, F_NONE),                   // C1
    BR("ret", S_Iw, Flow::RETURN, F_D64),           // C2
    BR("ret", S_NONE, Flow::RETURN, F_D64),         // C3
    UND,                                            // C4 (VEX3)
    UND,                                            // C5 (VEX2)
    GRP(G_11, S_Eb, S_Ib, F_NONE),                  // C6
    GRP(G_11, S_Ev, S_Iz, F_NONE),                  // C7
    O2("enter", S_Iw, S_Ib),                        // C8
    OF("leave", S_NONE, S_NONE, F_D64),             // C9
    BR("retf", S_Iw, Flow::RETURN, F_NONE),         // CA
    BR("retf", S_NONE, Flow::RETURN, F_NONE),       // CB
    O0("int3"),                                     // CC
    O1("int", S_Ib),                                // CD
    UND,                                            // CE
    BR("iret", S_NONE, Flow::RETURN, F_NONE),       // CF

    // 0xD0-0xDF
    GRP(G_2, S_Eb, S_ONE, F_NONE),                  // D0
    GRP(G_2, S_Ev, S_ONE, F_NONE),                  // D1
    GRP(G_2, S_Eb, S_CL, F_NONE),                   // D2
    GRP(G_2, S_Ev, S_CL, F_NONE),                   // D3
    UND, UND, UND,                                  // D4 D5 D6
    O0("xlat"),                                     // D7
    UND, UND, UND, UND, UND, UND, UND, UND,         // D8-DF (x87, handled separately)

    // 0xE0-0xEF
    BR("loopne", S_Jb, Flow::COND_BRANCH, F_NONE),  // E0
    BR("loope",  S_Jb, Flow::COND_BRANCH, F_NONE),  // E1
    BR("loop",   S_Jb, Flow::COND_BRANCH, F_NONE),  // E2
    BR("jrcxz",  S_Jb, Flow::COND_BRANCH, F_NONE),  // E3
    O2("in",  S_AL, S_Ib),                          // E4
    O2("in",  S_rAX, S_Ib),                         // E5
    O2("out", S_Ib, S_AL),                          // E6
    O2("out", S_Ib, S_rAX),                         // E7
    BR("call", S_Jz, Flow::CALL, F_D64),            // E8
    BR("jmp",  S_Jz, Flow::BRANCH, F_D64),          // E9
    UND,                                            // EA
    BR("jmp",  S_Jb, Flow::BRANCH, F_D64),          // EB
    O2("in",  S_AL, S_DX),                          // EC
    O2("in",  S_rAX, S_DX),                         // ED
    O2("out", S_DX, S_AL),                          // EE
    O2("out", S_DX, S_rAX),                         // EF

    // 0xF0-0xFF
    PFX,                                            // F0 LOCK
    O0("int1"),                                     // F1
    PFX, PFX,                                       // F2 F3
    O0("hlt"),                                      // F4
    O0("cmc"),                                      // F5
    GRP(G_3, S_Eb, S_NONE, F_NONE),                 // F6
    GRP(G_3, S_Ev, S_NONE, F_NONE),                 // F7
    O0("clc"), O0("stc"), O0("cli"), O0("sti"),     // F8-FB
    O0("cld"), O0("std"),                           // FC FD
    GRP(G_4, S_Eb, S_NONE, F_NONE),                 // FE
    GRP(G_5, S_Ev, S_NONE, F_NONE),                 // FF
};

static const char *const grp1_name[8] = {
    "add", "or", "adc", "sbb", "and", "sub", "xor", "cmp",
};

static const char *const grp2_name[8] = {
    "rol", "ror", "rcl", "rcr", "shl", "shr", "sal", "sar",
};

static const char *const grp3_name[8] = {
    "test", "test", "not", "neg", "mul", "imul", "div", "idiv",
};

/* ======================================================================== */
/* Decoder state                                                             */
/* ======================================================================== */

namespace {

struct X86 {
    std::span<const uint8_t> data;
    uint64_t addr = 0;
    size_t   pos = 0;
    bool     truncated = false;
    bool     overlong = false;

    /* Prefixes */
    bool        opsize = false;
    bool        adsize = false;
    bool        lock = false;
    bool        rep = false;
    bool        repne = false;
    const char *seg = nullptr;
    uint8_t     rex = 0;

    /* ModRM */
    bool    has_modrm = false;
    uint8_t mod = 0;
    uint8_t reg = 0;          // includes REX.R
    uint8_t rm = 0;           // includes REX.B (register form)
    Operand mem;              // memory form
    bool    rip_rel = false;

    uint8_t u8() {
        if (pos >= MAX_INSN_BYTES) { overlong = true; return 0; }
        if (pos >= data.size()) { truncated = true; return 0; }
        return data[pos++];
    }
    uint16_t u16() { uint16_t lo = u8(); return (uint16_t)(lo | (u8() << 8)); }
    uint32_t u32() { uint32_t lo = u16(); return lo | ((uint32_t)u16() << 16); }
    uint64_t u64() { uint64_t lo = u32(); return lo | ((uint64_t)u32() << 32); }

    bool failed() const { return truncated || overlong; }

    bool rex_w() const { return rex & 8; }
    bool rex_r() const { return rex & 4; }
    bool rex_x() const { return rex & 2; }
    bool rex_b() const { return rex & 1; }

    unsigned opsize_bits(bool d64) const {
        if (rex_w()) return 64;
        if (opsize) return 16;
        return d64 ? 64 : 32;
    }

    const char *gpr(unsigned num, unsigned bits) const {
        switch (bits) {
        case 8:  return (rex || num >= 8) ? reg8_rex[num] : reg8_legacy[num];
        case 16: return reg16[num];
        case 32: return reg32[num];
        default: return reg64[num];
        }
    }

    void read_modrm();
    Operand rm_operand(unsigned bits, uint8_t mem_size) const;
};

void X86::read_modrm()
{
    uint8_t m = u8();
    has_modrm = true;
    mod = m >> 6;
    reg = ((m >> 3) & 7) | (rex_r() ? 8 : 0);
    uint8_t rm_low = m & 7;
    rm = rm_low | (rex_b() ? 8 : 0);
    if (mod == 3) return;

    const char *const *areg = adsize ? reg32 : reg64;
    mem = Operand();
    mem.kind = OperandKind::MEM;
    mem.segment = seg;

    bool disp32 = (mod == 2);
    if (rm_low == 4) {
        uint8_t sib = u8();
        unsigned ss = sib >> 6;
        unsigned idx = ((sib >> 3) & 7) | (rex_x() ? 8 : 0);
        unsigned base = (sib & 7) | (rex_b() ? 8 : 0);
        if (idx != 4) {
            mem.index = areg[idx];
            mem.scale = (uint8_t)(1u << ss);
        }
        if ((sib & 7) == 5 && mod == 0)
            disp32 = true;           // no base, disp32
        else
            mem.reg = areg[base];
    } else if (rm_low == 5 && mod == 0) {
        mem.reg = adsize ? "eip" : "rip";
        rip_rel = true;
        disp32 = true;
    } else {
        mem.reg = areg[rm];
    }

    if (mod == 1) {
        mem.value = (int8_t)u8();
        mem.width = 8;
    } else if (disp32) {
        mem.value = (int32_t)u32();
        mem.width = 32;
    }
}

Operand X86::rm_operand(unsigned bits, uint8_t mem_size) const
{
    if (mod == 3)
        return op_reg(gpr(rm, bits));
    Operand o = mem;
    o.size = mem_size;
    return o;
}

bool spec_needs_modrm(uint8_t s)
{
    switch (s) {
    case S_Eb: case S_Ev: case S_Ew: case S_Ed:
    case S_Gb: case S_Gv: case S_M:  case S_Sw:
        return true;
    default:
        return false;
    }
}

} // namespace

/* ======================================================================== */
/* Operand construction from specifiers                                      */
/* ======================================================================== */

static bool add_spec(X86 &x, Instruction &insn, uint8_t spec, unsigned osz,
                     uint8_t opcode)
{
    switch (spec) {
    case S_NONE:
        return true;
    case S_Eb:
        insn.operands.push_back(x.rm_operand(8, 1));
        return true;
    case S_Ev:
        insn.operands.push_back(x.rm_operand(osz, (uint8_t)(osz / 8)));
        return true;
    case S_Ew:
        insn.operands.push_back(x.rm_operand(16, 2));
        return true;
    case S_Ed:
        insn.operands.push_back(x.rm_operand(32, 4));
        return true;
    case S_Gb:
        insn.operands.push_back(op_reg(x.gpr(x.reg, 8)));
        return true;
    case S_Gv:
        insn.operands.push_back(op_reg(x.gpr(x.reg, osz)));
        return true;
    case S_M:
        if (x.mod == 3) return false;
        insn.operands.push_back(x.rm_operand(osz, 0));
        return true;
    case S_Sw: {
        const char *s = sreg_name[x.reg & 7];
        if (!s) return false;
        insn.operands.push_back(op_reg(s));
        return true;
    }
    case S_Ib:
        insn.operands.push_back(op_imm(x.u8(), 8, false));
        return true;
    case S_Ibs:
        insn.operands.push_back(op_imm((int8_t)x.u8(), 8, true));
        return true;
    case S_Iw:
        insn.operands.push_back(op_imm(x.u16(), 16, false));
        return true;
    case S_Iz:
        if (osz == 16)
            insn.operands.push_back(op_imm(x.u16(), 16, false));
        else if (osz == 64)
            insn.operands.push_back(op_imm((int32_t)x.u32(), 32, true));
        else
            insn.operands.push_back(op_imm(x.u32(), 32, false));
        return true;
    case S_Iv:
        if (osz == 16)
            insn.operands.push_back(op_imm(x.u16(), 16, false));
        else if (osz == 64)
            insn.operands.push_back(op_imm((int64_t)x.u64(), 64, false));
        else
            insn.operands.push_back(op_imm(x.u32(), 32, false));
        return true;
    case S_Jb: {
        int8_t rel = (int8_t)x.u8();
        insn.has_target = true;
        insn.target = x.addr + x.pos + (int64_t)rel;
        insn.operands.push_back(op_rel(insn.target));
        return true;
    }
    case S_Jz: {
        int32_t rel = (int32_t)x.u32();
        insn.has_target = true;
        insn.target = x.addr + x.pos + (int64_t)rel;
        insn.operands.push_back(op_rel(insn.target));
        return true;
    }
    case S_AL:
        insn.operands.push_back(op_reg("al"));
        return true;
    case S_rAX:
        insn.operands.push_back(op_reg(x.gpr(0, osz)));
        return true;
    case S_CL:
        insn.operands.push_back(op_reg("cl"));
        return true;
    case S_DX:
        insn.operands.push_back(op_reg("dx"));
        return true;
    case S_ONE:
        insn.operands.push_back(op_imm(1, 8, false, false));
        return true;
    case S_Zb:
        insn.operands.push_back(op_reg(x.gpr((opcode & 7) | (x.rex_b() ? 8 : 0), 8)));
        return true;
    case S_Zv:
        insn.operands.push_back(op_reg(x.gpr((opcode & 7) | (x.rex_b() ? 8 : 0), osz)));
        return true;
    case S_Ob:
    case S_Ov: {
        uint64_t moff = x.adsize ? x.u32() : x.u64();
        Operand o = op_mem(nullptr, (int64_t)moff, x.adsize ? 32 : 64,
                           (uint8_t)(spec == S_Ob ? 1 : osz / 8));
        o.segment = x.seg;
        insn.operands.push_back(o);
        return true;
    }
    }
    return false;
}

/* ======================================================================== */
/* x87 escape (D8-DF)                                                        */
/* ======================================================================== */

/* Memory forms: [escape - 0xD8][reg], with access size */
struct FpuMem { const char *name; uint8_t size; };

static const FpuMem fpu_mem[8][8] = {
    /* D8 */ { {"fadd",4}, {"fmul",4}, {"fcom",4}, {"fcomp",4},
               {"fsub",4}, {"fsubr",4}, {"fdiv",4}, {"fdivr",4} },
    /* D9 */ { {"fld",4}, {nullptr,0}, {"fst",4}, {"fstp",4},
               {"fldenv",0}, {"fldcw",2}, {"fnstenv",0}, {"fnstcw",2} },
    /* DA */ { {"fiadd",4}, {"fimul",4}, {"ficom",4}, {"ficomp",4},
               {"fisub",4}, {"fisubr",4}, {"fidiv",4}, {"fidivr",4} },
    /* DB */ { {"fild",4}, {"fisttp",4}, {"fist",4}, {"fistp",4},
               {nullptr,0}, {"fld",10}, {nullptr,0}, {"fstp",10} },
    /* DC */ { {"fadd",8}, {"fmul",8}, {"fcom",8}, {"fcomp",8},
               {"fsub",8}, {"fsubr",8}, {"fdiv",8}, {"fdivr",8} },
    /* DD */ { {"fld",8}, {"fisttp",8}, {"fst",8}, {"fstp",8},
               {"frstor",0}, {nullptr,0}, {"fnsave",0}, {"fnstsw",2} },
    /* DE */ { {"fiadd",2}, {"fimul",2}, {"ficom",2}, {"ficomp",2},
               {"fisub",2}, {"fisubr",2}, {"fidiv",2}, {"fidivr",2} },
    /* DF */ { {"fild",2}, {"fisttp",2}, {"fist",2}, {"fistp",2},
               {"fbld",10}, {"fild",8}, {"fbstp",10}, {"fistp",8} },
};

static const char *const fpu_d9_e0[32] = {
    "fchs", "fabs", nullptr, nullptr, "ftst", "fxam", nullptr, nullptr,
    "fld1", "fldl2t", "fldl2e", "fldpi", "fldlg2", "fldln2", "fldz", nullptr,
    "f2xm1", "fyl2x", "fptan", "fpatan", "fxtract", "fprem1", "fdecstp", "fincstp",
    "fprem", "fyl2xp1", "fsqrt", "fsincos", "frndint", "fscale", "fsin", "fcos",
};

static bool decode_x87(X86 &x, Instruction &insn, uint8_t op)
{
    x.read_modrm();
    if (x.failed()) return false;
    unsigned esc = op - 0xD8;
    unsigned r = x.reg & 7;
    unsigned i = x.rm & 7;

    if (x.mod != 3) {
        const FpuMem &f = fpu_mem[esc][r];
        if (!f.name) return false;
        insn.mnemonic = f.name;
        Operand m = x.mem;
        m.size = f.size;
        insn.operands.push_back(m);
        return true;
    }

    auto st_st = [&](const char *name) {
        insn.mnemonic = name;
        insn.operands.push_back(op_reg(st_name[0]));
        insn.operands.push_back(op_reg(st_name[i]));
        return true;
    };
    auto sti_st = [&](const char *name) {
        insn.mnemonic = name;
        insn.operands.push_back(op_reg(st_name[i]));
        insn.operands.push_back(op_reg(st_name[0]));
        return true;
    };
    auto sti = [&](const char *name) {
        insn.mnemonic = name;
        insn.operands.push_back(op_reg(st_name[i]));
        return true;
    };

    switch (esc) {
    case 0: {   /* D8 */
        static const char *const n[8] = { "fadd", "fmul", "fcom", "fcomp",
                                          "fsub", "fsubr", "fdiv", "fdivr" };
        return st_st(n[r]);
    }
    case 1:     /* D9 */
        if (r == 0) return sti("fld");
        if (r == 1) return sti("fxch");
        if (r == 2 && i == 0) { insn.mnemonic = "fnop"; return true; }
        if (r >= 4) {
            const char *n = fpu_d9_e0[(r - 4) * 8 + i];
            if (!n) return false;
            insn.mnemonic = n;
            return true;
        }
        return false;
    case 2:     /* DA */
        if (r == 0) return st_st("fcmovb");
        if (r == 1) return st_st("fcmove");
        if (r == 2) return st_st("fcmovbe");
        if (r == 3) return st_st("fcmovu");
        if (r == 5 && i == 1) { insn.mnemonic = "fucompp"; return true; }
        return false;
    case 3:     /* DB */
        if (r == 0) return st_st("fcmovnb");
        if (r == 1) return st_st("fcmovne");
        if (r == 2) return st_st("fcmovnbe");
        if (r == 3) return st_st("fcmovnu");
        if (r == 4 && i == 2) { insn.mnemonic = "fnclex"; return true; }
        if (r == 4 && i == 3) { insn.mnemonic = "fninit"; return true; }
        if (r == 5) return st_st("fucomi");
        if (r == 6) return st_st("fcomi");
        return false;
    case 4: {   /* DC */
        static const char *const n[8] = { "fadd", "fmul", nullptr, nullptr,
                                          "fsubr", "fsub", "fdivr", "fdiv" };
        if (!n[r]) return false;
        return sti_st(n[r]);
    }
    case 5:     /* DD */
        if (r == 0) return sti("ffree");
        if (r == 2) return sti("fst");
        if (r == 3) return sti("fstp");
        if (r == 4) return sti("fucom");
        if (r == 5) return sti("fucomp");
        return false;
    case 6: {   /* DE */
        if (r == 3 && i == 1) { insn.mnemonic = "fcompp"; return true; }
        static const char *const n[8] = { "faddp", "fmulp", nullptr, nullptr,
                                          "fsubrp", "fsubp", "fdivrp", "fdivp" };
        if (!n[r]) return false;
        return sti_st(n[r]);
    }
    case 7:     /* DF */
        if (r == 4 && i == 0) {
            insn.mnemonic = "fnstsw";
            insn.operands.push_back(op_reg("ax"));
            return true;
        }
        if (r == 5) return st_st("fucomip");
        if (r == 6) return st_st("fcomip");
        return false;
    }
    return false;
}

/* ======================================================================== */
/* Two-byte map (0F xx)                                                      */
/* ======================================================================== */

/* Mandatory-prefix selector for SSE instructions */
enum SsePfx { P_NONE, P_66, P_F3, P_F2 };

static SsePfx sse_prefix(const X86 &x)
{
    if (x.repne) return P_F2;
    if (x.rep) return P_F3;
    if (x.opsize) return P_66;
    return P_NONE;
}

static Operand xmm_rm(const X86 &x, uint8_t size)
{
    if (x.mod == 3)
        return op_reg(xmm_name[x.rm]);
    Operand o = x.mem;
    o.size = size;
    return o;
}

static Operand xmm_reg(const X86 &x)
{
    return op_reg(xmm_name[x.reg]);
}

/* SSE with packed/scalar single/double variants (0F 51-5F) */
static bool sse_arith(X86 &x, Instruction &insn, const char *base, bool packed_only)
{
    static const char *const suffix[4] = { "ps", "pd", "ss", "sd" };
    static const uint8_t size[4] = { 16, 16, 4, 8 };
    SsePfx p = sse_prefix(x);
    if (packed_only && (p == P_F3 || p == P_F2)) return false;
    x.read_modrm();
    if (x.failed()) return false;
    insn.mnemonic = std::string(base) + suffix[p];
    insn.operands.push_back(xmm_reg(x));
    insn.operands.push_back(xmm_rm(x, size[p]));
    return true;
}

/* 66-prefixed integer SSE with xmm, xmm/m128 operands */
static bool sse_int(X86 &x, Instruction &insn, const char *name)
{
    if (sse_prefix(x) != P_66) return false;
    x.read_modrm();
    if (x.failed()) return false;
    insn.mnemonic = name;
    insn.operands.push_back(xmm_reg(x));
    insn.operands.push_back(xmm_rm(x, 16));
    return true;
}

static bool decode_0f(X86 &x, Instruction &insn)
{
    uint8_t op = x.u8();
    if (x.failed()) return false;
    SsePfx pfx = sse_prefix(x);

    /* jcc rel32 */
    if (op >= 0x80 && op <= 0x8F) {
        insn.mnemonic = jcc_name[op & 0xF];
        insn.flow = Flow::COND_BRANCH;
        return add_spec(x, insn, S_Jz, 64, op);
    }
    /* setcc r/m8 */
    if (op >= 0x90 && op <= 0x9F) {
        x.read_modrm();
        insn.mnemonic = setcc_name[op & 0xF];
        return add_spec(x, insn, S_Eb, 8, op);
    }
    /* cmovcc */
    if (op >= 0x40 && op <= 0x4F) {
        x.read_modrm();
        unsigned osz = x.opsize_bits(false);
        insn.mnemonic = cmovcc_name[op & 0xF];
        return add_spec(x, insn, S_Gv, osz, op) && add_spec(x, insn, S_Ev, osz, op);
    }
    /* bswap */
    if (op >= 0xC8 && op <= 0xCF) {
        unsigned osz = x.rex_w() ? 64 : 32;
        insn.mnemonic = "bswap";
        return add_spec(x, insn, S_Zv, osz, op);
    }

    unsigned osz = x.opsize_bits(false);

    switch (op) {
    case 0x05: insn.mnemonic = "syscall"; return true;
    case 0x06: insn.mnemonic = "clts";    return true;
    case 0x07: insn.mnemonic = "sysret";  insn.flow = Flow::RETURN; return true;
    case 0x08: insn.mnemonic = "invd";    return true;
    case 0x09: insn.mnemonic = "wbinvd";  return true;
    case 0x0B: insn.mnemonic = "ud2";     return true;
    case 0x30: insn.mnemonic = "wrmsr";   return true;
    case 0x31: insn.mnemonic = "rdtsc";   return true;
    case 0x32: insn.mnemonic = "rdmsr";   return true;
    case 0x33: insn.mnemonic = "rdpmc";   return true;
    case 0x34: insn.mnemonic = "sysenter"; return true;
    case 0x35: insn.mnemonic = "sysexit"; insn.flow = Flow::RETURN; return true;
    case 0xA2: insn.mnemonic = "cpuid";   return true;

    case 0x00: {    /* group 6 */
        static const char *const n[8] = { "sldt", "str", "lldt", "ltr",
                                          "verr", "verw", nullptr, nullptr };
        x.read_modrm();
        if (!n[x.reg & 7]) return false;
        insn.mnemonic = n[x.reg & 7];
        return add_spec(x, insn, S_Ew, 16, op);
    }
    case 0x01: {    /* group 7 */
        x.read_modrm();
        if (x.failed()) return false;
        if (x.mod == 3) {
            uint8_t modrm = (uint8_t)(0xC0 | ((x.reg & 7) << 3) | (x.rm & 7));
            switch (modrm) {
            case 0xC8: insn.mnemonic = "monitor"; return true;
            case 0xC9: insn.mnemonic = "mwait";   return true;
            case 0xCA: insn.mnemonic = "clac";    return true;
            case 0xCB: insn.mnemonic = "stac";    return true;
            case 0xD0: insn.mnemonic = "xgetbv";  return true;
            case 0xD1: insn.mnemonic = "xsetbv";  return true;
            case 0xF8: insn.mnemonic = "swapgs";  return true;
            case 0xF9: insn.mnemonic = "rdtscp";  return true;
            default:   return false;
            }
        }
        static const char *const n[8] = { "sgdt", "sidt", "lgdt", "lidt",
                                          "smsw", nullptr, "lmsw", "invlpg" };
        if (!n[x.reg & 7]) return false;
        insn.mnemonic = n[x.reg & 7];
        insn.operands.push_back(x.rm_operand(64, 0));
        return true;
    }

    case 0x0D:      /* prefetch (3DNow! hint space) */
    case 0x18:      /* prefetch group 16 */
    case 0x19: case 0x1A: case 0x1B: case 0x1C: case 0x1D: case 0x1F: {
        x.read_modrm();
        if (x.failed()) return false;
        if (op == 0x18 && x.mod != 3 && (x.reg & 7) < 4) {
            static const char *const n[4] = { "prefetchnta", "prefetcht0",
                                              "prefetcht1", "prefetcht2" };
            insn.mnemonic = n[x.reg & 7];
            insn.operands.push_back(x.rm_operand(64, 1));
            return true;
        }
        if (op == 0x0D) {
            insn.mnemonic = (x.reg & 7) == 1 ? "prefetchw" : "prefetch";
            insn.operands.push_back(x.rm_operand(64, 1));
            return true;
        }
        insn.mnemonic = "nop";
        return add_spec(x, insn, S_Ev, osz, op);
    }
    case 0x1E: {
        x.read_modrm();
        if (x.failed()) return false;
        if (pfx == P_F3 && x.mod == 3 && (x.reg & 7) == 7 && (x.rm & 7) == 2) {
            insn.mnemonic = "endbr64";
            return true;
        }
        if (pfx == P_F3 && x.mod == 3 && (x.reg & 7) == 7 && (x.rm & 7) == 3) {
            insn.mnemonic = "endbr32";
            return true;
        }
        insn.mnemonic = "nop";
        return add_spec(x, insn, S_Ev, osz, op);
    }

    case 0x10:
    case 0x11: {
        static const char *const n[4] = { "movups", "movupd", "movss", "movsd" };
        static const uint8_t size[4] = { 16, 16, 4, 8 };
        x.read_modrm();
        if (x.failed()) return false;
        insn.mnemonic = n[pfx];
        if (op == 0x10) {
            insn.operands.push_back(xmm_reg(x));
            insn.operands.push_back(xmm_rm(x, size[pfx]));
        } else {
            insn.operands.push_back(xmm_rm(x, size[pfx]));
            insn.operands.push_back(xmm_reg(x));
        }
        return true;
    }
    case 0x14: return sse_arith(x, insn, "unpckl", true);
    case 0x15: return sse_arith(x, insn, "unpckh", true);
    case 0x28:
    case 0x29: {
        if (pfx == P_F3 || pfx == P_F2) return false;
        x.read_modrm();
        if (x.failed()) return false;
        insn.mnemonic = pfx == P_66 ? "movapd" : "movaps";
        if (op == 0x28) {
            insn.operands.push_back(xmm_reg(x));
            insn.operands.push_back(xmm_rm(x, 16));
        } else {
            insn.operands.push_back(xmm_rm(x, 16));
            insn.operands.push_back(xmm_reg(x));
        }
        return true;
    }
    case 0x2A: {    /* cvtsi2ss / cvtsi2sd */
        if (pfx != P_F3 && pfx != P_F2) return false;
        x.read_modrm();
        if (x.failed()) return false;
        unsigned isz = x.rex_w() ? 64 : 32;
        insn.mnemonic = pfx == P_F3 ? "cvtsi2ss" : "cvtsi2sd";
        insn.operands.push_back(xmm_reg(x));
        insn.operands.push_back(x.rm_operand(isz, (uint8_t)(isz / 8)));
        return true;
    }
    case 0x2C:
    case 0x2D: {    /* cvt(t)ss2si / cvt(t)sd2si */
        if (pfx != P_F3 && pfx != P_F2) return false;
        x.read_modrm();
        if (x.failed()) return false;
        unsigned isz = x.rex_w() ? 64 : 32;
        if (op == 0x2C)
            insn.mnemonic = pfx == P_F3 ? "cvttss2si" : "cvttsd2si";
        else
            insn.mnemonic = pfx == P_F3 ? "cvtss2si" : "cvtsd2si";
        insn.operands.push_back(op_reg(x.gpr(x.reg, isz)));
        insn.operands.push_back(xmm_rm(x, pfx == P_F3 ? 4 : 8));
        return true;
    }
    case 0x2E:
    case 0x2F: {
        if (pfx == P_F3 || pfx == P_F2) return false;
        x.read_modrm();
        if (x.failed()) return false;
        const char *base = op == 0x2E ? "ucomis" : "comis";
        insn.mnemonic = std::string(base) + (pfx == P_66 ? "d" : "s");
        insn.operands.push_back(xmm_reg(x));
        insn.operands.push_back(xmm_rm(x, pfx == P_66 ? 8 : 4));
        return true;
    }
    case 0x51: return sse_arith(x, insn, "sqrt", false);
    case 0x54: return sse_arith(x, insn, "and", true);
    case 0x55: return sse_arith(x, insn, "andn", true);
    case 0x56: return sse_arith(x, insn, "or", true);
    case 0x57: return sse_arith(x, insn, "xor", true);
    case 0x58: return sse_arith(x, insn, "add", false);
    case 0x59: return sse_arith(x, insn, "mul", false);
    case 0x5A: {
        static const char *const n[4] = { "cvtps2pd", "cvtpd2ps", "cvtss2sd", "cvtsd2ss" };
        static const uint8_t size[4] = { 8, 16, 4, 8 };
        x.read_modrm();
        if (x.failed()) return false;
        insn.mnemonic = n[pfx];
        insn.operands.push_back(xmm_reg(x));
        insn.operands.push_back(xmm_rm(x, size[pfx]));
        return true;
    }
    case 0x5C: return sse_arith(x, insn, "sub", false);
    case 0x5D: return sse_arith(x, insn, "min", false);
    case 0x5E: return sse_arith(x, insn, "div", false);
    case 0x5F: return sse_arith(x, insn, "max", false);

    case 0x60: return sse_int(x, insn, "punpcklbw");
    case 0x61: return sse_int(x, insn, "punpcklwd");
    case 0x62: return sse_int(x, insn, "punpckldq");
    case 0x6C: return sse_int(x, insn, "punpcklqdq");
    case 0x6D: return sse_int(x, insn, "punpckhqdq");
    case 0x74: return sse_int(x, insn, "pcmpeqb");
    case 0x75: return sse_int(x, insn, "pcmpeqw");
    case 0x76: return sse_int(x, insn, "pcmpeqd");
    case 0xD4: return sse_int(x, insn, "paddq");
    case 0xDB: return sse_int(x, insn, "pand");
    case 0xDF: return sse_int(x, insn, "pandn");
    case 0xEB: return sse_int(x, insn, "por");
    case 0xEF: return sse_int(x, insn, "pxor");
    case 0xFA: return sse_int(x, insn, "psubd");
    case 0xFB: return sse_int(x, insn, "psubq");
    case 0xFE: return sse_int(x, insn, "paddd");

    case 0x6E: {    /* movd/movq xmm, r/m32/64 */
        if (pfx != P_66) return false;
        x.read_modrm();
        if (x.failed()) return false;
        unsigned isz = x.rex_w() ? 64 : 32;
        insn.mnemonic = x.rex_w() ? "movq" : "movd";
        insn.operands.push_back(xmm_reg(x));
        insn.operands.push_back(x.rm_operand(isz, (uint8_t)(isz / 8)));
        return true;
    }
    case 0x7E: {
        x.read_modrm();
        if (x.failed()) return false;
        if (pfx == P_66) {      /* movd/movq r/m, xmm */
            unsigned isz = x.rex_w() ? 64 : 32;
            insn.mnemonic = x.rex_w() ? "movq" : "movd";
            insn.operands.push_back(x.rm_operand(isz, (uint8_t)(isz / 8)));
            insn.operands.push_back(xmm_reg(x));
            return true;
        }
        if (pfx == P_F3) {      /* movq xmm, xmm/m64 */
            insn.mnemonic = "movq";
            insn.operands.push_back(xmm_reg(x));
            insn.operands.push_back(xmm_rm(x, 8));
            return true;
        }
        return false;
    }
    case 0x6F:
    case 0x7F: {
        if (pfx != P_66 && pfx != P_F3) return false;
        x.read_modrm();
        if (x.failed()) return false;
        insn.mnemonic = pfx == P_66 ? "movdqa" : "movdqu";
        if (op == 0x6F) {
            insn.operands.push_back(xmm_reg(x));
            insn.operands.push_back(xmm_rm(x, 16));
        } else {
            insn.operands.push_back(xmm_rm(x, 16));
            insn.operands.push_back(xmm_reg(x));
        }
        return true;
    }
    case 0x70: {
        if (pfx != P_66) return false;
        x.read_modrm();
        insn.mnemonic = "pshufd";
        insn.operands.push_back(xmm_reg(x));
        insn.operands.push_back(xmm_rm(x, 16));
        return add_spec(x, insn, S_Ib, 8, op);
    }
    case 0xC6: {
        if (pfx == P_F3 || pfx == P_F2) return false;
        x.read_modrm();
        insn.mnemonic = pfx == P_66 ? "shufpd" : "shufps";
        insn.operands.push_back(xmm_reg(x));
        insn.operands.push_back(xmm_rm(x, 16));
        return add_spec(x, insn, S_Ib, 8, op);
    }
    case 0xD6: {
        if (pfx != P_66) return false;
        x.read_modrm();
        if (x.failed()) return false;
        insn.mnemonic = "movq";
        insn.operands.push_back(xmm_rm(x, 8));
        insn.operands.push_back(xmm_reg(x));
        return true;
    }
    case 0xD7: {
        if (pfx != P_66) return false;
        x.read_modrm();
        if (x.failed() || x.mod != 3) return false;
        insn.mnemonic = "pmovmskb";
        insn.operands.push_back(op_reg(x.gpr(x.reg, 32)));
        insn.operands.push_back(op_reg(xmm_name[x.rm]));
        return true;
    }

    case 0xA0: insn.mnemonic = "push"; insn.operands.push_back(op_reg("fs")); return true;
    case 0xA1: insn.mnemonic = "pop";  insn.operands.push_back(op_reg("fs")); return true;
    case 0xA8: insn.mnemonic = "push"; insn.operands.push_back(op_reg("gs")); return true;
    case 0xA9: insn.mnemonic = "pop";  insn.operands.push_back(op_reg("gs")); return true;

    case 0xA3: case 0xAB: case 0xB3: case 0xBB: {
        static const char *const n[4] = { "bt", "bts", "btr", "btc" };
        unsigned k = op == 0xA3 ? 0 : op == 0xAB ? 1 : op == 0xB3 ? 2 : 3;
        x.read_modrm();
        insn.mnemonic = n[k];
        return add_spec(x, insn, S_Ev, osz, op) && add_spec(x, insn, S_Gv, osz, op);
    }
    case 0xA4: case 0xAC:
        x.read_modrm();
        insn.mnemonic = op == 0xA4 ? "shld" : "shrd";
        return add_spec(x, insn, S_Ev, osz, op) && add_spec(x, insn, S_Gv, osz, op)
            && add_spec(x, insn, S_Ib, osz, op);
    case 0xA5: case 0xAD:
        x.read_modrm();
        insn.mnemonic = op == 0xA5 ? "shld" : "shrd";
        return add_spec(x, insn, S_Ev, osz, op) && add_spec(x, insn, S_Gv, osz, op)
            && add_spec(x, insn, S_CL, osz, op);
    case 0xAE: {    /* group 15 */
        x.read_modrm();
        if (x.failed()) return false;
        if (x.mod == 3) {
            switch (x.reg & 7) {
            case 5: insn.mnemonic = "lfence"; return true;
            case 6: insn.mnemonic = "mfence"; return true;
            case 7: insn.mnemonic = "sfence"; return true;
            default: return false;
            }
        }
        static const char *const n[8] = { "fxsave", "fxrstor", "ldmxcsr", "stmxcsr",
                                          "xsave", "xrstor", "xsaveopt", "clflush" };
        static const uint8_t size[8] = { 0, 0, 4, 4, 0, 0, 0, 1 };
        insn.mnemonic = n[x.reg & 7];
        insn.operands.push_back(x.rm_operand(64, size[x.reg & 7]));
        return true;
    }
    case 0xAF:
        x.read_modrm();
        insn.mnemonic = "imul";
        return add_spec(x, insn, S_Gv, osz, op) && add_spec(x, insn, S_Ev, osz, op);
    case 0xB0: case 0xB1:
        x.read_modrm();
        insn.mnemonic = "cmpxchg";
        if (op == 0xB0)
            return add_spec(x, insn, S_Eb, 8, op) && add_spec(x, insn, S_Gb, 8, op);
        return add_spec(x, insn, S_Ev, osz, op) && add_spec(x, insn, S_Gv, osz, op);
    case 0xB6: case 0xB7: case 0xBE: case 0xBF:
        x.read_modrm();
        insn.mnemonic = (op == 0xB6 || op == 0xB7) ? "movzx" : "movsx";
        return add_spec(x, insn, S_Gv, osz, op)
            && add_spec(x, insn, (op & 1) ? S_Ew : S_Eb, osz, op);
    case 0xB8:
        if (pfx != P_F3) return false;
        x.read_modrm();
        insn.mnemonic = "popcnt";
        return add_spec(x, insn, S_Gv, osz, op) && add_spec(x, insn, S_Ev, osz, op);
    case 0xBA: {    /* group 8 */
        static const char *const n[8] = { nullptr, nullptr, nullptr, nullptr,
                                          "bt", "bts", "btr", "btc" };
        x.read_modrm();
        if (!n[x.reg & 7]) return false;
        insn.mnemonic = n[x.reg & 7];
        return add_spec(x, insn, S_Ev, osz, op) && add_spec(x, insn, S_Ib, osz, op);
    }
    case 0xBC: case 0xBD:
        x.read_modrm();
        if (pfx == P_F3)
            insn.mnemonic = op == 0xBC ? "tzcnt" : "lzcnt";
        else
            insn.mnemonic = op == 0xBC ? "bsf" : "bsr";
        return add_spec(x, insn, S_Gv, osz, op) && add_spec(x, insn, S_Ev, osz, op);
    case 0xC0: case 0xC1:
        x.read_modrm();
        insn.mnemonic = "xadd";
        if (op == 0xC0)
            return add_spec(x, insn, S_Eb, 8, op) && add_spec(x, insn, S_Gb, 8, op);
        return add_spec(x, insn, S_Ev, osz, op) && add_spec(x, insn, S_Gv, osz, op);
    case 0xC7: {    /* group 9 */
        x.read_modrm();
        if (x.failed()) return false;
        if (x.mod != 3 && (x.reg & 7) == 1) {
            insn.mnemonic = x.rex_w() ? "cmpxchg16b" : "cmpxchg8b";
            insn.operands.push_back(x.rm_operand(64, x.rex_w() ? 16 : 8));
            return true;
        }
        if (x.mod == 3 && (x.reg & 7) == 6) {
            insn.mnemonic = "rdrand";
            insn.operands.push_back(op_reg(x.gpr(x.rm, osz)));
            return true;
        }
        if (x.mod == 3 && (x.reg & 7) == 7) {
            insn.mnemonic = "rdseed";
            insn.operands.push_back(op_reg(x.gpr(x.rm, osz)));
            return true;
        }
        return false;
    }
    default:
        return false;
    }
}

/* ======================================================================== */
/* Group opcodes                                                             */
/* ======================================================================== */

static bool decode_group(X86 &x, Instruction &insn, const OpEntry &e,
                         uint8_t op)
{
    x.read_modrm();
    if (x.failed()) return false;
    unsigned r = x.reg & 7;
    bool d64 = e.flags & F_D64;
    unsigned osz = (e.a == S_Eb) ? 8 : x.opsize_bits(d64);

    switch (e.group) {
    case G_1:
        insn.mnemonic = grp1_name[r];
        return add_spec(x, insn, e.a, osz, op) && add_spec(x, insn, e.b, osz, op);
    case G_1A:
        if (r != 0) return false;
        insn.mnemonic = "pop";
        return add_spec(x, insn, S_Ev, x.opsize_bits(true), op);
    case G_2:
        insn.mnemonic = grp2_name[r];
        return add_spec(x, insn, e.a, osz, op) && add_spec(x, insn, e.b, osz, op);
    case G_3:
        insn.mnemonic = grp3_name[r];
        if (!add_spec(x, insn, e.a, osz, op)) return false;
        if (r < 2)
            return add_spec(x, insn, e.a == S_Eb ? S_Ib : S_Iz, osz, op);
        return true;
    case G_4:
        if (r > 1) return false;
        insn.mnemonic = r == 0 ? "inc" : "dec";
        return add_spec(x, insn, S_Eb, 8, op);
    case G_5:
        switch (r) {
        case 0:
        case 1:
            insn.mnemonic = r == 0 ? "inc" : "dec";
            return add_spec(x, insn, S_Ev, x.opsize_bits(false), op);
        case 2:
            insn.mnemonic = "call";
            insn.flow = Flow::INDIRECT;
            return add_spec(x, insn, S_Ev, x.opsize_bits(true), op);
        case 3:
        case 5:
            if (x.mod == 3) return false;
            insn.mnemonic = r == 3 ? "call" : "jmp";
            insn.flow = Flow::INDIRECT;
            {
                Operand m = x.mem;
                m.size = (uint8_t)(x.rex_w() ? 10 : x.opsize ? 4 : 6);
                insn.operands.push_back(m);
            }
            return true;
        case 4:
            insn.mnemonic = "jmp";
            insn.flow = Flow::INDIRECT;
            return add_spec(x, insn, S_Ev, x.opsize_bits(true), op);
        case 6:
            insn.mnemonic = "push";
            return add_spec(x, insn, S_Ev, x.opsize_bits(true), op);
        default:
            return false;
        }
    case G_11:
        if (r != 0) return false;
        insn.mnemonic = "mov";
        return add_spec(x, insn, e.a, osz, op) && add_spec(x, insn, e.b, osz, op);
    }
    return false;
}

/* ======================================================================== */
/* Size-dependent mnemonics                                                  */
/* ======================================================================== */

static const char *sized_name(uint8_t op, unsigned osz)
{
    switch (op) {
    case 0x98: return osz == 16 ? "cbw" : osz == 64 ? "cdqe" : "cwde";
    case 0x99: return osz == 16 ? "cwd" : osz == 64 ? "cqo" : "cdq";
    case 0x9C: return osz == 16 ? "pushf" : "pushfq";
    case 0x9D: return osz == 16 ? "popf" : "popfq";
    case 0xCF: return osz == 16 ? "iret" : osz == 64 ? "iretq" : "iretd";
    default:   return nullptr;
    }
}

static std::string string_name(const char *base, uint8_t op, unsigned osz)
{
    char sfx = 'b';
    if (op & 1)
        sfx = osz == 16 ? 'w' : osz == 64 ? 'q' : 'd';
    return std::string(base) + sfx;
}

/* ======================================================================== */
/* Main decoder                                                              */
/* ======================================================================== */

Instruction dec_x86_64(std::span<const uint8_t> data, uint64_t addr,
                       uint32_t /*flags*/)
{
    X86 x;
    x.data = data;
    x.addr = addr;

    Instruction insn;

    /* Prefixes.  REX only counts when it immediately precedes the opcode. */
    uint8_t op = 0;
    for (;;) {
        op = x.u8();
        if (x.failed())
            return make_invalid(data, addr, (unsigned)(x.overlong ? MAX_INSN_BYTES : x.pos));
        if (op >= 0x40 && op <= 0x4F) {
            x.rex = op;
            continue;
        }
        bool legacy = true;
        switch (op) {
        case 0x66: x.opsize = true; break;
        case 0x67: x.adsize = true; break;
        case 0xF0: x.lock = true; break;
        case 0xF2: x.repne = true; x.rep = false; break;
        case 0xF3: x.rep = true; x.repne = false; break;
        case 0x2E: x.seg = "cs"; break;
        case 0x36: x.seg = "ss"; break;
        case 0x3E: x.seg = "ds"; break;
        case 0x26: x.seg = "es"; break;
        case 0x64: x.seg = "fs"; break;
        case 0x65: x.seg = "gs"; break;
        default: legacy = false; break;
        }
        if (!legacy) break;
        x.rex = 0;      // REX followed by a legacy prefix is ignored
    }

    bool ok = false;
    bool string_op = false;
    bool string_cmp = false;

    if (op == 0x0F) {
        ok = decode_0f(x, insn);
    } else if (op >= 0xD8 && op <= 0xDF) {
        ok = decode_x87(x, insn, op);
    } else {
        const OpEntry &e = one_byte[op];
        if (e.flags & F_GROUP) {
            ok = decode_group(x, insn, e, op);
        } else if (e.mnem) {
            bool d64 = e.flags & F_D64;
            unsigned osz = x.opsize_bits(d64);

            insn.mnemonic = e.mnem;
            insn.flow = e.flow;

            if (op >= 0x70 && op <= 0x7F)
                insn.mnemonic = jcc_name[op & 0xF];
            if (const char *n = sized_name(op, osz))
                insn.mnemonic = n;
            if (e.flags & F_STRING) {
                insn.mnemonic = string_name(e.mnem, op, x.opsize_bits(false));
                string_op = true;
                string_cmp = e.flags & F_STRCMP;
            }
            if (op == 0x90) {
                if (x.rex_b()) {
                    insn.mnemonic = "xchg";
                    insn.operands.push_back(op_reg(x.gpr(8, x.opsize_bits(false))));
                    insn.operands.push_back(op_reg(x.gpr(0, x.opsize_bits(false))));
                } else if (x.rep) {
                    insn.mnemonic = "pause";
                }
            }
            if (op == 0x63 && !x.rex_w())
                osz = 32;

            if (spec_needs_modrm(e.a) || spec_needs_modrm(e.b) || spec_needs_modrm(e.c))
                x.read_modrm();

            ok = !x.failed()
              && add_spec(x, insn, e.a, osz, op)
              && add_spec(x, insn, e.b, osz, op)
              && add_spec(x, insn, e.c, osz, op);
        }
    }

    if (x.overlong)
        return make_invalid(data, addr, MAX_INSN_BYTES);
    if (x.truncated)
        return make_invalid(data, addr, (unsigned)data.size());
    if (!ok)
        return make_invalid(data, addr, (unsigned)x.pos);

    /* Prefix mnemonics */
    if (string_op && (x.rep || x.repne)) {
        const char *p = string_cmp ? (x.rep ? "repe " : "repne ") : "rep ";
        insn.mnemonic = p + insn.mnemonic;
    }
    if (x.lock)
        insn.mnemonic = "lock " + insn.mnemonic;

    /* RIP-relative operands resolve against the end of the instruction */
    for (auto &o : insn.operands) {
        if (o.kind == OperandKind::MEM && x.rip_rel &&
            o.reg && (strcmp(o.reg, "rip") == 0 || strcmp(o.reg, "eip") == 0)) {
            o.flags |= OPF_PCREL;
            o.target = addr + x.pos + o.value;
        }
    }

    insn.address = addr;
    insn.length = (uint8_t)x.pos;
    std::memcpy(insn.bytes.data(), data.data(), x.pos);
    return insn;
}

} // namespace arch
