/*
 * tokens.cpp: Instruction tokenizer
 */

#include "tokens.hpp"

#include <cinttypes>
#include <cstdio>

namespace tokens {

using arch::Machine;
using arch::MemMode;
using arch::Operand;
using arch::OperandKind;

/* ======================================================================== */
/* Syntax selection                                                          */
/* ======================================================================== */

namespace {

enum class Style { INTEL, ARM, A64, RISCV, MIPS };

Style style_for(Machine m)
{
    switch (m) {
    case Machine::ARM:     return Style::ARM;
    case Machine::AARCH64: return Style::A64;
    case Machine::RISCV64: return Style::RISCV;
    case Machine::MIPS:    return Style::MIPS;
    default:               return Style::INTEL;
    }
}

bool is_arm(Style s) { return s == Style::ARM || s == Style::A64; }

std::string hex(uint64_t v)
{
    char buf[24];
    snprintf(buf, sizeof(buf), "0x%" PRIx64, v);
    return buf;
}

std::string dec(uint64_t v)
{
    char buf[24];
    snprintf(buf, sizeof(buf), "%" PRIu64, v);
    return buf;
}

/* Signed-aware number text without any syntax prefix */
std::string number(int64_t value, bool is_signed, bool as_hex)
{
    if (is_signed && value < 0) {
        uint64_t mag = 0 - (uint64_t)value;
        return "-" + (as_hex ? hex(mag) : dec(mag));
    }
    return as_hex ? hex((uint64_t)value) : dec((uint64_t)value);
}

class Builder {
public:
    Builder(const arch::Arch &a, const Resolver *r)
        : arch_(a), style_(style_for(a.machine)), resolver_(r) {}

    void add(Kind kind, std::string text)
    {
        Token t;
        t.kind = kind;
        t.text = std::move(text);
        out_.push_back(std::move(t));
    }

    void delim(const char *text) { add(Kind::DELIMITER, text); }

    void operand(const Operand &op);
    void comments(const arch::Instruction &insn);

    std::vector<Token> take() { return std::move(out_); }

private:
    void reg(const Operand &op);
    void imm(const Operand &op);
    void mem(const Operand &op);
    void mem_intel(const Operand &op);
    void mem_arm(const Operand &op);
    void mem_paren(const Operand &op);
    void shift_suffix(const char *shift, uint8_t amount, const char *shift_reg,
                      bool extend_only);

    const arch::Arch &arch_;
    Style style_;
    const Resolver *resolver_;
    std::vector<Token> out_;
};

void Builder::shift_suffix(const char *shift, uint8_t amount,
                           const char *shift_reg, bool extend_only)
{
    if (!shift) return;
    delim(", ");
    add(Kind::MNEMONIC, shift);
    if (shift_reg) {
        delim(" ");
        add(Kind::REGISTER, shift_reg);
    } else if (amount || !extend_only) {
        if (std::string(shift) == "rrx") return;
        delim(" #");
        add(Kind::IMMEDIATE, dec(amount));
    }
}

void Builder::reg(const Operand &op)
{
    if (op.flags & arch::OPF_LIST_FIRST) delim("{");
    add(Kind::REGISTER, op.reg ? op.reg : "?");
    if (op.flags & arch::OPF_WRITEBACK) delim("!");
    if (op.shift) {
        std::string s = op.shift;
        bool extend = s.size() == 4 && (s[0] == 'u' || s[0] == 's') && s[1] == 'x';
        shift_suffix(op.shift, op.shift_amount, op.shift_reg, extend);
    }
    if (op.flags & arch::OPF_LIST_LAST) delim("}");
}

void Builder::imm(const Operand &op)
{
    std::string text = number(op.value, op.is_signed, op.flags & arch::OPF_HEX);
    if (is_arm(style_)) delim("#");
    add(Kind::IMMEDIATE, text);
    if (op.shift) {
        delim(", ");
        add(Kind::MNEMONIC, op.shift);
        delim(" #");
        add(Kind::IMMEDIATE, dec(op.shift_amount));
    }
}

void Builder::mem_intel(const Operand &op)
{
    const char *size = nullptr;
    switch (op.size) {
    case 1:  size = "byte";    break;
    case 2:  size = "word";    break;
    case 4:  size = "dword";   break;
    case 6:  size = "fword";   break;
    case 8:  size = "qword";   break;
    case 10: size = "tbyte";   break;
    case 16: size = "xmmword"; break;
    default: break;
    }
    if (size) {
        add(Kind::MNEMONIC, size);
        delim(" ptr ");
    }
    if (op.segment) {
        add(Kind::REGISTER, op.segment);
        delim(":");
    }
    delim("[");
    bool any = false;
    if (op.reg) {
        add(Kind::REGISTER, op.reg);
        any = true;
    }
    if (op.index) {
        if (any) delim(" + ");
        add(Kind::REGISTER, op.index);
        delim("*");
        add(Kind::IMMEDIATE, dec(op.scale));
        any = true;
    }
    if (!any) {
        add(Kind::IMMEDIATE, hex((uint64_t)op.value));
    } else if (op.width) {
        bool neg = op.value < 0;
        delim(neg ? " - " : " + ");
        add(Kind::IMMEDIATE, hex(neg ? 0 - (uint64_t)op.value : (uint64_t)op.value));
    }
    delim("]");
}

void Builder::mem_arm(const Operand &op)
{
    /* AArch64 literal: the address itself */
    if (!op.reg && (op.flags & arch::OPF_PCREL)) {
        out_.push_back(reference(arch_, op.target, resolver_));
        return;
    }

    delim("[");
    add(Kind::REGISTER, op.reg ? op.reg : "?");

    auto offset = [&] {
        if (op.index) {
            delim(", ");
            if (op.flags & arch::OPF_NEGATE) delim("-");
            add(Kind::REGISTER, op.index);
            if (op.shift) {
                std::string s = op.shift;
                bool extend = s != "lsl" && s != "lsr" && s != "asr" && s != "ror";
                shift_suffix(op.shift, op.shift_amount, nullptr, extend);
            }
        } else if (op.value != 0 || op.mode == MemMode::POST_INDEX) {
            delim(", #");
            add(Kind::IMMEDIATE, number(op.value, true, false));
        }
    };

    switch (op.mode) {
    case MemMode::OFFSET:
        offset();
        delim("]");
        break;
    case MemMode::PRE_INDEX:
        offset();
        delim("]!");
        break;
    case MemMode::POST_INDEX:
        delim("]");
        offset();
        break;
    }
}

void Builder::mem_paren(const Operand &op)
{
    if (op.width)
        add(Kind::IMMEDIATE, number(op.value, true, false));
    delim("(");
    add(Kind::REGISTER, op.reg ? op.reg : "?");
    delim(")");
}

void Builder::mem(const Operand &op)
{
    switch (style_) {
    case Style::INTEL: mem_intel(op); break;
    case Style::ARM:
    case Style::A64:   mem_arm(op);   break;
    default:           mem_paren(op); break;
    }
}

void Builder::operand(const Operand &op)
{
    switch (op.kind) {
    case OperandKind::REG: reg(op); break;
    case OperandKind::IMM: imm(op); break;
    case OperandKind::MEM: mem(op); break;
    case OperandKind::REL:
        out_.push_back(reference(arch_, op.target, resolver_));
        break;
    }
}

/* Trailing "; target" for PC-relative memory operands with a base register */
void Builder::comments(const arch::Instruction &insn)
{
    for (auto &op : insn.operands) {
        if (op.kind != OperandKind::MEM || !(op.flags & arch::OPF_PCREL) || !op.reg)
            continue;
        delim("  ");
        add(Kind::COMMENT, "; ");
        out_.push_back(reference(arch_, op.target, resolver_));
        break;
    }
}

} // namespace

/* ======================================================================== */
/* Public API                                                                */
/* ======================================================================== */

Token reference(const arch::Arch & /*arch*/, uint64_t addr,
                const Resolver *resolver)
{
    Token t;
    t.has_target = true;
    t.target = addr;

    if (resolver && resolver->symbol_at) {
        if (const char *s = resolver->symbol_at(resolver->ctx, addr)) {
            t.kind = Kind::SYMBOL;
            t.text = s;
            return t;
        }
    }
    t.text = hex(addr);
    if (resolver && resolver->is_instruction &&
        resolver->is_instruction(resolver->ctx, addr))
        t.kind = Kind::ADDRESS;
    else
        t.kind = Kind::UNRESOLVED;
    return t;
}

std::vector<Token> tokenize(const arch::Arch &arch,
                            const arch::Instruction &insn,
                            const Resolver *resolver)
{
    Builder b(arch, resolver);

    if (insn.is_error) {
        b.add(Kind::INVALID, "??");
        return b.take();
    }

    b.add(Kind::MNEMONIC, insn.mnemonic);
    for (size_t i = 0; i < insn.operands.size(); i++) {
        const Operand &op = insn.operands[i];
        b.delim(i == 0 ? " " : ", ");
        b.operand(op);
    }
    b.comments(insn);
    return b.take();
}

std::string format_address(uint64_t addr, unsigned digits)
{
    char buf[24];
    snprintf(buf, sizeof(buf), "%0*" PRIx64, (int)digits, addr);
    return buf;
}

std::string format_bytes(const arch::Instruction &insn)
{
    std::string s;
    char buf[4];
    for (unsigned i = 0; i < insn.length && i < insn.bytes.size(); i++) {
        snprintf(buf, sizeof(buf), i ? " %02x" : "%02x", insn.bytes[i]);
        s += buf;
    }
    return s;
}

std::string to_text(const std::vector<Token> &toks)
{
    std::string s;
    for (auto &t : toks)
        s += t.text;
    return s;
}

const char *kind_name(Kind kind)
{
    switch (kind) {
    case Kind::ADDRESS:    return "address";
    case Kind::BYTES:      return "bytes";
    case Kind::MNEMONIC:   return "mnemonic";
    case Kind::REGISTER:   return "register";
    case Kind::IMMEDIATE:  return "immediate";
    case Kind::SYMBOL:     return "symbol";
    case Kind::DELIMITER:  return "delimiter";
    case Kind::INVALID:    return "invalid";
    case Kind::LABEL:      return "label";
    case Kind::COMMENT:    return "comment";
    case Kind::UNRESOLVED: return "unresolved";
    }
    return "delimiter";
}

} // namespace tokens
