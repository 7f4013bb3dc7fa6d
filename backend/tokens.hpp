/*
 * tokens.hpp: Instruction tokenizer
 *
 * Turns a decoded instruction into typed, addressable text tokens in
 * the syntax of its architecture.  Relative operands are resolved
 * against the symbol table and the instruction stream through a
 * caller-supplied resolver; anything unresolved is rendered as a bare
 * address.
 */

#ifndef DS_TOKENS_H
#define DS_TOKENS_H

#include "arch.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace tokens {

enum class Kind : uint8_t {
    ADDRESS,        // navigable address (an instruction starts there)
    BYTES,          // raw encoding column
    MNEMONIC,
    REGISTER,
    IMMEDIATE,
    SYMBOL,         // reference rendered by symbol name
    DELIMITER,      // punctuation and whitespace
    INVALID,        // "??" of an undecodable entry
    LABEL,          // "name:" row header
    COMMENT,        // trailing "; ..." annotation
    UNRESOLVED,     // reference with no instruction or symbol at the target
};

struct Token {
    Kind        kind = Kind::DELIMITER;
    std::string text;
    bool        has_target = false;   // clickable reference
    uint64_t    target = 0;

    bool operator==(const Token &) const = default;
};

/*
 * Reference lookups.  Either callback may be null; symbol_at returns
 * nullptr when no symbol starts exactly at addr.
 */
struct Resolver {
    const void *ctx = nullptr;
    const char *(*symbol_at)(const void *ctx, uint64_t addr) = nullptr;
    bool        (*is_instruction)(const void *ctx, uint64_t addr) = nullptr;
};

/* Mnemonic and operand tokens (no address or bytes column). */
std::vector<Token> tokenize(const arch::Arch &arch,
                            const arch::Instruction &insn,
                            const Resolver *resolver = nullptr);

/* Token for a reference to addr: SYMBOL, ADDRESS or UNRESOLVED. */
Token reference(const arch::Arch &arch, uint64_t addr,
                const Resolver *resolver);

/* Zero-padded lowercase hex address, digits wide. */
std::string format_address(uint64_t addr, unsigned digits);

/* Space-separated hex bytes of the encoding. */
std::string format_bytes(const arch::Instruction &insn);

/* Concatenated token text. */
std::string to_text(const std::vector<Token> &toks);

const char *kind_name(Kind kind);

} // namespace tokens

#endif // DS_TOKENS_H
