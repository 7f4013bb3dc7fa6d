/*
 * vault.hpp: Debug vault
 *
 * Address-indexed correlation store built once per load from debug
 * records (line table entries and function ranges) supplied by a
 * debug-format reader.  Ranges never overlap after build: the first
 * registered record wins and later overlapping records are clipped
 * to whatever they still cover, or rejected, with a Conflict kept
 * for diagnostics.  The built Vault is immutable and safe to query
 * from any thread.
 */

#ifndef DS_VAULT_H
#define DS_VAULT_H

#include "image.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace vault {

/* Half-open address range [start, end). */
struct DebugRecord {
    uint64_t    start = 0;
    uint64_t    end = 0;
    std::string symbol;
    std::string file;
    uint32_t    line = 0;
    std::string function;
};

struct LineEntry {
    uint64_t    start = 0;
    uint64_t    end = 0;
    std::string file;
    uint32_t    line = 0;
};

struct FunctionRange {
    uint64_t    start = 0;
    uint64_t    end = 0;
    std::string name;
};

/* Passed through uninterpreted. */
struct TypeRecord {
    std::string name;
    std::string data;
};

struct Location {
    std::string symbol;
    std::string file;
    uint32_t    line = 0;       // 0 = no line information
    std::string function;

    bool operator==(const Location &) const = default;
};

struct SymbolRef {
    std::string name;
    uint64_t    offset = 0;

    bool operator==(const SymbolRef &) const = default;
};

struct Conflict {
    DebugRecord incoming;       // record as registered
    uint64_t    kept_start = 0; // first existing range it ran into
    uint64_t    kept_end = 0;
    bool        rejected = false;   // true: nothing left after clipping
};

class Vault {
public:
    Vault() = default;

    /* Line record covering addr, else the containing function range. */
    std::optional<Location> lookup(uint64_t addr) const;

    /* Containing function, else nearest preceding image symbol. */
    std::optional<SymbolRef> nearest_symbol(uint64_t addr) const;

    /* Label for addr: function starting there or a named image symbol. */
    const char *symbol_at(uint64_t addr) const;

    const FunctionRange *function_at(uint64_t addr) const;

    const std::vector<DebugRecord> &records() const { return records_; }
    const std::vector<FunctionRange> &functions() const { return functions_; }
    const std::vector<Conflict> &conflicts() const { return conflicts_; }
    const std::vector<TypeRecord> &type_records() const { return types_; }

private:
    friend class Builder;

    const DebugRecord *record_at(uint64_t addr) const;

    std::shared_ptr<const image::Image> image_;
    std::vector<DebugRecord>   records_;     // sorted, disjoint
    std::vector<FunctionRange> functions_;   // sorted, disjoint
    std::vector<Conflict>      conflicts_;
    std::vector<TypeRecord>    types_;
};

class Builder {
public:
    void add_record(DebugRecord rec);
    void add_line(const LineEntry &line);
    void add_function(FunctionRange fn);
    void add_type(TypeRecord type);

    size_t record_count() const { return records_.size(); }
    size_t function_count() const { return functions_.size(); }

    /* Resolve overlaps and produce the immutable vault. */
    Vault build(std::shared_ptr<const image::Image> image = nullptr) const;

private:
    std::vector<DebugRecord>   records_;     // registration order
    std::vector<FunctionRange> functions_;
    std::vector<TypeRecord>    types_;
};

} // namespace vault

#endif // DS_VAULT_H
