/*
 * vault.cpp: Debug vault
 */

#include "vault.hpp"

#include <algorithm>
#include <cinttypes>
#include <cstdio>
#include <map>
#include <optional>
#include <utility>

namespace vault {

/* ======================================================================== */
/* Builder                                                                   */
/* ======================================================================== */

void Builder::add_record(DebugRecord rec)
{
    records_.push_back(std::move(rec));
}

void Builder::add_line(const LineEntry &line)
{
    DebugRecord rec;
    rec.start = line.start;
    rec.end = line.end;
    rec.file = line.file;
    rec.line = line.line;
    records_.push_back(std::move(rec));
}

void Builder::add_function(FunctionRange fn)
{
    functions_.push_back(std::move(fn));
}

void Builder::add_type(TypeRecord type)
{
    types_.push_back(std::move(type));
}

namespace {

using Coverage = std::map<uint64_t, uint64_t>;   // start -> end
using Piece = std::pair<uint64_t, uint64_t>;

/*
 * Parts of [s, e) not yet in cov.  hit receives the first covered
 * range that intersects it.
 */
std::vector<Piece> uncovered(const Coverage &cov, uint64_t s, uint64_t e,
                             std::optional<Piece> &hit)
{
    std::vector<Piece> out;
    hit.reset();
    uint64_t cur = s;

    auto it = cov.upper_bound(s);
    if (it != cov.begin()) {
        auto prev = std::prev(it);
        if (prev->second > cur) {
            hit = *prev;
            cur = prev->second;
        }
    }
    for (; it != cov.end() && it->first < e; ++it) {
        if (!hit)
            hit = *it;
        if (it->first > cur)
            out.emplace_back(cur, it->first);
        cur = std::max(cur, it->second);
    }
    if (cur < e)
        out.emplace_back(cur, e);
    return out;
}

void log_conflict(const Conflict &c)
{
    fprintf(stderr, "[dissect] Debug record %" PRIx64 "-%" PRIx64 " (%s:%u) "
            "overlaps %" PRIx64 "-%" PRIx64 ", %s\n",
            c.incoming.start, c.incoming.end,
            c.incoming.file.empty() ? c.incoming.function.c_str() : c.incoming.file.c_str(),
            c.incoming.line, c.kept_start, c.kept_end,
            c.rejected ? "rejected" : "clipped");
}

} // namespace

Vault Builder::build(std::shared_ptr<const image::Image> image) const
{
    Vault v;
    v.image_ = std::move(image);
    v.types_ = types_;

    Coverage cov;
    for (auto &rec : records_) {
        if (rec.end <= rec.start) {
            fprintf(stderr, "[dissect] Empty debug record at %" PRIx64 " ignored\n",
                    rec.start);
            continue;
        }
        std::optional<Piece> hit;
        auto pieces = uncovered(cov, rec.start, rec.end, hit);
        if (hit) {
            Conflict c;
            c.incoming = rec;
            c.kept_start = hit->first;
            c.kept_end = hit->second;
            c.rejected = pieces.empty();
            log_conflict(c);
            v.conflicts_.push_back(std::move(c));
        }
        for (auto &[s, e] : pieces) {
            DebugRecord part = rec;
            part.start = s;
            part.end = e;
            v.records_.push_back(std::move(part));
            cov.emplace(s, e);
        }
    }
    std::sort(v.records_.begin(), v.records_.end(),
              [](const DebugRecord &a, const DebugRecord &b) { return a.start < b.start; });

    Coverage fcov;
    for (auto &fn : functions_) {
        if (fn.end <= fn.start) continue;
        std::optional<Piece> hit;
        auto pieces = uncovered(fcov, fn.start, fn.end, hit);
        if (hit) {
            Conflict c;
            c.incoming.start = fn.start;
            c.incoming.end = fn.end;
            c.incoming.symbol = fn.name;
            c.incoming.function = fn.name;
            c.kept_start = hit->first;
            c.kept_end = hit->second;
            c.rejected = pieces.empty();
            log_conflict(c);
            v.conflicts_.push_back(std::move(c));
        }
        /* A function keeps one range: its first uncovered piece */
        if (!pieces.empty()) {
            FunctionRange part = fn;
            part.start = pieces.front().first;
            part.end = pieces.front().second;
            fcov.emplace(part.start, part.end);
            v.functions_.push_back(std::move(part));
        }
    }
    std::sort(v.functions_.begin(), v.functions_.end(),
              [](const FunctionRange &a, const FunctionRange &b) { return a.start < b.start; });

    fprintf(stderr, "[dissect] Vault: %zu records, %zu functions, %zu conflicts\n",
            v.records_.size(), v.functions_.size(), v.conflicts_.size());
    return v;
}

/* ======================================================================== */
/* Queries                                                                   */
/* ======================================================================== */

template <typename T>
static const T *containing(const std::vector<T> &v, uint64_t addr)
{
    auto it = std::upper_bound(v.begin(), v.end(), addr,
                               [](uint64_t a, const T &r) { return a < r.start; });
    if (it == v.begin()) return nullptr;
    --it;
    return addr < it->end ? &*it : nullptr;
}

const DebugRecord *Vault::record_at(uint64_t addr) const
{
    return containing(records_, addr);
}

const FunctionRange *Vault::function_at(uint64_t addr) const
{
    return containing(functions_, addr);
}

std::optional<Location> Vault::lookup(uint64_t addr) const
{
    const FunctionRange *fn = function_at(addr);

    if (const DebugRecord *rec = record_at(addr)) {
        Location loc;
        loc.file = rec->file;
        loc.line = rec->line;
        loc.function = !rec->function.empty() ? rec->function
                     : fn ? fn->name : std::string();
        loc.symbol = !rec->symbol.empty() ? rec->symbol : loc.function;
        return loc;
    }
    if (fn) {
        Location loc;
        loc.symbol = fn->name;
        loc.function = fn->name;
        return loc;
    }
    return std::nullopt;
}

std::optional<SymbolRef> Vault::nearest_symbol(uint64_t addr) const
{
    if (const FunctionRange *fn = function_at(addr))
        return SymbolRef{fn->name, addr - fn->start};

    if (image_) {
        if (const image::Symbol *s = image_->symbol_before(addr))
            return SymbolRef{s->display, addr - s->addr};
    }
    return std::nullopt;
}

const char *Vault::symbol_at(uint64_t addr) const
{
    const FunctionRange *fn = function_at(addr);
    if (fn && fn->start == addr)
        return fn->name.c_str();

    if (image_) {
        const image::Symbol *s = image_->symbol_at(addr);
        if (s && !s->intrinsic)
            return s->display.c_str();
    }
    return nullptr;
}

} // namespace vault
