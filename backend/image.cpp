/*
 * image.cpp: Binary image
 */

#include "image.hpp"

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <cxxabi.h>

namespace image {

/* ======================================================================== */
/* Symbol metadata                                                           */
/* ======================================================================== */

std::string demangle(const std::string &name)
{
    if (name.compare(0, 2, "_Z") != 0)
        return name;

    int status = 0;
    char *out = abi::__cxa_demangle(name.c_str(), nullptr, nullptr, &status);
    if (status != 0 || !out) {
        free(out);
        return name;
    }
    std::string s = out;
    free(out);
    return s;
}

bool is_intrinsic(const std::string &name)
{
    static const char *const prefixes[] = {
        ".L", "str.", "anon.", "GCC_except_table",
    };
    if (name.empty()) return true;
    for (const char *p : prefixes)
        if (name.compare(0, strlen(p), p) == 0)
            return true;
    return false;
}

const char *kind_name(SymbolKind kind)
{
    switch (kind) {
    case SymbolKind::FUNCTION: return "function";
    case SymbolKind::OBJECT:   return "object";
    case SymbolKind::LABEL:    return "label";
    case SymbolKind::ENTRY:    return "entry";
    }
    return "label";
}

/* Preference when several symbols share an address */
static int symbol_rank(const Symbol &s)
{
    if (s.intrinsic) return 3;
    switch (s.kind) {
    case SymbolKind::FUNCTION: return 0;
    case SymbolKind::ENTRY:    return 1;
    default:                   return 2;
    }
}

/* ======================================================================== */
/* Construction                                                              */
/* ======================================================================== */

Image make_image(arch::Machine machine, bool big_endian, uint64_t entry,
                 std::vector<Section> sections, std::vector<Symbol> symbols)
{
    Image img;
    img.machine = machine;
    img.big_endian = big_endian;
    img.entry = entry;

    std::stable_sort(sections.begin(), sections.end(),
                     [](const Section &a, const Section &b) { return a.start < b.start; });
    for (auto &s : sections) {
        if (s.size == 0) continue;
        if (!img.sections.empty() && s.start < img.sections.back().end()) {
            fprintf(stderr, "[dissect] Section %s overlaps %s, dropped\n",
                    s.name.c_str(), img.sections.back().name.c_str());
            continue;
        }
        if (s.bytes.size() > s.size)
            s.bytes.resize(s.size);
        img.sections.push_back(std::move(s));
    }

    for (auto &s : symbols) {
        s.intrinsic = is_intrinsic(s.name);
        s.display = demangle(s.name);
    }
    std::stable_sort(symbols.begin(), symbols.end(),
                     [](const Symbol &a, const Symbol &b) {
                         if (a.addr != b.addr) return a.addr < b.addr;
                         return symbol_rank(a) < symbol_rank(b);
                     });

    for (auto &s : symbols) {
        if (!img.symbols.empty() && img.symbols.back().addr == s.addr)
            continue;
        img.symbols.push_back(std::move(s));
    }

    const Symbol *at_entry = img.symbol_at(entry);
    if (img.section_for(entry) && (!at_entry || at_entry->intrinsic)) {
        Symbol e;
        e.addr = entry;
        e.name = "entry";
        e.display = "entry";
        e.kind = SymbolKind::ENTRY;
        auto it = std::lower_bound(img.symbols.begin(), img.symbols.end(), entry,
                                   [](const Symbol &s, uint64_t a) { return s.addr < a; });
        if (it != img.symbols.end() && it->addr == entry)
            *it = std::move(e);
        else
            img.symbols.insert(it, std::move(e));
    }

    return img;
}

/* ======================================================================== */
/* Queries                                                                   */
/* ======================================================================== */

const Section *Image::section_for(uint64_t addr) const
{
    auto it = std::upper_bound(sections.begin(), sections.end(), addr,
                               [](uint64_t a, const Section &s) { return a < s.start; });
    if (it == sections.begin()) return nullptr;
    --it;
    return it->contains(addr) ? &*it : nullptr;
}

const Symbol *Image::symbol_at(uint64_t addr) const
{
    auto it = std::lower_bound(symbols.begin(), symbols.end(), addr,
                               [](const Symbol &s, uint64_t a) { return s.addr < a; });
    if (it == symbols.end() || it->addr != addr) return nullptr;
    return &*it;
}

const Symbol *Image::symbol_before(uint64_t addr) const
{
    const Section *sec = section_for(addr);
    if (!sec) return nullptr;

    auto it = std::upper_bound(symbols.begin(), symbols.end(), addr,
                               [](uint64_t a, const Symbol &s) { return a < s.addr; });
    while (it != symbols.begin()) {
        --it;
        if (it->addr < sec->start) break;
        if (!it->intrinsic) return &*it;
    }
    return nullptr;
}

std::span<const uint8_t> Image::bytes_from(uint64_t addr) const
{
    const Section *sec = section_for(addr);
    if (!sec) return {};
    uint64_t off = addr - sec->start;
    if (off >= sec->bytes.size()) return {};
    return std::span<const uint8_t>(sec->bytes).subspan((size_t)off);
}

bool Image::read(uint64_t addr, void *out, size_t n) const
{
    auto data = bytes_from(addr);
    if (data.size() < n) return false;
    memcpy(out, data.data(), n);
    return true;
}

std::optional<uint64_t> Image::read_pointer(uint64_t addr, unsigned width) const
{
    uint8_t buf[8];
    if (width == 0 || width > sizeof(buf) || !read(addr, buf, width))
        return std::nullopt;

    uint64_t v = 0;
    for (unsigned i = 0; i < width; i++) {
        unsigned idx = big_endian ? i : width - 1 - i;
        v = (v << 8) | buf[idx];
    }
    return v;
}

} // namespace image
