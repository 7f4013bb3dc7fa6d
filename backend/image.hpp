/*
 * image.hpp: Binary image
 *
 * Immutable view of a loaded binary: sections with their raw bytes,
 * a symbol table with one symbol per address, and the entry point.
 * Produced by a loader through make_image() and shared read-only
 * between the processor workers.
 */

#ifndef DS_IMAGE_H
#define DS_IMAGE_H

#include "arch.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace image {

/* Section permissions */
enum : uint8_t {
    PERM_R = 1 << 0,
    PERM_W = 1 << 1,
    PERM_X = 1 << 2,
};

struct Section {
    std::string name;
    uint64_t    start = 0;
    uint64_t    size  = 0;
    uint8_t     perms = PERM_R;
    std::vector<uint8_t> bytes;     // size() may be < size (zero fill, .bss)

    uint64_t end() const { return start + size; }
    bool contains(uint64_t addr) const { return addr >= start && addr < end(); }
    bool executable() const { return (perms & PERM_X) != 0; }
};

enum class SymbolKind : uint8_t {
    FUNCTION,
    OBJECT,
    LABEL,
    ENTRY,
};

struct Symbol {
    uint64_t    addr = 0;
    std::string name;               // raw (possibly mangled) name
    SymbolKind  kind = SymbolKind::FUNCTION;
    std::string display;            // demangled name, filled by make_image
    bool        intrinsic = false;  // compiler artifact, never used as a label
};

struct Image {
    arch::Machine machine = arch::Machine::UNKNOWN;
    bool          big_endian = false;
    uint64_t      entry = 0;
    std::vector<Section> sections;  // sorted by start, non-overlapping
    std::vector<Symbol>  symbols;   // sorted by addr, unique addresses

    const Section *section_for(uint64_t addr) const;

    /* Exact symbol at addr, including intrinsic ones. */
    const Symbol *symbol_at(uint64_t addr) const;

    /* Nearest non-intrinsic symbol at or before addr in the same section. */
    const Symbol *symbol_before(uint64_t addr) const;

    /* Bytes from addr to the end of its section's backing data. */
    std::span<const uint8_t> bytes_from(uint64_t addr) const;

    /* Copy n bytes; false if any byte lies outside backed section data. */
    bool read(uint64_t addr, void *out, size_t n) const;

    /* Code pointer of the given width in the image's byte order. */
    std::optional<uint64_t> read_pointer(uint64_t addr, unsigned width) const;

    uint32_t decode_flags() const
    {
        return big_endian ? arch::DECODE_BIG_ENDIAN : 0;
    }
};

/*
 * Assemble an image: sort sections, overlapping sections are dropped
 * (first one kept); sort symbols, demangle, flag intrinsics, keep one
 * symbol per address and add an "entry" symbol at the entry point
 * when nothing is there yet.
 */
Image make_image(arch::Machine machine, bool big_endian, uint64_t entry,
                 std::vector<Section> sections, std::vector<Symbol> symbols);

/* Demangled form of an Itanium C++ name, or the name unchanged. */
std::string demangle(const std::string &name);

/* Unnamed compiler-generated artifact (".L*", "str.*", ...). */
bool is_intrinsic(const std::string &name);

const char *kind_name(SymbolKind kind);

} // namespace image

#endif // DS_IMAGE_H
