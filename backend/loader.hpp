/*
 * loader.hpp: Collaborator inputs
 *
 * Raw image loader (a flat file mapped as one executable section) and
 * the debug JSON reader.  The debug file is an array of objects:
 *
 *   {"kind":"symbol",   "addr":4096, "name":"_Z3foov", "type":"function"}
 *   {"kind":"function", "addr":4096, "end":4160, "name":"foo"}
 *   {"kind":"line",     "addr":4096, "end":4100, "file":"a.c", "line":12}
 *   {"kind":"type",     "name":"struct s", "data":"..."}
 *
 * Addresses are decimal numbers or "0x" hex strings.
 */

#ifndef DS_LOADER_H
#define DS_LOADER_H

#include "image.hpp"
#include "vault.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace loader {

struct RawOptions {
    arch::Machine machine = arch::Machine::UNKNOWN;
    uint64_t      base = 0;
    std::optional<uint64_t> entry;      // defaults to base
    bool          big_endian = false;
};

struct DebugInfo {
    std::vector<image::Symbol> symbols;
    vault::Builder             vault;
};

/* Image over an in-memory buffer. */
image::Image image_from_bytes(std::vector<uint8_t> bytes, const RawOptions &opts,
                              std::vector<image::Symbol> symbols = {});

/* Read a flat binary; on failure err says why. */
std::optional<image::Image> load_raw(const char *path, const RawOptions &opts,
                                     std::vector<image::Symbol> symbols,
                                     std::string &err);

bool parse_debug_json(const std::string &data, DebugInfo &out, std::string &err);
bool load_debug_json(const char *path, DebugInfo &out, std::string &err);

/* "<image>.dbg.json" */
std::string default_debug_path(const std::string &image_path);

bool file_exists(const std::string &path);

} // namespace loader

#endif // DS_LOADER_H
