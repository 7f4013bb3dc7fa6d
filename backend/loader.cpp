/*
 * loader.cpp: Raw image loader and debug JSON reader
 */

#include "loader.hpp"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>

namespace loader {

/* ======================================================================== */
/* Raw image                                                                 */
/* ======================================================================== */

image::Image image_from_bytes(std::vector<uint8_t> bytes, const RawOptions &opts,
                              std::vector<image::Symbol> symbols)
{
    image::Section sec;
    sec.name = ".text";
    sec.start = opts.base;
    sec.size = bytes.size();
    sec.perms = image::PERM_R | image::PERM_X;
    sec.bytes = std::move(bytes);

    std::vector<image::Section> sections;
    sections.push_back(std::move(sec));
    return image::make_image(opts.machine, opts.big_endian,
                             opts.entry.value_or(opts.base),
                             std::move(sections), std::move(symbols));
}

static bool read_file(const char *path, std::string &data, std::string &err)
{
    FILE *f = fopen(path, "rb");
    if (!f) {
        err = std::string(path) + ": " + strerror(errno);
        return false;
    }
    fseek(f, 0, SEEK_END);
    long fsize = ftell(f);
    fseek(f, 0, SEEK_SET);
    if (fsize < 0) {
        fclose(f);
        err = std::string(path) + ": cannot determine size";
        return false;
    }
    data.assign((size_t)fsize, '\0');
    size_t nread = fsize ? fread(&data[0], 1, (size_t)fsize, f) : 0;
    fclose(f);
    if (nread != (size_t)fsize) {
        err = std::string(path) + ": short read";
        return false;
    }
    return true;
}

std::optional<image::Image> load_raw(const char *path, const RawOptions &opts,
                                     std::vector<image::Symbol> symbols,
                                     std::string &err)
{
    if (opts.machine == arch::Machine::UNKNOWN) {
        err = "no architecture given";
        return std::nullopt;
    }
    std::string data;
    if (!read_file(path, data, err))
        return std::nullopt;
    if (data.empty()) {
        err = std::string(path) + ": empty file";
        return std::nullopt;
    }

    std::vector<uint8_t> bytes(data.begin(), data.end());
    fprintf(stderr, "[dissect] Loaded %zu bytes from %s at 0x%llx\n",
            bytes.size(), path, (unsigned long long)opts.base);
    return image_from_bytes(std::move(bytes), opts, std::move(symbols));
}

std::string default_debug_path(const std::string &image_path)
{
    return image_path + ".dbg.json";
}

bool file_exists(const std::string &path)
{
    FILE *f = fopen(path.c_str(), "r");
    if (!f) return false;
    fclose(f);
    return true;
}

/* ======================================================================== */
/* Debug JSON                                                                */
/* ======================================================================== */

static std::string json_unescape(const std::string &s)
{
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); i++) {
        if (s[i] == '\\' && i + 1 < s.size()) {
            switch (s[i + 1]) {
            case '"':  out += '"';  i++; break;
            case '\\': out += '\\'; i++; break;
            case '/':  out += '/';  i++; break;
            case 'n':  out += '\n'; i++; break;
            case 'r':  out += '\r'; i++; break;
            case 't':  out += '\t'; i++; break;
            case 'u': {
                /* Basic Latin only; anything else becomes '?' */
                unsigned cp = 0;
                if (i + 5 < s.size())
                    cp = (unsigned)strtoul(s.substr(i + 2, 4).c_str(), nullptr, 16);
                out += (cp > 0 && cp < 0x80) ? (char)cp : '?';
                i += 5;
                break;
            }
            default: out += s[i]; break;
            }
        } else {
            out += s[i];
        }
    }
    return out;
}

/* String at pos (pos on the opening '"'); pos ends past the closing '"'. */
static std::string parse_json_string(const std::string &data, size_t &pos)
{
    if (pos >= data.size() || data[pos] != '"') return {};
    pos++;
    std::string raw;
    while (pos < data.size()) {
        if (data[pos] == '\\' && pos + 1 < data.size()) {
            raw += data[pos];
            raw += data[pos + 1];
            pos += 2;
        } else if (data[pos] == '"') {
            pos++;
            return json_unescape(raw);
        } else {
            raw += data[pos++];
        }
    }
    return json_unescape(raw);
}

static uint64_t parse_json_number(const std::string &data, size_t &pos)
{
    uint64_t val = 0;
    while (pos < data.size() && data[pos] >= '0' && data[pos] <= '9') {
        val = val * 10 + (uint64_t)(data[pos] - '0');
        pos++;
    }
    return val;
}

static bool parse_address(const std::string &s, uint64_t &out)
{
    if (s.empty()) return false;
    char *end = nullptr;
    errno = 0;
    out = strtoull(s.c_str(), &end, 0);
    return errno == 0 && end && *end == '\0';
}

namespace {

struct Object {
    std::string kind, name, file, type, data, function;
    uint64_t addr = 0, end = 0, line = 0;
    bool has_addr = false, has_end = false;
};

bool add_object(const Object &o, DebugInfo &out, std::string &err)
{
    if (o.kind == "type") {
        out.vault.add_type({o.name, o.data});
        return true;
    }
    if (!o.has_addr) {
        err = "debug object of kind '" + o.kind + "' without addr";
        return false;
    }

    if (o.kind == "symbol") {
        image::Symbol s;
        s.addr = o.addr;
        s.name = o.name;
        s.kind = o.type == "object" ? image::SymbolKind::OBJECT
               : o.type == "label"  ? image::SymbolKind::LABEL
               : image::SymbolKind::FUNCTION;
        out.symbols.push_back(std::move(s));
        return true;
    }
    if (o.kind == "function") {
        if (!o.has_end) {
            err = "function '" + o.name + "' without end";
            return false;
        }
        image::Symbol s;
        s.addr = o.addr;
        s.name = o.name;
        s.kind = image::SymbolKind::FUNCTION;
        out.symbols.push_back(s);
        out.vault.add_function({o.addr, o.end, image::demangle(o.name)});
        return true;
    }
    if (o.kind == "line") {
        vault::DebugRecord rec;
        rec.start = o.addr;
        rec.end = o.has_end ? o.end : o.addr + 1;
        rec.symbol = o.name;
        rec.file = o.file;
        rec.line = (uint32_t)o.line;
        rec.function = o.function;
        out.vault.add_record(std::move(rec));
        return true;
    }
    err = "unknown debug object kind '" + o.kind + "'";
    return false;
}

} // namespace

bool parse_debug_json(const std::string &data, DebugInfo &out, std::string &err)
{
    size_t count = 0;
    size_t pos = 0;
    while (pos < data.size()) {
        pos = data.find('{', pos);
        if (pos == std::string::npos) break;
        pos++;

        Object o;
        while (pos < data.size() && data[pos] != '}') {
            while (pos < data.size() &&
                   (data[pos] == ' ' || data[pos] == '\t' ||
                    data[pos] == '\n' || data[pos] == '\r' ||
                    data[pos] == ','))
                pos++;

            if (pos >= data.size() || data[pos] == '}') break;

            std::string key = parse_json_string(data, pos);
            if (key.empty()) {
                err = "malformed object at offset " + std::to_string(pos);
                return false;
            }

            while (pos < data.size() &&
                   (data[pos] == ':' || data[pos] == ' ' || data[pos] == '\t'))
                pos++;
            if (pos >= data.size()) break;

            if (data[pos] == '"') {
                std::string val = parse_json_string(data, pos);
                if (key == "addr" || key == "end") {
                    uint64_t v;
                    if (!parse_address(val, v)) {
                        err = "bad " + key + " '" + val + "'";
                        return false;
                    }
                    if (key == "addr") { o.addr = v; o.has_addr = true; }
                    else               { o.end = v;  o.has_end = true; }
                }
                else if (key == "kind")     o.kind = val;
                else if (key == "name")     o.name = val;
                else if (key == "file")     o.file = val;
                else if (key == "type")     o.type = val;
                else if (key == "data")     o.data = val;
                else if (key == "function") o.function = val;
            } else if (data[pos] >= '0' && data[pos] <= '9') {
                uint64_t val = parse_json_number(data, pos);
                if (key == "addr")      { o.addr = val; o.has_addr = true; }
                else if (key == "end")  { o.end = val;  o.has_end = true; }
                else if (key == "line") o.line = val;
            } else {
                /* Skip unknown value */
                pos++;
            }
        }
        if (pos < data.size() && data[pos] == '}')
            pos++;

        if (o.kind.empty()) {
            err = "debug object without kind";
            return false;
        }
        if (!add_object(o, out, err))
            return false;
        count++;
    }

    fprintf(stderr, "[dissect] Parsed %zu debug objects\n", count);
    return true;
}

bool load_debug_json(const char *path, DebugInfo &out, std::string &err)
{
    std::string data;
    if (!read_file(path, data, err))
        return false;
    if (!parse_debug_json(data, out, err)) {
        err = std::string(path) + ": " + err;
        return false;
    }
    return true;
}

} // namespace loader
