/*
 * helpers.hpp: Shared fixtures for the test suite
 */

#ifndef DS_TEST_HELPERS_H
#define DS_TEST_HELPERS_H

#include "arch.hpp"
#include "image.hpp"
#include "tokens.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <cstdio>
#include <initializer_list>
#include <memory>
#include <string>
#include <vector>

#include <stdlib.h>
#include <unistd.h>

namespace testutil {

inline const arch::Arch &arch_of(arch::Machine m)
{
    return *arch::arch_for_machine(m);
}

inline arch::Instruction decode(arch::Machine m, const std::vector<uint8_t> &bytes,
                                uint64_t addr = 0x1000, uint32_t flags = 0)
{
    return arch::decode(arch_of(m), bytes, addr, flags);
}

inline std::string text(arch::Machine m, const arch::Instruction &insn)
{
    return tokens::to_text(tokens::tokenize(arch_of(m), insn));
}

inline std::vector<uint8_t> words_le(std::initializer_list<uint32_t> words)
{
    std::vector<uint8_t> out;
    for (uint32_t w : words) {
        out.push_back((uint8_t)w);
        out.push_back((uint8_t)(w >> 8));
        out.push_back((uint8_t)(w >> 16));
        out.push_back((uint8_t)(w >> 24));
    }
    return out;
}

inline std::vector<uint8_t> words_be(std::initializer_list<uint32_t> words)
{
    std::vector<uint8_t> out;
    for (uint32_t w : words) {
        out.push_back((uint8_t)(w >> 24));
        out.push_back((uint8_t)(w >> 16));
        out.push_back((uint8_t)(w >> 8));
        out.push_back((uint8_t)w);
    }
    return out;
}

inline image::Section section(std::string name, uint64_t start,
                              std::vector<uint8_t> bytes,
                              uint8_t perms = image::PERM_R | image::PERM_X)
{
    image::Section s;
    s.name = std::move(name);
    s.start = start;
    s.size = bytes.size();
    s.perms = perms;
    s.bytes = std::move(bytes);
    return s;
}

inline image::Symbol symbol(uint64_t addr, std::string name,
                            image::SymbolKind kind = image::SymbolKind::FUNCTION)
{
    image::Symbol s;
    s.addr = addr;
    s.name = std::move(name);
    s.kind = kind;
    return s;
}

inline std::shared_ptr<const image::Image>
shared_image(arch::Machine m, uint64_t entry, std::vector<image::Section> sections,
             std::vector<image::Symbol> symbols = {}, bool big_endian = false)
{
    return std::make_shared<const image::Image>(
        image::make_image(m, big_endian, entry, std::move(sections), std::move(symbols)));
}

/* File on disk for the duration of a test */
class TempFile {
public:
    explicit TempFile(const std::string &contents)
    {
        char tmpl[] = "/tmp/dissect_testXXXXXX";
        int fd = mkstemp(tmpl);
        if (fd < 0) {
            ADD_FAILURE() << "mkstemp failed";
            return;
        }
        path_ = tmpl;
        if (::write(fd, contents.data(), contents.size()) != (ssize_t)contents.size())
            ADD_FAILURE() << "short write to " << path_;
        ::close(fd);
    }

    TempFile(std::string path, const std::string &contents)
        : path_(std::move(path))
    {
        FILE *f = fopen(path_.c_str(), "wb");
        if (!f) {
            ADD_FAILURE() << "cannot create " << path_;
            return;
        }
        if (fwrite(contents.data(), 1, contents.size(), f) != contents.size())
            ADD_FAILURE() << "short write to " << path_;
        fclose(f);
    }

    ~TempFile()
    {
        if (!path_.empty())
            unlink(path_.c_str());
    }

    TempFile(const TempFile &) = delete;
    TempFile &operator=(const TempFile &) = delete;

    const std::string &path() const { return path_; }

private:
    std::string path_;
};

inline std::string bytes_str(std::initializer_list<uint8_t> bytes)
{
    return std::string(bytes.begin(), bytes.end());
}

} // namespace testutil

#endif // DS_TEST_HELPERS_H
