/*
 * scroll.hpp: Scroll buffer
 *
 * Lazily materialised window over a row source for a viewer.  A source
 * exposes a finite sequence of rows:
 *
 *   size_t size() const;                   number of rows
 *   size_t row_for(uint64_t addr) const;   row an address anchors to
 *   Row    row(size_t index) const;        build one row
 *
 * The buffer keeps a virtual cursor (it may run past either end, so a
 * forward extend followed by a backward extend of the same count always
 * lands on the starting row) and a cache of built rows that is trimmed
 * to keep_distance rows around the cursor after every extend.
 */

#ifndef DS_SCROLL_H
#define DS_SCROLL_H

#include "processor.hpp"
#include "tokens.hpp"
#include "vault.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace scroll {

enum class Direction : uint8_t { FORWARD, BACKWARD };

enum class RowKind : uint8_t {
    LABEL,          // "name:" before the first instruction of a symbol
    INSTRUCTION,
    ERROR,          // undecodable bytes, "??"
    BYTES,          // hex dump line, or code bytes no sweep reached
    SECTION,        // start or end of a code section
};

struct Row {
    RowKind  kind = RowKind::INSTRUCTION;
    uint64_t address = 0;
    size_t   index = 0;                     // row index in its source
    std::vector<tokens::Token> tokens;
    std::optional<vault::Location> location;

    std::string text() const { return tokens::to_text(tokens); }
};

constexpr size_t CHECKPOINT_STRIDE = 64;        // listing items per checkpoint
constexpr size_t DEFAULT_KEEP_DISTANCE = 512;   // cached rows kept around the cursor
constexpr unsigned HEX_ROW_BYTES = 16;
constexpr unsigned GAP_ROW_BYTES = 8;           // undecoded bytes per listing row

/* ======================================================================== */
/* Listing source                                                            */
/* ======================================================================== */

/*
 * Rows of an analysed stream, per code section in address order: a
 * section start row, then the section's contents, then a section end
 * row.  Contents are the stream entries (with a label row in front of
 * every entry a symbol starts at) and, between them, rows of at most
 * GAP_ROW_BYTES bytes that no sweep decoded.  Both referenced objects
 * must outlive the source.
 */
class ListingSource {
public:
    ListingSource(const proc::Analysis &analysis, const vault::Vault &vault);
    ListingSource(const ListingSource &) = delete;
    ListingSource &operator=(const ListingSource &) = delete;

    size_t size() const { return rows_; }
    size_t row_for(uint64_t addr) const;
    Row row(size_t index) const;

    /* First row of the entry starting exactly at addr. */
    std::optional<size_t> row_of_entry(uint64_t addr) const;

    const tokens::Resolver &resolver() const { return resolver_; }

private:
    enum class ItemKind : uint8_t { SECTION_START, SECTION_END, ENTRY, GAP };

    struct Item {
        ItemKind kind;
        uint64_t addr;
        uint64_t end;                   // one past the last byte covered
        size_t   entry;                 // stream index of an ENTRY
        const image::Section *section;
    };

    struct Checkpoint {
        size_t item;        // multiple of CHECKPOINT_STRIDE
        size_t row;         // row index of that item's first row
    };

    size_t item_rows(const Item &item) const;
    std::optional<size_t> item_at(uint64_t addr) const;
    size_t first_row(size_t item) const;
    Row item_row(const Item &item, size_t sub, size_t index) const;
    Row entry_row(size_t entry, bool label, size_t index) const;

    const proc::Analysis &an_;
    const vault::Vault   &vault_;
    tokens::Resolver      resolver_;
    std::vector<Item>       items_;
    std::vector<Checkpoint> checkpoints_;
    size_t rows_ = 0;
};

/* ======================================================================== */
/* Hex source                                                                */
/* ======================================================================== */

/* HEX_ROW_BYTES-byte rows over every section of an image. */
class HexSource {
public:
    explicit HexSource(const image::Image &image);

    size_t size() const { return rows_; }
    size_t row_for(uint64_t addr) const;
    Row row(size_t index) const;

private:
    /* Sections whose aligned rows touch share one span */
    struct Span {
        size_t   first_row;
        uint64_t start;     // aligned down to HEX_ROW_BYTES
        uint64_t end;       // aligned up
    };

    const image::Image &image_;
    std::vector<Span> spans_;
    size_t rows_ = 0;
    unsigned digits_;
};

/* ======================================================================== */
/* Scroll buffer                                                             */
/* ======================================================================== */

template <typename Source>
class ScrollBuffer {
public:
    explicit ScrollBuffer(const Source &source,
                          size_t keep_distance = DEFAULT_KEEP_DISTANCE)
        : src_(source), keep_(keep_distance) {}

    /* Move the cursor to the row addr resolves to. */
    void set_anchor(uint64_t addr)
    {
        cursor_ = src_.size() ? (int64_t)src_.row_for(addr) : 0;
        trim();
    }

    /* Move the cursor to an absolute row index. */
    void set_row(size_t index)
    {
        cursor_ = (int64_t)index;
        trim();
    }

    /*
     * FORWARD returns rows [cursor, cursor + count) and advances the
     * cursor by count; BACKWARD returns rows [cursor - count, cursor)
     * and moves it back.  Rows outside the source are omitted.
     */
    std::vector<Row> extend(Direction dir, size_t count)
    {
        int64_t from = dir == Direction::FORWARD ? cursor_ : cursor_ - (int64_t)count;
        int64_t to = from + (int64_t)count;
        cursor_ = dir == Direction::FORWARD ? to : from;

        std::vector<Row> out;
        int64_t lo = std::max<int64_t>(from, 0);
        int64_t hi = std::min<int64_t>(to, (int64_t)src_.size());
        for (int64_t i = lo; i < hi; i++)
            out.push_back(get((size_t)i));
        trim();
        return out;
    }

    /* Rows [cursor, cursor + count) without moving the cursor. */
    std::vector<Row> peek(size_t count)
    {
        std::vector<Row> out;
        int64_t lo = std::max<int64_t>(cursor_, 0);
        int64_t hi = std::min<int64_t>(cursor_ + (int64_t)count, (int64_t)src_.size());
        for (int64_t i = lo; i < hi; i++)
            out.push_back(get((size_t)i));
        return out;
    }

    int64_t cursor() const { return cursor_; }
    size_t cached() const { return cache_.size(); }
    bool is_cached(size_t index) const { return cache_.count(index) != 0; }
    size_t keep_distance() const { return keep_; }
    const Source &source() const { return src_; }

private:
    const Row &get(size_t index)
    {
        auto it = cache_.find(index);
        if (it == cache_.end())
            it = cache_.emplace(index, src_.row(index)).first;
        return it->second;
    }

    void trim()
    {
        int64_t lo = cursor_ - (int64_t)keep_;
        int64_t hi = cursor_ + (int64_t)keep_;
        if (lo > 0)
            cache_.erase(cache_.begin(), cache_.lower_bound((size_t)lo));
        if (hi < 0)
            cache_.clear();
        else
            cache_.erase(cache_.upper_bound((size_t)hi), cache_.end());
    }

    const Source &src_;
    size_t keep_;
    int64_t cursor_ = 0;
    std::map<size_t, Row> cache_;
};

} // namespace scroll

#endif // DS_SCROLL_H
