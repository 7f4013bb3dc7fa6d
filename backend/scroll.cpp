/*
 * scroll.cpp: Listing and hex row sources
 */

#include "scroll.hpp"

#include <algorithm>
#include <cstdio>

namespace scroll {

using tokens::Kind;
using tokens::Token;

static Token make_token(Kind kind, std::string text)
{
    Token t;
    t.kind = kind;
    t.text = std::move(text);
    return t;
}

/* ======================================================================== */
/* Listing source                                                            */
/* ======================================================================== */

ListingSource::ListingSource(const proc::Analysis &analysis,
                             const vault::Vault &vault)
    : an_(analysis), vault_(vault)
{
    resolver_.ctx = this;
    resolver_.symbol_at = [](const void *ctx, uint64_t addr) {
        return static_cast<const ListingSource *>(ctx)->vault_.symbol_at(addr);
    };
    resolver_.is_instruction = [](const void *ctx, uint64_t addr) {
        auto *self = static_cast<const ListingSource *>(ctx);
        auto idx = self->an_.find(addr);
        return idx && !self->an_.stream[*idx].is_error;
    };

    if (!an_.image) return;

    const proc::Stream &stream = an_.stream;
    size_t next = 0;
    for (auto &sec : an_.image->sections) {
        if (!sec.executable()) continue;
        items_.push_back({ItemKind::SECTION_START, sec.start, sec.start, 0, &sec});

        while (next < stream.size() && stream[next].address < sec.start) next++;
        uint64_t cursor = sec.start;
        for (; next < stream.size() && stream[next].address < sec.end(); next++) {
            const arch::Instruction &insn = stream[next];
            if (insn.address > cursor)
                items_.push_back({ItemKind::GAP, cursor, insn.address, 0, &sec});
            items_.push_back({ItemKind::ENTRY, insn.address, insn.end(), next, &sec});
            cursor = std::max(cursor, insn.end());
        }
        if (cursor < sec.end())
            items_.push_back({ItemKind::GAP, cursor, sec.end(), 0, &sec});

        items_.push_back({ItemKind::SECTION_END, sec.end(), sec.end(), 0, &sec});
    }

    size_t row = 0;
    for (size_t i = 0; i < items_.size(); i++) {
        if (i % CHECKPOINT_STRIDE == 0)
            checkpoints_.push_back({i, row});
        row += item_rows(items_[i]);
    }
    rows_ = row;
}

size_t ListingSource::item_rows(const Item &item) const
{
    switch (item.kind) {
    case ItemKind::ENTRY:
        return vault_.symbol_at(item.addr) ? 2 : 1;
    case ItemKind::GAP:
        return (size_t)((item.end - 1) / GAP_ROW_BYTES - item.addr / GAP_ROW_BYTES + 1);
    default:
        return 1;
    }
}

/* Entry or gap covering addr */
std::optional<size_t> ListingSource::item_at(uint64_t addr) const
{
    auto it = std::upper_bound(items_.begin(), items_.end(), addr,
                               [](uint64_t a, const Item &i) { return a < i.addr; });
    while (it != items_.begin()) {
        const Item &item = *--it;
        if (item.kind == ItemKind::SECTION_START) continue;
        if (item.kind == ItemKind::SECTION_END || addr >= item.end) break;
        return (size_t)(it - items_.begin());
    }
    return std::nullopt;
}

size_t ListingSource::first_row(size_t item) const
{
    const Checkpoint &cp = checkpoints_[item / CHECKPOINT_STRIDE];
    size_t row = cp.row;
    for (size_t j = cp.item; j < item; j++)
        row += item_rows(items_[j]);
    return row;
}

size_t ListingSource::row_for(uint64_t addr) const
{
    if (items_.empty()) return 0;

    if (auto idx = item_at(addr)) {
        const Item &item = items_[*idx];
        size_t row = first_row(*idx);
        if (item.kind == ItemKind::GAP)
            row += (size_t)(addr / GAP_ROW_BYTES - item.addr / GAP_ROW_BYTES);
        return row;
    }

    /* Outside code: the next entry or gap, else the last row */
    auto it = std::upper_bound(items_.begin(), items_.end(), addr,
                               [](uint64_t a, const Item &i) { return a < i.addr; });
    for (; it != items_.end(); ++it)
        if (it->kind == ItemKind::ENTRY || it->kind == ItemKind::GAP)
            return first_row((size_t)(it - items_.begin()));
    return rows_ - 1;
}

std::optional<size_t> ListingSource::row_of_entry(uint64_t addr) const
{
    auto idx = item_at(addr);
    if (!idx || items_[*idx].kind != ItemKind::ENTRY || items_[*idx].addr != addr)
        return std::nullopt;
    return first_row(*idx);
}

Row ListingSource::row(size_t index) const
{
    if (index >= rows_) return Row{};

    auto it = std::upper_bound(checkpoints_.begin(), checkpoints_.end(), index,
                               [](size_t r, const Checkpoint &cp) { return r < cp.row; });
    const Checkpoint &cp = *std::prev(it);

    size_t r = cp.row;
    for (size_t j = cp.item; j < items_.size(); j++) {
        size_t n = item_rows(items_[j]);
        if (index < r + n)
            return item_row(items_[j], index - r, index);
        r += n;
    }
    return Row{};
}

Row ListingSource::item_row(const Item &item, size_t sub, size_t index) const
{
    if (item.kind == ItemKind::ENTRY)
        return entry_row(item.entry, sub == 0 && item_rows(item) == 2, index);

    unsigned digits = an_.arch ? an_.arch->addr_digits : 8;
    const image::Section &sec = *item.section;

    Row row;
    row.index = index;

    if (item.kind == ItemKind::GAP) {
        uint64_t line = item.addr / GAP_ROW_BYTES + sub;
        uint64_t start = std::max(item.addr, line * GAP_ROW_BYTES);
        uint64_t end = std::min(item.end, (line + 1) * GAP_ROW_BYTES);

        row.kind = RowKind::BYTES;
        row.address = start;
        row.location = vault_.lookup(start);
        row.tokens.push_back(make_token(Kind::ADDRESS, tokens::format_address(start, digits)));
        row.tokens.push_back(make_token(Kind::DELIMITER, "  "));

        std::string hex;
        char buf[4];
        for (uint64_t a = start; a < end; a++) {
            uint64_t off = a - sec.start;
            uint8_t b = off < sec.bytes.size() ? sec.bytes[(size_t)off] : 0;
            snprintf(buf, sizeof(buf), "%02x", b);
            if (!hex.empty()) hex += ' ';
            hex += buf;
        }
        row.tokens.push_back(make_token(Kind::BYTES, std::move(hex)));
        return row;
    }

    row.kind = RowKind::SECTION;
    row.address = item.addr;
    std::string text = item.kind == ItemKind::SECTION_START
        ? "; section " + sec.name + " " + tokens::format_address(sec.start, digits) +
          "-" + tokens::format_address(sec.end(), digits)
        : "; end of section " + sec.name;
    row.tokens.push_back(make_token(Kind::COMMENT, std::move(text)));
    return row;
}

Row ListingSource::entry_row(size_t entry, bool label, size_t index) const
{
    const arch::Instruction &insn = an_.stream[entry];

    Row row;
    row.address = insn.address;
    row.index = index;
    row.location = vault_.lookup(insn.address);

    if (label) {
        row.kind = RowKind::LABEL;
        Token t = make_token(Kind::LABEL, std::string(vault_.symbol_at(insn.address)) + ":");
        t.has_target = true;
        t.target = insn.address;
        row.tokens.push_back(std::move(t));
        return row;
    }

    row.kind = insn.is_error ? RowKind::ERROR : RowKind::INSTRUCTION;
    row.tokens.push_back(make_token(Kind::ADDRESS,
                                    tokens::format_address(insn.address, an_.arch->addr_digits)));
    row.tokens.push_back(make_token(Kind::DELIMITER, "  "));

    std::string bytes = tokens::format_bytes(insn);
    size_t width = an_.arch->max_insn_size > 4 ? 20 : 11;
    if (bytes.size() < width)
        bytes.append(width - bytes.size(), ' ');
    row.tokens.push_back(make_token(Kind::BYTES, std::move(bytes)));
    row.tokens.push_back(make_token(Kind::DELIMITER, "  "));

    auto body = tokens::tokenize(*an_.arch, insn, &resolver_);
    row.tokens.insert(row.tokens.end(), body.begin(), body.end());
    return row;
}

/* ======================================================================== */
/* Hex source                                                                */
/* ======================================================================== */

HexSource::HexSource(const image::Image &image)
    : image_(image)
{
    const arch::Arch *a = arch::arch_for_machine(image.machine);
    digits_ = a ? a->addr_digits : 8;

    for (auto &sec : image_.sections) {
        uint64_t start = sec.start & ~(uint64_t)(HEX_ROW_BYTES - 1);
        uint64_t end = (sec.end() + HEX_ROW_BYTES - 1) & ~(uint64_t)(HEX_ROW_BYTES - 1);
        if (start == end) continue;
        if (!spans_.empty() && start < spans_.back().end) {
            spans_.back().end = std::max(spans_.back().end, end);
            continue;
        }
        spans_.push_back({0, start, end});
    }

    size_t row = 0;
    for (auto &sp : spans_) {
        sp.first_row = row;
        row += (size_t)((sp.end - sp.start) / HEX_ROW_BYTES);
    }
    rows_ = row;
}

size_t HexSource::row_for(uint64_t addr) const
{
    if (spans_.empty()) return 0;

    auto it = std::upper_bound(spans_.begin(), spans_.end(), addr,
                               [](uint64_t a, const Span &s) { return a < s.start; });
    if (it != spans_.begin()) {
        const Span &sp = *std::prev(it);
        if (addr < sp.end)
            return sp.first_row + (size_t)((addr - sp.start) / HEX_ROW_BYTES);
    }
    if (it == spans_.end())
        return rows_ - 1;
    return it->first_row;
}

Row HexSource::row(size_t index) const
{
    if (index >= rows_) return Row{};

    auto it = std::upper_bound(spans_.begin(), spans_.end(), index,
                               [](size_t r, const Span &s) { return r < s.first_row; });
    const Span &sp = *std::prev(it);

    Row row;
    row.kind = RowKind::BYTES;
    row.index = index;
    row.address = sp.start + (uint64_t)(index - sp.first_row) * HEX_ROW_BYTES;

    row.tokens.push_back(make_token(Kind::ADDRESS,
                                    tokens::format_address(row.address, digits_)));
    row.tokens.push_back(make_token(Kind::DELIMITER, "  "));

    std::string hex, ascii;
    char buf[4];
    for (unsigned i = 0; i < HEX_ROW_BYTES; i++) {
        uint64_t a = row.address + i;
        if (i) hex += ' ';
        const image::Section *sec = image_.section_for(a);
        if (!sec) {
            hex += "  ";
            ascii += ' ';
            continue;
        }
        uint64_t off = a - sec->start;
        uint8_t b = off < sec->bytes.size() ? sec->bytes[(size_t)off] : 0;
        snprintf(buf, sizeof(buf), "%02x", b);
        hex += buf;
        ascii += (b >= 0x20 && b < 0x7f) ? (char)b : '.';
    }
    row.tokens.push_back(make_token(Kind::BYTES, std::move(hex)));
    row.tokens.push_back(make_token(Kind::DELIMITER, "  "));
    row.tokens.push_back(make_token(Kind::COMMENT, std::move(ascii)));
    return row;
}

} // namespace scroll
