#include <jsondelta-cpp/text_diff.hpp>
#include <jsondelta-cpp/json.hpp>

#include "myers.hpp"

#include <easylogging++.h>

#include <algorithm>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace jsondelta_cpp {

// =============================================================================
// UTF-8 <-> scalar values
// =============================================================================

namespace {

// Bytes outside well-formed sequences decode to base + byte so that they
// count as one position and re-encode to the same byte.
constexpr char32_t raw_byte_base = 0x110000;

auto is_continuation(unsigned char c) -> bool { return (c & 0xC0) == 0x80; }

auto decode_utf8(std::string_view text) -> std::u32string {
    auto out = std::u32string{};
    out.reserve(text.size());
    const auto n = text.size();
    std::size_t i = 0;
    while (i < n) {
        const auto c0 = static_cast<unsigned char>(text[i]);
        if (c0 < 0x80) {
            out.push_back(c0);
            ++i;
            continue;
        }

        auto len = std::size_t{0};
        auto lo = static_cast<unsigned char>(0x80);
        auto hi = static_cast<unsigned char>(0xBF);
        if (c0 >= 0xC2 && c0 <= 0xDF) {
            len = 2;
        } else if (c0 >= 0xE0 && c0 <= 0xEF) {
            len = 3;
            if (c0 == 0xE0) lo = 0xA0;  // overlong
            if (c0 == 0xED) hi = 0x9F;  // surrogates
        } else if (c0 >= 0xF0 && c0 <= 0xF4) {
            len = 4;
            if (c0 == 0xF0) lo = 0x90;  // overlong
            if (c0 == 0xF4) hi = 0x8F;  // beyond U+10FFFF
        }

        auto valid = len != 0 && i + len <= n;
        if (valid) {
            const auto c1 = static_cast<unsigned char>(text[i + 1]);
            valid = c1 >= lo && c1 <= hi;
            for (std::size_t k = 2; valid && k < len; ++k) {
                valid = is_continuation(static_cast<unsigned char>(text[i + k]));
            }
        }
        if (!valid) {
            out.push_back(raw_byte_base + c0);
            ++i;
            continue;
        }

        auto cp = static_cast<char32_t>(c0 & (0xFF >> (len + 1)));
        for (std::size_t k = 1; k < len; ++k) {
            cp = (cp << 6) | (static_cast<unsigned char>(text[i + k]) & 0x3F);
        }
        out.push_back(cp);
        i += len;
    }
    return out;
}

void append_utf8(std::string& out, char32_t cp) {
    if (cp >= raw_byte_base) {
        out.push_back(static_cast<char>(cp - raw_byte_base));
    } else if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

auto encode_utf8(const std::u32string& chars, std::size_t begin, std::size_t end) -> std::string {
    auto out = std::string{};
    out.reserve(end - begin);
    for (auto i = begin; i < end; ++i) {
        append_utf8(out, chars[i]);
    }
    return out;
}

void append_range(std::string& out, const std::u32string& chars, std::size_t begin, std::size_t end) {
    for (auto i = begin; i < end; ++i) {
        append_utf8(out, chars[i]);
    }
}

}  // namespace

auto char_count(std::string_view text) -> std::size_t {
    return decode_utf8(text).size();
}

// =============================================================================
// Diff
// =============================================================================

auto diff_text(std::string_view old_text, std::string_view new_text) -> std::vector<TextOp> {
    const auto a = decode_utf8(old_text);
    const auto b = decode_utf8(new_text);
    const auto edits = detail::myers_diff(a.size(), b.size(),
        [&](std::size_t i, std::size_t j) { return a[i] == b[j]; });

    auto ops = std::vector<TextOp>{};
    std::size_t i = 0;
    while (i < edits.size()) {
        if (edits[i].kind == detail::EditKind::equal) {
            ++i;
            continue;
        }
        // A run of non-equal edits covers one contiguous range on each side.
        auto old_range = TextRange{edits[i].old_begin, edits[i].old_begin};
        auto new_range = TextRange{edits[i].new_begin, edits[i].new_begin};
        while (i < edits.size() && edits[i].kind != detail::EditKind::equal) {
            old_range.end = std::max(old_range.end, edits[i].old_end);
            new_range.end = std::max(new_range.end, edits[i].new_end);
            ++i;
        }

        auto op = TextOp{};
        if (old_range.size() > 0 && new_range.size() > 0) {
            op.kind = TextOpKind::replace;
            op.old_range = old_range;
            op.new_range = new_range;
            op.old_text = encode_utf8(a, old_range.begin, old_range.end);
            op.new_text = encode_utf8(b, new_range.begin, new_range.end);
        } else if (old_range.size() > 0) {
            op.kind = TextOpKind::remove;
            op.old_range = old_range;
            op.old_text = encode_utf8(a, old_range.begin, old_range.end);
        } else {
            op.kind = TextOpKind::insert;
            op.new_range = new_range;
            op.new_text = encode_utf8(b, new_range.begin, new_range.end);
        }
        ops.push_back(std::move(op));
    }
    return ops;
}

// =============================================================================
// Apply / validate / invert
// =============================================================================

// Two cursors walk the old text and the text being built. Unchanged text
// between ops has the same length on both sides, which lets an insert
// (addressed in new positions) find its place in the old text.
auto apply_text_ops(std::string_view old_text, const std::vector<TextOp>& ops) -> std::string {
    const auto a = decode_utf8(old_text);
    const auto n = a.size();
    auto out = std::string{};
    out.reserve(old_text.size());
    std::size_t old_pos = 0;
    std::size_t new_pos = 0;

    for (const auto& op : ops) {
        switch (op.kind) {
            case TextOpKind::remove:
            case TextOpKind::replace: {
                const auto start = std::clamp(op.old_range.begin, old_pos, n);
                const auto stop = std::clamp(op.old_range.end, start, n);
                append_range(out, a, old_pos, start);
                new_pos += start - old_pos;
                old_pos = stop;
                if (op.kind == TextOpKind::replace) {
                    out += op.new_text;
                    new_pos += char_count(op.new_text);
                }
                break;
            }
            case TextOpKind::insert: {
                const auto gap = op.new_range.begin > new_pos ? op.new_range.begin - new_pos : 0;
                const auto take = std::min(gap, n - old_pos);
                append_range(out, a, old_pos, old_pos + take);
                old_pos += take;
                new_pos += take;
                out += op.new_text;
                new_pos += char_count(op.new_text);
                break;
            }
        }
    }
    append_range(out, a, old_pos, n);
    return out;
}

auto text_ops_match(std::string_view old_text, const std::vector<TextOp>& ops) -> bool {
    const auto a = decode_utf8(old_text);
    const auto n = a.size();
    std::size_t old_pos = 0;
    std::size_t new_pos = 0;

    for (const auto& op : ops) {
        if (op.kind == TextOpKind::insert) {
            if (op.new_range.begin < new_pos) return false;
            const auto gap = op.new_range.begin - new_pos;
            if (gap > n - old_pos) return false;
            old_pos += gap;
            new_pos = op.new_range.begin + char_count(op.new_text);
            continue;
        }
        const auto& r = op.old_range;
        if (r.begin < old_pos || r.end < r.begin || r.end > n) return false;
        if (encode_utf8(a, r.begin, r.end) != op.old_text) return false;
        new_pos += r.begin - old_pos;
        old_pos = r.end;
        if (op.kind == TextOpKind::replace) {
            new_pos += char_count(op.new_text);
        }
    }
    return true;
}

auto invert_text_ops(const std::vector<TextOp>& ops) -> std::vector<TextOp> {
    auto inverted = std::vector<TextOp>{};
    inverted.reserve(ops.size());
    for (const auto& op : ops) {
        auto inv = TextOp{};
        inv.old_range = op.new_range;
        inv.new_range = op.old_range;
        inv.old_text = op.new_text;
        inv.new_text = op.old_text;
        switch (op.kind) {
            case TextOpKind::insert:  inv.kind = TextOpKind::remove; break;
            case TextOpKind::remove:  inv.kind = TextOpKind::insert; break;
            case TextOpKind::replace: inv.kind = TextOpKind::replace; break;
        }
        inverted.push_back(std::move(inv));
    }
    return inverted;
}

// =============================================================================
// Wire format
// =============================================================================

void to_json(nlohmann::json& j, const TextOp& op) {
    auto range = [](const TextRange& r) { return nlohmann::json::array({r.begin, r.end}); };
    switch (op.kind) {
        case TextOpKind::remove:
            j = {{"op", "delete"}, {"range", range(op.old_range)}, {"text", op.old_text}};
            break;
        case TextOpKind::insert:
            j = {{"op", "insert"}, {"range", range(op.new_range)}, {"text", op.new_text}};
            break;
        case TextOpKind::replace:
            j = {{"op", "replace"},
                 {"old_range", range(op.old_range)},
                 {"new_range", range(op.new_range)},
                 {"old_text", op.old_text},
                 {"new_text", op.new_text}};
            break;
    }
}

void from_json(const nlohmann::json& j, TextOp& op) {
    auto range = [](const nlohmann::json& r) {
        return TextRange{r.at(0).get<std::size_t>(), r.at(1).get<std::size_t>()};
    };
    const auto kind = j.at("op").get<std::string>();
    op = TextOp{};
    if (kind == "delete") {
        op.kind = TextOpKind::remove;
        op.old_range = range(j.at("range"));
        op.old_text = j.value("text", std::string{});
    } else if (kind == "insert") {
        op.kind = TextOpKind::insert;
        op.new_range = range(j.at("range"));
        op.new_text = j.value("text", std::string{});
    } else if (kind == "replace") {
        op.kind = TextOpKind::replace;
        op.old_range = range(j.at("old_range"));
        op.new_range = range(j.at("new_range"));
        op.old_text = j.value("old_text", std::string{});
        op.new_text = j.value("new_text", std::string{});
    } else {
        throw std::invalid_argument{"unknown text op: " + kind};
    }
}

auto make_text_diff_delta(const std::vector<TextOp>& ops) -> Value {
    auto encoded = nlohmann::json::array();
    for (const auto& op : ops) {
        encoded.push_back(op);
    }
    auto payload = Object{};
    payload.emplace("text_diff", to_value(encoded));
    return Value{Array{Value{std::move(payload)}, Value{0}, Value{2}}};
}

auto read_text_ops(const Value& payload) -> std::vector<TextOp> {
    auto ops = std::vector<TextOp>{};
    const auto* list = payload.find("text_diff");
    if (!list || !list->is_array()) return ops;
    for (const auto& entry : *list->get_if<Array>()) {
        try {
            ops.push_back(to_json_value(entry).get<TextOp>());
        } catch (const nlohmann::json::exception& e) {
            LOG(DEBUG) << "skipping malformed text op: " << e.what();
        } catch (const std::invalid_argument& e) {
            LOG(DEBUG) << "skipping malformed text op: " << e.what();
        }
    }
    return ops;
}

}  // namespace jsondelta_cpp
