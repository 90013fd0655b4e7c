#pragma once

// Internal header — not installed.
// Myers O(ND) sequence alignment with the linear-space "middle snake"
// bisection, generic over the element comparison.

#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

namespace jsondelta_cpp::detail {

enum class EditKind : std::uint8_t { equal, remove, insert };

/// One run of an edit script. Old range for equal/remove, new range for
/// equal/insert; the other range is empty at the matching position.
struct Edit {
    EditKind kind;
    std::size_t old_begin;
    std::size_t old_end;
    std::size_t new_begin;
    std::size_t new_end;

    auto operator==(const Edit&) const -> bool = default;
};

/// Aligns two sequences known only by length. eq(i, j) compares element i
/// of the old sequence with element j of the new one.
template <typename Eq>
class MyersDiff {
public:
    MyersDiff(std::size_t old_size, std::size_t new_size, Eq eq)
        : old_size_{old_size}, new_size_{new_size}, eq_{std::move(eq)} {}

    auto run() -> std::vector<Edit> {
        edits_.clear();
        diff(0, old_size_, 0, new_size_);
        return std::move(edits_);
    }

private:
    using Index = std::ptrdiff_t;

    void emit(EditKind kind, std::size_t a0, std::size_t a1, std::size_t b0, std::size_t b1) {
        if (a0 == a1 && b0 == b1) return;
        if (!edits_.empty()) {
            auto& last = edits_.back();
            if (last.kind == kind && last.old_end == a0 && last.new_end == b0) {
                last.old_end = a1;
                last.new_end = b1;
                return;
            }
        }
        edits_.push_back(Edit{kind, a0, a1, b0, b1});
    }

    // Strip the common prefix and suffix, then align the middle.
    void diff(std::size_t a0, std::size_t a1, std::size_t b0, std::size_t b1) {
        auto prefix = std::size_t{0};
        while (a0 + prefix < a1 && b0 + prefix < b1 && eq_(a0 + prefix, b0 + prefix)) {
            ++prefix;
        }
        emit(EditKind::equal, a0, a0 + prefix, b0, b0 + prefix);
        a0 += prefix;
        b0 += prefix;

        auto suffix = std::size_t{0};
        while (a1 - suffix > a0 && b1 - suffix > b0 && eq_(a1 - suffix - 1, b1 - suffix - 1)) {
            ++suffix;
        }
        compute(a0, a1 - suffix, b0, b1 - suffix);
        emit(EditKind::equal, a1 - suffix, a1, b1 - suffix, b1);
    }

    void compute(std::size_t a0, std::size_t a1, std::size_t b0, std::size_t b1) {
        if (a0 == a1) {
            emit(EditKind::insert, a0, a0, b0, b1);
            return;
        }
        if (b0 == b1) {
            emit(EditKind::remove, a0, a1, b0, b0);
            return;
        }
        bisect(a0, a1, b0, b1);
    }

    void split(std::size_t a0, std::size_t a1, std::size_t b0, std::size_t b1, Index x, Index y) {
        diff(a0, a0 + static_cast<std::size_t>(x), b0, b0 + static_cast<std::size_t>(y));
        diff(a0 + static_cast<std::size_t>(x), a1, b0 + static_cast<std::size_t>(y), b1);
    }

    // Walk the forward and reverse paths until they overlap, then split the
    // problem at the middle snake (Myers 1986, section 4b).
    void bisect(std::size_t a0, std::size_t a1, std::size_t b0, std::size_t b1) {
        const auto n = static_cast<Index>(a1 - a0);
        const auto m = static_cast<Index>(b1 - b0);
        const auto max_d = (n + m + 1) / 2;
        const auto v_offset = max_d;
        const auto v_length = 2 * max_d + 2;
        auto v1 = std::vector<Index>(static_cast<std::size_t>(v_length), -1);
        auto v2 = std::vector<Index>(static_cast<std::size_t>(v_length), -1);
        v1[static_cast<std::size_t>(v_offset + 1)] = 0;
        v2[static_cast<std::size_t>(v_offset + 1)] = 0;

        const auto delta = n - m;
        // With an odd delta the forward path is the one that meets the reverse path.
        const auto front = (delta % 2 != 0);

        auto at = [](std::vector<Index>& v, Index i) -> Index& { return v[static_cast<std::size_t>(i)]; };

        Index k1start = 0;
        Index k1end = 0;
        Index k2start = 0;
        Index k2end = 0;

        for (Index d = 0; d < max_d; ++d) {
            for (auto k1 = -d + k1start; k1 <= d - k1end; k1 += 2) {
                const auto k1_offset = v_offset + k1;
                Index x1;
                if (k1 == -d || (k1 != d && at(v1, k1_offset - 1) < at(v1, k1_offset + 1))) {
                    x1 = at(v1, k1_offset + 1);
                } else {
                    x1 = at(v1, k1_offset - 1) + 1;
                }
                auto y1 = x1 - k1;
                while (x1 < n && y1 < m &&
                       eq_(a0 + static_cast<std::size_t>(x1), b0 + static_cast<std::size_t>(y1))) {
                    ++x1;
                    ++y1;
                }
                at(v1, k1_offset) = x1;
                if (x1 > n) {
                    k1end += 2;  // ran off the right of the graph
                } else if (y1 > m) {
                    k1start += 2;  // ran off the bottom of the graph
                } else if (front) {
                    const auto k2_offset = v_offset + delta - k1;
                    if (k2_offset >= 0 && k2_offset < v_length && at(v2, k2_offset) != -1) {
                        const auto x2 = n - at(v2, k2_offset);
                        if (x1 >= x2) {
                            split(a0, a1, b0, b1, x1, y1);
                            return;
                        }
                    }
                }
            }

            for (auto k2 = -d + k2start; k2 <= d - k2end; k2 += 2) {
                const auto k2_offset = v_offset + k2;
                Index x2;
                if (k2 == -d || (k2 != d && at(v2, k2_offset - 1) < at(v2, k2_offset + 1))) {
                    x2 = at(v2, k2_offset + 1);
                } else {
                    x2 = at(v2, k2_offset - 1) + 1;
                }
                auto y2 = x2 - k2;
                while (x2 < n && y2 < m &&
                       eq_(a0 + static_cast<std::size_t>(n - x2 - 1),
                           b0 + static_cast<std::size_t>(m - y2 - 1))) {
                    ++x2;
                    ++y2;
                }
                at(v2, k2_offset) = x2;
                if (x2 > n) {
                    k2end += 2;  // ran off the left of the graph
                } else if (y2 > m) {
                    k2start += 2;  // ran off the top of the graph
                } else if (!front) {
                    const auto k1_offset = v_offset + delta - k2;
                    if (k1_offset >= 0 && k1_offset < v_length && at(v1, k1_offset) != -1) {
                        const auto x1 = at(v1, k1_offset);
                        const auto y1 = v_offset + x1 - k1_offset;
                        if (x1 >= n - x2) {
                            split(a0, a1, b0, b1, x1, y1);
                            return;
                        }
                    }
                }
            }
        }

        // No commonality at all.
        emit(EditKind::remove, a0, a1, b0, b0);
        emit(EditKind::insert, a1, a1, b0, b1);
    }

    std::size_t old_size_;
    std::size_t new_size_;
    Eq eq_;
    std::vector<Edit> edits_;
};

/// Edit script turning old[0, old_size) into new[0, new_size).
template <typename Eq>
auto myers_diff(std::size_t old_size, std::size_t new_size, Eq eq) -> std::vector<Edit> {
    return MyersDiff<Eq>{old_size, new_size, std::move(eq)}.run();
}

}  // namespace jsondelta_cpp::detail
