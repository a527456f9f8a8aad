#include "ocrscore/edit_distance.h"
#include "ocrscore/unicode_utils.h"

#include <algorithm>
#include <numeric>
#include <vector>

namespace ocrscore {

namespace {

struct Span {
    const char32_t* data;
    std::size_t size;
};

// Common prefixes and suffixes never contribute to the distance
void trim_common(Span& a, Span& b) {
    while (a.size && b.size && *a.data == *b.data) {
        ++a.data, ++b.data, --a.size, --b.size;
    }
    while (a.size && b.size && a.data[a.size - 1] == b.data[b.size - 1]) {
        --a.size, --b.size;
    }
}

// Single-row Wagner-Fischer. When limit is set, stops as soon as every cell
// of a row exceeds it: each alignment path crosses every row, so the row
// minimum is a lower bound on the result.
std::size_t levenshtein(Span a, Span b, const std::size_t* limit) {
    trim_common(a, b);
    if (!a.size) {
        return b.size;
    }
    if (!b.size) {
        return a.size;
    }
    // keep the row over the shorter string
    if (b.size > a.size) {
        std::swap(a, b);
    }

    std::vector<std::size_t> row(b.size + 1);
    std::iota(row.begin(), row.end(), std::size_t{0});

    for (std::size_t i = 1; i <= a.size; ++i) {
        std::size_t diagonal = row[0];
        row[0] = i;
        std::size_t row_min = row[0];
        for (std::size_t j = 1; j <= b.size; ++j) {
            std::size_t above = row[j];
            std::size_t substitution = diagonal + (a.data[i - 1] == b.data[j - 1] ? 0 : 1);
            row[j] = std::min({above + 1, row[j - 1] + 1, substitution});
            diagonal = above;
            row_min = std::min(row_min, row[j]);
        }
        if (limit && row_min > *limit) {
            return *limit + 1;
        }
    }
    return row[b.size];
}

} // namespace

std::size_t edit_distance(const std::u32string& a, const std::u32string& b) {
    return levenshtein({a.data(), a.size()}, {b.data(), b.size()}, nullptr);
}

std::size_t edit_distance(const std::string& a, const std::string& b) {
    if (a == b) {
        return 0;
    }
    return edit_distance(unicode::to_code_points(a), unicode::to_code_points(b));
}

std::size_t bounded_edit_distance(const std::u32string& a, const std::u32string& b, std::size_t limit) {
    std::size_t length_gap = a.size() > b.size() ? a.size() - b.size() : b.size() - a.size();
    if (length_gap > limit) {
        return limit + 1;
    }
    std::size_t distance = levenshtein({a.data(), a.size()}, {b.data(), b.size()}, &limit);
    return distance > limit ? limit + 1 : distance;
}

} // namespace ocrscore
