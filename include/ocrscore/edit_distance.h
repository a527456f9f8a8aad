#pragma once

#include <cstddef>
#include <string>

namespace ocrscore {

// Levenshtein distance (unit cost insert/delete/substitute) over code points.
// UTF-8 overloads decode their arguments first; comparison is case-sensitive.
std::size_t edit_distance(const std::u32string& a, const std::u32string& b);
std::size_t edit_distance(const std::string& a, const std::string& b);

// Same metric, but gives up once the distance is known to exceed limit.
// Returns the exact distance when it is <= limit, limit + 1 otherwise.
std::size_t bounded_edit_distance(const std::u32string& a, const std::u32string& b, std::size_t limit);

} // namespace ocrscore
