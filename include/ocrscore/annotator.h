#pragma once

#include "types.h"

#include <vector>

namespace ocrscore {

// Reattach alignment outcomes to the tokens of one side, in original order.
//
// Outcomes for each normalized word are handed out in the order the matcher
// produced them (exact, then fuzzy, then unmatched). Throws std::logic_error
// if a token finds no outcome left for its word, or if outcomes remain after
// the last token: either means tokens and alignment do not belong together.
std::vector<Annotation> annotate(const std::vector<Token>& tokens, const Alignment& alignment, Side side);

} // namespace ocrscore
