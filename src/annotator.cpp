#include "ocrscore/annotator.h"

#include <deque>
#include <stdexcept>
#include <string>
#include <unordered_map>

namespace ocrscore {

namespace {

const char* side_name(Side side) {
    return side == Side::GroundTruth ? "ground truth" : "candidate";
}

} // namespace

std::vector<Annotation> annotate(const std::vector<Token>& tokens, const Alignment& alignment, Side side) {
    std::unordered_map<std::string, std::deque<const MatchRecord*>> outcomes;
    std::size_t outstanding = 0;
    for (const auto& record : alignment.records) {
        if (!record.involves(side)) {
            continue;
        }
        outcomes[record.word_on(side).value_or("")].push_back(&record);
        ++outstanding;
    }

    std::vector<Annotation> annotations;
    annotations.reserve(tokens.size());

    for (const auto& token : tokens) {
        auto it = outcomes.find(token.normalized);
        if (it == outcomes.end() || it->second.empty()) {
            throw std::logic_error("No match outcome left for " + std::string(side_name(side)) +
                                   " word '" + token.normalized + "' at position " +
                                   std::to_string(token.position));
        }
        const MatchRecord* record = it->second.front();
        it->second.pop_front();
        --outstanding;

        Annotation annotation;
        annotation.word = token.original;
        annotation.match_type = record->type;
        annotation.matched_with = record->word_opposite(side);
        annotation.edit_distance = record->distance;
        annotations.push_back(std::move(annotation));
    }

    if (outstanding > 0) {
        throw std::logic_error(std::to_string(outstanding) + " " + side_name(side) +
                               " match outcome(s) left without a token");
    }

    return annotations;
}

} // namespace ocrscore
