#pragma once

#include "types.h"

#include <string>
#include <unordered_set>
#include <vector>

namespace ocrscore {

// Split on runs of ASCII whitespace
std::vector<std::string> tokenize_whitespace(const std::string& text);

class TextNormalizer {
public:
    // Compiles the punctuation set once so the normalizer can be reused
    // across many texts (e.g. one ground truth against several candidates)
    explicit TextNormalizer(NormalizationConfig config = {});

    const NormalizationConfig& config() const { return config_; }

    // Normalize a single raw token
    // Returns an empty string when nothing survives punctuation stripping
    std::string normalize(const std::string& word) const;

    // Tokenize, normalize and drop tokens that normalize to nothing.
    // normalized[i] == tokens[i].normalized and tokens[i].position == i.
    TokenizedText tokenize_and_normalize(const std::string& text) const;

private:
    NormalizationConfig config_;
    std::unordered_set<char32_t> punctuation_;

    std::string strip_punctuation(const std::string& word) const;
};

TokenizedText tokenize_and_normalize(const std::string& text, const NormalizationConfig& config);

} // namespace ocrscore
