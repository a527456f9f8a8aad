#include "ocrscore/normalizer.h"
#include "ocrscore/unicode_utils.h"

#include <sstream>
#include <utility>

namespace {
using ocrscore::unicode::from_code_points;
using ocrscore::unicode::to_code_points;
using ocrscore::unicode::sanitize_utf8;
using ocrscore::unicode::to_lower;
}

namespace ocrscore {

std::vector<std::string> tokenize_whitespace(const std::string& text) {
    std::vector<std::string> tokens;

    if (text.empty()) {
        return tokens;
    }

    std::istringstream iss(text);
    std::string token;

    while (iss >> token) {
        tokens.push_back(token);
    }

    return tokens;
}

TextNormalizer::TextNormalizer(NormalizationConfig config) : config_(std::move(config)) {
    for (char32_t cp : to_code_points(config_.punctuation_chars)) {
        punctuation_.insert(cp);
    }
}

std::string TextNormalizer::strip_punctuation(const std::string& word) const {
    if (punctuation_.empty()) {
        return word;
    }
    std::u32string code_points = to_code_points(word);
    std::u32string kept;
    kept.reserve(code_points.size());
    for (char32_t cp : code_points) {
        if (punctuation_.count(cp) == 0) {
            kept.push_back(cp);
        }
    }
    // Leave untouched words byte-identical
    if (kept.size() == code_points.size()) {
        return word;
    }
    return from_code_points(kept);
}

std::string TextNormalizer::normalize(const std::string& word) const {
    std::string result = config_.ignore_punctuation ? strip_punctuation(word) : word;
    // Ill-formed bytes become U+FFFD on both paths, so equal-looking words match exactly
    return config_.case_sensitive ? sanitize_utf8(result) : to_lower(result);
}

TokenizedText TextNormalizer::tokenize_and_normalize(const std::string& text) const {
    TokenizedText result;
    std::vector<std::string> raw_tokens = tokenize_whitespace(text);
    result.normalized.reserve(raw_tokens.size());
    result.tokens.reserve(raw_tokens.size());

    for (auto& original : raw_tokens) {
        std::string normalized = normalize(original);
        // Punctuation-only tokens vanish from both sequences
        if (normalized.empty()) {
            continue;
        }
        Token token;
        token.normalized = normalized;
        token.original = std::move(original);
        token.position = result.normalized.size();
        result.normalized.push_back(std::move(normalized));
        result.tokens.push_back(std::move(token));
    }

    return result;
}

TokenizedText tokenize_and_normalize(const std::string& text, const NormalizationConfig& config) {
    return TextNormalizer(config).tokenize_and_normalize(text);
}

} // namespace ocrscore
