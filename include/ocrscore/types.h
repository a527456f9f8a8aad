#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace ocrscore {

// Python's string.punctuation
inline const char* const kDefaultPunctuation = "!\"#$%&'()*+,-./:;<=>?@[\\]^_`{|}~";

struct NormalizationConfig {
    bool case_sensitive = false;
    bool ignore_punctuation = true;
    std::string punctuation_chars = kDefaultPunctuation;  // UTF-8, one entry per code point
};

struct Token {
    std::string normalized;
    std::string original;
    std::size_t position = 0;  // index in the normalized sequence
};

struct TokenizedText {
    std::vector<std::string> normalized;
    std::vector<Token> tokens;
};

enum class MatchType {
    Exact,
    Fuzzy,
    GtOnly,
    OcrOnly
};

enum class Side {
    GroundTruth,
    Candidate
};

struct MatchRecord {
    MatchType type = MatchType::Exact;
    std::optional<std::string> gt_word;
    std::optional<std::string> ocr_word;
    std::optional<std::size_t> distance;

    static MatchRecord exact(const std::string& word);
    static MatchRecord fuzzy(const std::string& gt, const std::string& ocr, std::size_t distance);
    static MatchRecord gt_only(const std::string& gt);
    static MatchRecord ocr_only(const std::string& ocr);

    // Whether this record carries a participant from the given side
    bool involves(Side side) const;
    const std::optional<std::string>& word_on(Side side) const;
    const std::optional<std::string>& word_opposite(Side side) const;
};

struct Alignment {
    std::vector<MatchRecord> records;

    std::size_t count(MatchType type) const;
    bool empty() const { return records.empty(); }
};

struct Metrics {
    double precision = 0.0;
    double recall = 0.0;
    double f1 = 0.0;
    double avg_crr = 0.0;
    std::size_t exact_count = 0;
    std::size_t fuzzy_count = 0;
    std::size_t unmatched_gt = 0;
    std::size_t unmatched_ocr = 0;
    std::size_t total_gt = 0;
    std::size_t total_ocr = 0;
};

struct Annotation {
    std::string word;
    MatchType match_type = MatchType::Exact;
    std::optional<std::string> matched_with;
    std::optional<std::size_t> edit_distance;
};

const char* to_string(MatchType type);
std::optional<MatchType> match_type_from_string(const std::string& name);

} // namespace ocrscore
