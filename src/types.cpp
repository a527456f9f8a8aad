#include "ocrscore/types.h"

#include <algorithm>

namespace ocrscore {

MatchRecord MatchRecord::exact(const std::string& word) {
    MatchRecord record;
    record.type = MatchType::Exact;
    record.gt_word = word;
    record.ocr_word = word;
    record.distance = 0;
    return record;
}

MatchRecord MatchRecord::fuzzy(const std::string& gt, const std::string& ocr, std::size_t distance) {
    MatchRecord record;
    record.type = MatchType::Fuzzy;
    record.gt_word = gt;
    record.ocr_word = ocr;
    record.distance = distance;
    return record;
}

MatchRecord MatchRecord::gt_only(const std::string& gt) {
    MatchRecord record;
    record.type = MatchType::GtOnly;
    record.gt_word = gt;
    return record;
}

MatchRecord MatchRecord::ocr_only(const std::string& ocr) {
    MatchRecord record;
    record.type = MatchType::OcrOnly;
    record.ocr_word = ocr;
    return record;
}

bool MatchRecord::involves(Side side) const {
    switch (type) {
        case MatchType::Exact:
        case MatchType::Fuzzy:
            return true;
        case MatchType::GtOnly:
            return side == Side::GroundTruth;
        case MatchType::OcrOnly:
            return side == Side::Candidate;
    }
    return false;
}

const std::optional<std::string>& MatchRecord::word_on(Side side) const {
    return side == Side::GroundTruth ? gt_word : ocr_word;
}

const std::optional<std::string>& MatchRecord::word_opposite(Side side) const {
    return side == Side::GroundTruth ? ocr_word : gt_word;
}

std::size_t Alignment::count(MatchType type) const {
    return static_cast<std::size_t>(std::count_if(records.begin(), records.end(),
        [type](const MatchRecord& record) { return record.type == type; }));
}

const char* to_string(MatchType type) {
    switch (type) {
        case MatchType::Exact:
            return "exact";
        case MatchType::Fuzzy:
            return "fuzzy";
        case MatchType::GtOnly:
            return "gt_only";
        case MatchType::OcrOnly:
            return "ocr_only";
    }
    return "unknown";
}

std::optional<MatchType> match_type_from_string(const std::string& name) {
    if (name == "exact") return MatchType::Exact;
    if (name == "fuzzy") return MatchType::Fuzzy;
    if (name == "gt_only") return MatchType::GtOnly;
    if (name == "ocr_only") return MatchType::OcrOnly;
    return std::nullopt;
}

} // namespace ocrscore
