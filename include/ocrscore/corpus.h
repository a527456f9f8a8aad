#pragma once

#include "evaluator.h"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace ocrscore {

// Files named gt.txt and <model>_out.txt, read into memory
struct Corpus {
    std::optional<std::string> ground_truth;
    std::vector<CandidateText> candidates;
    std::vector<std::string> warnings;  // skipped files and missing pieces

    bool complete() const { return ground_truth.has_value() && !candidates.empty(); }
};

// "google_vision_out.txt" -> "google_vision"
std::string extract_model_name(const std::string& filename);

Corpus load_corpus(const std::vector<std::string>& paths, std::size_t max_bytes);
// All regular files of a directory, in filename order
Corpus load_corpus_directory(const std::string& directory, std::size_t max_bytes);

// Read a whole file; throws std::runtime_error if unreadable or over max_bytes
std::string read_text_file(const std::string& path, std::size_t max_bytes);

} // namespace ocrscore
