#pragma once

#include "types.h"

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace ocrscore {

struct ScoreSettings {
    std::unordered_map<std::string, std::string> options;
    std::string pid;
    std::string settings_file;
    std::string gt_file;
    std::vector<std::string> ocr_files;  // --ocr may be repeated
    std::string input_dir;
    std::string request_file;
    std::string outfile;
    bool verbose = false;
    bool debug = false;

    std::string get(const std::string& key, const std::string& fallback = "") const;
    int get_int(const std::string& key, int fallback) const;
    bool get_bool(const std::string& key, bool fallback) const;
    bool has(const std::string& key) const { return options.count(key) > 0; }

    NormalizationConfig to_normalization_config() const;
    // Maximum fuzzy edit distance; rejects negative values
    std::size_t threshold() const;
    std::size_t max_file_bytes() const;
};

ScoreSettings parse_arguments(int argc, char** argv);
// Fill options not set on the command line from an XML settings file
ScoreSettings load_settings(const ScoreSettings& base);

} // namespace ocrscore
