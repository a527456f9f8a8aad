#include "ocrscore/corpus.h"
#include "ocrscore/unicode_utils.h"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace ocrscore {

namespace {

bool ends_with(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string format_megabytes(std::size_t bytes) {
    std::ostringstream out;
    out.setf(std::ios::fixed);
    out.precision(2);
    out << static_cast<double>(bytes) / (1024.0 * 1024.0) << "MB";
    return out.str();
}

} // namespace

std::string extract_model_name(const std::string& filename) {
    std::string name = ends_with(filename, ".txt") ? filename.substr(0, filename.size() - 4) : filename;
    if (ends_with(name, "_out")) {
        name.resize(name.size() - 4);
    }
    return name;
}

std::string read_text_file(const std::string& path, std::size_t max_bytes) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("Cannot open file: " + path);
    }
    in.seekg(0, std::ios::end);
    std::streamoff size = in.tellg();
    if (size < 0) {
        throw std::runtime_error("Cannot determine size of file: " + path);
    }
    if (static_cast<std::size_t>(size) > max_bytes) {
        throw std::runtime_error("File is too large (" + format_megabytes(static_cast<std::size_t>(size)) +
                                 "). Maximum size is " + format_megabytes(max_bytes));
    }
    in.seekg(0, std::ios::beg);
    std::string content(static_cast<std::size_t>(size), '\0');
    if (size > 0 && !in.read(&content[0], size)) {
        throw std::runtime_error("Error reading file: " + path);
    }
    return content;
}

Corpus load_corpus(const std::vector<std::string>& paths, std::size_t max_bytes) {
    Corpus corpus;

    if (paths.empty()) {
        corpus.warnings.push_back("No files given");
        return corpus;
    }

    for (const auto& path : paths) {
        std::string filename = fs::path(path).filename().string();

        if (!ends_with(filename, ".txt")) {
            corpus.warnings.push_back("Skipping '" + filename + "': Only .txt files are supported");
            continue;
        }
        bool is_ground_truth = filename == "gt.txt";
        if (!is_ground_truth && !ends_with(filename, "_out.txt")) {
            corpus.warnings.push_back("Skipping '" + filename +
                                      "': File must be either 'gt.txt' or '<model_name>_out.txt'");
            continue;
        }

        std::string content;
        try {
            content = read_text_file(path, max_bytes);
        } catch (const std::runtime_error& ex) {
            corpus.warnings.push_back("Error reading '" + filename + "': " + ex.what());
            continue;
        }
        if (!unicode::is_valid_utf8(content)) {
            corpus.warnings.push_back("Error reading '" + filename + "': File must be UTF-8 encoded");
            continue;
        }

        if (is_ground_truth) {
            corpus.ground_truth = std::move(content);
        } else {
            corpus.candidates.push_back({extract_model_name(filename), std::move(content)});
        }
    }

    if (!corpus.ground_truth) {
        corpus.warnings.push_back("Ground truth file 'gt.txt' not found");
    }
    if (corpus.candidates.empty()) {
        corpus.warnings.push_back("No model output files found (must be named '<model_name>_out.txt')");
    }

    return corpus;
}

Corpus load_corpus_directory(const std::string& directory, std::size_t max_bytes) {
    std::error_code ec;
    fs::directory_iterator it(directory, ec);
    if (ec) {
        throw std::runtime_error("Cannot read directory " + directory + ": " + ec.message());
    }

    std::vector<std::string> paths;
    for (const auto& entry : it) {
        if (entry.is_regular_file()) {
            paths.push_back(entry.path().string());
        }
    }
    std::sort(paths.begin(), paths.end());
    return load_corpus(paths, max_bytes);
}

} // namespace ocrscore
