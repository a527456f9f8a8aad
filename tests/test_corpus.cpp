#include "ocrscore/corpus.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace fs = std::filesystem;
using namespace ocrscore;

namespace {

constexpr std::size_t kLimit = 1024;

class CorpusTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() /
               ("ocrscore_corpus_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(dir_);
        fs::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    std::string write(const std::string& name, const std::string& content) {
        fs::path path = dir_ / name;
        std::ofstream out(path, std::ios::binary);
        out << content;
        return path.string();
    }

    bool has_warning(const Corpus& corpus, const std::string& fragment) const {
        return std::any_of(corpus.warnings.begin(), corpus.warnings.end(),
                           [&fragment](const std::string& w) { return w.find(fragment) != std::string::npos; });
    }

    fs::path dir_;
};

} // namespace

TEST(ExtractModelName, StripsSuffixes) {
    EXPECT_EQ(extract_model_name("google_vision_out.txt"), "google_vision");
    EXPECT_EQ(extract_model_name("tesseract_out.txt"), "tesseract");
    EXPECT_EQ(extract_model_name("notes.txt"), "notes");
    EXPECT_EQ(extract_model_name("model_out"), "model");
}

TEST_F(CorpusTest, LoadsGroundTruthAndCandidates) {
    std::vector<std::string> paths = {
        write("gt.txt", "The quick brown fox"),
        write("tesseract_out.txt", "The quik brown"),
        write("abbyy_out.txt", "The quick brown fox"),
    };
    Corpus corpus = load_corpus(paths, kLimit);
    ASSERT_TRUE(corpus.complete());
    EXPECT_EQ(*corpus.ground_truth, "The quick brown fox");
    ASSERT_EQ(corpus.candidates.size(), 2u);
    EXPECT_EQ(corpus.candidates[0].name, "tesseract");
    EXPECT_EQ(corpus.candidates[0].text, "The quik brown");
    EXPECT_EQ(corpus.candidates[1].name, "abbyy");
    EXPECT_TRUE(corpus.warnings.empty());
}

TEST_F(CorpusTest, SkipsUnsupportedNames) {
    std::vector<std::string> paths = {
        write("gt.txt", "text"),
        write("a_out.txt", "text"),
        write("scan.pdf", "%PDF"),
        write("readme.txt", "notes"),
    };
    Corpus corpus = load_corpus(paths, kLimit);
    EXPECT_TRUE(corpus.complete());
    EXPECT_EQ(corpus.candidates.size(), 1u);
    EXPECT_TRUE(has_warning(corpus, "Skipping 'scan.pdf': Only .txt files are supported"));
    EXPECT_TRUE(has_warning(corpus, "Skipping 'readme.txt'"));
}

TEST_F(CorpusTest, RejectsInvalidUtf8) {
    std::vector<std::string> paths = {
        write("gt.txt", "fine"),
        write("bad_out.txt", std::string("caf\xE9", 4)),
    };
    Corpus corpus = load_corpus(paths, kLimit);
    EXPECT_FALSE(corpus.complete());
    EXPECT_TRUE(has_warning(corpus, "Error reading 'bad_out.txt': File must be UTF-8 encoded"));
    EXPECT_TRUE(has_warning(corpus, "No model output files found"));
}

TEST_F(CorpusTest, RejectsOversizedFiles) {
    std::vector<std::string> paths = {
        write("gt.txt", std::string(kLimit + 1, 'a')),
        write("m_out.txt", "a"),
    };
    Corpus corpus = load_corpus(paths, kLimit);
    EXPECT_FALSE(corpus.ground_truth.has_value());
    EXPECT_TRUE(has_warning(corpus, "File is too large"));
    EXPECT_TRUE(has_warning(corpus, "Ground truth file 'gt.txt' not found"));
}

TEST_F(CorpusTest, EmptyPathList) {
    Corpus corpus = load_corpus({}, kLimit);
    EXPECT_FALSE(corpus.complete());
    EXPECT_FALSE(corpus.warnings.empty());
}

TEST_F(CorpusTest, DirectoryIsReadInFilenameOrder) {
    write("zeta_out.txt", "z");
    write("gt.txt", "g");
    write("alpha_out.txt", "a");
    fs::create_directories(dir_ / "nested_out.txt");
    Corpus corpus = load_corpus_directory(dir_.string(), kLimit);
    ASSERT_TRUE(corpus.complete());
    ASSERT_EQ(corpus.candidates.size(), 2u);
    EXPECT_EQ(corpus.candidates[0].name, "alpha");
    EXPECT_EQ(corpus.candidates[1].name, "zeta");
}

TEST_F(CorpusTest, MissingDirectoryThrows) {
    EXPECT_THROW(load_corpus_directory((dir_ / "missing").string(), kLimit), std::runtime_error);
}

TEST_F(CorpusTest, ReadTextFileErrors) {
    EXPECT_THROW(read_text_file((dir_ / "absent.txt").string(), kLimit), std::runtime_error);
    std::string path = write("gt.txt", "");
    EXPECT_EQ(read_text_file(path, kLimit), "");
}
