#include "ocrscore/edit_distance.h"

#include <gtest/gtest.h>

using ocrscore::bounded_edit_distance;
using ocrscore::edit_distance;

TEST(EditDistance, IdenticalWordsAreZero) {
    EXPECT_EQ(edit_distance(std::string("brown"), std::string("brown")), 0u);
    EXPECT_EQ(edit_distance(std::string(""), std::string("")), 0u);
}

TEST(EditDistance, EmptyAgainstWordIsItsLength) {
    EXPECT_EQ(edit_distance(std::string(""), std::string("abc")), 3u);
    EXPECT_EQ(edit_distance(std::string("abcd"), std::string("")), 4u);
}

TEST(EditDistance, SingleEdits) {
    EXPECT_EQ(edit_distance(std::string("quick"), std::string("quik")), 1u);   // deletion
    EXPECT_EQ(edit_distance(std::string("quik"), std::string("quick")), 1u);   // insertion
    EXPECT_EQ(edit_distance(std::string("brown"), std::string("brawn")), 1u);  // substitution
}

TEST(EditDistance, ClassicExamples) {
    EXPECT_EQ(edit_distance(std::string("kitten"), std::string("sitting")), 3u);
    EXPECT_EQ(edit_distance(std::string("flaw"), std::string("lawn")), 2u);
    EXPECT_EQ(edit_distance(std::string("intention"), std::string("execution")), 5u);
    EXPECT_EQ(edit_distance(std::string("abc"), std::string("xyz")), 3u);
}

TEST(EditDistance, TranspositionCostsTwo) {
    EXPECT_EQ(edit_distance(std::string("ab"), std::string("ba")), 2u);
}

TEST(EditDistance, IsCaseSensitive) {
    EXPECT_EQ(edit_distance(std::string("The"), std::string("the")), 1u);
}

TEST(EditDistance, CountsCodePointsNotBytes) {
    // "café" vs "cafe": one substitution, although é is two bytes
    EXPECT_EQ(edit_distance(std::string("caf\xC3\xA9"), std::string("cafe")), 1u);
    EXPECT_EQ(edit_distance(std::string("\xC3\xBC"), std::string("")), 1u);
}

TEST(EditDistance, Symmetric) {
    EXPECT_EQ(edit_distance(std::string("recognition"), std::string("recogmtion")),
              edit_distance(std::string("recogmtion"), std::string("recognition")));
}

TEST(BoundedEditDistance, ExactWithinLimit) {
    EXPECT_EQ(bounded_edit_distance(U"kitten", U"sitting", 3), 3u);
    EXPECT_EQ(bounded_edit_distance(U"kitten", U"sitting", 5), 3u);
    EXPECT_EQ(bounded_edit_distance(U"same", U"same", 0), 0u);
}

TEST(BoundedEditDistance, CapsAtLimitPlusOne) {
    EXPECT_EQ(bounded_edit_distance(U"kitten", U"sitting", 2), 3u);
    EXPECT_EQ(bounded_edit_distance(U"kitten", U"sitting", 1), 2u);
    EXPECT_EQ(bounded_edit_distance(U"a", U"abcdef", 2), 3u);
    EXPECT_EQ(bounded_edit_distance(U"abcdef", U"uvwxyz", 0), 1u);
}

TEST(BoundedEditDistance, AgreesWithUnboundedBelowLimit) {
    const std::u32string words[] = {U"", U"a", U"ab", U"the", U"then", U"them", U"tehm", U"theme", U"thermal"};
    for (const auto& a : words) {
        for (const auto& b : words) {
            std::size_t full = edit_distance(a, b);
            for (std::size_t limit = 0; limit <= 8; ++limit) {
                std::size_t bounded = bounded_edit_distance(a, b, limit);
                if (full <= limit) {
                    EXPECT_EQ(bounded, full);
                } else {
                    EXPECT_EQ(bounded, limit + 1);
                }
            }
        }
    }
}
