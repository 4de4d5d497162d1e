#include <gtest/gtest.h>
#include "StringSimilarity.hpp"

TEST(StringSimilarityTest, LevenshteinDistance) {
    EXPECT_EQ(levenshtein_distance("kitten", "sitting"), 3u);
    EXPECT_EQ(levenshtein_distance("", "abc"), 3u);
    EXPECT_EQ(levenshtein_distance("abc", "abc"), 0u);
    EXPECT_EQ(levenshtein_distance("flaw", "lawn"), 2u);
}

TEST(StringSimilarityTest, BoundedAndExactOnIdentity) {
    EXPECT_DOUBLE_EQ(similarity("good", "good"), 1.0);
    EXPECT_DOUBLE_EQ(similarity("", ""), 1.0);
    EXPECT_DOUBLE_EQ(similarity("abc", ""), 0.0);
    EXPECT_DOUBLE_EQ(similarity("abc", "xyz"), 0.0);
}

TEST(StringSimilarityTest, OneEditOnSevenLetters) {
    EXPECT_NEAR(similarity("amazng", "amazing"), 1.0 - 1.0 / 7.0, 1e-9);
    EXPECT_GE(similarity("terible", "terrible"), 0.8);
    EXPECT_LT(similarity("god", "good"), 0.8);
}

TEST(StringSimilarityTest, Symmetric) {
    const char* words[] = {"good", "goood", "amazing", "amazng", "", "x", "terrible", "horrible"};
    for (const char* a : words) {
        for (const char* b : words) {
            EXPECT_DOUBLE_EQ(similarity(a, b), similarity(b, a)) << a << " / " << b;
            double s = similarity(a, b);
            EXPECT_GE(s, 0.0);
            EXPECT_LE(s, 1.0);
        }
    }
}

TEST(StringSimilarityTest, UpperBoundNeverBelowActual) {
    const char* words[] = {"good", "goood", "amazing", "am", "", "excellent"};
    for (const char* a : words) {
        for (const char* b : words) {
            std::string sa(a), sb(b);
            EXPECT_GE(similarity_upper_bound(sa.size(), sb.size()) + 1e-12, similarity(sa, sb));
        }
    }
}
