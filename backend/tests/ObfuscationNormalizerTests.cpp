#include <gtest/gtest.h>
#include "ObfuscationNormalizer.hpp"

class ObfuscationNormalizerTest : public ::testing::Test {
protected:
    ObfuscationNormalizer normalizer;
};

TEST_F(ObfuscationNormalizerTest, LowercasesAscii) {
    EXPECT_EQ(normalizer.normalize("HeLLo"), "hello");
}

TEST_F(ObfuscationNormalizerTest, SubstitutesCensorSymbols) {
    EXPECT_EQ(normalizer.normalize("f*ck"), "fck");
    EXPECT_EQ(normalizer.normalize("F*CK"), "fck");
    EXPECT_EQ(normalizer.normalize("f@ck"), "fack");
    EXPECT_EQ(normalizer.normalize("$hit"), "shit");
    EXPECT_EQ(normalizer.normalize("b#i%t^c&h"), "bitch");
    EXPECT_EQ(normalizer.normalize("a_b"), "ab");
}

TEST_F(ObfuscationNormalizerTest, CollapsesElongation) {
    EXPECT_EQ(normalizer.normalize("goooood"), "good");
    EXPECT_EQ(normalizer.normalize("GOOOOOD"), "good");
    EXPECT_EQ(normalizer.normalize("good"), "good");
    EXPECT_EQ(normalizer.normalize("better"), "better");
    EXPECT_EQ(normalizer.normalize("yesssss"), "yess");
}

TEST_F(ObfuscationNormalizerTest, SymbolOnlyTokenBecomesEmpty) {
    EXPECT_EQ(normalizer.normalize("***"), "");
    EXPECT_EQ(normalizer.normalize("#$%^&"), "s");
    EXPECT_EQ(normalizer.normalize(""), "");
}

TEST_F(ObfuscationNormalizerTest, EmojiPassThrough) {
    const std::string finger = "\xF0\x9F\x96\x95";
    EXPECT_EQ(normalizer.normalize(finger), finger);
}

TEST_F(ObfuscationNormalizerTest, StripsEdgePunctuation) {
    EXPECT_EQ(normalizer.normalize("--ok--"), "ok");
    EXPECT_EQ(normalizer.normalize("(great)"), "great");
    EXPECT_EQ(normalizer.normalize("well-made"), "well-made");
}

TEST_F(ObfuscationNormalizerTest, NonAsciiIsLeftAlone) {
    EXPECT_EQ(normalizer.normalize("CAF\xC3\xA9"), "caf\xC3\xA9");
    // Three U+2764 in a row are not collapsed byte-wise
    const std::string hearts = "\xE2\x9D\xA4\xE2\x9D\xA4\xE2\x9D\xA4";
    EXPECT_EQ(ObfuscationNormalizer::collapse_repeats(hearts, 2), hearts);
}

TEST_F(ObfuscationNormalizerTest, NormalizeIsIdempotent) {
    const char* samples[] = {
        "f*ck", "f@ck", "F***", "goooood", "GOOOOD!!", "a@@@a", "$$$hit", "@@@", "x#x#x",
        "--ok--", "aa-aaa-", "heLLLLo", "\xF0\x9F\x96\x95", "caf\xC3\xA9\xC3\xA9\xC3\xA9", "", "b_i_t_c_h"
    };
    for (const char* s : samples) {
        std::string once = normalizer.normalize(s);
        EXPECT_EQ(normalizer.normalize(once), once) << "input: " << s;
    }
}

TEST_F(ObfuscationNormalizerTest, Deterministic) {
    EXPECT_EQ(normalizer.normalize("Sh@@@@ttt"), normalizer.normalize("Sh@@@@ttt"));
}

TEST(ObfuscationNormalizerRulesTest, CollapseRepeats) {
    EXPECT_EQ(ObfuscationNormalizer::collapse_repeats("aaabbbccc", 1), "abc");
    EXPECT_EQ(ObfuscationNormalizer::collapse_repeats("aaabbbccc", 2), "aabbcc");
    EXPECT_EQ(ObfuscationNormalizer::collapse_repeats("abc", 2), "abc");
    EXPECT_EQ(ObfuscationNormalizer::collapse_repeats("", 2), "");
}

TEST(ObfuscationNormalizerRulesTest, CustomRules) {
    ObfuscationNormalizer custom({{'*', "u"}});
    EXPECT_EQ(custom.normalize("f*ck"), "fuck");
    // '@' has no rule here and is not at an edge, so it survives
    EXPECT_EQ(custom.normalize("f@ck"), "f@ck");
}

TEST(ObfuscationNormalizerRulesTest, FirstRuleForASymbolWins) {
    ObfuscationNormalizer custom({{'@', "o"}, {'@', "a"}});
    EXPECT_EQ(custom.normalize("f@x"), "fox");
}

TEST(ObfuscationNormalizerRulesTest, DefaultTable) {
    const auto& rules = ObfuscationNormalizer::default_rules();
    ASSERT_FALSE(rules.empty());
    EXPECT_EQ(rules.front().symbol, '@');
    EXPECT_EQ(rules.front().replacement, "a");
}
