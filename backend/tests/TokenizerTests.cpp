#include <gtest/gtest.h>
#include "Tokenizer.hpp"

using Tokens = std::vector<std::string>;

TEST(TokenizerTest, EmptyAndBlankInput) {
    EXPECT_TRUE(tokenize("").empty());
    EXPECT_TRUE(tokenize("   \t\n").empty());
    EXPECT_TRUE(tokenize("!!! ... ,,,").empty());
}

TEST(TokenizerTest, SplitsOnWhitespaceAndPunctuation) {
    EXPECT_EQ(tokenize("Your product is amazing!!!"), (Tokens{"Your", "product", "is", "amazing"}));
    EXPECT_EQ(tokenize("hello,world.again"), (Tokens{"hello", "world", "again"}));
    EXPECT_EQ(tokenize("don't"), (Tokens{"don", "t"}));
}

TEST(TokenizerTest, KeepsCensorSymbolsInsideTokens) {
    EXPECT_EQ(tokenize("f*ck this"), (Tokens{"f*ck", "this"}));
    EXPECT_EQ(tokenize("f@ck, f***!"), (Tokens{"f@ck", "f***"}));
    EXPECT_EQ(tokenize("$hit #$%^& a_b"), (Tokens{"$hit", "#$%^&", "a_b"}));
}

TEST(TokenizerTest, EmojiBecomeTheirOwnTokens) {
    const std::string finger = "\xF0\x9F\x96\x95";       // U+1F595
    const std::string thumbs = "\xF0\x9F\x91\x8D";       // U+1F44D
    const std::string skin = "\xF0\x9F\x8F\xBB";         // U+1F3FB

    EXPECT_EQ(tokenize(finger), (Tokens{finger}));
    EXPECT_EQ(tokenize("nice" + thumbs + "app"), (Tokens{"nice", thumbs, "app"}));
    EXPECT_EQ(tokenize("you " + finger + skin), (Tokens{"you", finger, skin}));
}

TEST(TokenizerTest, DropsEmojiPresentationSelector) {
    const std::string heart = "\xE2\x9D\xA4";            // U+2764
    EXPECT_EQ(tokenize(heart + "\xEF\xB8\x8F"), (Tokens{heart}));
}

TEST(TokenizerTest, NonAsciiLettersStayInWords) {
    EXPECT_EQ(tokenize("caf\xC3\xA9 ok"), (Tokens{"caf\xC3\xA9", "ok"}));
    // U+2019 right single quotation mark separates like an apostrophe
    EXPECT_EQ(tokenize("it\xE2\x80\x99s"), (Tokens{"it", "s"}));
}

TEST(TokenizerTest, InvalidUtf8ActsAsSeparator) {
    EXPECT_EQ(tokenize("ab\xFF" "cd"), (Tokens{"ab", "cd"}));
    EXPECT_EQ(tokenize("ab\xF0\x9F"), (Tokens{"ab"}));
}

TEST(TokenizerTest, SameInputSameTokens) {
    const std::string text = "Th1s is gooood f@ck \xF0\x9F\x96\x95 caf\xC3\xA9";
    EXPECT_EQ(tokenize(text), tokenize(text));
}

TEST(TokenizerTest, EmojiTokenDetection) {
    EXPECT_TRUE(is_emoji_token("\xF0\x9F\x96\x95"));
    EXPECT_FALSE(is_emoji_token("\xF0\x9F\x96\x95\xF0\x9F\x96\x95"));
    EXPECT_FALSE(is_emoji_token("a"));
    EXPECT_FALSE(is_emoji_token(""));
}

TEST(TokenizerTest, WordCharacterDetection) {
    EXPECT_TRUE(contains_word_character("abc"));
    EXPECT_TRUE(contains_word_character("f***"));
    EXPECT_TRUE(contains_word_character("caf\xC3\xA9"));
    EXPECT_FALSE(contains_word_character("***"));
    EXPECT_FALSE(contains_word_character("\xF0\x9F\x96\x95"));
}

TEST(TokenizerTest, Trim) {
    EXPECT_EQ(trim("  hi there \n"), "hi there");
    EXPECT_EQ(trim(" \t "), "");
    EXPECT_EQ(trim(""), "");
}
