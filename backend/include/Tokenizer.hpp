#pragma once
// Tokenizer.hpp
// Splits raw feedback into candidate tokens
// Censor symbols (* @ # $ % ^ & _) stay inside tokens so "f***" and "f@ck" survive
// into normalization; every emoji code point becomes a token of its own

#include <string>
#include <vector>

// Split on whitespace and punctuation. Empty input gives an empty list
std::vector<std::string> tokenize(const std::string& text);

// Characters kept inside a token even though they are punctuation
bool is_censor_symbol(char c);

// True when the token is exactly one emoji code point
bool is_emoji_token(const std::string& token);

// True when the token has at least one letter or digit (ASCII or any non-ASCII code point)
bool contains_word_character(const std::string& token);

// Strip ASCII whitespace from both ends
std::string trim(const std::string& text);
