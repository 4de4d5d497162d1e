#pragma once
// StringSimilarity.hpp
// Edit-distance based closeness between two words, used for fuzzy lexicon lookups
// similarity(a, b) = 1 - levenshtein(a, b) / max(|a|, |b|), symmetric and in [0, 1]

#include <string>

// Minimum number of single-byte insertions, deletions and substitutions
size_t levenshtein_distance(const std::string& a, const std::string& b);

// 1.0 for identical strings (including two empty strings), 0.0 when nothing lines up
double similarity(const std::string& a, const std::string& b);

// Cheap upper bound on similarity from the lengths alone (edit distance >= length difference)
double similarity_upper_bound(size_t len_a, size_t len_b);
