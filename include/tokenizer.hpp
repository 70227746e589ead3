#pragma once
#include <cstdint>
#include <string>
#include <vector>

// 32-bit FNV-1a. Fixed so token ids (and therefore every score) are reproducible
// across runs and platforms, unlike std::hash.
std::uint32_t fnv1a_32(const std::string& s);

// No vocabulary file: every whitespace-delimited word hashes into [0, vocab_size).
// Collisions are accepted, that's the price of not maintaining a vocab.
class HashTokenizer {
public:
    explicit HashTokenizer(int vocab_size);

    // lower-cased words, split on whitespace. Same order/length as tokenize().
    std::vector<std::string> split_words(const std::string& text) const;

    // empty or whitespace-only text gives an empty sequence
    std::vector<int> tokenize(const std::string& text) const;

    int token_id(const std::string& word) const;

    int vocab_size() const { return _vocab_size; }

private:
    int _vocab_size;
};
