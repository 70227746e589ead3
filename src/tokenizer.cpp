#include "tokenizer.hpp"
#include "utils/errors.hpp"
#include <cctype>
#include <sstream>

std::uint32_t fnv1a_32(const std::string& s) {
    constexpr std::uint32_t FNV_OFFSET = 2166136261u;
    constexpr std::uint32_t FNV_PRIME = 16777619u;

    std::uint32_t h = FNV_OFFSET;
    for (unsigned char c : s) {
        h ^= c;
        h *= FNV_PRIME;
    }
    return h;
}

HashTokenizer::HashTokenizer(int vocab_size) : _vocab_size(vocab_size) {
    if (vocab_size <= 0) {
        throw InvalidDimensionError("HashTokenizer: vocab_size must be positive, got " + std::to_string(vocab_size));
    }
}

std::vector<std::string> HashTokenizer::split_words(const std::string& text) const {
    std::string lowered;
    lowered.reserve(text.size());
    // ASCII lowering only, multi-byte sequences pass through untouched
    for (unsigned char c : text) lowered.push_back(static_cast<char>(std::tolower(c)));

    std::vector<std::string> words;
    std::istringstream iss(lowered);
    std::string word;
    while (iss >> word) words.push_back(word);
    return words;
}

int HashTokenizer::token_id(const std::string& word) const {
    return static_cast<int>(fnv1a_32(word) % static_cast<std::uint32_t>(_vocab_size));
}

std::vector<int> HashTokenizer::tokenize(const std::string& text) const {
    std::vector<int> tokens;
    for (const auto& word : split_words(text)) tokens.push_back(token_id(word));
    return tokens;
}
