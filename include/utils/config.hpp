#pragma once
#include <cstdint>

// Hashed vocab of 5000 words, 128 dim embeddings.

struct RankerConfig {
    int vocab_size = 5000;
    int embed_dim = 128;

    // embeddings and the initial query are drawn as N(0, 1) * init_scale
    float init_scale = 0.1f;
    std::uint32_t seed = 42;

    // added to the cosine denominator so a zero vector doesn't blow up
    float epsilon = 1e-8f;

    // feed filter defaults ("show top N ...", "hide ...")
    int default_top_k = 20;
    float filter_threshold = 0.5f;

    // throws InvalidDimensionError, see utils/errors.hpp
    void validate() const;
};
