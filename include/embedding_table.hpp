#pragma once
#include <Eigen/Dense>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <vector>

// Produces the [vocab_size, embed_dim] matrix. Swap this out to plug in pretrained vectors;
// nothing downstream cares where the numbers came from.
using EmbeddingInitializer = std::function<Eigen::MatrixXf(int vocab_size, int embed_dim)>;

// N(0, 1) * scale, same as the random placeholder table the ranker was prototyped with
EmbeddingInitializer gaussian_initializer(float scale, std::uint32_t seed);

// Every row is a xorshift32 stream seeded with (row + 1), mapped into [-scale, scale].
// Needs no seed and no storage, so two processes always agree on the table.
EmbeddingInitializer hashed_initializer(float scale);

// Pretrained vectors from a .npy file ([vocab_size, embed_dim] float32)
EmbeddingInitializer npy_initializer(const std::filesystem::path& path);

class EmbeddingTable {
public:
    // Throws InvalidDimensionError on non-positive dims or if the initializer hands back the wrong shape.
    EmbeddingTable(int vocab_size, int embed_dim, const EmbeddingInitializer& init);

    // One row per index, order preserved. Indices wrap modulo vocab_size (negatives too),
    // so any integer hash is a valid row.
    Eigen::MatrixXf lookup(const std::vector<int>& indices) const;

    Eigen::RowVectorXf row(int index) const;

    const Eigen::MatrixXf& weights() const { return _weights; }
    int vocab_size() const { return _vocab_size; }
    int embed_dim() const { return _embed_dim; }

private:
    int _vocab_size;
    int _embed_dim;

    // [vocab_size, embed_dim], never modified after construction
    Eigen::MatrixXf _weights;

    int wrap(int index) const;
};
