#include "embedding_table.hpp"
#include "utils/errors.hpp"
#include "utils/tensor_utils.hpp"
#include <sstream>

EmbeddingInitializer gaussian_initializer(float scale, std::uint32_t seed) {
    return [scale, seed](int vocab_size, int embed_dim) {
        return tensor_utils::random_2d(vocab_size, embed_dim, scale, seed);
    };
}

EmbeddingInitializer hashed_initializer(float scale) {
    return [scale](int vocab_size, int embed_dim) {
        Eigen::MatrixXf res(vocab_size, embed_dim);

        for (int i = 0; i < vocab_size; ++i) {
            std::uint32_t x = static_cast<std::uint32_t>(i) + 1u;
            for (int j = 0; j < embed_dim; ++j) {
                // xorshift32
                x ^= x << 13;
                x ^= x >> 17;
                x ^= x << 5;
                // low 16 bits -> [0, 1] -> [-scale, scale]
                float unit = static_cast<float>(x & 0xffffu) / 65535.0f;
                res(i, j) = unit * 2.0f * scale - scale;
            }
        }
        return res;
    };
}

EmbeddingInitializer npy_initializer(const std::filesystem::path& path) {
    return [path](int, int) {
        try {
            return tensor_utils::load_2d_tensor(path);
        } catch (const std::exception& e) {
            throw std::runtime_error("Failed to load embeddings: " + std::string(e.what()));
        }
    };
}

EmbeddingTable::EmbeddingTable(int vocab_size, int embed_dim, const EmbeddingInitializer& init)
    : _vocab_size(vocab_size), _embed_dim(embed_dim) {
    if (vocab_size <= 0 || embed_dim <= 0) {
        std::ostringstream oss;
        oss << "EmbeddingTable: dimensions must be positive, got [" << vocab_size << ", " << embed_dim << "]";
        throw InvalidDimensionError(oss.str());
    }
    if (!init) throw std::invalid_argument("EmbeddingTable: no initializer given");

    _weights = init(vocab_size, embed_dim);
    tensor_utils::assert_tensor_shape(_weights, vocab_size, embed_dim, "embedding table");
}

int EmbeddingTable::wrap(int index) const {
    int r = index % _vocab_size;
    return r < 0 ? r + _vocab_size : r;
}

Eigen::MatrixXf EmbeddingTable::lookup(const std::vector<int>& indices) const {
    Eigen::MatrixXf x(static_cast<Eigen::Index>(indices.size()), _embed_dim);

    // gather: same as multiplying a one-hot matrix into the table, just cheaper
    for (int i = 0; i < static_cast<int>(indices.size()); ++i) {
        x.row(i) = _weights.row(wrap(indices[i]));
    }
    return x;
}

Eigen::RowVectorXf EmbeddingTable::row(int index) const {
    return _weights.row(wrap(index));
}
