#include "attention.hpp"
#include "utils/errors.hpp"
#include <cmath>
#include <sstream>

AttentionEngine::AttentionEngine(int embed_dim) : _embed_dim(embed_dim) {
    if (embed_dim <= 0) {
        throw InvalidDimensionError("AttentionEngine: embed_dim must be positive, got " + std::to_string(embed_dim));
    }
    _scale = std::sqrt(static_cast<float>(embed_dim));
}

Eigen::RowVectorXf AttentionEngine::softmax(const Eigen::RowVectorXf& x) {
    Eigen::RowVectorXf exp_x = (x.array() - x.maxCoeff()).exp();  // for numerical stability
    return exp_x / exp_x.sum();
}

AttentionResult AttentionEngine::compute_attention(const Eigen::MatrixXf& embeddings, const Eigen::RowVectorXf& query) const {
    // Catch this before maxCoeff() on an empty vector, which is undefined.
    if (embeddings.rows() == 0) {
        throw EmptyInputError("compute_attention: empty token sequence");
    }
    if (embeddings.cols() != _embed_dim || query.size() != _embed_dim) {
        std::ostringstream oss;
        oss << "compute_attention: expected width " << _embed_dim
            << ", got embeddings [" << embeddings.rows() << ", " << embeddings.cols() << "]"
            << " and query [" << query.size() << "]";
        throw InvalidDimensionError(oss.str());
    }

    // 1. Raw scores: each token row dotted with the query, [seq_len]
    Eigen::RowVectorXf scores = (embeddings * query.transpose()).transpose() / _scale;

    // 2. Normalize (max subtracted inside softmax)
    AttentionResult res;
    res.weights = softmax(scores);

    // 3. Context = weighted sum of the token rows: [1, seq_len] x [seq_len, embed_dim]
    res.context = res.weights * embeddings;
    return res;
}
