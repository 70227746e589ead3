#pragma once
#include <Eigen/Dense>

struct AttentionResult {
    Eigen::RowVectorXf weights;   // [seq_len], non-negative, sums to 1
    Eigen::RowVectorXf context;   // [embed_dim], convex combination of the token rows
};

// Single head, single query. No projections: the query attends directly over the
// token embeddings, which act as both keys and values.
class AttentionEngine {
public:
    explicit AttentionEngine(int embed_dim);

    // embeddings: [seq_len, embed_dim], query: [embed_dim]
    // Throws EmptyInputError for seq_len == 0, InvalidDimensionError on a width mismatch.
    AttentionResult compute_attention(const Eigen::MatrixXf& embeddings, const Eigen::RowVectorXf& query) const;

    static Eigen::RowVectorXf softmax(const Eigen::RowVectorXf& x);

    int embed_dim() const { return _embed_dim; }
    float scale() const { return _scale; }

private:
    int _embed_dim;

    // sqrt(embed_dim), fixed here so dot products don't grow with the dimension
    float _scale;
};
