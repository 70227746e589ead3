/**
 * @file test_attention.cpp
 * @brief Unit tests for scaled dot-product attention and cosine scoring
 */

#include <gtest/gtest.h>
#include <attention.hpp>
#include <scorer.hpp>
#include <utils/errors.hpp>
#include <utils/tensor_utils.hpp>
#include <cmath>

TEST(AttentionTest, ScaleIsSqrtDim) {
    AttentionEngine attn(128);
    EXPECT_FLOAT_EQ(attn.scale(), std::sqrt(128.0f));
    EXPECT_THROW(AttentionEngine(0), InvalidDimensionError);
}

TEST(AttentionTest, MatchesHandComputation) {
    AttentionEngine attn(4);

    Eigen::MatrixXf emb(3, 4);
    emb << 1, 0, 0, 0,
           0, 1, 0, 0,
           1, 1, 0, 0;
    Eigen::RowVectorXf q(4);
    q << 2, 0, 0, 0;

    // raw = [2, 0, 2] / sqrt(4) = [1, 0, 1]
    float e1 = std::exp(0.0f), e0 = std::exp(-1.0f);
    float sum = 2 * e1 + e0;

    AttentionResult res = attn.compute_attention(emb, q);
    ASSERT_EQ(res.weights.size(), 3);
    EXPECT_NEAR(res.weights(0), e1 / sum, 1e-6f);
    EXPECT_NEAR(res.weights(1), e0 / sum, 1e-6f);
    EXPECT_NEAR(res.weights(2), e1 / sum, 1e-6f);

    // context = w0 * [1,0,0,0] + w1 * [0,1,0,0] + w2 * [1,1,0,0]
    ASSERT_EQ(res.context.size(), 4);
    EXPECT_NEAR(res.context(0), (e1 + e1) / sum, 1e-6f);
    EXPECT_NEAR(res.context(1), (e0 + e1) / sum, 1e-6f);
    EXPECT_NEAR(res.context(2), 0.0f, 1e-7f);
}

TEST(AttentionTest, WeightsAreADistribution) {
    AttentionEngine attn(32);
    Eigen::RowVectorXf q = tensor_utils::random_1d(32, 0.1f, 11);

    for (int len : {1, 2, 5, 17, 24}) {
        Eigen::MatrixXf emb = tensor_utils::random_2d(len, 32, 0.1f, 100 + len);
        AttentionResult res = attn.compute_attention(emb, q);

        ASSERT_EQ(res.weights.size(), len);
        EXPECT_NEAR(res.weights.sum(), 1.0f, 1e-6f);
        EXPECT_GE(res.weights.minCoeff(), 0.0f);
    }
}

TEST(AttentionTest, SingleTokenGetsAllTheWeight) {
    AttentionEngine attn(8);
    Eigen::MatrixXf emb = tensor_utils::random_2d(1, 8, 0.1f, 5);
    Eigen::RowVectorXf q = tensor_utils::random_1d(8, 0.1f, 6);

    AttentionResult res = attn.compute_attention(emb, q);
    EXPECT_FLOAT_EQ(res.weights(0), 1.0f);
    EXPECT_TRUE(res.context.isApprox(emb.row(0)));
}

TEST(AttentionTest, StableForHugeScores) {
    AttentionEngine attn(4);
    Eigen::MatrixXf emb(2, 4);
    emb << 1000, 0, 0, 0,
           999, 0, 0, 0;
    Eigen::RowVectorXf q(4);
    q << 1000, 0, 0, 0;

    // without the max subtraction exp() overflows to inf here
    AttentionResult res = attn.compute_attention(emb, q);
    EXPECT_TRUE(res.weights.allFinite());
    EXPECT_TRUE(res.context.allFinite());
    EXPECT_NEAR(res.weights.sum(), 1.0f, 1e-6f);
}

TEST(AttentionTest, EmptySequenceThrows) {
    AttentionEngine attn(8);
    Eigen::MatrixXf emb(0, 8);
    Eigen::RowVectorXf q = Eigen::RowVectorXf::Ones(8);
    EXPECT_THROW(attn.compute_attention(emb, q), EmptyInputError);
}

TEST(AttentionTest, WidthMismatchThrows) {
    AttentionEngine attn(8);
    Eigen::MatrixXf emb = Eigen::MatrixXf::Ones(2, 4);
    Eigen::RowVectorXf q = Eigen::RowVectorXf::Ones(8);
    EXPECT_THROW(attn.compute_attention(emb, q), InvalidDimensionError);
}

TEST(AttentionTest, SoftmaxOfEqualScoresIsUniform) {
    Eigen::RowVectorXf x = Eigen::RowVectorXf::Constant(4, 3.5f);
    Eigen::RowVectorXf w = AttentionEngine::softmax(x);
    for (int i = 0; i < 4; ++i) EXPECT_NEAR(w(i), 0.25f, 1e-7f);
}

TEST(ScorerTest, CosineBasics) {
    Eigen::RowVectorXf a(3), b(3);
    a << 1, 2, 3;
    b << -1, -2, -3;

    EXPECT_NEAR(cosine_similarity(a, a), 1.0f, 1e-6f);
    EXPECT_NEAR(cosine_similarity(a, b), -1.0f, 1e-6f);

    Eigen::RowVectorXf c(3);
    c << 3, 0, -1;
    EXPECT_NEAR(cosine_similarity(a, c), 0.0f, 1e-6f);
}

TEST(ScorerTest, ZeroVectorIsFinite) {
    Eigen::RowVectorXf zero = Eigen::RowVectorXf::Zero(5);
    Eigen::RowVectorXf a = Eigen::RowVectorXf::Ones(5);
    float s = cosine_similarity(zero, a);
    EXPECT_TRUE(std::isfinite(s));
    EXPECT_FLOAT_EQ(s, 0.0f);
    EXPECT_FLOAT_EQ(cosine_similarity(zero, zero), 0.0f);
}

TEST(ScorerTest, AlwaysWithinBounds) {
    const float eps = 1e-5f;
    for (std::uint32_t seed = 0; seed < 50; ++seed) {
        Eigen::RowVectorXf a = tensor_utils::random_1d(64, 0.1f, seed);
        Eigen::RowVectorXf b = tensor_utils::random_1d(64, 0.1f, seed + 1000);
        float s = cosine_similarity(a, b);
        EXPECT_GE(s, -1.0f - eps);
        EXPECT_LE(s, 1.0f + eps);
    }
}

TEST(ScorerTest, SizeMismatchThrows) {
    EXPECT_THROW(cosine_similarity(Eigen::RowVectorXf::Ones(3), Eigen::RowVectorXf::Ones(4)), InvalidDimensionError);
}
