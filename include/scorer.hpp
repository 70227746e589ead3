#pragma once
#include <Eigen/Dense>

// dot(a, b) / (|a| * |b| + eps). eps only keeps a zero vector from dividing by zero,
// so the result stays in [-1 - eps, 1 + eps] and finite for finite inputs.
float cosine_similarity(const Eigen::RowVectorXf& a, const Eigen::RowVectorXf& b, float eps = 1e-8f);
