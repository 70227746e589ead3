#include "scorer.hpp"
#include "utils/errors.hpp"
#include <sstream>

float cosine_similarity(const Eigen::RowVectorXf& a, const Eigen::RowVectorXf& b, float eps) {
    if (a.size() != b.size()) {
        std::ostringstream oss;
        oss << "cosine_similarity: size mismatch [" << a.size() << "] vs [" << b.size() << "]";
        throw InvalidDimensionError(oss.str());
    }
    return a.dot(b) / (a.norm() * b.norm() + eps);
}
