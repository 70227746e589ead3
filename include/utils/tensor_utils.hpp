#pragma once
#include <Eigen/Dense>
#include <cstdint>
#include <filesystem>
#include <string>

namespace tensor_utils {
    // Load 2D tensor (embedding matrix, [vocab_size, embed_dim])
    Eigen::MatrixXf load_2d_tensor(const std::filesystem::path& path);

    // N(0, 1) * scale, deterministic for a given seed
    Eigen::MatrixXf random_2d(int rows, int cols, float scale, std::uint32_t seed);
    Eigen::RowVectorXf random_1d(int size, float scale, std::uint32_t seed);

    // Verify tensor dimensions match expected shape, throws InvalidDimensionError
    void assert_tensor_shape(const Eigen::MatrixXf& tensor, int rows, int cols, std::string tensor_name = "[no_name]");
    void assert_vector_shape(const Eigen::RowVectorXf& vector, int size, std::string vector_name = "[no_name]");
}
