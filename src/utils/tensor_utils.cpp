#include "utils/tensor_utils.hpp"
#include "utils/errors.hpp"
#include <cnpy.h>
#include <random>
#include <sstream>
#include <stdexcept>

namespace tensor_utils {
    namespace {
        using RowMajorMatrixXf = Eigen::Matrix<float, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

        void check_float_array(const cnpy::NpyArray& arr, size_t ndim, const std::filesystem::path& path) {
            if (arr.word_size != sizeof(float) || arr.shape.size() != ndim) {
                std::ostringstream oss;
                oss << "Expected a " << ndim << "d float32 array in '" << path.string() << "'.\n";
                oss << "Got " << arr.shape.size() << " dims with word size " << arr.word_size << "\n";
                throw std::runtime_error(oss.str());
            }
        }
    }

    Eigen::MatrixXf load_2d_tensor(const std::filesystem::path& path) {
        cnpy::NpyArray arr = cnpy::npy_load(path.string());
        check_float_array(arr, 2, path);

        // numpy saves C order by default, Eigen is column major.
        if (arr.fortran_order) {
            return Eigen::Map<Eigen::MatrixXf>(arr.data<float>(), arr.shape[0], arr.shape[1]);
        }
        return Eigen::Map<RowMajorMatrixXf>(arr.data<float>(), arr.shape[0], arr.shape[1]);
    }

    Eigen::MatrixXf random_2d(int rows, int cols, float scale, std::uint32_t seed) {
        Eigen::MatrixXf res(rows, cols);

        std::mt19937 rng(seed);
        std::normal_distribution<float> nd(0.0f, 1.0f);

        // fill row by row so a row only depends on the seed and the rows before it
        for (int i = 0; i < rows; ++i) for (int j = 0; j < cols; ++j) {
            res(i, j) = nd(rng) * scale;
        }

        return res;
    }

    Eigen::RowVectorXf random_1d(int size, float scale, std::uint32_t seed) {
        Eigen::RowVectorXf res(size);

        std::mt19937 rng(seed);
        std::normal_distribution<float> nd(0.0f, 1.0f);

        for (int i = 0; i < size; ++i) {
            res(i) = nd(rng) * scale;
        }

        return res;
    }

    void assert_tensor_shape(const Eigen::MatrixXf& tensor, int rows, int cols, std::string tensor_name) {
        if (tensor.rows() != rows || tensor.cols() != cols) {
            std::ostringstream oss;
            oss << "Tensor shape mismatch for '" << tensor_name << "'.\n";
            oss << "Expected dimensions [" << rows << ", " << cols << "]\n";
            oss << "Got dimensions [" << tensor.rows() << ", " << tensor.cols() << "]\n";
            throw InvalidDimensionError(oss.str());
        }
    }

    void assert_vector_shape(const Eigen::RowVectorXf& vector, int size, std::string vector_name) {
        if (vector.size() != size) {
            std::ostringstream oss;
            oss << "vector shape mismatch for '" << vector_name << "'.\n";
            oss << "Expected dimensions [" << size << "]\n";
            oss << "Got dimensions [" << vector.size() << "]\n";
            throw InvalidDimensionError(oss.str());
        }
    }
}
