#include "utils/config.hpp"
#include "utils/errors.hpp"
#include <sstream>

void RankerConfig::validate() const {
    if (vocab_size <= 0 || embed_dim <= 0) {
        std::ostringstream oss;
        oss << "vocab_size and embed_dim must be positive, got vocab_size=" << vocab_size
            << " embed_dim=" << embed_dim;
        throw InvalidDimensionError(oss.str());
    }
}
