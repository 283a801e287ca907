#include "recs/IndexConfig.hpp"
#include <cmath>
#include <stdexcept>

namespace recs {

void IndexConfig::validate() const {
    if (!std::isfinite(genre_weight) || genre_weight < 0.0) {
        throw std::invalid_argument("genre_weight must be a finite value >= 0");
    }
}

}  // namespace recs
