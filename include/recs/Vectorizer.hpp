#pragma once
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "recs/Vocabulary.hpp"

namespace recs {

// Sparse feature vector: (dim, weight) pairs sorted by dim, no duplicate
// dims, no zero weights. An empty vector is the zero vector.
struct FeatureVector {
    std::vector<std::pair<uint32_t, double>> weights;

    bool is_zero() const { return weights.empty(); }
    double norm() const;
    double weight_at(uint32_t dim) const;
};

// (1 + ln(count)) * idf per known term, plus genre_weight per known genre,
// then L2-normalized. Unknown terms and genres are dropped.
FeatureVector vectorize(
    const std::vector<std::string>& tokens,
    const std::vector<std::string>& genres,
    const Vocabulary& vocab,
    double genre_weight
);

// divides by the Euclidean norm; the zero vector stays zero
void l2_normalize(FeatureVector& v);

double dot(const FeatureVector& a, const FeatureVector& b);

// dense view for repeated dots against one vector
std::vector<double> to_dense(const FeatureVector& v, size_t dimension);
double dot_dense(const std::vector<double>& dense, const FeatureVector& v);

}  // namespace recs
