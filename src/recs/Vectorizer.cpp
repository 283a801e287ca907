#include "recs/Vectorizer.hpp"
#include <algorithm>
#include <cmath>
#include <map>
#include <set>

namespace recs {

double FeatureVector::norm() const {
    // scale by the largest weight so the squares cannot overflow
    double peak = 0.0;
    for (const auto& kv : weights) peak = std::max(peak, std::fabs(kv.second));
    if (peak == 0.0) return 0.0;

    double norm2 = 0.0;
    for (const auto& kv : weights) {
        const double x = kv.second / peak;
        norm2 += x * x;
    }
    return peak * std::sqrt(norm2);
}

double FeatureVector::weight_at(uint32_t dim) const {
    auto it = std::lower_bound(weights.begin(), weights.end(), dim,
                               [](const std::pair<uint32_t, double>& p, uint32_t d){ return p.first < d; });
    if (it == weights.end() || it->first != dim) return 0.0;
    return it->second;
}

FeatureVector vectorize(
    const std::vector<std::string>& tokens,
    const std::vector<std::string>& genres,
    const Vocabulary& vocab,
    double genre_weight
) {
    // ordered by term_id, so weights come out sorted
    std::map<uint32_t, uint32_t> tf;
    for (const auto& t : tokens) {
        int32_t id = vocab.term_id(t);
        if (id == Vocabulary::kAbsent) continue;
        tf[(uint32_t)id] += 1;
    }

    FeatureVector v;
    v.weights.reserve(tf.size() + genres.size());

    const auto& idf = vocab.idf();
    for (const auto& kv : tf) {
        // log TF
        double w = (1.0 + std::log((double)kv.second)) * idf[kv.first];
        if (w > 0.0) v.weights.push_back({kv.first, w});
    }

    if (genre_weight > 0.0) {
        // a tag listed twice still counts once
        std::set<uint32_t> genre_dims;
        for (const auto& g : genres) {
            int32_t dim = vocab.genre_dim(g);
            if (dim != Vocabulary::kAbsent) genre_dims.insert((uint32_t)dim);
        }
        // genre dims all sit above the term range, order is preserved
        for (uint32_t dim : genre_dims) v.weights.push_back({dim, genre_weight});
    }

    l2_normalize(v);
    return v;
}

void l2_normalize(FeatureVector& v) {
    const double n = v.norm();
    if (n == 0.0) {
        v.weights.clear();
        return;
    }
    for (auto& kv : v.weights) kv.second /= n;

    // weights tiny next to the peak can underflow to 0; keep the no-zero-weights invariant
    v.weights.erase(std::remove_if(v.weights.begin(), v.weights.end(),
                                   [](const std::pair<uint32_t, double>& kv){ return kv.second == 0.0; }),
                    v.weights.end());
}

double dot(const FeatureVector& a, const FeatureVector& b) {
    const auto& x = a.weights;
    const auto& y = b.weights;
    size_t i = 0, j = 0;
    double s = 0.0;
    while (i < x.size() && j < y.size()) {
        if (x[i].first == y[j].first) {
            s += x[i].second * y[j].second;
            ++i; ++j;
        } else if (x[i].first < y[j].first) {
            ++i;
        } else {
            ++j;
        }
    }
    return s;
}

std::vector<double> to_dense(const FeatureVector& v, size_t dimension) {
    std::vector<double> dense(dimension, 0.0);
    for (const auto& kv : v.weights) {
        if (kv.first < dimension) dense[kv.first] = kv.second;
    }
    return dense;
}

double dot_dense(const std::vector<double>& dense, const FeatureVector& v) {
    double s = 0.0;
    for (const auto& kv : v.weights) {
        if (kv.first < dense.size()) s += dense[kv.first] * kv.second;
    }
    return s;
}

}  // namespace recs
