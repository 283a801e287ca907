#include "recs/Ranker.hpp"
#include <algorithm>

namespace recs {

static bool ranks_before(const ScoredRecord& a, const ScoredRecord& b) {
    if (a.score != b.score) return a.score > b.score;
    return a.record_id < b.record_id;
}

static void sort_and_truncate(std::vector<ScoredRecord>& hits, size_t k) {
    const size_t keep = std::min(k, hits.size());
    std::partial_sort(hits.begin(), hits.begin() + keep, hits.end(), ranks_before);
    hits.resize(keep);
}

std::vector<ScoredRecord> rank_by_record(const SimilarityIndex& index, std::int64_t id, int top_n) {
    const FeatureVector& base = index.vector_of(id);
    if (top_n <= 0) return {};

    const std::vector<double> dense = to_dense(base, index.vocabulary().dimension());

    std::vector<ScoredRecord> hits;
    hits.reserve(index.size());

    for (const auto& d : index.docs()) {
        if (d.id == id) continue;
        // both sides are unit length (or zero), so the dot is the cosine
        hits.push_back({d.id, dot_dense(dense, d.vec)});
    }

    sort_and_truncate(hits, (size_t)top_n);
    return hits;
}

std::vector<ScoredRecord> rank_by_query(const SimilarityIndex& index, const std::string& text, int top_n) {
    return rank_by_query(index, text, {}, top_n);
}

std::vector<ScoredRecord> rank_by_query(
    const SimilarityIndex& index,
    const std::string& text,
    const std::vector<std::string>& genres,
    int top_n
) {
    if (top_n <= 0) return {};

    const FeatureVector q = index.vectorize_query(text, genres);
    if (q.is_zero()) return {};  // no known terms or tags

    const std::vector<double> dense = to_dense(q, index.vocabulary().dimension());

    std::vector<ScoredRecord> hits;
    hits.reserve(index.size());

    for (const auto& d : index.docs()) {
        double score = dot_dense(dense, d.vec);
        if (score > 0.0) hits.push_back({d.id, score});
    }

    sort_and_truncate(hits, (size_t)top_n);
    return hits;
}

}  // namespace recs
