#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include "recs/SimilarityIndex.hpp"

namespace recs {

struct ScoredRecord {
    std::int64_t record_id;
    double score;  // cosine similarity in [0, 1]
};

// Records most similar to record `id`, excluding `id` itself.
// Sorted by score desc, then id asc; at most top_n entries, none when top_n <= 0.
// Zero-score records are kept. Throws NotFoundError for an unknown id.
std::vector<ScoredRecord> rank_by_record(const SimilarityIndex& index, std::int64_t id, int top_n);

// Records most similar to free text (+ optional genre tags). Same ordering.
// Only scores > 0 are returned; a query with no known terms or tags yields {}.
std::vector<ScoredRecord> rank_by_query(const SimilarityIndex& index, const std::string& text, int top_n);
std::vector<ScoredRecord> rank_by_query(
    const SimilarityIndex& index,
    const std::string& text,
    const std::vector<std::string>& genres,
    int top_n
);

}  // namespace recs
