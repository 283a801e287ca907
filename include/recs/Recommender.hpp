#pragma once
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "catalog/Movie.hpp"
#include "recs/IndexConfig.hpp"
#include "recs/Ranker.hpp"
#include "recs/SimilarityIndex.hpp"

namespace recs {

// Owner of the live snapshot. rebuild() builds a new SimilarityIndex off to
// the side and publishes it, together with its generation number, with one
// atomic pointer store; queries load the pointer once and run against that
// snapshot even if a rebuild lands meanwhile.
class Recommender {
public:
    // what one publish makes visible; index and generation never disagree
    struct Published {
        std::shared_ptr<const SimilarityIndex> index;
        uint64_t generation = 0;
    };

    explicit Recommender(IndexConfig cfg = {});

    // Throws (and keeps the current snapshot) if the corpus cannot be indexed.
    std::shared_ptr<const SimilarityIndex> rebuild(const std::vector<catalog::Movie>& corpus);

    Published current() const;
    std::shared_ptr<const SimilarityIndex> snapshot() const { return current().index; }
    uint64_t generation() const { return current().generation; }

    std::vector<ScoredRecord> rank_by_record(std::int64_t id, int top_n) const;
    std::vector<ScoredRecord> rank_by_query(const std::string& text, int top_n) const;
    std::vector<ScoredRecord> rank_by_query(
        const std::string& text,
        const std::vector<std::string>& genres,
        int top_n
    ) const;

private:
    IndexConfig m_cfg;
    std::shared_ptr<const Published> m_state;  // only touched via std::atomic_load / std::atomic_store
    std::mutex m_publish_mutex;                // one publisher at a time
};

}  // namespace recs
