#include "recs/Recommender.hpp"
#include <mutex>
#include <utility>

namespace recs {

Recommender::Recommender(IndexConfig cfg)
    : m_cfg(cfg),
      m_state(std::make_shared<const Published>(Published{std::make_shared<const SimilarityIndex>(), 0})) {
    m_cfg.validate();
}

std::shared_ptr<const SimilarityIndex> Recommender::rebuild(const std::vector<catalog::Movie>& corpus) {
    // the expensive build runs outside the lock; concurrent rebuilds only
    // serialize on the publish
    auto next = std::make_shared<const SimilarityIndex>(SimilarityIndex::build(corpus, m_cfg));

    std::lock_guard<std::mutex> lock(m_publish_mutex);
    const auto prev = std::atomic_load(&m_state);
    std::atomic_store(&m_state, std::make_shared<const Published>(Published{next, prev->generation + 1}));
    return next;
}

Recommender::Published Recommender::current() const {
    return *std::atomic_load(&m_state);
}

std::vector<ScoredRecord> Recommender::rank_by_record(std::int64_t id, int top_n) const {
    const auto idx = snapshot();
    return recs::rank_by_record(*idx, id, top_n);
}

std::vector<ScoredRecord> Recommender::rank_by_query(const std::string& text, int top_n) const {
    const auto idx = snapshot();
    return recs::rank_by_query(*idx, text, top_n);
}

std::vector<ScoredRecord> Recommender::rank_by_query(
    const std::string& text,
    const std::vector<std::string>& genres,
    int top_n
) const {
    const auto idx = snapshot();
    return recs::rank_by_query(*idx, text, genres, top_n);
}

}  // namespace recs
