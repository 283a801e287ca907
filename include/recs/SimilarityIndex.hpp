#pragma once
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

#include "catalog/Movie.hpp"
#include "recs/IndexConfig.hpp"
#include "recs/Vectorizer.hpp"
#include "recs/Vocabulary.hpp"

namespace recs {

struct IndexedDoc {
    std::int64_t id = 0;
    FeatureVector vec;  // unit length, or zero
};

struct IndexStats {
    size_t docs = 0;
    size_t vocab = 0;
    size_t genre_dims = 0;
    std::string built_at;
    IndexConfig config;
};

// One immutable generation of the index. Every vector in it shares the
// same vocabulary and idf table. A corpus change means building a new one.
class SimilarityIndex {
public:
    SimilarityIndex() = default;

    // Re-tokenizes and revectorizes the whole corpus.
    // Throws std::invalid_argument on duplicate ids or a bad config.
    static SimilarityIndex build(const std::vector<catalog::Movie>& corpus, const IndexConfig& cfg = {});

    bool contains(std::int64_t id) const { return m_pos.count(id) != 0; }

    // throws NotFoundError
    const FeatureVector& vector_of(std::int64_t id) const;

    // same tokenization, vocabulary and idf as the corpus vectors
    FeatureVector vectorize_query(const std::string& text, const std::vector<std::string>& genres = {}) const;

    const std::vector<IndexedDoc>& docs() const { return m_docs; }
    const Vocabulary& vocabulary() const { return m_vocab; }
    const IndexConfig& config() const { return m_cfg; }
    const std::string& built_at() const { return m_built_at; }

    size_t size() const { return m_docs.size(); }
    bool empty() const { return m_docs.empty(); }

    IndexStats stats() const;

    // lexical tokens of one record under cfg (title, description, keywords)
    static std::vector<std::string> document_tokens(const catalog::Movie& m, const IndexConfig& cfg);

private:
    IndexConfig m_cfg;
    Vocabulary m_vocab;
    std::vector<IndexedDoc> m_docs;                  // corpus order
    std::unordered_map<std::int64_t, size_t> m_pos;  // id -> m_docs index
    std::string m_built_at;
};

}  // namespace recs
