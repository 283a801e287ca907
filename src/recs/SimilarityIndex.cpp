#include "recs/SimilarityIndex.hpp"
#include "recs/Errors.hpp"
#include "text/TextUtil.hpp"

#include <chrono>
#include <cstdio>
#include <ctime>
#include <stdexcept>

namespace recs {

static std::string utc_now_iso8601() {
    const auto now = std::chrono::system_clock::now();
    const std::time_t t = std::chrono::system_clock::to_time_t(now);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;

    std::tm tm{};
    gmtime_r(&t, &tm);

    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);

    char out[40];
    std::snprintf(out, sizeof(out), "%s.%03dZ", buf, (int)ms);
    return out;
}

std::vector<std::string> SimilarityIndex::document_tokens(const catalog::Movie& m, const IndexConfig& cfg) {
    std::string text = m.title;
    text += ' ';
    text += m.description;
    if (cfg.include_keywords) {
        for (const auto& k : m.keywords) {
            text += ' ';
            text += k;
        }
    }
    return cfg.filter_stopwords ? textutil::tokenize_filtered(text) : textutil::tokenize(text);
}

SimilarityIndex SimilarityIndex::build(const std::vector<catalog::Movie>& corpus, const IndexConfig& cfg) {
    cfg.validate();

    SimilarityIndex idx;
    idx.m_cfg = cfg;
    idx.m_pos.reserve(corpus.size());

    for (size_t i = 0; i < corpus.size(); ++i) {
        if (!idx.m_pos.emplace(corpus[i].id, i).second) {
            throw std::invalid_argument("duplicate movie id in corpus: " + std::to_string(corpus[i].id));
        }
    }

    // Pass 1: tokens + genres -> vocab, df, idf
    std::vector<std::vector<std::string>> doc_tokens;
    std::vector<std::vector<std::string>> doc_genres;
    doc_tokens.reserve(corpus.size());
    doc_genres.reserve(corpus.size());

    for (const auto& m : corpus) {
        doc_tokens.push_back(document_tokens(m, cfg));
        doc_genres.push_back(m.genres);
    }

    idx.m_vocab = Vocabulary::build(doc_tokens, doc_genres);

    // Pass 2: normalized vectors
    idx.m_docs.reserve(corpus.size());
    for (size_t i = 0; i < corpus.size(); ++i) {
        IndexedDoc d;
        d.id = corpus[i].id;
        d.vec = vectorize(doc_tokens[i], doc_genres[i], idx.m_vocab, cfg.genre_weight);
        idx.m_docs.push_back(std::move(d));
    }

    idx.m_built_at = utc_now_iso8601();
    return idx;
}

const FeatureVector& SimilarityIndex::vector_of(std::int64_t id) const {
    auto it = m_pos.find(id);
    if (it == m_pos.end()) throw NotFoundError(id);
    return m_docs[it->second].vec;
}

FeatureVector SimilarityIndex::vectorize_query(const std::string& text, const std::vector<std::string>& genres) const {
    auto toks = m_cfg.filter_stopwords ? textutil::tokenize_filtered(text) : textutil::tokenize(text);
    return vectorize(toks, genres, m_vocab, m_cfg.genre_weight);
}

IndexStats SimilarityIndex::stats() const {
    IndexStats s;
    s.docs = m_docs.size();
    s.vocab = m_vocab.num_terms();
    s.genre_dims = m_vocab.num_genres();
    s.built_at = m_built_at;
    s.config = m_cfg;
    return s;
}

}  // namespace recs
