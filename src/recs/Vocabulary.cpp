#include "recs/Vocabulary.hpp"
#include "text/TextUtil.hpp"
#include <cmath>
#include <map>
#include <set>

namespace recs {

double Vocabulary::smoothed_idf(size_t num_docs, uint32_t df) {
    return std::log((double)num_docs / (1.0 + (double)df)) + 1.0;
}

Vocabulary Vocabulary::build(
    const std::vector<std::vector<std::string>>& docs_tokens,
    const std::vector<std::vector<std::string>>& docs_genres
) {
    Vocabulary v;
    v.m_num_docs = docs_tokens.size();

    // ordered map: iteration gives the lexicographic term order for free
    std::map<std::string, uint32_t> df_map;

    for (const auto& toks : docs_tokens) {
        // unique terms in this doc for DF
        std::set<std::string> seen(toks.begin(), toks.end());
        for (const auto& t : seen) {
            if (t.empty()) continue;
            df_map[t] += 1;
        }
    }

    // Freeze vocab: assign term_ids
    v.m_terms.reserve(df_map.size());
    v.m_df.reserve(df_map.size());
    v.m_idf.reserve(df_map.size());
    v.m_term_to_id.reserve(df_map.size());

    for (const auto& kv : df_map) {
        v.m_term_to_id.emplace(kv.first, (uint32_t)v.m_terms.size());
        v.m_terms.push_back(kv.first);
        v.m_df.push_back(kv.second);
        v.m_idf.push_back(smoothed_idf(v.m_num_docs, kv.second));
    }

    std::set<std::string> genre_set;
    for (const auto& gs : docs_genres) {
        for (const auto& g : gs) {
            std::string t = textutil::trim(g);
            if (!t.empty()) genre_set.insert(std::move(t));
        }
    }

    v.m_genres.assign(genre_set.begin(), genre_set.end());
    v.m_genre_to_id.reserve(v.m_genres.size());
    for (size_t i = 0; i < v.m_genres.size(); ++i) {
        v.m_genre_to_id.emplace(v.m_genres[i], (uint32_t)i);
    }

    return v;
}

int32_t Vocabulary::term_id(const std::string& term) const {
    auto it = m_term_to_id.find(term);
    if (it == m_term_to_id.end()) return kAbsent;
    return (int32_t)it->second;
}

int32_t Vocabulary::genre_dim(const std::string& genre) const {
    auto it = m_genre_to_id.find(textutil::trim(genre));
    if (it == m_genre_to_id.end()) return kAbsent;
    return (int32_t)(m_terms.size() + it->second);
}

}  // namespace recs
