#pragma once
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace recs {

// Term and genre dimensions of one index generation.
// Lexical terms own dims [0, num_terms()), genre tags own
// [num_terms(), dimension()). The two ranges never overlap, so the
// tag "Action" and the word "action" are different features.
class Vocabulary {
public:
    static constexpr int32_t kAbsent = -1;

    // docs_tokens[i] and docs_genres[i] describe document i
    static Vocabulary build(
        const std::vector<std::vector<std::string>>& docs_tokens,
        const std::vector<std::vector<std::string>>& docs_genres
    );

    size_t num_docs() const { return m_num_docs; }
    size_t num_terms() const { return m_terms.size(); }
    size_t num_genres() const { return m_genres.size(); }
    size_t dimension() const { return m_terms.size() + m_genres.size(); }
    bool empty() const { return dimension() == 0; }

    // dense dim of a term / genre, kAbsent when unknown
    int32_t term_id(const std::string& term) const;
    int32_t genre_dim(const std::string& genre) const;

    const std::vector<std::string>& terms() const { return m_terms; }    // term_id -> term
    const std::vector<uint32_t>& df() const { return m_df; }             // term_id -> document frequency
    const std::vector<double>& idf() const { return m_idf; }             // term_id -> idf
    const std::vector<std::string>& genres() const { return m_genres; }  // (dim - num_terms()) -> tag

    // ln(N / (1 + df)) + 1
    static double smoothed_idf(size_t num_docs, uint32_t df);

private:
    size_t m_num_docs = 0;

    std::vector<std::string> m_terms;
    std::vector<uint32_t> m_df;
    std::vector<double> m_idf;
    std::unordered_map<std::string, uint32_t> m_term_to_id;

    std::vector<std::string> m_genres;
    std::unordered_map<std::string, uint32_t> m_genre_to_id;  // genre -> offset inside the genre range
};

}  // namespace recs
