#pragma once

namespace recs {

struct IndexConfig {
    double genre_weight = 1.2;     // weight G of each genre dimension before normalization
    bool include_keywords = true;  // tokenize keywords along with title + description
    bool filter_stopwords = true;

    // throws std::invalid_argument on a negative or non-finite genre_weight
    void validate() const;
};

}  // namespace recs
