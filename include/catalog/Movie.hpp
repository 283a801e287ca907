#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace catalog {

struct Movie {
    std::int64_t id = 0;                // unique, stable
    std::string title;
    int year = 0;                       // 0 = unknown
    std::vector<std::string> genres;    // display order; a set for similarity
    std::vector<std::string> keywords;
    std::string poster;
    std::string description;
};

// what a caller supplies to MovieCatalog::add (id is assigned)
struct NewMovie {
    std::string title;
    int year = 0;
    std::vector<std::string> genres;
    std::vector<std::string> keywords;
    std::string poster;
    std::string description;
};

}  // namespace catalog
