#pragma once
#include "catalog/Movie.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace catalog {

class MovieCatalog {
public:
    // missing file -> empty catalog (with a warning); malformed file throws
    static MovieCatalog load_from_file(const std::string& path);
    static MovieCatalog from_movies(std::vector<Movie> movies);

    const std::vector<Movie>& movies() const { return m_movies; }
    size_t size() const { return m_movies.size(); }

    const Movie* find(std::int64_t id) const;

    // sorted, de-duplicated union of all genre tags
    std::vector<std::string> genres() const;

    // assigns max(id) + 1; throws std::invalid_argument on a blank title
    const Movie& add(NewMovie m);

    void save(const std::string& path) const;

private:
    std::vector<Movie> m_movies;
};

}  // namespace catalog
