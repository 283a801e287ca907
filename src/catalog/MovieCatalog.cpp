#include "catalog/MovieCatalog.hpp"
#include "io/JsonIO.hpp"
#include "text/TextUtil.hpp"

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <set>
#include <stdexcept>
#include <unordered_set>

namespace fs = std::filesystem;

namespace catalog {

MovieCatalog MovieCatalog::load_from_file(const std::string& path) {
    MovieCatalog c;

    if (!fs::exists(fs::path(path))) {
        std::cerr << "warning: movies file not found, starting empty: " << path << "\n";
        return c;
    }

    c.m_movies = loadMovies(path);
    return c;
}

MovieCatalog MovieCatalog::from_movies(std::vector<Movie> movies) {
    std::unordered_set<std::int64_t> seen;
    for (const auto& m : movies) {
        if (!seen.insert(m.id).second) {
            throw std::invalid_argument("duplicate movie id: " + std::to_string(m.id));
        }
    }

    MovieCatalog c;
    c.m_movies = std::move(movies);
    return c;
}

const Movie* MovieCatalog::find(std::int64_t id) const {
    for (const auto& m : m_movies) {
        if (m.id == id) return &m;
    }
    return nullptr;
}

std::vector<std::string> MovieCatalog::genres() const {
    std::set<std::string> all;
    for (const auto& m : m_movies) {
        for (const auto& g : m.genres) {
            std::string t = textutil::trim(g);
            if (!t.empty()) all.insert(std::move(t));
        }
    }
    return std::vector<std::string>(all.begin(), all.end());
}

const Movie& MovieCatalog::add(NewMovie nm) {
    std::string title = textutil::trim(nm.title);
    if (title.empty()) throw std::invalid_argument("missing title");

    std::int64_t max_id = 0;
    for (const auto& m : m_movies) max_id = std::max(max_id, m.id);

    Movie m;
    m.id = max_id + 1;
    m.title = std::move(title);
    m.year = nm.year;
    m.genres = std::move(nm.genres);
    m.keywords = std::move(nm.keywords);
    m.poster = std::move(nm.poster);
    m.description = std::move(nm.description);

    m_movies.push_back(std::move(m));
    return m_movies.back();
}

void MovieCatalog::save(const std::string& path) const {
    saveMovies(path, m_movies);
}

}  // namespace catalog
