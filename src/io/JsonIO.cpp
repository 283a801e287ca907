#include "io/JsonIO.hpp"

#include "text/TextUtil.hpp"

#include <cstdint>
#include <filesystem>
#include <limits>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <unordered_set>

using json = nlohmann::json;
using catalog::Movie;

static void require_object(const json& j, const std::string& where) {
    if (!j.is_object()) {
        throw std::runtime_error(where + " must be an object");
    }
}

static void require_array(const json& j, const std::string& where) {
    if (!j.is_array()) {
        throw std::runtime_error(where + " must be an array");
    }
}

static std::string require_string(const json& j, const char* key, const std::string& where) {
    if (!j.contains(key)) {
        throw std::runtime_error(where + " missing required field: " + std::string(key));
    }
    if (!j.at(key).is_string()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be a string");
    }
    return j.at(key).get<std::string>();
}

static std::int64_t require_integer(const json& j, const char* key, const std::string& where) {
    if (!j.contains(key)) {
        throw std::runtime_error(where + " missing required field: " + std::string(key));
    }
    if (!j.at(key).is_number_integer()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be an integer");
    }
    if (j.at(key).is_number_unsigned() &&
        j.at(key).get<std::uint64_t>() > (std::uint64_t)std::numeric_limits<std::int64_t>::max()) {
        throw std::runtime_error(where + "." + std::string(key) + " is out of range: " + j.at(key).dump());
    }
    return j.at(key).get<std::int64_t>();
}

static std::string optional_string(const json& j, const char* key, const std::string& where) {
    if (!j.contains(key) || j.at(key).is_null()) return "";
    if (!j.at(key).is_string()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be a string");
    }
    return j.at(key).get<std::string>();
}

static std::vector<std::string> optional_string_array(const json& j, const char* key, const std::string& where) {
    std::vector<std::string> out;
    if (!j.contains(key) || j.at(key).is_null()) return out;

    const json& arr = j.at(key);
    if (!arr.is_array()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be an array");
    }
    out.reserve(arr.size());
    for (size_t i = 0; i < arr.size(); ++i) {
        if (!arr.at(i).is_string()) {
            std::ostringstream oss;
            oss << where << "." << key << "[" << i << "] must be a string";
            throw std::runtime_error(oss.str());
        }
        out.push_back(arr.at(i).get<std::string>());
    }
    return out;
}

Movie parseMovie(const json& j, const std::string& where) {
    require_object(j, where);

    Movie m;
    m.id    = require_integer(j, "id", where);
    m.title = require_string(j, "title", where);
    if (textutil::trim(m.title).empty()) {
        throw std::runtime_error(where + ".title must not be empty");
    }

    if (j.contains("year") && !j.at("year").is_null()) {
        const json& y = j.at("year");
        if (!y.is_number_integer()) {
            throw std::runtime_error(where + ".year must be an integer or null");
        }
        // read wide, then range-check; get<int>() would silently wrap
        const bool fits = y.is_number_unsigned()
            ? y.get<std::uint64_t>() <= (std::uint64_t)std::numeric_limits<int>::max()
            : (y.get<std::int64_t>() >= std::numeric_limits<int>::min() &&
               y.get<std::int64_t>() <= std::numeric_limits<int>::max());
        if (!fits) {
            throw std::runtime_error(where + ".year is out of range: " + y.dump());
        }
        m.year = (int)y.get<std::int64_t>();
    }

    m.genres   = optional_string_array(j, "genres", where);
    m.keywords = optional_string_array(j, "keywords", where);
    m.poster   = optional_string(j, "poster", where);

    // the API writes "desc", hand-written files often say "description"
    if (j.contains("desc")) m.description = optional_string(j, "desc", where);
    else m.description = optional_string(j, "description", where);

    return m;
}

std::vector<Movie> parseMovies(const json& j) {
    require_array(j, "root");

    std::vector<Movie> movies;
    movies.reserve(j.size());
    std::unordered_set<std::int64_t> seen;

    for (size_t i = 0; i < j.size(); ++i) {
        std::ostringstream oss;
        oss << "root[" << i << "]";
        Movie m = parseMovie(j.at(i), oss.str());
        if (!seen.insert(m.id).second) {
            throw std::runtime_error(oss.str() + ".id duplicates an earlier movie: " + std::to_string(m.id));
        }
        movies.push_back(std::move(m));
    }
    return movies;
}

json movieToJson(const Movie& m) {
    json j;
    j["id"] = m.id;
    j["title"] = m.title;
    if (m.year != 0) j["year"] = m.year;
    else j["year"] = nullptr;
    j["genres"] = m.genres;
    j["keywords"] = m.keywords;
    j["poster"] = m.poster;
    j["desc"] = m.description;
    return j;
}

std::vector<Movie> loadMovies(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("failed to open movies file: " + path);
    }

    json j;
    try {
        in >> j;
    } catch (const std::exception& e) {
        throw std::runtime_error(std::string("failed to parse JSON: ") + path + ": " + e.what());
    }

    return parseMovies(j);
}

void saveMovies(const std::string& path, const std::vector<Movie>& movies) {
    const std::filesystem::path p(path);
    if (p.has_parent_path()) std::filesystem::create_directories(p.parent_path());

    json arr = json::array();
    for (const auto& m : movies) arr.push_back(movieToJson(m));

    std::ofstream out(p, std::ios::out | std::ios::trunc);
    if (!out) throw std::runtime_error("failed to open output file: " + path);

    out << arr.dump(2) << "\n";
    if (!out) throw std::runtime_error("failed to write movies file: " + path);
}
