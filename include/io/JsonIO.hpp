#pragma once
#include <string>
#include <vector>

#include "catalog/Movie.hpp"
#include "nlohmann/json.hpp"

// movies.json: a JSON array of movie objects
std::vector<catalog::Movie> loadMovies(const std::string& path);
void saveMovies(const std::string& path, const std::vector<catalog::Movie>& movies);

// `where` prefixes validation errors, e.g. "root[3]"
catalog::Movie parseMovie(const nlohmann::json& j, const std::string& where);
std::vector<catalog::Movie> parseMovies(const nlohmann::json& j);
nlohmann::json movieToJson(const catalog::Movie& m);
