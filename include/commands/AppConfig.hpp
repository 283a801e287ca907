#pragma once
#include <memory>
#include <string>

#include "catalog/MovieCatalog.hpp"
#include "recs/IndexConfig.hpp"
#include "recs/Recommender.hpp"

struct AppConfig {
    std::string data_path;
    int top_n = 5;
    recs::IndexConfig index;
};

// --data, else $MOVIE_RECS_DATA, else data/movies.json; --topN clamped to >= 0
AppConfig resolve_config(int argc, char** argv);

// rebuilds `rec` from the catalog and logs the new snapshot's stats to stderr
std::shared_ptr<const recs::SimilarityIndex> rebuild_and_log(
    recs::Recommender& rec,
    const catalog::MovieCatalog& store
);
