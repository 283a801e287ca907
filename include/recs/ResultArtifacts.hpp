// include/recs/ResultArtifacts.hpp
#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "catalog/Movie.hpp"
#include "catalog/MovieCatalog.hpp"
#include "nlohmann/json.hpp"
#include "recs/Ranker.hpp"
#include "recs/SimilarityIndex.hpp"

namespace recs {

struct RankedMovie {
    catalog::Movie movie;
    double score = 0.0;
};

// joins ranked ids back to catalog records, preserving rank order
std::vector<RankedMovie> resolve_hits(const catalog::MovieCatalog& catalog, const std::vector<ScoredRecord>& hits);

struct RecommendationsArtifact {
    std::int64_t base_id = 0;
    std::string built_at;
    std::vector<RankedMovie> recommendations;

    nlohmann::json to_json() const;
    void write_to(const std::filesystem::path& out_path) const;
};

struct SearchArtifact {
    std::string query;
    std::vector<std::string> genres;
    std::string built_at;
    std::vector<RankedMovie> results;

    nlohmann::json to_json() const;
    void write_to(const std::filesystem::path& out_path) const;
};

struct IndexStatsArtifact {
    IndexStats stats;

    nlohmann::json to_json() const;
    void write_to(const std::filesystem::path& out_path) const;
};

// scores are reported with 4 decimals
double round_score(double score);

}  // namespace recs
