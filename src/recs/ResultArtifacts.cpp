#include "recs/ResultArtifacts.hpp"
#include "io/JsonIO.hpp"

#include <cmath>
#include <fstream>
#include <stdexcept>

namespace recs {

double round_score(double score) {
    return std::round(score * 10000.0) / 10000.0;
}

std::vector<RankedMovie> resolve_hits(const catalog::MovieCatalog& catalog, const std::vector<ScoredRecord>& hits) {
    std::vector<RankedMovie> out;
    out.reserve(hits.size());
    for (const auto& h : hits) {
        const catalog::Movie* m = catalog.find(h.record_id);
        if (!m) continue;
        out.push_back({*m, h.score});
    }
    return out;
}

static nlohmann::json ranked_movie_to_json(const RankedMovie& r) {
    nlohmann::json j = movieToJson(r.movie);
    j["score"] = round_score(r.score);
    return j;
}

static nlohmann::json ranked_list_to_json(const std::vector<RankedMovie>& list) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& r : list) {
        arr.push_back(ranked_movie_to_json(r));
    }
    return arr;
}

static void write_json(const std::filesystem::path& out_path, const nlohmann::json& j) {
    if (out_path.has_parent_path()) std::filesystem::create_directories(out_path.parent_path());

    std::ofstream out(out_path);
    if (!out) throw std::runtime_error("Failed to open output file: " + out_path.string());

    out << j.dump(2) << "\n";
}

nlohmann::json RecommendationsArtifact::to_json() const {
    nlohmann::json j;
    j["baseId"] = base_id;
    j["builtAt"] = built_at;
    j["recommendations"] = ranked_list_to_json(recommendations);
    return j;
}

void RecommendationsArtifact::write_to(const std::filesystem::path& out_path) const {
    write_json(out_path, to_json());
}

nlohmann::json SearchArtifact::to_json() const {
    nlohmann::json j;
    j["query"] = query;
    j["genres"] = genres;
    j["builtAt"] = built_at;
    j["results"] = ranked_list_to_json(results);
    return j;
}

void SearchArtifact::write_to(const std::filesystem::path& out_path) const {
    write_json(out_path, to_json());
}

nlohmann::json IndexStatsArtifact::to_json() const {
    nlohmann::json j;
    j["docs"] = stats.docs;
    j["vocab"] = stats.vocab;
    j["genre_dims"] = stats.genre_dims;
    j["built_at"] = stats.built_at;
    j["config"] = {
        {"genre_weight", stats.config.genre_weight},
        {"include_keywords", stats.config.include_keywords},
        {"filter_stopwords", stats.config.filter_stopwords},
    };
    return j;
}

void IndexStatsArtifact::write_to(const std::filesystem::path& out_path) const {
    write_json(out_path, to_json());
}

}  // namespace recs
