#include "commands/recommend.hpp"
#include "commands/AppConfig.hpp"
#include "commands/CliArgs.hpp"

#include "catalog/MovieCatalog.hpp"
#include "recs/Errors.hpp"
#include "recs/Recommender.hpp"
#include "recs/ResultArtifacts.hpp"

#include <iostream>
#include <string>

static int recommend_usage() {
    std::cerr
        << "usage:\n"
        << "  movie-recs recommend --id <n> [--topN <n>] [--data <path>] [--out <path>]\n";
    return 1;
}

int cmd_recommend(int argc, char** argv) {
    const AppConfig cfg = resolve_config(argc, argv);

    if (cli::get_arg(argc, argv, "--id", "").empty()) {
        std::cerr << "error: missing --id\n";
        return recommend_usage();
    }
    const long long id = cli::get_arg_int64(argc, argv, "--id", -1);
    const std::string out_path = cli::get_arg(argc, argv, "--out", "");

    const auto store = catalog::MovieCatalog::load_from_file(cfg.data_path);

    recs::Recommender rec(cfg.index);
    const auto idx = rebuild_and_log(rec, store);

    std::vector<recs::ScoredRecord> hits;
    try {
        hits = recs::rank_by_record(*idx, id, cfg.top_n);
    } catch (const recs::NotFoundError& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }

    recs::RecommendationsArtifact art;
    art.base_id = id;
    art.built_at = idx->built_at();
    art.recommendations = recs::resolve_hits(store, hits);

    if (!out_path.empty()) {
        art.write_to(out_path);
        std::cerr << "OUT_RECOMMEND: " << out_path << "\n";
    }

    std::cout << art.to_json().dump(2) << "\n";
    return 0;
}
