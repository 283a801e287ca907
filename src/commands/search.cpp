#include "commands/search.hpp"
#include "commands/AppConfig.hpp"
#include "commands/CliArgs.hpp"

#include "catalog/MovieCatalog.hpp"
#include "recs/Recommender.hpp"
#include "recs/ResultArtifacts.hpp"

#include <iostream>
#include <string>
#include <vector>

int cmd_search(int argc, char** argv) {
    const AppConfig cfg = resolve_config(argc, argv);

    const std::string query = cli::get_arg(argc, argv, "--query", "");
    const std::vector<std::string> genres = cli::get_arg_list(argc, argv, "--genres");
    const std::string out_path = cli::get_arg(argc, argv, "--out", "");

    if (query.empty() && genres.empty()) {
        std::cerr << "warning: empty query, nothing to match\n";
    }

    const auto store = catalog::MovieCatalog::load_from_file(cfg.data_path);

    recs::Recommender rec(cfg.index);
    const auto idx = rebuild_and_log(rec, store);

    const auto hits = recs::rank_by_query(*idx, query, genres, cfg.top_n);

    recs::SearchArtifact art;
    art.query = query;
    art.genres = genres;
    art.built_at = idx->built_at();
    art.results = recs::resolve_hits(store, hits);

    if (!out_path.empty()) {
        art.write_to(out_path);
        std::cerr << "OUT_SEARCH: " << out_path << "\n";
    }

    std::cout << art.to_json().dump(2) << "\n";
    return 0;
}
