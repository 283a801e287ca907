#include "commands/stats.hpp"
#include "commands/AppConfig.hpp"
#include "commands/CliArgs.hpp"

#include "catalog/MovieCatalog.hpp"
#include "recs/Recommender.hpp"
#include "recs/ResultArtifacts.hpp"

#include <iostream>
#include <string>

int cmd_stats(int argc, char** argv) {
    const AppConfig cfg = resolve_config(argc, argv);
    const std::string out_path = cli::get_arg(argc, argv, "--out", "");

    const auto store = catalog::MovieCatalog::load_from_file(cfg.data_path);

    recs::Recommender rec(cfg.index);
    const auto idx = rebuild_and_log(rec, store);

    recs::IndexStatsArtifact art;
    art.stats = idx->stats();

    if (!out_path.empty()) {
        art.write_to(out_path);
        std::cerr << "OUT_STATS: " << out_path << "\n";
    }

    std::cout << art.to_json().dump(2) << "\n";
    return 0;
}
