#include "commands/add.hpp"
#include "commands/AppConfig.hpp"
#include "commands/CliArgs.hpp"

#include "catalog/MovieCatalog.hpp"
#include "io/JsonIO.hpp"
#include "recs/Recommender.hpp"
#include "text/TextUtil.hpp"

#include <iostream>
#include <string>

static int add_usage() {
    std::cerr
        << "usage:\n"
        << "  movie-recs add --title <str> [--year <n>] [--genres a,b] [--keywords a,b]\n"
        << "                 [--poster <url>] [--desc <text>] [--data <path>]\n";
    return 1;
}

int cmd_add(int argc, char** argv) {
    const AppConfig cfg = resolve_config(argc, argv);

    catalog::NewMovie nm;
    nm.title       = cli::get_arg(argc, argv, "--title", "");
    nm.year        = cli::get_arg_int(argc, argv, "--year", 0);
    nm.genres      = cli::get_arg_list(argc, argv, "--genres");
    nm.keywords    = cli::get_arg_list(argc, argv, "--keywords");
    nm.poster      = cli::get_arg(argc, argv, "--poster", "");
    nm.description = cli::get_arg(argc, argv, "--desc", "");

    if (textutil::trim(nm.title).empty()) {
        std::cerr << "error: missing title\n";
        return add_usage();
    }

    auto store = catalog::MovieCatalog::load_from_file(cfg.data_path);
    const catalog::Movie added = store.add(std::move(nm));

    store.save(cfg.data_path);
    std::cerr << "saved: " << cfg.data_path << " (n=" << store.size() << ")\n";

    // one rebuild per add here; batching is up to whoever drives the catalog
    recs::Recommender rec(cfg.index);
    rebuild_and_log(rec, store);

    std::cout << movieToJson(added).dump(2) << "\n";
    return 0;
}
