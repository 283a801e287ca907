#include "commands/AppConfig.hpp"
#include "commands/CliArgs.hpp"

#include <algorithm>
#include <cstdlib>
#include <iostream>

static const char* kDefaultDataPath = "data/movies.json";
static const char* kDataEnvVar = "MOVIE_RECS_DATA";

AppConfig resolve_config(int argc, char** argv) {
    AppConfig cfg;

    std::string data = cli::get_arg(argc, argv, "--data", "");
    if (data.empty()) {
        const char* env = std::getenv(kDataEnvVar);
        if (env && *env) data = env;
    }
    cfg.data_path = data.empty() ? kDefaultDataPath : data;

    cfg.top_n = std::max(0, cli::get_arg_int(argc, argv, "--topN", cfg.top_n));

    cfg.index.genre_weight = cli::get_arg_double(argc, argv, "--genre_weight", cfg.index.genre_weight);
    if (cli::has_flag(argc, argv, "--no_keywords")) cfg.index.include_keywords = false;
    if (cli::has_flag(argc, argv, "--keep_stopwords")) cfg.index.filter_stopwords = false;

    return cfg;
}

std::shared_ptr<const recs::SimilarityIndex> rebuild_and_log(
    recs::Recommender& rec,
    const catalog::MovieCatalog& store
) {
    auto idx = rec.rebuild(store.movies());
    const recs::IndexStats s = idx->stats();

    if (s.docs == 0) {
        std::cerr << "warning: empty corpus, index has no documents\n";
    }
    std::cerr << "index built: " << s.docs << " docs, vocab=" << s.vocab
              << ", genres=" << s.genre_dims << "\n";
    return idx;
}
