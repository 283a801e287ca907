#include "commands/browse.hpp"
#include "commands/AppConfig.hpp"
#include "commands/CliArgs.hpp"

#include "catalog/MovieCatalog.hpp"
#include "io/JsonIO.hpp"
#include "nlohmann/json.hpp"

#include <iostream>
#include <string>

int cmd_list(int argc, char** argv) {
    const AppConfig cfg = resolve_config(argc, argv);
    const auto store = catalog::MovieCatalog::load_from_file(cfg.data_path);

    nlohmann::json arr = nlohmann::json::array();
    for (const auto& m : store.movies()) arr.push_back(movieToJson(m));

    std::cout << arr.dump(2) << "\n";
    return 0;
}

int cmd_show(int argc, char** argv) {
    const AppConfig cfg = resolve_config(argc, argv);

    const std::string id_str = cli::get_arg(argc, argv, "--id", "");
    if (id_str.empty()) {
        std::cerr << "error: missing --id\n";
        return 1;
    }
    const long long id = cli::get_arg_int64(argc, argv, "--id", -1);

    const auto store = catalog::MovieCatalog::load_from_file(cfg.data_path);
    const catalog::Movie* m = store.find(id);
    if (!m) {
        std::cerr << "error: movie not found: " << id_str << "\n";
        return 1;
    }

    std::cout << movieToJson(*m).dump(2) << "\n";
    return 0;
}

int cmd_genres(int argc, char** argv) {
    const AppConfig cfg = resolve_config(argc, argv);
    const auto store = catalog::MovieCatalog::load_from_file(cfg.data_path);

    nlohmann::json arr = store.genres();
    std::cout << arr.dump(2) << "\n";
    return 0;
}
