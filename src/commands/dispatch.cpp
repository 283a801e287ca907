#include "commands/dispatch.hpp"
#include "commands/add.hpp"
#include "commands/browse.hpp"
#include "commands/recommend.hpp"
#include "commands/search.hpp"
#include "commands/stats.hpp"

#include <iostream>
#include <string>

static int print_usage() {
    std::cerr
        << "usage:\n"
        << "  movie-recs list [--data <path>]\n"
        << "  movie-recs show --id <n>\n"
        << "  movie-recs genres\n"
        << "  movie-recs recommend --id <n> [args]\n"
        << "  movie-recs search --query \"<text>\" [args]\n"
        << "  movie-recs add --title \"<title>\" [args]\n"
        << "  movie-recs stats [args]\n"
        << "  movie-recs help\n";
    return 1;
}

static void print_common_help() {
    std::cerr
        << "common:\n"
        << "  --data <path>                default: $MOVIE_RECS_DATA or data/movies.json\n"
        << "  --topN <n>                   default: 5 (negative -> 0)\n"
        << "  --genre_weight <f>           default: 1.2\n"
        << "  --no_keywords                leave keywords out of the lexical text\n"
        << "  --keep_stopwords             do not drop stop words\n";
}

static int print_list_help() {
    std::cerr
        << "usage:\n"
        << "  movie-recs list [--data <path>]\n"
        << "\n"
        << "  prints every movie in the catalog as JSON\n";
    return 0;
}

static int print_show_help() {
    std::cerr
        << "usage:\n"
        << "  movie-recs show --id <n> [--data <path>]\n"
        << "\n"
        << "  --id <n>                     (required) movie to print\n";
    return 0;
}

static int print_genres_help() {
    std::cerr
        << "usage:\n"
        << "  movie-recs genres [--data <path>]\n"
        << "\n"
        << "  prints the sorted list of genre tags\n";
    return 0;
}

static int print_recommend_help() {
    std::cerr
        << "usage:\n"
        << "  movie-recs recommend --id <n> [options]\n"
        << "\n"
        << "  --id <n>                     (required) base movie\n"
        << "  --out <path>                 optional: also write the result JSON here\n"
        << "\n";
    print_common_help();
    return 0;
}

static int print_search_help() {
    std::cerr
        << "usage:\n"
        << "  movie-recs search --query \"<text>\" [options]\n"
        << "\n"
        << "  --query <str>                free text matched against title/description/keywords\n"
        << "  --genres <a,b>               genre tags matched against movie genres\n"
        << "  --out <path>                 optional: also write the result JSON here\n"
        << "\n";
    print_common_help();
    return 0;
}

static int print_add_help() {
    std::cerr
        << "usage:\n"
        << "  movie-recs add --title \"<title>\" [options]\n"
        << "\n"
        << "  --title <str>                (required)\n"
        << "  --year <n>\n"
        << "  --genres <a,b>\n"
        << "  --keywords <a,b>\n"
        << "  --poster <url>\n"
        << "  --desc <text>\n"
        << "\n";
    print_common_help();
    return 0;
}

static int print_stats_help() {
    std::cerr
        << "usage:\n"
        << "  movie-recs stats [options]\n"
        << "\n"
        << "  --out <path>                 optional: also write the stats JSON here\n"
        << "\n";
    print_common_help();
    return 0;
}

int dispatch(int argc, char** argv) {
    if (argc < 2) return print_usage();

    const std::string cmd = argv[1];

    if (cmd == "help") {
        return print_usage();
    }

    const bool wants_help = (argc >= 3 && std::string(argv[2]) == "--help");
    if (cmd == "list"      && wants_help) return print_list_help();
    if (cmd == "show"      && wants_help) return print_show_help();
    if (cmd == "genres"    && wants_help) return print_genres_help();
    if (cmd == "recommend" && wants_help) return print_recommend_help();
    if (cmd == "search"    && wants_help) return print_search_help();
    if (cmd == "add"       && wants_help) return print_add_help();
    if (cmd == "stats"     && wants_help) return print_stats_help();

    if (cmd == "list")      return cmd_list(argc - 1, argv + 1);
    if (cmd == "show")      return cmd_show(argc - 1, argv + 1);
    if (cmd == "genres")    return cmd_genres(argc - 1, argv + 1);
    if (cmd == "recommend") return cmd_recommend(argc - 1, argv + 1);
    if (cmd == "search")    return cmd_search(argc - 1, argv + 1);
    if (cmd == "add")       return cmd_add(argc - 1, argv + 1);
    if (cmd == "stats")     return cmd_stats(argc - 1, argv + 1);

    std::cerr << "unknown command\n";
    return print_usage();
}
