#include "commands/CliArgs.hpp"
#include "text/TextUtil.hpp"

#include <stdexcept>

namespace cli {

bool has_flag(int argc, char** argv, const std::string& key) {
    for (int i = 0; i < argc; ++i) {
        if (std::string(argv[i]) == key) return true;
    }
    return false;
}

std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def) {
    for (int i = 0; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == key) return std::string(argv[i + 1]);
    }
    return def;
}

int get_arg_int(int argc, char** argv, const std::string& key, int def) {
    const std::string s = get_arg(argc, argv, key, "");
    if (s.empty()) return def;
    try { return std::stoi(s); } catch (const std::exception&) { return def; }
}

long long get_arg_int64(int argc, char** argv, const std::string& key, long long def) {
    const std::string s = get_arg(argc, argv, key, "");
    if (s.empty()) return def;
    try { return std::stoll(s); } catch (const std::exception&) { return def; }
}

double get_arg_double(int argc, char** argv, const std::string& key, double def) {
    const std::string s = get_arg(argc, argv, key, "");
    if (s.empty()) return def;
    try { return std::stod(s); } catch (const std::exception&) { return def; }
}

std::vector<std::string> get_arg_list(int argc, char** argv, const std::string& key) {
    return textutil::split_csv(get_arg(argc, argv, key, ""));
}

}  // namespace cli
