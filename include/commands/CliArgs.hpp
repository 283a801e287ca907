#pragma once
#include <string>
#include <vector>

namespace cli {

bool has_flag(int argc, char** argv, const std::string& key);
std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def);

// unparsable values fall back to def
int get_arg_int(int argc, char** argv, const std::string& key, int def);
long long get_arg_int64(int argc, char** argv, const std::string& key, long long def);
double get_arg_double(int argc, char** argv, const std::string& key, double def);

// "--genres SciFi,Action" -> {"SciFi", "Action"}
std::vector<std::string> get_arg_list(int argc, char** argv, const std::string& key);

}  // namespace cli
