#pragma once
#include <string>
#include <unordered_set>
#include <vector>

namespace textutil {

// lowercase, turn every run of non [a-z0-9] into one space, trim
std::string normalize(const std::string& s);

// normalize + split on spaces; empty input gives an empty vector
std::vector<std::string> tokenize(const std::string& text);

// tokenize, then drop stop words
std::vector<std::string> tokenize_filtered(const std::string& text);

const std::unordered_set<std::string>& stopwords();
bool is_stopword(const std::string& token);

std::string trim(const std::string& s);

// "a, b ,,c" -> {"a", "b", "c"}
std::vector<std::string> split_csv(const std::string& s);

}
