#include "text/TextUtil.hpp"
#include <cctype>

namespace textutil {

std::string normalize(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    bool prev_space = true;

    for (unsigned char ch : s) {
        // bytes >= 0x80 are never alphanumeric here, whatever the locale says
        unsigned char c = (ch < 0x80) ? static_cast<unsigned char>(std::tolower(ch)) : ch;

        bool keep =
            (c >= 'a' && c <= 'z') ||
            (c >= '0' && c <= '9');

        if (keep) {
            out.push_back(static_cast<char>(c));
            prev_space = false;
        } else {
            if (!prev_space) {
                out.push_back(' ');
                prev_space = true;
            }
        }
    }

    // trim trailing space
    if (!out.empty() && out.back() == ' ') out.pop_back();
    return out;
}

std::vector<std::string> tokenize(const std::string& text) {
    const std::string normalized = normalize(text);

    std::vector<std::string> tokens;
    std::string cur;

    for (char c : normalized) {
        if (c == ' ') {
            if (!cur.empty()) {
                tokens.push_back(cur);
                cur.clear();
            }
        } else {
            cur.push_back(c);
        }
    }
    if (!cur.empty()) tokens.push_back(cur);
    return tokens;
}

const std::unordered_set<std::string>& stopwords() {
    static const std::unordered_set<std::string> words = {
        "the", "and", "a", "an", "of", "in", "on", "to", "for", "with", "is",
        "are", "by", "from", "that", "this", "it", "as", "be", "was", "which"
    };
    return words;
}

bool is_stopword(const std::string& token) {
    return stopwords().count(token) != 0;
}

std::vector<std::string> tokenize_filtered(const std::string& text) {
    auto toks = tokenize(text);

    std::vector<std::string> out;
    out.reserve(toks.size());
    for (auto& t : toks) {
        if (!is_stopword(t)) out.push_back(std::move(t));
    }
    return out;
}

std::string trim(const std::string& s) {
    size_t a = 0;
    while (a < s.size() && std::isspace(static_cast<unsigned char>(s[a]))) ++a;

    size_t b = s.size();
    while (b > a && std::isspace(static_cast<unsigned char>(s[b - 1]))) --b;

    return s.substr(a, b - a);
}

std::vector<std::string> split_csv(const std::string& s) {
    std::vector<std::string> out;
    std::string cur;

    for (char c : s) {
        if (c == ',') {
            std::string t = trim(cur);
            if (!t.empty()) out.push_back(std::move(t));
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    std::string t = trim(cur);
    if (!t.empty()) out.push_back(std::move(t));
    return out;
}

}
