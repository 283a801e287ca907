#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "catalog/Movie.hpp"

namespace testutil {

catalog::Movie make_movie(
    std::int64_t id,
    const std::string& title,
    const std::vector<std::string>& genres,
    const std::string& description
);

// 1 "Space War" [SciFi], 2 "Love Story" [Romance], 3 "Space Romance" [SciFi, Romance]
std::vector<catalog::Movie> space_romance_corpus();

// fresh empty directory under the system temp dir, named after the running test
std::filesystem::path scratch_dir();

// argv-style view over owned strings
class Argv {
public:
    explicit Argv(std::vector<std::string> args);
    int argc() const { return (int)m_ptrs.size(); }
    char** argv() { return m_ptrs.data(); }

private:
    std::vector<std::string> m_args;
    std::vector<char*> m_ptrs;
};

}  // namespace testutil
