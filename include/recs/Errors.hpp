#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace recs {

// record id is not part of the snapshot being queried
class NotFoundError : public std::runtime_error {
public:
    explicit NotFoundError(std::int64_t id)
        : std::runtime_error("movie not found: " + std::to_string(id)), m_id(id) {}

    std::int64_t id() const { return m_id; }

private:
    std::int64_t m_id;
};

}  // namespace recs
