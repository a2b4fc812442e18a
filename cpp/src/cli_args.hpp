#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace fsplit::cli {

class UsageError : public std::runtime_error {
  public:
    explicit UsageError(const std::string &msg) : std::runtime_error(msg) {}
};

inline std::uint64_t parse_count(const std::string &flag, const std::string &value) {
    if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
        throw UsageError(flag + " expects a non-negative integer, got '" + value + "'");
    }
    try {
        return static_cast<std::uint64_t>(std::stoull(value));
    } catch (const std::out_of_range &) {
        throw UsageError(flag + " is out of range: " + value);
    }
}

inline void require_one_of_parts_or_chunk_size(std::uint64_t parts, std::uint64_t chunk_size) {
    if ((parts == 0) == (chunk_size == 0)) {
        throw UsageError("exactly one of --parts and --chunk-size must be given and > 0");
    }
}

} // namespace fsplit::cli
