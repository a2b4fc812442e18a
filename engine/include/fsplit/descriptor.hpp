#pragma once

#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <string>
#include <vector>

namespace fsplit {

inline constexpr const char *descriptor_file_name = "config.ini";
inline constexpr const char *descriptor_temp_suffix = ".tmp";
inline constexpr const char *part_file_suffix = ".part";

struct SplitDescriptor {
    std::string original_name;
    std::uint64_t original_size{0};
    std::string original_hash;
    bool compressed{false};
    // parts[i] is the file name of part i; the vector position is the order.
    std::vector<std::string> parts;

    std::size_t part_count() const noexcept { return parts.size(); }
};

std::string part_file_name(const std::string &original_name, std::size_t index);

// True for `<original_name>.<digits>.part`.
bool is_part_file_of(const std::string &file_name, const std::string &original_name);

bool has_descriptor(const std::filesystem::path &directory);

void write_descriptor(std::ostream &out, const SplitDescriptor &descriptor);

// Throws MissingDescriptor on malformed input or when the part indices are
// not exactly 0..parts-1.
SplitDescriptor parse_descriptor(std::istream &in);

// Writes to a temporary file in `directory` and renames it into place.
void save_descriptor(const std::filesystem::path &directory, const SplitDescriptor &descriptor);

SplitDescriptor load_descriptor(const std::filesystem::path &directory);

} // namespace fsplit
