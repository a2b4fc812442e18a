#pragma once

#include <filesystem>

namespace fsplit {

// Absolute, lexically normal, symlinks resolved for the part that exists,
// no trailing separator. `base` anchors relative paths.
std::filesystem::path resolve_path(const std::filesystem::path &path);
std::filesystem::path resolve_path(const std::filesystem::path &path,
                                   const std::filesystem::path &base);

} // namespace fsplit
