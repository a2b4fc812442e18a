#include "fsplit/paths.hpp"

#include <system_error>

namespace fsplit {

namespace fs = std::filesystem;

fs::path resolve_path(const fs::path &path) { return resolve_path(path, fs::current_path()); }

fs::path resolve_path(const fs::path &path, const fs::path &base) {
    auto absolute = (path.is_absolute() ? path : base / path).lexically_normal();
    if (!absolute.has_filename() && absolute != absolute.root_path()) {
        absolute = absolute.parent_path();
    }
    std::error_code ec;
    auto resolved = fs::weakly_canonical(absolute, ec);
    return ec ? absolute : resolved;
}

} // namespace fsplit
