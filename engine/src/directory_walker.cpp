#include "fsplit/directory_walker.hpp"

#include "fsplit/descriptor.hpp"
#include "fsplit/errors.hpp"
#include "fsplit/paths.hpp"

#include <algorithm>
#include <queue>
#include <string>
#include <system_error>

namespace fsplit {

namespace fs = std::filesystem;

namespace {

fs::path require_root(const fs::path &root) {
    auto resolved = resolve_path(root);
    std::error_code ec;
    if (!fs::is_directory(resolved, ec)) {
        throw Error(ErrorCode::MissingDirectory, "root is not a directory: " + resolved.string());
    }
    return resolved;
}

bool has_part_suffix(const fs::path &path) {
    const auto name = path.filename().string();
    const std::string suffix = part_file_suffix;
    return name.size() >= suffix.size() &&
           name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool is_real_directory(const fs::directory_entry &entry) {
    std::error_code ec;
    return !entry.is_symlink(ec) && entry.is_directory(ec);
}

} // namespace

DirectoryWalker::DirectoryWalker(LogSink &log) : log_(log) {}

std::set<fs::path> DirectoryWalker::resolve_ignore_list(const fs::path &root,
                                                        const std::vector<fs::path> &entries) {
    const auto base = resolve_path(root);
    std::set<fs::path> resolved;
    for (const auto &entry : entries) {
        if (!entry.empty()) {
            resolved.insert(resolve_path(entry, base));
        }
    }
    return resolved;
}

std::vector<fs::directory_entry> DirectoryWalker::list_children(const fs::path &directory) const {
    std::vector<fs::directory_entry> children;
    std::error_code ec;
    fs::directory_iterator it(directory, ec);
    if (ec) {
        log_.emit(LogLevel::Warn, "cannot read directory " + directory.string() + ": " + ec.message());
        return children;
    }
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) {
            log_.emit(LogLevel::Warn, "error while reading " + directory.string() + ": " + ec.message());
            break;
        }
        children.push_back(*it);
    }
    std::sort(children.begin(), children.end(),
              [](const fs::directory_entry &a, const fs::directory_entry &b) { return a.path() < b.path(); });
    return children;
}

std::vector<fs::path> DirectoryWalker::collect_splittable(const fs::path &root,
                                                          const std::vector<fs::path> &ignore_files) const {
    const auto start = require_root(root);
    const auto ignored = resolve_ignore_list(start, ignore_files);

    std::vector<fs::path> files;
    std::queue<fs::path> pending;
    pending.push(start);
    while (!pending.empty()) {
        const auto current = pending.front();
        pending.pop();
        if (ignored.count(current) != 0) {
            log_.emit(LogLevel::Debug, "Ignoring " + current.string());
            continue;
        }
        if (has_descriptor(current)) {
            log_.emit(LogLevel::Debug, "Skipping split directory " + current.string());
            continue;
        }
        for (const auto &entry : list_children(current)) {
            const auto path = resolve_path(entry.path());
            if (is_real_directory(entry)) {
                pending.push(path);
                continue;
            }
            std::error_code ec;
            if (!entry.is_regular_file(ec)) {
                continue;
            }
            if (ignored.count(path) != 0) {
                log_.emit(LogLevel::Debug, "Ignoring " + path.string());
                continue;
            }
            if (has_part_suffix(path) || path.filename() == descriptor_file_name) {
                continue;
            }
            files.push_back(path);
        }
    }
    return files;
}

std::vector<fs::path>
DirectoryWalker::collect_split_directories(const fs::path &root,
                                           const std::vector<fs::path> &ignore_dirs) const {
    const auto start = require_root(root);
    const auto ignored = resolve_ignore_list(start, ignore_dirs);

    std::vector<fs::path> directories;
    std::queue<fs::path> pending;
    pending.push(start);
    while (!pending.empty()) {
        const auto current = pending.front();
        pending.pop();
        if (ignored.count(current) != 0) {
            log_.emit(LogLevel::Debug, "Ignoring " + current.string());
            continue;
        }
        if (has_descriptor(current)) {
            directories.push_back(current);
            continue;
        }
        for (const auto &entry : list_children(current)) {
            if (is_real_directory(entry)) {
                pending.push(resolve_path(entry.path()));
            }
        }
    }
    return directories;
}

} // namespace fsplit
