#pragma once

#include "fsplit/log_sink.hpp"

#include <filesystem>
#include <set>
#include <vector>

namespace fsplit {

class DirectoryWalker {
  public:
    explicit DirectoryWalker(LogSink &log = null_log_sink());

    // Breadth-first list of regular files that may be split. Ignored paths,
    // part files, descriptor files and whole split directories are skipped.
    // Order is traversal order.
    std::vector<std::filesystem::path>
    collect_splittable(const std::filesystem::path &root,
                       const std::vector<std::filesystem::path> &ignore_files) const;

    // Breadth-first list of directories holding a descriptor. Does not
    // descend into a directory once it is found to hold one.
    std::vector<std::filesystem::path>
    collect_split_directories(const std::filesystem::path &root,
                              const std::vector<std::filesystem::path> &ignore_dirs) const;

    // Relative entries are taken relative to `root`.
    static std::set<std::filesystem::path>
    resolve_ignore_list(const std::filesystem::path &root,
                        const std::vector<std::filesystem::path> &entries);

  private:
    std::vector<std::filesystem::directory_entry>
    list_children(const std::filesystem::path &directory) const;

    LogSink &log_;
};

} // namespace fsplit
