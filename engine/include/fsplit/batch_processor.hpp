#pragma once

#include "fsplit/directory_walker.hpp"
#include "fsplit/errors.hpp"
#include "fsplit/log_sink.hpp"
#include "fsplit/merger.hpp"
#include "fsplit/splitter.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace fsplit {

struct BatchFailure {
    std::filesystem::path path;
    ErrorCode code;
    std::string message;
};

struct BatchReport {
    std::vector<std::filesystem::path> succeeded;
    std::vector<BatchFailure> failed;

    bool ok() const noexcept { return failed.empty(); }
};

// Runs split or merge over a whole tree, one item at a time. A failing item
// is logged and recorded; the remaining items are still processed.
class BatchProcessor {
  public:
    explicit BatchProcessor(LogSink &log = null_log_sink());

    BatchReport split_tree(const std::filesystem::path &root,
                           const std::vector<std::filesystem::path> &ignore_files,
                           const SplitOptions &options) const;

    BatchReport merge_tree(const std::filesystem::path &root,
                           const std::vector<std::filesystem::path> &ignore_dirs,
                           const MergeOptions &options) const;

  private:
    void record_failure(BatchReport &report, const std::filesystem::path &path, ErrorCode code,
                        const std::string &message) const;

    LogSink &log_;
    DirectoryWalker walker_;
    Splitter splitter_;
    Merger merger_;
};

} // namespace fsplit
