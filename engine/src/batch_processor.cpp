#include "fsplit/batch_processor.hpp"

#include <exception>
#include <filesystem>

namespace fsplit {

namespace fs = std::filesystem;

BatchProcessor::BatchProcessor(LogSink &log)
    : log_(log), walker_(log), splitter_(log), merger_(log) {}

BatchReport BatchProcessor::split_tree(const fs::path &root, const std::vector<fs::path> &ignore_files,
                                       const SplitOptions &options) const {
    // Validate the plan once up front so a bad flag does not fail every file.
    FileChunker::make_plan(0, options.parts, options.chunk_size);

    const auto files = walker_.collect_splittable(root, ignore_files);
    log_.emit(LogLevel::Info, "Found " + std::to_string(files.size()) + " files to split");

    BatchReport report;
    for (const auto &file : files) {
        try {
            splitter_.split(file, options);
            report.succeeded.push_back(file);
        } catch (const Error &err) {
            record_failure(report, file, err.code(), err.what());
        } catch (const std::exception &err) {
            record_failure(report, file, ErrorCode::IoError, err.what());
        }
    }
    return report;
}

BatchReport BatchProcessor::merge_tree(const fs::path &root, const std::vector<fs::path> &ignore_dirs,
                                       const MergeOptions &options) const {
    const auto directories = walker_.collect_split_directories(root, ignore_dirs);
    log_.emit(LogLevel::Info, "Found " + std::to_string(directories.size()) + " directories to merge");

    BatchReport report;
    for (const auto &directory : directories) {
        try {
            auto result = merger_.merge(directory, options);
            if (result.ok) {
                report.succeeded.push_back(directory);
            } else {
                record_failure(report, directory, ErrorCode::HashMismatch,
                               "hash mismatch for " + result.target.string());
            }
        } catch (const Error &err) {
            record_failure(report, directory, err.code(), err.what());
        } catch (const std::exception &err) {
            record_failure(report, directory, ErrorCode::IoError, err.what());
        }
    }
    return report;
}

void BatchProcessor::record_failure(BatchReport &report, const fs::path &path, ErrorCode code,
                                    const std::string &message) const {
    log_.emit(LogLevel::Error, path.string() + ": " + to_string(code) + ": " + message);
    report.failed.push_back(BatchFailure{path, code, message});
}

} // namespace fsplit
