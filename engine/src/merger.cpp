#include "fsplit/merger.hpp"

#include "fsplit/checksum.hpp"
#include "fsplit/errors.hpp"
#include "fsplit/part_codec.hpp"
#include "fsplit/paths.hpp"

#include <optional>
#include <system_error>
#include <vector>

namespace fsplit {

namespace fs = std::filesystem;

namespace {

constexpr std::size_t kCopyBufferSize = 4 * 1024 * 1024;

} // namespace

Merger::Merger(LogSink &log) : log_(log) {}

MergeResult Merger::merge(const fs::path &directory, const MergeOptions &options) const {
    const auto dir = resolve_path(directory);
    log_.emit(LogLevel::Info, "Reading directory: " + dir.string());
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        throw Error(ErrorCode::MissingDirectory, "directory does not exist: " + dir.string());
    }

    log_.emit(LogLevel::Debug, "Reading descriptor");
    const auto descriptor = load_descriptor(dir);

    MergeResult result;
    result.expected_hash = descriptor.original_hash;
    result.target = dir.parent_path() / descriptor.original_name;
    const auto target_status = fs::symlink_status(result.target, ec);
    if (fs::exists(target_status)) {
        if (fs::is_directory(target_status)) {
            throw Error(ErrorCode::IoError,
                        "merge target is a directory: " + result.target.string());
        }
        fs::remove(result.target);
    }

    log_.emit(LogLevel::Info, "Merging " + std::to_string(descriptor.part_count()) + " parts into " +
                                  result.target.string());
    {
        std::ofstream out(result.target, std::ios::binary | std::ios::app);
        if (!out) {
            throw Error(ErrorCode::IoError, "failed to create merge target: " + result.target.string());
        }
        for (const auto &name : descriptor.parts) {
            if (fs::path(name).filename().string() != name) {
                throw Error(ErrorCode::PartReadError, "part name is not a bare file name: " + name);
            }
            log_.emit(LogLevel::Debug, "Reading file: " + name);
            append_part(dir / name, descriptor.compressed, out);
        }
        out.flush();
        if (!out) {
            throw Error(ErrorCode::IoError, "failed to write merge target: " + result.target.string());
        }
    }

    const auto merged_size = static_cast<std::uint64_t>(fs::file_size(result.target));
    if (merged_size != descriptor.original_size) {
        throw Error(ErrorCode::PartReadError,
                    "merged " + std::to_string(merged_size) + " bytes into " +
                        result.target.string() + " but the descriptor records " +
                        std::to_string(descriptor.original_size));
    }

    log_.emit(LogLevel::Debug, "Verifying file hash");
    result.verified_hash = Checksum::file_sha256_hex(result.target);
    result.ok = result.verified_hash == result.expected_hash;
    if (!result.ok) {
        log_.emit(LogLevel::Error, "Hash verification failed for " + result.target.string() +
                                       ": expected " + result.expected_hash + ", got " +
                                       result.verified_hash);
        return result;
    }
    log_.emit(LogLevel::Info, "Hash verification succeeded: " + result.verified_hash);

    if (options.remove_after) {
        log_.emit(LogLevel::Debug, "Removing the directory " + dir.string());
        fs::remove_all(dir);
    }
    log_.emit(LogLevel::Info, "Merge finished: " + result.target.string());
    return result;
}

void Merger::append_part(const fs::path &part_path, bool compressed, std::ofstream &out) const {
    std::error_code ec;
    if (!fs::is_regular_file(part_path, ec)) {
        throw Error(ErrorCode::PartReadError, "missing part file: " + part_path.string());
    }
    std::ifstream in(part_path, std::ios::binary);
    if (!in) {
        throw Error(ErrorCode::PartReadError, "failed to open part file: " + part_path.string());
    }
    std::optional<PartCodec::Inflater> inflater;
    if (compressed) {
        inflater.emplace();
    }
    std::vector<char> buffer(kCopyBufferSize);
    try {
        while (in) {
            in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
            const auto read = in.gcount();
            if (read <= 0) {
                break;
            }
            if (inflater) {
                inflater->update(buffer.data(), static_cast<std::size_t>(read), out);
            } else {
                out.write(buffer.data(), read);
            }
        }
        if (inflater) {
            inflater->finish();
        }
    } catch (const Error &err) {
        if (err.code() != ErrorCode::PartReadError) {
            throw;
        }
        throw Error(ErrorCode::PartReadError, part_path.string() + ": " + err.what());
    }
    if (in.bad()) {
        throw Error(ErrorCode::PartReadError, "failed while reading part file: " + part_path.string());
    }
}

} // namespace fsplit
