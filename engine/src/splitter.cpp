#include "fsplit/splitter.hpp"

#include "fsplit/checksum.hpp"
#include "fsplit/errors.hpp"
#include "fsplit/part_codec.hpp"
#include "fsplit/paths.hpp"

#include <algorithm>
#include <optional>
#include <system_error>
#include <vector>

namespace fsplit {

namespace fs = std::filesystem;

namespace {

constexpr std::size_t kCopyBufferSize = 4 * 1024 * 1024;
constexpr const char *kUnsuffixedDirectorySuffix = ".parts";

// Lists what a previous split of `original_name` left in `directory`. Throws
// InvalidArguments when the directory holds anything else, so a user
// directory or another file's split is never cleared.
std::vector<fs::path> previous_split_entries(const fs::path &directory,
                                             const std::string &original_name) {
    std::error_code ec;
    const auto status = fs::symlink_status(directory, ec);
    if (!fs::exists(status)) {
        return {};
    }
    if (!fs::is_directory(status)) {
        throw Error(ErrorCode::InvalidArguments,
                    "split directory path is occupied by a file: " + directory.string());
    }
    if (has_descriptor(directory)) {
        std::string owner;
        try {
            owner = load_descriptor(directory).original_name;
        } catch (const Error &err) {
            throw Error(ErrorCode::InvalidArguments,
                        directory.string() + " holds an unreadable descriptor: " + err.what());
        }
        if (owner != original_name) {
            throw Error(ErrorCode::InvalidArguments,
                        directory.string() + " already holds the split of " + owner);
        }
    }
    const std::string temp_name = std::string(descriptor_file_name) + descriptor_temp_suffix;
    std::vector<fs::path> entries;
    for (const auto &entry : fs::directory_iterator(directory)) {
        const auto name = entry.path().filename().string();
        const bool owned = fs::is_regular_file(entry.symlink_status()) &&
                           (name == descriptor_file_name || name == temp_name ||
                            is_part_file_of(name, original_name));
        if (!owned) {
            throw Error(ErrorCode::InvalidArguments, directory.string() +
                                                         " is not a split directory of " +
                                                         original_name + ": it contains " + name);
        }
        entries.push_back(entry.path());
    }
    return entries;
}

} // namespace

Splitter::Splitter(LogSink &log) : log_(log) {}

fs::path Splitter::split_directory_for(const fs::path &file) {
    const auto name = file.filename().string();
    const auto leading = name.find_first_not_of('.');
    std::string stem = name;
    if (leading != std::string::npos) {
        const auto dot = name.find('.', leading);
        if (dot != std::string::npos) {
            stem = name.substr(0, dot);
        }
    }
    if (stem == name) {
        stem += kUnsuffixedDirectorySuffix;
    }
    return file.parent_path() / stem;
}

SplitDescriptor Splitter::split(const fs::path &path, const SplitOptions &options) const {
    const auto source = resolve_path(path);
    std::error_code ec;
    if (!fs::is_regular_file(source, ec)) {
        throw Error(ErrorCode::SourceNotFound, "source is not a regular file: " + source.string());
    }

    const auto file_size = static_cast<std::uint64_t>(fs::file_size(source));
    log_.emit(LogLevel::Info, "Source file: " + source.string());
    log_.emit(LogLevel::Info, "File size: " + std::to_string(file_size));

    const FileChunker chunker(FileChunker::make_plan(file_size, options.parts, options.chunk_size));
    log_.emit(LogLevel::Info, "Parts: " + std::to_string(chunker.plan().parts));
    log_.emit(LogLevel::Info, "Segment size: " + std::to_string(chunker.plan().chunk_size));
    const auto chunks = chunker.chunks();

    const auto directory = split_directory_for(source);
    const auto stale = previous_split_entries(directory, source.filename().string());

    log_.emit(LogLevel::Debug, "Calculating file hash");
    SplitDescriptor descriptor;
    descriptor.original_name = source.filename().string();
    descriptor.original_size = file_size;
    descriptor.original_hash = Checksum::file_sha256_hex(source);
    descriptor.compressed = options.compress;
    log_.emit(LogLevel::Info, "File hash: " + descriptor.original_hash);

    if (!stale.empty()) {
        log_.emit(LogLevel::Debug, "Clearing previous split in " + directory.string());
    }
    for (const auto &entry : stale) {
        fs::remove(entry);
    }
    log_.emit(LogLevel::Debug, "Creating " + directory.string());
    fs::create_directory(directory);

    std::ifstream in(source, std::ios::binary);
    if (!in) {
        throw Error(ErrorCode::SourceNotFound, "failed to open source file: " + source.string());
    }
    std::uint64_t bytes_written = 0;
    for (const auto &chunk : chunks) {
        auto name = part_file_name(descriptor.original_name, chunk.index);
        log_.emit(LogLevel::Debug, "Writing to file: " + name);
        bytes_written += write_part(in, chunk, directory / name, options.compress);
        descriptor.parts.push_back(std::move(name));
    }
    log_.emit(LogLevel::Info, std::to_string(bytes_written) + " bytes written");

    save_descriptor(directory, descriptor);

    if (options.remove_original) {
        log_.emit(LogLevel::Debug, "Removing the original file");
        fs::remove(source, ec);
        if (ec) {
            throw Error(ErrorCode::IoError,
                        "failed to remove original file " + source.string() + ": " + ec.message());
        }
    }
    log_.emit(LogLevel::Info, "Split finished: " + directory.string());
    return descriptor;
}

std::uint64_t Splitter::write_part(std::ifstream &source, const FileChunk &chunk,
                                   const fs::path &part_path, bool compress) const {
    std::ofstream out(part_path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw Error(ErrorCode::IoError, "failed to create part file: " + part_path.string());
    }
    std::vector<char> buffer(static_cast<std::size_t>(
        std::min<std::uint64_t>(std::max<std::uint64_t>(chunk.size, 1), kCopyBufferSize)));
    std::optional<PartCodec::Deflater> deflater;
    if (compress) {
        deflater.emplace();
    }
    std::uint64_t remaining = chunk.size;
    while (remaining > 0) {
        const auto to_read = static_cast<std::size_t>(std::min<std::uint64_t>(remaining, buffer.size()));
        source.read(buffer.data(), static_cast<std::streamsize>(to_read));
        if (static_cast<std::size_t>(source.gcount()) != to_read) {
            throw Error(ErrorCode::IoError, "source file shrank while splitting: " + part_path.string());
        }
        if (deflater) {
            deflater->update(buffer.data(), to_read, out);
        } else {
            out.write(buffer.data(), static_cast<std::streamsize>(to_read));
        }
        remaining -= to_read;
    }
    if (deflater) {
        deflater->finish(out);
    }
    out.flush();
    if (!out) {
        throw Error(ErrorCode::IoError, "failed to write part file: " + part_path.string());
    }
    return static_cast<std::uint64_t>(out.tellp());
}

} // namespace fsplit
