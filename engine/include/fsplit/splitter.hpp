#pragma once

#include "fsplit/descriptor.hpp"
#include "fsplit/file_chunker.hpp"
#include "fsplit/log_sink.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>

namespace fsplit {

struct SplitOptions {
    // Exactly one of parts and chunk_size must be non-zero.
    std::uint64_t parts{0};
    std::uint64_t chunk_size{0};
    bool remove_original{false};
    bool compress{false};
};

class Splitter {
  public:
    explicit Splitter(LogSink &log = null_log_sink());

    // Splits `path` into part files inside its sibling directory. The
    // descriptor is written last; any previous split there is discarded.
    SplitDescriptor split(const std::filesystem::path &path, const SplitOptions &options) const;

    // `dir/archive.tar.gz` -> `dir/archive`; `dir/README` -> `dir/README.parts`.
    static std::filesystem::path split_directory_for(const std::filesystem::path &file);

  private:
    std::uint64_t write_part(std::ifstream &source, const FileChunk &chunk,
                             const std::filesystem::path &part_path, bool compress) const;

    LogSink &log_;
};

} // namespace fsplit
