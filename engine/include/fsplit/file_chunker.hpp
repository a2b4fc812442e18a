#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace fsplit {

struct ChunkPlan {
    std::uint64_t file_size;
    std::uint64_t parts;
    std::uint64_t chunk_size;
};

struct FileChunk {
    std::size_t index;
    std::uint64_t offset;
    std::uint64_t size;
};

class FileChunker {
  public:
    // Exactly one of `parts` and `chunk_size` must be non-zero; the other is
    // derived with ceiling division.
    static ChunkPlan make_plan(std::uint64_t file_size, std::uint64_t parts,
                               std::uint64_t chunk_size);

    explicit FileChunker(ChunkPlan plan);

    // One entry per planned part, trailing parts may be empty.
    std::vector<FileChunk> chunks() const;

    const ChunkPlan &plan() const noexcept;

  private:
    ChunkPlan plan_;
};

} // namespace fsplit
