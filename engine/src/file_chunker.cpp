#include "fsplit/file_chunker.hpp"

#include "fsplit/errors.hpp"

#include <algorithm>

namespace fsplit {

namespace {

std::uint64_t ceil_div(std::uint64_t numerator, std::uint64_t denominator) {
    return numerator / denominator + (numerator % denominator != 0 ? 1 : 0);
}

} // namespace

ChunkPlan FileChunker::make_plan(std::uint64_t file_size, std::uint64_t parts,
                                 std::uint64_t chunk_size) {
    if (parts == 0 && chunk_size == 0) {
        throw Error(ErrorCode::InvalidArguments, "parts and chunk size cannot both be 0");
    }
    if (parts != 0 && chunk_size != 0) {
        throw Error(ErrorCode::InvalidArguments, "give either parts or chunk size, not both");
    }
    if (parts != 0) {
        return ChunkPlan{file_size, parts, ceil_div(file_size, parts)};
    }
    return ChunkPlan{file_size, ceil_div(file_size, chunk_size), chunk_size};
}

FileChunker::FileChunker(ChunkPlan plan) : plan_(plan) {
    if (plan_.parts > 0 && plan_.chunk_size == 0 && plan_.file_size != 0) {
        throw Error(ErrorCode::InvalidArguments, "chunk size must be > 0 for a non-empty file");
    }
}

std::vector<FileChunk> FileChunker::chunks() const {
    std::vector<FileChunk> chunks;
    chunks.reserve(static_cast<std::size_t>(plan_.parts));
    for (std::uint64_t index = 0; index < plan_.parts; ++index) {
        const auto offset = std::min(index * plan_.chunk_size, plan_.file_size);
        const auto size = std::min<std::uint64_t>(plan_.chunk_size, plan_.file_size - offset);
        chunks.push_back(FileChunk{static_cast<std::size_t>(index), offset, size});
    }
    return chunks;
}

const ChunkPlan &FileChunker::plan() const noexcept { return plan_; }

} // namespace fsplit
