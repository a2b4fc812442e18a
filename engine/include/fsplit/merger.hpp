#pragma once

#include "fsplit/descriptor.hpp"
#include "fsplit/log_sink.hpp"

#include <filesystem>
#include <fstream>
#include <string>

namespace fsplit {

struct MergeOptions {
    // Only honoured when the reconstructed file verifies.
    bool remove_after{false};
};

struct MergeResult {
    bool ok{false};
    std::string verified_hash;
    std::string expected_hash;
    std::filesystem::path target;
};

class Merger {
  public:
    explicit Merger(LogSink &log = null_log_sink());

    // Rebuilds the original next to `directory` from the parts its descriptor
    // lists, in descriptor order. A hash mismatch is returned as ok == false
    // and leaves the rebuilt file in place.
    MergeResult merge(const std::filesystem::path &directory, const MergeOptions &options) const;

  private:
    void append_part(const std::filesystem::path &part_path, bool compressed,
                     std::ofstream &out) const;

    LogSink &log_;
};

} // namespace fsplit
