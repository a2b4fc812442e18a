#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

struct evp_md_ctx_st;

namespace fsplit {

class Checksum {
  public:
    static constexpr std::size_t default_block_size = 64 * 1024;

    static std::string sha256_hex(const std::vector<char> &data);

    // Hashes the file in `block_size` reads; never buffers the whole file.
    static std::string file_sha256_hex(const std::filesystem::path &path,
                                       std::size_t block_size = default_block_size);

    class Sha256Accumulator {
      public:
        Sha256Accumulator();

        void update(const char *data, std::size_t size);

        // Finalizes the digest; the accumulator cannot be updated afterwards.
        std::string hex();

      private:
        struct ContextDeleter {
            void operator()(evp_md_ctx_st *ctx) const;
        };

        std::unique_ptr<evp_md_ctx_st, ContextDeleter> ctx_;
        bool finished_{false};
    };
};

} // namespace fsplit
