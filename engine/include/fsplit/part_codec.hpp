#pragma once

#include <zlib.h>

#include <cstddef>
#include <ostream>
#include <vector>

namespace fsplit {

// Each compressed part is one self-contained zlib stream.
class PartCodec {
  public:
    static std::vector<char> compress(const std::vector<char> &data);

    static std::vector<char> decompress(const std::vector<char> &data);

    class Deflater {
      public:
        explicit Deflater(int level = Z_DEFAULT_COMPRESSION);
        ~Deflater();

        Deflater(const Deflater &) = delete;
        Deflater &operator=(const Deflater &) = delete;

        void update(const char *data, std::size_t size, std::ostream &out);

        void finish(std::ostream &out);

      private:
        void pump(int flush, std::ostream &out);

        z_stream stream_{};
        bool finished_{false};
    };

    class Inflater {
      public:
        Inflater();
        ~Inflater();

        Inflater(const Inflater &) = delete;
        Inflater &operator=(const Inflater &) = delete;

        void update(const char *data, std::size_t size, std::ostream &out);

        // Throws PartReadError if the stream ended before its trailer.
        void finish();

        bool finished() const noexcept;

      private:
        z_stream stream_{};
        bool finished_{false};
    };
};

} // namespace fsplit
