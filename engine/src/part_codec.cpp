#include "fsplit/part_codec.hpp"

#include "fsplit/errors.hpp"

#include <algorithm>
#include <limits>
#include <sstream>
#include <string>

namespace fsplit {

namespace {

constexpr std::size_t kStreamBufferSize = 64 * 1024;

std::string zlib_message(const z_stream &stream, int rc) {
    std::ostringstream oss;
    oss << "zlib error " << rc;
    if (stream.msg != nullptr) {
        oss << ": " << stream.msg;
    }
    return oss.str();
}

void write_out(std::ostream &out, const unsigned char *data, std::size_t size) {
    if (size == 0) {
        return;
    }
    out.write(reinterpret_cast<const char *>(data), static_cast<std::streamsize>(size));
    if (!out) {
        throw Error(ErrorCode::IoError, "failed to write codec output");
    }
}

std::vector<char> to_vector(const std::string &bytes) {
    return std::vector<char>(bytes.begin(), bytes.end());
}

} // namespace

PartCodec::Deflater::Deflater(int level) {
    int rc = deflateInit(&stream_, level);
    if (rc != Z_OK) {
        throw Error(ErrorCode::IoError, "deflateInit failed: " + zlib_message(stream_, rc));
    }
}

PartCodec::Deflater::~Deflater() { deflateEnd(&stream_); }

void PartCodec::Deflater::pump(int flush, std::ostream &out) {
    unsigned char buffer[kStreamBufferSize];
    int rc = Z_OK;
    do {
        stream_.next_out = buffer;
        stream_.avail_out = static_cast<uInt>(sizeof(buffer));
        rc = deflate(&stream_, flush);
        if (rc == Z_STREAM_ERROR) {
            throw Error(ErrorCode::IoError, "deflate failed: " + zlib_message(stream_, rc));
        }
        write_out(out, buffer, sizeof(buffer) - stream_.avail_out);
    } while (stream_.avail_out == 0);
    if (flush == Z_FINISH && rc != Z_STREAM_END) {
        throw Error(ErrorCode::IoError, "deflate did not reach end of stream");
    }
}

void PartCodec::Deflater::update(const char *data, std::size_t size, std::ostream &out) {
    if (finished_) {
        throw std::logic_error("deflater already finished");
    }
    while (size > 0) {
        const auto piece = std::min<std::size_t>(size, std::numeric_limits<uInt>::max());
        stream_.next_in = reinterpret_cast<Bytef *>(const_cast<char *>(data));
        stream_.avail_in = static_cast<uInt>(piece);
        pump(Z_NO_FLUSH, out);
        data += piece;
        size -= piece;
    }
}

void PartCodec::Deflater::finish(std::ostream &out) {
    if (finished_) {
        return;
    }
    stream_.next_in = nullptr;
    stream_.avail_in = 0;
    pump(Z_FINISH, out);
    finished_ = true;
}

PartCodec::Inflater::Inflater() {
    int rc = inflateInit(&stream_);
    if (rc != Z_OK) {
        throw Error(ErrorCode::IoError, "inflateInit failed: " + zlib_message(stream_, rc));
    }
}

PartCodec::Inflater::~Inflater() { inflateEnd(&stream_); }

void PartCodec::Inflater::update(const char *data, std::size_t size, std::ostream &out) {
    unsigned char buffer[kStreamBufferSize];
    while (size > 0) {
        if (finished_) {
            throw Error(ErrorCode::PartReadError, "trailing bytes after compressed part stream");
        }
        const auto piece = std::min<std::size_t>(size, std::numeric_limits<uInt>::max());
        stream_.next_in = reinterpret_cast<Bytef *>(const_cast<char *>(data));
        stream_.avail_in = static_cast<uInt>(piece);
        do {
            stream_.next_out = buffer;
            stream_.avail_out = static_cast<uInt>(sizeof(buffer));
            int rc = inflate(&stream_, Z_NO_FLUSH);
            switch (rc) {
            case Z_NEED_DICT:
            case Z_DATA_ERROR:
            case Z_MEM_ERROR:
            case Z_STREAM_ERROR:
                throw Error(ErrorCode::PartReadError,
                            "corrupt compressed part: " + zlib_message(stream_, rc));
            default:
                break;
            }
            write_out(out, buffer, sizeof(buffer) - stream_.avail_out);
            if (rc == Z_STREAM_END) {
                finished_ = true;
                break;
            }
        } while (stream_.avail_out == 0);
        if (finished_ && stream_.avail_in > 0) {
            throw Error(ErrorCode::PartReadError, "trailing bytes after compressed part stream");
        }
        data += piece;
        size -= piece;
    }
}

void PartCodec::Inflater::finish() {
    if (!finished_) {
        throw Error(ErrorCode::PartReadError, "compressed part is truncated");
    }
}

bool PartCodec::Inflater::finished() const noexcept { return finished_; }

std::vector<char> PartCodec::compress(const std::vector<char> &data) {
    std::ostringstream out;
    Deflater deflater;
    deflater.update(data.data(), data.size(), out);
    deflater.finish(out);
    return to_vector(out.str());
}

std::vector<char> PartCodec::decompress(const std::vector<char> &data) {
    std::ostringstream out;
    Inflater inflater;
    inflater.update(data.data(), data.size(), out);
    inflater.finish();
    return to_vector(out.str());
}

} // namespace fsplit
