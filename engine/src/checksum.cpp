#include "fsplit/checksum.hpp"

#include "fsplit/errors.hpp"

#include <openssl/evp.h>

#include <fstream>
#include <iomanip>
#include <sstream>

namespace fsplit {

namespace {

std::string to_hex(const unsigned char *digest, unsigned int length) {
    std::ostringstream oss;
    oss << std::hex << std::nouppercase << std::setfill('0');
    for (unsigned int i = 0; i < length; ++i) {
        oss << std::setw(2) << static_cast<int>(digest[i]);
    }
    return oss.str();
}

} // namespace

void Checksum::Sha256Accumulator::ContextDeleter::operator()(evp_md_ctx_st *ctx) const {
    EVP_MD_CTX_free(ctx);
}

Checksum::Sha256Accumulator::Sha256Accumulator() : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_) {
        throw Error(ErrorCode::IoError, "failed to create EVP_MD_CTX");
    }
    if (EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) != 1) {
        throw Error(ErrorCode::IoError, "failed to initialize SHA-256 digest");
    }
}

void Checksum::Sha256Accumulator::update(const char *data, std::size_t size) {
    if (data == nullptr || size == 0) {
        return;
    }
    if (finished_) {
        throw std::logic_error("SHA-256 accumulator already finalized");
    }
    if (EVP_DigestUpdate(ctx_.get(), data, size) != 1) {
        throw Error(ErrorCode::IoError, "failed to update SHA-256 digest");
    }
}

std::string Checksum::Sha256Accumulator::hex() {
    if (finished_) {
        throw std::logic_error("SHA-256 accumulator already finalized");
    }
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(ctx_.get(), digest, &length) != 1) {
        throw Error(ErrorCode::IoError, "failed to finalize SHA-256 digest");
    }
    finished_ = true;
    return to_hex(digest, length);
}

std::string Checksum::sha256_hex(const std::vector<char> &data) {
    Sha256Accumulator accumulator;
    accumulator.update(data.data(), data.size());
    return accumulator.hex();
}

std::string Checksum::file_sha256_hex(const std::filesystem::path &path, std::size_t block_size) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw Error(ErrorCode::IoError, "failed to open file for hashing: " + path.string());
    }
    if (block_size == 0) {
        block_size = default_block_size;
    }
    Sha256Accumulator accumulator;
    std::vector<char> buffer(block_size);
    while (file) {
        file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        auto read = file.gcount();
        if (read <= 0) {
            break;
        }
        accumulator.update(buffer.data(), static_cast<std::size_t>(read));
    }
    if (file.bad()) {
        throw Error(ErrorCode::IoError, "failed while reading file for hashing: " + path.string());
    }
    return accumulator.hex();
}

} // namespace fsplit
