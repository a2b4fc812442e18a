#pragma once

#include <stdexcept>
#include <string>

namespace fsplit {

enum class ErrorCode {
    InvalidArguments,
    SourceNotFound,
    MissingDirectory,
    MissingDescriptor,
    PartReadError,
    HashMismatch,
    IoError,
};

const char *to_string(ErrorCode code) noexcept;

class Error : public std::runtime_error {
  public:
    Error(ErrorCode code, const std::string &message);

    ErrorCode code() const noexcept;

  private:
    ErrorCode code_;
};

} // namespace fsplit
