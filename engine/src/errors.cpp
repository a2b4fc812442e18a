#include "fsplit/errors.hpp"

namespace fsplit {

const char *to_string(ErrorCode code) noexcept {
    switch (code) {
    case ErrorCode::InvalidArguments:
        return "InvalidArguments";
    case ErrorCode::SourceNotFound:
        return "SourceNotFound";
    case ErrorCode::MissingDirectory:
        return "MissingDirectory";
    case ErrorCode::MissingDescriptor:
        return "MissingDescriptor";
    case ErrorCode::PartReadError:
        return "PartReadError";
    case ErrorCode::HashMismatch:
        return "HashMismatch";
    case ErrorCode::IoError:
        return "IoError";
    }
    return "Unknown";
}

Error::Error(ErrorCode code, const std::string &message)
    : std::runtime_error(message), code_(code) {}

ErrorCode Error::code() const noexcept { return code_; }

} // namespace fsplit
