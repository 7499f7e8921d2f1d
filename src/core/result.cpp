#include "core/result.hpp"

namespace kmp {

std::string_view to_string(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::NotFound: return "NotFound";
    case ErrorKind::CorruptData: return "CorruptData";
    case ErrorKind::UnsupportedFormat: return "UnsupportedFormat";
    case ErrorKind::UnsupportedOperation: return "UnsupportedOperation";
    case ErrorKind::DecodeError: return "DecodeError";
    case ErrorKind::InvalidArgument: return "InvalidArgument";
    case ErrorKind::IoError: return "IoError";
    }
    return "Unknown";
}

} // namespace kmp
