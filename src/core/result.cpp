#include "core/result.hpp"

namespace halon {

const char* error_code_name(ErrorCode code) {
    switch (code) {
    case ErrorCode::MissingPair: return "MissingPair";
    case ErrorCode::UnrecognizedFormat: return "UnrecognizedFormat";
    case ErrorCode::TruncatedData: return "TruncatedData";
    case ErrorCode::CorruptIndex: return "CorruptIndex";
    case ErrorCode::CorruptArchive: return "CorruptArchive";
    case ErrorCode::NotFound: return "NotFound";
    case ErrorCode::IoFailure: return "IoFailure";
    case ErrorCode::InvalidArgument: return "InvalidArgument";
    }
    return "Unknown";
}

std::string Error::describe() const {
    return std::string(error_code_name(code)) + ": " + message;
}

} // namespace halon
