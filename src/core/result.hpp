#pragma once

#include <optional>
#include <string>
#include <variant>

namespace halon {

enum class ErrorCode {
    MissingPair,
    UnrecognizedFormat,
    TruncatedData,
    CorruptIndex,
    CorruptArchive,
    NotFound,
    IoFailure,
    InvalidArgument,
};

const char* error_code_name(ErrorCode code);

struct Error {
    ErrorCode code = ErrorCode::IoFailure;
    std::string message;

    Error() = default;
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}

    /// "<CodeName>: <message>", used for CLI and log output.
    std::string describe() const;
};

/// Simple Result type: holds either a value of type T or an Error.
/// For void results, use Result<void>.
template <typename T>
class Result {
public:
    Result(T value) : data_(std::move(value)) {}
    Result(Error err) : data_(std::move(err)) {}

    bool ok() const { return std::holds_alternative<T>(data_); }
    explicit operator bool() const { return ok(); }

    const T& value() const { return std::get<T>(data_); }
    T& value() { return std::get<T>(data_); }

    const Error& error() const { return std::get<Error>(data_); }

private:
    std::variant<T, Error> data_;
};

/// Specialization for void results.
template <>
class Result<void> {
public:
    Result() : err_(std::nullopt) {}
    Result(Error err) : err_(std::move(err)) {}

    bool ok() const { return !err_.has_value(); }
    explicit operator bool() const { return ok(); }

    const Error& error() const { return err_.value(); }

private:
    std::optional<Error> err_;
};

} // namespace halon
