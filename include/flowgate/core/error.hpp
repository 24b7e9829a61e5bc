#pragma once

#include <expected>
#include <string>
#include <string_view>

namespace flowgate {

/// Failures of operations that are not themselves security decisions.
/// Policy outcomes never surface as an ErrorCode; they are Decisions.
enum class ErrorCode {
    Unknown = 1,
    InvalidConfig,             // configuration file or settings rejected
    InvalidArgument,           // caller-supplied input is out of contract
    NotFound,                  // unknown token, value parent or file entry
    AlreadyExists,             // duplicate verifier tag
    SerializationError,        // malformed JSON or schema violation
    IoError,                   // file could not be read or written
    UnsupportedSchemaVersion,  // policy or authority table from another version
    BudgetExceeded,            // a declared resource bound would be crossed
    DigestMismatch,            // snapshot bytes do not hash to their digest
    Forbidden,                 // caller lacks the trust the operation needs
    InternalError,
};

class Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    Error(ErrorCode code, std::string message, std::string detail)
        : code_(code), message_(std::move(message)), detail_(std::move(detail)) {}

    [[nodiscard]] auto code() const noexcept -> ErrorCode { return code_; }
    [[nodiscard]] auto message() const noexcept -> std::string_view { return message_; }
    [[nodiscard]] auto detail() const noexcept -> std::string_view { return detail_; }

    /// "message: detail", or just the message.
    [[nodiscard]] auto what() const -> std::string {
        if (detail_.empty()) return message_;
        return message_ + ": " + detail_;
    }

    /// Same code, with `context` as the message and this error's text as
    /// the detail.
    [[nodiscard]] auto wrap(std::string context) const -> Error {
        return Error(code_, std::move(context), what());
    }

private:
    ErrorCode code_;
    std::string message_;
    std::string detail_;
};

template <typename T>
using Result = std::expected<T, Error>;

using VoidResult = std::expected<void, Error>;

inline auto make_error(ErrorCode code, std::string message) -> Error {
    return Error(code, std::move(message));
}

inline auto make_error(ErrorCode code, std::string message, std::string detail) -> Error {
    return Error(code, std::move(message), std::move(detail));
}

/// Upper-snake name used in audit and CLI output.
inline auto error_code_to_string(ErrorCode code) -> std::string_view {
    switch (code) {
        case ErrorCode::Unknown: return "UNKNOWN";
        case ErrorCode::InvalidConfig: return "INVALID_CONFIG";
        case ErrorCode::InvalidArgument: return "INVALID_ARGUMENT";
        case ErrorCode::NotFound: return "NOT_FOUND";
        case ErrorCode::AlreadyExists: return "ALREADY_EXISTS";
        case ErrorCode::SerializationError: return "SERIALIZATION_ERROR";
        case ErrorCode::IoError: return "IO_ERROR";
        case ErrorCode::UnsupportedSchemaVersion: return "UNSUPPORTED_SCHEMA_VERSION";
        case ErrorCode::BudgetExceeded: return "BUDGET_EXCEEDED";
        case ErrorCode::DigestMismatch: return "DIGEST_MISMATCH";
        case ErrorCode::Forbidden: return "FORBIDDEN";
        case ErrorCode::InternalError: return "INTERNAL_ERROR";
    }
    return "UNKNOWN";
}

} // namespace flowgate
