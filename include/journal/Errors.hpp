#pragma once

#include <stdexcept>
#include <string>

namespace journal {

// Journal-owned error codes (no sqlite result codes escape)
enum class ErrorCode {
    InvalidArgument,
    ConcurrencyConflict,
    Cancelled,
    DecodeFailed,
    DuplicateEvent,
    StorageFailure
};

inline const char* errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidArgument:     return "InvalidArgument";
        case ErrorCode::ConcurrencyConflict: return "ConcurrencyConflict";
        case ErrorCode::Cancelled:           return "Cancelled";
        case ErrorCode::DecodeFailed:        return "DecodeFailed";
        case ErrorCode::DuplicateEvent:      return "DuplicateEvent";
        case ErrorCode::StorageFailure:      return "StorageFailure";
    }
    return "Unknown";
}

// Base of every exception thrown by the journal.
class JournalError : public std::runtime_error {
public:
    JournalError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), m_code(code) {}

    ErrorCode code() const { return m_code; }

private:
    ErrorCode m_code;
};

// Malformed input. Always raised before any mutation is attempted.
class InvalidArgument : public JournalError {
public:
    explicit InvalidArgument(const std::string& message)
        : JournalError(ErrorCode::InvalidArgument, message) {}
};

// Expected version did not match the stored ref. Callers retry with a fresh read.
class ConcurrencyConflict : public JournalError {
public:
    explicit ConcurrencyConflict(const std::string& message)
        : JournalError(ErrorCode::ConcurrencyConflict, message) {}
};

class Cancelled : public JournalError {
public:
    explicit Cancelled(const std::string& message)
        : JournalError(ErrorCode::Cancelled, message) {}
};

// A stored record could not be turned back into an Event.
class DecodeError : public JournalError {
public:
    explicit DecodeError(const std::string& message)
        : JournalError(ErrorCode::DecodeFailed, message) {}
};

class StorageError : public JournalError {
public:
    explicit StorageError(const std::string& message)
        : JournalError(ErrorCode::StorageFailure, message) {}
};

}  // namespace journal
