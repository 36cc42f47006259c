// SHARELEDGER - Error Codes and Call Results
// Copyright (c) 2024 SHARELEDGER Developers
// MIT License
//
// Every ledger operation either commits all of its writes and returns a
// value, or returns one of the stable error codes below and commits nothing.

#ifndef SHARELEDGER_CORE_RESULT_H
#define SHARELEDGER_CORE_RESULT_H

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace shareledger {

// ============================================================================
// Error Codes
// ============================================================================

/// Error codes surfaced to callers. Numeric values are part of the external
/// interface and must never be renumbered.
enum class LedgerError : uint32_t {
    OwnerOnly       = 100,
    NotFound        = 101,
    AlreadyListed   = 102,
    InvalidAmount   = 103,
    NotAuthorized   = 104,
    KycRequired     = 105,
    VoteExists      = 106,
    VoteEnded       = 107,
    PriceExpired    = 108,
    InvalidURI      = 109,
    InvalidValue    = 110,
    InvalidDuration = 111,
    InvalidKycLevel = 112,
    InvalidExpiry   = 113,
    InvalidVotes    = 114,
    InvalidAddress  = 115,
    InvalidTitle    = 116,
    AlreadyExecuted = 117,
    VotingActive    = 118,
};

/// Broad classes of failure
enum class ErrorCategory {
    Authorization,
    NotFound,
    InvalidInput,
    StateConflict,
    StaleData
};

/// Convert error to its stable name ("NotFound", ...)
const char* LedgerErrorToString(LedgerError err);

/// Parse an error name; nullopt if unknown
std::optional<LedgerError> ParseLedgerError(const std::string& str);

/// Numeric code of an error
inline uint32_t LedgerErrorCode(LedgerError err) {
    return static_cast<uint32_t>(err);
}

/// Category of an error
ErrorCategory GetErrorCategory(LedgerError err);

/// Convert category to string
const char* ErrorCategoryToString(ErrorCategory category);

// ============================================================================
// Result
// ============================================================================

/**
 * Outcome of a ledger call: a value, or an error code with a message.
 */
template<typename T>
class Result {
public:
    static Result Success(T value) {
        Result r;
        r.value_ = std::move(value);
        return r;
    }

    static Result Failure(LedgerError error, std::string message = "") {
        Result r;
        r.error_ = error;
        r.message_ = std::move(message);
        return r;
    }

    bool IsOk() const { return value_.has_value(); }
    explicit operator bool() const { return IsOk(); }

    /// Value of a successful call; throws std::logic_error on a failed one
    const T& Value() const {
        if (!value_) {
            throw std::logic_error(std::string("Result has no value: ") +
                                   LedgerErrorToString(*error_));
        }
        return *value_;
    }

    const T& operator*() const { return Value(); }
    const T* operator->() const { return &Value(); }

    /// Error of a failed call; throws std::logic_error on a successful one
    LedgerError Error() const {
        if (!error_) {
            throw std::logic_error("Result has no error");
        }
        return *error_;
    }

    const std::string& Message() const { return message_; }

    std::string ToString() const {
        if (IsOk()) return "OK";
        std::string s = LedgerErrorToString(*error_);
        if (!message_.empty()) {
            s += ": " + message_;
        }
        return s;
    }

private:
    Result() = default;

    std::optional<T> value_;
    std::optional<LedgerError> error_;
    std::string message_;
};

/// Value type for operations that return nothing on success
struct Unit {
    bool operator==(const Unit&) const { return true; }
};

using VoidResult = Result<Unit>;

} // namespace shareledger

#endif // SHARELEDGER_CORE_RESULT_H
