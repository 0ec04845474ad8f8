// PRICEFEED - Oracle Error Types
// Copyright (c) 2024 PRICEFEED Developers
// MIT License
//
// Failure kinds reported by engine operations and the Result<T> carrier that
// returns either a value or a tagged failure.

#ifndef PRICEFEED_ORACLE_ERRORS_H
#define PRICEFEED_ORACLE_ERRORS_H

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace pricefeed {
namespace oracle {

// ============================================================================
// Error Kinds
// ============================================================================

/// Failure kinds; the enumerator value is the stable numeric code
enum class OracleError : uint32_t {
    NotAuthorized = 100,
    InvalidPrice = 101,
    StalePrice = 102,
    SourceNotFound = 103,
    AlreadyExists = 104,        // Reserved
    InsufficientSources = 105,
    InvalidAsset = 106,
    ArithmeticOverflow = 107,
    StorageError = 108
};

/// Kind name, e.g. "StalePrice"
const char* OracleErrorToString(OracleError error);

/// Stable numeric code
inline uint32_t OracleErrorCode(OracleError error) {
    return static_cast<uint32_t>(error);
}

/// A failure kind plus a human-readable message
struct Failure {
    OracleError kind;
    std::string message;

    /// "u102 StalePrice: <message>"
    std::string ToString() const;
};

inline Failure Fail(OracleError kind, std::string message = "") {
    return Failure{kind, std::move(message)};
}

// ============================================================================
// Result
// ============================================================================

/**
 * Value or failure returned by an engine operation.
 *
 * A Failure converts implicitly, so operations can `return Fail(...)`.
 */
template<typename T>
class Result {
public:
    Result(T value) : value_(std::move(value)) {}
    Result(Failure failure) : failure_(std::move(failure)) {}

    bool ok() const { return value_.has_value(); }
    explicit operator bool() const { return ok(); }

    /// The value; throws std::logic_error on a failed result
    const T& value() const {
        if (!value_) {
            throw std::logic_error("Result::value() on failure: " + failure_.ToString());
        }
        return *value_;
    }

    T value_or(T fallback) const { return value_ ? *value_ : std::move(fallback); }

    /// Failure kind; only meaningful when !ok()
    OracleError error() const { return failure_.kind; }
    const std::string& message() const { return failure_.message; }
    const Failure& failure() const { return failure_; }

    std::string ToString() const { return ok() ? "OK" : failure_.ToString(); }

private:
    std::optional<T> value_;
    Failure failure_{OracleError::StorageError, ""};
};

template<>
class Result<void> {
public:
    Result() = default;
    Result(Failure failure) : ok_(false), failure_(std::move(failure)) {}

    static Result Ok() { return Result(); }

    bool ok() const { return ok_; }
    explicit operator bool() const { return ok_; }

    OracleError error() const { return failure_.kind; }
    const std::string& message() const { return failure_.message; }
    const Failure& failure() const { return failure_; }

    std::string ToString() const { return ok() ? "OK" : failure_.ToString(); }

private:
    bool ok_{true};
    Failure failure_{OracleError::StorageError, ""};
};

} // namespace oracle
} // namespace pricefeed

#endif // PRICEFEED_ORACLE_ERRORS_H
