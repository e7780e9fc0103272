/**
 * @file errors.hpp
 * @brief Error taxonomy shared by every adapter
 */

#pragma once

#include <stdexcept>
#include <string>

namespace Omnidb {

enum class ErrorKind {
    Unavailable,            // cannot connect, cancelled or deadline exceeded
    UnsupportedOperation,   // engine cannot meaningfully perform this call
    MalformedFilter,        // filter references an invalid column, operator or value
    MalformedInput,         // mutation input invalid for the target unit
    ExecutionFailure,       // native driver rejected the operation
    UnsupportedType         // database type not registered
};

const char* to_string(ErrorKind kind);

/**
 * @brief Error raised by every public operation.
 *
 * Carries the engine, the operation and the offending identifier or filter
 * fragment so callers can render a message without knowing adapter internals.
 */
class DbError : public std::runtime_error {
public:
    DbError(ErrorKind kind, std::string engine, std::string operation, std::string detail);

    ErrorKind kind() const noexcept { return kind_; }
    const std::string& engine() const noexcept { return engine_; }
    const std::string& operation() const noexcept { return operation_; }
    const std::string& detail() const noexcept { return detail_; }

    /**
     * @brief Copy with engine/operation filled in where they were left empty.
     */
    DbError with_context(const std::string& engine, const std::string& operation) const;

private:
    ErrorKind kind_;
    std::string engine_;
    std::string operation_;
    std::string detail_;
};

/**
 * @brief Thrown by native connection classes when the server cannot be reached.
 */
class ConnectionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Thrown by native connection classes when a statement or request fails.
 */
class DriverError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Thrown by value coercion; rethrown as MalformedFilter or MalformedInput.
 */
class CoercionError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// Shorthands used throughout the adapters.
DbError unsupported_operation(const std::string& engine, const std::string& operation);
DbError malformed_filter(const std::string& detail);
DbError malformed_input(const std::string& detail);

} // namespace Omnidb
