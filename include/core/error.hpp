#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace sqlbridge {

/**
 * @brief Error categories surfaced by the client library
 */
enum class ErrorCategory {
    NONE,
    POOL_CREATION,
    POOL_EXHAUSTED,
    NOT_CONNECTED,
    EXECUTION_ERROR,
    INTERNAL_ERROR
};

[[nodiscard]] inline std::string_view error_category_to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE:            return "none";
        case ErrorCategory::POOL_CREATION:   return "pool_creation";
        case ErrorCategory::POOL_EXHAUSTED:  return "pool_exhausted";
        case ErrorCategory::NOT_CONNECTED:   return "not_connected";
        case ErrorCategory::EXECUTION_ERROR: return "execution_error";
        case ErrorCategory::INTERNAL_ERROR:  return "internal_error";
        default:                             return "unknown";
    }
}

/**
 * @brief Base class of every error thrown by the client layer
 */
class DbError : public std::runtime_error {
public:
    DbError(ErrorCategory category, const std::string& message)
        : std::runtime_error(message), category_(category) {}

    [[nodiscard]] ErrorCategory category() const noexcept { return category_; }

private:
    ErrorCategory category_;
};

/**
 * @brief The engine rejected connection creation (bad host, credentials, path)
 */
class PoolCreationError : public DbError {
public:
    explicit PoolCreationError(const std::string& message)
        : DbError(ErrorCategory::POOL_CREATION, message) {}
};

/**
 * @brief Every connection is borrowed and the pool is at its maximum
 */
class PoolExhaustedError : public DbError {
public:
    explicit PoolExhaustedError(const std::string& message)
        : DbError(ErrorCategory::POOL_EXHAUSTED, message) {}
};

/**
 * @brief Manual-mode call issued without a prior connect()
 */
class NotConnectedError : public DbError {
public:
    explicit NotConnectedError(const std::string& message)
        : DbError(ErrorCategory::NOT_CONNECTED, message) {}
};

/**
 * @brief Statement failed in the engine; carries the engine's message
 */
class QueryExecutionError : public DbError {
public:
    explicit QueryExecutionError(const std::string& message)
        : DbError(ErrorCategory::EXECUTION_ERROR, message) {}
};

} // namespace sqlbridge
