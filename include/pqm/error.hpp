#pragma once

/**
 * @file error.hpp
 * @brief Typed failures and the Result type shared by every pqm operation
 *
 * Every core operation returns either a success value or an Error carrying
 * an ErrorCode. Callers branch on the code, never on the message text.
 *
 * @example
 * ```cpp
 * auto order = manager->resolve({"Final"});
 * if (order.isErr() && order.error().code() == pqm::ErrorCode::CYCLE_DETECTED) {
 *     for (const auto& n : order.error().related()) std::cerr << n << "\n";
 * }
 * ```
 */

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace pqm {

// ============================================================================
// Error Codes
// ============================================================================

/**
 * @brief Error codes for pqm operations
 */
enum class ErrorCode {
    // Per-file parse failures (batched during index builds)
    MALFORMED_METADATA,

    // Index-wide structural failures
    DUPLICATE_NAME,

    // Resolution failures
    CYCLE_DETECTED,
    UNRESOLVED_DEPENDENCY,

    // Storage / IO
    ALREADY_EXISTS,
    NOT_FOUND,
    IO_ERROR,
    INDEX_NOT_READY,
    ROLLBACK_FAILED,    // file change not undone; index and tree disagree until refresh

    // Concurrency
    LOCK_TIMEOUT,
    CANCELLED,

    // Edit policy
    NAME_REFERENCED,
    INVALID_ARGUMENT,

    // Reported by a DocumentAdapter
    ADAPTER_ERROR,
};

inline const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::MALFORMED_METADATA: return "malformed_metadata";
        case ErrorCode::DUPLICATE_NAME: return "duplicate_name";
        case ErrorCode::CYCLE_DETECTED: return "cycle_detected";
        case ErrorCode::UNRESOLVED_DEPENDENCY: return "unresolved_dependency";
        case ErrorCode::ALREADY_EXISTS: return "already_exists";
        case ErrorCode::NOT_FOUND: return "not_found";
        case ErrorCode::IO_ERROR: return "io_error";
        case ErrorCode::INDEX_NOT_READY: return "index_not_ready";
        case ErrorCode::ROLLBACK_FAILED: return "rollback_failed";
        case ErrorCode::LOCK_TIMEOUT: return "lock_timeout";
        case ErrorCode::CANCELLED: return "cancelled";
        case ErrorCode::NAME_REFERENCED: return "name_referenced";
        case ErrorCode::INVALID_ARGUMENT: return "invalid_argument";
        case ErrorCode::ADAPTER_ERROR: return "adapter_error";
        default: return "unknown";
    }
}

/**
 * @brief Error type with code, message and structured details
 *
 * - subject: the offending script name or file path
 * - related: cycle members, names a missing dependency is required by,
 *   the dependents blocking a rename, or the paths a failed rollback left behind
 */
class Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    Error(ErrorCode code, std::string message, std::string subject,
          std::vector<std::string> related = {})
        : code_(code), message_(std::move(message)), subject_(std::move(subject)),
          related_(std::move(related)) {}

    Error& withContext(const std::string& context) {
        message_ = context + ": " + message_;
        return *this;
    }

    ErrorCode code() const { return code_; }
    const std::string& message() const { return message_; }
    const std::string& subject() const { return subject_; }
    const std::vector<std::string>& related() const { return related_; }
    std::string toString() const {
        return std::string(error_code_to_string(code_)) + ": " + message_;
    }

private:
    ErrorCode code_;
    std::string message_;
    std::string subject_;
    std::vector<std::string> related_;
};

// ============================================================================
// Result Type
// ============================================================================

/**
 * @brief Result type for fallible operations
 * @tparam T The success value type
 * @tparam E The error type (default: Error)
 *
 * Check isOk() before accessing value(), or isErr() before error().
 */
template<typename T, typename E = Error>
class Result {
public:
    static Result ok(T value) { return Result(std::move(value)); }
    static Result err(E error) { return Result(std::move(error)); }

    bool isOk() const { return has_value_; }
    bool isErr() const { return !has_value_; }

    T& value() { return value_.value(); }
    const T& value() const { return value_.value(); }
    E& error() { return error_.value(); }
    const E& error() const { return error_.value(); }

    T valueOr(T default_value) const {
        if (has_value_) return value_.value();
        return default_value;
    }

    template<typename F>
    auto map(F func) -> Result<decltype(func(std::declval<T>())), E> {
        if (has_value_) {
            return Result<decltype(func(std::declval<T>())), E>::ok(func(value_.value()));
        }
        return Result<decltype(func(std::declval<T>())), E>::err(error_.value());
    }

private:
    explicit Result(T value) : has_value_(true), value_(std::move(value)) {}
    explicit Result(E error) : has_value_(false), error_(std::move(error)) {}

    bool has_value_;
    std::optional<T> value_;
    std::optional<E> error_;
};

template<typename E>
class Result<void, E> {
public:
    static Result ok() { return Result(true, std::nullopt); }
    static Result err(E error) { return Result(false, std::move(error)); }

    bool isOk() const { return has_value_; }
    bool isErr() const { return !has_value_; }

    void value() const {}
    E& error() { return error_.value(); }
    const E& error() const { return error_.value(); }

private:
    Result(bool hv, std::optional<E> err) : has_value_(hv), error_(std::move(err)) {}
    bool has_value_;
    std::optional<E> error_;
};

} // namespace pqm
