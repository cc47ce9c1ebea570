#pragma once

#include <optional>
#include <stdexcept>
#include <string>

namespace litereplica {

/**
 * @brief Error categories for the replica subsystem
 */
enum class ErrorCategory {
    NONE,
    CONFIGURATION_ERROR
};

/**
 * @brief Result type for operations that can fail
 */
template<typename T>
class Result {
public:
    static Result ok(T value) {
        Result r;
        r.success_ = true;
        r.value_ = std::move(value);
        return r;
    }

    static Result error(ErrorCategory category, std::string message) {
        Result r;
        r.success_ = false;
        r.error_category_ = category;
        r.error_message_ = std::move(message);
        return r;
    }

    bool is_ok() const { return success_; }
    bool is_error() const { return !success_; }

    const T& value() const { return *value_; }
    T& value() { return *value_; }

    ErrorCategory error_category() const { return error_category_; }
    const std::string& error_message() const { return error_message_; }

private:
    bool success_ = false;
    std::optional<T> value_;
    ErrorCategory error_category_ = ErrorCategory::NONE;
    std::string error_message_;
};

// ============================================================================
// Exceptions (surfaced to the caller, never retried automatically)
// ============================================================================

/// Alias not found, alias not a replica, extension missing for the platform.
class ConfigurationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Extension failed to install or load. Loader state is left unset.
class ExtensionLoadError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Point-in-time directive rejected by the extension.
class TimeTravelError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace litereplica
