#pragma once

#include <optional>
#include <stdexcept>
#include <string>

namespace pipeshield {

/**
 * @brief Error categories for the anonymization engine
 *
 * Recoverable categories (ambiguity, structural limits, collisions,
 * rehydration misses) are counted in reports and never abort a round trip.
 * The remaining ones abort the round trip or refuse startup.
 */
enum class ErrorCategory {
    NONE,
    CLASSIFICATION_AMBIGUOUS,
    STRUCTURAL_LIMIT_EXCEEDED,
    TOKEN_COLLISION,
    REHYDRATION_MISS,
    CONFIGURATION_INVALID,
    PROVIDER_ERROR,
    INTERNAL_ERROR
};

[[nodiscard]] inline const char* error_category_to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE:                      return "none";
        case ErrorCategory::CLASSIFICATION_AMBIGUOUS:  return "classification_ambiguous";
        case ErrorCategory::STRUCTURAL_LIMIT_EXCEEDED: return "structural_limit_exceeded";
        case ErrorCategory::TOKEN_COLLISION:           return "token_collision";
        case ErrorCategory::REHYDRATION_MISS:          return "rehydration_miss";
        case ErrorCategory::CONFIGURATION_INVALID:     return "configuration_invalid";
        case ErrorCategory::PROVIDER_ERROR:            return "provider_error";
        case ErrorCategory::INTERNAL_ERROR:            return "internal_error";
        default:                                       return "unknown";
    }
}

/// Invalid or missing configuration. Fatal at initialization.
struct ConfigError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

/// Every re-digest attempt for a value collided with an existing token.
struct TokenSpaceExhausted : std::runtime_error {
    using std::runtime_error::runtime_error;
};

/// Round trip operation invoked in the wrong state.
struct StateError : std::logic_error {
    using std::logic_error::logic_error;
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

} // namespace pipeshield
