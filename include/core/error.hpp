#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace textscrub {

/**
 * @brief Error categories for the scrubbing engine
 */
enum class ErrorCategory {
    NONE,
    CONFIGURATION_ERROR,        // bad tier string, unparsable recognizer definition
    DETECTION_ERROR,            // entity detector failed
    NOT_FOUND_ERROR,            // descrub token with no stored entity
    REVERSAL_CONFLICT_ERROR,    // full reversal without original text
    INVALID_REQUEST,
    INTERNAL_ERROR
};

[[nodiscard]] inline constexpr std::string_view error_category_name(ErrorCategory c) {
    switch (c) {
        case ErrorCategory::NONE:                    return "None";
        case ErrorCategory::CONFIGURATION_ERROR:     return "ConfigurationError";
        case ErrorCategory::DETECTION_ERROR:         return "DetectionError";
        case ErrorCategory::NOT_FOUND_ERROR:         return "NotFoundError";
        case ErrorCategory::REVERSAL_CONFLICT_ERROR: return "ReversalConflictError";
        case ErrorCategory::INVALID_REQUEST:         return "InvalidRequest";
        case ErrorCategory::INTERNAL_ERROR:          return "InternalError";
    }
    return "InternalError";
}

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

} // namespace textscrub
