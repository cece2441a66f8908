#pragma once

#include <optional>
#include <string>

namespace promptfw {

/**
 * @brief Why a rule pattern could not be compiled
 */
enum class ErrorCategory {
    NONE,
    EMPTY_PATTERN,
    UNSUPPORTED_FLAG,       // Inline flag group other than (?i)
    INVALID_REGEX           // Rejected by std::regex
};

inline const char* error_category_to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE:             return "none";
        case ErrorCategory::EMPTY_PATTERN:    return "empty_pattern";
        case ErrorCategory::UNSUPPORTED_FLAG: return "unsupported_flag";
        case ErrorCategory::INVALID_REGEX:    return "invalid_regex";
    }
    return "invalid_regex";
}

/**
 * @brief Value or categorized error
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

} // namespace promptfw
