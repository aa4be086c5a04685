#pragma once

#include <optional>
#include <utility>
#include <string>

namespace cmdguard {

/**
 * @brief Error categories for fallible operations outside the pipeline
 *
 * Pipeline operations report failures as data (records, alerts) and the
 * config loader has its own LoadResult; Result covers user input parsing.
 */
enum class ErrorCategory {
    NONE,
    INVALID_ARGUMENT
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

} // namespace cmdguard
