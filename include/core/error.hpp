#pragma once

#include <optional>
#include <stdexcept>
#include <string>

namespace seedgen {

/**
 * @brief Error categories for a seeding run
 *
 * SCHEMA, CAPACITY, LOAD and CONFIG errors are fatal: the run aborts and
 * whatever was loaded for earlier tables stays committed.
 * GENERATION errors only escape when a uniqueness fallback is exhausted.
 */
enum class ErrorCategory {
    NONE,
    SCHEMA_ERROR,
    CAPACITY_ERROR,
    GENERATION_ERROR,
    LOAD_ERROR,
    CONFIG_ERROR
};

[[nodiscard]] inline const char* error_category_to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE:             return "none";
        case ErrorCategory::SCHEMA_ERROR:     return "schema error";
        case ErrorCategory::CAPACITY_ERROR:   return "capacity error";
        case ErrorCategory::GENERATION_ERROR: return "generation error";
        case ErrorCategory::LOAD_ERROR:       return "load error";
        case ErrorCategory::CONFIG_ERROR:     return "config error";
    }
    return "unknown";
}

/**
 * @brief Fatal error raised out of the generation pipeline
 */
class SeedError : public std::runtime_error {
public:
    SeedError(ErrorCategory category, const std::string& message)
        : std::runtime_error(message), category_(category) {}

    [[nodiscard]] ErrorCategory category() const { return category_; }

private:
    ErrorCategory category_;
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

    /**
     * @brief Unwrap the value or raise the carried error as a SeedError
     */
    T value_or_throw() && {
        if (!success_) {
            throw SeedError(error_category_, error_message_);
        }
        return std::move(*value_);
    }

private:
    bool success_ = false;
    std::optional<T> value_;
    ErrorCategory error_category_ = ErrorCategory::NONE;
    std::string error_message_;
};

} // namespace seedgen
