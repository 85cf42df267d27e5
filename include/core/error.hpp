#pragma once

#include <format>
#include <optional>
#include <string>
#include <string_view>

namespace logfanout {

/**
 * @brief Error categories surfaced by the fan-out engine
 */
enum class ErrorCategory {
    NONE,
    TOPOLOGY_ERROR,             // Ring could not produce a usable replica/partition set
    UNAVAILABLE,                // Client for a replica unavailable, or its call failed
    NO_HEALTHY_REPLICAS,        // Healthy-only operation found nothing to ask
    UNIMPLEMENTED,              // Remote peer lacks the RPC (older ingester)
    IDENTITY_RESOLUTION_ERROR,  // Tenant could not be determined
    DEADLINE_EXCEEDED,
    CANCELLED,
    CONFIG_ERROR,
    INTERNAL_ERROR
};

[[nodiscard]] inline const char* error_category_to_string(ErrorCategory c) {
    switch (c) {
        case ErrorCategory::NONE:                      return "NONE";
        case ErrorCategory::TOPOLOGY_ERROR:            return "TOPOLOGY_ERROR";
        case ErrorCategory::UNAVAILABLE:               return "UNAVAILABLE";
        case ErrorCategory::NO_HEALTHY_REPLICAS:       return "NO_HEALTHY_REPLICAS";
        case ErrorCategory::UNIMPLEMENTED:             return "UNIMPLEMENTED";
        case ErrorCategory::IDENTITY_RESOLUTION_ERROR: return "IDENTITY_RESOLUTION_ERROR";
        case ErrorCategory::DEADLINE_EXCEEDED:         return "DEADLINE_EXCEEDED";
        case ErrorCategory::CANCELLED:                 return "CANCELLED";
        case ErrorCategory::CONFIG_ERROR:              return "CONFIG_ERROR";
        case ErrorCategory::INTERNAL_ERROR:            return "INTERNAL_ERROR";
        default:                                       return "UNKNOWN";
    }
}

/**
 * @brief Error payload detached from any value type
 */
struct Error {
    ErrorCategory category = ErrorCategory::NONE;
    std::string message;

    /// Same category, message prefixed with call-site context
    [[nodiscard]] Error wrap(std::string_view context) const {
        return Error{category, std::format("{}: {}", context, message)};
    }
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

    static Result error(Error err) {
        return error(err.category, std::move(err.message));
    }

    /// Re-type the error of another result (value-less propagation)
    template<typename U>
    static Result error_from(const Result<U>& other) {
        return error(other.error_category(), other.error_message());
    }

    bool is_ok() const { return success_; }
    bool is_error() const { return !success_; }

    const T& value() const { return *value_; }
    T& value() { return *value_; }

    ErrorCategory error_category() const { return error_category_; }
    const std::string& error_message() const { return error_message_; }

    [[nodiscard]] Error to_error() const { return Error{error_category_, error_message_}; }

private:
    bool success_ = false;
    std::optional<T> value_;
    ErrorCategory error_category_ = ErrorCategory::NONE;
    std::string error_message_;
};

/// True when the remote replica reported the RPC as not implemented
[[nodiscard]] inline bool is_unimplemented_call_error(ErrorCategory category) {
    return category == ErrorCategory::UNIMPLEMENTED;
}

} // namespace logfanout
