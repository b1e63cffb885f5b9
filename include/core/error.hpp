#pragma once

#include <optional>
#include <string>

namespace tenantcore {

/**
 * @brief Error codes surfaced by the tenant core
 */
enum class ErrorCode {
    NONE,
    DOMAIN_CONFLICT,
    TENANT_DATABASE_NOT_FOUND,
    TENANT_UNREACHABLE,
    TENANT_CONFIG_INVALID,
    POOL_SATURATED,
    PROVISIONING_PHASE_FAILED,
    SCHEMA_VERIFICATION_FAILED,
    PARTIAL_TEAM_MEMBER_FAILURE,
    SESSION_CEILING_EXCEEDED,
    INVALID_IDENTIFIER,
    INVALID_ARGUMENT,
    QUERY_FAILED,
    NOT_FOUND,
    INTERNAL_ERROR
};

inline const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::NONE:                        return "NONE";
        case ErrorCode::DOMAIN_CONFLICT:             return "DOMAIN_CONFLICT";
        case ErrorCode::TENANT_DATABASE_NOT_FOUND:   return "TENANT_DATABASE_NOT_FOUND";
        case ErrorCode::TENANT_UNREACHABLE:          return "TENANT_UNREACHABLE";
        case ErrorCode::TENANT_CONFIG_INVALID:       return "TENANT_CONFIG_INVALID";
        case ErrorCode::POOL_SATURATED:              return "POOL_SATURATED";
        case ErrorCode::PROVISIONING_PHASE_FAILED:   return "PROVISIONING_PHASE_FAILED";
        case ErrorCode::SCHEMA_VERIFICATION_FAILED:  return "SCHEMA_VERIFICATION_FAILED";
        case ErrorCode::PARTIAL_TEAM_MEMBER_FAILURE: return "PARTIAL_TEAM_MEMBER_FAILURE";
        case ErrorCode::SESSION_CEILING_EXCEEDED:    return "SESSION_CEILING_EXCEEDED";
        case ErrorCode::INVALID_IDENTIFIER:          return "INVALID_IDENTIFIER";
        case ErrorCode::INVALID_ARGUMENT:            return "INVALID_ARGUMENT";
        case ErrorCode::QUERY_FAILED:                return "QUERY_FAILED";
        case ErrorCode::NOT_FOUND:                   return "NOT_FOUND";
        case ErrorCode::INTERNAL_ERROR:              return "INTERNAL_ERROR";
    }
    return "UNKNOWN";
}

/**
 * @brief Whether a caller may retry the failed operation as-is
 */
inline bool is_retryable(ErrorCode code) {
    return code == ErrorCode::TENANT_UNREACHABLE || code == ErrorCode::POOL_SATURATED;
}

/**
 * @brief Result type for operations that can fail
 *
 * context carries structured detail for the caller (for provisioning
 * failures: the name of the phase that failed).
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

    static Result error(ErrorCode code, std::string message, std::string context = {}) {
        Result r;
        r.success_ = false;
        r.error_code_ = code;
        r.error_message_ = std::move(message);
        r.error_context_ = std::move(context);
        return r;
    }

    // Re-wrap the error of a Result with a different value type
    template<typename U>
    static Result error_from(const Result<U>& other) {
        return error(other.error_code(), other.error_message(), other.error_context());
    }

    bool is_ok() const { return success_; }
    bool is_error() const { return !success_; }

    const T& value() const { return *value_; }
    T& value() { return *value_; }

    ErrorCode error_code() const { return error_code_; }
    const std::string& error_message() const { return error_message_; }
    const std::string& error_context() const { return error_context_; }

private:
    bool success_ = false;
    std::optional<T> value_;
    ErrorCode error_code_ = ErrorCode::NONE;
    std::string error_message_;
    std::string error_context_;
};

template<>
class Result<void> {
public:
    static Result ok() {
        Result r;
        r.success_ = true;
        return r;
    }

    static Result error(ErrorCode code, std::string message, std::string context = {}) {
        Result r;
        r.success_ = false;
        r.error_code_ = code;
        r.error_message_ = std::move(message);
        r.error_context_ = std::move(context);
        return r;
    }

    template<typename U>
    static Result error_from(const Result<U>& other) {
        return error(other.error_code(), other.error_message(), other.error_context());
    }

    bool is_ok() const { return success_; }
    bool is_error() const { return !success_; }

    ErrorCode error_code() const { return error_code_; }
    const std::string& error_message() const { return error_message_; }
    const std::string& error_context() const { return error_context_; }

private:
    bool success_ = false;
    ErrorCode error_code_ = ErrorCode::NONE;
    std::string error_message_;
    std::string error_context_;
};

} // namespace tenantcore
