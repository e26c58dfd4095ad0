#pragma once

#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "ErrorCode.hpp"

namespace PROBEFLOW {

/**
 * @brief Error information structure for all fallible operations
 *
 * Contains error code, descriptive message, timestamp, and the HTTP status
 * when the failure was reported by an instrument service.
 * Includes stack trace information in debug builds for debugging assistance.
 */
struct Error {
    ErrorCode code;                  // Error code
    std::string message;             // Human-readable error description
    std::string timestamp;           // Human-readable timestamp (e.g., "2025-07-25 14:30:21")
    std::optional<int> http_status;  // Status of the instrument response, if any

#ifndef NDEBUG
    std::vector<std::string> stack_trace; // Stack trace in debug builds only
#endif

    /**
     * @brief Construct error with current timestamp
     * @param c Error code
     * @param msg Error message
     * @param status HTTP status of the failing response (0 if not applicable)
     */
    Error(ErrorCode c, const std::string& msg, int status = 0);

    /**
     * @brief Chain context onto the message, keeping code and status
     * @param context Prefix describing the failing call site
     * @return Copy whose message reads "<context>: <message>"
     */
    Error Wrap(const std::string& context) const;

    /**
     * @brief Get current timestamp in human-readable format
     * @return Formatted timestamp string (YYYY-MM-DD HH:MM:SS)
     */
    static std::string getCurrentTimestamp();

private:
    void captureStackTrace();
};

/**
 * @brief Result type for error handling without exceptions
 *
 * Contains either a successful result of type T or an Error.
 */
template<typename T>
using Result = std::variant<T, Error>;

/**
 * @brief Helper type for void returns that can fail
 */
using Status = Result<std::monostate>;

template<typename T>
bool isOk(const Result<T>& result) {
    return std::holds_alternative<T>(result);
}

/**
 * @warning Only call if isOk(result) returns true
 */
template<typename T>
const T& getValue(const Result<T>& result) {
    return std::get<T>(result);
}

template<typename T>
T& getValue(Result<T>& result) {
    return std::get<T>(result);
}

/**
 * @warning Only call if isOk(result) returns false
 */
template<typename T>
const Error& getError(const Result<T>& result) {
    return std::get<Error>(result);
}

template<typename T>
Result<std::decay_t<T>> Ok(T&& value) {
    return Result<std::decay_t<T>>{std::in_place_index<0>, std::forward<T>(value)};
}

inline Status Ok() {
    return Status{std::monostate{}};
}

template<typename T>
Result<T> Err(Error error) {
    return Result<T>{std::in_place_index<1>, std::move(error)};
}

template<typename T>
Result<T> Err(ErrorCode code, const std::string& message, int status = 0) {
    return Result<T>{std::in_place_index<1>, Error(code, message, status)};
}

} // namespace PROBEFLOW
