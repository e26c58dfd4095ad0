/**
 * @file Error.cpp
 * @brief Implementation of Error handling and Result pattern
 */

#include "probeflow/core/Error.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

#ifndef NDEBUG
#include <execinfo.h>  // For backtrace (Linux/macOS)
#include <cstdlib>
#endif

namespace PROBEFLOW {

Error::Error(ErrorCode c, const std::string& msg, int status)
    : code(c), message(msg), timestamp(getCurrentTimestamp()) {

    if (status != 0) {
        http_status = status;
    }

#ifndef NDEBUG
    // Capture stack trace in debug builds
    captureStackTrace();
#endif
}

Error Error::Wrap(const std::string& context) const {
    Error wrapped = *this;
    wrapped.message = context + ": " + message;
    return wrapped;
}

std::string Error::getCurrentTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    std::tm tm_now{};
    localtime_r(&time_t_now, &tm_now);

    // Format: "YYYY-MM-DD HH:MM:SS"
    std::ostringstream oss;
    oss << std::put_time(&tm_now, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

void Error::captureStackTrace() {
#ifndef NDEBUG
    constexpr int MAX_FRAMES = 16;
    void* buffer[MAX_FRAMES];

    int frame_count = backtrace(buffer, MAX_FRAMES);
    if (frame_count > 0) {
        char** symbols = backtrace_symbols(buffer, frame_count);
        if (symbols) {
            stack_trace.reserve(frame_count);
            for (int i = 0; i < frame_count; ++i) {
                stack_trace.emplace_back(symbols[i]);
            }
            std::free(symbols);
        }
    }

    if (stack_trace.empty()) {
        stack_trace.emplace_back("Stack trace capture not available");
    }
#endif
}

} // namespace PROBEFLOW
