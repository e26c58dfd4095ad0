#ifndef PROBEFLOW_CORE_ERROR_CODE_HPP
#define PROBEFLOW_CORE_ERROR_CODE_HPP

#include <cstdint>
#include <string>

namespace PROBEFLOW {

/**
 * @brief Error codes for control-plane responses and hardware operations
 */
enum class ErrorCode : uint16_t {
  Success = 0,

  // Configuration errors (100-199)
  InvalidConfiguration = 100,
  ConfigurationNotFound = 101,
  ConfigurationValidationFailed = 102,

  // State errors (200-299)
  InvalidStateTransition = 200,
  AlreadyRunning = 203,
  NoActiveRun = 204,
  RequestAlreadyPending = 205,

  // Hardware errors (300-399)
  HardwareRejected = 300, ///< Instrument answered 4xx (malformed request)
  HardwareFault = 301,    ///< Instrument answered 5xx or the task failed
  HardwareTimeout = 302,  ///< Task exceeded its time budget
  TaskAlreadyTerminal = 303,
  UnknownOperation = 304,
  TaskCancelledByInstrument = 305, ///< Task aborted on the instrument side

  // Communication errors (400-499)
  CommunicationError = 400, ///< Connection refused, reset, unresolved host
  Timeout = 401,            ///< Single request exceeded its deadline
  InvalidResponse = 403,    ///< Response body could not be interpreted
  Cancelled = 450,

  // Internal errors (500-599)
  InternalError = 500,
  InvariantViolation = 501,

  // Unknown error
  Unknown = 999
};

/**
 * @brief Convert ErrorCode to string for logging/debugging
 */
inline std::string ErrorCodeToString(ErrorCode code) {
  switch (code) {
  case ErrorCode::Success:
    return "Success";
  case ErrorCode::InvalidConfiguration:
    return "InvalidConfiguration";
  case ErrorCode::ConfigurationNotFound:
    return "ConfigurationNotFound";
  case ErrorCode::ConfigurationValidationFailed:
    return "ConfigurationValidationFailed";
  case ErrorCode::InvalidStateTransition:
    return "InvalidStateTransition";
  case ErrorCode::AlreadyRunning:
    return "AlreadyRunning";
  case ErrorCode::NoActiveRun:
    return "NoActiveRun";
  case ErrorCode::RequestAlreadyPending:
    return "RequestAlreadyPending";
  case ErrorCode::HardwareRejected:
    return "HardwareRejected";
  case ErrorCode::HardwareFault:
    return "HardwareFault";
  case ErrorCode::HardwareTimeout:
    return "HardwareTimeout";
  case ErrorCode::TaskAlreadyTerminal:
    return "TaskAlreadyTerminal";
  case ErrorCode::UnknownOperation:
    return "UnknownOperation";
  case ErrorCode::TaskCancelledByInstrument:
    return "TaskCancelledByInstrument";
  case ErrorCode::CommunicationError:
    return "CommunicationError";
  case ErrorCode::Timeout:
    return "Timeout";
  case ErrorCode::InvalidResponse:
    return "InvalidResponse";
  case ErrorCode::Cancelled:
    return "Cancelled";
  case ErrorCode::InternalError:
    return "InternalError";
  case ErrorCode::InvariantViolation:
    return "InvariantViolation";
  case ErrorCode::Unknown:
  default:
    return "Unknown";
  }
}

/**
 * @brief True for malformed-request failures (treated as programming errors)
 */
inline bool IsValidationError(ErrorCode code) {
  return code == ErrorCode::HardwareRejected ||
         code == ErrorCode::UnknownOperation;
}

} // namespace PROBEFLOW

#endif // PROBEFLOW_CORE_ERROR_CODE_HPP
