#pragma once

#include <string>

namespace orchestrator {

enum class ErrorCode {
  kOk,
  kNotFound,
  kAlreadyExists,
  kPreconditionFailed,
  kValidationFailed,
  kExecutionFailure,
  kTimeout,
  kPersistenceFailure,
  kConfigInvalid,
  kInvalidArgument,
  kNotImplemented,
};

struct Error {
  ErrorCode code = ErrorCode::kOk;
  std::string message;
};

const char* ErrorCodeName(ErrorCode code);

// Fills *err when err is non-null. Always returns false so callers can `return SetError(...)`.
bool SetError(Error* err, ErrorCode code, std::string message);

// Prepends "<prefix>: " to the message, keeping the code.
void WrapError(Error* err, const std::string& prefix);

}  // namespace orchestrator
