#include "errors.hpp"

#include <utility>

namespace orchestrator {

const char* ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::kOk:
      return "ok";
    case ErrorCode::kNotFound:
      return "not_found";
    case ErrorCode::kAlreadyExists:
      return "already_exists";
    case ErrorCode::kPreconditionFailed:
      return "precondition_failed";
    case ErrorCode::kValidationFailed:
      return "validation_failed";
    case ErrorCode::kExecutionFailure:
      return "execution_failure";
    case ErrorCode::kTimeout:
      return "timeout";
    case ErrorCode::kPersistenceFailure:
      return "persistence_failure";
    case ErrorCode::kConfigInvalid:
      return "config_invalid";
    case ErrorCode::kInvalidArgument:
      return "invalid_argument";
    case ErrorCode::kNotImplemented:
      return "not_implemented";
  }
  return "unknown";
}

bool SetError(Error* err, ErrorCode code, std::string message) {
  if (err) {
    err->code = code;
    err->message = std::move(message);
  }
  return false;
}

void WrapError(Error* err, const std::string& prefix) {
  if (!err) return;
  err->message = err->message.empty() ? prefix : prefix + ": " + err->message;
}

}  // namespace orchestrator
