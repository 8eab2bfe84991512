#include "error.h"

#include <cerrno>
#include <cstring>

const char* error_code_name(ErrorCode code) {
  switch (code) {
    case ErrorCode::kNone:
      return "OK";
    case ErrorCode::kInterface:
      return "InterfaceError";
    case ErrorCode::kSubnetTooLarge:
      return "SubnetTooLargeError";
    case ErrorCode::kInvalidArgument:
      return "InvalidArgumentError";
    case ErrorCode::kRegistration:
      return "RegistrationError";
    case ErrorCode::kSystem:
      return "SystemError";
  }
  return "UnknownError";
}

bool set_error(Error* err, ErrorCode code, const std::string& message) {
  if (err != nullptr) {
    err->code = code;
    err->message = message;
  }
  return false;
}

bool set_errno_error(Error* err, ErrorCode code, const std::string& message) {
  int saved = errno;
  return set_error(err, code, message + ": " + std::strerror(saved));
}
