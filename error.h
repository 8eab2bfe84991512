#ifndef NETNAME_ERROR_H_
#define NETNAME_ERROR_H_

#include <string>

enum class ErrorCode {
  kNone,
  kInterface,
  kSubnetTooLarge,
  kInvalidArgument,
  kRegistration,
  kSystem,
};

struct Error {
  ErrorCode code = ErrorCode::kNone;
  std::string message;
};

const char* error_code_name(ErrorCode code);

// Fills |err| (when given) and returns false, so callers can write
// `return set_error(err, ...);`.
bool set_error(Error* err, ErrorCode code, const std::string& message);

// Same as set_error, with strerror(errno) appended to |message|.
bool set_errno_error(Error* err, ErrorCode code, const std::string& message);

#endif  // NETNAME_ERROR_H_
