#include <pitstrat/errors.hpp>
#include <utility>

namespace pitstrat {

const char* error_code_name(ErrorCode c) {
  switch (c) {
    case ErrorCode::ConfigError:              return "ConfigError";
    case ErrorCode::InvalidCompoundParams:    return "InvalidCompoundParams";
    case ErrorCode::InsufficientCompoundData: return "InsufficientCompoundData";
    case ErrorCode::StintLengthExceeded:      return "StintLengthExceeded";
    case ErrorCode::NoLegalStrategy:          return "NoLegalStrategy";
  }
  return "Unknown";
}

std::string describe(const Error& e) {
  return std::string(error_code_name(e.code)) + ": " + e.reason;
}

bool fail(Error* out, ErrorCode code, std::string reason) {
  if (out) {
    out->code = code;
    out->reason = std::move(reason);
  }
  return false;
}

} // namespace pitstrat
