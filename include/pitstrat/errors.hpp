#pragma once
#include <string>

namespace pitstrat {

enum class ErrorCode : int {
  ConfigError = 0,          // invalid RaceConfig / WeatherState / options
  InvalidCompoundParams,    // negative rates, negative cliff onset, ...
  InsufficientCompoundData, // a required compound has no parameters
  StintLengthExceeded,      // no legal partition for a compound sequence
  NoLegalStrategy           // nothing survived enumeration + simulation
};

struct Error {
  ErrorCode code = ErrorCode::ConfigError;
  std::string reason; // literal, user-facing
};

const char* error_code_name(ErrorCode c);

// "<CodeName>: <reason>"
std::string describe(const Error& e);

// Writes into *out when out is non-null. Returns false so callers can
// `return fail(...)` from bool-returning helpers.
bool fail(Error* out, ErrorCode code, std::string reason);

} // namespace pitstrat
