#include <pitstrat/format.hpp>
#include <cmath>
#include <cstdio>

namespace pitstrat {

std::string format_race_time(double s) {
  char out[32];
  if (s < 0.0 || !std::isfinite(s)) {
    std::snprintf(out, sizeof(out), "%s", "--");
    return out;
  }
  // Round to milliseconds first so 59.9996 becomes 0:01:00.000, not 0:00:59.1000.
  const long long total_ms = std::llround(s * 1000.0);
  const long long hours    = total_ms / 3600000;
  const long long minutes  = (total_ms / 60000) % 60;
  const long long secs     = (total_ms / 1000) % 60;
  const long long ms       = total_ms % 1000;
  std::snprintf(out, sizeof(out), "%lld:%02lld:%02lld.%03lld", hours, minutes, secs, ms);
  return out;
}

std::string format_fixed(double value, int decimals) {
  if (decimals < 0) decimals = 0;
  const double half_ulp = 0.5 * std::pow(10.0, -decimals);
  if (std::fabs(value) < half_ulp) value = 0.0; // no "-0.0"
  char out[64];
  std::snprintf(out, sizeof(out), "%.*f", decimals, value);
  return out;
}

std::string format_signed(double seconds, int decimals) {
  std::string body = format_fixed(seconds, decimals);
  if (body[0] != '-' && seconds > 0.0 && body != format_fixed(0.0, decimals)) {
    return "+" + body;
  }
  return body;
}

} // namespace pitstrat
