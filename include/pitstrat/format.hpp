#pragma once
#include <string>

namespace pitstrat {

// Race time as "h:mm:ss.sss" (e.g. 5300.25 -> "1:28:20.250"); "--" for
// negative or non-finite input.
std::string format_race_time(double seconds);

// Fixed-point seconds with an explicit sign for positives: "+1.5", "-0.3", "0.0".
std::string format_signed(double seconds, int decimals = 1);

// Plain fixed-point: format_fixed(90.1234, 2) -> "90.12".
std::string format_fixed(double value, int decimals);

} // namespace pitstrat
