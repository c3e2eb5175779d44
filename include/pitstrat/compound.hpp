#pragma once
#include <map>
#include <optional>
#include <string>
#include <pitstrat/errors.hpp>

namespace pitstrat {

inline constexpr const char* kIntermediate = "INTERMEDIATE";
inline constexpr const char* kFullWet      = "WET";

enum class TyreCategory : int { Slick = 0, Intermediate = 1, Wet = 2 };

struct CompoundParams {
  double avg_deg_s_per_lap = 0.0;     // linear wear (s per lap of tyre age)
  int    cliff_onset_lap = 0;         // quadratic term starts past this lap
  double cliff_rate_s_per_lap2 = 0.0; // quadratic coefficient
  int    typical_max_stint_laps = 1;  // > 0
  double base_pace_offset = 0.0;      // seconds vs reference compound
  std::optional<double> temp_multiplier; // scales wear only, never baseline
};

// Keyed by compound code ("C3", "INTERMEDIATE", ...). Ordered so every
// iteration over it is deterministic.
using CompoundMap = std::map<std::string, CompoundParams>;

TyreCategory tyre_category(const std::string& code);
inline bool is_wet_tyre(const std::string& code) {
  return tyre_category(code) != TyreCategory::Slick;
}

// Returns false (and fills *err) for negative rates, negative cliff onset,
// non-positive max stint or a negative temperature multiplier.
bool validate_compound(const std::string& code, const CompoundParams& p, Error* err = nullptr);

// Lap-time delta caused by wear at zero-based lap_in_stint:
//   lap * avg_deg + cliff_rate * max(0, lap - cliff_onset)^2
// scaled by temp_multiplier when both it and track_temp_c are present.
// nullopt on invalid params or a negative lap index.
std::optional<double> degradation_delta(const CompoundParams& p,
                                        int lap_in_stint,
                                        std::optional<double> track_temp_c);

// Heuristic multiplier for a compound at a given track temperature:
// (t/25)^1.2, softer C-numbers slightly more sensitive, floored at 0.5.
double derived_temp_multiplier(const std::string& code, double track_temp_c);

// Copy of `catalog` where compounds lacking temp_multiplier get the derived one.
CompoundMap with_derived_temp_multipliers(const CompoundMap& catalog, double track_temp_c);

// Generic parameters for C1..C5, INTERMEDIATE and WET.
const CompoundMap& fallback_compound_catalog();

std::optional<CompoundParams> compound_by_code(const std::string& code);
std::optional<CompoundParams> compound_by_code_in(const CompoundMap& cat, const std::string& code);

} // namespace pitstrat
