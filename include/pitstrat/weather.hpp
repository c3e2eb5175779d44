#pragma once
#include <optional>
#include <string>
#include <pitstrat/compound.hpp>
#include <pitstrat/errors.hpp>

namespace pitstrat {

enum class WeatherCondition : int { Dry = 0, Damp, Wet, Extreme };

// Accepted as given; the engine never re-derives the condition from rain data.
struct WeatherState {
  WeatherCondition condition = WeatherCondition::Dry;
  double rain_intensity = 0.0; // 0 = bone dry, 1 = monsoon
};

const char* weather_condition_name(WeatherCondition c);
// Case-insensitive "dry" | "damp" | "wet" | "extreme".
std::optional<WeatherCondition> weather_condition_from_string(const std::string& s);

// ConfigError when rain_intensity is outside [0, 1].
bool validate_weather(const WeatherState& w, Error* err = nullptr);

// Tunable crossover heuristic: the lap after which slicks become viable.
struct CrossoverParams {
  double damp_factor = 0.5;
  double wet_factor = 0.7;
  double extreme_factor = 0.8;
  int min_opening_laps = 5;     // earliest crossover
  int min_slick_laps = 5;       // crossover leaves at least this many laps
  bool extreme_allows_slicks = false;
};

// floor(total_laps * rain_intensity * factor) clamped to
// [min_opening_laps, total_laps - min_slick_laps]. nullopt in dry.
std::optional<int> crossover_lap(const WeatherState& w, int total_laps, const CrossoverParams& p);

bool slicks_allowed(const WeatherState& w, const CrossoverParams& p);

// Track-surface constants: condition pace multipliers and tyre/surface mismatch costs.
struct SurfaceParams {
  double damp_multiplier = 1.06;
  double wet_multiplier = 1.15;
  double extreme_multiplier = 1.35;
  double wet_threshold = 0.6;            // rain intensity where full wets beat inters
  double mismatch_s = 4.0;               // per unit of intensity away from threshold
  double slick_wet_penalty_s = 8.0;      // scaled by (1 + rain_intensity)
  double inter_overheat_s_per_lap = 0.20;
  double wet_overheat_s_per_lap = 1.0;
};

double condition_pace_multiplier(WeatherCondition c, const SurfaceParams& p);

// Per-lap seconds added for running `cat` on race lap `race_lap` (1-based).
// Before or on the crossover: slicks aquaplane, wet tyres pay for a
// suitability mismatch. After it (and on every dry lap), wet tyres
// overheat cumulatively and slicks pay nothing.
double surface_penalty_s(TyreCategory cat,
                         int race_lap,
                         const WeatherState& w,
                         std::optional<int> crossover,
                         const SurfaceParams& p);

} // namespace pitstrat
