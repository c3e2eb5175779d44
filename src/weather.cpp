#include <pitstrat/weather.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>

namespace pitstrat {

static inline std::string lower(std::string s) {
  for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

const char* weather_condition_name(WeatherCondition c) {
  switch (c) {
    case WeatherCondition::Dry:     return "dry";
    case WeatherCondition::Damp:    return "damp";
    case WeatherCondition::Wet:     return "wet";
    case WeatherCondition::Extreme: return "extreme";
  }
  return "dry";
}

std::optional<WeatherCondition> weather_condition_from_string(const std::string& s) {
  const auto v = lower(s);
  if (v == "dry")     return WeatherCondition::Dry;
  if (v == "damp")    return WeatherCondition::Damp;
  if (v == "wet")     return WeatherCondition::Wet;
  if (v == "extreme") return WeatherCondition::Extreme;
  return std::nullopt;
}

bool validate_weather(const WeatherState& w, Error* err) {
  if (!(w.rain_intensity >= 0.0 && w.rain_intensity <= 1.0))
    return fail(err, ErrorCode::ConfigError, "rain_intensity must be within [0, 1]");
  return true;
}

std::optional<int> crossover_lap(const WeatherState& w, int total_laps, const CrossoverParams& p) {
  double factor = 0.0;
  switch (w.condition) {
    case WeatherCondition::Dry:     return std::nullopt;
    case WeatherCondition::Damp:    factor = p.damp_factor; break;
    case WeatherCondition::Wet:     factor = p.wet_factor; break;
    case WeatherCondition::Extreme: factor = p.extreme_factor; break;
  }
  // Tiny epsilon keeps products like 50 * 0.5 * 0.8 from flooring to 19.
  const double raw = static_cast<double>(total_laps) * w.rain_intensity * factor;
  int lap = static_cast<int>(std::floor(raw + 1e-9));
  const int hi = total_laps - p.min_slick_laps;
  lap = std::min(lap, hi);
  lap = std::max(lap, p.min_opening_laps);
  return lap;
}

bool slicks_allowed(const WeatherState& w, const CrossoverParams& p) {
  return w.condition != WeatherCondition::Extreme || p.extreme_allows_slicks;
}

double condition_pace_multiplier(WeatherCondition c, const SurfaceParams& p) {
  switch (c) {
    case WeatherCondition::Dry:     return 1.0;
    case WeatherCondition::Damp:    return p.damp_multiplier;
    case WeatherCondition::Wet:     return p.wet_multiplier;
    case WeatherCondition::Extreme: return p.extreme_multiplier;
  }
  return 1.0;
}

double surface_penalty_s(TyreCategory cat,
                         int race_lap,
                         const WeatherState& w,
                         std::optional<int> crossover,
                         const SurfaceParams& p) {
  // A dry race is "past crossover" from the green flag.
  const int dry_from = (w.condition == WeatherCondition::Dry) ? 0 : crossover.value_or(0);
  const double rain = std::clamp(w.rain_intensity, 0.0, 1.0);

  if (race_lap <= dry_from) {
    switch (cat) {
      case TyreCategory::Slick:
        return p.slick_wet_penalty_s * (1.0 + rain);
      case TyreCategory::Intermediate:
        return std::max(0.0, rain - p.wet_threshold) * p.mismatch_s;
      case TyreCategory::Wet:
        return std::max(0.0, p.wet_threshold - rain) * p.mismatch_s;
    }
    return 0.0;
  }

  const double laps_dry = static_cast<double>(race_lap - dry_from);
  switch (cat) {
    case TyreCategory::Slick:        return 0.0;
    case TyreCategory::Intermediate: return p.inter_overheat_s_per_lap * laps_dry;
    case TyreCategory::Wet:          return p.wet_overheat_s_per_lap * laps_dry;
  }
  return 0.0;
}

} // namespace pitstrat
