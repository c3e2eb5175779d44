#include <pitstrat/stint.hpp>

namespace pitstrat {

SurfaceModel make_surface_model(const WeatherState& w, int total_laps,
                                const CrossoverParams& crossover,
                                const SurfaceParams& surface) {
  SurfaceModel m;
  m.crossover_lap = crossover_lap(w, total_laps, crossover);
  m.params = surface;
  return m;
}

std::optional<double> stint_lap_time(const std::string& code,
                                     const CompoundParams& p,
                                     int lap_in_stint,
                                     int race_lap,
                                     const RaceConfig& race,
                                     const WeatherState& w,
                                     const SurfaceModel& surface) {
  const auto delta = degradation_delta(p, lap_in_stint, race.track_temp_c);
  if (!delta) return std::nullopt;

  const double base = race.base_lap_time_s * condition_pace_multiplier(w.condition, surface.params);
  const double penalty = surface_penalty_s(tyre_category(code), race_lap, w,
                                           surface.crossover_lap, surface.params);
  return base + p.base_pace_offset + *delta + penalty;
}

std::optional<Stint> simulate_stint(const std::string& code,
                                    const CompoundParams& p,
                                    int start_lap,
                                    int laps,
                                    const RaceConfig& race,
                                    const WeatherState& w,
                                    const SurfaceModel& surface,
                                    Error* err) {
  if (laps <= 0 || start_lap < 1) {
    fail(err, ErrorCode::ConfigError, "stint on " + code + " must cover at least one lap");
    return std::nullopt;
  }
  if (!validate_compound(code, p, err)) return std::nullopt;

  Stint s;
  s.compound = code;
  s.start_lap = start_lap;
  s.end_lap = start_lap + laps - 1;
  s.laps = laps;
  s.is_wet_tyre = is_wet_tyre(code);
  s.lap_times_s.reserve(static_cast<std::size_t>(laps));

  for (int n = 0; n < laps; ++n) {
    const auto t = stint_lap_time(code, p, n, start_lap + n, race, w, surface);
    if (!t) {
      fail(err, ErrorCode::InvalidCompoundParams, "compound '" + code + "': lap time undefined");
      return std::nullopt;
    }
    s.lap_times_s.push_back(*t);
    s.stint_time_s += *t;
    if (n > p.cliff_onset_lap) ++s.cliff_laps;
  }

  s.avg_lap_time_s = s.stint_time_s / static_cast<double>(laps);
  s.final_lap_time_s = s.lap_times_s.back();
  return s;
}

} // namespace pitstrat
