#pragma once
#include <optional>
#include <string>
#include <pitstrat/errors.hpp>
#include <pitstrat/pit.hpp>

namespace pitstrat {

struct RaceConfig {
  int    total_laps = 0;           // > 0
  double pit_loss_seconds = 0.0;   // >= 0, per stop
  double base_lap_time_s = 90.0;   // > 0, reference-compound lap on fresh tyres
  std::optional<double> track_temp_c;
  std::optional<std::string> circuit_key; // opaque, carried through only
};

// ConfigError on non-positive laps, negative pit loss or non-positive base lap.
bool validate_race_config(const RaceConfig& race, Error* err = nullptr);

// Convenience: build a RaceConfig whose pit loss comes from stationary + lane time.
RaceConfig race_config_with_pits(int total_laps, const PitParams& pit, double base_lap_time_s);

} // namespace pitstrat
