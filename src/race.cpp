#include <pitstrat/race.hpp>
#include <cmath>

namespace pitstrat {

bool validate_race_config(const RaceConfig& race, Error* err) {
  if (race.total_laps <= 0)
    return fail(err, ErrorCode::ConfigError,
                "total_laps must be positive (got " + std::to_string(race.total_laps) + ")");
  if (!(race.pit_loss_seconds >= 0.0) || !std::isfinite(race.pit_loss_seconds))
    return fail(err, ErrorCode::ConfigError, "pit_loss_seconds must be a non-negative number");
  if (!(race.base_lap_time_s > 0.0) || !std::isfinite(race.base_lap_time_s))
    return fail(err, ErrorCode::ConfigError, "base_lap_time_s must be positive");
  if (race.track_temp_c && !std::isfinite(*race.track_temp_c))
    return fail(err, ErrorCode::ConfigError, "track_temp_c must be finite when given");
  return true;
}

RaceConfig race_config_with_pits(int total_laps, const PitParams& pit, double base_lap_time_s) {
  RaceConfig race;
  race.total_laps = total_laps;
  race.pit_loss_seconds = pit_stop_loss(pit);
  race.base_lap_time_s = base_lap_time_s;
  return race;
}

} // namespace pitstrat
