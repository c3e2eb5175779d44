#pragma once
#include <optional>
#include <string>
#include <vector>
#include <pitstrat/compound.hpp>
#include <pitstrat/errors.hpp>
#include <pitstrat/race.hpp>
#include <pitstrat/weather.hpp>

namespace pitstrat {

// Weather-derived state shared by every stint of one request.
struct SurfaceModel {
  std::optional<int> crossover_lap; // nullopt in dry
  SurfaceParams params;
};

SurfaceModel make_surface_model(const WeatherState& w, int total_laps,
                                const CrossoverParams& crossover,
                                const SurfaceParams& surface);

struct Stint {
  int stint_number = 0;          // 1-based
  std::string compound;
  int start_lap = 0;             // 1-based, inclusive
  int end_lap = 0;               // inclusive
  int laps = 0;
  double stint_time_s = 0.0;     // sum of lap_times_s
  double avg_lap_time_s = 0.0;
  double final_lap_time_s = 0.0;
  int cliff_laps = 0;            // laps with lap_in_stint > cliff_onset_lap
  bool is_wet_tyre = false;
  std::vector<double> lap_times_s;
};

// Time of one lap: base * condition multiplier + pace offset
// + wear delta(lap_in_stint) + surface penalty(race_lap).
std::optional<double> stint_lap_time(const std::string& code,
                                     const CompoundParams& p,
                                     int lap_in_stint,
                                     int race_lap,
                                     const RaceConfig& race,
                                     const WeatherState& w,
                                     const SurfaceModel& surface);

// Lap-by-lap breakdown of `laps` laps starting at race lap `start_lap`.
// nullopt (with *err) on bad params or an empty stint.
std::optional<Stint> simulate_stint(const std::string& code,
                                    const CompoundParams& p,
                                    int start_lap,
                                    int laps,
                                    const RaceConfig& race,
                                    const WeatherState& w,
                                    const SurfaceModel& surface,
                                    Error* err = nullptr);

} // namespace pitstrat
