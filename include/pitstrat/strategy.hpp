#pragma once
#include <optional>
#include <string>
#include <vector>
#include <pitstrat/compound.hpp>
#include <pitstrat/enumerator.hpp>
#include <pitstrat/errors.hpp>
#include <pitstrat/race.hpp>
#include <pitstrat/stint.hpp>
#include <pitstrat/weather.hpp>

namespace pitstrat {

struct Strategy {
  std::string name;
  std::vector<Stint> stints;
  int stops = 0;                 // stints.size() - 1
  double total_time_s = 0.0;     // stints + pit loss; never includes the historical nudge
  double pit_time_s = 0.0;
  std::vector<int> pit_stop_laps; // last lap of every stint but the final one
  std::string weather_note;

  // Advisory metadata from HistoricalAdjuster.
  std::optional<double> historical_adjustment_s;
  std::vector<std::string> historical_notes;

  std::vector<std::string> compounds() const;
  std::optional<int> first_pit_lap() const;
  int laps_covered() const;
  double effective_score() const { return total_time_s + historical_adjustment_s.value_or(0.0); }
};

// Immutable per-request inputs shared by every candidate evaluation.
struct SimulationContext {
  RaceConfig race;
  WeatherState weather;
  CompoundMap catalog;
  StintRules rules;
  SurfaceModel surface;
};

SimulationContext make_simulation_context(const RaceConfig& race,
                                          const WeatherState& weather,
                                          const CompoundMap& catalog,
                                          const StintRules& rules,
                                          const SurfaceParams& surface,
                                          const CrossoverParams& crossover);

// Simulate one shape exactly as given. Fails with StintLengthExceeded (or
// the matching code) when the shape breaks the rules in ctx.rules.
std::optional<Strategy> simulate_strategy(const CandidateStrategy& c,
                                          const SimulationContext& ctx,
                                          Error* err = nullptr);

// Shift every internal boundary by each offset in [-radius, +radius] and
// keep the legal variant with the lowest total (first visited on ties;
// offsets are visited from -radius upwards).
std::optional<Strategy> optimise_boundaries(const CandidateStrategy& c,
                                            const SimulationContext& ctx,
                                            int radius,
                                            Error* err = nullptr);

} // namespace pitstrat
