#pragma once
#include <optional>
#include <string>
#include <vector>
#include <pitstrat/compound.hpp>
#include <pitstrat/errors.hpp>
#include <pitstrat/race.hpp>
#include <pitstrat/weather.hpp>

namespace pitstrat {

// A strategy shape before simulation: compound sequence + stint lengths.
struct CandidateStrategy {
  std::vector<std::string> compounds;
  std::vector<int> stint_laps; // same size as compounds, sums to total_laps

  int stops() const { return static_cast<int>(compounds.size()) - 1; }
};

// Legality rules shared by enumeration and the boundary search.
struct StintRules {
  int total_laps = 0;
  int min_stint_laps = 5;            // capped by total_laps when applied
  bool enforce_stint_limits = true;  // stint <= typical_max_stint_laps
  bool wet_mode = false;             // condition != dry
  std::optional<int> crossover_lap;  // slicks only on laps after it
  bool slicks_allowed = true;
  bool require_two_slicks = false;   // dry two-compound rule, when active
};

struct EnumeratorOptions {
  std::vector<int> stop_counts{0, 1, 2};
  int partition_step_laps = 5;
  int min_stint_laps = 5;
  bool enforce_two_compound_rule = true;
  bool enforce_stint_limits = true;
  CrossoverParams crossover;
};

struct EnumerationResult {
  std::vector<CandidateStrategy> candidates;
  StintRules rules;                        // as applied, after any relaxation
  std::vector<std::string> notes;          // advisory, user-facing
  std::vector<std::string> dropped_shapes; // one literal line per shape with no legal partition
  bool two_compound_rule_relaxed = false;
};

// "0-Stop: C3", "1-Stop: C4 -> C3", ...
std::string strategy_name(const std::vector<std::string>& compounds);

// Compound-level rules only (no lap counts).
bool sequence_is_legal(const std::vector<std::string>& compounds, const StintRules& rules);

// Full check of one shape: sequence rules, lap coverage, stint bounds and
// crossover. StintLengthExceeded for bound violations, ConfigError for
// malformed shapes, InsufficientCompoundData for unknown codes.
bool partition_is_legal(const CandidateStrategy& c,
                        const CompoundMap& catalog,
                        const StintRules& rules,
                        Error* err = nullptr);

StintRules make_stint_rules(const RaceConfig& race,
                            const WeatherState& weather,
                            const EnumeratorOptions& opt);

// Coarse candidate set for every legal compound sequence and stop count.
// Shapes without any legal partition are reported in dropped_shapes.
EnumerationResult enumerate_candidates(const RaceConfig& race,
                                       const CompoundMap& available,
                                       const WeatherState& weather,
                                       const EnumeratorOptions& opt);

} // namespace pitstrat
