#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include <pitstrat/compound.hpp>
#include <pitstrat/enumerator.hpp>
#include <pitstrat/errors.hpp>
#include <pitstrat/historical.hpp>
#include <pitstrat/race.hpp>
#include <pitstrat/ranker.hpp>
#include <pitstrat/rules.hpp>
#include <pitstrat/strategy.hpp>
#include <pitstrat/weather.hpp>

namespace pitstrat {

enum class MissingCompoundPolicy : int {
  Fail = 0,        // InsufficientCompoundData
  UseFallback = 1  // substitute generic parameters and say so in an advisory
};

// Knobs surfaced to callers.
struct EngineOptions {
  std::vector<int> stop_counts{0, 1, 2};
  int boundary_search_radius = 2;
  int partition_step_laps = 5;
  int min_stint_laps = 5;
  bool enforce_two_compound_rule = true;
  bool enforce_stint_limits = true;
  std::size_t max_strategies_per_stop_count = 3; // 0 = keep all
  unsigned worker_threads = 1;                   // 0 = hardware concurrency
  bool derive_temp_multipliers = false;
  bool extract_rule_hits = true;
  MissingCompoundPolicy missing_compound_policy = MissingCompoundPolicy::UseFallback;
  CrossoverParams crossover;
  SurfaceParams surface;
  HistoricalWeights historical; // historical.cap_s also sets the ranker's physics guard
};

struct PlanRequest {
  RaceConfig race;
  WeatherState weather;
  CompoundMap compounds;
  std::optional<HistoricalProfile> history;
};

struct PlanResult {
  std::optional<RankedResult> ranked;
  std::vector<std::vector<RuleHit>> rule_hits; // parallel to ranked->strategies
  std::optional<Error> error;                  // set => ranked is empty
  std::vector<std::string> dropped_shapes;
  std::size_t grid_points_evaluated = 0; // coarse shapes simulated without boundary search
  std::size_t candidates_evaluated = 0;  // one per compound sequence, boundary-searched

  bool ok() const { return ranked.has_value() && !error.has_value(); }
};

// Whole pipeline: validate -> enumerate -> simulate the coarse grid ->
// best grid point per sequence -> boundary search -> historical nudge ->
// rank -> rule hits. Identical inputs give identical
// output regardless of worker_threads.
PlanResult plan_strategies(const PlanRequest& req, const EngineOptions& opt = {});

EnumeratorOptions enumerator_options(const EngineOptions& opt);

// Validates the supplied compounds and fills in missing wet tyres per
// policy. Advisories describe every substitution.
bool resolve_compounds(const PlanRequest& req,
                       const EngineOptions& opt,
                       CompoundMap* out,
                       std::vector<std::string>* advisories,
                       Error* err = nullptr);

// Boundary-optimised simulation of every candidate; slot i holds the result
// for candidates[i] (nullopt when it broke the rules, reason in errors[i]).
std::vector<std::optional<Strategy>> evaluate_candidates(const std::vector<CandidateStrategy>& candidates,
                                                         const SimulationContext& ctx,
                                                         int radius,
                                                         unsigned worker_threads,
                                                         std::vector<Error>* errors = nullptr);

// One strategy per compound sequence: lowest total, then earlier first stop.
std::vector<Strategy> best_per_sequence(std::vector<Strategy> strategies);

} // namespace pitstrat
