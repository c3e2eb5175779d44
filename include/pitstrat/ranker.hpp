#pragma once
#include <cstddef>
#include <string>
#include <vector>
#include <pitstrat/race.hpp>
#include <pitstrat/strategy.hpp>
#include <pitstrat/weather.hpp>

namespace pitstrat {

struct RankOptions {
  double physics_guard_s = 2.0;        // same value as the historical cap
  std::size_t max_per_stop_count = 0;  // 0 = keep all
};

struct RankedResult {
  std::vector<Strategy> strategies;    // best first
  std::string recommended;             // strategies.front().name, "" when empty
  double delta_s = 0.0;                // winning margin, never negative (see lead_held_by_guard)
  bool lead_held_by_guard = false;     // runner-up is better adjusted; delta_s is the raw gap
  std::vector<std::string> guard_notes; // reorderings blocked by the physics guard

  // Request context carried for fact extraction; set by the planner.
  RaceConfig race;
  WeatherState weather;
  std::vector<std::string> advisories;
};

// Physics-priority guard: true when `behind` is more than guard_s slower
// on raw total_time_s than `ahead`, so no historical adjustment may rank
// it first.
bool physics_guard_blocks(const Strategy& ahead, const Strategy& behind, double guard_s);

// Sort by effective score (total + historical adjustment), ties by fewer
// stops, then earlier first pit lap, then name. Each place goes to the best
// effective score among the strategies within the guard of the fastest raw
// total still unranked, so a strategy never passes one that is more than
// the guard faster on raw time.
RankedResult rank_strategies(std::vector<Strategy> strategies, const RankOptions& opt);

} // namespace pitstrat
