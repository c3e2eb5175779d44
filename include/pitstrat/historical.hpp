#pragma once
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <pitstrat/strategy.hpp>

namespace pitstrat {

struct FirstStopLapStats {
  double median = 0.0;
  double p25 = 0.0;
  double p75 = 0.0;
  int n = 0;
};

struct StopCountDistribution {
  double one_stop_pct = 0.0;
  double two_stop_pct = 0.0;
  double three_plus_pct = 0.0;
  int n = 0;
};

struct StrategySequenceInfo {
  std::vector<std::string> sequence; // roles ("MEDIUM") or codes ("C3")
  double frequency_pct = 0.0;
  int n = 0;
};

struct UndercutOvercutStats {
  int undercut_attempts = 0;
  double undercut_success_rate = 0.0; // 0..1
  int overcut_attempts = 0;
  double overcut_success_rate = 0.0;  // 0..1
  double typical_undercut_gain_s = 0.0;
};

// Aggregated circuit history, resolved upstream. Read-only here.
struct HistoricalProfile {
  std::string circuit_key;
  std::optional<FirstStopLapStats> first_stop_lap;
  std::optional<StopCountDistribution> stop_count_distribution;
  std::vector<StrategySequenceInfo> common_sequences; // most frequent first
  std::optional<UndercutOvercutStats> undercut_overcut;
  std::map<std::string, std::string> compound_roles;  // "C3" -> "MEDIUM"
};

// Tunable weights. All values are seconds unless noted.
struct HistoricalWeights {
  double first_stop_penalty_per_lap = 0.15;
  double first_stop_max_penalty_s = 2.0;
  double sequence_match_bonus_s = 1.5;   // at 100% frequency
  double partial_match_factor = 0.4;     // same compounds, other order
  double stop_count_bonus_s = 0.5;       // at 100% share
  double dominant_share_pct = 40.0;      // share needed to count as dominant
  double undercut_weight_s = 1.0;        // (0.5 - success_rate) * weight
  double master_weight = 1.0;
  double cap_s = 2.0;                    // |adjustment| never exceeds this
};

struct HistoricalAdjustment {
  double adjustment_s = 0.0;
  std::vector<std::string> notes;
};

// Bounded, advisory nudge for one strategy. Zero and no notes without a profile.
HistoricalAdjustment historical_adjustment(const Strategy& s,
                                           const std::optional<HistoricalProfile>& profile,
                                           const HistoricalWeights& w);

// Copies `s` with historical_adjustment_s / historical_notes filled in.
// total_time_s is left untouched.
Strategy apply_historical_adjustment(const Strategy& s,
                                     const std::optional<HistoricalProfile>& profile,
                                     const HistoricalWeights& w);

} // namespace pitstrat
