#include <pitstrat/ranker.hpp>
#include <pitstrat/format.hpp>
#include <algorithm>
#include <climits>
#include <map>

namespace pitstrat {

static inline int first_pit_or_max(const Strategy& s) {
  return s.first_pit_lap().value_or(INT_MAX);
}

// Shared tie-break after the primary score.
static bool tie_break(const Strategy& a, const Strategy& b) {
  if (a.stops != b.stops) return a.stops < b.stops;
  const int fa = first_pit_or_max(a), fb = first_pit_or_max(b);
  if (fa != fb) return fa < fb;
  return a.name < b.name;
}

static bool raw_before(const Strategy& a, const Strategy& b) {
  if (a.total_time_s != b.total_time_s) return a.total_time_s < b.total_time_s;
  return tie_break(a, b);
}

static bool effective_before(const Strategy& a, const Strategy& b) {
  const double ea = a.effective_score(), eb = b.effective_score();
  if (ea != eb) return ea < eb;
  return tie_break(a, b);
}

bool physics_guard_blocks(const Strategy& ahead, const Strategy& behind, double guard_s) {
  return behind.total_time_s - ahead.total_time_s > guard_s;
}

RankedResult rank_strategies(std::vector<Strategy> strategies, const RankOptions& opt) {
  RankedResult res;
  const double guard = std::max(0.0, opt.physics_guard_s);

  std::stable_sort(strategies.begin(), strategies.end(), raw_before);

  // Pick by effective score among the strategies the guard leaves open:
  // those within `guard` of the fastest raw total still unranked.
  std::vector<Strategy> ordered;
  ordered.reserve(strategies.size());
  std::vector<bool> taken(strategies.size(), false);
  std::size_t fastest = 0; // first untaken index in raw order
  while (ordered.size() < strategies.size()) {
    while (taken[fastest]) ++fastest;
    std::size_t pick = fastest;
    for (std::size_t i = fastest + 1; i < strategies.size(); ++i) {
      if (taken[i]) continue;
      if (physics_guard_blocks(strategies[fastest], strategies[i], guard)) break;
      if (effective_before(strategies[i], strategies[pick])) pick = i;
    }
    taken[pick] = true;
    ordered.push_back(std::move(strategies[pick]));
  }
  strategies = std::move(ordered);

  if (opt.max_per_stop_count > 0) {
    std::map<int, std::size_t> kept;
    std::vector<Strategy> trimmed;
    for (auto& s : strategies) {
      if (kept[s.stops]++ < opt.max_per_stop_count) trimmed.push_back(std::move(s));
    }
    strategies = std::move(trimmed);
  }

  // Record every pair the effective score alone would have swapped.
  for (std::size_t i = 0; i < strategies.size(); ++i) {
    for (std::size_t j = i + 1; j < strategies.size(); ++j) {
      const auto& a = strategies[i];
      const auto& b = strategies[j];
      if (effective_before(b, a)) {
        res.guard_notes.push_back(a.name + " kept ahead of " + b.name +
                                  " by the physics guard (raw gap " +
                                  format_fixed(b.total_time_s - a.total_time_s, 1) + "s, cap " +
                                  format_fixed(guard, 1) + "s)");
      }
    }
  }

  res.strategies = std::move(strategies);
  if (!res.strategies.empty()) {
    res.recommended = res.strategies.front().name;
  }
  if (res.strategies.size() > 1) {
    const auto& best = res.strategies[0];
    const auto& second = res.strategies[1];
    if (effective_before(second, best)) {
      // The runner-up scores better once adjusted; the lead is the raw gap.
      res.lead_held_by_guard = true;
      res.delta_s = second.total_time_s - best.total_time_s;
    } else {
      res.delta_s = second.effective_score() - best.effective_score();
    }
  }
  return res;
}

} // namespace pitstrat
