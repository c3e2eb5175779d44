#include <pitstrat/enumerator.hpp>
#include <algorithm>
#include <set>

namespace pitstrat {

static inline int effective_min_stint(const StintRules& r) {
  return std::max(1, std::min(r.min_stint_laps, r.total_laps));
}

static inline int stint_max(const CompoundParams& p, const StintRules& r) {
  return r.enforce_stint_limits ? p.typical_max_stint_laps : r.total_laps;
}

std::string strategy_name(const std::vector<std::string>& compounds) {
  const int stops = compounds.empty() ? 0 : static_cast<int>(compounds.size()) - 1;
  std::string out = std::to_string(stops) + "-Stop: ";
  for (std::size_t i = 0; i < compounds.size(); ++i) {
    if (i) out += " -> ";
    out += compounds[i];
  }
  return out;
}

bool sequence_is_legal(const std::vector<std::string>& compounds, const StintRules& rules) {
  if (compounds.empty()) return false;

  if (!rules.wet_mode) {
    std::set<std::string> distinct;
    for (const auto& c : compounds) {
      if (is_wet_tyre(c)) return false;
      distinct.insert(c);
    }
    return !rules.require_two_slicks || distinct.size() >= 2;
  }

  // Wet mode: open on a wet tyre; once on slicks the track only dries further.
  if (!is_wet_tyre(compounds.front())) return false;
  bool on_slicks = false;
  for (const auto& c : compounds) {
    if (!is_wet_tyre(c)) {
      if (!rules.slicks_allowed) return false;
      on_slicks = true;
    } else if (on_slicks) {
      return false;
    }
  }
  return true;
}

bool partition_is_legal(const CandidateStrategy& c,
                        const CompoundMap& catalog,
                        const StintRules& rules,
                        Error* err) {
  if (c.compounds.empty() || c.compounds.size() != c.stint_laps.size())
    return fail(err, ErrorCode::ConfigError, "strategy shape needs one stint length per compound");

  const std::string name = strategy_name(c.compounds);
  if (!sequence_is_legal(c.compounds, rules))
    return fail(err, ErrorCode::ConfigError, name + ": compound sequence breaks tyre rules");

  int sum = 0;
  for (int laps : c.stint_laps) sum += laps;
  if (sum != rules.total_laps)
    return fail(err, ErrorCode::ConfigError,
                name + ": stints cover " + std::to_string(sum) + " laps, race has " +
                std::to_string(rules.total_laps));

  const int min_len = effective_min_stint(rules);
  int start = 1;
  for (std::size_t i = 0; i < c.compounds.size(); ++i) {
    const auto& code = c.compounds[i];
    const int len = c.stint_laps[i];
    auto it = catalog.find(code);
    if (it == catalog.end())
      return fail(err, ErrorCode::InsufficientCompoundData, "no parameters for compound '" + code + "'");
    if (len < min_len)
      return fail(err, ErrorCode::StintLengthExceeded,
                  name + ": stint " + std::to_string(i + 1) + " shorter than " +
                  std::to_string(min_len) + " laps");
    if (len > stint_max(it->second, rules))
      return fail(err, ErrorCode::StintLengthExceeded,
                  name + ": stint " + std::to_string(i + 1) + " (" + std::to_string(len) +
                  " laps) exceeds " + code + " max of " +
                  std::to_string(it->second.typical_max_stint_laps));
    if (rules.wet_mode && rules.crossover_lap && !is_wet_tyre(code) && start <= *rules.crossover_lap)
      return fail(err, ErrorCode::StintLengthExceeded,
                  name + ": slick stint starts on lap " + std::to_string(start) +
                  ", before crossover lap " + std::to_string(*rules.crossover_lap));
    start += len;
  }
  return true;
}

StintRules make_stint_rules(const RaceConfig& race,
                            const WeatherState& weather,
                            const EnumeratorOptions& opt) {
  StintRules r;
  r.total_laps = race.total_laps;
  r.min_stint_laps = opt.min_stint_laps;
  r.enforce_stint_limits = opt.enforce_stint_limits;
  r.wet_mode = weather.condition != WeatherCondition::Dry;
  r.crossover_lap = crossover_lap(weather, race.total_laps, opt.crossover);
  r.slicks_allowed = slicks_allowed(weather, opt.crossover);
  r.require_two_slicks = !r.wet_mode && opt.enforce_two_compound_rule;
  return r;
}

// lo, lo+step, ..., always ending on hi.
static std::vector<int> grid_values(int lo, int hi, int step) {
  std::vector<int> v;
  if (lo > hi) return v;
  step = std::max(1, step);
  for (int x = lo; x <= hi; x += step) v.push_back(x);
  if (v.back() != hi) v.push_back(hi);
  return v;
}

namespace {

struct PartitionWalker {
  const std::vector<std::string>& seq;
  const CompoundMap& catalog;
  const StintRules& rules;
  int step;
  std::vector<int> mins, maxs;
  std::vector<CandidateStrategy>& out;

  void walk(std::size_t i, int start, std::vector<int>& cur) {
    const int remaining = rules.total_laps - start + 1;
    if (i + 1 == seq.size()) {
      cur.push_back(remaining);
      CandidateStrategy c{seq, cur};
      if (partition_is_legal(c, catalog, rules)) out.push_back(std::move(c));
      cur.pop_back();
      return;
    }

    int rest_min = 0, rest_max = 0;
    for (std::size_t j = i + 1; j < seq.size(); ++j) {
      rest_min += mins[j];
      rest_max += maxs[j];
    }
    int lo = std::max(mins[i], remaining - rest_max);
    const int hi = std::min(maxs[i], remaining - rest_min);

    // Wet -> slick hand-over may not happen before the crossover lap.
    if (rules.crossover_lap && is_wet_tyre(seq[i]) && !is_wet_tyre(seq[i + 1])) {
      lo = std::max(lo, *rules.crossover_lap - start + 1);
    }

    for (int len : grid_values(lo, hi, step)) {
      cur.push_back(len);
      walk(i + 1, start + len, cur);
      cur.pop_back();
    }
  }
};

} // namespace

static std::vector<CandidateStrategy> grid_partitions(const std::vector<std::string>& seq,
                                                      const CompoundMap& catalog,
                                                      const StintRules& rules,
                                                      int step) {
  std::vector<CandidateStrategy> out;
  PartitionWalker w{seq, catalog, rules, step, {}, {}, out};
  for (const auto& code : seq) {
    auto it = catalog.find(code);
    if (it == catalog.end()) return out;
    w.mins.push_back(effective_min_stint(rules));
    w.maxs.push_back(stint_max(it->second, rules));
  }
  std::vector<int> cur;
  w.walk(0, 1, cur);
  return out;
}

// Odometer over codes^len, in catalogue order.
static bool next_sequence(std::vector<std::size_t>& idx, std::size_t base) {
  for (std::size_t pos = idx.size(); pos-- > 0;) {
    if (++idx[pos] < base) return true;
    idx[pos] = 0;
  }
  return false;
}

static void enumerate_with(const std::vector<std::string>& codes,
                           const std::vector<int>& stop_counts,
                           const CompoundMap& available,
                           const StintRules& rules,
                           int step,
                           EnumerationResult& res) {
  if (codes.empty()) return;
  for (int stops : stop_counts) {
    const std::size_t len = static_cast<std::size_t>(stops) + 1;
    std::vector<std::size_t> idx(len, 0);
    do {
      std::vector<std::string> seq;
      seq.reserve(len);
      for (auto k : idx) seq.push_back(codes[k]);

      if (sequence_is_legal(seq, rules)) {
        auto parts = grid_partitions(seq, available, rules, step);
        if (parts.empty()) {
          res.dropped_shapes.push_back(strategy_name(seq) + ": no legal stint partition over " +
                                       std::to_string(rules.total_laps) + " laps");
        }
        for (auto& p : parts) res.candidates.push_back(std::move(p));
      }
    } while (next_sequence(idx, codes.size()));
  }
}

EnumerationResult enumerate_candidates(const RaceConfig& race,
                                       const CompoundMap& available,
                                       const WeatherState& weather,
                                       const EnumeratorOptions& opt) {
  EnumerationResult res;
  res.rules = make_stint_rules(race, weather, opt);

  std::vector<int> stop_counts;
  for (int s : opt.stop_counts) {
    if (s >= 0 && std::find(stop_counts.begin(), stop_counts.end(), s) == stop_counts.end())
      stop_counts.push_back(s);
  }
  std::sort(stop_counts.begin(), stop_counts.end());

  std::vector<std::string> codes;
  for (const auto& [code, params] : available) {
    if (is_wet_tyre(code)) {
      if (res.rules.wet_mode) codes.push_back(code);
    } else if (!res.rules.wet_mode || res.rules.slicks_allowed) {
      codes.push_back(code);
    }
  }

  enumerate_with(codes, stop_counts, available, res.rules, opt.partition_step_laps, res);

  if (res.rules.require_two_slicks && res.candidates.empty()) {
    res.rules.require_two_slicks = false;
    res.two_compound_rule_relaxed = true;
    res.dropped_shapes.clear();
    enumerate_with(codes, stop_counts, available, res.rules, opt.partition_step_laps, res);
    res.notes.push_back("Two-compound rule relaxed: no legal two-compound split over " +
                        std::to_string(race.total_laps) + " laps");
  }

  if (res.rules.wet_mode) {
    if (!res.rules.slicks_allowed) {
      res.notes.push_back(std::string("Slicks excluded in ") +
                          weather_condition_name(weather.condition) + " conditions");
    } else if (res.rules.crossover_lap) {
      res.notes.push_back("Crossover to slicks modelled after lap " +
                          std::to_string(*res.rules.crossover_lap));
    }
  }
  return res;
}

} // namespace pitstrat
