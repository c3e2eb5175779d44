#include <pitstrat/historical.hpp>
#include <pitstrat/format.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>

namespace pitstrat {

static inline std::string upper(std::string s) {
  for (auto& c : s) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  return s;
}

static std::string join_arrow(const std::vector<std::string>& v) {
  std::string out;
  for (std::size_t i = 0; i < v.size(); ++i) {
    if (i) out += " -> ";
    out += v[i];
  }
  return out;
}

static std::string pct(double v) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.0f%%", v);
  return buf;
}

static std::string lap_label(double lap) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "L%.0f", lap);
  return buf;
}

static std::pair<double, std::string> score_first_stop(int actual, const FirstStopLapStats& fs,
                                                       const HistoricalWeights& w) {
  const std::string window = lap_label(fs.p25) + "-" + lap_label(fs.p75);
  const double lap = static_cast<double>(actual);
  if (lap >= fs.p25 && lap <= fs.p75) {
    return {0.0, "First stop L" + std::to_string(actual) + " within historical window (" + window +
                     ", median " + lap_label(fs.median) + ", n=" + std::to_string(fs.n) + ")"};
  }
  const double distance = std::max({fs.p25 - lap, lap - fs.p75, 0.0});
  const double penalty = std::min(distance * w.first_stop_penalty_per_lap, w.first_stop_max_penalty_s);
  return {penalty, "First stop L" + std::to_string(actual) + " is " + format_fixed(distance, 0) +
                       " laps outside historical IQR (" + window + "), " +
                       format_signed(penalty, 1) + "s penalty"};
}

static bool same_sequence(const std::vector<std::string>& a, const std::vector<std::string>& b) {
  if (a.size() != b.size()) return false;
  for (std::size_t i = 0; i < a.size(); ++i) {
    if (upper(a[i]) != upper(b[i])) return false;
  }
  return true;
}

static bool same_multiset(std::vector<std::string> a, std::vector<std::string> b) {
  if (a.size() != b.size()) return false;
  for (auto& s : a) s = upper(s);
  for (auto& s : b) s = upper(s);
  std::sort(a.begin(), a.end());
  std::sort(b.begin(), b.end());
  return a == b;
}

static std::pair<double, std::string> score_sequence(const std::vector<std::string>& compounds,
                                                     const HistoricalProfile& prof,
                                                     const HistoricalWeights& w) {
  std::vector<std::string> roles = compounds;
  for (auto& c : roles) {
    auto it = prof.compound_roles.find(c);
    if (it != prof.compound_roles.end()) c = it->second;
  }

  for (const auto& info : prof.common_sequences) {
    const double freq = info.frequency_pct / 100.0;
    if (same_sequence(roles, info.sequence)) {
      return {-w.sequence_match_bonus_s * freq,
              "Matches historical sequence " + join_arrow(info.sequence) + " (" +
                  pct(info.frequency_pct) + " of races)"};
    }
    if (same_multiset(roles, info.sequence)) {
      return {-w.sequence_match_bonus_s * w.partial_match_factor * freq,
              "Partially matches historical " + join_arrow(info.sequence) + " (" +
                  pct(info.frequency_pct) + ")"};
    }
  }
  return {0.0, {}};
}

static std::pair<double, std::string> score_stop_count(int stops, const StopCountDistribution& d,
                                                       const HistoricalWeights& w) {
  // Ties go to one stop, the way the share table is ordered.
  const int dominant = d.two_stop_pct > d.one_stop_pct ? 2 : 1;
  const double share = dominant == 1 ? d.one_stop_pct : d.two_stop_pct;
  if (stops == dominant && share > w.dominant_share_pct) {
    return {-w.stop_count_bonus_s * (share / 100.0),
            std::to_string(stops) + "-stop matches dominant historical pattern (" + pct(share) +
                " of drivers)"};
  }
  return {0.0, {}};
}

static std::pair<double, std::string> score_pit_timing_dependency(int actual,
                                                                  const FirstStopLapStats& fs,
                                                                  const UndercutOvercutStats& uo,
                                                                  const HistoricalWeights& w) {
  const double lap = static_cast<double>(actual);
  if (lap < fs.p25 && uo.undercut_attempts > 0) {
    return {(0.5 - uo.undercut_success_rate) * w.undercut_weight_s,
            "Early first stop relies on the undercut: historical success " +
                pct(uo.undercut_success_rate * 100.0) + " over " +
                std::to_string(uo.undercut_attempts) + " attempts"};
  }
  if (lap > fs.p75 && uo.overcut_attempts > 0) {
    return {(0.5 - uo.overcut_success_rate) * w.undercut_weight_s,
            "Late first stop relies on the overcut: historical success " +
                pct(uo.overcut_success_rate * 100.0) + " over " +
                std::to_string(uo.overcut_attempts) + " attempts"};
  }
  return {0.0, {}};
}

HistoricalAdjustment historical_adjustment(const Strategy& s,
                                           const std::optional<HistoricalProfile>& profile,
                                           const HistoricalWeights& w) {
  HistoricalAdjustment out;
  if (!profile || w.master_weight == 0.0) return out;

  double raw = 0.0;
  auto take = [&](const std::pair<double, std::string>& r) {
    raw += r.first;
    if (!r.second.empty()) out.notes.push_back(r.second);
  };

  const auto first = s.first_pit_lap();
  if (first && profile->first_stop_lap) {
    take(score_first_stop(*first, *profile->first_stop_lap, w));
    if (profile->undercut_overcut) {
      take(score_pit_timing_dependency(*first, *profile->first_stop_lap,
                                       *profile->undercut_overcut, w));
    }
  }
  if (!profile->common_sequences.empty()) {
    take(score_sequence(s.compounds(), *profile, w));
  }
  if (profile->stop_count_distribution) {
    take(score_stop_count(s.stops, *profile->stop_count_distribution, w));
  }

  const double weighted = raw * w.master_weight;
  const double cap = std::max(0.0, w.cap_s);
  double adj = std::clamp(weighted, -cap, cap);
  if (adj != weighted) {
    out.notes.push_back("Historical adjustment capped at " + format_fixed(cap, 1) + "s (raw " +
                        format_signed(weighted, 1) + "s)");
  }
  adj = std::round(adj * 1000.0) / 1000.0;
  if (adj == 0.0) adj = 0.0; // drop a negative zero
  out.adjustment_s = adj;
  return out;
}

Strategy apply_historical_adjustment(const Strategy& s,
                                     const std::optional<HistoricalProfile>& profile,
                                     const HistoricalWeights& w) {
  Strategy out = s;
  if (!profile) return out;
  auto adj = historical_adjustment(s, profile, w);
  out.historical_adjustment_s = adj.adjustment_s;
  out.historical_notes = std::move(adj.notes);
  return out;
}

} // namespace pitstrat
