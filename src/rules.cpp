#include <pitstrat/rules.hpp>
#include <pitstrat/format.hpp>

namespace pitstrat {

static std::string join_laps(const std::vector<int>& laps) {
  std::string out;
  for (std::size_t i = 0; i < laps.size(); ++i) {
    if (i) out += ", ";
    out += std::to_string(laps[i]);
  }
  return out;
}

static void weather_hits(const RankedResult& r, std::vector<RuleHit>& out) {
  const bool dry = r.weather.condition == WeatherCondition::Dry;
  out.push_back({"Weather", "Condition", weather_condition_name(r.weather.condition),
                 dry ? std::string("Slick tyres only")
                     : "Wet tyres required - rain intensity " +
                           format_fixed(r.weather.rain_intensity * 100.0, 0) + "%"});

  if (r.race.track_temp_c) {
    const double t = *r.race.track_temp_c;
    const char* impact = t > 45.0   ? "High track temp increases degradation"
                         : t < 25.0 ? "Low track temp reduces tyre warm-up"
                                    : "Moderate track temperature";
    out.push_back({"Weather", "Track temperature", format_fixed(t, 1) + "°C", impact});
  }
}

static void strategy_hits(const Strategy& s, const RankedResult& r, std::vector<RuleHit>& out) {
  std::string stops_impact;
  if (s.stops == 0) {
    stops_impact = "No pit stop - full race on one set";
  } else {
    stops_impact = std::to_string(s.stops) + " stop(s) at lap" + (s.stops > 1 ? "s " : " ") +
                   join_laps(s.pit_stop_laps);
  }
  out.push_back({"Strategy", "Pit stops", std::to_string(s.stops), stops_impact});

  std::string time_impact;
  if (s.name == r.recommended) {
    time_impact = "Fastest strategy - wins by " + format_fixed(r.delta_s, 1) + "s";
    if (r.lead_held_by_guard) time_impact += " on race time (lead held by the physics guard)";
  } else if (!r.strategies.empty() && s.effective_score() < r.strategies.front().effective_score()) {
    time_impact = format_signed(s.total_time_s - r.strategies.front().total_time_s, 1) +
                  "s off the optimal on race time (held back by the physics guard)";
  } else {
    const double best = r.strategies.empty() ? s.effective_score() : r.strategies.front().effective_score();
    time_impact = format_signed(s.effective_score() - best, 1) + "s off the optimal";
  }
  out.push_back({"Strategy", "Total race time", format_race_time(s.total_time_s), time_impact});
}

static void stint_hits(const Strategy& s, std::vector<RuleHit>& out) {
  for (const auto& st : s.stints) {
    RuleHit h;
    h.category = "Stint";
    h.rule_name = "S" + std::to_string(st.stint_number) + ": " + st.compound;
    h.observed_value = std::to_string(st.laps) + " laps (L" + std::to_string(st.start_lap) + "-L" +
                       std::to_string(st.end_lap) + ")";
    h.impact = "Avg " + format_fixed(st.avg_lap_time_s, 2) + "s/lap";
    if (st.cliff_laps > 0) {
      h.impact += " - " + std::to_string(st.cliff_laps) + " cliff laps (tyre drop-off)";
    }
    if (st.is_wet_tyre) h.impact += " [wet tyre]";
    out.push_back(std::move(h));
  }
}

std::vector<RuleHit> extract_rule_hits(const Strategy& s, const RankedResult& ranked) {
  std::vector<RuleHit> out;
  weather_hits(ranked, out);
  strategy_hits(s, ranked, out);
  stint_hits(s, out);

  if (!s.weather_note.empty()) {
    out.push_back({"Weather", "Race note", s.weather_note, "Pre-computed by simulation engine"});
  }

  for (const auto& note : s.historical_notes) {
    out.push_back({"Historical", "Pattern", note,
                   s.historical_adjustment_s
                       ? format_signed(*s.historical_adjustment_s, 1) + "s adjustment"
                       : std::string("Advisory")});
  }

  const std::string guard_prefix = s.name + " kept ahead of ";
  for (const auto& g : ranked.guard_notes) {
    if (g.compare(0, guard_prefix.size(), guard_prefix) == 0) {
      out.push_back({"Strategy", "Physics guard", g, "Historical signal did not override race time"});
    }
  }

  for (const auto& a : ranked.advisories) {
    out.push_back({"Strategy", "Engine advisory", a, "Request-level note"});
  }
  return out;
}

} // namespace pitstrat
