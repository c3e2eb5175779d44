#include <pitstrat/strategy.hpp>
#include <pitstrat/pit.hpp>
#include <algorithm>

namespace pitstrat {

std::vector<std::string> Strategy::compounds() const {
  std::vector<std::string> out;
  out.reserve(stints.size());
  for (const auto& s : stints) out.push_back(s.compound);
  return out;
}

std::optional<int> Strategy::first_pit_lap() const {
  if (pit_stop_laps.empty()) return std::nullopt;
  return pit_stop_laps.front();
}

int Strategy::laps_covered() const {
  int sum = 0;
  for (const auto& s : stints) sum += s.laps;
  return sum;
}

SimulationContext make_simulation_context(const RaceConfig& race,
                                          const WeatherState& weather,
                                          const CompoundMap& catalog,
                                          const StintRules& rules,
                                          const SurfaceParams& surface,
                                          const CrossoverParams& crossover) {
  SimulationContext ctx;
  ctx.race = race;
  ctx.weather = weather;
  ctx.catalog = catalog;
  ctx.rules = rules;
  ctx.surface = make_surface_model(weather, race.total_laps, crossover, surface);
  return ctx;
}

static std::string weather_note_for(const Strategy& s, const SimulationContext& ctx) {
  if (ctx.weather.condition == WeatherCondition::Dry) return {};

  const std::string cond = weather_condition_name(ctx.weather.condition);
  for (const auto& st : s.stints) {
    if (!st.is_wet_tyre) {
      return "Track dries ~lap " + std::to_string(ctx.surface.crossover_lap.value_or(0)) +
             "; slicks from lap " + std::to_string(st.start_lap);
    }
  }
  if (ctx.weather.condition == WeatherCondition::Extreme) {
    return "Extreme rain - wet tyres throughout";
  }
  return "Wet tyres throughout (" + cond + " race)";
}

std::optional<Strategy> simulate_strategy(const CandidateStrategy& c,
                                          const SimulationContext& ctx,
                                          Error* err) {
  if (!partition_is_legal(c, ctx.catalog, ctx.rules, err)) return std::nullopt;

  Strategy out;
  out.name = strategy_name(c.compounds);
  out.stops = c.stops();
  out.stints.reserve(c.compounds.size());

  int start = 1;
  double sum = 0.0;
  for (std::size_t i = 0; i < c.compounds.size(); ++i) {
    const auto& code = c.compounds[i];
    const auto& params = ctx.catalog.at(code);
    auto stint = simulate_stint(code, params, start, c.stint_laps[i], ctx.race, ctx.weather,
                                ctx.surface, err);
    if (!stint) return std::nullopt;
    stint->stint_number = static_cast<int>(i) + 1;
    sum += stint->stint_time_s;
    if (i + 1 < c.compounds.size()) out.pit_stop_laps.push_back(stint->end_lap);
    start = stint->end_lap + 1;
    out.stints.push_back(std::move(*stint));
  }

  const auto pit = pit_loss_cost(ctx.race.pit_loss_seconds, out.stops);
  if (!pit) {
    fail(err, ErrorCode::ConfigError, "pit_loss_seconds must be a non-negative number");
    return std::nullopt;
  }
  out.pit_time_s = *pit;
  out.total_time_s = sum + *pit;
  out.weather_note = weather_note_for(out, ctx);
  return out;
}

// Odometer over [-r, r]^k.
static bool next_offsets(std::vector<int>& off, int r) {
  for (std::size_t pos = off.size(); pos-- > 0;) {
    if (++off[pos] <= r) return true;
    off[pos] = -r;
  }
  return false;
}

std::optional<Strategy> optimise_boundaries(const CandidateStrategy& c,
                                            const SimulationContext& ctx,
                                            int radius,
                                            Error* err) {
  if (c.compounds.size() < 2 || radius <= 0) return simulate_strategy(c, ctx, err);

  // Internal boundaries as the last lap of each non-final stint.
  std::vector<int> bounds;
  int acc = 0;
  for (std::size_t i = 0; i + 1 < c.stint_laps.size(); ++i) {
    acc += c.stint_laps[i];
    bounds.push_back(acc);
  }

  std::optional<Strategy> best;
  Error first_err;
  bool have_err = false;

  std::vector<int> off(bounds.size(), -radius);
  do {
    CandidateStrategy v{c.compounds, {}};
    int prev = 0;
    bool ordered = true;
    for (std::size_t i = 0; i < bounds.size(); ++i) {
      const int b = bounds[i] + off[i];
      if (b <= prev || b >= ctx.rules.total_laps) { ordered = false; break; }
      v.stint_laps.push_back(b - prev);
      prev = b;
    }
    if (!ordered) continue;
    v.stint_laps.push_back(ctx.rules.total_laps - prev);

    Error e;
    auto s = simulate_strategy(v, ctx, &e);
    if (!s) {
      if (!have_err) { first_err = e; have_err = true; }
      continue;
    }
    if (!best || s->total_time_s < best->total_time_s) best = std::move(s);
  } while (next_offsets(off, radius));

  if (!best) {
    if (have_err) {
      fail(err, first_err.code, first_err.reason);
    } else {
      fail(err, ErrorCode::StintLengthExceeded,
           strategy_name(c.compounds) + ": no legal boundary within the search radius");
    }
  }
  return best;
}

} // namespace pitstrat
