#include <pitstrat/planner.hpp>
#include <pitstrat/log.hpp>
#include <algorithm>
#include <climits>
#include <map>
#include <thread>

namespace pitstrat {

EnumeratorOptions enumerator_options(const EngineOptions& opt) {
  EnumeratorOptions e;
  e.stop_counts = opt.stop_counts;
  e.partition_step_laps = opt.partition_step_laps;
  e.min_stint_laps = opt.min_stint_laps;
  e.enforce_two_compound_rule = opt.enforce_two_compound_rule;
  e.enforce_stint_limits = opt.enforce_stint_limits;
  e.crossover = opt.crossover;
  return e;
}

bool resolve_compounds(const PlanRequest& req,
                       const EngineOptions& opt,
                       CompoundMap* out,
                       std::vector<std::string>* advisories,
                       Error* err) {
  CompoundMap cat;
  for (const auto& [code, params] : req.compounds) {
    if (code.empty()) return fail(err, ErrorCode::ConfigError, "compound code must not be empty");
    if (!validate_compound(code, params, err)) return false;
    cat[code] = params;
  }

  const bool dry = req.weather.condition == WeatherCondition::Dry;
  const bool any_slick = std::any_of(cat.begin(), cat.end(),
                                     [](const auto& kv) { return !is_wet_tyre(kv.first); });
  if (dry && !any_slick) {
    return fail(err, ErrorCode::InsufficientCompoundData,
                "dry race needs parameters for at least one slick compound");
  }

  if (!dry) {
    const bool has_inter = cat.count(kIntermediate) > 0;
    const bool has_wet = cat.count(kFullWet) > 0;
    const bool extreme = req.weather.condition == WeatherCondition::Extreme;
    if (opt.missing_compound_policy == MissingCompoundPolicy::Fail) {
      // Full wets are mandatory in extreme rain.
      if (extreme && !has_wet) {
        return fail(err, ErrorCode::InsufficientCompoundData, "extreme race needs WET parameters");
      }
      if (!has_inter && !has_wet) {
        return fail(err, ErrorCode::InsufficientCompoundData,
                    std::string(weather_condition_name(req.weather.condition)) +
                        " race needs INTERMEDIATE or WET parameters");
      }
    } else {
      for (const char* code : {kIntermediate, kFullWet}) {
        if (cat.count(code)) continue;
        cat[code] = *compound_by_code(code);
        const std::string note = std::string(code) + " parameters not supplied; using generic fallback";
        log_message(LogLevel::Warn, "%s", note.c_str());
        if (advisories) advisories->push_back(note);
      }
    }
  }

  if (opt.derive_temp_multipliers && req.race.track_temp_c) {
    cat = with_derived_temp_multipliers(cat, *req.race.track_temp_c);
  }

  *out = std::move(cat);
  return true;
}

std::vector<std::optional<Strategy>> evaluate_candidates(const std::vector<CandidateStrategy>& candidates,
                                                         const SimulationContext& ctx,
                                                         int radius,
                                                         unsigned worker_threads,
                                                         std::vector<Error>* errors) {
  const std::size_t n = candidates.size();
  std::vector<std::optional<Strategy>> out(n);
  std::vector<Error> errs(n);

  // Static striding: slot i is only ever written by worker i % stride.
  auto work = [&](std::size_t first, std::size_t stride) {
    for (std::size_t i = first; i < n; i += stride) {
      out[i] = optimise_boundaries(candidates[i], ctx, radius, &errs[i]);
    }
  };

  unsigned threads = worker_threads;
  if (threads == 0) threads = std::max(1u, std::thread::hardware_concurrency());
  threads = static_cast<unsigned>(std::min<std::size_t>(threads, std::max<std::size_t>(n, 1)));

  if (threads <= 1) {
    work(0, 1);
  } else {
    std::vector<std::thread> pool;
    pool.reserve(threads);
    for (unsigned t = 0; t < threads; ++t) pool.emplace_back(work, t, threads);
    for (auto& th : pool) th.join();
  }

  if (errors) *errors = std::move(errs);
  return out;
}

std::vector<Strategy> best_per_sequence(std::vector<Strategy> strategies) {
  std::map<std::string, Strategy> best;
  for (auto& s : strategies) {
    auto it = best.find(s.name);
    if (it == best.end()) {
      best.emplace(s.name, std::move(s));
      continue;
    }
    const Strategy& cur = it->second;
    const bool faster = s.total_time_s < cur.total_time_s;
    const bool tie_earlier = s.total_time_s == cur.total_time_s &&
                             s.first_pit_lap().value_or(INT_MAX) < cur.first_pit_lap().value_or(INT_MAX);
    if (faster || tie_earlier) it->second = std::move(s);
  }

  std::vector<Strategy> out;
  out.reserve(best.size());
  for (auto& [name, s] : best) out.push_back(std::move(s));
  return out;
}

static CandidateStrategy candidate_from_strategy(const Strategy& s) {
  CandidateStrategy c;
  for (const auto& st : s.stints) {
    c.compounds.push_back(st.compound);
    c.stint_laps.push_back(st.laps);
  }
  return c;
}

static std::string no_legal_reason(const RaceConfig& race, const std::vector<std::string>& dropped) {
  std::string reason = "no legal strategy covers " + std::to_string(race.total_laps) + " laps";
  if (!dropped.empty()) {
    reason += " (" + std::to_string(dropped.size()) + " shape(s) rejected, first: " + dropped.front() + ")";
  }
  return reason;
}

PlanResult plan_strategies(const PlanRequest& req, const EngineOptions& opt) {
  PlanResult res;
  Error err;

  if (!validate_race_config(req.race, &err) || !validate_weather(req.weather, &err)) {
    res.error = err;
    return res;
  }
  if (opt.boundary_search_radius < 0 || opt.partition_step_laps <= 0 || opt.min_stint_laps <= 0) {
    res.error = Error{ErrorCode::ConfigError,
                      "search radius must be >= 0, partition step and minimum stint must be > 0"};
    return res;
  }

  CompoundMap catalog;
  std::vector<std::string> advisories;
  if (!resolve_compounds(req, opt, &catalog, &advisories, &err)) {
    res.error = err;
    return res;
  }

  const auto eopt = enumerator_options(opt);
  auto enumerated = enumerate_candidates(req.race, catalog, req.weather, eopt);
  for (const auto& n : enumerated.notes) advisories.push_back(n);
  res.dropped_shapes = enumerated.dropped_shapes;
  log_message(LogLevel::Debug, "%zu candidate(s), %zu shape(s) without a legal partition",
              enumerated.candidates.size(), enumerated.dropped_shapes.size());
  for (const auto& d : enumerated.dropped_shapes) {
    log_message(LogLevel::Debug, "dropped %s", d.c_str());
  }

  const auto ctx = make_simulation_context(req.race, req.weather, catalog, enumerated.rules,
                                           opt.surface, opt.crossover);

  // Coarse pass: every grid point as given, then one shape per sequence.
  std::vector<Error> errors;
  auto coarse = evaluate_candidates(enumerated.candidates, ctx, 0, opt.worker_threads, &errors);
  res.grid_points_evaluated = coarse.size();

  std::vector<Strategy> simulated;
  for (std::size_t i = 0; i < coarse.size(); ++i) {
    if (coarse[i]) {
      simulated.push_back(std::move(*coarse[i]));
    } else {
      res.dropped_shapes.push_back(errors[i].reason);
      log_message(LogLevel::Debug, "grid point dropped: %s", describe(errors[i]).c_str());
    }
  }

  auto seeds = best_per_sequence(std::move(simulated));
  if (seeds.empty()) {
    res.error = Error{ErrorCode::NoLegalStrategy, no_legal_reason(req.race, res.dropped_shapes)};
    return res;
  }

  // Refinement: boundary search around the best grid point of each sequence.
  std::vector<CandidateStrategy> survivors;
  survivors.reserve(seeds.size());
  for (const auto& s : seeds) survivors.push_back(candidate_from_strategy(s));
  auto refined = evaluate_candidates(survivors, ctx, opt.boundary_search_radius, opt.worker_threads, &errors);
  res.candidates_evaluated = refined.size();
  log_message(LogLevel::Debug, "%zu grid point(s) reduced to %zu sequence(s) for boundary search",
              res.grid_points_evaluated, res.candidates_evaluated);

  std::vector<Strategy> unique;
  unique.reserve(refined.size());
  for (std::size_t i = 0; i < refined.size(); ++i) {
    // The seed itself is inside the search window, so a refined result always exists.
    unique.push_back(refined[i] ? std::move(*refined[i]) : std::move(seeds[i]));
  }

  for (auto& s : unique) s = apply_historical_adjustment(s, req.history, opt.historical);

  RankOptions ropt;
  ropt.physics_guard_s = opt.historical.cap_s;
  ropt.max_per_stop_count = opt.max_strategies_per_stop_count;
  auto ranked = rank_strategies(std::move(unique), ropt);
  ranked.race = req.race;
  ranked.weather = req.weather;
  ranked.advisories = std::move(advisories);

  log_message(LogLevel::Info, "recommended %s (delta %.3fs, %zu strategies)",
              ranked.recommended.c_str(), ranked.delta_s, ranked.strategies.size());

  if (opt.extract_rule_hits) {
    res.rule_hits.reserve(ranked.strategies.size());
    for (const auto& s : ranked.strategies) res.rule_hits.push_back(extract_rule_hits(s, ranked));
  }
  res.ranked = std::move(ranked);
  return res;
}

} // namespace pitstrat
