#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <pitstrat/strategy.hpp>

using Catch::Approx;
using namespace pitstrat;

namespace {

CompoundMap scenario_a_catalog() {
  CompoundMap cat;
  cat["C3"] = {0.08, 20, 0.01, 25, 0.0, std::nullopt};
  cat["C4"] = {0.12, 15, 0.02, 20, 0.0, std::nullopt};
  return cat;
}

SimulationContext scenario_a_context(bool enforce_limits) {
  RaceConfig race;
  race.total_laps = 58;
  race.pit_loss_seconds = 22.0;
  race.base_lap_time_s = 90.0;
  const WeatherState dry{WeatherCondition::Dry, 0.0};

  EnumeratorOptions eopt;
  eopt.enforce_stint_limits = enforce_limits;
  const auto rules = make_stint_rules(race, dry, eopt);
  return make_simulation_context(race, dry, scenario_a_catalog(), rules, SurfaceParams{}, CrossoverParams{});
}

} // namespace

TEST_CASE("Scenario A: 1-stop C4 -> C3 total matches the hand calculation") {
  const auto ctx = scenario_a_context(false);
  // C4, 20 laps: 1800 + 0.12 * 190 + 0.02 * (1 + 4 + 9 + 16)        = 1823.40
  // C3, 38 laps: 3420 + 0.08 * 703 + 0.01 * (1^2 + ... + 17^2 = 1785) = 3494.09
  // pit: 22
  auto s = simulate_strategy({{"C4", "C3"}, {20, 38}}, ctx);
  REQUIRE(s.has_value());
  REQUIRE(s->name == "1-Stop: C4 -> C3");
  REQUIRE(s->stops == 1);
  REQUIRE(s->pit_time_s == Approx(22.0));
  REQUIRE(s->stints[0].stint_time_s == Approx(1823.4));
  REQUIRE(s->stints[1].stint_time_s == Approx(3494.09));
  REQUIRE(s->total_time_s == Approx(5339.49));
  REQUIRE(s->pit_stop_laps == std::vector<int>{20});
  REQUIRE(s->first_pit_lap().value() == 20);
  REQUIRE(s->laps_covered() == 58);
  REQUIRE(s->stints[1].start_lap == 21);
  REQUIRE(s->stints[1].cliff_laps == 17);
  REQUIRE(s->weather_note.empty());
  REQUIRE_FALSE(s->historical_adjustment_s.has_value());
  REQUIRE(s->effective_score() == Approx(s->total_time_s));
}

TEST_CASE("simulate_strategy honours stint limits") {
  const auto ctx = scenario_a_context(true);
  Error err;
  REQUIRE_FALSE(simulate_strategy({{"C4", "C3"}, {20, 38}}, ctx, &err).has_value());
  REQUIRE(err.code == ErrorCode::StintLengthExceeded);
}

TEST_CASE("a 0-stop has no pit time and no pit laps") {
  const auto ctx = scenario_a_context(false);
  auto s = simulate_strategy({{"C3"}, {58}}, ctx);
  // Two-compound rule is on in this context.
  REQUIRE_FALSE(s.has_value());

  auto relaxed = ctx;
  relaxed.rules.require_two_slicks = false;
  s = simulate_strategy({{"C3"}, {58}}, relaxed);
  REQUIRE(s.has_value());
  REQUIRE(s->stops == 0);
  REQUIRE(s->pit_time_s == Approx(0.0));
  REQUIRE(s->pit_stop_laps.empty());
  REQUIRE_FALSE(s->first_pit_lap().has_value());
}

TEST_CASE("optimise_boundaries") {
  const auto ctx = scenario_a_context(false);
  const CandidateStrategy coarse{{"C4", "C3"}, {20, 38}};
  const auto base = simulate_strategy(coarse, ctx).value();

  SECTION("never worse than the coarse shape") {
    auto best = optimise_boundaries(coarse, ctx, 2);
    REQUIRE(best.has_value());
    REQUIRE(best->total_time_s <= base.total_time_s);
    REQUIRE(best->laps_covered() == 58);
    const int pit = best->first_pit_lap().value();
    REQUIRE(pit >= 18);
    REQUIRE(pit <= 22);
  }

  SECTION("picks the minimum of the neighbourhood") {
    auto best = optimise_boundaries(coarse, ctx, 2).value();
    for (int b = 18; b <= 22; ++b) {
      auto v = simulate_strategy({{"C4", "C3"}, {b, 58 - b}}, ctx).value();
      REQUIRE(best.total_time_s <= v.total_time_s);
    }
  }

  SECTION("radius 0 is the shape itself") {
    auto same = optimise_boundaries(coarse, ctx, 0).value();
    REQUIRE(same.total_time_s == base.total_time_s);
    REQUIRE(same.pit_stop_laps == base.pit_stop_laps);
  }

  SECTION("two boundaries move independently") {
    const CandidateStrategy two{{"C4", "C3", "C4"}, {15, 25, 18}};
    auto best = optimise_boundaries(two, ctx, 2).value();
    REQUIRE(best.stops == 2);
    REQUIRE(best.laps_covered() == 58);
    REQUIRE(best.total_time_s <= simulate_strategy(two, ctx).value().total_time_s);
  }

  SECTION("no legal neighbour reports the first failure") {
    const auto strict = scenario_a_context(true);
    Error err;
    REQUIRE_FALSE(optimise_boundaries(coarse, strict, 2, &err).has_value());
    REQUIRE(err.code == ErrorCode::StintLengthExceeded);
  }
}

TEST_CASE("wet strategies carry a weather note") {
  RaceConfig race;
  race.total_laps = 58;
  race.pit_loss_seconds = 22.0;
  const WeatherState wet{WeatherCondition::Wet, 0.6};
  auto cat = scenario_a_catalog();
  cat["INTERMEDIATE"] = {0.02, 25, 0.005, 40, 2.0, std::nullopt};

  const auto rules = make_stint_rules(race, wet, EnumeratorOptions{});
  const auto ctx = make_simulation_context(race, wet, cat, rules, SurfaceParams{}, CrossoverParams{});

  auto s = simulate_strategy({{"INTERMEDIATE", "C3"}, {35, 23}}, ctx);
  REQUIRE(s.has_value());
  REQUIRE(s->weather_note == "Track dries ~lap 24; slicks from lap 36");
  REQUIRE(s->stints[0].is_wet_tyre);

  SECTION("slicks before the crossover are illegal") {
    Error err;
    REQUIRE_FALSE(simulate_strategy({{"INTERMEDIATE", "C3", "C3"}, {20, 19, 19}}, ctx, &err).has_value());
    REQUIRE(err.code == ErrorCode::StintLengthExceeded);
  }
}
