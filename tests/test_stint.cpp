#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <pitstrat/stint.hpp>

using namespace pitstrat;
using Catch::Approx;

static RaceConfig race58() {
  RaceConfig r;
  r.total_laps = 58;
  r.pit_loss_seconds = 22.0;
  r.base_lap_time_s = 90.0;
  return r;
}

static const WeatherState kDry{WeatherCondition::Dry, 0.0};

TEST_CASE("simulate_stint") {
  const auto race = race58();
  const auto surface = make_surface_model(kDry, race.total_laps, CrossoverParams{}, SurfaceParams{});
  const CompoundParams c4{0.12, 15, 0.02, 20, 0.0, std::nullopt};

  SECTION("sums lap times with linear and cliff wear") {
    // 20 * 90 + 0.12 * (0 + ... + 19) + 0.02 * (1 + 4 + 9 + 16) = 1800 + 22.8 + 0.6
    auto s = simulate_stint("C4", c4, 1, 20, race, kDry, surface);
    REQUIRE(s.has_value());
    REQUIRE(s->stint_time_s == Approx(1823.4));
    REQUIRE(s->avg_lap_time_s == Approx(91.17));
    REQUIRE(s->cliff_laps == 4);
    REQUIRE(s->start_lap == 1);
    REQUIRE(s->end_lap == 20);
    REQUIRE(s->laps == 20);
    REQUIRE(s->lap_times_s.size() == 20);
    REQUIRE(s->lap_times_s.front() == Approx(90.0));
    REQUIRE(s->final_lap_time_s == Approx(90.0 + 19 * 0.12 + 0.02 * 16));
    REQUIRE_FALSE(s->is_wet_tyre);
  }

  SECTION("pace offset is added to every lap") {
    auto slow = c4;
    slow.base_pace_offset = 0.5;
    auto a = simulate_stint("C4", c4, 1, 10, race, kDry, surface);
    auto b = simulate_stint("C4", slow, 1, 10, race, kDry, surface);
    REQUIRE(b->stint_time_s - a->stint_time_s == Approx(5.0));
  }

  SECTION("empty stint is a config error") {
    Error err;
    REQUIRE_FALSE(simulate_stint("C4", c4, 1, 0, race, kDry, surface, &err).has_value());
    REQUIRE(err.code == ErrorCode::ConfigError);
  }

  SECTION("invalid params propagate") {
    auto bad = c4;
    bad.cliff_onset_lap = -2;
    Error err;
    REQUIRE_FALSE(simulate_stint("C4", bad, 1, 10, race, kDry, surface, &err).has_value());
    REQUIRE(err.code == ErrorCode::InvalidCompoundParams);
  }
}

TEST_CASE("stint_lap_time in the wet") {
  const auto race = race58();
  const WeatherState wet{WeatherCondition::Wet, 0.6};
  const auto surface = make_surface_model(wet, race.total_laps, CrossoverParams{}, SurfaceParams{});
  REQUIRE(surface.crossover_lap.value() == 24);

  const CompoundParams inter{0.02, 25, 0.005, 40, 2.0, std::nullopt};
  const CompoundParams slick{0.0, 30, 0.0, 40, 0.0, std::nullopt};

  SECTION("condition multiplier applies to the base lap only") {
    // 90 * 1.15 + 2.0 + wear(0) + no mismatch at 0.6
    REQUIRE(stint_lap_time("INTERMEDIATE", inter, 0, 1, race, wet, surface).value() == Approx(105.5));
  }

  SECTION("slicks aquaplane until the crossover") {
    const double early = stint_lap_time("C3", slick, 0, 10, race, wet, surface).value();
    const double late = stint_lap_time("C3", slick, 0, 25, race, wet, surface).value();
    REQUIRE(early == Approx(103.5 + 12.8));
    REQUIRE(late == Approx(103.5));
  }

  SECTION("wet stint flags the tyre") {
    auto s = simulate_stint("INTERMEDIATE", inter, 1, 24, race, wet, surface);
    REQUIRE(s.has_value());
    REQUIRE(s->is_wet_tyre);
    REQUIRE(s->cliff_laps == 0);
  }
}
