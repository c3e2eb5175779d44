#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <pitstrat/weather.hpp>

using Catch::Approx;
using namespace pitstrat;

TEST_CASE("weather condition names round-trip case-insensitively") {
  REQUIRE(weather_condition_from_string("Wet").value() == WeatherCondition::Wet);
  REQUIRE(weather_condition_from_string("EXTREME").value() == WeatherCondition::Extreme);
  REQUIRE(weather_condition_from_string("damp").value() == WeatherCondition::Damp);
  REQUIRE_FALSE(weather_condition_from_string("drizzle").has_value());
  REQUIRE(std::string(weather_condition_name(WeatherCondition::Dry)) == "dry");
}

TEST_CASE("validate_weather rejects intensity outside [0, 1]") {
  Error err;
  REQUIRE(validate_weather(WeatherState{WeatherCondition::Wet, 1.0}));
  REQUIRE_FALSE(validate_weather(WeatherState{WeatherCondition::Wet, 1.2}, &err));
  REQUIRE(err.code == ErrorCode::ConfigError);
  REQUIRE_FALSE(validate_weather(WeatherState{WeatherCondition::Damp, -0.1}));
}

TEST_CASE("crossover_lap") {
  const CrossoverParams p;

  SECTION("none in dry") {
    REQUIRE_FALSE(crossover_lap({WeatherCondition::Dry, 0.0}, 58, p).has_value());
  }

  SECTION("scales with intensity and condition") {
    // 58 * 0.6 * 0.7 = 24.36
    REQUIRE(crossover_lap({WeatherCondition::Wet, 0.6}, 58, p).value() == 24);
    // 50 * 0.5 * 0.5 = 12.5
    REQUIRE(crossover_lap({WeatherCondition::Damp, 0.5}, 50, p).value() == 12);
    // 50 * 0.5 * 0.8 = 20 exactly
    REQUIRE(crossover_lap({WeatherCondition::Extreme, 0.5}, 50, p).value() == 20);
  }

  SECTION("higher intensity never crosses over earlier") {
    int prev = 0;
    for (int i = 0; i <= 10; ++i) {
      const int lap = crossover_lap({WeatherCondition::Wet, i / 10.0}, 60, p).value();
      REQUIRE(lap >= prev);
      prev = lap;
    }
  }

  SECTION("clamped to the opening and closing windows") {
    REQUIRE(crossover_lap({WeatherCondition::Wet, 0.1}, 50, p).value() == 5);
    REQUIRE(crossover_lap({WeatherCondition::Extreme, 1.0}, 20, p).value() == 15);
  }
}

TEST_CASE("slicks_allowed") {
  CrossoverParams p;
  REQUIRE(slicks_allowed({WeatherCondition::Wet, 0.8}, p));
  REQUIRE_FALSE(slicks_allowed({WeatherCondition::Extreme, 0.9}, p));
  p.extreme_allows_slicks = true;
  REQUIRE(slicks_allowed({WeatherCondition::Extreme, 0.9}, p));
}

TEST_CASE("condition_pace_multiplier") {
  const SurfaceParams p;
  REQUIRE(condition_pace_multiplier(WeatherCondition::Dry, p) == Approx(1.0));
  REQUIRE(condition_pace_multiplier(WeatherCondition::Damp, p) == Approx(1.06));
  REQUIRE(condition_pace_multiplier(WeatherCondition::Wet, p) == Approx(1.15));
  REQUIRE(condition_pace_multiplier(WeatherCondition::Extreme, p) == Approx(1.35));
}

TEST_CASE("surface_penalty_s") {
  const SurfaceParams p;
  const std::optional<int> xover = 24;

  SECTION("dry race: slicks free, wet tyres overheat from lap one") {
    const WeatherState dry{WeatherCondition::Dry, 0.0};
    REQUIRE(surface_penalty_s(TyreCategory::Slick, 10, dry, std::nullopt, p) == Approx(0.0));
    REQUIRE(surface_penalty_s(TyreCategory::Intermediate, 10, dry, std::nullopt, p) == Approx(2.0));
    REQUIRE(surface_penalty_s(TyreCategory::Wet, 10, dry, std::nullopt, p) == Approx(10.0));
  }

  SECTION("standing water punishes slicks") {
    const WeatherState wet{WeatherCondition::Wet, 0.6};
    REQUIRE(surface_penalty_s(TyreCategory::Slick, 10, wet, xover, p) == Approx(12.8));
    REQUIRE(surface_penalty_s(TyreCategory::Intermediate, 10, wet, xover, p) == Approx(0.0));
    REQUIRE(surface_penalty_s(TyreCategory::Wet, 10, wet, xover, p) == Approx(0.0));
  }

  SECTION("tyre suitability mismatch before crossover") {
    REQUIRE(surface_penalty_s(TyreCategory::Intermediate, 10, {WeatherCondition::Wet, 0.9}, xover, p) ==
            Approx(1.2));
    REQUIRE(surface_penalty_s(TyreCategory::Wet, 10, {WeatherCondition::Damp, 0.3}, xover, p) ==
            Approx(1.2));
  }

  SECTION("crossover lap itself is still wet") {
    const WeatherState wet{WeatherCondition::Wet, 0.6};
    REQUIRE(surface_penalty_s(TyreCategory::Slick, 24, wet, xover, p) == Approx(12.8));
    REQUIRE(surface_penalty_s(TyreCategory::Slick, 25, wet, xover, p) == Approx(0.0));
  }

  SECTION("wet tyres overheat progressively on a drying track") {
    const WeatherState wet{WeatherCondition::Wet, 0.6};
    REQUIRE(surface_penalty_s(TyreCategory::Intermediate, 30, wet, xover, p) == Approx(1.2));
    REQUIRE(surface_penalty_s(TyreCategory::Wet, 30, wet, xover, p) == Approx(6.0));
  }
}
