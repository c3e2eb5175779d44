#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <pitstrat/compound.hpp>
#include <pitstrat/format.hpp>

using Catch::Approx;
using namespace pitstrat;

static CompoundParams c3_params() {
  // avg_deg, cliff_onset, cliff_rate, max_stint, pace_offset
  return CompoundParams{0.08, 20, 0.01, 25, 0.0, std::nullopt};
}

TEST_CASE("degradation_delta") {
  const auto p = c3_params();

  SECTION("fresh tyre has no wear") {
    REQUIRE(degradation_delta(p, 0, std::nullopt).value() == Approx(0.0));
  }

  SECTION("linear before the cliff") {
    REQUIRE(degradation_delta(p, 10, std::nullopt).value() == Approx(0.8));
    REQUIRE(degradation_delta(p, 20, std::nullopt).value() == Approx(1.6));
  }

  SECTION("quadratic term past the cliff onset") {
    // 25 * 0.08 + 0.01 * 5^2
    REQUIRE(degradation_delta(p, 25, std::nullopt).value() == Approx(2.25));
  }

  SECTION("negative lap index is undefined") {
    REQUIRE_FALSE(degradation_delta(p, -1, std::nullopt).has_value());
  }

  SECTION("invalid params are undefined") {
    auto bad = p;
    bad.avg_deg_s_per_lap = -0.1;
    REQUIRE_FALSE(degradation_delta(bad, 3, std::nullopt).has_value());
  }
}

TEST_CASE("temp_multiplier scales wear only when a track temperature is given") {
  auto p = c3_params();
  p.temp_multiplier = 1.5;
  REQUIRE(degradation_delta(p, 10, std::nullopt).value() == Approx(0.8));
  REQUIRE(degradation_delta(p, 10, 40.0).value() == Approx(1.2));

  SECTION("zero multiplier removes wear") {
    p.temp_multiplier = 0.0;
    REQUIRE(degradation_delta(p, 30, 40.0).value() == Approx(0.0));
  }
}

TEST_CASE("degradation is non-decreasing in lap index for every catalogue compound") {
  for (const auto& [code, params] : fallback_compound_catalog()) {
    for (std::optional<double> temp : {std::optional<double>{}, std::optional<double>{38.0}}) {
      auto p = with_derived_temp_multipliers({{code, params}}, 38.0).at(code);
      double prev = 0.0;
      for (int n = 0; n <= 80; ++n) {
        const double d = degradation_delta(p, n, temp).value();
        INFO(code << " lap " << n);
        REQUIRE(d >= prev);
        prev = d;
      }
    }
  }
}

TEST_CASE("validate_compound") {
  Error err;
  REQUIRE(validate_compound("C3", c3_params(), &err));

  SECTION("negative cliff onset") {
    auto p = c3_params();
    p.cliff_onset_lap = -1;
    REQUIRE_FALSE(validate_compound("C3", p, &err));
    REQUIRE(err.code == ErrorCode::InvalidCompoundParams);
    REQUIRE(err.reason == "compound 'C3': cliff_onset_lap must be >= 0");
  }

  SECTION("negative cliff rate") {
    auto p = c3_params();
    p.cliff_rate_s_per_lap2 = -0.01;
    REQUIRE_FALSE(validate_compound("C3", p, &err));
    REQUIRE(err.code == ErrorCode::InvalidCompoundParams);
  }

  SECTION("max stint must be positive") {
    auto p = c3_params();
    p.typical_max_stint_laps = 0;
    REQUIRE_FALSE(validate_compound("C3", p, &err));
    REQUIRE(err.code == ErrorCode::InvalidCompoundParams);
  }

  SECTION("negative temp multiplier") {
    auto p = c3_params();
    p.temp_multiplier = -0.5;
    REQUIRE_FALSE(validate_compound("C3", p, &err));
    REQUIRE(err.code == ErrorCode::InvalidCompoundParams);
  }
}

TEST_CASE("tyre categories") {
  REQUIRE(tyre_category("C3") == TyreCategory::Slick);
  REQUIRE(tyre_category("INTERMEDIATE") == TyreCategory::Intermediate);
  REQUIRE(tyre_category("WET") == TyreCategory::Wet);
  REQUIRE(is_wet_tyre(kIntermediate));
  REQUIRE_FALSE(is_wet_tyre("C1"));
}

TEST_CASE("derived_temp_multiplier") {
  REQUIRE(derived_temp_multiplier("C3", 25.0) == Approx(1.0));
  REQUIRE(derived_temp_multiplier("C5", 25.0) == Approx(1.1));
  REQUIRE(derived_temp_multiplier("C1", 25.0) == Approx(0.9));
  REQUIRE(derived_temp_multiplier("INTERMEDIATE", 25.0) == Approx(1.0));
  SECTION("hotter track wears faster") {
    REQUIRE(derived_temp_multiplier("C3", 45.0) > derived_temp_multiplier("C3", 30.0));
  }
  SECTION("cold track floors at 0.5") {
    REQUIRE(derived_temp_multiplier("C1", 5.0) == Approx(0.5));
  }

  SECTION("explicit multipliers are kept") {
    CompoundMap cat{{"C3", c3_params()}, {"C4", c3_params()}};
    cat["C4"].temp_multiplier = 2.0;
    auto out = with_derived_temp_multipliers(cat, 25.0);
    REQUIRE(out.at("C3").temp_multiplier.value() == Approx(1.0));
    REQUIRE(out.at("C4").temp_multiplier.value() == Approx(2.0));
  }
}

TEST_CASE("fallback catalogue lookups") {
  REQUIRE(fallback_compound_catalog().size() == 7);
  auto inter = compound_by_code(kIntermediate);
  REQUIRE(inter.has_value());
  REQUIRE(inter->base_pace_offset == Approx(2.0));
  REQUIRE(compound_by_code("WET")->typical_max_stint_laps == 50);
  REQUIRE_FALSE(compound_by_code("C9").has_value());

  for (const auto& [code, params] : fallback_compound_catalog()) {
    INFO(code);
    REQUIRE(validate_compound(code, params));
  }
}

TEST_CASE("format helpers") {
  REQUIRE(format_race_time(5300.25) == "1:28:20.250");
  REQUIRE(format_race_time(59.9996) == "0:01:00.000");
  REQUIRE(format_race_time(-1.0) == "--");
  REQUIRE(format_fixed(90.1234, 2) == "90.12");
  REQUIRE(format_fixed(-0.01, 1) == "0.0");
  REQUIRE(format_signed(1.5) == "+1.5");
  REQUIRE(format_signed(-0.3) == "-0.3");
  REQUIRE(format_signed(0.0) == "0.0");
}
