#include <pitstrat/compound.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>

namespace pitstrat {

TyreCategory tyre_category(const std::string& code) {
  if (code == kIntermediate) return TyreCategory::Intermediate;
  if (code == kFullWet)      return TyreCategory::Wet;
  return TyreCategory::Slick;
}

bool validate_compound(const std::string& code, const CompoundParams& p, Error* err) {
  const std::string who = "compound '" + code + "': ";
  if (!(p.avg_deg_s_per_lap >= 0.0))
    return fail(err, ErrorCode::InvalidCompoundParams, who + "avg_deg_s_per_lap must be >= 0");
  if (p.cliff_onset_lap < 0)
    return fail(err, ErrorCode::InvalidCompoundParams, who + "cliff_onset_lap must be >= 0");
  if (!(p.cliff_rate_s_per_lap2 >= 0.0))
    return fail(err, ErrorCode::InvalidCompoundParams, who + "cliff_rate_s_per_lap2 must be >= 0");
  if (p.typical_max_stint_laps <= 0)
    return fail(err, ErrorCode::InvalidCompoundParams, who + "typical_max_stint_laps must be > 0");
  if (!std::isfinite(p.base_pace_offset))
    return fail(err, ErrorCode::InvalidCompoundParams, who + "base_pace_offset must be finite");
  if (p.temp_multiplier && !(*p.temp_multiplier >= 0.0))
    return fail(err, ErrorCode::InvalidCompoundParams, who + "temp_multiplier must be >= 0");
  return true;
}

std::optional<double> degradation_delta(const CompoundParams& p,
                                        int lap_in_stint,
                                        std::optional<double> track_temp_c) {
  if (lap_in_stint < 0) return std::nullopt;
  if (!validate_compound("", p)) return std::nullopt;

  const double n = static_cast<double>(lap_in_stint);
  double delta = n * p.avg_deg_s_per_lap;
  if (lap_in_stint > p.cliff_onset_lap) {
    const double past = static_cast<double>(lap_in_stint - p.cliff_onset_lap);
    delta += p.cliff_rate_s_per_lap2 * past * past;
  }
  if (track_temp_c.has_value() && p.temp_multiplier.has_value()) {
    delta *= *p.temp_multiplier;
  }
  return delta;
}

double derived_temp_multiplier(const std::string& code, double track_temp_c) {
  const double t = std::max(0.0, track_temp_c);
  const double base = std::pow(t / 25.0, 1.2);

  double sensitivity = 1.0;
  if (code.size() == 2 && (code[0] == 'C' || code[0] == 'c') &&
      std::isdigit(static_cast<unsigned char>(code[1]))) {
    sensitivity = 1.0 + 0.05 * static_cast<double>((code[1] - '0') - 3);
  }
  return std::max(0.5, base * sensitivity);
}

CompoundMap with_derived_temp_multipliers(const CompoundMap& catalog, double track_temp_c) {
  CompoundMap out = catalog;
  for (auto& [code, params] : out) {
    if (!params.temp_multiplier) {
      params.temp_multiplier = derived_temp_multiplier(code, track_temp_c);
    }
  }
  return out;
}

static CompoundMap make_catalog_builtin() {
  // {avg_deg, cliff_onset, cliff_rate, max_stint, pace_offset}
  CompoundMap cat;
  cat["C1"] = {0.030, 35, 0.006, 45, 2.0, std::nullopt};
  cat["C2"] = {0.045, 30, 0.008, 40, 1.3, std::nullopt};
  cat["C3"] = {0.065, 24, 0.012, 32, 0.7, std::nullopt};
  cat["C4"] = {0.095, 18, 0.025, 25, 0.2, std::nullopt};
  cat["C5"] = {0.140, 12, 0.035, 18, 0.0, std::nullopt};
  // Wet tyres are slow but barely wear on standing water.
  cat[kIntermediate] = {0.02, 25, 0.005, 40, 2.0, std::nullopt};
  cat[kFullWet]      = {0.01, 35, 0.003, 50, 5.0, std::nullopt};
  return cat;
}

const CompoundMap& fallback_compound_catalog() {
  static const CompoundMap cat = make_catalog_builtin();
  return cat;
}

std::optional<CompoundParams> compound_by_code(const std::string& code) {
  return compound_by_code_in(fallback_compound_catalog(), code);
}

std::optional<CompoundParams> compound_by_code_in(const CompoundMap& cat, const std::string& code) {
  auto it = cat.find(code);
  if (it == cat.end()) return std::nullopt;
  return it->second;
}

} // namespace pitstrat
