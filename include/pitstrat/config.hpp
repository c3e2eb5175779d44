#pragma once
#include <istream>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <pitstrat/compound.hpp>
#include <pitstrat/errors.hpp>
#include <pitstrat/historical.hpp>
#include <pitstrat/planner.hpp>
#include <pitstrat/race.hpp>
#include <pitstrat/weather.hpp>

namespace pitstrat {

// Compound catalogue CSV:
//   code,avg_deg_s_per_lap,cliff_onset_lap,cliff_rate_s_per_lap2,typical_max_stint_laps,base_pace_offset[,temp_multiplier]
// Accepts an optional header row; ignores lines starting with '#' and blank lines.
// Whitespace around fields is trimmed. Invalid rows and duplicate codes are
// skipped (first row wins); each skip is described in *warnings.
CompoundMap compound_catalog_from_csv_stream(std::istream& in,
                                             std::vector<std::string>* warnings = nullptr);

// Filesystem wrapper; returns nullopt if file cannot be opened.
std::optional<CompoundMap> load_compound_catalog_csv(const std::string& path,
                                                     std::vector<std::string>* warnings = nullptr);

// Scenario / history files are flat `key,value` rows. Later rows override
// earlier ones.
using Settings = std::map<std::string, std::string>;

Settings settings_from_csv_stream(std::istream& in, std::vector<std::string>* warnings = nullptr);
std::optional<Settings> load_settings_csv(const std::string& path,
                                          std::vector<std::string>* warnings = nullptr);

// total_laps is required; pit loss comes from pit_loss_seconds or from
// pit_stationary_s + pit_lane_delta_s. ConfigError on anything malformed.
std::optional<RaceConfig> race_config_from_settings(const Settings& s, Error* err = nullptr);

// weather_condition defaults to dry, rain_intensity to 0.
std::optional<WeatherState> weather_from_settings(const Settings& s, Error* err = nullptr);

// Overrides the knobs present in `s`; untouched fields keep their values.
bool apply_engine_settings(const Settings& s, EngineOptions* opt, Error* err = nullptr);

// Builds a profile from `history.*` keys. *out stays nullopt when no such
// key is present.
bool historical_profile_from_settings(const Settings& s,
                                      std::optional<HistoricalProfile>* out,
                                      Error* err = nullptr);

// `compounds` key ("C2;C3;C4") picks entries out of `catalog`; without it the
// whole catalogue is used. InsufficientCompoundData for unknown codes.
std::optional<CompoundMap> select_compounds(const Settings& s,
                                            const CompoundMap& catalog,
                                            Error* err = nullptr);

} // namespace pitstrat
