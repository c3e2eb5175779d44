#include <pitstrat/config.hpp>
#include <pitstrat/log.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <exception>
#include <fstream>

namespace pitstrat {

static std::string trim(std::string s) {
  auto not_space = [](unsigned char c){ return !std::isspace(c); };
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
  s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
  return s;
}

static std::string lower(std::string s) {
  for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

static std::vector<std::string> split(const std::string& line, char sep) {
  // No quoting; fields never contain the separator.
  std::vector<std::string> cols;
  std::string cur;
  for (char c : line) {
    if (c == sep) { cols.push_back(trim(cur)); cur.clear(); }
    else { cur.push_back(c); }
  }
  cols.push_back(trim(cur));
  return cols;
}

static double to_double_safe(const std::string& s, bool& ok) {
  try {
    size_t idx = 0;
    double v = std::stod(s, &idx);
    ok = idx == s.size() && std::isfinite(v);
    return v;
  } catch (const std::exception&) {
    ok = false;
    return 0.0;
  }
}

static int to_int_safe(const std::string& s, bool& ok) {
  try {
    size_t idx = 0;
    int v = std::stoi(s, &idx);
    ok = idx == s.size();
    return v;
  } catch (const std::exception&) {
    ok = false;
    return 0;
  }
}

static bool to_bool_safe(const std::string& s, bool& ok) {
  const std::string v = lower(s);
  ok = true;
  if (v == "true" || v == "1" || v == "yes" || v == "on") return true;
  if (v == "false" || v == "0" || v == "no" || v == "off") return false;
  ok = false;
  return false;
}

static void warn(std::vector<std::string>* warnings, std::string msg) {
  log_message(LogLevel::Warn, "%s", msg.c_str());
  if (warnings) warnings->push_back(std::move(msg));
}

// ---------------------------------------------------------------------------
// Compound catalogue

static bool is_compound_header(const std::vector<std::string>& cols) {
  return !cols.empty() && lower(cols[0]) == "code";
}

static std::optional<std::pair<std::string, CompoundParams>>
parse_compound_row(const std::vector<std::string>& cols, std::string& why) {
  if (cols.size() != 6 && cols.size() != 7) {
    why = "expected 6 or 7 columns, got " + std::to_string(cols.size());
    return std::nullopt;
  }
  const std::string code = cols[0];
  if (code.empty()) {
    why = "empty compound code";
    return std::nullopt;
  }
  bool ok1, ok2, ok3, ok4, ok5;
  CompoundParams p;
  p.avg_deg_s_per_lap = to_double_safe(cols[1], ok1);
  p.cliff_onset_lap = to_int_safe(cols[2], ok2);
  p.cliff_rate_s_per_lap2 = to_double_safe(cols[3], ok3);
  p.typical_max_stint_laps = to_int_safe(cols[4], ok4);
  p.base_pace_offset = to_double_safe(cols[5], ok5);
  if (!(ok1 && ok2 && ok3 && ok4 && ok5)) {
    why = "non-numeric field for " + code;
    return std::nullopt;
  }
  if (cols.size() == 7 && !cols[6].empty()) {
    bool ok6;
    p.temp_multiplier = to_double_safe(cols[6], ok6);
    if (!ok6) {
      why = "non-numeric temp_multiplier for " + code;
      return std::nullopt;
    }
  }
  Error err;
  if (!validate_compound(code, p, &err)) {
    why = err.reason;
    return std::nullopt;
  }
  return std::make_pair(code, p);
}

CompoundMap compound_catalog_from_csv_stream(std::istream& in, std::vector<std::string>* warnings) {
  CompoundMap out;
  std::string line;
  bool header_consumed = false;
  int line_no = 0;

  while (std::getline(in, line)) {
    ++line_no;
    std::string raw = trim(line);
    if (raw.empty() || raw[0] == '#') continue;

    auto cols = split(raw, ',');
    if (!header_consumed && is_compound_header(cols)) {
      header_consumed = true;
      continue;
    }

    std::string why;
    auto row = parse_compound_row(cols, why);
    if (!row) {
      warn(warnings, "compounds line " + std::to_string(line_no) + " skipped: " + why);
      continue;
    }
    if (!out.emplace(row->first, row->second).second) {
      warn(warnings, "compounds line " + std::to_string(line_no) + " skipped: duplicate code " + row->first);
    }
  }
  return out;
}

std::optional<CompoundMap> load_compound_catalog_csv(const std::string& path,
                                                     std::vector<std::string>* warnings) {
  std::ifstream f(path);
  if (!f) return std::nullopt;
  return compound_catalog_from_csv_stream(f, warnings);
}

// ---------------------------------------------------------------------------
// key,value settings

Settings settings_from_csv_stream(std::istream& in, std::vector<std::string>* warnings) {
  Settings out;
  std::string line;
  bool header_consumed = false;
  int line_no = 0;

  while (std::getline(in, line)) {
    ++line_no;
    std::string raw = trim(line);
    if (raw.empty() || raw[0] == '#') continue;

    auto cols = split(raw, ',');
    if (!header_consumed && cols.size() == 2 && lower(cols[0]) == "key" && lower(cols[1]) == "value") {
      header_consumed = true;
      continue;
    }
    if (cols.size() != 2 || cols[0].empty()) {
      warn(warnings, "settings line " + std::to_string(line_no) + " skipped: expected key,value");
      continue;
    }
    out[cols[0]] = cols[1];
  }
  return out;
}

std::optional<Settings> load_settings_csv(const std::string& path, std::vector<std::string>* warnings) {
  std::ifstream f(path);
  if (!f) return std::nullopt;
  return settings_from_csv_stream(f, warnings);
}

// Typed lookups. A missing key leaves *out alone and succeeds.
static bool read_double(const Settings& s, const std::string& key, double* out, Error* err) {
  auto it = s.find(key);
  if (it == s.end()) return true;
  bool ok;
  const double v = to_double_safe(it->second, ok);
  if (!ok) return fail(err, ErrorCode::ConfigError, key + ": not a number: '" + it->second + "'");
  *out = v;
  return true;
}

static bool read_int(const Settings& s, const std::string& key, int* out, Error* err) {
  auto it = s.find(key);
  if (it == s.end()) return true;
  bool ok;
  const int v = to_int_safe(it->second, ok);
  if (!ok) return fail(err, ErrorCode::ConfigError, key + ": not an integer: '" + it->second + "'");
  *out = v;
  return true;
}

static bool read_bool(const Settings& s, const std::string& key, bool* out, Error* err) {
  auto it = s.find(key);
  if (it == s.end()) return true;
  bool ok;
  const bool v = to_bool_safe(it->second, ok);
  if (!ok) return fail(err, ErrorCode::ConfigError, key + ": not a boolean: '" + it->second + "'");
  *out = v;
  return true;
}

static bool read_count(const Settings& s, const std::string& key, std::size_t* out, Error* err) {
  int v = static_cast<int>(*out);
  if (!read_int(s, key, &v, err)) return false;
  if (v < 0) return fail(err, ErrorCode::ConfigError, key + " must be >= 0");
  *out = static_cast<std::size_t>(v);
  return true;
}

std::optional<RaceConfig> race_config_from_settings(const Settings& s, Error* err) {
  if (!s.count("total_laps")) {
    fail(err, ErrorCode::ConfigError, "total_laps is required");
    return std::nullopt;
  }
  RaceConfig race;
  if (!read_int(s, "total_laps", &race.total_laps, err)) return std::nullopt;
  if (!read_double(s, "base_lap_time_s", &race.base_lap_time_s, err)) return std::nullopt;

  if (s.count("pit_loss_seconds")) {
    if (!read_double(s, "pit_loss_seconds", &race.pit_loss_seconds, err)) return std::nullopt;
  } else if (s.count("pit_stationary_s") || s.count("pit_lane_delta_s")) {
    PitParams pit;
    if (!read_double(s, "pit_stationary_s", &pit.stationary, err)) return std::nullopt;
    if (!read_double(s, "pit_lane_delta_s", &pit.lane, err)) return std::nullopt;
    race.pit_loss_seconds = pit_stop_loss(pit);
  } else {
    fail(err, ErrorCode::ConfigError, "pit_loss_seconds (or pit_stationary_s + pit_lane_delta_s) is required");
    return std::nullopt;
  }

  if (s.count("track_temp_c")) {
    double t = 0.0;
    if (!read_double(s, "track_temp_c", &t, err)) return std::nullopt;
    race.track_temp_c = t;
  }
  if (auto it = s.find("circuit_key"); it != s.end() && !it->second.empty()) {
    race.circuit_key = it->second;
  }

  if (!validate_race_config(race, err)) return std::nullopt;
  return race;
}

std::optional<WeatherState> weather_from_settings(const Settings& s, Error* err) {
  WeatherState w;
  if (auto it = s.find("weather_condition"); it != s.end()) {
    auto c = weather_condition_from_string(it->second);
    if (!c) {
      fail(err, ErrorCode::ConfigError, "weather_condition: unknown value '" + it->second + "'");
      return std::nullopt;
    }
    w.condition = *c;
  }
  if (!read_double(s, "rain_intensity", &w.rain_intensity, err)) return std::nullopt;
  if (!validate_weather(w, err)) return std::nullopt;
  return w;
}

static bool parse_stop_counts(const std::string& text, std::vector<int>* out, Error* err) {
  std::vector<int> counts;
  for (const auto& part : split(text, ';')) {
    bool ok;
    const int k = to_int_safe(part, ok);
    if (!ok || k < 0) {
      return fail(err, ErrorCode::ConfigError, "stop_counts: bad entry '" + part + "'");
    }
    counts.push_back(k);
  }
  *out = std::move(counts);
  return true;
}

bool apply_engine_settings(const Settings& s, EngineOptions* opt, Error* err) {
  EngineOptions o = *opt;

  if (auto it = s.find("stop_counts"); it != s.end()) {
    if (!parse_stop_counts(it->second, &o.stop_counts, err)) return false;
  }

  int worker_threads = static_cast<int>(o.worker_threads);
  const bool ok =
      read_int(s, "boundary_search_radius", &o.boundary_search_radius, err) &&
      read_int(s, "partition_step_laps", &o.partition_step_laps, err) &&
      read_int(s, "min_stint_laps", &o.min_stint_laps, err) &&
      read_int(s, "worker_threads", &worker_threads, err) &&
      read_count(s, "max_strategies_per_stop_count", &o.max_strategies_per_stop_count, err) &&
      read_bool(s, "enforce_stint_limits", &o.enforce_stint_limits, err) &&
      read_bool(s, "enforce_two_compound_rule", &o.enforce_two_compound_rule, err) &&
      read_bool(s, "derive_temp_multipliers", &o.derive_temp_multipliers, err) &&
      read_double(s, "historical_cap_s", &o.historical.cap_s, err) &&
      read_double(s, "historical_master_weight", &o.historical.master_weight, err) &&
      read_double(s, "crossover.damp_factor", &o.crossover.damp_factor, err) &&
      read_double(s, "crossover.wet_factor", &o.crossover.wet_factor, err) &&
      read_double(s, "crossover.extreme_factor", &o.crossover.extreme_factor, err) &&
      read_int(s, "crossover.min_opening_laps", &o.crossover.min_opening_laps, err) &&
      read_int(s, "crossover.min_slick_laps", &o.crossover.min_slick_laps, err) &&
      read_bool(s, "crossover.extreme_allows_slicks", &o.crossover.extreme_allows_slicks, err);
  if (!ok) return false;

  if (worker_threads < 0) return fail(err, ErrorCode::ConfigError, "worker_threads must be >= 0");
  o.worker_threads = static_cast<unsigned>(worker_threads);
  if (o.historical.cap_s < 0.0) return fail(err, ErrorCode::ConfigError, "historical_cap_s must be >= 0");

  if (auto it = s.find("missing_compound_policy"); it != s.end()) {
    const std::string v = lower(it->second);
    if (v == "fail") o.missing_compound_policy = MissingCompoundPolicy::Fail;
    else if (v == "fallback") o.missing_compound_policy = MissingCompoundPolicy::UseFallback;
    else return fail(err, ErrorCode::ConfigError, "missing_compound_policy: expected fail or fallback");
  }

  *opt = std::move(o);
  return true;
}

// "MEDIUM>HARD|45|120" -> sequence, frequency %, sample size (optional).
static bool parse_sequence(const std::string& key, const std::string& text,
                           StrategySequenceInfo* out, Error* err) {
  const auto parts = split(text, '|');
  if (parts.size() < 2 || parts.size() > 3) {
    return fail(err, ErrorCode::ConfigError, key + ": expected A>B|pct[|n]");
  }
  StrategySequenceInfo info;
  for (const auto& c : split(parts[0], '>')) {
    if (c.empty()) return fail(err, ErrorCode::ConfigError, key + ": empty compound in sequence");
    info.sequence.push_back(c);
  }
  bool ok;
  info.frequency_pct = to_double_safe(parts[1], ok);
  if (!ok || info.frequency_pct < 0.0) return fail(err, ErrorCode::ConfigError, key + ": bad frequency");
  if (parts.size() == 3) {
    info.n = to_int_safe(parts[2], ok);
    if (!ok || info.n < 0) return fail(err, ErrorCode::ConfigError, key + ": bad sample size");
  }
  *out = std::move(info);
  return true;
}

static bool has_prefix(const std::string& s, const std::string& prefix) {
  return s.compare(0, prefix.size(), prefix) == 0;
}

bool historical_profile_from_settings(const Settings& s,
                                      std::optional<HistoricalProfile>* out,
                                      Error* err) {
  const bool any = std::any_of(s.begin(), s.end(),
                               [](const auto& kv) { return has_prefix(kv.first, "history."); });
  if (!any) {
    out->reset();
    return true;
  }

  HistoricalProfile prof;
  if (auto it = s.find("history.circuit_key"); it != s.end()) prof.circuit_key = it->second;

  if (s.count("history.first_stop.median") || s.count("history.first_stop.p25") ||
      s.count("history.first_stop.p75")) {
    FirstStopLapStats fs;
    if (!read_double(s, "history.first_stop.median", &fs.median, err) ||
        !read_double(s, "history.first_stop.p25", &fs.p25, err) ||
        !read_double(s, "history.first_stop.p75", &fs.p75, err) ||
        !read_int(s, "history.first_stop.n", &fs.n, err)) {
      return false;
    }
    if (fs.p25 > fs.p75) return fail(err, ErrorCode::ConfigError, "history.first_stop: p25 > p75");
    prof.first_stop_lap = fs;
  }

  if (s.count("history.stop_count.one_pct") || s.count("history.stop_count.two_pct")) {
    StopCountDistribution d;
    if (!read_double(s, "history.stop_count.one_pct", &d.one_stop_pct, err) ||
        !read_double(s, "history.stop_count.two_pct", &d.two_stop_pct, err) ||
        !read_double(s, "history.stop_count.three_plus_pct", &d.three_plus_pct, err) ||
        !read_int(s, "history.stop_count.n", &d.n, err)) {
      return false;
    }
    prof.stop_count_distribution = d;
  }

  if (s.count("history.undercut.attempts") || s.count("history.overcut.attempts")) {
    UndercutOvercutStats uo;
    if (!read_int(s, "history.undercut.attempts", &uo.undercut_attempts, err) ||
        !read_double(s, "history.undercut.success_rate", &uo.undercut_success_rate, err) ||
        !read_int(s, "history.overcut.attempts", &uo.overcut_attempts, err) ||
        !read_double(s, "history.overcut.success_rate", &uo.overcut_success_rate, err) ||
        !read_double(s, "history.undercut.typical_gain_s", &uo.typical_undercut_gain_s, err)) {
      return false;
    }
    prof.undercut_overcut = uo;
  }

  // history.sequence.<rank>, ordered by numeric rank.
  std::vector<std::pair<int, StrategySequenceInfo>> ranked;
  const std::string seq_prefix = "history.sequence.";
  const std::string role_prefix = "history.role.";
  for (const auto& [key, value] : s) {
    if (has_prefix(key, seq_prefix)) {
      bool ok;
      const int rank = to_int_safe(key.substr(seq_prefix.size()), ok);
      if (!ok) return fail(err, ErrorCode::ConfigError, key + ": rank must be an integer");
      StrategySequenceInfo info;
      if (!parse_sequence(key, value, &info, err)) return false;
      ranked.emplace_back(rank, std::move(info));
    } else if (has_prefix(key, role_prefix)) {
      const std::string code = key.substr(role_prefix.size());
      if (code.empty() || value.empty()) return fail(err, ErrorCode::ConfigError, key + ": empty role");
      prof.compound_roles[code] = value;
    }
  }
  std::stable_sort(ranked.begin(), ranked.end(),
                   [](const auto& a, const auto& b) { return a.first < b.first; });
  for (auto& r : ranked) prof.common_sequences.push_back(std::move(r.second));

  *out = std::move(prof);
  return true;
}

std::optional<CompoundMap> select_compounds(const Settings& s, const CompoundMap& catalog, Error* err) {
  auto it = s.find("compounds");
  if (it == s.end() || it->second.empty()) return catalog;

  CompoundMap out;
  for (const auto& code : split(it->second, ';')) {
    if (code.empty()) continue;
    auto p = compound_by_code_in(catalog, code);
    if (!p) {
      fail(err, ErrorCode::InsufficientCompoundData, "no parameters for compound " + code);
      return std::nullopt;
    }
    out[code] = *p;
  }
  return out;
}

} // namespace pitstrat
