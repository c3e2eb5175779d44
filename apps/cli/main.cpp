#include <pitstrat/config.hpp>
#include <pitstrat/format.hpp>
#include <pitstrat/log.hpp>
#include <pitstrat/planner.hpp>

#include <iomanip>
#include <iostream>
#include <string>

using namespace pitstrat;

namespace {

struct CliArgs {
  std::string scenario;
  std::string compounds;  // empty -> built-in catalogue
  std::string history;    // empty -> history.* keys of the scenario, if any
  bool rules = false;
  bool verbose = false;
};

void print_usage() {
  std::cout << "pitstrat_cli --scenario FILE [--compounds FILE] [--history FILE]"
               " [--rules] [--verbose]\n";
}

bool parse_args(int argc, char** argv, CliArgs* args) {
  for (int i = 1; i < argc; ++i) {
    const std::string a = argv[i];
    auto need = [&](const std::string& flag) -> const char* {
      if (i + 1 >= argc) {
        std::cerr << "Missing value for " << flag << "\n";
        return nullptr;
      }
      return argv[++i];
    };
    if (a == "--scenario") {
      const char* v = need(a);
      if (!v) return false;
      args->scenario = v;
    } else if (a == "--compounds") {
      const char* v = need(a);
      if (!v) return false;
      args->compounds = v;
    } else if (a == "--history") {
      const char* v = need(a);
      if (!v) return false;
      args->history = v;
    } else if (a == "--rules") {
      args->rules = true;
    } else if (a == "--verbose" || a == "-v") {
      args->verbose = true;
    } else if (a == "--help" || a == "-h") {
      print_usage();
      return false;
    } else {
      std::cerr << "Unknown argument: " << a << "\n";
      return false;
    }
  }
  if (args->scenario.empty()) {
    print_usage();
    return false;
  }
  return true;
}

std::string join_laps(const std::vector<int>& laps) {
  if (laps.empty()) return "-";
  std::string out;
  for (std::size_t i = 0; i < laps.size(); ++i) {
    if (i) out += ",";
    out += std::to_string(laps[i]);
  }
  return out;
}

void print_table(const RankedResult& r) {
  const double best = r.strategies.front().effective_score();
  std::cout << " #  strategy                          stops  pit laps    race time      gap   hist\n";
  for (std::size_t i = 0; i < r.strategies.size(); ++i) {
    const auto& s = r.strategies[i];
    const std::string hist = s.historical_adjustment_s ? format_signed(*s.historical_adjustment_s, 2) : "-";
    std::cout << std::setw(2) << (i + 1) << "  "
              << std::left << std::setw(34) << s.name << std::right
              << std::setw(5) << s.stops << "  "
              << std::left << std::setw(10) << join_laps(s.pit_stop_laps) << std::right
              << std::setw(12) << format_race_time(s.total_time_s)
              << std::setw(9) << (i == 0 ? std::string("-") : format_signed(s.effective_score() - best, 1))
              << std::setw(7) << hist << "\n";
  }
  std::cout << "\nRecommended: " << r.recommended;
  if (r.strategies.size() > 1) {
    std::cout << " (ahead by " << format_fixed(r.delta_s, 1) << "s"
              << (r.lead_held_by_guard ? " on race time, held by the physics guard)" : ")");
  }
  std::cout << "\n";
  for (const auto& a : r.advisories) std::cout << "note: " << a << "\n";
  for (const auto& g : r.guard_notes) std::cout << "guard: " << g << "\n";
}

void print_rule_hits(const RankedResult& r, const std::vector<std::vector<RuleHit>>& hits) {
  for (std::size_t i = 0; i < hits.size() && i < r.strategies.size(); ++i) {
    std::cout << "\n[" << r.strategies[i].name << "]\n";
    for (const auto& h : hits[i]) {
      std::cout << "  " << std::left << std::setw(10) << h.category << std::setw(20) << h.rule_name
                << std::right << h.observed_value;
      if (!h.impact.empty()) std::cout << "  => " << h.impact;
      std::cout << "\n";
    }
  }
}

} // namespace

int main(int argc, char** argv) {
  CliArgs args;
  if (!parse_args(argc, argv, &args)) return 1;
  set_log_level(args.verbose ? LogLevel::Debug : LogLevel::Warn);

  auto scenario = load_settings_csv(args.scenario);
  if (!scenario) {
    std::cerr << "Cannot open scenario: " << args.scenario << "\n";
    return 1;
  }

  CompoundMap catalog = fallback_compound_catalog();
  if (!args.compounds.empty()) {
    auto loaded = load_compound_catalog_csv(args.compounds);
    if (!loaded) {
      std::cerr << "Cannot open compounds: " << args.compounds << "\n";
      return 1;
    }
    catalog = std::move(*loaded);
  }

  Settings history_src = *scenario;
  if (!args.history.empty()) {
    auto h = load_settings_csv(args.history);
    if (!h) {
      std::cerr << "Cannot open history: " << args.history << "\n";
      return 1;
    }
    history_src = std::move(*h);
  }

  Error err;
  PlanRequest req;
  EngineOptions opt;
  auto race = race_config_from_settings(*scenario, &err);
  auto weather = race ? weather_from_settings(*scenario, &err) : std::nullopt;
  auto compounds = weather ? select_compounds(*scenario, catalog, &err) : std::nullopt;
  if (!compounds || !apply_engine_settings(*scenario, &opt, &err) ||
      !historical_profile_from_settings(history_src, &req.history, &err)) {
    std::cerr << describe(err) << "\n";
    return 1;
  }
  req.race = *race;
  req.weather = *weather;
  req.compounds = std::move(*compounds);

  const auto result = plan_strategies(req, opt);
  if (!result.ok()) {
    std::cerr << describe(*result.error) << "\n";
    return 1;
  }

  std::cout << req.race.total_laps << " laps, " << weather_condition_name(req.weather.condition)
            << " (rain " << format_fixed(req.weather.rain_intensity, 2) << "), pit loss "
            << format_fixed(req.race.pit_loss_seconds, 1) << "s, "
            << result.grid_points_evaluated << " grid points, " << result.candidates_evaluated
            << " sequences refined\n\n";
  print_table(*result.ranked);
  if (args.rules) print_rule_hits(*result.ranked, result.rule_hits);
  return 0;
}
