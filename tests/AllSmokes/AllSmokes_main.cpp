#include <base/Log.hpp>

#include <array>
#include <string_view>

int run_duration_format_smoke();
int run_duration_parse_smoke();
int run_clock_smoke();
int run_stopwatch_state_smoke();
int run_stopwatch_lap_smoke();
int run_stopwatch_copy_smoke();
int run_serialization_smoke();
int run_deserialization_failure_smoke();
int run_reporting_smoke();
int run_timer_service_smoke();
int run_delayed_start_smoke();
int run_real_clock_smoke();

struct Smoke {
  std::string_view name;
  int (*run)();
};

constexpr static std::array<Smoke, 12> smokes{{
  {"duration_format", run_duration_format_smoke},
  {"duration_parse", run_duration_parse_smoke},
  {"clock", run_clock_smoke},
  {"stopwatch_state", run_stopwatch_state_smoke},
  {"stopwatch_lap", run_stopwatch_lap_smoke},
  {"stopwatch_copy", run_stopwatch_copy_smoke},
  {"serialization", run_serialization_smoke},
  {"deserialization_failure", run_deserialization_failure_smoke},
  {"reporting", run_reporting_smoke},
  {"timer_service", run_timer_service_smoke},
  {"delayed_start", run_delayed_start_smoke},
  {"real_clock", run_real_clock_smoke},
}};

// Runs every smoke (or only the one named on the command line). Each smoke
// returns 0 on success and a check-specific code otherwise.
int main(int argc, const char* argv[]) {
  const std::string_view only = argc > 1 ? argv[1] : "";

  int failures = 0;
  int ran = 0;

  for (const auto& smoke : smokes) {
    if (!only.empty() && smoke.name != only) {
      continue;
    }

    ran++;

    const auto result = smoke.run();
    if (result != 0) {
      log_error("{} smoke failed with code {}", smoke.name, result);
      failures++;
    } else {
      log_info("{} smoke passed", smoke.name);
    }
  }

  if (ran == 0) {
    log_error("no smoke named {}", only);
    return 1;
  }

  return failures == 0 ? 0 : 1;
}
