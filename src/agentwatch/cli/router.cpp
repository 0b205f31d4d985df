#include "agentwatch/cli/router.hpp"

#include "core/errors/exit_codes.hpp"
#include "core/json_utils.hpp"
#include "core/time_utils.hpp"
#include "model/baseline_stats.hpp"
#include "model/drift_event.hpp"
#include "model/trace_event.hpp"
#include "monitor/monitor_config.hpp"
#include "storage/trace_store.hpp"

#include <charconv>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace agentwatch::cli {

namespace {

constexpr int kExitSuccess = core::errors::ToInt(core::errors::ExitCode::kSuccess);
constexpr int kExitFailure = core::errors::ToInt(core::errors::ExitCode::kFailure);
constexpr int kExitUsage = core::errors::ToInt(core::errors::ExitCode::kUsage);
constexpr int kExitConfigInvalid = core::errors::ToInt(core::errors::ExitCode::kConfigInvalid);
constexpr int kExitStorageFailed = core::errors::ToInt(core::errors::ExitCode::kStorageFailed);

constexpr const char* kVersion = "agentwatch 0.1.0";

// One usage text source avoids divergence between help and error paths.
void PrintUsage(std::ostream& out) {
  out << "usage:\n"
      << "  agentwatch [--db <path>] [--log-level <debug|info|warn|error>] <command> ...\n"
      << "\n"
      << "commands:\n"
      << "  alerts [--last <N{m|h|d}>] [--agent <id>] [--severity <LOW|MED|HIGH|CRITICAL>] "
         "[--limit <n>]\n"
      << "  traces <agent_id> [--run <run_id|latest>] [--limit <n>]\n"
      << "  baseline <agent_id>\n"
      << "  runs <agent_id> [--limit <n>]\n"
      << "  validate-config <config.json>\n"
      << "  version\n";
}

// Value of the flag at `args[i]`; advances `i` past it.
bool TakeFlagValue(const std::vector<std::string_view>& args, std::size_t& i,
                   std::string_view& value, std::string& error) {
  if (i + 1 >= args.size()) {
    error = "missing value for " + std::string(args[i]);
    return false;
  }
  value = args[i + 1];
  ++i;
  return true;
}

bool ParseLimit(std::string_view text, std::size_t& limit, std::string& error) {
  std::uint64_t parsed = 0;
  const auto* end = text.data() + text.size();
  const auto result = std::from_chars(text.data(), end, parsed);
  if (text.empty() || result.ec != std::errc() || result.ptr != end || parsed == 0) {
    error = "--limit must be a positive integer, got '" + std::string(text) + "'";
    return false;
  }
  limit = static_cast<std::size_t>(parsed);
  return true;
}

std::string FormatListingTime(const double epoch_seconds) {
  return core::FormatUtc(core::FromEpochSeconds(epoch_seconds), "%Y-%m-%d %H:%M:%S");
}

// Opens the store named by global options. Inspection never needs more than
// the default connection setup.
bool OpenStore(const GlobalOptions& options, core::logging::Logger& logger,
               std::unique_ptr<storage::TraceStore>& store) {
  const fs::path db_path = options.db_path.value_or(storage::DefaultDbPath());
  store = std::make_unique<storage::TraceStore>(db_path, logger);
  std::string error;
  if (!store->Open(error)) {
    std::cerr << "error: " << error << '\n';
    return false;
  }
  return true;
}

int CommandVersion(const std::vector<std::string_view>& args) {
  if (!args.empty()) {
    std::cerr << "error: version does not accept arguments\n";
    return kExitUsage;
  }

  std::cout << kVersion << '\n';
  return kExitSuccess;
}

int CommandValidateConfig(const std::vector<std::string_view>& args) {
  if (args.size() != 1) {
    std::cerr << "error: validate-config requires exactly 1 argument: <config.json>\n";
    return kExitUsage;
  }

  const fs::path config_path(args.front());
  std::error_code ec;
  if (!fs::is_regular_file(config_path, ec) || ec) {
    std::cerr << "error: config file not found: " << config_path.string() << '\n';
    return kExitFailure;
  }

  monitor::MonitorConfig config;
  std::string error;
  if (!monitor::LoadMonitorConfig(config_path, config, error)) {
    std::cerr << "invalid config: " << error << '\n';
    return kExitConfigInvalid;
  }

  std::cout << "valid: " << config_path.string() << " (agent_id=" << config.agent_id
            << ", db_path=" << config.db_path.string() << ")\n";
  return kExitSuccess;
}

struct AlertsOptions {
  double window_seconds = 24.0 * 3600.0;
  std::optional<std::string> agent_id;
  std::optional<model::Severity> severity;
  std::size_t limit = 20;
};

bool ParseAlertsOptions(const std::vector<std::string_view>& args, AlertsOptions& options,
                        std::string& error) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    std::string_view value;
    if (token == "--last") {
      if (!TakeFlagValue(args, i, value, error) ||
          !ParseTimeWindowSeconds(value, options.window_seconds, error)) {
        return false;
      }
      continue;
    }
    if (token == "--agent") {
      if (!TakeFlagValue(args, i, value, error)) {
        return false;
      }
      options.agent_id = std::string(value);
      continue;
    }
    if (token == "--severity") {
      if (!TakeFlagValue(args, i, value, error)) {
        return false;
      }
      model::Severity severity = model::Severity::kLow;
      if (!model::ParseSeverity(value, severity)) {
        error = "--severity must be one of LOW|MED|HIGH|CRITICAL, got '" + std::string(value) +
                "'";
        return false;
      }
      options.severity = severity;
      continue;
    }
    if (token == "--limit") {
      if (!TakeFlagValue(args, i, value, error) || !ParseLimit(value, options.limit, error)) {
        return false;
      }
      continue;
    }

    error = "unknown option for alerts: " + std::string(token);
    return false;
  }
  return true;
}

int CommandAlerts(const GlobalOptions& global, core::logging::Logger& logger,
                  const std::vector<std::string_view>& args) {
  AlertsOptions options;
  std::string error;
  if (!ParseAlertsOptions(args, options, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }

  std::unique_ptr<storage::TraceStore> store;
  if (!OpenStore(global, logger, store)) {
    return kExitStorageFailed;
  }

  storage::DriftQuery query;
  query.agent_id = options.agent_id;
  query.since = core::NowEpochSeconds() - options.window_seconds;
  query.severity = options.severity;
  query.limit = options.limit;
  const std::vector<model::DriftEvent> events = store->GetDriftEvents(query);

  if (events.empty()) {
    std::cout << "No drift events found.\n";
    return kExitSuccess;
  }

  for (const model::DriftEvent& event : events) {
    std::cout << "\n  [" << model::ToString(event.severity) << "]  "
              << FormatListingTime(event.timestamp) << "  " << event.agent_id << '\n'
              << "          " << event.message << '\n'
              << "          Suggested action: " << event.suggested_action << '\n';
  }
  std::cout << '\n' << events.size() << " alert(s) shown\n";
  return kExitSuccess;
}

struct TracesOptions {
  std::string agent_id;
  std::string run = "latest";
  std::size_t limit = 50;
};

bool ParseTracesOptions(const std::vector<std::string_view>& args, TracesOptions& options,
                        std::string& error) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    std::string_view value;
    if (token == "--run") {
      if (!TakeFlagValue(args, i, value, error)) {
        return false;
      }
      options.run = std::string(value);
      continue;
    }
    if (token == "--limit") {
      if (!TakeFlagValue(args, i, value, error) || !ParseLimit(value, options.limit, error)) {
        return false;
      }
      continue;
    }
    if (!token.empty() && token.front() == '-') {
      error = "unknown option for traces: " + std::string(token);
      return false;
    }
    if (!options.agent_id.empty()) {
      error = "traces accepts exactly 1 agent id";
      return false;
    }
    options.agent_id = std::string(token);
  }

  if (options.agent_id.empty()) {
    error = "traces requires exactly 1 argument: <agent_id>";
    return false;
  }
  return true;
}

int CommandTraces(const GlobalOptions& global, core::logging::Logger& logger,
                  const std::vector<std::string_view>& args) {
  TracesOptions options;
  std::string error;
  if (!ParseTracesOptions(args, options, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }

  std::unique_ptr<storage::TraceStore> store;
  if (!OpenStore(global, logger, store)) {
    return kExitStorageFailed;
  }

  std::string run_id = options.run;
  if (run_id == "latest") {
    const std::vector<std::string> run_ids = store->GetRunIds(options.agent_id, 1);
    if (run_ids.empty()) {
      std::cout << "No runs found for agent '" << options.agent_id << "'\n";
      return kExitSuccess;
    }
    run_id = run_ids.front();
  }

  const std::vector<model::TraceEvent> events = store->GetRunTraces(options.agent_id, run_id);
  if (events.empty()) {
    std::cout << "No traces found for run '" << run_id << "'\n";
    return kExitSuccess;
  }

  std::cout << "\nAgent: " << options.agent_id << "  Run: " << run_id << "\n\n";
  std::cout << std::left << std::setw(21) << "Time" << std::setw(18) << "Type" << std::setw(26)
            << "Action" << std::right << std::setw(8) << "Tokens" << std::setw(12) << "Duration"
            << '\n';

  std::size_t shown = 0;
  for (const model::TraceEvent& event : events) {
    if (shown++ == options.limit) {
      break;
    }
    const std::string tokens = event.token_count != 0 ? std::to_string(event.token_count) : "-";
    const std::string duration =
        event.duration_ms != 0.0 ? core::FormatDouble(event.duration_ms, 0) + "ms" : "-";
    std::cout << std::left << std::setw(21) << FormatListingTime(event.timestamp)
              << std::setw(18) << model::ToString(event.action_type) << std::setw(26)
              << event.action_name << std::right << std::setw(8) << tokens << std::setw(12)
              << duration << '\n';
  }
  std::cout << '\n' << events.size() << " event(s) in run\n";
  return kExitSuccess;
}

int CommandBaseline(const GlobalOptions& global, core::logging::Logger& logger,
                    const std::vector<std::string_view>& args) {
  if (args.size() != 1 || args.front().empty() || args.front().front() == '-') {
    std::cerr << "error: baseline requires exactly 1 argument: <agent_id>\n";
    return kExitUsage;
  }
  const std::string agent_id(args.front());

  std::unique_ptr<storage::TraceStore> store;
  if (!OpenStore(global, logger, store)) {
    return kExitStorageFailed;
  }

  const std::optional<model::BaselineStats> baseline = store->GetBaseline(agent_id);
  if (!baseline.has_value()) {
    std::cout << "No baseline found for agent '" << agent_id << "'\n";
    return kExitSuccess;
  }

  const char* plus_minus = " \xC2\xB1 ";
  std::cout << "\nBaseline for '" << agent_id << "'  "
            << (baseline->is_calibrated ? "CALIBRATED" : "PENDING") << '\n'
            << "  Calibration runs: " << baseline->calibration_runs << '\n'
            << "  Tokens/run:       " << core::FormatDouble(baseline->mean_tokens_per_run, 0)
            << plus_minus << core::FormatDouble(baseline->std_tokens_per_run, 0) << '\n'
            << "  Tools/run:        " << core::FormatDouble(baseline->mean_tools_per_run, 1)
            << plus_minus << core::FormatDouble(baseline->std_tools_per_run, 1) << '\n'
            << "  Duration/run:     " << core::FormatDouble(baseline->mean_duration_ms, 0)
            << "ms" << plus_minus << core::FormatDouble(baseline->std_duration_ms, 0)
            << "ms\n";

  if (!baseline->common_sequences.empty()) {
    std::cout << "\n  Common sequences:\n";
    for (const auto& sequence : baseline->common_sequences) {
      std::cout << "    ";
      for (std::size_t i = 0; i < sequence.size(); ++i) {
        std::cout << (i == 0 ? "" : "  \xE2\x86\x92  ") << sequence[i];
      }
      std::cout << '\n';
    }
  }
  std::cout << '\n';
  return kExitSuccess;
}

int CommandRuns(const GlobalOptions& global, core::logging::Logger& logger,
                const std::vector<std::string_view>& args) {
  std::string agent_id;
  std::size_t limit = 10;
  std::string error;
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    if (token == "--limit") {
      std::string_view value;
      if (!TakeFlagValue(args, i, value, error) || !ParseLimit(value, limit, error)) {
        std::cerr << "error: " << error << '\n';
        return kExitUsage;
      }
      continue;
    }
    if ((!token.empty() && token.front() == '-') || !agent_id.empty()) {
      std::cerr << "error: runs requires exactly 1 argument: <agent_id>\n";
      return kExitUsage;
    }
    agent_id = std::string(token);
  }
  if (agent_id.empty()) {
    std::cerr << "error: runs requires exactly 1 argument: <agent_id>\n";
    return kExitUsage;
  }

  std::unique_ptr<storage::TraceStore> store;
  if (!OpenStore(global, logger, store)) {
    return kExitStorageFailed;
  }

  const std::vector<std::string> run_ids = store->GetRunIds(agent_id, limit);
  if (run_ids.empty()) {
    std::cout << "No runs found for agent '" << agent_id << "'\n";
    return kExitSuccess;
  }

  std::cout << "\nRecent runs for '" << agent_id << "'\n\n";
  std::cout << std::left << std::setw(16) << "Run ID" << std::right << std::setw(8) << "Events"
            << std::setw(12) << "Tokens" << std::setw(8) << "Tools" << std::setw(12)
            << "Duration" << '\n';
  for (const std::string& run_id : run_ids) {
    const model::RunStats stats = store->GetRunStats(agent_id, run_id);
    const std::string duration =
        stats.total_duration_ms != 0.0 ? core::FormatDouble(stats.total_duration_ms, 0) + "ms"
                                       : "-";
    std::cout << std::left << std::setw(16) << run_id << std::right << std::setw(8)
              << stats.event_count << std::setw(12) << core::WithThousands(stats.total_tokens)
              << std::setw(8) << stats.tool_calls << std::setw(12) << duration << '\n';
  }
  std::cout << '\n';
  return kExitSuccess;
}

// Global flags must precede the subcommand. Returns the index of the command
// token, or `argc` when none is present.
bool ParseGlobalOptions(int argc, char** argv, GlobalOptions& options, int& command_index,
                        std::string& error) {
  int i = 1;
  for (; i < argc; ++i) {
    const std::string_view token(argv[i]);
    if (token == "--db") {
      if (i + 1 >= argc) {
        error = "missing value for --db";
        return false;
      }
      options.db_path = fs::path(argv[i + 1]);
      ++i;
      continue;
    }
    if (token == "--log-level") {
      if (i + 1 >= argc) {
        error = "missing value for --log-level";
        return false;
      }
      if (!core::logging::ParseLogLevel(argv[i + 1], options.log_level, error)) {
        return false;
      }
      ++i;
      continue;
    }
    break;
  }
  command_index = i;
  return true;
}

} // namespace

bool ParseTimeWindowSeconds(std::string_view text, double& seconds, std::string& error) {
  if (text.size() < 2) {
    error = "invalid time window '" + std::string(text) + "' (expected e.g. 30m, 24h, 7d)";
    return false;
  }

  double multiplier = 0.0;
  switch (text.back()) {
  case 'm':
  case 'M':
    multiplier = 60.0;
    break;
  case 'h':
  case 'H':
    multiplier = 3600.0;
    break;
  case 'd':
  case 'D':
    multiplier = 86400.0;
    break;
  default:
    error = "unknown time unit '" + std::string(1, text.back()) + "' (use m/h/d)";
    return false;
  }

  const std::string number(text.substr(0, text.size() - 1));
  char* end = nullptr;
  const double value = std::strtod(number.c_str(), &end);
  if (end == number.c_str() || *end != '\0' || !std::isfinite(value) || value < 0.0) {
    error = "invalid time window '" + std::string(text) + "' (expected e.g. 30m, 24h, 7d)";
    return false;
  }

  seconds = value * multiplier;
  return true;
}

int Dispatch(int argc, char** argv) {
  GlobalOptions options;
  int command_index = 1;
  std::string error;
  if (!ParseGlobalOptions(argc, argv, options, command_index, error)) {
    std::cerr << "error: " << error << '\n';
    PrintUsage(std::cerr);
    return kExitUsage;
  }
  if (command_index >= argc) {
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  const std::string_view command(argv[command_index]);
  const std::vector<std::string_view> args(argv + command_index + 1, argv + argc);

  core::logging::Logger logger(options.log_level);

  if (command == "version") {
    return CommandVersion(args);
  }

  if (command == "validate-config") {
    return CommandValidateConfig(args);
  }

  if (command == "alerts") {
    return CommandAlerts(options, logger, args);
  }

  if (command == "traces") {
    return CommandTraces(options, logger, args);
  }

  if (command == "baseline") {
    return CommandBaseline(options, logger, args);
  }

  if (command == "runs") {
    return CommandRuns(options, logger, args);
  }

  if (command == "help" || command == "--help" || command == "-h") {
    PrintUsage(std::cout);
    return kExitSuccess;
  }

  std::cerr << "error: unknown subcommand: " << command << '\n';
  PrintUsage(std::cerr);
  return kExitUsage;
}

} // namespace agentwatch::cli
