#include "monitor/monitor_config.hpp"

#include "core/fs_utils.hpp"
#include "core/json_dom.hpp"
#include "storage/trace_store.hpp"

#include <chrono>
#include <cmath>
#include <cstdint>
#include <initializer_list>
#include <limits>
#include <utility>

namespace agentwatch::monitor {

namespace {

using JsonValue = core::json::Value;

const JsonValue* FindJsonPath(const JsonValue& root,
                              std::initializer_list<std::string_view> path) {
  const JsonValue* cursor = &root;
  for (const std::string_view key : path) {
    cursor = core::json::FindMember(*cursor, key);
    if (cursor == nullptr) {
      return nullptr;
    }
  }
  return cursor;
}

std::string PathLabel(std::initializer_list<std::string_view> path) {
  std::string label;
  for (const std::string_view key : path) {
    if (!label.empty()) {
      label.push_back('.');
    }
    label.append(key);
  }
  return label;
}

bool ReadString(const JsonValue& root, std::initializer_list<std::string_view> path,
                std::string& out, std::string& error) {
  const JsonValue* value = FindJsonPath(root, path);
  if (value == nullptr || value->type == JsonValue::Type::kNull) {
    return true;
  }
  if (value->type != JsonValue::Type::kString) {
    error = "config field '" + PathLabel(path) + "' must be a string";
    return false;
  }
  out = value->string_value;
  return true;
}

bool ReadBool(const JsonValue& root, std::initializer_list<std::string_view> path, bool& out,
              std::string& error) {
  const JsonValue* value = FindJsonPath(root, path);
  if (value == nullptr || value->type == JsonValue::Type::kNull) {
    return true;
  }
  if (value->type != JsonValue::Type::kBool) {
    error = "config field '" + PathLabel(path) + "' must be a boolean";
    return false;
  }
  out = value->bool_value;
  return true;
}

bool ReadNumber(const JsonValue& root, std::initializer_list<std::string_view> path, double& out,
                std::string& error) {
  const JsonValue* value = FindJsonPath(root, path);
  if (value == nullptr || value->type == JsonValue::Type::kNull) {
    return true;
  }
  if (value->type != JsonValue::Type::kNumber || !std::isfinite(value->number_value)) {
    error = "config field '" + PathLabel(path) + "' must be a finite number";
    return false;
  }
  out = value->number_value;
  return true;
}

bool ReadCount(const JsonValue& root, std::initializer_list<std::string_view> path,
               std::uint64_t& out, std::string& error) {
  double parsed = static_cast<double>(out);
  if (!ReadNumber(root, path, parsed, error)) {
    return false;
  }
  if (parsed < 0.0 || std::floor(parsed) != parsed ||
      parsed > static_cast<double>(std::numeric_limits<std::int64_t>::max())) {
    error = "config field '" + PathLabel(path) + "' must be a non-negative integer";
    return false;
  }
  out = static_cast<std::uint64_t>(parsed);
  return true;
}

bool ReadSize(const JsonValue& root, std::initializer_list<std::string_view> path,
              std::size_t& out, std::string& error) {
  std::uint64_t parsed = out;
  if (!ReadCount(root, path, parsed, error)) {
    return false;
  }
  out = static_cast<std::size_t>(parsed);
  return true;
}

bool ParseConfigRoot(const JsonValue& root, MonitorConfig& config, std::string& error) {
  std::string db_path;
  std::string log_level = core::logging::ToString(config.log_level);
  if (!ReadString(root, {"agent_id"}, config.agent_id, error) ||
      !ReadString(root, {"db_path"}, db_path, error) ||
      !ReadString(root, {"goal"}, config.goal_drift.goal_description, error) ||
      !ReadSize(root, {"calibration_runs"}, config.calibration_runs, error) ||
      !ReadString(root, {"log_level"}, log_level, error)) {
    return false;
  }
  if (!db_path.empty()) {
    config.db_path = db_path;
  }
  if (!core::logging::ParseLogLevel(log_level, config.log_level, error)) {
    error = "config field 'log_level': " + error;
    return false;
  }

  detectors::ActionLoopConfig& loop = config.action_loop;
  if (!ReadBool(root, {"detectors", "action_loop", "enabled"}, loop.enabled, error) ||
      !ReadSize(root, {"detectors", "action_loop", "window"}, loop.window_size, error) ||
      !ReadSize(root, {"detectors", "action_loop", "max_repeats"}, loop.max_repeats, error) ||
      !ReadSize(root, {"detectors", "action_loop", "sequence_length"}, loop.sequence_length,
                error)) {
    return false;
  }

  detectors::GoalDriftConfig& goal = config.goal_drift;
  if (!ReadBool(root, {"detectors", "goal_drift", "enabled"}, goal.enabled, error) ||
      !ReadNumber(root, {"detectors", "goal_drift", "similarity_threshold"},
                  goal.similarity_threshold, error)) {
    return false;
  }

  detectors::ResourceSpikeConfig& spike = config.resource_spike;
  std::uint64_t token_limit = static_cast<std::uint64_t>(spike.absolute_token_limit);
  if (!ReadBool(root, {"detectors", "resource_spike", "enabled"}, spike.enabled, error) ||
      !ReadNumber(root, {"detectors", "resource_spike", "spike_multiplier"},
                  spike.spike_multiplier, error) ||
      !ReadCount(root, {"detectors", "resource_spike", "absolute_token_limit"}, token_limit,
                 error) ||
      !ReadNumber(root, {"detectors", "resource_spike", "absolute_duration_limit_ms"},
                  spike.absolute_duration_limit_ms, error) ||
      !ReadSize(root, {"detectors", "resource_spike", "max_tracked_runs"},
                spike.max_tracked_runs, error)) {
    return false;
  }
  spike.absolute_token_limit = static_cast<std::int64_t>(token_limit);

  alerts::AlertConfig& alert = config.alerts;
  std::string webhook_url = alert.webhook_url.value_or("");
  std::string min_severity = model::ToString(alert.min_severity);
  double timeout_ms = static_cast<double>(alert.timeout.count());
  if (!ReadString(root, {"alerts", "webhook_url"}, webhook_url, error) ||
      !ReadString(root, {"alerts", "min_severity"}, min_severity, error) ||
      !ReadNumber(root, {"alerts", "cooldown_seconds"}, alert.cooldown_seconds, error) ||
      !ReadNumber(root, {"alerts", "timeout_ms"}, timeout_ms, error)) {
    return false;
  }
  if (webhook_url.empty()) {
    alert.webhook_url.reset();
  } else {
    alert.webhook_url = webhook_url;
  }
  if (!model::ParseSeverity(min_severity, alert.min_severity)) {
    error = "config field 'alerts.min_severity' must be one of LOW|MED|HIGH|CRITICAL, got '" +
            min_severity + "'";
    return false;
  }
  alert.timeout = std::chrono::milliseconds(static_cast<std::int64_t>(std::llround(timeout_ms)));
  return true;
}

} // namespace

MonitorConfig DefaultMonitorConfig(std::string agent_id) {
  MonitorConfig config;
  config.agent_id = std::move(agent_id);
  config.db_path = storage::DefaultDbPath();
  return config;
}

bool ValidateMonitorConfig(const MonitorConfig& config, std::string& error) {
  if (config.agent_id.empty()) {
    error = "agent_id must not be empty";
    return false;
  }
  if (config.db_path.empty()) {
    error = "db_path must not be empty";
    return false;
  }
  if (config.calibration_runs == 0) {
    error = "calibration_runs must be at least 1";
    return false;
  }
  if (config.action_loop.window_size == 0) {
    error = "detectors.action_loop.window must be at least 1";
    return false;
  }
  if (config.action_loop.max_repeats < 2) {
    error = "detectors.action_loop.max_repeats must be at least 2";
    return false;
  }
  if (config.action_loop.sequence_length < 2) {
    error = "detectors.action_loop.sequence_length must be at least 2";
    return false;
  }
  const double threshold = config.goal_drift.similarity_threshold;
  if (!(threshold > 0.0 && threshold <= 1.0)) {
    error = "detectors.goal_drift.similarity_threshold must be in (0, 1]";
    return false;
  }
  if (!(config.resource_spike.spike_multiplier > 0.0)) {
    error = "detectors.resource_spike.spike_multiplier must be > 0";
    return false;
  }
  if (config.resource_spike.absolute_token_limit <= 0) {
    error = "detectors.resource_spike.absolute_token_limit must be > 0";
    return false;
  }
  if (!(config.resource_spike.absolute_duration_limit_ms > 0.0)) {
    error = "detectors.resource_spike.absolute_duration_limit_ms must be > 0";
    return false;
  }
  if (config.resource_spike.max_tracked_runs == 0) {
    error = "detectors.resource_spike.max_tracked_runs must be at least 1";
    return false;
  }
  if (!(config.alerts.cooldown_seconds >= 0.0)) {
    error = "alerts.cooldown_seconds must be >= 0";
    return false;
  }
  if (config.alerts.timeout.count() <= 0) {
    error = "alerts.timeout_ms must be > 0";
    return false;
  }
  return true;
}

bool ParseMonitorConfigText(std::string_view json_text, MonitorConfig& config,
                            std::string& error) {
  config = DefaultMonitorConfig("");
  error.clear();

  JsonValue root;
  std::string parse_error;
  if (!core::json::Parse(json_text, root, parse_error)) {
    error = "invalid config JSON: " + parse_error;
    return false;
  }
  if (root.type != JsonValue::Type::kObject) {
    error = "config root must be a JSON object";
    return false;
  }

  if (!ParseConfigRoot(root, config, error)) {
    return false;
  }
  return ValidateMonitorConfig(config, error);
}

bool LoadMonitorConfig(const std::filesystem::path& path, MonitorConfig& config,
                       std::string& error) {
  std::string contents;
  if (!core::ReadTextFile(path, contents, error)) {
    return false;
  }
  if (!ParseMonitorConfigText(contents, config, error)) {
    error = "config '" + path.string() + "': " + error;
    return false;
  }
  return true;
}

} // namespace agentwatch::monitor
