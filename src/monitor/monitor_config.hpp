#pragma once

#include "alerts/alert_dispatcher.hpp"
#include "core/logging/logger.hpp"
#include "detectors/action_loop_detector.hpp"
#include "detectors/goal_drift_detector.hpp"
#include "detectors/resource_spike_detector.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>

namespace agentwatch::monitor {

// Every tunable of one monitored agent.
//
// JSON form (all members optional except `agent_id`; unknown keys ignored):
// {
//   "agent_id": "logistics-v2",
//   "db_path": "/var/lib/agentwatch/agentwatch.db",
//   "goal": "Optimise delivery routes",
//   "calibration_runs": 30,
//   "log_level": "info",
//   "detectors": {
//     "action_loop": {"enabled": true, "window": 20, "max_repeats": 4, "sequence_length": 3},
//     "goal_drift": {"enabled": true, "similarity_threshold": 0.5},
//     "resource_spike": {"enabled": true, "spike_multiplier": 2.5,
//                        "absolute_token_limit": 50000,
//                        "absolute_duration_limit_ms": 300000, "max_tracked_runs": 10}
//   },
//   "alerts": {"webhook_url": "https://hooks.slack.com/...", "min_severity": "MED",
//              "cooldown_seconds": 60, "timeout_ms": 10000}
// }
struct MonitorConfig {
  std::string agent_id;
  std::filesystem::path db_path;
  std::size_t calibration_runs = 30;
  core::logging::LogLevel log_level = core::logging::LogLevel::kInfo;

  detectors::ActionLoopConfig action_loop;
  // `goal_drift.goal_description` is the initial goal.
  detectors::GoalDriftConfig goal_drift;
  detectors::ResourceSpikeConfig resource_spike;
  alerts::AlertConfig alerts;
};

// Defaults for `agent_id` with the database under the user's home directory.
MonitorConfig DefaultMonitorConfig(std::string agent_id);

// Strict gate applied before a monitor is built.
bool ValidateMonitorConfig(const MonitorConfig& config, std::string& error);

// Parses the JSON form above on top of DefaultMonitorConfig and validates the
// result. Members with the wrong type are errors.
bool ParseMonitorConfigText(std::string_view json_text, MonitorConfig& config,
                            std::string& error);

bool LoadMonitorConfig(const std::filesystem::path& path, MonitorConfig& config,
                       std::string& error);

} // namespace agentwatch::monitor
