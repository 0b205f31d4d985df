#pragma once

#include "core/json_dom.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace agentwatch::model {

// Per-agent statistical picture of a "normal" run. Replaced wholesale on each
// calibration.
//
// `goal_embedding`, `mean_goal_similarity` and `std_goal_similarity` are
// reserved: they round-trip through storage but calibration never fills them.
struct BaselineStats {
  std::string agent_id;
  std::uint64_t calibration_runs = 0;
  double mean_tokens_per_run = 0.0;
  double std_tokens_per_run = 0.0;
  double mean_tools_per_run = 0.0;
  double std_tools_per_run = 0.0;
  double mean_duration_ms = 0.0;
  double std_duration_ms = 0.0;
  std::vector<std::vector<std::string>> common_sequences;
  std::optional<std::vector<double>> goal_embedding;
  double mean_goal_similarity = 0.0;
  double std_goal_similarity = 0.0;
  bool is_calibrated = false;

  bool operator==(const BaselineStats& other) const = default;
};

core::json::Value ToJsonValue(const BaselineStats& baseline);
std::string ToJson(const BaselineStats& baseline);

// Missing members keep their defaults; members of the wrong type fail.
bool ParseBaselineStats(const core::json::Value& value, BaselineStats& baseline,
                        std::string& error);

// Aggregate view of one run, computed from stored trace events.
struct RunStats {
  std::uint64_t event_count = 0;
  std::int64_t total_tokens = 0;
  std::uint64_t tool_calls = 0;
  std::uint64_t llm_calls = 0;
  double start_time = 0.0;
  double end_time = 0.0;
  double total_duration_ms = 0.0;
};

} // namespace agentwatch::model
