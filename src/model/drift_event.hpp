#pragma once

#include "core/json_dom.hpp"

#include <string>
#include <string_view>

namespace agentwatch::model {

// Ordered drift intensity. Comparisons rely on the underlying order, so new
// levels must keep LOW < MED < HIGH < CRITICAL.
enum class Severity {
  kLow = 0,
  kMed = 1,
  kHigh = 2,
  kCritical = 3,
};

enum class DetectorType {
  kActionLoop,
  kGoalDrift,
  kResourceSpike,
};

// Fixed score breakpoints shared by every detector:
// >= 0.9 CRITICAL, >= 0.7 HIGH, >= 0.5 MED, otherwise LOW (NaN maps to LOW).
Severity SeverityFromScore(double score);

// Persisted string forms: LOW, MED, HIGH, CRITICAL.
const char* ToString(Severity severity);
// Accepts the persisted forms case-insensitively plus the MEDIUM alias.
bool ParseSeverity(std::string_view text, Severity& severity);

// Persisted string forms: action_loop, goal_drift, resource_spike.
const char* ToString(DetectorType detector);
bool ParseDetectorType(std::string_view text, DetectorType& detector);

// A detector's verdict that a run is behaving anomalously. `score` is in
// [0, 1]; `severity` is always SeverityFromScore(score) for detector output.
struct DriftEvent {
  std::string event_id;
  std::string agent_id;
  std::string run_id;
  DetectorType detector = DetectorType::kActionLoop;
  Severity severity = Severity::kLow;
  double score = 0.0;
  std::string message;
  std::string suggested_action;
  double timestamp = 0.0;
  core::json::Value context = core::json::MakeObject();

  bool operator==(const DriftEvent& other) const = default;
};

// Builds a drift with a fresh id, current timestamp and severity derived from
// `score`.
DriftEvent MakeDriftEvent(std::string agent_id, std::string run_id, DetectorType detector,
                          double score, std::string message, std::string suggested_action,
                          core::json::Value context);

core::json::Value ToJsonValue(const DriftEvent& event);
std::string ToJson(const DriftEvent& event);
bool ParseDriftEvent(const core::json::Value& value, DriftEvent& event, std::string& error);

} // namespace agentwatch::model
