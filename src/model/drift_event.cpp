#include "model/drift_event.hpp"

#include "core/id_utils.hpp"
#include "core/time_utils.hpp"
#include "model/json_fields.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace agentwatch::model {

namespace {

std::string ToUpperAscii(std::string_view text) {
  std::string normalized(text);
  std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return normalized;
}

} // namespace

Severity SeverityFromScore(const double score) {
  if (score >= 0.9) {
    return Severity::kCritical;
  }
  if (score >= 0.7) {
    return Severity::kHigh;
  }
  if (score >= 0.5) {
    return Severity::kMed;
  }
  return Severity::kLow;
}

const char* ToString(const Severity severity) {
  switch (severity) {
  case Severity::kLow:
    return "LOW";
  case Severity::kMed:
    return "MED";
  case Severity::kHigh:
    return "HIGH";
  case Severity::kCritical:
    return "CRITICAL";
  }

  return "LOW";
}

bool ParseSeverity(std::string_view text, Severity& severity) {
  const std::string normalized = ToUpperAscii(text);
  if (normalized == "LOW") {
    severity = Severity::kLow;
    return true;
  }
  if (normalized == "MED" || normalized == "MEDIUM") {
    severity = Severity::kMed;
    return true;
  }
  if (normalized == "HIGH") {
    severity = Severity::kHigh;
    return true;
  }
  if (normalized == "CRITICAL") {
    severity = Severity::kCritical;
    return true;
  }
  return false;
}

const char* ToString(const DetectorType detector) {
  switch (detector) {
  case DetectorType::kActionLoop:
    return "action_loop";
  case DetectorType::kGoalDrift:
    return "goal_drift";
  case DetectorType::kResourceSpike:
    return "resource_spike";
  }

  return "action_loop";
}

bool ParseDetectorType(std::string_view text, DetectorType& detector) {
  if (text == "action_loop") {
    detector = DetectorType::kActionLoop;
    return true;
  }
  if (text == "goal_drift") {
    detector = DetectorType::kGoalDrift;
    return true;
  }
  if (text == "resource_spike") {
    detector = DetectorType::kResourceSpike;
    return true;
  }
  return false;
}

DriftEvent MakeDriftEvent(std::string agent_id, std::string run_id, const DetectorType detector,
                          const double score, std::string message, std::string suggested_action,
                          core::json::Value context) {
  DriftEvent event;
  event.event_id = core::GenerateShortId();
  event.agent_id = std::move(agent_id);
  event.run_id = std::move(run_id);
  event.detector = detector;
  event.severity = SeverityFromScore(score);
  event.score = score;
  event.message = std::move(message);
  event.suggested_action = std::move(suggested_action);
  event.timestamp = core::NowEpochSeconds();
  event.context = std::move(context);
  return event;
}

core::json::Value ToJsonValue(const DriftEvent& event) {
  using core::json::MakeNumber;
  using core::json::MakeString;

  return core::json::MakeObject({
      {"event_id", MakeString(event.event_id)},
      {"agent_id", MakeString(event.agent_id)},
      {"run_id", MakeString(event.run_id)},
      {"detector", MakeString(ToString(event.detector))},
      {"severity", MakeString(ToString(event.severity))},
      {"score", MakeNumber(event.score)},
      {"message", MakeString(event.message)},
      {"suggested_action", MakeString(event.suggested_action)},
      {"timestamp", MakeNumber(event.timestamp)},
      {"context", event.context},
  });
}

std::string ToJson(const DriftEvent& event) {
  return core::json::Serialize(ToJsonValue(event));
}

bool ParseDriftEvent(const core::json::Value& value, DriftEvent& event, std::string& error) {
  if (value.type != core::json::Value::Type::kObject) {
    error = "drift event must be a JSON object";
    return false;
  }

  DriftEvent parsed;
  std::string detector_text;
  std::string severity_text;
  if (!detail::ReadRequiredString(value, "event_id", parsed.event_id, error) ||
      !detail::ReadRequiredString(value, "agent_id", parsed.agent_id, error) ||
      !detail::ReadRequiredString(value, "run_id", parsed.run_id, error) ||
      !detail::ReadRequiredString(value, "detector", detector_text, error) ||
      !detail::ReadRequiredString(value, "severity", severity_text, error) ||
      !detail::ReadOptionalNumber(value, "score", parsed.score, error) ||
      !detail::ReadRequiredString(value, "message", parsed.message, error) ||
      !detail::ReadRequiredString(value, "suggested_action", parsed.suggested_action, error) ||
      !detail::ReadOptionalNumber(value, "timestamp", parsed.timestamp, error) ||
      !detail::ReadOptionalObject(value, "context", parsed.context, error)) {
    return false;
  }

  if (!ParseDetectorType(detector_text, parsed.detector)) {
    error = "unknown detector '" + detector_text + "'";
    return false;
  }
  if (!ParseSeverity(severity_text, parsed.severity)) {
    error = "unknown severity '" + severity_text + "'";
    return false;
  }

  event = std::move(parsed);
  return true;
}

} // namespace agentwatch::model
