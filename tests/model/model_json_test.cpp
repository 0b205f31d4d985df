#include "model/baseline_stats.hpp"
#include "model/drift_event.hpp"
#include "model/trace_event.hpp"

#include <catch2/catch.hpp>

#include <cmath>
#include <limits>
#include <string>

namespace model = agentwatch::model;
namespace json = agentwatch::core::json;

TEST_CASE("SeverityFromScore uses fixed breakpoints", "[model][severity]") {
  REQUIRE(model::SeverityFromScore(0.0) == model::Severity::kLow);
  REQUIRE(model::SeverityFromScore(0.49) == model::Severity::kLow);
  REQUIRE(model::SeverityFromScore(0.5) == model::Severity::kMed);
  REQUIRE(model::SeverityFromScore(0.625) == model::Severity::kMed);
  REQUIRE(model::SeverityFromScore(0.7) == model::Severity::kHigh);
  REQUIRE(model::SeverityFromScore(0.9) == model::Severity::kCritical);
  REQUIRE(model::SeverityFromScore(1.0) == model::Severity::kCritical);
  REQUIRE(model::SeverityFromScore(std::numeric_limits<double>::quiet_NaN()) ==
          model::Severity::kLow);
}

TEST_CASE("Severity parsing accepts persisted forms and aliases", "[model][severity]") {
  model::Severity severity = model::Severity::kLow;
  REQUIRE(model::ParseSeverity("HIGH", severity));
  REQUIRE(severity == model::Severity::kHigh);
  REQUIRE(model::ParseSeverity("medium", severity));
  REQUIRE(severity == model::Severity::kMed);
  REQUIRE(model::ParseSeverity("critical", severity));
  REQUIRE(severity == model::Severity::kCritical);
  REQUIRE_FALSE(model::ParseSeverity("urgent", severity));

  REQUIRE(model::Severity::kLow < model::Severity::kMed);
  REQUIRE(model::Severity::kHigh < model::Severity::kCritical);
}

TEST_CASE("Action and detector types keep stable spellings", "[model]") {
  REQUIRE(std::string(model::ToString(model::ActionType::kToolCall)) == "tool_call");
  REQUIRE(std::string(model::ToString(model::ActionType::kLlmRequest)) == "llm_request");
  REQUIRE(std::string(model::ToString(model::ActionType::kStateTransition)) ==
          "state_transition");
  REQUIRE(std::string(model::ToString(model::DetectorType::kResourceSpike)) ==
          "resource_spike");

  model::ActionType action = model::ActionType::kToolCall;
  REQUIRE(model::ParseActionType("llm_request", action));
  REQUIRE(action == model::ActionType::kLlmRequest);
  REQUIRE_FALSE(model::ParseActionType("shell", action));
}

TEST_CASE("MakeTraceEvent assigns distinct ids and empty payloads", "[model][trace]") {
  const model::TraceEvent first =
      model::MakeTraceEvent("agent", "run", model::ActionType::kToolCall, "search");
  const model::TraceEvent second =
      model::MakeTraceEvent("agent", "run", model::ActionType::kToolCall, "search");
  REQUIRE_FALSE(first.event_id.empty());
  REQUIRE(first.event_id != second.event_id);
  REQUIRE(first.timestamp > 0.0);
  REQUIRE(first.input_data.type == json::Value::Type::kObject);
  REQUIRE(first.input_data.object_value.empty());
}

TEST_CASE("TraceEvent survives a JSON round trip", "[model][trace][json]") {
  model::TraceEvent event =
      model::MakeTraceEvent("agent-1", "run-7", model::ActionType::kLlmRequest, "gpt-call");
  event.token_count = 1234;
  event.duration_ms = 56.5;
  event.output_data = json::MakeObject({{"text", json::MakeString("hello")}});

  json::Value parsed_json;
  std::string error;
  REQUIRE(json::Parse(model::ToJson(event), parsed_json, error));

  model::TraceEvent parsed;
  REQUIRE(model::ParseTraceEvent(parsed_json, parsed, error));
  REQUIRE(parsed == event);
}

TEST_CASE("MakeDriftEvent derives severity from score", "[model][drift]") {
  const model::DriftEvent drift = model::MakeDriftEvent(
      "agent", "run", model::DetectorType::kActionLoop, 0.75, "loop", "check tool",
      json::MakeObject({{"repeat_count", json::MakeNumber(6)}}));
  REQUIRE(drift.severity == model::Severity::kHigh);
  REQUIRE(drift.score == 0.75);
  REQUIRE_FALSE(drift.event_id.empty());

  json::Value parsed_json;
  std::string error;
  REQUIRE(json::Parse(model::ToJson(drift), parsed_json, error));
  const json::Value* severity = json::FindMember(parsed_json, "severity");
  REQUIRE(severity != nullptr);
  REQUIRE(severity->string_value == "HIGH");
  const json::Value* detector = json::FindMember(parsed_json, "detector");
  REQUIRE(detector != nullptr);
  REQUIRE(detector->string_value == "action_loop");
}

TEST_CASE("BaselineStats parsing keeps defaults for missing members", "[model][baseline]") {
  json::Value root;
  std::string error;
  REQUIRE(json::Parse(R"({"agent_id": "a", "calibration_runs": 3,
                         "mean_tokens_per_run": 120.5,
                         "common_sequences": [["search", "fetch"]]})",
                      root, error));

  model::BaselineStats baseline;
  REQUIRE(model::ParseBaselineStats(root, baseline, error));
  REQUIRE(baseline.agent_id == "a");
  REQUIRE(baseline.calibration_runs == 3);
  REQUIRE(baseline.mean_tokens_per_run == 120.5);
  REQUIRE(baseline.std_tokens_per_run == 0.0);
  REQUIRE(baseline.common_sequences.size() == 1);
  REQUIRE(baseline.common_sequences[0][1] == "fetch");
  REQUIRE_FALSE(baseline.goal_embedding.has_value());
  REQUIRE_FALSE(baseline.is_calibrated);

  REQUIRE(json::Parse(R"({"agent_id": 7})", root, error));
  REQUIRE_FALSE(model::ParseBaselineStats(root, baseline, error));
}
