#include "model/trace_event.hpp"

#include "core/id_utils.hpp"
#include "core/time_utils.hpp"
#include "model/json_fields.hpp"

#include <utility>

namespace agentwatch::model {

const char* ToString(const ActionType action_type) {
  switch (action_type) {
  case ActionType::kToolCall:
    return "tool_call";
  case ActionType::kLlmRequest:
    return "llm_request";
  case ActionType::kStateTransition:
    return "state_transition";
  }

  return "state_transition";
}

bool ParseActionType(std::string_view text, ActionType& action_type) {
  if (text == "tool_call") {
    action_type = ActionType::kToolCall;
    return true;
  }
  if (text == "llm_request") {
    action_type = ActionType::kLlmRequest;
    return true;
  }
  if (text == "state_transition") {
    action_type = ActionType::kStateTransition;
    return true;
  }
  return false;
}

TraceEvent MakeTraceEvent(std::string agent_id, std::string run_id, const ActionType action_type,
                          std::string action_name) {
  TraceEvent event;
  event.event_id = core::GenerateShortId();
  event.agent_id = std::move(agent_id);
  event.run_id = std::move(run_id);
  event.action_type = action_type;
  event.action_name = std::move(action_name);
  event.timestamp = core::NowEpochSeconds();
  return event;
}

core::json::Value ToJsonValue(const TraceEvent& event) {
  using core::json::MakeNumber;
  using core::json::MakeString;

  return core::json::MakeObject({
      {"event_id", MakeString(event.event_id)},
      {"agent_id", MakeString(event.agent_id)},
      {"run_id", MakeString(event.run_id)},
      {"action_type", MakeString(ToString(event.action_type))},
      {"action_name", MakeString(event.action_name)},
      {"timestamp", MakeNumber(event.timestamp)},
      {"token_count", MakeNumber(static_cast<double>(event.token_count))},
      {"input_data", event.input_data},
      {"output_data", event.output_data},
      {"duration_ms", MakeNumber(event.duration_ms)},
      {"metadata", event.metadata},
  });
}

std::string ToJson(const TraceEvent& event) {
  return core::json::Serialize(ToJsonValue(event));
}

bool ParseTraceEvent(const core::json::Value& value, TraceEvent& event, std::string& error) {
  if (value.type != core::json::Value::Type::kObject) {
    error = "trace event must be a JSON object";
    return false;
  }

  TraceEvent parsed;
  std::string action_type_text;
  if (!detail::ReadRequiredString(value, "event_id", parsed.event_id, error) ||
      !detail::ReadRequiredString(value, "agent_id", parsed.agent_id, error) ||
      !detail::ReadRequiredString(value, "run_id", parsed.run_id, error) ||
      !detail::ReadRequiredString(value, "action_type", action_type_text, error) ||
      !detail::ReadRequiredString(value, "action_name", parsed.action_name, error) ||
      !detail::ReadOptionalNumber(value, "timestamp", parsed.timestamp, error) ||
      !detail::ReadOptionalInteger(value, "token_count", parsed.token_count, error) ||
      !detail::ReadOptionalObject(value, "input_data", parsed.input_data, error) ||
      !detail::ReadOptionalObject(value, "output_data", parsed.output_data, error) ||
      !detail::ReadOptionalNumber(value, "duration_ms", parsed.duration_ms, error) ||
      !detail::ReadOptionalObject(value, "metadata", parsed.metadata, error)) {
    return false;
  }

  if (!ParseActionType(action_type_text, parsed.action_type)) {
    error = "unknown action_type '" + action_type_text + "'";
    return false;
  }

  event = std::move(parsed);
  return true;
}

} // namespace agentwatch::model
