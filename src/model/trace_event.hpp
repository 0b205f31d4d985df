#pragma once

#include "core/json_dom.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace agentwatch::model {

// Normalized categories of observed agent actions. Detectors key off these
// values, so keep the persisted spellings stable.
enum class ActionType {
  kToolCall,
  kLlmRequest,
  kStateTransition,
};

// Persisted string forms: tool_call, llm_request, state_transition.
const char* ToString(ActionType action_type);
bool ParseActionType(std::string_view text, ActionType& action_type);

// One observed agent action.
//
// - `event_id`: globally unique, generated at construction time.
// - `timestamp`: epoch seconds when the action was recorded.
// - `input_data` / `output_data` / `metadata`: opaque structured payloads,
//   always JSON objects.
struct TraceEvent {
  std::string event_id;
  std::string agent_id;
  std::string run_id;
  ActionType action_type = ActionType::kToolCall;
  std::string action_name;
  double timestamp = 0.0;
  std::int64_t token_count = 0;
  core::json::Value input_data = core::json::MakeObject();
  core::json::Value output_data = core::json::MakeObject();
  double duration_ms = 0.0;
  core::json::Value metadata = core::json::MakeObject();

  bool operator==(const TraceEvent& other) const = default;
};

// Builds an event with a fresh id and the current timestamp.
TraceEvent MakeTraceEvent(std::string agent_id, std::string run_id, ActionType action_type,
                          std::string action_name);

core::json::Value ToJsonValue(const TraceEvent& event);
std::string ToJson(const TraceEvent& event);
bool ParseTraceEvent(const core::json::Value& value, TraceEvent& event, std::string& error);

} // namespace agentwatch::model
