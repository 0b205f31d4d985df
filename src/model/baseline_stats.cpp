#include "model/baseline_stats.hpp"

#include "model/json_fields.hpp"

#include <utility>

namespace agentwatch::model {

namespace {

using JsonValue = core::json::Value;

bool ParseCommonSequences(const JsonValue& root, std::vector<std::vector<std::string>>& out,
                          std::string& error) {
  out.clear();
  const JsonValue* value = core::json::FindMember(root, "common_sequences");
  if (value == nullptr || value->type == JsonValue::Type::kNull) {
    return true;
  }
  if (value->type != JsonValue::Type::kArray) {
    error = "field 'common_sequences' must be an array of string arrays";
    return false;
  }

  for (const auto& sequence_value : value->array_value) {
    if (sequence_value.type != JsonValue::Type::kArray) {
      error = "field 'common_sequences' must be an array of string arrays";
      return false;
    }
    std::vector<std::string> sequence;
    sequence.reserve(sequence_value.array_value.size());
    for (const auto& action : sequence_value.array_value) {
      if (action.type != JsonValue::Type::kString) {
        error = "field 'common_sequences' must be an array of string arrays";
        return false;
      }
      sequence.push_back(action.string_value);
    }
    out.push_back(std::move(sequence));
  }
  return true;
}

bool ParseGoalEmbedding(const JsonValue& root, std::optional<std::vector<double>>& out,
                        std::string& error) {
  out.reset();
  const JsonValue* value = core::json::FindMember(root, "goal_embedding");
  if (value == nullptr || value->type == JsonValue::Type::kNull) {
    return true;
  }
  if (value->type != JsonValue::Type::kArray) {
    error = "field 'goal_embedding' must be an array of numbers or null";
    return false;
  }

  std::vector<double> embedding;
  embedding.reserve(value->array_value.size());
  for (const auto& component : value->array_value) {
    if (component.type != JsonValue::Type::kNumber) {
      error = "field 'goal_embedding' must be an array of numbers or null";
      return false;
    }
    embedding.push_back(component.number_value);
  }
  out = std::move(embedding);
  return true;
}

} // namespace

core::json::Value ToJsonValue(const BaselineStats& baseline) {
  using core::json::MakeBool;
  using core::json::MakeNumber;
  using core::json::MakeString;

  JsonValue sequences = core::json::MakeArray();
  for (const auto& sequence : baseline.common_sequences) {
    sequences.array_value.push_back(core::json::MakeStringArray(sequence));
  }

  JsonValue embedding;
  if (baseline.goal_embedding.has_value()) {
    embedding = core::json::MakeArray();
    for (const double component : baseline.goal_embedding.value()) {
      embedding.array_value.push_back(MakeNumber(component));
    }
  }

  return core::json::MakeObject({
      {"agent_id", MakeString(baseline.agent_id)},
      {"calibration_runs", MakeNumber(static_cast<double>(baseline.calibration_runs))},
      {"mean_tokens_per_run", MakeNumber(baseline.mean_tokens_per_run)},
      {"std_tokens_per_run", MakeNumber(baseline.std_tokens_per_run)},
      {"mean_tools_per_run", MakeNumber(baseline.mean_tools_per_run)},
      {"std_tools_per_run", MakeNumber(baseline.std_tools_per_run)},
      {"mean_duration_ms", MakeNumber(baseline.mean_duration_ms)},
      {"std_duration_ms", MakeNumber(baseline.std_duration_ms)},
      {"common_sequences", std::move(sequences)},
      {"goal_embedding", std::move(embedding)},
      {"mean_goal_similarity", MakeNumber(baseline.mean_goal_similarity)},
      {"std_goal_similarity", MakeNumber(baseline.std_goal_similarity)},
      {"is_calibrated", MakeBool(baseline.is_calibrated)},
  });
}

std::string ToJson(const BaselineStats& baseline) {
  return core::json::Serialize(ToJsonValue(baseline));
}

bool ParseBaselineStats(const core::json::Value& value, BaselineStats& baseline,
                        std::string& error) {
  if (value.type != JsonValue::Type::kObject) {
    error = "baseline must be a JSON object";
    return false;
  }

  BaselineStats parsed;
  std::int64_t calibration_runs = 0;
  if (!detail::ReadRequiredString(value, "agent_id", parsed.agent_id, error) ||
      !detail::ReadOptionalInteger(value, "calibration_runs", calibration_runs, error) ||
      !detail::ReadOptionalNumber(value, "mean_tokens_per_run", parsed.mean_tokens_per_run,
                                  error) ||
      !detail::ReadOptionalNumber(value, "std_tokens_per_run", parsed.std_tokens_per_run, error) ||
      !detail::ReadOptionalNumber(value, "mean_tools_per_run", parsed.mean_tools_per_run, error) ||
      !detail::ReadOptionalNumber(value, "std_tools_per_run", parsed.std_tools_per_run, error) ||
      !detail::ReadOptionalNumber(value, "mean_duration_ms", parsed.mean_duration_ms, error) ||
      !detail::ReadOptionalNumber(value, "std_duration_ms", parsed.std_duration_ms, error) ||
      !ParseCommonSequences(value, parsed.common_sequences, error) ||
      !ParseGoalEmbedding(value, parsed.goal_embedding, error) ||
      !detail::ReadOptionalNumber(value, "mean_goal_similarity", parsed.mean_goal_similarity,
                                  error) ||
      !detail::ReadOptionalNumber(value, "std_goal_similarity", parsed.std_goal_similarity,
                                  error)) {
    return false;
  }

  if (calibration_runs < 0) {
    error = "field 'calibration_runs' must be non-negative";
    return false;
  }
  parsed.calibration_runs = static_cast<std::uint64_t>(calibration_runs);

  if (const JsonValue* calibrated = core::json::FindMember(value, "is_calibrated");
      calibrated != nullptr) {
    if (calibrated->type != JsonValue::Type::kBool) {
      error = "field 'is_calibrated' must be a boolean";
      return false;
    }
    parsed.is_calibrated = calibrated->bool_value;
  }

  baseline = std::move(parsed);
  return true;
}

} // namespace agentwatch::model
