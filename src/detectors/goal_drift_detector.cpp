#include "detectors/goal_drift_detector.hpp"

#include "core/json_dom.hpp"
#include "core/json_utils.hpp"
#include "core/logging/logger.hpp"
#include "embedding/embedding_backend.hpp"
#include "embedding/vector_math.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <string_view>
#include <utility>

namespace agentwatch::detectors {

namespace {

constexpr std::size_t kMinOutputChars = 20;
constexpr std::size_t kEmbedChars = 512;
constexpr std::size_t kPreviewChars = 200;
constexpr double kMinBaselineStd = 0.05;

// Prefix holding at most `max_chars` UTF-8 code points. Never splits a
// multi-byte sequence.
std::string Utf8Prefix(std::string_view text, const std::size_t max_chars) {
  std::size_t chars = 0;
  std::size_t pos = 0;
  while (pos < text.size() && chars < max_chars) {
    ++pos;
    while (pos < text.size() && (static_cast<unsigned char>(text[pos]) & 0xC0U) == 0x80U) {
      ++pos;
    }
    ++chars;
  }
  return std::string(text.substr(0, pos));
}

// Code points between the first and last non-space bytes.
std::size_t TrimmedLength(std::string_view text) {
  const auto is_space = [](const char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
  };
  const auto first = std::find_if_not(text.begin(), text.end(), is_space);
  const auto last = std::find_if_not(text.rbegin(), text.rend(), is_space).base();
  std::size_t chars = 0;
  for (auto it = first; it < last; ++it) {
    if ((static_cast<unsigned char>(*it) & 0xC0U) != 0x80U) {
      ++chars;
    }
  }
  return chars;
}

std::string StringMember(const core::json::Value& object, std::string_view key) {
  const core::json::Value* member = core::json::FindMember(object, key);
  if (member == nullptr || member->type != core::json::Value::Type::kString) {
    return "";
  }
  return member->string_value;
}

double Round4(const double value) {
  return std::round(value * 10000.0) / 10000.0;
}

} // namespace

double EffectiveSimilarityThreshold(const double configured,
                                    const model::BaselineStats* baseline) {
  if (baseline == nullptr || !baseline->is_calibrated || baseline->mean_goal_similarity <= 0.0) {
    return configured;
  }
  const double spread = std::max(baseline->std_goal_similarity, kMinBaselineStd);
  return std::max(configured, baseline->mean_goal_similarity - 2.0 * spread);
}

GoalDriftDetector::GoalDriftDetector(embedding::EmbeddingBackend& backend,
                                     core::logging::Logger& logger, GoalDriftConfig config)
    : backend_(backend), logger_(logger), config_(std::move(config)) {}

bool GoalDriftDetector::Enabled() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return config_.enabled;
}

void GoalDriftDetector::SetEnabled(const bool enabled) {
  std::lock_guard<std::mutex> lock(mutex_);
  config_.enabled = enabled;
}

void GoalDriftDetector::SetGoal(std::string goal_description) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (goal_description != config_.goal_description) {
    goal_embedding_.reset();
  }
  config_.goal_description = std::move(goal_description);
}

std::string GoalDriftDetector::Goal() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return config_.goal_description;
}

bool GoalDriftDetector::GoalEmbedding(std::string& goal, std::vector<float>& embedding,
                                      std::string& error) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    goal = config_.goal_description;
    if (goal_embedding_.has_value()) {
      embedding = goal_embedding_.value();
      return true;
    }
  }

  if (!backend_.Embed(goal, embedding, error)) {
    return false;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  // Only cache when the goal did not change while embedding ran.
  if (config_.goal_description == goal) {
    goal_embedding_ = embedding;
  }
  return true;
}

bool GoalDriftDetector::Check(const model::TraceEvent& event,
                              const model::BaselineStats* baseline,
                              std::optional<model::DriftEvent>& drift,
                              std::string& /*error*/) {
  drift.reset();
  double configured_threshold = 0.0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!config_.enabled || config_.goal_description.empty()) {
      return true;
    }
    configured_threshold = config_.similarity_threshold;
  }
  if (event.action_type != model::ActionType::kLlmRequest) {
    return true;
  }

  std::string output_text = StringMember(event.output_data, "text");
  if (output_text.empty()) {
    output_text = StringMember(event.output_data, "output");
  }
  if (TrimmedLength(output_text) < kMinOutputChars) {
    return true;
  }

  std::string goal;
  std::vector<float> goal_vector;
  std::vector<float> output_vector;
  std::string embed_error;
  if (!GoalEmbedding(goal, goal_vector, embed_error) ||
      !backend_.Embed(Utf8Prefix(output_text, kEmbedChars), output_vector, embed_error)) {
    logger_.Warn("goal drift check failed",
                 {{"run_id", event.run_id}, {"event_id", event.event_id}, {"error", embed_error}});
    return true;
  }

  const double similarity = embedding::CosineSimilarity(goal_vector, output_vector);
  const double threshold = EffectiveSimilarityThreshold(configured_threshold, baseline);
  if (!(similarity < threshold)) {
    return true;
  }

  const double score = std::min(1.0, (threshold - similarity) / threshold);
  std::string message = "Goal drift: similarity dropped to " + core::FormatDouble(similarity, 2);
  if (baseline != nullptr && baseline->mean_goal_similarity > 0.0) {
    message += " (baseline: " + core::FormatDouble(baseline->mean_goal_similarity, 2) + ")";
  }

  drift = model::MakeDriftEvent(
      event.agent_id, event.run_id, model::DetectorType::kGoalDrift, score, std::move(message),
      "Review context window for off-topic injection or prompt degradation",
      core::json::MakeObject({
          {"similarity", core::json::MakeNumber(Round4(similarity))},
          {"threshold", core::json::MakeNumber(Round4(threshold))},
          {"output_preview", core::json::MakeString(Utf8Prefix(output_text, kPreviewChars))},
          {"goal_preview", core::json::MakeString(Utf8Prefix(goal, kPreviewChars))},
      }));
  return true;
}

} // namespace agentwatch::detectors
