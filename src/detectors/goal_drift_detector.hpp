#pragma once

#include "model/baseline_stats.hpp"
#include "model/drift_event.hpp"
#include "model/trace_event.hpp"

#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace agentwatch::core::logging {
class Logger;
}

namespace agentwatch::embedding {
class EmbeddingBackend;
}

namespace agentwatch::detectors {

struct GoalDriftConfig {
  bool enabled = true;
  // Similarity below this flags drift unless a calibrated baseline raises it.
  double similarity_threshold = 0.5;
  std::string goal_description;
};

// Threshold actually applied for one check. A calibrated baseline with a
// positive mean goal similarity can only raise the configured threshold:
// max(configured, mean - 2 * max(std, 0.05)).
double EffectiveSimilarityThreshold(double configured, const model::BaselineStats* baseline);

// Scores semantic distance between model output and the declared goal.
//
// Only llm_request events whose output payload carries a `text` (or, when
// that is empty, `output`) string of at least 20 non-blank characters are
// inspected, and only while a goal is set. The goal embedding is cached until
// the goal text changes. Embedding failures are logged and yield no verdict.
class GoalDriftDetector {
public:
  GoalDriftDetector(embedding::EmbeddingBackend& backend, core::logging::Logger& logger,
                    GoalDriftConfig config);

  const char* Name() const {
    return "goal_drift";
  }

  bool Enabled() const;
  void SetEnabled(bool enabled);

  void SetGoal(std::string goal_description);
  std::string Goal() const;

  bool Check(const model::TraceEvent& event, const model::BaselineStats* baseline,
             std::optional<model::DriftEvent>& drift, std::string& error);

private:
  bool GoalEmbedding(std::string& goal, std::vector<float>& embedding, std::string& error);

  embedding::EmbeddingBackend& backend_;
  core::logging::Logger& logger_;

  mutable std::mutex mutex_;
  GoalDriftConfig config_;
  std::optional<std::vector<float>> goal_embedding_;
};

} // namespace agentwatch::detectors
