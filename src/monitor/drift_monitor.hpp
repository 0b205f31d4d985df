#pragma once

#include "alerts/alert_dispatcher.hpp"
#include "baseline/calibrator.hpp"
#include "detectors/action_loop_detector.hpp"
#include "detectors/goal_drift_detector.hpp"
#include "detectors/resource_spike_detector.hpp"
#include "embedding/embedding_backend.hpp"
#include "monitor/monitor_config.hpp"
#include "storage/trace_store.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace agentwatch::core::logging {
class Logger;
}

namespace agentwatch::monitor {

// Optional parts of one recorded action.
struct EventDetails {
  std::optional<std::string> run_id;
  std::int64_t token_count = 0;
  core::json::Value input_data = core::json::MakeObject();
  core::json::Value output_data = core::json::MakeObject();
  double duration_ms = 0.0;
  core::json::Value metadata = core::json::MakeObject();
};

// Collaborators a host (or a test) may substitute. Empty members select the
// production implementations.
struct MonitorDependencies {
  std::unique_ptr<alerts::IWebhookTransport> webhook_transport;
  embedding::ProviderFactory embedding_factory;
  // Epoch seconds. Drives alert cooldowns and run wall-clock limits.
  std::function<double()> clock;
};

using DriftCallback = std::function<void(const model::DriftEvent&)>;

// In-process drift monitor for one agent.
//
// RecordEvent pipeline, run to completion on the calling thread:
// 1) persist the trace event (failure aborts before any detector runs)
// 2) action loop -> goal drift -> resource spike, each isolated: a failing
//    detector is logged and counts as no verdict
// 3) for every drift: persist, dispatch the alert, then invoke callbacks in
//    registration order
//
// EndRun recalibrates the baseline synchronously.
class DriftMonitor {
public:
  DriftMonitor(MonitorConfig config, core::logging::Logger& logger,
               MonitorDependencies dependencies = {});

  DriftMonitor(const DriftMonitor&) = delete;
  DriftMonitor& operator=(const DriftMonitor&) = delete;

  // Validates config, opens the store and loads any stored baseline.
  bool Open(std::string& error);

  const MonitorConfig& Config() const {
    return config_;
  }

  const std::string& AgentId() const {
    return config_.agent_id;
  }

  // Returns the active run id (generated when `run_id` is empty). A
  // non-empty goal replaces the goal used for drift scoring.
  std::string StartRun(std::optional<std::string> run_id = std::nullopt,
                       std::optional<std::string> goal = std::nullopt);

  // Recalibrates when a run is known (explicit or current), then clears the
  // current run. Fails only when the baseline cannot be persisted.
  bool EndRun(std::optional<std::string> run_id, std::string& error);

  std::optional<std::string> CurrentRunId() const;

  // `drifts` receives every drift detected for this event. Returns false when
  // the trace (or a drift) could not be persisted.
  bool RecordEvent(model::ActionType action_type, std::string action_name,
                   EventDetails details, std::vector<model::DriftEvent>& drifts,
                   std::string& error);

  void OnDrift(DriftCallback callback);

  void SetGoal(std::string goal_description);

  std::optional<model::BaselineStats> Baseline() const;

  std::vector<model::DriftEvent> RecentAlerts(double hours = 24.0, std::size_t limit = 50);

  storage::TraceStore& Store() {
    return store_;
  }

  detectors::ActionLoopDetector& ActionLoop() {
    return action_loop_;
  }

  detectors::GoalDriftDetector& GoalDrift() {
    return goal_drift_;
  }

  detectors::ResourceSpikeDetector& ResourceSpike() {
    return resource_spike_;
  }

  alerts::AlertDispatcher& Alerts() {
    return dispatcher_;
  }

  core::logging::Logger& Log() {
    return logger_;
  }

private:
  template <typename Detector>
  void RunDetector(Detector& detector, const model::TraceEvent& event,
                   const model::BaselineStats* baseline, std::vector<model::DriftEvent>& drifts,
                   std::string& persist_error);

  void PublishDrift(const model::DriftEvent& drift);

  MonitorConfig config_;
  core::logging::Logger& logger_;
  std::function<double()> clock_;

  storage::TraceStore store_;
  embedding::EmbeddingBackend embedding_;
  baseline::Calibrator calibrator_;
  detectors::ActionLoopDetector action_loop_;
  detectors::GoalDriftDetector goal_drift_;
  detectors::ResourceSpikeDetector resource_spike_;
  alerts::AlertDispatcher dispatcher_;

  mutable std::mutex mutex_;
  std::optional<std::string> current_run_id_;
  std::shared_ptr<const model::BaselineStats> baseline_;

  std::mutex callbacks_mutex_;
  std::vector<DriftCallback> callbacks_;
};

// Starts a run on construction and ends it on Finish() or destruction.
// Destruction cannot report errors, so calibration failures there are logged.
class ScopedRun {
public:
  explicit ScopedRun(DriftMonitor& monitor, std::optional<std::string> goal = std::nullopt,
                     std::optional<std::string> run_id = std::nullopt);
  ~ScopedRun();

  ScopedRun(const ScopedRun&) = delete;
  ScopedRun& operator=(const ScopedRun&) = delete;

  const std::string& RunId() const {
    return run_id_;
  }

  bool Finish(std::string& error);

private:
  DriftMonitor& monitor_;
  std::string run_id_;
  bool finished_ = false;
};

// Rough token estimate for text without a tokenizer: four bytes per token.
std::int64_t EstimateTokens(std::string_view text);

} // namespace agentwatch::monitor
