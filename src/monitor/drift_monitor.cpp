#include "monitor/drift_monitor.hpp"

#include "core/id_utils.hpp"
#include "core/logging/logger.hpp"
#include "core/time_utils.hpp"
#include "embedding/hashing_embedding_provider.hpp"

#include <exception>
#include <utility>

namespace agentwatch::monitor {

DriftMonitor::DriftMonitor(MonitorConfig config, core::logging::Logger& logger,
                           MonitorDependencies dependencies)
    : config_(std::move(config)),
      logger_(logger),
      clock_(dependencies.clock ? std::move(dependencies.clock)
                                : std::function<double()>(&core::NowEpochSeconds)),
      store_(config_.db_path, logger_),
      embedding_(dependencies.embedding_factory ? std::move(dependencies.embedding_factory)
                                                : embedding::MakeHashingProviderFactory()),
      calibrator_(store_, logger_, config_.calibration_runs),
      action_loop_(store_, config_.action_loop),
      goal_drift_(embedding_, logger_, config_.goal_drift),
      resource_spike_(config_.resource_spike, clock_),
      dispatcher_(config_.alerts, logger_, std::move(dependencies.webhook_transport), clock_) {}

bool DriftMonitor::Open(std::string& error) {
  if (!ValidateMonitorConfig(config_, error)) {
    return false;
  }
  logger_.SetAgentId(config_.agent_id);
  if (!store_.Open(error)) {
    return false;
  }

  std::optional<model::BaselineStats> stored = store_.GetBaseline(config_.agent_id);
  bool calibrated = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stored.has_value()) {
      calibrated = stored->is_calibrated;
      baseline_ = std::make_shared<const model::BaselineStats>(std::move(stored.value()));
    } else {
      baseline_.reset();
    }
  }

  logger_.Info("monitor initialised",
               {{"db_path", store_.DbPath().string()},
                {"baseline", calibrated ? "calibrated" : "pending"}});
  return true;
}

std::string DriftMonitor::StartRun(std::optional<std::string> run_id,
                                   std::optional<std::string> goal) {
  std::string active = run_id.has_value() && !run_id->empty() ? std::move(run_id.value())
                                                               : core::GenerateShortId();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    current_run_id_ = active;
  }
  if (goal.has_value() && !goal->empty()) {
    goal_drift_.SetGoal(std::move(goal.value()));
  }
  logger_.Debug("run started", {{"run_id", active}});
  return active;
}

bool DriftMonitor::EndRun(std::optional<std::string> run_id, std::string& error) {
  std::optional<std::string> target;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (run_id.has_value() && !run_id->empty()) {
      target = std::move(run_id);
    } else {
      target = current_run_id_;
    }
    current_run_id_.reset();
  }
  if (!target.has_value()) {
    return true;
  }

  model::BaselineStats updated;
  if (!calibrator_.UpdateBaseline(config_.agent_id, updated, error)) {
    return false;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  baseline_ = std::make_shared<const model::BaselineStats>(std::move(updated));
  return true;
}

std::optional<std::string> DriftMonitor::CurrentRunId() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return current_run_id_;
}

template <typename Detector>
void DriftMonitor::RunDetector(Detector& detector, const model::TraceEvent& event,
                               const model::BaselineStats* baseline,
                               std::vector<model::DriftEvent>& drifts,
                               std::string& persist_error) {
  std::optional<model::DriftEvent> drift;
  std::string detector_error;
  bool ok = false;
  try {
    ok = detector.Check(event, baseline, drift, detector_error);
  } catch (const std::exception& ex) {
    detector_error = ex.what();
  } catch (...) {
    detector_error = "non-standard exception";
  }
  if (!ok) {
    logger_.Error("detector failed",
                  {{"detector", detector.Name()},
                   {"event_id", event.event_id},
                   {"error", detector_error}});
    return;
  }
  if (!drift.has_value()) {
    return;
  }

  std::string save_error;
  if (!store_.SaveDrift(drift.value(), save_error)) {
    logger_.Error("failed to persist drift event",
                  {{"detector", detector.Name()},
                   {"event_id", drift->event_id},
                   {"error", save_error}});
    if (persist_error.empty()) {
      persist_error = save_error;
    }
    return;
  }

  drifts.push_back(drift.value());
  PublishDrift(drifts.back());
}

void DriftMonitor::PublishDrift(const model::DriftEvent& drift) {
  dispatcher_.Send(drift);

  std::vector<DriftCallback> callbacks;
  {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    callbacks = callbacks_;
  }
  for (const DriftCallback& callback : callbacks) {
    try {
      callback(drift);
    } catch (const std::exception& ex) {
      logger_.Warn("drift callback failed",
                   {{"event_id", drift.event_id}, {"error", ex.what()}});
    } catch (...) {
      logger_.Warn("drift callback failed",
                   {{"event_id", drift.event_id}, {"error", "non-standard exception"}});
    }
  }

  logger_.Warn("drift detected",
               {{"run_id", drift.run_id},
                {"severity", model::ToString(drift.severity)},
                {"detector", model::ToString(drift.detector)},
                {"message", drift.message}});
}

bool DriftMonitor::RecordEvent(const model::ActionType action_type, std::string action_name,
                               EventDetails details, std::vector<model::DriftEvent>& drifts,
                               std::string& error) {
  drifts.clear();

  std::string run_id;
  std::shared_ptr<const model::BaselineStats> baseline;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (details.run_id.has_value() && !details.run_id->empty()) {
      run_id = std::move(details.run_id.value());
    } else if (current_run_id_.has_value()) {
      run_id = current_run_id_.value();
    } else {
      run_id = core::GenerateShortId();
    }
    baseline = baseline_;
  }

  model::TraceEvent event =
      model::MakeTraceEvent(config_.agent_id, std::move(run_id), action_type,
                            std::move(action_name));
  event.token_count = details.token_count;
  event.input_data = std::move(details.input_data);
  event.output_data = std::move(details.output_data);
  event.duration_ms = details.duration_ms;
  event.metadata = std::move(details.metadata);

  if (!store_.SaveTrace(event, error)) {
    return false;
  }

  std::string persist_error;
  RunDetector(action_loop_, event, baseline.get(), drifts, persist_error);
  RunDetector(goal_drift_, event, baseline.get(), drifts, persist_error);
  RunDetector(resource_spike_, event, baseline.get(), drifts, persist_error);

  if (!persist_error.empty()) {
    error = persist_error;
    return false;
  }
  return true;
}

void DriftMonitor::OnDrift(DriftCallback callback) {
  std::lock_guard<std::mutex> lock(callbacks_mutex_);
  callbacks_.push_back(std::move(callback));
}

void DriftMonitor::SetGoal(std::string goal_description) {
  goal_drift_.SetGoal(std::move(goal_description));
}

std::optional<model::BaselineStats> DriftMonitor::Baseline() const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (baseline_ == nullptr) {
    return std::nullopt;
  }
  return *baseline_;
}

std::vector<model::DriftEvent> DriftMonitor::RecentAlerts(const double hours,
                                                          const std::size_t limit) {
  storage::DriftQuery query;
  query.agent_id = config_.agent_id;
  query.since = clock_() - hours * 3600.0;
  query.limit = limit;
  return store_.GetDriftEvents(query);
}

ScopedRun::ScopedRun(DriftMonitor& monitor, std::optional<std::string> goal,
                     std::optional<std::string> run_id)
    : monitor_(monitor), run_id_(monitor.StartRun(std::move(run_id), std::move(goal))) {}

ScopedRun::~ScopedRun() {
  if (finished_) {
    return;
  }
  std::string error;
  if (!Finish(error)) {
    monitor_.Log().Error("failed to end run", {{"run_id", run_id_}, {"error", error}});
  }
}

bool ScopedRun::Finish(std::string& error) {
  if (finished_) {
    return true;
  }
  finished_ = true;
  return monitor_.EndRun(run_id_, error);
}

std::int64_t EstimateTokens(std::string_view text) {
  return static_cast<std::int64_t>(text.size() / 4);
}

} // namespace agentwatch::monitor
