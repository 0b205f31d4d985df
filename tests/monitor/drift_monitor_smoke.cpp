#include "common/assertions.hpp"
#include "common/temp_dir.hpp"
#include "core/logging/logger.hpp"
#include "monitor/drift_monitor.hpp"

#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace model = agentwatch::model;
namespace json = agentwatch::core::json;
namespace monitor = agentwatch::monitor;
using agentwatch::core::logging::LogLevel;
using agentwatch::core::logging::Logger;
using agentwatch::tests::common::AssertContains;
using agentwatch::tests::common::Expect;
using agentwatch::tests::common::Fail;
using agentwatch::tests::common::ScopedTempDir;

namespace {

class CountingTransport final : public agentwatch::alerts::IWebhookTransport {
public:
  explicit CountingTransport(std::vector<std::string>& bodies) : bodies_(bodies) {}

  bool Post(const std::string& /*url*/, const std::string& json_body,
            std::chrono::milliseconds /*timeout*/, int& status_code,
            std::string& /*error*/) override {
    bodies_.push_back(json_body);
    status_code = 204;
    return true;
  }

private:
  std::vector<std::string>& bodies_;
};

std::vector<model::DriftEvent> RecordOrFail(monitor::DriftMonitor& drift_monitor,
                                            model::ActionType type, const std::string& name,
                                            monitor::EventDetails details = {}) {
  std::vector<model::DriftEvent> drifts;
  std::string error;
  if (!drift_monitor.RecordEvent(type, name, std::move(details), drifts, error)) {
    Fail("RecordEvent failed: " + error);
  }
  return drifts;
}

} // namespace

int main() {
  ScopedTempDir temp("agentwatch-monitor-smoke");
  std::ostringstream log_sink;
  Logger logger(LogLevel::kInfo, log_sink);

  monitor::MonitorConfig config = monitor::DefaultMonitorConfig("smoke-agent");
  config.db_path = temp.DbPath();
  config.calibration_runs = 2;
  config.alerts.webhook_url = "https://alerts.example.com/hook";

  std::vector<std::string> posted;
  monitor::MonitorDependencies dependencies;
  dependencies.webhook_transport = std::make_unique<CountingTransport>(posted);

  monitor::DriftMonitor drift_monitor(config, logger, std::move(dependencies));
  std::string error;
  if (!drift_monitor.Open(error)) {
    Fail("monitor open failed: " + error);
  }
  AssertContains(log_sink.str(), "monitor initialised");
  AssertContains(log_sink.str(), "baseline=\"pending\"");
  AssertContains(log_sink.str(), "agent_id=\"smoke-agent\"");
  Expect(!drift_monitor.Baseline().has_value(), "fresh database must not have a baseline");

  std::vector<model::DriftEvent> observed;
  bool throwing_callback_ran = false;
  drift_monitor.OnDrift([&throwing_callback_ran](const model::DriftEvent&) {
    throwing_callback_ran = true;
    throw std::runtime_error("callback exploded");
  });
  drift_monitor.OnDrift([&observed](const model::DriftEvent& drift) { observed.push_back(drift); });

  // Run 1: a tool loop and an off-topic answer.
  const std::string run_id = drift_monitor.StartRun(
      std::string("run-loop"), std::string("Optimise delivery routes for the truck fleet"));
  Expect(run_id == "run-loop", "explicit run id must be kept");
  Expect(drift_monitor.CurrentRunId() == std::optional<std::string>("run-loop"),
         "current run must be tracked");

  for (int i = 0; i < 3; ++i) {
    Expect(RecordOrFail(drift_monitor, model::ActionType::kToolCall, "search_web").empty(),
           "no drift expected before the loop threshold");
  }
  const auto fourth = RecordOrFail(drift_monitor, model::ActionType::kToolCall, "search_web");
  Expect(fourth.size() == 1 && fourth.front().detector == model::DetectorType::kActionLoop,
         "fourth identical call must flag a loop");
  const auto fifth = RecordOrFail(drift_monitor, model::ActionType::kToolCall, "search_web");
  Expect(fifth.size() == 1 && fifth.front().severity == model::Severity::kMed,
         "fifth identical call must flag a MED loop");
  Expect(fifth.front().run_id == "run-loop", "drift must carry the run id");

  monitor::EventDetails off_topic;
  off_topic.token_count = monitor::EstimateTokens("Chocolate cake recipe with vanilla frosting");
  off_topic.output_data = json::MakeObject(
      {{"text", json::MakeString("Chocolate cake recipe with vanilla frosting and sprinkles")}});
  const auto goal_drifts = RecordOrFail(drift_monitor, model::ActionType::kLlmRequest,
                                        "completion", std::move(off_topic));
  Expect(goal_drifts.size() == 1 && goal_drifts.front().detector == model::DetectorType::kGoalDrift,
         "off-topic output must flag goal drift");

  Expect(observed.size() == 3, "every drift must reach the registered callbacks");
  Expect(throwing_callback_ran, "throwing callback must still be invoked");
  AssertContains(log_sink.str(), "drift callback failed");
  AssertContains(log_sink.str(), "callback exploded");
  AssertContains(log_sink.str(), "drift detected");

  // Loop drifts share a cooldown slot; the goal drift has its own.
  Expect(posted.size() == 2, "cooldown must suppress the repeated loop alert");
  AssertContains(posted.front(), "\"source\":\"agentwatch\"");

  if (!drift_monitor.EndRun(std::nullopt, error)) {
    Fail("EndRun failed: " + error);
  }
  Expect(!drift_monitor.CurrentRunId().has_value(), "EndRun must clear the current run");
  const auto partial = drift_monitor.Baseline();
  Expect(partial.has_value() && !partial->is_calibrated && partial->calibration_runs == 1,
         "one run must produce a partial baseline");
  AssertContains(log_sink.str(), "baseline partial");

  // Run 2 closes through the scoped guard and completes calibration.
  {
    monitor::ScopedRun scoped(drift_monitor);
    Expect(!scoped.RunId().empty(), "scoped run must generate an id");
    monitor::EventDetails details;
    details.token_count = 120;
    details.duration_ms = 40.0;
    RecordOrFail(drift_monitor, model::ActionType::kToolCall, "plan_route", std::move(details));
    RecordOrFail(drift_monitor, model::ActionType::kStateTransition, "done");
  }
  const auto calibrated = drift_monitor.Baseline();
  Expect(calibrated.has_value() && calibrated->is_calibrated &&
             calibrated->calibration_runs == 2,
         "second run must complete calibration");
  AssertContains(log_sink.str(), "baseline calibrated");

  const auto alerts = drift_monitor.RecentAlerts();
  Expect(alerts.size() == 3, "all persisted drifts must be listed");
  Expect(alerts.front().detector == model::DetectorType::kGoalDrift,
         "recent alerts must be newest first");

  // A reopened monitor picks up the stored baseline.
  std::ostringstream reopen_sink;
  Logger reopen_logger(LogLevel::kInfo, reopen_sink);
  monitor::DriftMonitor reopened(config, reopen_logger);
  if (!reopened.Open(error)) {
    Fail("reopen failed: " + error);
  }
  AssertContains(reopen_sink.str(), "baseline=\"calibrated\"");
  Expect(reopened.Baseline().has_value() && reopened.Baseline()->is_calibrated,
         "reopened monitor must load the calibrated baseline");

  Expect(monitor::EstimateTokens("abcdefgh") == 2, "token estimate is four bytes per token");
  Expect(monitor::EstimateTokens("abc") == 0, "token estimate rounds down");
  return 0;
}
