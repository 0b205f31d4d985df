#include "detectors/resource_spike_detector.hpp"

#include <catch2/catch.hpp>

#include <optional>
#include <string>

namespace model = agentwatch::model;
namespace json = agentwatch::core::json;
using agentwatch::detectors::ResourceSpikeConfig;
using agentwatch::detectors::ResourceSpikeDetector;

namespace {

model::TraceEvent Event(const std::string& run_id, std::int64_t tokens, double duration_ms = 0.0,
                        model::ActionType type = model::ActionType::kLlmRequest) {
  model::TraceEvent event = model::MakeTraceEvent("agent-a", run_id, type, "step");
  event.token_count = tokens;
  event.duration_ms = duration_ms;
  return event;
}

std::optional<model::DriftEvent> Check(ResourceSpikeDetector& detector,
                                       const model::TraceEvent& event,
                                       const model::BaselineStats* baseline = nullptr) {
  std::optional<model::DriftEvent> drift;
  std::string error;
  REQUIRE(detector.Check(event, baseline, drift, error));
  return drift;
}

model::BaselineStats CalibratedBaseline() {
  model::BaselineStats baseline;
  baseline.agent_id = "agent-a";
  baseline.calibration_runs = 30;
  baseline.mean_tokens_per_run = 200.0;
  baseline.std_tokens_per_run = 50.0;
  baseline.is_calibrated = true;
  return baseline;
}

} // namespace

TEST_CASE("Absolute token limit is exclusive", "[detectors][resource_spike]") {
  double now = 1000.0;
  ResourceSpikeConfig config;
  config.absolute_token_limit = 1000;
  ResourceSpikeDetector detector(config, [&now]() { return now; });

  for (int i = 0; i < 10; ++i) {
    REQUIRE_FALSE(Check(detector, Event("run-1", 100)).has_value());
  }

  const auto drift = Check(detector, Event("run-1", 100));
  REQUIRE(drift.has_value());
  REQUIRE(drift->detector == model::DetectorType::kResourceSpike);
  REQUIRE(drift->score == Catch::Detail::Approx(0.7));
  REQUIRE(drift->severity == model::Severity::kHigh);
  REQUIRE(drift->message == "Resource spike: token count 1,100 exceeds absolute limit (1,000)");

  const json::Value* metric = json::FindMember(drift->context, "metric");
  REQUIRE(metric != nullptr);
  REQUIRE(metric->string_value == "absolute_token_limit");
}

TEST_CASE("Large overruns raise the absolute score", "[detectors][resource_spike]") {
  double now = 1000.0;
  ResourceSpikeConfig config;
  config.absolute_token_limit = 1000;
  ResourceSpikeDetector detector(config, [&now]() { return now; });

  const auto drift = Check(detector, Event("run-1", 1950));
  REQUIRE(drift.has_value());
  REQUIRE(drift->score == Catch::Detail::Approx(0.95));
  REQUIRE(drift->severity == model::Severity::kCritical);
}

TEST_CASE("Calibrated baselines flag token burn", "[detectors][resource_spike]") {
  double now = 1000.0;
  ResourceSpikeConfig config;
  config.spike_multiplier = 2.0;
  ResourceSpikeDetector detector(config, [&now]() { return now; });
  const model::BaselineStats baseline = CalibratedBaseline();

  REQUIRE_FALSE(Check(detector, Event("run-1", 300), &baseline).has_value());

  const auto drift = Check(detector, Event("run-1", 200), &baseline);
  REQUIRE(drift.has_value());
  REQUIRE(drift->score == Catch::Detail::Approx(200.0 / 300.0));
  REQUIRE(drift->severity == model::Severity::kMed);
  REQUIRE(drift->message ==
          "Resource spike: token_burn at 500 tokens (baseline: 200 \xC2\xB1 50)");
  REQUIRE(drift->suggested_action ==
          "Check for malformed input or error loops causing elevated token_burn");

  const json::Value* threshold = json::FindMember(drift->context, "threshold");
  REQUIRE(threshold != nullptr);
  REQUIRE(threshold->number_value == Catch::Detail::Approx(300.0));
  const json::Value* totals = json::FindMember(drift->context, "run_totals");
  REQUIRE(totals != nullptr);
  REQUIRE(json::FindMember(*totals, "total_tokens")->number_value == 500.0);
}

TEST_CASE("Uncalibrated baselines only apply absolute limits", "[detectors][resource_spike]") {
  double now = 1000.0;
  ResourceSpikeDetector detector(ResourceSpikeConfig{}, [&now]() { return now; });
  model::BaselineStats baseline = CalibratedBaseline();
  baseline.is_calibrated = false;

  REQUIRE_FALSE(Check(detector, Event("run-1", 5000), &baseline).has_value());
}

TEST_CASE("The higher scoring layer wins", "[detectors][resource_spike]") {
  double now = 1000.0;
  ResourceSpikeConfig config;
  config.spike_multiplier = 2.0;
  config.absolute_token_limit = 400;
  ResourceSpikeDetector detector(config, [&now]() { return now; });
  const model::BaselineStats baseline = CalibratedBaseline();

  // Baseline layer: (500 - 300) / 300 = 0.67. Absolute layer: max(0.25, 0.7).
  const auto drift = Check(detector, Event("run-1", 500), &baseline);
  REQUIRE(drift.has_value());
  REQUIRE(drift->score == Catch::Detail::Approx(0.7));
  REQUIRE(drift->message == "Resource spike: token count 500 exceeds absolute limit (400)");

  // Baseline layer: (1300 - 300) / 300 saturates at 1.0.
  const auto bigger = Check(detector, Event("run-1", 800), &baseline);
  REQUIRE(bigger.has_value());
  REQUIRE(bigger->score == 1.0);
  REQUIRE(bigger->message.rfind("Resource spike: token_burn at 1300 tokens", 0) == 0);
}

TEST_CASE("Wall-clock limit fires for long runs", "[detectors][resource_spike]") {
  double now = 1000.0;
  ResourceSpikeDetector detector(ResourceSpikeConfig{}, [&now]() { return now; });

  REQUIRE_FALSE(Check(detector, Event("run-1", 10)).has_value());
  now += 300.0;
  REQUIRE_FALSE(Check(detector, Event("run-1", 10)).has_value());
  now += 1.0;

  const auto drift = Check(detector, Event("run-1", 10));
  REQUIRE(drift.has_value());
  REQUIRE(drift->score == Catch::Detail::Approx(0.8));
  REQUIRE(drift->severity == model::Severity::kHigh);
  REQUIRE(drift->message == "Resource spike: run duration 301.0s exceeds limit (300s)");
  REQUIRE(drift->suggested_action == "Agent may be hung or stuck; consider terminating the run");
}

TEST_CASE("Counters accumulate per run", "[detectors][resource_spike]") {
  double now = 1000.0;
  ResourceSpikeDetector detector(ResourceSpikeConfig{}, [&now]() { return now; });

  Check(detector, Event("run-1", 10, 5.0, model::ActionType::kToolCall));
  Check(detector, Event("run-1", 20, 7.0, model::ActionType::kLlmRequest));
  Check(detector, Event("run-1", 0, 1.0, model::ActionType::kStateTransition));
  Check(detector, Event("run-2", 99));

  const auto counter = detector.CounterFor("run-1");
  REQUIRE(counter.has_value());
  REQUIRE(counter->total_tokens == 30);
  REQUIRE(counter->total_duration_ms == 13.0);
  REQUIRE(counter->tool_calls == 1);
  REQUIRE(counter->llm_calls == 1);
  REQUIRE(counter->start_time == 1000.0);
  REQUIRE(detector.CounterFor("run-2")->total_tokens == 99);
}

TEST_CASE("Least recently touched runs are evicted", "[detectors][resource_spike]") {
  double now = 1000.0;
  ResourceSpikeConfig config;
  config.max_tracked_runs = 2;
  ResourceSpikeDetector detector(config, [&now]() { return now; });

  Check(detector, Event("run-1", 1));
  Check(detector, Event("run-2", 1));
  Check(detector, Event("run-1", 1));
  Check(detector, Event("run-3", 1));

  REQUIRE(detector.TrackedRunCount() == 2);
  REQUIRE(detector.CounterFor("run-1").has_value());
  REQUIRE(detector.CounterFor("run-1")->total_tokens == 2);
  REQUIRE_FALSE(detector.CounterFor("run-2").has_value());
  REQUIRE(detector.CounterFor("run-3").has_value());

  // An evicted run starts over.
  Check(detector, Event("run-2", 5));
  REQUIRE(detector.CounterFor("run-2")->total_tokens == 5);
  REQUIRE_FALSE(detector.CounterFor("run-1").has_value());
}

TEST_CASE("Disabled detector keeps no state", "[detectors][resource_spike]") {
  double now = 1000.0;
  ResourceSpikeConfig config;
  config.absolute_token_limit = 1;
  ResourceSpikeDetector detector(config, [&now]() { return now; });
  detector.SetEnabled(false);

  REQUIRE_FALSE(Check(detector, Event("run-1", 100)).has_value());
  REQUIRE(detector.TrackedRunCount() == 0);
}
