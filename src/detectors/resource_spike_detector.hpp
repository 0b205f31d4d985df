#pragma once

#include "model/baseline_stats.hpp"
#include "model/drift_event.hpp"
#include "model/trace_event.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace agentwatch::detectors {

struct ResourceSpikeConfig {
  bool enabled = true;
  // Standard deviations above the baseline mean that count as a spike.
  double spike_multiplier = 2.5;
  // Exclusive: a run drifts once its total exceeds the limit.
  std::int64_t absolute_token_limit = 50'000;
  double absolute_duration_limit_ms = 300'000.0;
  std::size_t max_tracked_runs = 10;
};

// Cumulative consumption of one run as seen by this detector.
struct RunCounter {
  std::int64_t total_tokens = 0;
  double total_duration_ms = 0.0;
  std::uint64_t tool_calls = 0;
  std::uint64_t llm_calls = 0;
  // Wall clock (epoch seconds) when the run was first observed.
  double start_time = 0.0;
};

// Flags runs whose consumption leaves the calibrated norm or crosses hard
// ceilings.
//
// Every event updates the run counter first. With a calibrated baseline the
// token, duration and tool-call totals are compared against
// mean + multiplier * max(std, 0.1 * mean), first exceeding metric wins. The
// absolute token and wall-clock ceilings are evaluated on every event; when
// both layers fire the higher score is reported.
//
// At most `max_tracked_runs` counters are kept; the least recently touched run
// is evicted first. Safe for concurrent use.
class ResourceSpikeDetector {
public:
  using Clock = std::function<double()>;

  explicit ResourceSpikeDetector(ResourceSpikeConfig config, Clock clock = {});

  const char* Name() const {
    return "resource_spike";
  }

  bool Enabled() const;
  void SetEnabled(bool enabled);

  bool Check(const model::TraceEvent& event, const model::BaselineStats* baseline,
             std::optional<model::DriftEvent>& drift, std::string& error);

  std::optional<RunCounter> CounterFor(const std::string& run_id) const;
  std::size_t TrackedRunCount() const;

private:
  struct TrackedRun {
    RunCounter counter;
    std::list<std::string>::iterator recency;
  };

  // Caller holds `mutex_`.
  RunCounter& TouchCounter(const std::string& run_id);

  Clock clock_;

  mutable std::mutex mutex_;
  ResourceSpikeConfig config_;
  // Front is the most recently touched run.
  std::list<std::string> recency_;
  std::unordered_map<std::string, TrackedRun> runs_;
};

} // namespace agentwatch::detectors
