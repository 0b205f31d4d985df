#include "detectors/resource_spike_detector.hpp"

#include "core/json_dom.hpp"
#include "core/json_utils.hpp"
#include "core/time_utils.hpp"

#include <algorithm>
#include <array>
#include <utility>

namespace agentwatch::detectors {

namespace {

constexpr double kMinStdFractionOfMean = 0.1;
constexpr double kMinSpikeOverMean = 1.5;
constexpr double kMinAbsoluteTokenScore = 0.7;
constexpr double kDurationLimitScore = 0.8;

struct MetricCheck {
  const char* name;
  double current;
  double mean;
  double std;
  const char* unit;
};

core::json::Value RunTotalsJson(const RunCounter& counter) {
  return core::json::MakeObject({
      {"total_tokens", core::json::MakeNumber(static_cast<double>(counter.total_tokens))},
      {"total_duration_ms", core::json::MakeNumber(counter.total_duration_ms)},
      {"tool_calls", core::json::MakeNumber(static_cast<double>(counter.tool_calls))},
      {"llm_calls", core::json::MakeNumber(static_cast<double>(counter.llm_calls))},
      {"start_time", core::json::MakeNumber(counter.start_time)},
  });
}

std::optional<model::DriftEvent> CheckBaselineSpike(const model::TraceEvent& event,
                                                    const model::BaselineStats& baseline,
                                                    const RunCounter& counter,
                                                    const double multiplier) {
  const std::array<MetricCheck, 3> checks = {{
      {"token_burn", static_cast<double>(counter.total_tokens), baseline.mean_tokens_per_run,
       baseline.std_tokens_per_run, "tokens"},
      {"duration", counter.total_duration_ms, baseline.mean_duration_ms,
       baseline.std_duration_ms, "ms"},
      {"tool_calls", static_cast<double>(counter.tool_calls), baseline.mean_tools_per_run,
       baseline.std_tools_per_run, "calls"},
  }};

  for (const MetricCheck& check : checks) {
    if (check.mean == 0.0 && check.std == 0.0) {
      continue;
    }

    const double threshold =
        check.mean + multiplier * std::max(check.std, check.mean * kMinStdFractionOfMean);
    if (check.current <= threshold || check.current <= check.mean * kMinSpikeOverMean) {
      continue;
    }

    const double score = std::min(1.0, (check.current - threshold) / std::max(threshold, 1.0));
    const std::string metric(check.name);
    return model::MakeDriftEvent(
        event.agent_id, event.run_id, model::DetectorType::kResourceSpike, score,
        "Resource spike: " + metric + " at " + core::FormatDouble(check.current, 0) + " " +
            check.unit + " (baseline: " + core::FormatDouble(check.mean, 0) + " \xC2\xB1 " +
            core::FormatDouble(check.std, 0) + ")",
        "Check for malformed input or error loops causing elevated " + metric,
        core::json::MakeObject({
            {"metric", core::json::MakeString(metric)},
            {"current", core::json::MakeNumber(check.current)},
            {"baseline_mean", core::json::MakeNumber(check.mean)},
            {"baseline_std", core::json::MakeNumber(check.std)},
            {"threshold", core::json::MakeNumber(threshold)},
            {"run_totals", RunTotalsJson(counter)},
        }));
  }
  return std::nullopt;
}

std::optional<model::DriftEvent> CheckAbsoluteLimits(const model::TraceEvent& event,
                                                     const RunCounter& counter,
                                                     const ResourceSpikeConfig& config,
                                                     const double now) {
  if (counter.total_tokens > config.absolute_token_limit) {
    const double limit = static_cast<double>(config.absolute_token_limit);
    const double overrun =
        std::min(1.0, (static_cast<double>(counter.total_tokens) - limit) / limit);
    return model::MakeDriftEvent(
        event.agent_id, event.run_id, model::DetectorType::kResourceSpike,
        std::max(overrun, kMinAbsoluteTokenScore),
        "Resource spike: token count " + core::WithThousands(counter.total_tokens) +
            " exceeds absolute limit (" + core::WithThousands(config.absolute_token_limit) + ")",
        "Investigate agent run: token consumption is abnormally high",
        core::json::MakeObject({
            {"metric", core::json::MakeString("absolute_token_limit")},
            {"current_tokens", core::json::MakeNumber(static_cast<double>(counter.total_tokens))},
            {"limit", core::json::MakeNumber(limit)},
        }));
  }

  const double elapsed_ms = (now - counter.start_time) * 1000.0;
  if (elapsed_ms > config.absolute_duration_limit_ms) {
    return model::MakeDriftEvent(
        event.agent_id, event.run_id, model::DetectorType::kResourceSpike, kDurationLimitScore,
        "Resource spike: run duration " + core::FormatDouble(elapsed_ms / 1000.0, 1) +
            "s exceeds limit (" + core::FormatDouble(config.absolute_duration_limit_ms / 1000.0, 0) +
            "s)",
        "Agent may be hung or stuck; consider terminating the run",
        core::json::MakeObject({
            {"metric", core::json::MakeString("absolute_duration_limit")},
            {"elapsed_ms", core::json::MakeNumber(elapsed_ms)},
            {"limit_ms", core::json::MakeNumber(config.absolute_duration_limit_ms)},
        }));
  }
  return std::nullopt;
}

} // namespace

ResourceSpikeDetector::ResourceSpikeDetector(ResourceSpikeConfig config, Clock clock)
    : clock_(clock ? std::move(clock) : Clock(&core::NowEpochSeconds)), config_(config) {}

bool ResourceSpikeDetector::Enabled() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return config_.enabled;
}

void ResourceSpikeDetector::SetEnabled(const bool enabled) {
  std::lock_guard<std::mutex> lock(mutex_);
  config_.enabled = enabled;
}

RunCounter& ResourceSpikeDetector::TouchCounter(const std::string& run_id) {
  const auto found = runs_.find(run_id);
  if (found != runs_.end()) {
    recency_.splice(recency_.begin(), recency_, found->second.recency);
    return found->second.counter;
  }

  recency_.push_front(run_id);
  TrackedRun& tracked = runs_[run_id];
  tracked.recency = recency_.begin();
  tracked.counter.start_time = clock_();

  while (config_.max_tracked_runs > 0 && runs_.size() > config_.max_tracked_runs) {
    runs_.erase(recency_.back());
    recency_.pop_back();
  }
  return tracked.counter;
}

bool ResourceSpikeDetector::Check(const model::TraceEvent& event,
                                  const model::BaselineStats* baseline,
                                  std::optional<model::DriftEvent>& drift,
                                  std::string& /*error*/) {
  drift.reset();
  std::lock_guard<std::mutex> lock(mutex_);
  if (!config_.enabled) {
    return true;
  }

  RunCounter& counter = TouchCounter(event.run_id);
  counter.total_tokens += event.token_count;
  counter.total_duration_ms += event.duration_ms;
  if (event.action_type == model::ActionType::kToolCall) {
    ++counter.tool_calls;
  } else if (event.action_type == model::ActionType::kLlmRequest) {
    ++counter.llm_calls;
  }

  std::optional<model::DriftEvent> spike;
  if (baseline != nullptr && baseline->is_calibrated) {
    spike = CheckBaselineSpike(event, *baseline, counter, config_.spike_multiplier);
  }
  std::optional<model::DriftEvent> limit = CheckAbsoluteLimits(event, counter, config_, clock_());

  if (spike.has_value() && (!limit.has_value() || spike->score >= limit->score)) {
    drift = std::move(spike);
  } else {
    drift = std::move(limit);
  }
  return true;
}

std::optional<RunCounter> ResourceSpikeDetector::CounterFor(const std::string& run_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto found = runs_.find(run_id);
  if (found == runs_.end()) {
    return std::nullopt;
  }
  return found->second.counter;
}

std::size_t ResourceSpikeDetector::TrackedRunCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return runs_.size();
}

} // namespace agentwatch::detectors
