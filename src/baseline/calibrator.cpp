#include "baseline/calibrator.hpp"

#include "core/json_utils.hpp"
#include "core/logging/logger.hpp"
#include "storage/trace_store.hpp"

#include <algorithm>
#include <cstddef>
#include <cmath>
#include <map>
#include <set>
#include <utility>

namespace agentwatch::baseline {

namespace {

constexpr std::size_t kSequenceWindow = 50;
constexpr std::size_t kMinSequenceLength = 2;
constexpr std::size_t kMaxSequenceLength = 4;

} // namespace

PopulationStats ComputePopulationStats(const std::vector<double>& samples) {
  PopulationStats stats;
  if (samples.empty()) {
    return stats;
  }

  double sum = 0.0;
  for (const double sample : samples) {
    sum += sample;
  }
  stats.mean = sum / static_cast<double>(samples.size());
  if (samples.size() < 2) {
    return stats;
  }

  double squared = 0.0;
  for (const double sample : samples) {
    const double delta = sample - stats.mean;
    squared += delta * delta;
  }
  stats.std = std::sqrt(squared / static_cast<double>(samples.size()));
  return stats;
}

std::vector<std::vector<std::string>> FindCommonSequences(
    const std::vector<std::vector<std::string>>& runs, const std::size_t top_n) {
  using Sequence = std::vector<std::string>;

  std::map<Sequence, std::size_t> counts;
  std::vector<Sequence> first_seen;
  for (const Sequence& run : runs) {
    std::set<Sequence> seen_in_run;
    const std::size_t max_length = std::min(run.size(), kMaxSequenceLength);
    for (std::size_t length = kMinSequenceLength; length <= max_length; ++length) {
      for (std::size_t i = 0; i + length <= run.size(); ++i) {
        Sequence subsequence(run.begin() + static_cast<std::ptrdiff_t>(i),
                             run.begin() + static_cast<std::ptrdiff_t>(i + length));
        if (!seen_in_run.insert(subsequence).second) {
          continue;
        }
        auto [it, inserted] = counts.emplace(subsequence, 0);
        if (inserted) {
          first_seen.push_back(std::move(subsequence));
        }
        ++it->second;
      }
    }
  }

  std::stable_sort(first_seen.begin(), first_seen.end(),
                   [&counts](const Sequence& left, const Sequence& right) {
                     return counts.at(left) > counts.at(right);
                   });
  if (first_seen.size() > top_n) {
    first_seen.resize(top_n);
  }
  return first_seen;
}

Calibrator::Calibrator(storage::TraceStore& store, core::logging::Logger& logger,
                       const std::size_t required_runs)
    : store_(store), logger_(logger), required_runs_(required_runs) {}

bool Calibrator::UpdateBaseline(const std::string& agent_id, model::BaselineStats& baseline,
                                std::string& error) {
  model::BaselineStats updated;
  updated.agent_id = agent_id;

  const std::vector<std::string> run_ids = store_.GetRunIds(agent_id, required_runs_);
  if (!run_ids.empty()) {
    std::vector<double> tokens;
    std::vector<double> tools;
    std::vector<double> durations;
    std::vector<std::vector<std::string>> sequences;
    tokens.reserve(run_ids.size());
    tools.reserve(run_ids.size());
    durations.reserve(run_ids.size());

    for (const std::string& run_id : run_ids) {
      const model::RunStats stats = store_.GetRunStats(agent_id, run_id);
      tokens.push_back(static_cast<double>(stats.total_tokens));
      tools.push_back(static_cast<double>(stats.tool_calls));
      durations.push_back(stats.total_duration_ms);

      std::vector<std::string> actions =
          store_.GetRecentActions(agent_id, run_id, kSequenceWindow);
      if (!actions.empty()) {
        sequences.push_back(std::move(actions));
      }
    }

    const PopulationStats token_stats = ComputePopulationStats(tokens);
    const PopulationStats tool_stats = ComputePopulationStats(tools);
    const PopulationStats duration_stats = ComputePopulationStats(durations);

    updated.calibration_runs = run_ids.size();
    updated.mean_tokens_per_run = token_stats.mean;
    updated.std_tokens_per_run = token_stats.std;
    updated.mean_tools_per_run = tool_stats.mean;
    updated.std_tools_per_run = tool_stats.std;
    updated.mean_duration_ms = duration_stats.mean;
    updated.std_duration_ms = duration_stats.std;
    updated.common_sequences = FindCommonSequences(sequences);
    updated.is_calibrated = required_runs_ > 0 && run_ids.size() >= required_runs_;
  }

  if (!store_.SaveBaseline(updated, error)) {
    error = "failed to persist baseline for '" + agent_id + "': " + error;
    return false;
  }

  const std::string runs = std::to_string(updated.calibration_runs);
  if (updated.is_calibrated) {
    logger_.Info("baseline calibrated",
                 {{"target_agent", agent_id},
                  {"runs", runs},
                  {"mean_tokens", core::FormatDouble(updated.mean_tokens_per_run, 0)},
                  {"mean_tools", core::FormatDouble(updated.mean_tools_per_run, 1)}});
  } else {
    logger_.Info("baseline partial",
                 {{"target_agent", agent_id},
                  {"runs", runs},
                  {"required_runs", std::to_string(required_runs_)}});
  }

  baseline = std::move(updated);
  return true;
}

} // namespace agentwatch::baseline
