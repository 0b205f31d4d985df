#pragma once

#include "model/baseline_stats.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace agentwatch::core::logging {
class Logger;
}

namespace agentwatch::storage {
class TraceStore;
}

namespace agentwatch::baseline {

struct PopulationStats {
  double mean = 0.0;
  double std = 0.0;
};

// Population mean and standard deviation. The deviation is 0 for fewer than
// two samples; both are 0 for no samples.
PopulationStats ComputePopulationStats(const std::vector<double>& samples);

// Contiguous subsequences of length 2..4 counted once per run they appear in.
// Returns at most `top_n`, most frequent first; ties keep first-seen order.
std::vector<std::vector<std::string>> FindCommonSequences(
    const std::vector<std::vector<std::string>>& runs, std::size_t top_n = 5);

// Rebuilds an agent's baseline from its most recent runs.
//
// Up to `required_runs` of the latest runs are aggregated; the baseline counts
// as calibrated once that many runs exist. The result always replaces the
// stored baseline, including the empty one written for an agent without runs.
class Calibrator {
public:
  Calibrator(storage::TraceStore& store, core::logging::Logger& logger,
             std::size_t required_runs = 30);

  std::size_t RequiredRuns() const {
    return required_runs_;
  }

  // Fails only when the new baseline cannot be persisted.
  bool UpdateBaseline(const std::string& agent_id, model::BaselineStats& baseline,
                      std::string& error);

private:
  storage::TraceStore& store_;
  core::logging::Logger& logger_;
  std::size_t required_runs_;
};

} // namespace agentwatch::baseline
