#pragma once

#include "model/baseline_stats.hpp"
#include "model/drift_event.hpp"
#include "model/trace_event.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace agentwatch::storage {
class TraceStore;
}

namespace agentwatch::detectors {

struct ActionLoopConfig {
  bool enabled = true;
  // Tool-call history considered per check.
  std::size_t window_size = 20;
  // Identical trailing calls (or identical trailing blocks) that count as a loop.
  std::size_t max_repeats = 4;
  // Longest repeating block tried by the sequence check.
  std::size_t sequence_length = 3;
};

// Result of the pure pattern matchers below.
struct LoopMatch {
  // One element for a single-tool repeat, the repeating block otherwise.
  std::vector<std::string> pattern;
  std::size_t repeat_count = 0;
};

// Fires when the last `max_repeats` names are identical. `repeat_count` is the
// full length of the identical trailing run.
std::optional<LoopMatch> FindSingleRepeat(const std::vector<std::string>& recent,
                                          std::size_t max_repeats);

// Tries block lengths 2..`sequence_length` in order and returns the first
// whose trailing block repeats back-to-back at least `max_repeats` times.
std::optional<LoopMatch> FindSequenceRepeat(const std::vector<std::string>& recent,
                                            std::size_t max_repeats,
                                            std::size_t sequence_length);

// Flags a run that keeps invoking the same tool, or the same short chain of
// tools, back-to-back. Only tool-call events are inspected; the history comes
// from the store, so the triggering event must already be persisted.
class ActionLoopDetector {
public:
  ActionLoopDetector(storage::TraceStore& store, ActionLoopConfig config);

  const char* Name() const {
    return "action_loop";
  }

  bool Enabled() const {
    return config_.enabled;
  }

  void SetEnabled(bool enabled) {
    config_.enabled = enabled;
  }

  const ActionLoopConfig& Config() const {
    return config_;
  }

  // Leaves `drift` empty when nothing is flagged. Returns false only on an
  // internal failure.
  bool Check(const model::TraceEvent& event, const model::BaselineStats* baseline,
             std::optional<model::DriftEvent>& drift, std::string& error);

private:
  storage::TraceStore& store_;
  ActionLoopConfig config_;
};

} // namespace agentwatch::detectors
