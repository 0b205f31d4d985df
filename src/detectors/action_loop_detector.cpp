#include "detectors/action_loop_detector.hpp"

#include "core/json_dom.hpp"
#include "storage/trace_store.hpp"

#include <algorithm>
#include <cstddef>
#include <utility>

namespace agentwatch::detectors {

namespace {

constexpr std::size_t kSingleRepeatPreview = 10;
constexpr std::size_t kSequenceRepeatPreview = 15;

std::vector<std::string> TailOf(const std::vector<std::string>& items, const std::size_t count) {
  const std::size_t start = items.size() > count ? items.size() - count : 0;
  return std::vector<std::string>(items.begin() + static_cast<std::ptrdiff_t>(start), items.end());
}

double LoopScore(const std::size_t repeat_count, const std::size_t max_repeats) {
  const double ratio =
      static_cast<double>(repeat_count) / static_cast<double>(max_repeats * 2);
  return std::min(1.0, ratio);
}

std::string JoinSequence(const std::vector<std::string>& pattern) {
  std::string joined;
  for (std::size_t i = 0; i < pattern.size(); ++i) {
    if (i > 0) {
      joined += " \xE2\x86\x92 ";
    }
    joined += pattern[i];
  }
  return joined;
}

} // namespace

std::optional<LoopMatch> FindSingleRepeat(const std::vector<std::string>& recent,
                                          const std::size_t max_repeats) {
  if (max_repeats == 0 || recent.size() < max_repeats) {
    return std::nullopt;
  }

  const std::string& last = recent.back();
  const bool tail_identical =
      std::all_of(recent.end() - static_cast<std::ptrdiff_t>(max_repeats), recent.end(),
                  [&last](const std::string& name) { return name == last; });
  if (!tail_identical) {
    return std::nullopt;
  }

  std::size_t repeat_count = 0;
  for (auto it = recent.rbegin(); it != recent.rend() && *it == last; ++it) {
    ++repeat_count;
  }
  return LoopMatch{.pattern = {last}, .repeat_count = repeat_count};
}

std::optional<LoopMatch> FindSequenceRepeat(const std::vector<std::string>& recent,
                                            const std::size_t max_repeats,
                                            const std::size_t sequence_length) {
  if (max_repeats == 0) {
    return std::nullopt;
  }

  for (std::size_t length = 2; length <= sequence_length; ++length) {
    if (recent.size() < length * max_repeats) {
      continue;
    }

    const auto pattern_begin = recent.end() - static_cast<std::ptrdiff_t>(length);
    std::size_t repeat_count = 0;
    // Walk back one block at a time while each block equals the trailing one.
    for (std::size_t end = recent.size(); end >= length; end -= length) {
      const auto block_begin = recent.begin() + static_cast<std::ptrdiff_t>(end - length);
      if (!std::equal(block_begin, block_begin + static_cast<std::ptrdiff_t>(length),
                      pattern_begin)) {
        break;
      }
      ++repeat_count;
    }

    if (repeat_count >= max_repeats) {
      return LoopMatch{.pattern = std::vector<std::string>(pattern_begin, recent.end()),
                       .repeat_count = repeat_count};
    }
  }
  return std::nullopt;
}

ActionLoopDetector::ActionLoopDetector(storage::TraceStore& store, ActionLoopConfig config)
    : store_(store), config_(config) {}

bool ActionLoopDetector::Check(const model::TraceEvent& event,
                               const model::BaselineStats* /*baseline*/,
                               std::optional<model::DriftEvent>& drift,
                               std::string& /*error*/) {
  drift.reset();
  if (!config_.enabled || event.action_type != model::ActionType::kToolCall) {
    return true;
  }

  const std::vector<std::string> recent =
      store_.GetRecentActions(event.agent_id, event.run_id, config_.window_size);
  if (recent.size() < config_.max_repeats) {
    return true;
  }

  if (const auto single = FindSingleRepeat(recent, config_.max_repeats)) {
    const std::string& tool_name = single->pattern.front();
    const std::string count = std::to_string(single->repeat_count);
    drift = model::MakeDriftEvent(
        event.agent_id, event.run_id, model::DetectorType::kActionLoop,
        LoopScore(single->repeat_count, config_.max_repeats),
        "Action loop: " + tool_name + " called " + count + "x consecutively",
        "Check " + tool_name + " input/output for stale data or error loops",
        core::json::MakeObject({
            {"tool_name", core::json::MakeString(tool_name)},
            {"repeat_count", core::json::MakeNumber(static_cast<double>(single->repeat_count))},
            {"recent_actions",
             core::json::MakeStringArray(TailOf(recent, kSingleRepeatPreview))},
        }));
    return true;
  }

  if (const auto sequence =
          FindSequenceRepeat(recent, config_.max_repeats, config_.sequence_length)) {
    const std::string count = std::to_string(sequence->repeat_count);
    drift = model::MakeDriftEvent(
        event.agent_id, event.run_id, model::DetectorType::kActionLoop,
        LoopScore(sequence->repeat_count, config_.max_repeats),
        "Action loop: sequence [" + JoinSequence(sequence->pattern) + "] repeated " + count + "x",
        "Review agent logic for circular tool dependencies",
        core::json::MakeObject({
            {"sequence", core::json::MakeStringArray(sequence->pattern)},
            {"repeat_count",
             core::json::MakeNumber(static_cast<double>(sequence->repeat_count))},
            {"recent_actions",
             core::json::MakeStringArray(TailOf(recent, kSequenceRepeatPreview))},
        }));
  }
  return true;
}

} // namespace agentwatch::detectors
