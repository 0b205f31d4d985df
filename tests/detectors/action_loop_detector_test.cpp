#include "common/temp_dir.hpp"
#include "core/logging/logger.hpp"
#include "detectors/action_loop_detector.hpp"
#include "storage/trace_store.hpp"

#include <catch2/catch.hpp>

#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace model = agentwatch::model;
namespace json = agentwatch::core::json;
using agentwatch::core::logging::LogLevel;
using agentwatch::core::logging::Logger;
using agentwatch::detectors::ActionLoopConfig;
using agentwatch::detectors::ActionLoopDetector;
using agentwatch::detectors::FindSequenceRepeat;
using agentwatch::detectors::FindSingleRepeat;
using agentwatch::storage::TraceStore;
using agentwatch::tests::common::ScopedTempDir;

namespace {

// Persists tool calls the way the monitor does and checks the last one.
class LoopFixture {
public:
  explicit LoopFixture(ActionLoopConfig config = {})
      : temp_("agentwatch-action-loop"),
        logger_(LogLevel::kError, log_sink_),
        store_(temp_.DbPath(), logger_),
        detector_(store_, config) {
    std::string error;
    if (!store_.Open(error)) {
      agentwatch::tests::common::Fail("store open failed: " + error);
    }
  }

  std::optional<model::DriftEvent> Record(const std::string& name,
                                          model::ActionType type = model::ActionType::kToolCall) {
    const model::TraceEvent event = model::MakeTraceEvent("agent-a", "run-1", type, name);
    std::string error;
    if (!store_.SaveTrace(event, error)) {
      agentwatch::tests::common::Fail("save failed: " + error);
    }
    std::optional<model::DriftEvent> drift;
    if (!detector_.Check(event, nullptr, drift, error)) {
      agentwatch::tests::common::Fail("check failed: " + error);
    }
    return drift;
  }

  ActionLoopDetector& Detector() {
    return detector_;
  }

private:
  ScopedTempDir temp_;
  std::ostringstream log_sink_;
  Logger logger_;
  TraceStore store_;
  ActionLoopDetector detector_;
};

} // namespace

TEST_CASE("FindSingleRepeat reports the full identical tail", "[detectors][action_loop]") {
  const std::vector<std::string> recent = {"a", "b", "b", "b", "b", "b"};
  const auto match = FindSingleRepeat(recent, 4);
  REQUIRE(match.has_value());
  REQUIRE(match->pattern == std::vector<std::string>{"b"});
  REQUIRE(match->repeat_count == 5);

  REQUIRE_FALSE(FindSingleRepeat({"b", "b", "b", "a"}, 3).has_value());
  REQUIRE_FALSE(FindSingleRepeat({"b", "b"}, 3).has_value());
}

TEST_CASE("FindSequenceRepeat counts back-to-back blocks", "[detectors][action_loop]") {
  const std::vector<std::string> recent = {"x", "a", "b", "c", "a", "b", "c", "a", "b", "c"};
  const auto match = FindSequenceRepeat(recent, 3, 3);
  REQUIRE(match.has_value());
  REQUIRE(match->pattern == std::vector<std::string>{"a", "b", "c"});
  REQUIRE(match->repeat_count == 3);

  // Shorter blocks are tried first.
  const auto pair = FindSequenceRepeat({"a", "b", "a", "b", "a", "b"}, 3, 3);
  REQUIRE(pair.has_value());
  REQUIRE(pair->pattern == std::vector<std::string>{"a", "b"});

  REQUIRE_FALSE(FindSequenceRepeat({"a", "b", "a", "c", "a", "b"}, 2, 3).has_value());
  REQUIRE_FALSE(FindSequenceRepeat({"a", "b", "a", "b"}, 3, 2).has_value());
}

TEST_CASE("Five identical tool calls flag a loop", "[detectors][action_loop]") {
  LoopFixture fixture;
  for (int i = 0; i < 3; ++i) {
    REQUIRE_FALSE(fixture.Record("search_web").has_value());
  }

  const auto fourth = fixture.Record("search_web");
  REQUIRE(fourth.has_value());
  REQUIRE(fourth->score == Catch::Detail::Approx(0.5));

  const auto drift = fixture.Record("search_web");
  REQUIRE(drift.has_value());
  REQUIRE(drift->detector == model::DetectorType::kActionLoop);
  REQUIRE(drift->score == Catch::Detail::Approx(0.625));
  REQUIRE(drift->severity == model::Severity::kMed);
  REQUIRE(drift->message == "Action loop: search_web called 5x consecutively");
  REQUIRE(drift->suggested_action ==
          "Check search_web input/output for stale data or error loops");

  const json::Value* repeat_count = json::FindMember(drift->context, "repeat_count");
  REQUIRE(repeat_count != nullptr);
  REQUIRE(repeat_count->number_value == 5.0);
  const json::Value* recent = json::FindMember(drift->context, "recent_actions");
  REQUIRE(recent != nullptr);
  REQUIRE(recent->array_value.size() == 5);
}

TEST_CASE("Distinct tool calls never flag", "[detectors][action_loop]") {
  LoopFixture fixture;
  for (int i = 0; i < 20; ++i) {
    REQUIRE_FALSE(fixture.Record("tool_" + std::to_string(i)).has_value());
  }
}

TEST_CASE("Repeating tool pairs flag a sequence loop", "[detectors][action_loop]") {
  LoopFixture fixture;
  std::optional<model::DriftEvent> drift;
  for (int i = 0; i < 4; ++i) {
    drift = fixture.Record("fetch_page");
    REQUIRE_FALSE(drift.has_value());
    drift = fixture.Record("parse_page");
  }

  REQUIRE(drift.has_value());
  REQUIRE(drift->score == Catch::Detail::Approx(0.5));
  REQUIRE(drift->message ==
          "Action loop: sequence [fetch_page \xE2\x86\x92 parse_page] repeated 4x");
  REQUIRE(drift->suggested_action == "Review agent logic for circular tool dependencies");
  const json::Value* sequence = json::FindMember(drift->context, "sequence");
  REQUIRE(sequence != nullptr);
  REQUIRE(sequence->array_value.size() == 2);
}

TEST_CASE("Non tool-call events and disabled detectors are ignored",
          "[detectors][action_loop]") {
  LoopFixture fixture;
  for (int i = 0; i < 6; ++i) {
    REQUIRE_FALSE(fixture.Record("llm", model::ActionType::kLlmRequest).has_value());
  }

  fixture.Detector().SetEnabled(false);
  for (int i = 0; i < 6; ++i) {
    REQUIRE_FALSE(fixture.Record("search").has_value());
  }
  fixture.Detector().SetEnabled(true);
  REQUIRE(fixture.Record("search").has_value());
}

TEST_CASE("Scores saturate at one", "[detectors][action_loop]") {
  ActionLoopConfig config;
  config.max_repeats = 2;
  config.window_size = 10;
  LoopFixture fixture(config);
  std::optional<model::DriftEvent> drift;
  for (int i = 0; i < 8; ++i) {
    drift = fixture.Record("retry");
  }
  REQUIRE(drift.has_value());
  REQUIRE(drift->score == 1.0);
  REQUIRE(drift->severity == model::Severity::kCritical);
}
