#include "alerts/alert_dispatcher.hpp"
#include "core/logging/logger.hpp"

#include <catch2/catch.hpp>

#include <memory>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace model = agentwatch::model;
namespace json = agentwatch::core::json;
namespace alerts = agentwatch::alerts;
using agentwatch::core::logging::LogLevel;
using agentwatch::core::logging::Logger;

namespace {

struct PostRecord {
  std::string url;
  std::string body;
  long long timeout_ms = 0;
};

// Records every POST; answers with `status`.
class RecordingTransport final : public alerts::IWebhookTransport {
public:
  RecordingTransport(std::vector<PostRecord>& posts, int status) : posts_(posts), status_(status) {}

  bool Post(const std::string& url, const std::string& json_body,
            std::chrono::milliseconds timeout, int& status_code, std::string& error) override {
    posts_.push_back(PostRecord{url, json_body, static_cast<long long>(timeout.count())});
    status_code = status_;
    if (status_ < 200 || status_ >= 300) {
      error = "webhook returned HTTP " + std::to_string(status_);
      return false;
    }
    return true;
  }

private:
  std::vector<PostRecord>& posts_;
  int status_;
};

model::DriftEvent Drift(model::Severity severity,
                        model::DetectorType detector = model::DetectorType::kActionLoop,
                        const std::string& agent_id = "agent-a") {
  model::DriftEvent event = model::MakeDriftEvent(agent_id, "run-1", detector, 0.95, "message",
                                                  "action", json::MakeObject());
  event.severity = severity;
  return event;
}

struct DispatcherFixture {
  explicit DispatcherFixture(alerts::AlertConfig config, int status = 200)
      : logger(LogLevel::kDebug, log_sink),
        dispatcher(std::move(config), logger, std::make_unique<RecordingTransport>(posts, status),
                   [this]() { return now; }) {}

  double now = 10'000.0;
  std::vector<PostRecord> posts;
  std::ostringstream log_sink;
  Logger logger;
  alerts::AlertDispatcher dispatcher;
};

alerts::AlertConfig GenericConfig() {
  alerts::AlertConfig config;
  config.webhook_url = "https://example.com/hook";
  return config;
}

} // namespace

TEST_CASE("No destination means nothing is sent", "[alerts][dispatcher]") {
  DispatcherFixture fixture(alerts::AlertConfig{});
  REQUIRE_FALSE(fixture.dispatcher.ShouldAlert(Drift(model::Severity::kCritical)));
  REQUIRE_FALSE(fixture.dispatcher.Send(Drift(model::Severity::kCritical)));
  REQUIRE(fixture.posts.empty());
  REQUIRE(fixture.dispatcher.BuildPayload(Drift(model::Severity::kHigh)) == json::MakeObject());
}

TEST_CASE("Cooldown suppresses repeats per agent and detector", "[alerts][dispatcher]") {
  DispatcherFixture fixture(GenericConfig());

  REQUIRE(fixture.dispatcher.Send(Drift(model::Severity::kHigh)));
  REQUIRE_FALSE(fixture.dispatcher.Send(Drift(model::Severity::kHigh)));

  // Different detector and different agent have their own slots.
  REQUIRE(fixture.dispatcher.Send(Drift(model::Severity::kHigh, model::DetectorType::kGoalDrift)));
  REQUIRE(fixture.dispatcher.Send(
      Drift(model::Severity::kHigh, model::DetectorType::kActionLoop, "agent-b")));

  fixture.now += 59.0;
  REQUIRE_FALSE(fixture.dispatcher.Send(Drift(model::Severity::kHigh)));
  fixture.now += 1.0;
  REQUIRE(fixture.dispatcher.Send(Drift(model::Severity::kHigh)));

  REQUIRE(fixture.posts.size() == 4);
  REQUIRE(fixture.posts.front().url == "https://example.com/hook");
  REQUIRE(fixture.posts.front().timeout_ms == 10'000);
  REQUIRE(fixture.posts.front().body.find(R"("source":"agentwatch")") != std::string::npos);
  REQUIRE(fixture.log_sink.str().find("alert sent") != std::string::npos);
}

TEST_CASE("Events below the minimum severity do not reset the cooldown",
          "[alerts][dispatcher]") {
  alerts::AlertConfig config = GenericConfig();
  config.min_severity = model::Severity::kHigh;
  DispatcherFixture fixture(config);

  REQUIRE_FALSE(fixture.dispatcher.Send(Drift(model::Severity::kMed)));
  REQUIRE(fixture.dispatcher.Send(Drift(model::Severity::kHigh)));
  REQUIRE(fixture.posts.size() == 1);

  fixture.now += 30.0;
  REQUIRE_FALSE(fixture.dispatcher.Send(Drift(model::Severity::kLow)));
  fixture.now += 30.0;
  REQUIRE(fixture.dispatcher.ShouldAlert(Drift(model::Severity::kCritical)));
}

TEST_CASE("Failed deliveries are logged and still start the cooldown",
          "[alerts][dispatcher]") {
  DispatcherFixture fixture(GenericConfig(), 500);

  REQUIRE_FALSE(fixture.dispatcher.Send(Drift(model::Severity::kCritical)));
  REQUIRE(fixture.posts.size() == 1);
  REQUIRE(fixture.log_sink.str().find("failed to send alert") != std::string::npos);
  REQUIRE(fixture.log_sink.str().find("status=\"500\"") != std::string::npos);

  REQUIRE_FALSE(fixture.dispatcher.Send(Drift(model::Severity::kCritical)));
  REQUIRE(fixture.posts.size() == 1);
}

TEST_CASE("Zero cooldown sends every qualifying event", "[alerts][dispatcher]") {
  alerts::AlertConfig config = GenericConfig();
  config.cooldown_seconds = 0.0;
  DispatcherFixture fixture(config);

  REQUIRE(fixture.dispatcher.Send(Drift(model::Severity::kMed)));
  REQUIRE(fixture.dispatcher.Send(Drift(model::Severity::kMed)));
  REQUIRE(fixture.posts.size() == 2);
}

TEST_CASE("Payload shape follows the configured destination", "[alerts][dispatcher]") {
  alerts::AlertConfig config;
  config.webhook_url = "https://hooks.slack.com/services/T/B/X";
  DispatcherFixture fixture(config);

  const json::Value payload = fixture.dispatcher.BuildPayload(Drift(model::Severity::kHigh));
  REQUIRE(json::FindMember(payload, "attachments") != nullptr);
}
