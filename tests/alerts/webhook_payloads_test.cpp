#include "alerts/webhook_payloads.hpp"

#include <catch2/catch.hpp>

#include <string>

namespace model = agentwatch::model;
namespace json = agentwatch::core::json;
namespace alerts = agentwatch::alerts;

namespace {

model::DriftEvent SampleDrift(model::Severity severity = model::Severity::kHigh) {
  model::DriftEvent event = model::MakeDriftEvent(
      "logistics-v2", "run-9", model::DetectorType::kActionLoop, 0.75,
      "Action loop: search called 6x consecutively", "Check search input/output",
      json::MakeObject());
  event.severity = severity;
  // 2024-01-02 03:04:05 UTC
  event.timestamp = 1704164645.0;
  return event;
}

const json::Value& Member(const json::Value& object, const char* key) {
  const json::Value* member = json::FindMember(object, key);
  REQUIRE(member != nullptr);
  return *member;
}

} // namespace

TEST_CASE("Webhook flavor follows the destination host", "[alerts][payload]") {
  REQUIRE(alerts::DetectWebhookFlavor("https://hooks.slack.com/services/T/B/X") ==
          alerts::WebhookFlavor::kSlack);
  REQUIRE(alerts::DetectWebhookFlavor("https://discord.com/api/webhooks/1/abc") ==
          alerts::WebhookFlavor::kDiscord);
  REQUIRE(alerts::DetectWebhookFlavor("https://example.com/hook") ==
          alerts::WebhookFlavor::kGeneric);
  REQUIRE(std::string(alerts::ToString(alerts::WebhookFlavor::kDiscord)) == "discord");
}

TEST_CASE("Severity colors", "[alerts][payload]") {
  REQUIRE(std::string(alerts::SeverityColorHex(model::Severity::kLow)) == "#36a64f");
  REQUIRE(std::string(alerts::SeverityColorHex(model::Severity::kCritical)) == "#ff0000");
  REQUIRE(alerts::SeverityColorInt(model::Severity::kHigh) == 0xff6600U);
  REQUIRE(alerts::SeverityColorInt(model::Severity::kMed) == 0xdaa520U);
  REQUIRE(alerts::FormatAlertTime(1704164645.0) == "2024-01-02 03:04 UTC");
}

TEST_CASE("Slack payload carries one colored mrkdwn attachment", "[alerts][payload]") {
  const json::Value payload = alerts::BuildSlackPayload(SampleDrift());
  const json::Value& attachments = Member(payload, "attachments");
  REQUIRE(attachments.array_value.size() == 1);

  const json::Value& attachment = attachments.array_value.front();
  REQUIRE(Member(attachment, "color").string_value == "#ff6600");
  const json::Value& section = Member(attachment, "blocks").array_value.front();
  REQUIRE(Member(section, "type").string_value == "section");

  const json::Value& text = Member(section, "text");
  REQUIRE(Member(text, "type").string_value == "mrkdwn");
  const std::string& body = Member(text, "text").string_value;
  REQUIRE(body.find("*[HIGH] AgentWatch Alert*") != std::string::npos);
  REQUIRE(body.find("*Agent:* `logistics-v2`") != std::string::npos);
  REQUIRE(body.find("*Detector:* action_loop") != std::string::npos);
  REQUIRE(body.find("*Time:* 2024-01-02 03:04 UTC") != std::string::npos);
  REQUIRE(body.find("Action loop: search called 6x consecutively") != std::string::npos);
  REQUIRE(body.find("*Suggested action:* Check search input/output") != std::string::npos);
}

TEST_CASE("Discord payload carries one embed with fields", "[alerts][payload]") {
  const json::Value payload = alerts::BuildDiscordPayload(SampleDrift(model::Severity::kCritical));
  const json::Value& embed = Member(payload, "embeds").array_value.front();
  REQUIRE(Member(embed, "title").string_value.find("[CRITICAL] AgentWatch Alert") !=
          std::string::npos);
  REQUIRE(Member(embed, "color").number_value == static_cast<double>(0xff0000));

  const json::Value::Array& fields = Member(embed, "fields").array_value;
  REQUIRE(fields.size() == 5);
  REQUIRE(Member(fields[0], "name").string_value == "Agent");
  REQUIRE(Member(fields[0], "value").string_value == "`logistics-v2`");
  REQUIRE(Member(fields[0], "inline").bool_value);
  REQUIRE(Member(fields[1], "value").string_value == "action_loop");
  REQUIRE(Member(fields[2], "value").string_value == "2024-01-02 03:04 UTC");
  REQUIRE(Member(fields[3], "name").string_value == "Details");
  REQUIRE_FALSE(Member(fields[3], "inline").bool_value);
  REQUIRE(Member(fields[4], "value").string_value == "Check search input/output");
}

TEST_CASE("Generic payload wraps the full drift event", "[alerts][payload]") {
  const model::DriftEvent drift = SampleDrift();
  const json::Value payload = alerts::BuildWebhookPayload("https://example.com/hook", drift);
  REQUIRE(Member(payload, "source").string_value == "agentwatch");

  model::DriftEvent parsed;
  std::string error;
  REQUIRE(model::ParseDriftEvent(Member(payload, "event"), parsed, error));
  REQUIRE(parsed == drift);
}
