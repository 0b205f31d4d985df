#include "alerts/webhook_payloads.hpp"

#include "core/time_utils.hpp"

#include <cstdlib>
#include <utility>

namespace agentwatch::alerts {

namespace {

using core::json::MakeArray;
using core::json::MakeBool;
using core::json::MakeNumber;
using core::json::MakeObject;
using core::json::MakeString;
using core::json::Value;

const char* SeverityEmoji(const model::Severity severity) {
  switch (severity) {
  case model::Severity::kLow:
    return "\xF0\x9F\x9F\xA2";
  case model::Severity::kMed:
    return "\xF0\x9F\x9F\xA1";
  case model::Severity::kHigh:
    return "\xF0\x9F\x9F\xA0";
  case model::Severity::kCritical:
    return "\xF0\x9F\x94\xB4";
  }
  return "\xE2\x9A\xA0\xEF\xB8\x8F";
}

constexpr const char* kBulbEmoji = "\xF0\x9F\x92\xA1";

Value EmbedField(std::string name, std::string value, const bool inline_field) {
  return MakeObject({
      {"name", MakeString(std::move(name))},
      {"value", MakeString(std::move(value))},
      {"inline", MakeBool(inline_field)},
  });
}

} // namespace

WebhookFlavor DetectWebhookFlavor(std::string_view url) {
  if (url.find("hooks.slack.com") != std::string_view::npos) {
    return WebhookFlavor::kSlack;
  }
  if (url.find("discord.com") != std::string_view::npos) {
    return WebhookFlavor::kDiscord;
  }
  return WebhookFlavor::kGeneric;
}

const char* ToString(const WebhookFlavor flavor) {
  switch (flavor) {
  case WebhookFlavor::kSlack:
    return "slack";
  case WebhookFlavor::kDiscord:
    return "discord";
  case WebhookFlavor::kGeneric:
    return "generic";
  }
  return "generic";
}

const char* SeverityColorHex(const model::Severity severity) {
  switch (severity) {
  case model::Severity::kLow:
    return "#36a64f";
  case model::Severity::kMed:
    return "#daa520";
  case model::Severity::kHigh:
    return "#ff6600";
  case model::Severity::kCritical:
    return "#ff0000";
  }
  return "#daa520";
}

std::uint32_t SeverityColorInt(const model::Severity severity) {
  // Skip the leading '#'.
  return static_cast<std::uint32_t>(std::strtoul(SeverityColorHex(severity) + 1, nullptr, 16));
}

std::string FormatAlertTime(const double epoch_seconds) {
  return core::FormatUtc(core::FromEpochSeconds(epoch_seconds), "%Y-%m-%d %H:%M UTC");
}

Value BuildSlackPayload(const model::DriftEvent& event) {
  const std::string severity = model::ToString(event.severity);
  const std::string text = std::string(SeverityEmoji(event.severity)) + " *[" + severity +
                           "] AgentWatch Alert*\n" + "*Agent:* `" + event.agent_id + "`\n" +
                           "*Detector:* " + model::ToString(event.detector) + "\n" +
                           "*Time:* " + FormatAlertTime(event.timestamp) + "\n\n" +
                           event.message + "\n\n" + kBulbEmoji +
                           " *Suggested action:* " + event.suggested_action;

  const Value section = MakeObject({
      {"type", MakeString("section")},
      {"text", MakeObject({{"type", MakeString("mrkdwn")}, {"text", MakeString(text)}})},
  });
  const Value attachment = MakeObject({
      {"color", MakeString(SeverityColorHex(event.severity))},
      {"blocks", MakeArray({section})},
  });
  return MakeObject({{"attachments", MakeArray({attachment})}});
}

Value BuildDiscordPayload(const model::DriftEvent& event) {
  const std::string severity = model::ToString(event.severity);
  const Value embed = MakeObject({
      {"title", MakeString(std::string(SeverityEmoji(event.severity)) + " [" + severity +
                           "] AgentWatch Alert")},
      {"color", MakeNumber(static_cast<double>(SeverityColorInt(event.severity)))},
      {"fields", MakeArray({
                     EmbedField("Agent", "`" + event.agent_id + "`", true),
                     EmbedField("Detector", model::ToString(event.detector), true),
                     EmbedField("Time", FormatAlertTime(event.timestamp), true),
                     EmbedField("Details", event.message, false),
                     EmbedField(std::string(kBulbEmoji) + " Suggested Action",
                                event.suggested_action, false),
                 })},
  });
  return MakeObject({{"embeds", MakeArray({embed})}});
}

Value BuildGenericPayload(const model::DriftEvent& event) {
  return MakeObject({
      {"source", MakeString("agentwatch")},
      {"event", model::ToJsonValue(event)},
  });
}

Value BuildWebhookPayload(std::string_view url, const model::DriftEvent& event) {
  switch (DetectWebhookFlavor(url)) {
  case WebhookFlavor::kSlack:
    return BuildSlackPayload(event);
  case WebhookFlavor::kDiscord:
    return BuildDiscordPayload(event);
  case WebhookFlavor::kGeneric:
    return BuildGenericPayload(event);
  }
  return BuildGenericPayload(event);
}

} // namespace agentwatch::alerts
