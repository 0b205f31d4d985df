#pragma once

#include "core/json_dom.hpp"
#include "model/drift_event.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace agentwatch::alerts {

// Destination family picked from the webhook URL.
enum class WebhookFlavor {
  kSlack,
  kDiscord,
  kGeneric,
};

// `hooks.slack.com` -> Slack, `discord.com` -> Discord, anything else generic.
WebhookFlavor DetectWebhookFlavor(std::string_view url);
const char* ToString(WebhookFlavor flavor);

// `#36a64f`, `#daa520`, `#ff6600`, `#ff0000` for LOW..CRITICAL.
const char* SeverityColorHex(model::Severity severity);
std::uint32_t SeverityColorInt(model::Severity severity);

// `YYYY-MM-DD HH:MM UTC`.
std::string FormatAlertTime(double epoch_seconds);

// Slack: one attachment colored by severity with a single mrkdwn section.
core::json::Value BuildSlackPayload(const model::DriftEvent& event);
// Discord: one embed with integer color, inline Agent/Detector/Time fields,
// then Details and Suggested Action.
core::json::Value BuildDiscordPayload(const model::DriftEvent& event);
// `{"source": "agentwatch", "event": <drift event>}`.
core::json::Value BuildGenericPayload(const model::DriftEvent& event);

core::json::Value BuildWebhookPayload(std::string_view url, const model::DriftEvent& event);

} // namespace agentwatch::alerts
