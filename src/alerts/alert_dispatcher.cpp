#include "alerts/alert_dispatcher.hpp"

#include "alerts/libevent_webhook_transport.hpp"
#include "alerts/webhook_payloads.hpp"
#include "core/logging/logger.hpp"
#include "core/time_utils.hpp"

#include <utility>

namespace agentwatch::alerts {

AlertDispatcher::AlertDispatcher(AlertConfig config, core::logging::Logger& logger,
                                 std::unique_ptr<IWebhookTransport> transport, Clock clock)
    : config_(std::move(config)),
      logger_(logger),
      transport_(transport != nullptr ? std::move(transport)
                                      : std::make_unique<LibeventWebhookTransport>()),
      clock_(clock ? std::move(clock) : Clock(&core::NowEpochSeconds)) {}

bool AlertDispatcher::ShouldAlert(const model::DriftEvent& event) {
  if (!config_.webhook_url.has_value() || config_.webhook_url->empty()) {
    return false;
  }
  if (event.severity < config_.min_severity) {
    return false;
  }

  const std::string key = event.agent_id + ":" + model::ToString(event.detector);
  const double now = clock_();

  std::lock_guard<std::mutex> lock(mutex_);
  const auto found = last_alert_.find(key);
  if (found != last_alert_.end() && now - found->second < config_.cooldown_seconds) {
    return false;
  }
  last_alert_[key] = now;
  return true;
}

core::json::Value AlertDispatcher::BuildPayload(const model::DriftEvent& event) const {
  if (!config_.webhook_url.has_value() || config_.webhook_url->empty()) {
    return core::json::MakeObject();
  }
  return BuildWebhookPayload(config_.webhook_url.value(), event);
}

bool AlertDispatcher::Send(const model::DriftEvent& event) {
  if (!ShouldAlert(event)) {
    return false;
  }

  const std::string body = core::json::Serialize(BuildPayload(event));
  int status_code = 0;
  std::string error;
  if (!transport_->Post(config_.webhook_url.value(), body, config_.timeout, status_code, error)) {
    logger_.Warn("failed to send alert",
                 {{"target_agent", event.agent_id},
                  {"detector", model::ToString(event.detector)},
                  {"status", std::to_string(status_code)},
                  {"error", error}});
    return false;
  }

  logger_.Info("alert sent",
               {{"target_agent", event.agent_id},
                {"detector", model::ToString(event.detector)},
                {"severity", model::ToString(event.severity)},
                {"message", event.message}});
  return true;
}

} // namespace agentwatch::alerts
