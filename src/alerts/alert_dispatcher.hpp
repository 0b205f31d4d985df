#pragma once

#include "alerts/webhook_transport.hpp"
#include "core/json_dom.hpp"
#include "model/drift_event.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace agentwatch::core::logging {
class Logger;
}

namespace agentwatch::alerts {

struct AlertConfig {
  std::optional<std::string> webhook_url;
  model::Severity min_severity = model::Severity::kMed;
  double cooldown_seconds = 60.0;
  std::chrono::milliseconds timeout{10'000};
};

// Severity and cooldown gate in front of one webhook destination.
//
// The gate key is `{agent_id}:{detector}`. An accepted event stamps its key
// with the current time before anything is sent, so a failed delivery still
// starts the cooldown. Events below `min_severity` never touch the key.
class AlertDispatcher {
public:
  using Clock = std::function<double()>;

  // A null transport selects the libevent client; an empty clock selects the
  // system clock (epoch seconds).
  AlertDispatcher(AlertConfig config, core::logging::Logger& logger,
                  std::unique_ptr<IWebhookTransport> transport = nullptr, Clock clock = {});

  const AlertConfig& Config() const {
    return config_;
  }

  // Gate decision. Consumes the cooldown slot when it returns true.
  bool ShouldAlert(const model::DriftEvent& event);

  // Payload for the configured destination (empty object without one).
  core::json::Value BuildPayload(const model::DriftEvent& event) const;

  // Gate, then one blocking POST. True only when the alert was delivered.
  // Failures are logged and not retried.
  bool Send(const model::DriftEvent& event);

private:
  AlertConfig config_;
  core::logging::Logger& logger_;
  std::unique_ptr<IWebhookTransport> transport_;
  Clock clock_;

  std::mutex mutex_;
  std::unordered_map<std::string, double> last_alert_;
};

} // namespace agentwatch::alerts
