#pragma once

#include <chrono>
#include <string>

namespace agentwatch::alerts {

// Outbound HTTP POST of one JSON document.
//
// Contract:
// - blocks until a response arrives, the connection fails or `timeout`
//   elapses
// - returns true only for a 2xx response; `status_code` holds the HTTP status
//   whenever one was received (0 otherwise)
// - never retries
class IWebhookTransport {
public:
  virtual ~IWebhookTransport() = default;

  virtual bool Post(const std::string& url, const std::string& json_body,
                    std::chrono::milliseconds timeout, int& status_code,
                    std::string& error) = 0;
};

} // namespace agentwatch::alerts
