#pragma once

#include "alerts/webhook_transport.hpp"

#include <chrono>
#include <string>

namespace agentwatch::alerts {

// libevent `evhttp` client. Each Post runs a private event loop to
// completion; `https` URLs go through an OpenSSL bufferevent with peer and
// host name verification against the system trust store.
class LibeventWebhookTransport final : public IWebhookTransport {
public:
  LibeventWebhookTransport();

  bool Post(const std::string& url, const std::string& json_body,
            std::chrono::milliseconds timeout, int& status_code, std::string& error) override;
};

} // namespace agentwatch::alerts
