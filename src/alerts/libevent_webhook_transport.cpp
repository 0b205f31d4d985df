#include "alerts/libevent_webhook_transport.hpp"

#include <event2/buffer.h>
#include <event2/bufferevent.h>
#include <event2/bufferevent_ssl.h>
#include <event2/dns.h>
#include <event2/event.h>
#include <event2/http.h>
#include <event2/keyvalq_struct.h>
#include <openssl/err.h>
#include <openssl/ssl.h>

#include <memory>
#include <string_view>
#include <sys/time.h>

namespace agentwatch::alerts {

namespace {

struct EventBaseDeleter {
  void operator()(event_base* base) const {
    event_base_free(base);
  }
};

struct DnsBaseDeleter {
  void operator()(evdns_base* dns) const {
    evdns_base_free(dns, 0);
  }
};

struct UriDeleter {
  void operator()(evhttp_uri* uri) const {
    evhttp_uri_free(uri);
  }
};

struct SslContextDeleter {
  void operator()(SSL_CTX* context) const {
    SSL_CTX_free(context);
  }
};

struct ConnectionDeleter {
  void operator()(evhttp_connection* connection) const {
    evhttp_connection_free(connection);
  }
};

// Shared between Post and the libevent completion callback.
struct RequestState {
  event_base* base = nullptr;
  bool completed = false;
  int status_code = 0;
  std::string response_line;
};

void OnRequestDone(evhttp_request* request, void* arg) {
  auto* state = static_cast<RequestState*>(arg);
  state->completed = true;
  if (request != nullptr) {
    state->status_code = evhttp_request_get_response_code(request);
    const char* reason = evhttp_request_get_response_code_line(request);
    state->response_line = reason != nullptr ? reason : "";
  }
  event_base_loopbreak(state->base);
}

std::string DrainOpenSslErrors() {
  std::string joined;
  unsigned long code = 0;
  while ((code = ERR_get_error()) != 0) {
    char buffer[256];
    ERR_error_string_n(code, buffer, sizeof(buffer));
    if (!joined.empty()) {
      joined += "; ";
    }
    joined += buffer;
  }
  return joined;
}

timeval ToTimeval(const std::chrono::milliseconds timeout) {
  timeval tv{};
  tv.tv_sec = static_cast<decltype(tv.tv_sec)>(timeout.count() / 1000);
  tv.tv_usec = static_cast<decltype(tv.tv_usec)>((timeout.count() % 1000) * 1000);
  return tv;
}

} // namespace

LibeventWebhookTransport::LibeventWebhookTransport() {
  OPENSSL_init_ssl(0, nullptr);
}

bool LibeventWebhookTransport::Post(const std::string& url, const std::string& json_body,
                                    const std::chrono::milliseconds timeout, int& status_code,
                                    std::string& error) {
  status_code = 0;

  std::unique_ptr<evhttp_uri, UriDeleter> uri(evhttp_uri_parse(url.c_str()));
  if (uri == nullptr) {
    error = "malformed webhook url";
    return false;
  }

  const char* scheme_raw = evhttp_uri_get_scheme(uri.get());
  const char* host_raw = evhttp_uri_get_host(uri.get());
  const std::string_view scheme = scheme_raw != nullptr ? scheme_raw : "";
  if (host_raw == nullptr || host_raw[0] == '\0') {
    error = "webhook url has no host";
    return false;
  }
  const std::string host(host_raw);
  const bool use_tls = scheme == "https";
  if (!use_tls && scheme != "http") {
    error = "unsupported webhook url scheme '" + std::string(scheme) + "'";
    return false;
  }

  int port = evhttp_uri_get_port(uri.get());
  if (port < 0) {
    port = use_tls ? 443 : 80;
  }

  std::string target = evhttp_uri_get_path(uri.get()) != nullptr ? evhttp_uri_get_path(uri.get())
                                                                  : "";
  if (target.empty()) {
    target = "/";
  }
  if (const char* query = evhttp_uri_get_query(uri.get()); query != nullptr) {
    target += "?";
    target += query;
  }

  std::unique_ptr<event_base, EventBaseDeleter> base(event_base_new());
  if (base == nullptr) {
    error = "failed to create event base";
    return false;
  }
  std::unique_ptr<evdns_base, DnsBaseDeleter> dns(
      evdns_base_new(base.get(), EVDNS_BASE_INITIALIZE_NAMESERVERS));
  if (dns == nullptr) {
    error = "failed to initialize dns resolver";
    return false;
  }

  std::unique_ptr<SSL_CTX, SslContextDeleter> ssl_context;
  bufferevent* transport = nullptr;
  if (use_tls) {
    ssl_context.reset(SSL_CTX_new(TLS_client_method()));
    if (ssl_context == nullptr) {
      error = "failed to create tls context: " + DrainOpenSslErrors();
      return false;
    }
    SSL_CTX_set_verify(ssl_context.get(), SSL_VERIFY_PEER, nullptr);
    if (SSL_CTX_set_default_verify_paths(ssl_context.get()) != 1) {
      error = "failed to load system trust store: " + DrainOpenSslErrors();
      return false;
    }

    SSL* ssl = SSL_new(ssl_context.get());
    if (ssl == nullptr) {
      error = "failed to create tls session: " + DrainOpenSslErrors();
      return false;
    }
    SSL_set_tlsext_host_name(ssl, host.c_str());
    SSL_set1_host(ssl, host.c_str());

    // The bufferevent owns `ssl` from here on.
    transport = bufferevent_openssl_socket_new(base.get(), -1, ssl, BUFFEREVENT_SSL_CONNECTING,
                                               BEV_OPT_CLOSE_ON_FREE | BEV_OPT_DEFER_CALLBACKS);
    if (transport == nullptr) {
      SSL_free(ssl);
    }
  } else {
    transport = bufferevent_socket_new(base.get(), -1, BEV_OPT_CLOSE_ON_FREE);
  }
  if (transport == nullptr) {
    error = "failed to create connection buffer";
    return false;
  }

  // The connection owns `transport` from here on.
  std::unique_ptr<evhttp_connection, ConnectionDeleter> connection(
      evhttp_connection_base_bufferevent_new(base.get(), dns.get(), transport, host.c_str(),
                                             static_cast<ev_uint16_t>(port)));
  if (connection == nullptr) {
    bufferevent_free(transport);
    error = "failed to create http connection";
    return false;
  }

  const timeval tv = ToTimeval(timeout);
  evhttp_connection_set_timeout_tv(connection.get(), &tv);
  evhttp_connection_set_retries(connection.get(), 0);

  RequestState state;
  state.base = base.get();
  evhttp_request* request = evhttp_request_new(&OnRequestDone, &state);
  if (request == nullptr) {
    error = "failed to create http request";
    return false;
  }

  evkeyvalq* headers = evhttp_request_get_output_headers(request);
  evhttp_add_header(headers, "Host", host.c_str());
  evhttp_add_header(headers, "Content-Type", "application/json");
  evhttp_add_header(headers, "User-Agent", "agentwatch");
  evhttp_add_header(headers, "Connection", "close");
  evbuffer_add(evhttp_request_get_output_buffer(request), json_body.data(), json_body.size());

  // libevent frees the request whether or not this call succeeds.
  if (evhttp_make_request(connection.get(), request, EVHTTP_REQ_POST, target.c_str()) != 0) {
    error = "failed to dispatch http request to '" + host + "'";
    return false;
  }

  // Hard stop in case the connection timeout never fires (stalled TLS setup).
  event_base_loopexit(base.get(), &tv);
  event_base_dispatch(base.get());

  if (!state.completed) {
    error = "webhook request to '" + host + "' timed out after " +
            std::to_string(timeout.count()) + "ms";
    return false;
  }

  status_code = state.status_code;
  if (status_code == 0) {
    const std::string tls_detail = use_tls ? DrainOpenSslErrors() : "";
    error = "webhook request to '" + host + "' failed before a response was received";
    if (!tls_detail.empty()) {
      error += ": " + tls_detail;
    }
    return false;
  }
  if (status_code < 200 || status_code >= 300) {
    error = "webhook returned HTTP " + std::to_string(status_code);
    if (!state.response_line.empty()) {
      error += " " + state.response_line;
    }
    return false;
  }
  return true;
}

} // namespace agentwatch::alerts
