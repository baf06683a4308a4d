#include "vscrubsdk/nats_client.h"

#include <nats/nats.h>

#include <cstring>

#include <spdlog/spdlog.h>

namespace vscrub::sdk {

namespace {

void on_disconnected(natsConnection*, void*) { spdlog::warn("NATS disconnected"); }

void on_reconnected(natsConnection* nc, void*) {
  char url[256] = {};
  (void)natsConnection_GetConnectedUrl(nc, url, sizeof(url));
  spdlog::info("NATS reconnected url={}", url);
}

}  // namespace

NatsClient::~NatsClient() {
  close();
}

bool NatsClient::connect(const std::string& url) { return connect(url, Options{}); }

bool NatsClient::connect(const std::string& url, const Options& opts) {
  close();
  const std::string u = url.empty() ? std::string(NATS_DEFAULT_URL) : url;

  natsOptions* no = nullptr;
  natsStatus s = natsOptions_Create(&no);
  if (s == NATS_OK) s = natsOptions_SetURL(no, u.c_str());
  if (s == NATS_OK && !opts.name.empty()) s = natsOptions_SetName(no, opts.name.c_str());
  if (s == NATS_OK) s = natsOptions_SetMaxReconnect(no, opts.max_reconnect);
  if (s == NATS_OK) s = natsOptions_SetReconnectWait(no, opts.reconnect_wait_ms);
  if (s == NATS_OK) s = natsOptions_SetDisconnectedCB(no, &on_disconnected, nullptr);
  if (s == NATS_OK) s = natsOptions_SetReconnectedCB(no, &on_reconnected, nullptr);
  if (s == NATS_OK) s = natsConnection_Connect(&nc_, no);
  natsOptions_Destroy(no);
  if (s != NATS_OK) {
    spdlog::error("NATS connect failed url={} err={}", u, natsStatus_GetText(s));
    close();
    return false;
  }

  jsOptions jo;
  jsOptions_Init(&jo);
  jo.Wait = opts.js_publish_timeout_ms;
  s = natsConnection_JetStream(&js_, nc_, &jo);
  if (s != NATS_OK) {
    spdlog::error("JetStream init failed: {}", natsStatus_GetText(s));
    close();
    return false;
  }
  return true;
}

void NatsClient::close() {
  if (js_ != nullptr) {
    jsCtx_Destroy(js_);
    js_ = nullptr;
  }
  if (nc_ != nullptr) {
    natsConnection_Drain(nc_);
    natsConnection_Destroy(nc_);
    nc_ = nullptr;
  }
}

bool NatsClient::is_connected() const {
  return nc_ != nullptr && !natsConnection_IsClosed(nc_);
}

bool NatsClient::publish(const std::string& subject, const std::vector<std::uint8_t>& payload) {
  if (!is_connected()) {
    return false;
  }
  const natsStatus s =
      natsConnection_Publish(nc_, subject.c_str(), payload.data(), static_cast<int>(payload.size()));
  return s == NATS_OK;
}

bool NatsClient::js_publish(const std::string& subject, const std::vector<std::uint8_t>& payload, std::string* err) {
  if (!is_connected() || js_ == nullptr) {
    if (err != nullptr) *err = "not connected";
    return false;
  }
  jsPubAck* ack = nullptr;
  jsErrCode jerr = static_cast<jsErrCode>(0);
  const natsStatus s =
      js_Publish(&ack, js_, subject.c_str(), payload.data(), static_cast<int>(payload.size()), nullptr, &jerr);
  if (ack != nullptr) {
    jsPubAck_Destroy(ack);
  }
  if (s != NATS_OK) {
    if (err != nullptr) {
      *err = std::string(natsStatus_GetText(s)) + " (jsErr=" + std::to_string(static_cast<int>(jerr)) + ")";
    }
    return false;
  }
  return true;
}

std::optional<std::vector<std::uint8_t>> NatsClient::request(const std::string& subject,
                                                             const std::vector<std::uint8_t>& payload,
                                                             std::int64_t timeout_ms) {
  if (!is_connected()) {
    return std::nullopt;
  }
  natsMsg* reply = nullptr;
  const natsStatus s = natsConnection_Request(&reply, nc_, subject.c_str(), payload.data(),
                                              static_cast<int>(payload.size()), timeout_ms);
  if (s != NATS_OK || reply == nullptr) {
    if (reply != nullptr) {
      natsMsg_Destroy(reply);
    }
    return std::nullopt;
  }
  const void* data = natsMsg_GetData(reply);
  const int len = natsMsg_GetDataLength(reply);
  std::vector<std::uint8_t> out;
  if (data != nullptr && len > 0) {
    out.resize(static_cast<std::size_t>(len));
    std::memcpy(out.data(), data, static_cast<std::size_t>(len));
  }
  natsMsg_Destroy(reply);
  return out;
}

std::string NatsClient::last_error() {
  const char* err = nats_GetLastError(nullptr);
  return err ? std::string(err) : std::string();
}

}  // namespace vscrub::sdk
