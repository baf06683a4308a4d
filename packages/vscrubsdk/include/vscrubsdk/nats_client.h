#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nats/nats.h>

namespace vscrub::sdk {

class NatsClient {
 public:
  struct Options {
    std::string name = "vscrub";
    int max_reconnect = -1;  // forever
    std::int64_t reconnect_wait_ms = 500;
    std::int64_t js_publish_timeout_ms = 5000;
  };

  NatsClient() = default;
  ~NatsClient();
  NatsClient(const NatsClient&) = delete;
  NatsClient& operator=(const NatsClient&) = delete;
  NatsClient(NatsClient&&) = delete;
  NatsClient& operator=(NatsClient&&) = delete;

  // Connects and initializes a JetStream context.
  bool connect(const std::string& url);
  bool connect(const std::string& url, const Options& opts);
  void close();
  bool is_connected() const;

  natsConnection* raw() const { return nc_; }
  jsCtx* jetstream() const { return js_; }

  bool publish(const std::string& subject, const std::vector<std::uint8_t>& payload);

  // Publish into a JetStream stream; returns once the server acknowledged the write.
  bool js_publish(const std::string& subject, const std::vector<std::uint8_t>& payload, std::string* err = nullptr);

  std::optional<std::vector<std::uint8_t>> request(const std::string& subject, const std::vector<std::uint8_t>& payload,
                                                   std::int64_t timeout_ms);

  static std::string last_error();

 private:
  natsConnection* nc_ = nullptr;
  jsCtx* js_ = nullptr;
};

}  // namespace vscrub::sdk
