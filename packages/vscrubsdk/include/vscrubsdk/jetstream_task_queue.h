#pragma once

#include <cstdint>
#include <mutex>
#include <string>

#include <nats/nats.h>

#include "vscrubsdk/nats_client.h"
#include "vscrubsdk/task_queue.h"

namespace vscrub::sdk {

// Task queue on a JetStream work-queue stream consumed through one durable pull
// consumer shared by all workers. AckWait is the visibility timeout; MaxDeliver
// bounds redeliveries.
class JetStreamTaskQueue final : public TaskQueue {
 public:
  struct Config {
    std::string stream = "VSCRUB_TASKS";
    std::string subject_prefix = "vscrub";
    std::string durable = "vscrub-workers";
    std::int64_t ack_wait_ms = 60000;
    int max_deliver = 16;
    bool memory_storage = false;
    int replicas = 1;
  };

  JetStreamTaskQueue(Config cfg, NatsClient* client);
  ~JetStreamTaskQueue() override;
  JetStreamTaskQueue(const JetStreamTaskQueue&) = delete;
  JetStreamTaskQueue& operator=(const JetStreamTaskQueue&) = delete;

  // Creates the stream when missing and binds the pull consumer.
  bool start();
  void stop();

  bool enqueue(const Task& task, std::string* err = nullptr) override;
  std::optional<Delivery> deliver(std::int64_t timeout_ms) override;

 private:
  bool ensure_stream();

  Config cfg_;
  NatsClient* client_ = nullptr;
  std::mutex fetch_mu_;
  natsSubscription* sub_ = nullptr;
};

}  // namespace vscrub::sdk
