#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "vscrubsdk/job_model.h"

namespace vscrub::sdk {

class NatsClient;

// Completion event `{jobId, status, outputRef, error}`.
nlohmann::json job_event_json(const Job& job);

// Receives jobs that reached COMPLETED or FAILED. Best effort; never affects job state.
class JobNotifier {
 public:
  virtual ~JobNotifier() = default;
  virtual void job_finished(const Job& job) = 0;
};

class NatsJobNotifier final : public JobNotifier {
 public:
  NatsJobNotifier(NatsClient* client, std::string default_subject);

  void job_finished(const Job& job) override;

 private:
  NatsClient* client_ = nullptr;
  std::string default_subject_;
};

}  // namespace vscrub::sdk
