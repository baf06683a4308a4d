#pragma once

#include <string>

#include <nats/nats.h>
#include <nlohmann/json_fwd.hpp>

#include "vscrubsdk/job_api.h"
#include "vscrubsdk/nats_client.h"

namespace vscrub::sdk {

// Request/reply endpoints of the job API on NATS micro services.
//
// Subjects are `<prefix>.api.<endpoint>` for create_job, get_job, cancel_job,
// delete_job, retry_stitch and anonymize_image. Requests are `{reqId, args, meta}`
// JSON; replies are `{reqId, ok, result, error{code, message}}`.
class JobApiServer {
 public:
  struct Config {
    std::string api_prefix = "vscrub";
    std::string service_name = "vscrub_jobs";
    std::string version = "0.1.0";
  };

  JobApiServer(Config cfg, NatsClient* client, JobApi* api);
  ~JobApiServer();
  JobApiServer(const JobApiServer&) = delete;
  JobApiServer& operator=(const JobApiServer&) = delete;

  bool start();
  void stop();

  // Endpoint dispatch without the transport; returns the reply document.
  nlohmann::json handle(const std::string& endpoint, const nlohmann::json& request);

 private:
  static microError* on_micro_request(microRequest* req);

  Config cfg_;
  NatsClient* client_ = nullptr;
  JobApi* api_ = nullptr;
  microService* micro_ = nullptr;
};

}  // namespace vscrub::sdk
