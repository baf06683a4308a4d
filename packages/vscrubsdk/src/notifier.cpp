#include "vscrubsdk/notifier.h"

#include <spdlog/spdlog.h>

#include "vscrubsdk/msg_codec.h"
#include "vscrubsdk/nats_client.h"

namespace vscrub::sdk {

using json = nlohmann::json;

json job_event_json(const Job& job) {
  json ev;
  ev["jobId"] = job.job_id;
  ev["status"] = to_string(job.status);
  ev["outputRef"] = job.output_ref.empty() ? json(nullptr) : json(job.output_ref);
  ev["error"] = job.error.has_value() ? job_error_to_json(*job.error) : json(nullptr);
  return ev;
}

NatsJobNotifier::NatsJobNotifier(NatsClient* client, std::string default_subject)
    : client_(client), default_subject_(std::move(default_subject)) {}

void NatsJobNotifier::job_finished(const Job& job) {
  const std::string& subject = job.notify_subject.empty() ? default_subject_ : job.notify_subject;
  if (subject.empty() || client_ == nullptr) {
    return;
  }
  if (!client_->publish(subject, dump_json_bytes(job_event_json(job)))) {
    spdlog::warn("job notification not delivered jobId={} subject={}", job.job_id, subject);
    return;
  }
  spdlog::info("job notification sent jobId={} status={} subject={}", job.job_id, to_string(job.status), subject);
}

}  // namespace vscrub::sdk
