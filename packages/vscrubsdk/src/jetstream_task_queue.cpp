#include "vscrubsdk/jetstream_task_queue.h"

#include <spdlog/spdlog.h>

#include "vscrubsdk/msg_codec.h"
#include "vscrubsdk/naming.h"
#include "vscrubsdk/time_utils.h"

namespace vscrub::sdk {

using json = nlohmann::json;

namespace {

class JsAckHandle final : public AckHandle {
 public:
  explicit JsAckHandle(natsMsg* msg) : msg_(msg) {}
  ~JsAckHandle() override {
    if (msg_ != nullptr) {
      natsMsg_Destroy(msg_);
    }
  }
  JsAckHandle(const JsAckHandle&) = delete;
  JsAckHandle& operator=(const JsAckHandle&) = delete;

  bool ack() override { return check("ack", natsMsg_Ack(msg_, nullptr)); }

  bool nack(std::int64_t delay_ms) override {
    return check("nak", natsMsg_NakWithDelay(msg_, delay_ms < 0 ? 0 : delay_ms, nullptr));
  }

  bool in_progress() override { return check("in_progress", natsMsg_InProgress(msg_, nullptr)); }

 private:
  static bool check(const char* op, natsStatus s) {
    if (s != NATS_OK) {
      spdlog::warn("task {} failed: {}", op, natsStatus_GetText(s));
      return false;
    }
    return true;
  }

  natsMsg* msg_ = nullptr;
};

int delivery_count_of(natsMsg* msg) {
  jsMsgMetaData* meta = nullptr;
  if (natsMsg_GetMetaData(&meta, msg) != NATS_OK || meta == nullptr) {
    return 1;
  }
  const int n = static_cast<int>(meta->NumDelivered);
  jsMsgMetaData_Destroy(meta);
  return n > 0 ? n : 1;
}

}  // namespace

JetStreamTaskQueue::JetStreamTaskQueue(Config cfg, NatsClient* client) : cfg_(std::move(cfg)), client_(client) {}

JetStreamTaskQueue::~JetStreamTaskQueue() { stop(); }

bool JetStreamTaskQueue::ensure_stream() {
  jsCtx* js = client_->jetstream();
  jsStreamInfo* si = nullptr;
  jsErrCode jerr = static_cast<jsErrCode>(0);
  natsStatus s = js_GetStreamInfo(&si, js, cfg_.stream.c_str(), nullptr, &jerr);
  if (s == NATS_OK) {
    jsStreamInfo_Destroy(si);
    return true;
  }

  const std::string subject = task_subject_wildcard(cfg_.subject_prefix);
  const char* subjects[] = {subject.c_str()};
  jsStreamConfig sc;
  jsStreamConfig_Init(&sc);
  sc.Name = cfg_.stream.c_str();
  sc.Subjects = subjects;
  sc.SubjectsLen = 1;
  sc.Retention = js_WorkQueuePolicy;
  sc.Storage = cfg_.memory_storage ? js_MemoryStorage : js_FileStorage;
  sc.Replicas = cfg_.replicas > 0 ? cfg_.replicas : 1;

  si = nullptr;
  s = js_AddStream(&si, js, &sc, nullptr, &jerr);
  if (si != nullptr) {
    jsStreamInfo_Destroy(si);
  }
  if (s != NATS_OK) {
    spdlog::error("task stream create failed stream={} err={} jsErr={}", cfg_.stream, natsStatus_GetText(s),
                  static_cast<int>(jerr));
    return false;
  }
  spdlog::info("task stream created stream={} subjects={}", cfg_.stream, subject);
  return true;
}

bool JetStreamTaskQueue::start() {
  if (client_ == nullptr || client_->jetstream() == nullptr) {
    spdlog::error("task queue requires a JetStream context");
    return false;
  }
  if (sub_ != nullptr) {
    return true;
  }
  if (!ensure_stream()) {
    return false;
  }

  jsSubOptions so;
  jsSubOptions_Init(&so);
  so.Stream = cfg_.stream.c_str();
  so.Config.AckPolicy = js_AckExplicit;
  so.Config.AckWait = cfg_.ack_wait_ms * 1000000;  // nanoseconds
  so.Config.MaxDeliver = cfg_.max_deliver;

  const std::string subject = task_subject_wildcard(cfg_.subject_prefix);
  jsErrCode jerr = static_cast<jsErrCode>(0);
  const natsStatus s =
      js_PullSubscribe(&sub_, client_->jetstream(), subject.c_str(), cfg_.durable.c_str(), nullptr, &so, &jerr);
  if (s != NATS_OK) {
    spdlog::error("pull subscribe failed durable={} err={} jsErr={}", cfg_.durable, natsStatus_GetText(s),
                  static_cast<int>(jerr));
    sub_ = nullptr;
    return false;
  }
  spdlog::info("task consumer bound stream={} durable={} ackWaitMs={} maxDeliver={}", cfg_.stream, cfg_.durable,
               cfg_.ack_wait_ms, cfg_.max_deliver);
  return true;
}

void JetStreamTaskQueue::stop() {
  std::lock_guard<std::mutex> lock(fetch_mu_);
  if (sub_ != nullptr) {
    natsSubscription_Destroy(sub_);
    sub_ = nullptr;
  }
}

bool JetStreamTaskQueue::enqueue(const Task& task, std::string* err) {
  if (client_ == nullptr) {
    if (err != nullptr) *err = "no client";
    return false;
  }
  const auto subject = task_subject(cfg_.subject_prefix, task_kind_token(task.kind));
  return client_->js_publish(subject, encode_json(task_to_json(task)), err);
}

std::optional<Delivery> JetStreamTaskQueue::deliver(std::int64_t timeout_ms) {
  const std::int64_t deadline = now_ms() + (timeout_ms > 0 ? timeout_ms : 0);
  std::lock_guard<std::mutex> lock(fetch_mu_);
  if (sub_ == nullptr) {
    return std::nullopt;
  }
  while (true) {
    const std::int64_t remaining = deadline - now_ms();
    if (remaining <= 0) {
      return std::nullopt;
    }
    natsMsgList list{};
    jsErrCode jerr = static_cast<jsErrCode>(0);
    const natsStatus s = natsSubscription_Fetch(&list, sub_, 1, remaining, &jerr);
    if (s == NATS_TIMEOUT) {
      return std::nullopt;
    }
    if (s != NATS_OK) {
      spdlog::warn("task fetch failed err={} jsErr={}", natsStatus_GetText(s), static_cast<int>(jerr));
      natsMsgList_Destroy(&list);
      return std::nullopt;
    }
    if (list.Count <= 0) {
      natsMsgList_Destroy(&list);
      continue;
    }
    natsMsg* msg = list.Msgs[0];
    list.Msgs[0] = nullptr;  // ownership moves to the ack handle
    natsMsgList_Destroy(&list);

    json payload;
    Task task;
    std::string err;
    if (!decode_json(natsMsg_GetData(msg), static_cast<std::size_t>(natsMsg_GetDataLength(msg)), payload) ||
        !task_from_json(payload, task, err)) {
      spdlog::error("dropping malformed task subject={} err={}", natsMsg_GetSubject(msg), err);
      if (natsMsg_Term(msg, nullptr) != NATS_OK) {
        spdlog::warn("terminating malformed task failed subject={}", natsMsg_GetSubject(msg));
      }
      natsMsg_Destroy(msg);
      continue;
    }

    Delivery d;
    d.task = std::move(task);
    d.delivery_count = delivery_count_of(msg);
    d.ack = std::make_unique<JsAckHandle>(msg);
    return d;
  }
}

}  // namespace vscrub::sdk
