#include "vscrubsdk/job_api_server.h"

#include <exception>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "vscrubsdk/naming.h"
#include "vscrubsdk/time_utils.h"

namespace vscrub::sdk {

using json = nlohmann::json;

namespace {

constexpr const char* kEndpoints[] = {"create_job", "get_job", "cancel_job", "delete_job", "retry_stitch",
                                     "anonymize_image"};

struct Envelope {
  std::string req_id;
  json args;
  json meta;
};

Envelope parse_envelope(const json& raw) {
  Envelope out;
  if (raw.is_object() && raw.contains("reqId") && raw["reqId"].is_string()) {
    out.req_id = raw["reqId"].get<std::string>();
  }
  if (out.req_id.empty()) {
    out.req_id = std::to_string(static_cast<long long>(now_ms()));
  }
  out.args = raw.is_object() && raw.contains("args") && raw["args"].is_object() ? raw["args"] : json::object();
  out.meta = raw.is_object() && raw.contains("meta") && raw["meta"].is_object() ? raw["meta"] : json::object();
  return out;
}

json reply(const std::string& req_id, bool ok, const json& result, const std::string& code = {},
           const std::string& message = {}) {
  json payload;
  payload["reqId"] = req_id;
  payload["ok"] = ok;
  payload["result"] = ok ? result : json(nullptr);
  payload["error"] = ok ? json(nullptr) : json{{"code", code.empty() ? "INTERNAL" : code}, {"message", message}};
  return payload;
}

json error_reply(const std::string& req_id, const OpError& err) {
  return reply(req_id, false, json(nullptr), to_string(err.code), err.message);
}

std::string string_arg(const json& args, const char* key) {
  if (args.contains(key) && args[key].is_string()) return args[key].get<std::string>();
  return {};
}

}  // namespace

JobApiServer::JobApiServer(Config cfg, NatsClient* client, JobApi* api)
    : cfg_(std::move(cfg)), client_(client), api_(api) {}

JobApiServer::~JobApiServer() { stop(); }

bool JobApiServer::start() {
  if (client_ == nullptr || api_ == nullptr || client_->raw() == nullptr) {
    spdlog::error("job API requires an active NATS connection");
    return false;
  }
  const auto prefix = ensure_token(cfg_.api_prefix, "api_prefix");

  microServiceConfig sc{};
  sc.Name = cfg_.service_name.c_str();
  sc.Version = cfg_.version.c_str();
  sc.Description = "vscrub job API (create, status, cancel, delete, retry stitch).";
  sc.State = this;

  microError* err = micro_AddService(&micro_, client_->raw(), &sc);
  if (err != nullptr) {
    char buf[256] = {};
    spdlog::error("micro_AddService failed: {}", microError_String(err, buf, sizeof(buf)));
    microError_Destroy(err);
    micro_ = nullptr;
    return false;
  }

  for (const char* name : kEndpoints) {
    const std::string subject = api_endpoint_subject(prefix, name);
    microEndpointConfig ec{};
    ec.Name = name;
    ec.Subject = subject.c_str();
    ec.Handler = &JobApiServer::on_micro_request;
    ec.State = const_cast<char*>(name);  // string literal, outlives the service
    microError* e = microService_AddEndpoint(micro_, &ec);
    if (e != nullptr) {
      char buf[256] = {};
      spdlog::error("microService_AddEndpoint failed ep={} subject={} err={}", name, subject,
                    microError_String(e, buf, sizeof(buf)));
      microError_Destroy(e);
      stop();
      return false;
    }
  }
  spdlog::info("job API listening prefix={}.api", prefix);
  return true;
}

void JobApiServer::stop() {
  if (micro_ == nullptr) return;
  microError* err = microService_Destroy(micro_);
  if (err != nullptr) {
    char buf[256] = {};
    spdlog::warn("microService_Destroy failed: {}", microError_String(err, buf, sizeof(buf)));
    microError_Destroy(err);
  }
  micro_ = nullptr;
}

microError* JobApiServer::on_micro_request(microRequest* req) {
  if (req == nullptr) return nullptr;
  auto* self = static_cast<JobApiServer*>(microRequest_GetServiceState(req));
  const char* endpoint = static_cast<const char*>(microRequest_GetEndpointState(req));
  if (self == nullptr || endpoint == nullptr) return nullptr;

  const char* data = microRequest_GetData(req);
  const int len = microRequest_GetDataLength(req);
  json raw = json::object();
  if (data != nullptr && len > 0) {
    raw = json::parse(data, data + len, nullptr, false);
    if (raw.is_discarded()) raw = json::object();
  }
  const std::string out = self->handle(endpoint, raw).dump();
  microError* rerr = microRequest_Respond(req, out.data(), out.size());
  if (rerr != nullptr) {
    char buf[256] = {};
    spdlog::warn("job API respond failed ep={} err={}", endpoint, microError_String(rerr, buf, sizeof(buf)));
    microError_Destroy(rerr);
  }
  return nullptr;
}

json JobApiServer::handle(const std::string& endpoint, const json& request) {
  const Envelope env = parse_envelope(request);
  OpError err;
  try {
    if (endpoint == "create_job") {
      NewJob job;
      job.input_ref = string_arg(env.args, "inputRef");
      job.profile = env.args.value("profile", std::string("NONE"));
      job.notify_subject = string_arg(env.args, "notifySubject");
      if (env.args.contains("options")) job.options = env.args["options"];
      const auto id = api_->create_job(job, &err);
      if (!id.has_value()) return error_reply(env.req_id, err);
      return reply(env.req_id, true, json{{"jobId", *id}});
    }
    if (endpoint == "anonymize_image") {
      const json options = env.args.contains("options") ? env.args["options"] : json::object();
      const auto view = api_->anonymize_image(string_arg(env.args, "inputRef"),
                                              env.args.value("format", std::string(".png")),
                                              env.args.value("profile", std::string("NONE")), options, &err);
      if (!view.has_value()) return error_reply(env.req_id, err);
      return reply(env.req_id, true, json{{"outputRef", view->output_ref}, {"regions", view->regions}});
    }

    const std::string job_id = string_arg(env.args, "jobId");
    if (job_id.empty()) {
      return reply(env.req_id, false, json(nullptr), to_string(ErrorCode::kInvalidArgument), "missing jobId");
    }
    if (endpoint == "get_job") {
      const auto view = api_->get_job(job_id, &err);
      if (!view.has_value()) return error_reply(env.req_id, err);
      return reply(env.req_id, true, job_view_to_json(*view));
    }
    if (endpoint == "cancel_job") {
      if (!api_->cancel_job(job_id, &err)) return error_reply(env.req_id, err);
      return reply(env.req_id, true, json{{"jobId", job_id}, {"status", "FAILED"}});
    }
    if (endpoint == "delete_job") {
      if (!api_->delete_job(job_id, &err)) return error_reply(env.req_id, err);
      return reply(env.req_id, true, json{{"jobId", job_id}, {"deleted", true}});
    }
    if (endpoint == "retry_stitch") {
      if (!api_->retry_stitch(job_id, &err)) return error_reply(env.req_id, err);
      return reply(env.req_id, true, json{{"jobId", job_id}, {"status", "STITCHING"}});
    }
  } catch (const std::exception& ex) {
    spdlog::error("job API error ep={} err={}", endpoint, ex.what());
    return reply(env.req_id, false, json(nullptr), to_string(ErrorCode::kInternal), ex.what());
  }
  return reply(env.req_id, false, json(nullptr), to_string(ErrorCode::kNotFound), "unknown endpoint");
}

}  // namespace vscrub::sdk
