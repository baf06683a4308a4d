#include <cstdint>
#include <exception>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include <cxxopts.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "vscrubsdk/fs_blob_store.h"
#include "vscrubsdk/naming.h"
#include "vscrubsdk/nats_client.h"
#include "vscrubsdk/time_utils.h"

namespace {

using json = nlohmann::json;

int print_reply(const std::optional<std::vector<std::uint8_t>>& raw) {
  if (!raw.has_value()) {
    std::cerr << "no reply (is vscrubd running?)\n";
    return 1;
  }
  const json reply = json::parse(raw->begin(), raw->end(), nullptr, false);
  if (reply.is_discarded() || !reply.is_object()) {
    std::cerr << "malformed reply\n";
    return 1;
  }
  if (!reply.value("ok", false)) {
    const json& e = reply.contains("error") ? reply["error"] : json(nullptr);
    std::cerr << "error: " << (e.is_object() ? e.value("code", std::string("INTERNAL")) : std::string("INTERNAL"))
              << ": " << (e.is_object() ? e.value("message", std::string()) : std::string()) << "\n";
    return 1;
  }
  std::cout << reply["result"].dump(2) << "\n";
  return 0;
}

}  // namespace

int main(int argc, char** argv) {
  cxxopts::Options options("vscrubctl", "Submit and manage vscrub anonymization jobs");
  options.add_options()("command", "submit|image|status|cancel|delete|retry-stitch", cxxopts::value<std::string>())(
      "target", "Input path / blob ref (submit, image) or job id", cxxopts::value<std::string>()->default_value(""))(
      "nats-url", "NATS server URL", cxxopts::value<std::string>()->default_value("nats://127.0.0.1:4222"))(
      "api-prefix", "Job API subject prefix", cxxopts::value<std::string>()->default_value("vscrub"))(
      "profile", "NONE|GDPR|CCPA|HIPAA_SAFE_HARBOR", cxxopts::value<std::string>()->default_value("NONE"))(
      "options", "Redaction options as JSON", cxxopts::value<std::string>()->default_value(""))(
      "notify", "Completion notification subject", cxxopts::value<std::string>()->default_value(""))(
      "format", "Output encoding of an image (.png|.jpg)", cxxopts::value<std::string>()->default_value(".png"))(
      "upload", "Copy the input into the blob root before submitting", cxxopts::value<std::string>()->default_value(""))(
      "timeout-ms", "Request timeout", cxxopts::value<std::int64_t>()->default_value("5000"))("help", "Show help");
  options.parse_positional({"command", "target"});
  options.positional_help("<command> <target>");

  cxxopts::ParseResult args;
  try {
    args = options.parse(argc, argv);
  } catch (const std::exception& ex) {
    std::cerr << ex.what() << "\n" << options.help() << "\n";
    return 2;
  }
  if (args.count("help") || !args.count("command")) {
    std::cout << options.help() << "\n";
    return args.count("help") ? 0 : 2;
  }
  spdlog::set_level(spdlog::level::warn);

  const std::string command = args["command"].as<std::string>();
  const std::string target = args["target"].as<std::string>();
  if (target.empty()) {
    std::cerr << "missing <target>\n";
    return 2;
  }

  std::string endpoint;
  json request_args = json::object();
  const bool takes_input = command == "submit" || command == "image";
  if (takes_input) {
    endpoint = command == "submit" ? "create_job" : "anonymize_image";
    std::string input_ref = target;
    const std::string upload_root = args["upload"].as<std::string>();
    if (!upload_root.empty()) {
      vscrub::sdk::FsBlobStore::Config blob_cfg;
      blob_cfg.root = upload_root;
      vscrub::sdk::FsBlobStore blobs(blob_cfg, nullptr);
      vscrub::sdk::OpError err;
      if (!blobs.init(&err) || !blobs.put_file(target, input_ref, &err)) {
        std::cerr << "upload failed: " << err.message << "\n";
        return 1;
      }
    } else if (input_ref.rfind("blob:", 0) != 0 && input_ref.rfind("file:", 0) != 0) {
      input_ref = "file:" + input_ref;
    }
    request_args["inputRef"] = input_ref;
    request_args["profile"] = args["profile"].as<std::string>();
    const std::string notify = args["notify"].as<std::string>();
    if (!notify.empty() && command == "submit") request_args["notifySubject"] = notify;
    if (command == "image") request_args["format"] = args["format"].as<std::string>();
    const std::string opts = args["options"].as<std::string>();
    if (!opts.empty()) {
      json parsed = json::parse(opts, nullptr, false);
      if (parsed.is_discarded() || !parsed.is_object()) {
        std::cerr << "--options must be a JSON object\n";
        return 2;
      }
      request_args["options"] = std::move(parsed);
    }
  } else if (command == "status") {
    endpoint = "get_job";
  } else if (command == "cancel") {
    endpoint = "cancel_job";
  } else if (command == "delete") {
    endpoint = "delete_job";
  } else if (command == "retry-stitch") {
    endpoint = "retry_stitch";
  } else {
    std::cerr << "unknown command: " << command << "\n";
    return 2;
  }
  if (!takes_input) request_args["jobId"] = target;

  vscrub::sdk::NatsClient client;
  vscrub::sdk::NatsClient::Options nats_opts;
  nats_opts.name = "vscrubctl";
  nats_opts.max_reconnect = 0;
  if (!client.connect(args["nats-url"].as<std::string>(), nats_opts)) {
    std::cerr << "cannot connect to NATS: " << vscrub::sdk::NatsClient::last_error() << "\n";
    return 1;
  }

  const json envelope{{"reqId", "ctl-" + std::to_string(static_cast<long long>(vscrub::sdk::now_ms()))},
                      {"args", request_args},
                      {"meta", json{{"client", "vscrubctl"}}}};
  const std::string body = envelope.dump();
  const std::string subject = vscrub::sdk::api_endpoint_subject(args["api-prefix"].as<std::string>(), endpoint);
  const auto raw = client.request(subject, std::vector<std::uint8_t>(body.begin(), body.end()),
                                  args["timeout-ms"].as<std::int64_t>());
  const int rc = print_reply(raw);
  client.close();
  return rc;
}
