#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "vscrubsdk/blob_store.h"
#include "vscrubsdk/chunk_pipeline.h"
#include "vscrubsdk/fs_blob_store.h"
#include "vscrubsdk/notifier.h"
#include "vscrubsdk/record_store.h"
#include "vscrubsdk/stitch_coordinator.h"

namespace vscrub::test {

using sdk::ErrorCode;
using sdk::OpError;

inline std::vector<std::uint8_t> bytes_of(const std::string& s) { return std::vector<std::uint8_t>(s.begin(), s.end()); }

inline std::string string_of(const std::vector<std::uint8_t>& b) { return std::string(b.begin(), b.end()); }

// Blobs held in memory. Inputs are registered with a duration; every ref maps to
// the pseudo path "/mem/<ref>".
class MemoryBlobStore final : public sdk::BlobStore {
 public:
  void add_input(const std::string& ref, double duration_s) {
    std::lock_guard<std::mutex> lock(mu_);
    durations_[ref] = duration_s;
    blobs_[ref] = bytes_of("input:" + ref);
  }

  void fail_probe(ErrorCode code, int times) {
    std::lock_guard<std::mutex> lock(mu_);
    probe_fail_code_ = code;
    probe_failures_left_ = times;
  }

  void fail_puts(int times) {
    std::lock_guard<std::mutex> lock(mu_);
    put_failures_left_ = times;
  }

  bool put(const std::string& scope, const std::vector<std::uint8_t>& bytes, std::string& out_ref,
           OpError* err) override {
    std::lock_guard<std::mutex> lock(mu_);
    if (put_failures_left_ > 0) {
      --put_failures_left_;
      sdk::set_error(err, ErrorCode::kTransientIo, "injected put failure");
      return false;
    }
    out_ref = sdk::FsBlobStore::content_ref(scope, bytes);
    blobs_[out_ref] = bytes;
    ++puts_;
    return true;
  }

  bool get(const std::string& ref, std::vector<std::uint8_t>& out, OpError* err) const override {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = blobs_.find(ref);
    if (it == blobs_.end()) {
      sdk::set_error(err, ErrorCode::kNotFound, "no blob " + ref);
      return false;
    }
    out = it->second;
    return true;
  }

  std::optional<double> probe(const std::string& ref, OpError* err) const override {
    std::lock_guard<std::mutex> lock(mu_);
    if (probe_failures_left_ > 0) {
      --probe_failures_left_;
      sdk::set_error(err, probe_fail_code_, "injected probe failure");
      return std::nullopt;
    }
    auto it = durations_.find(ref);
    if (it == durations_.end()) {
      sdk::set_error(err, ErrorCode::kCorruptInput, "not a video: " + ref);
      return std::nullopt;
    }
    return it->second;
  }

  std::optional<std::string> local_path(const std::string& ref, OpError* err) const override {
    std::lock_guard<std::mutex> lock(mu_);
    if (blobs_.count(ref) == 0) {
      sdk::set_error(err, ErrorCode::kNotFound, "no blob " + ref);
      return std::nullopt;
    }
    return "/mem/" + ref;
  }

  bool remove(const std::string& ref, OpError*) override {
    std::lock_guard<std::mutex> lock(mu_);
    blobs_.erase(ref);
    removed_.insert(ref);
    return true;
  }

  bool remove_scope(const std::string& scope, OpError*) override {
    std::lock_guard<std::mutex> lock(mu_);
    for (auto it = blobs_.begin(); it != blobs_.end();) {
      if (sdk::blob_ref_scope(it->first) == scope) {
        removed_.insert(it->first);
        it = blobs_.erase(it);
      } else {
        ++it;
      }
    }
    removed_scopes_.insert(scope);
    return true;
  }

  // Stores `bytes` under a fixed ref, as an upload into the shared pool would.
  void add_blob(const std::string& ref, const std::vector<std::uint8_t>& bytes) {
    std::lock_guard<std::mutex> lock(mu_);
    blobs_[ref] = bytes;
  }

  std::set<std::string> removed_scopes() const {
    std::lock_guard<std::mutex> lock(mu_);
    return removed_scopes_;
  }

  bool contains(const std::string& ref) const {
    std::lock_guard<std::mutex> lock(mu_);
    return blobs_.count(ref) > 0;
  }

  std::set<std::string> removed() const {
    std::lock_guard<std::mutex> lock(mu_);
    return removed_;
  }

  int put_count() const {
    std::lock_guard<std::mutex> lock(mu_);
    return puts_;
  }

 private:
  mutable std::mutex mu_;
  std::map<std::string, std::vector<std::uint8_t>> blobs_;
  std::map<std::string, double> durations_;
  std::set<std::string> removed_;
  std::set<std::string> removed_scopes_;
  ErrorCode probe_fail_code_ = ErrorCode::kTransientIo;
  mutable int probe_failures_left_ = 0;
  int put_failures_left_ = 0;
  int puts_ = 0;
};

inline sdk::TrackSummary make_track(std::int64_t id, const std::string& label, std::vector<float> embedding) {
  sdk::TrackSummary t;
  t.local_track_id = id;
  t.class_label = label;
  t.embedding = std::move(embedding);
  t.last_bbox = sdk::BBox{10.0f, 10.0f, 20.0f, 20.0f};
  return t;
}

// Renders "rendered:<job>:<index>" and reports one face track per overlap window, so
// that all chunks of a job chain into a single identity.
class FakePipeline final : public sdk::ChunkPipeline {
 public:
  sdk::ChunkRenderResult render(const sdk::ChunkRenderRequest& request) override {
    std::function<void(const sdk::ChunkRenderRequest&)> hook;
    {
      std::lock_guard<std::mutex> lock(mu_);
      ++renders_[request.index];
      requests_.push_back(request);
      hook = before_render;
      auto it = failures_.find(request.index);
      if (it != failures_.end() && it->second.remaining != 0) {
        if (it->second.remaining > 0) --it->second.remaining;
        throw sdk::ProcessingError(it->second.code, "injected failure for chunk " + std::to_string(request.index));
      }
    }
    if (hook) hook(request);
    if (request.should_abort && request.should_abort()) {
      throw sdk::ProcessingError(ErrorCode::kCancelled, "job cancelled");
    }

    sdk::ChunkRenderResult out;
    out.output_bytes = bytes_of("rendered:" + request.job_id + ":" + std::to_string(request.index));
    if (request.head_window_end_s > request.head_window_begin_s) {
      out.head_tracks.push_back(make_track(1, "face", {1.0f, 0.0f, 0.0f}));
    }
    if (request.tail_window_end_s > request.tail_window_begin_s) {
      out.tail_tracks.push_back(make_track(1, "face", {1.0f, 0.0f, 0.0f}));
    }
    return out;
  }

  // times < 0 fails forever.
  void fail(int index, ErrorCode code, int times) {
    std::lock_guard<std::mutex> lock(mu_);
    failures_[index] = Failure{code, times};
  }

  int renders(int index) const {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = renders_.find(index);
    return it == renders_.end() ? 0 : it->second;
  }

  std::vector<sdk::ChunkRenderRequest> requests() const {
    std::lock_guard<std::mutex> lock(mu_);
    return requests_;
  }

  std::function<void(const sdk::ChunkRenderRequest&)> before_render;

 private:
  struct Failure {
    ErrorCode code = ErrorCode::kTransientIo;
    int remaining = 0;
  };

  mutable std::mutex mu_;
  std::map<int, Failure> failures_;
  std::map<int, int> renders_;
  std::vector<sdk::ChunkRenderRequest> requests_;
};

// Prefixes the input bytes with "redacted:" and reports two regions.
class FakeImagePipeline final : public sdk::ImagePipeline {
 public:
  sdk::ImageRenderResult render(const sdk::ImageRenderRequest& request) override {
    last = request;
    ++renders;
    if (fail_code.has_value()) {
      throw sdk::ProcessingError(*fail_code, "injected image failure");
    }
    sdk::ImageRenderResult out;
    out.output_bytes = bytes_of("redacted:");
    out.output_bytes.insert(out.output_bytes.end(), request.input_bytes.begin(), request.input_bytes.end());
    out.regions = 2;
    return out;
  }

  std::optional<ErrorCode> fail_code;
  sdk::ImageRenderRequest last;
  int renders = 0;
};

class FakeConcatenator final : public sdk::VideoConcatenator {
 public:
  std::vector<std::uint8_t> concatenate(const std::vector<std::string>& chunk_paths,
                                        const std::function<void()>& keepalive) override {
    std::lock_guard<std::mutex> lock(mu_);
    ++calls_;
    last_paths_ = chunk_paths;
    // One keepalive per chunk, as a long re-encode would report progress.
    for (std::size_t i = 0; i < chunk_paths.size(); ++i) {
      if (keepalive) keepalive();
    }
    if (failures_left_ > 0) {
      --failures_left_;
      throw sdk::ProcessingError(ErrorCode::kTransientIo, "injected concat failure");
    }
    std::string joined = "artifact";
    for (const auto& p : chunk_paths) joined += "|" + p;
    return bytes_of(joined);
  }

  void fail_next(int times) {
    std::lock_guard<std::mutex> lock(mu_);
    failures_left_ = times;
  }

  int calls() const {
    std::lock_guard<std::mutex> lock(mu_);
    return calls_;
  }

  std::vector<std::string> last_paths() const {
    std::lock_guard<std::mutex> lock(mu_);
    return last_paths_;
  }

 private:
  mutable std::mutex mu_;
  int calls_ = 0;
  int failures_left_ = 0;
  std::vector<std::string> last_paths_;
};

// Forwards to another record store and fails chosen calls with kError.
class FlakyRecordStore final : public sdk::RecordStore {
 public:
  explicit FlakyRecordStore(sdk::RecordStore* inner) : inner_(inner) {}

  // The next `times` reads of keys starting with `prefix` fail.
  void fail_gets(const std::string& prefix, int times) {
    std::lock_guard<std::mutex> lock(mu_);
    get_prefix_ = prefix;
    get_failures_left_ = times;
  }

  void fail_lists(int times) {
    std::lock_guard<std::mutex> lock(mu_);
    list_failures_left_ = times;
  }

  int failed_gets() const {
    std::lock_guard<std::mutex> lock(mu_);
    return failed_gets_;
  }

  sdk::StoreStatus get(const std::string& key, sdk::VersionedValue& out) const override {
    {
      std::lock_guard<std::mutex> lock(mu_);
      if (get_failures_left_ > 0 && key.compare(0, get_prefix_.size(), get_prefix_) == 0) {
        --get_failures_left_;
        ++failed_gets_;
        return sdk::StoreStatus::kError;
      }
    }
    return inner_->get(key, out);
  }

  sdk::StoreStatus create(const std::string& key, const std::vector<std::uint8_t>& bytes,
                          std::uint64_t* out_rev) override {
    return inner_->create(key, bytes, out_rev);
  }

  sdk::StoreStatus update(const std::string& key, const std::vector<std::uint8_t>& bytes, std::uint64_t expected_rev,
                          std::uint64_t* out_rev) override {
    return inner_->update(key, bytes, expected_rev, out_rev);
  }

  sdk::StoreStatus remove(const std::string& key) override { return inner_->remove(key); }

  sdk::StoreStatus list_keys(const std::string& prefix, std::vector<std::string>& out) const override {
    {
      std::lock_guard<std::mutex> lock(mu_);
      if (list_failures_left_ > 0) {
        --list_failures_left_;
        return sdk::StoreStatus::kError;
      }
    }
    return inner_->list_keys(prefix, out);
  }

 private:
  sdk::RecordStore* inner_ = nullptr;
  mutable std::mutex mu_;
  std::string get_prefix_;
  mutable int get_failures_left_ = 0;
  mutable int list_failures_left_ = 0;
  mutable int failed_gets_ = 0;
};

class RecordingNotifier final : public sdk::JobNotifier {
 public:
  void job_finished(const sdk::Job& job) override {
    std::lock_guard<std::mutex> lock(mu_);
    events_.push_back(job);
  }

  std::vector<sdk::Job> events() const {
    std::lock_guard<std::mutex> lock(mu_);
    return events_;
  }

 private:
  mutable std::mutex mu_;
  std::vector<sdk::Job> events_;
};

inline bool wait_until(const std::function<bool()>& pred, std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred()) return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  return pred();
}

}  // namespace vscrub::test
