#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <nats/nats.h>

#include "vscrubsdk/record_store.h"

namespace vscrub::sdk {

struct KvConfig {
  std::string bucket;
  std::uint8_t history = 1;
  std::int64_t max_bytes = -1;
  std::int64_t ttl_ms = 0;
  bool memory_storage = false;
  int replicas = 1;
};

// JetStream key/value bucket used as the transactional record store.
// Compare-and-set maps onto the bucket revisions (kvStore_Create / kvStore_Update).
class KvStore final : public RecordStore {
 public:
  KvStore() = default;
  ~KvStore() override;
  KvStore(const KvStore&) = delete;
  KvStore& operator=(const KvStore&) = delete;
  KvStore(KvStore&&) noexcept;
  KvStore& operator=(KvStore&&) noexcept;

  bool open_or_create(jsCtx* js, const KvConfig& cfg);
  void close();
  bool valid() const { return kv_ != nullptr; }

  StoreStatus get(const std::string& key, VersionedValue& out) const override;
  StoreStatus create(const std::string& key, const std::vector<std::uint8_t>& bytes,
                     std::uint64_t* out_rev = nullptr) override;
  StoreStatus update(const std::string& key, const std::vector<std::uint8_t>& bytes, std::uint64_t expected_rev,
                     std::uint64_t* out_rev = nullptr) override;
  StoreStatus remove(const std::string& key) override;
  StoreStatus list_keys(const std::string& prefix, std::vector<std::string>& out) const override;

 private:
  kvStore* kv_ = nullptr;
  std::string bucket_;
};

}  // namespace vscrub::sdk
