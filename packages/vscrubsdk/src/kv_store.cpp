#include "vscrubsdk/kv_store.h"

#include <nats/nats.h>

#include <cstring>

#include <spdlog/spdlog.h>

namespace vscrub::sdk {

KvStore::~KvStore() {
  close();
}

KvStore::KvStore(KvStore&& other) noexcept {
  kv_ = other.kv_;
  bucket_ = std::move(other.bucket_);
  other.kv_ = nullptr;
}

KvStore& KvStore::operator=(KvStore&& other) noexcept {
  if (this == &other) {
    return *this;
  }
  close();
  kv_ = other.kv_;
  bucket_ = std::move(other.bucket_);
  other.kv_ = nullptr;
  return *this;
}

bool KvStore::open_or_create(jsCtx* js, const KvConfig& cfg) {
  if (js == nullptr) {
    return false;
  }
  close();

  kvStore* kv = nullptr;
  natsStatus s = js_KeyValue(&kv, js, cfg.bucket.c_str());
  if (s == NATS_OK && kv != nullptr) {
    kv_ = kv;
    bucket_ = cfg.bucket;
    return true;
  }

  kvConfig c;
  kvConfig_Init(&c);
  c.Bucket = cfg.bucket.c_str();
  c.History = cfg.history;
  c.MaxBytes = cfg.max_bytes;
  c.TTL = (cfg.ttl_ms <= 0) ? 0 : (cfg.ttl_ms * 1000000LL);  // ns
  c.StorageType = cfg.memory_storage ? js_MemoryStorage : js_FileStorage;
  c.Replicas = cfg.replicas;

  s = js_CreateKeyValue(&kv, js, &c);
  if (s != NATS_OK || kv == nullptr) {
    spdlog::error("KV create failed bucket={} err={}", cfg.bucket, natsStatus_GetText(s));
    return false;
  }
  kv_ = kv;
  bucket_ = cfg.bucket;
  return true;
}

void KvStore::close() {
  if (kv_ != nullptr) {
    kvStore_Destroy(kv_);
    kv_ = nullptr;
  }
}

StoreStatus KvStore::get(const std::string& key, VersionedValue& out) const {
  if (kv_ == nullptr) {
    return StoreStatus::kError;
  }
  kvEntry* e = nullptr;
  const natsStatus s = kvStore_Get(&e, kv_, key.c_str());
  if (s == NATS_NOT_FOUND) {
    if (e) kvEntry_Destroy(e);
    return StoreStatus::kNotFound;
  }
  if (s != NATS_OK || e == nullptr) {
    if (e) kvEntry_Destroy(e);
    spdlog::warn("KV get failed bucket={} key={} err={}", bucket_, key, natsStatus_GetText(s));
    return StoreStatus::kError;
  }
  const void* data = kvEntry_Value(e);
  const int len = kvEntry_ValueLen(e);
  out.bytes.clear();
  if (data != nullptr && len > 0) {
    out.bytes.resize(static_cast<std::size_t>(len));
    std::memcpy(out.bytes.data(), data, static_cast<std::size_t>(len));
  }
  out.revision = kvEntry_Revision(e);
  kvEntry_Destroy(e);
  return StoreStatus::kOk;
}

StoreStatus KvStore::create(const std::string& key, const std::vector<std::uint8_t>& bytes, std::uint64_t* out_rev) {
  if (kv_ == nullptr) {
    return StoreStatus::kError;
  }
  uint64_t rev = 0;
  const natsStatus s = kvStore_Create(&rev, kv_, key.c_str(), bytes.data(), static_cast<int>(bytes.size()));
  if (s == NATS_OK) {
    if (out_rev != nullptr) *out_rev = rev;
    return StoreStatus::kOk;
  }
  // The client does not expose the JetStream error code here; tell a lost race
  // apart from a transport failure by looking at the key.
  VersionedValue existing;
  if (get(key, existing) == StoreStatus::kOk) {
    return StoreStatus::kConflict;
  }
  spdlog::warn("KV create failed bucket={} key={} err={}", bucket_, key, natsStatus_GetText(s));
  return StoreStatus::kError;
}

StoreStatus KvStore::update(const std::string& key, const std::vector<std::uint8_t>& bytes, std::uint64_t expected_rev,
                            std::uint64_t* out_rev) {
  if (kv_ == nullptr) {
    return StoreStatus::kError;
  }
  uint64_t rev = 0;
  const natsStatus s =
      kvStore_Update(&rev, kv_, key.c_str(), bytes.data(), static_cast<int>(bytes.size()), expected_rev);
  if (s == NATS_OK) {
    if (out_rev != nullptr) *out_rev = rev;
    return StoreStatus::kOk;
  }
  VersionedValue current;
  const StoreStatus gs = get(key, current);
  if (gs == StoreStatus::kNotFound) {
    return StoreStatus::kNotFound;
  }
  if (gs == StoreStatus::kOk && current.revision != expected_rev) {
    return StoreStatus::kConflict;
  }
  spdlog::warn("KV update failed bucket={} key={} err={}", bucket_, key, natsStatus_GetText(s));
  return StoreStatus::kError;
}

StoreStatus KvStore::remove(const std::string& key) {
  if (kv_ == nullptr) {
    return StoreStatus::kError;
  }
  const natsStatus s = kvStore_Delete(kv_, key.c_str());
  if (s == NATS_OK) return StoreStatus::kOk;
  if (s == NATS_NOT_FOUND) return StoreStatus::kNotFound;
  spdlog::warn("KV delete failed bucket={} key={} err={}", bucket_, key, natsStatus_GetText(s));
  return StoreStatus::kError;
}

StoreStatus KvStore::list_keys(const std::string& prefix, std::vector<std::string>& out) const {
  out.clear();
  if (kv_ == nullptr) {
    return StoreStatus::kError;
  }
  kvKeysList list;
  std::memset(&list, 0, sizeof(list));
  const natsStatus s = kvStore_Keys(&list, kv_, nullptr);
  if (s == NATS_NOT_FOUND) {
    return StoreStatus::kOk;  // empty bucket
  }
  if (s != NATS_OK) {
    spdlog::warn("KV keys failed bucket={} err={}", bucket_, natsStatus_GetText(s));
    return StoreStatus::kError;
  }
  for (int i = 0; i < list.Count; ++i) {
    const char* k = list.Keys[i];
    if (k == nullptr) continue;
    const std::string key(k);
    if (key.compare(0, prefix.size(), prefix) == 0) {
      out.push_back(key);
    }
  }
  kvKeysList_Destroy(&list);
  return StoreStatus::kOk;
}

}  // namespace vscrub::sdk
