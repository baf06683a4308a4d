#include "vscrubsdk/memory_record_store.h"

namespace vscrub::sdk {

const char* to_string(StoreStatus status) {
  switch (status) {
    case StoreStatus::kOk:
      return "ok";
    case StoreStatus::kConflict:
      return "conflict";
    case StoreStatus::kNotFound:
      return "not_found";
    case StoreStatus::kError:
      return "error";
  }
  return "error";
}

StoreStatus MemoryRecordStore::get(const std::string& key, VersionedValue& out) const {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = entries_.find(key);
  if (it == entries_.end()) return StoreStatus::kNotFound;
  out = it->second;
  return StoreStatus::kOk;
}

StoreStatus MemoryRecordStore::create(const std::string& key, const std::vector<std::uint8_t>& bytes,
                                      std::uint64_t* out_rev) {
  std::lock_guard<std::mutex> lock(mu_);
  if (entries_.find(key) != entries_.end()) return StoreStatus::kConflict;
  const std::uint64_t rev = next_rev_++;
  entries_.emplace(key, VersionedValue{bytes, rev});
  if (out_rev != nullptr) *out_rev = rev;
  return StoreStatus::kOk;
}

StoreStatus MemoryRecordStore::update(const std::string& key, const std::vector<std::uint8_t>& bytes,
                                      std::uint64_t expected_rev, std::uint64_t* out_rev) {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = entries_.find(key);
  if (it == entries_.end()) return StoreStatus::kNotFound;
  if (it->second.revision != expected_rev) return StoreStatus::kConflict;
  const std::uint64_t rev = next_rev_++;
  it->second = VersionedValue{bytes, rev};
  if (out_rev != nullptr) *out_rev = rev;
  return StoreStatus::kOk;
}

StoreStatus MemoryRecordStore::remove(const std::string& key) {
  std::lock_guard<std::mutex> lock(mu_);
  return entries_.erase(key) > 0 ? StoreStatus::kOk : StoreStatus::kNotFound;
}

StoreStatus MemoryRecordStore::list_keys(const std::string& prefix, std::vector<std::string>& out) const {
  std::lock_guard<std::mutex> lock(mu_);
  out.clear();
  for (auto it = entries_.lower_bound(prefix); it != entries_.end(); ++it) {
    if (it->first.compare(0, prefix.size(), prefix) != 0) break;
    out.push_back(it->first);
  }
  return StoreStatus::kOk;
}

std::size_t MemoryRecordStore::size() const {
  std::lock_guard<std::mutex> lock(mu_);
  return entries_.size();
}

}  // namespace vscrub::sdk
