#pragma once

#include <map>
#include <mutex>
#include <string>

#include "vscrubsdk/record_store.h"

namespace vscrub::sdk {

// In-process record store for tests and single-process runs.
class MemoryRecordStore final : public RecordStore {
 public:
  StoreStatus get(const std::string& key, VersionedValue& out) const override;
  StoreStatus create(const std::string& key, const std::vector<std::uint8_t>& bytes,
                     std::uint64_t* out_rev = nullptr) override;
  StoreStatus update(const std::string& key, const std::vector<std::uint8_t>& bytes, std::uint64_t expected_rev,
                     std::uint64_t* out_rev = nullptr) override;
  StoreStatus remove(const std::string& key) override;
  StoreStatus list_keys(const std::string& prefix, std::vector<std::string>& out) const override;

  std::size_t size() const;

 private:
  mutable std::mutex mu_;
  std::map<std::string, VersionedValue> entries_;
  std::uint64_t next_rev_ = 1;
};

}  // namespace vscrub::sdk
