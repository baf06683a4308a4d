#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace vscrub::sdk {

enum class StoreStatus : std::uint8_t {
  kOk,
  kConflict,  // key exists on create, or revision mismatch on update
  kNotFound,
  kError,
};

const char* to_string(StoreStatus status);

struct VersionedValue {
  std::vector<std::uint8_t> bytes;
  std::uint64_t revision = 0;
};

// Transactional key/value record store. Each key carries a revision that grows on
// every write; `update` is a compare-and-set on that revision and is linearizable
// per key.
class RecordStore {
 public:
  virtual ~RecordStore() = default;

  virtual StoreStatus get(const std::string& key, VersionedValue& out) const = 0;

  // Create only if absent.
  virtual StoreStatus create(const std::string& key, const std::vector<std::uint8_t>& bytes,
                             std::uint64_t* out_rev = nullptr) = 0;

  // Write only if the current revision equals `expected_rev`.
  virtual StoreStatus update(const std::string& key, const std::vector<std::uint8_t>& bytes,
                             std::uint64_t expected_rev, std::uint64_t* out_rev = nullptr) = 0;

  virtual StoreStatus remove(const std::string& key) = 0;

  virtual StoreStatus list_keys(const std::string& prefix, std::vector<std::string>& out) const = 0;
};

}  // namespace vscrub::sdk
