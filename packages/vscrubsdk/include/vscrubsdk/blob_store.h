#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "vscrubsdk/errors.h"

namespace vscrub::sdk {

// Opaque blob storage. Refs returned by `put` are stable locators; writing the same
// bytes twice into the same scope yields the same ref.
//
// A non-empty scope (a job id) gives the blob a namespace of its own, so that
// identical bytes written by two jobs never share storage. The empty scope is the
// shared upload pool.
class BlobStore {
 public:
  virtual ~BlobStore() = default;

  virtual bool put(const std::string& scope, const std::vector<std::uint8_t>& bytes, std::string& out_ref,
                   OpError* err = nullptr) = 0;
  virtual bool get(const std::string& ref, std::vector<std::uint8_t>& out, OpError* err = nullptr) const = 0;

  // Media duration in seconds.
  virtual std::optional<double> probe(const std::string& ref, OpError* err = nullptr) const = 0;

  // Path of a local file holding the blob, readable as long as the blob exists.
  virtual std::optional<std::string> local_path(const std::string& ref, OpError* err = nullptr) const = 0;

  // Removing a missing blob succeeds.
  virtual bool remove(const std::string& ref, OpError* err = nullptr) = 0;

  // Removes every blob written under `scope`. Removing an empty scope succeeds.
  virtual bool remove_scope(const std::string& scope, OpError* err = nullptr) = 0;
};

// Scope a `blob:` ref was written under; empty for the shared pool and other schemes.
std::string blob_ref_scope(const std::string& ref);

// Scope names are restricted to [A-Za-z0-9_.-] and may not start with '.'.
bool valid_blob_scope(const std::string& scope);

}  // namespace vscrub::sdk
