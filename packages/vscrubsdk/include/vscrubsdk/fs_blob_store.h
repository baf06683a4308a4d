#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "vscrubsdk/blob_store.h"

namespace vscrub::sdk {

// Content-addressed blob store on a local (or shared) filesystem.
//
// Shared blobs live under `root/<aa>/<sha256>-<size>.bin` and are referenced as
// `blob:<sha256>-<size>`. Scoped blobs live under `root/scopes/<scope>/<aa>/...`
// and are referenced as `blob:<scope>/<sha256>-<size>`. Writes go to a temp file
// first and are renamed into place, so readers never observe partial content.
// `file:<path>` refs address external inputs read-only.
class FsBlobStore final : public BlobStore {
 public:
  using DurationProbe = std::function<std::optional<double>(const std::string& path, OpError* err)>;

  struct Config {
    std::string root = "./vscrub-blobs";
    bool allow_file_refs = true;
  };

  FsBlobStore(Config cfg, DurationProbe probe);

  bool init(OpError* err = nullptr);

  bool put(const std::string& scope, const std::vector<std::uint8_t>& bytes, std::string& out_ref,
           OpError* err = nullptr) override;
  bool get(const std::string& ref, std::vector<std::uint8_t>& out, OpError* err = nullptr) const override;
  std::optional<double> probe(const std::string& ref, OpError* err = nullptr) const override;
  std::optional<std::string> local_path(const std::string& ref, OpError* err = nullptr) const override;
  bool remove(const std::string& ref, OpError* err = nullptr) override;
  bool remove_scope(const std::string& scope, OpError* err = nullptr) override;

  // Copies a local file into the shared pool.
  bool put_file(const std::string& path, std::string& out_ref, OpError* err = nullptr);

  // Ref of `bytes` under `scope`; empty when the digest cannot be computed.
  static std::string content_ref(const std::string& scope, const std::vector<std::uint8_t>& bytes);

 private:
  std::optional<std::string> blob_path(const std::string& ref) const;

  Config cfg_;
  DurationProbe probe_;
};

}  // namespace vscrub::sdk
