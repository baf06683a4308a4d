#include "vscrubsdk/fs_blob_store.h"

#include <atomic>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <system_error>

#include <openssl/evp.h>
#include <spdlog/spdlog.h>

#include <unistd.h>

namespace vscrub::sdk {

namespace fs = std::filesystem;

namespace {

constexpr const char* kBlobScheme = "blob:";
constexpr const char* kFileScheme = "file:";

bool has_prefix(const std::string& s, const char* prefix) {
  const std::string p(prefix);
  return s.size() > p.size() && s.compare(0, p.size(), p) == 0;
}

constexpr std::size_t kDigestHex = 64;
constexpr const char* kScopeDir = "scopes";

std::string sha256_hex(const std::vector<std::uint8_t>& bytes) {
  unsigned char md[EVP_MAX_MD_SIZE];
  unsigned int md_len = 0;
  if (EVP_Digest(bytes.data(), bytes.size(), md, &md_len, EVP_sha256(), nullptr) != 1) {
    return std::string();
  }
  static const char* hex = "0123456789abcdef";
  std::string out;
  out.reserve(md_len * 2);
  for (unsigned int i = 0; i < md_len; ++i) {
    out.push_back(hex[md[i] >> 4]);
    out.push_back(hex[md[i] & 0x0f]);
  }
  return out;
}

bool valid_blob_name(const std::string& name) {
  // <64 hex>-<decimal size>
  if (name.size() < kDigestHex + 2 || name[kDigestHex] != '-') return false;
  for (std::size_t i = 0; i < name.size(); ++i) {
    const char c = name[i];
    if (i < kDigestHex) {
      if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) return false;
    } else if (i > kDigestHex) {
      if (c < '0' || c > '9') return false;
    }
  }
  return true;
}

bool read_file(const fs::path& path, std::vector<std::uint8_t>& out) {
  std::ifstream in(path, std::ios::binary);
  if (!in) return false;
  out.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
  return !in.bad();
}

}  // namespace

FsBlobStore::FsBlobStore(Config cfg, DurationProbe probe) : cfg_(std::move(cfg)), probe_(std::move(probe)) {}

bool FsBlobStore::init(OpError* err) {
  std::error_code ec;
  fs::create_directories(fs::path(cfg_.root) / "tmp", ec);
  if (ec) {
    set_error(err, ErrorCode::kTransientIo, "create blob root failed: " + ec.message());
    return false;
  }
  spdlog::info("blob store ready root={}", cfg_.root);
  return true;
}

std::string FsBlobStore::content_ref(const std::string& scope, const std::vector<std::uint8_t>& bytes) {
  const std::string digest = sha256_hex(bytes);
  if (digest.empty()) return std::string();
  std::string ref = kBlobScheme;
  if (!scope.empty()) ref += scope + "/";
  return ref + digest + "-" + std::to_string(bytes.size());
}

std::optional<std::string> FsBlobStore::blob_path(const std::string& ref) const {
  if (has_prefix(ref, kBlobScheme)) {
    std::string name = ref.substr(std::string(kBlobScheme).size());
    const std::string scope = blob_ref_scope(ref);
    fs::path dir(cfg_.root);
    if (!scope.empty()) {
      if (!valid_blob_scope(scope)) return std::nullopt;
      name = name.substr(scope.size() + 1);
      dir = dir / kScopeDir / scope;
    }
    if (!valid_blob_name(name)) return std::nullopt;
    return (dir / name.substr(0, 2) / (name + ".bin")).string();
  }
  if (cfg_.allow_file_refs && has_prefix(ref, kFileScheme)) {
    return ref.substr(std::string(kFileScheme).size());
  }
  return std::nullopt;
}

bool FsBlobStore::put(const std::string& scope, const std::vector<std::uint8_t>& bytes, std::string& out_ref,
                      OpError* err) {
  static std::atomic<std::uint64_t> tmp_seq{0};

  if (!scope.empty() && !valid_blob_scope(scope)) {
    set_error(err, ErrorCode::kInvalidArgument, "invalid blob scope " + scope);
    return false;
  }
  const std::string ref = content_ref(scope, bytes);
  if (ref.empty()) {
    set_error(err, ErrorCode::kInternal, "content digest failed");
    return false;
  }
  const auto path = blob_path(ref);
  if (!path.has_value()) {
    set_error(err, ErrorCode::kInternal, "cannot map ref " + ref);
    return false;
  }

  std::error_code ec;
  if (fs::exists(*path, ec) && fs::file_size(*path, ec) == bytes.size() && !ec) {
    out_ref = ref;
    return true;
  }
  fs::create_directories(fs::path(*path).parent_path(), ec);
  if (ec) {
    set_error(err, ErrorCode::kTransientIo, "create blob dir failed: " + ec.message());
    return false;
  }

  const fs::path tmp = fs::path(cfg_.root) / "tmp" /
                       (fs::path(*path).stem().string() + "." + std::to_string(::getpid()) + "." +
                        std::to_string(tmp_seq.fetch_add(1)));
  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out) {
      set_error(err, ErrorCode::kTransientIo, "open temp blob failed: " + tmp.string());
      return false;
    }
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    out.flush();
    if (!out) {
      out.close();
      fs::remove(tmp, ec);
      set_error(err, ErrorCode::kTransientIo, "write temp blob failed: " + tmp.string());
      return false;
    }
  }
  fs::rename(tmp, *path, ec);
  if (ec) {
    std::error_code ignore;
    fs::remove(tmp, ignore);
    set_error(err, ErrorCode::kTransientIo, "rename blob failed: " + ec.message());
    return false;
  }
  spdlog::debug("blob stored ref={} bytes={}", ref, bytes.size());
  out_ref = ref;
  return true;
}

bool FsBlobStore::put_file(const std::string& path, std::string& out_ref, OpError* err) {
  std::vector<std::uint8_t> bytes;
  if (!read_file(path, bytes)) {
    set_error(err, ErrorCode::kNotFound, "cannot read " + path);
    return false;
  }
  return put(std::string(), bytes, out_ref, err);
}

bool FsBlobStore::get(const std::string& ref, std::vector<std::uint8_t>& out, OpError* err) const {
  const auto path = blob_path(ref);
  if (!path.has_value()) {
    set_error(err, ErrorCode::kInvalidArgument, "unsupported blob ref " + ref);
    return false;
  }
  std::error_code ec;
  if (!fs::exists(*path, ec)) {
    set_error(err, ErrorCode::kNotFound, "blob not found " + ref);
    return false;
  }
  if (!read_file(*path, out)) {
    set_error(err, ErrorCode::kTransientIo, "read blob failed " + ref);
    return false;
  }
  return true;
}

std::optional<std::string> FsBlobStore::local_path(const std::string& ref, OpError* err) const {
  const auto path = blob_path(ref);
  if (!path.has_value()) {
    set_error(err, ErrorCode::kInvalidArgument, "unsupported blob ref " + ref);
    return std::nullopt;
  }
  std::error_code ec;
  if (!fs::is_regular_file(*path, ec)) {
    set_error(err, ErrorCode::kNotFound, "blob not found " + ref);
    return std::nullopt;
  }
  return path;
}

std::optional<double> FsBlobStore::probe(const std::string& ref, OpError* err) const {
  const auto path = local_path(ref, err);
  if (!path.has_value()) {
    return std::nullopt;
  }
  if (!probe_) {
    set_error(err, ErrorCode::kInternal, "no duration probe configured");
    return std::nullopt;
  }
  return probe_(*path, err);
}

bool FsBlobStore::remove(const std::string& ref, OpError* err) {
  if (has_prefix(ref, kFileScheme)) {
    return true;  // external inputs are not owned by the store
  }
  const auto path = blob_path(ref);
  if (!path.has_value()) {
    set_error(err, ErrorCode::kInvalidArgument, "unsupported blob ref " + ref);
    return false;
  }
  std::error_code ec;
  fs::remove(*path, ec);
  if (ec) {
    set_error(err, ErrorCode::kTransientIo, "remove blob failed: " + ec.message());
    return false;
  }
  return true;
}

bool FsBlobStore::remove_scope(const std::string& scope, OpError* err) {
  if (!valid_blob_scope(scope)) {
    set_error(err, ErrorCode::kInvalidArgument, "invalid blob scope " + scope);
    return false;
  }
  std::error_code ec;
  const auto removed = fs::remove_all(fs::path(cfg_.root) / kScopeDir / scope, ec);
  if (ec) {
    set_error(err, ErrorCode::kTransientIo, "remove blob scope failed: " + ec.message());
    return false;
  }
  spdlog::debug("blob scope removed scope={} entries={}", scope, removed);
  return true;
}

}  // namespace vscrub::sdk
