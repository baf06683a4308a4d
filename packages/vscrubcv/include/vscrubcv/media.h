#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "vscrubsdk/errors.h"

namespace vscrub::vision {

struct VideoInfo {
  double fps = 0.0;
  int width = 0;
  int height = 0;
  std::int64_t frame_count = 0;
  double duration_s = 0.0;
};

// Opens the container and reads its stream properties.
bool probe_video(const std::string& path, VideoInfo& out, std::string& err);

// Duration probe for the blob store. Unreadable or empty media is kCorruptInput.
std::optional<double> probe_duration(const std::string& path, sdk::OpError* err);

int fourcc_code(const std::string& fourcc);

bool read_file_bytes(const std::string& path, std::vector<std::uint8_t>& out);

// Unique path in the temp directory, removed when the object goes away.
class TempFile {
 public:
  explicit TempFile(const std::string& suffix);
  ~TempFile();
  TempFile(const TempFile&) = delete;
  TempFile& operator=(const TempFile&) = delete;

  const std::string& path() const { return path_; }

 private:
  std::string path_;
};

}  // namespace vscrub::vision
