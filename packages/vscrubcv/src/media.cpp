#include "vscrubcv/media.h"

#include <atomic>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <system_error>

#include <opencv2/videoio.hpp>
#include <spdlog/spdlog.h>

#include <unistd.h>

#include "vscrubsdk/time_utils.h"

namespace vscrub::vision {

bool probe_video(const std::string& path, VideoInfo& out, std::string& err) {
  cv::VideoCapture cap;
  try {
    if (!cap.open(path)) {
      err = "cannot open video " + path;
      return false;
    }
  } catch (const cv::Exception& ex) {
    err = std::string("open video failed: ") + ex.what();
    return false;
  }
  VideoInfo info;
  info.fps = cap.get(cv::CAP_PROP_FPS);
  info.width = static_cast<int>(cap.get(cv::CAP_PROP_FRAME_WIDTH));
  info.height = static_cast<int>(cap.get(cv::CAP_PROP_FRAME_HEIGHT));
  info.frame_count = static_cast<std::int64_t>(cap.get(cv::CAP_PROP_FRAME_COUNT));
  if (!(info.fps > 0.0) || !std::isfinite(info.fps)) {
    err = "video reports no frame rate";
    return false;
  }
  if (info.frame_count <= 0) {
    err = "video reports no frames";
    return false;
  }
  info.duration_s = static_cast<double>(info.frame_count) / info.fps;
  out = info;
  return true;
}

std::optional<double> probe_duration(const std::string& path, sdk::OpError* err) {
  VideoInfo info;
  std::string msg;
  if (!probe_video(path, info, msg)) {
    sdk::set_error(err, sdk::ErrorCode::kCorruptInput, msg);
    return std::nullopt;
  }
  spdlog::debug("probed path={} fps={:.3f} frames={} durationS={:.3f}", path, info.fps, info.frame_count,
                info.duration_s);
  return info.duration_s;
}

int fourcc_code(const std::string& fourcc) {
  if (fourcc.size() != 4) return cv::VideoWriter::fourcc('m', 'p', '4', 'v');
  return cv::VideoWriter::fourcc(fourcc[0], fourcc[1], fourcc[2], fourcc[3]);
}

bool read_file_bytes(const std::string& path, std::vector<std::uint8_t>& out) {
  std::ifstream in(path, std::ios::binary);
  if (!in) return false;
  out.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
  return !in.bad();
}

TempFile::TempFile(const std::string& suffix) {
  static std::atomic<std::uint64_t> seq{0};
  std::error_code ec;
  auto dir = std::filesystem::temp_directory_path(ec);
  if (ec) dir = "/tmp";
  path_ = (dir / ("vscrub_" + std::to_string(::getpid()) + "_" + std::to_string(sdk::now_ms()) + "_" +
                  std::to_string(seq.fetch_add(1)) + suffix))
              .string();
}

TempFile::~TempFile() {
  std::error_code ec;
  std::filesystem::remove(path_, ec);
}

}  // namespace vscrub::vision
