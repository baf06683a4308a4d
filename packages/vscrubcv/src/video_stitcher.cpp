#include "vscrubcv/video_stitcher.h"

#include <cmath>

#include <opencv2/imgproc.hpp>
#include <opencv2/videoio.hpp>
#include <spdlog/spdlog.h>

#include "vscrubcv/media.h"

namespace vscrub::vision {

using sdk::ErrorCode;
using sdk::ProcessingError;

std::vector<std::uint8_t> OpenCvConcatenator::concatenate(const std::vector<std::string>& chunk_paths,
                                                          const std::function<void()>& keepalive) {
  if (chunk_paths.empty()) {
    throw ProcessingError(ErrorCode::kInvalidArgument, "nothing to concatenate");
  }
  TempFile out_file(cfg_.container_suffix);
  cv::VideoWriter writer;
  cv::Size size;
  std::int64_t total = 0;

  try {
    for (std::size_t i = 0; i < chunk_paths.size(); ++i) {
      cv::VideoCapture cap(chunk_paths[i]);
      if (!cap.isOpened()) {
        throw ProcessingError(ErrorCode::kCorruptInput, "cannot open chunk output " + std::to_string(i));
      }
      if (!writer.isOpened()) {
        const double fps = cap.get(cv::CAP_PROP_FPS);
        size = cv::Size(static_cast<int>(cap.get(cv::CAP_PROP_FRAME_WIDTH)),
                        static_cast<int>(cap.get(cv::CAP_PROP_FRAME_HEIGHT)));
        if (!(fps > 0.0) || size.area() <= 0 ||
            !writer.open(out_file.path(), fourcc_code(cfg_.fourcc), fps, size, true)) {
          throw ProcessingError(ErrorCode::kInternal, "cannot open output encoder");
        }
      }
      cv::Mat frame;
      cv::Mat resized;
      while (cap.read(frame)) {
        if (frame.size() != size) {
          cv::resize(frame, resized, size);
          writer.write(resized);
        } else {
          writer.write(frame);
        }
        ++total;
        if (keepalive && cfg_.keepalive_frames > 0 && total % cfg_.keepalive_frames == 0) {
          keepalive();
        }
      }
      if (keepalive) keepalive();
    }
  } catch (const cv::Exception& ex) {
    throw ProcessingError(ErrorCode::kInternal, std::string("concatenation failed: ") + ex.what());
  }
  writer.release();

  if (total == 0) {
    throw ProcessingError(ErrorCode::kCorruptInput, "chunk outputs contain no frames");
  }
  std::vector<std::uint8_t> bytes;
  if (!read_file_bytes(out_file.path(), bytes) || bytes.empty()) {
    throw ProcessingError(ErrorCode::kTransientIo, "cannot read stitched output");
  }
  spdlog::info("stitched chunks={} frames={} bytes={}", chunk_paths.size(), total, bytes.size());
  return bytes;
}

}  // namespace vscrub::vision
