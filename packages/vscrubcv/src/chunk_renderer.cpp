#include "vscrubcv/chunk_renderer.h"

#include <cmath>
#include <map>
#include <memory>
#include <stdexcept>

#include <opencv2/videoio.hpp>
#include <spdlog/spdlog.h>

#include "vscrubcv/anonymizer.h"
#include "vscrubcv/media.h"
#include "vscrubcv/redaction_policy.h"
#include "vscrubsdk/errors.h"

namespace vscrub::vision {

using sdk::ErrorCode;
using sdk::ProcessingError;

namespace {

std::int64_t to_frame(double seconds, double fps) { return static_cast<std::int64_t>(std::llround(seconds * fps)); }

struct Window {
  std::int64_t begin = 0;
  std::int64_t end = 0;  // exclusive
  bool contains(std::int64_t f) const { return f >= begin && f < end; }
};

void observe(std::map<std::int64_t, sdk::TrackSummary>& out, const Detection& d, std::int64_t offset) {
  if (d.local_track_id < 0 || d.embedding.empty()) return;
  sdk::TrackSummary& s = out[d.local_track_id];
  s.local_track_id = d.local_track_id;
  s.class_label = d.class_label;
  s.embedding = d.embedding;
  s.last_bbox = sdk::BBox{static_cast<float>(d.bbox.x), static_cast<float>(d.bbox.y),
                          static_cast<float>(d.bbox.width), static_cast<float>(d.bbox.height)};
  s.last_frame_offset_in_window = static_cast<int>(offset);
}

std::vector<sdk::TrackSummary> values_of(std::map<std::int64_t, sdk::TrackSummary>& m) {
  std::vector<sdk::TrackSummary> out;
  out.reserve(m.size());
  for (auto& [id, s] : m) out.push_back(std::move(s));
  return out;
}

}  // namespace

OpenCvChunkPipeline::OpenCvChunkPipeline(Config cfg, DetectionTrackerFactory factory)
    : cfg_(std::move(cfg)), factory_(std::move(factory)) {
  if (!factory_) {
    throw std::invalid_argument("OpenCvChunkPipeline requires a detection tracker factory");
  }
}

sdk::ChunkRenderResult OpenCvChunkPipeline::render(const sdk::ChunkRenderRequest& req) {
  RedactionPolicy policy;
  std::string policy_err;
  if (!resolve_policy(req.profile, req.options, policy, policy_err)) {
    throw ProcessingError(ErrorCode::kInvalidArgument, policy_err);
  }

  cv::VideoCapture cap;
  try {
    if (!cap.open(req.input_path)) {
      throw ProcessingError(ErrorCode::kCorruptInput, "cannot decode input " + req.input_path);
    }
  } catch (const cv::Exception& ex) {
    throw ProcessingError(ErrorCode::kCorruptInput, std::string("decode failed: ") + ex.what());
  }
  const double fps = cap.get(cv::CAP_PROP_FPS);
  if (!(fps > 0.0) || !std::isfinite(fps)) {
    throw ProcessingError(ErrorCode::kCorruptInput, "input reports no frame rate");
  }

  const std::int64_t first = to_frame(req.span.start_s, fps);
  const std::int64_t last = to_frame(req.span.end_s, fps);
  const Window core{to_frame(req.span.core_start_s, fps), to_frame(req.span.core_end_s, fps)};
  const Window head{to_frame(req.head_window_begin_s, fps), to_frame(req.head_window_end_s, fps)};
  const Window tail{to_frame(req.tail_window_begin_s, fps), to_frame(req.tail_window_end_s, fps)};
  if (first > 0 && !cap.set(cv::CAP_PROP_POS_FRAMES, static_cast<double>(first))) {
    throw ProcessingError(ErrorCode::kCorruptInput, "input is not seekable");
  }

  std::unique_ptr<DetectionTracker> tracker = factory_();
  Anonymizer anonymizer(policy, cfg_.smoothing_window);
  std::map<std::int64_t, sdk::TrackSummary> head_tracks;
  std::map<std::int64_t, sdk::TrackSummary> tail_tracks;

  TempFile out_file(cfg_.container_suffix);
  cv::VideoWriter writer;
  std::int64_t frames_read = 0;
  std::int64_t frames_written = 0;
  cv::Mat frame;

  for (std::int64_t f = first; f < last; ++f) {
    if (cfg_.abort_check_frames > 0 && (f - first) % cfg_.abort_check_frames == 0 && f != first) {
      if (req.should_abort && req.should_abort()) {
        throw ProcessingError(ErrorCode::kCancelled, "job is no longer active");
      }
      if (req.keepalive) req.keepalive();
    }
    if (!cap.read(frame) || frame.empty()) {
      if (frames_read == 0) {
        throw ProcessingError(ErrorCode::kCorruptInput, "no decodable frames in chunk span");
      }
      spdlog::warn("input ended early jobId={} index={} frame={} expectedEnd={}", req.job_id, req.index, f, last);
      break;
    }
    ++frames_read;

    std::vector<Detection> detections;
    try {
      detections = tracker->infer(frame);
    } catch (const cv::Exception& ex) {
      throw ProcessingError(ErrorCode::kModelInference, std::string("inference failed: ") + ex.what());
    }

    for (const auto& d : detections) {
      if (head.contains(f)) observe(head_tracks, d, f - head.begin);
      if (tail.contains(f)) observe(tail_tracks, d, f - tail.begin);
    }

    anonymizer.process(frame, f, detections);

    if (!core.contains(f)) continue;
    if (!writer.isOpened()) {
      if (!writer.open(out_file.path(), fourcc_code(cfg_.fourcc), fps, frame.size(), true)) {
        throw ProcessingError(ErrorCode::kInternal, "cannot open encoder for " + out_file.path());
      }
    }
    writer.write(frame);
    ++frames_written;
  }
  writer.release();

  if (frames_written == 0) {
    throw ProcessingError(ErrorCode::kCorruptInput, "chunk core span produced no frames");
  }

  sdk::ChunkRenderResult result;
  if (!read_file_bytes(out_file.path(), result.output_bytes) || result.output_bytes.empty()) {
    throw ProcessingError(ErrorCode::kTransientIo, "cannot read encoded chunk " + out_file.path());
  }
  result.head_tracks = values_of(head_tracks);
  result.tail_tracks = values_of(tail_tracks);
  spdlog::info("chunk rendered jobId={} index={} frames={} written={} headTracks={} tailTracks={} mode={}", req.job_id,
               req.index, frames_read, frames_written, result.head_tracks.size(), result.tail_tracks.size(),
               to_string(policy.mode));
  return result;
}

}  // namespace vscrub::vision
