/**
 * @file media_probe.cpp
 * @brief libavformat-backed metadata probe
 */

#include "hevc_batch/media_probe.hpp"

#include <algorithm>
#include <cstdint>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/avutil.h>
#include <libavutil/error.h>
#include <libavutil/log.h>
}

#include "hevc_batch/logging.hpp"

namespace hevc_batch {

namespace {

std::string av_error_string(int err) {
  char buf[AV_ERROR_MAX_STRING_SIZE] = {0};
  av_strerror(err, buf, sizeof(buf));
  return buf;
}

/// Closes the format context on every return path
struct FormatContextGuard {
  AVFormatContext *ctx = nullptr;
  ~FormatContextGuard() {
    if (ctx)
      avformat_close_input(&ctx);
  }
};

} // anonymous namespace

LibavProbe::LibavProbe() {
  /// Keep libav quiet; failures are reported through our own log
  av_log_set_level(AV_LOG_ERROR);
}

bool LibavProbe::probe(const std::string &path, VideoInfo &info) {
  FormatContextGuard guard;

  int ret = avformat_open_input(&guard.ctx, path.c_str(), nullptr, nullptr);
  if (ret < 0) {
    LOG_ERROR("avformat_open_input failed for {}: {}", path,
              av_error_string(ret));
    return false;
  }

  /// Find stream info (reads some packets to determine streams)
  ret = avformat_find_stream_info(guard.ctx, nullptr);
  if (ret < 0) {
    LOG_ERROR("avformat_find_stream_info failed for {}: {}", path,
              av_error_string(ret));
    return false;
  }

  VideoInfo result;
  result.duration = (guard.ctx->duration != AV_NOPTS_VALUE)
                        ? guard.ctx->duration / static_cast<double>(AV_TIME_BASE)
                        : 0.0;

  int video_stream_idx =
      av_find_best_stream(guard.ctx, AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
  if (video_stream_idx >= 0) {
    const AVStream *stream = guard.ctx->streams[video_stream_idx];
    result.codec = avcodec_get_name(stream->codecpar->codec_id);

    AVRational r = stream->r_frame_rate;
    result.fps = (r.num > 0 && r.den > 0) ? av_q2d(r) : DEFAULT_FPS;
  }

  result.total_frames =
      std::max<int64_t>(1, static_cast<int64_t>(result.duration * result.fps));

  info = result;
  return true;
}

} // namespace hevc_batch
