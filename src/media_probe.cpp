/**
 * @file media_probe.cpp
 * @brief Source media inspection implementation
 */

#include "vidcut/media_probe.hpp"

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/error.h>
}

#include <fmt/core.h>

#include "vidcut/logging.hpp"

namespace vidcut {

namespace {

/// Closes the demuxer on scope exit
struct FormatContext {
  AVFormatContext *ctx = nullptr;
  ~FormatContext() {
    if (ctx)
      avformat_close_input(&ctx);
  }
};

std::string av_error(int code) {
  char buf[AV_ERROR_MAX_STRING_SIZE] = {0};
  av_strerror(code, buf, sizeof(buf));
  return buf;
}

double rational(AVRational r) {
  return (r.num > 0 && r.den > 0) ? av_q2d(r) : 0.0;
}

} // anonymous namespace

bool probe_video_source(const std::string &path, VideoSource &out,
                        std::string &error) {
  out = VideoSource{};
  out.path = path;

  FormatContext fmt_ctx;
  int ret = avformat_open_input(&fmt_ctx.ctx, path.c_str(), nullptr, nullptr);
  if (ret < 0) {
    error = fmt::format("cannot open '{}': {}", path, av_error(ret));
    return false;
  }

  /// Reads some packets to determine streams
  ret = avformat_find_stream_info(fmt_ctx.ctx, nullptr);
  if (ret < 0) {
    error = fmt::format("cannot read stream info of '{}': {}", path,
                        av_error(ret));
    return false;
  }

  int video_idx =
      av_find_best_stream(fmt_ctx.ctx, AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
  if (video_idx < 0) {
    error = fmt::format("no video stream in '{}'", path);
    return false;
  }
  int audio_idx =
      av_find_best_stream(fmt_ctx.ctx, AVMEDIA_TYPE_AUDIO, -1, -1, nullptr, 0);
  out.has_audio = audio_idx >= 0;

  AVStream *stream = fmt_ctx.ctx->streams[video_idx];
  AVCodecParameters *param = stream->codecpar;
  out.video_codec = avcodec_get_name(param->codec_id);
  out.width = param->width;
  out.height = param->height;
  out.container = fmt_ctx.ctx->iformat ? fmt_ctx.ctx->iformat->name : "";

  out.fps = rational(stream->avg_frame_rate);
  if (out.fps <= 0.0)
    out.fps = rational(stream->r_frame_rate);

  if (fmt_ctx.ctx->duration != AV_NOPTS_VALUE && fmt_ctx.ctx->duration > 0) {
    out.duration = static_cast<double>(fmt_ctx.ctx->duration) / AV_TIME_BASE;
  } else if (stream->duration != AV_NOPTS_VALUE && stream->duration > 0) {
    out.duration = static_cast<double>(stream->duration) *
                   rational(stream->time_base);
  }
  if (out.duration <= 0.0) {
    error = fmt::format("unknown duration for '{}'", path);
    return false;
  }

  LOG_DEBUG("Probed {}: {} {}x{} @ {:.3f} fps, {:.3f}s, audio={}", path,
            out.video_codec, out.width, out.height, out.fps, out.duration,
            out.has_audio);
  return true;
}

} // namespace vidcut
