#include "strata/io/video_encoder.hpp"

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <string>
#include <system_error>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/channel_layout.h>
#include <libavutil/error.h>
#include <libavutil/frame.h>
#include <libavutil/opt.h>
#include <libswresample/swresample.h>
#include <libswscale/swscale.h>
}

namespace strata::io {
namespace {

constexpr int kFallbackAudioFrameSize = 1024;

void SetError(std::string* error, const std::string& message) {
  if (error != nullptr) {
    *error = message;
  }
}

std::string AvErrorText(int code) {
  char buf[AV_ERROR_MAX_STRING_SIZE] = {0};
  if (av_strerror(code, buf, sizeof(buf)) < 0) {
    return "libav error " + std::to_string(code);
  }
  return buf;
}

bool Fail(std::string* error, const std::string& what, int code) {
  SetError(error, what + ": " + AvErrorText(code));
  return false;
}

}  // namespace

struct VideoEncoder::State {
  EncoderSettings settings;
  std::filesystem::path path;
  std::string codec_name;

  AVFormatContext* format = nullptr;
  AVCodecContext* video_ctx = nullptr;
  AVCodecContext* audio_ctx = nullptr;
  AVStream* video_stream = nullptr;
  AVStream* audio_stream = nullptr;
  AVFrame* yuv = nullptr;
  AVFrame* audio_frame = nullptr;
  AVPacket* packet = nullptr;
  SwsContext* sws = nullptr;
  SwrContext* swr = nullptr;

  const core::AudioBuffer* audio = nullptr;
  int sample_rate = 0;
  int64_t audio_total_frames = 0;
  int64_t audio_cursor = 0;
  int audio_frame_size = kFallbackAudioFrameSize;

  bool open = false;
  bool header_written = false;
  int64_t frames_written = 0;

  ~State() { Release(); }

  void Release() {
    sws_freeContext(sws);
    sws = nullptr;
    swr_free(&swr);
    av_frame_free(&yuv);
    av_frame_free(&audio_frame);
    av_packet_free(&packet);
    avcodec_free_context(&video_ctx);
    avcodec_free_context(&audio_ctx);
    if (format != nullptr) {
      if ((format->oformat->flags & AVFMT_NOFILE) == 0 && format->pb != nullptr) {
        avio_closep(&format->pb);
      }
      avformat_free_context(format);
      format = nullptr;
    }
    video_stream = nullptr;
    audio_stream = nullptr;
    open = false;
    header_written = false;
  }

  bool DrainPackets(AVCodecContext* ctx, AVStream* stream, std::string* error) {
    for (;;) {
      const int rc = avcodec_receive_packet(ctx, packet);
      if (rc == AVERROR(EAGAIN) || rc == AVERROR_EOF) {
        return true;
      }
      if (rc < 0) {
        return Fail(error, "Encoder failed to produce a packet", rc);
      }
      av_packet_rescale_ts(packet, ctx->time_base, stream->time_base);
      packet->stream_index = stream->index;
      const int wrc = av_interleaved_write_frame(format, packet);
      if (wrc < 0) {
        return Fail(error, "Failed to write packet to " + path.string(), wrc);
      }
    }
  }

  bool Encode(AVCodecContext* ctx, AVStream* stream, const AVFrame* frame, std::string* error) {
    const int rc = avcodec_send_frame(ctx, frame);
    if (rc < 0 && rc != AVERROR_EOF) {
      return Fail(error, "Encoder rejected a frame", rc);
    }
    return DrainPackets(ctx, stream, error);
  }

  bool OpenVideo(std::string* error) {
    const AVCodec* codec = avcodec_find_encoder_by_name(settings.video_codec.c_str());
    if (codec == nullptr) {
      codec = avcodec_find_encoder(format->oformat->video_codec);
    }
    if (codec == nullptr) {
      SetError(error, "No video encoder available for " + path.string());
      return false;
    }
    codec_name = codec->name;

    video_stream = avformat_new_stream(format, nullptr);
    video_ctx = avcodec_alloc_context3(codec);
    if (video_stream == nullptr || video_ctx == nullptr) {
      SetError(error, "Failed to allocate the video stream.");
      return false;
    }
    video_ctx->codec_type = AVMEDIA_TYPE_VIDEO;
    video_ctx->width = settings.width;
    video_ctx->height = settings.height;
    video_ctx->time_base = AVRational{1, settings.fps};
    video_ctx->framerate = AVRational{settings.fps, 1};
    video_ctx->pix_fmt = AV_PIX_FMT_YUV420P;
    video_ctx->gop_size = settings.fps * 2;
    video_ctx->max_b_frames = 2;
    if (codec_name == "libx264") {
      if (av_opt_set(video_ctx->priv_data, "preset", settings.preset.c_str(), 0) < 0 ||
          av_opt_set(video_ctx->priv_data, "crf", std::to_string(settings.crf).c_str(), 0) < 0) {
        SetError(error, "libx264 rejected preset '" + settings.preset + "' or crf " + std::to_string(settings.crf));
        return false;
      }
    } else {
      video_ctx->bit_rate = settings.video_bit_rate;
    }
    if ((format->oformat->flags & AVFMT_GLOBALHEADER) != 0) {
      video_ctx->flags |= AV_CODEC_FLAG_GLOBAL_HEADER;
    }
    int rc = avcodec_open2(video_ctx, codec, nullptr);
    if (rc < 0) {
      return Fail(error, "Failed to open video encoder " + codec_name, rc);
    }
    rc = avcodec_parameters_from_context(video_stream->codecpar, video_ctx);
    if (rc < 0) {
      return Fail(error, "Failed to copy video encoder parameters", rc);
    }
    video_stream->time_base = video_ctx->time_base;

    yuv = av_frame_alloc();
    if (yuv == nullptr) {
      SetError(error, "Failed to allocate the video frame.");
      return false;
    }
    yuv->format = AV_PIX_FMT_YUV420P;
    yuv->width = settings.width;
    yuv->height = settings.height;
    rc = av_frame_get_buffer(yuv, 0);
    if (rc < 0) {
      return Fail(error, "Failed to allocate video frame buffers", rc);
    }
    sws = sws_getContext(settings.width, settings.height, AV_PIX_FMT_RGB24, settings.width, settings.height,
                         AV_PIX_FMT_YUV420P, SWS_BICUBIC, nullptr, nullptr, nullptr);
    if (sws == nullptr) {
      SetError(error, "Failed to create the RGB to YUV converter.");
      return false;
    }
    return true;
  }

  bool OpenAudio(std::string* error) {
    const AVCodec* codec = avcodec_find_encoder(AV_CODEC_ID_AAC);
    if (codec == nullptr) {
      SetError(error, "AAC encoder not found.");
      return false;
    }
    audio_stream = avformat_new_stream(format, nullptr);
    audio_ctx = avcodec_alloc_context3(codec);
    if (audio_stream == nullptr || audio_ctx == nullptr) {
      SetError(error, "Failed to allocate the audio stream.");
      return false;
    }
    audio_ctx->sample_rate = sample_rate;
    av_channel_layout_default(&audio_ctx->ch_layout, audio->channels);
    audio_ctx->sample_fmt = AV_SAMPLE_FMT_FLTP;
    audio_ctx->bit_rate = settings.audio_bit_rate;
    audio_ctx->time_base = AVRational{1, sample_rate};
    if ((format->oformat->flags & AVFMT_GLOBALHEADER) != 0) {
      audio_ctx->flags |= AV_CODEC_FLAG_GLOBAL_HEADER;
    }
    int rc = avcodec_open2(audio_ctx, codec, nullptr);
    if (rc < 0) {
      return Fail(error,
                  "Failed to open AAC encoder (" + std::to_string(audio->channels) + " channels, " +
                      std::to_string(sample_rate) + " Hz)",
                  rc);
    }
    rc = avcodec_parameters_from_context(audio_stream->codecpar, audio_ctx);
    if (rc < 0) {
      return Fail(error, "Failed to copy audio encoder parameters", rc);
    }
    audio_stream->time_base = audio_ctx->time_base;

    const bool variable = (codec->capabilities & AV_CODEC_CAP_VARIABLE_FRAME_SIZE) != 0;
    audio_frame_size = (!variable && audio_ctx->frame_size > 0) ? audio_ctx->frame_size : kFallbackAudioFrameSize;

    audio_frame = av_frame_alloc();
    if (audio_frame == nullptr) {
      SetError(error, "Failed to allocate the audio frame.");
      return false;
    }
    audio_frame->format = AV_SAMPLE_FMT_FLTP;
    audio_frame->sample_rate = sample_rate;
    audio_frame->nb_samples = audio_frame_size;
    rc = av_channel_layout_copy(&audio_frame->ch_layout, &audio_ctx->ch_layout);
    if (rc < 0) {
      return Fail(error, "Failed to set the audio frame layout", rc);
    }
    rc = av_frame_get_buffer(audio_frame, 0);
    if (rc < 0) {
      return Fail(error, "Failed to allocate audio frame buffers", rc);
    }

    rc = swr_alloc_set_opts2(&swr, &audio_ctx->ch_layout, AV_SAMPLE_FMT_FLTP, sample_rate, &audio_ctx->ch_layout,
                             AV_SAMPLE_FMT_FLT, sample_rate, 0, nullptr);
    if (rc < 0) {
      return Fail(error, "Failed to configure the audio converter", rc);
    }
    rc = swr_init(swr);
    if (rc < 0) {
      return Fail(error, "Failed to initialize the audio converter", rc);
    }
    return true;
  }

  // Encodes source audio up to `target` sample frames. Only whole encoder frames are sent unless
  // `final` is set.
  bool PushAudio(int64_t target, bool final, std::string* error) {
    if (audio_ctx == nullptr) {
      return true;
    }
    target = std::min(target, audio_total_frames);
    while (audio_cursor + audio_frame_size <= target || (final && audio_cursor < target)) {
      const int count = static_cast<int>(std::min<int64_t>(audio_frame_size, target - audio_cursor));
      int rc = av_frame_make_writable(audio_frame);
      if (rc < 0) {
        return Fail(error, "Audio frame is not writable", rc);
      }
      audio_frame->nb_samples = count;
      const float* src = audio->samples.data() + static_cast<size_t>(audio_cursor) * static_cast<size_t>(audio->channels);
      const uint8_t* in[1] = {reinterpret_cast<const uint8_t*>(src)};
      rc = swr_convert(swr, audio_frame->data, count, in, count);
      if (rc < 0) {
        return Fail(error, "Audio sample conversion failed", rc);
      }
      audio_frame->pts = audio_cursor;
      if (!Encode(audio_ctx, audio_stream, audio_frame, error)) {
        return false;
      }
      audio_cursor += count;
    }
    return true;
  }

  int64_t AudioFramesForVideo(int64_t video_frames) const {
    return video_frames * static_cast<int64_t>(sample_rate) / static_cast<int64_t>(settings.fps);
  }
};

VideoEncoder::VideoEncoder() : state_(std::make_unique<State>()) {}

VideoEncoder::~VideoEncoder() { Finish(nullptr); }

bool VideoEncoder::Open(const std::filesystem::path& path, const EncoderSettings& settings,
                        const core::AudioBuffer* audio, int sample_rate, std::string* error) {
  if (state_->open) {
    SetError(error, "Encoder is already open.");
    return false;
  }
  if (settings.width <= 0 || settings.height <= 0 || settings.width % 2 != 0 || settings.height % 2 != 0) {
    SetError(error, "Video size must be positive and even for yuv420p, got " + std::to_string(settings.width) + "x" +
                        std::to_string(settings.height) + ".");
    return false;
  }
  if (settings.fps <= 0) {
    SetError(error, "Frame rate must be positive, got " + std::to_string(settings.fps) + ".");
    return false;
  }
  const bool with_audio = audio != nullptr && audio->channels > 0 && !audio->samples.empty();
  if (with_audio && sample_rate <= 0) {
    SetError(error, "Audio sample rate must be positive, got " + std::to_string(sample_rate) + ".");
    return false;
  }

  std::error_code ec;
  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
      SetError(error, "Failed to create output directory " + path.parent_path().string() + ": " + ec.message());
      return false;
    }
  }

  State& s = *state_;
  s.settings = settings;
  s.path = path;
  s.frames_written = 0;
  s.audio = with_audio ? audio : nullptr;
  s.sample_rate = sample_rate;
  s.audio_cursor = 0;
  s.audio_total_frames =
      with_audio ? static_cast<int64_t>(audio->samples.size() / static_cast<size_t>(audio->channels)) : 0;

  const std::string target = path.string();
  int rc = avformat_alloc_output_context2(&s.format, nullptr, nullptr, target.c_str());
  if (rc < 0 || s.format == nullptr) {
    rc = avformat_alloc_output_context2(&s.format, nullptr, "mp4", target.c_str());
  }
  if (rc < 0 || s.format == nullptr) {
    s.Release();
    return Fail(error, "Failed to create output container for " + target, rc);
  }

  if (!s.OpenVideo(error) || (with_audio && !s.OpenAudio(error))) {
    s.Release();
    return false;
  }
  s.packet = av_packet_alloc();
  if (s.packet == nullptr) {
    s.Release();
    SetError(error, "Failed to allocate a packet.");
    return false;
  }

  if ((s.format->oformat->flags & AVFMT_NOFILE) == 0) {
    rc = avio_open(&s.format->pb, target.c_str(), AVIO_FLAG_WRITE);
    if (rc < 0) {
      s.Release();
      return Fail(error, "Failed to open output file " + target, rc);
    }
  }
  rc = avformat_write_header(s.format, nullptr);
  if (rc < 0) {
    s.Release();
    return Fail(error, "Muxer rejected the stream configuration for " + target, rc);
  }
  s.header_written = true;
  s.open = true;
  return true;
}

bool VideoEncoder::WriteFrame(const core::Frame& frame, std::string* error) {
  State& s = *state_;
  if (!s.open) {
    SetError(error, "Encoder is not open.");
    return false;
  }
  if (frame.width != s.settings.width || frame.height != s.settings.height ||
      frame.rgb.size() != static_cast<size_t>(frame.width) * static_cast<size_t>(frame.height) * 3U) {
    SetError(error, "Frame " + std::to_string(frame.index) + " does not match the encoder size " +
                        std::to_string(s.settings.width) + "x" + std::to_string(s.settings.height) + ".");
    return false;
  }

  const int rc = av_frame_make_writable(s.yuv);
  if (rc < 0) {
    return Fail(error, "Video frame is not writable", rc);
  }
  const uint8_t* src[1] = {frame.rgb.data()};
  const int src_stride[1] = {frame.width * 3};
  sws_scale(s.sws, src, src_stride, 0, frame.height, s.yuv->data, s.yuv->linesize);
  s.yuv->pts = s.frames_written;
  if (!s.Encode(s.video_ctx, s.video_stream, s.yuv, error)) {
    return false;
  }
  ++s.frames_written;
  return s.PushAudio(s.AudioFramesForVideo(s.frames_written), false, error);
}

bool VideoEncoder::Finish(std::string* error) {
  State& s = *state_;
  if (!s.open) {
    return true;
  }
  bool ok = s.Encode(s.video_ctx, s.video_stream, nullptr, error);
  if (ok && s.audio_ctx != nullptr) {
    ok = s.PushAudio(s.AudioFramesForVideo(s.frames_written), true, error) &&
         s.Encode(s.audio_ctx, s.audio_stream, nullptr, error);
  }
  if (s.header_written) {
    const int rc = av_write_trailer(s.format);
    if (rc < 0 && ok) {
      ok = Fail(error, "Failed to write container trailer for " + s.path.string(), rc);
    }
  }
  s.Release();
  return ok;
}

bool VideoEncoder::is_open() const { return state_->open; }

int64_t VideoEncoder::frames_written() const { return state_->frames_written; }

const std::string& VideoEncoder::video_codec_name() const { return state_->codec_name; }

}  // namespace strata::io
