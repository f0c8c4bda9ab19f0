#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>

#include "strata/core/audio_features.hpp"
#include "strata/core/image.hpp"

namespace strata::io {

struct EncoderSettings {
  int width = 1080;
  int height = 1920;
  int fps = 30;
  // Falls back to the container's default video encoder when this one is not built in.
  std::string video_codec = "libx264";
  std::string preset = "medium";
  int crf = 20;
  int64_t video_bit_rate = 6000000;
  int64_t audio_bit_rate = 192000;
};

// Muxes RGB frames (as yuv420p) and the source audio (as AAC) into one container. Audio is cut to
// the duration of the frames actually written.
class VideoEncoder {
 public:
  VideoEncoder();
  // Runs Finish(); a failure at this point cannot be reported.
  ~VideoEncoder();

  VideoEncoder(const VideoEncoder&) = delete;
  VideoEncoder& operator=(const VideoEncoder&) = delete;

  // `audio` may be null for a silent video; when present it must outlive the encoder.
  bool Open(const std::filesystem::path& path, const EncoderSettings& settings, const core::AudioBuffer* audio,
            int sample_rate, std::string* error);
  bool WriteFrame(const core::Frame& frame, std::string* error);
  // Flushes both encoders and writes the trailer. Safe to call more than once.
  bool Finish(std::string* error);

  bool is_open() const;
  int64_t frames_written() const;
  const std::string& video_codec_name() const;

 private:
  struct State;
  std::unique_ptr<State> state_;
};

}  // namespace strata::io
