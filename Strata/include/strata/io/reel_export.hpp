#pragma once

#include <filesystem>
#include <optional>

#include "strata/core/audio_features.hpp"
#include "strata/core/concept.hpp"
#include "strata/core/render_job.hpp"
#include "strata/io/video_encoder.hpp"

namespace strata::io {

struct ExportOptions {
  std::filesystem::path output_path;
  EncoderSettings encoder;
  // Every frame is also written as a numbered PNG here.
  std::optional<std::filesystem::path> frames_dir;
  // Captures the frame at the start of the climax segment into the result's snapshot.
  bool capture_poster = false;
};

// Analyzes the audio, renders every frame and muxes them with the source audio. Throws
// InvalidAudioError before the output is created when the audio is unusable, and EncodingError
// when the container cannot be written. The encoder settings' size and frame rate are taken from
// the render config.
core::ReelRenderResult ExportReel(const core::AudioBuffer& audio, int sample_rate, const core::Concept& reel,
                                  const core::ReelRenderOptions& options, const ExportOptions& export_options);

}  // namespace strata::io
