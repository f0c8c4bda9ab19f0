#include "strata/io/reel_export.hpp"

#include <string>
#include <vector>

#include "strata/core/errors.hpp"
#include "strata/core/timeline.hpp"
#include "strata/io/png_writer.hpp"

namespace strata::io {

core::ReelRenderResult ExportReel(const core::AudioBuffer& audio, int sample_rate, const core::Concept& reel,
                                  const core::ReelRenderOptions& options, const ExportOptions& export_options) {
  std::vector<core::RenderWarning> analysis_warnings;
  const core::AudioAnalysis analysis = core::AnalyzeAudio(audio, sample_rate, options.features, &analysis_warnings);
  const core::Timeline timeline = core::SegmentTimeline(analysis.duration_seconds);

  core::ReelRenderOptions render_options = options;
  if (export_options.capture_poster && !render_options.snapshot_seconds.has_value()) {
    render_options.snapshot_seconds = timeline.Get(core::SegmentId::kClimax).start_seconds;
  }

  EncoderSettings settings = export_options.encoder;
  settings.width = options.config.width;
  settings.height = options.config.height;
  settings.fps = options.config.fps;

  VideoEncoder encoder;
  std::string error;
  if (!encoder.Open(export_options.output_path, settings, &audio, sample_rate, &error)) {
    throw core::EncodingError(error);
  }

  core::FrameSink png_sink;
  if (export_options.frames_dir.has_value()) {
    png_sink = MakePngSequenceSink(*export_options.frames_dir);
  }
  const core::FrameSink sink = [&encoder, &png_sink](const core::Frame& frame, std::string* sink_error) {
    if (png_sink && !png_sink(frame, sink_error)) {
      return false;
    }
    return encoder.WriteFrame(frame, sink_error);
  };

  core::ReelRenderResult result = core::ReelRenderer().RenderAnalysis(analysis, reel, sink, render_options);
  if (!encoder.Finish(&error)) {
    throw core::EncodingError(error);
  }
  result.warnings.insert(result.warnings.begin(), analysis_warnings.begin(), analysis_warnings.end());
  return result;
}

}  // namespace strata::io
