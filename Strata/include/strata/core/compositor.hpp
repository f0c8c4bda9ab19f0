#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "strata/core/audio_features.hpp"
#include "strata/core/image.hpp"
#include "strata/core/layer.hpp"
#include "strata/core/timeline.hpp"

namespace strata::core {

enum class CompositorState {
  kAssembling,
  kRendering,
  kFinished,
};

// Receives frames in strictly increasing index order. Returning false stops the loop.
using FrameSink = std::function<bool(const Frame& frame, std::string* error)>;

struct FrameLoopOptions {
  int max_parallel_jobs = 0;
  int max_frames_in_flight = 0;
  std::function<void(double)> progress_callback;
  std::function<bool()> cancel_requested;
};

struct FrameLoopResult {
  int64_t frames_total = 0;
  int64_t frames_written = 0;
  bool cancelled = false;
};

class Compositor {
 public:
  Compositor(int width, int height, int fps);

  void SetAnalysis(AudioAnalysis analysis);
  void SetTimeline(Timeline timeline);
  void AddLayer(Layer layer);
  void BeginRendering();

  CompositorState state() const { return state_; }
  int width() const { return width_; }
  int height() const { return height_; }
  int fps() const { return fps_; }
  const std::vector<Layer>& layers() const { return layers_; }
  const AudioAnalysis& analysis() const;
  const Timeline& timeline() const;

  int64_t FrameCount() const;
  // Pure: the same index always yields the same pixels, in any order and on any thread.
  void ComposeFrame(int64_t index, Frame* frame, Image* scratch) const;

  // Drives every frame through the sink, then moves to Finished. Exceptions thrown by layers, the
  // sink, the progress callback or the cancel predicate are rethrown after all workers have stopped.
  bool Run(const FrameSink& sink, const FrameLoopOptions& options, FrameLoopResult* result, std::string* error);

 private:
  void RequireState(CompositorState expected, const char* operation) const;

  int width_ = 0;
  int height_ = 0;
  int fps_ = 0;
  CompositorState state_ = CompositorState::kAssembling;
  std::optional<AudioAnalysis> analysis_;
  std::optional<Timeline> timeline_;
  std::vector<Layer> layers_;
};

}  // namespace strata::core
