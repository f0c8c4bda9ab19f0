#include "strata/core/compositor.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <condition_variable>
#include <exception>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "strata/core/errors.hpp"
#include "strata/core/timebase.hpp"

namespace strata::core {
namespace {

const char* StateName(CompositorState state) {
  switch (state) {
    case CompositorState::kAssembling:
      return "assembling";
    case CompositorState::kRendering:
      return "rendering";
    case CompositorState::kFinished:
      return "finished";
  }
  return "unknown";
}

class ProgressReporter {
 public:
  ProgressReporter(const std::function<void(double)>& callback, int64_t total) : callback_(callback), total_(total) {}

  void Update(int64_t written) {
    if (!callback_ || total_ <= 0) {
      return;
    }
    const double pct = 100.0 * static_cast<double>(written) / static_cast<double>(total_);
    const auto now = std::chrono::steady_clock::now();
    if (written == total_ || pct - last_pct_ >= 0.5 || now - last_report_ >= std::chrono::milliseconds(500)) {
      callback_(pct);
      last_pct_ = pct;
      last_report_ = now;
    }
  }

 private:
  const std::function<void(double)>& callback_;
  int64_t total_ = 0;
  double last_pct_ = -1.0;
  std::chrono::steady_clock::time_point last_report_ = std::chrono::steady_clock::now();
};

int ResolveJobCount(int requested, int64_t total) {
  int jobs = requested;
  if (jobs <= 0) {
    jobs = static_cast<int>(std::thread::hardware_concurrency());
  }
  jobs = std::max(1, jobs);
  return static_cast<int>(std::min<int64_t>(jobs, std::max<int64_t>(1, total)));
}

bool CancelRequested(const FrameLoopOptions& options) { return options.cancel_requested && options.cancel_requested(); }

bool RunSerial(const Compositor& compositor, int64_t total, const FrameSink& sink, const FrameLoopOptions& options,
               FrameLoopResult* result, std::string* error) {
  ProgressReporter progress(options.progress_callback, total);
  Frame frame;
  Image scratch;
  for (int64_t k = 0; k < total; ++k) {
    if (CancelRequested(options)) {
      result->cancelled = true;
      return true;
    }
    compositor.ComposeFrame(k, &frame, &scratch);
    if (!sink(frame, error)) {
      return false;
    }
    ++result->frames_written;
    progress.Update(result->frames_written);
  }
  return true;
}

struct OrderedFrameQueue {
  std::mutex mutex;
  std::condition_variable changed;
  std::map<int64_t, Frame> ready;
  int64_t next_dispatch = 0;
  int64_t next_write = 0;
  bool stop = false;
  std::exception_ptr failure;
};

void RenderWorker(const Compositor& compositor, int64_t total, int64_t window, OrderedFrameQueue* queue) {
  Image scratch;
  for (;;) {
    int64_t index = 0;
    {
      std::unique_lock<std::mutex> lock(queue->mutex);
      queue->changed.wait(lock, [&] {
        return queue->stop || queue->next_dispatch >= total || queue->next_dispatch < queue->next_write + window;
      });
      if (queue->stop || queue->next_dispatch >= total) {
        return;
      }
      index = queue->next_dispatch++;
    }

    Frame frame;
    try {
      compositor.ComposeFrame(index, &frame, &scratch);
    } catch (...) {
      std::lock_guard<std::mutex> lock(queue->mutex);
      if (!queue->failure) {
        queue->failure = std::current_exception();
      }
      queue->stop = true;
      queue->changed.notify_all();
      return;
    }

    {
      std::lock_guard<std::mutex> lock(queue->mutex);
      queue->ready.emplace(index, std::move(frame));
    }
    queue->changed.notify_all();
  }
}

// Hands frames to the sink in index order until done, cancelled, stopped by a worker failure or
// rejected by the sink.
bool WriteInOrder(int64_t total, const FrameSink& sink, const FrameLoopOptions& options, OrderedFrameQueue* queue,
                  FrameLoopResult* result, std::string* error) {
  ProgressReporter progress(options.progress_callback, total);
  while (result->frames_written < total) {
    if (CancelRequested(options)) {
      result->cancelled = true;
      return true;
    }
    Frame frame;
    {
      std::unique_lock<std::mutex> lock(queue->mutex);
      queue->changed.wait(lock, [&] { return queue->stop || queue->ready.count(queue->next_write) > 0; });
      if (queue->stop) {
        return true;
      }
      auto it = queue->ready.find(queue->next_write);
      frame = std::move(it->second);
      queue->ready.erase(it);
    }
    if (!sink(frame, error)) {
      return false;
    }
    ++result->frames_written;
    progress.Update(result->frames_written);
    {
      std::lock_guard<std::mutex> lock(queue->mutex);
      ++queue->next_write;
    }
    queue->changed.notify_all();
  }
  return true;
}

bool RunParallel(const Compositor& compositor, int64_t total, int jobs, const FrameSink& sink,
                 const FrameLoopOptions& options, FrameLoopResult* result, std::string* error) {
  const int64_t window = options.max_frames_in_flight > 0 ? options.max_frames_in_flight : 2 * jobs;
  OrderedFrameQueue queue;
  std::vector<std::thread> workers;
  workers.reserve(static_cast<size_t>(jobs));
  for (int i = 0; i < jobs; ++i) {
    workers.emplace_back(RenderWorker, std::cref(compositor), total, window, &queue);
  }

  // Writer-side failures (sink, progress, cancel predicate) are rethrown after every worker has joined.
  bool ok = false;
  std::exception_ptr writer_failure;
  try {
    ok = WriteInOrder(total, sink, options, &queue, result, error);
  } catch (...) {
    writer_failure = std::current_exception();
  }

  {
    std::lock_guard<std::mutex> lock(queue.mutex);
    queue.stop = true;
  }
  queue.changed.notify_all();
  for (auto& worker : workers) {
    worker.join();
  }
  if (writer_failure) {
    std::rethrow_exception(writer_failure);
  }
  if (queue.failure) {
    std::rethrow_exception(queue.failure);
  }
  return ok;
}

}  // namespace

Compositor::Compositor(int width, int height, int fps) : width_(width), height_(height), fps_(fps) {
  if (width <= 0 || height <= 0) {
    throw std::invalid_argument("Canvas size must be positive, got " + std::to_string(width) + "x" +
                                std::to_string(height) + ".");
  }
  if (fps <= 0) {
    throw std::invalid_argument("Frame rate must be positive, got " + std::to_string(fps) + ".");
  }
}

void Compositor::RequireState(CompositorState expected, const char* operation) const {
  if (state_ != expected) {
    throw std::logic_error(std::string("Compositor::") + operation + " requires state " + StateName(expected) +
                           ", current state is " + StateName(state_) + ".");
  }
}

void Compositor::SetAnalysis(AudioAnalysis analysis) {
  RequireState(CompositorState::kAssembling, "SetAnalysis");
  if (!std::isfinite(analysis.duration_seconds) || analysis.duration_seconds <= 0.0) {
    throw InvalidAudioError("Audio analysis has non-positive duration.");
  }
  analysis_ = std::move(analysis);
}

void Compositor::SetTimeline(Timeline timeline) {
  RequireState(CompositorState::kAssembling, "SetTimeline");
  timeline_ = timeline;
}

void Compositor::AddLayer(Layer layer) {
  RequireState(CompositorState::kAssembling, "AddLayer");
  if (!layer.render) {
    throw std::invalid_argument("Layer '" + layer.name + "' has no render function.");
  }
  layer.opacity = std::max(0.0, std::min(layer.opacity, 1.0));
  layers_.push_back(std::move(layer));
}

void Compositor::BeginRendering() {
  RequireState(CompositorState::kAssembling, "BeginRendering");
  if (!analysis_.has_value() || !timeline_.has_value()) {
    throw std::logic_error("Compositor::BeginRendering requires audio analysis and timeline.");
  }
  std::stable_sort(layers_.begin(), layers_.end(),
                   [](const Layer& a, const Layer& b) { return a.z_index < b.z_index; });
  state_ = CompositorState::kRendering;
}

const AudioAnalysis& Compositor::analysis() const {
  if (!analysis_.has_value()) {
    throw std::logic_error("Compositor has no audio analysis.");
  }
  return *analysis_;
}

const Timeline& Compositor::timeline() const {
  if (!timeline_.has_value()) {
    throw std::logic_error("Compositor has no timeline.");
  }
  return *timeline_;
}

int64_t Compositor::FrameCount() const { return core::FrameCount(analysis().duration_seconds, fps_); }

void Compositor::ComposeFrame(int64_t index, Frame* frame, Image* scratch) const {
  if (state_ == CompositorState::kAssembling) {
    throw std::logic_error("Compositor::ComposeFrame called before BeginRendering.");
  }
  if (index < 0 || index >= FrameCount()) {
    throw std::out_of_range("Frame index " + std::to_string(index) + " is outside the track.");
  }
  ClearFrame(width_, height_, frame);
  frame->index = index;
  frame->timestamp_seconds = FrameTimestamp(index, fps_);

  const double t = frame->timestamp_seconds;
  for (const Layer& layer : layers_) {
    if (!layer.IsActive(t) || layer.opacity <= 0.0 || layer.region.Empty()) {
      continue;
    }
    if (scratch->width != layer.region.width || scratch->height != layer.region.height) {
      scratch->Resize(layer.region.width, layer.region.height);
    }
    layer.render(t, scratch);
    BlendImageOnto(*scratch, layer.region, layer.opacity, frame);
  }
}

bool Compositor::Run(const FrameSink& sink, const FrameLoopOptions& options, FrameLoopResult* result,
                     std::string* error) {
  RequireState(CompositorState::kRendering, "Run");
  state_ = CompositorState::kFinished;

  FrameLoopResult local;
  local.frames_total = FrameCount();
  const int jobs = ResolveJobCount(options.max_parallel_jobs, local.frames_total);
  const bool ok = jobs <= 1 ? RunSerial(*this, local.frames_total, sink, options, &local, error)
                            : RunParallel(*this, local.frames_total, jobs, sink, options, &local, error);
  if (result != nullptr) {
    *result = local;
  }
  return ok;
}

}  // namespace strata::core
