#pragma once

#include <string>
#include <vector>

#include "strata/core/errors.hpp"

namespace strata::core {

// Interleaved float PCM in [-1, 1].
struct AudioBuffer {
  int channels = 1;
  std::vector<float> samples;
};

struct AudioAnalysis {
  double duration_seconds = 0.0;
  int sample_rate = 0;
  std::vector<double> beat_times;
  std::vector<double> loudness_envelope;
  double envelope_window_seconds = 0.02;
  double average_pitch_hz = 0.0;
  double tempo_bpm = 0.0;
  double spectral_centroid_hz = 0.0;
  double average_rms = 0.0;
};

struct FeatureOptions {
  double envelope_window_seconds = 0.02;
  int onset_frame = 1024;
  int onset_hop = 512;
  int onset_peak_radius = 2;
  double min_beat_interval_seconds = 0.1;
  int pitch_frame = 2048;
  int pitch_hop = 1024;
  double min_pitch_hz = 50.0;
  double max_pitch_hz = 1000.0;
  double voicing_rms = 0.01;
  double voicing_correlation = 0.5;
  int fft_size = 2048;
  int fft_hop = 512;
  double min_tempo_bpm = 60.0;
  double max_tempo_bpm = 200.0;
};

std::vector<float> MixToMono(const AudioBuffer& audio);
double ComputeRms(const std::vector<float>& mono);
std::vector<double> ComputeLoudnessEnvelope(const std::vector<float>& mono, int sample_rate, double window_seconds);

bool DetectBeats(const std::vector<float>& mono, int sample_rate, const FeatureOptions& options,
                 std::vector<double>* beat_times, std::string* error);
bool EstimateTempo(const std::vector<double>& beat_times, const FeatureOptions& options, double* bpm, std::string* error);
bool EstimatePitch(const std::vector<float>& mono, int sample_rate, const FeatureOptions& options, double* pitch_hz,
                   std::string* error);
bool EstimateSpectralCentroid(const std::vector<float>& mono, int sample_rate, const FeatureOptions& options,
                              double* centroid_hz, std::string* error);

// Throws InvalidAudioError for empty buffers or a non-positive sample rate. Estimators that fail
// substitute 0.0 (or an empty beat list) and append a feature-extraction warning.
AudioAnalysis AnalyzeAudio(const AudioBuffer& audio, int sample_rate, const FeatureOptions& options,
                           std::vector<RenderWarning>* warnings);

}  // namespace strata::core
