#include "strata/core/audio_features.hpp"

#include <algorithm>
#include <cmath>
#include <complex>
#include <cstddef>
#include <numeric>
#include <string>
#include <vector>

namespace strata::core {
namespace {

constexpr double kPi = 3.14159265358979323846;
constexpr double kEpsilon = 1e-12;
constexpr double kEnvelopeEpsilon = 1e-8;

void SetError(std::string* error, const std::string& message) {
  if (error != nullptr) {
    *error = message;
  }
}

size_t NextPowerOfTwo(size_t value) {
  size_t n = 1;
  while (n < value) {
    n <<= 1U;
  }
  return n;
}

void FftInPlace(std::vector<std::complex<double>>* values) {
  auto& a = *values;
  const size_t n = a.size();
  size_t j = 0;
  for (size_t i = 1; i < n; ++i) {
    size_t bit = n >> 1;
    while (j & bit) {
      j ^= bit;
      bit >>= 1;
    }
    j ^= bit;
    if (i < j) {
      std::swap(a[i], a[j]);
    }
  }

  for (size_t len = 2; len <= n; len <<= 1) {
    const double angle = -2.0 * kPi / static_cast<double>(len);
    const std::complex<double> w_len(std::cos(angle), std::sin(angle));
    for (size_t i = 0; i < n; i += len) {
      std::complex<double> w(1.0, 0.0);
      for (size_t j2 = 0; j2 < len / 2; ++j2) {
        const std::complex<double> u = a[i + j2];
        const std::complex<double> v = a[i + j2 + len / 2] * w;
        a[i + j2] = u + v;
        a[i + j2 + len / 2] = u - v;
        w *= w_len;
      }
    }
  }
}

std::vector<double> BuildHann(int size) {
  std::vector<double> w(static_cast<size_t>(size), 0.0);
  if (size <= 1) {
    return w;
  }
  for (int i = 0; i < size; ++i) {
    w[static_cast<size_t>(i)] = 0.5 - 0.5 * std::cos(2.0 * kPi * static_cast<double>(i) / static_cast<double>(size - 1));
  }
  return w;
}

std::vector<double> ComputeOnsetStrength(const std::vector<float>& mono, size_t frame, size_t hop) {
  std::vector<double> energies;
  energies.reserve(mono.size() / hop + 1U);
  for (size_t start = 0; start + frame <= mono.size(); start += hop) {
    double e = 0.0;
    for (size_t i = 0; i < frame; ++i) {
      const double v = static_cast<double>(mono[start + i]);
      e += v * v;
    }
    energies.push_back(e / static_cast<double>(frame));
  }

  std::vector<double> onset_strength;
  onset_strength.reserve(energies.size());
  if (energies.empty()) {
    return onset_strength;
  }
  onset_strength.push_back(0.0);
  for (size_t i = 1; i < energies.size(); ++i) {
    onset_strength.push_back(std::max(0.0, energies[i] - energies[i - 1]));
  }
  return onset_strength;
}

bool IsLocalPeak(const std::vector<double>& values, size_t index, int radius) {
  const double v = values[index];
  const size_t r = static_cast<size_t>(std::max(0, radius));
  const size_t lo = index >= r ? index - r : 0U;
  const size_t hi = std::min(values.size() - 1U, index + r);
  for (size_t j = lo; j < index; ++j) {
    if (values[j] >= v) {
      return false;
    }
  }
  for (size_t j = index + 1U; j <= hi; ++j) {
    if (values[j] > v) {
      return false;
    }
  }
  return true;
}

// Lag of the strongest periodicity in one frame, or 0 when the frame is unvoiced.
double FramePitchLag(const std::vector<float>& mono, size_t start, size_t frame, size_t min_lag, size_t max_lag,
                     const FeatureOptions& options) {
  double mean = 0.0;
  for (size_t i = 0; i < frame; ++i) {
    mean += static_cast<double>(mono[start + i]);
  }
  mean /= static_cast<double>(frame);

  double sum_sq = 0.0;
  const size_t fft_size = NextPowerOfTwo(frame * 2U);
  std::vector<std::complex<double>> bins(fft_size, std::complex<double>(0.0, 0.0));
  for (size_t i = 0; i < frame; ++i) {
    const double v = static_cast<double>(mono[start + i]) - mean;
    sum_sq += v * v;
    bins[i] = std::complex<double>(v, 0.0);
  }
  if (std::sqrt(sum_sq / static_cast<double>(frame)) < options.voicing_rms) {
    return 0.0;
  }

  FftInPlace(&bins);
  for (auto& bin : bins) {
    bin = std::complex<double>(std::norm(bin), 0.0);
  }
  FftInPlace(&bins);

  const double r0 = bins[0].real();
  if (r0 <= kEpsilon) {
    return 0.0;
  }
  std::vector<double> r(max_lag + 2U, 0.0);
  for (size_t lag = 0; lag < r.size() && lag < fft_size; ++lag) {
    r[lag] = bins[lag].real() / r0;
  }

  double peak = 0.0;
  for (size_t lag = min_lag + 1U; lag < max_lag; ++lag) {
    peak = std::max(peak, r[lag]);
  }
  if (peak < options.voicing_correlation) {
    return 0.0;
  }

  for (size_t lag = min_lag + 1U; lag < max_lag; ++lag) {
    if (r[lag] < 0.9 * peak || r[lag] < r[lag - 1U] || r[lag] < r[lag + 1U]) {
      continue;
    }
    const double a = r[lag - 1U];
    const double b = r[lag];
    const double c = r[lag + 1U];
    const double denom = a - 2.0 * b + c;
    double offset = 0.0;
    if (denom < -kEpsilon) {
      offset = std::max(-0.5, std::min(0.5, 0.5 * (a - c) / denom));
    }
    return static_cast<double>(lag) + offset;
  }
  return 0.0;
}

}  // namespace

std::vector<float> MixToMono(const AudioBuffer& audio) {
  if (audio.channels <= 1) {
    return audio.samples;
  }
  const size_t channels = static_cast<size_t>(audio.channels);
  const size_t frames = audio.samples.size() / channels;
  std::vector<float> mono(frames, 0.0F);
  const float scale = 1.0F / static_cast<float>(channels);
  for (size_t f = 0; f < frames; ++f) {
    float sum = 0.0F;
    for (size_t c = 0; c < channels; ++c) {
      sum += audio.samples[f * channels + c];
    }
    mono[f] = sum * scale;
  }
  return mono;
}

double ComputeRms(const std::vector<float>& mono) {
  if (mono.empty()) {
    return 0.0;
  }
  double sum_sq = 0.0;
  for (float s : mono) {
    const double v = static_cast<double>(s);
    sum_sq += v * v;
  }
  return std::sqrt(sum_sq / static_cast<double>(mono.size()));
}

std::vector<double> ComputeLoudnessEnvelope(const std::vector<float>& mono, int sample_rate, double window_seconds) {
  std::vector<double> envelope;
  if (mono.empty() || sample_rate <= 0) {
    return envelope;
  }
  const size_t window =
      static_cast<size_t>(std::max(1L, std::lround(window_seconds * static_cast<double>(sample_rate))));
  const size_t count = std::max<size_t>(1U, mono.size() / window);
  envelope.reserve(count);
  for (size_t w = 0; w < count; ++w) {
    const size_t start = w * window;
    const size_t end = count == 1U ? mono.size() : std::min(mono.size(), start + window);
    double sum = 0.0;
    for (size_t i = start; i < end; ++i) {
      sum += std::fabs(static_cast<double>(mono[i]));
    }
    envelope.push_back(sum / static_cast<double>(std::max<size_t>(1U, end - start)));
  }

  const double max_value = *std::max_element(envelope.begin(), envelope.end());
  for (double& v : envelope) {
    v = std::min(1.0, v / (max_value + kEnvelopeEpsilon));
  }
  return envelope;
}

bool DetectBeats(const std::vector<float>& mono, int sample_rate, const FeatureOptions& options,
                 std::vector<double>* beat_times, std::string* error) {
  if (beat_times == nullptr) {
    SetError(error, "Internal beat detection error: null output.");
    return false;
  }
  beat_times->clear();
  const size_t frame = static_cast<size_t>(std::max(16, options.onset_frame));
  const size_t hop = static_cast<size_t>(std::max(1, options.onset_hop));
  if (sample_rate <= 0 || mono.size() < frame) {
    SetError(error, "Beat detection needs at least " + std::to_string(frame) + " samples, got " +
                        std::to_string(mono.size()) + ".");
    return false;
  }

  const std::vector<double> onset_strength = ComputeOnsetStrength(mono, frame, hop);
  const double mean = std::accumulate(onset_strength.begin(), onset_strength.end(), 0.0) /
                      static_cast<double>(onset_strength.size());
  double variance = 0.0;
  for (double v : onset_strength) {
    const double d = v - mean;
    variance += d * d;
  }
  variance /= static_cast<double>(onset_strength.size());
  const double threshold = mean + std::sqrt(variance);

  const double duration = static_cast<double>(mono.size()) / static_cast<double>(sample_rate);
  std::vector<double> strengths;
  for (size_t i = 0; i < onset_strength.size(); ++i) {
    const double v = onset_strength[i];
    if (v <= threshold || v <= kEpsilon || !IsLocalPeak(onset_strength, i, options.onset_peak_radius)) {
      continue;
    }
    const double t = std::min(duration, static_cast<double>(i * hop) / static_cast<double>(sample_rate));
    if (!beat_times->empty() && t - beat_times->back() < options.min_beat_interval_seconds) {
      if (v > strengths.back()) {
        beat_times->back() = t;
        strengths.back() = v;
      }
      continue;
    }
    beat_times->push_back(t);
    strengths.push_back(v);
  }
  return true;
}

bool EstimateTempo(const std::vector<double>& beat_times, const FeatureOptions& options, double* bpm, std::string* error) {
  if (bpm == nullptr) {
    SetError(error, "Internal tempo error: null output.");
    return false;
  }
  *bpm = 0.0;
  if (beat_times.size() < 2U) {
    SetError(error, "Tempo estimation needs at least two beats, found " + std::to_string(beat_times.size()) + ".");
    return false;
  }
  std::vector<double> intervals;
  intervals.reserve(beat_times.size() - 1U);
  for (size_t i = 1; i < beat_times.size(); ++i) {
    intervals.push_back(beat_times[i] - beat_times[i - 1]);
  }
  const size_t mid = intervals.size() / 2U;
  std::nth_element(intervals.begin(), intervals.begin() + static_cast<std::ptrdiff_t>(mid), intervals.end());
  double median = intervals[mid];
  if (intervals.size() % 2U == 0U) {
    const double lower = *std::max_element(intervals.begin(), intervals.begin() + static_cast<std::ptrdiff_t>(mid));
    median = 0.5 * (median + lower);
  }
  if (median <= kEpsilon) {
    SetError(error, "Tempo estimation found degenerate beat intervals.");
    return false;
  }

  double value = 60.0 / median;
  const double lo = std::max(1.0, options.min_tempo_bpm);
  const double hi = std::max(lo * 2.0, options.max_tempo_bpm);
  while (value < lo) {
    value *= 2.0;
  }
  while (value > hi) {
    value /= 2.0;
  }
  *bpm = value;
  return true;
}

bool EstimatePitch(const std::vector<float>& mono, int sample_rate, const FeatureOptions& options, double* pitch_hz,
                   std::string* error) {
  if (pitch_hz == nullptr) {
    SetError(error, "Internal pitch error: null output.");
    return false;
  }
  *pitch_hz = 0.0;
  const size_t frame = static_cast<size_t>(std::max(64, options.pitch_frame));
  const size_t hop = static_cast<size_t>(std::max(1, options.pitch_hop));
  if (sample_rate <= 0 || mono.size() < frame) {
    SetError(error, "Pitch estimation needs at least " + std::to_string(frame) + " samples, got " +
                        std::to_string(mono.size()) + ".");
    return false;
  }

  const double sr = static_cast<double>(sample_rate);
  const size_t min_lag = static_cast<size_t>(std::max(2.0, std::floor(sr / std::max(1.0, options.max_pitch_hz))));
  const size_t max_lag = std::min(frame - 2U, static_cast<size_t>(std::ceil(sr / std::max(1.0, options.min_pitch_hz))));
  if (max_lag <= min_lag + 1U) {
    SetError(error, "Pitch search range is empty at sample rate " + std::to_string(sample_rate) + ".");
    return false;
  }

  double sum_hz = 0.0;
  size_t voiced = 0;
  for (size_t start = 0; start + frame <= mono.size(); start += hop) {
    const double lag = FramePitchLag(mono, start, frame, min_lag, max_lag, options);
    if (lag <= 0.0) {
      continue;
    }
    sum_hz += sr / lag;
    ++voiced;
  }
  if (voiced == 0U) {
    SetError(error, "Pitch estimation found no voiced frames.");
    return false;
  }
  *pitch_hz = sum_hz / static_cast<double>(voiced);
  return true;
}

bool EstimateSpectralCentroid(const std::vector<float>& mono, int sample_rate, const FeatureOptions& options,
                              double* centroid_hz, std::string* error) {
  if (centroid_hz == nullptr) {
    SetError(error, "Internal centroid error: null output.");
    return false;
  }
  *centroid_hz = 0.0;
  const int fft_size = static_cast<int>(NextPowerOfTwo(static_cast<size_t>(std::max(256, options.fft_size))));
  const size_t hop = static_cast<size_t>(std::max(64, options.fft_hop));
  if (sample_rate <= 0 || mono.size() < static_cast<size_t>(fft_size)) {
    SetError(error, "Spectral centroid needs at least " + std::to_string(fft_size) + " samples, got " +
                        std::to_string(mono.size()) + ".");
    return false;
  }

  const std::vector<double> window = BuildHann(fft_size);
  const size_t half = static_cast<size_t>(fft_size / 2);
  std::vector<std::complex<double>> bins(static_cast<size_t>(fft_size));
  double centroid_sum = 0.0;
  size_t frames = 0;
  for (size_t start = 0; start + static_cast<size_t>(fft_size) <= mono.size(); start += hop) {
    for (int i = 0; i < fft_size; ++i) {
      const size_t idx = static_cast<size_t>(i);
      bins[idx] = std::complex<double>(static_cast<double>(mono[start + idx]) * window[idx], 0.0);
    }
    FftInPlace(&bins);

    double total_mag = 0.0;
    double weighted_sum = 0.0;
    for (size_t k = 1; k < half; ++k) {
      const double hz = static_cast<double>(sample_rate) * static_cast<double>(k) / static_cast<double>(fft_size);
      const double mag = std::abs(bins[k]);
      total_mag += mag;
      weighted_sum += hz * mag;
    }
    if (total_mag <= 1e-9) {
      continue;
    }
    centroid_sum += weighted_sum / total_mag;
    ++frames;
  }
  if (frames == 0U) {
    SetError(error, "Spectral centroid found only silent frames.");
    return false;
  }
  *centroid_hz = centroid_sum / static_cast<double>(frames);
  return true;
}

AudioAnalysis AnalyzeAudio(const AudioBuffer& audio, int sample_rate, const FeatureOptions& options,
                           std::vector<RenderWarning>* warnings) {
  if (sample_rate <= 0) {
    throw InvalidAudioError("Sample rate must be positive, got " + std::to_string(sample_rate) + ".");
  }
  if (audio.channels <= 0) {
    throw InvalidAudioError("Channel count must be positive, got " + std::to_string(audio.channels) + ".");
  }
  const std::vector<float> mono = MixToMono(audio);
  if (mono.empty()) {
    throw InvalidAudioError("Audio buffer contains no sample frames.");
  }

  AudioAnalysis out;
  out.sample_rate = sample_rate;
  out.duration_seconds = static_cast<double>(mono.size()) / static_cast<double>(sample_rate);
  out.envelope_window_seconds = options.envelope_window_seconds;
  out.loudness_envelope = ComputeLoudnessEnvelope(mono, sample_rate, options.envelope_window_seconds);
  out.average_rms = ComputeRms(mono);

  std::string error;
  if (!DetectBeats(mono, sample_rate, options, &out.beat_times, &error)) {
    out.beat_times.clear();
    AddWarning(warnings, WarningKind::kFeatureExtraction, "beat detection failed: " + error);
  }
  if (!EstimateTempo(out.beat_times, options, &out.tempo_bpm, &error)) {
    out.tempo_bpm = 0.0;
    AddWarning(warnings, WarningKind::kFeatureExtraction, "tempo estimation failed: " + error);
  }
  if (!EstimatePitch(mono, sample_rate, options, &out.average_pitch_hz, &error)) {
    out.average_pitch_hz = 0.0;
    AddWarning(warnings, WarningKind::kFeatureExtraction, "pitch estimation failed: " + error);
  }
  if (!EstimateSpectralCentroid(mono, sample_rate, options, &out.spectral_centroid_hz, &error)) {
    out.spectral_centroid_hz = 0.0;
    AddWarning(warnings, WarningKind::kFeatureExtraction, "spectral centroid failed: " + error);
  }
  return out;
}

}  // namespace strata::core
