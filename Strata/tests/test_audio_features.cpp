/**
 * @file test_audio_features.cpp
 * @brief Unit tests for audio feature extraction
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <algorithm>
#include <cmath>
#include <string>
#include <vector>

#include <strata/core/audio_features.hpp>
#include <strata/core/errors.hpp>

using namespace strata::core;
using Catch::Matchers::WithinAbs;

namespace {

constexpr int kRate = 22050;
constexpr double kTwoPi = 6.28318530717958647692;

AudioBuffer Sine(double hz, double seconds, double amplitude, int channels = 1) {
  AudioBuffer audio;
  audio.channels = channels;
  const size_t frames = static_cast<size_t>(seconds * kRate);
  audio.samples.resize(frames * static_cast<size_t>(channels));
  for (size_t i = 0; i < frames; ++i) {
    const float v = static_cast<float>(amplitude * std::sin(kTwoPi * hz * static_cast<double>(i) / kRate));
    for (int c = 0; c < channels; ++c) {
      audio.samples[i * static_cast<size_t>(channels) + static_cast<size_t>(c)] = v;
    }
  }
  return audio;
}

// 20 ms bursts of 1 kHz every `period` seconds, the first at `offset`.
AudioBuffer ClickTrack(double seconds, double period, double offset) {
  AudioBuffer audio;
  audio.samples.assign(static_cast<size_t>(seconds * kRate), 0.0F);
  const size_t burst = static_cast<size_t>(0.02 * kRate);
  for (double t = offset; t < seconds; t += period) {
    const size_t start = static_cast<size_t>(t * kRate);
    for (size_t i = 0; i < burst && start + i < audio.samples.size(); ++i) {
      audio.samples[start + i] = static_cast<float>(0.9 * std::sin(kTwoPi * 1000.0 * static_cast<double>(i) / kRate));
    }
  }
  return audio;
}

size_t CountKind(const std::vector<RenderWarning>& warnings, WarningKind kind) {
  size_t n = 0;
  for (const auto& w : warnings) {
    n += w.kind == kind ? 1U : 0U;
  }
  return n;
}

}  // namespace

TEST_CASE("Analysis rejects unusable audio", "[audio][errors]") {
  std::vector<RenderWarning> warnings;

  SECTION("empty buffer") {
    REQUIRE_THROWS_AS(AnalyzeAudio(AudioBuffer{}, kRate, FeatureOptions{}, &warnings), InvalidAudioError);
  }

  SECTION("non-positive sample rate") {
    REQUIRE_THROWS_AS(AnalyzeAudio(Sine(440.0, 0.5, 0.5), 0, FeatureOptions{}, &warnings), InvalidAudioError);
  }

  SECTION("zero channels") {
    AudioBuffer audio = Sine(440.0, 0.5, 0.5);
    audio.channels = 0;
    REQUIRE_THROWS_AS(AnalyzeAudio(audio, kRate, FeatureOptions{}, &warnings), InvalidAudioError);
  }
}

TEST_CASE("Stereo mixes down to the channel average", "[audio]") {
  AudioBuffer audio;
  audio.channels = 2;
  audio.samples = {1.0F, 0.0F, -0.5F, 0.5F, 0.25F, 0.75F};
  const std::vector<float> mono = MixToMono(audio);
  REQUIRE(mono.size() == 3U);
  REQUIRE_THAT(mono[0], WithinAbs(0.5, 1e-6));
  REQUIRE_THAT(mono[1], WithinAbs(0.0, 1e-6));
  REQUIRE_THAT(mono[2], WithinAbs(0.5, 1e-6));
}

TEST_CASE("Loudness envelope is normalized to [0, 1]", "[audio][envelope]") {
  SECTION("tone with a fade-in") {
    AudioBuffer audio = Sine(220.0, 2.0, 0.8);
    for (size_t i = 0; i < audio.samples.size(); ++i) {
      audio.samples[i] *= static_cast<float>(static_cast<double>(i) / static_cast<double>(audio.samples.size()));
    }
    const std::vector<double> envelope = ComputeLoudnessEnvelope(audio.samples, kRate, 0.02);
    REQUIRE(envelope.size() == 100U);
    double peak = 0.0;
    for (const double v : envelope) {
      REQUIRE(v >= 0.0);
      REQUIRE(v <= 1.0);
      peak = std::max(peak, v);
    }
    REQUIRE_THAT(peak, WithinAbs(1.0, 1e-6));
    REQUIRE(envelope.front() < envelope.back());
  }

  SECTION("silence is all zeros") {
    const std::vector<float> silence(kRate, 0.0F);
    const std::vector<double> envelope = ComputeLoudnessEnvelope(silence, kRate, 0.02);
    REQUIRE_FALSE(envelope.empty());
    for (const double v : envelope) {
      REQUIRE(v == 0.0);
    }
  }

  SECTION("clip shorter than one window keeps a single value") {
    const std::vector<float> blip(100, 0.5F);
    const std::vector<double> envelope = ComputeLoudnessEnvelope(blip, kRate, 0.02);
    REQUIRE(envelope.size() == 1U);
    REQUIRE_THAT(envelope[0], WithinAbs(1.0, 1e-6));
  }
}

TEST_CASE("Beats and tempo on a click track", "[audio][beats]") {
  const AudioBuffer clicks = ClickTrack(6.0, 0.5, 0.25);
  std::vector<RenderWarning> warnings;
  const AudioAnalysis analysis = AnalyzeAudio(clicks, kRate, FeatureOptions{}, &warnings);

  REQUIRE(analysis.beat_times.size() >= 9U);
  REQUIRE(analysis.beat_times.size() <= 12U);
  for (size_t i = 1; i < analysis.beat_times.size(); ++i) {
    REQUIRE(analysis.beat_times[i] > analysis.beat_times[i - 1]);
  }
  for (const double t : analysis.beat_times) {
    REQUIRE(t >= 0.0);
    REQUIRE(t <= analysis.duration_seconds);
  }
  REQUIRE_THAT(analysis.tempo_bpm, WithinAbs(120.0, 8.0));
}

TEST_CASE("Tempo folds into the configured range", "[audio][beats]") {
  FeatureOptions options;
  double bpm = 0.0;

  SECTION("slow pulse doubles") {
    REQUIRE(EstimateTempo({0.0, 1.5, 3.0, 4.5}, options, &bpm, nullptr));
    REQUIRE_THAT(bpm, WithinAbs(80.0, 1e-9));
  }

  SECTION("very slow pulse doubles until in range") {
    REQUIRE(EstimateTempo({0.0, 2.5, 5.0}, options, &bpm, nullptr));
    REQUIRE_THAT(bpm, WithinAbs(96.0, 1e-9));
  }

  SECTION("fast pulse halves") {
    REQUIRE(EstimateTempo({0.0, 0.2, 0.4, 0.6}, options, &bpm, nullptr));
    REQUIRE_THAT(bpm, WithinAbs(150.0, 1e-9));
  }

  SECTION("fewer than two beats fails") {
    std::string error;
    REQUIRE_FALSE(EstimateTempo({1.0}, options, &bpm, &error));
    REQUIRE(bpm == 0.0);
    REQUIRE_FALSE(error.empty());
  }
}

TEST_CASE("Pitch of a steady tone", "[audio][pitch]") {
  const AudioBuffer tone = Sine(440.0, 1.0, 0.5);
  double pitch = 0.0;
  std::string error;
  REQUIRE(EstimatePitch(tone.samples, kRate, FeatureOptions{}, &pitch, &error));
  REQUIRE_THAT(pitch, WithinAbs(440.0, 3.0));
}

TEST_CASE("Spectral centroid tracks brightness", "[audio][spectrum]") {
  double low = 0.0;
  double high = 0.0;
  REQUIRE(EstimateSpectralCentroid(Sine(500.0, 1.0, 0.5).samples, kRate, FeatureOptions{}, &low, nullptr));
  REQUIRE(EstimateSpectralCentroid(Sine(3000.0, 1.0, 0.5).samples, kRate, FeatureOptions{}, &high, nullptr));
  REQUIRE(low < high);
  REQUIRE_THAT(high, WithinAbs(3000.0, 300.0));
}

TEST_CASE("Failed estimators fall back to neutral values with warnings", "[audio][warnings]") {
  SECTION("silence") {
    AudioBuffer silence;
    silence.samples.assign(kRate * 2, 0.0F);
    std::vector<RenderWarning> warnings;
    const AudioAnalysis analysis = AnalyzeAudio(silence, kRate, FeatureOptions{}, &warnings);
    REQUIRE(analysis.duration_seconds == 2.0);
    REQUIRE(analysis.beat_times.empty());
    REQUIRE(analysis.tempo_bpm == 0.0);
    REQUIRE(analysis.average_pitch_hz == 0.0);
    REQUIRE(analysis.spectral_centroid_hz == 0.0);
    REQUIRE(analysis.average_rms == 0.0);
    REQUIRE(CountKind(warnings, WarningKind::kFeatureExtraction) == 3U);
  }

  SECTION("clip shorter than an analysis frame") {
    AudioBuffer blip;
    blip.samples.assign(200, 0.25F);
    std::vector<RenderWarning> warnings;
    const AudioAnalysis analysis = AnalyzeAudio(blip, kRate, FeatureOptions{}, &warnings);
    REQUIRE(analysis.duration_seconds > 0.0);
    REQUIRE(analysis.loudness_envelope.size() == 1U);
    REQUIRE(CountKind(warnings, WarningKind::kFeatureExtraction) == 4U);
  }

  SECTION("null warning sink is allowed") {
    AudioBuffer blip;
    blip.samples.assign(200, 0.25F);
    REQUIRE_NOTHROW(AnalyzeAudio(blip, kRate, FeatureOptions{}, nullptr));
  }
}
