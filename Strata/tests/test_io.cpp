/**
 * @file test_io.cpp
 * @brief Unit tests for WAV parsing, PNG output, JSON reports and video export
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <limits>
#include <string>
#include <vector>

#include <zlib.h>

extern "C" {
#include <libavformat/avformat.h>
}

#include <strata/core/errors.hpp>
#include <strata/io/audio_reader.hpp>
#include <strata/io/png_writer.hpp>
#include <strata/io/reel_export.hpp>
#include <strata/io/report_writer.hpp>
#include <strata/io/video_encoder.hpp>

using namespace strata;
using Catch::Matchers::WithinAbs;

namespace {

namespace fs = std::filesystem;

fs::path FreshDirectory(const std::string& name) {
  const fs::path dir = fs::temp_directory_path() / ("strata_test_" + name);
  std::error_code ec;
  fs::remove_all(dir, ec);
  fs::create_directories(dir);
  return dir;
}

std::vector<uint8_t> ReadBytes(const fs::path& path) {
  std::ifstream in(path, std::ios::binary);
  return std::vector<uint8_t>((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

std::string ReadText(const fs::path& path) {
  std::ifstream in(path);
  return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

void AppendU16(std::vector<uint8_t>* out, uint16_t v) {
  out->push_back(static_cast<uint8_t>(v & 0xFFU));
  out->push_back(static_cast<uint8_t>((v >> 8) & 0xFFU));
}

void AppendU32(std::vector<uint8_t>* out, uint32_t v) {
  for (int shift = 0; shift < 32; shift += 8) {
    out->push_back(static_cast<uint8_t>((v >> shift) & 0xFFU));
  }
}

void AppendTag(std::vector<uint8_t>* out, const char* tag) { out->insert(out->end(), tag, tag + 4); }

// A canonical RIFF/WAVE image with an extra LIST chunk before the data.
std::vector<uint8_t> MakeWav(uint16_t format, uint16_t channels, uint32_t sample_rate, uint16_t bits,
                             const std::vector<uint8_t>& payload) {
  std::vector<uint8_t> wav;
  AppendTag(&wav, "RIFF");
  AppendU32(&wav, 0U);
  AppendTag(&wav, "WAVE");
  AppendTag(&wav, "fmt ");
  AppendU32(&wav, 16U);
  AppendU16(&wav, format);
  AppendU16(&wav, channels);
  AppendU32(&wav, sample_rate);
  AppendU32(&wav, sample_rate * channels * (bits / 8U));
  AppendU16(&wav, static_cast<uint16_t>(channels * (bits / 8U)));
  AppendU16(&wav, bits);
  AppendTag(&wav, "LIST");
  AppendU32(&wav, 3U);
  wav.insert(wav.end(), {'a', 'b', 'c', 0U});
  AppendTag(&wav, "data");
  AppendU32(&wav, static_cast<uint32_t>(payload.size()));
  wav.insert(wav.end(), payload.begin(), payload.end());
  std::vector<uint8_t> riff_size;
  AppendU32(&riff_size, static_cast<uint32_t>(wav.size() - 8U));
  std::copy(riff_size.begin(), riff_size.end(), wav.begin() + 4);
  return wav;
}

uint32_t ReadU32Be(const std::vector<uint8_t>& bytes, size_t offset) {
  return (static_cast<uint32_t>(bytes[offset]) << 24) | (static_cast<uint32_t>(bytes[offset + 1]) << 16) |
         (static_cast<uint32_t>(bytes[offset + 2]) << 8) | static_cast<uint32_t>(bytes[offset + 3]);
}

constexpr int kSampleRate = 44100;
constexpr int kAacFrameSamples = 1024;

core::AudioBuffer SineAudio(double seconds) {
  core::AudioBuffer audio;
  audio.channels = 1;
  const auto count = static_cast<size_t>(seconds * kSampleRate);
  audio.samples.reserve(count);
  for (size_t i = 0; i < count; ++i) {
    audio.samples.push_back(0.5F * static_cast<float>(std::sin(2.0 * 3.14159265358979323846 * 440.0 *
                                                                static_cast<double>(i) / kSampleRate)));
  }
  return audio;
}

core::Frame GreyFrame(int64_t index, int width, int height) {
  core::Frame frame;
  core::ClearFrame(width, height, &frame);
  frame.index = index;
  std::fill(frame.rgb.begin(), frame.rgb.end(), static_cast<uint8_t>(40 + 20 * (index % 8)));
  return frame;
}

struct ContainerInfo {
  bool readable = false;
  unsigned streams = 0;
  int width = 0;
  int height = 0;
  double video_seconds = 0.0;
  double audio_seconds = 0.0;
  bool has_audio = false;
};

// Reopens a written container and reads its stream layout and durations.
ContainerInfo ReadContainer(const fs::path& path) {
  ContainerInfo info;
  AVFormatContext* format = nullptr;
  if (avformat_open_input(&format, path.string().c_str(), nullptr, nullptr) < 0) {
    return info;
  }
  if (avformat_find_stream_info(format, nullptr) >= 0) {
    info.readable = true;
    info.streams = format->nb_streams;
    for (unsigned i = 0; i < format->nb_streams; ++i) {
      const AVStream* stream = format->streams[i];
      const double seconds =
          stream->duration != AV_NOPTS_VALUE ? static_cast<double>(stream->duration) * av_q2d(stream->time_base) : 0.0;
      if (stream->codecpar->codec_type == AVMEDIA_TYPE_VIDEO) {
        info.width = stream->codecpar->width;
        info.height = stream->codecpar->height;
        info.video_seconds = seconds;
      } else if (stream->codecpar->codec_type == AVMEDIA_TYPE_AUDIO) {
        info.has_audio = true;
        info.audio_seconds = seconds;
      }
    }
  }
  avformat_close_input(&format);
  return info;
}

// The audio track may run past the last video frame by its final partial AAC frame plus the
// encoder's priming frame.
double AudioOverhangLimit() { return 2.0 * kAacFrameSamples / static_cast<double>(kSampleRate); }

}  // namespace

TEST_CASE("16-bit stereo WAV parses into interleaved floats", "[io][wav]") {
  std::vector<uint8_t> payload;
  for (const int16_t v : {int16_t{0}, int16_t{16384}, int16_t{-32768}, int16_t{32767}}) {
    AppendU16(&payload, static_cast<uint16_t>(v));
  }
  const std::vector<uint8_t> wav = MakeWav(1U, 2U, 48000U, 16U, payload);

  core::AudioBuffer audio;
  int sample_rate = 0;
  std::string error;
  REQUIRE(io::ParseWavBytes(wav, "memory", &audio, &sample_rate, &error));
  REQUIRE(sample_rate == 48000);
  REQUIRE(audio.channels == 2);
  REQUIRE(audio.samples.size() == 4U);
  REQUIRE_THAT(audio.samples[0], WithinAbs(0.0, 1e-6));
  REQUIRE_THAT(audio.samples[1], WithinAbs(0.5, 1e-6));
  REQUIRE_THAT(audio.samples[2], WithinAbs(-1.0, 1e-6));
  REQUIRE_THAT(audio.samples[3], WithinAbs(32767.0 / 32768.0, 1e-6));
}

TEST_CASE("Float WAV samples pass through unchanged", "[io][wav]") {
  std::vector<uint8_t> payload;
  for (const float v : {0.25F, -0.75F, 1.0F}) {
    uint32_t bits = 0;
    std::memcpy(&bits, &v, sizeof(bits));
    AppendU32(&payload, bits);
  }
  core::AudioBuffer audio;
  int sample_rate = 0;
  REQUIRE(io::ParseWavBytes(MakeWav(3U, 1U, 22050U, 32U, payload), "memory", &audio, &sample_rate, nullptr));
  REQUIRE(audio.channels == 1);
  REQUIRE(audio.samples == std::vector<float>{0.25F, -0.75F, 1.0F});
}

TEST_CASE("Malformed WAV images are rejected", "[io][wav][errors]") {
  core::AudioBuffer audio;
  int sample_rate = 0;
  std::string error;

  SECTION("too small") {
    REQUIRE_FALSE(io::ParseWavBytes(std::vector<uint8_t>(12, 0U), "tiny.wav", &audio, &sample_rate, &error));
    REQUIRE(error.find("tiny.wav") != std::string::npos);
  }

  SECTION("not RIFF") {
    std::vector<uint8_t> wav = MakeWav(1U, 1U, 8000U, 16U, std::vector<uint8_t>(8, 0U));
    wav[0] = 'X';
    REQUIRE_FALSE(io::ParseWavBytes(wav, "bad.wav", &audio, &sample_rate, &error));
    REQUIRE(error.find("RIFF") != std::string::npos);
  }

  SECTION("unsupported encoding") {
    REQUIRE_FALSE(io::ParseWavBytes(MakeWav(2U, 1U, 8000U, 16U, std::vector<uint8_t>(8, 0U)), "adpcm.wav", &audio,
                                    &sample_rate, &error));
    REQUIRE(error.find("Unsupported") != std::string::npos);
  }
}

TEST_CASE("Audio files are read from disk by extension", "[io][wav]") {
  const fs::path dir = FreshDirectory("audio_reader");
  std::vector<uint8_t> payload;
  for (int i = 0; i < 100; ++i) {
    AppendU16(&payload, static_cast<uint16_t>(static_cast<int16_t>(i * 100)));
  }
  const std::vector<uint8_t> wav = MakeWav(1U, 1U, 16000U, 16U, payload);
  const fs::path path = dir / "tone.wav";
  {
    std::ofstream out(path, std::ios::binary);
    out.write(reinterpret_cast<const char*>(wav.data()), static_cast<std::streamsize>(wav.size()));
  }

  core::AudioBuffer audio;
  int sample_rate = 0;
  std::string error;
  REQUIRE(io::ReadAudioFile(path, &audio, &sample_rate, &error));
  REQUIRE(sample_rate == 16000);
  REQUIRE(audio.samples.size() == 100U);

  REQUIRE_FALSE(io::ReadAudioFile(dir / "missing.wav", &audio, &sample_rate, &error));
  REQUIRE(error.find("not found") != std::string::npos);

  const fs::path unknown = dir / "notes.txt";
  std::ofstream(unknown) << "not audio";
  REQUIRE_FALSE(io::ReadAudioFile(unknown, &audio, &sample_rate, &error));
  REQUIRE(error.find("extension") != std::string::npos);

  fs::remove_all(dir);
}

TEST_CASE("PNG encoding produces a valid RGB image", "[io][png]") {
  const int width = 3;
  const int height = 2;
  std::vector<uint8_t> rgb(static_cast<size_t>(width * height * 3));
  for (size_t i = 0; i < rgb.size(); ++i) {
    rgb[i] = static_cast<uint8_t>(i * 13U);
  }
  std::vector<uint8_t> png;
  std::string error;
  REQUIRE(io::EncodePngRgb8(width, height, rgb, io::kDefaultPngCompression, &png, &error));

  const std::vector<uint8_t> signature{0x89U, 'P', 'N', 'G', '\r', '\n', 0x1AU, '\n'};
  REQUIRE(std::vector<uint8_t>(png.begin(), png.begin() + 8) == signature);
  REQUIRE(std::memcmp(png.data() + 12, "IHDR", 4) == 0);
  REQUIRE(ReadU32Be(png, 16) == static_cast<uint32_t>(width));
  REQUIRE(ReadU32Be(png, 20) == static_cast<uint32_t>(height));
  REQUIRE(png[24] == 8U);
  REQUIRE(png[25] == 2U);
  REQUIRE(std::memcmp(png.data() + png.size() - 8, "IEND", 4) == 0);

  const uint32_t ihdr_crc = static_cast<uint32_t>(crc32(0L, png.data() + 12, 17U));
  REQUIRE(ReadU32Be(png, 29) == ihdr_crc);

  const size_t idat = 33;
  REQUIRE(std::memcmp(png.data() + idat + 4, "IDAT", 4) == 0);
  const uint32_t idat_size = ReadU32Be(png, idat);
  std::vector<uint8_t> raw(static_cast<size_t>(height) * (static_cast<size_t>(width) * 3U + 1U));
  uLongf raw_size = static_cast<uLongf>(raw.size());
  REQUIRE(uncompress(raw.data(), &raw_size, png.data() + idat + 8, idat_size) == Z_OK);
  REQUIRE(raw_size == raw.size());
  REQUIRE(raw[0] == 0U);
  REQUIRE(std::vector<uint8_t>(raw.begin() + 1, raw.begin() + 10) == std::vector<uint8_t>(rgb.begin(), rgb.begin() + 9));
}

TEST_CASE("PNG encoding validates its input", "[io][png][errors]") {
  std::vector<uint8_t> png;
  std::string error;
  REQUIRE_FALSE(io::EncodePngRgb8(0, 4, {}, io::kDefaultPngCompression, &png, &error));
  REQUIRE_FALSE(io::EncodePngRgb8(2, 2, std::vector<uint8_t>(5, 0U), io::kDefaultPngCompression, &png, &error));
  REQUIRE(error.find("mismatch") != std::string::npos);
  REQUIRE_FALSE(io::EncodePngRgb8(1, 1, std::vector<uint8_t>(3, 0U), 12, &png, &error));
}

TEST_CASE("The PNG sequence sink numbers frames by index", "[io][png]") {
  const fs::path dir = FreshDirectory("png_sequence") / "frames";
  REQUIRE(io::SequenceFramePath(dir, 42).filename() == "frame_000042.png");

  const core::FrameSink sink = io::MakePngSequenceSink(dir, 1);
  core::Frame frame;
  core::ClearFrame(4, 2, &frame);
  for (int64_t k = 0; k < 3; ++k) {
    frame.index = k;
    std::string error;
    REQUIRE(sink(frame, &error));
  }
  for (int64_t k = 0; k < 3; ++k) {
    const std::vector<uint8_t> bytes = ReadBytes(io::SequenceFramePath(dir, k));
    REQUIRE(bytes.size() > 8U);
    REQUIRE(bytes[1] == 'P');
  }
  REQUIRE_FALSE(fs::exists(io::SequenceFramePath(dir, 3)));
  fs::remove_all(dir.parent_path());
}

TEST_CASE("Render reports carry analysis, timeline, layers and warnings", "[io][report]") {
  const fs::path dir = FreshDirectory("report");
  core::ReelRenderResult result;
  result.analysis.duration_seconds = 12.5;
  result.analysis.sample_rate = 44100;
  result.analysis.tempo_bpm = 118.0;
  result.analysis.beat_times = {0.5, 1.0};
  result.timeline = core::SegmentTimeline(12.5);
  result.layers.push_back({"background.classic", core::LayerKind::kBackground, 0, 0.0, 12.5, 1.0});
  result.frames_total = 375;
  result.frames_written = 375;
  result.warnings.push_back({core::WarningKind::kResourceMissing, "font \"Bold\"\tmissing"});

  const fs::path path = dir / "nested" / "report.json";
  std::string error;
  REQUIRE(io::WriteRenderReportJson(path, result, &error));
  const std::string json = ReadText(path);
  for (const char* key : {"\"analysis\"", "\"timeline\"", "\"layers\"", "\"frames_total\": 375", "\"warnings\"",
                          "\"beat_count\": 2", "\"hook_moment\"", "\"background.classic\"", "\"resource_missing\""}) {
    INFO(key);
    REQUIRE(json.find(key) != std::string::npos);
  }
  REQUIRE(json.find("font \\\"Bold\\\"\\tmissing") != std::string::npos);
  fs::remove_all(dir);
}

TEST_CASE("Analysis reports replace non-finite values", "[io][report]") {
  const fs::path dir = FreshDirectory("analysis");
  core::AudioAnalysis analysis;
  analysis.duration_seconds = 3.0;
  analysis.average_pitch_hz = std::numeric_limits<double>::quiet_NaN();
  const fs::path path = dir / "analysis.json";
  REQUIRE(io::WriteAnalysisJson(path, analysis, {}, nullptr));
  const std::string json = ReadText(path);
  REQUIRE(json.find("\"average_pitch_hz\": 0") != std::string::npos);
  REQUIRE(json.find("nan") == std::string::npos);
  fs::remove_all(dir);
}

TEST_CASE("The video encoder validates its settings before touching the disk", "[io][encoder]") {
  const fs::path dir = FreshDirectory("encoder");
  const fs::path path = dir / "out" / "reel.mp4";
  io::VideoEncoder encoder;
  std::string error;

  SECTION("odd dimensions") {
    io::EncoderSettings settings;
    settings.width = 1081;
    REQUIRE_FALSE(encoder.Open(path, settings, nullptr, 0, &error));
    REQUIRE(error.find("even") != std::string::npos);
  }

  SECTION("zero frame rate") {
    io::EncoderSettings settings;
    settings.fps = 0;
    REQUIRE_FALSE(encoder.Open(path, settings, nullptr, 0, &error));
  }

  SECTION("audio without a sample rate") {
    core::AudioBuffer audio;
    audio.samples.assign(100, 0.0F);
    REQUIRE_FALSE(encoder.Open(path, io::EncoderSettings{}, &audio, 0, &error));
  }

  REQUIRE_FALSE(encoder.is_open());
  REQUIRE_FALSE(fs::exists(path));
  core::Frame frame;
  core::ClearFrame(2, 2, &frame);
  REQUIRE_FALSE(encoder.WriteFrame(frame, &error));
  REQUIRE(encoder.Finish(&error));
  fs::remove_all(dir);
}

TEST_CASE("Encoded reels carry video and audio cut to the frames written", "[io][encoder]") {
  const fs::path dir = FreshDirectory("encoder_mux");
  const fs::path path = dir / "reel.mp4";
  const core::AudioBuffer audio = SineAudio(2.0);
  io::EncoderSettings settings;
  settings.width = 64;
  settings.height = 64;
  settings.fps = 10;
  settings.preset = "ultrafast";
  std::string error;

  SECTION("finished explicitly") {
    io::VideoEncoder encoder;
    REQUIRE(encoder.Open(path, settings, &audio, kSampleRate, &error));
    REQUIRE(encoder.is_open());
    REQUIRE_FALSE(encoder.video_codec_name().empty());
    for (int64_t i = 0; i < 10; ++i) {
      REQUIRE(encoder.WriteFrame(GreyFrame(i, 64, 64), &error));
    }
    REQUIRE(encoder.frames_written() == 10);
    REQUIRE(encoder.Finish(&error));
    REQUIRE_FALSE(encoder.is_open());
    REQUIRE(encoder.Finish(&error));

    const ContainerInfo info = ReadContainer(path);
    REQUIRE(info.readable);
    REQUIRE(info.streams == 2U);
    REQUIRE(info.has_audio);
    REQUIRE(info.width == 64);
    REQUIRE(info.height == 64);
    REQUIRE_THAT(info.video_seconds, WithinAbs(1.0, 0.11));
    REQUIRE(info.audio_seconds > 0.5);
    REQUIRE(info.audio_seconds <= info.video_seconds + AudioOverhangLimit());
  }

  SECTION("stopped early and finished by the destructor") {
    {
      io::VideoEncoder encoder;
      REQUIRE(encoder.Open(path, settings, &audio, kSampleRate, &error));
      for (int64_t i = 0; i < 5; ++i) {
        REQUIRE(encoder.WriteFrame(GreyFrame(i, 64, 64), &error));
      }
    }
    const ContainerInfo info = ReadContainer(path);
    REQUIRE(info.readable);
    REQUIRE(info.streams == 2U);
    REQUIRE_THAT(info.video_seconds, WithinAbs(0.5, 0.11));
    REQUIRE(info.audio_seconds <= info.video_seconds + AudioOverhangLimit());
  }

  SECTION("frames of the wrong size are rejected") {
    io::VideoEncoder encoder;
    REQUIRE(encoder.Open(path, settings, &audio, kSampleRate, &error));
    REQUIRE_FALSE(encoder.WriteFrame(GreyFrame(0, 32, 32), &error));
    REQUIRE(error.find("64x64") != std::string::npos);
    REQUIRE(encoder.frames_written() == 0);
    REQUIRE(encoder.Finish(&error));
  }
  fs::remove_all(dir);
}

TEST_CASE("Reel export renders, muxes and reports encoder failures", "[io][encoder][export]") {
  const fs::path dir = FreshDirectory("export");
  const core::AudioBuffer audio = SineAudio(2.0);
  core::Concept reel;
  reel.title = "Export";
  reel.hashtags = {"strata"};
  core::ReelRenderOptions options;
  options.config.width = 64;
  options.config.height = 112;
  options.config.fps = 10;
  options.config.max_parallel_jobs = 2;
  io::ExportOptions export_options;
  export_options.encoder.preset = "ultrafast";

  SECTION("a writable path gets a two-stream container") {
    export_options.output_path = dir / "nested" / "reel.mp4";
    const core::ReelRenderResult result = io::ExportReel(audio, kSampleRate, reel, options, export_options);
    REQUIRE(result.frames_written == 20);
    REQUIRE(result.frames_written == result.frames_total);
    const ContainerInfo info = ReadContainer(export_options.output_path);
    REQUIRE(info.readable);
    REQUIRE(info.streams == 2U);
    REQUIRE(info.width == 64);
    REQUIRE(info.height == 112);
    REQUIRE(info.audio_seconds <= info.video_seconds + AudioOverhangLimit());
  }

  SECTION("an output directory that is really a file") {
    const fs::path blocker = dir / "blocker";
    std::ofstream(blocker) << "not a directory";
    export_options.output_path = blocker / "reel.mp4";
    REQUIRE_THROWS_AS(io::ExportReel(audio, kSampleRate, reel, options, export_options), core::EncodingError);
    REQUIRE(fs::is_regular_file(blocker));
  }

  SECTION("unusable audio fails before the output exists") {
    export_options.output_path = dir / "silent.mp4";
    REQUIRE_THROWS_AS(io::ExportReel(core::AudioBuffer{}, kSampleRate, reel, options, export_options),
                      core::InvalidAudioError);
    REQUIRE_FALSE(fs::exists(export_options.output_path));
  }
  fs::remove_all(dir);
}
