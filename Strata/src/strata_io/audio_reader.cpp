#include "strata/io/audio_reader.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <utility>
#include <vector>

#include <unistd.h>

namespace strata::io {
namespace {

void SetError(std::string* error, const std::string& message) {
  if (error != nullptr) {
    *error = message;
  }
}

uint16_t ReadU16Le(const uint8_t* p) { return static_cast<uint16_t>(p[0] | (static_cast<uint16_t>(p[1]) << 8)); }

uint32_t ReadU32Le(const uint8_t* p) {
  return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) | (static_cast<uint32_t>(p[2]) << 16) |
         (static_cast<uint32_t>(p[3]) << 24);
}

int32_t ReadS24Le(const uint8_t* p) {
  int32_t value = static_cast<int32_t>(p[0]) | (static_cast<int32_t>(p[1]) << 8) | (static_cast<int32_t>(p[2]) << 16);
  if ((value & 0x00800000) != 0) {
    value |= static_cast<int32_t>(0xFF000000U);
  }
  return value;
}

std::string LowerExtension(const std::filesystem::path& path) {
  std::string e = path.extension().string();
  std::transform(e.begin(), e.end(), e.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return e;
}

bool IsDecodedExternally(const std::string& ext) {
  static const char* const kExtensions[] = {".flac", ".mp3", ".aiff", ".aif", ".m4a", ".aac", ".ogg", ".opus"};
  return std::any_of(std::begin(kExtensions), std::end(kExtensions), [&](const char* e) { return ext == e; });
}

// WAVE_FORMAT_EXTENSIBLE carries the real format code in the first two bytes of the sub-format GUID.
constexpr uint16_t kFormatPcm = 1;
constexpr uint16_t kFormatFloat = 3;
constexpr uint16_t kFormatExtensible = 0xFFFE;

bool DecodeSample(uint16_t format, uint16_t bits, const uint8_t* p, float* out) {
  if (format == kFormatPcm) {
    switch (bits) {
      case 16:
        *out = static_cast<float>(static_cast<double>(static_cast<int16_t>(ReadU16Le(p))) / 32768.0);
        return true;
      case 24:
        *out = static_cast<float>(static_cast<double>(ReadS24Le(p)) / 8388608.0);
        return true;
      case 32:
        *out = static_cast<float>(static_cast<double>(static_cast<int32_t>(ReadU32Le(p))) / 2147483648.0);
        return true;
      default:
        return false;
    }
  }
  if (format == kFormatFloat && bits == 32) {
    std::memcpy(out, p, sizeof(float));
    return true;
  }
  return false;
}

bool ReadFileBytes(const std::filesystem::path& path, std::vector<uint8_t>* bytes, std::string* error) {
  std::ifstream in(path, std::ios::binary);
  if (!in.is_open()) {
    SetError(error, "Failed to open audio file: " + path.string());
    return false;
  }
  bytes->assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
  return true;
}

std::string QuoteForShell(const std::string& value) {
  std::string out = "'";
  for (char c : value) {
    if (c == '\'') {
      out += "'\\''";
    } else {
      out.push_back(c);
    }
  }
  out.push_back('\'');
  return out;
}

bool DecodeWithFfmpegTool(const std::filesystem::path& path, core::AudioBuffer* audio, int* sample_rate,
                          std::string* error) {
  static std::atomic<int> counter{0};
  std::error_code ec;
  const std::filesystem::path tmp_dir = std::filesystem::temp_directory_path(ec);
  if (ec) {
    SetError(error, "No temporary directory available to decode " + path.string());
    return false;
  }
  const std::filesystem::path tmp_wav =
      tmp_dir / ("strata_decode_" + std::to_string(static_cast<long>(::getpid())) + "_" +
                 std::to_string(counter.fetch_add(1)) + ".wav");

  const std::string command = "ffmpeg -v error -y -i " + QuoteForShell(path.string()) + " -f wav -acodec pcm_f32le " +
                              QuoteForShell(tmp_wav.string()) + " >/dev/null 2>&1";
  if (std::system(command.c_str()) != 0) {
    std::filesystem::remove(tmp_wav, ec);
    SetError(error, "ffmpeg could not decode " + path.string());
    return false;
  }

  std::vector<uint8_t> bytes;
  std::string wav_error;
  const bool ok = ReadFileBytes(tmp_wav, &bytes, &wav_error) &&
                  ParseWavBytes(bytes, tmp_wav.string(), audio, sample_rate, &wav_error);
  std::filesystem::remove(tmp_wav, ec);
  if (!ok) {
    SetError(error, "Failed to read ffmpeg output for " + path.string() + ": " + wav_error);
    return false;
  }
  return true;
}

}  // namespace

bool ParseWavBytes(const std::vector<uint8_t>& bytes, const std::string& source, core::AudioBuffer* audio,
                   int* sample_rate, std::string* error) {
  if (bytes.size() < 44U) {
    SetError(error, "WAV file too small: " + source);
    return false;
  }
  if (std::memcmp(bytes.data(), "RIFF", 4) != 0 || std::memcmp(bytes.data() + 8, "WAVE", 4) != 0) {
    SetError(error, "Not a RIFF/WAVE file: " + source);
    return false;
  }

  uint16_t format = 0;
  uint16_t channels = 0;
  uint32_t sr = 0;
  uint16_t bits = 0;
  const uint8_t* data = nullptr;
  size_t data_size = 0;

  size_t cursor = 12;
  while (cursor + 8 <= bytes.size()) {
    const char* chunk_id = reinterpret_cast<const char*>(bytes.data() + cursor);
    const size_t chunk_size = ReadU32Le(bytes.data() + cursor + 4);
    const size_t body = cursor + 8;
    if (std::memcmp(chunk_id, "data", 4) == 0) {
      // Streamed writers leave the data size at 0 or 0xFFFFFFFF; take what is present.
      data = bytes.data() + body;
      data_size = std::min(chunk_size, bytes.size() - body);
      if (chunk_size == 0U || chunk_size == 0xFFFFFFFFU) {
        data_size = bytes.size() - body;
        break;
      }
    } else if (body + chunk_size > bytes.size()) {
      break;
    } else if (std::memcmp(chunk_id, "fmt ", 4) == 0 && chunk_size >= 16U) {
      format = ReadU16Le(bytes.data() + body);
      channels = ReadU16Le(bytes.data() + body + 2);
      sr = ReadU32Le(bytes.data() + body + 4);
      bits = ReadU16Le(bytes.data() + body + 14);
      if (format == kFormatExtensible && chunk_size >= 26U) {
        format = ReadU16Le(bytes.data() + body + 24);
      }
    }
    cursor = body + chunk_size + (chunk_size % 2U);
  }

  if (data == nullptr || channels == 0 || sr == 0 || bits == 0) {
    SetError(error, "Malformed WAV file: missing fmt or data chunk in " + source);
    return false;
  }
  const size_t bytes_per_sample = bits / 8U;
  if (bytes_per_sample == 0U || bits % 8U != 0U) {
    SetError(error, "Unsupported WAV bit depth " + std::to_string(bits) + " in " + source);
    return false;
  }
  const size_t bytes_per_frame = bytes_per_sample * channels;
  const size_t frame_count = data_size / bytes_per_frame;
  const size_t sample_count = frame_count * channels;

  std::vector<float> samples(sample_count, 0.0F);
  for (size_t i = 0; i < sample_count; ++i) {
    if (!DecodeSample(format, bits, data + i * bytes_per_sample, &samples[i])) {
      SetError(error, "Unsupported WAV encoding (format " + std::to_string(format) + ", " + std::to_string(bits) +
                          " bit) in " + source);
      return false;
    }
  }

  audio->channels = static_cast<int>(channels);
  audio->samples = std::move(samples);
  *sample_rate = static_cast<int>(sr);
  return true;
}

bool ReadAudioFile(const std::filesystem::path& path, core::AudioBuffer* audio, int* sample_rate, std::string* error) {
  if (audio == nullptr || sample_rate == nullptr) {
    SetError(error, "Invalid audio reader arguments.");
    return false;
  }
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    SetError(error, "Audio file not found: " + path.string());
    return false;
  }

  const std::string ext = LowerExtension(path);
  if (ext == ".wav" || ext == ".wave") {
    std::vector<uint8_t> bytes;
    if (!ReadFileBytes(path, &bytes, error)) {
      return false;
    }
    return ParseWavBytes(bytes, path.string(), audio, sample_rate, error);
  }
  if (IsDecodedExternally(ext)) {
    return DecodeWithFfmpegTool(path, audio, sample_rate, error);
  }

  SetError(error, "Unsupported audio file extension: " + path.string());
  return false;
}

}  // namespace strata::io
