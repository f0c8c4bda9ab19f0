#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "strata/core/audio_features.hpp"

namespace strata::io {

// Reads interleaved float PCM. WAV (PCM 16/24/32, float 32) is parsed directly; flac, mp3, aiff,
// m4a and ogg are decoded through the ffmpeg command line tool into a temporary WAV.
bool ReadAudioFile(const std::filesystem::path& path, core::AudioBuffer* audio, int* sample_rate, std::string* error);

// Parses an in-memory RIFF/WAVE image. `source` only labels error messages.
bool ParseWavBytes(const std::vector<uint8_t>& bytes, const std::string& source, core::AudioBuffer* audio,
                   int* sample_rate, std::string* error);

}  // namespace strata::io
