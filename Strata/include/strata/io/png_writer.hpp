#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "strata/core/compositor.hpp"
#include "strata/core/image.hpp"

namespace strata::io {

constexpr int kDefaultPngCompression = 6;

// Encodes an 8-bit RGB image into PNG bytes (single IDAT, filter type 0).
bool EncodePngRgb8(int width, int height, const std::vector<uint8_t>& rgb, int compression_level,
                   std::vector<uint8_t>* png, std::string* error);

// Writes through a temporary file and renames it into place.
bool WritePngRgb8(const std::filesystem::path& path, int width, int height, const std::vector<uint8_t>& rgb,
                  int compression_level, std::string* error);

bool WritePngFrame(const std::filesystem::path& path, const core::Frame& frame, std::string* error);

// frame_000000.png, frame_000001.png, ... under `directory`.
std::filesystem::path SequenceFramePath(const std::filesystem::path& directory, int64_t index);

// A frame sink that writes each frame as a numbered PNG. The directory is created on first use.
core::FrameSink MakePngSequenceSink(const std::filesystem::path& directory,
                                    int compression_level = kDefaultPngCompression);

}  // namespace strata::io
