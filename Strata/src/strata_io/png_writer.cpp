#include "strata/io/png_writer.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include <zlib.h>

namespace strata::io {
namespace {

constexpr std::array<uint8_t, 8> kPngSignature = {137U, 80U, 78U, 71U, 13U, 10U, 26U, 10U};

void SetError(std::string* error, const std::string& message) {
  if (error != nullptr) {
    *error = message;
  }
}

void AppendU32Be(std::vector<uint8_t>* out, uint32_t value) {
  out->push_back(static_cast<uint8_t>((value >> 24) & 0xFFU));
  out->push_back(static_cast<uint8_t>((value >> 16) & 0xFFU));
  out->push_back(static_cast<uint8_t>((value >> 8) & 0xFFU));
  out->push_back(static_cast<uint8_t>(value & 0xFFU));
}

// Chunk CRC covers the type and the payload.
void AppendChunk(std::vector<uint8_t>* png, const char* type, const uint8_t* data, size_t size) {
  AppendU32Be(png, static_cast<uint32_t>(size));
  const size_t type_start = png->size();
  png->insert(png->end(), type, type + 4);
  if (size > 0U) {
    png->insert(png->end(), data, data + size);
  }
  const uLong crc = crc32(0L, png->data() + type_start, static_cast<uInt>(png->size() - type_start));
  AppendU32Be(png, static_cast<uint32_t>(crc));
}

bool Deflate(const std::vector<uint8_t>& raw, int compression_level, std::vector<uint8_t>* out, std::string* error) {
  if (compression_level < 0 || compression_level > 9) {
    SetError(error, "PNG compression level must be in [0,9], got " + std::to_string(compression_level) + ".");
    return false;
  }
  uLongf actual = compressBound(static_cast<uLong>(raw.size()));
  out->assign(static_cast<size_t>(actual), 0U);
  const int rc = compress2(out->data(), &actual, raw.data(), static_cast<uLong>(raw.size()), compression_level);
  if (rc != Z_OK) {
    SetError(error, "zlib failed to deflate PNG payload (code " + std::to_string(rc) + ").");
    return false;
  }
  out->resize(static_cast<size_t>(actual));
  return true;
}

bool WriteFileAtomically(const std::filesystem::path& path, const std::vector<uint8_t>& bytes, std::string* error) {
  std::error_code ec;
  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
      SetError(error, "Failed to create directory " + path.parent_path().string() + ": " + ec.message());
      return false;
    }
  }
  const std::filesystem::path tmp = path.string() + ".tmp";
  {
    std::ofstream out(tmp, std::ios::binary);
    if (!out.is_open()) {
      SetError(error, "Failed to open PNG for writing: " + tmp.string());
      return false;
    }
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    out.close();
    if (!out) {
      std::filesystem::remove(tmp, ec);
      SetError(error, "Failed while writing PNG bytes: " + tmp.string());
      return false;
    }
  }
  std::filesystem::rename(tmp, path, ec);
  if (ec) {
    std::filesystem::remove(path, ec);
    ec.clear();
    std::filesystem::rename(tmp, path, ec);
  }
  if (ec) {
    std::filesystem::remove(tmp, ec);
    SetError(error, "Failed to finalize PNG file: " + path.string());
    return false;
  }
  return true;
}

}  // namespace

bool EncodePngRgb8(int width, int height, const std::vector<uint8_t>& rgb, int compression_level,
                   std::vector<uint8_t>* png, std::string* error) {
  if (width <= 0 || height <= 0) {
    SetError(error, "Invalid PNG dimensions " + std::to_string(width) + "x" + std::to_string(height) + ".");
    return false;
  }
  const size_t stride = static_cast<size_t>(width) * 3U;
  if (rgb.size() != stride * static_cast<size_t>(height)) {
    SetError(error, "PNG RGB buffer size mismatch.");
    return false;
  }

  std::vector<uint8_t> raw;
  raw.reserve(static_cast<size_t>(height) * (stride + 1U));
  for (int y = 0; y < height; ++y) {
    raw.push_back(0U);
    const auto row = rgb.begin() + static_cast<std::ptrdiff_t>(static_cast<size_t>(y) * stride);
    raw.insert(raw.end(), row, row + static_cast<std::ptrdiff_t>(stride));
  }
  std::vector<uint8_t> idat;
  if (!Deflate(raw, compression_level, &idat, error)) {
    return false;
  }

  png->clear();
  png->reserve(idat.size() + 64U);
  png->insert(png->end(), kPngSignature.begin(), kPngSignature.end());
  std::vector<uint8_t> ihdr;
  AppendU32Be(&ihdr, static_cast<uint32_t>(width));
  AppendU32Be(&ihdr, static_cast<uint32_t>(height));
  ihdr.insert(ihdr.end(), {8U, 2U, 0U, 0U, 0U});
  AppendChunk(png, "IHDR", ihdr.data(), ihdr.size());
  AppendChunk(png, "IDAT", idat.data(), idat.size());
  AppendChunk(png, "IEND", nullptr, 0U);
  return true;
}

bool WritePngRgb8(const std::filesystem::path& path, int width, int height, const std::vector<uint8_t>& rgb,
                  int compression_level, std::string* error) {
  std::vector<uint8_t> png;
  if (!EncodePngRgb8(width, height, rgb, compression_level, &png, error)) {
    return false;
  }
  return WriteFileAtomically(path, png, error);
}

bool WritePngFrame(const std::filesystem::path& path, const core::Frame& frame, std::string* error) {
  return WritePngRgb8(path, frame.width, frame.height, frame.rgb, kDefaultPngCompression, error);
}

std::filesystem::path SequenceFramePath(const std::filesystem::path& directory, int64_t index) {
  char name[32];
  std::snprintf(name, sizeof(name), "frame_%06lld.png", static_cast<long long>(index));
  return directory / name;
}

core::FrameSink MakePngSequenceSink(const std::filesystem::path& directory, int compression_level) {
  return [directory, compression_level](const core::Frame& frame, std::string* error) {
    return WritePngRgb8(SequenceFramePath(directory, frame.index), frame.width, frame.height, frame.rgb,
                        compression_level, error);
  };
}

}  // namespace strata::io
