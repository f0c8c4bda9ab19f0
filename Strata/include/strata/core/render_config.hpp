#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace strata::core {

enum class VisualStyle {
  kClassic,
  kEnergy,
  kGradient,
};

struct RenderConfig {
  int width = 1080;
  int height = 1920;
  int fps = 30;
  VisualStyle style = VisualStyle::kClassic;
  bool enhanced_effects = false;
  uint64_t seed = 0;
  int max_parallel_jobs = 0;
  std::optional<std::filesystem::path> font_path;
  std::string fallback_title;
};

inline const char* VisualStyleName(VisualStyle style) {
  switch (style) {
    case VisualStyle::kClassic:
      return "classic";
    case VisualStyle::kEnergy:
      return "energy";
    case VisualStyle::kGradient:
      return "gradient";
  }
  return "unknown";
}

inline std::optional<VisualStyle> ParseVisualStyle(const std::string& name) {
  if (name == "classic") {
    return VisualStyle::kClassic;
  }
  if (name == "energy") {
    return VisualStyle::kEnergy;
  }
  if (name == "gradient") {
    return VisualStyle::kGradient;
  }
  return std::nullopt;
}

}  // namespace strata::core
