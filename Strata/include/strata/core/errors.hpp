#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace strata::core {

class InvalidAudioError : public std::runtime_error {
 public:
  explicit InvalidAudioError(const std::string& message) : std::runtime_error(message) {}
};

class EncodingError : public std::runtime_error {
 public:
  explicit EncodingError(const std::string& message) : std::runtime_error(message) {}
};

enum class WarningKind {
  kFeatureExtraction,
  kLayerInputMissing,
  kResourceMissing,
};

struct RenderWarning {
  WarningKind kind = WarningKind::kFeatureExtraction;
  std::string message;
};

inline const char* WarningKindName(WarningKind kind) {
  switch (kind) {
    case WarningKind::kFeatureExtraction:
      return "feature_extraction";
    case WarningKind::kLayerInputMissing:
      return "layer_input_missing";
    case WarningKind::kResourceMissing:
      return "resource_missing";
  }
  return "unknown";
}

inline void AddWarning(std::vector<RenderWarning>* warnings, WarningKind kind, std::string message) {
  if (warnings == nullptr) {
    return;
  }
  warnings->push_back({kind, std::move(message)});
}

}  // namespace strata::core
