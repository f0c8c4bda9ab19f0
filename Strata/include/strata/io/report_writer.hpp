#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "strata/core/audio_features.hpp"
#include "strata/core/errors.hpp"
#include "strata/core/render_job.hpp"

namespace strata::io {

bool WriteRenderReportJson(const std::filesystem::path& path, const core::ReelRenderResult& result,
                           std::string* error);

bool WriteAnalysisJson(const std::filesystem::path& path, const core::AudioAnalysis& analysis,
                       const std::vector<core::RenderWarning>& warnings, std::string* error);

}  // namespace strata::io
