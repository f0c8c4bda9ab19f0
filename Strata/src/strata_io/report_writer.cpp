#include "strata/io/report_writer.hpp"

#include <cmath>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <string>

namespace strata::io {
namespace {

std::string EscapeJson(const std::string& in) {
  std::ostringstream out;
  for (const char ch : in) {
    switch (ch) {
      case '"':
        out << "\\\"";
        break;
      case '\\':
        out << "\\\\";
        break;
      case '\n':
        out << "\\n";
        break;
      case '\r':
        out << "\\r";
        break;
      case '\t':
        out << "\\t";
        break;
      default:
        if (static_cast<unsigned char>(ch) < 0x20U) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(ch)));
          out << buf;
        } else {
          out << ch;
        }
        break;
    }
  }
  return out.str();
}

// JSON has no NaN or infinity.
double Finite(double value) { return std::isfinite(value) ? value : 0.0; }

bool OpenReport(const std::filesystem::path& path, std::ofstream* out, std::string* error) {
  std::error_code ec;
  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
      if (error != nullptr) {
        *error = "Failed to create directory " + path.parent_path().string() + ": " + ec.message();
      }
      return false;
    }
  }
  out->open(path);
  if (!out->is_open()) {
    if (error != nullptr) {
      *error = "Failed to open JSON file for writing: " + path.string();
    }
    return false;
  }
  *out << std::setprecision(9);
  return true;
}

bool FinishReport(const std::filesystem::path& path, std::ofstream* out, std::string* error) {
  out->close();
  if (!*out) {
    if (error != nullptr) {
      *error = "Failed while writing JSON report: " + path.string();
    }
    return false;
  }
  return true;
}

void WriteAnalysis(std::ofstream& out, const core::AudioAnalysis& a, int indent) {
  const std::string pad(static_cast<size_t>(indent), ' ');
  out << pad << "\"duration_seconds\": " << Finite(a.duration_seconds) << ",\n";
  out << pad << "\"sample_rate\": " << a.sample_rate << ",\n";
  out << pad << "\"tempo_bpm\": " << Finite(a.tempo_bpm) << ",\n";
  out << pad << "\"average_pitch_hz\": " << Finite(a.average_pitch_hz) << ",\n";
  out << pad << "\"spectral_centroid_hz\": " << Finite(a.spectral_centroid_hz) << ",\n";
  out << pad << "\"average_rms\": " << Finite(a.average_rms) << ",\n";
  out << pad << "\"envelope_window_seconds\": " << Finite(a.envelope_window_seconds) << ",\n";
  out << pad << "\"envelope_frames\": " << a.loudness_envelope.size() << ",\n";
  out << pad << "\"beat_count\": " << a.beat_times.size() << ",\n";
  out << pad << "\"beat_times\": [";
  for (size_t i = 0; i < a.beat_times.size(); ++i) {
    out << (i == 0U ? "" : ", ") << Finite(a.beat_times[i]);
  }
  out << "]\n";
}

void WriteWarnings(std::ofstream& out, const std::vector<core::RenderWarning>& warnings) {
  out << "  \"warnings\": [\n";
  for (size_t i = 0; i < warnings.size(); ++i) {
    out << "    {\"kind\": \"" << core::WarningKindName(warnings[i].kind) << "\", \"message\": \""
        << EscapeJson(warnings[i].message) << "\"}";
    if (i + 1 < warnings.size()) {
      out << ",";
    }
    out << "\n";
  }
  out << "  ]\n";
}

}  // namespace

bool WriteRenderReportJson(const std::filesystem::path& path, const core::ReelRenderResult& result,
                           std::string* error) {
  std::ofstream out;
  if (!OpenReport(path, &out, error)) {
    return false;
  }

  out << "{\n";
  out << "  \"analysis\": {\n";
  WriteAnalysis(out, result.analysis, 4);
  out << "  },\n";

  out << "  \"timeline\": [\n";
  for (size_t i = 0; i < result.timeline.segments.size(); ++i) {
    const core::Segment& segment = result.timeline.segments[i];
    out << "    {\"segment\": \"" << core::SegmentName(segment.id) << "\", \"start_seconds\": "
        << Finite(segment.start_seconds) << ", \"end_seconds\": " << Finite(segment.end_seconds) << "}";
    if (i + 1 < result.timeline.segments.size()) {
      out << ",";
    }
    out << "\n";
  }
  out << "  ],\n";

  out << "  \"layers\": [\n";
  for (size_t i = 0; i < result.layers.size(); ++i) {
    const core::LayerSummary& layer = result.layers[i];
    out << "    {\n";
    out << "      \"name\": \"" << EscapeJson(layer.name) << "\",\n";
    out << "      \"kind\": \"" << core::LayerKindName(layer.kind) << "\",\n";
    out << "      \"z_index\": " << layer.z_index << ",\n";
    out << "      \"start_seconds\": " << Finite(layer.start_seconds) << ",\n";
    out << "      \"duration_seconds\": " << Finite(layer.duration_seconds) << ",\n";
    out << "      \"opacity\": " << Finite(layer.opacity) << "\n";
    out << "    }";
    if (i + 1 < result.layers.size()) {
      out << ",";
    }
    out << "\n";
  }
  out << "  ],\n";

  out << "  \"frames_total\": " << result.frames_total << ",\n";
  out << "  \"frames_written\": " << result.frames_written << ",\n";
  out << "  \"cancelled\": " << (result.cancelled ? "true" : "false") << ",\n";
  WriteWarnings(out, result.warnings);
  out << "}\n";
  return FinishReport(path, &out, error);
}

bool WriteAnalysisJson(const std::filesystem::path& path, const core::AudioAnalysis& analysis,
                       const std::vector<core::RenderWarning>& warnings, std::string* error) {
  std::ofstream out;
  if (!OpenReport(path, &out, error)) {
    return false;
  }
  out << "{\n";
  out << "  \"analysis\": {\n";
  WriteAnalysis(out, analysis, 4);
  out << "  },\n";
  WriteWarnings(out, warnings);
  out << "}\n";
  return FinishReport(path, &out, error);
}

}  // namespace strata::io
