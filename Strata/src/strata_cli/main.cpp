#include <atomic>
#include <csignal>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "strata/core/audio_features.hpp"
#include "strata/core/concept.hpp"
#include "strata/core/errors.hpp"
#include "strata/core/render_config.hpp"
#include "strata/core/render_job.hpp"
#include "strata/io/audio_reader.hpp"
#include "strata/io/png_writer.hpp"
#include "strata/io/reel_export.hpp"
#include "strata/io/report_writer.hpp"

namespace {

std::atomic<bool> g_interrupted{false};

void HandleInterrupt(int) { g_interrupted.store(true); }

struct RenderArgs {
  std::filesystem::path audio;
  std::filesystem::path out;
  strata::core::Concept reel;
  strata::core::RenderConfig config;
  std::optional<std::filesystem::path> transcript;
  std::optional<std::filesystem::path> report;
  std::optional<std::filesystem::path> poster;
  std::optional<std::filesystem::path> frames_dir;
};

struct AnalyzeArgs {
  std::filesystem::path audio;
  std::optional<std::filesystem::path> report;
};

void PrintUsage() {
  std::cerr << "Usage:\n";
  std::cerr << "  strata render <audio> --out <file.mp4> [--title T] [--intro T] [--hook T] [--development T]\n";
  std::cerr << "                [--climax T] [--closing T] [--hashtag H]... [--transcript <file>]\n";
  std::cerr << "                [--size WxH] [--fps N] [--style classic|energy|gradient] [--enhanced]\n";
  std::cerr << "                [--seed N] [--font <ttf>] [--jobs N] [--report <json>] [--poster <png>]\n";
  std::cerr << "                [--frames-dir <dir>]\n";
  std::cerr << "  strata analyze <audio> [--report <json>]\n";
}

bool ParseInt(const std::string& text, long long min_value, long long* out) {
  if (text.empty()) {
    return false;
  }
  size_t used = 0;
  long long value = 0;
  try {
    value = std::stoll(text, &used);
  } catch (const std::logic_error&) {
    return false;
  }
  if (used != text.size() || value < min_value) {
    return false;
  }
  *out = value;
  return true;
}

bool ParseSize(const std::string& text, int* width, int* height) {
  const size_t x = text.find_first_of("xX");
  if (x == std::string::npos) {
    return false;
  }
  long long w = 0;
  long long h = 0;
  if (!ParseInt(text.substr(0, x), 2, &w) || !ParseInt(text.substr(x + 1), 2, &h) || w > 16384 || h > 16384) {
    return false;
  }
  *width = static_cast<int>(w);
  *height = static_cast<int>(h);
  return true;
}

bool TakeValue(int argc, char** argv, int* i, const std::string& flag, std::string* value, std::string* error) {
  if (*i + 1 >= argc) {
    *error = "Expected value after " + flag;
    return false;
  }
  *value = argv[++*i];
  return true;
}

bool ParseRenderArgs(int argc, char** argv, RenderArgs* args, std::string* error) {
  if (argc < 3) {
    *error = "Missing audio file path.";
    return false;
  }
  args->audio = std::filesystem::path(argv[2]);
  for (int i = 3; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--enhanced") {
      args->config.enhanced_effects = true;
      continue;
    }
    std::string value;
    if (!TakeValue(argc, argv, &i, arg, &value, error)) {
      return false;
    }
    long long number = 0;
    if (arg == "--out") {
      args->out = value;
    } else if (arg == "--title") {
      args->reel.title = value;
    } else if (arg == "--intro") {
      args->reel.story.intro = value;
    } else if (arg == "--hook") {
      args->reel.story.hook_moment = value;
    } else if (arg == "--development") {
      args->reel.story.development = value;
    } else if (arg == "--climax") {
      args->reel.story.climax = value;
    } else if (arg == "--closing") {
      args->reel.story.closing = value;
    } else if (arg == "--hashtag") {
      args->reel.hashtags.push_back(value);
    } else if (arg == "--transcript") {
      args->transcript = value;
    } else if (arg == "--size") {
      if (!ParseSize(value, &args->config.width, &args->config.height)) {
        *error = "Invalid --size '" + value + "', expected WxH";
        return false;
      }
    } else if (arg == "--fps") {
      if (!ParseInt(value, 1, &number) || number > 240) {
        *error = "Invalid --fps '" + value + "'";
        return false;
      }
      args->config.fps = static_cast<int>(number);
    } else if (arg == "--style") {
      const auto style = strata::core::ParseVisualStyle(value);
      if (!style.has_value()) {
        *error = "Unknown --style '" + value + "'";
        return false;
      }
      args->config.style = *style;
    } else if (arg == "--seed") {
      if (!ParseInt(value, 0, &number)) {
        *error = "Invalid --seed '" + value + "'";
        return false;
      }
      args->config.seed = static_cast<uint64_t>(number);
    } else if (arg == "--font") {
      args->config.font_path = std::filesystem::path(value);
    } else if (arg == "--jobs") {
      if (!ParseInt(value, 0, &number) || number > 256) {
        *error = "Invalid --jobs '" + value + "'";
        return false;
      }
      args->config.max_parallel_jobs = static_cast<int>(number);
    } else if (arg == "--report") {
      args->report = value;
    } else if (arg == "--poster") {
      args->poster = value;
    } else if (arg == "--frames-dir") {
      args->frames_dir = value;
    } else {
      *error = "Unknown argument: " + arg;
      return false;
    }
  }
  if (args->out.empty()) {
    *error = "Missing --out <file.mp4>";
    return false;
  }
  return true;
}

bool ParseAnalyzeArgs(int argc, char** argv, AnalyzeArgs* args, std::string* error) {
  if (argc < 3) {
    *error = "Missing audio file path.";
    return false;
  }
  args->audio = std::filesystem::path(argv[2]);
  for (int i = 3; i < argc; ++i) {
    const std::string arg = argv[i];
    std::string value;
    if (arg != "--report") {
      *error = "Unknown argument: " + arg;
      return false;
    }
    if (!TakeValue(argc, argv, &i, arg, &value, error)) {
      return false;
    }
    args->report = value;
  }
  return true;
}

bool ReadTextFile(const std::filesystem::path& path, std::string* text) {
  std::ifstream in(path, std::ios::binary);
  if (!in.is_open()) {
    return false;
  }
  text->assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
  return true;
}

void PrintWarnings(const std::vector<strata::core::RenderWarning>& warnings) {
  for (const auto& warning : warnings) {
    std::cerr << "warning: [" << strata::core::WarningKindName(warning.kind) << "] " << warning.message << "\n";
  }
}

void PrintAnalysis(const strata::core::AudioAnalysis& analysis) {
  std::cout << std::fixed << std::setprecision(2);
  std::cout << "duration: " << analysis.duration_seconds << " s @ " << analysis.sample_rate << " Hz\n";
  std::cout << "tempo: " << analysis.tempo_bpm << " bpm, beats: " << analysis.beat_times.size() << "\n";
  std::cout << "pitch: " << analysis.average_pitch_hz << " Hz, centroid: " << analysis.spectral_centroid_hz
            << " Hz, rms: " << std::setprecision(4) << analysis.average_rms << "\n";
}

int RunAnalyze(int argc, char** argv) {
  AnalyzeArgs args;
  std::string error;
  if (!ParseAnalyzeArgs(argc, argv, &args, &error)) {
    std::cerr << "Argument error: " << error << "\n";
    PrintUsage();
    return 2;
  }

  strata::core::AudioBuffer audio;
  int sample_rate = 0;
  if (!strata::io::ReadAudioFile(args.audio, &audio, &sample_rate, &error)) {
    std::cerr << "error: " << error << "\n";
    return 3;
  }

  std::vector<strata::core::RenderWarning> warnings;
  strata::core::AudioAnalysis analysis;
  try {
    analysis = strata::core::AnalyzeAudio(audio, sample_rate, strata::core::FeatureOptions{}, &warnings);
  } catch (const strata::core::InvalidAudioError& e) {
    std::cerr << "error: invalid audio: " << e.what() << "\n";
    return 4;
  }
  PrintWarnings(warnings);
  PrintAnalysis(analysis);

  if (args.report.has_value() && !strata::io::WriteAnalysisJson(*args.report, analysis, warnings, &error)) {
    std::cerr << "I/O error: " << error << "\n";
    return 6;
  }
  return 0;
}

int RunRender(int argc, char** argv) {
  RenderArgs args;
  std::string error;
  if (!ParseRenderArgs(argc, argv, &args, &error)) {
    std::cerr << "Argument error: " << error << "\n";
    PrintUsage();
    return 2;
  }
  if (args.config.width % 2 != 0 || args.config.height % 2 != 0) {
    std::cerr << "Argument error: --size must be even in both dimensions for H.264 output\n";
    return 2;
  }
  if (args.reel.title.empty()) {
    args.config.fallback_title = args.audio.stem().string();
  }
  if (args.transcript.has_value() && !ReadTextFile(*args.transcript, &args.reel.transcription)) {
    std::cerr << "error: failed to read transcript: " << args.transcript->string() << "\n";
    return 3;
  }

  strata::core::AudioBuffer audio;
  int sample_rate = 0;
  if (!strata::io::ReadAudioFile(args.audio, &audio, &sample_rate, &error)) {
    std::cerr << "error: " << error << "\n";
    return 3;
  }

  std::signal(SIGINT, HandleInterrupt);
  strata::core::ReelRenderOptions options;
  options.config = args.config;
  options.cancel_requested = [] { return g_interrupted.load(); };
  options.progress_callback = [](double pct) {
    std::cerr << "\rrender: " << std::fixed << std::setprecision(1) << pct << "%" << std::flush;
  };

  strata::io::ExportOptions export_options;
  export_options.output_path = args.out;
  export_options.frames_dir = args.frames_dir;
  export_options.capture_poster = args.poster.has_value();

  strata::core::ReelRenderResult result;
  try {
    result = strata::io::ExportReel(audio, sample_rate, args.reel, options, export_options);
  } catch (const strata::core::InvalidAudioError& e) {
    std::cerr << "error: invalid audio: " << e.what() << "\n";
    return 4;
  } catch (const strata::core::EncodingError& e) {
    std::cerr << "\nerror: encoding failed: " << e.what() << "\n";
    return 5;
  }
  std::cerr << "\n";
  PrintWarnings(result.warnings);

  if (args.poster.has_value() && result.snapshot.has_value() &&
      !strata::io::WritePngFrame(*args.poster, *result.snapshot, &error)) {
    std::cerr << "I/O error: " << error << "\n";
    return 6;
  }
  if (args.report.has_value() && !strata::io::WriteRenderReportJson(*args.report, result, &error)) {
    std::cerr << "I/O error: " << error << "\n";
    return 6;
  }

  PrintAnalysis(result.analysis);
  std::cout << "style: " << strata::core::VisualStyleName(args.config.style) << ", layers: " << result.layers.size()
            << "\n";
  std::cout << "frames: " << result.frames_written << "/" << result.frames_total
            << (result.cancelled ? " (cancelled)" : "") << "\n";
  std::cout << "wrote " << args.out.string() << "\n";
  return result.cancelled ? 130 : 0;
}

}  // namespace

int main(int argc, char** argv) {
  if (argc < 2) {
    PrintUsage();
    return 2;
  }

  const std::string command = argv[1];
  try {
    if (command == "render") {
      return RunRender(argc, argv);
    }
    if (command == "analyze") {
      return RunAnalyze(argc, argv);
    }
  } catch (const std::exception& e) {
    std::cerr << "error: " << e.what() << "\n";
    return 6;
  }
  std::cerr << "Unsupported command: " << command << "\n";
  PrintUsage();
  return 2;
}
