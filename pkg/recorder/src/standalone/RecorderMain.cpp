// Repository: Capkit-recorder
// Component: Standalone Synthetic Recorder
// Purpose: Records a test pattern and sine tones through the full pipeline
//          into a segmented output, for diagnostics.
// Copyright (c) 2025 Capkit
//
// Not a capture application: no devices are opened. The output directory
// receives segment files plus manifest.json exactly as a real recording
// would.

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "capkit/mux/FfmpegEncoders.hpp"
#include "capkit/mux/FragmentedStreamMuxer.hpp"
#include "capkit/mux/Manifest.hpp"
#include "capkit/mux/SegmentedMuxer.hpp"
#include "capkit/mux/SessionRecovery.hpp"
#include "capkit/pipeline/OutputPipeline.hpp"
#include "capkit/pipeline/SyntheticSources.hpp"
#include "capkit/util/Errors.hpp"

namespace {

// =============================================================================
// Global state for signal handling
// =============================================================================
std::atomic<bool> g_termination_requested{false};

void SignalHandler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_termination_requested.store(true, std::memory_order_release);
  }
}

// =============================================================================
// CLI Arguments
// =============================================================================
struct CliArgs {
  std::string output_dir;
  std::string recover_dir;  // --recover: finalize crashed sessions instead of recording
  double duration_secs = 10.0;  // 0 = until SIGINT/SIGTERM
  double segment_secs = 3.0;
  int fps = 30;
  int width = 1280;
  int height = 720;
  int audio_sources = 1;
  bool fragmented = false;
  bool no_video = false;
  bool help = false;
  bool valid = false;
  std::string error;
};

void PrintUsage(const char* program_name) {
  std::cerr << "Usage: " << program_name << " --output DIR [OPTIONS]\n"
            << "       " << program_name << " --recover DIR [--segment-secs SECS]\n"
            << "\n"
            << "Records synthetic video/audio through the recording pipeline.\n"
            << "\n"
            << "OPTIONS:\n"
            << "  --output DIR         Output directory (segments + manifest.json)\n"
            << "  --duration SECS      Recording length (default: 10, 0 = until Ctrl-C)\n"
            << "  --segment-secs SECS  Segment duration (default: 3)\n"
            << "  --fps N              Video frame rate (default: 30)\n"
            << "  --width N            Video width (default: 1280)\n"
            << "  --height N           Video height (default: 720)\n"
            << "  --audio-sources N    Number of sine sources to mix (default: 1)\n"
            << "  --fragmented         Single DASH encode (init.mp4 + segment_NNN.m4s)\n"
            << "  --no-video           Audio-only recording\n"
            << "  --recover DIR        Finalize the unfinished recording in DIR or in its\n"
            << "                       subdirectories, then exit\n"
            << "  --help               Show this help message\n"
            << "\n"
            << "EXAMPLES:\n"
            << "  " << program_name << " --output /tmp/rec --duration 10\n"
            << "  " << program_name << " --output /tmp/rec --no-video --audio-sources 2\n"
            << "  " << program_name << " --output /tmp/rec --fragmented --audio-sources 0\n"
            << "  " << program_name << " --recover /tmp/rec\n"
            << "\n";
}

CliArgs ParseArgs(int argc, char* argv[]) {
  CliArgs args;

  try {
    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];

      if (arg == "--help" || arg == "-h") {
        args.help = true;
        args.valid = true;
        return args;
      } else if (arg == "--output" && i + 1 < argc) {
        args.output_dir = argv[++i];
      } else if (arg == "--recover" && i + 1 < argc) {
        args.recover_dir = argv[++i];
      } else if (arg == "--duration" && i + 1 < argc) {
        args.duration_secs = std::stod(argv[++i]);
      } else if (arg == "--segment-secs" && i + 1 < argc) {
        args.segment_secs = std::stod(argv[++i]);
      } else if (arg == "--fps" && i + 1 < argc) {
        args.fps = std::stoi(argv[++i]);
      } else if (arg == "--width" && i + 1 < argc) {
        args.width = std::stoi(argv[++i]);
      } else if (arg == "--height" && i + 1 < argc) {
        args.height = std::stoi(argv[++i]);
      } else if (arg == "--audio-sources" && i + 1 < argc) {
        args.audio_sources = std::stoi(argv[++i]);
      } else if (arg == "--fragmented") {
        args.fragmented = true;
      } else if (arg == "--no-video") {
        args.no_video = true;
      } else {
        args.error = "Unknown argument: " + arg;
        return args;
      }
    }
  } catch (const std::exception&) {
    args.error = "Invalid numeric argument";
    return args;
  }

  if (!args.recover_dir.empty() && !args.output_dir.empty()) {
    args.error = "--recover and --output are mutually exclusive";
    return args;
  }
  if (args.output_dir.empty() && args.recover_dir.empty()) {
    args.error = "--output or --recover is required";
    return args;
  }
  if (args.duration_secs < 0 || args.segment_secs <= 0) {
    args.error = "--duration must be >= 0 and --segment-secs > 0";
    return args;
  }
  if (args.fps <= 0 || args.width <= 0 || args.height <= 0) {
    args.error = "--fps, --width and --height must be positive";
    return args;
  }
  if (args.audio_sources < 0) {
    args.error = "--audio-sources must be >= 0";
    return args;
  }
  if (args.no_video && args.audio_sources == 0) {
    args.error = "--no-video needs at least one audio source";
    return args;
  }

  args.valid = true;
  return args;
}

void PrintManifestSummary(const std::filesystem::path& dir) {
  capkit::mux::Manifest manifest;
  std::string error;
  if (!capkit::mux::ReadManifestFile(dir / capkit::mux::kManifestFileName, &manifest, &error)) {
    std::cerr << "[RECORDER] Could not read manifest: " << error << "\n";
    return;
  }
  std::cout << "[RECORDER] Manifest: type=" << manifest.type
            << " complete=" << (manifest.is_complete ? "true" : "false")
            << " segments=" << manifest.segments.size();
  if (manifest.total_duration) {
    std::cout << " total=" << std::fixed << std::setprecision(3) << *manifest.total_duration
              << "s";
  }
  std::cout << "\n";
  for (const auto& seg : manifest.segments) {
    std::cout << "  " << seg.path << "  " << std::fixed << std::setprecision(3) << seg.duration
              << "s" << (seg.is_complete ? "" : "  (incomplete)") << "\n";
  }
}

// Returns the process exit code: 0 when every unfinished recording was
// finalized (or none was found), 5 otherwise.
int RunRecovery(const CliArgs& args) {
  capkit::mux::RecoveryOptions options;
  options.nominal_segment_duration_ns = capkit::timing::SecondsToNs(args.segment_secs);

  const auto dirs = capkit::mux::FindIncompleteRecordings(args.recover_dir);
  if (dirs.empty()) {
    std::cout << "[RECORDER] No unfinished recording under " << args.recover_dir << "\n";
    return 0;
  }

  int exit_code = 0;
  for (const auto& dir : dirs) {
    capkit::mux::RecoveryResult result;
    std::string error;
    if (!capkit::mux::RecoverRecording(dir, options, &result, &error)) {
      std::cerr << "[RECORDER] Recovery of " << dir.string() << " failed: " << error << "\n";
      exit_code = 5;
      continue;
    }
    std::cout << "[RECORDER] Recovered " << dir.string() << " (" << result.finalized
              << " pending, " << result.adopted.size() << " adopted)\n";
    PrintManifestSummary(dir);
  }
  return exit_code;
}

}  // namespace

int main(int argc, char* argv[]) {
  CliArgs args = ParseArgs(argc, argv);
  if (args.help) {
    PrintUsage(argv[0]);
    return 0;
  }
  if (!args.valid) {
    std::cerr << "Error: " << args.error << "\n\n";
    PrintUsage(argv[0]);
    return 1;
  }
  if (!args.recover_dir.empty()) {
    return RunRecovery(args);
  }

  std::signal(SIGINT, SignalHandler);
  std::signal(SIGTERM, SignalHandler);

  auto clock = capkit::timing::MakeSystemClock();
  const int64_t segment_ns = capkit::timing::SecondsToNs(args.segment_secs);

  capkit::pipeline::OutputPipelineBuilder builder(args.output_dir);
  builder.WithClock(clock);

  if (!args.no_video) {
    capkit::pipeline::TestPatternConfig pattern;
    pattern.width = args.width;
    pattern.height = args.height;
    pattern.fps_num = args.fps;
    builder.WithVideo(std::make_unique<capkit::pipeline::TestPatternVideoSource>(pattern, clock));
  }

  int audio_sources = args.audio_sources;
  if (args.fragmented && !args.no_video && audio_sources > 0) {
    std::cerr << "[RECORDER] --fragmented carries a single stream; ignoring audio sources\n";
    audio_sources = 0;
  }
  for (int i = 0; i < audio_sources; ++i) {
    capkit::pipeline::SineToneConfig tone;
    tone.name = "sine-" + std::to_string(i + 1);
    tone.frequency_hz = 440.0 * (i + 1);
    builder.WithAudioSource(std::make_unique<capkit::pipeline::SineToneAudioSource>(tone, clock));
  }

  capkit::mux::MuxerFactory factory;
  if (args.fragmented) {
    factory = [segment_ns, clock](const capkit::mux::MuxerSetup& setup)
        -> std::unique_ptr<capkit::mux::IMuxer> {
      capkit::mux::FragmentedMuxerConfig config;
      config.segment_duration_ns = segment_ns;
      return capkit::mux::FragmentedStreamMuxer::Setup(
          config, setup, std::make_unique<capkit::mux::FfmpegDashEncoder>(), clock);
    };
  } else {
    factory = [segment_ns, clock](const capkit::mux::MuxerSetup& setup)
        -> std::unique_ptr<capkit::mux::IMuxer> {
      capkit::mux::SegmentedMuxerConfig config;
      config.segment_duration_ns = segment_ns;
      return capkit::mux::SegmentedMuxer::Setup(
          config, setup, capkit::mux::MakeFfmpegSegmentEncoderFactory(), clock);
    };
  }

  std::unique_ptr<capkit::pipeline::OutputPipeline> pipeline;
  try {
    pipeline = builder.Build(factory);
  } catch (const capkit::SetupError& e) {
    std::cerr << "[RECORDER] Setup failed: " << e.what() << "\n";
    return 2;
  }

  std::cout << "[RECORDER] Recording to " << args.output_dir;
  if (args.duration_secs > 0) std::cout << " for " << args.duration_secs << "s";
  std::cout << " (Ctrl-C to stop)\n";

  const auto start = std::chrono::steady_clock::now();
  const auto limit = std::chrono::duration<double>(args.duration_secs);
  while (!g_termination_requested.load(std::memory_order_acquire)) {
    if (args.duration_secs > 0 && std::chrono::steady_clock::now() - start >= limit) break;
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  int exit_code = 0;
  try {
    capkit::pipeline::FinishedOutputPipeline finished = pipeline->Stop();
    for (const auto& error : finished.errors) {
      std::cerr << "[RECORDER] Stream error: " << error << "\n";
    }
    if (!finished.errors.empty()) exit_code = 4;
    std::cout << "[RECORDER] Frames: video=" << finished.video_frames
              << " audio=" << finished.audio_frames << "\n";
  } catch (const capkit::TimestampInvariantViolation& e) {
    std::cerr << "[RECORDER] Timestamp invariant violated: " << e.what() << "\n";
    exit_code = 3;
  }

  PrintManifestSummary(args.output_dir);
  return exit_code;
}
