/**
 * @file    cli_app.cpp
 * @brief   CLI Application Implementation
 * @author  AllenK (Kwyshell)
 * @license MIT
 *
 * @details
 * Command-line front end for the cursor removal engine. Every subcommand
 * opens one session on --video, runs one operation and prints a summary.
 * Engine options live on the top-level app and fall through to the
 * subcommands, so they can be given before or after the subcommand name
 * or loaded from a --config file.
 */

#include "cli/cli_app.hpp"
#include "core/artifact_cache.hpp"
#include "core/cursor_session.hpp"
#include "core/engine_config.hpp"
#include "core/frame_source.hpp"
#include "core/types.hpp"
#include "utils/path_formatter.hpp"

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <fmt/core.h>
#include <fmt/color.h>

#include <algorithm>
#include <array>
#include <atomic>
#include <charconv>
#include <csignal>
#include <filesystem>
#include <map>
#include <stdexcept>
#include <string>

#ifdef _WIN32
    #include <windows.h>
#endif

#ifndef CRE_VERSION
    #define CRE_VERSION "0.3.0"
#endif

namespace fs = std::filesystem;

namespace cre::cli {

namespace {

// =============================================================================
// Platform-specific console setup
// =============================================================================

void setup_console() {
#ifdef _WIN32
    SetConsoleOutputCP(CP_UTF8);
    HANDLE hOut = GetStdHandle(STD_OUTPUT_HANDLE);
    if (hOut != INVALID_HANDLE_VALUE) {
        DWORD dwMode = 0;
        if (GetConsoleMode(hOut, &dwMode)) {
            dwMode |= ENABLE_VIRTUAL_TERMINAL_PROCESSING;
            SetConsoleMode(hOut, dwMode);
        }
    }
#endif
}

// =============================================================================
// Banner printing
// =============================================================================

void print_banner() {
    fmt::print(fmt::fg(fmt::color::medium_purple), "  Cursor Removal Tool\n");
    fmt::print(fmt::fg(fmt::color::gray), "  Version: {}\n", CRE_VERSION);
    fmt::print("\n");
}

// =============================================================================
// Ctrl+C cancels the running batch
// =============================================================================

std::atomic<CursorSession*> g_active_session{nullptr};

extern "C" void on_interrupt(int) {
    if (CursorSession* session = g_active_session.load()) {
        session->cancel_batch();
    }
}

class InterruptGuard {
public:
    explicit InterruptGuard(CursorSession& session) {
        g_active_session.store(&session);
        m_previous = std::signal(SIGINT, on_interrupt);
    }
    ~InterruptGuard() {
        std::signal(SIGINT, m_previous);
        g_active_session.store(nullptr);
    }

    InterruptGuard(const InterruptGuard&) = delete;
    InterruptGuard& operator=(const InterruptGuard&) = delete;

private:
    void (*m_previous)(int){SIG_DFL};
};

// =============================================================================
// Result printing
// =============================================================================

constexpr std::array<FrameOutcome, 8> kOutcomes = {
    FrameOutcome::Detected, FrameOutcome::MaskWritten,
    FrameOutcome::Filled, FrameOutcome::FallbackUsed,
    FrameOutcome::Cached, FrameOutcome::SkippedGood,
    FrameOutcome::SkippedNoDetection, FrameOutcome::Failed
};

/**
 * @return exit code for the report (1 if any frame failed)
 */
int print_report(std::string_view title, const BatchReport& report) {
    const std::size_t failed = report.count(FrameOutcome::Failed);

    fmt::print(fmt::fg(fmt::color::green), "\n[OK] {}: {} frames\n", title, report.size());
    for (FrameOutcome outcome : kOutcomes) {
        const std::size_t n = report.count(outcome);
        if (n == 0) continue;
        const auto color = (outcome == FrameOutcome::Failed) ? fmt::color::red : fmt::color::gray;
        fmt::print(fmt::fg(color), "     {:<22}{}\n", to_string(outcome), n);
    }
    if (report.was_cancelled) {
        fmt::print(fmt::fg(fmt::color::yellow), "     cancelled before the last frame\n");
    }

    return (failed > 0 || report.was_cancelled) ? 1 : 0;
}

void print_detection(const DetectionRecord& rec) {
    fmt::print(fmt::fg(fmt::color::green),
        "[OK] Frame {}: bbox ({}, {}, {}x{}) score {:.3f} template '{}' ({})\n",
        rec.frame, rec.bbox.x, rec.bbox.y, rec.bbox.width, rec.bbox.height,
        rec.score, rec.template_id, to_string(rec.source));
}

void print_progress(const SessionProgress& p) {
    auto row = [](std::string_view label, auto value) {
        fmt::print(fmt::fg(fmt::color::gray), "  {:<16}", label);
        fmt::print("{}\n", value);
    };
    row("Frames", p.frame_count);
    row("Detections", p.detections);
    row("Rejected boxes", p.bad_detections);
    row("Good frames", p.good_frames);
    row("Masks", p.masks);
    row("Inpainted", p.inpainted);
}

// =============================================================================
// Option helpers
// =============================================================================

int parse_index(std::string_view text) {
    int value = 0;
    const char* first = text.data();
    const char* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || ptr != last || value < 0) {
        throw std::invalid_argument(fmt::format("Invalid frame index '{}'", text));
    }
    return value;
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && s.front() == ' ') s.remove_prefix(1);
    while (!s.empty() && s.back() == ' ') s.remove_suffix(1);
    return s;
}

const std::map<std::string, MatchMethod> kMatchMethods = {
    {"ccoeff", MatchMethod::CcoeffNormed},
    {"ccorr",  MatchMethod::CcorrNormed},
    {"sqdiff", MatchMethod::SqdiffNormed}
};

const std::map<std::string, InpaintMethod> kInpaintMethods = {
    {"telea",    InpaintMethod::Telea},
    {"ns",       InpaintMethod::NavierStokes},
    {"temporal", InpaintMethod::Temporal}
};

}  // anonymous namespace

// =============================================================================
// Public API
// =============================================================================

std::vector<int> parse_frame_list(std::string_view text, int frame_count) {
    std::vector<int> frames;
    text = trim(text);

    if (text.empty() || text == "all") {
        frames.reserve(static_cast<std::size_t>(std::max(frame_count, 0)));
        for (int i = 0; i < frame_count; ++i) frames.push_back(i);
        return frames;
    }

    while (!text.empty()) {
        const std::size_t comma = text.find(',');
        const std::string_view item = trim(text.substr(0, comma));
        text = (comma == std::string_view::npos) ? std::string_view{} : text.substr(comma + 1);

        if (item.empty()) {
            throw std::invalid_argument("Empty item in frame list");
        }

        int first = 0;
        int last = 0;
        const std::size_t dash = item.find('-');
        if (dash == std::string_view::npos) {
            first = last = parse_index(item);
        } else {
            first = parse_index(trim(item.substr(0, dash)));
            last = parse_index(trim(item.substr(dash + 1)));
            if (last < first) {
                throw std::invalid_argument(fmt::format("Reversed frame range '{}'", item));
            }
        }

        last = std::min(last, frame_count - 1);
        for (int i = first; i <= last; ++i) frames.push_back(i);
    }

    std::sort(frames.begin(), frames.end());
    frames.erase(std::unique(frames.begin(), frames.end()), frames.end());
    return frames;
}

int run(int argc, char** argv) {
    setup_console();

    CLI::App app{"Cursor Removal Tool - Detect, mask and inpaint a moving cursor in screen recordings"};
    app.set_version_flag("-V,--version", CRE_VERSION);
    app.set_config("--config", "", "Read options from a TOML/INI file");
    app.require_subcommand(1);
    app.fallthrough();

    EngineConfig config;

    // -------------------------------------------------------------------------
    // Session
    // -------------------------------------------------------------------------
    std::string video_path;
    std::string cache_dir;
    std::string dataset_dir;
    std::string frame_spec;
    bool force = false;

    app.add_option("--video", video_path, "Input video file")
        ->required()
        ->check(CLI::ExistingFile);
    app.add_option("--cache-dir", cache_dir,
        "Parent of cursor_cache/<video-stem>/ (default: the video's directory)");
    app.add_option("--dataset", dataset_dir, "Dataset folder with templates and curated crops")
        ->check(CLI::ExistingDirectory);
    app.add_option("--preset", config.dataset.preset, "Trueform preset name")
        ->capture_default_str();
    app.add_option("--frames", frame_spec, "Frames to process: all, N, a-b or a list (0-9,40)");
    app.add_flag("--force", force, "Recompute cached results");

    // -------------------------------------------------------------------------
    // Matcher
    // -------------------------------------------------------------------------
    app.add_option("--threshold", config.matcher.threshold, "Minimum match score")
        ->check(CLI::Range(0.0, 1.0))
        ->capture_default_str();
    app.add_option("--scales", config.matcher.scales, "Template scales (comma separated)")
        ->delimiter(',')
        ->check(CLI::PositiveNumber)
        ->capture_default_str();
    app.add_option("--method", config.matcher.method, "Match metric: ccoeff, ccorr or sqdiff")
        ->transform(CLI::CheckedTransformer(kMatchMethods, CLI::ignore_case));
    app.add_option("--early-stop", config.matcher.early_stop_score, "Stop searching at this score")
        ->check(CLI::Range(0.0, 1.0))
        ->capture_default_str();
    app.add_option("--downscale", config.matcher.detect_downscale, "Search resolution factor")
        ->check(CLI::Range(0.1, 1.0))
        ->capture_default_str();
    app.add_option("--roi-margin", config.matcher.roi_margin, "ROI padding relative to the box size")
        ->check(CLI::NonNegativeNumber)
        ->capture_default_str();
    app.add_option("--workers", config.matcher.workers, "Matching threads (0 = OpenCV default)")
        ->check(CLI::NonNegativeNumber);
    bool serial = false;
    app.add_flag("--serial", serial, "Evaluate template candidates on one thread");
    app.add_flag("--gpu", config.matcher.use_gpu, "Use the CUDA matcher when available");

    // -------------------------------------------------------------------------
    // Mask / inpaint
    // -------------------------------------------------------------------------
    app.add_option("--iou", config.store.iou_reject_threshold, "IoU above which a rejected box suppresses a detection")
        ->check(CLI::Range(0.0, 1.0))
        ->capture_default_str();
    app.add_option("--dilation", config.mask.dilation, "Mask dilation kernel in pixels")
        ->check(CLI::Range(0, 101))
        ->capture_default_str();
    bool no_trueform = false;
    app.add_flag("--no-trueform", no_trueform, "Always use the dilated rectangle mask");
    app.add_option("--inpaint", config.inpaint.method, "Inpaint method: telea, ns or temporal")
        ->transform(CLI::CheckedTransformer(kInpaintMethods, CLI::ignore_case));
    app.add_option("--radius", config.inpaint.radius, "Classical inpaint radius")
        ->check(CLI::Range(1, 50))
        ->capture_default_str();
    app.add_option("--max-search", config.temporal.max_search_frames, "Temporal donor search distance in frames")
        ->check(CLI::Range(1, 100000))
        ->capture_default_str();
    app.add_option("--scene-threshold", config.temporal.scene_threshold, "Minimum donor scene similarity")
        ->check(CLI::Range(0.0, 1.0))
        ->capture_default_str();
    app.add_option("--guide-width", config.dataset.guide_crop_width, "Guided box width")
        ->check(CLI::Range(8, 4096))
        ->capture_default_str();
    app.add_option("--guide-height", config.dataset.guide_crop_height, "Guided box height")
        ->check(CLI::Range(8, 4096))
        ->capture_default_str();
    bool no_save_crops = false;
    app.add_flag("--no-save-crops", no_save_crops, "Do not add guided crops to the dataset");

    // -------------------------------------------------------------------------
    // Verbosity
    // -------------------------------------------------------------------------
    bool verbose = false;
    bool quiet = false;
    app.add_flag("-v,--verbose", verbose, "Enable verbose output");
    app.add_flag("-q,--quiet", quiet, "Suppress all output except errors");

    // -------------------------------------------------------------------------
    // Subcommands
    // -------------------------------------------------------------------------
    auto* cmd_detect = app.add_subcommand("detect", "Detect the cursor on the selected frames");
    auto* cmd_masks = app.add_subcommand("masks", "Write masks for the selected frames");
    auto* cmd_inpaint = app.add_subcommand("inpaint", "Inpaint the selected frames");

    int frame = 0;
    std::vector<int> bbox;
    auto* cmd_reject = app.add_subcommand("reject", "Reject a box on a frame");
    cmd_reject->add_option("--frame", frame, "Frame index")->required()->check(CLI::NonNegativeNumber);
    cmd_reject->add_option("--bbox", bbox, "Rejected box x,y,w,h")
        ->required()
        ->expected(4)
        ->delimiter(',');

    auto* cmd_good = app.add_subcommand("mark-good", "Mark a frame as cursor-free");
    cmd_good->add_option("--frame", frame, "Frame index")->required()->check(CLI::NonNegativeNumber);

    auto* cmd_ungood = app.add_subcommand("unmark-good", "Remove a cursor-free mark");
    cmd_ungood->add_option("--frame", frame, "Frame index")->required()->check(CLI::NonNegativeNumber);

    std::vector<int> point;
    auto* cmd_guide = app.add_subcommand("guide", "Place a detection centred on a point");
    cmd_guide->add_option("--frame", frame, "Frame index")->required()->check(CLI::NonNegativeNumber);
    cmd_guide->add_option("--point", point, "Cursor position x,y")
        ->required()
        ->expected(2)
        ->delimiter(',');

    auto* cmd_trueform = app.add_subcommand("build-trueform", "Build trueforms from the dataset crops");

    int harvest_step = 3;
    int harvest_max = 200;
    auto* cmd_harvest = app.add_subcommand("harvest", "Save detected crops to the dataset");
    cmd_harvest->add_option("--step", harvest_step, "Frame step")->check(CLI::Range(1, 100000))->capture_default_str();
    cmd_harvest->add_option("--max", harvest_max, "Maximum number of crops")->check(CLI::Range(1, 100000))->capture_default_str();

    std::string output_path;
    auto* cmd_export_masks = app.add_subcommand("export-masks", "Write the mask video");
    cmd_export_masks->add_option("-o,--output", output_path, "Output video file")->required();

    auto* cmd_export_inpaint = app.add_subcommand("export-inpaint", "Write the inpainted video");
    cmd_export_inpaint->add_option("-o,--output", output_path, "Output video file")->required();

    int from_frame = -1;
    auto* cmd_next = app.add_subcommand("next-missing", "Find the next frame without a detection");
    cmd_next->add_option("--from", from_frame, "Start after this frame");

    auto* cmd_status = app.add_subcommand("status", "Show cache progress");

    // Parse arguments
    CLI11_PARSE(app, argc, argv);

    // Configure logging
    auto logger = spdlog::get("cre");
    if (!logger) {
        logger = spdlog::stdout_color_mt("cre");
    }
    spdlog::set_default_logger(logger);

    if (quiet) {
        spdlog::set_level(spdlog::level::err);
    } else if (verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else {
        spdlog::set_level(spdlog::level::info);
    }

    if (!quiet) {
        print_banner();
    }

    config.matcher.parallel = !serial;
    config.mask.use_trueform = !no_trueform;
    config.dataset.save_guided_crops = !no_save_crops;
    config.dataset.folder = dataset_dir;
    config.cache_parent = cache_dir;

    try {
        const fs::path video(video_path);
        VideoFrameSource source(video);
        spdlog::info("Video: {} ({} frames, {}x{}, {:.2f} fps)",
            video.filename(), source.frame_count(), source.width(), source.height(), source.fps());

        CursorSession session(source, ArtifactCache::root_for(video, config.cache_parent), config);
        spdlog::info("Matcher: {}, {} templates, {} trueforms",
            session.matcher_name(), session.templates().size(), session.trueforms().size());

        auto selected_frames = [&]() {
            std::vector<int> frames = parse_frame_list(frame_spec, source.frame_count());
            if (frames.empty()) {
                throw std::invalid_argument(fmt::format("No frames selected by '{}'", frame_spec));
            }
            return frames;
        };

        if (*cmd_detect) {
            InterruptGuard guard(session);
            return print_report("Detection", session.compute_all_detections(selected_frames(), force));
        }
        if (*cmd_masks) {
            InterruptGuard guard(session);
            return print_report("Masks", session.compute_all_masks(selected_frames(), force));
        }
        if (*cmd_inpaint) {
            InterruptGuard guard(session);
            spdlog::info("Inpaint method: {}", to_string(config.inpaint.method));
            return print_report("Inpaint", session.compute_all_inpaint(selected_frames(), force));
        }
        if (*cmd_reject) {
            if (frame >= source.frame_count()) {
                spdlog::error("Frame {} is out of range", frame);
                return 1;
            }
            const cv::Rect box(bbox[0], bbox[1], bbox[2], bbox[3]);
            if (box.width <= 0 || box.height <= 0) {
                spdlog::error("Rejected box must have a positive size");
                return 1;
            }
            session.reject(frame, box);
            fmt::print(fmt::fg(fmt::color::green), "[OK] Rejected ({}, {}, {}x{}) on frame {}\n",
                box.x, box.y, box.width, box.height, frame);
            return 0;
        }
        if (*cmd_good) {
            if (frame >= source.frame_count()) {
                spdlog::error("Frame {} is out of range", frame);
                return 1;
            }
            session.mark_good(frame);
            fmt::print(fmt::fg(fmt::color::green), "[OK] Frame {} marked good\n", frame);
            return 0;
        }
        if (*cmd_ungood) {
            if (session.unmark_good(frame)) {
                fmt::print(fmt::fg(fmt::color::green), "[OK] Frame {} unmarked\n", frame);
            } else {
                fmt::print(fmt::fg(fmt::color::yellow), "Frame {} was not marked good\n", frame);
            }
            return 0;
        }
        if (*cmd_guide) {
            print_detection(session.place_guided(frame, cv::Point(point[0], point[1])));
            return 0;
        }
        if (*cmd_trueform) {
            const std::size_t built = session.build_trueforms();
            if (built == 0) {
                fmt::print(fmt::fg(fmt::color::yellow),
                    "No orientation had two or more crops; nothing built\n");
                return 1;
            }
            fmt::print(fmt::fg(fmt::color::green), "[OK] Built {} trueform(s) for '{}'\n",
                built, config.dataset.preset);
            return 0;
        }
        if (*cmd_harvest) {
            const std::size_t saved = session.harvest_samples(harvest_step, harvest_max);
            fmt::print(fmt::fg(fmt::color::green), "[OK] Harvested {} crop(s) into {}\n",
                saved, config.dataset.folder);
            return 0;
        }
        if (*cmd_export_masks) {
            session.export_mask_video(output_path);
            fmt::print(fmt::fg(fmt::color::green), "[OK] Mask video: {}\n", output_path);
            return 0;
        }
        if (*cmd_export_inpaint) {
            session.export_inpaint_video(output_path);
            fmt::print(fmt::fg(fmt::color::green), "[OK] Inpainted video: {}\n", output_path);
            return 0;
        }
        if (*cmd_next) {
            if (const auto next = session.next_missing_detection(from_frame)) {
                fmt::print("{}\n", *next);
            } else {
                fmt::print(fmt::fg(fmt::color::green), "Every frame has a detection or a good mark\n");
            }
            return 0;
        }
        if (*cmd_status) {
            print_progress(session.progress());
            return 0;
        }

        return 0;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}

}  // namespace cre::cli
