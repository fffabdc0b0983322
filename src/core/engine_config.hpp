/**
 * @file    engine_config.hpp
 * @brief   Tunable parameters of the cursor removal engine
 * @author  AllenK (Kwyshell)
 * @license MIT
 *
 * @details
 * All thresholds and weights in one place. Defaults reproduce the values
 * the tool has been tuned with; the CLI exposes every field as an option
 * and through its config file.
 */

#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace cre {

/**
 * Template matching metric
 */
enum class MatchMethod {
    CcoeffNormed,   // cv::TM_CCOEFF_NORMED, max is best
    CcorrNormed,    // cv::TM_CCORR_NORMED, max is best
    SqdiffNormed    // cv::TM_SQDIFF_NORMED, scored as 1 - min
};

[[nodiscard]] constexpr std::string_view to_string(MatchMethod method) noexcept {
    switch (method) {
        case MatchMethod::CcoeffNormed: return "ccoeff";
        case MatchMethod::CcorrNormed:  return "ccorr";
        case MatchMethod::SqdiffNormed: return "sqdiff";
        default:                        return "ccoeff";
    }
}

/**
 * Classical single-frame inpaint algorithm, or temporal compositing
 */
enum class InpaintMethod {
    Telea,
    NavierStokes,
    Temporal        // Temporal fill first, Telea for whatever is left
};

[[nodiscard]] constexpr std::string_view to_string(InpaintMethod method) noexcept {
    switch (method) {
        case InpaintMethod::Telea:        return "telea";
        case InpaintMethod::NavierStokes: return "ns";
        case InpaintMethod::Temporal:     return "temporal";
        default:                          return "telea";
    }
}

struct MatcherConfig {
    double threshold{0.85};
    std::vector<double> scales{0.5, 0.75, 1.0, 1.25, 1.5};
    MatchMethod method{MatchMethod::CcoeffNormed};
    double early_stop_score{0.985};
    double detect_downscale{1.0};       // Search resolution, 0.1 .. 1.0
    double roi_margin{0.75};            // ROI padding relative to max(w, h)
    bool parallel{true};
    int workers{0};                     // 0 = cv::getNumThreads()
    bool use_gpu{false};
};

struct StoreConfig {
    double iou_reject_threshold{0.3};
};

struct MaskConfig {
    int dilation{5};                    // Elliptical kernel size in px, 0 = none
    bool use_trueform{true};
};

struct InpaintConfig {
    InpaintMethod method{InpaintMethod::Telea};
    int radius{3};
};

struct TemporalConfig {
    int max_search_frames{120};
    double scene_threshold{0.90};
    double hist_weight{0.6};
    double gray_weight{0.4};
    double gray_mse_gain{10.0};         // Scales normalized MSE before 1 - x
    int residual_radius{2};
};

struct DatasetConfig {
    std::filesystem::path folder;       // Templates + curated crops
    std::string preset{"default_gauntlet"};
    int guide_crop_width{85};
    int guide_crop_height{85};
    bool save_guided_crops{true};
};

/**
 * Complete engine configuration
 */
struct EngineConfig {
    MatcherConfig matcher;
    StoreConfig store;
    MaskConfig mask;
    InpaintConfig inpaint;
    TemporalConfig temporal;
    DatasetConfig dataset;

    // Parent of cursor_cache/<stem>/; empty = the video's directory
    std::filesystem::path cache_parent;
};

}  // namespace cre
