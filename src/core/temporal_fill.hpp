/**
 * @file    temporal_fill.hpp
 * @brief   Fill masked pixels from neighbouring frames of the same scene
 * @author  AllenK (Kwyshell)
 * @license MIT
 *
 * @details
 * Donor frames are searched backward, then forward, up to
 * max_search_frames away. A donor counts only if its scene similarity to
 * the target is at least scene_threshold; it contributes the still-missing
 * pixels that are not masked in its own cached mask.
 *
 * Scene similarity on 128x72 downscales:
 *
 *   hc = clamp(correl(HSV H-S histogram 16x16, min-max normalized), 0, 1)
 *   gs = clamp(1 - gain * mse(gray blurred 5x5) / 255^2, 0, 1)
 *   s  = clamp(w_hist * hc + w_gray * gs, 0, 1)
 */

#pragma once

#include "core/artifact_cache.hpp"
#include "core/engine_config.hpp"
#include "core/frame_source.hpp"

#include <opencv2/core.hpp>

#include <optional>

namespace cre {

/**
 * Downscaled gray image and color histogram of a frame
 */
struct SceneDescriptor {
    cv::Mat gray;               // 128x72 CV_8UC1, blurred
    cv::Mat hist;               // 16x16 CV_32F, min-max normalized
};

[[nodiscard]] SceneDescriptor describe_scene(const cv::Mat& bgr);

/**
 * Similarity of two scenes in [0, 1]
 */
[[nodiscard]] double scene_similarity(
    const SceneDescriptor& a,
    const SceneDescriptor& b,
    const TemporalConfig& config = {});

[[nodiscard]] double scene_similarity(
    const cv::Mat& a_bgr,
    const cv::Mat& b_bgr,
    const TemporalConfig& config = {});

/**
 * Temporal fill output
 */
struct TemporalFillResult {
    cv::Mat image;              // BGR, residual already inpainted
    int donors_used{0};
    int pixels_requested{0};
    int pixels_filled{0};       // From donors
    int residual_pixels{0};     // Left for the classical inpaint
};

class TemporalFillEngine {
public:
    /**
     * @param source  Donor frames
     * @param cache   Donor masks (pixels masked in a donor are not copied)
     */
    TemporalFillEngine(IFrameSource& source, const ArtifactCache& cache, const TemporalConfig& config);

    /**
     * Fill the masked pixels of a frame
     *
     * @return std::nullopt when no donor contributed; the caller then
     *         inpaints the whole mask. An empty mask gives the frame back.
     */
    [[nodiscard]] std::optional<TemporalFillResult> fill(
        int frame_index,
        const cv::Mat& frame_bgr,
        const cv::Mat& mask) const;

private:
    IFrameSource& m_source;
    const ArtifactCache& m_cache;
    TemporalConfig m_config;
};

}  // namespace cre
