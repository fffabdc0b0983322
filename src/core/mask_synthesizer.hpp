/**
 * @file    mask_synthesizer.hpp
 * @brief   Removal mask for a detection
 * @author  AllenK (Kwyshell)
 * @license MIT
 *
 * @details
 * Without a trueform the mask is the filled bbox dilated by an elliptical
 * kernel. With trueforms the best matching variant's shape is pasted at
 * the bbox. Both are clipped to the frame.
 */

#pragma once

#include "core/engine_config.hpp"
#include "core/trueform_builder.hpp"

#include <opencv2/core.hpp>

#include <string_view>

namespace cre {

/**
 * Filled rectangle dilated by an elliptical kernel of `dilation` px
 *
 * @return CV_8UC1 0/255 mask of frame_size
 */
[[nodiscard]] cv::Mat rectangle_mask(const cv::Size& frame_size, const cv::Rect& bbox, int dilation);

class MaskSynthesizer {
public:
    explicit MaskSynthesizer(const MaskConfig& config) : m_config(config) {}

    /**
     * Full-frame mask for a detection
     *
     * @param frame_bgr  Source frame (live crop used to pick a trueform variant)
     * @param bbox       Detection box
     * @param trueforms  Loaded trueforms, or nullptr
     * @param preset     Active preset name
     */
    [[nodiscard]] cv::Mat synthesize(
        const cv::Mat& frame_bgr,
        const cv::Rect& bbox,
        const TrueformSet* trueforms,
        std::string_view preset) const;

private:
    MaskConfig m_config;
};

}  // namespace cre
