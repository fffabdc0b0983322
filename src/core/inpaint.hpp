/**
 * @file    inpaint.hpp
 * @brief   Classical single-frame inpaint (fallback path)
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#pragma once

#include "core/engine_config.hpp"

#include <opencv2/core.hpp>

namespace cre {

/**
 * Fill the masked region of a frame from its own surroundings
 *
 * Telea or Navier-Stokes via cv::inpaint. InpaintMethod::Temporal has no
 * single-frame meaning and runs Telea.
 *
 * @param frame   BGR frame
 * @param mask    CV_8UC1, non-zero = fill; resized (nearest) if its size differs
 * @param method  Algorithm
 * @param radius  Neighbourhood radius in px, at least 1
 * @return        New frame; a copy of the input when the mask is empty
 * @throws std::runtime_error on an empty frame
 */
[[nodiscard]] cv::Mat inpaint(
    const cv::Mat& frame,
    const cv::Mat& mask,
    InpaintMethod method,
    int radius);

/**
 * Binarize a mask to 0/255 CV_8UC1 at the given size
 */
[[nodiscard]] cv::Mat normalize_mask(const cv::Mat& mask, const cv::Size& size);

}  // namespace cre
