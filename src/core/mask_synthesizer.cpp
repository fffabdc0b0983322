/**
 * @file    mask_synthesizer.cpp
 * @brief   Removal mask implementation
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#include "core/mask_synthesizer.hpp"

#include <opencv2/imgproc.hpp>
#include <spdlog/spdlog.h>

#include <stdexcept>

namespace cre {

cv::Mat rectangle_mask(const cv::Size& frame_size, const cv::Rect& bbox, int dilation) {
    cv::Mat mask = cv::Mat::zeros(frame_size, CV_8UC1);

    const cv::Rect box = bbox & cv::Rect(0, 0, frame_size.width, frame_size.height);
    if (box.empty()) {
        return mask;
    }
    mask(box).setTo(255);

    if (dilation > 0) {
        const cv::Mat kernel = cv::getStructuringElement(
            cv::MORPH_ELLIPSE, cv::Size(dilation, dilation));
        cv::dilate(mask, mask, kernel);
    }
    return mask;
}

cv::Mat MaskSynthesizer::synthesize(
    const cv::Mat& frame_bgr,
    const cv::Rect& bbox,
    const TrueformSet* trueforms,
    std::string_view preset) const
{
    if (frame_bgr.empty()) {
        throw std::runtime_error("Empty image provided");
    }

    if (m_config.use_trueform && trueforms && !trueforms->empty()) {
        if (auto shape = trueforms->mask_for(frame_bgr, bbox, preset)) {
            const cv::Rect box = bbox & cv::Rect(0, 0, frame_bgr.cols, frame_bgr.rows);
            cv::Mat mask = cv::Mat::zeros(frame_bgr.size(), CV_8UC1);
            mask(box).setTo(255, *shape);
            return mask;
        }
        spdlog::debug("No trueform for preset '{}', using rectangle mask", preset);
    }

    return rectangle_mask(frame_bgr.size(), bbox, m_config.dilation);
}

}  // namespace cre
