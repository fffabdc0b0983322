/**
 * @file    inpaint.cpp
 * @brief   Classical inpaint implementation
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#include "core/inpaint.hpp"

#include <opencv2/imgproc.hpp>
#include <opencv2/photo.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <stdexcept>

namespace cre {

cv::Mat normalize_mask(const cv::Mat& mask, const cv::Size& size) {
    if (mask.empty()) {
        return cv::Mat::zeros(size, CV_8UC1);
    }

    cv::Mat gray = mask;
    if (mask.channels() == 3) {
        cv::cvtColor(mask, gray, cv::COLOR_BGR2GRAY);
    } else if (mask.channels() == 4) {
        cv::cvtColor(mask, gray, cv::COLOR_BGRA2GRAY);
    }
    if (gray.depth() != CV_8U) {
        gray.convertTo(gray, CV_8U);
    }
    if (gray.size() != size) {
        cv::resize(gray, gray, size, 0, 0, cv::INTER_NEAREST);
    }

    cv::Mat binary;
    cv::threshold(gray, binary, 0, 255, cv::THRESH_BINARY);
    return binary;
}

cv::Mat inpaint(const cv::Mat& frame, const cv::Mat& mask, InpaintMethod method, int radius) {
    if (frame.empty()) {
        throw std::runtime_error("Empty image provided");
    }

    const cv::Mat binary = normalize_mask(mask, frame.size());
    if (cv::countNonZero(binary) == 0) {
        return frame.clone();
    }

    auto start_time = std::chrono::high_resolution_clock::now();

    const int flags = method == InpaintMethod::NavierStokes ? cv::INPAINT_NS : cv::INPAINT_TELEA;
    cv::Mat result;
    cv::inpaint(frame, binary, result, std::max(1, radius), flags);

    auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::high_resolution_clock::now() - start_time).count();
    spdlog::debug("inpaint: {} px, method={}, radius={} in {} us",
                  cv::countNonZero(binary), to_string(method), radius, elapsed);
    return result;
}

}  // namespace cre
