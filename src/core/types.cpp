/**
 * @file    types.cpp
 * @brief   Shared type helpers
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#include "core/types.hpp"

namespace cre {

std::optional<DetectionSource> detection_source_from_string(std::string_view text) noexcept {
    if (text == "auto")   return DetectionSource::Auto;
    if (text == "guided") return DetectionSource::Guided;
    if (text == "manual") return DetectionSource::Manual;
    return std::nullopt;
}

std::optional<RejectSource> reject_source_from_string(std::string_view text) noexcept {
    if (text == "bad_click") return RejectSource::BadClick;
    if (text == "auto_good") return RejectSource::AutoGood;
    return std::nullopt;
}

double iou(const cv::Rect& a, const cv::Rect& b) noexcept {
    if (a.width <= 0 || a.height <= 0 || b.width <= 0 || b.height <= 0) {
        return 0.0;
    }
    const double inter = static_cast<double>((a & b).area());
    const double uni = static_cast<double>(a.area()) + static_cast<double>(b.area()) - inter;
    return uni > 0.0 ? inter / uni : 0.0;
}

}  // namespace cre
