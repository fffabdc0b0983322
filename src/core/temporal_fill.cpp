/**
 * @file    temporal_fill.cpp
 * @brief   Temporal fill implementation
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#include "core/temporal_fill.hpp"
#include "core/inpaint.hpp"

#include <opencv2/imgproc.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <stdexcept>

namespace cre {

namespace {

const cv::Size kDescriptorSize(128, 72);

}  // namespace

// =============================================================================
// Scene similarity
// =============================================================================

SceneDescriptor describe_scene(const cv::Mat& bgr) {
    if (bgr.empty()) {
        throw std::runtime_error("Empty image provided");
    }

    cv::Mat color = bgr;
    if (bgr.channels() == 1) {
        cv::cvtColor(bgr, color, cv::COLOR_GRAY2BGR);
    } else if (bgr.channels() == 4) {
        cv::cvtColor(bgr, color, cv::COLOR_BGRA2BGR);
    }

    cv::Mat small;
    cv::resize(color, small, kDescriptorSize, 0, 0, cv::INTER_AREA);

    SceneDescriptor desc;
    cv::cvtColor(small, desc.gray, cv::COLOR_BGR2GRAY);
    cv::GaussianBlur(desc.gray, desc.gray, cv::Size(5, 5), 0);

    cv::Mat hsv;
    cv::cvtColor(small, hsv, cv::COLOR_BGR2HSV);

    const int channels[] = {0, 1};
    const int hist_size[] = {16, 16};
    const float h_range[] = {0.0f, 180.0f};
    const float s_range[] = {0.0f, 256.0f};
    const float* ranges[] = {h_range, s_range};
    cv::calcHist(&hsv, 1, channels, cv::Mat(), desc.hist, 2, hist_size, ranges);
    cv::normalize(desc.hist, desc.hist, 0.0, 1.0, cv::NORM_MINMAX);

    return desc;
}

double scene_similarity(const SceneDescriptor& a, const SceneDescriptor& b, const TemporalConfig& config) {
    const double hc = std::clamp(cv::compareHist(a.hist, b.hist, cv::HISTCMP_CORREL), 0.0, 1.0);

    cv::Mat diff;
    cv::absdiff(a.gray, b.gray, diff);
    diff.convertTo(diff, CV_32F);
    const double mse = cv::mean(diff.mul(diff))[0];
    const double nmse = mse / (255.0 * 255.0);
    const double gs = std::clamp(1.0 - nmse * config.gray_mse_gain, 0.0, 1.0);

    return std::clamp(config.hist_weight * hc + config.gray_weight * gs, 0.0, 1.0);
}

double scene_similarity(const cv::Mat& a_bgr, const cv::Mat& b_bgr, const TemporalConfig& config) {
    return scene_similarity(describe_scene(a_bgr), describe_scene(b_bgr), config);
}

// =============================================================================
// TemporalFillEngine
// =============================================================================

TemporalFillEngine::TemporalFillEngine(
    IFrameSource& source,
    const ArtifactCache& cache,
    const TemporalConfig& config)
    : m_source(source)
    , m_cache(cache)
    , m_config(config) {}

std::optional<TemporalFillResult> TemporalFillEngine::fill(
    int frame_index,
    const cv::Mat& frame_bgr,
    const cv::Mat& mask) const
{
    if (frame_bgr.empty()) {
        throw std::runtime_error("Empty image provided");
    }

    auto start_time = std::chrono::high_resolution_clock::now();

    TemporalFillResult result;
    result.image = frame_bgr.clone();

    cv::Mat to_fill = normalize_mask(mask, frame_bgr.size());
    int remaining = cv::countNonZero(to_fill);
    result.pixels_requested = remaining;
    if (remaining == 0) {
        return result;
    }

    const SceneDescriptor reference = describe_scene(frame_bgr);

    auto try_donor = [&](int donor_index) {
        auto donor = m_source.read_frame(donor_index);
        if (!donor || donor->size() != frame_bgr.size() || donor->type() != frame_bgr.type()) {
            return;
        }

        const double sim = scene_similarity(reference, describe_scene(*donor), m_config);
        if (sim < m_config.scene_threshold) {
            return;
        }

        // Copy only where still needed and valid in the donor
        cv::Mat select = to_fill.clone();
        if (auto donor_mask = m_cache.load_mask(donor_index)) {
            select.setTo(0, normalize_mask(*donor_mask, frame_bgr.size()));
        }

        const int count = cv::countNonZero(select);
        if (count == 0) {
            return;
        }

        donor->copyTo(result.image, select);
        to_fill.setTo(0, select);
        remaining -= count;
        ++result.donors_used;

        spdlog::debug("temporal fill {}: donor {} (sim={:.3f}) gave {} px, {} left",
                      frame_index, donor_index, sim, count, remaining);
    };

    const int max_search = std::max(0, m_config.max_search_frames);

    for (int k = 1; k <= max_search && remaining > 0; ++k) {
        const int j = frame_index - k;
        if (j < 0) break;
        try_donor(j);
    }

    for (int k = 1; k <= max_search && remaining > 0; ++k) {
        const int j = frame_index + k;
        if (j >= m_source.frame_count()) break;
        try_donor(j);
    }

    if (result.donors_used == 0) {
        spdlog::debug("temporal fill {}: no donor within {} frames", frame_index, max_search);
        return std::nullopt;
    }

    result.pixels_filled = result.pixels_requested - remaining;
    result.residual_pixels = remaining;

    if (remaining > 0) {
        result.image = inpaint(result.image, to_fill, InpaintMethod::Telea, m_config.residual_radius);
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::high_resolution_clock::now() - start_time).count();
    spdlog::debug("temporal fill {}: {} donors, {}/{} px, residual {} in {} us",
                  frame_index, result.donors_used, result.pixels_filled,
                  result.pixels_requested, result.residual_pixels, elapsed);

    return result;
}

}  // namespace cre
