/**
 * @file    template_matcher.cpp
 * @brief   Multi-scale template matching implementation
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#include "core/template_matcher.hpp"
#include "core/gpu_template_matcher.hpp"

#include <opencv2/imgproc.hpp>
#include <spdlog/spdlog.h>
#include <fmt/format.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>

namespace cre {

namespace detail {

int cv_method_for(MatchMethod method, bool flat_template) noexcept {
    if (flat_template) return cv::TM_SQDIFF_NORMED;
    switch (method) {
        case MatchMethod::CcorrNormed:  return cv::TM_CCORR_NORMED;
        case MatchMethod::SqdiffNormed: return cv::TM_SQDIFF_NORMED;
        case MatchMethod::CcoeffNormed:
        default:                        return cv::TM_CCOEFF_NORMED;
    }
}

std::pair<double, cv::Point> best_in_map(const cv::Mat& result, int cv_method) {
    double min_val = 0.0, max_val = 0.0;
    cv::Point min_loc, max_loc;
    cv::minMaxLoc(result, &min_val, &max_val, &min_loc, &max_loc);

    if (cv_method == cv::TM_SQDIFF || cv_method == cv::TM_SQDIFF_NORMED) {
        return {1.0 - min_val, min_loc};
    }
    return {max_val, max_loc};
}

std::string candidate_id(const ScaledTemplate& candidate) {
    return fmt::format("{}@{:.2f}", candidate.name, candidate.scale);
}

}  // namespace detail

// =============================================================================
// Candidate preparation
// =============================================================================

std::vector<ScaledTemplate> build_candidates(
    const TemplateLibrary& templates,
    const std::vector<double>& scales)
{
    std::vector<ScaledTemplate> candidates;
    candidates.reserve(templates.size() * scales.size());

    for (const auto& [name, tmpl] : templates.items()) {
        if (tmpl.empty()) continue;

        for (double s : scales) {
            const int tw = std::max(1, static_cast<int>(tmpl.cols * s));
            const int th = std::max(1, static_cast<int>(tmpl.rows * s));
            if (tw < 3 || th < 3) continue;

            ScaledTemplate c;
            c.name = name;
            c.scale = s;
            if (tw == tmpl.cols && th == tmpl.rows) {
                c.image = tmpl.clone();
            } else {
                cv::resize(tmpl, c.image, cv::Size(tw, th), 0, 0,
                           s > 1.0 ? cv::INTER_LINEAR : cv::INTER_AREA);
            }

            cv::Scalar mean, stddev;
            cv::meanStdDev(c.image, mean, stddev);
            c.flat = stddev[0] < 1e-3;

            candidates.push_back(std::move(c));
        }
    }

    spdlog::debug("Prepared {} match candidates from {} templates x {} scales",
                  candidates.size(), templates.size(), scales.size());
    return candidates;
}

// =============================================================================
// CPU matcher
// =============================================================================

CpuTemplateMatcher::CpuTemplateMatcher(const MatcherConfig& config)
    : m_method(config.method)
    , m_early_stop(config.early_stop_score)
    , m_parallel(config.parallel)
    , m_workers(config.workers) {}

void CpuTemplateMatcher::prepare(const TemplateLibrary& templates, const std::vector<double>& scales) {
    m_candidates = build_candidates(templates, scales);
}

std::optional<MatchResult> CpuTemplateMatcher::evaluate(
    const ScaledTemplate& candidate,
    const cv::Mat& search_gray,
    double threshold) const
{
    if (candidate.image.cols > search_gray.cols || candidate.image.rows > search_gray.rows) {
        return std::nullopt;
    }

    const int method = detail::cv_method_for(m_method, candidate.flat);

    cv::Mat result;
    cv::matchTemplate(search_gray, candidate.image, result, method);
    const auto [score, loc] = detail::best_in_map(result, method);

    if (!std::isfinite(score) || score < threshold) {
        return std::nullopt;
    }

    return MatchResult{
        cv::Rect(loc.x, loc.y, candidate.image.cols, candidate.image.rows),
        static_cast<float>(score),
        detail::candidate_id(candidate)
    };
}

std::optional<MatchResult> CpuTemplateMatcher::match(
    const cv::Mat& search_gray,
    double threshold) const
{
    if (m_candidates.empty() || search_gray.empty()) {
        return std::nullopt;
    }

    const int n = static_cast<int>(m_candidates.size());
    std::vector<std::optional<MatchResult>> results(m_candidates.size());

    if (m_parallel && n > 1) {
        // Bounded pool: OpenCV's workers, split into at most m_workers stripes
        const int workers = m_workers > 0 ? m_workers : std::max(1, cv::getNumThreads());
        const double stripes = static_cast<double>(std::min(n, workers));
        std::atomic<bool> stop{false};

        cv::parallel_for_(cv::Range(0, n), [&](const cv::Range& range) {
            for (int i = range.start; i < range.end; ++i) {
                if (stop.load(std::memory_order_relaxed)) return;
                results[i] = evaluate(m_candidates[i], search_gray, threshold);
                if (results[i] && results[i]->score >= m_early_stop) {
                    stop.store(true, std::memory_order_relaxed);
                }
            }
        }, stripes);
    } else {
        for (int i = 0; i < n; ++i) {
            results[i] = evaluate(m_candidates[i], search_gray, threshold);
            if (results[i] && results[i]->score >= m_early_stop) {
                break;
            }
        }
    }

    // Highest score wins, ties go to the earlier candidate
    std::optional<MatchResult> best;
    for (auto& r : results) {
        if (r && (!best || r->score > best->score)) {
            best = std::move(r);
        }
    }
    return best;
}

std::unique_ptr<ITemplateMatcher> create_matcher(const MatcherConfig& config) {
    if (config.use_gpu) {
        if (GpuTemplateMatcher::is_available()) {
            spdlog::info("Creating GPU template matcher");
            return std::make_unique<GpuTemplateMatcher>(config);
        }
        spdlog::warn("GPU matching requested but no CUDA device is available, using CPU");
    }
    spdlog::debug("Creating CPU template matcher (parallel={})", config.parallel);
    return std::make_unique<CpuTemplateMatcher>(config);
}

// =============================================================================
// Frame-level detection
// =============================================================================

cv::Rect roi_around(const cv::Rect& box, const cv::Size& image_size, double margin) {
    const int w = std::max(8, box.width);
    const int h = std::max(8, box.height);
    const int pad = static_cast<int>(margin * std::max(w, h));

    const int x0 = std::max(0, box.x - pad);
    const int y0 = std::max(0, box.y - pad);
    const int x1 = std::min(image_size.width, box.x + w + pad);
    const int y1 = std::min(image_size.height, box.y + h + pad);

    if (x1 <= x0 || y1 <= y0) return {};
    return {x0, y0, x1 - x0, y1 - y0};
}

std::optional<MatchResult> detect(
    const ITemplateMatcher& matcher,
    const cv::Mat& frame_gray,
    const DetectRequest& request)
{
    if (frame_gray.empty() || matcher.candidate_count() == 0) {
        return std::nullopt;
    }

    auto start_time = std::chrono::high_resolution_clock::now();

    // Search resolution
    const double s = std::clamp(request.downscale, 0.1, 1.0);
    cv::Mat gray_ds;
    if (s != 1.0) {
        const cv::Size dsz(std::max(1, static_cast<int>(frame_gray.cols * s)),
                           std::max(1, static_cast<int>(frame_gray.rows * s)));
        cv::resize(frame_gray, gray_ds, dsz, 0, 0, cv::INTER_AREA);
    } else {
        gray_ds = frame_gray;
    }

    std::optional<MatchResult> result;
    bool from_roi = false;

    // Phase 1: ROI around the hint
    if (request.roi_hint) {
        const cv::Rect& hint = *request.roi_hint;
        const cv::Rect hint_ds(static_cast<int>(hint.x * s), static_cast<int>(hint.y * s),
                               static_cast<int>(hint.width * s), static_cast<int>(hint.height * s));
        const cv::Rect roi = roi_around(hint_ds, gray_ds.size(), request.roi_margin);

        if (roi.width >= 8 && roi.height >= 8) {
            result = matcher.match(gray_ds(roi), request.threshold);
            if (result) {
                result->bbox.x += roi.x;
                result->bbox.y += roi.y;
                from_roi = true;
            }
        }
    }

    // Phase 2: full frame
    if (!result) {
        result = matcher.match(gray_ds, request.threshold);
    }

    if (!result) {
        return std::nullopt;
    }

    // Back to full resolution
    if (s != 1.0) {
        const double inv = 1.0 / s;
        cv::Rect& b = result->bbox;
        b = cv::Rect(static_cast<int>(b.x * inv), static_cast<int>(b.y * inv),
                     static_cast<int>(b.width * inv), static_cast<int>(b.height * inv));
    }
    result->bbox &= cv::Rect(0, 0, frame_gray.cols, frame_gray.rows);

    auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::high_resolution_clock::now() - start_time).count();
    spdlog::debug("detect: ({},{}) {}x{} score={:.3f} tmpl={} via {} in {} us",
                  result->bbox.x, result->bbox.y, result->bbox.width, result->bbox.height,
                  result->score, result->template_id, from_roi ? "roi" : "full frame", elapsed);

    return result;
}

}  // namespace cre
