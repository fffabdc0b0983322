/**
 * @file    gpu_template_matcher.cpp
 * @brief   CUDA template matcher implementation
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#include "core/gpu_template_matcher.hpp"

#include <opencv2/imgproc.hpp>
#include <spdlog/spdlog.h>

#include <cmath>

namespace cre {

GpuTemplateMatcher::GpuTemplateMatcher(const MatcherConfig& config)
    : m_method(config.method)
    , m_early_stop(config.early_stop_score) {}

bool GpuTemplateMatcher::is_available() noexcept {
#ifdef HAVE_OPENCV_CUDAIMGPROC
    try {
        return cv::cuda::getCudaEnabledDeviceCount() > 0;
    } catch (const cv::Exception& e) {
        spdlog::debug("CUDA probe failed: {}", e.what());
        return false;
    }
#else
    return false;
#endif
}

void GpuTemplateMatcher::prepare(const TemplateLibrary& templates, const std::vector<double>& scales) {
    m_candidates = build_candidates(templates, scales);

#ifdef HAVE_OPENCV_CUDAIMGPROC
    m_gpu_templates.clear();
    m_gpu_templates.reserve(m_candidates.size());
    for (const auto& c : m_candidates) {
        cv::cuda::GpuMat g;
        g.upload(c.image);
        m_gpu_templates.push_back(std::move(g));
    }
    spdlog::debug("Uploaded {} templates to GPU", m_gpu_templates.size());
#endif
}

std::optional<MatchResult> GpuTemplateMatcher::match(
    const cv::Mat& search_gray,
    double threshold) const
{
#ifdef HAVE_OPENCV_CUDAIMGPROC
    if (m_candidates.empty() || search_gray.empty()) {
        return std::nullopt;
    }

    cv::cuda::GpuMat gframe;
    gframe.upload(search_gray);

    // One matcher per metric, created once per frame
    const int primary_method = detail::cv_method_for(m_method, false);
    const int flat_method = detail::cv_method_for(m_method, true);
    cv::Ptr<cv::cuda::TemplateMatching> primary =
        cv::cuda::createTemplateMatching(CV_8U, primary_method);
    cv::Ptr<cv::cuda::TemplateMatching> flat =
        cv::cuda::createTemplateMatching(CV_8U, flat_method);

    std::optional<MatchResult> best;
    cv::cuda::GpuMat gresult;
    cv::Mat result;

    for (std::size_t i = 0; i < m_candidates.size(); ++i) {
        const ScaledTemplate& c = m_candidates[i];
        if (c.image.cols > search_gray.cols || c.image.rows > search_gray.rows) continue;

        const int method = c.flat ? flat_method : primary_method;
        (c.flat ? flat : primary)->match(gframe, m_gpu_templates[i], gresult);
        gresult.download(result);

        const auto [score, loc] = detail::best_in_map(result, method);
        if (!std::isfinite(score) || score < threshold) continue;

        if (!best || score > best->score) {
            best = MatchResult{
                cv::Rect(loc.x, loc.y, c.image.cols, c.image.rows),
                static_cast<float>(score),
                detail::candidate_id(c)
            };
        }
        if (best->score >= m_early_stop) break;
    }
    return best;
#else
    (void)search_gray;
    (void)threshold;
    return std::nullopt;
#endif
}

}  // namespace cre
