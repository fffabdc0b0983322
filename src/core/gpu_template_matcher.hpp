/**
 * @file    gpu_template_matcher.hpp
 * @brief   CUDA template matcher
 * @author  AllenK (Kwyshell)
 * @license MIT
 *
 * @details
 * Same contract as CpuTemplateMatcher: identical candidates, scores,
 * threshold and early stop. Candidates are uploaded once in prepare()
 * and matched one template at a time on the default stream.
 *
 * Built against OpenCV's cudaimgproc module when it is present
 * (HAVE_OPENCV_CUDAIMGPROC); otherwise is_available() returns false and
 * create_matcher() never selects it.
 */

#pragma once

#include "core/template_matcher.hpp"

#include <opencv2/core.hpp>
#include <opencv2/opencv_modules.hpp>

#ifdef HAVE_OPENCV_CUDAIMGPROC
#include <opencv2/core/cuda.hpp>
#include <opencv2/cudaimgproc.hpp>
#endif

#include <vector>

namespace cre {

class GpuTemplateMatcher final : public ITemplateMatcher {
public:
    explicit GpuTemplateMatcher(const MatcherConfig& config);

    /**
     * True when OpenCV was built with CUDA and a device is present
     */
    [[nodiscard]] static bool is_available() noexcept;

    void prepare(const TemplateLibrary& templates, const std::vector<double>& scales) override;

    [[nodiscard]] std::optional<MatchResult> match(
        const cv::Mat& search_gray,
        double threshold) const override;

    [[nodiscard]] std::string_view name() const noexcept override { return "gpu"; }
    [[nodiscard]] std::size_t candidate_count() const noexcept override { return m_candidates.size(); }

private:
    MatchMethod m_method;
    double m_early_stop;
    std::vector<ScaledTemplate> m_candidates;

#ifdef HAVE_OPENCV_CUDAIMGPROC
    std::vector<cv::cuda::GpuMat> m_gpu_templates;
#endif
};

}  // namespace cre
