/**
 * @file    template_matcher.hpp
 * @brief   Multi-scale template matching (CPU / GPU)
 * @author  AllenK (Kwyshell)
 * @license MIT
 *
 * @details
 * Every (template, scale) pair is a candidate. Each candidate is scored
 * with normalized cross-correlation against the search image and the best
 * location is kept; the best candidate overall wins.
 *
 *   ccoeff / ccorr:  score = max of the correlation map
 *   sqdiff:          score = 1 - min of the distance map
 *
 * Templates without intensity variance (a solid square) make
 * TM_CCOEFF_NORMED return 1.0 everywhere, so they are always scored with
 * the inverted squared-distance metric.
 *
 * Matchers are interchangeable behind ITemplateMatcher and are picked once
 * by create_matcher().
 */

#pragma once

#include "core/engine_config.hpp"
#include "core/template_library.hpp"

#include <opencv2/core.hpp>

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace cre {

/**
 * Best match of a matcher run
 */
struct MatchResult {
    cv::Rect bbox;              // In search image coordinates
    float score{0.0f};
    std::string template_id;    // "<name>@<scale>"
};

/**
 * One prepared candidate: a template resized to one scale
 */
struct ScaledTemplate {
    std::string name;
    double scale{1.0};
    cv::Mat image;              // CV_8UC1
    bool flat{false};           // No intensity variance
};

/**
 * Resize every template to every scale, dropping results under 3 px a side
 */
[[nodiscard]] std::vector<ScaledTemplate> build_candidates(
    const TemplateLibrary& templates,
    const std::vector<double>& scales);

/**
 * Matcher interface
 */
class ITemplateMatcher {
public:
    virtual ~ITemplateMatcher() = default;

    /**
     * Rebuild the candidate set from the current templates
     */
    virtual void prepare(const TemplateLibrary& templates, const std::vector<double>& scales) = 0;

    /**
     * Best candidate scoring at least threshold, or std::nullopt
     *
     * @param search_gray  CV_8UC1 search image (full frame or ROI)
     * @param threshold    Minimum accepted score
     */
    [[nodiscard]] virtual std::optional<MatchResult> match(
        const cv::Mat& search_gray,
        double threshold) const = 0;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
    [[nodiscard]] virtual std::size_t candidate_count() const noexcept = 0;
};

/**
 * CPU matcher. Candidates are evaluated on OpenCV's thread pool with at
 * most `workers` stripes; sequential mode stops at the first candidate
 * that reaches early_stop_score.
 */
class CpuTemplateMatcher final : public ITemplateMatcher {
public:
    explicit CpuTemplateMatcher(const MatcherConfig& config);

    void prepare(const TemplateLibrary& templates, const std::vector<double>& scales) override;

    [[nodiscard]] std::optional<MatchResult> match(
        const cv::Mat& search_gray,
        double threshold) const override;

    [[nodiscard]] std::string_view name() const noexcept override { return "cpu"; }
    [[nodiscard]] std::size_t candidate_count() const noexcept override { return m_candidates.size(); }

private:
    MatchMethod m_method;
    double m_early_stop;
    bool m_parallel;
    int m_workers;
    std::vector<ScaledTemplate> m_candidates;

    [[nodiscard]] std::optional<MatchResult> evaluate(
        const ScaledTemplate& candidate,
        const cv::Mat& search_gray,
        double threshold) const;
};

/**
 * Create the matcher requested by the configuration
 *
 * Falls back to the CPU matcher when the GPU path is requested but no
 * CUDA device (or no CUDA-enabled OpenCV) is present.
 */
[[nodiscard]] std::unique_ptr<ITemplateMatcher> create_matcher(const MatcherConfig& config);

// =============================================================================
// Frame-level detection (ROI, downscale)
// =============================================================================

struct DetectRequest {
    double threshold{0.85};
    double downscale{1.0};
    double roi_margin{0.75};
    std::optional<cv::Rect> roi_hint;   // Full-resolution box to search around
};

/**
 * Detect the object in a full frame
 *
 * Searches the padded ROI around roi_hint first and the whole frame only
 * if that fails. The returned box is in full-resolution coordinates and
 * clipped to the frame.
 *
 * @param matcher     Prepared matcher
 * @param frame_gray  CV_8UC1 full-resolution frame
 */
[[nodiscard]] std::optional<MatchResult> detect(
    const ITemplateMatcher& matcher,
    const cv::Mat& frame_gray,
    const DetectRequest& request);

/**
 * Padded search window around a box, clipped to the image
 *
 * The box grows by margin * max(w, h) on every side; boxes smaller than
 * 8 px are grown to 8 px first.
 */
[[nodiscard]] cv::Rect roi_around(const cv::Rect& box, const cv::Size& image_size, double margin);

namespace detail {

/**
 * Convert a matchTemplate result into a score and a location
 */
[[nodiscard]] std::pair<double, cv::Point> best_in_map(const cv::Mat& result, int cv_method);

[[nodiscard]] int cv_method_for(MatchMethod method, bool flat_template) noexcept;

[[nodiscard]] std::string candidate_id(const ScaledTemplate& candidate);

}  // namespace detail

}  // namespace cre
