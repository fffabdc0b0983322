/**
 * @file    cursor_session.hpp
 * @brief   Per-video annotation session
 * @author  AllenK (Kwyshell)
 * @license MIT
 *
 * @details
 * A session owns every piece of state for one video: the three annotation
 * stores, the artifact cache, the loaded templates and trueforms, and the
 * selected matcher. It is the only writer of the stores.
 *
 * Pipeline per frame:
 *
 *   good frame? --yes--> skip (source frame is the final output)
 *        |no
 *   detect (ROI first) -> drop if rejected -> record
 *        |
 *   synthesize mask (trueform or dilated rect) -> masks/NNNNNN.png
 *        |
 *   temporal fill / classical inpaint -> inpainted/NNNNNN.png
 *
 * Every public operation holds the session mutex for its whole per-frame
 * unit of work. Batch operations lock per frame so corrections from
 * another thread interleave between frames. Cached artifacts are reused
 * unless `force` is set.
 */

#pragma once

#include "core/annotation_store.hpp"
#include "core/artifact_cache.hpp"
#include "core/engine_config.hpp"
#include "core/frame_source.hpp"
#include "core/mask_synthesizer.hpp"
#include "core/template_library.hpp"
#include "core/template_matcher.hpp"
#include "core/temporal_fill.hpp"
#include "core/trueform_builder.hpp"
#include "core/types.hpp"

#include <opencv2/core.hpp>

#include <atomic>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace cre {

// =============================================================================
// Reports
// =============================================================================

/**
 * Per-frame outcomes of a batch operation, in processing order
 */
struct BatchReport {
    std::vector<std::pair<int, FrameOutcome>> frames;
    bool was_cancelled{false};

    void add(int frame, FrameOutcome outcome) { frames.emplace_back(frame, outcome); }

    [[nodiscard]] std::size_t count(FrameOutcome outcome) const noexcept;
    [[nodiscard]] std::optional<FrameOutcome> outcome_for(int frame) const noexcept;
    [[nodiscard]] std::size_t size() const noexcept { return frames.size(); }
};

struct SessionProgress {
    int frame_count{0};
    std::size_t detections{0};
    std::size_t bad_detections{0};
    std::size_t masks{0};
    std::size_t inpainted{0};
    std::size_t good_frames{0};
};

// =============================================================================
// Session
// =============================================================================

class CursorSession {
public:
    /**
     * Open (or create) the session state under cache_root
     *
     * Stores are loaded from disk; the templates and trueforms of
     * config.dataset.folder are loaded when it is set.
     *
     * @throws std::runtime_error if the cache directory cannot be created
     *         or the configured dataset folder does not exist
     */
    CursorSession(IFrameSource& source, std::filesystem::path cache_root, EngineConfig config);

    CursorSession(const CursorSession&) = delete;
    CursorSession& operator=(const CursorSession&) = delete;

    // =========================================================================
    // Dataset
    // =========================================================================

    /**
     * Load templates (grayscale) and the active preset's trueforms from a
     * dataset folder, then rebuild the matcher candidates
     *
     * @return number of templates
     * @throws std::runtime_error if the folder does not exist
     */
    std::size_t load_dataset(const std::filesystem::path& folder);

    /**
     * Replace the templates without touching the dataset folder
     */
    void set_templates(TemplateLibrary templates);

    /**
     * Build, save and activate trueforms for the active preset
     *
     * @return number of trueforms built
     * @throws std::runtime_error if no dataset folder is set
     */
    std::size_t build_trueforms();

    // =========================================================================
    // Per-frame operations
    // =========================================================================

    /**
     * Current detection of a frame
     *
     * Returns the stored record unless force is set; otherwise runs the
     * matcher (ROI around the stored or last box first). A result that
     * overlaps a rejected box is dropped. New results are recorded.
     * Good frames always give std::nullopt.
     */
    std::optional<DetectionRecord> detect(int frame, bool force = false);

    /**
     * Reject a box on a frame
     *
     * Stored detections overlapping the box move to the bad ledger; if
     * none overlapped, the box itself is recorded as bad. The frame's
     * detections, mask and inpainted frame are removed.
     */
    void reject(int frame, const cv::Rect& bbox);

    /**
     * Mark a frame as containing no object
     *
     * Its detections move to the bad ledger (source auto_good) and its
     * mask and inpainted frame are removed.
     */
    void mark_good(int frame);

    /**
     * @return true if the frame was marked
     */
    bool unmark_good(int frame);

    /**
     * Mask of a frame, from the cache or synthesized from its detection
     *
     * @return std::nullopt for good frames and frames without a detection
     */
    std::optional<cv::Mat> synthesize_mask(int frame, bool force = false);

    /**
     * Inpainted frame, from the cache or computed with the configured method
     *
     * A frame without a mask caches its source frame and returns
     * std::nullopt. Good frames are left untouched.
     */
    std::optional<cv::Mat> fill(int frame, bool force = false);

    /**
     * User-placed detection of guide_crop size centered on a point
     *
     * Recorded with source "guided" and score 1.0; the mask is written
     * immediately. The crop is saved to the dataset when one is set.
     *
     * @throws std::runtime_error if the frame cannot be read
     */
    DetectionRecord place_guided(int frame, const cv::Point& point);

    // =========================================================================
    // Batch operations
    // =========================================================================

    BatchReport compute_all_detections(const std::vector<int>& frames, bool force = false);
    BatchReport compute_all_masks(const std::vector<int>& frames, bool force = false);
    BatchReport compute_all_inpaint(const std::vector<int>& frames, bool force = false);

    /**
     * Save padded crops of detections on every step-th frame to the dataset
     *
     * @return number of crops saved
     * @throws std::runtime_error if no dataset folder is set
     */
    std::size_t harvest_samples(int step = 3, int max_samples = 200);

    /**
     * Write the mask of every frame (zero for good frames) to a video
     *
     * Masks are computed in parallel in chunks of 64 frames and written in
     * order. Masks missing from the cache are computed but not stored.
     *
     * @throws std::runtime_error if the writer cannot be opened
     */
    void export_mask_video(const std::filesystem::path& output);

    /**
     * Write the final video: cached inpainted frames, source frames for
     * good frames and frames without an inpainted artifact
     *
     * @throws std::runtime_error if the writer cannot be opened
     */
    void export_inpaint_video(const std::filesystem::path& output);

    /**
     * Request the running batch to stop after the current frame
     */
    void cancel_batch() noexcept { m_cancel_requested.store(true); }

    // =========================================================================
    // Queries
    // =========================================================================

    /**
     * Next frame after `from` (wrapping) with neither a detection nor a good mark
     */
    [[nodiscard]] std::optional<int> next_missing_detection(int from) const;

    [[nodiscard]] SessionProgress progress() const;
    [[nodiscard]] std::vector<int> all_frames() const;

    [[nodiscard]] const EngineConfig& config() const noexcept { return m_config; }
    [[nodiscard]] const ArtifactCache& cache() const noexcept { return m_cache; }
    [[nodiscard]] const DetectionStore& detections() const noexcept { return m_detections; }
    [[nodiscard]] const BadDetectionStore& bad_detections() const noexcept { return m_bad; }
    [[nodiscard]] const GoodFrameRegistry& good_frames() const noexcept { return m_good; }
    [[nodiscard]] const TemplateLibrary& templates() const noexcept { return m_templates; }
    [[nodiscard]] const TrueformSet& trueforms() const noexcept { return m_trueforms; }
    [[nodiscard]] std::string_view matcher_name() const noexcept { return m_matcher->name(); }

private:
    mutable std::mutex m_mutex;
    IFrameSource& m_source;
    EngineConfig m_config;

    ArtifactCache m_cache;
    DetectionStore m_detections;
    BadDetectionStore m_bad;
    GoodFrameRegistry m_good;

    TemplateLibrary m_templates;
    TrueformSet m_trueforms;
    std::unique_ptr<ITemplateMatcher> m_matcher;
    MaskSynthesizer m_mask_synth;
    TemporalFillEngine m_temporal;

    std::optional<cv::Rect> m_last_detection;
    std::atomic<bool> m_cancel_requested{false};

    // All helpers below expect m_mutex to be held

    [[nodiscard]] bool in_range(int frame) const noexcept;
    [[nodiscard]] std::optional<cv::Mat> read_frame(int frame);

    // Matcher only, nothing recorded
    [[nodiscard]] std::optional<MatchResult> run_matcher(
        const cv::Mat& frame_bgr,
        const std::optional<cv::Rect>& roi_hint) const;

    std::optional<DetectionRecord> detect_locked(int frame, const cv::Mat& frame_bgr, bool force);
    FrameOutcome mask_locked(int frame, const cv::Mat& frame_bgr, bool force, cv::Mat* mask_out);
    FrameOutcome fill_locked(int frame, bool force, cv::Mat* image_out);

    // Read-only mask for export: cache, stored detection, then matcher
    [[nodiscard]] cv::Mat export_mask(int frame) const;

    void remove_derived(int frame);
    void reload_dataset_locked();
    std::optional<std::filesystem::path> save_crop(int frame, const cv::Mat& crop) const;
};

}  // namespace cre
