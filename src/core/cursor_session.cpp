/**
 * @file    cursor_session.cpp
 * @brief   Per-video annotation session implementation
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#include "core/cursor_session.hpp"
#include "core/inpaint.hpp"
#include "utils/path_formatter.hpp"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <opencv2/videoio.hpp>
#include <spdlog/spdlog.h>
#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <chrono>
#include <stdexcept>

namespace cre {

namespace fs = std::filesystem;

namespace {

constexpr int kExportChunk = 64;

cv::Mat to_gray(const cv::Mat& bgr) {
    cv::Mat gray;
    if (bgr.channels() == 1) {
        gray = bgr;
    } else {
        cv::cvtColor(bgr, gray, cv::COLOR_BGR2GRAY);
    }
    return gray;
}

int fourcc_for(const fs::path& output) {
    std::string ext = to_utf8(output.extension());
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (ext == ".mp4") return cv::VideoWriter::fourcc('m', 'p', '4', 'v');
    return cv::VideoWriter::fourcc('X', 'V', 'I', 'D');
}

}  // namespace

// =============================================================================
// BatchReport
// =============================================================================

std::size_t BatchReport::count(FrameOutcome outcome) const noexcept {
    return static_cast<std::size_t>(std::count_if(frames.begin(), frames.end(),
        [outcome](const auto& entry) { return entry.second == outcome; }));
}

std::optional<FrameOutcome> BatchReport::outcome_for(int frame) const noexcept {
    for (const auto& [f, outcome] : frames) {
        if (f == frame) return outcome;
    }
    return std::nullopt;
}

// =============================================================================
// Construction / dataset
// =============================================================================

CursorSession::CursorSession(IFrameSource& source, fs::path cache_root, EngineConfig config)
    : m_source(source)
    , m_config(std::move(config))
    , m_cache(std::move(cache_root))
    , m_detections(m_cache.detections_ledger())
    , m_bad(m_cache.bad_detections_ledger())
    , m_good(m_cache.good_frames_file())
    , m_matcher(create_matcher(m_config.matcher))
    , m_mask_synth(m_config.mask)
    , m_temporal(m_source, m_cache, m_config.temporal)
{
    m_detections.load();
    m_bad.load();
    m_good.load();

    if (!m_config.dataset.folder.empty()) {
        reload_dataset_locked();
    }

    spdlog::info("Session {}: {} detections, {} bad, {} good frames, matcher={}",
                 m_cache.root(), m_detections.size(), m_bad.size(), m_good.size(),
                 m_matcher->name());
}

std::size_t CursorSession::load_dataset(const fs::path& folder) {
    std::lock_guard lock(m_mutex);
    m_config.dataset.folder = folder;
    reload_dataset_locked();
    return m_templates.size();
}

void CursorSession::set_templates(TemplateLibrary templates) {
    std::lock_guard lock(m_mutex);
    m_templates = std::move(templates);
    m_matcher->prepare(m_templates, m_config.matcher.scales);
    spdlog::debug("Templates replaced: {} templates, {} candidates",
                  m_templates.size(), m_matcher->candidate_count());
}

void CursorSession::reload_dataset_locked() {
    const fs::path& folder = m_config.dataset.folder;
    m_templates.load_folder(folder);
    m_trueforms.load(folder, m_config.dataset.preset);
    m_matcher->prepare(m_templates, m_config.matcher.scales);

    spdlog::info("Dataset {}: {} templates, {} trueforms, {} match candidates",
                 folder, m_templates.size(), m_trueforms.size(), m_matcher->candidate_count());
}

std::size_t CursorSession::build_trueforms() {
    std::lock_guard lock(m_mutex);
    if (m_config.dataset.folder.empty()) {
        throw std::runtime_error("Dataset folder not set");
    }

    TrueformSet built = cre::build_trueforms(m_config.dataset.folder, m_config.dataset.preset);
    const std::size_t n = built.size();
    if (n > 0) {
        m_trueforms = std::move(built);
    }
    return n;
}

// =============================================================================
// Helpers (lock held)
// =============================================================================

bool CursorSession::in_range(int frame) const noexcept {
    return frame >= 0 && frame < m_source.frame_count();
}

std::optional<cv::Mat> CursorSession::read_frame(int frame) {
    if (!in_range(frame)) {
        spdlog::warn("Frame {} out of range (0..{})", frame, m_source.frame_count() - 1);
        return std::nullopt;
    }
    return m_source.read_frame(frame);
}

std::optional<MatchResult> CursorSession::run_matcher(
    const cv::Mat& frame_bgr,
    const std::optional<cv::Rect>& roi_hint) const
{
    if (m_templates.empty()) {
        spdlog::debug("No templates loaded, detection skipped");
        return std::nullopt;
    }

    DetectRequest request;
    request.threshold = m_config.matcher.threshold;
    request.downscale = m_config.matcher.detect_downscale;
    request.roi_margin = m_config.matcher.roi_margin;
    request.roi_hint = roi_hint;

    return cre::detect(*m_matcher, to_gray(frame_bgr), request);
}

std::optional<DetectionRecord> CursorSession::detect_locked(int frame, const cv::Mat& frame_bgr, bool force) {
    if (m_good.contains(frame)) {
        return std::nullopt;
    }

    const double iou_thr = m_config.store.iou_reject_threshold;
    auto stored = m_detections.current(frame);
    if (stored && !force && !m_bad.is_rejected(frame, stored->bbox, iou_thr)) {
        return stored;
    }

    std::optional<cv::Rect> hint = stored ? std::optional<cv::Rect>(stored->bbox) : m_last_detection;
    auto match = run_matcher(frame_bgr, hint);
    if (!match) {
        spdlog::debug("Frame {}: no match", frame);
        return std::nullopt;
    }

    if (m_bad.is_rejected(frame, match->bbox, iou_thr)) {
        spdlog::info("Frame {}: match overlaps a rejected box, dropped", frame);
        return std::nullopt;
    }
    m_last_detection = match->bbox;

    DetectionRecord rec{frame, match->bbox, match->score, match->template_id, DetectionSource::Auto};
    m_detections.record(rec);

    // Mask and output were derived from the previous box (or from none)
    if (!stored || stored->bbox != rec.bbox) {
        remove_derived(frame);
    }
    return rec;
}

FrameOutcome CursorSession::mask_locked(int frame, const cv::Mat& frame_bgr, bool force, cv::Mat* mask_out) {
    if (m_good.contains(frame)) {
        return FrameOutcome::SkippedGood;
    }

    if (!force) {
        if (auto cached = m_cache.load_mask(frame)) {
            if (mask_out) *mask_out = *cached;
            return FrameOutcome::Cached;
        }
    }

    auto det = detect_locked(frame, frame_bgr, false);
    if (!det) {
        return FrameOutcome::SkippedNoDetection;
    }

    cv::Mat mask = m_mask_synth.synthesize(frame_bgr, det->bbox, &m_trueforms, m_config.dataset.preset);
    m_cache.save_mask(frame, mask);
    if (m_cache.remove_inpaint(frame)) {
        spdlog::debug("Frame {}: new mask, inpainted frame removed", frame);
    }
    if (mask_out) *mask_out = mask;
    return FrameOutcome::MaskWritten;
}

FrameOutcome CursorSession::fill_locked(int frame, bool force, cv::Mat* image_out) {
    if (!force) {
        if (auto cached = m_cache.load_inpaint(frame)) {
            if (image_out) *image_out = *cached;
            return FrameOutcome::Cached;
        }
    }

    auto frame_bgr = read_frame(frame);
    if (!frame_bgr) {
        return FrameOutcome::Failed;
    }

    cv::Mat mask;
    const FrameOutcome mask_outcome = mask_locked(frame, *frame_bgr, false, &mask);
    const bool has_mask = (mask_outcome == FrameOutcome::Cached || mask_outcome == FrameOutcome::MaskWritten)
                          && cv::countNonZero(mask) > 0;

    if (!has_mask) {
        // Cache the source so the frame is not reprocessed
        m_cache.save_inpaint(frame, *frame_bgr);
        if (image_out) *image_out = *frame_bgr;
        return FrameOutcome::SkippedNoDetection;
    }

    const InpaintConfig& ic = m_config.inpaint;
    cv::Mat result;
    FrameOutcome outcome = FrameOutcome::Filled;

    if (ic.method == InpaintMethod::Temporal) {
        if (auto tf = m_temporal.fill(frame, *frame_bgr, mask)) {
            result = std::move(tf->image);
        } else {
            result = inpaint(*frame_bgr, mask, InpaintMethod::Telea, ic.radius);
            outcome = FrameOutcome::FallbackUsed;
        }
    } else {
        result = inpaint(*frame_bgr, mask, ic.method, ic.radius);
    }

    m_cache.save_inpaint(frame, result);
    if (image_out) *image_out = result;
    return outcome;
}

void CursorSession::remove_derived(int frame) {
    if (m_cache.remove_mask(frame)) {
        spdlog::debug("Frame {}: mask removed", frame);
    }
    if (m_cache.remove_inpaint(frame)) {
        spdlog::debug("Frame {}: inpainted frame removed", frame);
    }
}

std::optional<fs::path> CursorSession::save_crop(int frame, const cv::Mat& crop) const {
    const fs::path& folder = m_config.dataset.folder;
    if (folder.empty() || crop.empty()) {
        return std::nullopt;
    }

    const auto ts = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    const fs::path path = folder / fmt::format("cursor_f{:06d}_w{}_h{}_{}.png",
                                               frame, crop.cols, crop.rows, ts);

    if (!cv::imwrite(path.string(), crop)) {
        spdlog::warn("Failed to save crop: {}", path);
        return std::nullopt;
    }
    spdlog::debug("Saved crop: {}", path);
    return path;
}

// =============================================================================
// Per-frame operations
// =============================================================================

std::optional<DetectionRecord> CursorSession::detect(int frame, bool force) {
    std::lock_guard lock(m_mutex);
    if (m_good.contains(frame)) {
        return std::nullopt;
    }

    if (!force) {
        auto stored = m_detections.current(frame);
        if (stored && !m_bad.is_rejected(frame, stored->bbox, m_config.store.iou_reject_threshold)) {
            return stored;
        }
    }

    auto frame_bgr = read_frame(frame);
    if (!frame_bgr) {
        return std::nullopt;
    }
    return detect_locked(frame, *frame_bgr, force);
}

void CursorSession::reject(int frame, const cv::Rect& bbox) {
    std::lock_guard lock(m_mutex);
    const double iou_thr = m_config.store.iou_reject_threshold;

    // Bad ledger first: a failed rewrite must not lose the rejection
    int moved = 0;
    for (const auto& rec : m_detections.records_for(frame)) {
        if (iou(rec.bbox, bbox) > iou_thr) {
            m_bad.append(BadDetectionRecord{frame, rec.bbox, rec.score, rec.template_id, RejectSource::BadClick});
            ++moved;
        }
    }
    if (moved == 0) {
        m_bad.append(BadDetectionRecord{frame, bbox, std::nullopt, std::string{}, RejectSource::BadClick});
    }

    m_detections.remove_frame(frame);
    remove_derived(frame);
    if (m_last_detection && iou(*m_last_detection, bbox) > iou_thr) {
        m_last_detection.reset();
    }

    spdlog::info("Frame {}: rejected ({},{} {}x{}), {} stored detection(s) moved to bad",
                 frame, bbox.x, bbox.y, bbox.width, bbox.height, moved);
}

void CursorSession::mark_good(int frame) {
    std::lock_guard lock(m_mutex);

    m_good.add(frame);
    const std::vector<DetectionRecord> removed = m_detections.records_for(frame);
    for (const auto& rec : removed) {
        m_bad.append(BadDetectionRecord{frame, rec.bbox, rec.score, rec.template_id, RejectSource::AutoGood});
    }
    m_detections.remove_frame(frame);
    remove_derived(frame);

    spdlog::info("Frame {}: marked good, {} detection(s) moved to bad", frame, removed.size());
}

bool CursorSession::unmark_good(int frame) {
    std::lock_guard lock(m_mutex);
    const bool was_marked = m_good.remove(frame);
    if (was_marked) {
        // The cached output of a good frame is its source copy
        m_cache.remove_inpaint(frame);
        spdlog::info("Frame {}: unmarked good", frame);
    } else {
        spdlog::info("Frame {}: was not marked good", frame);
    }
    return was_marked;
}

std::optional<cv::Mat> CursorSession::synthesize_mask(int frame, bool force) {
    std::lock_guard lock(m_mutex);
    if (m_good.contains(frame)) {
        return std::nullopt;
    }

    if (!force) {
        if (auto cached = m_cache.load_mask(frame)) {
            return cached;
        }
    }

    auto frame_bgr = read_frame(frame);
    if (!frame_bgr) {
        return std::nullopt;
    }

    cv::Mat mask;
    const FrameOutcome outcome = mask_locked(frame, *frame_bgr, force, &mask);
    if (outcome == FrameOutcome::SkippedNoDetection || outcome == FrameOutcome::SkippedGood) {
        return std::nullopt;
    }
    return mask;
}

std::optional<cv::Mat> CursorSession::fill(int frame, bool force) {
    std::lock_guard lock(m_mutex);
    if (m_good.contains(frame) || !in_range(frame)) {
        return std::nullopt;
    }

    cv::Mat image;
    const FrameOutcome outcome = fill_locked(frame, force, &image);
    spdlog::debug("Frame {}: fill {}", frame, to_string(outcome));

    if (outcome == FrameOutcome::Failed || outcome == FrameOutcome::SkippedNoDetection) {
        return std::nullopt;
    }
    return image;
}

DetectionRecord CursorSession::place_guided(int frame, const cv::Point& point) {
    std::lock_guard lock(m_mutex);

    auto frame_bgr = read_frame(frame);
    if (!frame_bgr) {
        throw std::runtime_error(fmt::format("Cannot read frame {}", frame));
    }

    const int fw = frame_bgr->cols;
    const int fh = frame_bgr->rows;
    const int cw = std::min(fw, std::max(8, m_config.dataset.guide_crop_width));
    const int ch = std::min(fh, std::max(8, m_config.dataset.guide_crop_height));
    const int x0 = std::clamp(point.x - cw / 2, 0, fw - cw);
    const int y0 = std::clamp(point.y - ch / 2, 0, fh - ch);
    const cv::Rect bbox(x0, y0, cw, ch);

    if (m_good.remove(frame)) {
        spdlog::info("Frame {}: guided placement clears the good mark", frame);
    }

    DetectionRecord rec{frame, bbox, 1.0f, "guided", DetectionSource::Guided};
    m_detections.record(rec);
    m_last_detection = bbox;

    cv::Mat mask = m_mask_synth.synthesize(*frame_bgr, bbox, &m_trueforms, m_config.dataset.preset);
    m_cache.save_mask(frame, mask);
    m_cache.remove_inpaint(frame);

    if (m_config.dataset.save_guided_crops && !m_config.dataset.folder.empty()) {
        if (save_crop(frame, (*frame_bgr)(bbox).clone())) {
            reload_dataset_locked();
        }
    }

    spdlog::info("Frame {}: guided box ({},{} {}x{})", frame, bbox.x, bbox.y, bbox.width, bbox.height);
    return rec;
}

// =============================================================================
// Batch operations
// =============================================================================

BatchReport CursorSession::compute_all_detections(const std::vector<int>& frames, bool force) {
    BatchReport report;
    m_cancel_requested.store(false);
    auto start_time = std::chrono::high_resolution_clock::now();

    for (std::size_t i = 0; i < frames.size(); ++i) {
        if (m_cancel_requested.load()) {
            report.was_cancelled = true;
            break;
        }

        const int fi = frames[i];
        std::lock_guard lock(m_mutex);

        if (m_good.contains(fi)) {
            report.add(fi, FrameOutcome::SkippedGood);
            continue;
        }
        if (!force) {
            auto stored = m_detections.current(fi);
            if (stored && !m_bad.is_rejected(fi, stored->bbox, m_config.store.iou_reject_threshold)) {
                m_last_detection = stored->bbox;
                report.add(fi, FrameOutcome::Cached);
                continue;
            }
        }

        try {
            auto frame_bgr = read_frame(fi);
            if (!frame_bgr) {
                report.add(fi, FrameOutcome::Failed);
                continue;
            }
            auto det = detect_locked(fi, *frame_bgr, force);
            report.add(fi, det ? FrameOutcome::Detected : FrameOutcome::SkippedNoDetection);
        } catch (const cv::Exception& e) {
            spdlog::error("Frame {}: detection failed: {}", fi, e.what());
            report.add(fi, FrameOutcome::Failed);
        }

        if (fi % 100 == 0) {
            spdlog::info("Detections {}/{}", i + 1, frames.size());
        }
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::high_resolution_clock::now() - start_time).count();
    spdlog::info("Detections: {} detected, {} cached, {} without match, {} good, {} failed ({} ms)",
                 report.count(FrameOutcome::Detected), report.count(FrameOutcome::Cached),
                 report.count(FrameOutcome::SkippedNoDetection), report.count(FrameOutcome::SkippedGood),
                 report.count(FrameOutcome::Failed), elapsed / 1000);
    return report;
}

BatchReport CursorSession::compute_all_masks(const std::vector<int>& frames, bool force) {
    BatchReport report;
    m_cancel_requested.store(false);
    auto start_time = std::chrono::high_resolution_clock::now();

    for (std::size_t i = 0; i < frames.size(); ++i) {
        if (m_cancel_requested.load()) {
            report.was_cancelled = true;
            break;
        }

        const int fi = frames[i];
        std::lock_guard lock(m_mutex);

        if (m_good.contains(fi)) {
            report.add(fi, FrameOutcome::SkippedGood);
            continue;
        }
        if (!force && m_cache.has_mask(fi)) {
            report.add(fi, FrameOutcome::Cached);
            continue;
        }

        try {
            auto frame_bgr = read_frame(fi);
            if (!frame_bgr) {
                report.add(fi, FrameOutcome::Failed);
                continue;
            }
            report.add(fi, mask_locked(fi, *frame_bgr, force, nullptr));
        } catch (const cv::Exception& e) {
            spdlog::error("Frame {}: mask failed: {}", fi, e.what());
            report.add(fi, FrameOutcome::Failed);
        }

        if (fi % 100 == 0) {
            spdlog::info("Masks {}/{}", i + 1, frames.size());
        }
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::high_resolution_clock::now() - start_time).count();
    spdlog::info("Masks: {} written, {} cached, {} without detection, {} good, {} failed ({} ms)",
                 report.count(FrameOutcome::MaskWritten), report.count(FrameOutcome::Cached),
                 report.count(FrameOutcome::SkippedNoDetection), report.count(FrameOutcome::SkippedGood),
                 report.count(FrameOutcome::Failed), elapsed / 1000);
    return report;
}

BatchReport CursorSession::compute_all_inpaint(const std::vector<int>& frames, bool force) {
    BatchReport report;
    m_cancel_requested.store(false);
    auto start_time = std::chrono::high_resolution_clock::now();

    spdlog::info("Inpainting {} frames (method={}, radius={})",
                 frames.size(), to_string(m_config.inpaint.method), m_config.inpaint.radius);

    for (std::size_t i = 0; i < frames.size(); ++i) {
        if (m_cancel_requested.load()) {
            report.was_cancelled = true;
            break;
        }

        const int fi = frames[i];
        std::lock_guard lock(m_mutex);

        try {
            if (m_good.contains(fi)) {
                // The final output of a good frame is its source
                if (!m_cache.has_inpaint(fi) || force) {
                    auto frame_bgr = read_frame(fi);
                    if (!frame_bgr) {
                        report.add(fi, FrameOutcome::Failed);
                        continue;
                    }
                    m_cache.save_inpaint(fi, *frame_bgr);
                }
                report.add(fi, FrameOutcome::SkippedGood);
                continue;
            }

            if (!force && m_cache.has_inpaint(fi)) {
                report.add(fi, FrameOutcome::Cached);
                continue;
            }

            report.add(fi, fill_locked(fi, force, nullptr));
        } catch (const cv::Exception& e) {
            spdlog::error("Frame {}: inpaint failed: {}", fi, e.what());
            report.add(fi, FrameOutcome::Failed);
        }

        if (fi % 50 == 0) {
            spdlog::info("Inpaint {}/{}", i + 1, frames.size());
        }
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::high_resolution_clock::now() - start_time).count();
    spdlog::info("Inpaint: {} filled, {} fallback, {} cached, {} without mask, {} good, {} failed ({} ms)",
                 report.count(FrameOutcome::Filled), report.count(FrameOutcome::FallbackUsed),
                 report.count(FrameOutcome::Cached), report.count(FrameOutcome::SkippedNoDetection),
                 report.count(FrameOutcome::SkippedGood), report.count(FrameOutcome::Failed),
                 elapsed / 1000);
    return report;
}

std::size_t CursorSession::harvest_samples(int step, int max_samples) {
    {
        std::lock_guard lock(m_mutex);
        if (m_config.dataset.folder.empty()) {
            throw std::runtime_error("Dataset folder not set");
        }
        if (m_templates.empty()) {
            spdlog::warn("Harvest needs templates; load a dataset first");
            return 0;
        }
    }

    step = std::max(1, step);
    m_cancel_requested.store(false);
    spdlog::info("Harvesting every {} frames (threshold={:.2f})", step, m_config.matcher.threshold);

    std::size_t saved = 0;
    const int total = m_source.frame_count();
    for (int fi = 0; fi < total && static_cast<int>(saved) < max_samples; fi += step) {
        if (m_cancel_requested.load()) break;

        std::lock_guard lock(m_mutex);
        auto frame_bgr = read_frame(fi);
        if (!frame_bgr) continue;

        auto match = run_matcher(*frame_bgr, std::nullopt);
        if (!match || m_bad.is_rejected(fi, match->bbox, m_config.store.iou_reject_threshold)) {
            continue;
        }

        const cv::Rect& b = match->bbox;
        const int pad = static_cast<int>(0.1 * std::max(b.width, b.height));
        const cv::Rect padded = cv::Rect(b.x - pad, b.y - pad, b.width + 2 * pad, b.height + 2 * pad)
                                & cv::Rect(0, 0, frame_bgr->cols, frame_bgr->rows);
        if (padded.empty()) continue;

        if (save_crop(fi, (*frame_bgr)(padded).clone())) {
            ++saved;
            if (saved % 25 == 0) {
                spdlog::info("Harvest: {} crops so far", saved);
            }
        }
    }

    spdlog::info("Harvest done: {} crops saved to {}", saved, m_config.dataset.folder);
    return saved;
}

// =============================================================================
// Exports
// =============================================================================

cv::Mat CursorSession::export_mask(int frame) const {
    const cv::Size size = m_source.frame_size();
    cv::Mat zeros = cv::Mat::zeros(size, CV_8UC1);

    if (m_good.contains(frame)) {
        return zeros;
    }
    if (auto cached = m_cache.load_mask(frame)) {
        return normalize_mask(*cached, size);
    }

    auto frame_bgr = m_source.read_frame(frame);
    if (!frame_bgr) {
        return zeros;
    }

    const double iou_thr = m_config.store.iou_reject_threshold;
    std::optional<cv::Rect> bbox;
    if (auto stored = m_detections.current(frame);
        stored && !m_bad.is_rejected(frame, stored->bbox, iou_thr)) {
        bbox = stored->bbox;
    } else if (auto match = run_matcher(*frame_bgr, std::nullopt);
               match && !m_bad.is_rejected(frame, match->bbox, iou_thr)) {
        bbox = match->bbox;
    }

    if (!bbox) {
        return zeros;
    }
    return normalize_mask(
        m_mask_synth.synthesize(*frame_bgr, *bbox, &m_trueforms, m_config.dataset.preset), size);
}

void CursorSession::export_mask_video(const fs::path& output) {
    const cv::Size size = m_source.frame_size();
    cv::VideoWriter writer(output.string(), fourcc_for(output), m_source.fps(), size, false);
    if (!writer.isOpened()) {
        throw std::runtime_error(fmt::format("Failed to open video writer: {}", output));
    }

    const int total = m_source.frame_count();
    spdlog::info("Writing mask video to {} ({} frames)", output, total);
    auto start_time = std::chrono::high_resolution_clock::now();

    for (int start = 0; start < total; start += kExportChunk) {
        const int end = std::min(total, start + kExportChunk);
        std::vector<cv::Mat> masks(static_cast<std::size_t>(end - start));

        {
            // Stores are only read while the chunk is computed
            std::lock_guard lock(m_mutex);
            cv::parallel_for_(cv::Range(start, end), [&](const cv::Range& range) {
                for (int i = range.start; i < range.end; ++i) {
                    try {
                        masks[i - start] = export_mask(i);
                    } catch (const cv::Exception& e) {
                        spdlog::error("Frame {}: mask export failed: {}", i, e.what());
                        masks[i - start] = cv::Mat::zeros(size, CV_8UC1);
                    }
                }
            });
        }

        for (const auto& mask : masks) {
            writer.write(mask);
        }
        spdlog::info("Mask export {}/{}", end, total);
    }

    writer.release();
    auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::high_resolution_clock::now() - start_time).count();
    spdlog::info("Mask video complete in {} ms", elapsed / 1000);
}

void CursorSession::export_inpaint_video(const fs::path& output) {
    const cv::Size size = m_source.frame_size();
    cv::VideoWriter writer(output.string(), fourcc_for(output), m_source.fps(), size, true);
    if (!writer.isOpened()) {
        throw std::runtime_error(fmt::format("Failed to open video writer: {}", output));
    }

    const int total = m_source.frame_count();
    spdlog::info("Writing inpainted video to {} ({} frames)", output, total);
    auto start_time = std::chrono::high_resolution_clock::now();

    for (int i = 0; i < total; ++i) {
        std::lock_guard lock(m_mutex);

        cv::Mat out;
        if (!m_good.contains(i)) {
            if (auto cached = m_cache.load_inpaint(i)) {
                out = std::move(*cached);
                if (out.size() != size) {
                    cv::resize(out, out, size, 0, 0, cv::INTER_AREA);
                }
            }
        }
        if (out.empty()) {
            if (auto src = m_source.read_frame(i)) {
                out = std::move(*src);
            } else {
                out = cv::Mat::zeros(size, CV_8UC3);
            }
        }
        writer.write(out);

        if (i % 100 == 0) {
            spdlog::info("Inpaint export {}/{}", i, total);
        }
    }

    writer.release();
    auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::high_resolution_clock::now() - start_time).count();
    spdlog::info("Inpainted video complete in {} ms", elapsed / 1000);
}

// =============================================================================
// Queries
// =============================================================================

std::optional<int> CursorSession::next_missing_detection(int from) const {
    std::lock_guard lock(m_mutex);
    const int total = m_source.frame_count();
    if (total <= 0) {
        return std::nullopt;
    }

    for (int off = 1; off <= total; ++off) {
        const auto idx = static_cast<int>(((static_cast<std::int64_t>(from) + off) % total + total) % total);
        if (!m_detections.contains(idx) && !m_good.contains(idx)) {
            return idx;
        }
    }
    return std::nullopt;
}

SessionProgress CursorSession::progress() const {
    std::lock_guard lock(m_mutex);
    SessionProgress p;
    p.frame_count = m_source.frame_count();
    p.detections = m_detections.size();
    p.bad_detections = m_bad.size();
    p.masks = m_cache.count_masks();
    p.inpainted = m_cache.count_inpaints();
    p.good_frames = m_good.size();
    return p;
}

std::vector<int> CursorSession::all_frames() const {
    std::vector<int> frames(static_cast<std::size_t>(std::max(0, m_source.frame_count())));
    for (std::size_t i = 0; i < frames.size(); ++i) {
        frames[i] = static_cast<int>(i);
    }
    return frames;
}

}  // namespace cre
