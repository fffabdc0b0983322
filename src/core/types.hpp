/**
 * @file    types.hpp
 * @brief   Shared type definitions for the Cursor Removal Engine
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#pragma once

#include <opencv2/core.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace cre {

// Version info
inline constexpr const char* kVersion = "0.3.0";

// =============================================================================
// Detection provenance
// =============================================================================

/**
 * Where an accepted detection came from
 */
enum class DetectionSource {
    Auto,       // Multi-scale matcher
    Guided,     // User clicked the object position
    Manual      // User drew / imported the box
};

[[nodiscard]] constexpr std::string_view to_string(DetectionSource source) noexcept {
    switch (source) {
        case DetectionSource::Auto:   return "auto";
        case DetectionSource::Guided: return "guided";
        case DetectionSource::Manual: return "manual";
        default:                      return "auto";
    }
}

[[nodiscard]] std::optional<DetectionSource> detection_source_from_string(std::string_view text) noexcept;

/**
 * Why a bounding box was rejected
 */
enum class RejectSource {
    BadClick,   // Human rejected the detection
    AutoGood    // Frame was marked as containing no object
};

[[nodiscard]] constexpr std::string_view to_string(RejectSource source) noexcept {
    switch (source) {
        case RejectSource::BadClick: return "bad_click";
        case RejectSource::AutoGood: return "auto_good";
        default:                     return "bad_click";
    }
}

[[nodiscard]] std::optional<RejectSource> reject_source_from_string(std::string_view text) noexcept;

// =============================================================================
// Records
// =============================================================================

/**
 * One accepted detection. The latest record for a frame is the current one.
 */
struct DetectionRecord {
    int frame{0};
    cv::Rect bbox;
    float score{0.0f};          // NCC may exceed 1.0 slightly, clamp at use sites
    std::string template_id;
    DetectionSource source{DetectionSource::Auto};
};

/**
 * One rejected bounding box. Never deleted.
 */
struct BadDetectionRecord {
    int frame{0};
    cv::Rect bbox;
    std::optional<float> score;
    std::string template_id;
    RejectSource source{RejectSource::BadClick};
};

// =============================================================================
// Batch outcome reporting
// =============================================================================

/**
 * Per-frame outcome of a batch operation
 */
enum class FrameOutcome {
    Detected,               // Detection recorded
    MaskWritten,            // Mask artifact written
    Filled,                 // Temporal fill produced the result
    FallbackUsed,           // Classical inpaint produced the result
    Cached,                 // Artifact already present, nothing done
    SkippedGood,            // Frame marked as good
    SkippedNoDetection,     // No detection / mask for this frame
    Failed                  // Read or processing error, logged
};

[[nodiscard]] constexpr std::string_view to_string(FrameOutcome outcome) noexcept {
    switch (outcome) {
        case FrameOutcome::Detected:           return "detected";
        case FrameOutcome::MaskWritten:        return "mask-written";
        case FrameOutcome::Filled:             return "filled";
        case FrameOutcome::FallbackUsed:       return "fallback-used";
        case FrameOutcome::Cached:             return "cached";
        case FrameOutcome::SkippedGood:        return "skipped-good";
        case FrameOutcome::SkippedNoDetection: return "skipped-no-detection";
        case FrameOutcome::Failed:             return "failed";
        default:                               return "unknown";
    }
}

// =============================================================================
// Geometry helpers
// =============================================================================

/**
 * Intersection over union of two boxes, 0 when either is empty
 */
[[nodiscard]] double iou(const cv::Rect& a, const cv::Rect& b) noexcept;

/**
 * Center of a box in floating point
 */
[[nodiscard]] inline cv::Point2d center_of(const cv::Rect& r) noexcept {
    return {r.x + r.width * 0.5, r.y + r.height * 0.5};
}

}  // namespace cre
