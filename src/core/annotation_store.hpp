/**
 * @file    annotation_store.hpp
 * @brief   Persistent detection / bad-detection / good-frame stores
 * @author  AllenK (Kwyshell)
 * @license MIT
 *
 * @details
 * Ledgers are JSON lines, one record per line:
 *
 *   {"frame": 12, "bbox": [x, y, w, h], "score": 0.97, "template": "a.png@1.00", "source": "auto"}
 *
 * Loading replays the ledger: a malformed line is logged and skipped, and
 * the latest record of a frame supersedes earlier ones. A `null` value
 * (older ledgers write `"score": null` for bad clicks) reads as absent. Every mutation is
 * written to disk before the call returns.
 *
 * Rejecting a detection rewrites the detection ledger without the frame's
 * records, so code reading the file directly never sees a rejected box.
 */

#pragma once

#include "core/types.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace cre {

// =============================================================================
// Detection ledger
// =============================================================================

class DetectionStore {
public:
    explicit DetectionStore(std::filesystem::path ledger_path);

    /**
     * Replay the ledger from disk, replacing the in-memory view
     * @return number of frames with a current record
     */
    std::size_t load();

    /**
     * Append a record; it becomes the frame's current record
     * @throws std::runtime_error if the ledger cannot be written
     */
    void record(const DetectionRecord& rec);

    /**
     * Remove every record of a frame and rewrite the ledger
     * @return the removed records, oldest first
     * @throws std::runtime_error if the ledger cannot be rewritten
     */
    std::vector<DetectionRecord> remove_frame(int frame);

    [[nodiscard]] std::optional<DetectionRecord> current(int frame) const;

    /**
     * Every record of a frame, oldest first
     */
    [[nodiscard]] std::vector<DetectionRecord> records_for(int frame) const;

    [[nodiscard]] bool contains(int frame) const noexcept { return m_current.count(frame) != 0; }
    [[nodiscard]] std::size_t size() const noexcept { return m_current.size(); }
    [[nodiscard]] std::set<int> frames() const;
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return m_path; }

private:
    std::filesystem::path m_path;
    std::vector<DetectionRecord> m_log;         // Every valid line, in file order
    std::map<int, DetectionRecord> m_current;   // Latest record per frame
};

// =============================================================================
// Bad-detection ledger
// =============================================================================

class BadDetectionStore {
public:
    explicit BadDetectionStore(std::filesystem::path ledger_path);

    std::size_t load();

    /**
     * Append a rejected box
     * @throws std::runtime_error if the ledger cannot be written
     */
    void append(const BadDetectionRecord& rec);

    /**
     * True if bbox overlaps any rejected box of the same frame with
     * IoU strictly above iou_threshold
     */
    [[nodiscard]] bool is_rejected(int frame, const cv::Rect& bbox, double iou_threshold) const;

    [[nodiscard]] const std::vector<BadDetectionRecord>& records_for(int frame) const;
    [[nodiscard]] std::size_t frame_count() const noexcept { return m_by_frame.size(); }
    [[nodiscard]] std::size_t size() const noexcept { return m_total; }

private:
    std::filesystem::path m_path;
    std::map<int, std::vector<BadDetectionRecord>> m_by_frame;
    std::size_t m_total{0};
};

// =============================================================================
// Good frames
// =============================================================================

/**
 * Frames explicitly marked as having no object. Saved as a JSON array.
 */
class GoodFrameRegistry {
public:
    explicit GoodFrameRegistry(std::filesystem::path file_path);

    std::size_t load();

    /**
     * @return true if the frame was not marked before
     * @throws std::runtime_error if the file cannot be written
     */
    bool add(int frame);

    /**
     * @return true if the frame was marked
     * @throws std::runtime_error if the file cannot be written
     */
    bool remove(int frame);

    [[nodiscard]] bool contains(int frame) const noexcept { return m_frames.count(frame) != 0; }
    [[nodiscard]] const std::set<int>& frames() const noexcept { return m_frames; }
    [[nodiscard]] std::size_t size() const noexcept { return m_frames.size(); }

private:
    std::filesystem::path m_path;
    std::set<int> m_frames;

    void save() const;
};

// =============================================================================
// Line codec
// =============================================================================

namespace ledger {

[[nodiscard]] std::string encode(const DetectionRecord& rec);
[[nodiscard]] std::string encode(const BadDetectionRecord& rec);

[[nodiscard]] std::optional<DetectionRecord> parse_detection(std::string_view line);
[[nodiscard]] std::optional<BadDetectionRecord> parse_bad_detection(std::string_view line);

}  // namespace ledger

}  // namespace cre
