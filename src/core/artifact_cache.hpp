/**
 * @file    artifact_cache.hpp
 * @brief   Per-video on-disk cache layout and per-frame artifacts
 * @author  AllenK (Kwyshell)
 * @license MIT
 *
 * @details
 * Layout under <parent>/cursor_cache/<video-stem>/:
 *
 *   detections/detections.jsonl
 *   detections/bad_detections.jsonl
 *   masks/000042.png         single channel, video size
 *   inpainted/000042.png     BGR, video size
 *   good_frames.json
 *
 * Artifacts are written with PNG so reads give back the exact pixels.
 */

#pragma once

#include <opencv2/core.hpp>

#include <filesystem>
#include <optional>

namespace cre {

class ArtifactCache {
public:
    /**
     * Resolve the cache root for a video
     *
     * @param video_path   Source video
     * @param cache_parent Directory holding cursor_cache/; empty = the video's directory
     */
    [[nodiscard]] static std::filesystem::path root_for(
        const std::filesystem::path& video_path,
        const std::filesystem::path& cache_parent = {});

    /**
     * Create the directory tree
     * @throws std::runtime_error if a directory cannot be created
     */
    explicit ArtifactCache(std::filesystem::path root);

    [[nodiscard]] const std::filesystem::path& root() const noexcept { return m_root; }
    [[nodiscard]] std::filesystem::path detections_ledger() const;
    [[nodiscard]] std::filesystem::path bad_detections_ledger() const;
    [[nodiscard]] std::filesystem::path good_frames_file() const;
    [[nodiscard]] std::filesystem::path mask_path(int frame) const;
    [[nodiscard]] std::filesystem::path inpaint_path(int frame) const;

    [[nodiscard]] bool has_mask(int frame) const;
    [[nodiscard]] bool has_inpaint(int frame) const;

    /**
     * Load a cached mask as CV_8UC1
     *
     * An unreadable file is logged and treated as missing.
     */
    [[nodiscard]] std::optional<cv::Mat> load_mask(int frame) const;

    /**
     * Load a cached inpainted frame as BGR
     */
    [[nodiscard]] std::optional<cv::Mat> load_inpaint(int frame) const;

    /**
     * @throws std::runtime_error if the file cannot be written
     */
    void save_mask(int frame, const cv::Mat& mask) const;
    void save_inpaint(int frame, const cv::Mat& image) const;

    /**
     * Delete the mask / inpainted frame; missing files are not an error
     * @return true if a file was removed
     */
    bool remove_mask(int frame) const;
    bool remove_inpaint(int frame) const;

    [[nodiscard]] std::size_t count_masks() const;
    [[nodiscard]] std::size_t count_inpaints() const;

private:
    std::filesystem::path m_root;
};

}  // namespace cre
