/**
 * @file    trueform_builder.hpp
 * @brief   Canonical object shape (trueform) from noisy dataset crops
 * @author  AllenK (Kwyshell)
 * @license MIT
 *
 * @details
 * A trueform is a (median image, binary mask) pair per orientation bin.
 *
 *   1. Bin every crop by the principal axis of its edge pixels
 *   2. Per bin with >= 2 crops: resize to the median size, ECC-align to the
 *      first crop (Euclidean, then translation, else keep unaligned)
 *   3. Per-pixel median and MAD across samples; low MAD and consistent
 *      Canny edges mark object pixels
 *   4. GrabCut refinement seeded from that mask
 *   5. Crop to the mask bounding box and save as BGRA (alpha = mask)
 *
 * Files: <dataset>/trueforms/<preset>_<bin>_trueform.png
 */

#pragma once

#include <opencv2/core.hpp>

#include <array>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cre {

// =============================================================================
// Orientation bins
// =============================================================================

enum class OrientationBin {
    Right,      // [315, 45) degrees
    Down,       // [45, 135)
    Left,       // [135, 225)
    Up          // [225, 315)
};

inline constexpr std::array<OrientationBin, 4> kOrientationBins = {
    OrientationBin::Right, OrientationBin::Down, OrientationBin::Left, OrientationBin::Up
};

[[nodiscard]] constexpr std::string_view to_string(OrientationBin bin) noexcept {
    switch (bin) {
        case OrientationBin::Right: return "right";
        case OrientationBin::Down:  return "down";
        case OrientationBin::Left:  return "left";
        case OrientationBin::Up:    return "up";
        default:                    return "right";
    }
}

/**
 * Map an angle in degrees (image y axis down) to its bin
 */
[[nodiscard]] OrientationBin orientation_bin_for_angle(double degrees) noexcept;

/**
 * Orientation of a BGR crop
 *
 * PCA of the Canny(50, 150) edge coordinates. The axis sign is chosen so
 * the third moment of the projections is non-negative. Fewer than 50 edge
 * pixels gives Right.
 */
[[nodiscard]] OrientationBin orientation_bin(const cv::Mat& bgr);

// =============================================================================
// Alignment
// =============================================================================

/**
 * Outcome of ECC alignment. A failed alignment is not an error: the
 * caller keeps the unaligned sample.
 */
struct AlignResult {
    enum class Status { Aligned, Unaligned };

    Status status{Status::Unaligned};
    cv::Mat image;              // Warped sample, or the input when unaligned

    [[nodiscard]] bool aligned() const noexcept { return status == Status::Aligned; }
};

/**
 * Align a BGR sample to a BGR reference of the same size
 */
[[nodiscard]] AlignResult align_to_reference(const cv::Mat& reference, const cv::Mat& sample);

// =============================================================================
// Trueform
// =============================================================================

struct Trueform {
    std::string key;            // "<preset>_<bin>"
    cv::Mat median;             // CV_8UC3
    cv::Mat mask;               // CV_8UC1, 0 / 255
};

/**
 * Median image and consensus mask of same-bin samples (>= 2)
 *
 * Samples are resized to the median sample size and aligned to the first.
 * The mask is not yet refined or cropped. When the median/open/close
 * cleanup leaves nothing, the closed raw threshold mask is returned.
 */
[[nodiscard]] Trueform compute_consensus(const std::vector<cv::Mat>& samples);

/**
 * GrabCut refinement of a consensus mask
 *
 * Outside the mask is probable background, inside probable foreground, the
 * eroded core certain foreground. Returns the input mask when GrabCut
 * cannot run or labels every pixel background.
 */
[[nodiscard]] cv::Mat refine_mask_grabcut(const cv::Mat& image_bgr, const cv::Mat& mask);

/**
 * Crop median and mask to the mask's bounding box; unchanged if the mask is empty
 */
[[nodiscard]] Trueform crop_to_mask(const Trueform& tf);

/**
 * Persist as BGRA PNG (color = median, alpha = mask)
 * @throws std::runtime_error if the file cannot be written
 */
void save_trueform(const std::filesystem::path& path, const Trueform& tf);

/**
 * Load a BGRA trueform; non-4-channel or unreadable files give std::nullopt
 */
[[nodiscard]] std::optional<Trueform> load_trueform(const std::filesystem::path& path, std::string key);

/**
 * All dataset images (png, jpg, jpeg, bmp, webp) directly under a folder,
 * loaded as BGR in file-name order
 *
 * @throws std::runtime_error if the folder does not exist
 */
[[nodiscard]] std::vector<cv::Mat> load_dataset_crops(const std::filesystem::path& folder);

// =============================================================================
// Trueform set
// =============================================================================

class TrueformSet {
public:
    void put(Trueform tf);
    void clear() noexcept { m_items.clear(); }

    [[nodiscard]] bool empty() const noexcept { return m_items.empty(); }
    [[nodiscard]] std::size_t size() const noexcept { return m_items.size(); }
    [[nodiscard]] const Trueform* find(std::string_view key) const;
    [[nodiscard]] const std::map<std::string, Trueform, std::less<>>& items() const noexcept { return m_items; }

    /**
     * Load <folder>/trueforms/<preset>[_*]_trueform.png
     * @return number of trueforms loaded
     */
    std::size_t load(const std::filesystem::path& dataset_folder, std::string_view preset);

    /**
     * Mask for a live detection, sized to the bbox clipped to the frame
     *
     * An exact "<preset>" key wins; otherwise the "<preset>_*" variant whose
     * median best correlates with the live crop is used.
     */
    [[nodiscard]] std::optional<cv::Mat> mask_for(
        const cv::Mat& frame_bgr,
        const cv::Rect& bbox,
        std::string_view preset) const;

private:
    std::map<std::string, Trueform, std::less<>> m_items;
};

/**
 * Trueform file path for a key
 */
[[nodiscard]] std::filesystem::path trueform_path(
    const std::filesystem::path& dataset_folder,
    std::string_view key);

/**
 * Build every bin with enough samples, save each to disk
 *
 * @return The built trueforms (empty if no bin had two samples)
 * @throws std::runtime_error if the dataset folder is missing or a file
 *         cannot be written
 */
[[nodiscard]] TrueformSet build_trueforms(
    const std::filesystem::path& dataset_folder,
    std::string_view preset);

}  // namespace cre
