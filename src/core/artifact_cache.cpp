/**
 * @file    artifact_cache.cpp
 * @brief   Per-video artifact cache implementation
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#include "core/artifact_cache.hpp"
#include "utils/path_formatter.hpp"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <spdlog/spdlog.h>
#include <fmt/format.h>

#include <stdexcept>
#include <system_error>

namespace cre {

namespace fs = std::filesystem;

namespace {

constexpr const char* kDetectionsDir = "detections";
constexpr const char* kMasksDir = "masks";
constexpr const char* kInpaintDir = "inpainted";

std::optional<cv::Mat> read_png(const fs::path& path, int flags) {
    std::error_code ec;
    if (!fs::exists(path, ec)) return std::nullopt;

    cv::Mat image = cv::imread(path.string(), flags);
    if (image.empty()) {
        spdlog::warn("Unreadable cached artifact ignored: {}", path);
        return std::nullopt;
    }
    return image;
}

void write_png(const fs::path& path, const cv::Mat& image) {
    bool ok = false;
    try {
        ok = cv::imwrite(path.string(), image);
    } catch (const cv::Exception& e) {
        throw std::runtime_error(fmt::format("Failed to write {}: {}", path, e.what()));
    }
    if (!ok) {
        throw std::runtime_error(fmt::format("Failed to write {}", path));
    }
}

bool remove_file(const fs::path& path) {
    std::error_code ec;
    const bool removed = fs::remove(path, ec);
    if (ec) {
        spdlog::warn("Cannot remove {}: {}", path, ec.message());
        return false;
    }
    return removed;
}

std::size_t count_png(const fs::path& dir) {
    std::error_code ec;
    std::size_t n = 0;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->is_regular_file(ec) && it->path().extension() == ".png") {
            ++n;
        }
    }
    return n;
}

}  // namespace

fs::path ArtifactCache::root_for(const fs::path& video_path, const fs::path& cache_parent) {
    const fs::path parent = cache_parent.empty() ? video_path.parent_path() : cache_parent;
    return parent / "cursor_cache" / video_path.stem();
}

ArtifactCache::ArtifactCache(fs::path root)
    : m_root(std::move(root))
{
    for (const char* sub : {kDetectionsDir, kMasksDir, kInpaintDir}) {
        std::error_code ec;
        fs::create_directories(m_root / sub, ec);
        if (ec) {
            throw std::runtime_error(fmt::format(
                "Cannot create cache directory {}: {}", m_root / sub, ec.message()));
        }
    }
    spdlog::debug("Artifact cache: {}", m_root);
}

fs::path ArtifactCache::detections_ledger() const {
    return m_root / kDetectionsDir / "detections.jsonl";
}

fs::path ArtifactCache::bad_detections_ledger() const {
    return m_root / kDetectionsDir / "bad_detections.jsonl";
}

fs::path ArtifactCache::good_frames_file() const {
    return m_root / "good_frames.json";
}

fs::path ArtifactCache::mask_path(int frame) const {
    return m_root / kMasksDir / frame_file_name(frame);
}

fs::path ArtifactCache::inpaint_path(int frame) const {
    return m_root / kInpaintDir / frame_file_name(frame);
}

bool ArtifactCache::has_mask(int frame) const {
    std::error_code ec;
    return fs::exists(mask_path(frame), ec);
}

bool ArtifactCache::has_inpaint(int frame) const {
    std::error_code ec;
    return fs::exists(inpaint_path(frame), ec);
}

std::optional<cv::Mat> ArtifactCache::load_mask(int frame) const {
    return read_png(mask_path(frame), cv::IMREAD_GRAYSCALE);
}

std::optional<cv::Mat> ArtifactCache::load_inpaint(int frame) const {
    return read_png(inpaint_path(frame), cv::IMREAD_COLOR);
}

void ArtifactCache::save_mask(int frame, const cv::Mat& mask) const {
    cv::Mat gray = mask;
    if (mask.channels() != 1) {
        cv::cvtColor(mask, gray, cv::COLOR_BGR2GRAY);
    }
    write_png(mask_path(frame), gray);
}

void ArtifactCache::save_inpaint(int frame, const cv::Mat& image) const {
    write_png(inpaint_path(frame), image);
}

bool ArtifactCache::remove_mask(int frame) const {
    return remove_file(mask_path(frame));
}

bool ArtifactCache::remove_inpaint(int frame) const {
    return remove_file(inpaint_path(frame));
}

std::size_t ArtifactCache::count_masks() const {
    return count_png(m_root / kMasksDir);
}

std::size_t ArtifactCache::count_inpaints() const {
    return count_png(m_root / kInpaintDir);
}

}  // namespace cre
