/**
 * @file    frame_source.cpp
 * @brief   cv::VideoCapture frame source
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#include "core/frame_source.hpp"
#include "utils/path_formatter.hpp"

#include <spdlog/spdlog.h>
#include <stdexcept>

namespace cre {

VideoFrameSource::VideoFrameSource(const std::filesystem::path& path) {
    if (!m_capture.open(path.string())) {
        throw std::runtime_error("Failed to open video: " + to_utf8(path));
    }

    m_frame_count = static_cast<int>(m_capture.get(cv::CAP_PROP_FRAME_COUNT));
    const double fps = m_capture.get(cv::CAP_PROP_FPS);
    m_fps = fps > 0.0 ? fps : 30.0;
    m_width = static_cast<int>(m_capture.get(cv::CAP_PROP_FRAME_WIDTH));
    m_height = static_cast<int>(m_capture.get(cv::CAP_PROP_FRAME_HEIGHT));

    spdlog::info("Opened video {}: {} frames, {:.2f} fps, {}x{}",
                 path.filename(), m_frame_count, m_fps, m_width, m_height);
}

std::optional<cv::Mat> VideoFrameSource::read_frame(int index) {
    if (index < 0 || index >= m_frame_count) {
        return std::nullopt;
    }

    std::lock_guard lock(m_mutex);
    m_capture.set(cv::CAP_PROP_POS_FRAMES, index);

    cv::Mat frame;
    if (!m_capture.read(frame) || frame.empty()) {
        spdlog::warn("Failed to decode frame {}", index);
        return std::nullopt;
    }
    return frame;
}

}  // namespace cre
