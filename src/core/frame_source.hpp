/**
 * @file    frame_source.hpp
 * @brief   Random-access video frame source
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#pragma once

#include <opencv2/core.hpp>
#include <opencv2/videoio.hpp>

#include <filesystem>
#include <mutex>
#include <optional>

namespace cre {

/**
 * Decoded video with frame-by-index access
 *
 * Implementations return BGR 8-bit frames. read_frame() returns
 * std::nullopt for out-of-range indices or decode failures.
 */
class IFrameSource {
public:
    virtual ~IFrameSource() = default;

    [[nodiscard]] virtual std::optional<cv::Mat> read_frame(int index) = 0;
    [[nodiscard]] virtual int frame_count() const noexcept = 0;
    [[nodiscard]] virtual double fps() const noexcept = 0;
    [[nodiscard]] virtual int width() const noexcept = 0;
    [[nodiscard]] virtual int height() const noexcept = 0;

    [[nodiscard]] cv::Size frame_size() const noexcept { return {width(), height()}; }
};

/**
 * cv::VideoCapture backed source. Seeks on every read.
 */
class VideoFrameSource final : public IFrameSource {
public:
    /**
     * Open a video file
     * @throws std::runtime_error if the file cannot be opened
     */
    explicit VideoFrameSource(const std::filesystem::path& path);

    VideoFrameSource(const VideoFrameSource&) = delete;
    VideoFrameSource& operator=(const VideoFrameSource&) = delete;

    [[nodiscard]] std::optional<cv::Mat> read_frame(int index) override;
    [[nodiscard]] int frame_count() const noexcept override { return m_frame_count; }
    [[nodiscard]] double fps() const noexcept override { return m_fps; }
    [[nodiscard]] int width() const noexcept override { return m_width; }
    [[nodiscard]] int height() const noexcept override { return m_height; }

private:
    std::mutex m_mutex;         // VideoCapture is not reentrant
    cv::VideoCapture m_capture;
    int m_frame_count{0};
    double m_fps{30.0};
    int m_width{0};
    int m_height{0};
};

}  // namespace cre
