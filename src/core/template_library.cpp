/**
 * @file    template_library.cpp
 * @brief   Template folder loading
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#include "core/template_library.hpp"
#include "utils/path_formatter.hpp"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace fs = std::filesystem;

namespace cre {

std::size_t TemplateLibrary::load_folder(const fs::path& folder) {
    if (!fs::is_directory(folder)) {
        throw std::runtime_error("Dataset folder not found: " + to_utf8(folder));
    }

    m_templates.clear();
    for (const auto& entry : fs::directory_iterator(folder)) {
        if (!entry.is_regular_file() || !is_image_extension(entry.path())) continue;

        cv::Mat gray = cv::imread(entry.path().string(), cv::IMREAD_GRAYSCALE);
        if (gray.empty()) {
            spdlog::warn("Failed to read template: {}", entry.path());
            continue;
        }
        m_templates[to_utf8(entry.path().filename())] = gray;
    }

    spdlog::info("Loaded {} templates from {}", m_templates.size(), folder);
    return m_templates.size();
}

void TemplateLibrary::add(const std::string& name, const cv::Mat& image) {
    if (image.empty()) return;

    cv::Mat gray;
    if (image.channels() == 4) {
        cv::cvtColor(image, gray, cv::COLOR_BGRA2GRAY);
    } else if (image.channels() == 3) {
        cv::cvtColor(image, gray, cv::COLOR_BGR2GRAY);
    } else {
        gray = image.clone();
    }
    m_templates[name] = gray;
}

}  // namespace cre
