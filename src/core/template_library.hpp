/**
 * @file    template_library.hpp
 * @brief   Named grayscale reference images loaded from a dataset folder
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#pragma once

#include <opencv2/core.hpp>

#include <filesystem>
#include <map>
#include <string>

namespace cre {

/**
 * Sample name -> grayscale template
 *
 * Sorted by name so that matcher candidate order (and with it the
 * early-stop behaviour) is reproducible between runs.
 */
class TemplateLibrary {
public:
    TemplateLibrary() = default;

    /**
     * Replace the contents with every readable image in a folder
     *
     * Unreadable files are logged and skipped.
     *
     * @throws std::runtime_error if the folder does not exist
     * @return number of templates loaded
     */
    std::size_t load_folder(const std::filesystem::path& folder);

    /**
     * Add or replace one template (converted to grayscale if needed)
     */
    void add(const std::string& name, const cv::Mat& image);

    void clear() noexcept { m_templates.clear(); }

    [[nodiscard]] bool empty() const noexcept { return m_templates.empty(); }
    [[nodiscard]] std::size_t size() const noexcept { return m_templates.size(); }
    [[nodiscard]] const std::map<std::string, cv::Mat>& items() const noexcept { return m_templates; }

private:
    std::map<std::string, cv::Mat> m_templates;
};

}  // namespace cre
