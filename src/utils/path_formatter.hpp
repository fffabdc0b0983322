/**
 * @file    path_formatter.hpp
 * @brief   Path helpers and fmt formatter for std::filesystem::path
 * @author  AllenK (Kwyshell)
 * @license MIT
 *
 * @details
 * Logging a std::filesystem::path through spdlog/fmt needs a formatter.
 * path.string() is not UTF-8 on every platform, so the formatter goes
 * through u8string(), which in C++20 yields std::u8string (char8_t).
 *
 * Usage:
 *   #include "utils/path_formatter.hpp"
 *   spdlog::info("Saved mask: {}", mask_path);
 */

#pragma once

#include <cctype>
#include <filesystem>
#include <string>
#include <string_view>
#include <fmt/format.h>

namespace cre {

/**
 * Convert filesystem path to UTF-8 encoded std::string
 */
inline std::string to_utf8(const std::filesystem::path& path) {
    auto u8str = path.u8string();
    return std::string(
        reinterpret_cast<const char*>(u8str.data()),
        u8str.size()
    );
}

/**
 * Per-frame artifact file name: zero padded to six digits
 *
 * frame_file_name(42) -> "000042.png"
 */
inline std::string frame_file_name(int frame_index, std::string_view ext = ".png") {
    return fmt::format("{:06d}{}", frame_index, ext);
}

/**
 * True for the image extensions the dataset loader accepts
 */
inline bool is_image_extension(const std::filesystem::path& path) {
    std::string ext = path.extension().string();
    for (auto& c : ext) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return ext == ".png" || ext == ".jpg" || ext == ".jpeg" ||
           ext == ".bmp" || ext == ".webp";
}

}  // namespace cre

// =============================================================================
// fmt formatter specialization for std::filesystem::path
// =============================================================================

template <>
struct fmt::formatter<std::filesystem::path> : fmt::formatter<std::string_view> {
    auto format(const std::filesystem::path& p, format_context& ctx) const {
        auto u8 = p.u8string();
        std::string_view sv{
            reinterpret_cast<const char*>(u8.data()),
            u8.size()
        };
        return fmt::formatter<std::string_view>::format(sv, ctx);
    }
};
