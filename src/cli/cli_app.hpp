/**
 * @file    cli_app.hpp
 * @brief   CLI Application Entry Point
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#pragma once

#include <string_view>
#include <vector>

namespace cre::cli {

/**
 * Run the CLI application
 *
 * @param argc  Argument count
 * @param argv  Argument values
 * @return      Exit code (0 = success)
 */
int run(int argc, char** argv);

/**
 * Parse a frame selection against a video of frame_count frames
 *
 * Accepts "all" (or an empty string), single indices and inclusive ranges
 * separated by commas: "12", "0-99", "0-9,40,100-120". Indices past the
 * last frame are clamped; duplicates are removed and the result is sorted.
 *
 * @throws std::invalid_argument on malformed input or a reversed range
 */
[[nodiscard]] std::vector<int> parse_frame_list(std::string_view text, int frame_count);

}  // namespace cre::cli
