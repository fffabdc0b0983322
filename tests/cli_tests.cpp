#include "cli/cli_app.hpp"

#include "test_support.hpp"

#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace {

using cre::test::check;

bool throws_invalid(std::string_view text, int frame_count) {
    try {
        (void)cre::cli::parse_frame_list(text, frame_count);
    } catch (const std::invalid_argument&) {
        return true;
    }
    return false;
}

void test_frame_list() {
    using cre::cli::parse_frame_list;

    check(parse_frame_list("all", 4) == std::vector<int>{0, 1, 2, 3}, "'all' selects every frame");
    check(parse_frame_list("", 3) == std::vector<int>{0, 1, 2}, "empty list selects every frame");
    check(parse_frame_list("5", 10) == std::vector<int>{5}, "single index");
    check(parse_frame_list("0-3,2,7", 10) == std::vector<int>{0, 1, 2, 3, 7}, "ranges and indices merge sorted");
    check(parse_frame_list(" 4 , 1 ", 10) == std::vector<int>{1, 4}, "spaces around items are ignored");
    check(parse_frame_list("8-20", 10) == std::vector<int>{8, 9}, "range end is clamped to the last frame");
    check(parse_frame_list("15", 10).empty(), "index past the end selects nothing");

    check(throws_invalid("a", 10), "non-numeric item throws");
    check(throws_invalid("5-2", 10), "reversed range throws");
    check(throws_invalid("1,,2", 10), "empty item throws");
    check(throws_invalid("-3", 10), "negative index throws");
}

void test_command_line_errors() {
    std::string prog = "CursorRemovalTool";
    std::string status = "status";
    std::string video_flag = "--video";
    std::string missing = "/nonexistent/cre_missing_video.mp4";

    char* no_video[] = {prog.data(), status.data(), nullptr};
    check(cre::cli::run(2, no_video) != 0, "missing --video is an error");

    char* bad_video[] = {prog.data(), video_flag.data(), missing.data(), status.data(), nullptr};
    check(cre::cli::run(4, bad_video) != 0, "nonexistent video is an error");
}

}  // namespace

int main() {
    test_frame_list();
    test_command_line_errors();

    return cre::test::finish("cli_tests");
}
