#include "core/trueform_builder.hpp"

#include "test_support.hpp"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

using cre::test::check;
namespace fs = std::filesystem;

/**
 * Cursor glyph (without its black box) over a flat background
 */
cv::Mat glyph_crop(int bg_level, cv::Point offset) {
    const cv::Mat glyph = cre::test::make_cursor(32);
    cv::Mat glyph_gray;
    cv::cvtColor(glyph, glyph_gray, cv::COLOR_BGR2GRAY);
    const cv::Mat shape = glyph_gray > 0;

    cv::Mat crop(40, 40, CV_8UC3, cv::Scalar(bg_level, bg_level + 10, bg_level + 20));
    glyph.copyTo(crop(cv::Rect(offset, glyph.size())), shape);
    return crop;
}

void write_dataset(const fs::path& folder) {
    fs::create_directories(folder);
    const std::vector<std::pair<int, cv::Point>> variants = {
        {60, {4, 4}}, {75, {4, 3}}, {90, {3, 4}}, {105, {4, 4}}, {70, {5, 4}}, {85, {4, 5}}
    };
    int i = 0;
    for (const auto& [level, offset] : variants) {
        const fs::path file = folder / ("crop_" + std::to_string(i++) + ".png");
        if (!cv::imwrite(file.string(), glyph_crop(level, offset))) {
            throw std::runtime_error("cannot write " + file.string());
        }
    }
}

void test_angle_bins() {
    using cre::OrientationBin;
    check(cre::orientation_bin_for_angle(0.0) == OrientationBin::Right, "0 degrees is right");
    check(cre::orientation_bin_for_angle(44.9) == OrientationBin::Right, "44.9 degrees is right");
    check(cre::orientation_bin_for_angle(45.0) == OrientationBin::Down, "45 degrees is down");
    check(cre::orientation_bin_for_angle(90.0) == OrientationBin::Down, "90 degrees is down");
    check(cre::orientation_bin_for_angle(180.0) == OrientationBin::Left, "180 degrees is left");
    check(cre::orientation_bin_for_angle(-90.0) == OrientationBin::Up, "-90 degrees is up");
    check(cre::orientation_bin_for_angle(314.0) == OrientationBin::Up, "314 degrees is up");
    check(cre::orientation_bin_for_angle(315.0) == OrientationBin::Right, "315 degrees is right");
    check(cre::orientation_bin_for_angle(720.0 + 100.0) == OrientationBin::Down, "angles wrap");
}

void test_orientation_of_crops() {
    const cv::Mat flat(40, 40, CV_8UC3, cv::Scalar(128, 128, 128));
    check(cre::orientation_bin(flat) == cre::OrientationBin::Right, "too few edges defaults to right");
    check(cre::orientation_bin(cv::Mat()) == cre::OrientationBin::Right, "empty crop defaults to right");

    // A horizontal bar with a heavy blob on one end points toward the blob side
    cv::Mat bar(60, 120, CV_8UC3, cv::Scalar(0, 0, 0));
    cv::rectangle(bar, cv::Rect(10, 27, 100, 6), cv::Scalar(255, 255, 255), cv::FILLED);
    cv::circle(bar, {100, 30}, 18, cv::Scalar(255, 255, 255), cv::FILLED);
    cv::Mat flipped;
    cv::flip(bar, flipped, 1);

    const auto a = cre::orientation_bin(bar);
    const auto b = cre::orientation_bin(flipped);
    check(a == cre::OrientationBin::Right || a == cre::OrientationBin::Left, "horizontal bar bins horizontally");
    check(a != b, "mirrored crop lands in the opposite bin");

    cv::Mat rotated;
    cv::rotate(bar, rotated, cv::ROTATE_90_CLOCKWISE);
    const auto c = cre::orientation_bin(rotated);
    check(c == cre::OrientationBin::Down || c == cre::OrientationBin::Up, "vertical bar bins vertically");
}

void test_consensus_requires_two_samples() {
    bool threw = false;
    try {
        (void)cre::compute_consensus({glyph_crop(80, {4, 4})});
    } catch (const std::runtime_error&) {
        threw = true;
    }
    check(threw, "consensus of one sample should throw");
}

void test_consensus_finds_shape() {
    std::vector<cv::Mat> samples;
    for (int level : {60, 80, 100, 120}) {
        samples.push_back(glyph_crop(level, {4, 4}));
    }

    const cre::Trueform tf = cre::compute_consensus(samples);
    check(tf.median.size() == cv::Size(40, 40) && tf.median.type() == CV_8UC3, "median is BGR at sample size");
    check(tf.mask.size() == cv::Size(40, 40) && tf.mask.type() == CV_8UC1, "mask is single channel");
    check(cv::countNonZero(tf.mask) > 0, "stable glyph edges should produce a mask");

    const cre::Trueform cropped = cre::crop_to_mask(tf);
    check(cropped.mask.cols <= 40 && cropped.mask.rows <= 40, "crop never grows");
    check(cropped.mask.size() == cropped.median.size(), "median and mask are cropped together");
    check(cv::countNonZero(cropped.mask) == cv::countNonZero(tf.mask), "crop keeps every mask pixel");

    const cre::Trueform empty{"k", tf.median, cv::Mat::zeros(tf.median.size(), CV_8UC1)};
    check(cre::crop_to_mask(empty).mask.size() == tf.median.size(), "empty mask leaves the trueform unchanged");
}

void test_build_is_deterministic() {
    cre::test::TempDir dir("cre_trueform");
    const fs::path dataset = dir.path() / "dataset";
    write_dataset(dataset);

    const cre::TrueformSet first = cre::build_trueforms(dataset, "run");
    const cre::TrueformSet second = cre::build_trueforms(dataset, "run");

    check(!first.empty(), "six similar crops should build at least one trueform");
    check(first.size() == second.size(), "rebuild yields the same bins");

    for (const auto& [key, tf] : first.items()) {
        const cre::Trueform* other = second.find(key);
        check(other != nullptr, "rebuild has key " + key);
        if (!other) continue;

        const double a = cv::countNonZero(tf.mask);
        const double b = cv::countNonZero(other->mask);
        check(a > 0, "trueform " + key + " has mask pixels");
        check(std::abs(a - b) <= 0.02 * std::max(a, b), "rebuild of " + key + " is within 2% of mask pixels");
        check(fs::exists(cre::trueform_path(dataset, key)), "trueform " + key + " is written to disk");
    }

    cre::TrueformSet loaded;
    check(loaded.load(dataset, "run") == first.size(), "saved trueforms load back by preset");
    check(loaded.load(dataset, "other") == 0, "other presets are not loaded");
}

void test_rgba_round_trip() {
    cre::test::TempDir dir("cre_trueform");

    cre::Trueform tf;
    tf.key = "p_left";
    tf.median = cv::Mat(12, 16, CV_8UC3, cv::Scalar(10, 20, 30));
    tf.mask = cv::Mat::zeros(12, 16, CV_8UC1);
    tf.mask(cv::Rect(2, 3, 6, 5)).setTo(255);

    const fs::path path = cre::trueform_path(dir.path(), tf.key);
    cre::save_trueform(path, tf);

    const auto back = cre::load_trueform(path, tf.key);
    check(back.has_value(), "saved trueform loads");
    if (back) {
        check(back->key == "p_left", "key is kept");
        check(cre::test::mats_equal(back->median, tf.median), "median color survives the alpha PNG");
        check(cre::test::mats_equal(back->mask, tf.mask), "mask survives as alpha");
    }

    const fs::path rgb = dir.path() / "trueforms" / "p_up_trueform.png";
    cv::imwrite(rgb.string(), tf.median);
    check(!cre::load_trueform(rgb, "p_up").has_value(), "trueform without alpha is ignored");

    bool threw = false;
    try {
        cre::save_trueform(dir.path() / "x.png", cre::Trueform{});
    } catch (const std::runtime_error&) {
        threw = true;
    }
    check(threw, "saving an empty trueform throws");
}

void test_mask_for_live_detection() {
    cre::TrueformSet set;

    cre::Trueform right;
    right.key = "p_right";
    right.median = glyph_crop(80, {4, 4});
    right.mask = cv::Mat::zeros(40, 40, CV_8UC1);
    right.mask(cv::Rect(0, 0, 20, 40)).setTo(255);
    set.put(right);

    cre::Trueform left;
    left.key = "p_left";
    cv::flip(right.median, left.median, 1);
    cv::flip(right.mask, left.mask, 1);
    set.put(left);

    cv::Mat frame(120, 160, CV_8UC3, cv::Scalar(80, 90, 100));
    right.median.copyTo(frame(cv::Rect(50, 40, 40, 40)));

    const auto mask = set.mask_for(frame, {50, 40, 40, 40}, "p");
    check(mask.has_value(), "a variant should be picked for the live crop");
    if (mask) {
        check(mask->size() == cv::Size(40, 40), "mask is sized to the box");
        check(mask->at<uchar>(20, 5) != 0 && mask->at<uchar>(20, 35) == 0,
              "best correlating variant is used");
    }

    const auto clipped = set.mask_for(frame, {140, 100, 40, 40}, "p");
    check(clipped && clipped->size() == cv::Size(20, 20), "mask is sized to the box clipped to the frame");

    check(!set.mask_for(frame, {50, 40, 40, 40}, "q").has_value(), "unknown preset gives no mask");

    cre::Trueform exact;
    exact.key = "p";
    exact.median = right.median.clone();
    exact.mask = cv::Mat(40, 40, CV_8UC1, cv::Scalar(255));
    set.put(exact);
    const auto whole = set.mask_for(frame, {50, 40, 40, 40}, "p");
    check(whole && cv::countNonZero(*whole) == 1600, "exact preset key wins over variants");
}

}  // namespace

int main() {
    test_angle_bins();
    test_orientation_of_crops();
    test_consensus_requires_two_samples();
    test_consensus_finds_shape();
    test_build_is_deterministic();
    test_rgba_round_trip();
    test_mask_for_live_detection();

    return cre::test::finish("trueform_tests");
}
