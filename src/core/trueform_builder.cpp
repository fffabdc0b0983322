/**
 * @file    trueform_builder.cpp
 * @brief   Trueform construction, persistence and selection
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#include "core/trueform_builder.hpp"
#include "utils/path_formatter.hpp"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <opencv2/video/tracking.hpp>
#include <spdlog/spdlog.h>
#include <fmt/format.h>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <system_error>

namespace cre {

namespace fs = std::filesystem;

namespace {

constexpr int kMinEdgePixels = 50;
constexpr std::string_view kTrueformSuffix = "_trueform.png";

// Fixed RNG state for GrabCut's k-means initialisation
constexpr uint64_t kGrabCutSeed = 0x9E3779B97F4A7C15ull;

cv::Mat to_gray(const cv::Mat& image) {
    cv::Mat gray;
    switch (image.channels()) {
        case 1:  gray = image; break;
        case 4:  cv::cvtColor(image, gray, cv::COLOR_BGRA2GRAY); break;
        default: cv::cvtColor(image, gray, cv::COLOR_BGR2GRAY); break;
    }
    return gray;
}

cv::Mat to_bgr(const cv::Mat& image) {
    cv::Mat bgr;
    switch (image.channels()) {
        case 1:  cv::cvtColor(image, bgr, cv::COLOR_GRAY2BGR); break;
        case 4:  cv::cvtColor(image, bgr, cv::COLOR_BGRA2BGR); break;
        default: bgr = image; break;
    }
    return bgr;
}

// Median of a small sample; even counts average the two middle values
float median_of(std::vector<float>& values) {
    const std::size_t n = values.size();
    std::sort(values.begin(), values.end());
    if (n % 2 == 1) return values[n / 2];
    return 0.5f * (values[n / 2 - 1] + values[n / 2]);
}

int median_of(std::vector<int> values) {
    std::sort(values.begin(), values.end());
    const std::size_t n = values.size();
    if (n % 2 == 1) return values[n / 2];
    return static_cast<int>(0.5 * (values[n / 2 - 1] + values[n / 2]));
}

// Percentile with linear interpolation between closest ranks
double percentile(const cv::Mat& values_f32, double p) {
    std::vector<float> v(values_f32.begin<float>(), values_f32.end<float>());
    if (v.empty()) return 0.0;
    std::sort(v.begin(), v.end());

    const double pos = p / 100.0 * static_cast<double>(v.size() - 1);
    const auto lo = static_cast<std::size_t>(std::floor(pos));
    const std::size_t hi = std::min(lo + 1, v.size() - 1);
    const double frac = pos - static_cast<double>(lo);
    return v[lo] + (v[hi] - v[lo]) * frac;
}

/**
 * Pins cv::theRNG() for the lifetime of the guard, restoring it afterwards
 */
class ScopedRngState {
public:
    explicit ScopedRngState(uint64_t state)
        : m_saved(cv::theRNG().state) {
        cv::theRNG().state = state;
    }
    ~ScopedRngState() { cv::theRNG().state = m_saved; }

    ScopedRngState(const ScopedRngState&) = delete;
    ScopedRngState& operator=(const ScopedRngState&) = delete;

private:
    uint64_t m_saved;
};

bool starts_with(std::string_view text, std::string_view prefix) {
    return text.size() >= prefix.size() && text.compare(0, prefix.size(), prefix) == 0;
}

bool ends_with(std::string_view text, std::string_view suffix) {
    return text.size() >= suffix.size() &&
           text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

}  // namespace

// =============================================================================
// Orientation
// =============================================================================

OrientationBin orientation_bin_for_angle(double degrees) noexcept {
    double a = std::fmod(degrees, 360.0);
    if (a < 0.0) a += 360.0;

    if (a >= 315.0 || a < 45.0) return OrientationBin::Right;
    if (a < 135.0) return OrientationBin::Down;
    if (a < 225.0) return OrientationBin::Left;
    return OrientationBin::Up;
}

OrientationBin orientation_bin(const cv::Mat& bgr) {
    if (bgr.empty()) return OrientationBin::Right;

    cv::Mat edges;
    cv::Canny(to_gray(bgr), edges, 50, 150);

    std::vector<cv::Point> pts;
    cv::findNonZero(edges, pts);
    if (static_cast<int>(pts.size()) < kMinEdgePixels) {
        return OrientationBin::Right;
    }

    double mx = 0.0, my = 0.0;
    for (const auto& p : pts) {
        mx += p.x;
        my += p.y;
    }
    const double n = static_cast<double>(pts.size());
    mx /= n;
    my /= n;

    double cxx = 0.0, cxy = 0.0, cyy = 0.0;
    for (const auto& p : pts) {
        const double dx = p.x - mx;
        const double dy = p.y - my;
        cxx += dx * dx;
        cxy += dx * dy;
        cyy += dy * dy;
    }

    // Principal axis of the 2x2 covariance
    const double theta = 0.5 * std::atan2(2.0 * cxy, cxx - cyy);
    double vx = std::cos(theta);
    double vy = std::sin(theta);

    // Point the axis toward the heavier tail of the projections
    double m3 = 0.0;
    for (const auto& p : pts) {
        const double t = (p.x - mx) * vx + (p.y - my) * vy;
        m3 += t * t * t;
    }
    if (m3 < 0.0) {
        vx = -vx;
        vy = -vy;
    }

    const double angle = std::atan2(vy, vx) * 180.0 / CV_PI;
    return orientation_bin_for_angle(angle);
}

// =============================================================================
// Alignment
// =============================================================================

AlignResult align_to_reference(const cv::Mat& reference, const cv::Mat& sample) {
    if (reference.empty() || sample.empty() || reference.size() != sample.size()) {
        return {AlignResult::Status::Unaligned, sample};
    }

    cv::Mat ref_f, img_f;
    cv::GaussianBlur(to_gray(reference), ref_f, cv::Size(3, 3), 0);
    cv::GaussianBlur(to_gray(sample), img_f, cv::Size(3, 3), 0);
    ref_f.convertTo(ref_f, CV_32F, 1.0 / 255.0);
    img_f.convertTo(img_f, CV_32F, 1.0 / 255.0);

    const cv::TermCriteria criteria(cv::TermCriteria::COUNT | cv::TermCriteria::EPS, 150, 1e-6);

    for (int mode : {cv::MOTION_EUCLIDEAN, cv::MOTION_TRANSLATION}) {
        cv::Mat warp = cv::Mat::eye(2, 3, CV_32F);
        try {
            cv::findTransformECC(ref_f, img_f, warp, mode, criteria, cv::noArray(), 5);
            if (!cv::checkRange(warp)) {
                spdlog::debug("ECC warp not finite (mode {})", mode);
                continue;
            }

            cv::Mat aligned;
            cv::warpAffine(sample, aligned, warp, reference.size(),
                           cv::INTER_LINEAR | cv::WARP_INVERSE_MAP, cv::BORDER_REFLECT);
            return {AlignResult::Status::Aligned, aligned};
        } catch (const cv::Exception& e) {
            spdlog::debug("ECC alignment failed ({}): {}",
                          mode == cv::MOTION_EUCLIDEAN ? "euclidean" : "translation", e.what());
        }
    }

    return {AlignResult::Status::Unaligned, sample};
}

// =============================================================================
// Consensus
// =============================================================================

Trueform compute_consensus(const std::vector<cv::Mat>& samples) {
    if (samples.size() < 2) {
        throw std::runtime_error("Trueform consensus needs at least two samples");
    }

    std::vector<int> hs, ws;
    for (const auto& s : samples) {
        hs.push_back(s.rows);
        ws.push_back(s.cols);
    }
    const cv::Size size(std::max(1, median_of(ws)), std::max(1, median_of(hs)));

    cv::Mat reference;
    cv::resize(to_bgr(samples.front()), reference, size, 0, 0, cv::INTER_AREA);

    std::vector<cv::Mat> aligned;
    aligned.reserve(samples.size());
    int aligned_count = 0;
    for (const auto& s : samples) {
        cv::Mat resized;
        cv::resize(to_bgr(s), resized, size, 0, 0, cv::INTER_AREA);
        AlignResult r = align_to_reference(reference, resized);
        if (r.aligned()) ++aligned_count;
        aligned.push_back(std::move(r.image));
    }
    spdlog::debug("Consensus: {} samples at {}x{}, {} aligned",
                  aligned.size(), size.width, size.height, aligned_count);

    // Per-pixel median color and median absolute deviation
    const int n = static_cast<int>(aligned.size());
    cv::Mat median(size, CV_8UC3);
    cv::Mat mad_gray(size, CV_32F);
    std::vector<float> values(n), deviations(n);

    for (int y = 0; y < size.height; ++y) {
        auto* med_row = median.ptr<cv::Vec3b>(y);
        auto* mad_row = mad_gray.ptr<float>(y);
        for (int x = 0; x < size.width; ++x) {
            float mad_sum = 0.0f;
            for (int c = 0; c < 3; ++c) {
                for (int i = 0; i < n; ++i) {
                    values[i] = aligned[i].ptr<cv::Vec3b>(y)[x][c];
                }
                std::vector<float> sorted = values;
                const float med = median_of(sorted);
                med_row[x][c] = static_cast<uchar>(med);

                for (int i = 0; i < n; ++i) {
                    deviations[i] = std::abs(values[i] - med);
                }
                mad_sum += median_of(deviations);
            }
            mad_row[x] = mad_sum / 3.0f;
        }
    }

    // Fraction of samples with an edge at each pixel
    cv::Mat consensus = cv::Mat::zeros(size, CV_32F);
    for (const auto& img : aligned) {
        cv::Mat edges, edges_f;
        cv::Canny(to_gray(img), edges, 50, 150);
        edges.convertTo(edges_f, CV_32F, 1.0 / 255.0);
        consensus += edges_f;
    }
    consensus /= static_cast<double>(std::max(1, n));

    // Robust MAD scaling
    const double q1 = percentile(mad_gray, 25.0);
    const double q3 = percentile(mad_gray, 75.0);
    const double iqr = std::max(1e-6, q3 - q1);

    cv::Mat prob(size, CV_32F);
    for (int y = 0; y < size.height; ++y) {
        const auto* mad_row = mad_gray.ptr<float>(y);
        const auto* cons_row = consensus.ptr<float>(y);
        auto* prob_row = prob.ptr<float>(y);
        for (int x = 0; x < size.width; ++x) {
            const double mad_norm = std::clamp((mad_row[x] - q1) / iqr, 0.0, 3.0) / 3.0;
            prob_row[x] = static_cast<float>((1.0 - mad_norm) * std::pow(cons_row[x], 0.7));
        }
    }

    const double thr = std::max(0.2, percentile(prob, 70.0) * 0.7);
    const cv::Mat raw = prob > thr;

    cv::Mat mask;
    cv::medianBlur(raw, mask, 3);
    const cv::Mat kernel = cv::getStructuringElement(cv::MORPH_ELLIPSE, cv::Size(3, 3));
    cv::morphologyEx(mask, mask, cv::MORPH_OPEN, kernel);
    cv::morphologyEx(mask, mask, cv::MORPH_CLOSE, kernel);

    // One-pixel edge traces do not survive the median filter
    if (cv::countNonZero(mask) == 0 && cv::countNonZero(raw) > 0) {
        spdlog::debug("Consensus cleanup removed every pixel, keeping closed raw mask");
        cv::morphologyEx(raw, mask, cv::MORPH_CLOSE, kernel);
    }

    return Trueform{std::string{}, median, mask};
}

cv::Mat refine_mask_grabcut(const cv::Mat& image_bgr, const cv::Mat& mask) {
    if (image_bgr.empty() || mask.empty() || image_bgr.size() != mask.size()) {
        return mask.clone();
    }

    // GrabCut needs both foreground and background samples
    const int fg = cv::countNonZero(mask);
    if (fg == 0 || fg == static_cast<int>(mask.total())) {
        return mask.clone();
    }

    const cv::Mat kernel = cv::getStructuringElement(cv::MORPH_ELLIPSE, cv::Size(3, 3));

    cv::Mat gc_mask(mask.size(), CV_8UC1, cv::Scalar(cv::GC_PR_BGD));
    gc_mask.setTo(cv::Scalar(cv::GC_PR_FGD), mask > 0);

    cv::Mat core;
    cv::erode(mask > 0, core, kernel);
    gc_mask.setTo(cv::Scalar(cv::GC_FGD), core);

    try {
        ScopedRngState rng(kGrabCutSeed);
        cv::Mat bgd_model, fgd_model;
        cv::grabCut(to_bgr(image_bgr), gc_mask, cv::Rect(), bgd_model, fgd_model, 3,
                    cv::GC_INIT_WITH_MASK);
    } catch (const cv::Exception& e) {
        spdlog::warn("GrabCut refinement failed, keeping raw mask: {}", e.what());
        return mask.clone();
    }

    cv::Mat refined = (gc_mask == cv::GC_FGD) | (gc_mask == cv::GC_PR_FGD);
    cv::morphologyEx(refined, refined, cv::MORPH_OPEN, kernel);
    cv::morphologyEx(refined, refined, cv::MORPH_CLOSE, kernel);

    if (cv::countNonZero(refined) == 0) {
        spdlog::debug("GrabCut removed every pixel, keeping raw mask");
        return mask.clone();
    }
    return refined;
}

Trueform crop_to_mask(const Trueform& tf) {
    std::vector<cv::Point> pts;
    if (!tf.mask.empty()) {
        cv::findNonZero(tf.mask, pts);
    }
    if (pts.empty()) {
        return tf;
    }

    const cv::Rect box = cv::boundingRect(pts);
    return Trueform{tf.key, tf.median(box).clone(), tf.mask(box).clone()};
}

// =============================================================================
// Persistence
// =============================================================================

fs::path trueform_path(const fs::path& dataset_folder, std::string_view key) {
    return dataset_folder / "trueforms" / fmt::format("{}{}", key, kTrueformSuffix);
}

void save_trueform(const fs::path& path, const Trueform& tf) {
    if (tf.median.empty() || tf.mask.empty()) {
        throw std::runtime_error(fmt::format("Empty trueform cannot be saved: {}", path));
    }

    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
        throw std::runtime_error(fmt::format(
            "Cannot create directory {}: {}", path.parent_path(), ec.message()));
    }

    std::vector<cv::Mat> channels;
    cv::split(to_bgr(tf.median), channels);
    cv::Mat alpha = tf.mask > 0;
    channels.push_back(alpha);

    cv::Mat bgra;
    cv::merge(channels, bgra);
    if (!cv::imwrite(path.string(), bgra)) {
        throw std::runtime_error(fmt::format("Failed to write trueform: {}", path));
    }
}

std::optional<Trueform> load_trueform(const fs::path& path, std::string key) {
    cv::Mat bgra = cv::imread(path.string(), cv::IMREAD_UNCHANGED);
    if (bgra.empty()) {
        spdlog::warn("Unreadable trueform ignored: {}", path);
        return std::nullopt;
    }
    if (bgra.channels() != 4 || bgra.depth() != CV_8U) {
        spdlog::warn("Trueform without 8-bit alpha ignored: {}", path);
        return std::nullopt;
    }

    std::vector<cv::Mat> channels;
    cv::split(bgra, channels);

    Trueform tf;
    tf.key = std::move(key);
    cv::merge(std::vector<cv::Mat>{channels[0], channels[1], channels[2]}, tf.median);
    tf.mask = channels[3] > 0;
    return tf;
}

std::vector<cv::Mat> load_dataset_crops(const fs::path& folder) {
    std::error_code ec;
    if (!fs::is_directory(folder, ec)) {
        throw std::runtime_error(fmt::format("Dataset folder not found: {}", folder));
    }

    std::vector<fs::path> files;
    for (const auto& entry : fs::directory_iterator(folder)) {
        if (entry.is_regular_file() && is_image_extension(entry.path())) {
            files.push_back(entry.path());
        }
    }
    std::sort(files.begin(), files.end());

    std::vector<cv::Mat> crops;
    crops.reserve(files.size());
    for (const auto& file : files) {
        cv::Mat img = cv::imread(file.string(), cv::IMREAD_COLOR);
        if (img.empty()) {
            spdlog::warn("Failed to read dataset image: {}", file);
            continue;
        }
        crops.push_back(std::move(img));
    }

    spdlog::info("Loaded {} images from dataset {}", crops.size(), folder);
    return crops;
}

// =============================================================================
// TrueformSet
// =============================================================================

void TrueformSet::put(Trueform tf) {
    std::string key = tf.key;
    m_items.insert_or_assign(std::move(key), std::move(tf));
}

const Trueform* TrueformSet::find(std::string_view key) const {
    auto it = m_items.find(key);
    return it == m_items.end() ? nullptr : &it->second;
}

std::size_t TrueformSet::load(const fs::path& dataset_folder, std::string_view preset) {
    m_items.clear();

    const fs::path dir = dataset_folder / "trueforms";
    std::error_code ec;
    if (preset.empty() || !fs::is_directory(dir, ec)) {
        return 0;
    }

    const std::string prefix = fmt::format("{}_", preset);
    std::vector<fs::path> files;
    for (const auto& entry : fs::directory_iterator(dir)) {
        const std::string name = to_utf8(entry.path().filename());
        if (!entry.is_regular_file() || !ends_with(name, kTrueformSuffix)) continue;

        const std::string key = name.substr(0, name.size() - kTrueformSuffix.size());
        if (key == preset || starts_with(key, prefix)) {
            files.push_back(entry.path());
        }
    }
    std::sort(files.begin(), files.end());

    for (const auto& file : files) {
        const std::string name = to_utf8(file.filename());
        std::string key = name.substr(0, name.size() - kTrueformSuffix.size());
        if (auto tf = load_trueform(file, std::move(key))) {
            put(std::move(*tf));
        }
    }

    spdlog::info("Loaded {} trueforms for preset '{}'", m_items.size(), preset);
    return m_items.size();
}

std::optional<cv::Mat> TrueformSet::mask_for(
    const cv::Mat& frame_bgr,
    const cv::Rect& bbox,
    std::string_view preset) const
{
    if (frame_bgr.empty() || m_items.empty() || preset.empty()) {
        return std::nullopt;
    }

    const cv::Rect box = bbox & cv::Rect(0, 0, frame_bgr.cols, frame_bgr.rows);
    if (box.empty()) {
        return std::nullopt;
    }

    const Trueform* best = find(preset);
    if (!best) {
        const cv::Mat crop_gray = to_gray(frame_bgr(box));
        const std::string prefix = fmt::format("{}_", preset);
        double best_score = -std::numeric_limits<double>::infinity();

        for (const auto& [key, tf] : m_items) {
            if (!starts_with(key, prefix) || tf.median.empty() || tf.mask.empty()) continue;

            cv::Mat med;
            cv::resize(to_gray(tf.median), med, box.size(), 0, 0, cv::INTER_AREA);

            cv::Mat res;
            cv::matchTemplate(crop_gray, med, res, cv::TM_CCOEFF_NORMED);
            double max_val = 0.0;
            cv::minMaxLoc(res, nullptr, &max_val);
            if (!std::isfinite(max_val)) max_val = -1.0;

            if (max_val > best_score) {
                best_score = max_val;
                best = &tf;
            }
        }
        if (best) {
            spdlog::debug("Trueform '{}' selected (ncc={:.3f})", best->key, best_score);
        }
    }

    if (!best || best->mask.empty()) {
        return std::nullopt;
    }

    cv::Mat mask;
    cv::resize(best->mask, mask, box.size(), 0, 0, cv::INTER_NEAREST);
    return mask;
}

// =============================================================================
// Build
// =============================================================================

TrueformSet build_trueforms(const fs::path& dataset_folder, std::string_view preset) {
    auto start_time = std::chrono::high_resolution_clock::now();

    const std::vector<cv::Mat> crops = load_dataset_crops(dataset_folder);
    TrueformSet result;
    if (crops.size() < 2) {
        spdlog::warn("Need at least 2 dataset images to build a trueform, found {}", crops.size());
        return result;
    }

    std::map<OrientationBin, std::vector<cv::Mat>> bins;
    for (const auto& crop : crops) {
        bins[orientation_bin(crop)].push_back(crop);
    }

    for (OrientationBin bin : kOrientationBins) {
        const auto& samples = bins[bin];
        if (samples.size() < 2) {
            spdlog::debug("Bin '{}' has {} samples, skipped", to_string(bin), samples.size());
            continue;
        }

        spdlog::info("Building trueform for bin '{}' with {} samples", to_string(bin), samples.size());
        Trueform tf = compute_consensus(samples);
        tf.mask = refine_mask_grabcut(tf.median, tf.mask);
        tf = crop_to_mask(tf);
        tf.key = fmt::format("{}_{}", preset, to_string(bin));

        const fs::path path = trueform_path(dataset_folder, tf.key);
        save_trueform(path, tf);
        spdlog::info("Saved trueform: {} ({}x{}, {} mask px)",
                     path, tf.mask.cols, tf.mask.rows, cv::countNonZero(tf.mask));
        result.put(std::move(tf));
    }

    if (result.empty()) {
        spdlog::warn("No orientation bin had two samples; collect more varied crops");
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::high_resolution_clock::now() - start_time).count();
    spdlog::debug("build_trueforms: {} trueforms in {} us", result.size(), elapsed);
    return result;
}

}  // namespace cre
