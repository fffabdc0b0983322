#include "core/artifact_cache.hpp"
#include "core/cursor_session.hpp"
#include "core/engine_config.hpp"
#include "core/template_library.hpp"
#include "core/types.hpp"

#include "test_support.hpp"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <cstdlib>
#include <filesystem>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace {

using cre::test::check;
namespace fs = std::filesystem;

constexpr int kFrames = 12;
const cv::Size kFrameSize(160, 120);

struct Clip {
    cv::Mat background;
    cv::Mat cursor;
    std::vector<cv::Point> positions;
    std::vector<cv::Mat> frames;

    Clip() {
        background = cre::test::make_background(kFrameSize, cv::Scalar(150, 100, 70));
        cursor = cre::test::make_cursor(24);
        for (int i = 0; i < kFrames; ++i) {
            positions.emplace_back(10 + 8 * i, 20 + 5 * i);
        }
        frames = cre::test::make_cursor_video(background, cursor, positions);
    }

    [[nodiscard]] cv::Rect box(int frame) const {
        return {positions[static_cast<std::size_t>(frame)], cursor.size()};
    }

    [[nodiscard]] cre::TemplateLibrary templates() const {
        cv::Mat gray;
        cv::cvtColor(cursor, gray, cv::COLOR_BGR2GRAY);
        cre::TemplateLibrary lib;
        lib.add("arrow", gray);
        return lib;
    }
};

cre::EngineConfig test_config() {
    cre::EngineConfig cfg;
    cfg.matcher.threshold = 0.8;
    cfg.matcher.scales = {1.0};
    cfg.mask.dilation = 5;
    cfg.inpaint.method = cre::InpaintMethod::Telea;
    return cfg;
}

std::vector<int> all_frames() {
    std::vector<int> frames;
    for (int i = 0; i < kFrames; ++i) frames.push_back(i);
    return frames;
}

void test_detect_and_persist() {
    Clip clip;
    cre::test::TempDir dir("cre_session");
    const fs::path root = dir.path() / "cursor_cache" / "clip";
    cre::test::MemoryFrameSource source(clip.frames);

    {
        cre::CursorSession session(source, root, test_config());
        session.set_templates(clip.templates());

        const auto report = session.compute_all_detections(all_frames());
        check(report.size() == kFrames, "every frame is reported");
        check(report.count(cre::FrameOutcome::Detected) == kFrames, "cursor detected on every frame");

        const auto det = session.detect(7);
        check(det && cre::iou(det->bbox, clip.box(7)) > 0.9, "detection lands on the cursor");
        check(det && det->source == cre::DetectionSource::Auto, "matcher results are auto detections");

        const auto again = session.compute_all_detections(all_frames());
        check(again.count(cre::FrameOutcome::Cached) == kFrames, "second run reuses stored detections");
    }

    cre::CursorSession reopened(source, root, test_config());
    check(reopened.detections().size() == kFrames, "detections survive a new session");
    check(reopened.progress().detections == kFrames, "progress counts stored detections");
}

void test_rejection_suppresses_redetection() {
    Clip clip;
    cre::test::TempDir dir("cre_session");
    cre::test::MemoryFrameSource source(clip.frames);
    cre::CursorSession session(source, dir.path() / "cache", test_config());
    session.set_templates(clip.templates());

    const auto det = session.detect(10);
    check(det.has_value(), "frame 10 has a detection before rejection");
    if (!det) return;

    (void)session.synthesize_mask(10);
    check(session.cache().has_mask(10), "mask written before rejection");

    session.reject(10, det->bbox);
    check(!session.detections().contains(10), "rejection removes the stored detection");
    check(!session.cache().has_mask(10), "rejection removes the mask");
    check(session.bad_detections().records_for(10).size() == 1, "rejected detection moves to the bad ledger");

    const auto redo = session.detect(10, true);
    check(!redo || cre::iou(redo->bbox, det->bbox) <= 0.3, "rejected box is not detected again");

    // Rejecting a box that overlaps nothing stores the box itself
    session.reject(3, {0, 0, 10, 10});
    const auto& bad3 = session.bad_detections().records_for(3);
    check(bad3.size() == 1 && bad3.front().bbox == cv::Rect(0, 0, 10, 10) && !bad3.front().score,
          "a box without a matching detection is recorded as given");
}

void test_good_frame_is_untouched() {
    Clip clip;
    cre::test::TempDir dir("cre_session");
    cre::test::MemoryFrameSource source(clip.frames);
    cre::CursorSession session(source, dir.path() / "cache", test_config());
    session.set_templates(clip.templates());

    (void)session.compute_all_detections(all_frames());
    (void)session.compute_all_masks(all_frames());
    check(session.cache().has_mask(5), "frame 5 has a mask before it is marked good");

    session.mark_good(5);
    check(session.good_frames().contains(5), "frame 5 is marked good");
    check(!session.detections().contains(5), "good frame has no detection");
    check(!session.cache().has_mask(5), "good frame has no mask");
    const auto& bad = session.bad_detections().records_for(5);
    check(bad.size() == 1 && bad.front().source == cre::RejectSource::AutoGood,
          "detection of a good frame moves to the bad ledger as auto_good");

    check(!session.detect(5).has_value(), "good frame is never detected");
    check(!session.synthesize_mask(5).has_value(), "good frame never gets a mask");

    const auto report = session.compute_all_inpaint(all_frames());
    check(report.outcome_for(5) == cre::FrameOutcome::SkippedGood, "good frame is skipped by inpaint");

    const auto out = session.cache().load_inpaint(5);
    check(out && cre::test::mats_equal(*out, clip.frames[5]), "good frame output equals the source frame");

    check(session.unmark_good(5), "unmark returns true");
    check(!session.unmark_good(5), "second unmark returns false");
}

void test_batches_are_idempotent() {
    Clip clip;
    cre::test::TempDir dir("cre_session");
    cre::test::MemoryFrameSource source(clip.frames);
    cre::CursorSession session(source, dir.path() / "cache", test_config());
    session.set_templates(clip.templates());

    const auto masks = session.compute_all_masks(all_frames());
    check(masks.count(cre::FrameOutcome::MaskWritten) == kFrames, "first mask run writes every mask");

    const auto inpainted = session.compute_all_inpaint(all_frames());
    check(inpainted.count(cre::FrameOutcome::Filled) == kFrames, "first inpaint run fills every frame");

    std::vector<std::vector<char>> mask_bytes, inpaint_bytes;
    for (int i = 0; i < kFrames; ++i) {
        mask_bytes.push_back(cre::test::read_bytes(session.cache().mask_path(i)));
        inpaint_bytes.push_back(cre::test::read_bytes(session.cache().inpaint_path(i)));
    }

    const auto masks2 = session.compute_all_masks(all_frames());
    const auto inpainted2 = session.compute_all_inpaint(all_frames());
    check(masks2.count(cre::FrameOutcome::Cached) == kFrames, "second mask run is all cached");
    check(inpainted2.count(cre::FrameOutcome::Cached) == kFrames, "second inpaint run is all cached");

    bool identical = true;
    for (int i = 0; i < kFrames; ++i) {
        identical = identical &&
            cre::test::read_bytes(session.cache().mask_path(i)) == mask_bytes[static_cast<std::size_t>(i)] &&
            cre::test::read_bytes(session.cache().inpaint_path(i)) == inpaint_bytes[static_cast<std::size_t>(i)];
    }
    check(identical, "cached artifacts are byte-identical after a second run");

    const auto forced = session.compute_all_masks({0, 1}, true);
    check(forced.count(cre::FrameOutcome::MaskWritten) == 2, "force recomputes cached masks");

    const auto cleaned = session.fill(6);
    check(cleaned.has_value(), "fill returns the cached result");
    if (cleaned) {
        const cv::Vec3b px = (*cleaned).at<cv::Vec3b>(clip.box(6).y + 12, clip.box(6).x + 6);
        const cv::Vec3b bg = clip.background.at<cv::Vec3b>(clip.box(6).y + 12, clip.box(6).x + 6);
        check(std::abs(px[0] - bg[0]) < 40 && std::abs(px[2] - bg[2]) < 40, "white cursor pixels are painted over");
    }
}

void test_temporal_inpaint() {
    Clip clip;
    cre::test::TempDir dir("cre_session");
    cre::test::MemoryFrameSource source(clip.frames);

    auto cfg = test_config();
    cfg.inpaint.method = cre::InpaintMethod::Temporal;
    cre::CursorSession session(source, dir.path() / "cache", cfg);
    session.set_templates(clip.templates());

    (void)session.compute_all_masks(all_frames());
    const auto report = session.compute_all_inpaint(all_frames());
    check(report.count(cre::FrameOutcome::Filled) + report.count(cre::FrameOutcome::FallbackUsed) == kFrames,
          "every frame is inpainted");
    check(report.count(cre::FrameOutcome::Filled) == kFrames, "moving cursor leaves donors for every frame");

    const auto out = session.cache().load_inpaint(6);
    check(out.has_value(), "temporal result is cached");
    if (out) {
        const cv::Rect hole = clip.box(6);
        cv::Mat diff;
        cv::absdiff((*out)(hole), clip.background(hole), diff);
        check(cv::mean(diff)[0] < 2.0, "temporal fill restores the background under the cursor");
    }
}

void test_navigation_and_guided_placement() {
    Clip clip;
    cre::test::TempDir dir("cre_session");
    cre::test::MemoryFrameSource source(clip.frames);
    cre::CursorSession session(source, dir.path() / "cache", test_config());
    session.set_templates(clip.templates());

    (void)session.detect(0);
    (void)session.detect(1);
    session.mark_good(2);

    check(session.next_missing_detection(0) == 3, "next missing skips detected and good frames");
    check(session.next_missing_detection(-1) == 3, "search starts after the given frame");
    check(session.next_missing_detection(kFrames - 1) == 3, "search wraps around");
    check(session.next_missing_detection(std::numeric_limits<int>::max()) == 8,
          "a start index at the int limit wraps without overflow");

    const auto rec = session.place_guided(2, {5, 5});
    check(rec.source == cre::DetectionSource::Guided && rec.score == 1.0f, "guided detection has score 1");
    check(rec.bbox == cv::Rect(0, 0, 85, 85), "guided box is clamped into the frame");
    check(!session.good_frames().contains(2), "guided placement clears the good mark");
    check(session.cache().has_mask(2), "guided placement writes the mask immediately");
    check(session.detections().current(2).has_value(), "guided detection is stored");

    const auto far = session.place_guided(4, {200, 200});
    check(far.bbox == cv::Rect(kFrameSize.width - 85, kFrameSize.height - 85, 85, 85),
          "guided box near the far corner stays inside the frame");

    bool threw = false;
    try {
        (void)session.place_guided(kFrames + 5, {10, 10});
    } catch (const std::runtime_error&) {
        threw = true;
    }
    check(threw, "guided placement on a missing frame throws");

    const auto p = session.progress();
    check(p.frame_count == kFrames && p.good_frames == 0, "progress reflects the session");
    check(p.detections == 4, "progress counts detected and guided frames");
}

void test_dataset_operations() {
    Clip clip;
    cre::test::TempDir dir("cre_session");
    const fs::path dataset = dir.path() / "dataset";
    fs::create_directories(dataset);
    cv::imwrite((dataset / "arrow.png").string(), clip.cursor);

    cre::test::MemoryFrameSource source(clip.frames);

    {
        cre::CursorSession no_dataset(source, dir.path() / "cache_a", test_config());
        bool threw = false;
        try {
            (void)no_dataset.build_trueforms();
        } catch (const std::runtime_error&) {
            threw = true;
        }
        check(threw, "building trueforms without a dataset throws");
        check(no_dataset.load_dataset(dataset) == 1, "load_dataset reads the template images");
        check(no_dataset.detect(0).has_value(), "templates from the dataset detect the cursor");
    }

    auto cfg = test_config();
    cfg.dataset.folder = dataset;
    cfg.dataset.preset = "unit";
    cre::CursorSession session(source, dir.path() / "cache_b", cfg);
    check(session.templates().size() == 1, "configured dataset is loaded on open");

    const std::size_t harvested = session.harvest_samples(3, 3);
    check(harvested == 3, "harvest stops at max_samples");

    std::size_t crops = 0;
    for (const auto& entry : fs::directory_iterator(dataset)) {
        if (entry.path().filename().string().rfind("cursor_f", 0) == 0) ++crops;
    }
    check(crops == 3, "harvested crops are saved to the dataset");

    const std::size_t built = session.build_trueforms();
    check(built == session.trueforms().size() || built == 0, "built trueforms become active");
}

void test_export_needs_writable_output() {
    Clip clip;
    cre::test::TempDir dir("cre_session");
    cre::test::MemoryFrameSource source(clip.frames);
    cre::CursorSession session(source, dir.path() / "cache", test_config());

    bool threw = false;
    try {
        session.export_mask_video(dir.path() / "missing" / "dir" / "masks.avi");
    } catch (const std::runtime_error&) {
        threw = true;
    }
    check(threw, "unwritable mask video throws");
}

/**
 * Frame source that requests cancellation when a given frame is read
 */
class CancelOnReadSource final : public cre::IFrameSource {
public:
    CancelOnReadSource(std::vector<cv::Mat> frames, int cancel_at)
        : m_inner(std::move(frames)), m_cancel_at(cancel_at) {}

    void attach(cre::CursorSession* session) { m_session = session; }

    [[nodiscard]] std::optional<cv::Mat> read_frame(int index) override {
        if (m_session && index == m_cancel_at) {
            m_session->cancel_batch();
        }
        return m_inner.read_frame(index);
    }

    [[nodiscard]] int frame_count() const noexcept override { return m_inner.frame_count(); }
    [[nodiscard]] double fps() const noexcept override { return m_inner.fps(); }
    [[nodiscard]] int width() const noexcept override { return m_inner.width(); }
    [[nodiscard]] int height() const noexcept override { return m_inner.height(); }

private:
    cre::test::MemoryFrameSource m_inner;
    int m_cancel_at;
    cre::CursorSession* m_session{nullptr};
};

void test_cancel_stops_between_frames() {
    Clip clip;
    cre::test::TempDir dir("cre_session");
    CancelOnReadSource source(clip.frames, 4);
    cre::CursorSession session(source, dir.path() / "cache", test_config());
    session.set_templates(clip.templates());
    source.attach(&session);

    const auto report = session.compute_all_masks(all_frames());
    check(report.was_cancelled, "batch reports the cancellation");
    check(report.size() == 5, "the frame in progress finishes, later frames are not reported");
    check(report.count(cre::FrameOutcome::MaskWritten) == 5, "frames before the cancel are processed");
    check(session.cache().count_masks() == 5, "exactly the processed frames have masks");
    check(!session.cache().has_mask(5) && !report.outcome_for(5).has_value(), "frame after the cancel is untouched");

    source.attach(nullptr);
    const auto resumed = session.compute_all_masks(all_frames());
    check(!resumed.was_cancelled, "the next batch starts uncancelled");
    check(resumed.count(cre::FrameOutcome::Cached) == 5 &&
          resumed.count(cre::FrameOutcome::MaskWritten) == kFrames - 5,
          "a resumed batch keeps earlier artifacts and finishes the rest");
}

void test_unmark_good_drops_source_copy() {
    Clip clip;
    cre::test::TempDir dir("cre_session");
    cre::test::MemoryFrameSource source(clip.frames);
    cre::CursorSession session(source, dir.path() / "cache", test_config());
    session.set_templates(clip.templates());

    session.mark_good(5);
    const auto good = session.compute_all_inpaint({5});
    check(good.outcome_for(5) == cre::FrameOutcome::SkippedGood, "good frame is skipped");
    check(session.cache().has_inpaint(5), "good frame output is its source copy");

    check(session.unmark_good(5), "frame 5 was marked");
    check(!session.cache().has_inpaint(5), "unmark drops the source copy");

    const auto redone = session.compute_all_inpaint({5});
    check(redone.outcome_for(5) == cre::FrameOutcome::Filled, "unmarked frame is inpainted again");
    const auto out = session.cache().load_inpaint(5);
    check(out && !cre::test::mats_equal(*out, clip.frames[5]), "cursor is removed after unmark");
}

void test_new_detection_invalidates_output() {
    Clip clip;
    cre::test::TempDir dir("cre_session");
    cre::test::MemoryFrameSource source(clip.frames);
    cre::CursorSession session(source, dir.path() / "cache", test_config());

    // No templates yet: the source is cached as the output
    const auto first = session.compute_all_inpaint({3});
    check(first.outcome_for(3) == cre::FrameOutcome::SkippedNoDetection, "frame without detection is passed through");
    check(session.cache().has_inpaint(3), "pass-through output is cached");

    session.set_templates(clip.templates());
    check(session.detect(3).has_value(), "cursor is detected once templates exist");
    check(!session.cache().has_inpaint(3), "a new detection drops the pass-through output");

    const auto second = session.compute_all_inpaint({3});
    check(second.outcome_for(3) == cre::FrameOutcome::Filled, "frame is inpainted after its detection");
    const auto out = session.cache().load_inpaint(3);
    check(out && !cre::test::mats_equal(*out, clip.frames[3]), "output differs from the source frame");

    const auto remasked = session.compute_all_masks({3}, true);
    check(remasked.outcome_for(3) == cre::FrameOutcome::MaskWritten, "forced mask is rewritten");
    check(!session.cache().has_inpaint(3), "a rewritten mask drops the inpainted frame");
    const auto third = session.compute_all_inpaint({3});
    check(third.outcome_for(3) == cre::FrameOutcome::Filled, "inpaint follows the new mask");
}

void test_rejected_match_is_not_a_search_hint() {
    const cv::Size size(240, 120);
    const cv::Mat bg = cre::test::make_background(size, cv::Scalar(150, 100, 70));
    const cv::Mat cursor = cre::test::make_cursor(24);

    // Static icon that resembles the cursor closely enough to pass the threshold
    cv::Mat icon = cursor.clone();
    cv::rectangle(icon, cv::Rect(3, 9, 6, 6), cv::Scalar(128, 128, 128), cv::FILLED);

    std::vector<cv::Mat> frames = {bg.clone(), bg.clone()};
    icon.copyTo(frames[0](cv::Rect(20, 20, 24, 24)));
    icon.copyTo(frames[1](cv::Rect(20, 20, 24, 24)));
    cursor.copyTo(frames[1](cv::Rect(180, 80, 24, 24)));

    cre::test::TempDir dir("cre_session");
    cre::test::MemoryFrameSource source(frames);
    cre::CursorSession session(source, dir.path() / "cache", test_config());

    cv::Mat gray;
    cv::cvtColor(cursor, gray, cv::COLOR_BGR2GRAY);
    cre::TemplateLibrary lib;
    lib.add("arrow", gray);
    session.set_templates(std::move(lib));

    session.reject(0, {20, 20, 24, 24});
    check(!session.detect(0).has_value(), "icon on frame 0 is rejected");

    const auto next = session.detect(1);
    check(next && next->bbox == cv::Rect(180, 80, 24, 24),
          "next frame searches the whole frame, not around the rejected icon");
}

void test_failed_reject_keeps_detection() {
    Clip clip;
    cre::test::TempDir dir("cre_session");
    cre::test::MemoryFrameSource source(clip.frames);
    cre::CursorSession session(source, dir.path() / "cache", test_config());
    session.set_templates(clip.templates());

    const auto det = session.detect(10);
    check(det.has_value(), "frame 10 is detected");
    if (!det) return;

    // A directory where the bad ledger belongs makes the append fail
    fs::create_directories(session.cache().bad_detections_ledger());

    bool threw = false;
    try {
        session.reject(10, det->bbox);
    } catch (const std::runtime_error&) {
        threw = true;
    }
    check(threw, "unwritable bad ledger throws");
    check(session.detections().contains(10), "detection survives a failed rejection");
}

}  // namespace

int main() {
    test_detect_and_persist();
    test_rejection_suppresses_redetection();
    test_good_frame_is_untouched();
    test_batches_are_idempotent();
    test_temporal_inpaint();
    test_navigation_and_guided_placement();
    test_dataset_operations();
    test_export_needs_writable_output();
    test_cancel_stops_between_frames();
    test_unmark_good_drops_source_copy();
    test_new_detection_invalidates_output();
    test_rejected_match_is_not_a_search_hint();
    test_failed_reject_keeps_detection();

    return cre::test::finish("session_tests");
}
