#include "core/annotation_store.hpp"
#include "core/artifact_cache.hpp"
#include "core/types.hpp"

#include "test_support.hpp"

#include <opencv2/core.hpp>

#include <cmath>
#include <filesystem>
#include <string>

namespace {

using cre::test::check;
namespace fs = std::filesystem;

cre::DetectionRecord make_detection(int frame, cv::Rect bbox, float score, const char* tmpl) {
    cre::DetectionRecord rec;
    rec.frame = frame;
    rec.bbox = bbox;
    rec.score = score;
    rec.template_id = tmpl;
    rec.source = cre::DetectionSource::Auto;
    return rec;
}

void test_iou() {
    check(cre::iou({0, 0, 10, 10}, {0, 0, 10, 10}) == 1.0, "identical boxes have IoU 1");
    check(cre::iou({0, 0, 10, 10}, {20, 20, 5, 5}) == 0.0, "disjoint boxes have IoU 0");
    check(std::abs(cre::iou({0, 0, 10, 10}, {5, 0, 10, 10}) - 50.0 / 150.0) < 1e-9,
          "half-overlapping boxes have IoU 1/3");
    check(cre::iou({0, 0, 0, 10}, {0, 0, 10, 10}) == 0.0, "empty box has IoU 0");
}

void test_ledger_codec() {
    const auto rec = make_detection(7, {10, 20, 30, 40}, 0.9125f, "arrow big@1.00");
    const std::string line = cre::ledger::encode(rec);
    const auto back = cre::ledger::parse_detection(line);
    check(back.has_value(), "encoded detection should parse");
    if (back) {
        check(back->frame == 7 && back->bbox == cv::Rect(10, 20, 30, 40), "frame and bbox survive the ledger");
        check(std::abs(back->score - 0.9125f) < 1e-5f, "score survives the ledger");
        check(back->template_id == "arrow big@1.00", "template id survives the ledger");
    }

    cre::BadDetectionRecord bad;
    bad.frame = 3;
    bad.bbox = {1, 2, 3, 4};
    bad.source = cre::RejectSource::AutoGood;
    const std::string bad_line = cre::ledger::encode(bad);
    check(bad_line.find("score") == std::string::npos, "absent score is omitted");
    check(bad_line.find("\"auto_good\"") != std::string::npos, "reject source is written by name");
    const auto bad_back = cre::ledger::parse_bad_detection(bad_line);
    check(bad_back && !bad_back->score && bad_back->source == cre::RejectSource::AutoGood,
          "bad record without score parses back without one");

    check(!cre::ledger::parse_detection("{not json").has_value(), "broken JSON is rejected");
    check(!cre::ledger::parse_detection(R"({"frame": 1, "bbox": [0, 0, -5, 4]})").has_value(),
          "non-positive bbox size is rejected");
    check(!cre::ledger::parse_detection(R"({"frame": -2, "bbox": [0, 0, 5, 4]})").has_value(),
          "negative frame is rejected");
    check(!cre::ledger::parse_detection(R"({"frame": 1, "bbox": [0, 0, 5]})").has_value(),
          "bbox with three values is rejected");
    check(!cre::ledger::parse_detection(R"({"frame": 1, "bbox": [0, 0, 5, 5], "source": "psychic"})").has_value(),
          "unknown source is rejected");
}

void test_replay_skips_corrupt_lines_and_latest_wins() {
    cre::test::TempDir dir("cre_store");
    const fs::path ledger = dir.path() / "detections.jsonl";

    cre::test::write_text(ledger,
        R"({"frame": 0, "bbox": [1, 1, 10, 10], "score": 0.9, "template": "a@1.00", "source": "auto"})" "\n"
        "garbage that is not json\n"
        "\n"
        R"({"frame": 0, "bbox": [5, 5, 10, 10], "score": 0.95, "template": "a@1.00", "source": "manual"})" "\n"
        R"({"frame": 4, "bbox": [2, 2, 0, 10], "score": 0.9})" "\n"
        R"({"frame": 2, "bbox": [7, 8, 9, 10], "score": 0.8, "template": "b@0.75", "source": "guided"})" "\n");

    cre::DetectionStore store(ledger);
    const std::size_t frames = store.load();
    check(frames == 2, "two frames have valid records");
    check(!store.contains(4), "record with zero width is skipped");

    const auto f0 = store.current(0);
    check(f0 && f0->bbox == cv::Rect(5, 5, 10, 10), "latest record of a frame wins");
    check(f0 && f0->source == cre::DetectionSource::Manual, "source of the latest record is kept");

    const auto f2 = store.current(2);
    check(f2 && f2->source == cre::DetectionSource::Guided, "guided source is parsed");
}

void test_remove_frame_rewrites_ledger() {
    cre::test::TempDir dir("cre_store");
    const fs::path ledger = dir.path() / "detections.jsonl";

    {
        cre::DetectionStore store(ledger);
        store.load();
        store.record(make_detection(1, {0, 0, 10, 10}, 0.9f, "a@1.00"));
        store.record(make_detection(2, {5, 5, 10, 10}, 0.8f, "a@1.00"));
        store.record(make_detection(1, {1, 1, 10, 10}, 0.95f, "a@1.00"));

        const auto removed = store.remove_frame(1);
        check(removed.size() == 2, "both records of the frame are returned");
        check(removed.size() == 2 && removed.front().bbox == cv::Rect(0, 0, 10, 10),
              "removed records come oldest first");
        check(!store.contains(1), "removed frame has no current record");
        check(store.remove_frame(9).empty(), "removing an unknown frame is a no-op");
        check(!fs::exists(fs::path(ledger.string() + ".tmp")), "temporary rewrite file is gone");
    }

    cre::DetectionStore reloaded(ledger);
    check(reloaded.load() == 1, "rewritten ledger holds only the other frame");
    check(reloaded.contains(2) && !reloaded.contains(1), "rewrite survives a reload");
}

void test_bad_store_rejects_by_iou() {
    cre::test::TempDir dir("cre_store");
    const fs::path ledger = dir.path() / "bad_detections.jsonl";

    {
        cre::BadDetectionStore bad(ledger);
        bad.load();
        cre::BadDetectionRecord rec;
        rec.frame = 10;
        rec.bbox = {100, 100, 40, 40};
        rec.score = 0.92f;
        rec.template_id = "a@1.00";
        bad.append(rec);
    }

    cre::BadDetectionStore bad(ledger);
    check(bad.load() == 1, "bad ledger replays its record");
    check(bad.is_rejected(10, {102, 101, 40, 40}, 0.3), "strongly overlapping box is rejected");
    check(!bad.is_rejected(10, {160, 160, 40, 40}, 0.3), "distant box is not rejected");
    check(!bad.is_rejected(11, {100, 100, 40, 40}, 0.3), "rejection is per frame");

    // Identical box: IoU 1.0 is not above 1.0
    check(!bad.is_rejected(10, {100, 100, 40, 40}, 1.0), "threshold is strict");
    check(bad.records_for(10).size() == 1 && bad.records_for(3).empty(), "records are grouped per frame");
}

void test_null_values_read_as_absent() {
    const std::string line =
        R"({"frame": 3, "bbox": [1, 2, 5, 5], "score": null, "template": "", "source": "bad_click"})";
    const auto rec = cre::ledger::parse_bad_detection(line);
    check(rec.has_value(), "bad click with a null score parses");
    check(rec && !rec->score && rec->source == cre::RejectSource::BadClick, "null score reads as absent");

    const auto named = cre::ledger::parse_bad_detection(
        R"({"frame": 3, "bbox": [1, 2, 5, 5], "score": null, "template": "null", "source": "bad_click"})");
    check(named && named->template_id == "null", "the word null inside a string is kept");

    check(!cre::ledger::parse_detection(R"({"frame": null, "bbox": [1, 2, 5, 5]})").has_value(),
          "null frame is still rejected");

    cre::test::TempDir dir("cre_store");
    const fs::path ledger = dir.path() / "bad_detections.jsonl";
    cre::test::write_text(ledger, line + "\n");

    cre::BadDetectionStore bad(ledger);
    check(bad.load() == 1, "ledger with null scores loads");
    check(bad.is_rejected(3, {1, 2, 5, 5}, 0.3), "box with a null score is still rejected");
}

void test_good_frames_persist() {
    cre::test::TempDir dir("cre_store");
    const fs::path file = dir.path() / "good_frames.json";

    {
        cre::GoodFrameRegistry good(file);
        check(good.load() == 0, "missing file loads as empty");
        check(good.add(12), "first mark returns true");
        check(!good.add(12), "second mark returns false");
        check(good.add(3), "another frame can be marked");
        check(good.remove(12), "unmark returns true for a marked frame");
        check(!good.remove(40), "unmark returns false for an unmarked frame");
    }

    cre::GoodFrameRegistry reloaded(file);
    check(reloaded.load() == 1, "good frames survive a reload");
    check(reloaded.contains(3) && !reloaded.contains(12), "reloaded set matches the last save");

    cre::test::write_text(file, "[1, \"x\", 5]");
    cre::GoodFrameRegistry mixed(file);
    check(mixed.load() == 2, "non-integer entries are skipped");

    cre::test::write_text(file, "{{{");
    cre::GoodFrameRegistry broken(file);
    check(broken.load() == 0, "malformed file loads as empty");
}

void test_cache_layout() {
    const fs::path root = cre::ArtifactCache::root_for("/videos/demo clip.mp4", {});
    check(root == fs::path("/videos/cursor_cache/demo clip"), "cache sits next to the video");
    check(cre::ArtifactCache::root_for("/videos/a.mp4", "/tmp/x") == fs::path("/tmp/x/cursor_cache/a"),
          "cache parent can be overridden");

    cre::test::TempDir dir("cre_cache");
    cre::ArtifactCache cache(dir.path() / "cursor_cache" / "v");
    check(cache.mask_path(42).filename() == "000042.png", "artifact names are zero padded");
    check(cache.detections_ledger().parent_path().filename() == "detections", "ledgers live under detections/");

    cv::Mat mask(20, 30, CV_8UC1, cv::Scalar(0));
    mask(cv::Rect(5, 5, 10, 10)).setTo(255);
    cache.save_mask(42, mask);
    check(cache.has_mask(42) && cache.count_masks() == 1, "saved mask is found");

    const auto loaded = cache.load_mask(42);
    check(loaded && cv::countNonZero(*loaded) == 100, "mask round-trips losslessly");
    check(!cache.load_mask(43).has_value(), "missing mask loads as nullopt");

    cre::test::write_text(cache.inpaint_path(5), "not a png");
    check(!cache.load_inpaint(5).has_value(), "unreadable artifact loads as nullopt");

    check(cache.remove_mask(42), "remove returns true for an existing mask");
    check(!cache.remove_mask(42), "remove returns false once gone");
}

}  // namespace

int main() {
    test_iou();
    test_ledger_codec();
    test_replay_skips_corrupt_lines_and_latest_wins();
    test_remove_frame_rewrites_ledger();
    test_bad_store_rejects_by_iou();
    test_null_values_read_as_absent();
    test_good_frames_persist();
    test_cache_layout();

    return cre::test::finish("store_tests");
}
