/**
 * @file    annotation_store.cpp
 * @brief   Persistent annotation stores implementation
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#include "core/annotation_store.hpp"
#include "utils/path_formatter.hpp"

#include <opencv2/core/persistence.hpp>
#include <spdlog/spdlog.h>
#include <fmt/format.h>

#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace cre {

namespace {

// =============================================================================
// JSON helpers
// =============================================================================

std::string json_escape(std::string_view text) {
    std::string out;
    out.reserve(text.size() + 2);
    for (char ch : text) {
        switch (ch) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(ch) < 0x20) {
                    out += fmt::format("\\u{:04x}", static_cast<int>(ch));
                } else {
                    out += ch;
                }
        }
    }
    return out;
}

bool is_word_char(char ch) {
    return std::isalnum(static_cast<unsigned char>(ch)) != 0 || ch == '_';
}

/**
 * Replace bare `null` literals with an empty string
 *
 * OpenCV's JSON reader rejects null. Every field reader treats an empty
 * string as a missing value, so the member reads as absent.
 */
std::string replace_null_literals(const std::string& text) {
    std::string out;
    out.reserve(text.size());

    bool in_string = false;
    for (std::size_t i = 0; i < text.size(); ++i) {
        const char ch = text[i];
        if (in_string) {
            out += ch;
            if (ch == '\\' && i + 1 < text.size()) {
                out += text[++i];
            } else if (ch == '"') {
                in_string = false;
            }
            continue;
        }

        if (ch == '"') {
            in_string = true;
        } else if (text.compare(i, 4, "null") == 0 &&
                   (i == 0 || !is_word_char(text[i - 1])) &&
                   (i + 4 >= text.size() || !is_word_char(text[i + 4]))) {
            out += "\"\"";
            i += 3;
            continue;
        }
        out += ch;
    }
    return out;
}

/**
 * Parse one JSON object with OpenCV's persistence layer
 *
 * FileStorage requires a top-level map, which ledger lines always are.
 * Returns an unopened storage for anything it cannot parse.
 */
cv::FileStorage open_json(const std::string& text) {
    try {
        return cv::FileStorage(replace_null_literals(text), cv::FileStorage::READ | cv::FileStorage::MEMORY |
                                     cv::FileStorage::FORMAT_JSON);
    } catch (const cv::Exception& e) {
        spdlog::debug("JSON parse error: {}", e.what());
        return cv::FileStorage();
    }
}

bool is_number(const cv::FileNode& node) {
    return node.isInt() || node.isReal();
}

std::optional<cv::Rect> read_bbox(const cv::FileNode& node) {
    if (!node.isSeq() || node.size() != 4) return std::nullopt;
    int v[4];
    for (int i = 0; i < 4; ++i) {
        const cv::FileNode item = node[i];
        if (!is_number(item)) return std::nullopt;
        v[i] = item.isInt() ? static_cast<int>(item) : static_cast<int>(static_cast<double>(item));
    }
    if (v[2] <= 0 || v[3] <= 0) return std::nullopt;
    return cv::Rect(v[0], v[1], v[2], v[3]);
}

std::optional<int> read_frame(const cv::FileNode& node) {
    if (!node.isInt()) return std::nullopt;
    const int frame = static_cast<int>(node);
    if (frame < 0) return std::nullopt;
    return frame;
}

std::string read_string(const cv::FileNode& node) {
    return node.isString() ? static_cast<std::string>(node) : std::string{};
}

void append_line(const std::filesystem::path& path, const std::string& line) {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
    }

    std::ofstream out(path, std::ios::app | std::ios::binary);
    if (!out) {
        throw std::runtime_error(fmt::format("Cannot open ledger for append: {}", path));
    }
    out << line << '\n';
    out.flush();
    if (!out) {
        throw std::runtime_error(fmt::format("Failed to write ledger: {}", path));
    }
}

/**
 * Write content to <path>.tmp, then rename over path
 */
void write_atomic(const std::filesystem::path& path, const std::string& content) {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
    }

    std::filesystem::path tmp = path;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc | std::ios::binary);
        if (!out) {
            throw std::runtime_error(fmt::format("Cannot create file: {}", tmp));
        }
        out << content;
        out.flush();
        if (!out) {
            throw std::runtime_error(fmt::format("Failed to write file: {}", tmp));
        }
    }

    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        throw std::runtime_error(fmt::format("Cannot replace {}: {}", path, ec.message()));
    }
}

/**
 * Feed every non-empty line of a file to fn(line, line_number)
 */
template <typename Fn>
void for_each_line(const std::filesystem::path& path, Fn&& fn) {
    std::ifstream in(path, std::ios::binary);
    if (!in) return;

    std::string line;
    int line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.find_first_not_of(" \t") == std::string::npos) continue;
        fn(line, line_no);
    }
}

}  // namespace

// =============================================================================
// Line codec
// =============================================================================

namespace ledger {

std::string encode(const DetectionRecord& rec) {
    return fmt::format(
        R"({{"frame": {}, "bbox": [{}, {}, {}, {}], "score": {:.6f}, "template": "{}", "source": "{}"}})",
        rec.frame, rec.bbox.x, rec.bbox.y, rec.bbox.width, rec.bbox.height,
        rec.score, json_escape(rec.template_id), to_string(rec.source));
}

std::string encode(const BadDetectionRecord& rec) {
    std::string out = fmt::format(
        R"({{"frame": {}, "bbox": [{}, {}, {}, {}])",
        rec.frame, rec.bbox.x, rec.bbox.y, rec.bbox.width, rec.bbox.height);
    if (rec.score) {
        out += fmt::format(R"(, "score": {:.6f})", *rec.score);
    }
    out += fmt::format(R"(, "template": "{}", "source": "{}"}})",
                       json_escape(rec.template_id), to_string(rec.source));
    return out;
}

std::optional<DetectionRecord> parse_detection(std::string_view line) {
    cv::FileStorage fs = open_json(std::string(line));
    if (!fs.isOpened()) return std::nullopt;

    const auto frame = read_frame(fs["frame"]);
    const auto bbox = read_bbox(fs["bbox"]);
    if (!frame || !bbox) return std::nullopt;

    DetectionRecord rec;
    rec.frame = *frame;
    rec.bbox = *bbox;

    const cv::FileNode score = fs["score"];
    if (is_number(score)) {
        rec.score = static_cast<float>(static_cast<double>(score));
    }
    rec.template_id = read_string(fs["template"]);

    const std::string source = read_string(fs["source"]);
    if (!source.empty()) {
        const auto parsed = detection_source_from_string(source);
        if (!parsed) return std::nullopt;
        rec.source = *parsed;
    }
    return rec;
}

std::optional<BadDetectionRecord> parse_bad_detection(std::string_view line) {
    cv::FileStorage fs = open_json(std::string(line));
    if (!fs.isOpened()) return std::nullopt;

    const auto frame = read_frame(fs["frame"]);
    const auto bbox = read_bbox(fs["bbox"]);
    if (!frame || !bbox) return std::nullopt;

    BadDetectionRecord rec;
    rec.frame = *frame;
    rec.bbox = *bbox;

    const cv::FileNode score = fs["score"];
    if (is_number(score)) {
        rec.score = static_cast<float>(static_cast<double>(score));
    }
    rec.template_id = read_string(fs["template"]);

    const std::string source = read_string(fs["source"]);
    if (!source.empty()) {
        const auto parsed = reject_source_from_string(source);
        if (!parsed) return std::nullopt;
        rec.source = *parsed;
    }
    return rec;
}

}  // namespace ledger

// =============================================================================
// DetectionStore
// =============================================================================

DetectionStore::DetectionStore(std::filesystem::path ledger_path)
    : m_path(std::move(ledger_path)) {}

std::size_t DetectionStore::load() {
    m_log.clear();
    m_current.clear();

    int skipped = 0;
    for_each_line(m_path, [&](const std::string& line, int line_no) {
        auto rec = ledger::parse_detection(line);
        if (!rec) {
            spdlog::warn("{}:{}: malformed detection record skipped", m_path, line_no);
            ++skipped;
            return;
        }
        m_current[rec->frame] = *rec;
        m_log.push_back(std::move(*rec));
    });

    spdlog::debug("Loaded {} detection records ({} frames, {} skipped) from {}",
                  m_log.size(), m_current.size(), skipped, m_path);
    return m_current.size();
}

void DetectionStore::record(const DetectionRecord& rec) {
    append_line(m_path, ledger::encode(rec));
    m_log.push_back(rec);
    m_current[rec.frame] = rec;
}

std::vector<DetectionRecord> DetectionStore::remove_frame(int frame) {
    std::vector<DetectionRecord> removed;
    std::vector<DetectionRecord> kept;
    kept.reserve(m_log.size());
    for (auto& rec : m_log) {
        if (rec.frame == frame) {
            removed.push_back(rec);
        } else {
            kept.push_back(rec);
        }
    }
    if (removed.empty()) return removed;

    std::string content;
    for (const auto& rec : kept) {
        content += ledger::encode(rec);
        content += '\n';
    }
    write_atomic(m_path, content);

    m_log = std::move(kept);
    m_current.erase(frame);
    spdlog::debug("Removed {} detection records of frame {}", removed.size(), frame);
    return removed;
}

std::optional<DetectionRecord> DetectionStore::current(int frame) const {
    auto it = m_current.find(frame);
    if (it == m_current.end()) return std::nullopt;
    return it->second;
}

std::vector<DetectionRecord> DetectionStore::records_for(int frame) const {
    std::vector<DetectionRecord> out;
    for (const auto& rec : m_log) {
        if (rec.frame == frame) out.push_back(rec);
    }
    return out;
}

std::set<int> DetectionStore::frames() const {
    std::set<int> out;
    for (const auto& [frame, rec] : m_current) {
        out.insert(frame);
    }
    return out;
}

// =============================================================================
// BadDetectionStore
// =============================================================================

BadDetectionStore::BadDetectionStore(std::filesystem::path ledger_path)
    : m_path(std::move(ledger_path)) {}

std::size_t BadDetectionStore::load() {
    m_by_frame.clear();
    m_total = 0;

    for_each_line(m_path, [&](const std::string& line, int line_no) {
        auto rec = ledger::parse_bad_detection(line);
        if (!rec) {
            spdlog::warn("{}:{}: malformed bad-detection record skipped", m_path, line_no);
            return;
        }
        m_by_frame[rec->frame].push_back(std::move(*rec));
        ++m_total;
    });

    spdlog::debug("Loaded {} bad-detection records from {}", m_total, m_path);
    return m_total;
}

void BadDetectionStore::append(const BadDetectionRecord& rec) {
    append_line(m_path, ledger::encode(rec));
    m_by_frame[rec.frame].push_back(rec);
    ++m_total;
}

bool BadDetectionStore::is_rejected(int frame, const cv::Rect& bbox, double iou_threshold) const {
    auto it = m_by_frame.find(frame);
    if (it == m_by_frame.end()) return false;
    for (const auto& bad : it->second) {
        if (iou(bad.bbox, bbox) > iou_threshold) {
            return true;
        }
    }
    return false;
}

const std::vector<BadDetectionRecord>& BadDetectionStore::records_for(int frame) const {
    static const std::vector<BadDetectionRecord> kEmpty;
    auto it = m_by_frame.find(frame);
    return it == m_by_frame.end() ? kEmpty : it->second;
}

// =============================================================================
// GoodFrameRegistry
// =============================================================================

GoodFrameRegistry::GoodFrameRegistry(std::filesystem::path file_path)
    : m_path(std::move(file_path)) {}

std::size_t GoodFrameRegistry::load() {
    m_frames.clear();

    std::ifstream in(m_path, std::ios::binary);
    if (!in) return 0;

    std::ostringstream ss;
    ss << in.rdbuf();
    const std::string content = ss.str();
    if (content.find_first_not_of(" \t\r\n") == std::string::npos) return 0;

    // FileStorage needs a top-level map; the file is a bare array
    cv::FileStorage fs = open_json("{\"frames\": " + content + "}");
    if (!fs.isOpened() || !fs["frames"].isSeq()) {
        spdlog::warn("{}: malformed good-frame list ignored", m_path);
        return 0;
    }

    const cv::FileNode list = fs["frames"];
    for (auto it = list.begin(); it != list.end(); ++it) {
        const cv::FileNode item = *it;
        if (item.isInt() && static_cast<int>(item) >= 0) {
            m_frames.insert(static_cast<int>(item));
        } else {
            spdlog::warn("{}: non-integer entry skipped", m_path);
        }
    }

    spdlog::debug("Loaded {} good frames from {}", m_frames.size(), m_path);
    return m_frames.size();
}

bool GoodFrameRegistry::add(int frame) {
    if (!m_frames.insert(frame).second) return false;
    save();
    return true;
}

bool GoodFrameRegistry::remove(int frame) {
    if (m_frames.erase(frame) == 0) return false;
    save();
    return true;
}

void GoodFrameRegistry::save() const {
    std::string content = "[";
    bool first = true;
    for (int f : m_frames) {
        if (!first) content += ", ";
        content += std::to_string(f);
        first = false;
    }
    content += "]\n";
    write_atomic(m_path, content);
}

}  // namespace cre
