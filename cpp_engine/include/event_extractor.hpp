/**
 * Arena Tracker - Event Extractor
 *
 * Streams the client log line by line and pulls out embedded JSON payloads,
 * whether they sit alone on a line, trail a logger prefix, or span several
 * lines with no continuation marker.
 */

#pragma once

#include "raw_event.hpp"
#include <fstream>

namespace arena {

struct ExtractorOptions {
    bool quiet = false;           // Suppress the format-sniff warning
    size_t sniff_bytes = 4096;    // How much of the file head to sniff for product markers
};

/**
 * EventExtractor - Pull-based scanner over one log file.
 *
 * Construction validates the file and throws on fatal problems:
 * - LogFileNotFoundError if the path does not exist
 * - InvalidLogFormatError if the file is empty or cannot be read
 *
 * A missing product marker in the file head is only a warning.
 */
class EventExtractor {
public:
    explicit EventExtractor(const std::string& log_path, ExtractorOptions options = {});
    ~EventExtractor() = default;

    EventExtractor(const EventExtractor&) = delete;
    EventExtractor& operator=(const EventExtractor&) = delete;

    /**
     * Get the next classified event.
     *
     * Returns nullopt at end of file. Payloads that parse but match no
     * known event signature are skipped silently.
     */
    std::optional<RawEvent> next();

    /**
     * Rewind to the start of the file and clear all scan state.
     */
    void reset();

    const std::string& path() const { return path_; }
    int lines_read() const { return line_number_; }
    bool is_accumulating() const { return state_ == ScanState::ACCUMULATING; }
    std::optional<TimestampMs> last_timestamp() const { return last_timestamp_; }

    // ========================================================================
    // STATIC HELPERS - public for testing and reuse
    // ========================================================================

    /**
     * Map a parsed payload to its event kind by fixed key priority.
     */
    static std::optional<EventKind> classify(const nlohmann::json& data);

    /**
     * Parse a "[UnityCrossThreadLogger]M/D/YYYY h:mm:ss AM" line prefix (UTC).
     */
    static std::optional<TimestampMs> parse_logger_timestamp(const std::string& line);

    /**
     * Return the "{...}" suffix of a line, from the first '{' to a final '}'.
     */
    static std::optional<std::string> extract_trailing_json(const std::string& line);

    /**
     * Drop invalid UTF-8 byte sequences.
     */
    static std::string sanitize_utf8(const std::string& text);

private:
    enum class ScanState {
        SCANNING,
        ACCUMULATING
    };

    std::string path_;
    ExtractorOptions options_;
    std::ifstream file_;

    ScanState state_ = ScanState::SCANNING;
    std::vector<std::string> buffer_;
    int line_number_ = 0;
    std::optional<TimestampMs> last_timestamp_;

    void validate_file() const;
    std::optional<RawEvent> make_event(nlohmann::json data, const std::string& line) const;
};

} // namespace arena
