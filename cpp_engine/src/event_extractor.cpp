/**
 * Arena Tracker - Event Extractor Implementation
 *
 * Two scan states:
 * - SCANNING: test each line for a logger timestamp, a line that opens a
 *   JSON object, or a JSON suffix after a log prefix
 * - ACCUMULATING: append lines to a buffer until the buffer parses
 */

#include "event_extractor.hpp"
#include "errors.hpp"
#include <filesystem>
#include <iostream>
#include <limits>
#include <regex>

using json = nlohmann::json;

namespace arena {

namespace {

const char* const LOGGER_PREFIX = "[UnityCrossThreadLogger]";
constexpr size_t RAW_LINE_LIMIT = 200;

std::string strip(const std::string& s) {
    const char* ws = " \t\r\n\f\v";
    size_t begin = s.find_first_not_of(ws);
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

std::string join_lines(const std::vector<std::string>& lines) {
    std::string joined;
    for (size_t i = 0; i < lines.size(); i++) {
        if (i > 0) joined += '\n';
        joined += lines[i];
    }
    return joined;
}

// Days since 1970-01-01 for a proleptic Gregorian date
int64_t days_from_civil(int y, int m, int d) {
    y -= m <= 2 ? 1 : 0;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const int64_t yoe = y - era * 400;
    const int64_t doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

int days_in_month(int y, int m) {
    static const int DAYS[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (m == 2) {
        bool leap = (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
        return leap ? 29 : 28;
    }
    return DAYS[m - 1];
}

std::optional<TimestampMs> payload_timestamp(const json& data) {
    auto it = data.find("timestamp");
    if (it == data.end()) {
        return std::nullopt;
    }
    if (it->is_number_unsigned()) {
        uint64_t raw = it->get<uint64_t>();
        if (raw > static_cast<uint64_t>(std::numeric_limits<TimestampMs>::max())) {
            return std::nullopt;
        }
        TimestampMs value = static_cast<TimestampMs>(raw);
        return value != 0 ? std::optional<TimestampMs>(value) : std::nullopt;
    }
    if (it->is_number_integer()) {
        TimestampMs value = it->get<TimestampMs>();
        return value != 0 ? std::optional<TimestampMs>(value) : std::nullopt;
    }
    if (it->is_number_float()) {
        // max() rounds up to 2^63 as a double, so the upper bound is exclusive
        double raw = it->get<double>();
        if (!(raw >= static_cast<double>(std::numeric_limits<TimestampMs>::min()) &&
              raw < static_cast<double>(std::numeric_limits<TimestampMs>::max()))) {
            return std::nullopt;
        }
        TimestampMs value = static_cast<TimestampMs>(raw);
        return value != 0 ? std::optional<TimestampMs>(value) : std::nullopt;
    }
    if (it->is_string()) {
        const std::string& text = it->get_ref<const std::string&>();
        if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos ||
            text.size() > 18) {
            return std::nullopt;
        }
        TimestampMs value = std::stoll(text);
        return value != 0 ? std::optional<TimestampMs>(value) : std::nullopt;
    }
    return std::nullopt;
}

} // namespace

// ============================================================================
// CONSTRUCTION
// ============================================================================

EventExtractor::EventExtractor(const std::string& log_path, ExtractorOptions options)
    : path_(log_path)
    , options_(options) {
    validate_file();

    file_.open(path_, std::ios::in | std::ios::binary);
    if (!file_.is_open()) {
        throw InvalidLogFormatError("Cannot read log file", std::nullopt, path_);
    }
}

void EventExtractor::validate_file() const {
    namespace fs = std::filesystem;

    std::error_code ec;
    if (!fs::exists(path_, ec)) {
        throw LogFileNotFoundError(path_);
    }

    auto size = fs::file_size(path_, ec);
    if (ec) {
        throw InvalidLogFormatError("Cannot read log file", std::nullopt, ec.message());
    }
    if (size == 0) {
        throw InvalidLogFormatError("Log file is empty", std::nullopt, path_);
    }

    std::ifstream head(path_, std::ios::in | std::ios::binary);
    if (!head.is_open()) {
        throw InvalidLogFormatError("Cannot read log file", std::nullopt, path_);
    }

    std::string header(options_.sniff_bytes, '\0');
    head.read(&header[0], static_cast<std::streamsize>(header.size()));
    header.resize(static_cast<size_t>(head.gcount()));
    if (header.empty()) {
        throw InvalidLogFormatError("Cannot read log file", std::nullopt, path_);
    }

    if (header.find("Unity") == std::string::npos &&
        header.find("MTGA") == std::string::npos &&
        header.find("Wizards") == std::string::npos) {
        if (!options_.quiet) {
            std::cerr << "[LogParser] File may not be a valid MTGA log: " << path_ << std::endl;
        }
    }
}

void EventExtractor::reset() {
    file_.clear();
    file_.seekg(0);
    state_ = ScanState::SCANNING;
    buffer_.clear();
    line_number_ = 0;
    last_timestamp_.reset();
}

// ============================================================================
// SCANNING
// ============================================================================

std::optional<RawEvent> EventExtractor::next() {
    std::string line;

    while (std::getline(file_, line)) {
        line_number_++;
        line = sanitize_utf8(line);
        std::string stripped = strip(line);

        auto ts = parse_logger_timestamp(line);
        if (ts.has_value()) {
            last_timestamp_ = ts;
        }

        if (state_ == ScanState::ACCUMULATING) {
            buffer_.push_back(stripped);
            json data = json::parse(join_lines(buffer_), nullptr, false);
            if (!data.is_discarded()) {
                state_ = ScanState::SCANNING;
                buffer_.clear();
                auto event = make_event(std::move(data), stripped);
                if (event.has_value()) {
                    return event;
                }
            }
            continue;
        }

        if (!stripped.empty() && stripped.front() == '{') {
            json data = json::parse(stripped, nullptr, false);
            if (data.is_discarded()) {
                state_ = ScanState::ACCUMULATING;
                buffer_.assign(1, stripped);
                continue;
            }
            auto event = make_event(std::move(data), stripped);
            if (event.has_value()) {
                return event;
            }
            continue;
        }

        auto suffix = extract_trailing_json(stripped);
        if (suffix.has_value()) {
            json data = json::parse(*suffix, nullptr, false);
            if (!data.is_discarded()) {
                auto event = make_event(std::move(data), stripped);
                if (event.has_value()) {
                    return event;
                }
            }
        }
    }

    // An unterminated multi-line buffer at end of file is dropped
    buffer_.clear();
    state_ = ScanState::SCANNING;
    return std::nullopt;
}

std::optional<RawEvent> EventExtractor::make_event(json data, const std::string& line) const {
    auto kind = classify(data);
    if (!kind.has_value()) {
        return std::nullopt;
    }

    RawEvent event;
    event.kind = *kind;
    event.timestamp = payload_timestamp(data);
    event.logger_timestamp = last_timestamp_;
    event.line_number = line_number_;
    event.raw_line = line.substr(0, RAW_LINE_LIMIT);
    event.data = std::move(data);
    return event;
}

// ============================================================================
// STATIC HELPERS
// ============================================================================

std::optional<EventKind> EventExtractor::classify(const json& data) {
    if (!data.is_object()) {
        return std::nullopt;
    }

    if (data.contains("matchGameRoomStateChangedEvent")) {
        return EventKind::MATCH_STATE;
    }
    if (data.contains("greToClientEvent")) {
        return EventKind::GRE_EVENT;
    }
    if (data.contains("CourseDeck") || data.contains("CourseDeckSummary")) {
        return EventKind::COURSE_DECK;
    }

    // Marker checks look at the whole serialized payload, keys and values alike
    const std::string serialized = data.dump();
    if (data.contains("request") && serialized.find("DeckUpsertDeckV2") != std::string::npos) {
        return EventKind::DECK_UPSERT;
    }
    if (data.contains("request") && serialized.find("EventSetDeckV2") != std::string::npos) {
        return EventKind::DECK_SET;
    }
    if (serialized.find("gameStateMessage") != std::string::npos) {
        return EventKind::GAME_STATE;
    }

    return std::nullopt;
}

std::optional<TimestampMs> EventExtractor::parse_logger_timestamp(const std::string& line) {
    if (line.compare(0, std::char_traits<char>::length(LOGGER_PREFIX), LOGGER_PREFIX) != 0) {
        return std::nullopt;
    }

    static const std::regex pattern(
        R"(^\[UnityCrossThreadLogger\](\d+)/(\d+)/(\d+)\s+(\d+):(\d+):(\d+)\s+([AP])M)");

    std::smatch m;
    if (!std::regex_search(line, m, pattern)) {
        return std::nullopt;
    }

    try {
        int month = std::stoi(m[1].str());
        int day = std::stoi(m[2].str());
        int year = std::stoi(m[3].str());
        int hour = std::stoi(m[4].str());
        int minute = std::stoi(m[5].str());
        int second = std::stoi(m[6].str());
        bool pm = m[7].str() == "P";

        if (month < 1 || month > 12 || day < 1 || day > days_in_month(year, month) ||
            hour < 1 || hour > 12 || minute > 59 || second > 61) {
            return std::nullopt;
        }

        // 12 AM is midnight, 12 PM is noon
        int hour24 = hour % 12 + (pm ? 12 : 0);

        int64_t days = days_from_civil(year, month, day);
        int64_t seconds = days * 86400 + hour24 * 3600 + minute * 60 + second;
        return seconds * 1000;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

std::optional<std::string> EventExtractor::extract_trailing_json(const std::string& line) {
    size_t last = line.find_last_not_of(" \t\r\n\f\v");
    if (last == std::string::npos || line[last] != '}') {
        return std::nullopt;
    }

    size_t first = line.find('{');
    if (first == std::string::npos || first >= last) {
        return std::nullopt;
    }

    return line.substr(first, last - first + 1);
}

std::string EventExtractor::sanitize_utf8(const std::string& text) {
    std::string out;
    out.reserve(text.size());

    const size_t n = text.size();
    size_t i = 0;

    while (i < n) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        size_t len = 0;
        uint32_t min_cp = 0;

        if (c < 0x80) {
            out.push_back(static_cast<char>(c));
            i++;
            continue;
        } else if ((c & 0xE0) == 0xC0) {
            len = 2; min_cp = 0x80;
        } else if ((c & 0xF0) == 0xE0) {
            len = 3; min_cp = 0x800;
        } else if ((c & 0xF8) == 0xF0) {
            len = 4; min_cp = 0x10000;
        } else {
            i++;  // Stray continuation or invalid lead byte
            continue;
        }

        if (i + len > n) {
            i++;
            continue;
        }

        uint32_t cp = c & (0xFF >> (len + 1));
        bool valid = true;
        for (size_t k = 1; k < len; k++) {
            unsigned char cc = static_cast<unsigned char>(text[i + k]);
            if ((cc & 0xC0) != 0x80) {
                valid = false;
                break;
            }
            cp = (cp << 6) | (cc & 0x3F);
        }

        if (valid && cp >= min_cp && cp <= 0x10FFFF && !(cp >= 0xD800 && cp <= 0xDFFF)) {
            out.append(text, i, len);
            i += len;
        } else {
            i++;
        }
    }

    return out;
}

} // namespace arena
