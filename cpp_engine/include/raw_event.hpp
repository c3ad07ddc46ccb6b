/**
 * Arena Tracker - Raw Event
 *
 * A JSON payload pulled out of the client log and tagged with its kind.
 * Produced by the EventExtractor and consumed by the match tracker in one pass.
 */

#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>

namespace arena {

struct RawEvent {
    EventKind kind = EventKind::GAME_STATE;
    nlohmann::json data;

    // Payload's own "timestamp" field, if any (epoch milliseconds)
    std::optional<TimestampMs> timestamp;

    // Last logger-prefix timestamp seen at or before this event
    std::optional<TimestampMs> logger_timestamp;

    int line_number = 0;
    std::string raw_line;    // First 200 bytes of the line that completed the payload
};

} // namespace arena
