/**
 * Arena Tracker - C++ Implementation
 *
 * Reads the MTG Arena client log and reconstructs per-match statistics:
 * participants, result, deck, legal actions, life totals and zone transfers,
 * plus a narrated replay built from inferred zone roles.
 *
 * Include this header to get access to the complete tracker API.
 */

#pragma once

// Core types
#include "types.hpp"
#include "errors.hpp"

// Log reading
#include "raw_event.hpp"
#include "event_extractor.hpp"
#include "events.hpp"

// Match aggregation
#include "match_data.hpp"
#include "match_tracker.hpp"
#include "match_export.hpp"

// Cards
#include "card_database.hpp"
#include "card_classifier.hpp"

// Zones and replay
#include "zone_inference.hpp"
#include "replay_logger.hpp"

// Configuration
#include "config.hpp"

namespace arena {

/**
 * Version information.
 */
constexpr int VERSION_MAJOR = 1;
constexpr int VERSION_MINOR = 0;
constexpr int VERSION_PATCH = 0;

inline std::string get_version() {
    return std::to_string(VERSION_MAJOR) + "." +
           std::to_string(VERSION_MINOR) + "." +
           std::to_string(VERSION_PATCH);
}

} // namespace arena
