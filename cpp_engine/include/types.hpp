/**
 * Arena Tracker - Core Type Definitions
 *
 * This file defines all enums and basic types used throughout the tracker.
 * String forms match the identifiers the game client writes to its log.
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <unordered_set>
#include <unordered_map>
#include <optional>
#include <memory>

namespace arena {

// ============================================================================
// ENUMS
// ============================================================================

enum class EventKind : uint8_t {
    MATCH_STATE,
    GRE_EVENT,
    COURSE_DECK,
    DECK_UPSERT,
    DECK_SET,
    GAME_STATE
};

// No draw value: the completion event only ever reports a winning team.
enum class MatchResult : uint8_t {
    WIN,
    LOSS
};

enum class ZoneRole : uint8_t {
    BATTLEFIELD,
    STACK,
    LIBRARY,
    OPPONENT_LIBRARY,
    HAND,
    OPPONENT_HAND,
    GRAVEYARD,
    EXILE
};

enum class Actor : uint8_t {
    YOU,
    OPPONENT,
    UNKNOWN
};

// ============================================================================
// TYPE ALIASES
// ============================================================================

using GrpId = int;          // Card definition ID (Arena ID)
using InstanceId = int;     // Per-match game object ID
using ZoneId = int;         // Per-match zone ID, no fixed meaning
using SeatId = int;         // Player slot; the local player is seat 2
using TimestampMs = int64_t;

constexpr SeatId LOCAL_PLAYER_SEAT = 2;

// ============================================================================
// GAME OBJECT TYPE MARKERS
// ============================================================================

namespace object_type {
    constexpr const char* CARD = "GameObjectType_Card";
    constexpr const char* TOKEN = "GameObjectType_Token";
    constexpr const char* EMBLEM = "GameObjectType_Emblem";
    constexpr const char* OMEN = "GameObjectType_Omen";
    constexpr const char* ABILITY = "GameObjectType_Ability";
    constexpr const char* TRIGGER_HOLDER = "GameObjectType_TriggerHolder";
    constexpr const char* REVEALED_CARD = "GameObjectType_RevealedCard";
}

// ============================================================================
// UTILITY FUNCTIONS
// ============================================================================

inline const char* to_string(EventKind kind) {
    switch (kind) {
        case EventKind::MATCH_STATE: return "match_state";
        case EventKind::GRE_EVENT: return "gre_event";
        case EventKind::COURSE_DECK: return "course_deck";
        case EventKind::DECK_UPSERT: return "deck_upsert";
        case EventKind::DECK_SET: return "deck_set";
        case EventKind::GAME_STATE: return "game_state";
        default: return "unknown";
    }
}

inline const char* to_string(MatchResult result) {
    switch (result) {
        case MatchResult::WIN: return "win";
        case MatchResult::LOSS: return "loss";
        default: return "unknown";
    }
}

inline const char* to_string(ZoneRole role) {
    switch (role) {
        case ZoneRole::BATTLEFIELD: return "Battlefield";
        case ZoneRole::STACK: return "Stack";
        case ZoneRole::LIBRARY: return "Library";
        case ZoneRole::OPPONENT_LIBRARY: return "Library (opponent)";
        case ZoneRole::HAND: return "Hand";
        case ZoneRole::OPPONENT_HAND: return "Hand (opponent)";
        case ZoneRole::GRAVEYARD: return "Graveyard";
        case ZoneRole::EXILE: return "Exile";
        default: return "Unknown";
    }
}

inline const char* to_string(Actor actor) {
    switch (actor) {
        case Actor::YOU: return "you";
        case Actor::OPPONENT: return "opponent";
        case Actor::UNKNOWN: return "unknown";
        default: return "unknown";
    }
}

/**
 * Collapse owner-specific roles to the shared role used by the verb table.
 */
inline ZoneRole base_role(ZoneRole role) {
    switch (role) {
        case ZoneRole::OPPONENT_LIBRARY: return ZoneRole::LIBRARY;
        case ZoneRole::OPPONENT_HAND: return ZoneRole::HAND;
        default: return role;
    }
}

} // namespace arena
