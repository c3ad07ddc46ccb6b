/**
 * Arena Tracker - Typed Events
 *
 * Closed set of payload shapes the tracker understands. A RawEvent is
 * decoded into exactly one variant alternative; anything else becomes
 * Unclassified and is dropped by the reducer.
 *
 * Decoding is all-or-nothing: decode_event() either returns a complete
 * value or throws.
 */

#pragma once

#include "raw_event.hpp"
#include "match_data.hpp"
#include <variant>

namespace arena {

// ============================================================================
// MATCH ROOM STATE
// ============================================================================

struct ReservedPlayer {
    std::string player_name;
    std::string user_id;
    std::optional<SeatId> seat_id;
    std::string event_id;
};

struct ResultEntry {
    std::string scope;                   // "MatchScope_Match", "MatchScope_Game"
    std::optional<int> winning_team_id;
    std::optional<std::string> reason;
};

struct MatchStateEvent {
    std::string match_id;                // Empty when the config carries none
    std::string state_type;
    std::vector<ReservedPlayer> players;

    // finalMatchResult
    std::optional<int> winning_team_id;
    std::vector<ResultEntry> results;

    std::optional<TimestampMs> timestamp;
    std::optional<TimestampMs> logger_timestamp;

    bool is_completed() const {
        return state_type == "MatchGameRoomStateType_MatchCompleted";
    }
};

// ============================================================================
// GAME RULES ENGINE
// ============================================================================

struct PlayerLife {
    SeatId seat_id = 0;
    int life_total = 0;
};

struct GameObjectUpdate {
    InstanceId instance_id = 0;
    ObjectFacts facts;
};

struct LegalAction {
    std::optional<SeatId> seat_id;
    std::string action_type;
    std::optional<InstanceId> instance_id;
    std::optional<GrpId> grp_id;
    std::optional<GrpId> ability_grp_id;
    std::string mana_cost;               // Serialized JSON, empty when absent
};

struct ZoneTransferAnnotation {
    std::vector<InstanceId> affected_ids;
    std::optional<ZoneId> zone_src;
    std::optional<ZoneId> zone_dest;
    std::string category;
};

struct GameStateMessage {
    int game_state_id = 0;
    int turn_number = 0;                 // 0 when the message carries no turn info
    std::string phase;
    std::string step;
    std::optional<SeatId> active_player;

    std::optional<std::string> super_format;
    std::optional<std::string> game_type;

    std::vector<PlayerLife> players;
    std::vector<GameObjectUpdate> objects;
    std::vector<LegalAction> actions;
    std::vector<ZoneTransferAnnotation> zone_transfers;
};

struct GreEvent {
    std::vector<GameStateMessage> messages;   // Game-state messages only
    std::optional<TimestampMs> timestamp;
};

// ============================================================================
// DECK
// ============================================================================

struct DeckEvent {
    std::optional<std::string> deck_name;
    std::optional<std::string> deck_id;
    std::optional<std::string> format;
    bool has_summary = false;
    std::optional<std::vector<DeckCard>> main_deck;
};

struct Unclassified {};

using EventPayload = std::variant<MatchStateEvent, GreEvent, DeckEvent, Unclassified>;

// ============================================================================
// DECODING
// ============================================================================

EventPayload decode_event(const RawEvent& event);

MatchStateEvent decode_match_state(const RawEvent& event);
GreEvent decode_gre_event(const RawEvent& event);
GameStateMessage decode_game_state_message(const nlohmann::json& game_state);
DeckEvent decode_deck_event(const RawEvent& event);

} // namespace arena
