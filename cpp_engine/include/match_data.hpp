/**
 * Arena Tracker - Match Aggregate
 *
 * Everything the tracker learns about one match: participants, result,
 * and the ordered logs of actions, life totals and zone transfers.
 */

#pragma once

#include "types.hpp"
#include <map>
#include <set>
#include <tuple>

namespace arena {

/**
 * ObjectFacts - Latest snapshot of one game object.
 *
 * Overwritten (never merged) every time the object is seen again.
 */
struct ObjectFacts {
    std::optional<GrpId> grp_id;
    std::string name;
    std::string type;                    // "GameObjectType_Card", "GameObjectType_Token", ...
    std::vector<std::string> card_types;
    std::vector<std::string> subtypes;
    std::vector<std::string> colors;
    std::optional<int> power;
    std::optional<int> toughness;
    std::optional<SeatId> owner_seat;
    std::optional<SeatId> controller_seat;
};

/**
 * Key used to drop repeated sightings of the same legal action.
 */
using ActionKey = std::tuple<int, std::string, std::optional<InstanceId>>;

/**
 * ActionRecord - One legal option offered to a seat (not necessarily taken).
 */
struct ActionRecord {
    int game_state_id = 0;
    int turn_number = 0;
    std::string phase;
    std::string step;
    std::optional<SeatId> active_player;
    std::optional<SeatId> seat_id;
    std::string action_type;
    std::optional<InstanceId> instance_id;
    std::optional<GrpId> card_grp_id;
    std::optional<GrpId> ability_grp_id;
    std::string mana_cost;               // Serialized JSON, empty when absent
    std::optional<TimestampMs> timestamp;

    ActionKey key() const {
        return ActionKey(game_state_id, action_type, instance_id);
    }
};

/**
 * LifeSnapshot - A (seat, life) pair as reported by one game-state message.
 */
struct LifeSnapshot {
    int game_state_id = 0;
    int turn_number = 0;
    SeatId seat_id = 0;
    int life_total = 0;
};

/**
 * LifeChangeRecord - A snapshot diffed against the seat's previous total.
 *
 * change_amount is unset on the first sighting of a seat and never zero.
 */
struct LifeChangeRecord {
    int game_state_id = 0;
    int turn_number = 0;
    SeatId seat_id = 0;
    int life_total = 0;
    std::optional<int> change_amount;
};

struct ZoneTransferRecord {
    int game_state_id = 0;
    int turn_number = 0;
    InstanceId instance_id = 0;
    std::optional<GrpId> card_grp_id;    // Unset when the instance was never resolved
    std::optional<ZoneId> from_zone;
    std::optional<ZoneId> to_zone;
    std::string category;                // "CastSpell", "Draw", "TokenCreated", ...
};

struct DeckCard {
    GrpId card_id = 0;
    int quantity = 1;
};

/**
 * MatchData - Aggregate for a single match.
 */
struct MatchData {
    std::string match_id;

    // Participants (seat 2 is the local player by convention)
    std::optional<std::string> player_name;
    std::optional<SeatId> player_seat_id;
    std::optional<std::string> player_user_id;
    std::optional<std::string> opponent_name;
    std::optional<SeatId> opponent_seat_id;
    std::optional<std::string> opponent_user_id;

    // Format / event
    std::optional<std::string> event_id;
    std::optional<std::string> format;
    std::optional<std::string> match_type;

    // Deck
    std::optional<std::string> deck_name;
    std::optional<std::string> deck_id;
    std::vector<DeckCard> deck_cards;

    // Outcome
    std::optional<TimestampMs> start_time;
    std::optional<TimestampMs> end_time;
    std::optional<MatchResult> result;
    std::optional<int> winning_team_id;
    std::optional<std::string> winning_reason;
    int total_turns = 0;

    // Ordered logs
    std::vector<ActionRecord> actions;
    std::vector<LifeSnapshot> life_snapshots;
    std::vector<ZoneTransferRecord> zone_transfers;
    std::map<InstanceId, ObjectFacts> card_instances;

    // Keys of recorded actions, kept so repeats are dropped on arrival
    std::set<ActionKey> action_keys;

    MatchData() = default;
    explicit MatchData(std::string id) : match_id(std::move(id)) {}

    bool is_complete() const { return end_time.has_value() || result.has_value(); }

    const ObjectFacts* find_instance(InstanceId instance_id) const {
        auto it = card_instances.find(instance_id);
        return it != card_instances.end() ? &it->second : nullptr;
    }
};

} // namespace arena
