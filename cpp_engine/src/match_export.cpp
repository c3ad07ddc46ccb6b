/**
 * Arena Tracker - Match Export Implementation
 */

#include "match_export.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <set>

using json = nlohmann::json;

namespace arena {

namespace {

template <typename T>
json nullable(const std::optional<T>& value) {
    return value.has_value() ? json(*value) : json(nullptr);
}

} // namespace

const std::vector<std::string>& default_significant_action_types() {
    static const std::vector<std::string> types = {
        "ActionType_Cast",
        "ActionType_Play",
        "ActionType_Attack",
        "ActionType_Block",
        "ActionType_Activate",
        "ActionType_Activate_Mana",
        "ActionType_Resolution",
    };
    return types;
}

std::vector<LifeChangeRecord> compute_life_changes(const std::vector<LifeSnapshot>& snapshots) {
    std::vector<LifeChangeRecord> changes;
    std::unordered_map<SeatId, int> previous;

    for (const auto& snap : snapshots) {
        LifeChangeRecord change;
        change.game_state_id = snap.game_state_id;
        change.turn_number = snap.turn_number;
        change.seat_id = snap.seat_id;
        change.life_total = snap.life_total;

        auto it = previous.find(snap.seat_id);
        if (it != previous.end()) {
            int delta = snap.life_total - it->second;
            if (delta == 0) {
                continue;
            }
            change.change_amount = delta;
        }

        previous[snap.seat_id] = snap.life_total;
        changes.push_back(change);
    }

    return changes;
}

std::vector<ActionRecord> significant_actions(const std::vector<ActionRecord>& actions,
                                              const std::vector<std::string>& types) {
    std::vector<ActionRecord> kept;
    std::set<ActionKey> seen;

    for (const auto& action : actions) {
        if (std::find(types.begin(), types.end(), action.action_type) == types.end()) {
            continue;
        }
        if (!seen.insert(action.key()).second) {
            continue;
        }
        kept.push_back(action);
    }
    return kept;
}

std::vector<ZoneTransferRecord> dedupe_zone_transfers(
    const std::vector<ZoneTransferRecord>& transfers) {
    std::vector<ZoneTransferRecord> kept;
    std::set<std::tuple<int, InstanceId, std::string>> seen;

    for (const auto& zt : transfers) {
        if (!seen.insert(std::make_tuple(zt.game_state_id, zt.instance_id, zt.category)).second) {
            continue;
        }
        kept.push_back(zt);
    }
    return kept;
}

std::optional<int64_t> duration_seconds(const MatchData& match) {
    if (!match.start_time.has_value() || !match.end_time.has_value()) {
        return std::nullopt;
    }
    return (*match.end_time - *match.start_time) / 1000;
}

// ============================================================================
// JSON
// ============================================================================

void to_json(json& j, const ObjectFacts& facts) {
    j = json{
        {"grp_id", nullable(facts.grp_id)},
        {"name", facts.name},
        {"type", facts.type},
        {"card_types", facts.card_types},
        {"subtypes", facts.subtypes},
        {"colors", facts.colors},
        {"power", nullable(facts.power)},
        {"toughness", nullable(facts.toughness)},
        {"owner_seat", nullable(facts.owner_seat)},
        {"controller_seat", nullable(facts.controller_seat)},
    };
}

void to_json(json& j, const ActionRecord& action) {
    j = json{
        {"game_state_id", action.game_state_id},
        {"turn_number", action.turn_number},
        {"phase", action.phase},
        {"step", action.step},
        {"active_player", nullable(action.active_player)},
        {"seat_id", nullable(action.seat_id)},
        {"action_type", action.action_type},
        {"instance_id", nullable(action.instance_id)},
        {"card_grp_id", nullable(action.card_grp_id)},
        {"ability_grp_id", nullable(action.ability_grp_id)},
        {"mana_cost", action.mana_cost.empty() ? json(nullptr) : json(action.mana_cost)},
        {"timestamp_ms", nullable(action.timestamp)},
    };
}

void to_json(json& j, const LifeChangeRecord& change) {
    j = json{
        {"game_state_id", change.game_state_id},
        {"turn_number", change.turn_number},
        {"seat_id", change.seat_id},
        {"life_total", change.life_total},
        {"change_amount", nullable(change.change_amount)},
    };
}

void to_json(json& j, const ZoneTransferRecord& transfer) {
    j = json{
        {"game_state_id", transfer.game_state_id},
        {"turn_number", transfer.turn_number},
        {"instance_id", transfer.instance_id},
        {"card_grp_id", nullable(transfer.card_grp_id)},
        {"from_zone", nullable(transfer.from_zone)},
        {"to_zone", nullable(transfer.to_zone)},
        {"category", transfer.category.empty() ? json(nullptr) : json(transfer.category)},
    };
}

void to_json(json& j, const MatchData& match) {
    json deck_cards = json::array();
    for (const auto& card : match.deck_cards) {
        deck_cards.push_back(json{{"card_id", card.card_id}, {"quantity", card.quantity}});
    }

    // JSON object keys must be strings
    json instances = json::object();
    for (const auto& [instance_id, facts] : match.card_instances) {
        instances[std::to_string(instance_id)] = facts;
    }

    j = json{
        {"match_id", match.match_id},
        {"player_name", nullable(match.player_name)},
        {"player_seat_id", nullable(match.player_seat_id)},
        {"player_user_id", nullable(match.player_user_id)},
        {"opponent_name", nullable(match.opponent_name)},
        {"opponent_seat_id", nullable(match.opponent_seat_id)},
        {"opponent_user_id", nullable(match.opponent_user_id)},
        {"event_id", nullable(match.event_id)},
        {"format", nullable(match.format)},
        {"match_type", nullable(match.match_type)},
        {"deck_name", nullable(match.deck_name)},
        {"deck_id", nullable(match.deck_id)},
        {"deck_cards", deck_cards},
        {"start_time_ms", nullable(match.start_time)},
        {"end_time_ms", nullable(match.end_time)},
        {"duration_seconds", nullable(duration_seconds(match))},
        {"result", match.result.has_value() ? json(to_string(*match.result)) : json(nullptr)},
        {"winning_team_id", nullable(match.winning_team_id)},
        {"winning_reason", nullable(match.winning_reason)},
        {"total_turns", match.total_turns},
        {"actions", match.actions},
        {"life_changes", compute_life_changes(match.life_snapshots)},
        {"zone_transfers", match.zone_transfers},
        {"card_instances", instances},
    };
}

void to_json(json& j, const ParseError& error) {
    j = json{
        {"event_kind", to_string(error.event_kind)},
        {"line_number", error.line_number},
        {"message", error.message},
    };
}

json export_parse_result(const ParseResult& result) {
    return json{
        {"matches", result.matches},
        {"errors", result.errors},
    };
}

json export_document(const ParseResult& result,
                     const std::vector<std::string>& significant_types,
                     bool all_actions) {
    json document = export_parse_result(result);
    if (all_actions) {
        return document;
    }

    for (size_t i = 0; i < result.matches.size(); i++) {
        const MatchData& m = result.matches[i];
        document["matches"][i]["actions"] = significant_actions(m.actions, significant_types);
        document["matches"][i]["zone_transfers"] = dedupe_zone_transfers(m.zone_transfers);
    }
    return document;
}

} // namespace arena
