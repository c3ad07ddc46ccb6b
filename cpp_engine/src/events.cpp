/**
 * Arena Tracker - Typed Event Decoding
 */

#include "events.hpp"
#include "json_fields.hpp"

using json = nlohmann::json;

namespace arena {

using namespace json_fields;

namespace {

const char* const GAME_STATE_MESSAGE = "GREMessageType_GameStateMessage";
const char* const ZONE_TRANSFER = "AnnotationType_ZoneTransfer";

std::vector<std::string> string_list(const json& obj, const char* key) {
    std::vector<std::string> out;
    for (const auto& v : array_or_empty(obj, key)) {
        out.push_back(v.get<std::string>());
    }
    return out;
}

// The client writes "name" as a localization id; keep whatever it wrote as text
std::string name_field(const json& obj) {
    if (!has(obj, "name")) return "";
    const auto& v = obj.at("name");
    return v.is_string() ? v.get<std::string>() : v.dump();
}

std::optional<int> first_int(const json& detail) {
    const auto& values = array_or_empty(detail, "valueInt32");
    if (values.empty() || values[0].is_null()) return std::nullopt;
    return values[0].get<int>();
}

std::optional<std::string> first_string(const json& detail) {
    const auto& values = array_or_empty(detail, "valueString");
    if (values.empty() || values[0].is_null()) return std::nullopt;
    return values[0].get<std::string>();
}

bool is_zone_transfer(const json& annotation) {
    if (!has(annotation, "type")) return false;
    const auto& type = annotation.at("type");
    if (type.is_string()) {
        return type.get<std::string>().find(ZONE_TRANSFER) != std::string::npos;
    }
    for (const auto& t : array_or_empty(annotation, "type")) {
        if (t.is_string() && t.get<std::string>() == ZONE_TRANSFER) {
            return true;
        }
    }
    return false;
}

ObjectFacts decode_object_facts(const json& obj) {
    ObjectFacts facts;
    facts.grp_id = optional_value<GrpId>(obj, "grpId");
    facts.name = name_field(obj);
    facts.type = string_or(obj, "type");
    facts.card_types = string_list(obj, "cardTypes");
    facts.subtypes = string_list(obj, "subtypes");
    facts.colors = string_list(obj, "color");
    facts.power = optional_value<int>(object_or_empty(obj, "power"), "value");
    facts.toughness = optional_value<int>(object_or_empty(obj, "toughness"), "value");
    facts.owner_seat = optional_value<SeatId>(obj, "ownerSeatId");
    facts.controller_seat = optional_value<SeatId>(obj, "controllerSeatId");
    return facts;
}

std::vector<DeckCard> decode_main_deck(const json& deck) {
    std::vector<DeckCard> cards;
    const auto& main_deck = array_or_empty(deck, "MainDeck");

    // Older clients write a flat [cardId, quantity, cardId, quantity, ...] list
    if (!main_deck.empty() && main_deck[0].is_number()) {
        for (size_t i = 0; i + 1 < main_deck.size(); i += 2) {
            DeckCard card;
            card.card_id = main_deck[i].get<GrpId>();
            card.quantity = main_deck[i + 1].get<int>();
            if (card.card_id != 0) {
                cards.push_back(card);
            }
        }
        return cards;
    }

    for (const auto& entry : main_deck) {
        auto card_id = optional_value<GrpId>(entry, "cardId");
        if (!card_id.has_value() || *card_id == 0) {
            continue;
        }
        DeckCard card;
        card.card_id = *card_id;
        card.quantity = int_or(entry, "quantity", 1);
        cards.push_back(card);
    }
    return cards;
}

/**
 * Read deck summary / deck list from one container object.
 * Returns false if the container has neither.
 */
bool read_deck_container(const json& src, DeckEvent& out) {
    const json* summary = nullptr;
    const json* deck = nullptr;

    if (has(src, "CourseDeckSummary")) {
        summary = &object_or_empty(src, "CourseDeckSummary");
        deck = &object_or_empty(src, "CourseDeck");
    } else if (has(src, "Summary")) {
        summary = &object_or_empty(src, "Summary");
        deck = &object_or_empty(src, "Deck");
    } else if (has(src, "CourseDeck")) {
        deck = &object_or_empty(src, "CourseDeck");
    }

    if (summary == nullptr && deck == nullptr) {
        return false;
    }

    if (summary != nullptr && !summary->empty()) {
        out.has_summary = true;
        out.deck_name = optional_value<std::string>(*summary, "Name");
        out.deck_id = optional_value<std::string>(*summary, "DeckId");
        for (const auto& attr : array_or_empty(*summary, "Attributes")) {
            if (string_or(attr, "name") == "Format") {
                out.format = optional_value<std::string>(attr, "value");
            }
        }
    }

    if (deck != nullptr && !deck->empty()) {
        out.main_deck = decode_main_deck(*deck);
    }

    return true;
}

} // namespace

// ============================================================================
// MATCH ROOM STATE
// ============================================================================

MatchStateEvent decode_match_state(const RawEvent& event) {
    const auto& data = object_or_empty(event.data, "matchGameRoomStateChangedEvent");
    const auto& room = object_or_empty(data, "gameRoomInfo");
    const auto& config = object_or_empty(room, "gameRoomConfig");

    MatchStateEvent out;
    out.match_id = string_or(config, "matchId");
    out.state_type = string_or(room, "stateType");
    out.timestamp = event.timestamp;
    out.logger_timestamp = event.logger_timestamp;

    for (const auto& p : array_or_empty(config, "reservedPlayers")) {
        ReservedPlayer player;
        player.player_name = string_or(p, "playerName");
        player.user_id = string_or(p, "userId");
        player.seat_id = optional_value<SeatId>(p, "systemSeatId");
        player.event_id = string_or(p, "eventId");
        out.players.push_back(std::move(player));
    }

    const auto& final_result = object_or_empty(room, "finalMatchResult");
    out.winning_team_id = optional_value<int>(final_result, "winningTeamId");
    for (const auto& r : array_or_empty(final_result, "resultList")) {
        ResultEntry entry;
        entry.scope = string_or(r, "scope");
        entry.winning_team_id = optional_value<int>(r, "winningTeamId");
        entry.reason = optional_value<std::string>(r, "reason");
        out.results.push_back(std::move(entry));
    }

    return out;
}

// ============================================================================
// GAME RULES ENGINE
// ============================================================================

GameStateMessage decode_game_state_message(const json& gs) {
    GameStateMessage msg;
    msg.game_state_id = int_or(gs, "gameStateId");

    const auto& turn_info = object_or_empty(gs, "turnInfo");
    msg.turn_number = int_or(turn_info, "turnNumber");
    msg.phase = string_or(turn_info, "phase");
    msg.step = string_or(turn_info, "step");
    msg.active_player = optional_value<SeatId>(turn_info, "activePlayer");

    const auto& game_info = object_or_empty(gs, "gameInfo");
    if (!game_info.empty()) {
        msg.super_format = optional_value<std::string>(game_info, "superFormat");
        msg.game_type = optional_value<std::string>(game_info, "type");
    }

    for (const auto& p : array_or_empty(gs, "players")) {
        auto seat = optional_value<SeatId>(p, "systemSeatNumber");
        auto life = optional_value<int>(p, "lifeTotal");
        if (seat.has_value() && life.has_value()) {
            msg.players.push_back(PlayerLife{*seat, *life});
        }
    }

    for (const auto& obj : array_or_empty(gs, "gameObjects")) {
        auto instance_id = optional_value<InstanceId>(obj, "instanceId");
        if (!instance_id.has_value()) {
            continue;
        }
        msg.objects.push_back(GameObjectUpdate{*instance_id, decode_object_facts(obj)});
    }

    for (const auto& a : array_or_empty(gs, "actions")) {
        const auto& action = object_or_empty(a, "action");
        if (action.empty()) {
            continue;
        }
        LegalAction legal;
        legal.seat_id = optional_value<SeatId>(a, "seatId");
        legal.action_type = string_or(action, "actionType");
        legal.instance_id = optional_value<InstanceId>(action, "instanceId");
        legal.grp_id = optional_value<GrpId>(action, "grpId");
        legal.ability_grp_id = optional_value<GrpId>(action, "abilityGrpId");
        if (has(action, "manaCost")) {
            legal.mana_cost = action.at("manaCost").dump();
        }
        msg.actions.push_back(std::move(legal));
    }

    for (const auto& annotation : array_or_empty(gs, "annotations")) {
        if (!is_zone_transfer(annotation)) {
            continue;
        }

        ZoneTransferAnnotation transfer;
        for (const auto& detail : array_or_empty(annotation, "details")) {
            const std::string key = string_or(detail, "key");
            if (key == "zone_src") {
                transfer.zone_src = first_int(detail);
            } else if (key == "zone_dest") {
                transfer.zone_dest = first_int(detail);
            } else if (key == "category") {
                transfer.category = first_string(detail).value_or("");
            }
        }
        for (const auto& id : array_or_empty(annotation, "affectedIds")) {
            transfer.affected_ids.push_back(id.get<InstanceId>());
        }
        msg.zone_transfers.push_back(std::move(transfer));
    }

    return msg;
}

GreEvent decode_gre_event(const RawEvent& event) {
    const auto& gre = object_or_empty(event.data, "greToClientEvent");

    GreEvent out;
    out.timestamp = event.timestamp;
    for (const auto& msg : array_or_empty(gre, "greToClientMessages")) {
        if (string_or(msg, "type") != GAME_STATE_MESSAGE) {
            continue;
        }
        out.messages.push_back(decode_game_state_message(object_or_empty(msg, "gameStateMessage")));
    }
    return out;
}

// ============================================================================
// DECK
// ============================================================================

DeckEvent decode_deck_event(const RawEvent& event) {
    DeckEvent out;
    if (read_deck_container(event.data, out)) {
        return out;
    }

    // Deck requests carry their body as a JSON-encoded string
    if (has(event.data, "request") && event.data.at("request").is_string()) {
        json inner = json::parse(event.data.at("request").get<std::string>(), nullptr, false);
        if (!inner.is_discarded() && inner.is_object()) {
            read_deck_container(inner, out);
        }
    }
    return out;
}

EventPayload decode_event(const RawEvent& event) {
    switch (event.kind) {
        case EventKind::MATCH_STATE:
            return decode_match_state(event);
        case EventKind::GRE_EVENT:
            return decode_gre_event(event);
        case EventKind::COURSE_DECK:
        case EventKind::DECK_UPSERT:
        case EventKind::DECK_SET:
            return decode_deck_event(event);
        case EventKind::GAME_STATE:
        default:
            return Unclassified{};
    }
}

} // namespace arena
