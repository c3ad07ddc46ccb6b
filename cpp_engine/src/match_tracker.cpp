/**
 * Arena Tracker - Match State Tracker Implementation
 */

#include "match_tracker.hpp"
#include <algorithm>
#include <iostream>

namespace arena {

namespace {

const char* const MATCH_SCOPE = "MatchScope_Match";

void open_match(ParserState& state, const MatchStateEvent& event) {
    if (state.current.has_value()) {
        state.completed.push_back(std::move(*state.current));
    }

    state.current.emplace(event.match_id);
    state.last_turn_number = 0;

    if (event.timestamp.has_value()) {
        state.current->start_time = event.timestamp;
    } else if (event.logger_timestamp.has_value()) {
        state.current->start_time = event.logger_timestamp;
    }
}

} // namespace

// ============================================================================
// REDUCER
// ============================================================================

ParserState apply_event(ParserState state, const RawEvent& event, bool quiet) {
    EventPayload payload;

    // Decode fully before touching the state so a bad payload changes nothing
    try {
        payload = decode_event(event);
    } catch (const std::exception& e) {
        state.errors.push_back(ParseError{event.kind, event.line_number, e.what()});
        if (!quiet) {
            std::cerr << "[LogParser] Error processing event at line " << event.line_number
                      << ": " << e.what() << std::endl;
        }
        return state;
    }

    if (const auto* match_state = std::get_if<MatchStateEvent>(&payload)) {
        apply_match_state(state, *match_state);
    } else if (const auto* gre = std::get_if<GreEvent>(&payload)) {
        apply_gre_event(state, *gre);
    } else if (const auto* deck = std::get_if<DeckEvent>(&payload)) {
        apply_deck_event(state, *deck);
    }
    // Unclassified: dropped

    return state;
}

ParserState finish(ParserState state) {
    if (state.current.has_value()) {
        state.completed.push_back(std::move(*state.current));
        state.current.reset();
    }
    return state;
}

// ============================================================================
// MATCH ROOM STATE
// ============================================================================

void apply_match_state(ParserState& state, const MatchStateEvent& event) {
    if (event.match_id.empty()) {
        return;
    }

    if (!state.current.has_value() || state.current->match_id != event.match_id) {
        open_match(state, event);
    }

    MatchData& match = *state.current;

    for (const auto& player : event.players) {
        if (player.seat_id.has_value() && *player.seat_id == LOCAL_PLAYER_SEAT) {
            match.player_name = player.player_name;
            match.player_seat_id = player.seat_id;
            match.player_user_id = player.user_id;
        } else {
            match.opponent_name = player.player_name;
            match.opponent_seat_id = player.seat_id;
            match.opponent_user_id = player.user_id;
        }

        // First non-empty event id sticks
        if (!player.event_id.empty() && !match.event_id.has_value()) {
            match.event_id = player.event_id;
        }
    }

    if (!event.is_completed()) {
        return;
    }

    if (event.timestamp.has_value()) {
        match.end_time = event.timestamp;
    }

    match.winning_team_id = event.winning_team_id;

    for (const auto& entry : event.results) {
        if (entry.scope != MATCH_SCOPE) {
            continue;
        }
        if (entry.winning_team_id.has_value() && match.player_seat_id.has_value() &&
            *entry.winning_team_id == *match.player_seat_id) {
            match.result = MatchResult::WIN;
        } else if (entry.winning_team_id.has_value() && *entry.winning_team_id != 0) {
            match.result = MatchResult::LOSS;
        }
        match.winning_reason = entry.reason;
    }
}

// ============================================================================
// GAME RULES ENGINE
// ============================================================================

void apply_gre_event(ParserState& state, const GreEvent& event) {
    if (!state.current.has_value()) {
        return;
    }
    for (const auto& msg : event.messages) {
        apply_game_state_message(state, msg, event.timestamp);
    }
}

void apply_game_state_message(ParserState& state, const GameStateMessage& msg,
                              std::optional<TimestampMs> timestamp) {
    if (!state.current.has_value()) {
        return;
    }
    MatchData& match = *state.current;

    // Turn number is sticky: messages without turn info inherit the last one
    int turn_number = msg.turn_number;
    if (turn_number > 0) {
        state.last_turn_number = turn_number;
    } else if (state.last_turn_number > 0) {
        turn_number = state.last_turn_number;
    }
    match.total_turns = std::max(match.total_turns, turn_number);

    if (msg.super_format.has_value()) {
        match.format = msg.super_format;
    }
    if (msg.game_type.has_value()) {
        match.match_type = msg.game_type;
    }

    for (const auto& p : msg.players) {
        match.life_snapshots.push_back(
            LifeSnapshot{msg.game_state_id, turn_number, p.seat_id, p.life_total});
    }

    // Last write wins
    for (const auto& obj : msg.objects) {
        match.card_instances[obj.instance_id] = obj.facts;
    }

    for (const auto& legal : msg.actions) {
        ActionRecord record;
        record.game_state_id = msg.game_state_id;
        record.turn_number = turn_number;
        record.phase = msg.phase;
        record.step = msg.step;
        record.active_player = msg.active_player;
        record.seat_id = legal.seat_id;
        record.action_type = legal.action_type;
        record.instance_id = legal.instance_id;
        record.ability_grp_id = legal.ability_grp_id;
        record.mana_cost = legal.mana_cost;
        record.timestamp = timestamp;

        const ObjectFacts* facts =
            legal.instance_id.has_value() ? match.find_instance(*legal.instance_id) : nullptr;
        if (facts != nullptr && facts->grp_id.has_value() && *facts->grp_id != 0) {
            record.card_grp_id = facts->grp_id;
        } else {
            record.card_grp_id = legal.grp_id;
        }

        if (!match.action_keys.insert(record.key()).second) {
            continue;  // Same option offered again in this game state
        }
        match.actions.push_back(std::move(record));
    }

    for (const auto& annotation : msg.zone_transfers) {
        for (InstanceId instance_id : annotation.affected_ids) {
            ZoneTransferRecord transfer;
            transfer.game_state_id = msg.game_state_id;
            transfer.turn_number = turn_number;
            transfer.instance_id = instance_id;
            transfer.from_zone = annotation.zone_src;
            transfer.to_zone = annotation.zone_dest;
            transfer.category = annotation.category;

            const ObjectFacts* facts = match.find_instance(instance_id);
            if (facts != nullptr) {
                transfer.card_grp_id = facts->grp_id;
            }
            match.zone_transfers.push_back(std::move(transfer));
        }
    }
}

// ============================================================================
// DECK
// ============================================================================

void apply_deck_event(ParserState& state, const DeckEvent& event) {
    if (!state.current.has_value()) {
        return;
    }
    MatchData& match = *state.current;

    if (event.has_summary) {
        match.deck_name = event.deck_name;
        match.deck_id = event.deck_id;
        if (event.format.has_value()) {
            match.format = event.format;
        }
    }

    if (event.main_deck.has_value()) {
        match.deck_cards = *event.main_deck;
    }
}

// ============================================================================
// LOG PARSER
// ============================================================================

LogParser::LogParser(const std::string& log_path, ParserOptions options)
    : options_(options)
    , extractor_(log_path, ExtractorOptions{options.quiet}) {}

ParseResult LogParser::parse_matches() {
    extractor_.reset();

    ParserState state;
    while (auto event = extractor_.next()) {
        state = apply_event(std::move(state), *event, options_.quiet);
    }
    state = finish(std::move(state));

    if (options_.verbose) {
        std::cerr << "[LogParser] Read " << extractor_.lines_read() << " lines, found "
                  << state.completed.size() << " matches" << std::endl;
    }
    if (!state.errors.empty() && !options_.quiet) {
        std::cerr << "[LogParser] Completed with " << state.errors.size()
                  << " non-fatal parse errors" << std::endl;
    }

    last_errors_ = state.errors;

    ParseResult result;
    result.matches = std::move(state.completed);
    result.errors = std::move(state.errors);
    return result;
}

std::vector<MatchData> parse_log_file(const std::string& log_path, ParserOptions options) {
    LogParser parser(log_path, options);
    return parser.parse_matches().matches;
}

} // namespace arena
