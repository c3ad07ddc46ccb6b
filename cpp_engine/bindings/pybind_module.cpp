/**
 * Arena Tracker - Python Bindings
 *
 * pybind11 wrapper for the C++ tracker.
 * Exposes log parsing, card classification and replay reconstruction.
 */

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <nlohmann/json.hpp>
#include "arena_tracker.hpp"

namespace py = pybind11;

PYBIND11_MODULE(arena_tracker_cpp, m) {
    m.doc() = "MTG Arena log parser and match statistics";

    // ========================================================================
    // EXCEPTIONS
    // ========================================================================

    static py::exception<arena::TrackerError> tracker_error(m, "TrackerError");
    py::register_exception<arena::LogFileNotFoundError>(m, "LogFileNotFoundError", tracker_error.ptr());
    py::register_exception<arena::InvalidLogFormatError>(m, "InvalidLogFormatError", tracker_error.ptr());
    py::register_exception<arena::CardLookupError>(m, "CardLookupError", tracker_error.ptr());
    py::register_exception<arena::ConfigError>(m, "ConfigError", tracker_error.ptr());

    // ========================================================================
    // ENUMS
    // ========================================================================

    py::enum_<arena::EventKind>(m, "EventKind")
        .value("MATCH_STATE", arena::EventKind::MATCH_STATE)
        .value("GRE_EVENT", arena::EventKind::GRE_EVENT)
        .value("COURSE_DECK", arena::EventKind::COURSE_DECK)
        .value("DECK_UPSERT", arena::EventKind::DECK_UPSERT)
        .value("DECK_SET", arena::EventKind::DECK_SET)
        .value("GAME_STATE", arena::EventKind::GAME_STATE)
        .export_values();

    py::enum_<arena::MatchResult>(m, "MatchResult")
        .value("WIN", arena::MatchResult::WIN)
        .value("LOSS", arena::MatchResult::LOSS)
        .export_values();

    py::enum_<arena::ZoneRole>(m, "ZoneRole")
        .value("BATTLEFIELD", arena::ZoneRole::BATTLEFIELD)
        .value("STACK", arena::ZoneRole::STACK)
        .value("LIBRARY", arena::ZoneRole::LIBRARY)
        .value("OPPONENT_LIBRARY", arena::ZoneRole::OPPONENT_LIBRARY)
        .value("HAND", arena::ZoneRole::HAND)
        .value("OPPONENT_HAND", arena::ZoneRole::OPPONENT_HAND)
        .value("GRAVEYARD", arena::ZoneRole::GRAVEYARD)
        .value("EXILE", arena::ZoneRole::EXILE)
        .export_values();

    py::enum_<arena::Actor>(m, "Actor")
        .value("YOU", arena::Actor::YOU)
        .value("OPPONENT", arena::Actor::OPPONENT)
        .value("UNKNOWN", arena::Actor::UNKNOWN)
        .export_values();

    // ========================================================================
    // MATCH AGGREGATE
    // ========================================================================

    py::class_<arena::ObjectFacts>(m, "ObjectFacts")
        .def_readonly("grp_id", &arena::ObjectFacts::grp_id)
        .def_readonly("name", &arena::ObjectFacts::name)
        .def_readonly("type", &arena::ObjectFacts::type)
        .def_readonly("card_types", &arena::ObjectFacts::card_types)
        .def_readonly("subtypes", &arena::ObjectFacts::subtypes)
        .def_readonly("colors", &arena::ObjectFacts::colors)
        .def_readonly("power", &arena::ObjectFacts::power)
        .def_readonly("toughness", &arena::ObjectFacts::toughness)
        .def_readonly("owner_seat", &arena::ObjectFacts::owner_seat)
        .def_readonly("controller_seat", &arena::ObjectFacts::controller_seat);

    py::class_<arena::ActionRecord>(m, "ActionRecord")
        .def_readonly("game_state_id", &arena::ActionRecord::game_state_id)
        .def_readonly("turn_number", &arena::ActionRecord::turn_number)
        .def_readonly("phase", &arena::ActionRecord::phase)
        .def_readonly("step", &arena::ActionRecord::step)
        .def_readonly("active_player", &arena::ActionRecord::active_player)
        .def_readonly("seat_id", &arena::ActionRecord::seat_id)
        .def_readonly("action_type", &arena::ActionRecord::action_type)
        .def_readonly("instance_id", &arena::ActionRecord::instance_id)
        .def_readonly("card_grp_id", &arena::ActionRecord::card_grp_id)
        .def_readonly("ability_grp_id", &arena::ActionRecord::ability_grp_id)
        .def_readonly("mana_cost", &arena::ActionRecord::mana_cost)
        .def_readonly("timestamp", &arena::ActionRecord::timestamp);

    py::class_<arena::LifeSnapshot>(m, "LifeSnapshot")
        .def_readonly("game_state_id", &arena::LifeSnapshot::game_state_id)
        .def_readonly("turn_number", &arena::LifeSnapshot::turn_number)
        .def_readonly("seat_id", &arena::LifeSnapshot::seat_id)
        .def_readonly("life_total", &arena::LifeSnapshot::life_total);

    py::class_<arena::LifeChangeRecord>(m, "LifeChangeRecord")
        .def_readonly("game_state_id", &arena::LifeChangeRecord::game_state_id)
        .def_readonly("turn_number", &arena::LifeChangeRecord::turn_number)
        .def_readonly("seat_id", &arena::LifeChangeRecord::seat_id)
        .def_readonly("life_total", &arena::LifeChangeRecord::life_total)
        .def_readonly("change_amount", &arena::LifeChangeRecord::change_amount);

    py::class_<arena::ZoneTransferRecord>(m, "ZoneTransferRecord")
        .def(py::init<>())
        .def_readwrite("game_state_id", &arena::ZoneTransferRecord::game_state_id)
        .def_readwrite("turn_number", &arena::ZoneTransferRecord::turn_number)
        .def_readwrite("instance_id", &arena::ZoneTransferRecord::instance_id)
        .def_readwrite("card_grp_id", &arena::ZoneTransferRecord::card_grp_id)
        .def_readwrite("from_zone", &arena::ZoneTransferRecord::from_zone)
        .def_readwrite("to_zone", &arena::ZoneTransferRecord::to_zone)
        .def_readwrite("category", &arena::ZoneTransferRecord::category);

    py::class_<arena::DeckCard>(m, "DeckCard")
        .def_readonly("card_id", &arena::DeckCard::card_id)
        .def_readonly("quantity", &arena::DeckCard::quantity);

    py::class_<arena::MatchData>(m, "MatchData")
        .def_readonly("match_id", &arena::MatchData::match_id)
        .def_readonly("player_name", &arena::MatchData::player_name)
        .def_readonly("player_seat_id", &arena::MatchData::player_seat_id)
        .def_readonly("player_user_id", &arena::MatchData::player_user_id)
        .def_readonly("opponent_name", &arena::MatchData::opponent_name)
        .def_readonly("opponent_seat_id", &arena::MatchData::opponent_seat_id)
        .def_readonly("opponent_user_id", &arena::MatchData::opponent_user_id)
        .def_readonly("event_id", &arena::MatchData::event_id)
        .def_readonly("format", &arena::MatchData::format)
        .def_readonly("match_type", &arena::MatchData::match_type)
        .def_readonly("deck_name", &arena::MatchData::deck_name)
        .def_readonly("deck_id", &arena::MatchData::deck_id)
        .def_readonly("deck_cards", &arena::MatchData::deck_cards)
        .def_readonly("start_time", &arena::MatchData::start_time)
        .def_readonly("end_time", &arena::MatchData::end_time)
        .def_readonly("result", &arena::MatchData::result)
        .def_readonly("winning_team_id", &arena::MatchData::winning_team_id)
        .def_readonly("winning_reason", &arena::MatchData::winning_reason)
        .def_readonly("total_turns", &arena::MatchData::total_turns)
        .def_readonly("actions", &arena::MatchData::actions)
        .def_readonly("life_snapshots", &arena::MatchData::life_snapshots)
        .def_readonly("zone_transfers", &arena::MatchData::zone_transfers)
        .def_readonly("card_instances", &arena::MatchData::card_instances)
        .def("is_complete", &arena::MatchData::is_complete)
        .def("to_json", [](const arena::MatchData& match) {
            nlohmann::json j = match;
            return j.dump();
        });

    py::class_<arena::ParseError>(m, "ParseError")
        .def_readonly("event_kind", &arena::ParseError::event_kind)
        .def_readonly("line_number", &arena::ParseError::line_number)
        .def_readonly("message", &arena::ParseError::message);

    py::class_<arena::ParseResult>(m, "ParseResult")
        .def_readonly("matches", &arena::ParseResult::matches)
        .def_readonly("errors", &arena::ParseResult::errors);

    // ========================================================================
    // PARSER
    // ========================================================================

    py::class_<arena::ParserOptions>(m, "ParserOptions")
        .def(py::init<>())
        .def_readwrite("quiet", &arena::ParserOptions::quiet)
        .def_readwrite("verbose", &arena::ParserOptions::verbose);

    py::class_<arena::LogParser>(m, "LogParser")
        .def(py::init<const std::string&, arena::ParserOptions>(),
             py::arg("log_path"), py::arg("options") = arena::ParserOptions{})
        .def("parse_matches", &arena::LogParser::parse_matches)
        .def("get_parse_errors", &arena::LogParser::get_parse_errors);

    m.def("parse_log_file", &arena::parse_log_file,
          py::arg("log_path"), py::arg("options") = arena::ParserOptions{});

    m.def("compute_life_changes", &arena::compute_life_changes);
    m.def("significant_actions", &arena::significant_actions);
    m.def("dedupe_zone_transfers", &arena::dedupe_zone_transfers);

    // ========================================================================
    // CARDS
    // ========================================================================

    py::class_<arena::CardFacts>(m, "CardFacts")
        .def_readonly("arena_id", &arena::CardFacts::arena_id)
        .def_readonly("name", &arena::CardFacts::name)
        .def_readonly("mana_cost", &arena::CardFacts::mana_cost)
        .def_readonly("cmc", &arena::CardFacts::cmc)
        .def_readonly("type_line", &arena::CardFacts::type_line)
        .def_readonly("colors", &arena::CardFacts::colors)
        .def_readonly("rarity", &arena::CardFacts::rarity)
        .def_readonly("set_code", &arena::CardFacts::set_code)
        .def_readonly("oracle_text", &arena::CardFacts::oracle_text)
        .def_readonly("power", &arena::CardFacts::power)
        .def_readonly("toughness", &arena::CardFacts::toughness);

    py::class_<arena::CardLookup>(m, "CardLookup")
        .def("lookup", &arena::CardLookup::lookup, py::return_value_policy::reference);

    py::class_<arena::CardDatabase, arena::CardLookup>(m, "CardDatabase")
        .def(py::init<>())
        .def("load_from_json", &arena::CardDatabase::load_from_json)
        .def("has_card", &arena::CardDatabase::has_card)
        .def("get_all_arena_ids", &arena::CardDatabase::get_all_arena_ids)
        .def("card_count", &arena::CardDatabase::card_count);

    py::class_<arena::ObjectClassification>(m, "ObjectClassification")
        .def_readonly("real_card_ids", &arena::ObjectClassification::real_card_ids)
        .def_readonly("special_objects", &arena::ObjectClassification::special_objects);

    py::class_<arena::ResolvedCard>(m, "ResolvedCard")
        .def_readonly("grp_id", &arena::ResolvedCard::grp_id)
        .def_readonly("name", &arena::ResolvedCard::name)
        .def_readonly("object_type", &arena::ResolvedCard::object_type)
        .def_readonly("is_token", &arena::ResolvedCard::is_token)
        .def_readonly("source_grp_id", &arena::ResolvedCard::source_grp_id);

    m.def("classify_objects", &arena::classify_objects);
    m.def("generate_token_name", &arena::generate_token_name);
    m.def("resolve_card_names", &arena::resolve_card_names,
          py::arg("classification"), py::arg("lookup") = nullptr);

    // ========================================================================
    // ZONES / REPLAY
    // ========================================================================

    py::class_<arena::ReplayStep>(m, "ReplayStep")
        .def_readonly("game_state_id", &arena::ReplayStep::game_state_id)
        .def_readonly("turn_number", &arena::ReplayStep::turn_number)
        .def_readonly("actor", &arena::ReplayStep::actor)
        .def_readonly("verb", &arena::ReplayStep::verb)
        .def_readonly("grp_id", &arena::ReplayStep::grp_id)
        .def_readonly("instance_id", &arena::ReplayStep::instance_id)
        .def_readonly("card_name", &arena::ReplayStep::card_name)
        .def_readonly("from_label", &arena::ReplayStep::from_label)
        .def_readonly("to_label", &arena::ReplayStep::to_label)
        .def_readonly("player_life", &arena::ReplayStep::player_life)
        .def_readonly("opponent_life", &arena::ReplayStep::opponent_life)
        .def("__str__", &arena::format_replay_step);

    py::class_<arena::Replay>(m, "Replay")
        .def_readonly("steps", &arena::Replay::steps)
        .def_readonly("roles", &arena::Replay::roles)
        .def_readonly("player_hand", &arena::Replay::player_hand)
        .def_readonly("opponent_hand", &arena::Replay::opponent_hand);

    m.def("infer_zone_roles",
          py::overload_cast<const std::vector<arena::ZoneTransferRecord>&>(&arena::infer_zone_roles));
    m.def("build_replay",
          [](const std::vector<arena::ZoneTransferRecord>& transfers,
             const std::vector<arena::LifeChangeRecord>& life_changes,
             arena::SeatId player_seat,
             const arena::CardLookup* cards) {
              arena::ReplayOptions options;
              options.player_seat = player_seat;
              options.cards = cards;
              return arena::build_replay(transfers, life_changes, options);
          },
          py::arg("transfers"), py::arg("life_changes"),
          py::arg("player_seat") = arena::LOCAL_PLAYER_SEAT, py::arg("cards") = nullptr);

    // ========================================================================
    // MODULE INFO
    // ========================================================================

    m.attr("VERSION") = arena::get_version();
    m.attr("__version__") = arena::get_version();
}
