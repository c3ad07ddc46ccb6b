/**
 * Arena Tracker - Test Fixtures
 *
 * Builders for the JSON payloads the client writes, and a temp-file log
 * that removes itself.
 */

#pragma once

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace fixtures {

using json = nlohmann::json;

const char* const LOG_HEADER = "Initialize engine version: 2022.3.42f1 (Unity)";
const char* const LOGGER_LINE = "[UnityCrossThreadLogger]1/15/2024 3:04:05 PM";
constexpr int64_t LOGGER_LINE_MS = 1705331045000LL;

/**
 * Log file in the temp directory, deleted on destruction.
 */
class TempLog {
public:
    explicit TempLog(const std::string& content, const std::string& stem = "log") {
        static int counter = 0;
        path_ = (std::filesystem::temp_directory_path() /
                 ("arena_tracker_" + stem + "_" + std::to_string(++counter) + ".log")).string();
        std::ofstream out(path_, std::ios::out | std::ios::binary | std::ios::trunc);
        out << content;
    }

    ~TempLog() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    TempLog(const TempLog&) = delete;
    TempLog& operator=(const TempLog&) = delete;

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

inline std::string lines(const std::vector<std::string>& parts) {
    std::string out;
    for (const auto& part : parts) {
        out += part;
        out += '\n';
    }
    return out;
}

// ============================================================================
// MATCH ROOM
// ============================================================================

inline json reserved_players(const std::string& player, const std::string& opponent) {
    return json::array({
        {{"userId", "U-OPP"}, {"playerName", opponent}, {"systemSeatId", 1},
         {"teamId", 1}, {"eventId", "Ladder"}},
        {{"userId", "U-ME"}, {"playerName", player}, {"systemSeatId", 2},
         {"teamId", 2}, {"eventId", "Ladder"}},
    });
}

inline json match_started(const std::string& match_id,
                          const std::string& player = "Alice",
                          const std::string& opponent = "Bob") {
    return {
        {"timestamp", "1705331000000"},
        {"matchGameRoomStateChangedEvent", {
            {"gameRoomInfo", {
                {"gameRoomConfig", {
                    {"matchId", match_id},
                    {"reservedPlayers", reserved_players(player, opponent)},
                }},
                {"stateType", "MatchGameRoomStateType_Playing"},
            }},
        }},
    };
}

inline json match_completed(const std::string& match_id, int winning_team,
                            const std::string& player = "Alice",
                            const std::string& opponent = "Bob") {
    return {
        {"timestamp", "1705331600000"},
        {"matchGameRoomStateChangedEvent", {
            {"gameRoomInfo", {
                {"gameRoomConfig", {
                    {"matchId", match_id},
                    {"reservedPlayers", reserved_players(player, opponent)},
                }},
                {"stateType", "MatchGameRoomStateType_MatchCompleted"},
                {"finalMatchResult", {
                    {"matchId", match_id},
                    {"matchCompletedReason", "MatchCompletedReasonType_Success"},
                    {"resultList", json::array({
                        {{"scope", "MatchScope_Game"}, {"result", "ResultType_WinLoss"},
                         {"winningTeamId", winning_team}, {"reason", "ResultReason_Game"}},
                        {{"scope", "MatchScope_Match"}, {"result", "ResultType_WinLoss"},
                         {"winningTeamId", winning_team}, {"reason", "ResultReason_Concede"}},
                    })},
                }},
            }},
        }},
    };
}

// ============================================================================
// GAME RULES ENGINE
// ============================================================================

/**
 * Game-state message body. turn == 0 leaves turnNumber out.
 */
inline json game_state(int game_state_id, int turn = 0) {
    json gs = {
        {"type", "GameStateType_Diff"},
        {"gameStateId", game_state_id},
        {"turnInfo", {{"phase", "Phase_Main1"}, {"step", "Step_Unknown"}, {"activePlayer", 2}}},
    };
    if (turn > 0) {
        gs["turnInfo"]["turnNumber"] = turn;
    }
    return gs;
}

inline json life(int seat, int total) {
    return {{"systemSeatNumber", seat}, {"lifeTotal", total}};
}

inline json card_object(int instance_id, int grp_id,
                        const std::string& type = "GameObjectType_Card") {
    return {
        {"instanceId", instance_id},
        {"grpId", grp_id},
        {"type", type},
        {"zoneId", 31},
        {"ownerSeatId", 2},
        {"controllerSeatId", 2},
    };
}

inline json legal_action(const std::string& action_type, int instance_id, int grp_id = 0) {
    json action = {{"actionType", action_type}, {"instanceId", instance_id}};
    if (grp_id != 0) {
        action["grpId"] = grp_id;
    }
    return {{"seatId", 2}, {"action", action}};
}

inline json zone_transfer(const std::vector<int>& affected, int src, int dest,
                          const std::string& category) {
    return {
        {"id", 1},
        {"affectorId", affected.empty() ? 0 : affected[0]},
        {"affectedIds", affected},
        {"type", json::array({"AnnotationType_ZoneTransfer"})},
        {"details", json::array({
            {{"key", "zone_src"}, {"type", "KeyValuePairValueType_int32"}, {"valueInt32", json::array({src})}},
            {{"key", "zone_dest"}, {"type", "KeyValuePairValueType_int32"}, {"valueInt32", json::array({dest})}},
            {{"key", "category"}, {"type", "KeyValuePairValueType_string"}, {"valueString", json::array({category})}},
        })},
    };
}

inline json gre(const std::vector<json>& game_states) {
    json messages = json::array();
    for (const auto& gs : game_states) {
        messages.push_back({
            {"type", "GREMessageType_GameStateMessage"},
            {"systemSeatIds", json::array({2})},
            {"gameStateMessage", gs},
        });
    }
    return {
        {"transactionId", "t-1"},
        {"timestamp", "1705331100000"},
        {"greToClientEvent", {{"greToClientMessages", messages}}},
    };
}

// ============================================================================
// DECK
// ============================================================================

inline json course_deck(const std::string& name, const std::vector<std::pair<int, int>>& cards) {
    json main_deck = json::array();
    for (const auto& [card_id, quantity] : cards) {
        main_deck.push_back({{"cardId", card_id}, {"quantity", quantity}});
    }
    return {
        {"CourseDeckSummary", {
            {"DeckId", "deck-1"},
            {"Name", name},
            {"Attributes", json::array({{{"name", "Format"}, {"value", "Standard"}}})},
        }},
        {"CourseDeck", {{"MainDeck", main_deck}}},
    };
}

} // namespace fixtures
