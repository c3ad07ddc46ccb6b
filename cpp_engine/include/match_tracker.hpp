/**
 * Arena Tracker - Match State Tracker
 *
 * Folds the classified event stream into match aggregates. The fold is an
 * explicit reducer over ParserState; there is no global "current match".
 *
 * Usage:
 *   LogParser parser("Player.log");
 *   ParseResult result = parser.parse_matches();
 */

#pragma once

#include "events.hpp"
#include "event_extractor.hpp"

namespace arena {

/**
 * ParseError - A non-fatal failure while processing one event.
 */
struct ParseError {
    EventKind event_kind = EventKind::GAME_STATE;
    int line_number = 0;
    std::string message;
};

/**
 * ParserState - Everything the reducer carries between events.
 *
 * At most one aggregate is open. It is closed (moved into completed) when a
 * different matchId appears or when the stream finishes.
 */
struct ParserState {
    std::optional<MatchData> current;
    std::vector<MatchData> completed;
    std::vector<ParseError> errors;

    // Last nonzero turn seen in the open match, for messages without turn info
    int last_turn_number = 0;
};

/**
 * Apply one event. Never throws: decoding failures are appended to
 * state.errors and leave the rest of the state untouched.
 */
ParserState apply_event(ParserState state, const RawEvent& event, bool quiet = false);

/**
 * Close the open aggregate, if any (it keeps an unset result).
 */
ParserState finish(ParserState state);

// Reducer steps for decoded events - public for testing
void apply_match_state(ParserState& state, const MatchStateEvent& event);
void apply_gre_event(ParserState& state, const GreEvent& event);
void apply_game_state_message(ParserState& state, const GameStateMessage& msg,
                              std::optional<TimestampMs> timestamp);
void apply_deck_event(ParserState& state, const DeckEvent& event);

// ============================================================================
// LOG PARSER
// ============================================================================

struct ParserOptions {
    bool quiet = false;      // Suppress warnings on std::cerr
    bool verbose = false;    // Progress messages on std::cerr
};

struct ParseResult {
    std::vector<MatchData> matches;
    std::vector<ParseError> errors;
};

/**
 * LogParser - Extractor plus reducer over one log file.
 *
 * Construction throws LogFileNotFoundError / InvalidLogFormatError.
 * parse_matches() can be called repeatedly; each call re-reads the file.
 */
class LogParser {
public:
    explicit LogParser(const std::string& log_path, ParserOptions options = {});

    ParseResult parse_matches();

    /**
     * Errors from the most recent parse_matches() call.
     */
    const std::vector<ParseError>& get_parse_errors() const { return last_errors_; }

    EventExtractor& extractor() { return extractor_; }

private:
    ParserOptions options_;
    EventExtractor extractor_;
    std::vector<ParseError> last_errors_;
};

/**
 * Convenience wrapper: parse a log file and return its matches.
 */
std::vector<MatchData> parse_log_file(const std::string& log_path, ParserOptions options = {});

} // namespace arena
