/**
 * Arena Tracker - Command Line Front End
 *
 * Usage:
 *   arena_cli parse  <log>                     Summary table of every match
 *   arena_cli export <log> [--output <file>]   Match aggregates as JSON
 *   arena_cli cards  <log>                     Card names referenced per match
 *   arena_cli replay <log> [match_id] [--trace]
 *
 * Common options: --cards <db.json> --config <file> --verbose --quiet
 */

#include <iostream>
#include <fstream>
#include <iomanip>
#include <string>
#include <vector>
#include <memory>

#include <nlohmann/json.hpp>
#include "arena_tracker.hpp"

using namespace arena;
using json = nlohmann::json;

// ============================================================================
// HELP
// ============================================================================

void print_help() {
    std::cout << R"(
=== Arena Tracker ===

Usage:
  arena_cli <command> <log_path> [args] [options]

Commands:
  parse  <log>                - List matches found in the log
  export <log>                - Write match aggregates as JSON
  cards  <log>                - Resolve card and token names per match
  replay <log> [match_id]     - Narrate zone transfers (last match by default)
  help                        - Show this help

Options:
  --cards <path>              - Card database JSON (overrides config)
  --config <path>             - Config file (JSON)
  --output <path>             - export: write to file instead of stdout
  --all-actions               - export: keep every legal action, not just significant ones
  --trace                     - replay: also write a trace file to trace_dir
  --verbose                   - Progress messages
  --quiet                     - Suppress warnings

Examples:
  arena_cli parse Player.log
  arena_cli export Player.log --output matches.json
  arena_cli replay Player.log 5c3f0a2e-... --cards cards.json --trace
)" << std::endl;
}

// ============================================================================
// ARGUMENTS
// ============================================================================

struct CliArgs {
    std::string command;
    std::vector<std::string> positional;
    std::string cards_path;
    std::string config_path;
    std::string output_path;
    bool all_actions = false;
    bool trace = false;
    bool verbose = false;
    bool quiet = false;
};

bool parse_args(int argc, char** argv, CliArgs& args) {
    if (argc < 2) {
        return false;
    }
    args.command = argv[1];

    for (int i = 2; i < argc; i++) {
        std::string arg = argv[i];
        auto value = [&](std::string& out) {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << arg << std::endl;
                return false;
            }
            out = argv[++i];
            return true;
        };

        if (arg == "--cards") {
            if (!value(args.cards_path)) return false;
        } else if (arg == "--config") {
            if (!value(args.config_path)) return false;
        } else if (arg == "--output" || arg == "-o") {
            if (!value(args.output_path)) return false;
        } else if (arg == "--all-actions") {
            args.all_actions = true;
        } else if (arg == "--trace") {
            args.trace = true;
        } else if (arg == "--verbose" || arg == "-v") {
            args.verbose = true;
        } else if (arg == "--quiet" || arg == "-q") {
            args.quiet = true;
        } else if (arg.size() > 1 && arg[0] == '-') {
            std::cerr << "Unknown option: '" << arg << "'" << std::endl;
            return false;
        } else {
            args.positional.push_back(arg);
        }
    }
    return true;
}

// ============================================================================
// CLI
// ============================================================================

class Cli {
public:
    explicit Cli(CliArgs args) : args_(std::move(args)) {}

    int run() {
        if (args_.command == "help" || args_.command == "--help" || args_.command == "-h") {
            print_help();
            return 0;
        }

        if (args_.positional.empty()) {
            std::cerr << "Missing log path. Type 'arena_cli help' for usage." << std::endl;
            return 2;
        }
        if (!load_config()) {
            return 1;
        }

        if (args_.command == "parse") {
            return cmd_parse();
        } else if (args_.command == "export") {
            return cmd_export();
        } else if (args_.command == "cards") {
            return cmd_cards();
        } else if (args_.command == "replay") {
            return cmd_replay();
        }

        std::cerr << "Unknown command: '" << args_.command
                  << "'. Type 'arena_cli help' for usage." << std::endl;
        return 2;
    }

private:
    CliArgs args_;
    TrackerConfig config_;
    std::unique_ptr<CardDatabase> cards_;

    bool load_config() {
        if (!args_.config_path.empty() && !apply_config_file(config_, args_.config_path)) {
            return false;
        }
        if (!args_.cards_path.empty()) config_.card_db_path = args_.cards_path;
        if (args_.verbose) config_.verbose = true;
        if (args_.quiet) config_.quiet = true;

        // Only the commands that print card names need the database
        bool wants_names = args_.command == "cards" || args_.command == "replay";
        if (wants_names && !config_.card_db_path.empty()) {
            cards_ = std::make_unique<CardDatabase>();
            if (!cards_->load_from_json(config_.card_db_path)) {
                std::cerr << "[arena_cli] Continuing without card names" << std::endl;
                cards_.reset();
            }
        }
        return true;
    }

    ParseResult parse_log() {
        ParserOptions options;
        options.quiet = config_.quiet;
        options.verbose = config_.verbose;

        LogParser parser(args_.positional[0], options);
        return parser.parse_matches();
    }

    const MatchData* select_match(const ParseResult& result) const {
        if (result.matches.empty()) {
            return nullptr;
        }
        if (args_.positional.size() < 2) {
            return &result.matches.back();
        }
        for (const auto& match : result.matches) {
            if (match.match_id == args_.positional[1]) {
                return &match;
            }
        }
        return nullptr;
    }

    // ========================================================================
    // COMMANDS
    // ========================================================================

    int cmd_parse() {
        ParseResult result = parse_log();

        std::cout << "+================================================================+" << std::endl;
        std::cout << "|  MATCHES (" << result.matches.size() << ")  |  ERRORS ("
                  << result.errors.size() << ")" << std::endl;
        std::cout << "+================================================================+" << std::endl;

        for (size_t i = 0; i < result.matches.size(); i++) {
            const MatchData& m = result.matches[i];
            auto significant = significant_actions(m.actions, config_.significant_action_types);

            std::cout << "  [" << i << "] " << m.match_id << std::endl;
            std::cout << "      " << m.player_name.value_or("?") << " vs "
                      << m.opponent_name.value_or("?")
                      << " | " << (m.result ? to_string(*m.result) : "incomplete")
                      << " | turns: " << m.total_turns;
            auto duration = duration_seconds(m);
            if (duration) {
                std::cout << " | " << *duration << "s";
            }
            std::cout << std::endl;
            std::cout << "      format: " << m.format.value_or("-")
                      << " | deck: " << m.deck_name.value_or("-")
                      << " | actions: " << significant.size()
                      << " | transfers: " << dedupe_zone_transfers(m.zone_transfers).size()
                      << std::endl;
        }

        for (const auto& error : result.errors) {
            std::cout << "  [!] line " << error.line_number << " (" << to_string(error.event_kind)
                      << "): " << error.message << std::endl;
        }
        return 0;
    }

    int cmd_export() {
        ParseResult result = parse_log();
        json document = export_document(result, config_.significant_action_types,
                                        args_.all_actions);

        if (args_.output_path.empty()) {
            std::cout << document.dump(2) << std::endl;
            return 0;
        }

        std::ofstream out(args_.output_path);
        if (!out.is_open()) {
            std::cerr << "[arena_cli] Failed to open output: " << args_.output_path << std::endl;
            return 1;
        }
        out << document.dump(2) << std::endl;
        if (!config_.quiet) {
            std::cout << "[arena_cli] Wrote " << result.matches.size() << " matches to "
                      << args_.output_path << std::endl;
        }
        return 0;
    }

    int cmd_cards() {
        ParseResult result = parse_log();

        for (const auto& match : result.matches) {
            ObjectClassification classification = classify_objects(match);
            auto rows = resolve_card_names(classification, cards_.get());

            std::cout << "\n=== " << match.match_id << " ("
                      << classification.real_card_ids.size() << " cards, "
                      << classification.special_objects.size() << " special objects) ===" << std::endl;
            for (const auto& row : rows) {
                std::cout << "  " << std::setw(8) << row.grp_id << "  " << row.name;
                if (row.is_token) {
                    std::cout << "  {token}";
                } else if (!row.object_type.empty()) {
                    std::cout << "  {" << object_type_label(row.object_type) << "}";
                }
                if (row.source_grp_id) {
                    std::cout << "  <- " << *row.source_grp_id;
                }
                std::cout << std::endl;
            }
        }
        return 0;
    }

    int cmd_replay() {
        ParseResult result = parse_log();
        const MatchData* match = select_match(result);
        if (match == nullptr) {
            std::cerr << "[arena_cli] No matching match in log" << std::endl;
            return 1;
        }

        ReplayOptions options;
        options.cards = cards_.get();
        Replay replay = build_replay(dedupe_zone_transfers(match->zone_transfers),
                                     compute_life_changes(match->life_snapshots), options);

        std::cout << "=== Replay " << match->match_id << " ===" << std::endl;
        if (config_.verbose) {
            for (const auto& [zone, role] : replay.roles) {
                std::cout << "  zone " << zone << ": " << to_string(role) << std::endl;
            }
        }
        for (const auto& step : replay.steps) {
            std::cout << format_replay_step(step) << std::endl;
        }

        if (args_.trace) {
            ReplayLogger logger(cards_.get(), config_.trace_dir);
            logger.log_replay(*match, replay);
        }
        return 0;
    }
};

int main(int argc, char** argv) {
    CliArgs args;
    if (!parse_args(argc, argv, args)) {
        print_help();
        return 2;
    }

    try {
        Cli cli(std::move(args));
        return cli.run();
    } catch (const TrackerError& e) {
        std::cerr << "[arena_cli] " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[arena_cli] Unexpected error: " << e.what() << std::endl;
        return 1;
    }
}
