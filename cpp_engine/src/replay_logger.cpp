/**
 * Arena Tracker - Replay Logger Implementation
 */

#include "replay_logger.hpp"
#include "match_export.hpp"
#include <filesystem>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <iostream>

namespace arena {

namespace {

std::string or_dash(const std::optional<std::string>& value) {
    return value.has_value() ? *value : "-";
}

} // namespace

ReplayLogger::ReplayLogger(const CardLookup* cards, const std::string& output_dir)
    : cards_(cards) {

    std::error_code ec;
    std::filesystem::create_directories(output_dir, ec);
    if (ec) {
        std::cerr << "[Replay Logger] Failed to create directory " << output_dir
                  << ": " << ec.message() << std::endl;
        enabled_ = false;
        return;
    }

    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm tm = *std::localtime(&time_t);

    std::ostringstream filename;
    filename << output_dir << "/replay_"
             << std::put_time(&tm, "%Y%m%d_%H%M%S") << ".log";
    log_path_ = filename.str();

    log_file_.open(log_path_);
    if (!log_file_.is_open()) {
        std::cerr << "[Replay Logger] Failed to open log file: " << log_path_ << std::endl;
        enabled_ = false;
        return;
    }

    log_file_ << std::string(80, '=') << "\n";
    log_file_ << "MATCH REPLAY - ZONE TRANSFER TRACE\n";

    std::ostringstream timestamp;
    timestamp << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    log_file_ << "Started: " << timestamp.str() << "\n";
    log_file_ << std::string(80, '=') << "\n\n";

    std::cout << "[Replay Logger] Logging to: " << log_path_ << std::endl;
}

ReplayLogger::~ReplayLogger() {
    if (log_file_.is_open()) {
        log_file_.close();
    }
}

void ReplayLogger::set_card_lookup(const CardLookup* cards) {
    cards_ = cards;
}

std::string ReplayLogger::fmt_card(GrpId grp_id) const {
    std::string id = "(" + std::to_string(grp_id) + ")";
    if (cards_) {
        const CardFacts* card = cards_->lookup(grp_id);
        if (card) {
            return card->name + " " + id;
        }
    }
    return id;
}

void ReplayLogger::log_match_header(const MatchData& match) {
    if (!enabled_ || !log_file_.is_open()) return;

    log_file_ << std::string(80, '#') << "\n";
    log_file_ << "[MATCH " << match.match_id << "]\n";
    log_file_ << std::string(80, '#') << "\n";
    log_file_ << "You:      " << or_dash(match.player_name);
    if (match.player_seat_id) log_file_ << " (seat " << *match.player_seat_id << ")";
    log_file_ << "\n";
    log_file_ << "Opponent: " << or_dash(match.opponent_name);
    if (match.opponent_seat_id) log_file_ << " (seat " << *match.opponent_seat_id << ")";
    log_file_ << "\n";
    log_file_ << "Event:    " << or_dash(match.event_id) << "\n";
    log_file_ << "Format:   " << or_dash(match.format) << "\n";
    log_file_ << "Deck:     " << or_dash(match.deck_name);
    if (!match.deck_cards.empty()) {
        int total = 0;
        for (const auto& card : match.deck_cards) total += card.quantity;
        log_file_ << " (" << total << " cards)";
    }
    log_file_ << "\n\n";
}

void ReplayLogger::log_zone_roles(const ZoneRoleMap& roles) {
    if (!enabled_ || !log_file_.is_open()) return;

    log_file_ << "ZONES (" << roles.size() << "):\n";
    for (const auto& [zone, role] : roles) {
        log_file_ << "  " << std::setw(4) << zone << "  " << to_string(role) << "\n";
    }
    log_file_ << "\n";
}

void ReplayLogger::log_step(const ReplayStep& step) {
    if (!enabled_ || !log_file_.is_open()) return;

    log_file_ << "[gs " << std::setw(4) << step.game_state_id << "] "
              << format_replay_step(step) << "  #" << step.instance_id;
    if (cards_ == nullptr || cards_->lookup(step.grp_id) == nullptr) {
        log_file_ << "  " << fmt_card(step.grp_id);
    }
    log_file_ << "\n";
}

void ReplayLogger::log_match_end(const MatchData& match) {
    if (!enabled_ || !log_file_.is_open()) return;

    log_file_ << "\n" << std::string(80, '=') << "\n";
    log_file_ << "MATCH END\n";
    log_file_ << std::string(80, '=') << "\n";

    if (match.result.has_value()) {
        log_file_ << "Result: " << to_string(*match.result) << "\n";
    } else {
        log_file_ << "Result: (incomplete)\n";
    }
    log_file_ << "Reason: " << or_dash(match.winning_reason) << "\n";
    log_file_ << "Turns:  " << match.total_turns << "\n";

    auto duration = duration_seconds(match);
    if (duration.has_value()) {
        log_file_ << "Duration: " << *duration << "s\n";
    }

    log_file_ << std::string(80, '=') << "\n\n";

    log_file_.flush();
}

void ReplayLogger::log_replay(const MatchData& match, const Replay& replay) {
    log_match_header(match);
    log_zone_roles(replay.roles);
    for (const auto& step : replay.steps) {
        log_step(step);
    }
    log_match_end(match);
}

} // namespace arena
