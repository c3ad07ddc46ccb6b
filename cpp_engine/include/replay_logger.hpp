/**
 * Arena Tracker - Replay Logger
 *
 * Writes a reconstructed match replay to a timestamped trace file:
 * match header, inferred zone roles, one line per replay step and the result.
 */

#pragma once

#include "card_database.hpp"
#include "zone_inference.hpp"
#include <fstream>
#include <string>

namespace arena {

/**
 * ReplayLogger - Human-readable trace of one or more match replays.
 */
class ReplayLogger {
public:
    /**
     * Constructor - creates timestamped log file.
     *
     * @param cards Optional card database for resolving card names
     * @param output_dir Directory for log files (created if missing)
     */
    explicit ReplayLogger(const CardLookup* cards = nullptr,
                          const std::string& output_dir = "replays");

    ~ReplayLogger();

    void set_card_lookup(const CardLookup* cards);

    /**
     * Log match participants, format and deck.
     */
    void log_match_header(const MatchData& match);

    /**
     * Log the inferred zone role map, one zone per line.
     */
    void log_zone_roles(const ZoneRoleMap& roles);

    void log_step(const ReplayStep& step);

    /**
     * Log result, reason and duration.
     */
    void log_match_end(const MatchData& match);

    /**
     * Convenience: header, roles, every step and the result.
     */
    void log_replay(const MatchData& match, const Replay& replay);

    const std::string& get_log_path() const { return log_path_; }

    bool is_enabled() const { return enabled_; }

    void set_enabled(bool enabled) { enabled_ = enabled; }

private:
    std::string log_path_;
    std::ofstream log_file_;
    const CardLookup* cards_ = nullptr;
    bool enabled_ = true;

    /**
     * Format a card as "Name (grpId)", or just "(grpId)" when unknown.
     */
    std::string fmt_card(GrpId grp_id) const;
};

} // namespace arena
