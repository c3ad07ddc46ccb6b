/**
 * Arena Tracker - Zone-Role Inference
 *
 * Zone ids in the log are arbitrary per-match integers. Their roles are
 * recovered from transfer statistics by a fixed pipeline of passes, each a
 * pure function from the current role map to an extended one:
 *
 *   1. Battlefield       - highest net among zones with named arrivals
 *   2. Stack             - >=3 named arrivals, |net| <= 3, most arrivals
 *   3. Opponent library  - most anonymous departures
 *   4. Opponent hand     - first zone fed by the opponent library
 *   5. Library           - >=3 named departures, net <= -3, one destination
 *   6. Hand              - fed by a named transfer from a library
 *   7. Graveyard         - net >= 1, fed by battlefield or stack
 *   8. Exile             - anything left with <= 2 named arrivals
 *
 * A pass never relabels a zone. Ties go to the zone seen first in the log.
 */

#pragma once

#include "card_database.hpp"
#include "match_data.hpp"
#include <map>
#include <set>

namespace arena {

using ZoneRoleMap = std::map<ZoneId, ZoneRole>;

/**
 * Per-zone transfer counters. "Named" means the transfer carries a grpId.
 */
struct ZoneStats {
    int named_arrivals = 0;
    int named_departures = 0;
    int anonymous_departures = 0;
    std::set<ZoneId> named_destinations;
    size_t first_seen = 0;            // Position in ZoneAnalysis::encounter_order

    int net() const { return named_arrivals - named_departures; }
};

/**
 * Input shared by every pass.
 */
struct ZoneAnalysis {
    std::vector<ZoneTransferRecord> transfers;
    std::map<ZoneId, ZoneStats> stats;
    std::vector<ZoneId> encounter_order;
};

bool is_named_transfer(const ZoneTransferRecord& transfer);

ZoneAnalysis compute_zone_stats(const std::vector<ZoneTransferRecord>& transfers);

// ============================================================================
// PASSES (applied in this order by infer_zone_roles)
// ============================================================================

ZoneRoleMap assign_battlefield(const ZoneAnalysis& analysis, ZoneRoleMap roles);
ZoneRoleMap assign_stack(const ZoneAnalysis& analysis, ZoneRoleMap roles);
ZoneRoleMap assign_opponent_library(const ZoneAnalysis& analysis, ZoneRoleMap roles);
ZoneRoleMap assign_opponent_hand(const ZoneAnalysis& analysis, ZoneRoleMap roles);
ZoneRoleMap assign_player_library(const ZoneAnalysis& analysis, ZoneRoleMap roles);
ZoneRoleMap assign_hands(const ZoneAnalysis& analysis, ZoneRoleMap roles);
ZoneRoleMap assign_graveyards(const ZoneAnalysis& analysis, ZoneRoleMap roles);
ZoneRoleMap assign_exile(const ZoneAnalysis& analysis, ZoneRoleMap roles);

/**
 * Run all passes. Zones no pass claims are absent from the map.
 */
ZoneRoleMap infer_zone_roles(const std::vector<ZoneTransferRecord>& transfers);
ZoneRoleMap infer_zone_roles(const ZoneAnalysis& analysis);

// ============================================================================
// REPLAY
// ============================================================================

/**
 * ReplayStep - One human-readable event reconstructed from a transfer.
 */
struct ReplayStep {
    int game_state_id = 0;
    int turn_number = 0;
    Actor actor = Actor::UNKNOWN;
    std::string verb;                 // "cast", "drawn", "token created", "moved", ...
    GrpId grp_id = 0;
    InstanceId instance_id = 0;
    std::string card_name;
    std::optional<ZoneId> from_zone;
    std::optional<ZoneId> to_zone;
    std::string from_label;           // Role name or "unknown zone"
    std::string to_label;
    std::optional<int> player_life;
    std::optional<int> opponent_life;
};

struct ReplayOptions {
    SeatId player_seat = LOCAL_PLAYER_SEAT;
    const CardLookup* cards = nullptr;    // Optional; misses give "Unknown Card (<id>)"
};

struct Replay {
    std::vector<ReplayStep> steps;
    ZoneRoleMap roles;
    std::optional<ZoneId> player_hand;
    std::optional<ZoneId> opponent_hand;
};

/**
 * Verb for a (from, to) role pair, or empty when the pair is not narrated.
 * Owner-specific roles are collapsed first.
 */
std::string replay_verb(ZoneRole from, ZoneRole to);

/**
 * Rebuild a narrated replay from one match's stored logs.
 *
 * Transfers without a grpId are skipped. Life totals shown on each step
 * include every life change up to and including the transfer's game state.
 */
Replay build_replay(const std::vector<ZoneTransferRecord>& transfers,
                    const std::vector<LifeChangeRecord>& life_changes,
                    const ReplayOptions& options = {});

/**
 * One line of text, e.g.
 *   "T3 you: Shock cast (Hand -> Stack) [20 / 18]"
 */
std::string format_replay_step(const ReplayStep& step);

} // namespace arena
