/**
 * Arena Tracker - Match Export
 *
 * Everything a storage layer needs to turn a MatchData into rows:
 * life-total diffing, significant-action filtering, transfer dedup, and a
 * deterministic JSON document for the whole aggregate.
 */

#pragma once

#include "match_data.hpp"
#include "match_tracker.hpp"
#include <nlohmann/json_fwd.hpp>

namespace arena {

/**
 * Action types worth storing; the rest are routine legal options.
 */
const std::vector<std::string>& default_significant_action_types();

/**
 * Diff life snapshots per seat.
 *
 * The first sighting of a seat has no change amount; snapshots that repeat
 * the seat's previous total are skipped entirely.
 */
std::vector<LifeChangeRecord> compute_life_changes(const std::vector<LifeSnapshot>& snapshots);

/**
 * Keep actions whose type is in the given list, first occurrence per
 * (gameStateId, actionType, instanceId).
 */
std::vector<ActionRecord> significant_actions(const std::vector<ActionRecord>& actions,
                                              const std::vector<std::string>& types);

/**
 * Keep the first transfer per (gameStateId, instanceId, category).
 */
std::vector<ZoneTransferRecord> dedupe_zone_transfers(
    const std::vector<ZoneTransferRecord>& transfers);

/**
 * Whole seconds between start and end, when both are known.
 */
std::optional<int64_t> duration_seconds(const MatchData& match);

// ============================================================================
// JSON
// ============================================================================

void to_json(nlohmann::json& j, const ObjectFacts& facts);
void to_json(nlohmann::json& j, const ActionRecord& action);
void to_json(nlohmann::json& j, const LifeChangeRecord& change);
void to_json(nlohmann::json& j, const ZoneTransferRecord& transfer);
void to_json(nlohmann::json& j, const MatchData& match);
void to_json(nlohmann::json& j, const ParseError& error);

/**
 * Export document for a parse run: {"matches": [...], "errors": [...]}.
 */
nlohmann::json export_parse_result(const ParseResult& result);

/**
 * Export document as the CLI writes it. Unless all_actions is set, each
 * match keeps only its significant actions and deduplicated transfers.
 */
nlohmann::json export_document(const ParseResult& result,
                               const std::vector<std::string>& significant_types,
                               bool all_actions);

} // namespace arena
