/**
 * Arena Tracker - Card/Object Classifier
 *
 * Splits the grpIds referenced by a match into real cards (resolved through
 * the card database) and special objects (tokens, emblems, alternate faces,
 * Omens) that are named locally from their game-state facts.
 */

#pragma once

#include "card_database.hpp"
#include "match_data.hpp"
#include <map>
#include <set>

namespace arena {

/**
 * Result of classify_objects(). The two id sets are disjoint.
 */
struct ObjectClassification {
    std::set<GrpId> real_card_ids;
    std::map<GrpId, ObjectFacts> special_objects;   // grpId -> representative facts

    bool is_real(GrpId grp_id) const { return real_card_ids.count(grp_id) > 0; }
    bool is_special(GrpId grp_id) const { return special_objects.count(grp_id) > 0; }
};

/**
 * Classify every grpId in the match.
 *
 * Rules:
 * - Ability, TriggerHolder and RevealedCard objects are ignored.
 * - Card objects and decklist ids are real cards.
 * - Omen objects are always special, whatever else the id was seen as.
 * - Other object types are special; the lowest instance id supplies the facts.
 * - Ids referenced only by actions are real cards.
 */
ObjectClassification classify_objects(const MatchData& match);

/**
 * True for engine-internal object types that never reach the card table.
 */
bool is_internal_object_type(const std::string& type);

/**
 * True for Token and Emblem object types.
 */
bool is_token_object_type(const std::string& type);

/**
 * Build a display name for a token, e.g. "1/1 Red Goblin Creature Token".
 * Emblems are always named "Emblem".
 */
std::string generate_token_name(const ObjectFacts& facts);

/**
 * Object type without its "GameObjectType_" prefix, or "Unknown" when empty.
 */
std::string object_type_label(const std::string& type);

/**
 * ResolvedCard - A named row ready for the card table.
 */
struct ResolvedCard {
    GrpId grp_id = 0;
    std::string name;
    std::string object_type;              // Empty for real cards
    bool is_token = false;
    std::optional<GrpId> source_grp_id;   // Front face an Omen was named from
    std::optional<CardFacts> facts;       // Set when the card database had the id
};

/**
 * Name every classified id, in ascending grpId order.
 *
 * Real-card misses become "Unknown Card (<id>)". Special objects that are
 * neither tokens nor found in the database become "[<Label>] (<id>)", except
 * an Omen whose front face (id - 1) has a "Front // Back" name, which takes
 * the back half. lookup may be null, in which case every lookup misses.
 */
std::vector<ResolvedCard> resolve_card_names(const ObjectClassification& classification,
                                             const CardLookup* lookup);

} // namespace arena
