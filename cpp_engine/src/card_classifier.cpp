/**
 * Arena Tracker - Card/Object Classifier Implementation
 */

#include "card_classifier.hpp"
#include <unordered_map>

namespace arena {

namespace {

const char* const TYPE_PREFIX = "GameObjectType_";
const char* const FACE_SEPARATOR = " // ";

const std::unordered_map<std::string, std::string>& color_labels() {
    static const std::unordered_map<std::string, std::string> labels = {
        {"CardColor_White", "White"},
        {"CardColor_Blue", "Blue"},
        {"CardColor_Black", "Black"},
        {"CardColor_Red", "Red"},
        {"CardColor_Green", "Green"},
    };
    return labels;
}

const std::unordered_map<std::string, std::string>& card_type_labels() {
    static const std::unordered_map<std::string, std::string> labels = {
        {"CardType_Creature", "Creature"},
        {"CardType_Artifact", "Artifact"},
        {"CardType_Enchantment", "Enchantment"},
        {"CardType_Land", "Land"},
        {"CardType_Planeswalker", "Planeswalker"},
        {"CardType_Instant", "Instant"},
        {"CardType_Sorcery", "Sorcery"},
    };
    return labels;
}

std::string strip_prefix(const std::string& value, const std::string& prefix) {
    if (value.compare(0, prefix.size(), prefix) == 0) {
        return value.substr(prefix.size());
    }
    return value;
}

std::string label_or_stripped(const std::unordered_map<std::string, std::string>& labels,
                              const std::string& value, const std::string& prefix) {
    auto it = labels.find(value);
    return it != labels.end() ? it->second : strip_prefix(value, prefix);
}

bool has_grp_id(const ObjectFacts& facts) {
    return facts.grp_id.has_value() && *facts.grp_id != 0;
}

} // namespace

bool is_internal_object_type(const std::string& type) {
    return type == object_type::ABILITY ||
           type == object_type::TRIGGER_HOLDER ||
           type == object_type::REVEALED_CARD;
}

bool is_token_object_type(const std::string& type) {
    return type == object_type::TOKEN || type == object_type::EMBLEM;
}

std::string object_type_label(const std::string& type) {
    if (type.empty()) {
        return "Unknown";
    }
    return strip_prefix(type, TYPE_PREFIX);
}

// ============================================================================
// CLASSIFICATION
// ============================================================================

ObjectClassification classify_objects(const MatchData& match) {
    ObjectClassification result;

    // Omen sightings win regardless of where they fall in instance order
    std::set<GrpId> omen_ids;
    for (const auto& [instance_id, facts] : match.card_instances) {
        if (has_grp_id(facts) && facts.type == object_type::OMEN) {
            omen_ids.insert(*facts.grp_id);
        }
    }

    for (const auto& card : match.deck_cards) {
        if (card.card_id != 0 && omen_ids.count(card.card_id) == 0) {
            result.real_card_ids.insert(card.card_id);
        }
    }

    // card_instances is ordered by instance id, so "first sighting" is stable
    for (const auto& [instance_id, facts] : match.card_instances) {
        if (!has_grp_id(facts) || is_internal_object_type(facts.type)) {
            continue;
        }
        GrpId grp_id = *facts.grp_id;

        if (facts.type == object_type::OMEN) {
            // First Omen sighting supplies the facts
            if (result.special_objects.count(grp_id) == 0 ||
                result.special_objects[grp_id].type != object_type::OMEN) {
                result.special_objects[grp_id] = facts;
            }
            continue;
        }
        if (omen_ids.count(grp_id) > 0) {
            continue;
        }

        if (facts.type == object_type::CARD) {
            result.real_card_ids.insert(grp_id);
            result.special_objects.erase(grp_id);
        } else if (result.real_card_ids.count(grp_id) == 0) {
            result.special_objects.emplace(grp_id, facts);
        }
    }

    for (const auto& action : match.actions) {
        if (!action.card_grp_id.has_value() || *action.card_grp_id == 0) {
            continue;
        }
        GrpId grp_id = *action.card_grp_id;
        if (result.special_objects.count(grp_id) == 0) {
            result.real_card_ids.insert(grp_id);
        }
    }

    return result;
}

// ============================================================================
// NAMING
// ============================================================================

std::string generate_token_name(const ObjectFacts& facts) {
    if (facts.type == object_type::EMBLEM) {
        return "Emblem";
    }

    std::vector<std::string> parts;
    if (facts.power.has_value() && facts.toughness.has_value()) {
        parts.push_back(std::to_string(*facts.power) + "/" + std::to_string(*facts.toughness));
    }
    for (const auto& color : facts.colors) {
        parts.push_back(label_or_stripped(color_labels(), color, "CardColor_"));
    }
    for (const auto& subtype : facts.subtypes) {
        parts.push_back(strip_prefix(subtype, "SubType_"));
    }
    for (const auto& card_type : facts.card_types) {
        parts.push_back(label_or_stripped(card_type_labels(), card_type, "CardType_"));
    }
    parts.push_back("Token");

    std::string name;
    for (const auto& part : parts) {
        if (!name.empty()) {
            name += ' ';
        }
        name += part;
    }
    return name;
}

std::vector<ResolvedCard> resolve_card_names(const ObjectClassification& classification,
                                             const CardLookup* lookup) {
    std::set<GrpId> wanted = classification.real_card_ids;
    for (const auto& [grp_id, facts] : classification.special_objects) {
        if (!is_token_object_type(facts.type)) {
            wanted.insert(grp_id);
            if (facts.type == object_type::OMEN) {
                wanted.insert(grp_id - 1);
            }
        }
    }

    std::unordered_map<GrpId, const CardFacts*> found;
    if (lookup != nullptr) {
        found = lookup->lookup_many(wanted);
    }
    auto find = [&found](GrpId grp_id) -> const CardFacts* {
        auto it = found.find(grp_id);
        return it != found.end() ? it->second : nullptr;
    };

    std::map<GrpId, ResolvedCard> rows;

    for (GrpId grp_id : classification.real_card_ids) {
        ResolvedCard row;
        row.grp_id = grp_id;
        if (const CardFacts* card = find(grp_id)) {
            row.name = card->name;
            row.facts = *card;
        } else {
            row.name = "Unknown Card (" + std::to_string(grp_id) + ")";
        }
        rows[grp_id] = std::move(row);
    }

    for (const auto& [grp_id, facts] : classification.special_objects) {
        ResolvedCard row;
        row.grp_id = grp_id;
        row.object_type = facts.type;

        if (is_token_object_type(facts.type)) {
            row.name = generate_token_name(facts);
            row.is_token = true;
        } else if (const CardFacts* card = find(grp_id)) {
            row.name = card->name;
            row.facts = *card;
        } else {
            if (facts.type == object_type::OMEN) {
                const CardFacts* front = find(grp_id - 1);
                if (front != nullptr) {
                    size_t sep = front->name.find(FACE_SEPARATOR);
                    if (sep != std::string::npos) {
                        std::string back = front->name.substr(sep + std::string(FACE_SEPARATOR).size());
                        size_t next = back.find(FACE_SEPARATOR);
                        row.name = back.substr(0, next);
                        row.source_grp_id = grp_id - 1;
                    }
                }
            }
            if (row.name.empty()) {
                row.name = "[" + object_type_label(facts.type) + "] (" + std::to_string(grp_id) + ")";
            }
        }
        rows[grp_id] = std::move(row);
    }

    std::vector<ResolvedCard> resolved;
    resolved.reserve(rows.size());
    for (auto& [grp_id, row] : rows) {
        resolved.push_back(std::move(row));
    }
    return resolved;
}

} // namespace arena
