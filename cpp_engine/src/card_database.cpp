/**
 * Arena Tracker - Card Database Implementation
 *
 * Loads card definitions from JSON files using nlohmann/json.
 * Double-faced cards take their gameplay fields from the front face.
 */

#include "card_database.hpp"
#include "errors.hpp"
#include "json_fields.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <fstream>
#include <iostream>

using json = nlohmann::json;

namespace arena {

using namespace json_fields;

namespace {

std::vector<std::string> string_list(const json& obj, const char* key) {
    std::vector<std::string> out;
    if (!has(obj, key) || !obj.at(key).is_array()) {
        return out;
    }
    for (const auto& v : obj.at(key)) {
        if (v.is_string()) {
            out.push_back(v.get<std::string>());
        }
    }
    return out;
}

// Bulk data writes power/toughness as strings ("2", "*"); tolerate numbers too
std::optional<std::string> stat_field(const json& obj, const char* key) {
    if (!has(obj, key)) return std::nullopt;
    const auto& v = obj.at(key);
    return v.is_string() ? v.get<std::string>() : v.dump();
}

std::string image_field(const json& obj) {
    if (has(obj, "image_uris") && obj.at("image_uris").is_object()) {
        return string_or(obj.at("image_uris"), "normal");
    }
    return string_or(obj, "image_uri");
}

} // namespace

// ============================================================================
// CARD LOOKUP
// ============================================================================

std::unordered_map<GrpId, const CardFacts*> CardLookup::lookup_many(const std::set<GrpId>& ids) const {
    std::unordered_map<GrpId, const CardFacts*> found;
    for (GrpId id : ids) {
        found[id] = lookup(id);
    }
    return found;
}

const CardFacts& CardLookup::require(GrpId grp_id) const {
    const CardFacts* card = lookup(grp_id);
    if (card == nullptr) {
        throw CardLookupError("Card not found in card database", grp_id);
    }
    return *card;
}

// ============================================================================
// CARD DATABASE
// ============================================================================

CardDatabase::CardDatabase() {}

bool CardDatabase::load_from_json(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        std::cerr << "[CardDatabase] Failed to open: " << filepath << std::endl;
        return false;
    }

    try {
        json data = json::parse(file);
        return load_from_document(data);
    } catch (const json::parse_error& e) {
        std::cerr << "[CardDatabase] JSON parse error: " << e.what() << std::endl;
        return false;
    } catch (const std::exception& e) {
        std::cerr << "[CardDatabase] Error: " << e.what() << std::endl;
        return false;
    }
}

bool CardDatabase::load_from_document(const json& data) {
    int card_count = 0;

    if (data.is_array()) {
        for (const auto& card_json : data) {
            if (!card_json.is_object() || !has(card_json, "arena_id")) {
                continue;  // Not on Arena
            }
            CardFacts card = parse_card(card_json);
            if (card.arena_id != 0) {
                cards_[card.arena_id] = std::move(card);
                card_count++;
            }
        }
    } else if (data.is_object()) {
        for (const auto& [key, card_json] : data.items()) {
            if (!card_json.is_object()) {
                continue;
            }
            CardFacts card = parse_card(card_json);
            if (card.arena_id == 0) {
                try {
                    card.arena_id = std::stoi(key);
                } catch (const std::exception&) {
                    std::cerr << "[CardDatabase] Skipping non-numeric key: " << key << std::endl;
                    continue;
                }
            }
            cards_[card.arena_id] = std::move(card);
            card_count++;
        }
    } else {
        std::cerr << "[CardDatabase] Expected a card array or an id-keyed object" << std::endl;
        return false;
    }

    std::cout << "[CardDatabase] Loaded " << card_count << " cards" << std::endl;
    return true;
}

CardFacts CardDatabase::parse_card(const json& card_json) {
    CardFacts card;

    card.arena_id = int_or(card_json, "arena_id");
    card.name = string_or(card_json, "name");
    card.cmc = has(card_json, "cmc") ? card_json.at("cmc").get<double>() : 0.0;
    card.colors = string_list(card_json, "colors");
    card.color_identity = string_list(card_json, "color_identity");
    card.set_code = has(card_json, "set") ? string_or(card_json, "set") : string_or(card_json, "set_code");
    card.rarity = string_or(card_json, "rarity");
    card.scryfall_id = has(card_json, "id") ? string_or(card_json, "id") : string_or(card_json, "scryfall_id");

    // Double-faced cards keep the full name but play as their front face
    const json* face = &card_json;
    if (has(card_json, "card_faces") && card_json.at("card_faces").is_array() &&
        !card_json.at("card_faces").empty()) {
        face = &card_json.at("card_faces")[0];
    }

    card.mana_cost = string_or(*face, "mana_cost", string_or(card_json, "mana_cost"));
    card.type_line = string_or(*face, "type_line", string_or(card_json, "type_line"));
    card.oracle_text = string_or(*face, "oracle_text", string_or(card_json, "oracle_text"));
    card.power = stat_field(*face, "power");
    card.toughness = stat_field(*face, "toughness");
    card.image_uri = image_field(*face);
    if (card.image_uri.empty()) {
        card.image_uri = image_field(card_json);
    }

    return card;
}

void CardDatabase::add_card(CardFacts card) {
    GrpId id = card.arena_id;
    cards_[id] = std::move(card);
}

const CardFacts* CardDatabase::lookup(GrpId grp_id) const {
    auto it = cards_.find(grp_id);
    return it != cards_.end() ? &it->second : nullptr;
}

bool CardDatabase::has_card(GrpId grp_id) const {
    return cards_.find(grp_id) != cards_.end();
}

std::vector<GrpId> CardDatabase::get_all_arena_ids() const {
    std::vector<GrpId> ids;
    ids.reserve(cards_.size());
    for (const auto& [id, card] : cards_) {
        ids.push_back(id);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

} // namespace arena
