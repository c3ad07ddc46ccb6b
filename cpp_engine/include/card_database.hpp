/**
 * Arena Tracker - Card Database
 *
 * Read-only card definitions keyed by Arena ID (grpId), loaded from a
 * JSON index. The index itself is built by an external bulk-download step.
 */

#pragma once

#include "types.hpp"
#include <set>
#include <nlohmann/json_fwd.hpp>

namespace arena {

/**
 * Card definition (immutable).
 *
 * For double-faced cards the name is the full "Front // Back" name while the
 * remaining fields come from the front face.
 */
struct CardFacts {
    GrpId arena_id = 0;
    std::string name;
    std::string mana_cost;
    double cmc = 0.0;
    std::string type_line;
    std::vector<std::string> colors;
    std::vector<std::string> color_identity;
    std::string set_code;
    std::string rarity;
    std::string oracle_text;
    std::optional<std::string> power;
    std::optional<std::string> toughness;
    std::string scryfall_id;
    std::string image_uri;
};

/**
 * CardLookup - Card database as seen by the classifier and replay.
 *
 * Lookups are synchronous and read-only; a miss is not an error.
 */
class CardLookup {
public:
    virtual ~CardLookup() = default;

    /**
     * Get a card definition by Arena ID.
     *
     * Returns nullptr if the card is not known.
     */
    virtual const CardFacts* lookup(GrpId grp_id) const = 0;

    /**
     * Look up a batch of IDs. Misses map to nullptr.
     */
    virtual std::unordered_map<GrpId, const CardFacts*> lookup_many(const std::set<GrpId>& ids) const;

    /**
     * Like lookup(), but throws CardLookupError on a miss.
     */
    const CardFacts& require(GrpId grp_id) const;
};

/**
 * CardDatabase - In-memory index loaded from JSON.
 *
 * Accepted layouts:
 * - an array of card objects carrying "arena_id" (bulk card data)
 * - an object keyed by arena id whose values are card objects (saved index)
 */
class CardDatabase : public CardLookup {
public:
    CardDatabase();
    ~CardDatabase() override = default;

    /**
     * Load cards from a JSON file.
     */
    bool load_from_json(const std::string& filepath);

    /**
     * Load cards from an already-parsed JSON document.
     */
    bool load_from_document(const nlohmann::json& data);

    /**
     * Add or replace a single card.
     */
    void add_card(CardFacts card);

    const CardFacts* lookup(GrpId grp_id) const override;

    bool has_card(GrpId grp_id) const;

    std::vector<GrpId> get_all_arena_ids() const;

    size_t card_count() const { return cards_.size(); }

    /**
     * Reduce one bulk card object to the fields the tracker keeps.
     */
    static CardFacts parse_card(const nlohmann::json& card_json);

private:
    std::unordered_map<GrpId, CardFacts> cards_;
};

} // namespace arena
