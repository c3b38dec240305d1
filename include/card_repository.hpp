/**
 * Card Battle Engine - Card Repository
 *
 * Stores immutable card data loaded from JSON.
 * Provides fast lookup by templateId and by creature name.
 */

#pragma once

#include "effect_types.hpp"
#include <unordered_map>
#include <nlohmann/json_fwd.hpp>

namespace cardbattle {

/**
 * Creature attributes that change knockout value and criteria matching.
 */
struct CreatureAttributes {
    bool ex = false;
    bool mega = false;
    bool ultra_beast = false;
};

struct AttackData {
    std::string name;
    AmountSpec damage;                // Resolved in the attack's context
    EnergyCost energy_requirements;   // COLORLESS is matched by any type
    std::vector<Effect> effects;
};

struct AbilityData {
    std::string name;
    Trigger trigger;
    std::vector<Effect> effects;
};

struct CreatureData {
    TemplateID template_id;
    std::string name;
    int max_hp = 0;
    EnergyType type = EnergyType::COLORLESS;
    std::optional<EnergyType> weakness;
    int retreat_cost = 0;
    std::vector<AttackData> attacks;
    std::optional<AbilityData> ability;
    std::optional<std::string> previous_stage_name;
    CreatureAttributes attributes;

    bool is_basic() const { return !previous_stage_name.has_value(); }

    // Points awarded to the opponent on knockout
    int get_knockout_points() const {
        if (attributes.mega) return 3;
        if (attributes.ex) return 2;
        return 1;
    }
};

struct SupporterData {
    TemplateID template_id;
    std::string name;
    std::vector<Effect> effects;
};

struct ItemData {
    TemplateID template_id;
    std::string name;
    std::vector<Effect> effects;
};

struct ToolData {
    TemplateID template_id;
    std::string name;
    Trigger trigger{TriggerKind::PASSIVE};
    std::vector<Effect> effects;
};

/**
 * CardData - Card categories as a tagged variant (no inheritance).
 */
using CardData = std::variant<CreatureData, SupporterData, ItemData, ToolData>;

inline CardCategory category_of(const CardData& card) {
    return static_cast<CardCategory>(card.index());
}

const TemplateID& template_id_of(const CardData& card);
const std::string& name_of(const CardData& card);

/**
 * CardRepository - Central card lookup.
 *
 * Loads cards from JSON (or accepts them from code via add_card) and
 * provides typed lookup. Typed getters throw std::out_of_range for
 * unknown templateIds.
 */
class CardRepository {
public:
    CardRepository();
    ~CardRepository() = default;

    /**
     * Load cards from a JSON file.
     *
     * Format: {"creatures": [...], "supporters": [...], "items": [...], "tools": [...]}
     */
    bool load_from_json(const std::string& filepath);

    /**
     * Load cards from an in-memory JSON document.
     */
    bool load_from_string(const std::string& text);

    /**
     * Register a card built in code. Replaces an existing templateId.
     */
    void add_card(CardData card);

    /**
     * Get card data by templateId.
     *
     * Returns nullptr if card not found.
     */
    const CardData* get_card(const TemplateID& template_id) const;

    bool has_card(const TemplateID& template_id) const;

    std::optional<CardCategory> get_category(const TemplateID& template_id) const;

    const CreatureData& get_creature(const TemplateID& template_id) const;
    const SupporterData& get_supporter(const TemplateID& template_id) const;
    const ItemData& get_item(const TemplateID& template_id) const;
    const ToolData& get_tool(const TemplateID& template_id) const;

    /**
     * Get the evolution stage of a creature: 0 (basic), 1 or 2.
     */
    int get_evolution_stage(const TemplateID& template_id) const;

    /**
     * All creature templateIds that share a declared name.
     */
    std::vector<TemplateID> get_templates_by_name(const std::string& name) const;

    /**
     * Resolve an effect reference to its descriptor.
     */
    const Effect& get_effect(const EffectRef& ref) const;

    /**
     * Effect list for one origin of a card (an attack, the ability, ...).
     */
    const std::vector<Effect>& get_effects(const TemplateID& template_id,
                                           EffectOrigin origin,
                                           int group_index = 0) const;

    std::vector<TemplateID> get_all_template_ids() const;

    size_t card_count() const { return cards_.size(); }

    /**
     * Static parsing utilities - public for use by other components.
     */
    static EnergyType parse_energy_type(const std::string& s);
    static StatusCondition parse_status_condition(const std::string& s);
    static CardCategory parse_card_category(const std::string& s);

private:
    std::unordered_map<TemplateID, CardData> cards_;
    std::unordered_map<std::string, std::vector<TemplateID>> creatures_by_name_;

    bool load_document(const nlohmann::json& data);
    void index_card(const CardData& card);
};

} // namespace cardbattle
