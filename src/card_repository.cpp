/**
 * Card Battle Engine - Card Repository Implementation
 *
 * Loads card definitions from JSON files using nlohmann/json.
 */

#include "card_repository.hpp"
#include "effect_parser.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <fstream>
#include <iostream>
#include <stdexcept>

using json = nlohmann::json;

namespace cardbattle {

const TemplateID& template_id_of(const CardData& card) {
    return std::visit([](const auto& c) -> const TemplateID& { return c.template_id; }, card);
}

const std::string& name_of(const CardData& card) {
    return std::visit([](const auto& c) -> const std::string& { return c.name; }, card);
}

CardRepository::CardRepository() {}

bool CardRepository::load_from_json(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        std::cerr << "[CardRepository] Failed to open: " << filepath << std::endl;
        return false;
    }

    try {
        json data = json::parse(file);
        return load_document(data);
    } catch (const json::parse_error& e) {
        std::cerr << "[CardRepository] JSON parse error: " << e.what() << std::endl;
        return false;
    }
}

bool CardRepository::load_from_string(const std::string& text) {
    try {
        json data = json::parse(text);
        return load_document(data);
    } catch (const json::parse_error& e) {
        std::cerr << "[CardRepository] JSON parse error: " << e.what() << std::endl;
        return false;
    }
}

bool CardRepository::load_document(const json& data) {
    if (!data.is_object()) {
        std::cerr << "[CardRepository] Card document must be an object" << std::endl;
        return false;
    }

    // Parse everything first so a malformed card leaves the repository untouched
    std::vector<CardData> parsed;
    try {
        if (data.contains("creatures")) {
            for (const auto& j : data["creatures"]) parsed.emplace_back(parse_creature(j));
        }
        if (data.contains("supporters")) {
            for (const auto& j : data["supporters"]) parsed.emplace_back(parse_supporter(j));
        }
        if (data.contains("items")) {
            for (const auto& j : data["items"]) parsed.emplace_back(parse_item(j));
        }
        if (data.contains("tools")) {
            for (const auto& j : data["tools"]) parsed.emplace_back(parse_tool(j));
        }
    } catch (const json::exception& e) {
        std::cerr << "[CardRepository] JSON error: " << e.what() << std::endl;
        return false;
    } catch (const std::invalid_argument& e) {
        std::cerr << "[CardRepository] Invalid card: " << e.what() << std::endl;
        return false;
    }

    for (auto& card : parsed) {
        add_card(std::move(card));
    }

    std::cout << "[CardRepository] Loaded " << parsed.size() << " cards" << std::endl;
    return true;
}

void CardRepository::add_card(CardData card) {
    const TemplateID id = template_id_of(card);

    auto existing = cards_.find(id);
    if (existing != cards_.end() && category_of(existing->second) == CardCategory::CREATURE) {
        auto& ids = creatures_by_name_[name_of(existing->second)];
        ids.erase(std::remove(ids.begin(), ids.end(), id), ids.end());
    }

    index_card(card);
    cards_[id] = std::move(card);
}

void CardRepository::index_card(const CardData& card) {
    if (category_of(card) == CardCategory::CREATURE) {
        creatures_by_name_[name_of(card)].push_back(template_id_of(card));
    }
}

// ============================================================================
// LOOKUP
// ============================================================================

const CardData* CardRepository::get_card(const TemplateID& template_id) const {
    auto it = cards_.find(template_id);
    return it != cards_.end() ? &it->second : nullptr;
}

bool CardRepository::has_card(const TemplateID& template_id) const {
    return cards_.find(template_id) != cards_.end();
}

std::optional<CardCategory> CardRepository::get_category(const TemplateID& template_id) const {
    const CardData* card = get_card(template_id);
    if (!card) return std::nullopt;
    return category_of(*card);
}

namespace {

template <typename T>
const T& get_typed(const CardData* card, const TemplateID& template_id, const char* label) {
    if (card) {
        if (const T* typed = std::get_if<T>(card)) {
            return *typed;
        }
    }
    throw std::out_of_range(std::string(label) + " not found: " + template_id);
}

} // anonymous namespace

const CreatureData& CardRepository::get_creature(const TemplateID& template_id) const {
    return get_typed<CreatureData>(get_card(template_id), template_id, "Creature");
}

const SupporterData& CardRepository::get_supporter(const TemplateID& template_id) const {
    return get_typed<SupporterData>(get_card(template_id), template_id, "Supporter");
}

const ItemData& CardRepository::get_item(const TemplateID& template_id) const {
    return get_typed<ItemData>(get_card(template_id), template_id, "Item");
}

const ToolData& CardRepository::get_tool(const TemplateID& template_id) const {
    return get_typed<ToolData>(get_card(template_id), template_id, "Tool");
}

int CardRepository::get_evolution_stage(const TemplateID& template_id) const {
    const CreatureData& creature = get_creature(template_id);
    if (creature.is_basic()) {
        return 0;
    }

    // Stage 2 if the previous stage itself evolves from something
    for (const auto& prev_id : get_templates_by_name(*creature.previous_stage_name)) {
        if (!get_creature(prev_id).is_basic()) {
            return 2;
        }
    }
    return 1;
}

std::vector<TemplateID> CardRepository::get_templates_by_name(const std::string& name) const {
    auto it = creatures_by_name_.find(name);
    if (it == creatures_by_name_.end()) {
        return {};
    }
    return it->second;
}

const std::vector<Effect>& CardRepository::get_effects(const TemplateID& template_id,
                                                       EffectOrigin origin,
                                                       int group_index) const {
    const CardData* card = get_card(template_id);
    if (!card) {
        throw std::out_of_range("Card not found: " + template_id);
    }

    switch (origin) {
        case EffectOrigin::CARD:
            if (const auto* supporter = std::get_if<SupporterData>(card)) return supporter->effects;
            if (const auto* item = std::get_if<ItemData>(card)) return item->effects;
            break;
        case EffectOrigin::ATTACK:
            if (const auto* creature = std::get_if<CreatureData>(card)) {
                if (group_index < 0 || group_index >= static_cast<int>(creature->attacks.size())) {
                    throw std::out_of_range("Attack index out of range: " + template_id);
                }
                return creature->attacks[group_index].effects;
            }
            break;
        case EffectOrigin::ABILITY:
            if (const auto* creature = std::get_if<CreatureData>(card)) {
                if (creature->ability) return creature->ability->effects;
            }
            break;
        case EffectOrigin::TOOL:
            if (const auto* tool = std::get_if<ToolData>(card)) return tool->effects;
            break;
    }

    throw std::out_of_range(std::string("No ") + to_string(origin) + " effects on " + template_id);
}

const Effect& CardRepository::get_effect(const EffectRef& ref) const {
    const auto& effects = get_effects(ref.template_id, ref.origin, ref.group_index);
    if (ref.effect_index < 0 || ref.effect_index >= static_cast<int>(effects.size())) {
        throw std::out_of_range("Effect index out of range: " + ref.template_id);
    }
    return effects[ref.effect_index];
}

std::vector<TemplateID> CardRepository::get_all_template_ids() const {
    std::vector<TemplateID> ids;
    ids.reserve(cards_.size());
    for (const auto& [id, card] : cards_) {
        ids.push_back(id);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

// ============================================================================
// PARSING UTILITIES
// ============================================================================

EnergyType CardRepository::parse_energy_type(const std::string& s) {
    if (s == "fire") return EnergyType::FIRE;
    if (s == "water") return EnergyType::WATER;
    if (s == "grass") return EnergyType::GRASS;
    if (s == "lightning") return EnergyType::LIGHTNING;
    if (s == "psychic") return EnergyType::PSYCHIC;
    if (s == "fighting") return EnergyType::FIGHTING;
    if (s == "darkness") return EnergyType::DARKNESS;
    if (s == "metal") return EnergyType::METAL;
    if (s == "colorless") return EnergyType::COLORLESS;
    throw std::invalid_argument("Unknown energy type: " + s);
}

StatusCondition CardRepository::parse_status_condition(const std::string& s) {
    if (s == "sleep") return StatusCondition::SLEEP;
    if (s == "burn") return StatusCondition::BURN;
    if (s == "confusion") return StatusCondition::CONFUSION;
    if (s == "paralysis") return StatusCondition::PARALYSIS;
    if (s == "poison") return StatusCondition::POISON;
    throw std::invalid_argument("Unknown status condition: " + s);
}

CardCategory CardRepository::parse_card_category(const std::string& s) {
    if (s == "creature") return CardCategory::CREATURE;
    if (s == "supporter") return CardCategory::SUPPORTER;
    if (s == "item") return CardCategory::ITEM;
    if (s == "tool") return CardCategory::TOOL;
    throw std::invalid_argument("Unknown card category: " + s);
}

} // namespace cardbattle
