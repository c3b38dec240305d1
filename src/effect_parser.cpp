/**
 * Card Battle Engine - Effect Descriptor Parsing Implementation
 *
 * Parses the camelCase card-data JSON format using nlohmann/json.
 */

#include "effect_parser.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>

using json = nlohmann::json;

namespace cardbattle {

namespace {

const json& require(const json& j, const char* key) {
    if (!j.is_object() || !j.contains(key)) {
        throw std::invalid_argument(std::string("Missing field '") + key + "' in " + j.dump());
    }
    return j.at(key);
}

PlayerScope parse_player_scope(const std::string& s) {
    if (s == "self") return PlayerScope::SELF;
    if (s == "opponent") return PlayerScope::OPPONENT;
    if (s == "both") return PlayerScope::BOTH;
    throw std::invalid_argument("Unknown player scope: " + s);
}

PositionScope parse_position_scope(const std::string& s) {
    if (s == "active") return PositionScope::ACTIVE;
    if (s == "bench") return PositionScope::BENCH;
    throw std::invalid_argument("Unknown position: " + s);
}

ZoneType parse_zone(const std::string& s) {
    if (s == "hand") return ZoneType::HAND;
    if (s == "deck") return ZoneType::DECK;
    if (s == "discard") return ZoneType::DISCARD;
    if (s == "field") return ZoneType::FIELD;
    throw std::invalid_argument("Unknown location: " + s);
}

std::vector<EnergyType> parse_energy_list(const json& j) {
    std::vector<EnergyType> types;
    if (j.is_string()) {
        types.push_back(CardRepository::parse_energy_type(j.get<std::string>()));
        return types;
    }
    for (const auto& t : j) {
        types.push_back(CardRepository::parse_energy_type(t.get<std::string>()));
    }
    return types;
}

void parse_attributes(const json& j, CardCriteria& card) {
    if (j.contains("ex")) card.ex = j["ex"].get<bool>();
    if (j.contains("mega")) card.mega = j["mega"].get<bool>();
    if (j.contains("ultraBeast")) card.ultra_beast = j["ultraBeast"].get<bool>();
}

void parse_card_criteria(const json& j, CardCriteria& card) {
    if (j.contains("name")) {
        if (j["name"].is_array()) {
            for (const auto& n : j["name"]) card.names.push_back(n.get<std::string>());
        } else {
            card.names.push_back(j["name"].get<std::string>());
        }
    }
    if (j.contains("names")) {
        for (const auto& n : j["names"]) card.names.push_back(n.get<std::string>());
    }
    if (j.contains("stage")) card.stage = j["stage"].get<int>();
    if (j.contains("previousStageName")) {
        card.previous_stage_name = j["previousStageName"].get<std::string>();
    }
    if (j.contains("isType")) {
        card.is_type = CardRepository::parse_energy_type(j["isType"].get<std::string>());
    }
    if (j.contains("attributes")) parse_attributes(j["attributes"], card);
}

// Shared keys of "fieldCriteria" and the older "condition" shape.
void parse_condition(const json& j, FieldCriteria& criteria) {
    if (j.contains("hasDamage")) criteria.has_damage = j["hasDamage"].get<bool>();
    if (j.contains("hasEnergy")) {
        for (const auto& [type, count] : j["hasEnergy"].items()) {
            criteria.has_energy[CardRepository::parse_energy_type(type)] = count.get<int>();
        }
    }
    if (j.contains("cardCriteria")) parse_card_criteria(j["cardCriteria"], criteria.card);
    if (j.contains("evolvesFrom")) {
        criteria.card.previous_stage_name = j["evolvesFrom"].get<std::string>();
    }
    if (j.contains("stage")) criteria.card.stage = j["stage"].get<int>();
    if (j.contains("isType")) {
        criteria.card.is_type = CardRepository::parse_energy_type(j["isType"].get<std::string>());
    }
    if (j.contains("attributes")) parse_attributes(j["attributes"], criteria.card);
}

HpOperation parse_hp_operation(const std::string& s) {
    if (s == "heal") return HpOperation::HEAL;
    if (s == "damage") return HpOperation::DAMAGE;
    throw std::invalid_argument("Unknown hp operation: " + s);
}

EnergyOperation parse_energy_operation(const std::string& s) {
    if (s == "attach") return EnergyOperation::ATTACH;
    if (s == "discard") return EnergyOperation::DISCARD;
    throw std::invalid_argument("Unknown energy operation: " + s);
}

template <typename T>
void parse_duration_into(const json& j, T& effect) {
    if (j.contains("duration")) {
        effect.duration = parse_duration(j["duration"]);
    }
}

FieldCriteria parse_optional_criteria(const json& j, const char* key) {
    if (j.contains(key) && j[key].is_object()) {
        return parse_field_criteria(j[key]);
    }
    return FieldCriteria{};
}

EnergyEffect parse_energy_effect(const json& j, std::optional<EnergyOperation> forced) {
    EnergyEffect effect;
    effect.operation = forced ? *forced
                              : parse_energy_operation(require(j, "operation").get<std::string>());
    if (j.contains("energyType")) {
        effect.energy_types = parse_energy_list(j["energyType"]);
    }
    if (j.contains("energyTypes")) {
        effect.energy_types = parse_energy_list(j["energyTypes"]);
    }
    if (effect.operation == EnergyOperation::ATTACH && effect.energy_types.empty()) {
        throw std::invalid_argument("Energy attach requires an energyType: " + j.dump());
    }
    effect.amount = j.contains("amount") ? parse_amount(j["amount"]) : AmountSpec(ConstantAmount{1});
    effect.target = parse_field_target(require(j, "target"));
    return effect;
}

EnergyTransferEffect parse_energy_transfer(const json& j) {
    EnergyTransferEffect effect;
    const json& source = require(j, "source");
    if (source.value("type", "") == "field") {
        effect.source = parse_energy_source(source);
    } else {
        // Flat shape: source is a field target, types and amount live on the effect
        effect.source.field_target = parse_field_target(source);
        if (j.contains("energyTypes")) effect.source.energy_types = parse_energy_list(j["energyTypes"]);
        if (j.contains("amount")) {
            const AmountSpec amount = parse_amount(j["amount"]);
            if (const auto* constant = std::get_if<ConstantAmount>(&amount.value)) {
                effect.source.count = constant->value;
            } else {
                throw std::invalid_argument("Energy transfer amount must be constant: " + j.dump());
            }
        }
    }
    effect.target = parse_field_target(require(j, "target"));
    return effect;
}

} // anonymous namespace

// ============================================================================
// AMOUNTS / CRITERIA / TARGETS
// ============================================================================

AmountSpec parse_amount(const json& j) {
    if (j.is_number_integer()) {
        return ConstantAmount{j.get<int>()};
    }

    const std::string type = require(j, "type").get<std::string>();

    if (type == "constant") {
        return ConstantAmount{require(j, "value").get<int>()};
    }

    if (type == "player-context-resolved") {
        PlayerContextAmount amount;
        const std::string source = require(j, "source").get<std::string>();
        if (source == "hand-size") {
            amount.source = ContextSource::HAND_SIZE;
        } else if (source == "current-points") {
            amount.source = ContextSource::CURRENT_POINTS;
        } else if (source == "points-to-win") {
            amount.source = ContextSource::POINTS_TO_WIN;
        } else {
            throw std::invalid_argument("Unknown player context source: " + source);
        }
        amount.player_context = parse_player_scope(j.value("playerContext", "self"));
        return amount;
    }

    if (type == "count") {
        CountAmount amount;
        const std::string count_type = require(j, "countType").get<std::string>();
        if (count_type == "field") {
            amount.count_type = CountType::FIELD;
            amount.criteria = parse_optional_criteria(j, "criteria");
        } else if (count_type == "card") {
            amount.count_type = CountType::CARD;
            amount.player = parse_player_scope(j.value("player", "self"));
            amount.location = parse_zone(j.value("location", "hand"));
        } else if (count_type == "energy") {
            amount.count_type = CountType::ENERGY;
            amount.criteria = parse_optional_criteria(j, "fieldCriteria");
            if (j.contains("energyCriteria") && j["energyCriteria"].contains("energyTypes")) {
                amount.energy_types = parse_energy_list(j["energyCriteria"]["energyTypes"]);
            }
        } else if (count_type == "damage") {
            amount.count_type = CountType::DAMAGE;
            amount.criteria = parse_optional_criteria(j, "fieldCriteria");
        } else {
            throw std::invalid_argument("Unknown count type: " + count_type);
        }
        return amount;
    }

    if (type == "addition") {
        AdditionAmount amount;
        for (const auto& child : require(j, "values")) {
            amount.values.push_back(parse_amount(child));
        }
        return amount;
    }

    if (type == "multiplication") {
        MultiplicationAmount amount;
        amount.base = std::make_shared<const AmountSpec>(parse_amount(require(j, "base")));
        amount.multiplier = std::make_shared<const AmountSpec>(parse_amount(require(j, "multiplier")));
        return amount;
    }

    throw std::invalid_argument("Unknown amount type: " + type);
}

FieldCriteria parse_field_criteria(const json& j) {
    FieldCriteria criteria;
    if (j.contains("player")) criteria.player = parse_player_scope(j["player"].get<std::string>());
    if (j.contains("position")) criteria.position = parse_position_scope(j["position"].get<std::string>());
    if (j.contains("location") && parse_zone(j["location"].get<std::string>()) != ZoneType::FIELD) {
        throw std::invalid_argument("Field criteria must target the field: " + j.dump());
    }
    if (j.contains("fieldCriteria")) parse_condition(j["fieldCriteria"], criteria);
    if (j.contains("condition")) parse_condition(j["condition"], criteria);
    return criteria;
}

FieldTarget parse_field_target(const json& j) {
    const std::string type = require(j, "type").get<std::string>();

    if (type == "fixed") {
        FixedTarget target;
        target.player = parse_player_scope(j.value("player", "self"));
        const std::string position = j.value("position", "active");
        if (position == "active") {
            target.position = FixedPosition::ACTIVE;
        } else if (position == "source") {
            target.position = FixedPosition::SOURCE;
        } else {
            throw std::invalid_argument("Unknown fixed position: " + position);
        }
        return target;
    }

    if (type == "all-matching") {
        return AllMatchingTarget{parse_optional_criteria(j, "criteria")};
    }

    if (type == "single-choice") {
        SingleChoiceTarget target;
        target.chooser = parse_player_scope(j.value("chooser", "self"));
        target.criteria = parse_optional_criteria(j, "criteria");
        return target;
    }

    throw std::invalid_argument("Unsupported field target type: " + type);
}

EnergySource parse_energy_source(const json& j) {
    EnergySource source;
    source.field_target = parse_field_target(require(j, "fieldTarget"));
    if (j.contains("criteria") && j["criteria"].contains("energyTypes")) {
        source.energy_types = parse_energy_list(j["criteria"]["energyTypes"]);
    }
    source.count = j.value("count", 1);
    return source;
}

Trigger parse_trigger(const json& j) {
    Trigger trigger;
    const std::string type = require(j, "type").get<std::string>();

    if (type == "manual") trigger.kind = TriggerKind::MANUAL;
    else if (type == "end-of-turn") trigger.kind = TriggerKind::END_OF_TURN;
    else if (type == "start-of-turn") trigger.kind = TriggerKind::START_OF_TURN;
    else if (type == "on-checkup") trigger.kind = TriggerKind::ON_CHECKUP;
    else if (type == "damaged") trigger.kind = TriggerKind::DAMAGED;
    else if (type == "energy-attachment") trigger.kind = TriggerKind::ENERGY_ATTACHMENT;
    else if (type == "on-play") trigger.kind = TriggerKind::ON_PLAY;
    else if (type == "before-knockout") trigger.kind = TriggerKind::BEFORE_KNOCKOUT;
    else if (type == "on-retreat") trigger.kind = TriggerKind::ON_RETREAT;
    else if (type == "passive") trigger.kind = TriggerKind::PASSIVE;
    else throw std::invalid_argument("Unknown trigger type: " + type);

    trigger.unlimited = j.value("unlimited", false);
    trigger.own_turn_only = j.value("ownTurnOnly", false);
    trigger.first_turn_only = j.value("firstTurnOnly", false);
    trigger.filter_evolution = j.value("filterEvolution", false);
    if (j.contains("energyType")) {
        trigger.energy_type = CardRepository::parse_energy_type(j["energyType"].get<std::string>());
    }
    return trigger;
}

DurationKind parse_duration(const json& j) {
    const std::string type = j.is_string() ? j.get<std::string>()
                                           : require(j, "type").get<std::string>();
    if (type == "until-end-of-turn") return DurationKind::UNTIL_END_OF_TURN;
    if (type == "until-end-of-next-turn") return DurationKind::UNTIL_END_OF_NEXT_TURN;
    if (type == "while-in-play") return DurationKind::WHILE_IN_PLAY;
    throw std::invalid_argument("Unknown duration: " + type);
}

// ============================================================================
// EFFECTS
// ============================================================================

Effect parse_effect(const json& j) {
    const std::string type = require(j, "type").get<std::string>();

    if (type == "hp") {
        HpEffect effect;
        effect.amount = parse_amount(require(j, "amount"));
        effect.target = parse_field_target(require(j, "target"));
        effect.operation = parse_hp_operation(require(j, "operation").get<std::string>());
        return effect;
    }

    if (type == "status") {
        StatusEffect effect;
        effect.condition = CardRepository::parse_status_condition(require(j, "condition").get<std::string>());
        effect.target = parse_field_target(require(j, "target"));
        return effect;
    }

    if (type == "status-recovery") {
        StatusRecoveryEffect effect;
        effect.target = parse_field_target(require(j, "target"));
        if (j.contains("conditions")) {
            for (const auto& c : j["conditions"]) {
                effect.conditions.push_back(CardRepository::parse_status_condition(c.get<std::string>()));
            }
        }
        return effect;
    }

    if (type == "draw") {
        DrawEffect effect;
        effect.amount = parse_amount(require(j, "amount"));
        effect.player = parse_player_scope(j.value("player", "self"));
        return effect;
    }

    if (type == "energy") return parse_energy_effect(j, std::nullopt);
    if (type == "energy-attach") return parse_energy_effect(j, EnergyOperation::ATTACH);
    if (type == "energy-discard") return parse_energy_effect(j, EnergyOperation::DISCARD);
    if (type == "energy-transfer") return parse_energy_transfer(j);

    if (type == "switch") {
        return SwitchEffect{parse_field_target(require(j, "target"))};
    }

    if (type == "shuffle") {
        ShuffleEffect effect;
        effect.target = parse_player_scope(j.value("target", "self"));
        effect.shuffle_hand = j.value("shuffleHand", true);
        if (j.contains("drawAfter")) effect.draw_after = parse_amount(j["drawAfter"]);
        return effect;
    }

    if (type == "damage-boost") {
        DamageBoostEffect effect;
        effect.amount = parse_amount(require(j, "amount"));
        effect.damage_source = parse_optional_criteria(j, "damageSource");
        parse_duration_into(j, effect);
        return effect;
    }

    if (type == "hp-bonus") {
        HpBonusEffect effect;
        effect.amount = parse_amount(require(j, "amount"));
        effect.target = parse_optional_criteria(j, "target");
        parse_duration_into(j, effect);
        return effect;
    }

    if (type == "prevent-attack") {
        PreventAttackEffect effect;
        effect.target = parse_optional_criteria(j, "target");
        parse_duration_into(j, effect);
        return effect;
    }

    if (type == "prevent-energy-attachment") {
        PreventEnergyAttachmentEffect effect;
        effect.target = parse_player_scope(j.value("target", "opponent"));
        parse_duration_into(j, effect);
        return effect;
    }

    if (type == "prevent-playing") {
        PreventPlayingEffect effect;
        for (const auto& c : require(j, "cardTypes")) {
            effect.categories.push_back(CardRepository::parse_card_category(c.get<std::string>()));
        }
        effect.target = parse_player_scope(j.value("target", "opponent"));
        parse_duration_into(j, effect);
        return effect;
    }

    if (type == "retreat-cost-increase") {
        RetreatCostIncreaseEffect effect;
        effect.amount = parse_amount(require(j, "amount"));
        effect.target = parse_optional_criteria(j, "target");
        parse_duration_into(j, effect);
        return effect;
    }

    if (type == "retreat-cost-reduction") {
        RetreatCostReductionEffect effect;
        effect.amount = parse_amount(require(j, "amount"));
        effect.target = parse_optional_criteria(j, "target");
        parse_duration_into(j, effect);
        return effect;
    }

    if (type == "retreat-prevention") {
        RetreatPreventionEffect effect;
        effect.target = parse_optional_criteria(j, "target");
        parse_duration_into(j, effect);
        return effect;
    }

    if (type == "evolution-flexibility") {
        EvolutionFlexibilityEffect effect;
        effect.target = require(j, "target").get<std::string>();
        effect.base_form = require(j, "baseForm").get<std::string>();
        parse_duration_into(j, effect);
        return effect;
    }

    if (type == "damage-reduction") {
        DamageReductionEffect effect;
        effect.amount = parse_amount(require(j, "amount"));
        effect.damage_source = parse_optional_criteria(j, "damageSource");
        effect.target = parse_optional_criteria(j, "target");
        parse_duration_into(j, effect);
        return effect;
    }

    if (type == "prevent-damage") {
        PreventDamageEffect effect;
        effect.target = parse_optional_criteria(j, "target");
        effect.damage_source = parse_optional_criteria(j, "damageSource");
        parse_duration_into(j, effect);
        return effect;
    }

    if (type == "disable-weakness") {
        DisableWeaknessEffect effect;
        effect.target = parse_optional_criteria(j, "target");
        parse_duration_into(j, effect);
        return effect;
    }

    if (type == "attack-energy-cost-modifier") {
        AttackEnergyCostModifierEffect effect;
        const json& amount = require(j, "amount");
        effect.amount = parse_amount(amount);
        // Negative constants reduce the cost
        if (const auto* constant = std::get_if<ConstantAmount>(&effect.amount.value)) {
            if (constant->value < 0) {
                effect.amount = ConstantAmount{-constant->value};
                effect.reduce = true;
            }
        }
        effect.target = parse_optional_criteria(j, "target");
        parse_duration_into(j, effect);
        return effect;
    }

    if (type == "status-prevention") {
        StatusPreventionEffect effect;
        effect.target = parse_optional_criteria(j, "target");
        if (j.contains("conditions")) {
            for (const auto& c : j["conditions"]) {
                effect.conditions.push_back(CardRepository::parse_status_condition(c.get<std::string>()));
            }
        }
        parse_duration_into(j, effect);
        return effect;
    }

    if (type == "hand-discard") {
        HandDiscardEffect effect;
        effect.amount = parse_amount(require(j, "amount"));
        effect.target = parse_player_scope(j.value("target", "self"));
        effect.shuffle_into_deck = j.value("shuffleIntoDeck", false);
        return effect;
    }

    if (type == "search") {
        SearchEffect effect;
        const json& source = require(j, "source");
        effect.player = parse_player_scope(source.value("player", "self"));
        effect.location = parse_zone(source.value("location", "deck"));
        if (effect.location != ZoneType::DECK && effect.location != ZoneType::DISCARD) {
            throw std::invalid_argument("Search source must be the deck or discard: " + j.dump());
        }
        if (source.contains("cardTypes")) {
            for (const auto& c : source["cardTypes"]) {
                effect.categories.push_back(CardRepository::parse_card_category(c.get<std::string>()));
            }
        }
        if (source.contains("cardCriteria")) parse_card_criteria(source["cardCriteria"], effect.card);
        effect.amount = j.contains("amount") ? parse_amount(j["amount"]) : AmountSpec(ConstantAmount{1});
        return effect;
    }

    if (type == "swap-cards") {
        SwapCardsEffect effect;
        effect.discard_amount = parse_amount(require(j, "discardAmount"));
        effect.draw_amount = parse_amount(require(j, "drawAmount"));
        if (j.contains("maxDrawn")) effect.max_drawn = j["maxDrawn"].get<int>();
        effect.target = parse_player_scope(j.value("target", "self"));
        return effect;
    }

    if (type == "tool-discard") {
        return ToolDiscardEffect{parse_field_target(require(j, "target"))};
    }

    if (type == "remove-field-card") {
        RemoveFieldCardEffect effect;
        effect.target = parse_field_target(require(j, "target"));
        effect.destination = parse_zone(j.value("destination", "hand"));
        if (effect.destination != ZoneType::HAND && effect.destination != ZoneType::DECK) {
            throw std::invalid_argument("Removed creatures go to the hand or deck: " + j.dump());
        }
        return effect;
    }

    if (type == "evolution-acceleration") {
        EvolutionAccelerationEffect effect;
        effect.target = parse_field_target(require(j, "target"));
        effect.skip_stages = j.value("skipStages", 1);
        if (effect.skip_stages < 1) {
            throw std::invalid_argument("skipStages must be at least 1: " + j.dump());
        }
        return effect;
    }

    if (type == "pull-evolution") {
        PullEvolutionEffect effect;
        effect.target = parse_field_target(require(j, "target"));
        if (j.contains("cardCriteria")) parse_card_criteria(j["cardCriteria"], effect.card);
        return effect;
    }

    throw std::invalid_argument("Unknown effect type: " + type);
}

std::vector<Effect> parse_effects(const json& j) {
    std::vector<Effect> effects;
    if (j.is_null()) {
        return effects;
    }
    for (const auto& e : j) {
        effects.push_back(parse_effect(e));
    }
    return effects;
}

// ============================================================================
// CARDS
// ============================================================================

CreatureData parse_creature(const json& j) {
    CreatureData creature;
    creature.template_id = require(j, "templateId").get<std::string>();
    creature.name = require(j, "name").get<std::string>();
    creature.max_hp = require(j, "maxHp").get<int>();
    creature.type = CardRepository::parse_energy_type(j.value("type", "colorless"));
    if (j.contains("weakness") && !j["weakness"].is_null()) {
        creature.weakness = CardRepository::parse_energy_type(j["weakness"].get<std::string>());
    }
    creature.retreat_cost = j.value("retreatCost", 0);

    if (j.contains("previousStageName") && !j["previousStageName"].is_null()) {
        creature.previous_stage_name = j["previousStageName"].get<std::string>();
    } else if (j.contains("evolvesFrom") && !j["evolvesFrom"].is_null()) {
        creature.previous_stage_name = j["evolvesFrom"].get<std::string>();
    }

    if (j.contains("attributes")) {
        const auto& attrs = j["attributes"];
        creature.attributes.ex = attrs.value("ex", false);
        creature.attributes.mega = attrs.value("mega", false);
        creature.attributes.ultra_beast = attrs.value("ultraBeast", false);
    }

    if (j.contains("attacks")) {
        for (const auto& attack_json : j["attacks"]) {
            AttackData attack;
            attack.name = require(attack_json, "name").get<std::string>();
            // A plain number or any amount shape (multiplication, addition, ...)
            if (attack_json.contains("damage") && !attack_json["damage"].is_null()) {
                attack.damage = parse_amount(attack_json["damage"]);
            }

            // Either ["fire", "colorless"] or [{"type": "fire", "amount": 2}]
            if (attack_json.contains("energyRequirements")) {
                for (const auto& req : attack_json["energyRequirements"]) {
                    if (req.is_string()) {
                        attack.energy_requirements.push_back(
                            CardRepository::parse_energy_type(req.get<std::string>()));
                        continue;
                    }
                    const EnergyType type =
                        CardRepository::parse_energy_type(require(req, "type").get<std::string>());
                    const int amount = req.value("amount", 1);
                    for (int i = 0; i < amount; i++) {
                        attack.energy_requirements.push_back(type);
                    }
                }
            }

            if (attack_json.contains("effects")) {
                attack.effects = parse_effects(attack_json["effects"]);
            }
            creature.attacks.push_back(std::move(attack));
        }
    }

    if (j.contains("ability") && !j["ability"].is_null()) {
        const auto& ability_json = j["ability"];
        AbilityData ability;
        ability.name = require(ability_json, "name").get<std::string>();
        ability.trigger = parse_trigger(require(ability_json, "trigger"));
        ability.effects = parse_effects(ability_json.value("effects", json::array()));
        creature.ability = std::move(ability);
    }

    return creature;
}

SupporterData parse_supporter(const json& j) {
    SupporterData supporter;
    supporter.template_id = require(j, "templateId").get<std::string>();
    supporter.name = require(j, "name").get<std::string>();
    supporter.effects = parse_effects(j.value("effects", json::array()));
    return supporter;
}

ItemData parse_item(const json& j) {
    ItemData item;
    item.template_id = require(j, "templateId").get<std::string>();
    item.name = require(j, "name").get<std::string>();
    item.effects = parse_effects(j.value("effects", json::array()));
    return item;
}

ToolData parse_tool(const json& j) {
    ToolData tool;
    tool.template_id = require(j, "templateId").get<std::string>();
    tool.name = require(j, "name").get<std::string>();
    if (j.contains("trigger") && !j["trigger"].is_null()) {
        tool.trigger = parse_trigger(j["trigger"]);
    }
    tool.effects = parse_effects(j.value("effects", json::array()));
    return tool;
}

} // namespace cardbattle
