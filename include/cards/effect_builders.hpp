/**
 * Card Battle Engine - Effect Builders
 *
 * Reusable building blocks for effect descriptors and card data built in
 * code, as an alternative to the JSON card format.
 *
 * Usage:
 *   auto damaged_bench = CriteriaBuilder()
 *       .player(PlayerScope::SELF)
 *       .bench()
 *       .has_damage()
 *       .build();
 *
 *   Effect heal = make_heal(amount::constant(20), target::single_choice(damaged_bench));
 */

#pragma once

#include "../card_repository.hpp"

namespace cardbattle {
namespace effects {

// ============================================================================
// CRITERIA BUILDER
// ============================================================================

/**
 * CriteriaBuilder - Fluent interface for building FieldCriteria.
 */
class CriteriaBuilder {
public:
    CriteriaBuilder& player(PlayerScope scope);
    CriteriaBuilder& active();
    CriteriaBuilder& bench();
    CriteriaBuilder& has_damage(bool value = true);
    CriteriaBuilder& has_energy(EnergyType type, int minimum = 1);
    CriteriaBuilder& name(const std::string& name);
    CriteriaBuilder& stage(int stage);
    CriteriaBuilder& evolves_from(const std::string& creature_name);
    CriteriaBuilder& is_type(EnergyType type);
    CriteriaBuilder& ex(bool value = true);
    CriteriaBuilder& mega(bool value = true);
    CriteriaBuilder& ultra_beast(bool value = true);

    FieldCriteria build() const { return criteria_; }

private:
    FieldCriteria criteria_;
};

// ============================================================================
// AMOUNT BUILDERS
// ============================================================================

namespace amount {

AmountSpec constant(int value);

AmountSpec hand_size(PlayerScope player = PlayerScope::SELF);
AmountSpec current_points(PlayerScope player = PlayerScope::SELF);
AmountSpec points_to_win(PlayerScope player = PlayerScope::SELF);

AmountSpec count_field(const FieldCriteria& criteria);
AmountSpec count_cards(PlayerScope player, ZoneType location);
AmountSpec count_energy(const FieldCriteria& criteria, std::vector<EnergyType> energy_types = {});
AmountSpec count_damage(const FieldCriteria& criteria);

AmountSpec sum(std::vector<AmountSpec> values);
AmountSpec product(const AmountSpec& base, const AmountSpec& multiplier);

} // namespace amount

// ============================================================================
// TARGET BUILDERS
// ============================================================================

namespace target {

FieldTarget active(PlayerScope player = PlayerScope::SELF);

// The creature that owns the attack, ability or tool
FieldTarget source();

FieldTarget all_matching(const FieldCriteria& criteria);
FieldTarget single_choice(const FieldCriteria& criteria, PlayerScope chooser = PlayerScope::SELF);

EnergySource energy_from(const FieldTarget& field_target,
                         std::vector<EnergyType> energy_types,
                         int count = 1);

} // namespace target

// ============================================================================
// EFFECT BUILDERS
// ============================================================================

Effect make_heal(const AmountSpec& amount, const FieldTarget& target);
Effect make_damage(const AmountSpec& amount, const FieldTarget& target);
Effect make_status(StatusCondition condition, const FieldTarget& target);
Effect make_status_recovery(const FieldTarget& target, std::vector<StatusCondition> conditions = {});
Effect make_draw(const AmountSpec& amount, PlayerScope player = PlayerScope::SELF);

Effect make_attach_energy(EnergyType type, const AmountSpec& amount, const FieldTarget& target);
Effect make_discard_energy(std::vector<EnergyType> types, const AmountSpec& amount, const FieldTarget& target);
Effect make_energy_transfer(const EnergySource& source, const FieldTarget& target);

Effect make_switch(const FieldTarget& target);

/**
 * Shuffle the hand into the deck, then optionally draw.
 */
Effect make_shuffle(PlayerScope player, std::optional<AmountSpec> draw_after = std::nullopt);

Effect make_damage_boost(const AmountSpec& amount, const FieldCriteria& damage_source,
                         DurationKind duration = DurationKind::UNTIL_END_OF_TURN);
Effect make_hp_bonus(const AmountSpec& amount, const FieldCriteria& target,
                     DurationKind duration = DurationKind::WHILE_IN_PLAY);
Effect make_prevent_attack(const FieldCriteria& target,
                           DurationKind duration = DurationKind::UNTIL_END_OF_NEXT_TURN);
Effect make_prevent_energy_attachment(PlayerScope target,
                                      DurationKind duration = DurationKind::UNTIL_END_OF_NEXT_TURN);
Effect make_prevent_playing(std::vector<CardCategory> categories, PlayerScope target,
                            DurationKind duration = DurationKind::UNTIL_END_OF_NEXT_TURN);
Effect make_retreat_cost_increase(const AmountSpec& amount, const FieldCriteria& target,
                                  DurationKind duration = DurationKind::UNTIL_END_OF_NEXT_TURN);
Effect make_retreat_cost_reduction(const AmountSpec& amount, const FieldCriteria& target,
                                   DurationKind duration = DurationKind::UNTIL_END_OF_TURN);
Effect make_retreat_prevention(const FieldCriteria& target,
                               DurationKind duration = DurationKind::UNTIL_END_OF_NEXT_TURN);
Effect make_evolution_flexibility(const std::string& evolution_name, const std::string& base_form,
                                  DurationKind duration = DurationKind::UNTIL_END_OF_TURN);
Effect make_damage_reduction(const AmountSpec& amount, const FieldCriteria& target,
                             const FieldCriteria& damage_source = FieldCriteria{},
                             DurationKind duration = DurationKind::UNTIL_END_OF_NEXT_TURN);
Effect make_prevent_damage(const FieldCriteria& target, const FieldCriteria& damage_source = FieldCriteria{},
                           DurationKind duration = DurationKind::UNTIL_END_OF_NEXT_TURN);
Effect make_disable_weakness(const FieldCriteria& target,
                             DurationKind duration = DurationKind::UNTIL_END_OF_NEXT_TURN);

/**
 * Positive `delta` adds Colorless requirements, negative removes requirements.
 */
Effect make_attack_cost_modifier(int delta, const FieldCriteria& target,
                                 DurationKind duration = DurationKind::UNTIL_END_OF_NEXT_TURN);
Effect make_status_prevention(const FieldCriteria& target, std::vector<StatusCondition> conditions = {},
                              DurationKind duration = DurationKind::WHILE_IN_PLAY);

Effect make_hand_discard(const AmountSpec& amount, PlayerScope target = PlayerScope::SELF,
                         bool shuffle_into_deck = false);
Effect make_search(const AmountSpec& amount, ZoneType location = ZoneType::DECK,
                   std::vector<CardCategory> categories = {}, const CardCriteria& card = CardCriteria{});
Effect make_swap_cards(const AmountSpec& discard_amount, const AmountSpec& draw_amount,
                       PlayerScope target = PlayerScope::SELF, std::optional<int> max_drawn = std::nullopt);

Effect make_tool_discard(const FieldTarget& target);
Effect make_remove_field_card(const FieldTarget& target, ZoneType destination = ZoneType::HAND);
Effect make_evolution_acceleration(const FieldTarget& target, int skip_stages = 1);
Effect make_pull_evolution(const FieldTarget& target, const CardCriteria& card = CardCriteria{});

// ============================================================================
// CARD BUILDERS
// ============================================================================

/**
 * CreatureBuilder - Fluent interface for building CreatureData.
 *
 * Usage:
 *   auto fox = CreatureBuilder("ember-fox", "Ember Fox", 60, EnergyType::FIRE)
 *       .weakness(EnergyType::WATER)
 *       .retreat_cost(1)
 *       .attack("Scorch", 30, {EnergyType::FIRE})
 *       .build();
 */
class CreatureBuilder {
public:
    CreatureBuilder(const TemplateID& template_id, const std::string& name, int max_hp, EnergyType type);

    CreatureBuilder& weakness(EnergyType type);
    CreatureBuilder& retreat_cost(int cost);
    CreatureBuilder& evolves_from(const std::string& previous_stage_name);
    CreatureBuilder& ex(bool value = true);
    CreatureBuilder& mega(bool value = true);
    CreatureBuilder& ultra_beast(bool value = true);
    CreatureBuilder& attack(const std::string& name, int damage, EnergyCost cost,
                            std::vector<Effect> effects = {});
    CreatureBuilder& attack(const std::string& name, const AmountSpec& damage, EnergyCost cost,
                            std::vector<Effect> effects = {});
    CreatureBuilder& ability(const std::string& name, Trigger trigger, std::vector<Effect> effects);

    CreatureData build() const { return creature_; }

private:
    CreatureData creature_;
};

SupporterData make_supporter(const TemplateID& template_id, const std::string& name,
                             std::vector<Effect> effects);
ItemData make_item(const TemplateID& template_id, const std::string& name,
                   std::vector<Effect> effects);
ToolData make_tool(const TemplateID& template_id, const std::string& name,
                   Trigger trigger, std::vector<Effect> effects);

/**
 * Trigger of the given kind with every flag off.
 */
Trigger make_trigger(TriggerKind kind);

} // namespace effects
} // namespace cardbattle
