/**
 * Card Battle Engine - Effect Builders Implementation
 */

#include "cards/effect_builders.hpp"

namespace cardbattle {
namespace effects {

// ============================================================================
// CRITERIA BUILDER
// ============================================================================

CriteriaBuilder& CriteriaBuilder::player(PlayerScope scope) {
    criteria_.player = scope;
    return *this;
}

CriteriaBuilder& CriteriaBuilder::active() {
    criteria_.position = PositionScope::ACTIVE;
    return *this;
}

CriteriaBuilder& CriteriaBuilder::bench() {
    criteria_.position = PositionScope::BENCH;
    return *this;
}

CriteriaBuilder& CriteriaBuilder::has_damage(bool value) {
    criteria_.has_damage = value;
    return *this;
}

CriteriaBuilder& CriteriaBuilder::has_energy(EnergyType type, int minimum) {
    criteria_.has_energy[type] = minimum;
    return *this;
}

CriteriaBuilder& CriteriaBuilder::name(const std::string& name) {
    criteria_.card.names.push_back(name);
    return *this;
}

CriteriaBuilder& CriteriaBuilder::stage(int stage) {
    criteria_.card.stage = stage;
    return *this;
}

CriteriaBuilder& CriteriaBuilder::evolves_from(const std::string& creature_name) {
    criteria_.card.previous_stage_name = creature_name;
    return *this;
}

CriteriaBuilder& CriteriaBuilder::is_type(EnergyType type) {
    criteria_.card.is_type = type;
    return *this;
}

CriteriaBuilder& CriteriaBuilder::ex(bool value) {
    criteria_.card.ex = value;
    return *this;
}

CriteriaBuilder& CriteriaBuilder::mega(bool value) {
    criteria_.card.mega = value;
    return *this;
}

CriteriaBuilder& CriteriaBuilder::ultra_beast(bool value) {
    criteria_.card.ultra_beast = value;
    return *this;
}

// ============================================================================
// AMOUNT BUILDERS
// ============================================================================

namespace amount {

AmountSpec constant(int value) {
    return ConstantAmount{value};
}

AmountSpec hand_size(PlayerScope player) {
    return PlayerContextAmount{ContextSource::HAND_SIZE, player};
}

AmountSpec current_points(PlayerScope player) {
    return PlayerContextAmount{ContextSource::CURRENT_POINTS, player};
}

AmountSpec points_to_win(PlayerScope player) {
    return PlayerContextAmount{ContextSource::POINTS_TO_WIN, player};
}

AmountSpec count_field(const FieldCriteria& criteria) {
    CountAmount count;
    count.count_type = CountType::FIELD;
    count.criteria = criteria;
    return count;
}

AmountSpec count_cards(PlayerScope player, ZoneType location) {
    CountAmount count;
    count.count_type = CountType::CARD;
    count.player = player;
    count.location = location;
    return count;
}

AmountSpec count_energy(const FieldCriteria& criteria, std::vector<EnergyType> energy_types) {
    CountAmount count;
    count.count_type = CountType::ENERGY;
    count.criteria = criteria;
    count.energy_types = std::move(energy_types);
    return count;
}

AmountSpec count_damage(const FieldCriteria& criteria) {
    CountAmount count;
    count.count_type = CountType::DAMAGE;
    count.criteria = criteria;
    return count;
}

AmountSpec sum(std::vector<AmountSpec> values) {
    return AdditionAmount{std::move(values)};
}

AmountSpec product(const AmountSpec& base, const AmountSpec& multiplier) {
    MultiplicationAmount m;
    m.base = std::make_shared<const AmountSpec>(base);
    m.multiplier = std::make_shared<const AmountSpec>(multiplier);
    return m;
}

} // namespace amount

// ============================================================================
// TARGET BUILDERS
// ============================================================================

namespace target {

FieldTarget active(PlayerScope player) {
    return FixedTarget{player, FixedPosition::ACTIVE};
}

FieldTarget source() {
    return FixedTarget{PlayerScope::SELF, FixedPosition::SOURCE};
}

FieldTarget all_matching(const FieldCriteria& criteria) {
    return AllMatchingTarget{criteria};
}

FieldTarget single_choice(const FieldCriteria& criteria, PlayerScope chooser) {
    return SingleChoiceTarget{chooser, criteria};
}

EnergySource energy_from(const FieldTarget& field_target,
                         std::vector<EnergyType> energy_types,
                         int count) {
    EnergySource source;
    source.field_target = field_target;
    source.energy_types = std::move(energy_types);
    source.count = count;
    return source;
}

} // namespace target

// ============================================================================
// EFFECT BUILDERS
// ============================================================================

Effect make_heal(const AmountSpec& amount, const FieldTarget& target) {
    return HpEffect{amount, target, HpOperation::HEAL};
}

Effect make_damage(const AmountSpec& amount, const FieldTarget& target) {
    return HpEffect{amount, target, HpOperation::DAMAGE};
}

Effect make_status(StatusCondition condition, const FieldTarget& target) {
    return StatusEffect{condition, target};
}

Effect make_status_recovery(const FieldTarget& target, std::vector<StatusCondition> conditions) {
    return StatusRecoveryEffect{target, std::move(conditions)};
}

Effect make_draw(const AmountSpec& amount, PlayerScope player) {
    return DrawEffect{amount, player};
}

Effect make_attach_energy(EnergyType type, const AmountSpec& amount, const FieldTarget& target) {
    return EnergyEffect{EnergyOperation::ATTACH, {type}, amount, target};
}

Effect make_discard_energy(std::vector<EnergyType> types, const AmountSpec& amount, const FieldTarget& target) {
    return EnergyEffect{EnergyOperation::DISCARD, std::move(types), amount, target};
}

Effect make_energy_transfer(const EnergySource& source, const FieldTarget& target) {
    return EnergyTransferEffect{source, target};
}

Effect make_switch(const FieldTarget& target) {
    return SwitchEffect{target};
}

Effect make_shuffle(PlayerScope player, std::optional<AmountSpec> draw_after) {
    return ShuffleEffect{player, true, std::move(draw_after)};
}

Effect make_damage_boost(const AmountSpec& amount, const FieldCriteria& damage_source, DurationKind duration) {
    return DamageBoostEffect{amount, damage_source, duration};
}

Effect make_hp_bonus(const AmountSpec& amount, const FieldCriteria& target, DurationKind duration) {
    return HpBonusEffect{amount, target, duration};
}

Effect make_prevent_attack(const FieldCriteria& target, DurationKind duration) {
    return PreventAttackEffect{target, duration};
}

Effect make_prevent_energy_attachment(PlayerScope target, DurationKind duration) {
    return PreventEnergyAttachmentEffect{target, duration};
}

Effect make_prevent_playing(std::vector<CardCategory> categories, PlayerScope target, DurationKind duration) {
    return PreventPlayingEffect{std::move(categories), target, duration};
}

Effect make_retreat_cost_increase(const AmountSpec& amount, const FieldCriteria& target, DurationKind duration) {
    return RetreatCostIncreaseEffect{amount, target, duration};
}

Effect make_retreat_cost_reduction(const AmountSpec& amount, const FieldCriteria& target, DurationKind duration) {
    return RetreatCostReductionEffect{amount, target, duration};
}

Effect make_retreat_prevention(const FieldCriteria& target, DurationKind duration) {
    return RetreatPreventionEffect{target, duration};
}

Effect make_evolution_flexibility(const std::string& evolution_name, const std::string& base_form,
                                  DurationKind duration) {
    return EvolutionFlexibilityEffect{evolution_name, base_form, duration};
}

Effect make_damage_reduction(const AmountSpec& amount, const FieldCriteria& target,
                             const FieldCriteria& damage_source, DurationKind duration) {
    return DamageReductionEffect{amount, damage_source, target, duration};
}

Effect make_prevent_damage(const FieldCriteria& target, const FieldCriteria& damage_source,
                           DurationKind duration) {
    return PreventDamageEffect{target, damage_source, duration};
}

Effect make_disable_weakness(const FieldCriteria& target, DurationKind duration) {
    return DisableWeaknessEffect{target, duration};
}

Effect make_attack_cost_modifier(int delta, const FieldCriteria& target, DurationKind duration) {
    return AttackEnergyCostModifierEffect{ConstantAmount{delta < 0 ? -delta : delta}, delta < 0, target, duration};
}

Effect make_status_prevention(const FieldCriteria& target, std::vector<StatusCondition> conditions,
                              DurationKind duration) {
    return StatusPreventionEffect{target, std::move(conditions), duration};
}

Effect make_hand_discard(const AmountSpec& amount, PlayerScope target, bool shuffle_into_deck) {
    return HandDiscardEffect{amount, target, shuffle_into_deck};
}

Effect make_search(const AmountSpec& amount, ZoneType location,
                   std::vector<CardCategory> categories, const CardCriteria& card) {
    return SearchEffect{PlayerScope::SELF, location, std::move(categories), card, amount};
}

Effect make_swap_cards(const AmountSpec& discard_amount, const AmountSpec& draw_amount,
                       PlayerScope target, std::optional<int> max_drawn) {
    return SwapCardsEffect{discard_amount, draw_amount, max_drawn, target};
}

Effect make_tool_discard(const FieldTarget& target) {
    return ToolDiscardEffect{target};
}

Effect make_remove_field_card(const FieldTarget& target, ZoneType destination) {
    return RemoveFieldCardEffect{target, destination};
}

Effect make_evolution_acceleration(const FieldTarget& target, int skip_stages) {
    return EvolutionAccelerationEffect{target, skip_stages};
}

Effect make_pull_evolution(const FieldTarget& target, const CardCriteria& card) {
    return PullEvolutionEffect{target, card};
}

// ============================================================================
// CARD BUILDERS
// ============================================================================

CreatureBuilder::CreatureBuilder(const TemplateID& template_id, const std::string& name,
                                 int max_hp, EnergyType type) {
    creature_.template_id = template_id;
    creature_.name = name;
    creature_.max_hp = max_hp;
    creature_.type = type;
}

CreatureBuilder& CreatureBuilder::weakness(EnergyType type) {
    creature_.weakness = type;
    return *this;
}

CreatureBuilder& CreatureBuilder::retreat_cost(int cost) {
    creature_.retreat_cost = cost;
    return *this;
}

CreatureBuilder& CreatureBuilder::evolves_from(const std::string& previous_stage_name) {
    creature_.previous_stage_name = previous_stage_name;
    return *this;
}

CreatureBuilder& CreatureBuilder::ex(bool value) {
    creature_.attributes.ex = value;
    return *this;
}

CreatureBuilder& CreatureBuilder::mega(bool value) {
    creature_.attributes.mega = value;
    return *this;
}

CreatureBuilder& CreatureBuilder::ultra_beast(bool value) {
    creature_.attributes.ultra_beast = value;
    return *this;
}

CreatureBuilder& CreatureBuilder::attack(const std::string& name, int damage, EnergyCost cost,
                                         std::vector<Effect> effects) {
    return attack(name, amount::constant(damage), std::move(cost), std::move(effects));
}

CreatureBuilder& CreatureBuilder::attack(const std::string& name, const AmountSpec& damage, EnergyCost cost,
                                         std::vector<Effect> effects) {
    creature_.attacks.push_back(AttackData{name, damage, std::move(cost), std::move(effects)});
    return *this;
}

CreatureBuilder& CreatureBuilder::ability(const std::string& name, Trigger trigger,
                                          std::vector<Effect> effects) {
    creature_.ability = AbilityData{name, trigger, std::move(effects)};
    return *this;
}

SupporterData make_supporter(const TemplateID& template_id, const std::string& name,
                             std::vector<Effect> effects) {
    return SupporterData{template_id, name, std::move(effects)};
}

ItemData make_item(const TemplateID& template_id, const std::string& name,
                   std::vector<Effect> effects) {
    return ItemData{template_id, name, std::move(effects)};
}

ToolData make_tool(const TemplateID& template_id, const std::string& name,
                   Trigger trigger, std::vector<Effect> effects) {
    return ToolData{template_id, name, trigger, std::move(effects)};
}

Trigger make_trigger(TriggerKind kind) {
    Trigger trigger;
    trigger.kind = kind;
    return trigger;
}

} // namespace effects
} // namespace cardbattle
