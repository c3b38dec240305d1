/**
 * Tests for Effect Builders
 */

#include <sstream>
#include "test_helpers.hpp"

using namespace cardbattle;
using namespace cardbattle::effects;
using namespace testutil;

// ============================================================================
// CRITERIA BUILDER TESTS
// ============================================================================

TEST(CriteriaBuilder, EmptyBuilderMatchesEverything) {
    FieldCriteria criteria = CriteriaBuilder().build();

    TEST_ASSERT_FALSE(criteria.player.has_value());
    TEST_ASSERT(criteria.position == PositionScope::ANY);
    TEST_ASSERT_FALSE(criteria.has_damage.has_value());
    TEST_ASSERT_TRUE(criteria.has_energy.empty());
    TEST_ASSERT_TRUE(criteria.card.empty());
}

TEST(CriteriaBuilder, ChainedFields) {
    FieldCriteria criteria = CriteriaBuilder()
        .player(PlayerScope::OPPONENT)
        .bench()
        .has_damage()
        .has_energy(EnergyType::WATER, 2)
        .build();

    TEST_ASSERT(*criteria.player == PlayerScope::OPPONENT);
    TEST_ASSERT(criteria.position == PositionScope::BENCH);
    TEST_ASSERT_TRUE(*criteria.has_damage);
    TEST_ASSERT_EQ(2, criteria.has_energy.at(EnergyType::WATER));
}

TEST(CriteriaBuilder, CardFields) {
    FieldCriteria criteria = CriteriaBuilder()
        .name("Ember Fox")
        .name("Blaze Fox")
        .stage(1)
        .evolves_from("Ember Fox")
        .is_type(EnergyType::FIRE)
        .ex(false)
        .mega()
        .build();

    TEST_ASSERT_EQ(2u, criteria.card.names.size());
    TEST_ASSERT_EQ("Blaze Fox", criteria.card.names[1]);
    TEST_ASSERT_EQ(1, *criteria.card.stage);
    TEST_ASSERT_EQ("Ember Fox", *criteria.card.previous_stage_name);
    TEST_ASSERT(*criteria.card.is_type == EnergyType::FIRE);
    TEST_ASSERT_FALSE(*criteria.card.ex);
    TEST_ASSERT_TRUE(*criteria.card.mega);
    TEST_ASSERT_FALSE(criteria.card.ultra_beast.has_value());
    TEST_ASSERT_FALSE(criteria.card.empty());
}

// ============================================================================
// AMOUNT AND TARGET BUILDER TESTS
// ============================================================================

TEST(AmountBuilders, ProducesMatchingAlternatives) {
    TEST_ASSERT_EQ(20, std::get<ConstantAmount>(amount::constant(20).value).value);

    const auto points = std::get<PlayerContextAmount>(amount::points_to_win(PlayerScope::OPPONENT).value);
    TEST_ASSERT(points.source == ContextSource::POINTS_TO_WIN);
    TEST_ASSERT(points.player_context == PlayerScope::OPPONENT);

    const auto cards = std::get<CountAmount>(amount::count_cards(PlayerScope::SELF, ZoneType::DISCARD).value);
    TEST_ASSERT(cards.count_type == CountType::CARD);
    TEST_ASSERT(cards.location == ZoneType::DISCARD);

    const auto energy = std::get<CountAmount>(
        amount::count_energy(CriteriaBuilder().active().build(), {EnergyType::FIRE}).value);
    TEST_ASSERT(energy.count_type == CountType::ENERGY);
    TEST_ASSERT_EQ(1u, energy.energy_types.size());

    const auto total = std::get<AdditionAmount>(
        amount::sum({amount::constant(1), amount::hand_size()}).value);
    TEST_ASSERT_EQ(2u, total.values.size());

    const auto product = std::get<MultiplicationAmount>(
        amount::product(amount::count_damage(FieldCriteria{}), amount::constant(2)).value);
    TEST_ASSERT_NOT_NULL(product.base.get());
    TEST_ASSERT_EQ(2, std::get<ConstantAmount>(product.multiplier->value).value);
}

TEST(TargetBuilders, FixedAndChoiceTargets) {
    const auto active = std::get<FixedTarget>(target::active(PlayerScope::OPPONENT));
    TEST_ASSERT(active.player == PlayerScope::OPPONENT);
    TEST_ASSERT(active.position == FixedPosition::ACTIVE);

    const auto source = std::get<FixedTarget>(target::source());
    TEST_ASSERT(source.position == FixedPosition::SOURCE);

    const auto choice = std::get<SingleChoiceTarget>(
        target::single_choice(CriteriaBuilder().bench().build(), PlayerScope::OPPONENT));
    TEST_ASSERT(choice.chooser == PlayerScope::OPPONENT);
    TEST_ASSERT(choice.criteria.position == PositionScope::BENCH);

    const EnergySource from = target::energy_from(target::active(), {EnergyType::GRASS}, 3);
    TEST_ASSERT_EQ(3, from.count);
    TEST_ASSERT(from.energy_types[0] == EnergyType::GRASS);
    TEST_ASSERT_TRUE(std::holds_alternative<FixedTarget>(from.field_target));
}

// ============================================================================
// EFFECT AND CARD BUILDER TESTS
// ============================================================================

TEST(EffectBuilders, KindsAndDefaults) {
    TEST_ASSERT(effect_kind(make_heal(amount::constant(10), target::active())) == EffectKind::HP);
    TEST_ASSERT(std::get<HpEffect>(make_damage(amount::constant(10), target::active())).operation ==
                HpOperation::DAMAGE);
    TEST_ASSERT(effect_kind(make_switch(target::active())) == EffectKind::SWITCH);

    const auto boost = std::get<DamageBoostEffect>(make_damage_boost(amount::constant(10), FieldCriteria{}));
    TEST_ASSERT(boost.duration == DurationKind::UNTIL_END_OF_TURN);

    const auto bonus = std::get<HpBonusEffect>(make_hp_bonus(amount::constant(10), FieldCriteria{}));
    TEST_ASSERT(bonus.duration == DurationKind::WHILE_IN_PLAY);

    const auto block = std::get<PreventAttackEffect>(make_prevent_attack(FieldCriteria{}));
    TEST_ASSERT(block.duration == DurationKind::UNTIL_END_OF_NEXT_TURN);

    const auto shuffle = std::get<ShuffleEffect>(make_shuffle(PlayerScope::OPPONENT));
    TEST_ASSERT(shuffle.target == PlayerScope::OPPONENT);
    TEST_ASSERT_TRUE(shuffle.shuffle_hand);
    TEST_ASSERT_FALSE(shuffle.draw_after.has_value());

    const auto attach = std::get<EnergyEffect>(
        make_attach_energy(EnergyType::METAL, amount::constant(2), target::source()));
    TEST_ASSERT(attach.operation == EnergyOperation::ATTACH);
    TEST_ASSERT(attach.energy_types[0] == EnergyType::METAL);
}

TEST(EffectBuilders, CostModifierSignAndNewDefaults) {
    const auto cheaper = std::get<AttackEnergyCostModifierEffect>(make_attack_cost_modifier(-2, FieldCriteria{}));
    TEST_ASSERT_TRUE(cheaper.reduce);
    TEST_ASSERT_EQ(2, std::get<ConstantAmount>(cheaper.amount.value).value);

    const auto pricier = std::get<AttackEnergyCostModifierEffect>(make_attack_cost_modifier(1, FieldCriteria{}));
    TEST_ASSERT_FALSE(pricier.reduce);

    const auto guard = std::get<StatusPreventionEffect>(make_status_prevention(FieldCriteria{}));
    TEST_ASSERT(guard.duration == DurationKind::WHILE_IN_PLAY);
    TEST_ASSERT_TRUE(guard.conditions.empty());

    TEST_ASSERT(std::get<RemoveFieldCardEffect>(make_remove_field_card(target::active())).destination ==
                ZoneType::HAND);
    TEST_ASSERT_EQ(1, std::get<EvolutionAccelerationEffect>(make_evolution_acceleration(target::active())).skip_stages);
    TEST_ASSERT(effect_kind(make_search(amount::constant(1))) == EffectKind::SEARCH);
    TEST_ASSERT(effect_kind(make_pull_evolution(target::active())) == EffectKind::PULL_EVOLUTION);
}

TEST(CreatureBuilder, AttackDamageFromAmount) {
    CreatureData creature = CreatureBuilder("storm-hawk", "Storm Hawk", 70, EnergyType::LIGHTNING)
        .attack("Gale", amount::count_cards(PlayerScope::SELF, ZoneType::HAND), {})
        .attack("Peck", 20, {})
        .build();

    TEST_ASSERT(std::holds_alternative<CountAmount>(creature.attacks[0].damage.value));
    TEST_ASSERT_EQ(20, std::get<ConstantAmount>(creature.attacks[1].damage.value).value);
}

TEST(CreatureBuilder, BuildsCreatureData) {
    CreatureData creature = CreatureBuilder("rock-crab", "Rock Crab", 110, EnergyType::FIGHTING)
        .weakness(EnergyType::GRASS)
        .retreat_cost(2)
        .evolves_from("Pebble Crab")
        .ultra_beast()
        .attack("Pinch", 40, {EnergyType::FIGHTING, EnergyType::COLORLESS})
        .ability("Hard Shell", make_trigger(TriggerKind::PASSIVE),
                 {make_hp_bonus(amount::constant(10), FieldCriteria{})})
        .build();

    TEST_ASSERT_EQ("rock-crab", creature.template_id);
    TEST_ASSERT_EQ(110, creature.max_hp);
    TEST_ASSERT(*creature.weakness == EnergyType::GRASS);
    TEST_ASSERT_FALSE(creature.is_basic());
    TEST_ASSERT_TRUE(creature.attributes.ultra_beast);
    TEST_ASSERT_EQ(1, creature.get_knockout_points());
    TEST_ASSERT_EQ(1u, creature.attacks.size());
    TEST_ASSERT_EQ(2u, creature.attacks[0].energy_requirements.size());
    TEST_ASSERT_TRUE(creature.attacks[0].effects.empty());
    TEST_ASSERT_EQ("Hard Shell", creature.ability->name);
    TEST_ASSERT(creature.ability->trigger.kind == TriggerKind::PASSIVE);
}

TEST(CardBuilders, TrainerAndToolData) {
    SupporterData supporter = make_supporter("helper", "Helper", {make_draw(amount::constant(2))});
    TEST_ASSERT_EQ("Helper", supporter.name);
    TEST_ASSERT_EQ(1u, supporter.effects.size());

    ToolData tool = make_tool("charm", "Charm", make_trigger(TriggerKind::ON_RETREAT), {});
    TEST_ASSERT(tool.trigger.kind == TriggerKind::ON_RETREAT);
    TEST_ASSERT(category_of(CardData(tool)) == CardCategory::TOOL);

    Trigger trigger = make_trigger(TriggerKind::START_OF_TURN);
    TEST_ASSERT_FALSE(trigger.unlimited);
    TEST_ASSERT_FALSE(trigger.own_turn_only);
    TEST_ASSERT_FALSE(trigger.first_turn_only);
    TEST_ASSERT_FALSE(trigger.energy_type.has_value());
}
