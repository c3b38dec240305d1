/**
 * Tests for BattleEngine actions
 *
 * States are built by hand so every test controls exactly which creatures,
 * cards and energy are in play.
 */

#include <sstream>
#include "test_helpers.hpp"

using namespace cardbattle;
using namespace cardbattle::effects;
using namespace testutil;

namespace {

// Player 0 to move on turn 2, both decks stocked
GameState duel(const TemplateID& ours, const TemplateID& theirs) {
    GameState state = make_state();
    state.turn_number = 2;
    state.current_player = 0;
    place(state, 0, ours);
    place(state, 1, theirs);
    fill_deck(state, 0, "potion", 10);
    fill_deck(state, 1, "potion", 10);
    return state;
}

// Resolve a trainer card's effects as `player` without spending an action
void resolve_card(const BattleEngine& engine, GameState& state, const TemplateID& card, PlayerID player) {
    const EffectQueue& queue = engine.get_effect_queue();
    queue.enqueue_group(state, card, EffectOrigin::CARD, 0, trainer_context(player, card));
    queue.drain(state);
}

const FieldPosition OUR_ACTIVE{0, ACTIVE_POSITION};
const FieldPosition THEIR_ACTIVE{1, ACTIVE_POSITION};

} // anonymous namespace

// ============================================================================
// PLAYING CARDS
// ============================================================================

TEST(EngineActions, SupporterGoesToDiscardAndResolves) {
    BattleEngine engine(make_test_repository());
    GameState state = duel("ember-fox", "tide-turtle");
    const InstanceID scholar = add_to_hand(state, 0, "scholar");

    ActionResult result = engine.step_inplace(state, Action::play_card(0, scholar));

    TEST_ASSERT_MSG(result.success, result.message);
    TEST_ASSERT_NOT_NULL(state.players[0].discard.find_card(scholar));
    TEST_ASSERT_EQ(3, state.players[0].hand.count());
    TEST_ASSERT_EQ(7, state.players[0].deck.count());
    TEST_ASSERT_TRUE(state.players[0].supporter_played_this_turn);
    TEST_ASSERT_EQ(1, state.executed_actions);
}

TEST(EngineActions, SecondSupporterIsRejected) {
    BattleEngine engine(make_test_repository());
    GameState state = duel("ember-fox", "tide-turtle");
    const InstanceID first = add_to_hand(state, 0, "scholar");
    const InstanceID second = add_to_hand(state, 0, "scholar");

    TEST_ASSERT_TRUE(engine.step_inplace(state, Action::play_card(0, first)).success);
    TEST_ASSERT_EQ(4, state.players[0].hand.count());

    ActionResult result = engine.step_inplace(state, Action::play_card(0, second));

    TEST_ASSERT_FALSE(result.success);
    TEST_ASSERT_EQ("A supporter was already played this turn", result.message);
    TEST_ASSERT_EQ(4, state.players[0].hand.count());
    TEST_ASSERT_NOT_NULL(state.players[0].hand.find_card(second));
    TEST_ASSERT_EQ(1, state.executed_actions);
}

TEST(EngineActions, SupporterWithoutTargetsIsRejected) {
    BattleEngine engine(make_test_repository());
    GameState state = duel("ember-fox", "tide-turtle");
    const InstanceID medic = add_to_hand(state, 0, "field-medic");

    ActionResult result = engine.step_inplace(state, Action::play_card(0, medic));

    TEST_ASSERT_FALSE(result.success);
    TEST_ASSERT_EQ("Supporter has no valid targets", result.message);
    TEST_ASSERT_FALSE(state.players[0].supporter_played_this_turn);
}

TEST(EngineActions, ItemsAreNotLimited) {
    BattleEngine engine(make_test_repository());
    GameState state = duel("ember-fox", "tide-turtle");
    state.get_creature(OUR_ACTIVE).damage_taken = 50;
    const InstanceID first = add_to_hand(state, 0, "potion");
    const InstanceID second = add_to_hand(state, 0, "potion");

    TEST_ASSERT_TRUE(engine.step_inplace(state, Action::play_card(0, first)).success);
    TEST_ASSERT_TRUE(engine.step_inplace(state, Action::play_card(0, second)).success);

    TEST_ASSERT_EQ(0, state.get_creature(OUR_ACTIVE).damage_taken);
    TEST_ASSERT_EQ(2, state.players[0].discard.count());
}

TEST(EngineActions, PreventedCategoryCannotBePlayed) {
    BattleEngine engine(make_test_repository());
    GameState state = duel("ember-fox", "tide-turtle");
    resolve_card(engine, state, "lockdown", 1);
    const InstanceID scholar = add_to_hand(state, 0, "scholar");
    const InstanceID potion = add_to_hand(state, 0, "potion");

    ActionResult result = engine.step_inplace(state, Action::play_card(0, scholar));
    TEST_ASSERT_FALSE(result.success);
    TEST_ASSERT_EQ("Playing supporter cards is prevented", result.message);

    TEST_ASSERT_TRUE(engine.step_inplace(state, Action::play_card(0, potion)).success);
}

TEST(EngineActions, BasicCreatureGoesToBenchAndTriggersOnPlay) {
    BattleEngine engine(make_test_repository());
    GameState state = duel("ember-fox", "tide-turtle");
    const InstanceID bat = add_to_hand(state, 0, "echo-bat");

    TEST_ASSERT_TRUE(engine.step_inplace(state, Action::play_card(0, bat)).success);

    TEST_ASSERT_EQ(1, state.players[0].field.find_position(bat));
    TEST_ASSERT_EQ(2, state.players[0].field.bench[0].turn_played);
    TEST_ASSERT_EQ(1, state.players[0].hand.count());
}

TEST(EngineActions, FullBenchIsRejected) {
    BattleEngine engine(make_test_repository());
    GameState state = duel("ember-fox", "tide-turtle");
    place(state, 0, "spark-mouse");
    place(state, 0, "spark-mouse");
    place(state, 0, "spark-mouse");
    const InstanceID bat = add_to_hand(state, 0, "echo-bat");

    ActionResult result = engine.step_inplace(state, Action::play_card(0, bat));

    TEST_ASSERT_FALSE(result.success);
    TEST_ASSERT_EQ("Bench is full", result.message);
}

TEST(EngineActions, ToolAttachesOncePerCreature) {
    BattleEngine engine(make_test_repository());
    GameState state = duel("ember-fox", "tide-turtle");
    const InstanceID band = add_to_hand(state, 0, "vital-band");
    const InstanceID armor = add_to_hand(state, 0, "spike-armor");

    TEST_ASSERT_TRUE(engine.step_inplace(state, Action::play_card(0, band, ACTIVE_POSITION)).success);
    TEST_ASSERT_EQ(90, effective_max_hp(state, engine.get_card_repository(), OUR_ACTIVE));

    ActionResult result = engine.step_inplace(state, Action::play_card(0, armor, ACTIVE_POSITION));
    TEST_ASSERT_FALSE(result.success);
    TEST_ASSERT_EQ("Creature already has a tool attached", result.message);
}

// ============================================================================
// ENERGY
// ============================================================================

TEST(EngineActions, AttachEnergyOncePerTurn) {
    BattleEngine engine(make_test_repository());
    GameState state = duel("ember-fox", "tide-turtle");
    state.energy.current_energy[0] = EnergyType::FIRE;

    TEST_ASSERT_TRUE(engine.step_inplace(state, Action::attach_energy(0, ACTIVE_POSITION)).success);
    TEST_ASSERT_EQ(1, state.energy.count(field_id(state, OUR_ACTIVE), EnergyType::FIRE));
    TEST_ASSERT_FALSE(state.energy.current_energy[0].has_value());

    ActionResult result = engine.step_inplace(state, Action::attach_energy(0, ACTIVE_POSITION));
    TEST_ASSERT_FALSE(result.success);
    TEST_ASSERT_EQ(1, state.energy.count(field_id(state, OUR_ACTIVE), EnergyType::FIRE));
}

TEST(EngineActions, EnergyAttachmentCanBePrevented) {
    BattleEngine engine(make_test_repository());
    GameState state = duel("ember-fox", "tide-turtle");
    state.energy.current_energy[0] = EnergyType::FIRE;
    resolve_card(engine, state, "grounding", 1);

    ActionResult result = engine.step_inplace(state, Action::attach_energy(0, ACTIVE_POSITION));

    TEST_ASSERT_FALSE(result.success);
    TEST_ASSERT_EQ("Energy attachment is prevented", result.message);
}

// ============================================================================
// RETREAT
// ============================================================================

TEST(EngineActions, RetreatPaysCostAndClearsStatus) {
    BattleEngine engine(make_test_repository());
    GameState state = duel("ember-fox", "tide-turtle");
    auto mouse = place(state, 0, "spark-mouse");
    const InstanceID fox_id = field_id(state, OUR_ACTIVE);
    const InstanceID mouse_id = field_id(state, mouse);
    state.energy.attach(fox_id, EnergyType::FIRE, 1);
    state.get_creature(OUR_ACTIVE).add_status(StatusCondition::POISON);

    TEST_ASSERT_TRUE(engine.step_inplace(state, Action::retreat(0, 1)).success);

    TEST_ASSERT_EQ(mouse_id, field_id(state, OUR_ACTIVE));
    TEST_ASSERT_EQ(1, state.players[0].field.find_position(fox_id));
    TEST_ASSERT_EQ(0, state.players[0].field.bench[0].status_flags);
    TEST_ASSERT_EQ(0, state.energy.total(fox_id));
    TEST_ASSERT_EQ(1, state.energy.discarded_count(0, EnergyType::FIRE));
    TEST_ASSERT_TRUE(state.players[0].retreated_this_turn);

    TEST_ASSERT_FALSE(engine.step_inplace(state, Action::retreat(0, 1)).success);
}

TEST(EngineActions, RetreatCostIncreaseBlocksRetreat) {
    BattleEngine engine(make_test_repository());
    GameState state = duel("ember-fox", "tide-turtle");
    place(state, 0, "spark-mouse");
    state.energy.attach(field_id(state, OUR_ACTIVE), EnergyType::FIRE, 1);
    resolve_card(engine, state, "roadblock", 1);

    TEST_ASSERT_EQ(3, engine.calculate_retreat_cost(state, OUR_ACTIVE));

    ActionResult result = engine.step_inplace(state, Action::retreat(0, 1));

    TEST_ASSERT_FALSE(result.success);
    TEST_ASSERT_EQ("Not enough energy to retreat (cost 3)", result.message);
    TEST_ASSERT_EQ("ember-fox", state.get_creature(OUR_ACTIVE).template_id());
    TEST_ASSERT_EQ(1, state.energy.total(field_id(state, OUR_ACTIVE)));
}

TEST(EngineActions, RetreatPreventionBlocksRetreat) {
    BattleEngine engine(make_test_repository());
    GameState state = duel("ember-fox", "tide-turtle");
    place(state, 0, "spark-mouse");
    state.energy.attach(field_id(state, OUR_ACTIVE), EnergyType::FIRE, 1);
    resolve_card(engine, state, "snare", 1);

    ActionResult result = engine.step_inplace(state, Action::retreat(0, 1));

    TEST_ASSERT_FALSE(result.success);
    TEST_ASSERT_EQ("Retreat is prevented", result.message);
}

TEST(EngineActions, ParalyzedActiveCannotRetreatOrAttack) {
    BattleEngine engine(make_test_repository());
    GameState state = duel("spark-mouse", "tide-turtle");
    place(state, 0, "echo-bat");
    state.get_creature(OUR_ACTIVE).add_status(StatusCondition::PARALYSIS);

    TEST_ASSERT_FALSE(engine.step_inplace(state, Action::retreat(0, 1)).success);
    TEST_ASSERT_FALSE(engine.step_inplace(state, Action::attack(0, 0)).success);
    TEST_ASSERT_EQ(0, state.executed_actions);
}

// ============================================================================
// ATTACKS
// ============================================================================

TEST(EngineActions, AttackAppliesWeaknessAndEndsTurn) {
    BattleEngine engine(make_test_repository());
    GameState state = duel("spark-mouse", "tide-turtle");

    TEST_ASSERT_EQ(30, engine.calculate_attack_damage(state, 0));
    TEST_ASSERT_TRUE(engine.step_inplace(state, Action::attack(0, 0)).success);

    TEST_ASSERT_EQ(30, state.get_creature(THEIR_ACTIVE).damage_taken);
    TEST_ASSERT_EQ(1, state.current_player);
    TEST_ASSERT_EQ(3, state.turn_number);
    TEST_ASSERT(state.turn_stage == TurnStage::MAIN);
    TEST_ASSERT(state.energy.current_energy[1] == EnergyType::WATER);
    TEST_ASSERT_EQ(1, state.players[1].hand.count());
}

TEST(EngineActions, AttackDamageIncludesBoosts) {
    BattleEngine engine(make_test_repository());
    GameState state = duel("ember-fox", "tide-turtle");
    state.energy.attach(field_id(state, OUR_ACTIVE), EnergyType::FIRE, 2);

    TEST_ASSERT_EQ(30, engine.calculate_attack_damage(state, 1));
    resolve_card(engine, state, "war-cry", 0);
    TEST_ASSERT_EQ(60, engine.calculate_attack_damage(state, 1));

    TEST_ASSERT_TRUE(engine.step_inplace(state, Action::attack(0, 1)).success);

    TEST_ASSERT_EQ(60, state.get_creature(THEIR_ACTIVE).damage_taken);
    TEST_ASSERT_EQ(1, state.players[0].hand.count());
    TEST_ASSERT_TRUE(state.passive_effects.empty());
}

TEST(EngineActions, ZeroDamageAttackKeepsBoostsButNotWeakness) {
    BattleEngine engine(make_test_repository());
    GameState state = duel("spark-mouse", "tide-turtle");

    TEST_ASSERT_EQ(0, engine.calculate_attack_damage(state, 1));

    // Tide Turtle is weak to Lightning, but Numbing Jolt has no base damage
    resolve_card(engine, state, "war-cry", 0);
    TEST_ASSERT_EQ(30, engine.calculate_attack_damage(state, 1));
    TEST_ASSERT_TRUE(engine.step_inplace(state, Action::attack(0, 1)).success);

    TEST_ASSERT_EQ(30, state.get_creature(THEIR_ACTIVE).damage_taken);
    TEST_ASSERT_TRUE(state.get_creature(THEIR_ACTIVE).has_status(StatusCondition::PARALYSIS));

    // Paralysis outlasts the attacker's checkup
    ActionResult result = engine.step_inplace(state, Action::attack(1, 0));
    TEST_ASSERT_FALSE(result.success);
    TEST_ASSERT_EQ("Active creature is asleep or paralyzed", result.message);
}

TEST(EngineActions, AttackNeedsEnergy) {
    BattleEngine engine(make_test_repository());
    GameState state = duel("ember-fox", "tide-turtle");

    ActionResult result = engine.step_inplace(state, Action::attack(0, 0));

    TEST_ASSERT_FALSE(result.success);
    TEST_ASSERT_EQ("Not enough energy for Scorch", result.message);
}

TEST(EngineActions, ColorlessCostTakesAnyType) {
    EnergyCounts attached{{EnergyType::FIRE, 1}, {EnergyType::WATER, 1}};

    TEST_ASSERT_TRUE(BattleEngine::can_pay_energy_cost(attached, {EnergyType::FIRE, EnergyType::COLORLESS}));
    TEST_ASSERT_FALSE(BattleEngine::can_pay_energy_cost(attached, {EnergyType::FIRE, EnergyType::FIRE}));
    TEST_ASSERT_FALSE(BattleEngine::can_pay_energy_cost(attached,
        {EnergyType::WATER, EnergyType::COLORLESS, EnergyType::COLORLESS}));
    TEST_ASSERT_TRUE(BattleEngine::can_pay_energy_cost({}, {}));
}

TEST(EngineActions, PreventedAttackIsRejected) {
    BattleEngine engine(make_test_repository());
    GameState state = duel("spark-mouse", "tide-turtle");
    resolve_card(engine, state, "ceasefire", 1);

    ActionResult result = engine.step_inplace(state, Action::attack(0, 0));

    TEST_ASSERT_FALSE(result.success);
    TEST_ASSERT_EQ("Spark Mouse is prevented from attacking", result.message);
}

TEST(EngineActions, AttackDamageResolvesAmountInAttackContext) {
    CardRepository repo = make_test_repository();
    repo.add_card(CreatureBuilder("pack-hound", "Pack Hound", 70, EnergyType::FIGHTING)
        .attack("Pack Howl",
                amount::product(amount::count_field(CriteriaBuilder().player(PlayerScope::SELF).bench().build()),
                                amount::constant(20)),
                {})
        .build());
    BattleEngine engine(std::move(repo));
    GameState state = duel("pack-hound", "tide-turtle");

    TEST_ASSERT_EQ(0, engine.calculate_attack_damage(state, 0));

    place(state, 0, "spark-mouse");
    place(state, 0, "echo-bat");
    place(state, 1, "moss-golem");
    TEST_ASSERT_EQ(40, engine.calculate_attack_damage(state, 0));

    TEST_ASSERT_TRUE(engine.step_inplace(state, Action::attack(0, 0)).success);
    TEST_ASSERT_EQ(40, state.get_creature(THEIR_ACTIVE).damage_taken);
}

// ============================================================================
// DEFENSIVE PASSIVES
// ============================================================================

TEST(EngineActions, DamageReductionAndPrevention) {
    CardRepository repo = make_test_repository();
    repo.add_card(make_supporter("iron-wall", "Iron Wall",
        {make_damage_reduction(amount::constant(20), FieldCriteria{})}));
    repo.add_card(make_supporter("safeguard", "Safeguard",
        {make_prevent_damage(FieldCriteria{}, CriteriaBuilder().is_type(EnergyType::FIRE).build())}));
    BattleEngine engine(std::move(repo));
    GameState state = duel("ember-fox", "tide-turtle");
    state.energy.attach(field_id(state, OUR_ACTIVE), EnergyType::FIRE, 1);

    // The attacker's own side is unaffected
    resolve_card(engine, state, "iron-wall", 0);
    TEST_ASSERT_EQ(30, engine.calculate_attack_damage(state, 0));

    resolve_card(engine, state, "iron-wall", 1);
    TEST_ASSERT_EQ(10, engine.calculate_attack_damage(state, 0));

    resolve_card(engine, state, "iron-wall", 1);
    TEST_ASSERT_EQ(0, engine.calculate_attack_damage(state, 0));

    resolve_card(engine, state, "safeguard", 1);
    TEST_ASSERT_TRUE(engine.step_inplace(state, Action::attack(0, 0)).success);
    TEST_ASSERT_EQ(0, state.get_creature(THEIR_ACTIVE).damage_taken);
}

TEST(EngineActions, PreventDamageChecksAttackerCriteria) {
    CardRepository repo = make_test_repository();
    repo.add_card(make_supporter("safeguard", "Safeguard",
        {make_prevent_damage(FieldCriteria{}, CriteriaBuilder().ex().build())}));
    BattleEngine engine(std::move(repo));
    GameState state = duel("ember-fox", "tide-turtle");
    resolve_card(engine, state, "safeguard", 1);

    TEST_ASSERT_EQ(30, engine.calculate_attack_damage(state, 0));
}

TEST(EngineActions, DisabledWeaknessDropsBonus) {
    CardRepository repo = make_test_repository();
    repo.add_card(make_supporter("insulate", "Insulate", {make_disable_weakness(FieldCriteria{})}));
    BattleEngine engine(std::move(repo));
    GameState state = duel("spark-mouse", "tide-turtle");

    TEST_ASSERT_EQ(30, engine.calculate_attack_damage(state, 0));
    resolve_card(engine, state, "insulate", 1);
    TEST_ASSERT_EQ(10, engine.calculate_attack_damage(state, 0));
}

TEST(EngineActions, AttackCostIncreaseAddsColorless) {
    CardRepository repo = make_test_repository();
    repo.add_card(make_supporter("heavy-air", "Heavy Air", {make_attack_cost_modifier(1, FieldCriteria{})}));
    BattleEngine engine(std::move(repo));
    GameState state = duel("ember-fox", "tide-turtle");
    state.energy.attach(field_id(state, OUR_ACTIVE), EnergyType::FIRE, 1);

    resolve_card(engine, state, "heavy-air", 1);

    const EnergyCost cost = engine.calculate_attack_cost(state, OUR_ACTIVE, 0);
    TEST_ASSERT_EQ(2u, cost.size());
    TEST_ASSERT(cost[1] == EnergyType::COLORLESS);
    TEST_ASSERT_EQ(1u, engine.calculate_attack_cost(state, THEIR_ACTIVE, 0).size());

    ActionResult result = engine.step_inplace(state, Action::attack(0, 0));
    TEST_ASSERT_FALSE(result.success);
    TEST_ASSERT_EQ("Not enough energy for Scorch", result.message);
}

TEST(EngineActions, AttackCostReductionRemovesColorlessFirst) {
    CardRepository repo = make_test_repository();
    repo.add_card(make_supporter("tailwind", "Tailwind", {make_attack_cost_modifier(-1, FieldCriteria{})}));
    BattleEngine engine(std::move(repo));
    GameState state = duel("ember-fox", "tide-turtle");
    state.energy.attach(field_id(state, OUR_ACTIVE), EnergyType::FIRE, 1);

    TEST_ASSERT_FALSE(engine.step_inplace(state, Action::attack(0, 1)).success);

    resolve_card(engine, state, "tailwind", 0);

    const EnergyCost cost = engine.calculate_attack_cost(state, OUR_ACTIVE, 1);
    TEST_ASSERT_EQ(1u, cost.size());
    TEST_ASSERT(cost[0] == EnergyType::FIRE);
    TEST_ASSERT_TRUE(engine.calculate_attack_cost(state, OUR_ACTIVE, 0).empty());

    ActionResult result = engine.step_inplace(state, Action::attack(0, 1));
    TEST_ASSERT_MSG(result.success, result.message);
}

// ============================================================================
// KNOCKOUTS AND WINNING
// ============================================================================

TEST(EngineActions, KnockoutAwardsPointAndAwaitsPromotion) {
    BattleEngine engine(make_test_repository());
    GameState state = duel("ember-fox", "spark-mouse");
    auto bat = place(state, 1, "echo-bat");
    const InstanceID bat_id = field_id(state, bat);
    const InstanceID mouse_id = field_id(state, THEIR_ACTIVE);
    state.energy.attach(field_id(state, OUR_ACTIVE), EnergyType::FIRE, 1);
    state.energy.attach(mouse_id, EnergyType::LIGHTNING, 2);
    state.players[1].tools[mouse_id] = {"vital-band-1-x", "vital-band"};
    state.get_creature(THEIR_ACTIVE).damage_taken = 40;

    TEST_ASSERT_TRUE(engine.step_inplace(state, Action::attack(0, 0)).success);

    TEST_ASSERT_EQ(1, state.players[0].points);
    TEST_ASSERT_FALSE(state.players[1].field.has_active());
    TEST_ASSERT_TRUE(state.players[1].awaiting_promotion);
    TEST_ASSERT_NOT_NULL(state.players[1].discard.find_card(mouse_id));
    TEST_ASSERT_NOT_NULL(state.players[1].discard.find_card("vital-band-1-x"));
    TEST_ASSERT_TRUE(state.players[1].tools.empty());
    TEST_ASSERT_EQ(2, state.energy.discarded_count(1, EnergyType::LIGHTNING));
    TEST_ASSERT_EQ(0, state.current_player);

    auto legal = engine.get_legal_actions(state);
    TEST_ASSERT_EQ(1u, legal.size());
    TEST_ASSERT(legal[0].action_type == ActionType::PROMOTE_ACTIVE);
    TEST_ASSERT_EQ(1, legal[0].player_id);

    TEST_ASSERT_FALSE(engine.step_inplace(state, Action::end_turn(0)).success);
    TEST_ASSERT_TRUE(engine.step_inplace(state, legal[0]).success);

    TEST_ASSERT_EQ(bat_id, field_id(state, THEIR_ACTIVE));
    TEST_ASSERT_FALSE(state.players[1].awaiting_promotion);
    TEST_ASSERT_EQ(1, state.current_player);
}

TEST(EngineActions, KnockingOutLastCreatureWins) {
    BattleEngine engine(make_test_repository());
    GameState state = duel("spark-mouse", "tide-turtle-ex");
    state.get_creature(THEIR_ACTIVE).damage_taken = 170;

    TEST_ASSERT_TRUE(engine.step_inplace(state, Action::attack(0, 0)).success);

    TEST_ASSERT_EQ(2, state.players[0].points);
    TEST_ASSERT(state.result == GameResult::PLAYER_0_WIN);
    TEST_ASSERT_EQ(0, *state.winner_id);
    TEST_ASSERT_TRUE(engine.get_legal_actions(state).empty());
    TEST_ASSERT_FALSE(engine.step_inplace(state, Action::end_turn(1)).success);
}

TEST(EngineActions, MegaKnockoutReachesWinningPoints) {
    BattleEngine engine(make_test_repository());
    GameState state = duel("spark-mouse", "iron-colossus");
    place(state, 1, "echo-bat");
    state.get_creature(THEIR_ACTIVE).damage_taken = 245;

    TEST_ASSERT_TRUE(engine.step_inplace(state, Action::attack(0, 0)).success);

    TEST_ASSERT_EQ(3, state.players[0].points);
    TEST_ASSERT(state.result == GameResult::PLAYER_0_WIN);
}

TEST(EngineActions, SimultaneousWinIsADraw) {
    BattleEngine engine(make_test_repository());
    GameState state = duel("thorn-bush", "thorn-bush");

    TEST_ASSERT_TRUE(engine.step_inplace(state, Action::attack(0, 0)).success);

    TEST_ASSERT(state.result == GameResult::DRAW);
    TEST_ASSERT_FALSE(state.winner_id.has_value());
    TEST_ASSERT_EQ(1, state.players[0].points);
    TEST_ASSERT_EQ(1, state.players[1].points);
}

TEST(EngineActions, WinPointsCheck) {
    BattleEngine engine(make_test_repository());
    GameState state = duel("ember-fox", "tide-turtle");
    state.players[1].points = 3;

    engine.check_win_conditions(state);

    TEST_ASSERT(state.result == GameResult::PLAYER_1_WIN);
    TEST_ASSERT_EQ(1, *state.winner_id);
}

// ============================================================================
// ATOMICITY
// ============================================================================

TEST(EngineActions, FailedResolutionRestoresState) {
    BattleEngine engine(make_test_repository());
    GameState state = duel("thorn-bush", "thorn-bush");
    state.config.max_resolution_steps = 5;
    const auto ids_before = state.players[0].collect_instance_ids();

    ActionResult result = engine.step_inplace(state, Action::attack(0, 0));

    TEST_ASSERT_FALSE(result.success);
    TEST_ASSERT_EQ(0u, result.message.find("Action failed"));
    TEST_ASSERT_EQ(0, state.get_creature(OUR_ACTIVE).damage_taken);
    TEST_ASSERT_EQ(0, state.get_creature(THEIR_ACTIVE).damage_taken);
    TEST_ASSERT_TRUE(state.effect_queue.empty());
    TEST_ASSERT_EQ(0, state.current_player);
    TEST_ASSERT_EQ(2, state.turn_number);
    TEST_ASSERT_EQ(0, state.executed_actions);
    TEST_ASSERT(state.result == GameResult::ONGOING);
    TEST_ASSERT(ids_before == state.players[0].collect_instance_ids());
}

TEST(EngineActions, StepLeavesInputUntouched) {
    BattleEngine engine(make_test_repository());
    GameState state = duel("spark-mouse", "tide-turtle");

    ActionResult result;
    GameState next = engine.step(state, Action::attack(0, 0), &result);

    TEST_ASSERT_TRUE(result.success);
    TEST_ASSERT_EQ(0, state.get_creature(THEIR_ACTIVE).damage_taken);
    TEST_ASSERT_EQ(30, next.get_creature(THEIR_ACTIVE).damage_taken);
    TEST_ASSERT_EQ(0, state.executed_actions);
    TEST_ASSERT_EQ(1, next.executed_actions);
}

TEST(EngineActions, OutOfTurnActionIsRejected) {
    BattleEngine engine(make_test_repository());
    GameState state = duel("spark-mouse", "tide-turtle");

    ActionResult result = engine.step_inplace(state, Action::end_turn(1));

    TEST_ASSERT_FALSE(result.success);
    TEST_ASSERT_EQ("Not player 1's turn", result.message);
}

// ============================================================================
// EVOLUTION
// ============================================================================

TEST(EngineActions, EvolveKeepsDamageAndEnergy) {
    BattleEngine engine(make_test_repository());
    GameState state = duel("ember-fox", "tide-turtle");
    const InstanceID fox_id = field_id(state, OUR_ACTIVE);
    state.get_creature(OUR_ACTIVE).damage_taken = 20;
    state.get_creature(OUR_ACTIVE).add_status(StatusCondition::POISON);
    state.energy.attach(fox_id, EnergyType::FIRE, 1);
    const InstanceID blaze = add_to_hand(state, 0, "blaze-fox");

    TEST_ASSERT_TRUE(engine.step_inplace(state, Action::evolve(0, blaze, ACTIVE_POSITION)).success);

    const FieldCard& evolved = state.get_creature(OUR_ACTIVE);
    TEST_ASSERT_EQ("blaze-fox", evolved.template_id());
    TEST_ASSERT_EQ(fox_id, evolved.field_instance_id());
    TEST_ASSERT_EQ(2u, evolved.evolution_stack.size());
    TEST_ASSERT_EQ(20, evolved.damage_taken);
    TEST_ASSERT_EQ(0, evolved.status_flags);
    TEST_ASSERT_EQ(1, state.energy.count(fox_id, EnergyType::FIRE));
    TEST_ASSERT_EQ(90, effective_max_hp(state, engine.get_card_repository(), OUR_ACTIVE));

    // Once per turn
    const InstanceID another = add_to_hand(state, 0, "blaze-fox");
    TEST_ASSERT_FALSE(engine.can_evolve(state, 0, "blaze-fox", ACTIVE_POSITION));
    TEST_ASSERT_FALSE(engine.step_inplace(state, Action::evolve(0, another, ACTIVE_POSITION)).success);
}

TEST(EngineActions, CannotEvolveOnTurnPlayed) {
    BattleEngine engine(make_test_repository());
    GameState state = duel("spark-mouse", "tide-turtle");
    place(state, 0, "ember-fox", state.turn_number);

    TEST_ASSERT_FALSE(engine.can_evolve(state, 0, "blaze-fox", 1));
}

TEST(EngineActions, EvolutionMatchesByName) {
    BattleEngine engine(make_test_repository());
    GameState state = duel("spark-mouse", "tide-turtle");

    TEST_ASSERT_FALSE(engine.can_evolve(state, 0, "blaze-fox", ACTIVE_POSITION));

    resolve_card(engine, state, "swift-evolution", 0);
    TEST_ASSERT_TRUE(engine.can_evolve(state, 0, "blaze-fox", ACTIVE_POSITION));

    const InstanceID blaze = add_to_hand(state, 0, "blaze-fox");
    TEST_ASSERT_TRUE(engine.step_inplace(state, Action::evolve(0, blaze, ACTIVE_POSITION)).success);
    TEST_ASSERT_EQ("blaze-fox", state.get_creature(OUR_ACTIVE).template_id());
}

TEST(EngineActions, EvolveDropsOldAbilityPassives) {
    BattleEngine engine(make_test_repository());
    engine.get_card_repository().add_card(CreatureBuilder("stone-warden", "Stone Warden", 150, EnergyType::FIGHTING)
        .evolves_from("Stone Sentry")
        .retreat_cost(3)
        .attack("Boulder", 60, {EnergyType::FIGHTING})
        .build());

    GameState state = duel("stone-sentry", "tide-turtle");
    TriggerEvent passive;
    passive.kind = TriggerKind::PASSIVE;
    passive.player_id = 0;
    passive.field_instance_id = field_id(state, OUR_ACTIVE);
    dispatch_event(state, engine.get_card_repository(), engine.get_effect_queue(), passive);
    engine.get_effect_queue().drain(state);
    TEST_ASSERT_EQ(120, effective_max_hp(state, engine.get_card_repository(), OUR_ACTIVE));

    const InstanceID warden = add_to_hand(state, 0, "stone-warden");
    TEST_ASSERT_TRUE(engine.step_inplace(state, Action::evolve(0, warden, ACTIVE_POSITION)).success);

    TEST_ASSERT_TRUE(state.passive_effects.empty());
    TEST_ASSERT_EQ(150, effective_max_hp(state, engine.get_card_repository(), OUR_ACTIVE));
}

// ============================================================================
// ABILITIES
// ============================================================================

TEST(EngineActions, ManualAbilityOncePerTurn) {
    BattleEngine engine(make_test_repository());
    GameState state = duel("spark-mouse", "tide-turtle");

    TEST_ASSERT_TRUE(engine.step_inplace(state, Action::use_ability(0, ACTIVE_POSITION)).success);
    TEST_ASSERT_EQ(1, state.energy.count(field_id(state, OUR_ACTIVE), EnergyType::LIGHTNING));

    ActionResult result = engine.step_inplace(state, Action::use_ability(0, ACTIVE_POSITION));
    TEST_ASSERT_FALSE(result.success);
    TEST_ASSERT_EQ("Static Charge was already used this turn", result.message);
}

TEST(EngineActions, CreatureWithoutManualAbility) {
    BattleEngine engine(make_test_repository());
    GameState state = duel("thorn-bush", "tide-turtle");

    ActionResult result = engine.step_inplace(state, Action::use_ability(0, ACTIVE_POSITION));

    TEST_ASSERT_FALSE(result.success);
    TEST_ASSERT_EQ("Thorn Bush has no usable ability", result.message);
}

// ============================================================================
// PENDING SELECTION
// ============================================================================

TEST(EngineActions, PendingSelectionRestrictsActions) {
    BattleEngine engine(make_test_repository());
    GameState state = duel("ember-fox", "tide-turtle");
    place(state, 1, "spark-mouse");
    auto bat = place(state, 1, "echo-bat");
    const InstanceID bat_id = field_id(state, bat);
    const InstanceID gust = add_to_hand(state, 0, "gust-order");

    TEST_ASSERT_TRUE(engine.step_inplace(state, Action::play_card(0, gust)).success);
    TEST_ASSERT_TRUE(state.is_awaiting_selection());

    auto legal = engine.get_legal_actions(state);
    TEST_ASSERT_EQ(2u, legal.size());
    for (const auto& action : legal) {
        TEST_ASSERT(action.action_type == ActionType::SELECT_TARGET);
        TEST_ASSERT_EQ(0, action.player_id);
    }

    ActionResult blocked = engine.step_inplace(state, Action::end_turn(0));
    TEST_ASSERT_FALSE(blocked.success);
    TEST_ASSERT_EQ("A target selection is pending", blocked.message);
    TEST_ASSERT_FALSE(engine.step_inplace(state, Action::select_target(1, 0)).success);
    TEST_ASSERT_FALSE(engine.step_inplace(state, Action::select_target(0, 2)).success);

    TEST_ASSERT_TRUE(engine.step_inplace(state, Action::select_target(0, 1)).success);
    TEST_ASSERT_FALSE(state.is_awaiting_selection());
    TEST_ASSERT_EQ(bat_id, field_id(state, THEIR_ACTIVE));
}
