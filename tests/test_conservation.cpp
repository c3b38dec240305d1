/**
 * Tests for card and energy conservation
 *
 * Cards only move between zones and energy only moves between creatures
 * and the discard ledger; nothing is created or lost.
 */

#include <sstream>
#include "test_helpers.hpp"

using namespace cardbattle;
using namespace cardbattle::effects;
using namespace testutil;

namespace {

DeckList mixed_deck(const TemplateID& basic, EnergyType type) {
    DeckList deck;
    const std::vector<TemplateID> cards = {
        basic, basic, basic, "echo-bat", "spark-mouse", "blaze-fox", "blaze-fox",
        "scholar", "scholar", "fresh-start", "potion", "potion", "fire-charm",
        "sting-dart", "vital-band", "spike-armor", "escape-rope", "gust-order",
        "energy-shift", "field-medic",
    };
    deck.cards = cards;
    deck.energy_types = {type};
    return deck;
}

} // anonymous namespace

TEST(Conservation, CardsSurviveAFullPlayout) {
    BattleEngine engine(make_test_repository());
    GameState state = engine.create_game(mixed_deck("ember-fox", EnergyType::FIRE),
                                         mixed_deck("thorn-bush", EnergyType::GRASS), 11);

    const auto ids0 = state.players[0].collect_instance_ids();
    const auto ids1 = state.players[1].collect_instance_ids();
    TEST_ASSERT_EQ(20u, ids0.size());
    TEST_ASSERT_EQ(20u, ids1.size());

    for (int step = 0; step < 200 && !state.is_game_over(); step++) {
        auto legal = engine.get_legal_actions(state);
        TEST_ASSERT_FALSE(legal.empty());

        // Vary the choice so most action types get exercised
        const Action& action = legal[(step * 7) % legal.size()];
        ActionResult result = engine.step_inplace(state, action);
        TEST_ASSERT_MSG(result.success, action.to_string() + ": " + result.message);

        TEST_ASSERT(ids0 == state.players[0].collect_instance_ids());
        TEST_ASSERT(ids1 == state.players[1].collect_instance_ids());
    }
}

TEST(Conservation, EvolutionKeepsEveryCard) {
    BattleEngine engine(make_test_repository());
    GameState state = make_state();
    state.turn_number = 2;
    place(state, 0, "ember-fox");
    place(state, 1, "tide-turtle");
    const InstanceID blaze = add_to_hand(state, 0, "blaze-fox");
    const auto before = state.players[0].collect_instance_ids();

    TEST_ASSERT_TRUE(engine.step_inplace(state, Action::evolve(0, blaze, ACTIVE_POSITION)).success);

    TEST_ASSERT(before == state.players[0].collect_instance_ids());
    TEST_ASSERT_TRUE(state.players[0].hand.is_empty());
}

TEST(Conservation, ShuffleKeepsEveryCard) {
    BattleEngine engine(make_test_repository());
    GameState state = make_state();
    place(state, 0, "ember-fox");
    place(state, 1, "tide-turtle");
    fill_deck(state, 0, "potion", 6);
    fill_hand(state, 0, "sting-dart", 3);
    const InstanceID fresh = add_to_hand(state, 0, "fresh-start");
    const auto before = state.players[0].collect_instance_ids();

    TEST_ASSERT_TRUE(engine.step_inplace(state, Action::play_card(0, fresh)).success);

    TEST_ASSERT(before == state.players[0].collect_instance_ids());
    TEST_ASSERT_EQ(3, state.players[0].hand.count());
    TEST_ASSERT_EQ(6, state.players[0].deck.count());
}

TEST(Conservation, KnockoutMovesWholeStackToDiscard) {
    BattleEngine engine(make_test_repository());
    GameState state = make_state();
    state.turn_number = 2;
    place(state, 0, "spark-mouse");
    place(state, 1, "ember-fox");
    place(state, 1, "echo-bat");
    const InstanceID blaze = add_to_hand(state, 1, "blaze-fox");

    state.current_player = 1;
    TEST_ASSERT_TRUE(engine.step_inplace(state, Action::evolve(1, blaze, ACTIVE_POSITION)).success);
    TEST_ASSERT_TRUE(engine.step_inplace(state, Action::end_turn(1)).success);

    const auto before = state.players[1].collect_instance_ids();
    state.get_creature(FieldPosition{1, ACTIVE_POSITION}).damage_taken = 80;
    TEST_ASSERT_TRUE(engine.step_inplace(state, Action::attack(0, 0)).success);

    TEST_ASSERT(before == state.players[1].collect_instance_ids());
    TEST_ASSERT_EQ(2, state.players[1].discard.count());
    TEST_ASSERT_NOT_NULL(state.players[1].discard.find_card(blaze));
}

TEST(Conservation, EnergyIsNeverCreatedOrLost) {
    BattleEngine engine(make_test_repository());
    GameState state = make_state();
    state.turn_number = 2;
    auto fox = place(state, 0, "ember-fox");
    auto mouse = place(state, 0, "spark-mouse");
    place(state, 1, "tide-turtle");
    state.energy.attach(field_id(state, fox), EnergyType::FIRE, 3);
    state.energy.attach(field_id(state, mouse), EnergyType::LIGHTNING, 1);
    TEST_ASSERT_EQ(4, energy_in_circulation(state));

    // Both choices have a single candidate (only the fox holds fire energy)
    const InstanceID shift = add_to_hand(state, 0, "energy-shift");
    TEST_ASSERT_TRUE(engine.step_inplace(state, Action::play_card(0, shift)).success);
    TEST_ASSERT_EQ(1, state.energy.count(field_id(state, fox), EnergyType::FIRE));
    TEST_ASSERT_EQ(2, state.energy.count(field_id(state, mouse), EnergyType::FIRE));
    TEST_ASSERT_EQ(4, energy_in_circulation(state));

    TEST_ASSERT_TRUE(engine.step_inplace(state, Action::retreat(0, 1)).success);
    TEST_ASSERT_EQ(1, state.energy.discarded_count(0, EnergyType::FIRE));
    TEST_ASSERT_EQ(4, energy_in_circulation(state));

    // Knock out the spark mouse, now active
    const InstanceID mouse_id = field_id(state, FieldPosition{0, ACTIVE_POSITION});
    state.get_creature(FieldPosition{0, ACTIVE_POSITION}).damage_taken = 40;
    state.current_player = 1;
    const InstanceID dart = add_to_hand(state, 1, "sting-dart");
    TEST_ASSERT_TRUE(engine.step_inplace(state, Action::play_card(1, dart)).success);

    TEST_ASSERT_FALSE(state.find_creature(mouse_id).has_value());
    TEST_ASSERT_EQ(0, state.energy.total(mouse_id));
    TEST_ASSERT_EQ(3, state.energy.discarded_count(0, EnergyType::FIRE));
    TEST_ASSERT_EQ(4, energy_in_circulation(state));
}
