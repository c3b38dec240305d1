/**
 * Card Battle Engine - Test Fixtures
 *
 * A shared card pool built with the effect builders, and helpers that put
 * creatures and cards exactly where a test needs them.
 */

#pragma once

#include "card_battle.hpp"
#include <stdexcept>

namespace testutil {

using namespace cardbattle;
using namespace cardbattle::effects;

// ============================================================================
// CARD POOL
// ============================================================================

inline Trigger own_turn_trigger(TriggerKind kind) {
    Trigger trigger = make_trigger(kind);
    trigger.own_turn_only = true;
    return trigger;
}

inline CardRepository make_test_repository() {
    CardRepository repo;

    const FieldCriteria self_any = CriteriaBuilder().player(PlayerScope::SELF).build();
    const FieldCriteria self_bench = CriteriaBuilder().player(PlayerScope::SELF).bench().build();
    const FieldCriteria self_damaged = CriteriaBuilder().player(PlayerScope::SELF).has_damage().build();
    const FieldCriteria opponent_active = CriteriaBuilder().player(PlayerScope::OPPONENT).active().build();
    const FieldCriteria opponent_bench = CriteriaBuilder().player(PlayerScope::OPPONENT).bench().build();

    // Creatures
    repo.add_card(CreatureBuilder("ember-fox", "Ember Fox", 60, EnergyType::FIRE)
        .weakness(EnergyType::WATER)
        .retreat_cost(1)
        .attack("Scorch", 30, {EnergyType::FIRE})
        .attack("Flare Rush", 20, {EnergyType::FIRE, EnergyType::COLORLESS},
                {make_damage_boost(amount::constant(10), FieldCriteria{}),
                 make_draw(amount::constant(1))})
        .build());

    repo.add_card(CreatureBuilder("blaze-fox", "Blaze Fox", 90, EnergyType::FIRE)
        .weakness(EnergyType::WATER)
        .retreat_cost(2)
        .evolves_from("Ember Fox")
        .attack("Inferno", 70, {EnergyType::FIRE, EnergyType::FIRE})
        .build());

    repo.add_card(CreatureBuilder("tide-turtle", "Tide Turtle", 80, EnergyType::WATER)
        .weakness(EnergyType::LIGHTNING)
        .retreat_cost(2)
        .attack("Water Gun", 20, {EnergyType::WATER})
        .build());

    repo.add_card(CreatureBuilder("tide-turtle-ex", "Tide Turtle ex", 180, EnergyType::WATER)
        .ex()
        .retreat_cost(3)
        .attack("Tsunami", 120, {EnergyType::WATER, EnergyType::WATER, EnergyType::WATER})
        .build());

    repo.add_card(CreatureBuilder("iron-colossus", "Iron Colossus", 250, EnergyType::METAL)
        .ex()
        .mega()
        .retreat_cost(4)
        .attack("Crush", 200, {EnergyType::METAL, EnergyType::METAL})
        .build());

    repo.add_card(CreatureBuilder("spark-mouse", "Spark Mouse", 50, EnergyType::LIGHTNING)
        .weakness(EnergyType::FIGHTING)
        .attack("Zap", 10, {})
        .attack("Numbing Jolt", 0, {}, {make_status(StatusCondition::PARALYSIS, target::active(PlayerScope::OPPONENT))})
        .ability("Static Charge", make_trigger(TriggerKind::MANUAL),
                 {make_attach_energy(EnergyType::LIGHTNING, amount::constant(1), target::source())})
        .build());

    repo.add_card(CreatureBuilder("moss-golem", "Moss Golem", 120, EnergyType::GRASS)
        .retreat_cost(3)
        .attack("Vine Lash", 30, {EnergyType::GRASS})
        .ability("Healing Roots", own_turn_trigger(TriggerKind::END_OF_TURN),
                 {make_heal(amount::constant(10), target::all_matching(self_damaged))})
        .build());

    repo.add_card(CreatureBuilder("thorn-bush", "Thorn Bush", 70, EnergyType::GRASS)
        .retreat_cost(1)
        .attack("Prick", 10, {})
        .ability("Thorns", make_trigger(TriggerKind::DAMAGED),
                 {make_damage(amount::constant(10), target::active(PlayerScope::OPPONENT))})
        .build());

    repo.add_card(CreatureBuilder("stone-sentry", "Stone Sentry", 100, EnergyType::FIGHTING)
        .retreat_cost(2)
        .attack("Rock Throw", 20, {})
        .ability("Bulwark", make_trigger(TriggerKind::PASSIVE),
                 {make_hp_bonus(amount::constant(20), FieldCriteria{})})
        .build());

    repo.add_card(CreatureBuilder("echo-bat", "Echo Bat", 40, EnergyType::PSYCHIC)
        .attack("Screech", 10, {})
        .ability("Welcome Chirp", make_trigger(TriggerKind::ON_PLAY), {make_draw(amount::constant(1))})
        .build());

    // Supporters
    repo.add_card(make_supporter("field-medic", "Field Medic",
        {make_heal(amount::constant(20), target::single_choice(self_damaged))}));
    repo.add_card(make_supporter("scholar", "Scholar", {make_draw(amount::constant(3))}));
    repo.add_card(make_supporter("fresh-start", "Fresh Start",
        {make_shuffle(PlayerScope::SELF, amount::hand_size(PlayerScope::SELF))}));
    repo.add_card(make_supporter("energy-shift", "Energy Shift",
        {make_energy_transfer(target::energy_from(target::single_choice(self_any), {EnergyType::FIRE}, 2),
                              target::single_choice(self_bench))}));
    repo.add_card(make_supporter("gust-order", "Gust Order",
        {make_switch(target::single_choice(opponent_bench))}));
    repo.add_card(make_supporter("roadblock", "Roadblock",
        {make_retreat_cost_increase(amount::constant(2), opponent_active)}));
    repo.add_card(make_supporter("lockdown", "Lockdown",
        {make_prevent_playing({CardCategory::SUPPORTER}, PlayerScope::OPPONENT)}));
    repo.add_card(make_supporter("war-cry", "War Cry",
        {make_damage_boost(amount::constant(30), self_any)}));
    repo.add_card(make_supporter("grounding", "Grounding",
        {make_prevent_energy_attachment(PlayerScope::OPPONENT)}));
    repo.add_card(make_supporter("snare", "Snare", {make_retreat_prevention(opponent_active)}));
    repo.add_card(make_supporter("ceasefire", "Ceasefire", {make_prevent_attack(opponent_active)}));
    repo.add_card(make_supporter("swift-evolution", "Swift Evolution",
        {make_evolution_flexibility("Blaze Fox", "Spark Mouse")}));
    repo.add_card(make_supporter("triage", "Triage",
        {make_heal(amount::constant(10), target::active(PlayerScope::SELF)),
         make_draw(amount::constant(2))}));

    // Items
    repo.add_card(make_item("potion", "Potion",
        {make_heal(amount::constant(30), target::active(PlayerScope::SELF))}));
    repo.add_card(make_item("fire-charm", "Fire Charm",
        {make_attach_energy(EnergyType::FIRE, amount::constant(1), target::single_choice(self_any))}));
    repo.add_card(make_item("flush-out", "Flush Out",
        {make_discard_energy({}, amount::constant(2), target::active(PlayerScope::OPPONENT))}));
    repo.add_card(make_item("escape-rope", "Escape Rope",
        {make_switch(target::single_choice(self_bench))}));
    repo.add_card(make_item("antidote", "Antidote",
        {make_status_recovery(target::active(PlayerScope::SELF))}));
    repo.add_card(make_item("sting-dart", "Sting Dart",
        {make_damage(amount::constant(30), target::active(PlayerScope::OPPONENT))}));
    repo.add_card(make_item("stray-salve", "Stray Salve",
        {make_heal(amount::constant(30), target::active(PlayerScope::OPPONENT))}));
    repo.add_card(make_item("bench-blast", "Bench Blast",
        {make_damage(amount::constant(30), target::all_matching(opponent_bench))}));

    // Tools
    repo.add_card(make_tool("vital-band", "Vital Band", make_trigger(TriggerKind::PASSIVE),
        {make_hp_bonus(amount::constant(30), FieldCriteria{})}));
    repo.add_card(make_tool("spike-armor", "Spike Armor", make_trigger(TriggerKind::DAMAGED),
        {make_damage(amount::constant(20), target::active(PlayerScope::OPPONENT))}));

    Trigger fire_attached = make_trigger(TriggerKind::ENERGY_ATTACHMENT);
    fire_attached.energy_type = EnergyType::FIRE;
    repo.add_card(make_tool("ember-stone", "Ember Stone", fire_attached, {make_draw(amount::constant(1))}));

    return repo;
}

// ============================================================================
// STATE HELPERS
// ============================================================================

inline InstanceID next_instance_id(const TemplateID& template_id, PlayerID player) {
    static int counter = 0;
    return template_id + "-" + std::to_string(player) + "-" + std::to_string(counter++);
}

inline GameState make_state(const GameConfig& config = GameConfig()) {
    GameState state;
    state.config = config;
    state.rng.seed(7);
    for (auto& player : state.players) {
        player.field.max_bench_size = config.max_bench_size;
    }
    state.energy.available_types[0] = {EnergyType::FIRE};
    state.energy.available_types[1] = {EnergyType::WATER};
    return state;
}

// Active spot first, then the bench
inline FieldPosition place(GameState& state, PlayerID player_id, const TemplateID& template_id,
                           int turn_played = 0) {
    PlayerState& player = state.get_player(player_id);
    const InstanceID id = next_instance_id(template_id, player_id);
    if (!player.field.add_creature(FieldCard(id, template_id, turn_played))) {
        throw std::runtime_error("Field is full for player " + std::to_string(player_id));
    }
    return FieldPosition{player_id, player.field.find_position(id)};
}

inline InstanceID add_to_hand(GameState& state, PlayerID player_id, const TemplateID& template_id) {
    const InstanceID id = next_instance_id(template_id, player_id);
    state.get_player(player_id).hand.add_card({id, template_id});
    return id;
}

inline void fill_deck(GameState& state, PlayerID player_id, const TemplateID& template_id, int count) {
    for (int i = 0; i < count; i++) {
        state.get_player(player_id).deck.add_card({next_instance_id(template_id, player_id), template_id});
    }
}

inline void fill_hand(GameState& state, PlayerID player_id, const TemplateID& template_id, int count) {
    for (int i = 0; i < count; i++) {
        add_to_hand(state, player_id, template_id);
    }
}

inline const InstanceID& field_id(const GameState& state, const FieldPosition& position) {
    return state.get_creature(position).field_instance_id();
}

inline EffectContext trainer_context(PlayerID player, const std::string& name = "Test Effect") {
    EffectContext context;
    context.type = ContextType::TRAINER;
    context.source_player = player;
    context.effect_name = name;
    return context;
}

inline EffectContext creature_context(const GameState& state, const FieldPosition& source) {
    EffectContext context;
    context.type = ContextType::ATTACK;
    context.source_player = source.player_id;
    context.effect_name = "Test Attack";
    context.source_instance_id = field_id(state, source);
    return context;
}

// Attached plus discarded energy of every type for both players
inline int energy_in_circulation(const GameState& state) {
    int total = 0;
    for (const auto& [id, counts] : state.energy.attached) {
        total += total_energy(counts);
    }
    for (const auto& counts : state.energy.discarded) {
        total += total_energy(counts);
    }
    return total;
}

// ============================================================================
// EFFECT HARNESS
// ============================================================================

/**
 * EffectHarness - Repository, registry and queue wired together, for
 * resolving card effects without the engine.
 */
class EffectHarness {
public:
    EffectHarness()
        : repo(make_test_repository())
        , queue(repo, registry) {
        register_all_handlers(registry);
        queue.set_listener([this](const QueuedEffect& queued, const Effect& effect, const ApplyResult& result) {
            applied_kinds.push_back(effect_kind(effect));
            applied_names.push_back(queued.context.effect_name);
            results.push_back(result);
        });
    }

    EffectHarness(const EffectHarness&) = delete;
    EffectHarness& operator=(const EffectHarness&) = delete;

    // Queue every effect of a supporter or item as if `player` played it
    void enqueue_card(GameState& state, const TemplateID& template_id, PlayerID player) {
        const std::string& name = name_of(*repo.get_card(template_id));
        queue.enqueue_group(state, template_id, EffectOrigin::CARD, 0, trainer_context(player, name));
    }

    DrainStatus play(GameState& state, const TemplateID& template_id, PlayerID player) {
        enqueue_card(state, template_id, player);
        return queue.drain(state);
    }

    CardRepository repo;
    EffectRegistry registry;
    EffectQueue queue;

    std::vector<EffectKind> applied_kinds;
    std::vector<std::string> applied_names;
    std::vector<ApplyResult> results;
};

} // namespace testutil
