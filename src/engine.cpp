/**
 * Card Battle Engine - Engine Implementation
 *
 * Action validation, action application and turn flow. Every effect
 * runs through the effect queue; the engine only moves cards, pays costs
 * and decides when the queue is drained.
 */

#include "engine.hpp"
#include "xray_logger.hpp"
#include "effects/handlers.hpp"
#include "effects/field_operations.hpp"
#include "effects/passive_effects.hpp"
#include "effects/trigger_dispatcher.hpp"
#include "effects/value_resolver.hpp"
#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace cardbattle {

using effects::DrainStatus;
using effects::TriggerEvent;

namespace {

constexpr int WEAKNESS_BONUS = 20;
constexpr int POISON_CHECKUP_DAMAGE = 10;
constexpr int BURN_CHECKUP_DAMAGE = 20;

EffectContext trainer_context(const std::string& name, PlayerID player) {
    EffectContext context;
    context.type = ContextType::TRAINER;
    context.source_player = player;
    context.effect_name = name;
    return context;
}

TriggerEvent make_event(TriggerKind kind, PlayerID player, const InstanceID& field_instance_id) {
    TriggerEvent event;
    event.kind = kind;
    event.player_id = player;
    event.field_instance_id = field_instance_id;
    return event;
}

bool is_bench_position(const Field& field, const std::optional<int>& position) {
    return position && *position != ACTIVE_POSITION && field.is_occupied(*position);
}

} // anonymous namespace

BattleEngine::BattleEngine()
    : queue_(repo_, registry_) {
    effects::register_all_handlers(registry_);
}

BattleEngine::BattleEngine(CardRepository repo)
    : repo_(std::move(repo))
    , queue_(repo_, registry_) {
    effects::register_all_handlers(registry_);
}

void BattleEngine::set_logger(XRayLogger* logger) {
    logger_ = logger;
    if (!logger_) {
        queue_.set_listener(nullptr);
        return;
    }
    queue_.set_listener([logger](const QueuedEffect& queued, const Effect& effect,
                                 const effects::ApplyResult& result) {
        logger->log_effect(queued, effect, result);
    });
}

// ============================================================================
// CORE API
// ============================================================================

GameState BattleEngine::step(const GameState& state, const Action& action, ActionResult* result) const {
    GameState new_state = state.clone();
    ActionResult outcome = step_inplace(new_state, action);
    if (result) {
        *result = std::move(outcome);
    }
    return new_state;
}

ActionResult BattleEngine::step_inplace(GameState& state, const Action& action) const {
    if (logger_) {
        logger_->log_action(state, action);
    }

    GameState snapshot = state.clone();
    ActionResult result;
    try {
        result = apply_action(state, action);
    } catch (const std::exception& e) {
        std::cerr << "[BattleEngine] " << action.to_string() << " failed: " << e.what() << std::endl;
        result = ActionResult::fail(std::string("Action failed: ") + e.what());
    }

    if (result.success) {
        state.executed_actions++;
    } else {
        state = std::move(snapshot);
    }

    if (logger_) {
        logger_->log_result(result.success, result.message);
        if (result.success) {
            if (state.pending_selection) {
                logger_->log_pending_selection(*state.pending_selection);
            }
            logger_->log_state(state);
            if (state.is_game_over()) {
                logger_->log_game_end(state.winner_id, to_string(state.result));
            }
        }
    }
    return result;
}

std::vector<Action> BattleEngine::get_legal_actions(const GameState& state) const {
    if (state.is_game_over()) {
        return {};
    }

    std::vector<Action> candidates;

    // Priority 1: a suspended effect waits for its chooser
    if (state.pending_selection) {
        const auto& pending = *state.pending_selection;
        for (size_t i = 0; i < pending.candidates.size(); i++) {
            candidates.push_back(Action::select_target(pending.chooser, static_cast<int>(i)));
        }
        return candidates;
    }

    // Priority 2: an empty active spot must be filled
    if (state.is_awaiting_promotion()) {
        for (PlayerID p = 0; p < 2; p++) {
            const PlayerState& player = state.players[p];
            if (!player.awaiting_promotion) continue;
            for (int pos = 1; pos <= player.field.get_bench_count(); pos++) {
                candidates.push_back(Action::promote_active(p, pos));
            }
        }
        return candidates;
    }

    // Priority 3: the current player's turn
    const PlayerID pid = state.current_player;
    const PlayerState& player = state.get_player(pid);
    const auto occupied = player.field.occupied_positions();

    for (const auto& card : player.hand.cards) {
        auto category = repo_.get_category(card.template_id);
        if (!category) continue;

        if (*category == CardCategory::CREATURE && !repo_.get_creature(card.template_id).is_basic()) {
            for (int pos : occupied) {
                candidates.push_back(Action::evolve(pid, card.instance_id, pos));
            }
        } else if (*category == CardCategory::TOOL) {
            for (int pos : occupied) {
                candidates.push_back(Action::play_card(pid, card.instance_id, pos));
            }
        } else {
            candidates.push_back(Action::play_card(pid, card.instance_id));
        }
    }

    for (int pos : occupied) {
        candidates.push_back(Action::attach_energy(pid, pos));
        candidates.push_back(Action::use_ability(pid, pos));
        if (pos != ACTIVE_POSITION) {
            candidates.push_back(Action::retreat(pid, pos));
        }
    }

    if (player.field.has_active()) {
        const auto& attacks = repo_.get_creature(player.field.active_spot->template_id()).attacks;
        for (size_t i = 0; i < attacks.size(); i++) {
            candidates.push_back(Action::attack(pid, static_cast<int>(i)));
        }
    }

    candidates.push_back(Action::end_turn(pid));

    std::vector<Action> legal;
    for (auto& action : candidates) {
        if (validate_action(state, action).success) {
            legal.push_back(std::move(action));
        }
    }
    return legal;
}

// ============================================================================
// GAME SETUP
// ============================================================================

GameState BattleEngine::create_game(const DeckList& deck0,
                                    const DeckList& deck1,
                                    uint32_t seed,
                                    const GameConfig& config) const {
    GameState state;
    state.config = config;
    state.rng.seed(seed);
    state.current_player = config.starting_player;

    const DeckList* decks[2] = {&deck0, &deck1};
    const int hand_size = std::max(1, config.initial_hand_size);

    for (PlayerID p = 0; p < 2; p++) {
        PlayerState& player = state.players[p];
        const DeckList& deck = *decks[p];
        const std::string label = "Deck " + std::to_string(p);

        player.field.max_bench_size = config.max_bench_size;

        if (deck.energy_types.empty()) {
            throw std::invalid_argument(label + " has no energy types");
        }
        for (EnergyType type : deck.energy_types) {
            if (type == EnergyType::COLORLESS) {
                throw std::invalid_argument(label + " cannot generate colorless energy");
            }
        }
        state.energy.available_types[p] = deck.energy_types;

        bool has_basic = false;
        for (size_t n = 0; n < deck.cards.size(); n++) {
            const TemplateID& template_id = deck.cards[n];
            auto category = repo_.get_category(template_id);
            if (!category) {
                throw std::invalid_argument(label + " has unknown card: " + template_id);
            }
            if (*category == CardCategory::CREATURE && repo_.get_creature(template_id).is_basic()) {
                has_basic = true;
            }
            player.deck.add_card({template_id + "-" + std::to_string(p) + "-" + std::to_string(n), template_id});
        }
        if (!has_basic) {
            throw std::invalid_argument(label + " has no basic creature");
        }

        // Redeal until the hand holds a basic creature
        std::optional<CardRef> opener;
        while (!opener) {
            for (auto& card : player.hand.cards) {
                player.deck.add_to_bottom(std::move(card));
            }
            player.hand.cards.clear();
            player.deck.shuffle(state.rng);
            effects::draw_cards(state, p, hand_size);

            for (const auto& card : player.hand.cards) {
                if (repo_.get_category(card.template_id) == CardCategory::CREATURE &&
                    repo_.get_creature(card.template_id).is_basic()) {
                    opener = card;
                    break;
                }
            }
        }

        player.hand.take_card(opener->instance_id);
        player.field.add_creature(FieldCard(opener->instance_id, opener->template_id, 0));

        effects::dispatch_event(state, repo_, queue_,
                                make_event(TriggerKind::PASSIVE, p, opener->instance_id));
    }

    if (queue_.drain(state) != DrainStatus::IDLE) {
        throw std::runtime_error("Setup effects cannot wait for a selection");
    }

    // Turn 1: the starting player draws but generates no energy
    state.get_current_player().reset_turn_flags();
    effects::draw_cards(state, state.current_player, 1);
    return state;
}

// ============================================================================
// VALIDATION
// ============================================================================

ActionResult BattleEngine::validate_action(const GameState& state, const Action& action) const {
    if (state.is_game_over()) {
        return ActionResult::fail("Game is over");
    }
    if (action.player_id > 1) {
        return ActionResult::fail("Invalid player id");
    }

    if (state.pending_selection) {
        if (action.action_type != ActionType::SELECT_TARGET) {
            return ActionResult::fail("A target selection is pending");
        }
        return validate_select_target(state, action);
    }

    if (state.is_awaiting_promotion()) {
        if (action.action_type != ActionType::PROMOTE_ACTIVE) {
            return ActionResult::fail("An active creature must be promoted first");
        }
        return validate_promote_active(state, action);
    }

    if (action.player_id != state.current_player) {
        return ActionResult::fail("Not player " + std::to_string(action.player_id) + "'s turn");
    }

    switch (action.action_type) {
        case ActionType::PLAY_CARD: return validate_play_card(state, action);
        case ActionType::ATTACH_ENERGY: return validate_attach_energy(state, action);
        case ActionType::EVOLVE: return validate_evolve(state, action);
        case ActionType::RETREAT: return validate_retreat(state, action);
        case ActionType::ATTACK: return validate_attack(state, action);
        case ActionType::USE_ABILITY: return validate_use_ability(state, action);
        case ActionType::SELECT_TARGET: return ActionResult::fail("No selection is pending");
        case ActionType::PROMOTE_ACTIVE: return ActionResult::fail("No promotion is pending");
        case ActionType::END_TURN: return ActionResult::ok();
        default: return ActionResult::fail("Unknown action type");
    }
}

ActionResult BattleEngine::validate_play_card(const GameState& state, const Action& action) const {
    const PlayerState& player = state.get_player(action.player_id);

    if (!action.card_id) {
        return ActionResult::fail("No card specified");
    }
    const CardRef* card = player.hand.find_card(*action.card_id);
    if (!card) {
        return ActionResult::fail("Card not in hand: " + *action.card_id);
    }
    auto category = repo_.get_category(card->template_id);
    if (!category) {
        return ActionResult::fail("Unknown card: " + card->template_id);
    }
    if (effects::is_card_category_prevented(state, repo_, action.player_id, *category)) {
        return ActionResult::fail(std::string("Playing ") + to_string(*category) + " cards is prevented");
    }

    switch (*category) {
        case CardCategory::CREATURE:
            if (!repo_.get_creature(card->template_id).is_basic()) {
                return ActionResult::fail("Only basic creatures can be played to the bench");
            }
            if (player.field.has_active() && !player.field.can_add_to_bench()) {
                return ActionResult::fail("Bench is full");
            }
            return ActionResult::ok();

        case CardCategory::SUPPORTER:
            if (player.supporter_played_this_turn) {
                return ActionResult::fail("A supporter was already played this turn");
            }
            if (!can_apply_effects(state, card->template_id, EffectOrigin::CARD, 0,
                                   trainer_context(repo_.get_supporter(card->template_id).name, action.player_id))) {
                return ActionResult::fail("Supporter has no valid targets");
            }
            return ActionResult::ok();

        case CardCategory::ITEM:
            if (!can_apply_effects(state, card->template_id, EffectOrigin::CARD, 0,
                                   trainer_context(repo_.get_item(card->template_id).name, action.player_id))) {
                return ActionResult::fail("Item has no valid targets");
            }
            return ActionResult::ok();

        case CardCategory::TOOL: {
            if (!action.position) {
                return ActionResult::fail("Tool needs a target position");
            }
            const FieldCard* holder = player.field.get(*action.position);
            if (!holder) {
                return ActionResult::fail("No creature at position " + std::to_string(*action.position));
            }
            if (player.get_tool(holder->field_instance_id())) {
                return ActionResult::fail("Creature already has a tool attached");
            }
            return ActionResult::ok();
        }
    }
    return ActionResult::fail("Unknown card category");
}

ActionResult BattleEngine::validate_attach_energy(const GameState& state, const Action& action) const {
    const PlayerState& player = state.get_player(action.player_id);

    if (!state.energy.current_energy[action.player_id]) {
        return ActionResult::fail("No energy available to attach");
    }
    if (player.energy_attached_this_turn) {
        return ActionResult::fail("Energy was already attached this turn");
    }
    if (effects::is_energy_attachment_prevented(state, repo_, action.player_id)) {
        return ActionResult::fail("Energy attachment is prevented");
    }
    if (!action.position || !player.field.is_occupied(*action.position)) {
        return ActionResult::fail("No creature at target position");
    }
    return ActionResult::ok();
}

ActionResult BattleEngine::validate_evolve(const GameState& state, const Action& action) const {
    const PlayerState& player = state.get_player(action.player_id);

    if (!action.card_id || !action.position) {
        return ActionResult::fail("Evolve needs a card and a position");
    }
    const CardRef* card = player.hand.find_card(*action.card_id);
    if (!card) {
        return ActionResult::fail("Card not in hand: " + *action.card_id);
    }
    if (repo_.get_category(card->template_id) != CardCategory::CREATURE ||
        repo_.get_creature(card->template_id).is_basic()) {
        return ActionResult::fail("Card is not an evolution: " + card->template_id);
    }
    if (!player.field.is_occupied(*action.position)) {
        return ActionResult::fail("No creature at position " + std::to_string(*action.position));
    }
    if (!can_evolve(state, action.player_id, card->template_id, *action.position)) {
        return ActionResult::fail("Cannot evolve into " + repo_.get_creature(card->template_id).name);
    }
    return ActionResult::ok();
}

ActionResult BattleEngine::validate_retreat(const GameState& state, const Action& action) const {
    const PlayerState& player = state.get_player(action.player_id);

    if (!player.field.has_active()) {
        return ActionResult::fail("No active creature");
    }
    if (!is_bench_position(player.field, action.position)) {
        return ActionResult::fail("Invalid bench position");
    }
    if (player.retreated_this_turn) {
        return ActionResult::fail("Already retreated this turn");
    }

    const FieldPosition active{action.player_id, ACTIVE_POSITION};
    const FieldCard& card = state.get_creature(active);
    if (card.is_asleep_or_paralyzed()) {
        return ActionResult::fail("Active creature is asleep or paralyzed");
    }
    if (effects::is_retreat_prevented(state, repo_, active)) {
        return ActionResult::fail("Retreat is prevented");
    }

    const int cost = calculate_retreat_cost(state, active);
    if (state.energy.total(card.field_instance_id()) < cost) {
        return ActionResult::fail("Not enough energy to retreat (cost " + std::to_string(cost) + ")");
    }
    return ActionResult::ok();
}

ActionResult BattleEngine::validate_attack(const GameState& state, const Action& action) const {
    const PlayerState& player = state.get_player(action.player_id);

    if (!action.attack_index) {
        return ActionResult::fail("No attack specified");
    }
    if (!player.field.has_active()) {
        return ActionResult::fail("No active creature");
    }
    if (!state.get_player(opponent_of(action.player_id)).field.has_active()) {
        return ActionResult::fail("Opponent has no active creature");
    }

    const FieldPosition active{action.player_id, ACTIVE_POSITION};
    const FieldCard& attacker = state.get_creature(active);
    const CreatureData& creature = repo_.get_creature(attacker.template_id());

    const int index = *action.attack_index;
    if (index < 0 || index >= static_cast<int>(creature.attacks.size())) {
        return ActionResult::fail("Invalid attack index " + std::to_string(index));
    }
    if (attacker.is_asleep_or_paralyzed()) {
        return ActionResult::fail("Active creature is asleep or paralyzed");
    }
    if (effects::is_attack_prevented(state, repo_, active)) {
        return ActionResult::fail(creature.name + " is prevented from attacking");
    }
    if (!can_pay_energy_cost(state.energy.get_attached(attacker.field_instance_id()),
                             calculate_attack_cost(state, active, index))) {
        return ActionResult::fail("Not enough energy for " + creature.attacks[index].name);
    }
    return ActionResult::ok();
}

ActionResult BattleEngine::validate_use_ability(const GameState& state, const Action& action) const {
    const PlayerState& player = state.get_player(action.player_id);

    if (!action.position || !player.field.is_occupied(*action.position)) {
        return ActionResult::fail("No creature at ability position");
    }
    const FieldCard& card = player.field.at(*action.position);
    const CreatureData& creature = repo_.get_creature(card.template_id());

    if (!creature.ability || creature.ability->trigger.kind != TriggerKind::MANUAL) {
        return ActionResult::fail(creature.name + " has no usable ability");
    }
    if (card.ability_used_this_turn && !creature.ability->trigger.unlimited) {
        return ActionResult::fail(creature.ability->name + " was already used this turn");
    }

    EffectContext context = effects::ability_context(repo_, card, action.player_id, TriggerKind::MANUAL);
    if (!can_apply_effects(state, creature.template_id, EffectOrigin::ABILITY, 0, context)) {
        return ActionResult::fail(creature.ability->name + " has no valid targets");
    }
    return ActionResult::ok();
}

ActionResult BattleEngine::validate_select_target(const GameState& state, const Action& action) const {
    const PendingSelection& pending = *state.pending_selection;

    if (action.player_id != pending.chooser) {
        return ActionResult::fail("Player " + std::to_string(pending.chooser) + " must choose");
    }
    if (!action.choice_index || *action.choice_index < 0 ||
        *action.choice_index >= static_cast<int>(pending.candidates.size())) {
        return ActionResult::fail("Invalid selection");
    }
    return ActionResult::ok();
}

ActionResult BattleEngine::validate_promote_active(const GameState& state, const Action& action) const {
    const PlayerState& player = state.get_player(action.player_id);

    if (!player.awaiting_promotion) {
        return ActionResult::fail("Player " + std::to_string(action.player_id) + " has an active creature");
    }
    if (!is_bench_position(player.field, action.position)) {
        return ActionResult::fail("Invalid bench position");
    }
    return ActionResult::ok();
}

// ============================================================================
// ACTION APPLICATION
// ============================================================================

ActionResult BattleEngine::apply_action(GameState& state, const Action& action) const {
    ActionResult check = validate_action(state, action);
    if (!check.success) {
        return check;
    }

    switch (action.action_type) {
        case ActionType::PLAY_CARD: return apply_play_card(state, action);
        case ActionType::ATTACH_ENERGY: return apply_attach_energy(state, action);
        case ActionType::EVOLVE: return apply_evolve(state, action);
        case ActionType::RETREAT: return apply_retreat(state, action);
        case ActionType::ATTACK: return apply_attack(state, action);
        case ActionType::USE_ABILITY: return apply_use_ability(state, action);
        case ActionType::SELECT_TARGET: return apply_select_target(state, action);
        case ActionType::PROMOTE_ACTIVE: return apply_promote_active(state, action);
        case ActionType::END_TURN:
            advance_turn(state);
            return ActionResult::ok("Turn ended");
        default:
            return ActionResult::fail("Unknown action type");
    }
}

ActionResult BattleEngine::apply_play_card(GameState& state, const Action& action) const {
    const PlayerID pid = action.player_id;
    PlayerState& player = state.get_player(pid);

    CardRef card = *player.hand.take_card(*action.card_id);
    const CardData& data = *repo_.get_card(card.template_id);
    const std::string name = name_of(data);

    switch (category_of(data)) {
        case CardCategory::CREATURE: {
            player.field.add_creature(FieldCard(card.instance_id, card.template_id, state.turn_number));
            enter_play(state, {pid, player.field.find_position(card.instance_id)}, false);
            break;
        }

        case CardCategory::SUPPORTER:
        case CardCategory::ITEM: {
            if (category_of(data) == CardCategory::SUPPORTER) {
                player.supporter_played_this_turn = true;
            }
            player.discard.add_card(card);
            queue_.enqueue_group(state, card.template_id, EffectOrigin::CARD, 0, trainer_context(name, pid));
            break;
        }

        case CardCategory::TOOL: {
            const FieldPosition position{pid, *action.position};
            const InstanceID holder = state.get_creature(position).field_instance_id();
            player.tools[holder] = card;
            effects::enqueue_tool_trigger(state, repo_, queue_, position,
                                          make_event(TriggerKind::PASSIVE, pid, holder));
            break;
        }
    }

    resolve(state);
    return ActionResult::ok("Played " + name);
}

ActionResult BattleEngine::apply_attach_energy(GameState& state, const Action& action) const {
    const PlayerID pid = action.player_id;
    PlayerState& player = state.get_player(pid);

    const EnergyType type = *state.energy.current_energy[pid];
    const InstanceID id = player.field.at(*action.position).field_instance_id();

    state.energy.attach(id, type, 1);
    state.energy.current_energy[pid].reset();
    player.energy_attached_this_turn = true;

    TriggerEvent event = make_event(TriggerKind::ENERGY_ATTACHMENT, pid, id);
    event.energy_type = type;
    dispatch_events(state, {event});

    resolve(state);
    return ActionResult::ok(std::string("Attached ") + to_string(type) + " energy");
}

ActionResult BattleEngine::apply_evolve(GameState& state, const Action& action) const {
    const PlayerID pid = action.player_id;
    PlayerState& player = state.get_player(pid);

    CardRef card = *player.hand.take_card(*action.card_id);
    const TemplateID evolved_template = card.template_id;

    effects::ApplyResult evolved;
    effects::evolve_creature(state, {pid, *action.position}, std::move(card), evolved);
    dispatch_events(state, evolved.events);

    resolve(state);
    return ActionResult::ok("Evolved into " + repo_.get_creature(evolved_template).name);
}

ActionResult BattleEngine::apply_retreat(GameState& state, const Action& action) const {
    const PlayerID pid = action.player_id;
    PlayerState& player = state.get_player(pid);
    const FieldPosition active{pid, ACTIVE_POSITION};

    const int cost = calculate_retreat_cost(state, active);
    const InstanceID id = state.get_creature(active).field_instance_id();

    // Pay in energy type declaration order
    int remaining = cost;
    for (int t = 0; t < ATTACHABLE_ENERGY_TYPES && remaining > 0; t++) {
        remaining -= state.energy.discard(id, pid, static_cast<EnergyType>(t), remaining);
    }

    player.field.active_spot->clear_all_status();
    player.field.switch_active(*action.position);
    player.retreated_this_turn = true;

    dispatch_events(state, {make_event(TriggerKind::ON_RETREAT, pid, id)});

    resolve(state);
    return ActionResult::ok("Retreated for " + std::to_string(cost) + " energy");
}

ActionResult BattleEngine::apply_attack(GameState& state, const Action& action) const {
    const PlayerID pid = action.player_id;
    const int index = *action.attack_index;

    const FieldCard& attacker = state.get_player(pid).field.at(ACTIVE_POSITION);
    const TemplateID template_id = attacker.template_id();
    const AttackData& attack = repo_.get_creature(template_id).attacks[index];
    const EffectContext context = attack_context(state, index);

    const int damage = calculate_attack_damage(state, index);
    effects::ApplyResult result;
    const int dealt = effects::deal_damage(state, repo_, {opponent_of(pid), ACTIVE_POSITION}, damage, result);

    // Damage boosts on the attack were counted into the damage already
    for (size_t i = 0; i < attack.effects.size(); i++) {
        if (effect_kind(attack.effects[i]) == EffectKind::DAMAGE_BOOST) continue;
        queue_.enqueue(state, EffectRef{template_id, EffectOrigin::ATTACK, index, static_cast<int>(i)}, context);
    }
    dispatch_events(state, result.events);

    state.end_turn_after_resolution = true;
    resolve(state);
    return ActionResult::ok(context.effect_name + " dealt " + std::to_string(dealt) + " damage");
}

ActionResult BattleEngine::apply_use_ability(GameState& state, const Action& action) const {
    const PlayerID pid = action.player_id;
    FieldCard& card = state.get_player(pid).field.at(*action.position);
    const CreatureData& creature = repo_.get_creature(card.template_id());

    card.ability_used_this_turn = true;
    EffectContext context = effects::ability_context(repo_, card, pid, TriggerKind::MANUAL);
    queue_.enqueue_group(state, creature.template_id, EffectOrigin::ABILITY, 0, context);

    resolve(state);
    return ActionResult::ok("Used " + context.effect_name);
}

ActionResult BattleEngine::apply_select_target(GameState& state, const Action& action) const {
    if (!queue_.resume_with_selection(state, *action.choice_index)) {
        return ActionResult::fail("Invalid selection");
    }
    resolve(state);
    return ActionResult::ok("Selected target " + std::to_string(*action.choice_index));
}

ActionResult BattleEngine::apply_promote_active(GameState& state, const Action& action) const {
    PlayerState& player = state.get_player(action.player_id);
    player.field.promote(*action.position);
    player.awaiting_promotion = false;

    resolve(state);
    return ActionResult::ok("Promoted a new active creature");
}

// ============================================================================
// RESOLUTION AND TURN FLOW
// ============================================================================

void BattleEngine::resolve(GameState& state) const {
    if (queue_.drain(state) == DrainStatus::AWAITING_SELECTION) {
        return;
    }

    process_knockouts(state);
    check_win_conditions(state);
    if (state.is_game_over()) {
        return;
    }

    // A transition that suspended on a selection picks up where it stopped
    if (state.turn_stage != TurnStage::MAIN) {
        advance_turn(state);
        return;
    }

    if (state.end_turn_after_resolution && !state.is_awaiting_promotion()) {
        state.end_turn_after_resolution = false;
        advance_turn(state);
    }
}

void BattleEngine::advance_turn(GameState& state) const {
    while (!state.is_game_over()) {
        switch (state.turn_stage) {
            case TurnStage::MAIN:
                state.turn_stage = TurnStage::END_OF_TURN;
                effects::dispatch_turn_trigger(state, repo_, queue_, TriggerKind::END_OF_TURN);
                break;

            case TurnStage::END_OF_TURN:
                run_checkup(state);
                state.turn_stage = TurnStage::CHECKUP;
                effects::dispatch_turn_trigger(state, repo_, queue_, TriggerKind::ON_CHECKUP);
                break;

            case TurnStage::CHECKUP:
                begin_turn(state);
                state.turn_stage = TurnStage::START_OF_TURN;
                effects::dispatch_turn_trigger(state, repo_, queue_, TriggerKind::START_OF_TURN);
                break;

            case TurnStage::START_OF_TURN: {
                const PlayerID player = state.current_player;
                const auto& types = state.energy.available_types[player];
                if (!types.empty()) {
                    std::uniform_int_distribution<size_t> pick(0, types.size() - 1);
                    state.energy.current_energy[player] = types[pick(state.rng)];
                }
                effects::draw_cards(state, player, 1);
                state.turn_stage = TurnStage::MAIN;
                return;
            }
        }

        if (queue_.drain(state) == DrainStatus::AWAITING_SELECTION) {
            return;
        }
        process_knockouts(state);
        check_win_conditions(state);
    }
}

void BattleEngine::run_checkup(GameState& state) const {
    effects::ApplyResult result;
    const PlayerID order[2] = {state.current_player, opponent_of(state.current_player)};

    for (PlayerID p : order) {
        if (!state.get_player(p).field.has_active()) continue;
        const FieldPosition active{p, ACTIVE_POSITION};

        if (state.get_creature(active).has_status(StatusCondition::POISON)) {
            effects::deal_damage(state, repo_, active, POISON_CHECKUP_DAMAGE, result);
        }
        if (state.get_creature(active).has_status(StatusCondition::BURN)) {
            effects::deal_damage(state, repo_, active, BURN_CHECKUP_DAMAGE, result);
        }

        // Sleep and paralysis last through their owner's turn
        if (p == state.current_player) {
            FieldCard& card = state.get_creature(active);
            card.remove_status(StatusCondition::SLEEP);
            card.remove_status(StatusCondition::PARALYSIS);
        }
    }

    dispatch_events(state, result.events);
}

void BattleEngine::begin_turn(GameState& state) const {
    const int ending_turn = state.turn_number;

    state.turn_number++;
    state.current_player = opponent_of(state.current_player);

    // Before start-of-turn triggers, so a lapsed prevention never blocks the new turn
    effects::expire_passive_effects(state, ending_turn);

    state.get_current_player().reset_turn_flags();
    state.energy.current_energy[state.current_player].reset();
}

void BattleEngine::enter_play(GameState& state, const FieldPosition& position, bool from_evolution) const {
    const InstanceID id = state.get_creature(position).field_instance_id();

    effects::enqueue_ability_trigger(state, repo_, queue_, position,
                                     make_event(TriggerKind::PASSIVE, position.player_id, id));

    TriggerEvent on_play = make_event(TriggerKind::ON_PLAY, position.player_id, id);
    on_play.from_evolution = from_evolution;
    effects::enqueue_ability_trigger(state, repo_, queue_, position, on_play);
}

// ============================================================================
// DAMAGE AND KNOCKOUT
// ============================================================================

void BattleEngine::dispatch_events(GameState& state, const std::vector<TriggerEvent>& events) const {
    for (const auto& event : events) {
        effects::dispatch_event(state, repo_, queue_, event);
    }
}

void BattleEngine::process_knockouts(GameState& state) const {
    std::vector<InstanceID> knocked_out;
    for (PlayerID p = 0; p < 2; p++) {
        for (int pos : state.players[p].field.occupied_positions()) {
            const FieldPosition position{p, pos};
            if (effects::is_knocked_out(state, repo_, position)) {
                knocked_out.push_back(state.get_creature(position).field_instance_id());
            }
        }
    }

    // Positions shift as creatures leave, so look each one up again
    for (const auto& id : knocked_out) {
        if (auto position = state.find_creature(id)) {
            knock_out(state, *position);
        }
    }
}

void BattleEngine::knock_out(GameState& state, const FieldPosition& position) const {
    PlayerState& owner = state.get_player(position.player_id);
    PlayerState& opponent = state.get_player(opponent_of(position.player_id));

    FieldCard card = owner.field.remove_at(position.field_index);
    const InstanceID field_id = card.field_instance_id();
    const CreatureData& creature = repo_.get_creature(card.template_id());

    // Whole evolution stack, tool and energy leave play together
    for (const auto& entry : card.evolution_stack) {
        owner.discard.add_card({entry.instance_id, entry.template_id});
    }
    auto tool = owner.tools.find(field_id);
    if (tool != owner.tools.end()) {
        owner.discard.add_card(tool->second);
        owner.tools.erase(tool);
    }
    state.energy.discard_all(field_id, position.player_id);
    effects::clear_passives_for_instance(state, field_id);

    opponent.points += creature.get_knockout_points();

    if (position.field_index == ACTIVE_POSITION && owner.field.get_bench_count() > 0) {
        owner.awaiting_promotion = true;
    }

    std::cout << "[BattleEngine] " << creature.name << " was knocked out (player "
              << static_cast<int>(position.player_id) << ")" << std::endl;
}

// ============================================================================
// WIN CONDITIONS
// ============================================================================

void BattleEngine::check_win_conditions(GameState& state) const {
    if (state.is_game_over()) return;

    bool wins[2] = {false, false};
    for (PlayerID p = 0; p < 2; p++) {
        const PlayerState& opponent = state.players[opponent_of(p)];
        wins[p] = state.players[p].points >= state.config.win_points ||
                  !opponent.field.has_any_creature();
    }

    if (wins[0] && wins[1]) {
        state.result = GameResult::DRAW;
        state.winner_id.reset();
    } else if (wins[0]) {
        state.result = GameResult::PLAYER_0_WIN;
        state.winner_id = 0;
    } else if (wins[1]) {
        state.result = GameResult::PLAYER_1_WIN;
        state.winner_id = 1;
    }
}

// ============================================================================
// RULES QUERIES
// ============================================================================

EffectContext BattleEngine::attack_context(const GameState& state, int attack_index) const {
    const FieldCard& attacker = state.get_current_player().field.at(ACTIVE_POSITION);
    const CreatureData& creature = repo_.get_creature(attacker.template_id());
    if (attack_index < 0 || attack_index >= static_cast<int>(creature.attacks.size())) {
        throw std::out_of_range("Attack index out of range: " + std::to_string(attack_index));
    }

    EffectContext context;
    context.type = ContextType::ATTACK;
    context.source_player = state.current_player;
    context.effect_name = creature.name + "'s " + creature.attacks[attack_index].name;
    context.source_instance_id = attacker.field_instance_id();
    return context;
}

int BattleEngine::calculate_attack_damage(const GameState& state, int attack_index) const {
    const EffectContext context = attack_context(state, attack_index);
    const FieldPosition attacker_pos{state.current_player, ACTIVE_POSITION};
    const CreatureData& creature = repo_.get_creature(state.get_creature(attacker_pos).template_id());
    const AttackData& attack = creature.attacks[attack_index];

    int damage = effects::resolve_amount(state, repo_, attack.damage, context);

    const PlayerState& opponent = state.get_opponent();
    std::optional<FieldPosition> defender_pos;
    if (opponent.field.has_active()) {
        defender_pos = FieldPosition{opponent.player_id, ACTIVE_POSITION};
    }

    // Weakness only adds to an attack that deals damage of its own
    if (defender_pos && damage > 0 && !effects::is_weakness_disabled(state, repo_, *defender_pos)) {
        const CreatureData& defender = repo_.get_creature(state.get_creature(*defender_pos).template_id());
        if (defender.weakness && *defender.weakness == creature.type) {
            damage += WEAKNESS_BONUS;
        }
    }

    damage += effects::get_damage_boost(state, repo_, attacker_pos);
    for (const auto& effect : attack.effects) {
        if (const auto* boost = std::get_if<DamageBoostEffect>(&effect)) {
            damage += effects::resolve_amount(state, repo_, boost->amount, context);
        }
    }

    if (defender_pos) {
        if (effects::is_damage_prevented(state, repo_, attacker_pos, *defender_pos)) {
            return 0;
        }
        damage -= effects::get_damage_reduction(state, repo_, attacker_pos, *defender_pos);
    }
    return std::max(0, damage);
}

EnergyCost BattleEngine::calculate_attack_cost(const GameState& state, const FieldPosition& attacker,
                                               int attack_index) const {
    const CreatureData& creature = repo_.get_creature(state.get_creature(attacker).template_id());
    EnergyCost cost = creature.attacks.at(attack_index).energy_requirements;

    int modifier = effects::get_attack_cost_modifier(state, repo_, attacker);
    for (; modifier > 0; modifier--) {
        cost.push_back(EnergyType::COLORLESS);
    }
    for (; modifier < 0 && !cost.empty(); modifier++) {
        auto colorless = std::find(cost.begin(), cost.end(), EnergyType::COLORLESS);
        cost.erase(colorless != cost.end() ? colorless : cost.end() - 1);
    }
    return cost;
}

int BattleEngine::calculate_retreat_cost(const GameState& state, const FieldPosition& position) const {
    const FieldCard& card = state.get_creature(position);
    const int cost = repo_.get_creature(card.template_id()).retreat_cost +
                     effects::get_retreat_cost_modifier(state, repo_, position);
    return std::max(0, cost);
}

bool BattleEngine::can_evolve(const GameState& state, PlayerID player_id,
                              const TemplateID& evolution_template, int position) const {
    const FieldCard* base = state.get_player(player_id).field.get(position);
    if (!base) return false;

    const CreatureData& evolution = repo_.get_creature(evolution_template);
    if (evolution.is_basic()) return false;

    // Not the turn it came into play or already evolved
    if (base->turn_played == state.turn_number || base->turn_last_evolved == state.turn_number) {
        return false;
    }

    const CreatureData& current = repo_.get_creature(base->template_id());
    if (*evolution.previous_stage_name == current.name) {
        return true;
    }
    return effects::allows_flexible_evolution(state, repo_, player_id, evolution.name, current.name);
}

bool BattleEngine::can_pay_energy_cost(const EnergyCounts& attached, const EnergyCost& cost) {
    if (cost.empty()) {
        return true;
    }

    EnergyCounts available = attached;

    int colorless_needed = 0;
    EnergyCounts specific_needed;
    for (EnergyType type : cost) {
        if (type == EnergyType::COLORLESS) {
            colorless_needed++;
        } else {
            specific_needed[type]++;
        }
    }

    // Step 1: Pay specific type requirements first
    for (const auto& [type, count] : specific_needed) {
        auto it = available.find(type);
        const int have = it != available.end() ? it->second : 0;
        if (have < count) {
            return false;
        }
        available[type] -= count;
    }

    // Step 2: Pay colorless with any remaining energy
    return total_energy(available) >= colorless_needed;
}

bool BattleEngine::can_apply_effects(const GameState& state,
                                     const TemplateID& template_id,
                                     EffectOrigin origin,
                                     int group_index,
                                     const EffectContext& context) const {
    for (const auto& effect : repo_.get_effects(template_id, origin, group_index)) {
        if (!registry_.can_apply(state, repo_, effect, context)) {
            return false;
        }
    }
    return true;
}

} // namespace cardbattle
