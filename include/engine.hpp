/**
 * Card Battle Engine - Main Engine Interface
 *
 * This is the primary interface for the game engine.
 * Provides step() to apply player actions and get_legal_actions()
 * to enumerate them.
 */

#pragma once

#include "game_state.hpp"
#include "action.hpp"
#include "card_repository.hpp"
#include "effects/effect_queue.hpp"

namespace cardbattle {

class XRayLogger;

/**
 * ActionResult - Outcome of one engine action.
 *
 * A failed action leaves the state exactly as it was.
 */
struct ActionResult {
    bool success = false;
    std::string message;

    static ActionResult ok(std::string message = {}) { return {true, std::move(message)}; }
    static ActionResult fail(std::string message) { return {false, std::move(message)}; }
};

/**
 * DeckList - One player's deck and the energy types it generates.
 */
struct DeckList {
    std::vector<TemplateID> cards;
    std::vector<EnergyType> energy_types;
};

/**
 * BattleEngine - The game engine.
 *
 * Owns the card repository and the effect handler registry; game states
 * are passed in by reference. Read operations are safe to share, a single
 * GameState must not be stepped from two threads at once.
 */
class BattleEngine {
public:
    BattleEngine();
    explicit BattleEngine(CardRepository repo);
    ~BattleEngine() = default;

    // The effect queue refers to members of this object
    BattleEngine(const BattleEngine&) = delete;
    BattleEngine& operator=(const BattleEngine&) = delete;

    // ========================================================================
    // CORE API
    // ========================================================================

    /**
     * Get all legal actions from the current state.
     *
     * While a selection is pending only SELECT_TARGET actions are returned;
     * while a promotion is pending only PROMOTE_ACTIVE actions.
     */
    std::vector<Action> get_legal_actions(const GameState& state) const;

    /**
     * Check an action without applying it.
     */
    ActionResult validate_action(const GameState& state, const Action& action) const;

    /**
     * Apply an action to a copy of the state and return the copy.
     */
    GameState step(const GameState& state, const Action& action, ActionResult* result = nullptr) const;

    /**
     * Apply an action in-place.
     *
     * The action is atomic: if it is rejected, or resolution throws, the
     * state is restored to what it was before the call.
     */
    ActionResult step_inplace(GameState& state, const Action& action) const;

    // ========================================================================
    // GAME SETUP
    // ========================================================================

    /**
     * Create a new game from two deck lists.
     *
     * Instance ids are "<templateId>-<player>-<n>". Decks are shuffled with
     * `seed`, each player draws config.initial_hand_size and the first basic
     * creature in hand becomes the active creature.
     * Throws std::invalid_argument for an unknown card, a deck without a
     * basic creature or a deck without energy types.
     */
    GameState create_game(const DeckList& deck0,
                          const DeckList& deck1,
                          uint32_t seed,
                          const GameConfig& config = GameConfig()) const;

    // ========================================================================
    // RULES QUERIES
    // ========================================================================

    /**
     * Printed retreat cost plus increases minus reductions, never below 0.
     */
    int calculate_retreat_cost(const GameState& state, const FieldPosition& position) const;

    /**
     * Whether `evolution_template` may evolve the creature at `position`.
     */
    bool can_evolve(const GameState& state, PlayerID player_id,
                    const TemplateID& evolution_template, int position) const;

    /**
     * Damage the current player's active creature would deal with an attack:
     * printed damage, +20 weakness when that damage is positive, damage-boost
     * passives and damage-boost effects on the attack itself, less the
     * defender's damage reductions. A matching prevent-damage makes it 0.
     */
    int calculate_attack_damage(const GameState& state, int attack_index) const;

    /**
     * Energy an attack requires after attack-energy-cost-modifier passives.
     * Increases add Colorless; reductions remove Colorless first.
     */
    EnergyCost calculate_attack_cost(const GameState& state, const FieldPosition& attacker,
                                     int attack_index) const;

    /**
     * Whether attached energy pays a cost. Specific types are paid first,
     * colorless with whatever remains.
     */
    static bool can_pay_energy_cost(const EnergyCounts& attached, const EnergyCost& cost);

    /**
     * Whether every effect in a group is applicable (card plays and
     * ability uses are rejected otherwise).
     */
    bool can_apply_effects(const GameState& state,
                           const TemplateID& template_id,
                           EffectOrigin origin,
                           int group_index,
                           const EffectContext& context) const;

    /**
     * Set the result if a player reached the winning points or has no
     * creatures left.
     */
    void check_win_conditions(GameState& state) const;

    // ========================================================================
    // COMPONENT ACCESS
    // ========================================================================

    CardRepository& get_card_repository() { return repo_; }
    const CardRepository& get_card_repository() const { return repo_; }

    bool load_cards(const std::string& filepath) {
        return repo_.load_from_json(filepath);
    }

    const effects::EffectRegistry& get_effect_registry() const { return registry_; }
    const effects::EffectQueue& get_effect_queue() const { return queue_; }

    /**
     * Optional X-Ray trace; not owned. Pass nullptr to detach.
     */
    void set_logger(XRayLogger* logger);

private:
    CardRepository repo_;
    effects::EffectRegistry registry_;
    effects::EffectQueue queue_;
    XRayLogger* logger_ = nullptr;

    // ========================================================================
    // VALIDATION (by action type)
    // ========================================================================

    ActionResult validate_play_card(const GameState& state, const Action& action) const;
    ActionResult validate_attach_energy(const GameState& state, const Action& action) const;
    ActionResult validate_evolve(const GameState& state, const Action& action) const;
    ActionResult validate_retreat(const GameState& state, const Action& action) const;
    ActionResult validate_attack(const GameState& state, const Action& action) const;
    ActionResult validate_use_ability(const GameState& state, const Action& action) const;
    ActionResult validate_select_target(const GameState& state, const Action& action) const;
    ActionResult validate_promote_active(const GameState& state, const Action& action) const;

    // ========================================================================
    // ACTION APPLICATION
    // ========================================================================

    ActionResult apply_action(GameState& state, const Action& action) const;

    ActionResult apply_play_card(GameState& state, const Action& action) const;
    ActionResult apply_attach_energy(GameState& state, const Action& action) const;
    ActionResult apply_evolve(GameState& state, const Action& action) const;
    ActionResult apply_retreat(GameState& state, const Action& action) const;
    ActionResult apply_attack(GameState& state, const Action& action) const;
    ActionResult apply_use_ability(GameState& state, const Action& action) const;
    ActionResult apply_select_target(GameState& state, const Action& action) const;
    ActionResult apply_promote_active(GameState& state, const Action& action) const;

    // ========================================================================
    // RESOLUTION AND TURN FLOW
    // ========================================================================

    /**
     * Drain the queue, process knockouts, then continue a pending turn
     * transition or an attack's end of turn.
     */
    void resolve(GameState& state) const;

    /**
     * Run the turn transition from state.turn_stage until it completes or
     * suspends on a selection.
     */
    void advance_turn(GameState& state) const;

    void run_checkup(GameState& state) const;
    void begin_turn(GameState& state) const;

    // Queue passive and on-play triggers for a creature that entered play
    void enter_play(GameState& state, const FieldPosition& position, bool from_evolution) const;

    // ========================================================================
    // DAMAGE AND KNOCKOUT
    // ========================================================================

    void dispatch_events(GameState& state, const std::vector<effects::TriggerEvent>& events) const;

    void process_knockouts(GameState& state) const;
    void knock_out(GameState& state, const FieldPosition& position) const;

    EffectContext attack_context(const GameState& state, int attack_index) const;
};

} // namespace cardbattle
