/**
 * Card Battle Engine - Passive Effect Tracker
 *
 * Registration, expiry and queries for duration-scoped passive effects.
 * Passives of the same kind stack additively. Criteria are evaluated at
 * query time, relative to the player who registered the effect. Criteria
 * that name no player default to the side the kind acts on: the
 * registering player's creatures for beneficial kinds, the opponent's for
 * prevent-attack, retreat-cost-increase and retreat-prevention.
 */

#pragma once

#include "../game_state.hpp"
#include "../card_repository.hpp"

namespace cardbattle {
namespace effects {

// ============================================================================
// LIFECYCLE
// ============================================================================

/**
 * Register a passive effect created by `context`.
 *
 * `amount` is evaluated by the caller at registration time. Returns the
 * new effect's id ("passive-effect-N").
 */
std::string register_passive(GameState& state,
                             const EffectRef& ref,
                             EffectKind kind,
                             const EffectContext& context,
                             int amount,
                             DurationKind duration,
                             std::optional<InstanceID> bound_instance = std::nullopt);

/**
 * Remove effects that lapse when `ending_turn` ends. Returns the number removed.
 */
int expire_passive_effects(GameState& state, int ending_turn);

/**
 * Remove every effect bound to a creature that left play. Returns the number removed.
 */
int clear_passives_for_instance(GameState& state, const InstanceID& field_instance_id);

/**
 * Remove effects bound to a creature that came from one origin (e.g. the
 * old form's ability after evolution). Returns the number removed.
 */
int clear_passives_for_instance(GameState& state, const InstanceID& field_instance_id,
                                EffectOrigin origin);

// ============================================================================
// QUERIES
// ============================================================================

int get_hp_bonus(const GameState& state, const CardRepository& repo, const FieldPosition& position);

/**
 * Printed max HP plus every applicable hp-bonus.
 */
int effective_max_hp(const GameState& state, const CardRepository& repo, const FieldPosition& position);

/**
 * Sum of damage-boost passives that apply to an attack by `attacker`.
 */
int get_damage_boost(const GameState& state, const CardRepository& repo, const FieldPosition& attacker);

bool is_attack_prevented(const GameState& state, const CardRepository& repo, const FieldPosition& attacker);

bool is_energy_attachment_prevented(const GameState& state, const CardRepository& repo, PlayerID player);

bool is_card_category_prevented(const GameState& state, const CardRepository& repo,
                                PlayerID player, CardCategory category);

/**
 * Net retreat cost change (increases minus reductions) for a creature.
 */
int get_retreat_cost_modifier(const GameState& state, const CardRepository& repo,
                              const FieldPosition& position);

bool is_retreat_prevented(const GameState& state, const CardRepository& repo,
                          const FieldPosition& position);

/**
 * Whether an evolution-flexibility effect lets `player` evolve a creature
 * named `base_name` into one named `evolution_name`.
 */
bool allows_flexible_evolution(const GameState& state, const CardRepository& repo, PlayerID player,
                               const std::string& evolution_name, const std::string& base_name);

/**
 * Sum of damage-reduction passives protecting `defender` from `attacker`.
 */
int get_damage_reduction(const GameState& state, const CardRepository& repo,
                         const FieldPosition& attacker, const FieldPosition& defender);

bool is_damage_prevented(const GameState& state, const CardRepository& repo,
                         const FieldPosition& attacker, const FieldPosition& defender);

bool is_weakness_disabled(const GameState& state, const CardRepository& repo, const FieldPosition& defender);

/**
 * Net change to the number of energy an attack by `attacker` requires.
 */
int get_attack_cost_modifier(const GameState& state, const CardRepository& repo,
                             const FieldPosition& attacker);

bool is_status_prevented(const GameState& state, const CardRepository& repo,
                         const FieldPosition& position, StatusCondition condition);

} // namespace effects
} // namespace cardbattle
