/**
 * Card Battle Engine - Value Resolver
 *
 * Evaluates AmountSpec expressions against the current state.
 * Read-only and deterministic.
 */

#pragma once

#include "../game_state.hpp"
#include "../card_repository.hpp"

namespace cardbattle {
namespace effects {

/**
 * Resolve a player scope relative to the acting player.
 * BOTH is not a single player and throws std::invalid_argument.
 */
PlayerID resolve_player(PlayerScope scope, PlayerID acting_player);

/**
 * Evaluate an amount. Never negative.
 */
int resolve_amount(const GameState& state,
                   const CardRepository& repo,
                   const AmountSpec& amount,
                   const EffectContext& context);

/**
 * Points the player still needs to win, clamped at 0.
 */
int points_to_win(const GameState& state, PlayerID player);

} // namespace effects
} // namespace cardbattle
