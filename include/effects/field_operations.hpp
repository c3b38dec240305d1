/**
 * Card Battle Engine - Field Operations
 *
 * Non-cascading state primitives shared by effect handlers and the engine.
 * They report trigger events through ApplyResult; they never enqueue.
 */

#pragma once

#include "effect_handler.hpp"

namespace cardbattle {
namespace effects {

/**
 * Damage a creature, capped at its remaining effective HP.
 *
 * Appends a DAMAGED event when damage is dealt, and a BEFORE_KNOCKOUT
 * event plus a knocked_out entry when the creature reaches effective HP.
 * Returns the damage actually dealt.
 */
int deal_damage(GameState& state,
                const CardRepository& repo,
                const FieldPosition& position,
                int amount,
                ApplyResult& result);

/**
 * Heal a creature, capped at its current damage. Returns the amount healed.
 */
int heal_damage(GameState& state, const FieldPosition& position, int amount);

/**
 * Draw up to `count` cards; stops at an empty deck or the hand limit.
 * Returns the number drawn.
 */
int draw_cards(GameState& state, PlayerID player, int count);

/**
 * Put the whole hand on the bottom of the deck and shuffle.
 */
void shuffle_hand_into_deck(GameState& state, PlayerID player);

/**
 * Move up to `count` cards from the front of the hand to the discard pile,
 * or to the deck (then shuffled). Returns the number moved.
 */
int discard_from_hand(GameState& state, PlayerID player, int count, bool shuffle_into_deck = false);

/**
 * Discard the tool attached to a creature and end its passives.
 * Returns false when the creature holds no tool.
 */
bool discard_tool(GameState& state, const FieldPosition& position);

/**
 * Return a creature's evolution stack and tool to its owner's hand or deck.
 *
 * Attached energy is discarded and every passive bound to the creature
 * ends. An emptied active spot with a bench left sets awaiting_promotion.
 */
void return_to_owner(GameState& state, const FieldPosition& position, ZoneType destination);

/**
 * Put `card` on top of a creature's evolution stack.
 *
 * Passives from the previous form's ability end; PASSIVE and ON_PLAY
 * events for the new form are appended to `result`.
 */
void evolve_creature(GameState& state, const FieldPosition& position, CardRef card, ApplyResult& result);

/**
 * Whether the creature has reached its effective HP.
 */
bool is_knocked_out(const GameState& state, const CardRepository& repo, const FieldPosition& position);

} // namespace effects
} // namespace cardbattle
