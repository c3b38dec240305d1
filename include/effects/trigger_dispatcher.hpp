/**
 * Card Battle Engine - Trigger Dispatcher
 *
 * Maps game events to the abilities and attached tools that react to
 * them, and enqueues their effects. Nothing is applied here.
 *
 * Ordering:
 * - Turn triggers: the turn player's creatures first, then the opponent's,
 *   each by field position ascending
 * - On one creature the ability is queued before its attached tool
 */

#pragma once

#include "effect_queue.hpp"

namespace cardbattle {
namespace effects {

/**
 * Whether a declared trigger reacts to `event` on a creature owned by `owner`.
 * Checks energy type, evolution filter and the turn restrictions.
 */
bool trigger_matches(const GameState& state, const Trigger& trigger,
                     const TriggerEvent& event, PlayerID owner);

EffectContext ability_context(const CardRepository& repo, const FieldCard& card,
                              PlayerID owner, std::optional<TriggerKind> trigger);

EffectContext tool_context(const CardRepository& repo, const TemplateID& tool_template,
                           const FieldCard& holder, PlayerID owner, TriggerKind trigger);

/**
 * Queue the ability of the creature at `position` if its trigger matches.
 * Returns the number of effects queued.
 */
int enqueue_ability_trigger(GameState& state, const CardRepository& repo,
                            const EffectQueue& queue, const FieldPosition& position,
                            const TriggerEvent& event);

/**
 * Queue the tool attached to the creature at `position` if its trigger matches.
 */
int enqueue_tool_trigger(GameState& state, const CardRepository& repo,
                         const EffectQueue& queue, const FieldPosition& position,
                         const TriggerEvent& event);

/**
 * Event on one creature (damaged, before-knockout, energy-attachment,
 * on-play, on-retreat, passive). Creatures no longer in play are ignored.
 */
int dispatch_event(GameState& state, const CardRepository& repo,
                   const EffectQueue& queue, const TriggerEvent& event);

/**
 * End-of-turn, start-of-turn or checkup triggers for every creature in play.
 */
int dispatch_turn_trigger(GameState& state, const CardRepository& repo,
                          const EffectQueue& queue, TriggerKind kind);

} // namespace effects
} // namespace cardbattle
