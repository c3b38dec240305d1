/**
 * Card Battle Engine - Effect Handlers
 *
 * Registration entry points for the closed set of effect kinds.
 * Each handlers/ source file registers the kinds it implements.
 */

#pragma once

#include "effect_handler.hpp"

namespace cardbattle {
namespace effects {

/**
 * Register a handler for every EffectKind.
 *
 * Call this once when building an engine.
 */
void register_all_handlers(EffectRegistry& registry);

// ============================================================================
// INDIVIDUAL HANDLER REGISTRATIONS
// ============================================================================

void register_hp_handler(EffectRegistry& registry);
void register_status_handlers(EffectRegistry& registry);       // status, status-recovery
void register_draw_handlers(EffectRegistry& registry);         // draw, shuffle
void register_energy_handlers(EffectRegistry& registry);       // energy, energy-transfer
void register_switch_handler(EffectRegistry& registry);
void register_passive_handlers(EffectRegistry& registry);      // duration-scoped kinds
void register_hand_handlers(EffectRegistry& registry);         // hand-discard, search, swap-cards
void register_removal_handlers(EffectRegistry& registry);      // tool-discard, remove-field-card
void register_evolution_handlers(EffectRegistry& registry);    // evolution-acceleration, pull-evolution

} // namespace effects
} // namespace cardbattle
