/**
 * Card Battle Engine - Effect Handler Registry
 *
 * One handler per effect kind. Each handler exposes:
 * - can_apply: dry run, true when every required source/target resolves
 * - requirements: which parts of the effect are targeted (static)
 * - apply: performs the mutation against already-resolved positions
 *
 * Example usage:
 *   EffectRegistry registry;
 *   register_all_handlers(registry);
 *   ApplyResult r = registry.apply(ctx, effect, slots);
 */

#pragma once

#include "../game_state.hpp"
#include "../card_repository.hpp"
#include "target_resolver.hpp"
#include <functional>

namespace cardbattle {
namespace effects {

// ============================================================================
// HANDLER DATA TYPES
// ============================================================================

/**
 * HandlerContext - Everything a handler needs to mutate state.
 */
struct HandlerContext {
    GameState& state;
    const CardRepository& repo;
    const EffectContext& context;
    const EffectRef& ref;
};

/**
 * SelectionPoint - A targeted part of an effect. Points into the descriptor.
 */
struct SelectionPoint {
    TargetRole role = TargetRole::TARGET;
    const FieldTarget* target = nullptr;        // Set unless energy_source is
    const EnergySource* energy_source = nullptr;
    bool required = true;

    bool may_require_selection() const {
        const FieldTarget& t = energy_source ? energy_source->field_target : *target;
        return std::holds_alternative<SingleChoiceTarget>(t);
    }
};

/**
 * TriggerEvent - A state change other cards may react to.
 */
struct TriggerEvent {
    TriggerKind kind = TriggerKind::DAMAGED;
    PlayerID player_id = 0;                     // Owner of the creature
    InstanceID field_instance_id;
    std::optional<EnergyType> energy_type;      // ENERGY_ATTACHMENT
    bool from_evolution = false;                // ON_PLAY
};

/**
 * ApplyResult - Outcome of one handler application.
 */
struct ApplyResult {
    bool success = true;
    int amount_applied = 0;                     // After capping
    std::vector<FieldPosition> affected;
    std::vector<TriggerEvent> events;
    std::vector<InstanceID> knocked_out;        // Reached effective HP; processed after the queue drains
    std::string message;
};

// ============================================================================
// CALLBACK TYPES
// ============================================================================

// Dry run: (state, repo, effect, context) -> bool
using CanApplyCallback = std::function<bool(
    const GameState&,
    const CardRepository&,
    const Effect&,
    const EffectContext&
)>;

// Static selection points of an effect
using RequirementsCallback = std::function<std::vector<SelectionPoint>(const Effect&)>;

// Mutation: (handler context, effect, resolved slots) -> ApplyResult
using ApplyCallback = std::function<ApplyResult(
    HandlerContext&,
    const Effect&,
    const ResolvedSlots&
)>;

struct EffectHandler {
    CanApplyCallback can_apply;         // Optional; defaults to requirement resolution
    RequirementsCallback requirements;  // Optional; defaults to no selection points
    ApplyCallback apply;
};

// ============================================================================
// EFFECT REGISTRY
// ============================================================================

/**
 * EffectRegistry - Handler lookup by effect kind.
 *
 * Populated once before play, read-only afterwards.
 */
class EffectRegistry {
public:
    EffectRegistry() = default;
    ~EffectRegistry() = default;

    void register_handler(EffectKind kind, EffectHandler handler);

    bool has_handler(EffectKind kind) const;

    /**
     * Throws std::out_of_range if no handler is registered for the kind.
     */
    const EffectHandler& get_handler(EffectKind kind) const;

    bool can_apply(const GameState& state,
                   const CardRepository& repo,
                   const Effect& effect,
                   const EffectContext& context) const;

    std::vector<SelectionPoint> get_resolution_requirements(const Effect& effect) const;

    ApplyResult apply(HandlerContext& ctx, const Effect& effect, const ResolvedSlots& slots) const;

    size_t handler_count() const { return handlers_.size(); }

private:
    std::unordered_map<EffectKind, EffectHandler> handlers_;
};

// ============================================================================
// HELPERS
// ============================================================================

/**
 * Whether every required selection point resolves to something
 * (a selection still counts; UNSATISFIABLE does not).
 */
bool requirements_available(const GameState& state,
                            const CardRepository& repo,
                            const std::vector<SelectionPoint>& points,
                            const EffectContext& context);

/**
 * Resolve one selection point.
 */
TargetResolution resolve_selection_point(const GameState& state,
                                         const CardRepository& repo,
                                         const SelectionPoint& point,
                                         const EffectContext& context);

/**
 * Positions for a role, or an empty list if the role was not resolved.
 */
const std::vector<FieldPosition>& slot_positions(const ResolvedSlots& slots, TargetRole role);

} // namespace effects
} // namespace cardbattle
