/**
 * Card Battle Engine - Effect Handler Registry Implementation
 */

#include "effects/effect_handler.hpp"
#include <stdexcept>

namespace cardbattle {
namespace effects {

// ============================================================================
// REGISTRATION
// ============================================================================

void EffectRegistry::register_handler(EffectKind kind, EffectHandler handler) {
    if (!handler.apply) {
        throw std::invalid_argument(std::string("Handler without apply for ") + to_string(kind));
    }
    handlers_[kind] = std::move(handler);
}

bool EffectRegistry::has_handler(EffectKind kind) const {
    return handlers_.find(kind) != handlers_.end();
}

const EffectHandler& EffectRegistry::get_handler(EffectKind kind) const {
    auto it = handlers_.find(kind);
    if (it == handlers_.end()) {
        throw std::out_of_range(std::string("No handler registered for effect kind: ") + to_string(kind));
    }
    return it->second;
}

// ============================================================================
// INVOCATION
// ============================================================================

std::vector<SelectionPoint> EffectRegistry::get_resolution_requirements(const Effect& effect) const {
    const EffectHandler& handler = get_handler(effect_kind(effect));
    if (!handler.requirements) {
        return {};
    }
    return handler.requirements(effect);
}

bool EffectRegistry::can_apply(const GameState& state,
                               const CardRepository& repo,
                               const Effect& effect,
                               const EffectContext& context) const {
    const EffectHandler& handler = get_handler(effect_kind(effect));
    if (handler.can_apply) {
        return handler.can_apply(state, repo, effect, context);
    }
    return requirements_available(state, repo, get_resolution_requirements(effect), context);
}

ApplyResult EffectRegistry::apply(HandlerContext& ctx, const Effect& effect, const ResolvedSlots& slots) const {
    return get_handler(effect_kind(effect)).apply(ctx, effect, slots);
}

// ============================================================================
// HELPERS
// ============================================================================

TargetResolution resolve_selection_point(const GameState& state,
                                         const CardRepository& repo,
                                         const SelectionPoint& point,
                                         const EffectContext& context) {
    if (point.energy_source) {
        return resolve_energy_source(state, repo, *point.energy_source, context);
    }
    return resolve_target(state, repo, *point.target, context);
}

bool requirements_available(const GameState& state,
                            const CardRepository& repo,
                            const std::vector<SelectionPoint>& points,
                            const EffectContext& context) {
    for (const auto& point : points) {
        if (!point.required) continue;
        if (!is_target_available(resolve_selection_point(state, repo, point, context))) {
            return false;
        }
    }
    return true;
}

const std::vector<FieldPosition>& slot_positions(const ResolvedSlots& slots, TargetRole role) {
    static const std::vector<FieldPosition> empty;
    const auto& slot = role == TargetRole::SOURCE ? slots.source : slots.target;
    return slot ? *slot : empty;
}

} // namespace effects
} // namespace cardbattle
