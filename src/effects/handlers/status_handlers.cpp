/**
 * Status Effect Handlers
 *
 * Descriptors:
 *   { type: 'status', condition, target }
 *   { type: 'status-recovery', target, conditions? }
 *
 * Sleep, paralysis and confusion replace one another; poison and burn
 * stack with them. Recovery without a condition list clears everything.
 * Creatures covered by a status-prevention passive are skipped.
 */

#include "effects/handlers.hpp"
#include "effects/passive_effects.hpp"

namespace cardbattle {
namespace effects {

namespace {

template <typename T>
std::vector<SelectionPoint> target_requirement(const Effect& effect) {
    SelectionPoint point;
    point.role = TargetRole::TARGET;
    point.target = &std::get<T>(effect).target;
    return {point};
}

ApplyResult apply_status(HandlerContext& ctx, const Effect& effect, const ResolvedSlots& slots) {
    const auto& status = std::get<StatusEffect>(effect);
    ApplyResult result;

    for (const auto& position : slot_positions(slots, TargetRole::TARGET)) {
        if (is_status_prevented(ctx.state, ctx.repo, position, status.condition)) {
            continue;
        }
        ctx.state.get_creature(position).add_status(status.condition);
        result.affected.push_back(position);
        result.amount_applied++;
    }

    result.message = std::string("Applied ") + to_string(status.condition);
    return result;
}

ApplyResult apply_status_recovery(HandlerContext& ctx, const Effect& effect, const ResolvedSlots& slots) {
    const auto& recovery = std::get<StatusRecoveryEffect>(effect);
    ApplyResult result;

    for (const auto& position : slot_positions(slots, TargetRole::TARGET)) {
        FieldCard& card = ctx.state.get_creature(position);
        if (recovery.conditions.empty()) {
            card.clear_all_status();
        } else {
            for (StatusCondition condition : recovery.conditions) {
                card.remove_status(condition);
            }
        }
        result.affected.push_back(position);
        result.amount_applied++;
    }
    return result;
}

} // anonymous namespace

void register_status_handlers(EffectRegistry& registry) {
    EffectHandler status;
    status.requirements = target_requirement<StatusEffect>;
    status.apply = apply_status;
    registry.register_handler(EffectKind::STATUS, std::move(status));

    EffectHandler recovery;
    recovery.requirements = target_requirement<StatusRecoveryEffect>;
    recovery.apply = apply_status_recovery;
    registry.register_handler(EffectKind::STATUS_RECOVERY, std::move(recovery));
}

} // namespace effects
} // namespace cardbattle
