/**
 * Switch Effect Handler
 *
 * Descriptor: { type: 'switch', switchWith: FieldTarget }
 *
 * Each chosen bench creature swaps places with its owner's active creature.
 * The creature leaving the active spot loses its status conditions.
 */

#include "effects/handlers.hpp"

namespace cardbattle {
namespace effects {

namespace {

std::vector<SelectionPoint> switch_requirements(const Effect& effect) {
    SelectionPoint point;
    point.role = TargetRole::TARGET;
    point.target = &std::get<SwitchEffect>(effect).target;
    return {point};
}

ApplyResult apply_switch(HandlerContext& ctx, const Effect&, const ResolvedSlots& slots) {
    ApplyResult result;

    for (const auto& position : slot_positions(slots, TargetRole::TARGET)) {
        if (position.field_index == ACTIVE_POSITION) {
            continue;  // Already active
        }

        Field& field = ctx.state.get_player(position.player_id).field;
        if (field.has_active()) {
            field.active_spot->clear_all_status();
            field.switch_active(position.field_index);
        } else {
            field.promote(position.field_index);
            ctx.state.get_player(position.player_id).awaiting_promotion = false;
        }

        result.affected.push_back({position.player_id, ACTIVE_POSITION});
        result.amount_applied++;
    }

    result.message = ctx.context.effect_name + " switched " + std::to_string(result.amount_applied);
    return result;
}

} // anonymous namespace

void register_switch_handler(EffectRegistry& registry) {
    EffectHandler handler;
    handler.requirements = switch_requirements;
    handler.apply = apply_switch;
    registry.register_handler(EffectKind::SWITCH, std::move(handler));
}

} // namespace effects
} // namespace cardbattle
