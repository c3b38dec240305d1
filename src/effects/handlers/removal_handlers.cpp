/**
 * Removal Effect Handlers
 *
 * Descriptors:
 *   { type: 'tool-discard', target: FieldTarget }
 *   { type: 'remove-field-card', target: FieldTarget, destination: 'hand' | 'deck' }
 *
 * A removed creature is not knocked out: no points are awarded and no
 * before-knockout triggers run.
 */

#include "effects/handlers.hpp"
#include "effects/field_operations.hpp"
#include <algorithm>

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

ApplyResult apply_tool_discard(HandlerContext& ctx, const Effect&, const ResolvedSlots& slots) {
    ApplyResult result;

    for (const auto& position : slot_positions(slots, TargetRole::TARGET)) {
        if (discard_tool(ctx.state, position)) {
            result.affected.push_back(position);
            result.amount_applied++;
        }
    }

    result.message = "Discarded " + std::to_string(result.amount_applied) + " tools";
    return result;
}

ApplyResult apply_remove_field_card(HandlerContext& ctx, const Effect& effect, const ResolvedSlots& slots) {
    const auto& remove = std::get<RemoveFieldCardEffect>(effect);
    ApplyResult result;

    // Highest bench position first so earlier removals don't shift later ones
    std::vector<FieldPosition> positions = slot_positions(slots, TargetRole::TARGET);
    std::sort(positions.begin(), positions.end(), [](const FieldPosition& a, const FieldPosition& b) {
        return a.field_index > b.field_index;
    });

    for (const auto& position : positions) {
        return_to_owner(ctx.state, position, remove.destination);
        result.affected.push_back(position);
        result.amount_applied++;
    }

    result.message = "Returned " + std::to_string(result.amount_applied) + " creatures to " +
                     to_string(remove.destination);
    return result;
}

} // anonymous namespace

void register_removal_handlers(EffectRegistry& registry) {
    EffectHandler tool;
    tool.requirements = target_requirement<ToolDiscardEffect>;
    tool.apply = apply_tool_discard;
    registry.register_handler(EffectKind::TOOL_DISCARD, std::move(tool));

    EffectHandler remove;
    remove.requirements = target_requirement<RemoveFieldCardEffect>;
    remove.apply = apply_remove_field_card;
    registry.register_handler(EffectKind::REMOVE_FIELD_CARD, std::move(remove));
}

} // namespace effects
} // namespace cardbattle
