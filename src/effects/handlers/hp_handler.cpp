/**
 * HP Effect Handler
 *
 * Descriptor: { type: 'hp', amount, target, operation: 'heal' | 'damage' }
 *
 * Key mechanics:
 * - Amount is evaluated once, before any target is touched
 * - Heal is capped at current damage (never below 0)
 * - Damage is capped at remaining effective HP (max HP + hp-bonus)
 * - Heals skip undamaged creatures and never reach the opponent's side
 * - Damage reports damaged / before-knockout events for the trigger dispatcher
 */

#include "effects/handlers.hpp"
#include "effects/field_operations.hpp"
#include "effects/value_resolver.hpp"

namespace cardbattle {
namespace effects {

namespace {

std::vector<SelectionPoint> hp_requirements(const Effect& effect) {
    const auto& hp = std::get<HpEffect>(effect);
    SelectionPoint point;
    point.role = TargetRole::TARGET;
    point.target = &hp.target;
    return {point};
}

ApplyResult apply_hp(HandlerContext& ctx, const Effect& effect, const ResolvedSlots& slots) {
    const auto& hp = std::get<HpEffect>(effect);
    ApplyResult result;

    const int amount = resolve_amount(ctx.state, ctx.repo, hp.amount, ctx.context);

    for (const auto& position : slot_positions(slots, TargetRole::TARGET)) {
        if (hp.operation == HpOperation::HEAL) {
            // Healing never reaches the opponent's creatures
            const FieldCard& card = ctx.state.get_creature(position);
            if (position.player_id != ctx.context.source_player || card.damage_taken == 0) {
                continue;
            }
            const int healed = heal_damage(ctx.state, position, amount);
            result.amount_applied += healed;
            result.affected.push_back(position);
        } else {
            result.amount_applied += deal_damage(ctx.state, ctx.repo, position, amount, result);
        }
    }

    result.message = std::string(hp.operation == HpOperation::HEAL ? "Healed " : "Dealt ") +
                     std::to_string(result.amount_applied);
    return result;
}

} // anonymous namespace

void register_hp_handler(EffectRegistry& registry) {
    EffectHandler handler;
    handler.requirements = hp_requirements;
    handler.apply = apply_hp;
    registry.register_handler(EffectKind::HP, std::move(handler));
}

} // namespace effects
} // namespace cardbattle
