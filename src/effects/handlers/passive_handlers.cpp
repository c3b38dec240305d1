/**
 * Passive Effect Handlers
 *
 * damage-boost, hp-bonus, prevent-attack, prevent-energy-attachment,
 * prevent-playing, retreat-cost-increase, retreat-cost-reduction,
 * retreat-prevention, evolution-flexibility, damage-reduction,
 * prevent-damage, disable-weakness, attack-energy-cost-modifier,
 * status-prevention.
 *
 * None of these mutate game totals. Applying one registers a
 * duration-scoped passive effect that the legality checks and the damage
 * calculation consult later. The amount, where the kind has one, is
 * evaluated once at registration.
 */

#include "effects/handlers.hpp"
#include "effects/passive_effects.hpp"
#include "effects/value_resolver.hpp"
#include <type_traits>
#include <utility>

namespace cardbattle {
namespace effects {

namespace {

template <typename T, typename = void>
struct has_amount : std::false_type {};

template <typename T>
struct has_amount<T, std::void_t<decltype(std::declval<T>().amount)>> : std::true_type {};

template <typename T>
ApplyResult apply_passive(HandlerContext& ctx, const Effect& effect, const ResolvedSlots&) {
    const T& descriptor = std::get<T>(effect);
    ApplyResult result;

    int amount = 0;
    if constexpr (has_amount<T>::value) {
        amount = resolve_amount(ctx.state, ctx.repo, descriptor.amount, ctx.context);
    }
    if constexpr (std::is_same_v<T, AttackEnergyCostModifierEffect>) {
        if (descriptor.reduce) amount = -amount;
    }

    const EffectKind kind = effect_kind(effect);
    const std::string id = register_passive(ctx.state, ctx.ref, kind, ctx.context,
                                            amount, descriptor.duration);

    result.amount_applied = amount;
    result.message = std::string("Registered ") + to_string(kind) + " (" + id + ", " +
                     to_string(descriptor.duration) + ")";
    return result;
}

template <typename T>
void register_passive_kind(EffectRegistry& registry, EffectKind kind) {
    EffectHandler handler;
    handler.apply = apply_passive<T>;
    registry.register_handler(kind, std::move(handler));
}

} // anonymous namespace

void register_passive_handlers(EffectRegistry& registry) {
    register_passive_kind<DamageBoostEffect>(registry, EffectKind::DAMAGE_BOOST);
    register_passive_kind<HpBonusEffect>(registry, EffectKind::HP_BONUS);
    register_passive_kind<PreventAttackEffect>(registry, EffectKind::PREVENT_ATTACK);
    register_passive_kind<PreventEnergyAttachmentEffect>(registry, EffectKind::PREVENT_ENERGY_ATTACHMENT);
    register_passive_kind<PreventPlayingEffect>(registry, EffectKind::PREVENT_PLAYING);
    register_passive_kind<RetreatCostIncreaseEffect>(registry, EffectKind::RETREAT_COST_INCREASE);
    register_passive_kind<RetreatCostReductionEffect>(registry, EffectKind::RETREAT_COST_REDUCTION);
    register_passive_kind<RetreatPreventionEffect>(registry, EffectKind::RETREAT_PREVENTION);
    register_passive_kind<EvolutionFlexibilityEffect>(registry, EffectKind::EVOLUTION_FLEXIBILITY);
    register_passive_kind<DamageReductionEffect>(registry, EffectKind::DAMAGE_REDUCTION);
    register_passive_kind<PreventDamageEffect>(registry, EffectKind::PREVENT_DAMAGE);
    register_passive_kind<DisableWeaknessEffect>(registry, EffectKind::DISABLE_WEAKNESS);
    register_passive_kind<AttackEnergyCostModifierEffect>(registry, EffectKind::ATTACK_ENERGY_COST_MODIFIER);
    register_passive_kind<StatusPreventionEffect>(registry, EffectKind::STATUS_PREVENTION);
}

} // namespace effects
} // namespace cardbattle
