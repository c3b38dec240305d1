/**
 * Energy Effect Handlers
 *
 * Descriptors:
 *   { type: 'energy', operation: 'attach' | 'discard', energyType(s), amount, target }
 *   { type: 'energy-transfer', source: { fieldTarget, criteria: { energyTypes }, count }, target }
 *
 * Key mechanics:
 * - Attach adds `amount` of the first declared type to every target
 * - Discard removes up to `amount`, walking the declared types in order,
 *   and records what was removed in the owner's discarded-energy ledger
 * - Transfer moves min(count, matching attached) units, type by type in
 *   declared order; ENERGY_TRANSFER_ALL moves everything that matches
 * - Per-type counts are preserved, energy is never treated as a fungible total
 */

#include "effects/handlers.hpp"
#include "effects/value_resolver.hpp"

namespace cardbattle {
namespace effects {

namespace {

// Declared types, or every attachable type in declaration order
std::vector<EnergyType> types_or_all(const std::vector<EnergyType>& declared) {
    if (!declared.empty()) {
        return declared;
    }
    std::vector<EnergyType> all;
    for (int i = 0; i < ATTACHABLE_ENERGY_TYPES; i++) {
        all.push_back(static_cast<EnergyType>(i));
    }
    return all;
}

// ============================================================================
// ATTACH / DISCARD
// ============================================================================

std::vector<SelectionPoint> energy_requirements(const Effect& effect) {
    SelectionPoint point;
    point.role = TargetRole::TARGET;
    point.target = &std::get<EnergyEffect>(effect).target;
    return {point};
}

void attach_energy(HandlerContext& ctx, const EnergyEffect& energy, int amount, ApplyResult& result) {
    if (energy.energy_types.empty() || amount <= 0) {
        return;
    }
    const EnergyType type = energy.energy_types.front();

    for (const auto& position : result.affected) {
        const InstanceID& id = ctx.state.get_creature(position).field_instance_id();
        ctx.state.energy.attach(id, type, amount);
        result.amount_applied += amount;
        result.events.push_back({TriggerKind::ENERGY_ATTACHMENT, position.player_id, id, type});
    }
}

void discard_energy(HandlerContext& ctx, const EnergyEffect& energy, int amount, ApplyResult& result) {
    const auto types = types_or_all(energy.energy_types);

    for (const auto& position : result.affected) {
        const InstanceID& id = ctx.state.get_creature(position).field_instance_id();
        int remaining = amount;
        for (EnergyType type : types) {
            if (remaining <= 0) break;
            remaining -= ctx.state.energy.discard(id, position.player_id, type, remaining);
        }
        result.amount_applied += amount - remaining;
    }
}

ApplyResult apply_energy(HandlerContext& ctx, const Effect& effect, const ResolvedSlots& slots) {
    const auto& energy = std::get<EnergyEffect>(effect);
    ApplyResult result;
    result.affected = slot_positions(slots, TargetRole::TARGET);

    const int amount = resolve_amount(ctx.state, ctx.repo, energy.amount, ctx.context);
    if (energy.operation == EnergyOperation::ATTACH) {
        attach_energy(ctx, energy, amount, result);
        result.message = "Attached " + std::to_string(result.amount_applied) + " energy";
    } else {
        discard_energy(ctx, energy, amount, result);
        result.message = "Discarded " + std::to_string(result.amount_applied) + " energy";
    }
    return result;
}

// ============================================================================
// TRANSFER
// ============================================================================

std::vector<SelectionPoint> transfer_requirements(const Effect& effect) {
    const auto& transfer = std::get<EnergyTransferEffect>(effect);

    SelectionPoint source;
    source.role = TargetRole::SOURCE;
    source.energy_source = &transfer.source;

    SelectionPoint target;
    target.role = TargetRole::TARGET;
    target.target = &transfer.target;

    return {source, target};
}

ApplyResult apply_transfer(HandlerContext& ctx, const Effect& effect, const ResolvedSlots& slots) {
    const auto& transfer = std::get<EnergyTransferEffect>(effect);
    ApplyResult result;

    const auto& sources = slot_positions(slots, TargetRole::SOURCE);
    const auto& targets = slot_positions(slots, TargetRole::TARGET);
    if (sources.empty() || targets.empty()) {
        result.message = ctx.context.effect_name + " found no valid targets";
        return result;
    }

    const InstanceID to = ctx.state.get_creature(targets.front()).field_instance_id();
    const auto types = types_or_all(transfer.source.energy_types);

    for (const auto& source : sources) {
        const InstanceID from = ctx.state.get_creature(source).field_instance_id();
        if (from == to) continue;

        int remaining = transfer.source.count;
        for (EnergyType type : types) {
            if (remaining <= 0) break;
            remaining -= ctx.state.energy.transfer(from, to, type, remaining);
        }
        result.amount_applied += transfer.source.count - remaining;
        result.affected.push_back(source);
    }

    result.affected.push_back(targets.front());
    result.message = "Moved " + std::to_string(result.amount_applied) + " energy";
    return result;
}

} // anonymous namespace

void register_energy_handlers(EffectRegistry& registry) {
    EffectHandler energy;
    energy.requirements = energy_requirements;
    energy.apply = apply_energy;
    registry.register_handler(EffectKind::ENERGY, std::move(energy));

    EffectHandler transfer;
    transfer.requirements = transfer_requirements;
    transfer.apply = apply_transfer;
    registry.register_handler(EffectKind::ENERGY_TRANSFER, std::move(transfer));
}

} // namespace effects
} // namespace cardbattle
