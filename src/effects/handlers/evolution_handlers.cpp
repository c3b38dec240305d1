/**
 * Evolution Effect Handlers
 *
 * Descriptors:
 *   { type: 'evolution-acceleration', target: FieldTarget, skipStages }
 *   { type: 'pull-evolution', target: FieldTarget, cardCriteria? }
 *
 * Acceleration evolves a basic that was not put into play this turn
 * straight from its owner's hand into a later stage, skipping the
 * intermediate form. Pull evolution takes the next stage from the owner's
 * deck and shuffles the deck afterwards. Both report the same PASSIVE and
 * ON_PLAY events as evolving from hand.
 */

#include "effects/handlers.hpp"
#include "effects/field_operations.hpp"
#include "effects/target_resolver.hpp"
#include <iostream>

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

bool is_creature(const CardRepository& repo, const TemplateID& template_id) {
    return repo.get_category(template_id) == CardCategory::CREATURE;
}

// Name of the basic a card evolves from once `skip_stages` forms are skipped
std::optional<std::string> accelerated_base_name(const CardRepository& repo,
                                                 const TemplateID& template_id,
                                                 int skip_stages) {
    std::optional<std::string> name = repo.get_creature(template_id).previous_stage_name;
    for (int i = 0; i < skip_stages && name; i++) {
        const auto templates = repo.get_templates_by_name(*name);
        if (templates.empty()) {
            return std::nullopt;
        }
        name = repo.get_creature(templates.front()).previous_stage_name;
    }
    return name;
}

// ============================================================================
// EVOLUTION ACCELERATION
// ============================================================================

const CardRef* find_accelerated_form(const GameState& state, const CardRepository& repo,
                                     const FieldPosition& position, int skip_stages) {
    const FieldCard& card = state.get_creature(position);
    if (card.evolution_stack.size() != 1 || card.turn_played >= state.turn_number) {
        return nullptr;
    }

    const CreatureData& basic = repo.get_creature(card.template_id());
    if (!basic.is_basic()) {
        return nullptr;
    }

    for (const auto& candidate : state.get_player(position.player_id).hand.cards) {
        if (!is_creature(repo, candidate.template_id)) continue;
        const auto base = accelerated_base_name(repo, candidate.template_id, skip_stages);
        if (base && *base == basic.name) {
            return &candidate;
        }
    }
    return nullptr;
}

bool can_accelerate(const GameState& state, const CardRepository& repo, const Effect& effect,
                    const EffectContext& ctx) {
    const auto& acceleration = std::get<EvolutionAccelerationEffect>(effect);
    const TargetResolution resolution = resolve_target(state, repo, acceleration.target, ctx);
    if (!is_target_available(resolution)) {
        return false;
    }

    const auto& positions = resolution.is_resolved() ? resolution.positions : resolution.candidates;
    for (const auto& position : positions) {
        if (find_accelerated_form(state, repo, position, acceleration.skip_stages)) {
            return true;
        }
    }
    return false;
}

ApplyResult apply_acceleration(HandlerContext& ctx, const Effect& effect, const ResolvedSlots& slots) {
    const auto& acceleration = std::get<EvolutionAccelerationEffect>(effect);
    ApplyResult result;

    for (const auto& position : slot_positions(slots, TargetRole::TARGET)) {
        const CardRef* form = find_accelerated_form(ctx.state, ctx.repo, position, acceleration.skip_stages);
        if (!form) {
            std::cerr << "[Evolution] " << ctx.context.effect_name
                      << ": no card in hand can evolve the target" << std::endl;
            continue;
        }

        const InstanceID form_id = form->instance_id;
        CardRef card = *ctx.state.get_player(position.player_id).hand.take_card(form_id);
        evolve_creature(ctx.state, position, std::move(card), result);
        result.amount_applied++;
    }

    result.message = "Accelerated " + std::to_string(result.amount_applied) + " evolutions";
    return result;
}

// ============================================================================
// PULL EVOLUTION
// ============================================================================

const CardRef* find_next_stage(const GameState& state, const CardRepository& repo,
                               const FieldPosition& position, const CardCriteria& criteria) {
    const std::string& name = repo.get_creature(state.get_creature(position).template_id()).name;

    for (const auto& candidate : state.get_player(position.player_id).deck.cards) {
        if (!is_creature(repo, candidate.template_id)) continue;
        const CreatureData& creature = repo.get_creature(candidate.template_id);
        if (creature.previous_stage_name == name && card_matches(repo, candidate.template_id, criteria)) {
            return &candidate;
        }
    }
    return nullptr;
}

bool can_pull_evolution(const GameState& state, const CardRepository& repo, const Effect& effect,
                        const EffectContext& ctx) {
    const auto& pull = std::get<PullEvolutionEffect>(effect);
    const TargetResolution resolution = resolve_target(state, repo, pull.target, ctx);
    if (!is_target_available(resolution)) {
        return false;
    }

    const auto& positions = resolution.is_resolved() ? resolution.positions : resolution.candidates;
    for (const auto& position : positions) {
        if (find_next_stage(state, repo, position, pull.card)) {
            return true;
        }
    }
    return false;
}

ApplyResult apply_pull_evolution(HandlerContext& ctx, const Effect& effect, const ResolvedSlots& slots) {
    const auto& pull = std::get<PullEvolutionEffect>(effect);
    ApplyResult result;

    for (const auto& position : slot_positions(slots, TargetRole::TARGET)) {
        const CardRef* next = find_next_stage(ctx.state, ctx.repo, position, pull.card);
        if (!next) {
            continue;
        }

        PlayerState& owner = ctx.state.get_player(position.player_id);
        const InstanceID next_id = next->instance_id;
        CardRef card = *owner.deck.take_card(next_id);
        evolve_creature(ctx.state, position, std::move(card), result);
        owner.deck.shuffle(ctx.state.rng);
        result.amount_applied++;
    }

    result.message = "Evolved " + std::to_string(result.amount_applied) + " creatures from the deck";
    return result;
}

} // anonymous namespace

void register_evolution_handlers(EffectRegistry& registry) {
    EffectHandler acceleration;
    acceleration.can_apply = can_accelerate;
    acceleration.requirements = target_requirement<EvolutionAccelerationEffect>;
    acceleration.apply = apply_acceleration;
    registry.register_handler(EffectKind::EVOLUTION_ACCELERATION, std::move(acceleration));

    EffectHandler pull;
    pull.can_apply = can_pull_evolution;
    pull.requirements = target_requirement<PullEvolutionEffect>;
    pull.apply = apply_pull_evolution;
    registry.register_handler(EffectKind::PULL_EVOLUTION, std::move(pull));
}

} // namespace effects
} // namespace cardbattle
