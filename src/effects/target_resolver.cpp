/**
 * Card Battle Engine - Target Resolver Implementation
 */

#include "effects/target_resolver.hpp"
#include "effects/value_resolver.hpp"
#include <algorithm>
#include <stdexcept>

namespace cardbattle {
namespace effects {

// ============================================================================
// CRITERIA MATCHING
// ============================================================================

bool card_matches(const CardRepository& repo,
                  const TemplateID& template_id,
                  const CardCriteria& criteria) {
    if (criteria.empty()) {
        return true;
    }

    const CreatureData& creature = repo.get_creature(template_id);

    if (!criteria.names.empty() &&
        std::find(criteria.names.begin(), criteria.names.end(), creature.name) == criteria.names.end()) {
        return false;
    }
    if (criteria.stage && repo.get_evolution_stage(template_id) != *criteria.stage) {
        return false;
    }
    if (criteria.previous_stage_name &&
        creature.previous_stage_name != criteria.previous_stage_name) {
        return false;
    }
    if (criteria.is_type && creature.type != *criteria.is_type) {
        return false;
    }
    if (criteria.ex && creature.attributes.ex != *criteria.ex) {
        return false;
    }
    if (criteria.mega && creature.attributes.mega != *criteria.mega) {
        return false;
    }
    if (criteria.ultra_beast && creature.attributes.ultra_beast != *criteria.ultra_beast) {
        return false;
    }
    return true;
}

bool creature_matches(const GameState& state,
                      const CardRepository& repo,
                      const FieldPosition& position,
                      const FieldCriteria& criteria,
                      PlayerID acting_player) {
    const FieldCard* card = state.get_player(position.player_id).field.get(position.field_index);
    if (!card) {
        return false;
    }

    if (criteria.player && *criteria.player != PlayerScope::BOTH &&
        resolve_player(*criteria.player, acting_player) != position.player_id) {
        return false;
    }

    if (criteria.position == PositionScope::ACTIVE && position.field_index != ACTIVE_POSITION) {
        return false;
    }
    if (criteria.position == PositionScope::BENCH && position.field_index == ACTIVE_POSITION) {
        return false;
    }

    if (criteria.has_damage && (card->damage_taken > 0) != *criteria.has_damage) {
        return false;
    }

    for (const auto& [type, minimum] : criteria.has_energy) {
        if (state.energy.count(card->field_instance_id(), type) < minimum) {
            return false;
        }
    }

    return card_matches(repo, card->template_id(), criteria.card);
}

std::vector<FieldPosition> find_matching_positions(const GameState& state,
                                                   const CardRepository& repo,
                                                   const FieldCriteria& criteria,
                                                   PlayerID acting_player) {
    std::vector<FieldPosition> matches;
    for (PlayerID p = 0; p < 2; p++) {
        for (int pos : state.players[p].field.occupied_positions()) {
            FieldPosition position{p, pos};
            if (creature_matches(state, repo, position, criteria, acting_player)) {
                matches.push_back(position);
            }
        }
    }
    return matches;
}

// ============================================================================
// RESOLUTION
// ============================================================================

namespace {

TargetResolution resolve_fixed(const GameState& state, const FixedTarget& target,
                               const EffectContext& context) {
    if (target.position == FixedPosition::SOURCE && context.source_instance_id) {
        auto position = state.find_creature(*context.source_instance_id);
        if (!position) {
            return TargetResolution::unsatisfiable();
        }
        return TargetResolution::resolved({*position});
    }

    // ACTIVE, or SOURCE without a source creature (trainer cards) falls back to the active
    const PlayerID player = resolve_player(target.player, context.source_player);
    if (!state.get_player(player).field.has_active()) {
        return TargetResolution::unsatisfiable();
    }
    return TargetResolution::resolved({FieldPosition{player, ACTIVE_POSITION}});
}

TargetResolution choose_from(std::vector<FieldPosition> candidates, PlayerID chooser) {
    if (candidates.empty()) {
        return TargetResolution::unsatisfiable();
    }
    if (candidates.size() == 1) {
        return TargetResolution::resolved(std::move(candidates));
    }
    return TargetResolution::requires_selection(chooser, std::move(candidates));
}

} // anonymous namespace

TargetResolution resolve_target(const GameState& state,
                                const CardRepository& repo,
                                const FieldTarget& target,
                                const EffectContext& context) {
    if (const auto* fixed = std::get_if<FixedTarget>(&target)) {
        return resolve_fixed(state, *fixed, context);
    }

    if (const auto* all = std::get_if<AllMatchingTarget>(&target)) {
        return TargetResolution::resolved(
            find_matching_positions(state, repo, all->criteria, context.source_player));
    }

    const auto& single = std::get<SingleChoiceTarget>(target);
    return choose_from(find_matching_positions(state, repo, single.criteria, context.source_player),
                       resolve_player(single.chooser, context.source_player));
}

TargetResolution resolve_energy_source(const GameState& state,
                                       const CardRepository& repo,
                                       const EnergySource& source,
                                       const EffectContext& context) {
    auto has_matching_energy = [&](const FieldPosition& pos) {
        const InstanceID& id = state.get_creature(pos).field_instance_id();
        if (source.energy_types.empty()) {
            return state.energy.total(id) > 0;
        }
        for (EnergyType type : source.energy_types) {
            if (state.energy.count(id, type) > 0) return true;
        }
        return false;
    };

    auto keep_with_energy = [&](std::vector<FieldPosition> positions) {
        positions.erase(std::remove_if(positions.begin(), positions.end(),
                                       [&](const FieldPosition& p) { return !has_matching_energy(p); }),
                        positions.end());
        return positions;
    };

    if (const auto* single = std::get_if<SingleChoiceTarget>(&source.field_target)) {
        auto candidates = keep_with_energy(
            find_matching_positions(state, repo, single->criteria, context.source_player));
        return choose_from(std::move(candidates),
                           resolve_player(single->chooser, context.source_player));
    }

    TargetResolution resolution = resolve_target(state, repo, source.field_target, context);
    if (!resolution.is_resolved()) {
        return resolution;
    }

    const bool fixed = std::holds_alternative<FixedTarget>(source.field_target);
    resolution.positions = keep_with_energy(std::move(resolution.positions));
    if (fixed && resolution.positions.empty()) {
        return TargetResolution::unsatisfiable();
    }
    return resolution;
}

bool is_target_available(const TargetResolution& resolution) {
    return resolution.status != ResolutionStatus::UNSATISFIABLE;
}

} // namespace effects
} // namespace cardbattle
