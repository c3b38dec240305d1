/**
 * Card Battle Engine - Target Resolver
 *
 * Turns field target specifications into concrete field positions, or
 * reports that a player has to choose (REQUIRES_SELECTION), or that
 * nothing can be targeted (UNSATISFIABLE).
 *
 * Criteria matching is AND across every stated field. Player scopes are
 * relative to the context's acting player; an unset player means both.
 * Name-based criteria compare declared names, never templateIds.
 */

#pragma once

#include "../game_state.hpp"
#include "../card_repository.hpp"

namespace cardbattle {
namespace effects {

enum class ResolutionStatus : uint8_t {
    RESOLVED,
    REQUIRES_SELECTION,
    UNSATISFIABLE
};

inline const char* to_string(ResolutionStatus status) {
    switch (status) {
        case ResolutionStatus::RESOLVED: return "resolved";
        case ResolutionStatus::REQUIRES_SELECTION: return "requires-selection";
        case ResolutionStatus::UNSATISFIABLE: return "unsatisfiable";
        default: return "unknown";
    }
}

struct TargetResolution {
    ResolutionStatus status = ResolutionStatus::UNSATISFIABLE;
    std::vector<FieldPosition> positions;       // RESOLVED (may be empty for all-matching)
    PlayerID chooser = 0;                       // REQUIRES_SELECTION
    std::vector<FieldPosition> candidates;      // REQUIRES_SELECTION

    static TargetResolution resolved(std::vector<FieldPosition> positions) {
        TargetResolution r;
        r.status = ResolutionStatus::RESOLVED;
        r.positions = std::move(positions);
        return r;
    }

    static TargetResolution requires_selection(PlayerID chooser, std::vector<FieldPosition> candidates) {
        TargetResolution r;
        r.status = ResolutionStatus::REQUIRES_SELECTION;
        r.chooser = chooser;
        r.candidates = std::move(candidates);
        return r;
    }

    static TargetResolution unsatisfiable() {
        return TargetResolution{};
    }

    bool is_resolved() const { return status == ResolutionStatus::RESOLVED; }
};

// ============================================================================
// CRITERIA MATCHING
// ============================================================================

bool card_matches(const CardRepository& repo,
                  const TemplateID& template_id,
                  const CardCriteria& criteria);

bool creature_matches(const GameState& state,
                      const CardRepository& repo,
                      const FieldPosition& position,
                      const FieldCriteria& criteria,
                      PlayerID acting_player);

/**
 * Every occupied position matching the criteria, player 0 first,
 * then by field position ascending.
 */
std::vector<FieldPosition> find_matching_positions(const GameState& state,
                                                   const CardRepository& repo,
                                                   const FieldCriteria& criteria,
                                                   PlayerID acting_player);

// ============================================================================
// RESOLUTION
// ============================================================================

TargetResolution resolve_target(const GameState& state,
                                const CardRepository& repo,
                                const FieldTarget& target,
                                const EffectContext& context);

/**
 * Resolve an energy-transfer source. Positions without attached energy of
 * an accepted type are dropped from the result and from the candidates.
 */
TargetResolution resolve_energy_source(const GameState& state,
                                       const CardRepository& repo,
                                       const EnergySource& source,
                                       const EffectContext& context);

/**
 * Whether a resolution leaves the effect something to act on.
 * All-matching with an empty set still counts (the effect is a no-op).
 */
bool is_target_available(const TargetResolution& resolution);

} // namespace effects
} // namespace cardbattle
