/**
 * Card Battle Engine - Passive Effect
 *
 * A registered, duration-scoped modifier (prevent-attack, retreat cost
 * changes, damage boosts, ...) consulted by legality and damage checks.
 */

#pragma once

#include "effect_types.hpp"

namespace cardbattle {

struct PassiveEffect {
    std::string id;                         // "passive-effect-N"
    EffectRef ref;                          // Descriptor in the CardRepository
    EffectKind kind = EffectKind::DAMAGE_BOOST;
    PlayerID source_player = 0;
    std::string effect_name;
    int amount = 0;                         // Evaluated at registration
    DurationKind duration = DurationKind::UNTIL_END_OF_TURN;
    int created_turn = 0;

    // Creature the effect is bound to; WHILE_IN_PLAY effects end when it leaves play
    std::optional<InstanceID> bound_instance;

    /**
     * Whether the effect lapses when `ending_turn` ends.
     */
    bool is_expired(int ending_turn) const {
        switch (duration) {
            case DurationKind::UNTIL_END_OF_TURN:
                return created_turn <= ending_turn;
            case DurationKind::UNTIL_END_OF_NEXT_TURN:
                return created_turn + 1 <= ending_turn;
            case DurationKind::WHILE_IN_PLAY:
            default:
                return false;
        }
    }
};

} // namespace cardbattle
