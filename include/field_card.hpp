/**
 * Card Battle Engine - Field Card
 *
 * A creature occupying a field position, with its evolution stack and
 * mutable runtime state. Copied whenever the game state is cloned.
 */

#pragma once

#include "types.hpp"

namespace cardbattle {

/**
 * EvolutionEntry - One physical card merged into a field position.
 */
struct EvolutionEntry {
    InstanceID instance_id;
    TemplateID template_id;
};

/**
 * FieldCard - A creature in play.
 *
 * The evolution stack holds every card merged into this position, base form
 * first. The base form's instance id identifies the position for energy and
 * tool bookkeeping and stays stable across evolution.
 */
struct FieldCard {
    std::vector<EvolutionEntry> evolution_stack;
    int damage_taken = 0;

    // Status conditions (bit flags)
    uint8_t status_flags = 0;
    static constexpr uint8_t STATUS_ASLEEP    = 1 << 0;
    static constexpr uint8_t STATUS_BURNED    = 1 << 1;
    static constexpr uint8_t STATUS_CONFUSED  = 1 << 2;
    static constexpr uint8_t STATUS_PARALYZED = 1 << 3;
    static constexpr uint8_t STATUS_POISONED  = 1 << 4;

    // Temporal state
    int turn_played = 0;
    int turn_last_evolved = -1;
    bool ability_used_this_turn = false;

    // ========================================================================
    // CONSTRUCTORS
    // ========================================================================

    FieldCard() = default;

    FieldCard(InstanceID instance_id, TemplateID template_id, int turn)
        : turn_played(turn)
    {
        evolution_stack.push_back({std::move(instance_id), std::move(template_id)});
    }

    // ========================================================================
    // IDENTITY
    // ========================================================================

    const InstanceID& field_instance_id() const {
        return evolution_stack.front().instance_id;
    }

    // Current (top) form
    const InstanceID& instance_id() const {
        return evolution_stack.back().instance_id;
    }

    const TemplateID& template_id() const {
        return evolution_stack.back().template_id;
    }

    void evolve(InstanceID instance_id, TemplateID template_id, int turn) {
        evolution_stack.push_back({std::move(instance_id), std::move(template_id)});
        turn_last_evolved = turn;
        clear_all_status();
    }

    // ========================================================================
    // STATUS CONDITION HELPERS
    // ========================================================================

    static uint8_t status_bit(StatusCondition status) {
        switch (status) {
            case StatusCondition::SLEEP:     return STATUS_ASLEEP;
            case StatusCondition::BURN:      return STATUS_BURNED;
            case StatusCondition::CONFUSION: return STATUS_CONFUSED;
            case StatusCondition::PARALYSIS: return STATUS_PARALYZED;
            case StatusCondition::POISON:    return STATUS_POISONED;
            default: return 0;
        }
    }

    bool has_status(StatusCondition status) const {
        return (status_flags & status_bit(status)) != 0;
    }

    // Sleep, paralysis and confusion replace each other; poison and burn stack.
    void add_status(StatusCondition status) {
        if (status == StatusCondition::SLEEP || status == StatusCondition::PARALYSIS ||
            status == StatusCondition::CONFUSION) {
            status_flags &= ~(STATUS_ASLEEP | STATUS_PARALYZED | STATUS_CONFUSED);
        }
        status_flags |= status_bit(status);
    }

    void remove_status(StatusCondition status) {
        status_flags &= ~status_bit(status);
    }

    void clear_all_status() {
        status_flags = 0;
    }

    bool is_asleep_or_paralyzed() const {
        return (status_flags & (STATUS_ASLEEP | STATUS_PARALYZED)) != 0;
    }
};

} // namespace cardbattle
