/**
 * Card Battle Engine - Effect Context
 *
 * Who is applying an effect and where it came from.
 */

#pragma once

#include "types.hpp"

namespace cardbattle {

enum class ContextType : uint8_t {
    ATTACK,
    ABILITY,
    TRAINER,    // Supporter / item
    TOOL
};

inline const char* to_string(ContextType type) {
    switch (type) {
        case ContextType::ATTACK: return "attack";
        case ContextType::ABILITY: return "ability";
        case ContextType::TRAINER: return "trainer";
        case ContextType::TOOL: return "tool";
        default: return "unknown";
    }
}

/**
 * EffectContext - Acting player and source of an effect.
 *
 * `source_instance_id` is the field instance id of the creature that owns
 * the attack, ability or tool. Player scopes in effect descriptors are
 * relative to `source_player`.
 */
struct EffectContext {
    ContextType type = ContextType::TRAINER;
    PlayerID source_player = 0;
    std::string effect_name;
    std::optional<InstanceID> source_instance_id;
    std::optional<TriggerKind> trigger;     // Set when enqueued by a trigger
};

} // namespace cardbattle
