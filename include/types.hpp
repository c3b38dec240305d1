/**
 * Card Battle Engine - Core Type Definitions
 *
 * This file defines all enums and basic types used throughout the engine.
 * String spellings match the card-data JSON format.
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <unordered_set>
#include <unordered_map>
#include <optional>
#include <memory>

namespace cardbattle {

// ============================================================================
// ENUMS
// ============================================================================

// Declaration order is the tie-break order for "any energy type" selection.
enum class EnergyType : uint8_t {
    FIRE,
    WATER,
    GRASS,
    LIGHTNING,
    PSYCHIC,
    FIGHTING,
    DARKNESS,
    METAL,
    COLORLESS   // Costs only, never attached
};

enum class StatusCondition : uint8_t {
    SLEEP,
    BURN,
    CONFUSION,
    PARALYSIS,
    POISON
};

enum class CardCategory : uint8_t {
    CREATURE,
    SUPPORTER,
    ITEM,
    TOOL
};

enum class GameResult : uint8_t {
    ONGOING,
    PLAYER_0_WIN,
    PLAYER_1_WIN,
    DRAW
};

enum class ActionType : uint8_t {
    PLAY_CARD,
    ATTACH_ENERGY,
    EVOLVE,
    RETREAT,
    ATTACK,
    USE_ABILITY,
    SELECT_TARGET,
    PROMOTE_ACTIVE,
    END_TURN
};

enum class ZoneType : uint8_t {
    HAND,
    DECK,
    DISCARD,
    FIELD
};

// Player scope relative to the acting player of an effect.
enum class PlayerScope : uint8_t {
    SELF,
    OPPONENT,
    BOTH
};

enum class PositionScope : uint8_t {
    ANY,
    ACTIVE,
    BENCH
};

enum class EffectKind : uint8_t {
    HP,
    STATUS,
    STATUS_RECOVERY,
    DRAW,
    ENERGY,
    ENERGY_TRANSFER,
    SWITCH,
    SHUFFLE,
    DAMAGE_BOOST,
    HP_BONUS,
    PREVENT_ATTACK,
    PREVENT_ENERGY_ATTACHMENT,
    PREVENT_PLAYING,
    RETREAT_COST_INCREASE,
    RETREAT_COST_REDUCTION,
    RETREAT_PREVENTION,
    EVOLUTION_FLEXIBILITY,
    DAMAGE_REDUCTION,
    PREVENT_DAMAGE,
    DISABLE_WEAKNESS,
    ATTACK_ENERGY_COST_MODIFIER,
    STATUS_PREVENTION,
    HAND_DISCARD,
    SEARCH,
    SWAP_CARDS,
    TOOL_DISCARD,
    REMOVE_FIELD_CARD,
    EVOLUTION_ACCELERATION,
    PULL_EVOLUTION
};

enum class TriggerKind : uint8_t {
    MANUAL,
    END_OF_TURN,
    START_OF_TURN,
    ON_CHECKUP,
    DAMAGED,
    ENERGY_ATTACHMENT,
    ON_PLAY,
    BEFORE_KNOCKOUT,
    ON_RETREAT,
    PASSIVE
};

enum class DurationKind : uint8_t {
    UNTIL_END_OF_TURN,
    UNTIL_END_OF_NEXT_TURN,
    WHILE_IN_PLAY
};

// ============================================================================
// TYPE ALIASES
// ============================================================================

using InstanceID = std::string;       // Unique physical copy (e.g., "ember-fox-0-3")
using TemplateID = std::string;       // Card data ID (e.g., "ember-fox")
using PlayerID = uint8_t;             // 0 or 1
using EnergyCost = std::vector<EnergyType>;

// ============================================================================
// CONSTANTS
// ============================================================================

constexpr int ACTIVE_POSITION = 0;
constexpr int ENERGY_TRANSFER_ALL = 999;
constexpr int ATTACHABLE_ENERGY_TYPES = 8;

inline PlayerID opponent_of(PlayerID player) {
    return static_cast<PlayerID>(1 - player);
}

// ============================================================================
// UTILITY FUNCTIONS
// ============================================================================

inline const char* to_string(EnergyType type) {
    switch (type) {
        case EnergyType::FIRE: return "fire";
        case EnergyType::WATER: return "water";
        case EnergyType::GRASS: return "grass";
        case EnergyType::LIGHTNING: return "lightning";
        case EnergyType::PSYCHIC: return "psychic";
        case EnergyType::FIGHTING: return "fighting";
        case EnergyType::DARKNESS: return "darkness";
        case EnergyType::METAL: return "metal";
        case EnergyType::COLORLESS: return "colorless";
        default: return "unknown";
    }
}

inline const char* to_string(StatusCondition status) {
    switch (status) {
        case StatusCondition::SLEEP: return "sleep";
        case StatusCondition::BURN: return "burn";
        case StatusCondition::CONFUSION: return "confusion";
        case StatusCondition::PARALYSIS: return "paralysis";
        case StatusCondition::POISON: return "poison";
        default: return "unknown";
    }
}

inline const char* to_string(CardCategory category) {
    switch (category) {
        case CardCategory::CREATURE: return "creature";
        case CardCategory::SUPPORTER: return "supporter";
        case CardCategory::ITEM: return "item";
        case CardCategory::TOOL: return "tool";
        default: return "unknown";
    }
}

inline const char* to_string(GameResult result) {
    switch (result) {
        case GameResult::ONGOING: return "ongoing";
        case GameResult::PLAYER_0_WIN: return "player_0_win";
        case GameResult::PLAYER_1_WIN: return "player_1_win";
        case GameResult::DRAW: return "draw";
        default: return "unknown";
    }
}

inline const char* to_string(ZoneType zone) {
    switch (zone) {
        case ZoneType::HAND: return "hand";
        case ZoneType::DECK: return "deck";
        case ZoneType::DISCARD: return "discard";
        case ZoneType::FIELD: return "field";
        default: return "unknown";
    }
}

inline const char* to_string(PlayerScope scope) {
    switch (scope) {
        case PlayerScope::SELF: return "self";
        case PlayerScope::OPPONENT: return "opponent";
        case PlayerScope::BOTH: return "both";
        default: return "unknown";
    }
}

inline const char* to_string(EffectKind kind) {
    switch (kind) {
        case EffectKind::HP: return "hp";
        case EffectKind::STATUS: return "status";
        case EffectKind::STATUS_RECOVERY: return "status-recovery";
        case EffectKind::DRAW: return "draw";
        case EffectKind::ENERGY: return "energy";
        case EffectKind::ENERGY_TRANSFER: return "energy-transfer";
        case EffectKind::SWITCH: return "switch";
        case EffectKind::SHUFFLE: return "shuffle";
        case EffectKind::DAMAGE_BOOST: return "damage-boost";
        case EffectKind::HP_BONUS: return "hp-bonus";
        case EffectKind::PREVENT_ATTACK: return "prevent-attack";
        case EffectKind::PREVENT_ENERGY_ATTACHMENT: return "prevent-energy-attachment";
        case EffectKind::PREVENT_PLAYING: return "prevent-playing";
        case EffectKind::RETREAT_COST_INCREASE: return "retreat-cost-increase";
        case EffectKind::RETREAT_COST_REDUCTION: return "retreat-cost-reduction";
        case EffectKind::RETREAT_PREVENTION: return "retreat-prevention";
        case EffectKind::EVOLUTION_FLEXIBILITY: return "evolution-flexibility";
        case EffectKind::DAMAGE_REDUCTION: return "damage-reduction";
        case EffectKind::PREVENT_DAMAGE: return "prevent-damage";
        case EffectKind::DISABLE_WEAKNESS: return "disable-weakness";
        case EffectKind::ATTACK_ENERGY_COST_MODIFIER: return "attack-energy-cost-modifier";
        case EffectKind::STATUS_PREVENTION: return "status-prevention";
        case EffectKind::HAND_DISCARD: return "hand-discard";
        case EffectKind::SEARCH: return "search";
        case EffectKind::SWAP_CARDS: return "swap-cards";
        case EffectKind::TOOL_DISCARD: return "tool-discard";
        case EffectKind::REMOVE_FIELD_CARD: return "remove-field-card";
        case EffectKind::EVOLUTION_ACCELERATION: return "evolution-acceleration";
        case EffectKind::PULL_EVOLUTION: return "pull-evolution";
        default: return "unknown";
    }
}

inline const char* to_string(TriggerKind kind) {
    switch (kind) {
        case TriggerKind::MANUAL: return "manual";
        case TriggerKind::END_OF_TURN: return "end-of-turn";
        case TriggerKind::START_OF_TURN: return "start-of-turn";
        case TriggerKind::ON_CHECKUP: return "on-checkup";
        case TriggerKind::DAMAGED: return "damaged";
        case TriggerKind::ENERGY_ATTACHMENT: return "energy-attachment";
        case TriggerKind::ON_PLAY: return "on-play";
        case TriggerKind::BEFORE_KNOCKOUT: return "before-knockout";
        case TriggerKind::ON_RETREAT: return "on-retreat";
        case TriggerKind::PASSIVE: return "passive";
        default: return "unknown";
    }
}

inline const char* to_string(DurationKind kind) {
    switch (kind) {
        case DurationKind::UNTIL_END_OF_TURN: return "until-end-of-turn";
        case DurationKind::UNTIL_END_OF_NEXT_TURN: return "until-end-of-next-turn";
        case DurationKind::WHILE_IN_PLAY: return "while-in-play";
        default: return "unknown";
    }
}

inline const char* to_string(ActionType type) {
    switch (type) {
        case ActionType::PLAY_CARD: return "PLAY_CARD";
        case ActionType::ATTACH_ENERGY: return "ATTACH_ENERGY";
        case ActionType::EVOLVE: return "EVOLVE";
        case ActionType::RETREAT: return "RETREAT";
        case ActionType::ATTACK: return "ATTACK";
        case ActionType::USE_ABILITY: return "USE_ABILITY";
        case ActionType::SELECT_TARGET: return "SELECT_TARGET";
        case ActionType::PROMOTE_ACTIVE: return "PROMOTE_ACTIVE";
        case ActionType::END_TURN: return "END_TURN";
        default: return "UNKNOWN";
    }
}

} // namespace cardbattle
