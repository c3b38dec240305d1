/**
 * Card Battle Engine - Effect Descriptors
 *
 * Declarative card-effect data: amounts, criteria, targets, durations,
 * triggers and the closed set of effect kinds. Descriptors are immutable
 * once loaded and are owned by the CardRepository.
 */

#pragma once

#include "types.hpp"
#include <map>
#include <variant>

namespace cardbattle {

// ============================================================================
// CRITERIA
// ============================================================================

/**
 * CardCriteria - Static-data filter for a creature card.
 *
 * Evolution matching is by name, so reprints with a different templateId
 * match the same criteria.
 */
struct CardCriteria {
    std::vector<std::string> names;
    std::optional<int> stage;                       // 0 = basic, 1, 2
    std::optional<std::string> previous_stage_name;
    std::optional<EnergyType> is_type;
    std::optional<bool> ex;
    std::optional<bool> mega;
    std::optional<bool> ultra_beast;

    bool empty() const {
        return names.empty() && !stage && !previous_stage_name && !is_type &&
               !ex && !mega && !ultra_beast;
    }
};

/**
 * FieldCriteria - Filter over creatures on the field.
 *
 * Every stated field must match (AND). Unset fields impose no constraint.
 * `player` is relative to the acting player; unset means both players.
 */
struct FieldCriteria {
    std::optional<PlayerScope> player;
    PositionScope position = PositionScope::ANY;
    std::optional<bool> has_damage;
    std::map<EnergyType, int> has_energy;           // type -> minimum attached
    CardCriteria card;
};

// ============================================================================
// AMOUNTS
// ============================================================================

struct AmountSpec;

struct ConstantAmount {
    int value = 0;
};

enum class ContextSource : uint8_t {
    HAND_SIZE,
    CURRENT_POINTS,
    POINTS_TO_WIN
};

struct PlayerContextAmount {
    ContextSource source = ContextSource::HAND_SIZE;
    PlayerScope player_context = PlayerScope::SELF;
};

enum class CountType : uint8_t {
    FIELD,      // creatures matching criteria
    CARD,       // cards in a zone
    ENERGY,     // attached energy on matching creatures
    DAMAGE      // damage taken by matching creatures
};

struct CountAmount {
    CountType count_type = CountType::FIELD;
    FieldCriteria criteria;                         // FIELD, ENERGY, DAMAGE
    PlayerScope player = PlayerScope::SELF;         // CARD
    ZoneType location = ZoneType::HAND;             // CARD
    std::vector<EnergyType> energy_types;           // ENERGY, empty = all
};

struct AdditionAmount {
    std::vector<AmountSpec> values;
};

struct MultiplicationAmount {
    std::shared_ptr<const AmountSpec> base;
    std::shared_ptr<const AmountSpec> multiplier;
};

/**
 * AmountSpec - Recursive numeric expression evaluated by the ValueResolver.
 */
struct AmountSpec {
    using Value = std::variant<
        ConstantAmount,
        PlayerContextAmount,
        CountAmount,
        AdditionAmount,
        MultiplicationAmount
    >;

    Value value;

    AmountSpec() : value(ConstantAmount{}) {}
    AmountSpec(ConstantAmount v) : value(std::move(v)) {}
    AmountSpec(PlayerContextAmount v) : value(std::move(v)) {}
    AmountSpec(CountAmount v) : value(std::move(v)) {}
    AmountSpec(AdditionAmount v) : value(std::move(v)) {}
    AmountSpec(MultiplicationAmount v) : value(std::move(v)) {}
};

// ============================================================================
// TARGETS
// ============================================================================

enum class FixedPosition : uint8_t {
    ACTIVE,
    SOURCE      // Creature that owns the ability/attack/trigger
};

struct FixedTarget {
    PlayerScope player = PlayerScope::SELF;
    FixedPosition position = FixedPosition::ACTIVE;
};

struct AllMatchingTarget {
    FieldCriteria criteria;
};

struct SingleChoiceTarget {
    PlayerScope chooser = PlayerScope::SELF;
    FieldCriteria criteria;
};

using FieldTarget = std::variant<FixedTarget, AllMatchingTarget, SingleChoiceTarget>;

/**
 * EnergySource - Source side of an energy transfer.
 *
 * `count` is capped to what is attached; ENERGY_TRANSFER_ALL moves everything.
 */
struct EnergySource {
    FieldTarget field_target;
    std::vector<EnergyType> energy_types;   // empty = any type
    int count = 1;
};

// ============================================================================
// TRIGGERS
// ============================================================================

struct Trigger {
    TriggerKind kind = TriggerKind::MANUAL;
    bool unlimited = false;                  // MANUAL
    bool own_turn_only = false;              // END_OF_TURN, START_OF_TURN, ON_CHECKUP
    bool first_turn_only = false;            // END_OF_TURN, START_OF_TURN, ON_CHECKUP
    std::optional<EnergyType> energy_type;   // ENERGY_ATTACHMENT
    bool filter_evolution = false;           // ON_PLAY
};

// ============================================================================
// EFFECTS
// ============================================================================

enum class HpOperation : uint8_t {
    HEAL,
    DAMAGE
};

enum class EnergyOperation : uint8_t {
    ATTACH,
    DISCARD
};

struct HpEffect {
    AmountSpec amount;
    FieldTarget target;
    HpOperation operation = HpOperation::DAMAGE;
};

struct StatusEffect {
    StatusCondition condition = StatusCondition::POISON;
    FieldTarget target;
};

struct StatusRecoveryEffect {
    FieldTarget target;
    std::vector<StatusCondition> conditions;    // empty = all
};

struct DrawEffect {
    AmountSpec amount;
    PlayerScope player = PlayerScope::SELF;
};

struct EnergyEffect {
    EnergyOperation operation = EnergyOperation::ATTACH;
    std::vector<EnergyType> energy_types;       // attach uses the first, discard walks in order
    AmountSpec amount;
    FieldTarget target;
};

struct EnergyTransferEffect {
    EnergySource source;
    FieldTarget target;
};

// Chosen creature swaps places with its owner's active creature.
struct SwitchEffect {
    FieldTarget target;
};

struct ShuffleEffect {
    PlayerScope target = PlayerScope::SELF;
    bool shuffle_hand = true;
    std::optional<AmountSpec> draw_after;
};

// Boosts attacks by the registering player's creatures matching `damage_source`
struct DamageBoostEffect {
    AmountSpec amount;
    FieldCriteria damage_source;
    DurationKind duration = DurationKind::UNTIL_END_OF_TURN;
};

struct HpBonusEffect {
    AmountSpec amount;
    FieldCriteria target;
    DurationKind duration = DurationKind::WHILE_IN_PLAY;
};

struct PreventAttackEffect {
    FieldCriteria target;
    DurationKind duration = DurationKind::UNTIL_END_OF_NEXT_TURN;
};

struct PreventEnergyAttachmentEffect {
    PlayerScope target = PlayerScope::OPPONENT;
    DurationKind duration = DurationKind::UNTIL_END_OF_NEXT_TURN;
};

struct PreventPlayingEffect {
    std::vector<CardCategory> categories;
    PlayerScope target = PlayerScope::OPPONENT;
    DurationKind duration = DurationKind::UNTIL_END_OF_NEXT_TURN;
};

struct RetreatCostIncreaseEffect {
    AmountSpec amount;
    FieldCriteria target;
    DurationKind duration = DurationKind::UNTIL_END_OF_NEXT_TURN;
};

struct RetreatCostReductionEffect {
    AmountSpec amount;
    FieldCriteria target;
    DurationKind duration = DurationKind::UNTIL_END_OF_TURN;
};

struct RetreatPreventionEffect {
    FieldCriteria target;
    DurationKind duration = DurationKind::UNTIL_END_OF_NEXT_TURN;
};

// `target` evolution name may evolve from the `base_form` creature name.
struct EvolutionFlexibilityEffect {
    std::string target;
    std::string base_form;
    DurationKind duration = DurationKind::UNTIL_END_OF_TURN;
};

// Subtracted from attacks on the registering player's creatures matching `target`
struct DamageReductionEffect {
    AmountSpec amount;
    FieldCriteria damage_source;
    FieldCriteria target;
    DurationKind duration = DurationKind::UNTIL_END_OF_NEXT_TURN;
};

struct PreventDamageEffect {
    FieldCriteria target;
    FieldCriteria damage_source;
    DurationKind duration = DurationKind::UNTIL_END_OF_NEXT_TURN;
};

struct DisableWeaknessEffect {
    FieldCriteria target;
    DurationKind duration = DurationKind::UNTIL_END_OF_NEXT_TURN;
};

// Adds Colorless requirements, or removes `amount` requirements when `reduce` is set
struct AttackEnergyCostModifierEffect {
    AmountSpec amount;
    bool reduce = false;
    FieldCriteria target;
    DurationKind duration = DurationKind::UNTIL_END_OF_NEXT_TURN;
};

struct StatusPreventionEffect {
    FieldCriteria target;
    std::vector<StatusCondition> conditions;    // empty = all
    DurationKind duration = DurationKind::WHILE_IN_PLAY;
};

struct HandDiscardEffect {
    AmountSpec amount;
    PlayerScope target = PlayerScope::SELF;
    bool shuffle_into_deck = false;
};

// Moves up to `amount` matching cards from a zone to the hand
struct SearchEffect {
    PlayerScope player = PlayerScope::SELF;
    ZoneType location = ZoneType::DECK;
    std::vector<CardCategory> categories;       // empty = any category
    CardCriteria card;                          // creatures only when set
    AmountSpec amount;
};

struct SwapCardsEffect {
    AmountSpec discard_amount;
    AmountSpec draw_amount;
    std::optional<int> max_drawn;
    PlayerScope target = PlayerScope::SELF;
};

struct ToolDiscardEffect {
    FieldTarget target;
};

// Returns a creature with its whole stack and tool to the owner's hand or deck
struct RemoveFieldCardEffect {
    FieldTarget target;
    ZoneType destination = ZoneType::HAND;
};

// A basic evolves straight from hand into the form `skip_stages` past its next stage
struct EvolutionAccelerationEffect {
    FieldTarget target;
    int skip_stages = 1;
};

// Evolves the target into a matching card found in its owner's deck
struct PullEvolutionEffect {
    FieldTarget target;
    CardCriteria card;
};

/**
 * Effect - Tagged union over the closed set of effect kinds.
 *
 * Alternative order matches EffectKind so that effect_kind() is an index cast.
 */
using Effect = std::variant<
    HpEffect,
    StatusEffect,
    StatusRecoveryEffect,
    DrawEffect,
    EnergyEffect,
    EnergyTransferEffect,
    SwitchEffect,
    ShuffleEffect,
    DamageBoostEffect,
    HpBonusEffect,
    PreventAttackEffect,
    PreventEnergyAttachmentEffect,
    PreventPlayingEffect,
    RetreatCostIncreaseEffect,
    RetreatCostReductionEffect,
    RetreatPreventionEffect,
    EvolutionFlexibilityEffect,
    DamageReductionEffect,
    PreventDamageEffect,
    DisableWeaknessEffect,
    AttackEnergyCostModifierEffect,
    StatusPreventionEffect,
    HandDiscardEffect,
    SearchEffect,
    SwapCardsEffect,
    ToolDiscardEffect,
    RemoveFieldCardEffect,
    EvolutionAccelerationEffect,
    PullEvolutionEffect
>;

static_assert(std::variant_size_v<Effect> ==
              static_cast<size_t>(EffectKind::PULL_EVOLUTION) + 1,
              "Effect alternatives must mirror EffectKind");

inline EffectKind effect_kind(const Effect& effect) {
    return static_cast<EffectKind>(effect.index());
}

// ============================================================================
// EFFECT REFERENCES
// ============================================================================

enum class EffectOrigin : uint8_t {
    CARD,       // Supporter / item effects
    ATTACK,     // group_index = attack index
    ABILITY,
    TOOL
};

inline const char* to_string(EffectOrigin origin) {
    switch (origin) {
        case EffectOrigin::CARD: return "card";
        case EffectOrigin::ATTACK: return "attack";
        case EffectOrigin::ABILITY: return "ability";
        case EffectOrigin::TOOL: return "tool";
        default: return "unknown";
    }
}

/**
 * EffectRef - Serializable pointer to a descriptor inside the CardRepository.
 *
 * Queued and suspended effects carry a reference instead of a copy.
 */
struct EffectRef {
    TemplateID template_id;
    EffectOrigin origin = EffectOrigin::CARD;
    int group_index = 0;
    int effect_index = 0;

    bool operator==(const EffectRef& other) const {
        return template_id == other.template_id && origin == other.origin &&
               group_index == other.group_index && effect_index == other.effect_index;
    }
};

} // namespace cardbattle
