/**
 * Card Battle Engine - Passive Effect Tracker Implementation
 */

#include "effects/passive_effects.hpp"
#include "effects/target_resolver.hpp"
#include <algorithm>

namespace cardbattle {
namespace effects {

// ============================================================================
// LIFECYCLE
// ============================================================================

std::string register_passive(GameState& state,
                             const EffectRef& ref,
                             EffectKind kind,
                             const EffectContext& context,
                             int amount,
                             DurationKind duration,
                             std::optional<InstanceID> bound_instance) {
    PassiveEffect passive;
    passive.id = "passive-effect-" + std::to_string(state.next_passive_effect_id++);
    passive.ref = ref;
    passive.kind = kind;
    passive.source_player = context.source_player;
    passive.effect_name = context.effect_name;
    passive.amount = amount;
    passive.duration = duration;
    passive.created_turn = state.turn_number;

    if (duration == DurationKind::WHILE_IN_PLAY) {
        passive.bound_instance = bound_instance ? bound_instance : context.source_instance_id;
    } else {
        passive.bound_instance = std::move(bound_instance);
    }

    state.passive_effects.push_back(passive);
    return passive.id;
}

int expire_passive_effects(GameState& state, int ending_turn) {
    auto& effects = state.passive_effects;
    const size_t before = effects.size();
    effects.erase(std::remove_if(effects.begin(), effects.end(),
                                 [ending_turn](const PassiveEffect& e) { return e.is_expired(ending_turn); }),
                  effects.end());
    return static_cast<int>(before - effects.size());
}

int clear_passives_for_instance(GameState& state, const InstanceID& field_instance_id) {
    auto& effects = state.passive_effects;
    const size_t before = effects.size();
    effects.erase(std::remove_if(effects.begin(), effects.end(),
                                 [&](const PassiveEffect& e) {
                                     return e.bound_instance && *e.bound_instance == field_instance_id;
                                 }),
                  effects.end());
    return static_cast<int>(before - effects.size());
}

int clear_passives_for_instance(GameState& state, const InstanceID& field_instance_id,
                                EffectOrigin origin) {
    auto& effects = state.passive_effects;
    const size_t before = effects.size();
    effects.erase(std::remove_if(effects.begin(), effects.end(),
                                 [&](const PassiveEffect& e) {
                                     return e.bound_instance && *e.bound_instance == field_instance_id &&
                                            e.ref.origin == origin;
                                 }),
                  effects.end());
    return static_cast<int>(before - effects.size());
}

// ============================================================================
// QUERIES
// ============================================================================

namespace {

template <typename T>
const T& descriptor(const CardRepository& repo, const PassiveEffect& passive) {
    return std::get<T>(repo.get_effect(passive.ref));
}

bool scope_includes(PlayerScope scope, PlayerID source_player, PlayerID player) {
    switch (scope) {
        case PlayerScope::SELF: return player == source_player;
        case PlayerScope::OPPONENT: return player != source_player;
        case PlayerScope::BOTH: return true;
    }
    return false;
}

// A bound effect with no criteria applies to its holder only. Otherwise
// criteria without a player fall back to the side the kind acts on.
bool applies_to(const GameState& state, const CardRepository& repo, const PassiveEffect& passive,
                const FieldCriteria& criteria, const FieldPosition& position, PlayerScope default_scope) {
    const bool unscoped = criteria.card.empty() && !criteria.player &&
                          criteria.position == PositionScope::ANY && !criteria.has_damage &&
                          criteria.has_energy.empty();
    if (unscoped && passive.bound_instance) {
        return state.get_creature(position).field_instance_id() == *passive.bound_instance;
    }
    if (!criteria.player) {
        FieldCriteria scoped = criteria;
        scoped.player = default_scope;
        return creature_matches(state, repo, position, scoped, passive.source_player);
    }
    return creature_matches(state, repo, position, criteria, passive.source_player);
}

} // anonymous namespace

int get_hp_bonus(const GameState& state, const CardRepository& repo, const FieldPosition& position) {
    int bonus = 0;
    for (const auto& passive : state.passive_effects) {
        if (passive.kind != EffectKind::HP_BONUS) continue;
        const auto& effect = descriptor<HpBonusEffect>(repo, passive);
        if (applies_to(state, repo, passive, effect.target, position, PlayerScope::SELF)) {
            bonus += passive.amount;
        }
    }
    return bonus;
}

int effective_max_hp(const GameState& state, const CardRepository& repo, const FieldPosition& position) {
    const FieldCard& card = state.get_creature(position);
    return repo.get_creature(card.template_id()).max_hp + get_hp_bonus(state, repo, position);
}

int get_damage_boost(const GameState& state, const CardRepository& repo, const FieldPosition& attacker) {
    int boost = 0;
    for (const auto& passive : state.passive_effects) {
        if (passive.kind != EffectKind::DAMAGE_BOOST || passive.source_player != attacker.player_id) continue;
        const auto& effect = descriptor<DamageBoostEffect>(repo, passive);
        if (creature_matches(state, repo, attacker, effect.damage_source, passive.source_player)) {
            boost += passive.amount;
        }
    }
    return boost;
}

bool is_attack_prevented(const GameState& state, const CardRepository& repo, const FieldPosition& attacker) {
    for (const auto& passive : state.passive_effects) {
        if (passive.kind != EffectKind::PREVENT_ATTACK) continue;
        const auto& effect = descriptor<PreventAttackEffect>(repo, passive);
        if (applies_to(state, repo, passive, effect.target, attacker, PlayerScope::OPPONENT)) {
            return true;
        }
    }
    return false;
}

bool is_energy_attachment_prevented(const GameState& state, const CardRepository& repo, PlayerID player) {
    for (const auto& passive : state.passive_effects) {
        if (passive.kind != EffectKind::PREVENT_ENERGY_ATTACHMENT) continue;
        const auto& effect = descriptor<PreventEnergyAttachmentEffect>(repo, passive);
        if (scope_includes(effect.target, passive.source_player, player)) {
            return true;
        }
    }
    return false;
}

bool is_card_category_prevented(const GameState& state, const CardRepository& repo,
                                PlayerID player, CardCategory category) {
    for (const auto& passive : state.passive_effects) {
        if (passive.kind != EffectKind::PREVENT_PLAYING) continue;
        const auto& effect = descriptor<PreventPlayingEffect>(repo, passive);
        if (!scope_includes(effect.target, passive.source_player, player)) continue;
        if (std::find(effect.categories.begin(), effect.categories.end(), category) != effect.categories.end()) {
            return true;
        }
    }
    return false;
}

int get_retreat_cost_modifier(const GameState& state, const CardRepository& repo,
                              const FieldPosition& position) {
    int modifier = 0;
    for (const auto& passive : state.passive_effects) {
        if (passive.kind == EffectKind::RETREAT_COST_INCREASE) {
            const auto& effect = descriptor<RetreatCostIncreaseEffect>(repo, passive);
            if (applies_to(state, repo, passive, effect.target, position, PlayerScope::OPPONENT)) {
                modifier += passive.amount;
            }
        } else if (passive.kind == EffectKind::RETREAT_COST_REDUCTION) {
            const auto& effect = descriptor<RetreatCostReductionEffect>(repo, passive);
            if (applies_to(state, repo, passive, effect.target, position, PlayerScope::SELF)) {
                modifier -= passive.amount;
            }
        }
    }
    return modifier;
}

bool is_retreat_prevented(const GameState& state, const CardRepository& repo,
                          const FieldPosition& position) {
    for (const auto& passive : state.passive_effects) {
        if (passive.kind != EffectKind::RETREAT_PREVENTION) continue;
        const auto& effect = descriptor<RetreatPreventionEffect>(repo, passive);
        if (applies_to(state, repo, passive, effect.target, position, PlayerScope::OPPONENT)) {
            return true;
        }
    }
    return false;
}

bool allows_flexible_evolution(const GameState& state, const CardRepository& repo, PlayerID player,
                               const std::string& evolution_name, const std::string& base_name) {
    for (const auto& passive : state.passive_effects) {
        if (passive.kind != EffectKind::EVOLUTION_FLEXIBILITY || passive.source_player != player) continue;
        const auto& effect = descriptor<EvolutionFlexibilityEffect>(repo, passive);
        if (effect.target == evolution_name && effect.base_form == base_name) {
            return true;
        }
    }
    return false;
}

int get_damage_reduction(const GameState& state, const CardRepository& repo,
                         const FieldPosition& attacker, const FieldPosition& defender) {
    int reduction = 0;
    for (const auto& passive : state.passive_effects) {
        if (passive.kind != EffectKind::DAMAGE_REDUCTION) continue;
        const auto& effect = descriptor<DamageReductionEffect>(repo, passive);
        if (applies_to(state, repo, passive, effect.target, defender, PlayerScope::SELF) &&
            creature_matches(state, repo, attacker, effect.damage_source, passive.source_player)) {
            reduction += passive.amount;
        }
    }
    return reduction;
}

bool is_damage_prevented(const GameState& state, const CardRepository& repo,
                         const FieldPosition& attacker, const FieldPosition& defender) {
    for (const auto& passive : state.passive_effects) {
        if (passive.kind != EffectKind::PREVENT_DAMAGE) continue;
        const auto& effect = descriptor<PreventDamageEffect>(repo, passive);
        if (applies_to(state, repo, passive, effect.target, defender, PlayerScope::SELF) &&
            creature_matches(state, repo, attacker, effect.damage_source, passive.source_player)) {
            return true;
        }
    }
    return false;
}

bool is_weakness_disabled(const GameState& state, const CardRepository& repo, const FieldPosition& defender) {
    for (const auto& passive : state.passive_effects) {
        if (passive.kind != EffectKind::DISABLE_WEAKNESS) continue;
        const auto& effect = descriptor<DisableWeaknessEffect>(repo, passive);
        if (applies_to(state, repo, passive, effect.target, defender, PlayerScope::SELF)) {
            return true;
        }
    }
    return false;
}

int get_attack_cost_modifier(const GameState& state, const CardRepository& repo,
                             const FieldPosition& attacker) {
    int modifier = 0;
    for (const auto& passive : state.passive_effects) {
        if (passive.kind != EffectKind::ATTACK_ENERGY_COST_MODIFIER) continue;
        const auto& effect = descriptor<AttackEnergyCostModifierEffect>(repo, passive);
        const PlayerScope side = effect.reduce ? PlayerScope::SELF : PlayerScope::OPPONENT;
        if (applies_to(state, repo, passive, effect.target, attacker, side)) {
            modifier += passive.amount;
        }
    }
    return modifier;
}

bool is_status_prevented(const GameState& state, const CardRepository& repo,
                         const FieldPosition& position, StatusCondition condition) {
    for (const auto& passive : state.passive_effects) {
        if (passive.kind != EffectKind::STATUS_PREVENTION) continue;
        const auto& effect = descriptor<StatusPreventionEffect>(repo, passive);
        if (!effect.conditions.empty() &&
            std::find(effect.conditions.begin(), effect.conditions.end(), condition) == effect.conditions.end()) {
            continue;
        }
        if (applies_to(state, repo, passive, effect.target, position, PlayerScope::SELF)) {
            return true;
        }
    }
    return false;
}

} // namespace effects
} // namespace cardbattle
