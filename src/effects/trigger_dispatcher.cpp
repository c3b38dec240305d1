/**
 * Card Battle Engine - Trigger Dispatcher Implementation
 */

#include "effects/trigger_dispatcher.hpp"

namespace cardbattle {
namespace effects {

bool trigger_matches(const GameState& state, const Trigger& trigger,
                     const TriggerEvent& event, PlayerID owner) {
    if (trigger.kind != event.kind) {
        return false;
    }

    switch (trigger.kind) {
        case TriggerKind::ENERGY_ATTACHMENT:
            return !trigger.energy_type || trigger.energy_type == event.energy_type;

        case TriggerKind::ON_PLAY:
            return !(trigger.filter_evolution && event.from_evolution);

        case TriggerKind::END_OF_TURN:
        case TriggerKind::START_OF_TURN:
        case TriggerKind::ON_CHECKUP:
            if (trigger.own_turn_only && owner != state.current_player) return false;
            if (trigger.first_turn_only && state.turn_number != 1) return false;
            return true;

        default:
            return true;
    }
}

EffectContext ability_context(const CardRepository& repo, const FieldCard& card,
                              PlayerID owner, std::optional<TriggerKind> trigger) {
    const CreatureData& creature = repo.get_creature(card.template_id());

    EffectContext context;
    context.type = ContextType::ABILITY;
    context.source_player = owner;
    context.effect_name = creature.name + "'s " + (creature.ability ? creature.ability->name : "ability");
    context.source_instance_id = card.field_instance_id();
    context.trigger = trigger;
    return context;
}

EffectContext tool_context(const CardRepository& repo, const TemplateID& tool_template,
                           const FieldCard& holder, PlayerID owner, TriggerKind trigger) {
    EffectContext context;
    context.type = ContextType::TOOL;
    context.source_player = owner;
    context.effect_name = repo.get_tool(tool_template).name;
    context.source_instance_id = holder.field_instance_id();
    context.trigger = trigger;
    return context;
}

int enqueue_ability_trigger(GameState& state, const CardRepository& repo,
                            const EffectQueue& queue, const FieldPosition& position,
                            const TriggerEvent& event) {
    const FieldCard& card = state.get_creature(position);
    const CreatureData& creature = repo.get_creature(card.template_id());
    if (!creature.ability || !trigger_matches(state, creature.ability->trigger, event, position.player_id)) {
        return 0;
    }

    EffectContext context = ability_context(repo, card, position.player_id, event.kind);
    return queue.enqueue_group(state, creature.template_id, EffectOrigin::ABILITY, 0, context);
}

int enqueue_tool_trigger(GameState& state, const CardRepository& repo,
                         const EffectQueue& queue, const FieldPosition& position,
                         const TriggerEvent& event) {
    const FieldCard& card = state.get_creature(position);
    const CardRef* tool = state.get_player(position.player_id).get_tool(card.field_instance_id());
    if (!tool) {
        return 0;
    }

    const ToolData& data = repo.get_tool(tool->template_id);
    if (!trigger_matches(state, data.trigger, event, position.player_id)) {
        return 0;
    }

    EffectContext context = tool_context(repo, data.template_id, card, position.player_id, event.kind);
    return queue.enqueue_group(state, data.template_id, EffectOrigin::TOOL, 0, context);
}

int dispatch_event(GameState& state, const CardRepository& repo,
                   const EffectQueue& queue, const TriggerEvent& event) {
    auto position = state.find_creature(event.field_instance_id);
    if (!position) {
        return 0;
    }

    int queued = enqueue_ability_trigger(state, repo, queue, *position, event);
    if (!event.from_evolution) {
        // An attached tool stays registered across evolution
        queued += enqueue_tool_trigger(state, repo, queue, *position, event);
    }
    return queued;
}

int dispatch_turn_trigger(GameState& state, const CardRepository& repo,
                          const EffectQueue& queue, TriggerKind kind) {
    int queued = 0;
    const PlayerID order[2] = {state.current_player, opponent_of(state.current_player)};

    for (PlayerID player : order) {
        for (int index : state.get_player(player).field.occupied_positions()) {
            const FieldPosition position{player, index};
            TriggerEvent event;
            event.kind = kind;
            event.player_id = player;
            event.field_instance_id = state.get_creature(position).field_instance_id();

            queued += enqueue_ability_trigger(state, repo, queue, position, event);
            queued += enqueue_tool_trigger(state, repo, queue, position, event);
        }
    }
    return queued;
}

} // namespace effects
} // namespace cardbattle
