/**
 * Card Battle Engine - Field Operations Implementation
 */

#include "effects/field_operations.hpp"
#include "effects/passive_effects.hpp"
#include <algorithm>

namespace cardbattle {
namespace effects {

int deal_damage(GameState& state,
                const CardRepository& repo,
                const FieldPosition& position,
                int amount,
                ApplyResult& result) {
    FieldCard& card = state.get_creature(position);
    const int max_hp = effective_max_hp(state, repo, position);
    const int remaining = std::max(0, max_hp - card.damage_taken);
    const int dealt = std::min(std::max(0, amount), remaining);

    if (dealt == 0) {
        return 0;
    }

    card.damage_taken += dealt;
    result.affected.push_back(position);
    result.events.push_back({TriggerKind::DAMAGED, position.player_id, card.field_instance_id(), std::nullopt});

    if (card.damage_taken >= max_hp) {
        result.knocked_out.push_back(card.field_instance_id());
        result.events.push_back({TriggerKind::BEFORE_KNOCKOUT, position.player_id,
                                 card.field_instance_id(), std::nullopt});
    }
    return dealt;
}

int heal_damage(GameState& state, const FieldPosition& position, int amount) {
    FieldCard& card = state.get_creature(position);
    const int healed = std::min(std::max(0, amount), card.damage_taken);
    card.damage_taken -= healed;
    return healed;
}

int draw_cards(GameState& state, PlayerID player_id, int count) {
    PlayerState& player = state.get_player(player_id);
    int drawn = 0;
    while (drawn < count && player.hand.count() < state.config.max_hand_size) {
        auto card = player.deck.draw_top();
        if (!card) break;
        player.hand.add_card(std::move(*card));
        drawn++;
    }
    return drawn;
}

void shuffle_hand_into_deck(GameState& state, PlayerID player_id) {
    PlayerState& player = state.get_player(player_id);
    for (auto& card : player.hand.cards) {
        player.deck.add_to_bottom(std::move(card));
    }
    player.hand.cards.clear();
    player.deck.shuffle(state.rng);
}

int discard_from_hand(GameState& state, PlayerID player_id, int count, bool shuffle_into_deck) {
    PlayerState& player = state.get_player(player_id);
    const int moved = std::min(std::max(0, count), player.hand.count());
    for (int i = 0; i < moved; i++) {
        CardRef card = std::move(player.hand.cards.front());
        player.hand.cards.erase(player.hand.cards.begin());
        if (shuffle_into_deck) {
            player.deck.add_to_bottom(std::move(card));
        } else {
            player.discard.add_card(std::move(card));
        }
    }
    if (shuffle_into_deck && moved > 0) {
        player.deck.shuffle(state.rng);
    }
    return moved;
}

bool discard_tool(GameState& state, const FieldPosition& position) {
    PlayerState& player = state.get_player(position.player_id);
    const InstanceID holder = state.get_creature(position).field_instance_id();
    auto it = player.tools.find(holder);
    if (it == player.tools.end()) {
        return false;
    }
    player.discard.add_card(std::move(it->second));
    player.tools.erase(it);
    clear_passives_for_instance(state, holder, EffectOrigin::TOOL);
    return true;
}

void return_to_owner(GameState& state, const FieldPosition& position, ZoneType destination) {
    PlayerState& player = state.get_player(position.player_id);
    Zone& zone = destination == ZoneType::DECK ? player.deck : player.hand;

    FieldCard removed = player.field.remove_at(position.field_index);
    const InstanceID holder = removed.field_instance_id();

    for (auto& entry : removed.evolution_stack) {
        zone.add_card({std::move(entry.instance_id), std::move(entry.template_id)});
    }
    auto tool = player.tools.find(holder);
    if (tool != player.tools.end()) {
        zone.add_card(std::move(tool->second));
        player.tools.erase(tool);
    }
    if (destination == ZoneType::DECK) {
        player.deck.shuffle(state.rng);
    }

    state.energy.discard_all(holder, position.player_id);
    clear_passives_for_instance(state, holder);

    if (position.field_index == ACTIVE_POSITION && !player.field.bench.empty()) {
        player.awaiting_promotion = true;
    }
}

void evolve_creature(GameState& state, const FieldPosition& position, CardRef card, ApplyResult& result) {
    FieldCard& target = state.get_creature(position);
    const InstanceID field_id = target.field_instance_id();

    target.evolve(std::move(card.instance_id), std::move(card.template_id), state.turn_number);

    // The previous form's ability no longer applies
    clear_passives_for_instance(state, field_id, EffectOrigin::ABILITY);

    TriggerEvent passive{TriggerKind::PASSIVE, position.player_id, field_id, std::nullopt, true};
    TriggerEvent on_play{TriggerKind::ON_PLAY, position.player_id, field_id, std::nullopt, true};
    result.affected.push_back(position);
    result.events.push_back(passive);
    result.events.push_back(on_play);
}

bool is_knocked_out(const GameState& state, const CardRepository& repo, const FieldPosition& position) {
    return state.get_creature(position).damage_taken >= effective_max_hp(state, repo, position);
}

} // namespace effects
} // namespace cardbattle
