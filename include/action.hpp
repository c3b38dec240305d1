/**
 * Card Battle Engine - Action Representation
 *
 * Decoded intent of one player message, applied by BattleEngine::step().
 */

#pragma once

#include "types.hpp"

namespace cardbattle {

/**
 * Action - A single game action.
 *
 * `card_id` names a card in the acting player's hand, `position` a field
 * position of the acting player, `choice_index` an index into the pending
 * selection's candidates.
 */
struct Action {
    ActionType action_type = ActionType::END_TURN;
    PlayerID player_id = 0;

    std::optional<InstanceID> card_id;
    std::optional<int> position;
    std::optional<int> attack_index;
    std::optional<int> choice_index;

    // ========================================================================
    // CONSTRUCTORS
    // ========================================================================

    Action() = default;

    Action(ActionType type, PlayerID player)
        : action_type(type)
        , player_id(player)
    {}

    // ========================================================================
    // FACTORY METHODS
    // ========================================================================

    static Action end_turn(PlayerID player) {
        return Action(ActionType::END_TURN, player);
    }

    // Creature to the bench, supporter or item; tools also need a position
    static Action play_card(PlayerID player, const InstanceID& card,
                            std::optional<int> position = std::nullopt) {
        Action a(ActionType::PLAY_CARD, player);
        a.card_id = card;
        a.position = position;
        return a;
    }

    static Action attach_energy(PlayerID player, int position) {
        Action a(ActionType::ATTACH_ENERGY, player);
        a.position = position;
        return a;
    }

    static Action evolve(PlayerID player, const InstanceID& card, int position) {
        Action a(ActionType::EVOLVE, player);
        a.card_id = card;
        a.position = position;
        return a;
    }

    static Action retreat(PlayerID player, int bench_position) {
        Action a(ActionType::RETREAT, player);
        a.position = bench_position;
        return a;
    }

    static Action attack(PlayerID player, int attack_index) {
        Action a(ActionType::ATTACK, player);
        a.attack_index = attack_index;
        return a;
    }

    static Action use_ability(PlayerID player, int position) {
        Action a(ActionType::USE_ABILITY, player);
        a.position = position;
        return a;
    }

    static Action select_target(PlayerID player, int choice_index) {
        Action a(ActionType::SELECT_TARGET, player);
        a.choice_index = choice_index;
        return a;
    }

    static Action promote_active(PlayerID player, int bench_position) {
        Action a(ActionType::PROMOTE_ACTIVE, player);
        a.position = bench_position;
        return a;
    }

    // ========================================================================
    // DISPLAY
    // ========================================================================

    std::string to_string() const {
        std::string label = cardbattle::to_string(action_type);
        label += " p" + std::to_string(player_id);
        if (card_id) label += " card=" + *card_id;
        if (position) label += " pos=" + std::to_string(*position);
        if (attack_index) label += " attack=" + std::to_string(*attack_index);
        if (choice_index) label += " choice=" + std::to_string(*choice_index);
        return label;
    }
};

} // namespace cardbattle
