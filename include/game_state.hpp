/**
 * Card Battle Engine - Game State
 *
 * The root state object representing the complete game snapshot.
 * One instance per game; every controller and handler mutates it by reference.
 */

#pragma once

#include "player_state.hpp"
#include "energy_store.hpp"
#include "passive_effect.hpp"
#include "pending_selection.hpp"
#include "game_config.hpp"
#include <array>
#include <deque>
#include <random>

namespace cardbattle {

// Where a turn transition stands; MAIN outside a transition
enum class TurnStage : uint8_t {
    MAIN,
    END_OF_TURN,    // End-of-turn triggers queued
    CHECKUP,        // Checkup done, on-checkup triggers queued
    START_OF_TURN   // Next turn begun, start-of-turn triggers queued
};

inline const char* to_string(TurnStage stage) {
    switch (stage) {
        case TurnStage::MAIN: return "main";
        case TurnStage::END_OF_TURN: return "end-of-turn";
        case TurnStage::CHECKUP: return "checkup";
        case TurnStage::START_OF_TURN: return "start-of-turn";
        default: return "unknown";
    }
}

/**
 * GameState - The complete game snapshot.
 *
 * Cloned before every engine action so a failed action can be rolled back.
 */
struct GameState {
    // Players (always exactly 2)
    std::array<PlayerState, 2> players;

    // Turn tracking
    int turn_number = 1;
    PlayerID current_player = 0;
    TurnStage turn_stage = TurnStage::MAIN;

    // Energy bookkeeping for both players
    EnergyStore energy;

    // Duration-scoped modifiers
    std::vector<PassiveEffect> passive_effects;
    int next_passive_effect_id = 1;

    // Game result
    GameResult result = GameResult::ONGOING;
    std::optional<PlayerID> winner_id;

    // Rules in force for this game
    GameConfig config;

    // RNG for game randomness (mutable since it changes state when used)
    mutable std::mt19937 rng;

    // Resolution queue (FIFO) and the suspended effect, if any
    std::deque<QueuedEffect> effect_queue;
    std::optional<PendingSelection> pending_selection;

    // An attack ends the turn once its effects finish resolving
    bool end_turn_after_resolution = false;

    int executed_actions = 0;

    // ========================================================================
    // CONSTRUCTORS
    // ========================================================================

    GameState() {
        players[0] = PlayerState(0);
        players[1] = PlayerState(1);
    }

    // ========================================================================
    // PLAYER ACCESS
    // ========================================================================

    PlayerState& get_player(PlayerID id) {
        if (id > 1) {
            throw std::out_of_range("Invalid player id: " + std::to_string(id));
        }
        return players[id];
    }

    const PlayerState& get_player(PlayerID id) const {
        if (id > 1) {
            throw std::out_of_range("Invalid player id: " + std::to_string(id));
        }
        return players[id];
    }

    PlayerState& get_current_player() { return players[current_player]; }
    const PlayerState& get_current_player() const { return players[current_player]; }

    PlayerState& get_opponent() { return players[opponent_of(current_player)]; }
    const PlayerState& get_opponent() const { return players[opponent_of(current_player)]; }

    FieldCard& get_creature(const FieldPosition& position) {
        return get_player(position.player_id).field.at(position.field_index);
    }

    const FieldCard& get_creature(const FieldPosition& position) const {
        return get_player(position.player_id).field.at(position.field_index);
    }

    // Locate a creature by field instance id
    std::optional<FieldPosition> find_creature(const InstanceID& field_instance_id) const {
        for (PlayerID p = 0; p < 2; p++) {
            int pos = players[p].field.find_position(field_instance_id);
            if (pos >= 0) {
                return FieldPosition{p, pos};
            }
        }
        return std::nullopt;
    }

    // ========================================================================
    // GAME STATUS
    // ========================================================================

    bool is_game_over() const {
        return result != GameResult::ONGOING;
    }

    bool is_awaiting_selection() const {
        return pending_selection.has_value();
    }

    bool is_awaiting_promotion() const {
        return players[0].awaiting_promotion || players[1].awaiting_promotion;
    }

    // ========================================================================
    // CLONING
    // ========================================================================

    // Every member is a value type, so a member-wise copy is a deep snapshot
    GameState clone() const {
        return *this;
    }
};

} // namespace cardbattle
