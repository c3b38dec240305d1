/**
 * Card Battle Engine - Game Configuration
 *
 * Rule constants that vary between formats, loadable from JSON.
 */

#pragma once

#include "types.hpp"

namespace cardbattle {

struct GameConfig {
    int win_points = 3;
    int max_bench_size = 3;
    int max_hand_size = 10;
    int initial_hand_size = 5;

    // Upper bound on queue steps per drain; stops runaway trigger chains
    int max_resolution_steps = 1000;

    PlayerID starting_player = 0;
};

/**
 * Load a configuration from a JSON object with camelCase keys
 * (winPoints, maxBenchSize, maxHandSize, initialHandSize,
 * maxResolutionSteps, startingPlayer). Missing keys keep their defaults.
 *
 * Returns false on I/O or parse failure; `config` is left unchanged.
 */
bool load_game_config(const std::string& filepath, GameConfig& config);

/**
 * Same as load_game_config, from an in-memory document.
 */
bool parse_game_config(const std::string& text, GameConfig& config);

} // namespace cardbattle
