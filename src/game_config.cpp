/**
 * Card Battle Engine - Game Configuration Implementation
 */

#include "game_config.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>

using json = nlohmann::json;

namespace cardbattle {

namespace {

bool apply_config(const json& data, GameConfig& config) {
    if (!data.is_object()) {
        std::cerr << "[GameConfig] Configuration must be a JSON object" << std::endl;
        return false;
    }

    GameConfig loaded = config;
    loaded.win_points = data.value("winPoints", loaded.win_points);
    loaded.max_bench_size = data.value("maxBenchSize", loaded.max_bench_size);
    loaded.max_hand_size = data.value("maxHandSize", loaded.max_hand_size);
    loaded.initial_hand_size = data.value("initialHandSize", loaded.initial_hand_size);
    loaded.max_resolution_steps = data.value("maxResolutionSteps", loaded.max_resolution_steps);

    const int starting = data.value("startingPlayer", static_cast<int>(loaded.starting_player));
    if (starting != 0 && starting != 1) {
        std::cerr << "[GameConfig] startingPlayer must be 0 or 1, got " << starting << std::endl;
        return false;
    }
    loaded.starting_player = static_cast<PlayerID>(starting);

    if (loaded.win_points <= 0 || loaded.max_bench_size < 0 || loaded.max_resolution_steps <= 0) {
        std::cerr << "[GameConfig] Rule values out of range" << std::endl;
        return false;
    }

    config = loaded;
    return true;
}

} // anonymous namespace

bool load_game_config(const std::string& filepath, GameConfig& config) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        std::cerr << "[GameConfig] Failed to open: " << filepath << std::endl;
        return false;
    }

    try {
        return apply_config(json::parse(file), config);
    } catch (const json::exception& e) {
        std::cerr << "[GameConfig] JSON error: " << e.what() << std::endl;
        return false;
    }
}

bool parse_game_config(const std::string& text, GameConfig& config) {
    try {
        return apply_config(json::parse(text), config);
    } catch (const json::exception& e) {
        std::cerr << "[GameConfig] JSON error: " << e.what() << std::endl;
        return false;
    }
}

} // namespace cardbattle
