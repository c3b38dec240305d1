/**
 * Card Battle Engine - C++ Implementation
 *
 * Effect-resolution engine for a two-player creature card battle game.
 * Card effects are data; the engine resolves them through a FIFO queue
 * that can pause on a player's target selection.
 *
 * Include this header to get access to the complete engine API.
 */

#pragma once

// Core types
#include "types.hpp"
#include "effect_types.hpp"

// Data structures
#include "zone.hpp"
#include "field.hpp"
#include "player_state.hpp"
#include "action.hpp"
#include "pending_selection.hpp"
#include "game_state.hpp"
#include "game_config.hpp"

// Card data
#include "card_repository.hpp"
#include "cards/effect_builders.hpp"

// Effect resolution
#include "effects/value_resolver.hpp"
#include "effects/target_resolver.hpp"
#include "effects/field_operations.hpp"
#include "effects/effect_queue.hpp"
#include "effects/trigger_dispatcher.hpp"
#include "effects/handlers.hpp"
#include "effects/passive_effects.hpp"

// Engine
#include "engine.hpp"
#include "xray_logger.hpp"

#define CARDBATTLE_VERSION_MAJOR 1
#define CARDBATTLE_VERSION_MINOR 0
#define CARDBATTLE_VERSION_PATCH 0

namespace cardbattle {

/**
 * Version information.
 */
constexpr int VERSION_MAJOR = CARDBATTLE_VERSION_MAJOR;
constexpr int VERSION_MINOR = CARDBATTLE_VERSION_MINOR;
constexpr int VERSION_PATCH = CARDBATTLE_VERSION_PATCH;

inline std::string get_version() {
    return std::to_string(VERSION_MAJOR) + "." +
           std::to_string(VERSION_MINOR) + "." +
           std::to_string(VERSION_PATCH);
}

} // namespace cardbattle
