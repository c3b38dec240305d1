/**
 * Card Battle Engine - Player State
 *
 * Represents a single player's zones, field, attached tools and flags.
 */

#pragma once

#include "zone.hpp"
#include "field.hpp"

namespace cardbattle {

/**
 * PlayerState - Complete state for one player.
 */
struct PlayerState {
    PlayerID player_id = 0;

    // Zones
    Zone deck;
    Zone hand;
    Zone discard;

    // Field
    Field field;

    // Attached tools, keyed by the holder's field instance id (one per creature)
    std::unordered_map<InstanceID, CardRef> tools;

    int points = 0;

    // Turn Flags - reset each turn
    bool supporter_played_this_turn = false;
    bool energy_attached_this_turn = false;
    bool retreated_this_turn = false;

    // Set when the active creature was knocked out and a bench creature must be promoted
    bool awaiting_promotion = false;

    // ========================================================================
    // CONSTRUCTORS
    // ========================================================================

    PlayerState() = default;

    explicit PlayerState(PlayerID id) : player_id(id) {}

    // ========================================================================
    // TURN MANAGEMENT
    // ========================================================================

    void reset_turn_flags() {
        supporter_played_this_turn = false;
        energy_attached_this_turn = false;
        retreated_this_turn = false;

        for (int pos : field.occupied_positions()) {
            field.at(pos).ability_used_this_turn = false;
        }
    }

    // ========================================================================
    // QUERIES
    // ========================================================================

    const CardRef* get_tool(const InstanceID& field_instance_id) const {
        auto it = tools.find(field_instance_id);
        return it != tools.end() ? &it->second : nullptr;
    }

    /**
     * Every physical card this player owns: hand, deck, discard, evolution
     * stacks and attached tools. Sorted, so two snapshots compare directly.
     */
    std::vector<InstanceID> collect_instance_ids() const {
        std::vector<InstanceID> ids;
        for (const auto* zone : {&hand, &deck, &discard}) {
            for (const auto& card : zone->cards) {
                ids.push_back(card.instance_id);
            }
        }
        for (int pos : field.occupied_positions()) {
            for (const auto& entry : field.at(pos).evolution_stack) {
                ids.push_back(entry.instance_id);
            }
        }
        for (const auto& [holder, tool] : tools) {
            ids.push_back(tool.instance_id);
        }
        std::sort(ids.begin(), ids.end());
        return ids;
    }
};

} // namespace cardbattle
