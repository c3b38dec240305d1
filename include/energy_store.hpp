/**
 * Card Battle Engine - Energy Store
 *
 * Energy attached to field creatures (keyed by field instance id), the
 * per-player discarded-energy ledger, and per-turn energy generation state.
 */

#pragma once

#include "types.hpp"
#include <algorithm>
#include <array>
#include <map>

namespace cardbattle {

// Ordered by EnergyType so iteration follows declaration order
using EnergyCounts = std::map<EnergyType, int>;

inline int total_energy(const EnergyCounts& counts) {
    int total = 0;
    for (const auto& [type, count] : counts) {
        total += count;
    }
    return total;
}

struct EnergyStore {
    std::unordered_map<InstanceID, EnergyCounts> attached;
    std::array<EnergyCounts, 2> discarded;

    // Generated energy waiting to be attached this turn
    std::array<std::optional<EnergyType>, 2> current_energy;
    std::array<std::vector<EnergyType>, 2> available_types;

    // ========================================================================
    // QUERIES
    // ========================================================================

    int count(const InstanceID& field_instance_id, EnergyType type) const {
        auto it = attached.find(field_instance_id);
        if (it == attached.end()) return 0;
        auto type_it = it->second.find(type);
        return type_it != it->second.end() ? type_it->second : 0;
    }

    int total(const InstanceID& field_instance_id) const {
        auto it = attached.find(field_instance_id);
        return it != attached.end() ? total_energy(it->second) : 0;
    }

    EnergyCounts get_attached(const InstanceID& field_instance_id) const {
        auto it = attached.find(field_instance_id);
        return it != attached.end() ? it->second : EnergyCounts{};
    }

    int discarded_count(PlayerID player, EnergyType type) const {
        auto it = discarded[player].find(type);
        return it != discarded[player].end() ? it->second : 0;
    }

    // ========================================================================
    // MUTATION
    // ========================================================================

    void attach(const InstanceID& field_instance_id, EnergyType type, int amount) {
        if (amount <= 0) return;
        attached[field_instance_id][type] += amount;
    }

    // Discard up to `amount` of one type into the player's ledger; returns the amount removed
    int discard(const InstanceID& field_instance_id, PlayerID player, EnergyType type, int amount) {
        const int removed = std::min(amount, count(field_instance_id, type));
        if (removed <= 0) return 0;
        remove(field_instance_id, type, removed);
        discarded[player][type] += removed;
        return removed;
    }

    // Move up to `amount` of one type between creatures; returns the amount moved
    int transfer(const InstanceID& from, const InstanceID& to, EnergyType type, int amount) {
        const int moved = std::min(amount, count(from, type));
        if (moved <= 0) return 0;
        remove(from, type, moved);
        attached[to][type] += moved;
        return moved;
    }

    // Knockout: everything attached goes to the ledger with per-type counts intact
    void discard_all(const InstanceID& field_instance_id, PlayerID player) {
        auto it = attached.find(field_instance_id);
        if (it == attached.end()) return;
        for (const auto& [type, count] : it->second) {
            discarded[player][type] += count;
        }
        attached.erase(it);
    }

private:
    void remove(const InstanceID& field_instance_id, EnergyType type, int amount) {
        auto& counts = attached[field_instance_id];
        counts[type] -= amount;
        if (counts[type] <= 0) counts.erase(type);
        if (counts.empty()) attached.erase(field_instance_id);
    }
};

} // namespace cardbattle
