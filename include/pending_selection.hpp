/**
 * Card Battle Engine - Queued Effects and Pending Selection
 *
 * Serializable resolution state: effects waiting in the queue and the one
 * effect suspended on a player's choice.
 */

#pragma once

#include "effect_context.hpp"
#include "effect_types.hpp"
#include <nlohmann/json_fwd.hpp>

namespace cardbattle {

struct FieldPosition {
    PlayerID player_id = 0;
    int field_index = 0;

    bool operator==(const FieldPosition& other) const {
        return player_id == other.player_id && field_index == other.field_index;
    }
    bool operator!=(const FieldPosition& other) const { return !(*this == other); }
};

enum class TargetRole : uint8_t {
    SOURCE,     // Energy-transfer source
    TARGET
};

inline const char* to_string(TargetRole role) {
    return role == TargetRole::SOURCE ? "source" : "target";
}

/**
 * ResolvedSlots - Positions already fixed for an effect, by a player's
 * choice or by auto-resolution. A resumed effect skips resolved roles.
 */
struct ResolvedSlots {
    std::optional<std::vector<FieldPosition>> source;
    std::optional<std::vector<FieldPosition>> target;
};

/**
 * QueuedEffect - One entry of the FIFO effect queue.
 */
struct QueuedEffect {
    EffectRef ref;
    EffectContext context;
    ResolvedSlots slots;
};

/**
 * PendingSelection - The effect suspended on a player's choice.
 *
 * At most one exists at a time. The queue does not advance until a
 * selection from `candidates` arrives.
 */
struct PendingSelection {
    QueuedEffect effect;
    TargetRole role = TargetRole::TARGET;
    PlayerID chooser = 0;
    std::vector<FieldPosition> candidates;

    bool is_candidate(const FieldPosition& position) const {
        for (const auto& c : candidates) {
            if (c == position) return true;
        }
        return false;
    }
};

// ============================================================================
// JSON SERIALIZATION
// ============================================================================

void to_json(nlohmann::json& j, const FieldPosition& p);
void from_json(const nlohmann::json& j, FieldPosition& p);

void to_json(nlohmann::json& j, const EffectRef& ref);
void from_json(const nlohmann::json& j, EffectRef& ref);

void to_json(nlohmann::json& j, const EffectContext& ctx);
void from_json(const nlohmann::json& j, EffectContext& ctx);

void to_json(nlohmann::json& j, const QueuedEffect& q);
void from_json(const nlohmann::json& j, QueuedEffect& q);

void to_json(nlohmann::json& j, const PendingSelection& s);
void from_json(const nlohmann::json& j, PendingSelection& s);

} // namespace cardbattle
