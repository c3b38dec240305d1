/**
 * Card Battle Engine - X-Ray Logger
 *
 * Complete game state visibility for debugging.
 * Logs all game state including hidden zones (hands, decks, discard),
 * every applied effect and every suspended selection.
 * Shows instance ids so exact card movement can be tracked.
 */

#pragma once

#include "game_state.hpp"
#include "action.hpp"
#include "effects/effect_handler.hpp"
#include <string>
#include <fstream>

namespace cardbattle {

class CardRepository;

/**
 * XRayLogger - Complete game state visibility for debugging.
 *
 * Attach to an engine with BattleEngine::set_logger(). A logger whose file
 * could not be opened stays disabled and every call is a no-op.
 */
class XRayLogger {
public:
    /**
     * Constructor - creates a timestamped log file.
     *
     * @param repo Optional card repository for resolving card names
     * @param output_dir Directory for log files (created if missing)
     */
    explicit XRayLogger(const CardRepository* repo = nullptr,
                        const std::string& output_dir = "xrays");

    ~XRayLogger();

    void set_card_repository(const CardRepository* repo);

    /**
     * Log an action header.
     */
    void log_action(const GameState& state, const Action& action);

    /**
     * Log whether the last action was accepted.
     */
    void log_result(bool success, const std::string& message);

    /**
     * Log one applied effect: name, kind, amount applied, targets.
     */
    void log_effect(const QueuedEffect& queued, const Effect& effect, const effects::ApplyResult& result);

    void log_pending_selection(const PendingSelection& pending);

    /**
     * Log complete game state snapshot (including hidden zones).
     */
    void log_state(const GameState& state);

    /**
     * Log game end result.
     *
     * @param winner Winning player ID (nullopt if draw)
     * @param reason Reason for game end
     */
    void log_game_end(std::optional<PlayerID> winner, const std::string& reason);

    const std::string& get_log_path() const { return log_path_; }

    bool is_enabled() const { return enabled_; }

    void set_enabled(bool enabled) { enabled_ = enabled; }

private:
    std::string log_path_;
    std::ofstream log_file_;
    const CardRepository* repo_ = nullptr;
    bool enabled_ = true;

    bool can_write() const { return enabled_ && log_file_.is_open(); }

    /**
     * Format card as "CardName (instance_id)".
     */
    std::string fmt_card(const InstanceID& instance_id, const TemplateID& template_id) const;

    static std::string fmt_position(const FieldPosition& position);

    static std::string fmt_energy(const EnergyCounts& counts);

    /**
     * Format a creature line with HP, status, energy and tool.
     * Format: "ACTIVE:  Ember Fox (ember-fox-0-3) | HP: 40/60 | Status: [...] | Energy: {...} | Tool: ..."
     */
    std::string format_creature_line(const GameState& state, const PlayerState& player,
                                     const FieldCard& card, const std::string& label) const;

    void write_zone(const std::string& label, const Zone& zone);
};

} // namespace cardbattle
