/**
 * Card Battle Engine - X-Ray Logger Implementation
 */

#include "xray_logger.hpp"
#include "card_repository.hpp"
#include <algorithm>
#include <filesystem>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <iostream>

namespace cardbattle {

namespace {

std::string timestamp(const char* format) {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm tm = *std::localtime(&time_t);

    std::ostringstream out;
    out << std::put_time(&tm, format);
    return out.str();
}

} // anonymous namespace

XRayLogger::XRayLogger(const CardRepository* repo, const std::string& output_dir)
    : repo_(repo) {

    std::error_code ec;
    std::filesystem::create_directories(output_dir, ec);
    if (ec) {
        std::cerr << "[X-Ray Logger] Cannot create " << output_dir << ": " << ec.message() << std::endl;
    }

    log_path_ = output_dir + "/xray_game_" + timestamp("%Y%m%d_%H%M%S") + ".log";

    log_file_.open(log_path_);
    if (!log_file_.is_open()) {
        std::cerr << "[X-Ray Logger] Failed to open log file: " << log_path_ << std::endl;
        enabled_ = false;
        return;
    }

    log_file_ << std::string(80, '=') << "\n";
    log_file_ << "X-RAY GAME LOG - EFFECT RESOLUTION TRACE\n";
    log_file_ << "Started: " << timestamp("%Y-%m-%d %H:%M:%S") << "\n";
    log_file_ << std::string(80, '=') << "\n\n";
    log_file_.flush();

    std::cout << "[X-Ray Logger] Logging to: " << log_path_ << std::endl;
}

XRayLogger::~XRayLogger() {
    if (log_file_.is_open()) {
        log_file_.close();
    }
}

void XRayLogger::set_card_repository(const CardRepository* repo) {
    repo_ = repo;
}

// ============================================================================
// FORMATTING
// ============================================================================

std::string XRayLogger::fmt_card(const InstanceID& instance_id, const TemplateID& template_id) const {
    std::string name = template_id;
    if (repo_) {
        if (const CardData* card = repo_->get_card(template_id)) {
            name = name_of(*card);
        }
    }
    return name + " (" + instance_id + ")";
}

std::string XRayLogger::fmt_position(const FieldPosition& position) {
    return "P" + std::to_string(position.player_id) + ":" +
           (position.field_index == ACTIVE_POSITION ? std::string("active")
                                                    : "bench" + std::to_string(position.field_index));
}

std::string XRayLogger::fmt_energy(const EnergyCounts& counts) {
    std::ostringstream out;
    out << "{";
    bool first = true;
    for (const auto& [type, count] : counts) {
        if (!first) out << ", ";
        out << to_string(type) << ": " << count;
        first = false;
    }
    out << "}";
    return out.str();
}

std::string XRayLogger::format_creature_line(const GameState& state, const PlayerState& player,
                                             const FieldCard& card, const std::string& label) const {
    std::ostringstream line;
    line << label << ":  " << fmt_card(card.instance_id(), card.template_id());

    if (card.evolution_stack.size() > 1) {
        line << " [stack " << card.evolution_stack.size() << "]";
    }

    if (repo_ && repo_->has_card(card.template_id())) {
        const int max_hp = repo_->get_creature(card.template_id()).max_hp;
        line << " | HP: " << std::max(0, max_hp - card.damage_taken) << "/" << max_hp;
    }
    line << " | Damage: " << card.damage_taken;

    line << " | Status: [";
    bool first = true;
    for (int s = 0; s <= static_cast<int>(StatusCondition::POISON); s++) {
        const auto status = static_cast<StatusCondition>(s);
        if (!card.has_status(status)) continue;
        if (!first) line << ", ";
        line << to_string(status);
        first = false;
    }
    line << "]";

    line << " | Energy: " << fmt_energy(state.energy.get_attached(card.field_instance_id()));

    if (const CardRef* tool = player.get_tool(card.field_instance_id())) {
        line << " | Tool: " << fmt_card(tool->instance_id, tool->template_id);
    }
    return line.str();
}

void XRayLogger::write_zone(const std::string& label, const Zone& zone) {
    log_file_ << label << " (" << zone.count() << "): [";
    for (size_t i = 0; i < zone.cards.size(); i++) {
        if (i > 0) log_file_ << ", ";
        log_file_ << fmt_card(zone.cards[i].instance_id, zone.cards[i].template_id);
    }
    log_file_ << "]\n";
}

// ============================================================================
// LOGGING
// ============================================================================

void XRayLogger::log_action(const GameState& state, const Action& action) {
    if (!can_write()) return;

    log_file_ << std::string(80, '#') << "\n";
    log_file_ << "[TURN " << state.turn_number << " | PLAYER: P" << static_cast<int>(action.player_id)
              << "] ACTION: " << action.to_string() << "\n";
    log_file_ << std::string(80, '#') << "\n\n";

    log_file_.flush();
}

void XRayLogger::log_result(bool success, const std::string& message) {
    if (!can_write()) return;

    log_file_ << (success ? "  OK: " : "  REJECTED: ") << message << "\n\n";
    log_file_.flush();
}

void XRayLogger::log_effect(const QueuedEffect& queued, const Effect& effect, const effects::ApplyResult& result) {
    if (!can_write()) return;

    log_file_ << "  EFFECT: " << queued.context.effect_name
              << " [" << to_string(effect_kind(effect)) << "]"
              << " amount=" << result.amount_applied;

    if (!result.affected.empty()) {
        log_file_ << " targets=[";
        for (size_t i = 0; i < result.affected.size(); i++) {
            if (i > 0) log_file_ << ", ";
            log_file_ << fmt_position(result.affected[i]);
        }
        log_file_ << "]";
    }
    if (!result.knocked_out.empty()) {
        log_file_ << " knockouts=" << result.knocked_out.size();
    }
    if (!result.message.empty()) {
        log_file_ << " (" << result.message << ")";
    }
    log_file_ << "\n";

    log_file_.flush();
}

void XRayLogger::log_pending_selection(const PendingSelection& pending) {
    if (!can_write()) return;

    log_file_ << "  AWAITING: P" << static_cast<int>(pending.chooser) << " selects "
              << to_string(pending.role) << " for " << pending.effect.context.effect_name << " from [";
    for (size_t i = 0; i < pending.candidates.size(); i++) {
        if (i > 0) log_file_ << ", ";
        log_file_ << i << "=" << fmt_position(pending.candidates[i]);
    }
    log_file_ << "]\n\n";

    log_file_.flush();
}

void XRayLogger::log_state(const GameState& state) {
    if (!can_write()) return;

    log_file_ << std::string(80, '=') << "\n";

    for (const auto& player : state.players) {
        log_file_ << "[PLAYER " << static_cast<int>(player.player_id) << "] Points: " << player.points;
        if (player.awaiting_promotion) {
            log_file_ << " (awaiting promotion)";
        }
        log_file_ << "\n";

        if (player.field.has_active()) {
            log_file_ << format_creature_line(state, player, *player.field.active_spot, "ACTIVE") << "\n";
        } else {
            log_file_ << "ACTIVE:  (Empty)\n";
        }
        for (size_t i = 0; i < player.field.bench.size(); i++) {
            log_file_ << format_creature_line(state, player, player.field.bench[i],
                                              "BENCH " + std::to_string(i + 1)) << "\n";
        }

        write_zone("HAND", player.hand);
        write_zone("DECK", player.deck);
        write_zone("DISCARD", player.discard);

        log_file_ << "DISCARDED ENERGY: " << fmt_energy(state.energy.discarded[player.player_id]) << "\n";
        const auto& current = state.energy.current_energy[player.player_id];
        log_file_ << "CURRENT ENERGY: " << (current ? to_string(*current) : "(none)") << "\n\n";
    }

    log_file_ << "[GLOBAL]\n";
    log_file_ << "Turn: " << state.turn_number
              << " | Current Player: P" << static_cast<int>(state.current_player)
              << " | Stage: " << to_string(state.turn_stage)
              << " | Actions: " << state.executed_actions << "\n";

    if (!state.passive_effects.empty()) {
        log_file_ << "Passive Effects:\n";
        for (const auto& passive : state.passive_effects) {
            log_file_ << "  " << passive.id << " " << to_string(passive.kind)
                      << " amount=" << passive.amount
                      << " from P" << static_cast<int>(passive.source_player)
                      << " (" << passive.effect_name << ", " << to_string(passive.duration)
                      << ", turn " << passive.created_turn << ")";
            if (passive.bound_instance) {
                log_file_ << " bound=" << *passive.bound_instance;
            }
            log_file_ << "\n";
        }
    }

    if (!state.effect_queue.empty()) {
        log_file_ << "Effect Queue: " << state.effect_queue.size() << " effect(s) pending\n";
    }

    log_file_ << std::string(80, '=') << "\n\n";

    log_file_.flush();
}

void XRayLogger::log_game_end(std::optional<PlayerID> winner, const std::string& reason) {
    if (!can_write()) return;

    log_file_ << "\n" << std::string(80, '=') << "\n";
    log_file_ << "GAME END\n";
    log_file_ << std::string(80, '=') << "\n";

    if (winner.has_value()) {
        log_file_ << "Winner: Player " << static_cast<int>(*winner) << "\n";
    } else {
        log_file_ << "Result: Draw\n";
    }

    log_file_ << "Reason: " << reason << "\n";
    log_file_ << "Ended: " << timestamp("%Y-%m-%d %H:%M:%S") << "\n";
    log_file_ << std::string(80, '=') << "\n";

    log_file_.flush();
}

} // namespace cardbattle
