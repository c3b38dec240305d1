/**
 * Card Battle Engine - Effect Queue
 *
 * FIFO resolution loop over queued effects. The queue itself and the
 * suspended selection live in GameState, so a suspended game can be
 * cloned or serialized and resumed later.
 *
 * Per effect: resolve source, resolve target, apply. Either resolution
 * step can suspend into GameState::pending_selection; the queue then
 * freezes until resume_with_selection() supplies the missing choice.
 * Events reported by a handler enqueue trigger effects at the back of
 * the queue, so trigger chains finish before drain() reports IDLE.
 */

#pragma once

#include "effect_handler.hpp"

namespace cardbattle {
namespace effects {

enum class DrainStatus : uint8_t {
    IDLE,
    AWAITING_SELECTION
};

inline const char* to_string(DrainStatus status) {
    return status == DrainStatus::IDLE ? "idle" : "awaiting-selection";
}

// Observer for every applied effect (used by the X-Ray logger)
using AppliedEffectListener = std::function<void(
    const QueuedEffect&,
    const Effect&,
    const ApplyResult&
)>;

class EffectQueue {
public:
    EffectQueue(const CardRepository& repo, const EffectRegistry& registry);

    /**
     * Queue every effect of one effect group (a card, an attack, an
     * ability or a tool) in declared order. Returns the number queued.
     */
    int enqueue_group(GameState& state,
                      const TemplateID& template_id,
                      EffectOrigin origin,
                      int group_index,
                      const EffectContext& context) const;

    void enqueue(GameState& state, const EffectRef& ref, const EffectContext& context) const;

    /**
     * Resolve queued effects until the queue is empty or a selection is needed.
     *
     * Throws std::runtime_error when more than config.max_resolution_steps
     * effects are processed in one call.
     */
    DrainStatus drain(GameState& state) const;

    /**
     * Fill the pending selection with candidates[choice_index] and put the
     * effect back at the front of the queue. An index outside the candidate
     * list returns false and leaves the pending selection intact.
     * Call drain() afterwards.
     */
    bool resume_with_selection(GameState& state, int choice_index) const;

    bool resume_with_position(GameState& state, const FieldPosition& position) const;

    void set_listener(AppliedEffectListener listener) { listener_ = std::move(listener); }

private:
    // Returns false when the effect suspended on a selection
    bool process(GameState& state, QueuedEffect queued) const;

    const CardRepository& repo_;
    const EffectRegistry& registry_;
    AppliedEffectListener listener_;
};

} // namespace effects
} // namespace cardbattle
