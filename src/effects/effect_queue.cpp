/**
 * Card Battle Engine - Effect Queue Implementation
 */

#include "effects/effect_queue.hpp"
#include "effects/trigger_dispatcher.hpp"
#include <iostream>
#include <stdexcept>

namespace cardbattle {
namespace effects {

namespace {

std::optional<std::vector<FieldPosition>>& slot_for(ResolvedSlots& slots, TargetRole role) {
    return role == TargetRole::SOURCE ? slots.source : slots.target;
}

bool is_untouched(const ResolvedSlots& slots) {
    return !slots.source && !slots.target;
}

} // anonymous namespace

EffectQueue::EffectQueue(const CardRepository& repo, const EffectRegistry& registry)
    : repo_(repo), registry_(registry) {}

// ============================================================================
// ENQUEUE
// ============================================================================

int EffectQueue::enqueue_group(GameState& state,
                               const TemplateID& template_id,
                               EffectOrigin origin,
                               int group_index,
                               const EffectContext& context) const {
    const auto& effects = repo_.get_effects(template_id, origin, group_index);
    for (size_t i = 0; i < effects.size(); i++) {
        EffectRef ref{template_id, origin, group_index, static_cast<int>(i)};
        enqueue(state, ref, context);
    }
    return static_cast<int>(effects.size());
}

void EffectQueue::enqueue(GameState& state, const EffectRef& ref, const EffectContext& context) const {
    QueuedEffect queued;
    queued.ref = ref;
    queued.context = context;
    state.effect_queue.push_back(std::move(queued));
}

// ============================================================================
// RESOLUTION LOOP
// ============================================================================

DrainStatus EffectQueue::drain(GameState& state) const {
    int steps = 0;

    while (!state.pending_selection && !state.effect_queue.empty()) {
        if (++steps > state.config.max_resolution_steps) {
            throw std::runtime_error("Effect resolution exceeded " +
                                     std::to_string(state.config.max_resolution_steps) + " steps");
        }

        QueuedEffect next = std::move(state.effect_queue.front());
        state.effect_queue.pop_front();

        if (!process(state, std::move(next))) {
            break;
        }
    }

    return state.pending_selection ? DrainStatus::AWAITING_SELECTION : DrainStatus::IDLE;
}

bool EffectQueue::process(GameState& state, QueuedEffect queued) const {
    const Effect& effect = repo_.get_effect(queued.ref);
    const EffectKind kind = effect_kind(effect);

    // A resumed effect already passed this check before it suspended
    if (is_untouched(queued.slots) && !registry_.can_apply(state, repo_, effect, queued.context)) {
        std::cerr << "[EffectQueue] Skipping " << queued.context.effect_name
                  << " (" << to_string(kind) << "): cannot apply" << std::endl;
        return true;
    }

    for (const auto& point : registry_.get_resolution_requirements(effect)) {
        auto& slot = slot_for(queued.slots, point.role);
        if (slot) continue;

        TargetResolution resolution = resolve_selection_point(state, repo_, point, queued.context);
        switch (resolution.status) {
            case ResolutionStatus::RESOLVED:
                slot = std::move(resolution.positions);
                break;

            case ResolutionStatus::REQUIRES_SELECTION: {
                PendingSelection pending;
                pending.role = point.role;
                pending.chooser = resolution.chooser;
                pending.candidates = std::move(resolution.candidates);
                pending.effect = std::move(queued);
                state.pending_selection = std::move(pending);
                return false;
            }

            case ResolutionStatus::UNSATISFIABLE:
                if (point.required) {
                    std::cerr << "[EffectQueue] Skipping " << queued.context.effect_name
                              << " (" << to_string(kind) << "): no valid " << to_string(point.role)
                              << std::endl;
                    return true;
                }
                slot = std::vector<FieldPosition>{};
                break;
        }
    }

    HandlerContext ctx{state, repo_, queued.context, queued.ref};
    ApplyResult result = registry_.apply(ctx, effect, queued.slots);

    if (listener_) {
        listener_(queued, effect, result);
    }

    for (const auto& event : result.events) {
        dispatch_event(state, repo_, *this, event);
    }
    return true;
}

// ============================================================================
// RESUME
// ============================================================================

bool EffectQueue::resume_with_selection(GameState& state, int choice_index) const {
    if (!state.pending_selection) {
        std::cerr << "[EffectQueue] No pending selection to resume" << std::endl;
        return false;
    }

    const PendingSelection& pending = *state.pending_selection;
    if (choice_index < 0 || choice_index >= static_cast<int>(pending.candidates.size())) {
        std::cerr << "[EffectQueue] Invalid selection " << choice_index << " (" << pending.candidates.size()
                  << " candidates)" << std::endl;
        return false;
    }

    QueuedEffect resumed = pending.effect;
    slot_for(resumed.slots, pending.role) = std::vector<FieldPosition>{pending.candidates[choice_index]};

    state.pending_selection.reset();
    state.effect_queue.push_front(std::move(resumed));
    return true;
}

bool EffectQueue::resume_with_position(GameState& state, const FieldPosition& position) const {
    if (!state.pending_selection) {
        return resume_with_selection(state, -1);
    }

    const auto& candidates = state.pending_selection->candidates;
    for (size_t i = 0; i < candidates.size(); i++) {
        if (candidates[i] == position) {
            return resume_with_selection(state, static_cast<int>(i));
        }
    }
    std::cerr << "[EffectQueue] Position " << static_cast<int>(position.player_id) << ":"
              << position.field_index << " is not a candidate" << std::endl;
    return false;
}

} // namespace effects
} // namespace cardbattle
