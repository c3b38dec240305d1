/**
 * Card Battle Engine - Handler Registration
 */

#include "effects/handlers.hpp"
#include <iostream>

namespace cardbattle {
namespace effects {

void register_all_handlers(EffectRegistry& registry) {
    register_hp_handler(registry);
    register_status_handlers(registry);
    register_draw_handlers(registry);
    register_energy_handlers(registry);
    register_switch_handler(registry);
    register_passive_handlers(registry);
    register_hand_handlers(registry);
    register_removal_handlers(registry);
    register_evolution_handlers(registry);

    const size_t expected = static_cast<size_t>(EffectKind::PULL_EVOLUTION) + 1;
    if (registry.handler_count() != expected) {
        std::cerr << "[EffectRegistry] Registered " << registry.handler_count()
                  << " of " << expected << " effect kinds" << std::endl;
    }
}

} // namespace effects
} // namespace cardbattle
