/**
 * Draw and Shuffle Effect Handlers
 *
 * Descriptors:
 *   { type: 'draw', amount, player? }
 *   { type: 'shuffle', target: 'self' | 'opponent' | 'both', shuffleHand, drawAfter? }
 *
 * Drawing stops at an empty deck or at the hand limit. A shuffle's
 * drawAfter amount is evaluated before the hand goes back into the deck,
 * so hand-size amounts see the hand as it was.
 */

#include "effects/handlers.hpp"
#include "effects/field_operations.hpp"
#include "effects/value_resolver.hpp"

namespace cardbattle {
namespace effects {

namespace {

std::vector<PlayerID> players_in_scope(PlayerScope scope, PlayerID acting) {
    if (scope == PlayerScope::BOTH) {
        return {acting, opponent_of(acting)};
    }
    return {resolve_player(scope, acting)};
}

// ============================================================================
// DRAW
// ============================================================================

bool can_draw(const GameState& state, const CardRepository&, const Effect& effect, const EffectContext& ctx) {
    const auto& draw = std::get<DrawEffect>(effect);
    for (PlayerID player : players_in_scope(draw.player, ctx.source_player)) {
        if (!state.get_player(player).deck.is_empty()) {
            return true;
        }
    }
    return false;
}

ApplyResult apply_draw(HandlerContext& ctx, const Effect& effect, const ResolvedSlots&) {
    const auto& draw = std::get<DrawEffect>(effect);
    ApplyResult result;

    const int amount = resolve_amount(ctx.state, ctx.repo, draw.amount, ctx.context);
    for (PlayerID player : players_in_scope(draw.player, ctx.context.source_player)) {
        result.amount_applied += draw_cards(ctx.state, player, amount);
    }

    result.message = "Drew " + std::to_string(result.amount_applied) + " cards";
    return result;
}

// ============================================================================
// SHUFFLE
// ============================================================================

ApplyResult apply_shuffle(HandlerContext& ctx, const Effect& effect, const ResolvedSlots&) {
    const auto& shuffle = std::get<ShuffleEffect>(effect);
    ApplyResult result;

    for (PlayerID player : players_in_scope(shuffle.target, ctx.context.source_player)) {
        const int draw_amount = shuffle.draw_after
            ? resolve_amount(ctx.state, ctx.repo, *shuffle.draw_after, ctx.context)
            : 0;

        if (shuffle.shuffle_hand) {
            shuffle_hand_into_deck(ctx.state, player);
        } else {
            ctx.state.get_player(player).deck.shuffle(ctx.state.rng);
        }

        if (draw_amount > 0) {
            result.amount_applied += draw_cards(ctx.state, player, draw_amount);
        }
    }

    result.message = ctx.context.effect_name + " shuffled";
    return result;
}

} // anonymous namespace

void register_draw_handlers(EffectRegistry& registry) {
    EffectHandler draw;
    draw.can_apply = can_draw;
    draw.apply = apply_draw;
    registry.register_handler(EffectKind::DRAW, std::move(draw));

    // Always applicable, nothing to target
    EffectHandler shuffle;
    shuffle.apply = apply_shuffle;
    registry.register_handler(EffectKind::SHUFFLE, std::move(shuffle));
}

} // namespace effects
} // namespace cardbattle
