/**
 * Hand Effect Handlers
 *
 * Descriptors:
 *   { type: 'hand-discard', amount, target: 'self' | 'opponent' | 'both', shuffleIntoDeck? }
 *   { type: 'search', source: { player, location, cardTypes?, cardCriteria? }, amount }
 *   { type: 'swap-cards', discardAmount, drawAmount, maxDrawn?, target }
 *
 * Cards leave the hand from the front. Searched cards are taken in zone
 * order and stop at the hand limit; a searched deck is shuffled afterwards.
 */

#include "effects/handlers.hpp"
#include "effects/field_operations.hpp"
#include "effects/target_resolver.hpp"
#include "effects/value_resolver.hpp"
#include <algorithm>

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
// HAND DISCARD
// ============================================================================

ApplyResult apply_hand_discard(HandlerContext& ctx, const Effect& effect, const ResolvedSlots&) {
    const auto& discard = std::get<HandDiscardEffect>(effect);
    ApplyResult result;

    const int amount = resolve_amount(ctx.state, ctx.repo, discard.amount, ctx.context);
    for (PlayerID player : players_in_scope(discard.target, ctx.context.source_player)) {
        result.amount_applied += discard_from_hand(ctx.state, player, amount, discard.shuffle_into_deck);
    }

    result.message = std::string(discard.shuffle_into_deck ? "Shuffled " : "Discarded ") +
                     std::to_string(result.amount_applied) + " cards from hand";
    return result;
}

// ============================================================================
// SEARCH
// ============================================================================

bool search_matches(const CardRepository& repo, const SearchEffect& search, const CardRef& card) {
    const auto category = repo.get_category(card.template_id);
    if (!category) {
        return false;
    }
    if (!search.categories.empty() &&
        std::find(search.categories.begin(), search.categories.end(), *category) == search.categories.end()) {
        return false;
    }
    if (!search.card.empty()) {
        return *category == CardCategory::CREATURE && card_matches(repo, card.template_id, search.card);
    }
    return true;
}

Zone& search_zone(PlayerState& player, ZoneType location) {
    return location == ZoneType::DISCARD ? player.discard : player.deck;
}

bool can_search(const GameState& state, const CardRepository& repo, const Effect& effect,
                const EffectContext& ctx) {
    const auto& search = std::get<SearchEffect>(effect);
    const PlayerState& player = state.get_player(resolve_player(search.player, ctx.source_player));
    const Zone& zone = search.location == ZoneType::DISCARD ? player.discard : player.deck;
    return std::any_of(zone.cards.begin(), zone.cards.end(),
                       [&](const CardRef& card) { return search_matches(repo, search, card); });
}

ApplyResult apply_search(HandlerContext& ctx, const Effect& effect, const ResolvedSlots&) {
    const auto& search = std::get<SearchEffect>(effect);
    ApplyResult result;

    const int amount = resolve_amount(ctx.state, ctx.repo, search.amount, ctx.context);
    PlayerState& player = ctx.state.get_player(resolve_player(search.player, ctx.context.source_player));
    Zone& zone = search_zone(player, search.location);

    auto it = zone.cards.begin();
    while (it != zone.cards.end() && result.amount_applied < amount &&
           player.hand.count() < ctx.state.config.max_hand_size) {
        if (!search_matches(ctx.repo, search, *it)) {
            ++it;
            continue;
        }
        player.hand.add_card(std::move(*it));
        it = zone.cards.erase(it);
        result.amount_applied++;
    }

    if (search.location == ZoneType::DECK) {
        player.deck.shuffle(ctx.state.rng);
    }

    result.message = "Found " + std::to_string(result.amount_applied) + " cards";
    return result;
}

// ============================================================================
// SWAP CARDS
// ============================================================================

ApplyResult apply_swap_cards(HandlerContext& ctx, const Effect& effect, const ResolvedSlots&) {
    const auto& swap = std::get<SwapCardsEffect>(effect);
    ApplyResult result;

    const int discard_amount = resolve_amount(ctx.state, ctx.repo, swap.discard_amount, ctx.context);
    int draw_amount = resolve_amount(ctx.state, ctx.repo, swap.draw_amount, ctx.context);
    if (swap.max_drawn) {
        draw_amount = std::min(draw_amount, *swap.max_drawn);
    }

    for (PlayerID player : players_in_scope(swap.target, ctx.context.source_player)) {
        discard_from_hand(ctx.state, player, discard_amount);
        result.amount_applied += draw_cards(ctx.state, player, draw_amount);
    }

    result.message = "Swapped for " + std::to_string(result.amount_applied) + " cards";
    return result;
}

} // anonymous namespace

void register_hand_handlers(EffectRegistry& registry) {
    EffectHandler discard;
    discard.apply = apply_hand_discard;
    registry.register_handler(EffectKind::HAND_DISCARD, std::move(discard));

    EffectHandler search;
    search.can_apply = can_search;
    search.apply = apply_search;
    registry.register_handler(EffectKind::SEARCH, std::move(search));

    EffectHandler swap;
    swap.apply = apply_swap_cards;
    registry.register_handler(EffectKind::SWAP_CARDS, std::move(swap));
}

} // namespace effects
} // namespace cardbattle
