/**
 * Card Battle Engine - Value Resolver Implementation
 */

#include "effects/value_resolver.hpp"
#include "effects/target_resolver.hpp"
#include <algorithm>
#include <climits>
#include <stdexcept>

namespace cardbattle {
namespace effects {

PlayerID resolve_player(PlayerScope scope, PlayerID acting_player) {
    switch (scope) {
        case PlayerScope::SELF: return acting_player;
        case PlayerScope::OPPONENT: return opponent_of(acting_player);
        default:
            throw std::invalid_argument("Player scope 'both' does not name a single player");
    }
}

int points_to_win(const GameState& state, PlayerID player) {
    return std::max(0, state.config.win_points - state.get_player(player).points);
}

namespace {

int resolve_player_context(const GameState& state, const PlayerContextAmount& amount,
                           const EffectContext& context) {
    const PlayerID player = resolve_player(amount.player_context, context.source_player);
    switch (amount.source) {
        case ContextSource::HAND_SIZE:
            return state.get_player(player).hand.count();
        case ContextSource::CURRENT_POINTS:
            return state.get_player(player).points;
        case ContextSource::POINTS_TO_WIN:
            return points_to_win(state, player);
    }
    return 0;
}

const Zone& zone_of(const PlayerState& player, ZoneType location) {
    switch (location) {
        case ZoneType::HAND: return player.hand;
        case ZoneType::DECK: return player.deck;
        case ZoneType::DISCARD: return player.discard;
        default:
            throw std::invalid_argument(std::string("Card count cannot read zone: ") + to_string(location));
    }
}

int resolve_count(const GameState& state, const CardRepository& repo,
                  const CountAmount& amount, const EffectContext& context) {
    const PlayerID acting = context.source_player;

    switch (amount.count_type) {
        case CountType::FIELD:
            return static_cast<int>(find_matching_positions(state, repo, amount.criteria, acting).size());

        case CountType::CARD: {
            if (amount.location == ZoneType::FIELD) {
                const PlayerID player = resolve_player(amount.player, acting);
                return state.get_player(player).field.count_creatures();
            }
            if (amount.player == PlayerScope::BOTH) {
                return zone_of(state.players[0], amount.location).count() +
                       zone_of(state.players[1], amount.location).count();
            }
            const PlayerID player = resolve_player(amount.player, acting);
            return zone_of(state.get_player(player), amount.location).count();
        }

        case CountType::ENERGY: {
            int total = 0;
            for (const auto& pos : find_matching_positions(state, repo, amount.criteria, acting)) {
                const InstanceID& id = state.get_creature(pos).field_instance_id();
                if (amount.energy_types.empty()) {
                    total += state.energy.total(id);
                } else {
                    for (EnergyType type : amount.energy_types) {
                        total += state.energy.count(id, type);
                    }
                }
            }
            return total;
        }

        case CountType::DAMAGE: {
            int total = 0;
            for (const auto& pos : find_matching_positions(state, repo, amount.criteria, acting)) {
                total += state.get_creature(pos).damage_taken;
            }
            return total;
        }
    }
    return 0;
}

} // anonymous namespace

int resolve_amount(const GameState& state,
                   const CardRepository& repo,
                   const AmountSpec& amount,
                   const EffectContext& context) {
    int value = 0;

    if (const auto* constant = std::get_if<ConstantAmount>(&amount.value)) {
        value = constant->value;
    } else if (const auto* player_context = std::get_if<PlayerContextAmount>(&amount.value)) {
        value = resolve_player_context(state, *player_context, context);
    } else if (const auto* count = std::get_if<CountAmount>(&amount.value)) {
        value = resolve_count(state, repo, *count, context);
    } else if (const auto* addition = std::get_if<AdditionAmount>(&amount.value)) {
        long long sum = 0;
        for (const auto& child : addition->values) {
            sum += resolve_amount(state, repo, child, context);
        }
        value = static_cast<int>(std::min<long long>(INT_MAX, sum));
    } else if (const auto* multiplication = std::get_if<MultiplicationAmount>(&amount.value)) {
        if (!multiplication->base || !multiplication->multiplier) {
            throw std::invalid_argument("Multiplication amount is missing an operand");
        }
        const long long product =
            static_cast<long long>(resolve_amount(state, repo, *multiplication->base, context)) *
            resolve_amount(state, repo, *multiplication->multiplier, context);
        value = static_cast<int>(std::max<long long>(INT_MIN, std::min<long long>(INT_MAX, product)));
    }

    return std::max(0, value);
}

} // namespace effects
} // namespace cardbattle
