/**
 * Card Battle Engine - Zone Container
 *
 * Represents a card zone (deck, hand, discard).
 */

#pragma once

#include "types.hpp"
#include <algorithm>
#include <random>

namespace cardbattle {

/**
 * CardRef - A physical card outside the field.
 */
struct CardRef {
    InstanceID instance_id;
    TemplateID template_id;
};

/**
 * Zone - Ordered container for cards. Index 0 is the top of a deck.
 */
struct Zone {
    std::vector<CardRef> cards;

    // ========================================================================
    // BASIC OPERATIONS
    // ========================================================================

    void add_card(CardRef card) {
        cards.push_back(std::move(card));
    }

    // Remove and return card
    std::optional<CardRef> take_card(const InstanceID& instance_id) {
        for (auto it = cards.begin(); it != cards.end(); ++it) {
            if (it->instance_id == instance_id) {
                CardRef removed = std::move(*it);
                cards.erase(it);
                return removed;
            }
        }
        return std::nullopt;
    }

    const CardRef* find_card(const InstanceID& instance_id) const {
        for (const auto& card : cards) {
            if (card.instance_id == instance_id) {
                return &card;
            }
        }
        return nullptr;
    }

    int count() const {
        return static_cast<int>(cards.size());
    }

    bool is_empty() const {
        return cards.empty();
    }

    // ========================================================================
    // DECK OPERATIONS
    // ========================================================================

    // Draw from top of deck (index 0)
    std::optional<CardRef> draw_top() {
        if (cards.empty()) {
            return std::nullopt;
        }
        CardRef top = std::move(cards.front());
        cards.erase(cards.begin());
        return top;
    }

    void add_to_bottom(CardRef card) {
        cards.push_back(std::move(card));
    }

    template<typename RNG>
    void shuffle(RNG& rng) {
        std::shuffle(cards.begin(), cards.end(), rng);
    }
};

} // namespace cardbattle
