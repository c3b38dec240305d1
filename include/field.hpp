/**
 * Card Battle Engine - Field
 *
 * A player's creatures in play. Position 0 is the active spot,
 * positions 1..max_bench_size address the bench in order.
 */

#pragma once

#include "field_card.hpp"
#include <stdexcept>

namespace cardbattle {

struct Field {
    std::optional<FieldCard> active_spot;
    std::vector<FieldCard> bench;
    int max_bench_size = 3;

    // ========================================================================
    // BASIC OPERATIONS
    // ========================================================================

    bool has_active() const {
        return active_spot.has_value();
    }

    int get_bench_count() const {
        return static_cast<int>(bench.size());
    }

    bool can_add_to_bench() const {
        return get_bench_count() < max_bench_size;
    }

    bool has_any_creature() const {
        return has_active() || !bench.empty();
    }

    int count_creatures() const {
        return (has_active() ? 1 : 0) + get_bench_count();
    }

    // Highest addressable position + 1 (the active spot counts even when empty)
    int position_count() const {
        return 1 + get_bench_count();
    }

    bool is_occupied(int position) const {
        if (position == ACTIVE_POSITION) return has_active();
        return position > ACTIVE_POSITION && position <= get_bench_count();
    }

    FieldCard* get(int position) {
        if (!is_occupied(position)) return nullptr;
        return position == ACTIVE_POSITION ? &*active_spot : &bench[position - 1];
    }

    const FieldCard* get(int position) const {
        if (!is_occupied(position)) return nullptr;
        return position == ACTIVE_POSITION ? &*active_spot : &bench[position - 1];
    }

    FieldCard& at(int position) {
        FieldCard* card = get(position);
        if (!card) {
            throw std::out_of_range("No creature at field position " + std::to_string(position));
        }
        return *card;
    }

    const FieldCard& at(int position) const {
        const FieldCard* card = get(position);
        if (!card) {
            throw std::out_of_range("No creature at field position " + std::to_string(position));
        }
        return *card;
    }

    // Fills the active spot first, then the bench
    bool add_creature(FieldCard card) {
        if (!has_active()) {
            active_spot = std::move(card);
            return true;
        }
        if (!can_add_to_bench()) {
            return false;
        }
        bench.push_back(std::move(card));
        return true;
    }

    /**
     * Remove a creature. Removing the active leaves the spot empty until
     * promote(); later bench positions shift down by one.
     */
    FieldCard remove_at(int position) {
        FieldCard removed = std::move(at(position));
        if (position == ACTIVE_POSITION) {
            active_spot.reset();
        } else {
            bench.erase(bench.begin() + (position - 1));
        }
        return removed;
    }

    // Swap a bench creature with the active one
    void switch_active(int bench_position) {
        if (bench_position == ACTIVE_POSITION || !is_occupied(bench_position) || !has_active()) {
            throw std::out_of_range("Invalid bench position: " + std::to_string(bench_position));
        }
        std::swap(*active_spot, bench[bench_position - 1]);
    }

    // Move a bench creature into the empty active spot
    void promote(int bench_position) {
        if (has_active()) {
            throw std::invalid_argument("Active spot is occupied");
        }
        active_spot = remove_at(bench_position);
    }

    // ========================================================================
    // LOOKUP
    // ========================================================================

    int find_position(const InstanceID& field_instance_id) const {
        for (int pos = 0; pos < position_count(); pos++) {
            const FieldCard* card = get(pos);
            if (card && card->field_instance_id() == field_instance_id) {
                return pos;
            }
        }
        return -1;
    }

    std::vector<int> occupied_positions() const {
        std::vector<int> positions;
        for (int pos = 0; pos < position_count(); pos++) {
            if (is_occupied(pos)) positions.push_back(pos);
        }
        return positions;
    }
};

} // namespace cardbattle
