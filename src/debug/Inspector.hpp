//
// Created on 15/10/2026.
//

#ifndef NOMERCYUNO_INSPECTOR_HPP
#define NOMERCYUNO_INSPECTOR_HPP

#include <vector>
#include <cstddef>
#include <cstdint>
#include <ranges>
#include <utility>

#include "../core/Types.hpp"
#include "../core/Game.hpp"

namespace uno::core::debug
{
    struct Inspector
    {
        struct SnapshotAll
        {
            std::vector<CardSP> deck;
            std::vector<CardSP> discard;
            std::vector<std::vector<CardSP>> hands;
            util::CompositionCounter composition{};

            uint8_t n_players{};
            PlyrIdxT current_idx{};
            int8_t direction{};
            Color active_color{};
            uint16_t pending_draw{};
        };

        static inline auto Gather(GameImpl const& g) -> SnapshotAll
        {
            SnapshotAll ret{};
            ret.n_players = static_cast<uint8_t>(g.players_.size());
            ret.current_idx = g.current_idx_;
            ret.direction = g.direction_;
            ret.active_color = g.active_color_;
            ret.pending_draw = g.pending_draw_;
            ret.composition = g.composition_;

            ret.hands.reserve(g.hands_.size());
            for (Hand const& h : g.hands_)
            {
                ret.hands.push_back(h.Pointers());
            }

            ret.deck.assign(g.deck_.draw_.cbegin(), g.deck_.draw_.cend());
            ret.discard.assign(g.deck_.discard_.cbegin(), g.deck_.discard_.cend());

            return ret;
        }

#if UNO_ENABLE_TEST_HOOKS == true
        // Overrides turn state for scripted scenarios. Cards are never touched here,
        // so conservation still holds afterwards.
        static inline auto SetTurn(GameImpl& g, PlyrIdxT current, int8_t direction,
                                   Color active, uint16_t pending) -> void
        {
            UNO_ASSERT(current < g.players_.size(), "Seat out of range");
            UNO_ASSERT(direction == 1 || direction == -1, "Direction must be +1 or -1");
            UNO_ASSERT(IsStandard(active), "Active color must be a standard color");
            g.current_idx_ = current;
            g.direction_ = direction;
            g.active_color_ = active;
            g.pending_draw_ = pending;
        }
#endif
    };
}

#endif //NOMERCYUNO_INSPECTOR_HPP
