//
// Created on 12/10/2026.
//

#ifndef NOMERCYUNO_STATE_HPP
#define NOMERCYUNO_STATE_HPP

#include "Types.hpp"
#include "Actions.hpp"
#include "Hand.hpp"



namespace uno::core
{
    // Read-only view handed to a deciding player. Owns copies only, so nothing a
    // player does with it can reach the authoritative state.
    struct GameSnapshot
    {
        PlyrIdxT seat{};
        PlyrIdxT current_idx{};
        uint8_t n_players{};
        int8_t direction{1};

        Card top{Color::Red, Rank::Zero};
        Color active_color{Color::Red};
        uint16_t pending_draw{};
        bool no_mercy{true};

        // for UI: reveal my hand, counts for others
        Hand my_hand;
        std::vector<uint8_t> hand_counts;

        uint8_t draw_pile{};
        uint8_t discard_pile{};
    };

} // namespace uno::core

#endif //NOMERCYUNO_STATE_HPP
