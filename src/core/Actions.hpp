//
// Created on 12/10/2026.
//

#ifndef NOMERCYUNO_ACTIONS_HPP
#define NOMERCYUNO_ACTIONS_HPP

#include "Types.hpp"

namespace uno::core
{
    // chosen_color only matters for wild ranks.
    // stack_intent marks a play meant as an answer to a pending chain; an interactive
    // opponent only challenges a WILD_DRAW_FOUR that carries it.
    struct PlayAction
    {
        Card card;
        std::optional<Color> chosen_color{};
        bool stack_intent{false};
    };
    struct DrawAction    {};
    // raised by the deciding player itself (e.g. it picked a card it may not play)
    struct InvalidAction {};

    using Move = std::variant<PlayAction, DrawAction, InvalidAction>;

    enum class MoveOutcome : uint8_t
    {
        Invalid,
        Applied,
        GameEnded
    };
} // namespace uno::core

#endif //NOMERCYUNO_ACTIONS_HPP
