//
// Created on 12/10/2026.
//

#ifndef NOMERCYUNO_PLAYER_HPP
#define NOMERCYUNO_PLAYER_HPP

#include <string>
#include "Actions.hpp"
#include "State.hpp"

namespace uno::core
{
    class Player
    {
    public:
        virtual ~Player() = default;

        // Called by the game loop for the seat whose turn it is. Must not block for
        // automated policies; an interactive adapter may wait on input.
        virtual auto ChooseMove(std::shared_ptr<GameSnapshot const> snapshot) -> Move = 0;

        virtual auto Name() const -> std::string = 0;

        // Whether this seat contests every WILD_DRAW_FOUR played against it.
        // Automated policies do; an interactive seat only contests plays that
        // carried stack_intent.
        virtual auto AlwaysChallenges() const -> bool { return false; }
    };
}
#endif //NOMERCYUNO_PLAYER_HPP
