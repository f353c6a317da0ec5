//
// Created on 14/10/2026.
//

#ifndef NOMERCYUNO_AGGRESSIVEAI_HPP
#define NOMERCYUNO_AGGRESSIVEAI_HPP

#include <string>
#include "Player.hpp"
#include "State.hpp"
#include "Types.hpp"

namespace uno::core
{
    // Stacks whenever it can, leads with action cards and saves plain
    // number cards for last. Deterministic.
    class AggressiveAI final : public Player
    {
    public:
        explicit AggressiveAI(std::string name);

        auto ChooseMove(std::shared_ptr<const GameSnapshot> snapshot) -> Move override;
        auto Name() const -> std::string override { return name_; }
        auto AlwaysChallenges() const -> bool override { return true; }

    private:
        auto StackMove(GameSnapshot const& s) const -> Move;
        auto LeadMove(GameSnapshot const& s) const -> Move;

    private:
        std::string name_;
    };
}

#endif //NOMERCYUNO_AGGRESSIVEAI_HPP
