//
// Created on 14/10/2026.
//

#ifndef NOMERCYUNO_RANDOMAI_HPP
#define NOMERCYUNO_RANDOMAI_HPP

#include <string>
#include "Player.hpp"
#include "NoMercyRules.hpp"
#include "State.hpp"
#include "Types.hpp"

namespace uno::core
{
    class RandomAI final : public uno::core::Player
    {
    public:
        RandomAI(std::string name, uint64_t rng_seed);

        auto ChooseMove(std::shared_ptr<const uno::core::GameSnapshot> snapshot) -> uno::core::Move override;
        auto Name() const -> std::string override { return name_; }
        auto AlwaysChallenges() const -> bool override { return true; }

    private:
        template <class Vec>
        auto pick(Vec const& v) -> size_t
        {
            return std::uniform_int_distribution<size_t>{0, v.size() - 1}(rng_);
        }

    private:
        std::string name_;
        std::mt19937 rng_;
    };
}

#endif //NOMERCYUNO_RANDOMAI_HPP
