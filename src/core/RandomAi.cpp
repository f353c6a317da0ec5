//
// Created on 14/10/2026.
//

#include "RandomAi.hpp"
#include <random>
#include <utility>

#include "Exception.hpp"

namespace uno::core
{
    RandomAI::RandomAI(std::string name, uint64_t rng_seed):
        name_(std::move(name)), rng_(rng_seed) {}

    auto RandomAI::ChooseMove(std::shared_ptr<const GameSnapshot> snapshot) -> Move
    {
        UNO_ASSERT(snapshot, "Null snapshot handed to RandomAI");
        GameSnapshot const& s = *snapshot;

        std::vector<Card> candidates;
        for (Card const& c : s.my_hand.Cards())
        {
            if (!NoMercyRules::Matches(c, s.top, s.active_color)) continue;
            // while a chain is pending only a stack answer keeps the turn alive
            if (s.pending_draw > 0 && !IsStackable(c.rank)) continue;
            candidates.push_back(c);
        }

        if (candidates.empty()) return DrawAction{};

        Card const chosen = candidates[pick(candidates)];
        std::optional<Color> color{};
        if (IsWild(chosen.rank))
        {
            color = constants::StandardColors[pick(constants::StandardColors)];
        }
        return PlayAction{.card = chosen, .chosen_color = color, .stack_intent = s.pending_draw > 0};
    }
}
