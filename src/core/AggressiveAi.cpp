//
// Created on 14/10/2026.
//

#include "AggressiveAi.hpp"

#include <utility>

#include "Exception.hpp"
#include "NoMercyRules.hpp"

namespace uno::core
{
    AggressiveAI::AggressiveAI(std::string name) :
        name_(std::move(name)) {}

    static auto ColorFor(Card const& c, GameSnapshot const& s) -> std::optional<Color>
    {
        if (!IsWild(c.rank)) return std::nullopt;
        return NoMercyRules::AutoColor(s.my_hand);
    }

    auto AggressiveAI::ChooseMove(std::shared_ptr<const GameSnapshot> snapshot) -> Move
    {
        UNO_ASSERT(snapshot, "Null snapshot handed to AggressiveAI");
        if (snapshot->pending_draw > 0) return StackMove(*snapshot);
        return LeadMove(*snapshot);
    }

    auto AggressiveAI::StackMove(GameSnapshot const& s) const -> Move
    {
        for (Card const& c : s.my_hand.Cards())
        {
            if (IsStackable(c.rank) && NoMercyRules::Matches(c, s.top, s.active_color))
                return PlayAction{.card = c, .chosen_color = ColorFor(c, s), .stack_intent = true};
        }
        return DrawAction{};
    }

    auto AggressiveAI::LeadMove(GameSnapshot const& s) const -> Move
    {
        std::optional<Card> fallback{};
        for (Card const& c : s.my_hand.Cards())
        {
            if (!NoMercyRules::Matches(c, s.top, s.active_color)) continue;

            if (c.rank == Rank::WildDrawFour)
            {
                // only lead with it when no challenge could catch us
                if (!s.my_hand.HasNonWildColor(s.active_color))
                    return PlayAction{.card = c, .chosen_color = ColorFor(c, s), .stack_intent = true};
                if (!fallback) fallback.emplace(c);
                continue;
            }
            if (IsAction(c.rank))
                return PlayAction{.card = c, .chosen_color = std::nullopt, .stack_intent = false};
            if (!fallback) fallback.emplace(c);
        }

        if (fallback)
            return PlayAction{.card = *fallback, .chosen_color = ColorFor(*fallback, s), .stack_intent = false};
        return DrawAction{};
    }
}
