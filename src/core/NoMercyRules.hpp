//
// Created on 12/10/2026.
//

#ifndef NOMERCYUNO_NOMERCYRULES_HPP
#define NOMERCYUNO_NOMERCYRULES_HPP
#include "Rules.hpp"
#include "Hand.hpp"

namespace uno::core
{
    class NoMercyRules final : public Rules
    {
    public:
        auto Open(GameImpl& game) -> void override;
        auto Validate(GameImpl const& game, Move const& m) const -> CheckResult override;
        auto Penalize(GameImpl& game, error::RuleViolation const& v) -> void override;
        auto Apply(GameImpl& game, Move const& m) -> void override;
        auto Advance(GameImpl& game) -> MoveOutcome override;

        // A wild always matches. Otherwise the color must equal the top card's
        // color (the active color when the top card is wild) or the ranks must be equal.
        static auto Matches(Card const& candidate, Card const& top, Color active) -> bool;
        // Most held color in hand is the pick for automated wild plays.
        static auto AutoColor(Hand const& hand) -> Color { return hand.MostHeldColor(); }

    private:
        auto PlayCard(GameImpl& game, PlyrIdxT seat, Card const& card, std::optional<Color> chosen,
                      bool stack_intent, bool auto_played) -> void;
        auto ResolveWildDrawFour(GameImpl& game, PlyrIdxT seat, Color prior, bool stack_intent) -> void;
        auto ApplyDraw(GameImpl& game) -> void;
    };
}

#endif //NOMERCYUNO_NOMERCYRULES_HPP
