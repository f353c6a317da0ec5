//
// Created on 12/10/2026.
//

#include "NoMercyRules.hpp"

#include "Game.hpp"
#include "Util.hpp"
#include <algorithm>
namespace
{
    inline auto Viol(uno::core::error::RuleViolationCode code) -> uno::core::error::RuleViolation
    {
        return uno::core::error::RuleViolation{ .code = code };
    }
}

namespace uno::core
{
    auto NoMercyRules::Matches(Card const& candidate, Card const& top, Color const active) -> bool
    {
        if (IsWild(candidate.rank)) return true;
        if (IsWild(top.rank)) return candidate.color == active || candidate.rank == top.rank;
        return candidate.color == top.color || candidate.rank == top.rank;
    }

    auto NoMercyRules::Open(GameImpl& game) -> void
    {
        Card const& start = game.deck_.TopDiscard();
        UNO_ASSERT(!IsWild(start.rank), "Opening discard must not be wild");

        switch (start.rank)
        {
        case Rank::Skip:
            game.Emit(EffectTriggered{.effect = Effect::Skip, .seat = game.current_idx_});
            game.AdvanceTurn(1);
            break;
        case Rank::Reverse:
            // nobody has played yet, so no extra step
            game.Reverse();
            game.Emit(EffectTriggered{.effect = Effect::Reverse, .seat = game.current_idx_});
            break;
        case Rank::DrawTwo:
            game.pending_draw_ = 2;
            game.Emit(EffectTriggered{.effect = Effect::DrawStacked, .seat = game.current_idx_,
                                      .pending = game.pending_draw_});
            break;
        default:
            break;
        }
    }

    auto NoMercyRules::Validate(GameImpl const& game, Move const& m) const -> CheckResult
    {
        using RVC = ::uno::core::error::RuleViolationCode;
        PlyrIdxT const actor = game.actor_;

        return std::visit([&]<typename T0>(T0 const& act) -> CheckResult
        {
            using T = std::decay_t<T0>;

            if constexpr (std::is_same_v<T, InvalidAction>)
            {
                return std::unexpected(Viol(RVC::Declared_Invalid)
                                       .with_actor(actor).with_pending(game.pending_draw_));
            }
            else if constexpr (std::is_same_v<T, DrawAction>)
            {
                return {};
            }
            else if constexpr (std::is_same_v<T, PlayAction>)
            {
                if (!game.hands_[actor].Contains(act.card))
                    return std::unexpected(Viol(RVC::Play_CardNotInHand)
                                           .with_actor(actor).with_card(act.card));

                Card const& top = game.deck_.TopDiscard();
                if (!Matches(act.card, top, game.active_color_))
                    return std::unexpected(Viol(RVC::Play_DoesNotMatch)
                                           .with_actor(actor)
                                           .with_card(act.card)
                                           .with_top(top)
                                           .with_active(game.active_color_));

                if (IsWild(act.card.rank) && (!act.chosen_color || !IsStandard(*act.chosen_color)))
                    return std::unexpected(Viol(RVC::Play_WildWithoutColor)
                                           .with_actor(actor).with_card(act.card));

                return {};
            }

            UNO_THROW(uno::core::error::Code::Unknown, "Unreachable variant in Validate");
        }, m);
    }

    auto NoMercyRules::Penalize(GameImpl& game, error::RuleViolation const& v) -> void
    {
        // a declared invalid move costs one card; a refused play only loses the turn
        if (v.code == error::RuleViolationCode::Declared_Invalid)
        {
            game.DrawInto(game.actor_, 1, DrawReason::InvalidPenalty);
        }
        game.turn_steps_ = 1;
    }

    auto NoMercyRules::Apply(GameImpl& game, Move const& m) -> void
    {
        std::visit([&]<typename T0>(T0 const& act)
            {
                using T = std::decay_t<T0>;
                if constexpr (std::is_same_v<T, PlayAction>)
                {
                    PlayCard(game, game.actor_, act.card, act.chosen_color, act.stack_intent, false);
                }
                else if constexpr (std::is_same_v<T, DrawAction>)
                {
                    ApplyDraw(game);
                }
                else if constexpr (std::is_same_v<T, InvalidAction>)
                {
                    ::uno::core::error::fail(::uno::core::error::Code::Rules, "Invalid move reached Apply");
                }
            }, m);
    }

    auto NoMercyRules::ApplyDraw(GameImpl& game) -> void
    {
        PlyrIdxT const seat = game.actor_;

        // answering a chain by drawing ends the turn; the drawer never plays instead
        if (game.pending_draw_ > 0)
        {
            uint16_t const owed = game.pending_draw_;
            game.pending_draw_ = 0;
            game.DrawInto(seat, owed, DrawReason::PendingChain);
            game.turn_steps_ = 1;
            return;
        }

        CardSP drawn = game.DrawFromDeck();
        game.Emit(CardsDrawn{.seat = seat,
                             .requested = 1,
                             .drawn = static_cast<uint16_t>(drawn ? 1 : 0),
                             .reason = DrawReason::Voluntary,
                             .single = drawn ? std::optional<Card>{*drawn} : std::nullopt});
        // nothing left to draw: the turn simply passes
        if (!drawn)
        {
            game.turn_steps_ = 1;
            return;
        }

        Card const card = *drawn;
        game.hands_[seat].Add(std::move(drawn));

        if (game.cfg_.no_mercy && Matches(card, game.deck_.TopDiscard(), game.active_color_))
        {
            std::optional<Color> const color =
                IsWild(card.rank) ? std::optional<Color>{AutoColor(game.hands_[seat])} : std::nullopt;
            PlayCard(game, seat, card, color, false, true);
            return;
        }
        game.turn_steps_ = 1;
    }

    auto NoMercyRules::PlayCard(GameImpl& game, PlyrIdxT const seat, Card const& card,
                                std::optional<Color> const chosen, bool const stack_intent,
                                bool const auto_played) -> void
    {
        // WILD_DRAW_FOUR legality is judged against the color in force before this play
        Color const prior = game.active_color_;

        game.MoveHandToDiscard(seat, card);
        if (IsWild(card.rank))
        {
            UNO_ASSERT(chosen && IsStandard(*chosen), "Wild played without a standard color");
            game.active_color_ = *chosen;
        }
        else
        {
            game.active_color_ = card.color;
        }

        game.Emit(CardPlayed{.seat = seat, .card = card,
                             .chosen = IsWild(card.rank) ? chosen : std::nullopt,
                             .auto_played = auto_played});
        if (IsWild(card.rank))
            game.Emit(EffectTriggered{.effect = Effect::ColorChosen, .seat = seat, .color = game.active_color_});

        if (game.hands_[seat].Size() == 1)
            game.Emit(LastCard{.seat = seat});

        switch (card.rank)
        {
        case Rank::Skip:
            game.Emit(EffectTriggered{.effect = Effect::Skip, .seat = game.NextSeat(seat)});
            game.turn_steps_ = 2;
            break;
        case Rank::Reverse:
            game.Reverse();
            // with two players a reverse hands the turn straight back
            if (game.players_.size() == 2)
            {
                game.Emit(EffectTriggered{.effect = Effect::ReverseAsSkip, .seat = seat});
                game.turn_steps_ = 2;
            }
            else
            {
                game.Emit(EffectTriggered{.effect = Effect::Reverse, .seat = seat});
                game.turn_steps_ = 1;
            }
            break;
        case Rank::DrawTwo:
            game.pending_draw_ += 2;
            game.Emit(EffectTriggered{.effect = Effect::DrawStacked, .seat = game.NextSeat(seat),
                                      .pending = game.pending_draw_});
            game.turn_steps_ = 1;
            break;
        case Rank::WildDrawFour:
            ResolveWildDrawFour(game, seat, prior, stack_intent);
            game.turn_steps_ = 1;
            break;
        default:
            game.turn_steps_ = 1;
            break;
        }
    }

    auto NoMercyRules::ResolveWildDrawFour(GameImpl& game, PlyrIdxT const seat, Color const prior,
                                           bool const stack_intent) -> void
    {
        PlyrIdxT const opponent = game.NextSeat(seat);
        bool const illegal = game.hands_[seat].HasNonWildColor(prior);
        bool const challenged = game.players_[opponent]->AlwaysChallenges() || stack_intent;

        if (!challenged)
        {
            game.pending_draw_ += 4;
            game.Emit(EffectTriggered{.effect = Effect::DrawStacked, .seat = opponent,
                                      .pending = game.pending_draw_});
            return;
        }

        game.Emit(Challenge{.challenger = opponent, .target = seat, .upheld = illegal});
        if (illegal)
        {
            game.DrawInto(seat, 4, DrawReason::ChallengeUpheld);
        }
        else
        {
            game.DrawInto(opponent, 6, DrawReason::ChallengeFailed);
        }
    }

    auto NoMercyRules::Advance(GameImpl& game) -> MoveOutcome
    {
        if (game.hands_[game.actor_].Empty())
        {
            game.winner_ = game.actor_;
            game.Emit(GameWon{.seat = game.actor_});
            return MoveOutcome::GameEnded;
        }

        game.AdvanceTurn(game.turn_steps_);
        return MoveOutcome::Applied;
    }

} // uno
