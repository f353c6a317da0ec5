//
// Created on 16/10/2026.
//
#include "ConsoleView.hpp"

#include <fmt/format.h>

#include "../core/Format.hpp"

namespace uno::cli
{
    using namespace uno::core;

    ConsoleView::ConsoleView(std::ostream& out) :
        out_(out) {}

    auto ConsoleView::NameOf(PlyrIdxT const seat) const -> std::string
    {
        return seat < names_.size() ? names_[seat] : fmt::format("P{}", static_cast<int>(seat));
    }

    auto ConsoleView::OnEvent(GameEvent const& e) -> void
    {
        std::visit([&]<typename T0>(T0 const& ev)
        {
            using T = std::decay_t<T0>;

            if constexpr (std::is_same_v<T, GameStarted>)
            {
                names_ = ev.names;
                std::string list;
                for (size_t i{}; i < names_.size(); ++i) list += fmt::format("{}{}", (i ? ", " : ""), names_[i]);
                out_ << fmt::format("UNO - No Mercy Edition\nPlayers: [{}]\n", list);
            }
            else if constexpr (std::is_same_v<T, OpeningCard>)
            {
                out_ << fmt::format("Starting card: {} | Active color: {}\n", ev.card, ev.active);
            }
            else if constexpr (std::is_same_v<T, TurnStarted>)
            {
                out_ << fmt::format("\n--- {}'s turn ---\n", NameOf(ev.seat));
                for (size_t i{}; i < ev.hand_counts.size(); ++i)
                {
                    if (i == static_cast<size_t>(ev.seat)) continue;
                    out_ << fmt::format("{} has {} cards.\n", NameOf(static_cast<PlyrIdxT>(i)),
                                        static_cast<int>(ev.hand_counts[i]));
                }
            }
            else if constexpr (std::is_same_v<T, CardPlayed>)
            {
                if (ev.auto_played)
                    out_ << fmt::format("{} auto-plays drawn card: {}\n", NameOf(ev.seat), ev.card);
                else if (ev.chosen)
                    out_ << fmt::format("{} plays: {} -> color set to {}\n", NameOf(ev.seat), ev.card, *ev.chosen);
                else
                    out_ << fmt::format("{} plays: {}\n", NameOf(ev.seat), ev.card);
            }
            else if constexpr (std::is_same_v<T, CardsDrawn>)
            {
                switch (ev.reason)
                {
                case DrawReason::Voluntary:
                    if (ev.single)
                        out_ << fmt::format("{} draws: {}\n", NameOf(ev.seat), *ev.single);
                    else
                        out_ << fmt::format("{} tries to draw but the deck is empty.\n", NameOf(ev.seat));
                    break;
                case DrawReason::PendingChain:
                    out_ << fmt::format("{} draws {} (no stack).\n", NameOf(ev.seat), ev.drawn);
                    break;
                case DrawReason::InvalidPenalty:
                    out_ << fmt::format("Invalid move. {} draws one as penalty.\n", NameOf(ev.seat));
                    break;
                case DrawReason::ChallengeUpheld:
                    out_ << fmt::format("Challenge successful - {} draws {}.\n", NameOf(ev.seat), ev.drawn);
                    break;
                case DrawReason::ChallengeFailed:
                    out_ << fmt::format("Challenge failed - {} draws {}.\n", NameOf(ev.seat), ev.drawn);
                    break;
                }
            }
            else if constexpr (std::is_same_v<T, DeckReshuffled>)
            {
                out_ << fmt::format("Discard pile reshuffled into a new draw pile ({} cards).\n",
                                    static_cast<int>(ev.draw_pile));
            }
            else if constexpr (std::is_same_v<T, EffectTriggered>)
            {
                switch (ev.effect)
                {
                case Effect::Skip:          out_ << fmt::format("{} is skipped.\n", NameOf(ev.seat)); break;
                case Effect::Reverse:       out_ << "Direction reversed.\n"; break;
                case Effect::ReverseAsSkip: out_ << "Direction reversed. Reverse acts as skip with 2 players.\n"; break;
                case Effect::DrawStacked:   out_ << fmt::format("Pending draw increased to {}.\n", ev.pending); break;
                case Effect::ColorChosen:   break;
                }
            }
            else if constexpr (std::is_same_v<T, LastCard>)
            {
                out_ << fmt::format("{} says UNO!\n", NameOf(ev.seat));
            }
            else if constexpr (std::is_same_v<T, Challenge>)
            {
                out_ << fmt::format("{} challenges the WILD DRAW FOUR!\n", NameOf(ev.challenger));
            }
            else if constexpr (std::is_same_v<T, MoveRejected>)
            {
                if (ev.violation.code != error::RuleViolationCode::Declared_Invalid)
                    out_ << fmt::format("{}. Turn forfeited.\n", error::to_string(ev.violation.code));
            }
            else
            {
                out_ << fmt::format("\n{} wins!\n", NameOf(ev.seat));
            }
        }, e);
    }
}
