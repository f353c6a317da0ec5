//
// Created on 16/10/2026.
//
#include <gtest/gtest.h>

#include <sstream>

#include "../cli/ConsolePlayer.hpp"
#include "../cli/ConsoleView.hpp"
#include "../core/Exception.hpp"
#include "../core/State.hpp"
#include "TestSupport.hpp"

using namespace uno::core;
using namespace uno::test;
using uno::cli::ConsolePlayer;
using uno::cli::ConsoleView;

namespace
{
    auto Snap(std::vector<Card> const& hand, Card const& top, Color active, uint16_t pending = 0)
        -> std::shared_ptr<GameSnapshot const>
    {
        auto s = std::make_shared<GameSnapshot>();
        s->top = top;
        s->active_color = active;
        s->pending_draw = pending;
        for (Card const& c : hand) s->my_hand.Add(std::make_shared<Card const>(c));
        return s;
    }

    auto Contains(std::string const& hay, std::string const& needle) -> bool
    {
        return hay.find(needle) != std::string::npos;
    }
}

TEST(ConsolePlayer, ZeroDraws)
{
    std::istringstream in("0\n");
    std::ostringstream out;
    ConsolePlayer p("You", in, out);

    Move const m = p.ChooseMove(Snap({Blue(Rank::Nine)}, Red(Rank::Five), Color::Red));
    EXPECT_TRUE(std::holds_alternative<DrawAction>(m));
    EXPECT_TRUE(Contains(out.str(), "Top: [RED 5] Active color: RED"));
    EXPECT_TRUE(Contains(out.str(), " 1) BLUE 9"));
}

TEST(ConsolePlayer, RepromptsUntilNumberInRange)
{
    std::istringstream in("abc\n7\n  \n2\n");
    std::ostringstream out;
    ConsolePlayer p("You", in, out);

    Move const m = p.ChooseMove(Snap({Blue(Rank::Nine), Red(Rank::Two)}, Red(Rank::Five), Color::Red));
    ASSERT_TRUE(std::holds_alternative<PlayAction>(m));
    EXPECT_EQ(std::get<PlayAction>(m).card, Red(Rank::Two));
    EXPECT_FALSE(std::get<PlayAction>(m).stack_intent);

    std::string const text = out.str();
    size_t hits{};
    for (size_t pos = text.find("Enter a number between 0 and 2."); pos != std::string::npos;
         pos = text.find("Enter a number between 0 and 2.", pos + 1))
        ++hits;
    EXPECT_EQ(hits, 3u);
}

TEST(ConsolePlayer, WildAsksForColor)
{
    std::istringstream in("1\n9\n4\n");
    std::ostringstream out;
    ConsolePlayer p("You", in, out);

    Move const m = p.ChooseMove(Snap({WildCard(), Blue(Rank::Nine)}, Red(Rank::Five), Color::Red));
    ASSERT_TRUE(std::holds_alternative<PlayAction>(m));
    EXPECT_EQ(std::get<PlayAction>(m).card, WildCard());
    EXPECT_EQ(std::get<PlayAction>(m).chosen_color, Color::Blue);
    EXPECT_TRUE(Contains(out.str(), "Choose color: 1) RED  2) YELLOW  3) GREEN  4) BLUE"));
}

TEST(ConsolePlayer, NonMatchingCardIsInvalid)
{
    std::istringstream in("1\n");
    std::ostringstream out;
    ConsolePlayer p("You", in, out);

    Move const m = p.ChooseMove(Snap({Blue(Rank::Nine)}, Red(Rank::Five), Color::Red));
    EXPECT_TRUE(std::holds_alternative<InvalidAction>(m));
    EXPECT_TRUE(Contains(out.str(), "Illegal play."));
}

TEST(ConsolePlayer, PlainCardAgainstChainIsInvalid)
{
    std::istringstream in("1\n");
    std::ostringstream out;
    ConsolePlayer p("You", in, out);

    Move const m = p.ChooseMove(Snap({Red(Rank::Nine)}, Red(Rank::DrawTwo), Color::Red, 2));
    EXPECT_TRUE(std::holds_alternative<InvalidAction>(m));
    EXPECT_TRUE(Contains(out.str(), "Pending draw to you: 2"));
    EXPECT_TRUE(Contains(out.str(), "You must stack"));
}

TEST(ConsolePlayer, ClosedInputThrows)
{
    std::istringstream in("");
    std::ostringstream out;
    ConsolePlayer p("You", in, out);

    EXPECT_THROW((void)p.ChooseMove(Snap({Red(Rank::Nine)}, Red(Rank::Five), Color::Red)),
                 error::InvalidActionError);
    EXPECT_FALSE(p.AlwaysChallenges());
}

TEST(ConsoleView, RendersTableTalk)
{
    std::ostringstream out;
    ConsoleView view(out);

    view.OnEvent(GameStarted{.names = {"You", "AI-1"}, .seed = 1, .no_mercy = true});
    view.OnEvent(OpeningCard{.card = Red(Rank::Five), .active = Color::Red});
    view.OnEvent(CardPlayed{.seat = 1, .card = WildFour(), .chosen = Color::Green});
    view.OnEvent(EffectTriggered{.effect = Effect::DrawStacked, .seat = 0, .pending = 4});
    view.OnEvent(CardsDrawn{.seat = 0, .requested = 4, .drawn = 4, .reason = DrawReason::PendingChain});
    view.OnEvent(CardPlayed{.seat = 0, .card = Green(Rank::Two), .auto_played = true});
    view.OnEvent(LastCard{.seat = 1});
    view.OnEvent(Challenge{.challenger = 0, .target = 1, .upheld = false});
    view.OnEvent(GameWon{.seat = 1});

    std::string const text = out.str();
    EXPECT_TRUE(Contains(text, "Players: [You, AI-1]"));
    EXPECT_TRUE(Contains(text, "Starting card: RED 5 | Active color: RED"));
    EXPECT_TRUE(Contains(text, "AI-1 plays: WILD_DRAW_FOUR -> color set to GREEN"));
    EXPECT_TRUE(Contains(text, "Pending draw increased to 4."));
    EXPECT_TRUE(Contains(text, "You draws 4 (no stack)."));
    EXPECT_TRUE(Contains(text, "You auto-plays drawn card: GREEN 2"));
    EXPECT_TRUE(Contains(text, "AI-1 says UNO!"));
    EXPECT_TRUE(Contains(text, "You challenges the WILD DRAW FOUR!"));
    EXPECT_TRUE(Contains(text, "AI-1 wins!"));
}

TEST(ConsoleView, ReportsForfeitButNotDeclaredInvalid)
{
    std::ostringstream out;
    ConsoleView view(out);

    view.OnEvent(MoveRejected{.seat = 0, .violation = {.code = error::RuleViolationCode::Declared_Invalid}});
    EXPECT_TRUE(out.str().empty());

    view.OnEvent(MoveRejected{.seat = 0, .violation = {.code = error::RuleViolationCode::Play_DoesNotMatch}});
    EXPECT_TRUE(Contains(out.str(), "Turn forfeited."));
}

TEST(ConsoleView, NamesTheCardDrawn)
{
    std::ostringstream out;
    ConsoleView view(out);

    view.OnEvent(GameStarted{.names = {"You", "AI-1"}, .seed = 1, .no_mercy = true});
    view.OnEvent(CardsDrawn{.seat = 0, .requested = 1, .drawn = 1, .reason = DrawReason::Voluntary,
                            .single = Blue(Rank::Seven)});
    EXPECT_TRUE(Contains(out.str(), "You draws: BLUE 7"));

    view.OnEvent(CardsDrawn{.seat = 1, .requested = 1, .drawn = 0, .reason = DrawReason::Voluntary});
    EXPECT_TRUE(Contains(out.str(), "AI-1 tries to draw but the deck is empty."));
}
