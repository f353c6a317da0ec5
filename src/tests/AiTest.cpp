//
// Created on 16/10/2026.
//
#include <gtest/gtest.h>

#include "../core/AggressiveAi.hpp"
#include "../core/RandomAi.hpp"
#include "../core/NoMercyRules.hpp"
#include "../core/State.hpp"
#include "TestSupport.hpp"

using namespace uno::core;
using namespace uno::test;

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
        s->hand_counts = {static_cast<uint8_t>(hand.size()), 7};
        s->n_players = 2;
        return s;
    }

    auto AsPlay(Move const& m) -> PlayAction const&
    {
        return std::get<PlayAction>(m);
    }
}

TEST(AggressiveAI, StacksWhenChainPending)
{
    AggressiveAI ai("agg");
    Move const m = ai.ChooseMove(Snap({Blue(Rank::Nine), Green(Rank::DrawTwo)}, Red(Rank::DrawTwo), Color::Red, 2));
    ASSERT_TRUE(std::holds_alternative<PlayAction>(m));
    EXPECT_EQ(AsPlay(m).card, Green(Rank::DrawTwo));
    EXPECT_TRUE(AsPlay(m).stack_intent);
    EXPECT_FALSE(AsPlay(m).chosen_color);
}

TEST(AggressiveAI, DrawsChainRatherThanPlayingPlainCard)
{
    AggressiveAI ai("agg");
    Move const m = ai.ChooseMove(Snap({Red(Rank::Nine), Blue(Rank::One)}, Red(Rank::DrawTwo), Color::Red, 2));
    EXPECT_TRUE(std::holds_alternative<DrawAction>(m));
}

TEST(AggressiveAI, StacksWildFourWithMostHeldColor)
{
    AggressiveAI ai("agg");
    Move const m = ai.ChooseMove(Snap({Yellow(Rank::One), WildFour(), Yellow(Rank::Two)},
                                      Red(Rank::DrawTwo), Color::Red, 2));
    ASSERT_TRUE(std::holds_alternative<PlayAction>(m));
    EXPECT_EQ(AsPlay(m).card, WildFour());
    ASSERT_TRUE(AsPlay(m).chosen_color);
    EXPECT_EQ(*AsPlay(m).chosen_color, Color::Yellow);
}

TEST(AggressiveAI, PrefersActionCards)
{
    AggressiveAI ai("agg");
    Move const m = ai.ChooseMove(Snap({Red(Rank::Three), Blue(Rank::Five), Red(Rank::Skip)},
                                      Red(Rank::Five), Color::Red));
    ASSERT_TRUE(std::holds_alternative<PlayAction>(m));
    EXPECT_EQ(AsPlay(m).card, Red(Rank::Skip));
}

TEST(AggressiveAI, FallsBackToFirstPlayable)
{
    AggressiveAI ai("agg");
    Move const m = ai.ChooseMove(Snap({Green(Rank::One), Blue(Rank::Five), Red(Rank::Three)},
                                      Red(Rank::Five), Color::Red));
    ASSERT_TRUE(std::holds_alternative<PlayAction>(m));
    EXPECT_EQ(AsPlay(m).card, Blue(Rank::Five));
    EXPECT_FALSE(AsPlay(m).stack_intent);
}

TEST(AggressiveAI, LeadsWithWildFourOnlyWhenLegal)
{
    AggressiveAI ai("agg");
    Move const legal = ai.ChooseMove(Snap({WildFour(), Blue(Rank::One)}, Red(Rank::Five), Color::Red));
    ASSERT_TRUE(std::holds_alternative<PlayAction>(legal));
    EXPECT_EQ(AsPlay(legal).card, WildFour());
    EXPECT_TRUE(AsPlay(legal).stack_intent);
    EXPECT_EQ(AsPlay(legal).chosen_color, Color::Blue);

    Move const held = ai.ChooseMove(Snap({Red(Rank::Three), WildFour()}, Red(Rank::Five), Color::Red));
    ASSERT_TRUE(std::holds_alternative<PlayAction>(held));
    EXPECT_EQ(AsPlay(held).card, Red(Rank::Three));
}

TEST(AggressiveAI, DrawsWithNothingPlayable)
{
    AggressiveAI ai("agg");
    EXPECT_TRUE(std::holds_alternative<DrawAction>(
        ai.ChooseMove(Snap({Green(Rank::One), Blue(Rank::Two)}, Red(Rank::Five), Color::Red))));
    EXPECT_TRUE(ai.AlwaysChallenges());
}

TEST(RandomAI, OnlyProposesLegalMoves)
{
    std::vector<Card> const hand{Red(Rank::Three), Green(Rank::DrawTwo), WildCard(), Blue(Rank::Five), WildFour()};
    for (uint64_t seed = 1; seed <= 200; ++seed)
    {
        RandomAI ai("rnd", seed);
        uint16_t const pending = (seed % 2) ? 2 : 0;
        Move const m = ai.ChooseMove(Snap(hand, Red(Rank::DrawTwo), Color::Red, pending));
        ASSERT_TRUE(std::holds_alternative<PlayAction>(m)) << "seed " << seed;

        PlayAction const& p = AsPlay(m);
        EXPECT_NE(std::ranges::find(hand, p.card), hand.end());
        EXPECT_TRUE(NoMercyRules::Matches(p.card, Red(Rank::DrawTwo), Color::Red));
        if (pending > 0) EXPECT_TRUE(IsStackable(p.card.rank));
        if (IsWild(p.card.rank))
        {
            ASSERT_TRUE(p.chosen_color);
            EXPECT_TRUE(IsStandard(*p.chosen_color));
        }
        else
        {
            EXPECT_FALSE(p.chosen_color);
        }
    }
}

TEST(RandomAI, DrawsWhenNothingFits)
{
    RandomAI ai("rnd", 5);
    EXPECT_TRUE(std::holds_alternative<DrawAction>(
        ai.ChooseMove(Snap({Green(Rank::One), Blue(Rank::Two)}, Red(Rank::Five), Color::Red))));
    // a plain match does not answer a chain
    EXPECT_TRUE(std::holds_alternative<DrawAction>(
        ai.ChooseMove(Snap({Red(Rank::One)}, Red(Rank::DrawTwo), Color::Red, 2))));
}
