//
// Created on 16/10/2026.
//
#include <gtest/gtest.h>

#include "../core/Hand.hpp"
#include "../core/Deck.hpp"
#include "TestSupport.hpp"

using namespace uno::core;
using namespace uno::test;

namespace
{
    auto HandOf(std::vector<Card> const& cards) -> Hand
    {
        Hand h;
        for (Card const& c : cards) h.Add(std::make_shared<Card const>(c));
        return h;
    }
}

TEST(Hand, DrawStopsQuietlyWhenDeckRunsDry)
{
    Deck deck({Red(Rank::One), Red(Rank::Two)}, {}, 1);
    Hand h;
    EXPECT_EQ(h.Draw(deck, 5), 2u);
    EXPECT_EQ(h.Size(), 2u);
    EXPECT_EQ(deck.DrawSize(), 0u);
    EXPECT_EQ(h.Draw(deck, 1), 0u);
}

TEST(Hand, TakeRemovesOneCopyOnly)
{
    Hand h = HandOf({Blue(Rank::Two), Red(Rank::Skip), Blue(Rank::Two)});
    EXPECT_TRUE(h.Contains(Blue(Rank::Two)));
    EXPECT_FALSE(h.Contains(Green(Rank::Two)));

    CardSP const taken = h.Take(Blue(Rank::Two));
    ASSERT_TRUE(taken);
    EXPECT_EQ(*taken, Blue(Rank::Two));
    EXPECT_EQ(h.Size(), 2u);
    EXPECT_TRUE(h.Contains(Blue(Rank::Two)));

    EXPECT_EQ(h.Take(Green(Rank::Nine)), nullptr);
    EXPECT_EQ(h.Size(), 2u);
    EXPECT_EQ(h.Find(Yellow(Rank::Zero)), nullptr);
}

TEST(Hand, PlayableAndColorQueries)
{
    Hand h = HandOf({Blue(Rank::Two), Red(Rank::Skip), WildCard()});
    EXPECT_TRUE(h.HasPlayable(Green(Rank::Nine), Color::Green)); // the wild
    EXPECT_EQ(h.CountColor(Color::Blue), 1u);
    EXPECT_EQ(h.CountColor(Color::Green), 0u);
    EXPECT_TRUE(h.HasNonWildColor(Color::Red));
    EXPECT_FALSE(h.HasNonWildColor(Color::Yellow));

    Hand plain = HandOf({Blue(Rank::Two), Red(Rank::Skip)});
    EXPECT_FALSE(plain.HasPlayable(Green(Rank::Nine), Color::Green));
    EXPECT_TRUE(plain.HasPlayable(Green(Rank::Skip), Color::Green));
}

TEST(Hand, MostHeldColorBreaksTiesInFixedOrder)
{
    EXPECT_EQ(HandOf({Green(Rank::One), Yellow(Rank::Two)}).MostHeldColor(), Color::Yellow);
    EXPECT_EQ(HandOf({Blue(Rank::One), Blue(Rank::Two), Red(Rank::Three)}).MostHeldColor(), Color::Blue);
    EXPECT_EQ(HandOf({WildCard(), WildFour()}).MostHeldColor(), Color::Red);
    EXPECT_EQ(Hand{}.MostHeldColor(), Color::Red);
    EXPECT_EQ(NoMercyRules::AutoColor(HandOf({WildCard(), Green(Rank::Four)})), Color::Green);
}
