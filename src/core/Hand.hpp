//
// Created on 13/10/2026.
//

#ifndef NOMERCYUNO_HAND_HPP
#define NOMERCYUNO_HAND_HPP

#include "Types.hpp"

namespace uno::core
{
    class Deck;

    // Cards held by one seat. Order is display order only.
    class Hand
    {
    public:
        Hand() = default;

        //Draws up to count cards, stopping quietly when the deck runs dry.
        //Returns how many were actually drawn.
        auto Draw(Deck& deck, size_t count) -> size_t;
        auto Add(CardSP card) -> void;
        //removes the first card equal to c, nullptr if none
        auto Take(Card const& c) -> CardSP;
        //returns nullptr if doesnt exist
        auto Find(Card const& c) const -> CardSP;
        auto Contains(Card const& c) const -> bool { return static_cast<bool>(Find(c)); }

        auto HasPlayable(Card const& top, Color active) const -> bool;
        auto CountColor(Color color) const -> size_t;
        auto HasNonWildColor(Color color) const -> bool;
        // Most held standard color, ties go to the earlier of RED, YELLOW, GREEN, BLUE.
        auto MostHeldColor() const -> Color;

        auto Size() const noexcept  -> size_t { return cards_.size(); }
        auto Empty() const noexcept -> bool { return cards_.empty(); }
        auto Pointers() const noexcept -> std::vector<CardSP> const& { return cards_; }
        auto Cards() const -> std::vector<Card>;

    private:
        std::vector<CardSP> cards_;
    };
}

#endif //NOMERCYUNO_HAND_HPP
