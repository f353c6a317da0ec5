//
// Created on 13/10/2026.
//

#ifndef NOMERCYUNO_DECK_HPP
#define NOMERCYUNO_DECK_HPP

#include <deque>
#include "Types.hpp"

namespace uno::core { class GameImpl; }
namespace uno::core::debug {struct Inspector;}
namespace uno::core
{
    // Owns the draw pile and the discard pile. Front of each deque is the
    // next card to draw / the current top of the discard pile.
    class Deck
    {
    public:
        Deck() = delete;
        // Builds the standard 108 cards and shuffles them.
        explicit Deck(uint64_t seed);
        // Explicit arrangement, used for reproducible scenarios. The seed only
        // drives later reshuffles.
        Deck(std::vector<Card> const& draw, std::vector<Card> const& discard, uint64_t seed);

        //returns nullptr when nothing can be supplied even after recycling the discard pile
        auto Draw() -> CardSP;
        auto Discard(CardSP card) -> void;
        //throws if the discard pile is empty
        auto TopDiscard() const -> Card const&;

        // Draws and discards until a non-wild card is on top.
        auto StartDiscardNonWild() -> void;
        // Keeps the top discard in place and shuffles the rest into a new draw pile.
        auto ReshuffleFromDiscard() -> void;

        auto DrawSize() const noexcept    -> size_t { return draw_.size(); }
        auto DiscardSize() const noexcept -> size_t { return discard_.size(); }
        auto Reshuffles() const noexcept  -> uint32_t { return reshuffles_; }

        // setup counts every card once to fix the table composition
        friend class GameImpl;
        friend struct debug::Inspector;
    private:
        auto BuildStandard() -> void;
    private:
        RngT rng_;
        std::deque<CardSP> draw_;
        std::deque<CardSP> discard_;
        uint32_t reshuffles_{0};
    };
}

#endif //NOMERCYUNO_DECK_HPP
