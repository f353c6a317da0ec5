//
// Created on 12/10/2026.
//

#ifndef NOMERCYUNO_UTIL_HPP
#define NOMERCYUNO_UTIL_HPP

#include <algorithm>
#include <array>
#include <span>
#include <memory>
#include "OmegaException.hpp"



namespace uno::core::util
{
    // true if any zone slot holds a null card
    inline auto any_invalid(std::span<CardSP const> cards) -> bool
    {
        return std::ranges::any_of(cards, [](CardSP const& p) { return !p; });
    }

    inline constexpr size_t CardUIDCount = constants::ColorCount * constants::RankCount;

    inline auto CardToUID(Card const& c) -> size_t
    {
        return static_cast<size_t>(c.color) * constants::RankCount + static_cast<size_t>(c.rank);
    }

    // Multiset of card faces, compared against the standard 108-card composition.
    class CompositionCounter
    {
    public:
        CompositionCounter() : counts_{} {}

        auto Add(Card const& c) -> void { ++counts_[CardToUID(c)]; }

        [[nodiscard]]
        auto Count(Card const& c) const -> uint16_t { return counts_[CardToUID(c)]; }

        [[nodiscard]]
        auto Total() const -> size_t
        {
            size_t total{};
            for (auto const n : counts_) total += n;
            return total;
        }

        [[nodiscard]]
        auto operator==(CompositionCounter const& o) const -> bool { return counts_ == o.counts_; }

        // one 0, two of 1..9 and of each action rank per color; four of each wild rank
        static auto Standard() -> CompositionCounter
        {
            CompositionCounter c;
            for (Color const color : constants::StandardColors)
            {
                c.counts_[CardToUID(Card{color, Rank::Zero})] = 1;
                for (size_t r{std::to_underlying(Rank::One)}; r <= std::to_underlying(Rank::DrawTwo); ++r)
                {
                    c.counts_[CardToUID(Card{color, static_cast<Rank>(r)})] = 2;
                }
            }
            c.counts_[CardToUID(Card{Color::Wild, Rank::Wild})] = 4;
            c.counts_[CardToUID(Card{Color::Wild, Rank::WildDrawFour})] = 4;
            return c;
        }

    private:
        std::array<uint16_t, CardUIDCount> counts_;
    };
}

#endif //NOMERCYUNO_UTIL_HPP
