//
// Created on 13/10/2026.
//
#include "Hand.hpp"

#include <algorithm>
#include <utility>

#include "Deck.hpp"
#include "Exception.hpp"
#include "NoMercyRules.hpp"

namespace uno::core
{
    auto Hand::Draw(Deck& deck, size_t const count) -> size_t
    {
        size_t drawn{};
        for (size_t i{}; i < count; ++i)
        {
            CardSP card = deck.Draw();
            if (!card) break;
            cards_.push_back(std::move(card));
            ++drawn;
        }
        return drawn;
    }

    auto Hand::Add(CardSP card) -> void
    {
        UNO_ASSERT(card, "Adding a null card to a hand");
        cards_.push_back(std::move(card));
    }

    auto Hand::Take(Card const& c) -> CardSP
    {
        auto const it = std::ranges::find_if(cards_, [&c](CardSP const& csp) { return *csp == c; });
        if (it == std::end(cards_)) return nullptr;
        CardSP card = std::move(*it);
        cards_.erase(it);
        return card;
    }

    auto Hand::Find(Card const& c) const -> CardSP
    {
        auto const it = std::ranges::find_if(cards_, [&c](CardSP const& csp) { return *csp == c; });
        return (it != std::cend(cards_)) ? *it : CardSP{};
    }

    auto Hand::HasPlayable(Card const& top, Color const active) const -> bool
    {
        return std::ranges::any_of(cards_, [&](CardSP const& c) { return NoMercyRules::Matches(*c, top, active); });
    }

    auto Hand::CountColor(Color const color) const -> size_t
    {
        return std::ranges::count_if(cards_, [color](CardSP const& c) { return c->color == color; });
    }

    auto Hand::HasNonWildColor(Color const color) const -> bool
    {
        return std::ranges::any_of(cards_, [color](CardSP const& c)
        {
            return !IsWild(c->rank) && c->color == color;
        });
    }

    auto Hand::MostHeldColor() const -> Color
    {
        Color best = constants::StandardColors.front();
        size_t best_count = CountColor(best);
        for (Color const color : constants::StandardColors)
        {
            size_t const n = CountColor(color);
            if (n > best_count)
            {
                best = color;
                best_count = n;
            }
        }
        return best;
    }

    auto Hand::Cards() const -> std::vector<Card>
    {
        std::vector<Card> out;
        out.reserve(cards_.size());
        for (CardSP const& c : cards_) out.push_back(*c);
        return out;
    }
}
