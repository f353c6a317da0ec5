//
// Created on 13/10/2026.
//
#include "Deck.hpp"

#include <algorithm>
#include <iterator>
#include <vector>

#include "Exception.hpp"

namespace uno::core
{
    Deck::Deck(uint64_t const seed) :
        rng_{seed}
    {
        BuildStandard();
        UNO_ASSERT(draw_.size() == constants::DeckSize, "Standard deck did not produce 108 cards");
    }

    Deck::Deck(std::vector<Card> const& draw, std::vector<Card> const& discard, uint64_t const seed) :
        rng_{seed}
    {
        for (Card const& c : draw) draw_.emplace_back(std::make_shared<Card const>(c));
        for (Card const& c : discard) discard_.emplace_back(std::make_shared<Card const>(c));
    }

    auto Deck::BuildStandard() -> void
    {
        std::vector<CardSP> cards;
        cards.reserve(constants::DeckSize);
        for (Color const color : constants::StandardColors)
        {
            cards.emplace_back(std::make_shared<Card const>(color, Rank::Zero));
            for (size_t i{}; i < 2; ++i)
            {
                for (size_t r{std::to_underlying(Rank::One)}; r <= std::to_underlying(Rank::DrawTwo); ++r)
                {
                    cards.emplace_back(std::make_shared<Card const>(color, static_cast<Rank>(r)));
                }
            }
        }
        for (size_t i{}; i < 4; ++i)
        {
            cards.emplace_back(std::make_shared<Card const>(Color::Wild, Rank::Wild));
            cards.emplace_back(std::make_shared<Card const>(Color::Wild, Rank::WildDrawFour));
        }
        std::ranges::shuffle(cards, rng_);
        draw_.assign(std::make_move_iterator(cards.begin()), std::make_move_iterator(cards.end()));
    }

    auto Deck::Draw() -> CardSP
    {
        if (draw_.empty()) ReshuffleFromDiscard();
        if (draw_.empty()) return nullptr;

        CardSP card = std::move(draw_.front());
        draw_.pop_front();
        return card;
    }

    auto Deck::Discard(CardSP card) -> void
    {
        UNO_ASSERT(card, "Discarding a null card");
        discard_.push_front(std::move(card));
    }

    auto Deck::TopDiscard() const -> Card const&
    {
        UNO_ASSERT(!discard_.empty(), "Top of discard requested before any card was discarded");
        return *discard_.front();
    }

    auto Deck::StartDiscardNonWild() -> void
    {
        while (true)
        {
            CardSP card = Draw();
            if (!card)
                UNO_THROW(error::Code::State, "Deck exhausted while seeding the opening discard");
            bool const wild = IsWild(card->rank);
            Discard(std::move(card));
            if (!wild) break;
        }
    }

    auto Deck::ReshuffleFromDiscard() -> void
    {
        if (discard_.empty()) return;

        CardSP top = std::move(discard_.front());
        discard_.pop_front();

        std::vector<CardSP> rest(std::make_move_iterator(discard_.begin()), std::make_move_iterator(discard_.end()));
        discard_.clear();
        std::ranges::shuffle(rest, rng_);
        draw_.insert(draw_.end(), std::make_move_iterator(rest.begin()), std::make_move_iterator(rest.end()));
        discard_.push_front(std::move(top));
        if (!rest.empty()) ++reshuffles_;
    }
}
