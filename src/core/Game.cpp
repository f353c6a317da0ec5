//
// Created on 12/10/2026.
//
#include "Game.hpp"
#include <ranges>

#include "Util.hpp"
#include <utility>

namespace uno::core
{
    GameImpl::GameImpl(Config const& config,
                       std::unique_ptr<Rules> rules,
                       std::vector<std::unique_ptr<Player>> players,
                       SinkList sinks) :
        GameImpl(config, Deck{config.seed}, std::move(rules), std::move(players), std::move(sinks))
    {
    }

    GameImpl::GameImpl(Config const& config,
                       Deck deck,
                       std::unique_ptr<Rules> rules,
                       std::vector<std::unique_ptr<Player>> players,
                       SinkList sinks) :
        cfg_(config),
        rules_(std::move(rules)),
        players_(std::move(players)),
        sinks_(std::move(sinks)),
        deck_(std::move(deck)),
        hands_(players_.size())
    {
        UNO_ASSERT(rules_, "Null rules in core");
        UNO_ASSERT(players_.size() >= constants::MinPlayers, "Less than 2 players while initalising core");
        UNO_ASSERT(players_.size() <= constants::MaxPlayers, "More than 10 players while initalising core");
        UNO_ASSERT(!std::ranges::any_of(players_,
                                        [](std::unique_ptr<Player> const& p) { return !p; }), "Invalid player in core");
        UNO_ASSERT(!std::ranges::any_of(sinks_,
                                        [](std::shared_ptr<EventSink> const& s) { return !s; }), "Invalid sink in core");
        cfg_.n_players = static_cast<uint32_t>(players_.size());
        Setup();
    }

    auto GameImpl::Setup() -> void
    {
        std::vector<std::string> names;
        names.reserve(players_.size());
        for (auto const& p : players_) names.push_back(p->Name());
        Emit(GameStarted{.names = std::move(names), .seed = cfg_.seed, .no_mercy = cfg_.no_mercy});

        DealInitialHands();
        deck_.StartDiscardNonWild();
        active_color_ = deck_.TopDiscard().color;

        for (CardSP const& c : deck_.draw_) composition_.Add(*c);
        for (CardSP const& c : deck_.discard_) composition_.Add(*c);
        for (Hand const& h : hands_)
            for (CardSP const& c : h.Pointers()) composition_.Add(*c);

        Emit(OpeningCard{.card = deck_.TopDiscard(), .active = active_color_});
        rules_->Open(*this);
    }

    auto GameImpl::DealInitialHands() -> void
    {
        size_t const target = cfg_.hand_size;
        UNO_ASSERT(target * hands_.size() < deck_.DrawSize(), "Less cards in deck than required to init player hands");
        //will not deal round robin as with a randomly shuffled deck
        //dealing order should not matter.
        for (auto& hand : hands_)
        {
            size_t const drawn = hand.Draw(deck_, target);
            UNO_ASSERT(drawn == target, "Deck ran dry while dealing");
        }
    }

    auto GameImpl::Subscribe(std::shared_ptr<EventSink> sink) -> void
    {
        UNO_ASSERT(sink, "Subscribing a null sink");
        sinks_.push_back(std::move(sink));
    }

    auto GameImpl::Emit(GameEvent const& e) -> void
    {
        for (auto const& sink : sinks_) sink->OnEvent(e);
    }

    auto GameImpl::HandCounts() const -> std::vector<uint8_t>
    {
        std::vector<uint8_t> counts;
        counts.reserve(hands_.size());
        for (Hand const& h : hands_) counts.push_back(static_cast<uint8_t>(h.Size()));
        return counts;
    }

    auto GameImpl::SnapshotFor(PlyrIdxT const seat) const -> std::shared_ptr<GameSnapshot const>
    {
        std::shared_ptr<GameSnapshot> snap = std::make_shared<GameSnapshot>();
        snap->seat = seat;
        snap->current_idx = current_idx_;
        snap->n_players = static_cast<uint8_t>(players_.size());
        snap->direction = direction_;
        snap->top = deck_.TopDiscard();
        snap->active_color = active_color_;
        snap->pending_draw = pending_draw_;
        snap->no_mercy = cfg_.no_mercy;
        snap->my_hand = hands_.at(seat);
        snap->hand_counts = HandCounts();
        snap->draw_pile = static_cast<uint8_t>(deck_.DrawSize());
        snap->discard_pile = static_cast<uint8_t>(deck_.DiscardSize());
        return snap;
    }

    auto GameImpl::DrawFromDeck() -> CardSP
    {
        uint32_t const before = deck_.Reshuffles();
        CardSP card = deck_.Draw();
        if (deck_.Reshuffles() != before)
            Emit(DeckReshuffled{.draw_pile = static_cast<uint8_t>(deck_.DrawSize() + (card ? 1 : 0))});
        return card;
    }

    auto GameImpl::DrawInto(PlyrIdxT const seat, size_t const count, DrawReason const reason) -> size_t
    {
        // card by card so a recycle is reported at the moment it happens
        size_t drawn{};
        for (; drawn < count; ++drawn)
        {
            CardSP card = DrawFromDeck();
            if (!card) break;
            hands_.at(seat).Add(std::move(card));
        }
        Emit(CardsDrawn{.seat = seat,
                        .requested = static_cast<uint16_t>(count),
                        .drawn = static_cast<uint16_t>(drawn),
                        .reason = reason});
        return drawn;
    }

    auto GameImpl::MoveHandToDiscard(PlyrIdxT const seat, Card const& c) -> void
    {
        CardSP card = hands_.at(seat).Take(c);
        if (!card)
            UNO_THROW(error::Code::State, "Card to discard is not in hand");
        deck_.Discard(std::move(card));
    }

    auto GameImpl::NextSeat(PlyrIdxT const from) const -> PlyrIdxT
    {
        auto const n = static_cast<int>(players_.size());
        return static_cast<PlyrIdxT>(((static_cast<int>(from) + direction_) % n + n) % n);
    }

    auto GameImpl::AdvanceTurn(size_t const steps) -> void
    {
        for (size_t i{}; i < steps; ++i) current_idx_ = NextSeat(current_idx_);
    }

    auto GameImpl::Reverse() -> void
    {
        direction_ = static_cast<int8_t>(-direction_);
    }

    auto GameImpl::Step() -> MoveOutcome
    {
        if (winner_)
            UNO_THROW(error::Code::State, "Step called after the game has been won");

        actor_ = current_idx_;
        turn_steps_ = 1;
        Emit(TurnStarted{.seat = actor_, .hand_counts = HandCounts(), .pending = pending_draw_});

        Move const move = players_[actor_]->ChooseMove(SnapshotFor(actor_));

        if (auto const ok = rules_->Validate(*this, move); !ok.has_value())
        {
            Emit(MoveRejected{.seat = actor_, .violation = ok.error()});
            rules_->Penalize(*this, ok.error());
            (void)rules_->Advance(*this);
            return MoveOutcome::Invalid;
        }
        rules_->Apply(*this, move);
        return rules_->Advance(*this);
    }

    auto GameImpl::Run() -> PlyrIdxT
    {
        while (Step() != MoveOutcome::GameEnded)
        {
        }
        return *winner_;
    }
}
