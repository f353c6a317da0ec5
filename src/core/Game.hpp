//
// Created on 12/10/2026.
//

#ifndef NOMERCYUNO_GAME_HPP
#define NOMERCYUNO_GAME_HPP

#include <algorithm>
#include <random>
#include <span>
#include <string>
#include "Types.hpp"
#include "Actions.hpp"
#include "State.hpp"
#include "Rules.hpp"
#include "Player.hpp"
#include "Deck.hpp"
#include "Hand.hpp"
#include "Events.hpp"
#include "Util.hpp"

namespace uno::core::debug {struct Inspector;}
namespace uno::core
{
    class GameImpl
    {
    public:
        using SinkList = std::vector<std::shared_ptr<EventSink>>;

        GameImpl() = delete;
        GameImpl(Config const& config,
                 std::unique_ptr<Rules> rules,
                 std::vector<std::unique_ptr<Player>> players,
                 SinkList sinks = {});
        // Deals from a prepared deck instead of a freshly shuffled one.
        GameImpl(Config const& config,
                 Deck deck,
                 std::unique_ptr<Rules> rules,
                 std::vector<std::unique_ptr<Player>> players,
                 SinkList sinks = {});

        // One state-machine step: ask current player for a move, validate/apply/advance.
        auto Step() -> MoveOutcome;
        // Steps until someone wins and returns the winning seat.
        auto Run() -> PlyrIdxT;
        auto SnapshotFor(PlyrIdxT seat) const -> std::shared_ptr<GameSnapshot const>;
        auto Subscribe(std::shared_ptr<EventSink> sink) -> void;

        auto Current() const noexcept       -> PlyrIdxT { return current_idx_; }
        auto Direction() const noexcept     -> int8_t  { return direction_; }
        auto ActiveColor() const noexcept   -> Color   { return active_color_; }
        auto PendingDraw() const noexcept   -> uint16_t { return pending_draw_; }
        auto NoMercy() const noexcept       -> bool    { return cfg_.no_mercy; }
        auto PlayerCount() const noexcept   -> size_t  { return players_.size(); }
        auto Winner() const noexcept        -> std::optional<PlyrIdxT> { return winner_; }
        auto IsOver() const noexcept        -> bool    { return winner_.has_value(); }
        auto Seed() const noexcept          -> uint64_t { return cfg_.seed; }
        auto TopDiscard() const             -> Card const& { return deck_.TopDiscard(); }
        auto HandOf(PlyrIdxT seat) const    -> Hand const& { return hands_.at(seat); }
        auto HandSize(PlyrIdxT seat) const  -> size_t { return hands_.at(seat).Size(); }
        auto DeckRef() const noexcept       -> Deck const& { return deck_; }
        auto PlayerAt(PlyrIdxT seat)        -> Player* { return players_.at(seat).get(); }

        //allows class to directly access private data on an instance
        friend class NoMercyRules;
        friend struct debug::Inspector;

        // Draws up to count cards into seat's hand, notifying subscribers. Returns cards drawn.
        auto DrawInto(PlyrIdxT seat, size_t count, DrawReason reason) -> size_t;
        // Single card straight from the deck, nullptr if none can be supplied.
        auto DrawFromDeck() -> CardSP;
        // Moves the card from seat's hand onto the discard pile. Throws if it is not held.
        auto MoveHandToDiscard(PlyrIdxT seat, Card const& c) -> void;
        auto AdvanceTurn(size_t steps) -> void;
        auto Reverse() -> void;
        auto NextSeat(PlyrIdxT from) const -> PlyrIdxT;
        auto Emit(GameEvent const& e) -> void;

    private:
        auto Setup() -> void;
        auto DealInitialHands() -> void;
        auto HandCounts() const -> std::vector<uint8_t>;
    private:
        Config cfg_;
        std::unique_ptr<Rules> rules_;
        std::vector<std::unique_ptr<Player>> players_;
        SinkList sinks_;

        // Authoritative state
        Deck deck_;                 // owns draw and discard piles
        std::vector<Hand> hands_;   // [seat] owns cards in hand
        util::CompositionCounter composition_; // every card in play, fixed after setup

        // Turn state
        PlyrIdxT current_idx_{0};
        PlyrIdxT actor_{0};           // seat that acted in the step being resolved
        int8_t   direction_{1};
        Color    active_color_{Color::Red};
        uint16_t pending_draw_{0};
        uint8_t  turn_steps_{1};      // set by Apply/Penalize, consumed by Advance
        std::optional<PlyrIdxT> winner_{};
    };
}
#endif //NOMERCYUNO_GAME_HPP
