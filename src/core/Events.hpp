//
// Created on 14/10/2026.
//

#ifndef NOMERCYUNO_EVENTS_HPP
#define NOMERCYUNO_EVENTS_HPP

#include <string>
#include "Types.hpp"
#include "Exception.hpp"

namespace uno::core
{
    enum class DrawReason : uint8_t
    {
        Voluntary,       // plain DRAW with no chain pending
        PendingChain,    // absorbing an unanswered DRAW_TWO / WILD_DRAW_FOUR chain
        InvalidPenalty,  // player declared an invalid move
        ChallengeUpheld, // illegal WILD_DRAW_FOUR caught
        ChallengeFailed  // challenged a legal WILD_DRAW_FOUR
    };

    enum class Effect : uint8_t
    {
        Skip,
        Reverse,
        ReverseAsSkip,
        DrawStacked,
        ColorChosen
    };

    struct GameStarted   { std::vector<std::string> names; uint64_t seed{}; bool no_mercy{}; };
    struct OpeningCard   { Card card; Color active; };
    struct TurnStarted   { PlyrIdxT seat{}; std::vector<uint8_t> hand_counts; uint16_t pending{}; };
    struct CardPlayed    { PlyrIdxT seat{}; Card card; std::optional<Color> chosen{}; bool auto_played{}; };
    struct CardsDrawn    { PlyrIdxT seat{}; uint16_t requested{}; uint16_t drawn{}; DrawReason reason{};
                           std::optional<Card> single{}; };
    struct DeckReshuffled{ uint8_t draw_pile{}; };
    struct EffectTriggered { Effect effect{}; PlyrIdxT seat{}; uint16_t pending{}; std::optional<Color> color{}; };
    struct LastCard      { PlyrIdxT seat{}; };
    struct Challenge     { PlyrIdxT challenger{}; PlyrIdxT target{}; bool upheld{}; };
    struct MoveRejected  { PlyrIdxT seat{}; error::RuleViolation violation; };
    struct GameWon       { PlyrIdxT seat{}; };

    using GameEvent = std::variant<
      GameStarted, OpeningCard, TurnStarted, CardPlayed, CardsDrawn, DeckReshuffled,
      EffectTriggered, LastCard, Challenge, MoveRejected, GameWon>;

    // Presentation layers (console, transcript, tests) subscribe to the engine
    // through this. Delivered synchronously, in the order state changed.
    class EventSink
    {
    public:
        virtual ~EventSink() = default;
        virtual auto OnEvent(GameEvent const& e) -> void = 0;
    };
}

#endif //NOMERCYUNO_EVENTS_HPP
