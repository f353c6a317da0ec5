#include "AuditLogger.hpp"

#include <string_view>
#include <vector>
#include <fmt/format.h>

#include "../core/Format.hpp"

using namespace uno::core;

namespace
{

auto s_move(Move const& m) -> std::string
{
    return std::visit(
        [&]<typename T0>(T0 const& act) -> std::string
        {
            using T = std::decay_t<T0>;

            if constexpr (std::is_same_v<T, PlayAction>)
            {
                std::string s = fmt::format("Play({}", act.card);
                if (act.chosen_color) s += fmt::format(" as {}", *act.chosen_color);
                if (act.stack_intent) s += " stack";
                return s + ")";
            }
            else if constexpr (std::is_same_v<T, DrawAction>)
            {
                return "Draw";
            }
            else
            {
                return "Invalid";
            }
        },
        m
    );
}

auto s_reason(DrawReason const r) -> std::string_view
{
    switch (r)
    {
        case DrawReason::Voluntary:       return "voluntary";
        case DrawReason::PendingChain:    return "chain";
        case DrawReason::InvalidPenalty:  return "penalty";
        case DrawReason::ChallengeUpheld: return "challenge-upheld";
        case DrawReason::ChallengeFailed: return "challenge-failed";
    }
    return "?";
}

auto s_effect(Effect const e) -> std::string_view
{
    switch (e)
    {
        case Effect::Skip:          return "skip";
        case Effect::Reverse:       return "reverse";
        case Effect::ReverseAsSkip: return "reverse-as-skip";
        case Effect::DrawStacked:   return "draw-stacked";
        case Effect::ColorChosen:   return "color";
    }
    return "?";
}

auto s_counts(std::vector<uint8_t> const& counts) -> std::string
{
    std::string body;
    for (size_t i{}; i < counts.size(); ++i)
    {
        body += fmt::format("{}{}:{}", (i ? "," : ""), i, static_cast<int>(counts[i]));
    }
    return body;
}

auto s_event(GameEvent const& e) -> std::string
{
    return std::visit(
        [&]<typename T0>(T0 const& ev) -> std::string
        {
            using T = std::decay_t<T0>;

            if constexpr (std::is_same_v<T, GameStarted>)
            {
                return fmt::format("Started players={} seed={} nomercy={}", ev.names.size(), ev.seed, ev.no_mercy);
            }
            else if constexpr (std::is_same_v<T, OpeningCard>)
            {
                return fmt::format("Opening card={} active={}", ev.card, ev.active);
            }
            else if constexpr (std::is_same_v<T, TurnStarted>)
            {
                return fmt::format("Turn actor=P{} pending={} hands=[{}]", static_cast<int>(ev.seat), ev.pending,
                                   s_counts(ev.hand_counts));
            }
            else if constexpr (std::is_same_v<T, CardPlayed>)
            {
                return fmt::format("Played P{} {}{}{}", static_cast<int>(ev.seat), ev.card,
                                   ev.chosen ? fmt::format(" as {}", *ev.chosen) : std::string{},
                                   ev.auto_played ? " (auto)" : "");
            }
            else if constexpr (std::is_same_v<T, CardsDrawn>)
            {
                return fmt::format("Drew P{} {}/{} reason={}", static_cast<int>(ev.seat), ev.drawn, ev.requested,
                                   s_reason(ev.reason));
            }
            else if constexpr (std::is_same_v<T, DeckReshuffled>)
            {
                return fmt::format("Reshuffled draw={}", static_cast<int>(ev.draw_pile));
            }
            else if constexpr (std::is_same_v<T, EffectTriggered>)
            {
                std::string s = fmt::format("Effect {} seat=P{}", s_effect(ev.effect), static_cast<int>(ev.seat));
                if (ev.effect == Effect::DrawStacked) s += fmt::format(" pending={}", ev.pending);
                if (ev.color) s += fmt::format(" color={}", *ev.color);
                return s;
            }
            else if constexpr (std::is_same_v<T, LastCard>)
            {
                return fmt::format("LastCard P{}", static_cast<int>(ev.seat));
            }
            else if constexpr (std::is_same_v<T, Challenge>)
            {
                return fmt::format("Challenge P{} -> P{} upheld={}", static_cast<int>(ev.challenger),
                                   static_cast<int>(ev.target), ev.upheld);
            }
            else if constexpr (std::is_same_v<T, MoveRejected>)
            {
                return fmt::format("Rejected P{}: {}", static_cast<int>(ev.seat), error::describe(ev.violation));
            }
            else
            {
                return fmt::format("Won P{}", static_cast<int>(ev.seat));
            }
        },
        e
    );
}

} // anonymous namespace

namespace uno::core::debug
{

AuditLogger::AuditLogger(std::string path)
    : out_(std::move(path), std::ios::out | std::ios::trunc)
{
}

AuditLogger::~AuditLogger() = default;

auto AuditLogger::write(std::string const& line) -> void
{
    out_ << line << '\n';
    ++lines_;
}

auto AuditLogger::OnEvent(GameEvent const& e) -> void
{
    write(s_event(e));
}

auto AuditLogger::start(GameImpl const& game) -> void
{
    write(fmt::format("Seed={}", game.Seed()));
    write(fmt::format("Players={}", static_cast<int>(game.PlayerCount())));
    write(fmt::format("NoMercy={}", game.NoMercy()));
    write(fmt::format("Top={} Active={}", game.TopDiscard(), game.ActiveColor()));
    out_.flush();
}

auto AuditLogger::turn(std::uint8_t const actor, Move const& m) -> void
{
    write(fmt::format("Action: P{} {}", static_cast<int>(actor), s_move(m)));
}

auto AuditLogger::outcome(MoveOutcome const m) -> void
{
    char const* txt =
        (m == MoveOutcome::Applied   ? "Applied" :
        (m == MoveOutcome::GameEnded ? "GameEnded" : "Invalid"));
    write(fmt::format("Outcome: {}", txt));
}

auto AuditLogger::end(GameImpl const& game) -> void
{
    std::string body;

    for (std::uint8_t i = 0; i < game.PlayerCount(); ++i)
    {
        body += fmt::format("{}{}:{}", (i ? "," : ""), static_cast<int>(i), game.HandSize(i));
    }

    int const winner = game.Winner() ? static_cast<int>(*game.Winner()) : -1;
    write(fmt::format("Winner={} handsizes=[{}]", winner, body));
    out_.flush();
}

auto AuditLogger::flush() -> void
{
    out_.flush();
}

} // namespace uno::core::debug
