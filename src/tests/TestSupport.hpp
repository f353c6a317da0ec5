//
// Created on 16/10/2026.
//

#ifndef NOMERCYUNO_TESTSUPPORT_HPP
#define NOMERCYUNO_TESTSUPPORT_HPP

#include <deque>
#include <memory>
#include <string>
#include <vector>

#include "../core/Game.hpp"
#include "../core/NoMercyRules.hpp"
#include "../core/Events.hpp"
#include "../core/Player.hpp"

namespace uno::test
{
    using namespace uno::core;

    inline auto Red(Rank r) -> Card    { return Card{Color::Red, r}; }
    inline auto Yellow(Rank r) -> Card { return Card{Color::Yellow, r}; }
    inline auto Green(Rank r) -> Card  { return Card{Color::Green, r}; }
    inline auto Blue(Rank r) -> Card   { return Card{Color::Blue, r}; }
    inline auto WildCard() -> Card     { return Card{Color::Wild, Rank::Wild}; }
    inline auto WildFour() -> Card     { return Card{Color::Wild, Rank::WildDrawFour}; }

    inline auto Play(Card const& c, std::optional<Color> color = std::nullopt, bool stack = false) -> Move
    {
        return PlayAction{.card = c, .chosen_color = color, .stack_intent = stack};
    }

    // Replays a fixed list of moves, then draws. Counts how often it was asked.
    class ScriptedPlayer final : public Player
    {
    public:
        ScriptedPlayer(std::string name, std::deque<Move> script, bool always_challenges = false)
            : name_(std::move(name)), script_(std::move(script)), always_challenges_(always_challenges)
        {
        }

        auto ChooseMove(std::shared_ptr<GameSnapshot const> snapshot) -> Move override
        {
            last_snapshot_ = std::move(snapshot);
            ++calls_;
            if (script_.empty()) return DrawAction{};
            Move m = script_.front();
            script_.pop_front();
            return m;
        }

        auto Name() const -> std::string override { return name_; }
        auto AlwaysChallenges() const -> bool override { return always_challenges_; }

        auto Calls() const -> size_t { return calls_; }
        auto LastSnapshot() const -> std::shared_ptr<GameSnapshot const> const& { return last_snapshot_; }

    private:
        std::string name_;
        std::deque<Move> script_;
        bool always_challenges_;
        size_t calls_{0};
        std::shared_ptr<GameSnapshot const> last_snapshot_{};
    };

    class EventRecorder final : public EventSink
    {
    public:
        auto OnEvent(GameEvent const& e) -> void override { events.push_back(e); }

        template <class T>
        auto Count() const -> size_t
        {
            return static_cast<size_t>(std::ranges::count_if(events,
                [](GameEvent const& e) { return std::holds_alternative<T>(e); }));
        }

        template <class T>
        auto All() const -> std::vector<T>
        {
            std::vector<T> out;
            for (GameEvent const& e : events)
                if (auto const* p = std::get_if<T>(&e)) out.push_back(*p);
            return out;
        }

        std::vector<GameEvent> events;
    };

    struct Seat
    {
        std::deque<Move> script;
        bool always_challenges{false};
    };

    // Lays the draw pile out as hands (seat 0 first), then the opening card,
    // then whatever is left to draw. Every hand must have the same size.
    inline auto MakeGame(std::vector<std::vector<Card>> const& hands,
                         Card const& opening,
                         std::vector<Card> const& rest,
                         std::vector<Seat> seats,
                         std::shared_ptr<EventRecorder> recorder = nullptr,
                         bool no_mercy = true) -> GameImpl
    {
        std::vector<Card> draw;
        for (auto const& h : hands) draw.insert(draw.end(), h.begin(), h.end());
        draw.push_back(opening);
        draw.insert(draw.end(), rest.begin(), rest.end());

        Config cfg{};
        cfg.n_players = static_cast<uint32_t>(hands.size());
        cfg.hand_size = static_cast<uint8_t>(hands.front().size());
        cfg.no_mercy = no_mercy;
        cfg.seed = 99;

        std::vector<std::unique_ptr<Player>> players;
        for (size_t i{}; i < seats.size(); ++i)
        {
            players.emplace_back(std::make_unique<ScriptedPlayer>(
                "P" + std::to_string(i), std::move(seats[i].script), seats[i].always_challenges));
        }

        GameImpl::SinkList sinks;
        if (recorder) sinks.push_back(recorder);

        return GameImpl(cfg, Deck{draw, {}, cfg.seed}, std::make_unique<NoMercyRules>(),
                        std::move(players), std::move(sinks));
    }

    inline auto Scripted(GameImpl& g, PlyrIdxT seat) -> ScriptedPlayer*
    {
        return dynamic_cast<ScriptedPlayer*>(g.PlayerAt(seat));
    }

    // A spare run of cards nobody in the scenarios can match by accident.
    inline auto Filler(size_t n) -> std::vector<Card>
    {
        std::vector<Card> out;
        for (size_t i{}; i < n; ++i) out.push_back(Yellow(static_cast<Rank>(1 + i % 9)));
        return out;
    }
}

#endif //NOMERCYUNO_TESTSUPPORT_HPP
