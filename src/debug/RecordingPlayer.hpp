//
// Created on 15/10/2026.
//

#ifndef NOMERCYUNO_RECORDINGPLAYER_HPP
#define NOMERCYUNO_RECORDINGPLAYER_HPP

#include <memory>
#include <utility>
#include <vector>

#include "../core/Player.hpp"

namespace uno::core::debug
{
    // Forwards to a wrapped player and keeps what it proposed, so a transcript
    // can show the move next to the engine's verdict.
    class RecordingPlayer final : public Player
    {
    public:
        struct Tally
        {
            size_t plays{0};
            size_t stack_plays{0};
            size_t draws{0};
            size_t invalid{0};
        };

        explicit RecordingPlayer(std::unique_ptr<Player> inner)
            : inner_{std::move(inner)}
        {
        }

        auto ChooseMove(std::shared_ptr<GameSnapshot const> s) -> Move override
        {
            last_move_ = inner_->ChooseMove(std::move(s));
            has_last_ = true;
            ++calls_;

            if (auto const* play = std::get_if<PlayAction>(&last_move_))
            {
                ++tally_.plays;
                if (play->stack_intent) ++tally_.stack_plays;
            }
            else if (std::holds_alternative<DrawAction>(last_move_)) ++tally_.draws;
            else ++tally_.invalid;

            return last_move_;
        }

        auto Name() const -> std::string override { return inner_->Name(); }
        auto AlwaysChallenges() const -> bool override { return inner_->AlwaysChallenges(); }

        auto HasLast() const -> bool { return has_last_; }
        auto Last() const -> Move const& { return last_move_; }
        auto Calls() const -> size_t { return calls_; }
        auto Counts() const -> Tally const& { return tally_; }

    private:
        std::unique_ptr<Player> inner_;
        Move last_move_{DrawAction{}};
        bool has_last_{false};
        size_t calls_{0};
        Tally tally_{};
    };

    inline auto WrapRecording(std::vector<std::unique_ptr<Player>>& players)
        -> std::vector<std::unique_ptr<Player>>
    {
        std::vector<std::unique_ptr<Player>> out;
        out.reserve(players.size());
        for (auto& p : players) out.emplace_back(std::make_unique<RecordingPlayer>(std::move(p)));
        return out;
    }

    //only valid for seats wrapped with WrapRecording
    inline auto AsRecording(Player* p) -> RecordingPlayer*
    {
        return dynamic_cast<RecordingPlayer*>(p);
    }
}

#endif //NOMERCYUNO_RECORDINGPLAYER_HPP
