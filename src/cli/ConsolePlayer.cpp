//
// Created on 16/10/2026.
//
#include "ConsolePlayer.hpp"

#include <charconv>
#include <utility>
#include <fmt/format.h>

#include "../core/Exception.hpp"
#include "../core/Format.hpp"
#include "../core/NoMercyRules.hpp"

namespace uno::cli
{
    using namespace uno::core;

    ConsolePlayer::ConsolePlayer(std::string name, std::istream& in, std::ostream& out) :
        name_(std::move(name)), in_(in), out_(out) {}

    auto ConsolePlayer::ChooseMove(std::shared_ptr<GameSnapshot const> snapshot) -> Move
    {
        UNO_ASSERT(snapshot, "Null snapshot handed to ConsolePlayer");
        GameSnapshot const& s = *snapshot;
        std::vector<Card> const hand = s.my_hand.Cards();

        out_ << fmt::format("\nYour turn. Top: [{}] Active color: {}\n", s.top, s.active_color);
        out_ << "Your hand:\n";
        for (size_t i{}; i < hand.size(); ++i)
        {
            out_ << fmt::format("  {:2d}) {}\n", i + 1, hand[i]);
        }
        if (s.pending_draw > 0)
        {
            out_ << fmt::format("Pending draw to you: {} (stackable with DRAW_TWO or WILD_DRAW_FOUR)\n",
                                s.pending_draw);
        }

        int const choice = ReadInt("Choose a card number to play, or 0 to draw: ", 0, static_cast<int>(hand.size()));
        if (choice == 0) return DrawAction{};

        Card const chosen = hand[static_cast<size_t>(choice - 1)];
        if (!NoMercyRules::Matches(chosen, s.top, s.active_color))
        {
            out_ << "Illegal play. You must match color/rank or play a wild.\n";
            return InvalidAction{};
        }

        std::optional<Color> color{};
        if (IsWild(chosen.rank)) color = AskColor();

        if (s.pending_draw > 0 && !IsStackable(chosen.rank))
        {
            out_ << "You must stack with DRAW_TWO or WILD_DRAW_FOUR, or draw.\n";
            return InvalidAction{};
        }
        return PlayAction{.card = chosen, .chosen_color = color, .stack_intent = false};
    }

    auto ConsolePlayer::ReadInt(std::string_view const prompt, int const min_v, int const max_v) -> int
    {
        while (true)
        {
            out_ << prompt;
            out_.flush();

            std::string line;
            if (!std::getline(in_, line))
                UNO_THROW(error::Code::InvalidAction, "Input closed while waiting for a move");

            auto const first = line.find_first_not_of(" \t\r");
            auto const last = line.find_last_not_of(" \t\r");
            if (first != std::string::npos)
            {
                std::string_view const trimmed{line.data() + first, last - first + 1};
                int v{};
                auto const res = std::from_chars(trimmed.data(), trimmed.data() + trimmed.size(), v);
                if (res.ec == std::errc{} && res.ptr == trimmed.data() + trimmed.size() && v >= min_v && v <= max_v)
                    return v;
            }
            out_ << fmt::format("Enter a number between {} and {}.\n", min_v, max_v);
        }
    }

    auto ConsolePlayer::AskColor() -> Color
    {
        out_ << "Choose color: 1) RED  2) YELLOW  3) GREEN  4) BLUE\n";
        int const c = ReadInt("> ", 1, 4);
        return constants::StandardColors[static_cast<size_t>(c - 1)];
    }
}
