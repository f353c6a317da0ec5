//
// Created on 16/10/2026.
//

//
// main.cpp — console table: one interactive seat against automated players
//

#include <charconv>
#include <cstdint>
#include <cstring>
#include <memory>
#include <string>
#include <vector>

#include <fmt/format.h>

#include "core/Game.hpp"
#include "core/NoMercyRules.hpp"
#include "core/AggressiveAi.hpp"
#include "core/RandomAi.hpp"
#include "core/Exception.hpp"
#include "debug/AuditLogger.hpp"
#include "cli/ConsolePlayer.hpp"
#include "cli/ConsoleView.hpp"

namespace
{
    struct CliConfig
    {
        std::uint32_t n_players{2};
        std::uint64_t seed{std::random_device{}()};
        bool          no_mercy{true};
        bool          human{true};
        bool          random_ai{false};
        std::string   audit_path{};
    };

    auto ParseArgs(int argc, char** argv) -> CliConfig
    {
        CliConfig cfg{};

        for (int i = 1; i < argc; ++i)
        {
            std::string arg = argv[i];

            auto next_uint = [&](std::uint64_t& out)
            {
                if (i + 1 >= argc) { return false; }
                char const* s = argv[++i];
                auto res = std::from_chars(s, s + std::strlen(s), out);
                return res.ec == std::errc{};
            };

            if (arg == "--players")
            {
                std::uint64_t v{};
                if (next_uint(v) && v >= uno::core::constants::MinPlayers && v <= uno::core::constants::MaxPlayers)
                {
                    cfg.n_players = static_cast<std::uint32_t>(v);
                }
            }
            else if (arg == "--seed")
            {
                std::uint64_t v{};
                if (next_uint(v)) { cfg.seed = v; }
            }
            else if (arg == "--no-mercy")
            {
                std::uint64_t v{};
                if (next_uint(v)) { cfg.no_mercy = (v != 0); }
            }
            else if (arg == "--humans")
            {
                std::uint64_t v{};
                if (next_uint(v)) { cfg.human = (v != 0); }
            }
            else if (arg == "--ai")
            {
                if (i + 1 < argc) { cfg.random_ai = (std::string{argv[++i]} == "random"); }
            }
            else if (arg == "--audit")
            {
                if (i + 1 < argc) { cfg.audit_path = argv[++i]; }
            }
        }
        return cfg;
    }
}

int main(int argc, char** argv)
{
    using namespace uno;
    using namespace uno::core;

    CliConfig const cc = ParseArgs(argc, argv);

    Config cfg;
    cfg.n_players = cc.n_players;
    cfg.no_mercy  = cc.no_mercy;
    cfg.seed      = cc.seed;

    std::vector<std::unique_ptr<Player>> players;
    players.reserve(cc.n_players);
    for (std::uint32_t i = 0; i < cc.n_players; ++i)
    {
        if (i == 0 && cc.human)
        {
            players.emplace_back(std::make_unique<cli::ConsolePlayer>("You"));
        }
        else if (cc.random_ai)
        {
            players.emplace_back(std::make_unique<RandomAI>(fmt::format("AI-{}", i), cc.seed + i * 1337u));
        }
        else
        {
            players.emplace_back(std::make_unique<AggressiveAI>(fmt::format("AI-{}", i)));
        }
    }

    GameImpl::SinkList sinks;
    sinks.push_back(std::make_shared<cli::ConsoleView>());
    std::shared_ptr<debug::AuditLogger> audit;
    if (!cc.audit_path.empty())
    {
        audit = std::make_shared<debug::AuditLogger>(cc.audit_path);
        sinks.push_back(audit);
    }

    try
    {
        GameImpl game(cfg, std::make_unique<NoMercyRules>(), std::move(players), std::move(sinks));
        if (audit) audit->start(game);

        game.Run();

        if (audit) audit->end(game);
        fmt::print("\nGame over.\n");
    }
    catch (OmegaException<error::Code> const& e)
    {
        fmt::print(stderr, "{}", e);
        return 1;
    }

    return 0;
}
