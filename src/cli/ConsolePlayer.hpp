//
// Created on 16/10/2026.
//

#ifndef NOMERCYUNO_CONSOLEPLAYER_HPP
#define NOMERCYUNO_CONSOLEPLAYER_HPP

#include <iostream>
#include <string>
#include <string_view>

#include "../core/Player.hpp"

namespace uno::cli
{
    // Prompt driven seat. Blocks on the input stream until a well formed answer
    // arrives; rule checks it cannot settle locally are left to the engine.
    class ConsolePlayer final : public core::Player
    {
    public:
        explicit ConsolePlayer(std::string name, std::istream& in = std::cin, std::ostream& out = std::cout);

        auto ChooseMove(std::shared_ptr<core::GameSnapshot const> snapshot) -> core::Move override;
        auto Name() const -> std::string override { return name_; }

    private:
        //re-prompts until a number in [min_v, max_v] is read; throws if input closes
        auto ReadInt(std::string_view prompt, int min_v, int max_v) -> int;
        auto AskColor() -> core::Color;

    private:
        std::string name_;
        std::istream& in_;
        std::ostream& out_;
    };
}

#endif //NOMERCYUNO_CONSOLEPLAYER_HPP
