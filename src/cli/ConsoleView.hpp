//
// Created on 16/10/2026.
//

#ifndef NOMERCYUNO_CONSOLEVIEW_HPP
#define NOMERCYUNO_CONSOLEVIEW_HPP

#include <iostream>
#include <string>
#include <vector>

#include "../core/Events.hpp"

namespace uno::cli
{
    // Renders engine events as the table talk a player would hear.
    class ConsoleView final : public core::EventSink
    {
    public:
        explicit ConsoleView(std::ostream& out = std::cout);

        auto OnEvent(core::GameEvent const& e) -> void override;

    private:
        auto NameOf(core::PlyrIdxT seat) const -> std::string;

    private:
        std::ostream& out_;
        std::vector<std::string> names_;
    };
}

#endif //NOMERCYUNO_CONSOLEVIEW_HPP
