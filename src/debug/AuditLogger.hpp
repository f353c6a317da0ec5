//
// Created on 15/10/2026.
//

#ifndef NOMERCYUNO_AUDITLOGGER_HPP
#define NOMERCYUNO_AUDITLOGGER_HPP

#include <cstdint>
#include <fstream>
#include <string>

#include "../core/Game.hpp"
#include "../core/Events.hpp"
#include "../core/Actions.hpp"
#include "../core/Types.hpp"

namespace uno::core::debug
{
    // Line oriented transcript of a game. Subscribe it to a game to record every
    // event; the turn/outcome calls add what the test loop knows on top of that.
    class AuditLogger final : public EventSink
    {
    public:
        explicit AuditLogger(std::string path);
        ~AuditLogger() override;

        AuditLogger(AuditLogger const&) = delete;
        auto operator=(AuditLogger const&) -> AuditLogger& = delete;

        auto OnEvent(GameEvent const& e) -> void override;

        // Session header (seed, players, rule toggle, opening card)
        auto start(GameImpl const& game) -> void;

        // Per turn (after Step): actor seat and the move it proposed
        auto turn(std::uint8_t actor, Move const& m) -> void;

        // Per step outcome
        auto outcome(MoveOutcome m) -> void;

        // Game end footer (winner seat and final hand sizes)
        auto end(GameImpl const& game) -> void;

        // Manual flush
        auto flush() -> void;

        auto Lines() const noexcept -> size_t { return lines_; }

    private:
        auto write(std::string const& line) -> void;

    private:
        std::ofstream out_;
        size_t lines_{0};
    };
}

#endif //NOMERCYUNO_AUDITLOGGER_HPP
