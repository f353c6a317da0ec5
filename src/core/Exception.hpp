//
// Created on 12/10/2026.
//

#ifndef NOMERCYUNO_EXCEPTION_HPP
#define NOMERCYUNO_EXCEPTION_HPP

#include "OmegaException.hpp"

#include <expected>
#include <stdexcept>
#include <string_view>
#include <utility>
#include <fmt/format.h>
#include "Types.hpp"
#include "Format.hpp"

namespace uno::core::error
{
    enum class Code : unsigned
    {
        Unknown, // unknown error
        Rules, // rules engine misuse (not user invalid move)
        State, // state engine misuse (not user invalid move)
        InvalidAction, // proposed action cannot be applied
        Assertion // internal assertion failed
    };

    struct UnknownError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct RulesError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct StateError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct InvalidActionError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct AssertionError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    [[noreturn]]
    inline auto fail(Code c, std::string msg,
                     std::source_location const& loc = std::source_location::current()) -> void
    {
        switch (c)
        {
        case Code::Unknown: throw UnknownError(std::move(msg), c, loc);
        case Code::Rules: throw RulesError(std::move(msg), c, loc);
        case Code::State: throw StateError(std::move(msg), c, loc);
        case Code::InvalidAction: throw InvalidActionError(std::move(msg), c, loc);
        case Code::Assertion: throw AssertionError(std::move(msg), c, loc);
        }
        throw std::runtime_error(msg);
    }

#define UNO_THROW(code_enum, msg) ::uno::core::error::fail((code_enum), (msg))
#define UNO_ASSERT(cond, msg) do { if(!(cond)) ::uno::core::error::fail(::uno::core::error::Code::Assertion, (msg)); } while(0)

    // Reasons a proposed move is refused. None of these are faults: the engine
    // settles each with a penalty or a forfeited turn.
    enum class RuleViolationCode : std::uint16_t
    {
        // raised by the player itself
        Declared_Invalid,

        // Play
        Play_CardNotInHand,
        Play_DoesNotMatch,
        Play_WildWithoutColor
    };

    // Compact, optional context carried with the violation.
    struct RuleViolation
    {
        RuleViolationCode code{};
        std::optional<PlyrIdxT> actor{};
        std::optional<Card> card{};
        std::optional<Card> top{};
        std::optional<Color> active{};
        std::optional<std::uint16_t> pending{};

        auto with_actor(PlyrIdxT s) -> RuleViolation&
        {
            actor = s;
            return *this;
        }

        auto with_card(Card const& c) -> RuleViolation&
        {
            card.emplace(c);
            return *this;
        }

        auto with_top(Card const& c) -> RuleViolation&
        {
            top.emplace(c);
            return *this;
        }

        auto with_active(Color c) -> RuleViolation&
        {
            active = c;
            return *this;
        }

        auto with_pending(std::uint16_t v) -> RuleViolation&
        {
            pending = v;
            return *this;
        }
    };

    inline auto to_string(RuleViolationCode c) -> std::string_view
    {
        using E = RuleViolationCode;
        switch (c)
        {
        case E::Declared_Invalid: return "Player declared an invalid move";
        case E::Play_CardNotInHand: return "Play: card not in hand";
        case E::Play_DoesNotMatch: return "Play: card does not match top card or active color";
        case E::Play_WildWithoutColor: return "Play: wild played without a standard color";
        }
        return "Unknown";
    }

    inline auto describe(RuleViolation const& v) -> std::string
    {
        // Build a compact, reproducible message for logs/tests.
        auto s = fmt::format("{}", to_string(v.code));
        if (v.actor) s += fmt::format(" | actor=P{}", static_cast<int>(*v.actor));
        if (v.card) s += fmt::format(" | card={}", *v.card);
        if (v.top) s += fmt::format(" | top={}", *v.top);
        if (v.active) s += fmt::format(" | active={}", *v.active);
        if (v.pending) s += fmt::format(" | pending={}", *v.pending);
        return s;
    }

    using ValidateResult = std::expected<void, RuleViolation>;
}

#endif //NOMERCYUNO_EXCEPTION_HPP
