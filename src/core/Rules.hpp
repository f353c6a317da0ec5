//
// Created on 12/10/2026.
//

#ifndef NOMERCYUNO_RULES_HPP
#define NOMERCYUNO_RULES_HPP

#include "Actions.hpp"
#include "Types.hpp"
#include "Exception.hpp"

namespace uno::core
{
    //forward declaration
    class GameImpl;

    class Rules
    {
    public:
        using CheckResult = error::ValidateResult;

        virtual ~Rules() = default;

        // Applies the opening discard's effect once, before anyone acts.
        virtual auto Open(GameImpl& game) -> void = 0;

        // Returns unexpected(reason) for ordinary rule violations (NOT exceptions).
        // Throw only for engine misuse / broken invariants.
        virtual auto Validate(GameImpl const& game, Move const& m) const -> CheckResult = 0;

        // Settles a refused move (penalty draw or forfeited turn).
        virtual auto Penalize(GameImpl& game, error::RuleViolation const& v) -> void = 0;

        // Mutate authoritative state (move shared_ptr<Card const> deck <-> hand <-> discard).
        virtual auto Apply(GameImpl& game, Move const& m) -> void = 0;

        virtual auto Advance(GameImpl& game) -> MoveOutcome = 0;
    };
}

#endif //NOMERCYUNO_RULES_HPP
