//
// Created on 15/10/2026.
//

#ifndef NOMERCYUNO_INVARIANTS_HPP
#define NOMERCYUNO_INVARIANTS_HPP

#include "../core/Game.hpp"
#include "../core/Exception.hpp"
#include "../core/Util.hpp"
#include "Inspector.hpp"
#include <span>
#include <unordered_set>
#include <vector>

namespace uno::core::debug
{
    // A second layer of checks run by tests after every step. Throws AssertionError
    // on the first broken invariant.
    inline auto CheckInvariants(GameImpl const& g) -> void
    {
#if UNO_ENABLE_TEST_HOOKS == false
        (void)g;
#else
    Inspector::SnapshotAll const s = Inspector::Gather(g);

    // 1) Zones never hold null cards
    UNO_ASSERT(!util::any_invalid(std::span<CardSP const>{s.deck}), "Null card in draw pile");
    UNO_ASSERT(!util::any_invalid(std::span<CardSP const>{s.discard}), "Null card in discard pile");
    for (auto const& h : s.hands)
        UNO_ASSERT(!util::any_invalid(std::span<CardSP const>{h}), "Null card in hand");

    // 2) A starting discard is always present
    UNO_ASSERT(!s.discard.empty(), "Discard pile empty after setup");

    // 3) Turn state in range
    UNO_ASSERT(s.current_idx < s.n_players, "Current seat out of range");
    UNO_ASSERT(s.direction == 1 || s.direction == -1, "Direction must be +1 or -1");
    UNO_ASSERT(IsStandard(s.active_color), "Active color is not a standard color");

    // 4) Deep: no card object in two zones, and the multiset of faces never changes
    {
        std::unordered_set<Card const*> seen;
        seen.reserve(s.composition.Total());
        util::CompositionCounter now{};

        auto push_unique = [&](CardSP const& p)
        {
            bool const inserted = seen.insert(p.get()).second;
            UNO_ASSERT(inserted, "Duplicate card pointer across zones");
            now.Add(*p);
        };

        for (auto const& p : s.deck)    push_unique(p);
        for (auto const& p : s.discard) push_unique(p);
        for (auto const& h : s.hands) for (auto const& p : h) push_unique(p);

        UNO_ASSERT(seen.size() == s.composition.Total(), "Materialized card count changed");
        UNO_ASSERT(now == s.composition, "Card composition changed");
    }
#endif // UNO_ENABLE_TEST_HOOKS == true
    }

    // Standard games must additionally hold exactly the 108-card deck.
    inline auto IsStandardComposition(GameImpl const& g) -> bool
    {
        return Inspector::Gather(g).composition == util::CompositionCounter::Standard();
    }
}
#endif //NOMERCYUNO_INVARIANTS_HPP
