//
// Created by Malik T on 19/08/2025.
//

#ifndef CONQUESTGAME_INVARIANTS_HPP
#define CONQUESTGAME_INVARIANTS_HPP

#include "../core/Game.hpp"
#include "Inspector.hpp"
#include <algorithm>
#include <ranges>
#include <vector>

namespace conquest::core::debug
{
    // A second layer of checks. Several counters (armies, cards, bonuses, elimination) depend
    // on each other, so every one of them is re-derived here from scratch. Throws AssertionError.
    inline auto CheckInvariants(Game const& g) -> void
    {
#if CNQ_ENABLE_TEST_HOOKS == false
        (void)g;
#else
    Inspector::SnapshotAll const s = Inspector::Gather(g);
    bool const claiming = (s.stage == Stage::Claim);

    // 1) Territory cells: armies >= 0, empty <=> unowned, unowned only while claiming
    ArmyT unowned = 0;
    for (TerritoryInfo const& t : s.territories)
    {
        CNQ_ASSERT(t.armies >= 0, "Negative army count");
        CNQ_ASSERT((t.armies == 0) == !t.owner.has_value(), "Army count and ownership disagree");
        if (!t.owner.has_value())
        {
            CNQ_ASSERT(claiming, "Unowned territory outside the claim stage");
            ++unowned;
        }
        else
        {
            CNQ_ASSERT(*t.owner < s.players.size(), "Territory owned by unknown player");
        }
    }
    if (claiming) CNQ_ASSERT(unowned == s.unclaimed, "Unclaimed counter out of sync");

    // 2) Per player counters match the board
    ArmyT owned_sum = 0;
    for (PlayerState const& p : s.players)
    {
        auto const owned = static_cast<ArmyT>(std::ranges::count_if(s.territories, [&](TerritoryInfo const& t)
        {
            return t.owner.has_value() && *t.owner == p.index;
        }));
        CNQ_ASSERT(owned == p.owned_territories, "Owned territory count out of sync for " + p.name);
        CNQ_ASSERT(Inspector::FreshBonus(g, p.index) == p.continent_bonus, "Stale region bonus for " + p.name);
        CNQ_ASSERT(p.draft_armies >= 0, "Negative draft armies for " + p.name);
        CNQ_ASSERT(p.single_star_cards >= 0 && p.double_star_cards >= 0, "Negative card count for " + p.name);
        CNQ_ASSERT(!p.defeated || p.owned_territories == 0, "Defeated player still owns territory");
        if (!claiming)
            CNQ_ASSERT(p.defeated == (p.owned_territories == 0), "Player without territory is not defeated");
        owned_sum += owned;
    }
    if (!claiming)
        CNQ_ASSERT(owned_sum == static_cast<ArmyT>(s.territory_count), "Owned territories do not cover the map");

    // 3) Card conservation
    {
        CardPiles const& c = s.piles;
        CNQ_ASSERT(c.draw_single >= 0 && c.draw_double >= 0 && c.discard_single >= 0 && c.discard_double >= 0,
                   "Negative card pile");
        int32_t singles = c.draw_single + c.discard_single;
        int32_t doubles = c.draw_double + c.discard_double;
        for (PlayerState const& p : s.players)
        {
            singles += p.single_star_cards;
            doubles += p.double_star_cards;
        }
        CNQ_ASSERT(singles == constants::SingleStarCardTotal, "Single-star cards not conserved");
        CNQ_ASSERT(doubles == constants::DoubleStarCardTotal, "Double-star cards not conserved");
    }

    // 4) Stage local state
    CNQ_ASSERT(s.stage != Stage::Initializing, "Initializing stage is observable");
    CNQ_ASSERT((s.stage == Stage::Invade) == s.invasion.has_value(), "Pending invasion outside the invade stage");
    if (s.invasion)
    {
        TerritoryInfo const& from = s.territories.at(s.invasion->from);
        TerritoryInfo const& to = s.territories.at(s.invasion->to);
        CNQ_ASSERT(from.owner == s.current && to.owner == s.current, "Invasion between foreign territories");
        CNQ_ASSERT(from.armies > 1, "Invasion source has no armies to move");
    }

    auto const undefeated = std::ranges::count_if(s.players, [](PlayerState const& p) { return !p.defeated; });
    CNQ_ASSERT((s.stage == Stage::Finished) == (undefeated == 1), "Finished stage and survivors disagree");
    if (s.stage != Stage::Finished)
        CNQ_ASSERT(!s.players.at(s.current).defeated, "Defeated player holds the turn");

#endif // CNQ_ENABLE_TEST_HOOKS == true
    }
}
#endif //CONQUESTGAME_INVARIANTS_HPP
