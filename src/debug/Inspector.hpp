//
// Created by Malik T on 19/08/2025.
//

#ifndef CONQUESTGAME_INSPECTOR_HPP
#define CONQUESTGAME_INSPECTOR_HPP

#include <cstdint>
#include <optional>
#include <vector>

#include "../core/Types.hpp"
#include "../core/Game.hpp"
#include "../core/RegionBonus.hpp"

namespace conquest::core::debug
{
    struct Inspector
    {
        struct SnapshotAll
        {
            Stage stage{};
            PlyrIdxT current{};
            std::vector<TerritoryInfo> territories;
            std::vector<PlayerState> players;
            CardPiles piles{};
            std::optional<PendingInvasion> invasion{};
            ArmyT unclaimed{};
            size_t territory_count{};
        };

        static inline auto Gather(Game const& g) -> SnapshotAll
        {
            SnapshotAll ret{};
            ret.stage = g.stage_;
            ret.current = g.turns_.Current();
            ret.territories.assign(g.territories_.All().begin(), g.territories_.All().end());
            ret.players = g.players_;
            ret.piles = g.cards_.Piles();
            ret.invasion = g.invasion_;
            ret.unclaimed = g.unclaimed_;
            ret.territory_count = g.geo_->TerritoryCount();
            return ret;
        }

        // Bonus the player should have right now, bypassing the cached value.
        static inline auto FreshBonus(Game const& g, PlyrIdxT const p) -> ArmyT
        {
            return ComputeRegionBonus(*g.geo_, g.territories_, g.players_.at(p));
        }
    };
}

#endif //CONQUESTGAME_INSPECTOR_HPP
