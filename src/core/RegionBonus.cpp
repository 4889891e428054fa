//
// Created by Malik T on 04/10/2025.
//

#include "RegionBonus.hpp"

#include <algorithm>

namespace conquest::core
{
    auto ComputeRegionBonus(Geography const& geo,
                            TerritoryStore const& territories,
                            PlayerState const& player) -> ArmyT
    {
        ArmyT bonus{0};
        for (Region const& region : geo.Regions())
        {
            // cannot hold the region with fewer territories than it has
            if (static_cast<size_t>(player.owned_territories) < region.territories.size()) continue;

            bool const owns_all = std::ranges::all_of(region.territories, [&](TerrIdxT const t)
            {
                return territories.IsOwnedBy(t, player.index);
            });
            if (owns_all) bonus += region.bonus;
        }
        return bonus;
    }
}
