//
// Created by Malik T on 04/10/2025.
//

#ifndef CONQUESTGAME_REGIONBONUS_HPP
#define CONQUESTGAME_REGIONBONUS_HPP

#include "Geography.hpp"
#include "TerritoryStore.hpp"
#include "Types.hpp"

namespace conquest::core
{
    // Sum of the bonuses of every region the player owns outright.
    auto ComputeRegionBonus(Geography const& geo,
                            TerritoryStore const& territories,
                            PlayerState const& player) -> ArmyT;

    // Recomputes and caches the bonus; call after every change to owned_territories.
    inline auto RefreshRegionBonus(Geography const& geo,
                                   TerritoryStore const& territories,
                                   PlayerState& player) -> void
    {
        player.continent_bonus = ComputeRegionBonus(geo, territories, player);
    }
}

#endif //CONQUESTGAME_REGIONBONUS_HPP
