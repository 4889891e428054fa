//
// Created by Malik T on 14/08/2025.
//

#ifndef CONQUESTGAME_STATE_HPP
#define CONQUESTGAME_STATE_HPP

#include <optional>
#include <vector>
#include "CardEconomy.hpp"
#include "Types.hpp"

namespace conquest::core
{
    // Immutable copy of the public state, handed to UI code
    struct GameSnapshot
    {
        Stage stage{Stage::Initializing};
        PlyrIdxT current_player{};

        std::vector<TerritoryInfo> territories;
        std::vector<PlayerState> players;

        CardPiles piles{};
        std::optional<PendingInvasion> invasion{};
        ArmyT unclaimed{};
    };

} // namespace conquest::core

#endif //CONQUESTGAME_STATE_HPP
