//
// Created by Malik T on 05/10/2025.
//

#ifndef CONQUESTGAME_COMBAT_HPP
#define CONQUESTGAME_COMBAT_HPP

#include <array>
#include "Types.hpp"

namespace conquest::core
{
    namespace constants
    {
        inline constexpr ArmyT MaxAttackers = 3;
        inline constexpr ArmyT MaxDefenders = 2;

        // Indexed by attackers - 1. Closed form best-case dice outcomes instead of rolling.
        // Chance the attacker wins against one defender.
        inline constexpr std::array<double, 3> SingleWin{15.0 / 36, 125.0 / 216, 855.0 / 1296};
        // Chance the attacker wins against two defenders when it is not a mutual loss.
        inline constexpr std::array<double, 3> DoubleWin{55.0 / 216, 715.0 / 1296, 5501.0 / 7776};
        // Chance both sides lose one army against two defenders.
        inline constexpr std::array<double, 3> BothLose{0.0, 420.0 / 1296, 2611.0 / 7776};
    }

    struct CombatResult
    {
        ArmyT attacker_losses{0};
        ArmyT defender_losses{0};
        // Attacking armies still committed, moved in on capture
        ArmyT survivors{0};
    };

    // Resolves one attack using a single uniform draw r in [0,1).
    // Counts are assumed validated: attackers in [1,3], defenders in [1,2].
    auto ResolveCombat(ArmyT attackers, ArmyT defenders, double r) -> CombatResult;
}

#endif //CONQUESTGAME_COMBAT_HPP
