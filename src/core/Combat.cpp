//
// Created by Malik T on 05/10/2025.
//

#include "Combat.hpp"
#include "Exception.hpp"

namespace conquest::core
{
    auto ResolveCombat(ArmyT const attackers, ArmyT const defenders, double const r) -> CombatResult
    {
        CNQ_ASSERT(attackers >= 1 && attackers <= constants::MaxAttackers, "Attacker count out of range");
        CNQ_ASSERT(defenders >= 1 && defenders <= constants::MaxDefenders, "Defender count out of range");

        auto const idx = static_cast<size_t>(attackers - 1);
        CombatResult res{.attacker_losses = 0, .defender_losses = 0, .survivors = attackers};

        if (defenders == 1)
        {
            if (r < constants::SingleWin[idx]) res.defender_losses = 1;
            else res.attacker_losses = 1;
            return res;
        }

        if (r < constants::BothLose[idx])
        {
            res.attacker_losses = 1;
            res.defender_losses = 1;
            --res.survivors;
            return res;
        }

        ArmyT const stake = (attackers == 1) ? 1 : 2;
        if (r < constants::DoubleWin[idx]) res.defender_losses = stake;
        else res.attacker_losses = stake;
        return res;
    }
}
