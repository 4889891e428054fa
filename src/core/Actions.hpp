//
// Created by Malik T on 14/08/2025.
//

#ifndef CONQUESTGAME_ACTIONS_HPP
#define CONQUESTGAME_ACTIONS_HPP

#include <variant>
#include "Types.hpp"

namespace conquest::core
{
    struct ClaimAction    { TerrIdxT territory{}; };
    struct PopulateAction { TerrIdxT territory{}; };
    struct DraftAction    { TerrIdxT territory{}; ArmyT count{}; };
    struct AttackAction
    {
        TerrIdxT from{};
        TerrIdxT to{};
        ArmyT attackers{};
        ArmyT defenders{};
    };
    struct InvadeAction   { ArmyT count{}; };
    struct ManeuverAction
    {
        TerrIdxT from{};
        TerrIdxT to{};
        ArmyT count{};
    };
    struct SkipAction     {};
    struct TradeInAction  { int32_t stars{}; };

    using PlayerAction = std::variant<
      ClaimAction, PopulateAction, DraftAction, AttackAction,
      InvadeAction, ManeuverAction, SkipAction, TradeInAction>;

    enum class MoveOutcome : uint8_t
    {
        Applied,
        Captured, // an attack took the defending territory
        GameEnded
    };
} // namespace conquest::core

#endif //CONQUESTGAME_ACTIONS_HPP
