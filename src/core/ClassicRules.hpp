//
// Created by Malik T on 15/08/2025.
//

#ifndef CONQUESTGAME_CLASSICRULES_HPP
#define CONQUESTGAME_CLASSICRULES_HPP
#include "Rules.hpp"

namespace conquest::core
{
    class ClassicRules final : public Rules
    {
    public:
        auto Validate(Game const& game, PlayerAction const& a) const -> CheckResult override;
        auto Apply(Game& game, PlayerAction const& a) -> MoveOutcome override;

    private:
        static auto ApplyAttack(Game& game, AttackAction const& act) -> MoveOutcome;
    };
}

#endif //CONQUESTGAME_CLASSICRULES_HPP
