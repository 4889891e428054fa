//
// Created by Malik T on 15/08/2025.
//

#ifndef CONQUESTGAME_RULES_HPP
#define CONQUESTGAME_RULES_HPP

#include "Actions.hpp"
#include "Types.hpp"
#include "Exception.hpp"

namespace conquest::core
{
    //forward declaration
    class Game;

    class Rules
    {
    public:
        using CheckResult = error::ValidateResult;

        virtual ~Rules() = default;

        // Returns unexpected(reason) for ordinary rule violations (NOT exceptions).
        // Throw only for engine misuse / broken invariants.
        virtual auto Validate(Game const& game, PlayerAction const& a) const -> CheckResult = 0;

        // Mutate authoritative state and run any stage transition. Only called after Validate passed.
        virtual auto Apply(Game& game, PlayerAction const& a) -> MoveOutcome = 0;
    };
}

#endif //CONQUESTGAME_RULES_HPP
