//
// Created by Malik T on 04/10/2025.
//

#ifndef CONQUESTGAME_CARDECONOMY_HPP
#define CONQUESTGAME_CARDECONOMY_HPP

#include <array>
#include "Exception.hpp"
#include "Random.hpp"
#include "Types.hpp"

namespace conquest::core::debug {struct Rig;}
namespace conquest::core
{
    namespace constants
    {
        // Bonus armies for trading in 2..10 stars
        inline constexpr std::array<ArmyT, 9> ArmiesForStars{2, 4, 7, 10, 13, 17, 21, 25, 30};
    }

    struct CardPiles
    {
        int32_t draw_single{constants::SingleStarCardTotal};
        int32_t draw_double{constants::DoubleStarCardTotal};
        int32_t discard_single{0};
        int32_t discard_double{0};
    };

    // Draw and discard piles of star cards. Every card is always in exactly one pile or one hand.
    class CardEconomy
    {
    public:
        CardEconomy() = default;

        // Deals one card to the player, reshuffling the discards when the draw piles are empty.
        // Returns false (and changes nothing) when no card is left anywhere.
        auto GiveCard(PlayerState& player, RandomSource& rng) -> bool;

        static auto CheckTradeIn(PlayerState const& player, int32_t stars) -> error::ValidateResult;

        // Spends double cards first. Returns the bonus armies added to the player's draft pool.
        auto TradeIn(PlayerState& player, int32_t stars) -> ArmyT;

        // All cards of a defeated player go to the one who defeated them.
        static auto TransferAll(PlayerState& from, PlayerState& to) noexcept -> void;

        static auto ArmiesForStars(int32_t stars) -> error::ActionResult<ArmyT>;

        auto Piles() const noexcept -> CardPiles const& { return piles_; }

    private:
        auto Reshuffle() noexcept -> void;

    private:
        CardPiles piles_{};

        friend struct debug::Rig;
    };
}

#endif //CONQUESTGAME_CARDECONOMY_HPP
