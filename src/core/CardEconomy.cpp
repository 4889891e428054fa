//
// Created by Malik T on 04/10/2025.
//

#include "CardEconomy.hpp"

#include <algorithm>

namespace
{
    inline auto Viol(conquest::core::error::RuleViolationCode code) -> conquest::core::error::RuleViolation
    {
        return conquest::core::error::RuleViolation{ .code = code };
    }
}

namespace conquest::core
{
    auto CardEconomy::Reshuffle() noexcept -> void
    {
        piles_.draw_single += piles_.discard_single;
        piles_.draw_double += piles_.discard_double;
        piles_.discard_single = 0;
        piles_.discard_double = 0;
    }

    auto CardEconomy::GiveCard(PlayerState& player, RandomSource& rng) -> bool
    {
        if (piles_.draw_single + piles_.draw_double == 0) Reshuffle();

        int32_t const total = piles_.draw_single + piles_.draw_double;
        if (total == 0) return false;

        if (rng.NextBelow(static_cast<uint32_t>(total)) < static_cast<uint32_t>(piles_.draw_single))
        {
            --piles_.draw_single;
            ++player.single_star_cards;
        }
        else
        {
            --piles_.draw_double;
            ++player.double_star_cards;
        }
        return true;
    }

    auto CardEconomy::CheckTradeIn(PlayerState const& player, int32_t const stars) -> error::ValidateResult
    {
        using RVC = error::RuleViolationCode;

        int32_t const max_stars = std::min(constants::MaxTradeStars, player.Stars());
        if (stars < constants::MinTradeStars || stars > max_stars)
            return std::unexpected(Viol(RVC::TradeIn_StarsOutOfRange)
                                   .with_actor(player.index).with_attempted(stars).with_limit(max_stars));

        // double cards alone only ever add up to an even total
        if (player.single_star_cards == 0 && (stars & 1) != 0)
            return std::unexpected(Viol(RVC::TradeIn_OddWithoutSingles)
                                   .with_actor(player.index).with_attempted(stars));
        return {};
    }

    auto CardEconomy::TradeIn(PlayerState& player, int32_t const stars) -> ArmyT
    {
        CNQ_ASSERT(CheckTradeIn(player, stars).has_value(), "TradeIn applied without validation");

        int32_t const doubles = std::min(stars / 2, player.double_star_cards);
        int32_t const singles = stars - doubles * 2;
        CNQ_ASSERT(singles <= player.single_star_cards, "Not enough single-star cards for trade");

        player.double_star_cards -= doubles;
        player.single_star_cards -= singles;
        piles_.discard_double += doubles;
        piles_.discard_single += singles;

        ArmyT const bonus = constants::ArmiesForStars[static_cast<size_t>(stars - constants::MinTradeStars)];
        player.draft_armies += bonus;
        return bonus;
    }

    auto CardEconomy::TransferAll(PlayerState& from, PlayerState& to) noexcept -> void
    {
        to.single_star_cards += from.single_star_cards;
        to.double_star_cards += from.double_star_cards;
        from.single_star_cards = 0;
        from.double_star_cards = 0;
    }

    auto CardEconomy::ArmiesForStars(int32_t const stars) -> error::ActionResult<ArmyT>
    {
        if (stars < constants::MinTradeStars || stars > constants::MaxTradeStars)
            return std::unexpected(Viol(error::RuleViolationCode::Stars_OutOfRange).with_attempted(stars));
        return constants::ArmiesForStars[static_cast<size_t>(stars - constants::MinTradeStars)];
    }
}
