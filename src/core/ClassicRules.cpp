//
// Created by Malik T on 15/08/2025.
//

#include "ClassicRules.hpp"

#include "CardEconomy.hpp"
#include "Combat.hpp"
#include "Game.hpp"
#include <algorithm>
#include <type_traits>
namespace
{
    inline auto Viol(conquest::core::error::RuleViolationCode code) -> conquest::core::error::RuleViolation
    {
        return conquest::core::error::RuleViolation{ .code = code };
    }
}

namespace conquest::core
{
    static auto IsSkippable(Stage const s) -> bool
    {
        return s == Stage::Attack || s == Stage::Maneuver || s == Stage::Invade;
    }

auto ClassicRules::Validate(Game const& game, PlayerAction const& a) const -> CheckResult
{
    using RVC = ::conquest::core::error::RuleViolationCode;

    PlyrIdxT const actor = game.CurrentIdx();
    PlayerState const& player = game.CurrentPlayer();
    TerritoryStore const& terr = game.territories_;

    auto wrong_stage = [&](Stage const expected) -> CheckResult
    {
        return std::unexpected(Viol(RVC::WrongStage)
                               .with_stage(game.stage_).with_expected(expected).with_actor(actor));
    };
    auto missing = [&](TerrIdxT const t) -> CheckResult
    {
        return std::unexpected(Viol(RVC::Territory_NotFound).with_actor(actor).with_territory(t));
    };
    auto not_owned = [&](TerrIdxT const t) -> CheckResult
    {
        return std::unexpected(Viol(RVC::Territory_NotOwned).with_actor(actor).with_territory(t));
    };

    return std::visit([&]<typename T0>(T0 const& act) -> CheckResult
    {
        using T = std::decay_t<T0>;

        if constexpr (std::is_same_v<T, ClaimAction>)
        {
            if (game.stage_ != Stage::Claim) return wrong_stage(Stage::Claim);
            if (!terr.Contains(act.territory)) return missing(act.territory);

            if (terr.At(act.territory).owner.has_value())
                return std::unexpected(Viol(RVC::Claim_AlreadyOwned)
                                       .with_actor(actor).with_territory(act.territory));
            return {};
        }
        else if constexpr (std::is_same_v<T, PopulateAction>)
        {
            if (game.stage_ != Stage::Populate) return wrong_stage(Stage::Populate);
            if (!terr.Contains(act.territory)) return missing(act.territory);
            if (!terr.IsOwnedBy(act.territory, actor)) return not_owned(act.territory);

            if (player.draft_armies <= 0)
                return std::unexpected(Viol(RVC::Populate_NoArmiesLeft).with_actor(actor));
            return {};
        }
        else if constexpr (std::is_same_v<T, DraftAction>)
        {
            if (game.stage_ != Stage::Draft) return wrong_stage(Stage::Draft);
            if (!terr.Contains(act.territory)) return missing(act.territory);
            if (!terr.IsOwnedBy(act.territory, actor)) return not_owned(act.territory);

            if (act.count < 0 || act.count > player.draft_armies)
                return std::unexpected(Viol(RVC::Draft_CountOutOfRange)
                                       .with_actor(actor)
                                       .with_attempted(act.count)
                                       .with_limit(player.draft_armies));
            return {};
        }
        else if constexpr (std::is_same_v<T, AttackAction>)
        {
            if (game.stage_ != Stage::Attack) return wrong_stage(Stage::Attack);
            if (!terr.Contains(act.from)) return missing(act.from);
            if (!terr.Contains(act.to)) return missing(act.to);
            if (!terr.IsOwnedBy(act.from, actor)) return not_owned(act.from);

            if (!game.geo_->AreAdjacent(act.from, act.to))
                return std::unexpected(Viol(RVC::Attack_NotAdjacent).with_actor(actor).with_territory(act.to));

            if (terr.IsOwnedBy(act.to, actor))
                return std::unexpected(Viol(RVC::Attack_OwnTerritory).with_actor(actor).with_territory(act.to));

            ArmyT const available = terr.At(act.from).armies;
            if (act.attackers < 1 || act.attackers > constants::MaxAttackers || available <= act.attackers)
                return std::unexpected(Viol(RVC::Attack_AttackersOutOfRange)
                                       .with_actor(actor)
                                       .with_territory(act.from)
                                       .with_attempted(act.attackers)
                                       .with_limit(std::min(constants::MaxAttackers, available - 1)));

            ArmyT const holding = terr.At(act.to).armies;
            if (act.defenders < 1 || act.defenders > constants::MaxDefenders || holding < act.defenders)
                return std::unexpected(Viol(RVC::Attack_DefendersOutOfRange)
                                       .with_actor(actor)
                                       .with_territory(act.to)
                                       .with_attempted(act.defenders)
                                       .with_limit(std::min(constants::MaxDefenders, holding)));
            return {};
        }
        else if constexpr (std::is_same_v<T, InvadeAction>)
        {
            if (game.stage_ != Stage::Invade) return wrong_stage(Stage::Invade);
            CNQ_ASSERT(game.invasion_.has_value(), "Invade stage without a pending invasion");

            ArmyT const available = terr.At(game.invasion_->from).armies;
            if (act.count < 0 || act.count >= available)
                return std::unexpected(Viol(RVC::Invade_CountOutOfRange)
                                       .with_actor(actor)
                                       .with_attempted(act.count)
                                       .with_limit(available - 1));
            return {};
        }
        else if constexpr (std::is_same_v<T, ManeuverAction>)
        {
            if (game.stage_ != Stage::Maneuver) return wrong_stage(Stage::Maneuver);
            if (!terr.Contains(act.from)) return missing(act.from);
            if (!terr.Contains(act.to)) return missing(act.to);
            if (!terr.IsOwnedBy(act.from, actor)) return not_owned(act.from);
            if (!terr.IsOwnedBy(act.to, actor)) return not_owned(act.to);

            ArmyT const available = terr.At(act.from).armies;
            if (act.count < 0 || act.count >= available)
                return std::unexpected(Viol(RVC::Maneuver_CountOutOfRange)
                                       .with_actor(actor)
                                       .with_territory(act.from)
                                       .with_attempted(act.count)
                                       .with_limit(available - 1));

            if (!game.geo_->AreAdjacent(act.from, act.to))
                return std::unexpected(Viol(RVC::Maneuver_NotAdjacent).with_actor(actor).with_territory(act.to));
            return {};
        }
        else if constexpr (std::is_same_v<T, SkipAction>)
        {
            if (!IsSkippable(game.stage_))
                return std::unexpected(Viol(RVC::Skip_NotSkippable).with_stage(game.stage_).with_actor(actor));
            return {};
        }
        else if constexpr (std::is_same_v<T, TradeInAction>)
        {
            if (game.stage_ != Stage::Draft) return wrong_stage(Stage::Draft);
            return CardEconomy::CheckTradeIn(player, act.stars);
        }

        CNQ_THROW(error::Code::Unknown, "Unreachable variant in Validate");
    }, a);
}

    auto ClassicRules::ApplyAttack(Game& game, AttackAction const& act) -> MoveOutcome
    {
        PlyrIdxT const actor = game.CurrentIdx();
        TerritoryInfo& src = game.territories_.At(act.from);
        TerritoryInfo& dst = game.territories_.At(act.to);
        CNQ_ASSERT(dst.owner.has_value(), "Attacked territory has no owner");
        PlyrIdxT const defender = *dst.owner;

        CombatResult const res = ResolveCombat(act.attackers, act.defenders, game.rng_->NextUnit());
        src.armies -= res.attacker_losses;
        dst.armies -= res.defender_losses;
        CNQ_ASSERT(src.armies >= 1 && dst.armies >= 0, "Combat losses exceed committed armies");

        // the caller re-clamps its counts against the reduced armies
        if (dst.armies != 0) return MoveOutcome::Applied;

        // captured: survivors move in and ownership flips
        dst.owner = actor;
        game.territories_.Transfer(act.from, act.to, res.survivors);
        game.OnTerritoryGained(actor);
        game.OnTerritoryLost(defender); // may finish the game

        PlayerState& attacker = game.Current();
        if (attacker.captures_this_turn++ == 0)
        {
            game.cards_.GiveCard(attacker, *game.rng_);
        }

        PlayerState& loser = game.players_[defender];
        if (loser.defeated)
        {
            CardEconomy::TransferAll(loser, attacker);
        }

        if (game.stage_ == Stage::Finished) return MoveOutcome::GameEnded;

        if (src.armies > 1)
        {
            game.invasion_ = PendingInvasion{.from = act.from, .to = act.to};
            game.SetStage(Stage::Invade);
        }
        return MoveOutcome::Captured;
    }

    auto ClassicRules::Apply(Game& game, PlayerAction const& a) -> MoveOutcome
    {
        return std::visit([&]<typename T0>(T0 const& act) -> MoveOutcome
            {
                using T = std::decay_t<T0>;
                PlayerState& player = game.Current();

                if constexpr (std::is_same_v<T, ClaimAction>)
                {
                    // the claiming army is free; the initial pool is spent during Populate
                    game.territories_.Assign(act.territory, player.index, 1);
                    game.OnTerritoryGained(player.index);
                    game.turns_.Advance(game.players_);
                    if (--game.unclaimed_ == 0) game.SetStage(Stage::Populate);
                }
                else if constexpr (std::is_same_v<T, PopulateAction>)
                {
                    ++game.territories_.At(act.territory).armies;
                    --player.draft_armies;

                    // next seat with armies left; the current seat keeps going if it is the only one
                    bool const moved = game.turns_.AdvanceIf(game.players_,
                        [](PlayerState const& p) { return p.draft_armies > 0; });
                    if (!moved && player.draft_armies == 0)
                    {
                        game.turns_.Advance(game.players_);
                        game.SetStage(Stage::Draft);
                    }
                }
                else if constexpr (std::is_same_v<T, DraftAction>)
                {
                    game.territories_.At(act.territory).armies += act.count;
                    player.draft_armies -= act.count;
                    if (player.draft_armies == 0) game.SetStage(Stage::Attack);
                }
                else if constexpr (std::is_same_v<T, AttackAction>)
                {
                    return ApplyAttack(game, act);
                }
                else if constexpr (std::is_same_v<T, InvadeAction>)
                {
                    game.territories_.Transfer(game.invasion_->from, game.invasion_->to, act.count);
                    game.SetStage(Stage::Attack);
                }
                else if constexpr (std::is_same_v<T, ManeuverAction>)
                {
                    game.territories_.Transfer(act.from, act.to, act.count);
                    game.turns_.Advance(game.players_);
                    game.SetStage(Stage::Draft);
                }
                else if constexpr (std::is_same_v<T, SkipAction>)
                {
                    switch (game.stage_)
                    {
                    case Stage::Attack:
                        game.SetStage(Stage::Maneuver);
                        break;
                    case Stage::Maneuver:
                        game.turns_.Advance(game.players_);
                        game.SetStage(Stage::Draft);
                        break;
                    case Stage::Invade:
                        game.SetStage(Stage::Attack);
                        break;
                    default:
                        CNQ_THROW(error::Code::Rules, "Skip applied in a stage that cannot be skipped");
                    }
                }
                else if constexpr (std::is_same_v<T, TradeInAction>)
                {
                    game.cards_.TradeIn(player, act.stars);
                }
                return MoveOutcome::Applied;
            }, a);
    }

} // conquest
