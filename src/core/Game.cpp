//
// Created by Malik T on 15/08/2025.
//
#include "Game.hpp"

#include <algorithm>
#include <ranges>
#include <utility>
#include "ClassicRules.hpp"
#include "RegionBonus.hpp"

namespace conquest::core
{
    namespace
    {
        auto CheckedGeography(std::shared_ptr<Geography const> geo) -> std::shared_ptr<Geography const>
        {
            if (!geo) CNQ_THROW(error::Code::Config, "Game created without a geography");
            if (geo->TerritoryCount() == 0) CNQ_THROW(error::Code::Config, "Game created with an empty geography");
            return geo;
        }

        auto CheckedConfig(Config const& cfg) -> Config const&
        {
            if (cfg.n_players < constants::MinPlayers || cfg.n_players > constants::MaxPlayers)
                CNQ_THROW(error::Code::Config,
                          "Player count must be within 2..6, got " + std::to_string(cfg.n_players));
            return cfg;
        }

        // every player needs at least one territory to claim
        auto CheckedSeating(std::shared_ptr<Geography const> geo, Config const& cfg) -> std::shared_ptr<Geography const>
        {
            if (geo->TerritoryCount() < cfg.n_players)
                CNQ_THROW(error::Code::Config,
                          "Geography has " + std::to_string(geo->TerritoryCount()) + " territories for " +
                          std::to_string(cfg.n_players) + " players");
            return geo;
        }

        template <typename T>
        auto DropValue(error::ActionResult<T> const& r) -> error::ValidateResult
        {
            if (!r.has_value()) return std::unexpected(r.error());
            return {};
        }
    }

    Game::Game(std::shared_ptr<Geography const> geography,
               Config const& config,
               std::unique_ptr<RandomSource> rng,
               std::unique_ptr<Rules> rules) :
        cfg_(CheckedConfig(config)),
        geo_(CheckedSeating(CheckedGeography(std::move(geography)), cfg_)),
        rng_(rng ? std::move(rng) : std::unique_ptr<RandomSource>{std::make_unique<SeededRandom>(cfg_.seed)}),
        rules_(rules ? std::move(rules) : std::unique_ptr<Rules>{std::make_unique<ClassicRules>()}),
        players_(cfg_.n_players),
        territories_(geo_->TerritoryCount()),
        turns_(cfg_.n_players)
    {
        for (size_t i{}; i < players_.size(); ++i)
        {
            PlayerState& p = players_[i];
            p.index = static_cast<PlyrIdxT>(i);
            p.name = (i < cfg_.names.size() && !cfg_.names[i].empty())
                         ? cfg_.names[i]
                         : "Player " + std::to_string(i + 1);
        }
        SetStage(Stage::Claim);
    }

    auto Game::InitialArmies() const noexcept -> ArmyT
    {
        // 40 for 2 players down to 20 for 6
        return 40 - (static_cast<ArmyT>(players_.size()) - 2) * 5;
    }

    auto Game::SetStage(Stage const s) -> void
    {
        if (s == stage_) return;
        stage_ = s;
        if (stage_ != Stage::Invade) invasion_.reset();
        OnStageChange();
    }

    auto Game::OnStageChange() -> void
    {
        switch (stage_)
        {
        case Stage::Claim:
        {
            unclaimed_ = static_cast<ArmyT>(territories_.Size());
            for (PlayerState& p : players_) p.draft_armies = InitialArmies();
            break;
        }
        case Stage::Draft:
        {
            // one army per three territories, at least three, plus region bonuses
            PlayerState& p = Current();
            p.draft_armies += std::max(constants::MinDraftArmies, p.owned_territories / 3) + p.continent_bonus;
            break;
        }
        default:
            break;
        }
    }

    auto Game::OnTerritoryGained(PlyrIdxT const player) -> void
    {
        PlayerState& p = players_.at(player);
        ++p.owned_territories;
        RefreshRegionBonus(*geo_, territories_, p);
    }

    auto Game::OnTerritoryLost(PlyrIdxT const player) -> void
    {
        PlayerState& p = players_.at(player);
        CNQ_ASSERT(p.owned_territories > 0, "Player lost a territory they did not own");
        if (--p.owned_territories == 0)
        {
            p.defeated = true;
            if (UndefeatedCount() == 1) SetStage(Stage::Finished);
        }
        RefreshRegionBonus(*geo_, territories_, p);
    }

    auto Game::UndefeatedCount() const -> size_t
    {
        return static_cast<size_t>(std::ranges::count_if(players_, [](PlayerState const& p) { return !p.defeated; }));
    }

    auto Game::Territory(TerrIdxT const t) const -> error::ActionResult<TerritoryInfo>
    {
        if (!territories_.Contains(t))
            return std::unexpected(error::RuleViolation{.code = error::RuleViolationCode::Territory_NotFound}
                                   .with_territory(t));
        return territories_.At(t);
    }

    auto Game::Snapshot() const -> std::shared_ptr<GameSnapshot const>
    {
        std::shared_ptr<GameSnapshot> snap = std::make_shared<GameSnapshot>();
        snap->stage = stage_;
        snap->current_player = turns_.Current();
        snap->territories.assign(territories_.All().begin(), territories_.All().end());
        snap->players = players_;
        snap->piles = cards_.Piles();
        snap->invasion = invasion_;
        snap->unclaimed = unclaimed_;
        return snap;
    }

    auto Game::Act(PlayerAction const& action) -> error::ActionResult<MoveOutcome>
    {
        if (auto const ok = rules_->Validate(*this, action); !ok.has_value())
        {
            return std::unexpected(ok.error());
        }
        return rules_->Apply(*this, action);
    }

    auto Game::Claim(TerrIdxT const territory) -> error::ValidateResult
    {
        return DropValue(Act(ClaimAction{territory}));
    }

    auto Game::Populate(TerrIdxT const territory) -> error::ValidateResult
    {
        return DropValue(Act(PopulateAction{territory}));
    }

    auto Game::Draft(TerrIdxT const territory, ArmyT const count) -> error::ValidateResult
    {
        return DropValue(Act(DraftAction{territory, count}));
    }

    auto Game::Attack(TerrIdxT const from, TerrIdxT const to,
                      ArmyT const attackers, ArmyT const defenders) -> error::ActionResult<bool>
    {
        auto const res = Act(AttackAction{from, to, attackers, defenders});
        if (!res.has_value()) return std::unexpected(res.error());
        return *res != MoveOutcome::Applied;
    }

    auto Game::Invade(ArmyT const count) -> error::ValidateResult
    {
        return DropValue(Act(InvadeAction{count}));
    }

    auto Game::Maneuver(TerrIdxT const from, TerrIdxT const to, ArmyT const count) -> error::ValidateResult
    {
        return DropValue(Act(ManeuverAction{from, to, count}));
    }

    auto Game::Skip() -> error::ValidateResult
    {
        return DropValue(Act(SkipAction{}));
    }

    auto Game::TradeInCards(int32_t const stars) -> error::ValidateResult
    {
        return DropValue(Act(TradeInAction{stars}));
    }
}
