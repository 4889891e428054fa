//
// Created by Malik T on 15/08/2025.
//

#ifndef CONQUESTGAME_GAME_HPP
#define CONQUESTGAME_GAME_HPP

#include <memory>
#include <optional>
#include <span>
#include <vector>
#include "Types.hpp"
#include "Actions.hpp"
#include "CardEconomy.hpp"
#include "Exception.hpp"
#include "Geography.hpp"
#include "Random.hpp"
#include "Rules.hpp"
#include "State.hpp"
#include "TerritoryStore.hpp"
#include "TurnManager.hpp"

namespace conquest::core::debug {struct Inspector; struct Rig;}
namespace conquest::core
{
    class Game
    {
    public:
        Game() = delete;
        // Throws ConfigError for a player count outside [2,6] or an absent/empty geography.
        // A SeededRandom over config.seed and ClassicRules are used when none are supplied.
        Game(std::shared_ptr<Geography const> geography,
             Config const& config,
             std::unique_ptr<RandomSource> rng = nullptr,
             std::unique_ptr<Rules> rules = nullptr);

        Game(Game const&) = delete;
        auto operator=(Game const&) -> Game& = delete;
        Game(Game&&) noexcept = default;
        auto operator=(Game&&) noexcept -> Game& = default;

        // One state-machine step: validate then apply. Nothing changes when validation fails.
        auto Act(PlayerAction const& action) -> error::ActionResult<MoveOutcome>;

        auto Claim(TerrIdxT territory) -> error::ValidateResult;
        auto Populate(TerrIdxT territory) -> error::ValidateResult;
        auto Draft(TerrIdxT territory, ArmyT count) -> error::ValidateResult;
        // Value is true when the defending territory was captured.
        auto Attack(TerrIdxT from, TerrIdxT to, ArmyT attackers, ArmyT defenders) -> error::ActionResult<bool>;
        auto Invade(ArmyT count) -> error::ValidateResult;
        auto Maneuver(TerrIdxT from, TerrIdxT to, ArmyT count) -> error::ValidateResult;
        auto Skip() -> error::ValidateResult;
        auto TradeInCards(int32_t stars) -> error::ValidateResult;

        static auto ArmiesForStars(int32_t stars) -> error::ActionResult<ArmyT>
        {
            return CardEconomy::ArmiesForStars(stars);
        }

        auto StageNow() const noexcept      -> Stage    { return stage_; }
        auto CurrentIdx() const noexcept    -> PlyrIdxT { return turns_.Current(); }
        auto CurrentPlayer() const noexcept -> PlayerState const& { return players_[turns_.Current()]; }
        auto PlayerCount() const noexcept   -> size_t   { return players_.size(); }
        auto Players() const noexcept       -> std::span<PlayerState const> { return players_; }
        auto PlayerAt(PlyrIdxT seat) const  -> PlayerState const& { return players_.at(seat); }

        auto Map() const noexcept           -> Geography const& { return *geo_; }
        auto TerritoryCount() const noexcept -> size_t { return territories_.Size(); }
        auto Territories() const noexcept   -> std::span<TerritoryInfo const> { return territories_.All(); }
        auto Territory(TerrIdxT t) const    -> error::ActionResult<TerritoryInfo>;

        auto Piles() const noexcept         -> CardPiles const& { return cards_.Piles(); }
        auto Invasion() const noexcept      -> std::optional<PendingInvasion> const& { return invasion_; }
        auto Unclaimed() const noexcept     -> ArmyT { return unclaimed_; }
        auto UndefeatedCount() const        -> size_t;

        auto Snapshot() const -> std::shared_ptr<GameSnapshot const>;

        //allows class to directly access private data on an instance
        friend class ClassicRules;
        friend struct debug::Inspector;
        friend struct debug::Rig;

    private:
        auto Current() -> PlayerState& { return players_[turns_.Current()]; }
        auto InitialArmies() const noexcept -> ArmyT;

        // Switches stage and runs the entry step of the new stage (army grants, counters).
        auto SetStage(Stage s) -> void;
        auto OnStageChange() -> void;

        auto OnTerritoryGained(PlyrIdxT player) -> void;
        // May finish the game when the player loses their last territory.
        auto OnTerritoryLost(PlyrIdxT player) -> void;

    private:
        Config cfg_;
        std::shared_ptr<Geography const> geo_;
        std::unique_ptr<RandomSource> rng_;
        std::unique_ptr<Rules> rules_;

        // Authoritative state
        std::vector<PlayerState> players_;
        TerritoryStore territories_;
        CardEconomy cards_;
        TurnManager turns_;

        Stage stage_{Stage::Initializing};
        std::optional<PendingInvasion> invasion_{}; // only while stage_ == Invade
        ArmyT unclaimed_{0};                        // only meaningful during Claim
    };
}
#endif //CONQUESTGAME_GAME_HPP
