//
// Created by Malik T on 18/08/2025.
//

#include "RandomDriver.hpp"

#include <algorithm>
#include <utility>

#include "../core/Combat.hpp"
#include "../core/Exception.hpp"

namespace conquest::test
{
    using namespace conquest::core;

    RandomDriver::RandomDriver(uint64_t rng_seed):
        rng_(static_cast<std::mt19937::result_type>(rng_seed)) {}

    auto RandomDriver::Owned(GameSnapshot const& s) const -> std::vector<TerrIdxT>
    {
        std::vector<TerrIdxT> out;
        for (size_t i{}; i < s.territories.size(); ++i)
        {
            if (s.territories[i].owner == s.current_player) out.push_back(static_cast<TerrIdxT>(i));
        }
        return out;
    }

    auto RandomDriver::Choose(GameSnapshot const& s, Geography const& geo) -> PlayerAction
    {
        switch (s.stage)
        {
        case Stage::Claim:
        {
            std::vector<TerrIdxT> free;
            for (size_t i{}; i < s.territories.size(); ++i)
            {
                if (!s.territories[i].owner) free.push_back(static_cast<TerrIdxT>(i));
            }
            CNQ_ASSERT(!free.empty(), "Claim stage without free territory");
            return ClaimAction{free[pick(free)]};
        }
        case Stage::Populate:
        {
            auto const mine = Owned(s);
            return PopulateAction{mine[pick(mine)]};
        }
        case Stage::Draft:
            return DraftMove(s);
        case Stage::Attack:
            return AttackMove(s, geo);
        case Stage::Invade:
        {
            ArmyT const spare = s.territories.at(s.invasion->from).armies - 1;
            return InvadeAction{chance(0.75) ? spare : std::uniform_int_distribution<ArmyT>{0, spare}(rng_)};
        }
        case Stage::Maneuver:
            return ManeuverMove(s, geo);
        default:
            return SkipAction{};
        }
    }

    auto RandomDriver::DraftMove(GameSnapshot const& s) -> PlayerAction
    {
        PlayerState const& me = s.players.at(s.current_player);

        int32_t stars = std::min(constants::MaxTradeStars, me.Stars());
        if (me.single_star_cards == 0 && (stars & 1) != 0) --stars;
        if (stars >= constants::MinTradeStars && chance(0.5))
        {
            return TradeInAction{stars};
        }

        auto const mine = Owned(s);
        ArmyT const count = std::uniform_int_distribution<ArmyT>{1, me.draft_armies}(rng_);
        return DraftAction{mine[pick(mine)], count};
    }

    auto RandomDriver::AttackMove(GameSnapshot const& s, Geography const& geo) -> PlayerAction
    {
        std::vector<std::pair<TerrIdxT, TerrIdxT>> fronts;
        for (TerrIdxT const from : Owned(s))
        {
            if (s.territories[from].armies < 2) continue;
            for (TerrIdxT const to : geo.Neighbors(from))
            {
                if (s.territories[to].owner != s.current_player) fronts.emplace_back(from, to);
            }
        }
        if (fronts.empty() || chance(0.05)) return SkipAction{};

        auto const [from, to] = fronts[pick(fronts)];
        ArmyT const attackers = std::min(constants::MaxAttackers, s.territories[from].armies - 1);
        ArmyT const defenders = std::min(constants::MaxDefenders, s.territories[to].armies);
        return AttackAction{from, to, attackers, defenders};
    }

    auto RandomDriver::ManeuverMove(GameSnapshot const& s, Geography const& geo) -> PlayerAction
    {
        std::vector<std::pair<TerrIdxT, TerrIdxT>> moves;
        for (TerrIdxT const from : Owned(s))
        {
            if (s.territories[from].armies < 2) continue;
            for (TerrIdxT const to : geo.Neighbors(from))
            {
                if (s.territories[to].owner == s.current_player) moves.emplace_back(from, to);
            }
        }
        if (moves.empty() || chance(0.3)) return SkipAction{};

        auto const [from, to] = moves[pick(moves)];
        ArmyT const count = std::uniform_int_distribution<ArmyT>{0, s.territories[from].armies - 1}(rng_);
        return ManeuverAction{from, to, count};
    }
}
