//
// Created by Malik T on 03/10/2025.
//

#include "TerritoryStore.hpp"

#include <algorithm>
#include "Exception.hpp"

namespace conquest::core
{
    auto TerritoryStore::At(TerrIdxT const t) -> TerritoryInfo&
    {
        if (!Contains(t)) CNQ_THROW(error::Code::State, "Territory index out of range");
        return cells_[t];
    }

    auto TerritoryStore::At(TerrIdxT const t) const -> TerritoryInfo const&
    {
        if (!Contains(t)) CNQ_THROW(error::Code::State, "Territory index out of range");
        return cells_[t];
    }

    auto TerritoryStore::IsOwnedBy(TerrIdxT const t, PlyrIdxT const player) const -> bool
    {
        auto const& owner = At(t).owner;
        return owner.has_value() && *owner == player;
    }

    auto TerritoryStore::CountOwnedBy(PlyrIdxT const player) const -> ArmyT
    {
        return static_cast<ArmyT>(std::ranges::count_if(cells_, [player](TerritoryInfo const& ti)
        {
            return ti.owner.has_value() && *ti.owner == player;
        }));
    }

    auto TerritoryStore::Assign(TerrIdxT const t, PlyrIdxT const owner, ArmyT const armies) -> void
    {
        CNQ_ASSERT(armies >= 1, "Owned territory must hold at least one army");
        TerritoryInfo& cell = At(t);
        cell.owner = owner;
        cell.armies = armies;
    }

    auto TerritoryStore::Transfer(TerrIdxT const from, TerrIdxT const to, ArmyT const count) -> void
    {
        TerritoryInfo& src = At(from);
        TerritoryInfo& dst = At(to);
        CNQ_ASSERT(count >= 0 && count < src.armies, "Transfer would empty the source territory");
        src.armies -= count;
        dst.armies += count;
    }
}
