//
// Created by Malik T on 03/10/2025.
//

#ifndef CONQUESTGAME_TERRITORYSTORE_HPP
#define CONQUESTGAME_TERRITORYSTORE_HPP

#include <span>
#include <vector>
#include "Types.hpp"

namespace conquest::core
{
    // Owner and army count for every territory, indexed like the geography.
    class TerritoryStore
    {
    public:
        explicit TerritoryStore(size_t territory_count) :
            cells_(territory_count) {}

        auto Size() const noexcept -> size_t { return cells_.size(); }
        auto Contains(TerrIdxT const t) const noexcept -> bool { return t < cells_.size(); }

        // Throws StateError for unknown territories; callers validate first.
        auto At(TerrIdxT t) -> TerritoryInfo&;
        auto At(TerrIdxT t) const -> TerritoryInfo const&;

        auto IsOwnedBy(TerrIdxT t, PlyrIdxT player) const -> bool;
        auto CountOwnedBy(PlyrIdxT player) const -> ArmyT;

        auto Assign(TerrIdxT t, PlyrIdxT owner, ArmyT armies) -> void;
        // Moves armies between two cells; the source keeps at least one.
        auto Transfer(TerrIdxT from, TerrIdxT to, ArmyT count) -> void;

        auto All() const noexcept -> std::span<TerritoryInfo const> { return cells_; }

    private:
        std::vector<TerritoryInfo> cells_;
    };
}

#endif //CONQUESTGAME_TERRITORYSTORE_HPP
