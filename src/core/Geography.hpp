//
// Created by Malik T on 02/10/2025.
//

#ifndef CONQUESTGAME_GEOGRAPHY_HPP
#define CONQUESTGAME_GEOGRAPHY_HPP

#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include "Types.hpp"

namespace conquest::core
{
    struct Region
    {
        std::string name;
        std::vector<TerrIdxT> territories;
        ArmyT bonus{0};
    };

    using Border = std::pair<TerrIdxT, TerrIdxT>;

    // Immutable map the engine plays on. Territories are addressed 0..TerritoryCount()-1
    // and adjacency is symmetric.
    class Geography
    {
    public:
        virtual ~Geography() = default;

        virtual auto TerritoryCount() const noexcept -> size_t = 0;
        virtual auto TerritoryName(TerrIdxT t) const -> std::string_view = 0;
        virtual auto Neighbors(TerrIdxT t) const -> std::span<TerrIdxT const> = 0;
        virtual auto AreAdjacent(TerrIdxT a, TerrIdxT b) const -> bool = 0;
        virtual auto Regions() const noexcept -> std::span<Region const> = 0;

        auto Contains(TerrIdxT const t) const noexcept -> bool { return t < TerritoryCount(); }
    };

    class StaticGeography final : public Geography
    {
    public:
        // Throws GeographyError when the borders or regions reference unknown territories.
        StaticGeography(std::vector<std::string> names,
                        std::vector<Border> const& borders,
                        std::vector<Region> regions);

        auto TerritoryCount() const noexcept -> size_t override { return names_.size(); }
        auto TerritoryName(TerrIdxT t) const -> std::string_view override;
        auto Neighbors(TerrIdxT t) const -> std::span<TerrIdxT const> override;
        auto AreAdjacent(TerrIdxT a, TerrIdxT b) const -> bool override;
        auto Regions() const noexcept -> std::span<Region const> override { return regions_; }

        // Index of the territory with this name, if any.
        auto Find(std::string_view name) const -> std::optional<TerrIdxT>;

    private:
        std::vector<std::string> names_;
        std::vector<std::vector<TerrIdxT>> neighbors_; // sorted per territory
        std::vector<Region> regions_;
    };

    // The standard 42 territory board grouped into six regions.
    auto MakeClassicWorld() -> std::shared_ptr<StaticGeography const>;
}

#endif //CONQUESTGAME_GEOGRAPHY_HPP
