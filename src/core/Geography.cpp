//
// Created by Malik T on 02/10/2025.
//

#include "Geography.hpp"

#include <algorithm>
#include <limits>
#include <ranges>
#include "Exception.hpp"

namespace conquest::core
{
    StaticGeography::StaticGeography(std::vector<std::string> names,
                                     std::vector<Border> const& borders,
                                     std::vector<Region> regions) :
        names_(std::move(names)),
        neighbors_(names_.size()),
        regions_(std::move(regions))
    {
        using error::Code;
        if (names_.empty())
            CNQ_THROW(Code::Geography, "Geography has no territories");
        if (names_.size() > std::numeric_limits<TerrIdxT>::max())
            CNQ_THROW(Code::Geography, "Geography has too many territories");

        for (auto const& [a, b] : borders)
        {
            if (a >= names_.size() || b >= names_.size())
                CNQ_THROW(Code::Geography, "Border references unknown territory");
            if (a == b)
                CNQ_THROW(Code::Geography, "Territory cannot border itself: " + names_[a]);
            neighbors_[a].push_back(b);
            neighbors_[b].push_back(a);
        }
        for (auto& n : neighbors_)
        {
            std::ranges::sort(n);
            auto const dup = std::ranges::unique(n);
            n.erase(dup.begin(), dup.end());
        }

        std::vector<bool> in_region(names_.size(), false);
        for (Region const& r : regions_)
        {
            if (r.territories.empty())
                CNQ_THROW(Code::Geography, "Region without territories: " + r.name);
            if (r.bonus < 0)
                CNQ_THROW(Code::Geography, "Region with negative bonus: " + r.name);
            for (TerrIdxT const t : r.territories)
            {
                if (t >= names_.size())
                    CNQ_THROW(Code::Geography, "Region references unknown territory: " + r.name);
                if (in_region[t])
                    CNQ_THROW(Code::Geography, "Territory listed in more than one region: " + names_[t]);
                in_region[t] = true;
            }
        }
    }

    auto StaticGeography::TerritoryName(TerrIdxT const t) const -> std::string_view
    {
        return names_.at(t);
    }

    auto StaticGeography::Neighbors(TerrIdxT const t) const -> std::span<TerrIdxT const>
    {
        return neighbors_.at(t);
    }

    auto StaticGeography::AreAdjacent(TerrIdxT const a, TerrIdxT const b) const -> bool
    {
        if (a >= neighbors_.size() || b >= neighbors_.size()) return false;
        return std::ranges::binary_search(neighbors_[a], b);
    }

    auto StaticGeography::Find(std::string_view const name) const -> std::optional<TerrIdxT>
    {
        auto const it = std::ranges::find(names_, name);
        if (it == std::end(names_)) return std::nullopt;
        return static_cast<TerrIdxT>(std::distance(std::begin(names_), it));
    }
}
