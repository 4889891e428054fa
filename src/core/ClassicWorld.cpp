//
// Created by Malik T on 03/10/2025.
//

#include <array>
#include <string_view>
#include "Exception.hpp"
#include "Geography.hpp"

namespace conquest::core
{
    namespace
    {
        struct RegionDef
        {
            std::string_view name;
            ArmyT bonus;
            std::vector<std::string_view> territories;
        };

        auto ClassicRegions() -> std::vector<RegionDef>
        {
            return {
                {"North America", 5, {"Alaska", "Northwest Territory", "Greenland", "Alberta", "Ontario",
                                      "Quebec", "Western United States", "Eastern United States",
                                      "Central America"}},
                {"South America", 2, {"Venezuela", "Peru", "Brazil", "Argentina"}},
                {"Europe", 5, {"Iceland", "Scandinavia", "Great Britain", "Northern Europe", "Ukraine",
                               "Western Europe", "Southern Europe"}},
                {"Africa", 3, {"North Africa", "Egypt", "East Africa", "Congo", "South Africa", "Madagascar"}},
                {"Asia", 7, {"Ural", "Siberia", "Yakutsk", "Kamchatka", "Irkutsk", "Mongolia", "Japan",
                             "Afghanistan", "China", "Middle East", "India", "Siam"}},
                {"Australia", 2, {"Indonesia", "New Guinea", "Western Australia", "Eastern Australia"}},
            };
        }

        constexpr std::array<std::pair<std::string_view, std::string_view>, 83> ClassicBorders{{
            {"Alaska", "Northwest Territory"}, {"Alaska", "Alberta"}, {"Alaska", "Kamchatka"},
            {"Northwest Territory", "Alberta"}, {"Northwest Territory", "Ontario"},
            {"Northwest Territory", "Greenland"},
            {"Greenland", "Ontario"}, {"Greenland", "Quebec"}, {"Greenland", "Iceland"},
            {"Alberta", "Ontario"}, {"Alberta", "Western United States"},
            {"Ontario", "Quebec"}, {"Ontario", "Western United States"}, {"Ontario", "Eastern United States"},
            {"Quebec", "Eastern United States"},
            {"Western United States", "Eastern United States"}, {"Western United States", "Central America"},
            {"Eastern United States", "Central America"},
            {"Central America", "Venezuela"},
            {"Venezuela", "Peru"}, {"Venezuela", "Brazil"},
            {"Peru", "Brazil"}, {"Peru", "Argentina"},
            {"Brazil", "Argentina"}, {"Brazil", "North Africa"},
            {"Iceland", "Scandinavia"}, {"Iceland", "Great Britain"},
            {"Scandinavia", "Great Britain"}, {"Scandinavia", "Northern Europe"}, {"Scandinavia", "Ukraine"},
            {"Great Britain", "Northern Europe"}, {"Great Britain", "Western Europe"},
            {"Northern Europe", "Ukraine"}, {"Northern Europe", "Western Europe"},
            {"Northern Europe", "Southern Europe"},
            {"Ukraine", "Southern Europe"}, {"Ukraine", "Ural"}, {"Ukraine", "Afghanistan"},
            {"Ukraine", "Middle East"},
            {"Western Europe", "Southern Europe"}, {"Western Europe", "North Africa"},
            {"Southern Europe", "North Africa"}, {"Southern Europe", "Egypt"}, {"Southern Europe", "Middle East"},
            {"North Africa", "Egypt"}, {"North Africa", "East Africa"}, {"North Africa", "Congo"},
            {"Egypt", "East Africa"}, {"Egypt", "Middle East"},
            {"East Africa", "Congo"}, {"East Africa", "South Africa"}, {"East Africa", "Madagascar"},
            {"East Africa", "Middle East"},
            {"Congo", "South Africa"},
            {"South Africa", "Madagascar"},
            {"Ural", "Siberia"}, {"Ural", "Afghanistan"}, {"Ural", "China"},
            {"Siberia", "Yakutsk"}, {"Siberia", "Irkutsk"}, {"Siberia", "Mongolia"}, {"Siberia", "China"},
            {"Yakutsk", "Kamchatka"}, {"Yakutsk", "Irkutsk"},
            {"Kamchatka", "Irkutsk"}, {"Kamchatka", "Mongolia"}, {"Kamchatka", "Japan"},
            {"Irkutsk", "Mongolia"},
            {"Mongolia", "China"}, {"Mongolia", "Japan"},
            {"Afghanistan", "China"}, {"Afghanistan", "Middle East"}, {"Afghanistan", "India"},
            {"China", "India"}, {"China", "Siam"},
            {"Middle East", "India"},
            {"India", "Siam"},
            {"Siam", "Indonesia"},
            {"Indonesia", "New Guinea"}, {"Indonesia", "Western Australia"},
            {"New Guinea", "Western Australia"}, {"New Guinea", "Eastern Australia"},
            {"Western Australia", "Eastern Australia"},
        }};
    }

    auto MakeClassicWorld() -> std::shared_ptr<StaticGeography const>
    {
        std::vector<RegionDef> const defs = ClassicRegions();

        std::vector<std::string> names;
        std::vector<Region> regions;
        for (RegionDef const& d : defs)
        {
            Region r{.name = std::string{d.name}, .territories = {}, .bonus = d.bonus};
            for (std::string_view const t : d.territories)
            {
                r.territories.push_back(static_cast<TerrIdxT>(names.size()));
                names.emplace_back(t);
            }
            regions.push_back(std::move(r));
        }

        auto index_of = [&names](std::string_view const n) -> TerrIdxT
        {
            for (size_t i{}; i < names.size(); ++i)
                if (names[i] == n) return static_cast<TerrIdxT>(i);
            CNQ_THROW(error::Code::Geography, "Classic border names unknown territory: " + std::string{n});
        };

        std::vector<Border> borders;
        borders.reserve(ClassicBorders.size());
        for (auto const& [a, b] : ClassicBorders)
        {
            borders.emplace_back(index_of(a), index_of(b));
        }

        return std::make_shared<StaticGeography const>(std::move(names), borders, std::move(regions));
    }
}
