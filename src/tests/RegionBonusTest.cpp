//
// Created by Malik T on 09/10/2025.
//
#include <gtest/gtest.h>

#include "../core/Geography.hpp"
#include "../core/RegionBonus.hpp"
#include "../core/TerritoryStore.hpp"
#include "TestSupport.hpp"

using namespace conquest::core;
using conquest::test::MakeTestMap;

namespace
{
    auto Owner(TerritoryStore const& store, PlyrIdxT const idx) -> PlayerState
    {
        PlayerState p{};
        p.index = idx;
        p.owned_territories = store.CountOwnedBy(idx);
        return p;
    }
}

TEST(RegionBonus, Nothing_Without_A_Full_Region)
{
    auto const geo = MakeTestMap();
    TerritoryStore store{geo->TerritoryCount()};
    store.Assign(0, 0, 1);
    store.Assign(1, 0, 1);
    store.Assign(3, 0, 1);
    store.Assign(2, 1, 1);

    EXPECT_EQ(ComputeRegionBonus(*geo, store, Owner(store, 0)), 0);
    EXPECT_EQ(ComputeRegionBonus(*geo, store, Owner(store, 1)), 0);
}

TEST(RegionBonus, Sums_Every_Held_Region)
{
    auto const geo = MakeTestMap();
    TerritoryStore store{geo->TerritoryCount()};
    for (TerrIdxT t = 0; t < 3; ++t) store.Assign(t, 0, 1);
    EXPECT_EQ(ComputeRegionBonus(*geo, store, Owner(store, 0)), 2);

    for (TerrIdxT t = 3; t < 6; ++t) store.Assign(t, 0, 2);
    PlayerState p = Owner(store, 0);
    RefreshRegionBonus(*geo, store, p);
    EXPECT_EQ(p.continent_bonus, 5);

    store.Assign(4, 1, 1);
    p.owned_territories = store.CountOwnedBy(0);
    RefreshRegionBonus(*geo, store, p);
    EXPECT_EQ(p.continent_bonus, 2);
}

TEST(RegionBonus, Classic_World_Totals)
{
    auto const world = MakeClassicWorld();
    TerritoryStore store{world->TerritoryCount()};
    for (TerrIdxT t = 0; t < world->TerritoryCount(); ++t) store.Assign(t, 0, 1);
    EXPECT_EQ(ComputeRegionBonus(*world, store, Owner(store, 0)), 24);

    auto const au = world->Find("Eastern Australia");
    ASSERT_TRUE(au.has_value());
    store.Assign(*au, 1, 1);
    // losing one Australian territory drops the 2 army region
    EXPECT_EQ(ComputeRegionBonus(*world, store, Owner(store, 0)), 22);
}
