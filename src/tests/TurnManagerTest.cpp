//
// Created by Malik T on 09/10/2025.
//
#include <gtest/gtest.h>

#include <vector>
#include "../core/TurnManager.hpp"

using namespace conquest::core;

namespace
{
    auto Seats(size_t const n) -> std::vector<PlayerState>
    {
        std::vector<PlayerState> ps(n);
        for (size_t i{}; i < n; ++i) ps[i].index = static_cast<PlyrIdxT>(i);
        return ps;
    }
}

TEST(TurnManager, Wraps_Around)
{
    auto ps = Seats(3);
    TurnManager turns{3};
    EXPECT_EQ(turns.Current(), 0);
    ASSERT_TRUE(turns.Advance(ps));
    ASSERT_TRUE(turns.Advance(ps));
    EXPECT_EQ(turns.Current(), 2);
    ASSERT_TRUE(turns.Advance(ps));
    EXPECT_EQ(turns.Current(), 0);
}

TEST(TurnManager, Skips_Defeated_And_Resets_Captures)
{
    auto ps = Seats(4);
    ps[1].defeated = true;
    ps[2].defeated = true;
    ps[0].captures_this_turn = 3;

    TurnManager turns{4};
    ASSERT_TRUE(turns.Advance(ps));
    EXPECT_EQ(turns.Current(), 3);
    EXPECT_EQ(ps[0].captures_this_turn, 0);

    ASSERT_TRUE(turns.Advance(ps));
    EXPECT_EQ(turns.Current(), 0);
}

TEST(TurnManager, Lone_Survivor_Cannot_Advance)
{
    auto ps = Seats(2);
    ps[1].defeated = true;
    ps[0].captures_this_turn = 1;

    TurnManager turns{2};
    EXPECT_FALSE(turns.Advance(ps));
    EXPECT_EQ(turns.Current(), 0);
    EXPECT_EQ(ps[0].captures_this_turn, 1);
}

TEST(TurnManager, Advance_If_Filters_Candidates)
{
    auto ps = Seats(4);
    ps[1].draft_armies = 0;
    ps[2].draft_armies = 5;
    ps[3].draft_armies = 0;
    auto const has_armies = [](PlayerState const& p) { return p.draft_armies > 0; };

    TurnManager turns{4};
    ASSERT_TRUE(turns.AdvanceIf(ps, has_armies));
    EXPECT_EQ(turns.Current(), 2);

    // only the current seat qualifies
    ps[0].draft_armies = 0;
    EXPECT_FALSE(turns.AdvanceIf(ps, has_armies));
    EXPECT_EQ(turns.Current(), 2);
}
