#include <gtest/gtest.h>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

#include "../core/Game.hpp"
#include "../core/Geography.hpp"
#include "../debug/AuditLogger.hpp"
#include "../debug/Invariants.hpp"
#include "RandomDriver.hpp"
#include "TestSupport.hpp"

using namespace conquest::core;

namespace
{
constexpr int kActionCap = 50'000;

auto make_game(std::shared_ptr<Geography const> const& world, uint32_t n_players, uint64_t seed) -> Game
{
    Config cfg{
        .n_players = n_players,
        .seed      = seed,
        .names     = {}
    };
    return Game(world, cfg);
}

// Plays until the game ends or the cap is hit, checking every invariant after each action.
// Returns the number of actions applied.
auto play(Game& game, conquest::test::RandomDriver& driver, debug::AuditLogger* log) -> int
{
    int applied = 0;
    while (game.StageNow() != Stage::Finished && applied < kActionCap)
    {
        auto const snap = game.Snapshot();
        PlayerAction const action = driver.Choose(*snap, game.Map());
        if (log) log->turn(*snap, action);

        auto const res = game.Act(action);
        if (!res.has_value())
        {
            if (log) log->rejected(res.error());
            ADD_FAILURE() << "Driver produced an illegal action " << debug::DescribeAction(action)
                          << ": " << error::describe(res.error());
            return applied;
        }
        if (log) log->outcome(*res);
        ++applied;

        debug::CheckInvariants(game);
        if (*res == MoveOutcome::GameEnded) EXPECT_EQ(game.StageNow(), Stage::Finished);
    }
    return applied;
}
} // anonymous namespace

TEST(SelfPlay, Transcripts_And_End)
{
    namespace fs = std::filesystem;
    fs::create_directories("_artifacts");
    auto const world = MakeClassicWorld();

    try
    {
        for (uint32_t n = constants::MinPlayers; n <= constants::MaxPlayers; ++n)
        {
            for (uint64_t seed : {111ull, 222ull, 333ull})
            {
                std::string const path = "_artifacts/game_" + std::to_string(n) + "p_" + std::to_string(seed) + ".log";
                auto game = make_game(world, n, seed);
                conquest::test::RandomDriver driver(seed * 7 + n);
                debug::AuditLogger log(path);

                log.start(game, seed);
                int const applied = play(game, driver, &log);
                log.end(game);

                ASSERT_FALSE(HasFailure()) << "seed=" << seed << " players=" << n;
                EXPECT_GT(applied, 0);
                if (game.StageNow() == Stage::Finished)
                {
                    EXPECT_EQ(game.UndefeatedCount(), 1u);
                }

                ASSERT_TRUE(fs::exists(path));
                ASSERT_GT(fs::file_size(path), 0u);
            }
        }
    }
    catch (OmegaException<error::Code> const& e)
    {
        std::cerr << e.to_str();
        FAIL() << e.what();
    }
}

TEST(SelfPlay, Same_Seeds_Same_Game)
{
    auto const world = MakeClassicWorld();
    for (uint64_t seed : {5ull, 77ull})
    {
        auto a = make_game(world, 4, seed);
        auto b = make_game(world, 4, seed);
        conquest::test::RandomDriver da(seed);
        conquest::test::RandomDriver db(seed);

        for (int i = 0; i < 3000 && a.StageNow() != Stage::Finished; ++i)
        {
            auto const sa = a.Snapshot();
            auto const sb = b.Snapshot();
            ASSERT_TRUE(conquest::test::SameBoard(*sa, *sb)) << "diverged at action " << i;

            ASSERT_TRUE(a.Act(da.Choose(*sa, a.Map())).has_value());
            ASSERT_TRUE(b.Act(db.Choose(*sb, b.Map())).has_value());
        }
        EXPECT_TRUE(conquest::test::SameBoard(*a.Snapshot(), *b.Snapshot()));
    }
}

TEST(SelfPlay, Rejected_Actions_Leave_No_Trace)
{
    auto const world = MakeClassicWorld();
    auto game = make_game(world, 3, 9);
    conquest::test::RandomDriver driver(9);

    // every stage sees a batch of malformed actions that must bounce off
    for (int i = 0; i < 2000 && game.StageNow() != Stage::Finished; ++i)
    {
        auto const before = game.Snapshot();
        for (PlayerAction const& bad : {PlayerAction{DraftAction{999, 1}},
                                        PlayerAction{AttackAction{0, 0, 9, 9}},
                                        PlayerAction{InvadeAction{-1}},
                                        PlayerAction{TradeInAction{11}}})
        {
            ASSERT_FALSE(game.Act(bad).has_value()) << debug::DescribeAction(bad);
        }
        ASSERT_TRUE(conquest::test::SameBoard(*before, *game.Snapshot()));
        ASSERT_TRUE(game.Act(driver.Choose(*before, game.Map())).has_value());
        debug::CheckInvariants(game);
    }
}
