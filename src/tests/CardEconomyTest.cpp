//
// Created by Malik T on 08/10/2025.
//
#include <gtest/gtest.h>

#include "../core/CardEconomy.hpp"
#include "TestSupport.hpp"

using namespace conquest::core;
using conquest::test::ScriptedRandom;

namespace
{
    auto Hand(int32_t const singles, int32_t const doubles) -> PlayerState
    {
        PlayerState p{};
        p.single_star_cards = singles;
        p.double_star_cards = doubles;
        return p;
    }

    auto CardsInPlay(CardPiles const& c, PlayerState const& p) -> int32_t
    {
        return c.draw_single + c.draw_double + c.discard_single + c.discard_double +
               p.single_star_cards + p.double_star_cards;
    }
}

TEST(CardEconomy, Draw_Kind_Follows_Pile_Sizes)
{
    CardEconomy cards;
    ScriptedRandom rng;
    PlayerState p{};

    rng.QueueBelow(29);   // last single slot
    rng.QueueBelow(30);   // first double slot
    ASSERT_TRUE(cards.GiveCard(p, rng));
    ASSERT_TRUE(cards.GiveCard(p, rng));

    EXPECT_EQ(p.single_star_cards, 1);
    EXPECT_EQ(p.double_star_cards, 1);
    EXPECT_EQ(p.Stars(), 3);
    EXPECT_EQ(cards.Piles().draw_single, 29);
    EXPECT_EQ(cards.Piles().draw_double, 11);
}

TEST(CardEconomy, Exhausted_Deck_Gives_Nothing)
{
    CardEconomy cards;
    ScriptedRandom rng;
    PlayerState p{};

    for (int i = 0; i < constants::SingleStarCardTotal + constants::DoubleStarCardTotal; ++i)
    {
        ASSERT_TRUE(cards.GiveCard(p, rng));
    }
    EXPECT_EQ(p.single_star_cards, constants::SingleStarCardTotal);
    EXPECT_EQ(p.double_star_cards, constants::DoubleStarCardTotal);

    PlayerState const before = p;
    EXPECT_FALSE(cards.GiveCard(p, rng));
    EXPECT_EQ(p.Stars(), before.Stars());
    EXPECT_EQ(CardsInPlay(cards.Piles(), p), 42);
}

TEST(CardEconomy, Discards_Return_When_Draw_Piles_Run_Out)
{
    CardEconomy cards;
    ScriptedRandom rng;
    PlayerState p{};
    for (int i = 0; i < 42; ++i) ASSERT_TRUE(cards.GiveCard(p, rng));

    // 10 stars: five double cards
    ASSERT_EQ(cards.TradeIn(p, 10), 30);
    EXPECT_EQ(cards.Piles().discard_double, 5);
    EXPECT_EQ(cards.Piles().discard_single, 0);

    ASSERT_TRUE(cards.GiveCard(p, rng));
    EXPECT_EQ(cards.Piles().discard_double, 0);
    EXPECT_EQ(cards.Piles().draw_double, 4);
    EXPECT_EQ(cards.Piles().draw_single, 0);
    EXPECT_EQ(p.double_star_cards, constants::DoubleStarCardTotal - 4);
    EXPECT_EQ(CardsInPlay(cards.Piles(), p), 42);
}

TEST(CardEconomy, Trade_Checks)
{
    using RVC = error::RuleViolationCode;

    EXPECT_TRUE(CardEconomy::CheckTradeIn(Hand(2, 0), 2).has_value());
    EXPECT_TRUE(CardEconomy::CheckTradeIn(Hand(1, 1), 3).has_value());
    EXPECT_TRUE(CardEconomy::CheckTradeIn(Hand(0, 6), 10).has_value());

    auto const too_few = CardEconomy::CheckTradeIn(Hand(1, 0), 2);
    ASSERT_FALSE(too_few.has_value());
    EXPECT_EQ(too_few.error().code, RVC::TradeIn_StarsOutOfRange);
    EXPECT_EQ(too_few.error().Kind(), error::ErrorKind::InvalidArgument);

    auto const too_many = CardEconomy::CheckTradeIn(Hand(12, 0), 11);
    ASSERT_FALSE(too_many.has_value());
    EXPECT_EQ(too_many.error().code, RVC::TradeIn_StarsOutOfRange);

    auto const odd = CardEconomy::CheckTradeIn(Hand(0, 3), 5);
    ASSERT_FALSE(odd.has_value());
    EXPECT_EQ(odd.error().code, RVC::TradeIn_OddWithoutSingles);
}

TEST(CardEconomy, Trade_Spends_Doubles_First)
{
    CardEconomy cards;
    PlayerState p = Hand(3, 1);
    p.draft_armies = 4;

    EXPECT_EQ(cards.TradeIn(p, 3), 4);
    EXPECT_EQ(p.double_star_cards, 0);
    EXPECT_EQ(p.single_star_cards, 2);
    EXPECT_EQ(p.draft_armies, 8);
    EXPECT_EQ(cards.Piles().discard_double, 1);
    EXPECT_EQ(cards.Piles().discard_single, 1);

    EXPECT_THROW(cards.TradeIn(p, 3), error::AssertionError);
}

TEST(CardEconomy, Transfer_Moves_Whole_Hand)
{
    PlayerState loser = Hand(2, 3);
    PlayerState winner = Hand(1, 0);
    CardEconomy::TransferAll(loser, winner);
    EXPECT_EQ(loser.Stars(), 0);
    EXPECT_EQ(winner.single_star_cards, 3);
    EXPECT_EQ(winner.double_star_cards, 3);
}

TEST(CardEconomy, Armies_For_Stars_Table)
{
    int32_t const expected[] = {2, 4, 7, 10, 13, 17, 21, 25, 30};
    ArmyT prev = 0;
    for (int32_t s = constants::MinTradeStars; s <= constants::MaxTradeStars; ++s)
    {
        auto const armies = CardEconomy::ArmiesForStars(s);
        ASSERT_TRUE(armies.has_value());
        EXPECT_EQ(*armies, expected[s - 2]);
        EXPECT_GT(*armies, prev);
        prev = *armies;
    }

    for (int32_t const bad : {-1, 0, 1, 11, 100})
    {
        auto const r = CardEconomy::ArmiesForStars(bad);
        ASSERT_FALSE(r.has_value());
        EXPECT_EQ(r.error().code, error::RuleViolationCode::Stars_OutOfRange);
        EXPECT_EQ(r.error().Kind(), error::ErrorKind::InvalidArgument);
    }
    EXPECT_EQ(*Game::ArmiesForStars(4), 7);
}
