//
// Created by Malik T on 14/08/2025.
//

#ifndef CONQUESTGAME_TYPES_HPP
#define CONQUESTGAME_TYPES_HPP

#define CNQ_ENABLE_TEST_HOOKS true

#include <array>
#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <vector>

namespace conquest::core::constants
{
    inline constexpr size_t MinPlayers = 2;
    inline constexpr size_t MaxPlayers = 6;

    inline constexpr int32_t SingleStarCardTotal = 30;
    inline constexpr int32_t DoubleStarCardTotal = 12;

    inline constexpr int32_t MinTradeStars = 2;
    inline constexpr int32_t MaxTradeStars = 10;

    inline constexpr int32_t MinDraftArmies = 3;
}

namespace conquest::core
{
    using PlyrIdxT = uint8_t;
    using TerrIdxT = uint16_t;
    using ArmyT    = int32_t;

    enum class Stage : uint8_t
    {
        Initializing = 0,
        Claim,
        Populate,
        Draft,
        Attack,
        Invade,
        Maneuver,
        Finished
    };

    inline auto to_string(Stage const s) -> std::string_view
    {
        switch (s)
        {
        case Stage::Initializing: return "Initializing";
        case Stage::Claim:        return "Claim";
        case Stage::Populate:     return "Populate";
        case Stage::Draft:        return "Draft";
        case Stage::Attack:       return "Attack";
        case Stage::Invade:       return "Invade";
        case Stage::Maneuver:     return "Maneuver";
        case Stage::Finished:     return "Finished";
        }
        return "?";
    }

    struct TerritoryInfo
    {
        std::optional<PlyrIdxT> owner{};
        ArmyT armies{0};
    };

    struct PlayerState
    {
        PlyrIdxT    index{};
        std::string name;
        bool        defeated{false};
        ArmyT       owned_territories{0};
        ArmyT       draft_armies{0};
        int32_t     single_star_cards{0};
        int32_t     double_star_cards{0};
        int32_t     captures_this_turn{0};
        ArmyT       continent_bonus{0};

        [[nodiscard]]
        auto Stars() const noexcept -> int32_t { return single_star_cards + double_star_cards * 2; }
    };

    // An attack from `from` captured `to` and may still move armies in.
    struct PendingInvasion
    {
        TerrIdxT from{};
        TerrIdxT to{};
    };

    struct Config
    {
        uint32_t n_players{2};
        uint64_t seed{std::random_device{}()};
        // Missing entries default to "Player N"
        std::vector<std::string> names{};
    };
}

#endif //CONQUESTGAME_TYPES_HPP
