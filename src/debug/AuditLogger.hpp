//
// Created by Malik T on 20/08/2025.
//

#ifndef CONQUESTGAME_AUDITLOGGER_HPP
#define CONQUESTGAME_AUDITLOGGER_HPP

#include <cstdint>
#include <fstream>
#include <string>

#include "../core/Game.hpp"
#include "../core/State.hpp"
#include "../core/Actions.hpp"
#include "../core/Types.hpp"

namespace conquest::core::debug
{
    auto DescribeAction(PlayerAction const& a) -> std::string;

    class AuditLogger
    {
    public:
        explicit AuditLogger(std::string path);
        ~AuditLogger();

        AuditLogger(AuditLogger const&) = delete;
        auto operator=(AuditLogger const&) -> AuditLogger& = delete;
        
        AuditLogger(AuditLogger&&) noexcept = default;
        auto operator=(AuditLogger&&) noexcept -> AuditLogger& = default;

        // Session header (seed, player names, territory count)
        auto start(Game const& game, std::uint64_t seed) -> void;

        // Per action (before Act): snapshot, proposed action
        auto turn(GameSnapshot const& s, PlayerAction const& a) -> void;

        // Per action outcome (after Act)
        auto outcome(MoveOutcome m) -> void;
        auto rejected(error::RuleViolation const& v) -> void;

        // Game end footer (winner seat; -1 if none) and final standings
        auto end(Game const& game) -> void;

        // Manual flush
        auto flush() -> void;

    private:
        std::ofstream out_;
    };
}

#endif //CONQUESTGAME_AUDITLOGGER_HPP
