//
// Created by Malik T on 05/10/2025.
//

#ifndef CONQUESTGAME_TURNMANAGER_HPP
#define CONQUESTGAME_TURNMANAGER_HPP

#include <span>
#include "Types.hpp"

namespace conquest::core::debug {struct Rig;}
namespace conquest::core
{
    // Circular turn order over a fixed seat list.
    class TurnManager
    {
    public:
        explicit TurnManager(size_t n_players) :
            n_players_(n_players) {}

        auto Current() const noexcept -> PlyrIdxT { return current_; }

        // Moves to the next undefeated player. False if no other such player exists.
        auto Advance(std::span<PlayerState> players) -> bool
        {
            return AdvanceIf(players, [](PlayerState const&) { return true; });
        }

        // Moves to the next undefeated player accepted by pred, resetting the outgoing player's
        // per-turn counters. The current player is never a candidate. False (no change) if none qualifies.
        template <typename Pred>
        auto AdvanceIf(std::span<PlayerState> players, Pred&& pred) -> bool
        {
            PlyrIdxT next = current_;
            for (;;)
            {
                next = NextSeat(next);
                if (next == current_) return false;
                PlayerState const& cand = players[next];
                if (!cand.defeated && pred(cand)) break;
            }
            players[current_].captures_this_turn = 0;
            current_ = next;
            return true;
        }

        auto NextSeat(PlyrIdxT const idx) const noexcept -> PlyrIdxT
        {
            return static_cast<PlyrIdxT>((idx + 1) % n_players_);
        }

    private:
        size_t n_players_;
        PlyrIdxT current_{0};

        friend struct debug::Rig;
    };
}

#endif //CONQUESTGAME_TURNMANAGER_HPP
