//
// Created by Malik T on 07/10/2025.
//

#ifndef CONQUESTGAME_RIG_HPP
#define CONQUESTGAME_RIG_HPP

#include "../core/Game.hpp"
#include "../core/RegionBonus.hpp"

namespace conquest::core::debug
{
    // Test hooks that put a game into an exact position. Every hook keeps the
    // bookkeeping consistent (owned counts, bonuses, card conservation).
#if CNQ_ENABLE_TEST_HOOKS == true
    struct Rig
    {
        // Sets owner and armies for a territory, then recounts every player.
        static inline auto Place(Game& g, TerrIdxT const t, PlyrIdxT const owner, ArmyT const armies) -> void
        {
            TerritoryInfo& cell = g.territories_.At(t);
            if (!cell.owner.has_value()) --g.unclaimed_;
            g.territories_.Assign(t, owner, armies);
            Recount(g);
        }

        static inline auto Recount(Game& g) -> void
        {
            for (PlayerState& p : g.players_)
            {
                p.owned_territories = g.territories_.CountOwnedBy(p.index);
                RefreshRegionBonus(*g.geo_, g.territories_, p);
            }
        }

        // Moves cards from the draw piles into the player's hand.
        static inline auto Deal(Game& g, PlyrIdxT const p, int32_t const singles, int32_t const doubles) -> void
        {
            CardPiles& piles = g.cards_.piles_;
            CNQ_ASSERT(piles.draw_single >= singles && piles.draw_double >= doubles, "Rig: not enough cards to deal");
            piles.draw_single -= singles;
            piles.draw_double -= doubles;
            g.players_.at(p).single_star_cards += singles;
            g.players_.at(p).double_star_cards += doubles;
        }

        // Empties both draw piles into the discard piles.
        static inline auto DiscardDrawPiles(Game& g) -> void
        {
            CardPiles& piles = g.cards_.piles_;
            piles.discard_single += piles.draw_single;
            piles.discard_double += piles.draw_double;
            piles.draw_single = 0;
            piles.draw_double = 0;
        }

        // Jumps straight to a stage without running its entry step.
        static inline auto Force(Game& g, Stage const s, PlyrIdxT const current,
                                 std::optional<PendingInvasion> invasion = std::nullopt) -> void
        {
            g.stage_ = s;
            g.turns_.current_ = current;
            g.invasion_ = invasion;
        }

        static inline auto SetDraft(Game& g, PlyrIdxT const p, ArmyT const armies) -> void
        {
            g.players_.at(p).draft_armies = armies;
        }
    };
#endif
}

#endif //CONQUESTGAME_RIG_HPP
