//
// Created by Malik T on 02/10/2025.
//

#ifndef CONQUESTGAME_RANDOM_HPP
#define CONQUESTGAME_RANDOM_HPP

#include <cstdint>
#include <random>

namespace conquest::core
{
    // Single source of chance for combat and card draws. Injected at construction so
    // identical seeds (or scripted values in tests) give identical games.
    class RandomSource
    {
    public:
        virtual ~RandomSource() = default;

        // Uniform in [0, 1)
        virtual auto NextUnit() -> double = 0;
        // Uniform in [0, n), n > 0
        virtual auto NextBelow(uint32_t n) -> uint32_t = 0;
    };

    class SeededRandom final : public RandomSource
    {
    public:
        explicit SeededRandom(uint64_t seed);

        auto NextUnit() -> double override;
        auto NextBelow(uint32_t n) -> uint32_t override;

    private:
        std::mt19937_64 rng_;
    };
}

#endif //CONQUESTGAME_RANDOM_HPP
