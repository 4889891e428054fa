//
// Created by Malik T on 02/10/2025.
//

#include "Random.hpp"
#include "Exception.hpp"
#include <cmath>

namespace conquest::core
{
    SeededRandom::SeededRandom(uint64_t const seed) :
        rng_{seed}
    {
    }

    auto SeededRandom::NextUnit() -> double
    {
        double const r = std::uniform_real_distribution<double>{0.0, 1.0}(rng_);
        // generate_canonical may round up to 1.0
        return r < 1.0 ? r : std::nextafter(1.0, 0.0);
    }

    auto SeededRandom::NextBelow(uint32_t const n) -> uint32_t
    {
        CNQ_ASSERT(n > 0, "NextBelow called with an empty range");
        return std::uniform_int_distribution<uint32_t>{0, n - 1}(rng_);
    }
}
