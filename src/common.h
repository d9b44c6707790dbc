#pragma once

#include "libmetatsp.h"

#include <cstddef>
#include <limits>
#include <random>
#include <vector>

#ifndef WIN32
#define FORCE_INLINE __attribute__((always_inline)) inline
#else
#define FORCE_INLINE inline __forceinline
#endif

namespace mtsp {
    /// Represents an index into the distance matrix, i.e. a city
    typedef std::ptrdiff_t city_idx;

    /// Represents an index into the tour array where a particular city is located
    typedef std::ptrdiff_t tour_idx;

    /// A closed tour, stored as a permutation of the city indices
    typedef std::vector<city_idx> Route;

    /// The random stream threaded through every solver call. Each call owns its own instance.
    typedef std::mt19937_64 Rng;

    constexpr cost_t COST_POSITIVE_INFINITY = std::numeric_limits<cost_t>::infinity();

    /// Tours shorter than this have no well-defined swap/insert/2-Opt adjacency.
    constexpr size_t MIN_CITIES_FOR_MOVES = 4;

    /// Number of incremental cost updates after which a full recompute is forced to keep
    /// floating point drift in check.
    constexpr size_t MAX_DIRTY_COST_UPDATES = 64;

    /// Best tour and its cost as produced by one engine run.
    struct search_result_t {
        Route route;
        cost_t cost = COST_POSITIVE_INFINITY;
    };
}
