#pragma once

#include "common.h"
#include "distance_matrix.h"
#include "moves.h"

namespace mtsp {
    /// Stopping and move parameters of a single hill climbing trajectory.
    struct hill_climb_limits_t {
        uint64_t max_iter = 500;
        uint64_t stop_no_improve = 50;
        MtspNeighborhood neighborhood_type = MTSP_NEIGHBORHOOD_SWAP;
        CostMode cost_mode = CostMode::Full;
    };

    /// Improves start_tour by first-improvement random neighbors until max_iter neighbors were tried or
    /// stop_no_improve consecutive neighbors failed to improve. If best_cost_trace is given, the
    /// trajectory's best cost after every iteration is appended to it.
    [[nodiscard]] search_result_t HillClimb(const DistanceMatrix &matrix, Route start_tour,
                                            const hill_climb_limits_t &limits, Rng &rng,
                                            std::vector<cost_t> *best_cost_trace = nullptr);

    [[nodiscard]] MtspStatus ValidateHillClimbingOptions(const MtspHillClimbingOptionsDescriptor &options,
                                                         size_t num_cities, std::string *why = nullptr);

    /// Runs options.n_starts independent trajectories from random tours and keeps the best.
    [[nodiscard]] search_result_t RunHillClimbing(const DistanceMatrix &matrix,
                                                  const MtspHillClimbingOptionsDescriptor &options, Rng &rng);
}
