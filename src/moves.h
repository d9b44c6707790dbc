#pragma once

#include "common.h"
#include "distance_matrix.h"

namespace mtsp {
    /// Describes one local move. Swap and 2-Opt moves are stored with i < j;
    /// insert moves keep their direction (take the city at i, put it at j).
    struct move_t {
        MtspNeighborhood type = MTSP_NEIGHBORHOOD_SWAP;
        tour_idx i = -1;
        tour_idx j = -1;
    };

    /// A candidate tour owned independently of the tour it was derived from.
    struct neighbor_t {
        Route route;
        cost_t cost = COST_POSITIVE_INFINITY;
        move_t move;
    };

    /// How candidate costs are obtained.
    enum class CostMode {
        /// O(1) incremental update from the adjacency of the changed positions
        Delta,
        /// O(n) full tour sum of the candidate
        Full
    };

    [[nodiscard]] inline CostMode CostModeFromFlag(const bool use_delta) {
        return use_delta ? CostMode::Delta : CostMode::Full;
    }

    [[nodiscard]] bool IsValidNeighborhood(MtspNeighborhood neighborhood);

    /// Draws a uniformly random pair of distinct positions and normalizes it for the move type.
    [[nodiscard]] move_t SampleMove(MtspNeighborhood type, size_t num_cities, Rng &rng);

    /// Change in tour cost when cities at positions i and j are exchanged.
    [[nodiscard]] cost_t ComputeSwapMoveDelta(const Route &tour, const DistanceMatrix &matrix,
                                              tour_idx i, tour_idx j);

    /// Change in tour cost when the segment [i, j) is reversed, i < j.
    template<bool asymmetric>
    [[nodiscard]] cost_t ComputeTwoOptMoveDelta(const Route &tour, const DistanceMatrix &matrix,
                                                tour_idx i, tour_idx j);

    /// Change in tour cost when the city at position i is moved to position j.
    [[nodiscard]] cost_t ComputeInsertMoveDelta(const Route &tour, const DistanceMatrix &matrix,
                                                tour_idx i, tour_idx j);

    /// Dispatches to the delta function of the move type.
    [[nodiscard]] cost_t ComputeMoveDelta(const Route &tour, const DistanceMatrix &matrix, const move_t &move);

    /// Inplace applies a move to the given tour.
    void ApplyMove(Route &tour, const move_t &move);

    /// Samples one move on tour and returns the resulting tour in a fresh buffer together with its cost,
    /// computed from current_cost by delta or by a full recompute depending on mode.
    [[nodiscard]] neighbor_t GenerateNeighbor(const Route &tour, cost_t current_cost, const DistanceMatrix &matrix,
                                              MtspNeighborhood type, CostMode mode, Rng &rng);

    /// Keeps an incrementally updated tour cost honest: after MAX_DIRTY_COST_UPDATES delta
    /// updates the cost is recomputed from scratch.
    class CostReconciler {
        size_t num_dirty_cost_computations = 0;

    public:
        /// Records one delta update of cost for tour and reconciles when due.
        void on_delta_update(const Route &tour, const DistanceMatrix &matrix, cost_t &cost);

        void reset() {
            num_dirty_cost_computations = 0;
        }
    };
}
