#include "moves.h"

#include <algorithm>
#include <cassert>
#include <cmath>
#include <utility>

namespace mtsp {
    namespace {
        [[nodiscard]] FORCE_INLINE city_idx CityAt(const Route &tour, const tour_idx position) {
            const auto n = static_cast<tour_idx>(tour.size());
            return tour[((position % n) + n) % n];
        }
    }

    bool IsValidNeighborhood(const MtspNeighborhood neighborhood) {
        switch (neighborhood) {
            case MTSP_NEIGHBORHOOD_SWAP:
            case MTSP_NEIGHBORHOOD_INSERT:
            case MTSP_NEIGHBORHOOD_TWO_OPT:
                return true;
        }
        return false;
    }

    move_t SampleMove(const MtspNeighborhood type, const size_t num_cities, Rng &rng) {
        std::uniform_int_distribution<tour_idx> dist(0, static_cast<tour_idx>(num_cities) - 1);
        tour_idx i = dist(rng);
        tour_idx j = dist(rng);
        while (i == j) {
            j = dist(rng);
        }
        if (type != MTSP_NEIGHBORHOOD_INSERT && i > j) {
            std::swap(i, j);
        }
        return move_t{.type = type, .i = i, .j = j};
    }

    cost_t ComputeSwapMoveDelta(const Route &tour, const DistanceMatrix &matrix, tour_idx i, tour_idx j) {
        if (i == j) {
            return 0;
        }
        if (i > j) {
            std::swap(i, j);
        }
        const auto n = static_cast<tour_idx>(tour.size());

        const city_idx a = tour[i];
        const city_idx b = tour[j];
        const city_idx a_prev = CityAt(tour, i - 1);
        const city_idx a_next = CityAt(tour, i + 1);
        const city_idx b_prev = CityAt(tour, j - 1);
        const city_idx b_next = CityAt(tour, j + 1);

        // Neighbors in the tour: a_prev -> a -> b -> b_next becomes a_prev -> b -> a -> b_next
        if (j == i + 1) {
            const cost_t old_edges = matrix.get_cost(a_prev, a)
                                     + matrix.get_cost(a, b)
                                     + matrix.get_cost(b, b_next);
            const cost_t new_edges = matrix.get_cost(a_prev, b)
                                     + matrix.get_cost(b, a)
                                     + matrix.get_cost(a, b_next);
            return new_edges - old_edges;
        }

        // Neighbors across the wrap-around: b_prev -> b -> a -> a_next becomes b_prev -> a -> b -> a_next
        if (i == 0 && j == n - 1) {
            const cost_t old_edges = matrix.get_cost(b_prev, b)
                                     + matrix.get_cost(b, a)
                                     + matrix.get_cost(a, a_next);
            const cost_t new_edges = matrix.get_cost(b_prev, a)
                                     + matrix.get_cost(a, b)
                                     + matrix.get_cost(b, a_next);
            return new_edges - old_edges;
        }

        // Disjoint neighborhoods, four edges on each side
        const cost_t old_edges = matrix.get_cost(a_prev, a)
                                 + matrix.get_cost(a, a_next)
                                 + matrix.get_cost(b_prev, b)
                                 + matrix.get_cost(b, b_next);
        const cost_t new_edges = matrix.get_cost(a_prev, b)
                                 + matrix.get_cost(b, a_next)
                                 + matrix.get_cost(b_prev, a)
                                 + matrix.get_cost(a, b_next);
        return new_edges - old_edges;
    }

    template<bool asymmetric>
    cost_t ComputeTwoOptMoveDelta(const Route &tour, const DistanceMatrix &matrix, tour_idx i, tour_idx j) {
        if (i == j) {
            return 0;
        }
        if (i > j) {
            std::swap(i, j);
        }

        // The segment [i, j) is reversed: im1 -> first .. last -> jp1 becomes im1 -> last .. first -> jp1
        const city_idx im1 = CityAt(tour, i - 1);
        const city_idx first = tour[i];
        const city_idx last = tour[j - 1];
        const city_idx jp1 = CityAt(tour, j);

        // Costs of the old edges that will be removed:
        cost_t old_edges = matrix.get_cost(im1, first) + matrix.get_cost(last, jp1);

        // Costs of the new edges that will be added:
        cost_t new_edges = matrix.get_cost(im1, last) + matrix.get_cost(first, jp1);

        if constexpr (asymmetric) {
            // For an ASYMMETRIC matrix, also account for the edges reversed inside the segment
            for (tour_idx k = i; k + 1 < j; ++k) {
                old_edges += matrix.get_cost(tour[k], tour[k + 1]);
                new_edges += matrix.get_cost(tour[k + 1], tour[k]);
            }
        }

        return new_edges - old_edges;
    }

    template cost_t ComputeTwoOptMoveDelta<true>(const Route &, const DistanceMatrix &, tour_idx, tour_idx);

    template cost_t ComputeTwoOptMoveDelta<false>(const Route &, const DistanceMatrix &, tour_idx, tour_idx);

    cost_t ComputeInsertMoveDelta(const Route &tour, const DistanceMatrix &matrix, const tour_idx i,
                                  const tour_idx j) {
        if (i == j) {
            return 0;
        }
        const auto n = static_cast<tour_idx>(tour.size());
        const city_idx a = tour[i];
        const city_idx a_prev = CityAt(tour, i - 1);
        const city_idx a_next = CityAt(tour, i + 1);

        // Removing a closes the gap: a_prev -> a_next
        cost_t delta = matrix.get_cost(a_prev, a_next)
                       - matrix.get_cost(a_prev, a)
                       - matrix.get_cost(a, a_next);

        city_idx left;
        city_idx right;
        if (i < j) {
            // Cities i+1 .. j shift left by one; a lands between old tour[j] and old tour[j+1].
            left = tour[j];
            const tour_idx right_idx = (j + 1) % n;
            // When the right neighbor is a itself (i = 0, j = n-1) the displaced neighbor is a_next
            right = (right_idx == i) ? a_next : tour[right_idx];
        } else {
            // Cities j .. i-1 shift right by one; a lands between old tour[j-1] and old tour[j].
            const tour_idx left_idx = (j - 1 + n) % n;
            // When the left neighbor is a itself (j = 0, i = n-1) the displaced neighbor is a_prev
            left = (left_idx == i) ? a_prev : tour[left_idx];
            right = tour[j];
        }

        delta += matrix.get_cost(left, a)
                + matrix.get_cost(a, right)
                - matrix.get_cost(left, right);
        return delta;
    }

    cost_t ComputeMoveDelta(const Route &tour, const DistanceMatrix &matrix, const move_t &move) {
        switch (move.type) {
            case MTSP_NEIGHBORHOOD_SWAP:
                return ComputeSwapMoveDelta(tour, matrix, move.i, move.j);
            case MTSP_NEIGHBORHOOD_INSERT:
                return ComputeInsertMoveDelta(tour, matrix, move.i, move.j);
            case MTSP_NEIGHBORHOOD_TWO_OPT:
                return matrix.is_symmetric()
                           ? ComputeTwoOptMoveDelta<false>(tour, matrix, move.i, move.j)
                           : ComputeTwoOptMoveDelta<true>(tour, matrix, move.i, move.j);
        }
        return COST_POSITIVE_INFINITY;
    }

    void ApplyMove(Route &tour, const move_t &move) {
        const tour_idx i = move.i;
        const tour_idx j = move.j;
        if (i == j) {
            return;
        }
        switch (move.type) {
            case MTSP_NEIGHBORHOOD_SWAP: {
                std::swap(tour[i], tour[j]);
                break;
            }
            case MTSP_NEIGHBORHOOD_TWO_OPT: {
                const tour_idx lo = std::min(i, j);
                const tour_idx hi = std::max(i, j);
                std::reverse(tour.begin() + lo, tour.begin() + hi);
                break;
            }
            case MTSP_NEIGHBORHOOD_INSERT: {
                if (i < j) {
                    std::rotate(tour.begin() + i, tour.begin() + i + 1, tour.begin() + j + 1);
                } else {
                    std::rotate(tour.begin() + j, tour.begin() + i, tour.begin() + i + 1);
                }
                break;
            }
        }
    }

    neighbor_t GenerateNeighbor(const Route &tour, const cost_t current_cost, const DistanceMatrix &matrix,
                                const MtspNeighborhood type, const CostMode mode, Rng &rng) {
        neighbor_t neighbor{};
        neighbor.move = SampleMove(type, tour.size(), rng);
        neighbor.route = tour;
        ::mtsp::ApplyMove(neighbor.route, neighbor.move);

        if (mode == CostMode::Delta) {
            neighbor.cost = current_cost + ComputeMoveDelta(tour, matrix, neighbor.move);
#ifdef MTSP_IS_DEBUG
            const cost_t expected_cost = ComputeTourCost(neighbor.route, matrix);
            assert(std::fabs(neighbor.cost - expected_cost) <= 1e-6 * std::max<cost_t>(1, expected_cost));
#endif
        } else {
            neighbor.cost = ComputeTourCost(neighbor.route, matrix);
        }
        return neighbor;
    }

    void CostReconciler::on_delta_update(const Route &tour, const DistanceMatrix &matrix, cost_t &cost) {
        ++num_dirty_cost_computations;

        // occasionally do a full cost recompute
        if (num_dirty_cost_computations > MAX_DIRTY_COST_UPDATES) {
            num_dirty_cost_computations = 0;
            cost = ComputeTourCost(tour, matrix);
        }
    }
}
