#include "constructors.h"
#include "hill_climbing.h"
#include "moves.h"

#include <algorithm>
#include <cassert>
#include <cmath>
#include <sstream>

namespace mtsp {
    Route BuildNearestNeighborTour(const DistanceMatrix &matrix, const city_idx start_city) {
        const size_t n = matrix.size();
        std::vector<bool> visited(n, false);

        Route tour{};
        tour.reserve(n);
        tour.push_back(start_city);
        visited[start_city] = true;

        // build the tour
        while (tour.size() < n) {
            const city_idx last_city = tour.back();
            cost_t min_cost = COST_POSITIVE_INFINITY;
            city_idx nearest_city = -1;
            for (city_idx city = 0; city < static_cast<city_idx>(n); ++city) {
                if (visited[city]) {
                    continue;
                }
                const cost_t cost = matrix.get_cost(last_city, city);
                if (cost < min_cost) {
                    min_cost = cost;
                    nearest_city = city;
                }
            }
            assert(nearest_city != -1);
            tour.push_back(nearest_city);
            visited[nearest_city] = true;
        }
        return tour;
    }

    MtspStatus ValidateNearestNeighborOptions(const MtspNearestNeighborOptionsDescriptor &options,
                                              const size_t num_cities, std::string *why) {
        if (options.start_city >= num_cities) {
            if (why) {
                std::ostringstream msg;
                msg << "start_city " << options.start_city << " is out of range for " << num_cities << " cities";
                *why = msg.str();
            }
            return MTSP_STATUS_ERROR_INVALID_CONFIG;
        }
        return MTSP_STATUS_SUCCESS;
    }

    Route ConstructGreedyRandomizedTour(const DistanceMatrix &matrix, const double alpha, const city_idx start_city,
                                        Rng &rng) {
        const size_t n = matrix.size();

        std::vector<city_idx> remaining{};
        remaining.reserve(n);
        for (city_idx city = 0; city < static_cast<city_idx>(n); ++city) {
            if (city != start_city) {
                remaining.push_back(city);
            }
        }

        Route tour{};
        tour.reserve(n);
        tour.push_back(start_city);

        std::vector<size_t> rcl{};
        rcl.reserve(n);

        city_idx current = start_city;
        while (!remaining.empty()) {
            cost_t min_cost = COST_POSITIVE_INFINITY;
            cost_t max_cost = -COST_POSITIVE_INFINITY;
            for (const city_idx city: remaining) {
                const cost_t cost = matrix.get_cost(current, city);
                min_cost = std::min(min_cost, cost);
                max_cost = std::max(max_cost, cost);
            }

            // with equal distances everywhere the whole list qualifies and the draw is uniform
            const cost_t threshold = min_cost + alpha * (max_cost - min_cost);
            rcl.clear();
            for (size_t k = 0; k < remaining.size(); ++k) {
                if (matrix.get_cost(current, remaining[k]) <= threshold) {
                    rcl.push_back(k);
                }
            }

            std::uniform_int_distribution<size_t> dist(0, rcl.size() - 1);
            const size_t chosen = rcl[dist(rng)];
            current = remaining[chosen];
            tour.push_back(current);
            remaining.erase(remaining.begin() + static_cast<std::ptrdiff_t>(chosen));
        }
        return tour;
    }

    Route ConstructGreedyRandomizedTour(const DistanceMatrix &matrix, const double alpha, Rng &rng) {
        std::uniform_int_distribution<city_idx> dist(0, static_cast<city_idx>(matrix.size()) - 1);
        const city_idx start_city = dist(rng);
        return ConstructGreedyRandomizedTour(matrix, alpha, start_city, rng);
    }

    MtspStatus ValidateGraspOptions(const MtspGraspOptionsDescriptor &options, const size_t num_cities,
                                    std::string *why) {
        std::ostringstream msg;
        if (num_cities < MIN_CITIES_FOR_MOVES) {
            msg << "GRASP needs at least " << MIN_CITIES_FOR_MOVES << " cities, got " << num_cities;
        } else if (!IsValidNeighborhood(options.neighborhood_type)) {
            msg << "unknown neighborhood_type " << static_cast<int>(options.neighborhood_type);
        } else if (!(options.alpha >= 0 && options.alpha <= 1)) {
            msg << "alpha must lie in [0, 1], got " << options.alpha;
        } else if (options.iterations == 0) {
            msg << "iterations must be at least 1";
        } else if (options.ihc_stop_no_improve == 0) {
            msg << "ihc_stop_no_improve must be at least 1";
        } else {
            return MTSP_STATUS_SUCCESS;
        }
        if (why) *why = msg.str();
        return MTSP_STATUS_ERROR_INVALID_CONFIG;
    }

    search_result_t RunGrasp(const DistanceMatrix &matrix, const MtspGraspOptionsDescriptor &options, Rng &rng) {
        const hill_climb_limits_t limits{
            .max_iter = options.ihc_max_iter,
            .stop_no_improve = options.ihc_stop_no_improve,
            .neighborhood_type = options.neighborhood_type,
            .cost_mode = CostModeFromFlag(options.use_delta),
        };

        search_result_t best{};
        for (uint32_t iteration = 0; iteration < options.iterations; ++iteration) {
            Route start_tour = ConstructGreedyRandomizedTour(matrix, options.alpha, rng);
            search_result_t local = HillClimb(matrix, std::move(start_tour), limits, rng);
            if (local.cost < best.cost) {
                best = std::move(local);
            }
        }
        return best;
    }
}
