#include "hill_climbing.h"

#include <sstream>

namespace mtsp {
    search_result_t HillClimb(const DistanceMatrix &matrix, Route start_tour, const hill_climb_limits_t &limits,
                              Rng &rng, std::vector<cost_t> *best_cost_trace) {
        search_result_t best{};
        best.cost = ComputeTourCost(start_tour, matrix);
        best.route = std::move(start_tour);

        CostReconciler reconciler{};
        uint64_t no_improve = 0;

        for (uint64_t iteration = 0; iteration < limits.max_iter; ++iteration) {
            neighbor_t candidate = ::mtsp::GenerateNeighbor(best.route, best.cost, matrix,
                                                            limits.neighborhood_type, limits.cost_mode, rng);

            if (candidate.cost < best.cost) {
                best.route = std::move(candidate.route);
                best.cost = candidate.cost;
                no_improve = 0;
                if (limits.cost_mode == CostMode::Delta) {
                    reconciler.on_delta_update(best.route, matrix, best.cost);
                }
            } else {
                ++no_improve;
            }

            if (best_cost_trace != nullptr) {
                best_cost_trace->push_back(best.cost);
            }

            if (no_improve >= limits.stop_no_improve) {
                break;
            }
        }

        if (limits.cost_mode == CostMode::Delta) {
            best.cost = ComputeTourCost(best.route, matrix);
        }
        return best;
    }

    MtspStatus ValidateHillClimbingOptions(const MtspHillClimbingOptionsDescriptor &options,
                                           const size_t num_cities, std::string *why) {
        std::ostringstream msg;
        if (num_cities < MIN_CITIES_FOR_MOVES) {
            msg << "hill climbing needs at least " << MIN_CITIES_FOR_MOVES << " cities, got " << num_cities;
        } else if (!IsValidNeighborhood(options.neighborhood_type)) {
            msg << "unknown neighborhood_type " << static_cast<int>(options.neighborhood_type);
        } else if (options.n_starts == 0) {
            msg << "n_starts must be at least 1";
        } else if (options.stop_no_improve == 0) {
            msg << "stop_no_improve must be at least 1";
        } else {
            return MTSP_STATUS_SUCCESS;
        }
        if (why) *why = msg.str();
        return MTSP_STATUS_ERROR_INVALID_CONFIG;
    }

    search_result_t RunHillClimbing(const DistanceMatrix &matrix, const MtspHillClimbingOptionsDescriptor &options,
                                    Rng &rng) {
        const hill_climb_limits_t limits{
            .max_iter = options.max_iter,
            .stop_no_improve = options.stop_no_improve,
            .neighborhood_type = options.neighborhood_type,
            .cost_mode = CostModeFromFlag(options.use_delta),
        };

        search_result_t best{};
        for (uint32_t start = 0; start < options.n_starts; ++start) {
            search_result_t local = HillClimb(matrix, GenerateRandomTour(matrix.size(), rng), limits, rng);
            if (local.cost < best.cost) {
                best = std::move(local);
            }
        }
        return best;
    }
}
