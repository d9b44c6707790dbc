#include "simulated_annealing.h"
#include "moves.h"

#include <cmath>
#include <sstream>

namespace mtsp {
    bool AcceptMove(const cost_t delta, const double temperature, const double uniform_draw) {
        if (delta < 0) {
            return true;
        }
        return uniform_draw < std::exp(-delta / temperature);
    }

    MtspStatus ValidateSimulatedAnnealingOptions(const MtspSimulatedAnnealingOptionsDescriptor &options,
                                                 const size_t num_cities, std::string *why) {
        std::ostringstream msg;
        if (num_cities < MIN_CITIES_FOR_MOVES) {
            msg << "simulated annealing needs at least " << MIN_CITIES_FOR_MOVES << " cities, got " << num_cities;
        } else if (!IsValidNeighborhood(options.neighborhood_type)) {
            msg << "unknown neighborhood_type " << static_cast<int>(options.neighborhood_type);
        } else if (!(options.T0 > 0) || !std::isfinite(options.T0)) {
            msg << "T0 must be a positive number, got " << options.T0;
        } else if (!(options.T_min > 0) || !std::isfinite(options.T_min)) {
            msg << "T_min must be a positive number, got " << options.T_min;
        } else if (!(options.alpha > 0 && options.alpha < 1)) {
            msg << "alpha must lie in (0, 1), got " << options.alpha;
        } else {
            return MTSP_STATUS_SUCCESS;
        }
        if (why) *why = msg.str();
        return MTSP_STATUS_ERROR_INVALID_CONFIG;
    }

    search_result_t RunSimulatedAnnealing(const DistanceMatrix &matrix,
                                          const MtspSimulatedAnnealingOptionsDescriptor &options, Rng &rng) {
        const CostMode mode = CostModeFromFlag(options.use_delta);

        Route current_tour = GenerateRandomTour(matrix.size(), rng);
        cost_t current_cost = ComputeTourCost(current_tour, matrix);

        search_result_t best{.route = current_tour, .cost = current_cost};

        CostReconciler reconciler{};
        std::uniform_real_distribution<double> uniform(0.0, 1.0);

        double temperature = options.T0;
        for (uint64_t iteration = 0; temperature > options.T_min && iteration < options.max_iter; ++iteration) {
            neighbor_t candidate = ::mtsp::GenerateNeighbor(current_tour, current_cost, matrix,
                                                            options.neighborhood_type, mode, rng);
            const cost_t delta = candidate.cost - current_cost;

            // draw every iteration so that both cost modes consume the random stream identically
            const double draw = uniform(rng);
            if (AcceptMove(delta, temperature, draw)) {
                current_tour = std::move(candidate.route);
                current_cost = candidate.cost;
                if (mode == CostMode::Delta) {
                    reconciler.on_delta_update(current_tour, matrix, current_cost);
                }

                if (current_cost < best.cost) {
                    best.route = current_tour;
                    best.cost = current_cost;
                }
            }

            temperature *= options.alpha;
        }

        best.cost = ComputeTourCost(best.route, matrix);
        return best;
    }
}
