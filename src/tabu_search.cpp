#include "tabu_search.h"

#include <algorithm>
#include <cassert>
#include <cmath>
#include <sstream>

namespace mtsp {
    namespace {
        /// The search loop shared by both memory kinds. key_of maps the current tour and a sampled move
        /// to the key the memory stores once that move is accepted.
        template<typename Key, typename KeyFn>
        search_result_t SearchWithMemory(const DistanceMatrix &matrix, const MtspTabuSearchOptionsDescriptor &options,
                                         Rng &rng, KeyFn key_of) {
            Route current_tour = GenerateRandomTour(matrix.size(), rng);
            cost_t current_cost = ComputeTourCost(current_tour, matrix);

            search_result_t best{.route = current_tour, .cost = current_cost};

            TabuMemory<Key> tabu_memory{options.tabu_tenure};
            CostReconciler reconciler{};
            uint64_t no_improve = 0;

            for (uint64_t iteration = 0; iteration < options.max_iter; ++iteration) {
                move_t best_move{};
                Key best_key{};
                cost_t best_candidate_cost = COST_POSITIVE_INFINITY;

                // explore n_neighbors sampled moves, costs by delta only
                for (uint32_t k = 0; k < options.n_neighbors; ++k) {
                    const move_t move = SampleMove(options.neighborhood_type, current_tour.size(), rng);
                    const cost_t candidate_cost = current_cost + ComputeMoveDelta(current_tour, matrix, move);
                    Key key = key_of(current_tour, move);

                    if (!::mtsp::IsCandidateAdmissible(tabu_memory, key, candidate_cost, best.cost)) {
                        continue;
                    }
                    if (candidate_cost < best_candidate_cost) {
                        best_candidate_cost = candidate_cost;
                        best_move = move;
                        best_key = std::move(key);
                    }
                }

                if (best_move.i == -1) {
                    ++no_improve;
                    if (no_improve >= options.stop_no_improve) {
                        break;
                    }
                    continue;
                }

                ::mtsp::ApplyMove(current_tour, best_move);
                current_cost = best_candidate_cost;
                reconciler.on_delta_update(current_tour, matrix, current_cost);

#ifdef MTSP_IS_DEBUG
                const cost_t expected_cost = ComputeTourCost(current_tour, matrix);
                assert(std::fabs(current_cost - expected_cost) <= 1e-6 * std::max<cost_t>(1, expected_cost));
                assert(IsValidPermutation(current_tour, matrix.size()));
#endif

                tabu_memory.push(std::move(best_key));

                if (current_cost < best.cost) {
                    best.route = current_tour;
                    best.cost = current_cost;
                    no_improve = 0;
                } else {
                    ++no_improve;
                }

                if (no_improve >= options.stop_no_improve) {
                    break;
                }
            }

            best.cost = ComputeTourCost(best.route, matrix);
            return best;
        }
    }

    bool IsValidTabuKey(const MtspTabuKey tabu_key) {
        switch (tabu_key) {
            case MTSP_TABU_KEY_MOVE:
            case MTSP_TABU_KEY_ROUTE:
                return true;
        }
        return false;
    }

    MtspStatus ValidateTabuSearchOptions(const MtspTabuSearchOptionsDescriptor &options, const size_t num_cities,
                                         std::string *why) {
        std::ostringstream msg;
        if (num_cities < MIN_CITIES_FOR_MOVES) {
            msg << "tabu search needs at least " << MIN_CITIES_FOR_MOVES << " cities, got " << num_cities;
        } else if (!IsValidNeighborhood(options.neighborhood_type)) {
            msg << "unknown neighborhood_type " << static_cast<int>(options.neighborhood_type);
        } else if (!IsValidTabuKey(options.tabu_key)) {
            msg << "unknown tabu_key " << static_cast<int>(options.tabu_key);
        } else if (options.tabu_tenure == 0) {
            msg << "tabu_tenure must be at least 1";
        } else if (options.n_neighbors == 0) {
            msg << "n_neighbors must be at least 1";
        } else if (options.stop_no_improve == 0) {
            msg << "stop_no_improve must be at least 1";
        } else {
            return MTSP_STATUS_SUCCESS;
        }
        if (why) *why = msg.str();
        return MTSP_STATUS_ERROR_INVALID_CONFIG;
    }

    search_result_t RunTabuSearch(const DistanceMatrix &matrix, const MtspTabuSearchOptionsDescriptor &options,
                                  Rng &rng) {
        if (options.tabu_key == MTSP_TABU_KEY_ROUTE) {
            return SearchWithMemory<Route>(matrix, options, rng, [](const Route &tour, const move_t &move) {
                Route candidate = tour;
                ::mtsp::ApplyMove(candidate, move);
                return candidate;
            });
        }
        return SearchWithMemory<tabu_key_t>(matrix, options, rng, [](const Route &, const move_t &move) {
            return TabuKeyOf(move);
        });
    }
}
