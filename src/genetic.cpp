#include "genetic.h"
#include "moves.h"

#include <algorithm>
#include <cassert>
#include <iterator>
#include <numeric>
#include <sstream>

namespace mtsp {
    namespace {
        constexpr city_idx EMPTY_SLOT = -1;

        /// Inverse permutation: position_of[city] is the index of city in tour.
        [[nodiscard]] std::vector<tour_idx> PositionsOf(const Route &tour) {
            std::vector<tour_idx> position_of(tour.size());
            for (size_t k = 0; k < tour.size(); ++k) {
                position_of[tour[k]] = static_cast<tour_idx>(k);
            }
            return position_of;
        }

        [[nodiscard]] bool IsValidSelection(const MtspSelection selection) {
            switch (selection) {
                case MTSP_SELECTION_TOURNAMENT:
                case MTSP_SELECTION_ROULETTE:
                case MTSP_SELECTION_RANKING:
                    return true;
            }
            return false;
        }

        [[nodiscard]] bool IsValidCrossover(const MtspCrossover crossover) {
            switch (crossover) {
                case MTSP_CROSSOVER_OX:
                case MTSP_CROSSOVER_PMX:
                case MTSP_CROSSOVER_CX:
                    return true;
            }
            return false;
        }

        [[nodiscard]] size_t SelectParent(const MtspGeneticOptionsDescriptor &options,
                                          const std::vector<cost_t> &costs, Rng &rng) {
            switch (options.selection) {
                case MTSP_SELECTION_TOURNAMENT:
                    return SelectTournament(costs, options.tournament_size, rng);
                case MTSP_SELECTION_ROULETTE:
                    return SelectRoulette(costs, rng);
                case MTSP_SELECTION_RANKING:
                    return SelectRanking(costs, rng);
            }
            return 0;
        }
    }

    slice_t SampleSlice(const size_t num_cities, Rng &rng) {
        std::uniform_int_distribution<tour_idx> dist(0, static_cast<tour_idx>(num_cities) - 1);
        tour_idx a = dist(rng);
        tour_idx b = dist(rng);
        while (a == b) {
            b = dist(rng);
        }
        return {std::min(a, b), std::max(a, b)};
    }

    size_t SelectTournament(const std::vector<cost_t> &costs, const size_t tournament_size, Rng &rng) {
        std::vector<size_t> all(costs.size());
        std::iota(all.begin(), all.end(), 0);

        std::vector<size_t> contestants{};
        contestants.reserve(tournament_size);
        std::ranges::sample(all, std::back_inserter(contestants), static_cast<std::ptrdiff_t>(tournament_size), rng);

        size_t winner = contestants.front();
        for (const size_t idx: contestants) {
            if (costs[idx] < costs[winner]) {
                winner = idx;
            }
        }
        return winner;
    }

    size_t SelectRoulette(const std::vector<cost_t> &costs, Rng &rng) {
        std::vector<double> fitness(costs.size());
        for (size_t k = 0; k < costs.size(); ++k) {
            // zero-cost tours would otherwise get an infinite weight
            fitness[k] = 1.0 / (costs[k] + 1e-9);
        }
        std::discrete_distribution<size_t> dist(fitness.begin(), fitness.end());
        return dist(rng);
    }

    size_t SelectRanking(const std::vector<cost_t> &costs, Rng &rng) {
        std::vector<size_t> order(costs.size());
        std::iota(order.begin(), order.end(), 0);
        std::ranges::stable_sort(order, [&costs](const size_t a, const size_t b) {
            return costs[a] < costs[b];
        });

        // order[0] is the cheapest and gets rank N, order[N-1] gets rank 1
        std::vector<double> ranks(costs.size());
        for (size_t k = 0; k < ranks.size(); ++k) {
            ranks[k] = static_cast<double>(ranks.size() - k);
        }
        std::discrete_distribution<size_t> dist(ranks.begin(), ranks.end());
        return order[dist(rng)];
    }

    Route CrossoverOX(const Route &parent1, const Route &parent2, const slice_t slice) {
        const auto n = static_cast<tour_idx>(parent1.size());
        Route child(parent1.size(), EMPTY_SLOT);
        std::vector<bool> placed(parent1.size(), false);

        for (tour_idx k = slice.begin; k < slice.end; ++k) {
            child[k] = parent1[k];
            placed[parent1[k]] = true;
        }

        tour_idx pos = slice.end;
        for (const city_idx city: parent2) {
            if (placed[city]) {
                continue;
            }
            if (pos == n) {
                pos = 0;
            }
            child[pos] = city;
            placed[city] = true;
            ++pos;
        }
        return child;
    }

    Route CrossoverPMX(const Route &parent1, const Route &parent2, const slice_t slice) {
        Route child(parent1.size(), EMPTY_SLOT);
        std::vector<bool> placed(parent1.size(), false);
        const std::vector<tour_idx> position_in_parent2 = PositionsOf(parent2);

        for (tour_idx k = slice.begin; k < slice.end; ++k) {
            child[k] = parent1[k];
            placed[parent1[k]] = true;
        }

        for (tour_idx k = slice.begin; k < slice.end; ++k) {
            const city_idx city = parent2[k];
            if (placed[city]) {
                continue;
            }
            // follow the slice mapping until a free slot outside the slice turns up
            tour_idx pos = k;
            while (child[pos] != EMPTY_SLOT) {
                pos = position_in_parent2[parent1[pos]];
            }
            child[pos] = city;
            placed[city] = true;
        }

        for (size_t k = 0; k < child.size(); ++k) {
            if (child[k] == EMPTY_SLOT) {
                child[k] = parent2[k];
            }
        }
        return child;
    }

    Route CrossoverCX(const Route &parent1, const Route &parent2) {
        const std::vector<tour_idx> position_in_parent1 = PositionsOf(parent1);
        std::vector<bool> in_cycle(parent1.size(), false);

        tour_idx idx = 0;
        while (!in_cycle[idx]) {
            in_cycle[idx] = true;
            idx = position_in_parent1[parent2[idx]];
        }

        Route child(parent1.size());
        for (size_t k = 0; k < child.size(); ++k) {
            child[k] = in_cycle[k] ? parent1[k] : parent2[k];
        }
        return child;
    }

    Route Crossover(const MtspCrossover type, const Route &parent1, const Route &parent2, Rng &rng) {
        switch (type) {
            case MTSP_CROSSOVER_OX:
                return CrossoverOX(parent1, parent2, SampleSlice(parent1.size(), rng));
            case MTSP_CROSSOVER_PMX:
                return CrossoverPMX(parent1, parent2, SampleSlice(parent1.size(), rng));
            case MTSP_CROSSOVER_CX:
                return CrossoverCX(parent1, parent2);
        }
        return parent1;
    }

    MtspStatus ValidateGeneticOptions(const MtspGeneticOptionsDescriptor &options, const size_t num_cities,
                                      std::string *why) {
        std::ostringstream msg;
        if (num_cities < MIN_CITIES_FOR_MOVES) {
            msg << "the genetic algorithm needs at least " << MIN_CITIES_FOR_MOVES << " cities, got " << num_cities;
        } else if (!IsValidNeighborhood(options.mutation_type)) {
            msg << "unknown mutation_type " << static_cast<int>(options.mutation_type);
        } else if (!IsValidSelection(options.selection)) {
            msg << "unknown selection " << static_cast<int>(options.selection);
        } else if (!IsValidCrossover(options.crossover)) {
            msg << "unknown crossover " << static_cast<int>(options.crossover);
        } else if (options.population_size < 2) {
            msg << "population_size must be at least 2, got " << options.population_size;
        } else if (options.selection == MTSP_SELECTION_TOURNAMENT
                   && (options.tournament_size == 0 || options.tournament_size > options.population_size)) {
            msg << "tournament_size must lie in [1, population_size], got " << options.tournament_size;
        } else if (!(options.mutation_prob >= 0 && options.mutation_prob <= 1)) {
            msg << "mutation_prob must lie in [0, 1], got " << options.mutation_prob;
        } else {
            return MTSP_STATUS_SUCCESS;
        }
        if (why) *why = msg.str();
        return MTSP_STATUS_ERROR_INVALID_CONFIG;
    }

    search_result_t RunGenetic(const DistanceMatrix &matrix, const MtspGeneticOptionsDescriptor &options, Rng &rng,
                               std::vector<cost_t> *best_cost_trace,
                               std::vector<generation_snapshot_t> *population_trace) {
        const size_t n = matrix.size();
        const size_t population_size = options.population_size;

        std::vector<Route> population{};
        std::vector<cost_t> costs{};
        population.reserve(population_size);
        costs.reserve(population_size);
        for (size_t k = 0; k < population_size; ++k) {
            population.push_back(GenerateRandomTour(n, rng));
            costs.push_back(ComputeTourCost(population.back(), matrix));
        }

        search_result_t best{};
        {
            const auto best_it = std::ranges::min_element(costs);
            const auto best_idx = static_cast<size_t>(best_it - costs.begin());
            best.route = population[best_idx];
            best.cost = costs[best_idx];
        }
        if (population_trace != nullptr) {
            population_trace->push_back({.population = population, .costs = costs});
        }

        std::uniform_real_distribution<double> uniform(0.0, 1.0);

        for (uint32_t generation = 0; generation < options.generations; ++generation) {
            std::vector<Route> next_population{};
            std::vector<cost_t> next_costs{};
            next_population.reserve(population_size);
            next_costs.reserve(population_size);

            // elite
            next_population.push_back(best.route);
            next_costs.push_back(best.cost);

            while (next_population.size() < population_size) {
                const size_t p1 = SelectParent(options, costs, rng);
                const size_t p2 = SelectParent(options, costs, rng);

                Route child = ::mtsp::Crossover(options.crossover, population[p1], population[p2], rng);

                if (uniform(rng) < options.mutation_prob) {
                    ::mtsp::ApplyMove(child, SampleMove(options.mutation_type, n, rng));
                }

#ifdef MTSP_IS_DEBUG
                assert(IsValidPermutation(child, n));
#endif
                next_costs.push_back(ComputeTourCost(child, matrix));
                next_population.push_back(std::move(child));
            }

            population = std::move(next_population);
            costs = std::move(next_costs);

            const auto best_it = std::ranges::min_element(costs);
            if (*best_it < best.cost) {
                const auto best_idx = static_cast<size_t>(best_it - costs.begin());
                best.route = population[best_idx];
                best.cost = costs[best_idx];
            }

            if (best_cost_trace != nullptr) {
                best_cost_trace->push_back(best.cost);
            }
            if (population_trace != nullptr) {
                population_trace->push_back({.population = population, .costs = costs});
            }
        }
        return best;
    }
}
