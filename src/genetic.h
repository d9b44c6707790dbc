#pragma once

#include "common.h"
#include "distance_matrix.h"

#include <string>

namespace mtsp {
    /// A crossover slice covering the positions [begin, end), begin < end.
    struct slice_t {
        tour_idx begin = 0;
        tour_idx end = 0;
    };

    /// The population and its costs as they stood at the end of one generation.
    struct generation_snapshot_t {
        std::vector<Route> population;
        std::vector<cost_t> costs;
    };

    /// Uniformly random slice with distinct endpoints drawn from 0 .. num_cities - 1.
    [[nodiscard]] slice_t SampleSlice(size_t num_cities, Rng &rng);

    /// Index of the cheapest of tournament_size distinct individuals drawn uniformly.
    [[nodiscard]] size_t SelectTournament(const std::vector<cost_t> &costs, size_t tournament_size, Rng &rng);

    /// Index drawn with probability proportional to 1 / cost.
    [[nodiscard]] size_t SelectRoulette(const std::vector<cost_t> &costs, Rng &rng);

    /// Index drawn with probability proportional to its rank, the cheapest individual ranking highest.
    [[nodiscard]] size_t SelectRanking(const std::vector<cost_t> &costs, Rng &rng);

    /// Order crossover: parent1's slice stays in place, the remaining positions are filled
    /// from just after the slice (wrapping) with parent2's cities in parent2's order.
    [[nodiscard]] Route CrossoverOX(const Route &parent1, const Route &parent2, slice_t slice);

    /// Partially matched crossover: parent1's slice stays in place, displaced parent2 cities follow the
    /// slice mapping to a free position, everything else is copied from parent2.
    [[nodiscard]] Route CrossoverPMX(const Route &parent1, const Route &parent2, slice_t slice);

    /// Cycle crossover: positions on the cycle through index 0 come from parent1, all others from parent2.
    [[nodiscard]] Route CrossoverCX(const Route &parent1, const Route &parent2);

    /// Produces one child with the chosen operator, drawing a slice where the operator needs one.
    [[nodiscard]] Route Crossover(MtspCrossover type, const Route &parent1, const Route &parent2, Rng &rng);

    [[nodiscard]] MtspStatus ValidateGeneticOptions(const MtspGeneticOptionsDescriptor &options, size_t num_cities,
                                                    std::string *why = nullptr);

    /// Evolves options.generations generations and returns the best individual ever seen. If
    /// best_cost_trace is given, the best-ever cost after every generation is appended to it. If
    /// population_trace is given, the initial population and then every generation is appended to it.
    [[nodiscard]] search_result_t RunGenetic(const DistanceMatrix &matrix, const MtspGeneticOptionsDescriptor &options,
                                             Rng &rng, std::vector<cost_t> *best_cost_trace = nullptr,
                                             std::vector<generation_snapshot_t> *population_trace = nullptr);
}
