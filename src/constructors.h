#pragma once

#include "common.h"
#include "distance_matrix.h"

#include <string>

namespace mtsp {
    /// Greedy tour from start_city: always travel to the closest unvisited city, ties to the lowest index.
    [[nodiscard]] Route BuildNearestNeighborTour(const DistanceMatrix &matrix, city_idx start_city);

    [[nodiscard]] MtspStatus ValidateNearestNeighborOptions(const MtspNearestNeighborOptionsDescriptor &options,
                                                            size_t num_cities, std::string *why = nullptr);

    /// Greedy randomized construction from start_city. At every step the restricted candidate list holds the
    /// unvisited cities within min + alpha * (max - min) of the current city; the next city is drawn
    /// uniformly from it.
    [[nodiscard]] Route ConstructGreedyRandomizedTour(const DistanceMatrix &matrix, double alpha,
                                                      city_idx start_city, Rng &rng);

    /// Same as above from a uniformly random start city.
    [[nodiscard]] Route ConstructGreedyRandomizedTour(const DistanceMatrix &matrix, double alpha, Rng &rng);

    [[nodiscard]] MtspStatus ValidateGraspOptions(const MtspGraspOptionsDescriptor &options, size_t num_cities,
                                                  std::string *why = nullptr);

    /// Runs options.iterations rounds of construction followed by hill climbing and keeps the best tour.
    [[nodiscard]] search_result_t RunGrasp(const DistanceMatrix &matrix, const MtspGraspOptionsDescriptor &options,
                                           Rng &rng);
}
