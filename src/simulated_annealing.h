#pragma once

#include "common.h"
#include "distance_matrix.h"

#include <string>

namespace mtsp {
    /// Metropolis rule: improving moves are always taken, a worsening move of size delta is taken when
    /// the uniform [0, 1) draw falls below exp(-delta / temperature).
    [[nodiscard]] bool AcceptMove(cost_t delta, double temperature, double uniform_draw);

    [[nodiscard]] MtspStatus ValidateSimulatedAnnealingOptions(
        const MtspSimulatedAnnealingOptionsDescriptor &options, size_t num_cities, std::string *why = nullptr);

    /// Anneals from a random tour and returns the best tour seen.
    [[nodiscard]] search_result_t RunSimulatedAnnealing(const DistanceMatrix &matrix,
                                                        const MtspSimulatedAnnealingOptionsDescriptor &options,
                                                        Rng &rng);
}
