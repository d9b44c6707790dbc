#include <chrono>
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <random>
#include <string>
#include <vector>
#include <libmetatsp.h>

#include "debug_print.h"
#include "distance_matrix.h"
#include "params.h"

// Random points in the unit square scaled to max_cost, Euclidean distances.
static std::vector<cost_t> createRandomEuclideanMatrix(const size_t n, const double max_cost, std::mt19937_64 &rng) {
    std::uniform_real_distribution dist(0.0, max_cost);
    std::vector<double> xs(n);
    std::vector<double> ys(n);
    for (size_t i = 0; i < n; i++) {
        xs[i] = dist(rng);
        ys[i] = dist(rng);
    }

    std::vector<cost_t> costs(n * n, 0.0);
    for (size_t i = 0; i < n; i++) {
        for (size_t j = 0; j < n; j++) {
            costs[i * n + j] = std::hypot(xs[i] - xs[j], ys[i] - ys[j]);
        }
    }
    return costs;
}

int main(int argc, char **argv) {
    const bool verbose = argc > 1 && std::string(argv[1]) == "-v";
    std::mt19937_64 rng{std::random_device{}()};

    for (const std::vector<size_t> test_sizes{10, 25, 50, 100, 200}; const auto n: test_sizes) {
        const std::vector<cost_t> costs = createRandomEuclideanMatrix(n, 100.0, rng);
        const MtspDistanceMatrixDescriptor matrix{.costs = costs.data(), .num_cities = n};

        if (verbose && n <= 10) {
            mtsp::PrintDistanceMatrix(mtsp::DistanceMatrix::FromDescriptor(matrix));
        }

        std::cout << "N = " << n << std::endl;
        for (const auto algorithm: {MTSP_ALGORITHM_NEAREST_NEIGHBOR, MTSP_ALGORITHM_HILL_CLIMBING,
                                    MTSP_ALGORITHM_SIMULATED_ANNEALING, MTSP_ALGORITHM_TABU_SEARCH,
                                    MTSP_ALGORITHM_GRASP, MTSP_ALGORITHM_GENETIC}) {
            constexpr size_t iterations = 3;
            double total_seconds = 0;
            double total_cost = 0;

            for (size_t i = 0; i < iterations; i++) {
                MtspSolutionDescriptor outputDesc{};
                const std::string params = algorithm == MTSP_ALGORITHM_NEAREST_NEIGHBOR
                                               ? std::string{}
                                               : nlohmann::json{{"seed", i}}.dump();

                const auto start = std::chrono::steady_clock::now();
                if (const MtspStatus status = mtspSolve(&matrix, algorithm, params.c_str(), &outputDesc);
                    status != MTSP_STATUS_SUCCESS) {
                    std::cerr << "Error: " << mtsp::AlgorithmName(algorithm) << " returned status "
                              << mtspStatusToString(status) << ": " << mtspGetLastErrorMessage() << std::endl;
                    return 1;
                }
                const auto end = std::chrono::steady_clock::now();

                total_seconds += std::chrono::duration<double>(end - start).count();
                total_cost += outputDesc.cost;

                if (verbose && i == 0) {
                    mtsp::PrintRoute(mtsp::Route(outputDesc.route, outputDesc.route + outputDesc.num_cities),
                                     outputDesc.cost);
                }
                mtspDisposeSolution(&outputDesc);
            }

            // Print a summary for this engine
            std::cout << "  " << std::left << std::setw(20) << mtsp::AlgorithmName(algorithm) << std::right
                      << " avg cost = " << std::fixed << std::setprecision(2) << std::setw(10)
                      << total_cost / iterations
                      << ", avg time = " << std::setprecision(3) << std::setw(10)
                      << total_seconds / iterations * 1e3 << " ms (over " << iterations << " runs)" << std::endl;
        }
    }

    return 0;
}
