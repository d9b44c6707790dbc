#include <libmetatsp.h>

#include "common.h"
#include "constructors.h"
#include "distance_matrix.h"
#include "genetic.h"
#include "hill_climbing.h"
#include "params.h"
#include "simulated_annealing.h"
#include "tabu_search.h"

#include <algorithm>
#include <chrono>
#include <cstring>
#include <new>
#include <string>

namespace {
    thread_local std::string last_error_message{};

    MtspStatus Fail(const MtspStatus status, std::string message) {
        last_error_message = std::move(message);
        return status;
    }

    [[nodiscard]] char *CopyToCString(const std::string &text) {
        auto *buffer = new char[text.size() + 1];
        std::memcpy(buffer, text.c_str(), text.size() + 1);
        return buffer;
    }

    /// Writes the engine result into the caller's descriptor. The route buffer and the meta_json buffer
    /// are released by mtspDisposeSolution.
    void FillSolution(const mtsp::search_result_t &result, const nlohmann::json &meta,
                      const double runtime_seconds, MtspSolutionDescriptor &output_descriptor) {
        auto *route = new cityid_t[result.route.size()];
        std::ranges::transform(result.route, route, [](const mtsp::city_idx city) {
            return static_cast<cityid_t>(city);
        });

        char *meta_json;
        try {
            meta_json = CopyToCString(meta.dump());
        } catch (const std::bad_alloc &) {
            delete[] route;
            throw;
        }

        output_descriptor.route = route;
        output_descriptor.num_cities = result.route.size();
        output_descriptor.cost = result.cost;
        output_descriptor.runtime_seconds = runtime_seconds;
        output_descriptor.meta_json = meta_json;
    }

    /// Shared driver of all entry points: argument and matrix checks, option validation, timing,
    /// output filling and translation of exceptions into status codes.
    template<typename Options, typename Validate, typename Run>
    MtspStatus SolveWith(const MtspDistanceMatrixDescriptor *matrix, const Options *options,
                         MtspSolutionDescriptor *output_descriptor, Validate validate, Run run) {
        last_error_message.clear();
        if (matrix == nullptr || options == nullptr || output_descriptor == nullptr) {
            return Fail(MTSP_STATUS_ERROR_INVALID_ARG, "null argument");
        }
        *output_descriptor = MtspSolutionDescriptor{};

        std::string why{};
        if (const auto status = mtsp::ValidateDistanceMatrix(*matrix, &why); status != MTSP_STATUS_SUCCESS) {
            return Fail(status, why);
        }
        if (const auto status = validate(*options, matrix->num_cities, &why); status != MTSP_STATUS_SUCCESS) {
            return Fail(status, why);
        }

        try {
            const auto start = std::chrono::steady_clock::now();
            const mtsp::DistanceMatrix distance_matrix = mtsp::DistanceMatrix::FromDescriptor(*matrix);
            const mtsp::search_result_t result = run(distance_matrix, *options);
            const auto end = std::chrono::steady_clock::now();

            if (!mtsp::IsValidPermutation(result.route, distance_matrix.size())) {
                return Fail(MTSP_STATUS_ERROR_INTERNAL, "solver produced an invalid tour");
            }

            const double runtime_seconds = std::chrono::duration<double>(end - start).count();
            FillSolution(result, mtsp::DescribeOptions(*options), runtime_seconds, *output_descriptor);
        } catch (const std::bad_alloc &) {
            return Fail(MTSP_STATUS_OUT_OF_MEMORY, "out of memory");
        } catch (const std::exception &e) {
            return Fail(MTSP_STATUS_ERROR_INTERNAL, e.what());
        }
        return MTSP_STATUS_SUCCESS;
    }

    /// Parses params_json into Options on top of their defaults and forwards to the typed entry point.
    template<typename Options, typename Parse, typename Solve>
    MtspStatus SolveFromJson(const MtspDistanceMatrixDescriptor *matrix, const char *params_json,
                             MtspSolutionDescriptor *output_descriptor, Parse parse, Solve solve) {
        Options options{};
        nlohmann::json params{};
        if (params_json != nullptr && *params_json != '\0') {
            try {
                params = nlohmann::json::parse(params_json);
            } catch (const nlohmann::json::exception &e) {
                if (output_descriptor != nullptr) {
                    *output_descriptor = MtspSolutionDescriptor{};
                }
                return Fail(MTSP_STATUS_ERROR_INVALID_CONFIG, e.what());
            }
        }

        std::string why{};
        if (const auto status = parse(params, options, &why); status != MTSP_STATUS_SUCCESS) {
            if (output_descriptor != nullptr) {
                *output_descriptor = MtspSolutionDescriptor{};
            }
            return Fail(status, why);
        }
        return solve(matrix, &options, output_descriptor);
    }
}

MtspStatus mtspSolveHillClimbing(const MtspDistanceMatrixDescriptor *matrix,
                                 const MtspHillClimbingOptionsDescriptor *options,
                                 MtspSolutionDescriptor *output_descriptor) {
    return SolveWith(matrix, options, output_descriptor, &mtsp::ValidateHillClimbingOptions,
                     [](const mtsp::DistanceMatrix &distance_matrix, const MtspHillClimbingOptionsDescriptor &opts) {
                         mtsp::Rng rng{opts.seed};
                         return mtsp::RunHillClimbing(distance_matrix, opts, rng);
                     });
}

MtspStatus mtspSolveSimulatedAnnealing(const MtspDistanceMatrixDescriptor *matrix,
                                       const MtspSimulatedAnnealingOptionsDescriptor *options,
                                       MtspSolutionDescriptor *output_descriptor) {
    return SolveWith(matrix, options, output_descriptor, &mtsp::ValidateSimulatedAnnealingOptions,
                     [](const mtsp::DistanceMatrix &distance_matrix,
                        const MtspSimulatedAnnealingOptionsDescriptor &opts) {
                         mtsp::Rng rng{opts.seed};
                         return mtsp::RunSimulatedAnnealing(distance_matrix, opts, rng);
                     });
}

MtspStatus mtspSolveTabuSearch(const MtspDistanceMatrixDescriptor *matrix,
                               const MtspTabuSearchOptionsDescriptor *options,
                               MtspSolutionDescriptor *output_descriptor) {
    return SolveWith(matrix, options, output_descriptor, &mtsp::ValidateTabuSearchOptions,
                     [](const mtsp::DistanceMatrix &distance_matrix, const MtspTabuSearchOptionsDescriptor &opts) {
                         mtsp::Rng rng{opts.seed};
                         return mtsp::RunTabuSearch(distance_matrix, opts, rng);
                     });
}

MtspStatus mtspSolveGrasp(const MtspDistanceMatrixDescriptor *matrix,
                          const MtspGraspOptionsDescriptor *options,
                          MtspSolutionDescriptor *output_descriptor) {
    return SolveWith(matrix, options, output_descriptor, &mtsp::ValidateGraspOptions,
                     [](const mtsp::DistanceMatrix &distance_matrix, const MtspGraspOptionsDescriptor &opts) {
                         mtsp::Rng rng{opts.seed};
                         return mtsp::RunGrasp(distance_matrix, opts, rng);
                     });
}

MtspStatus mtspSolveGenetic(const MtspDistanceMatrixDescriptor *matrix,
                            const MtspGeneticOptionsDescriptor *options,
                            MtspSolutionDescriptor *output_descriptor) {
    return SolveWith(matrix, options, output_descriptor, &mtsp::ValidateGeneticOptions,
                     [](const mtsp::DistanceMatrix &distance_matrix, const MtspGeneticOptionsDescriptor &opts) {
                         mtsp::Rng rng{opts.seed};
                         return mtsp::RunGenetic(distance_matrix, opts, rng);
                     });
}

MtspStatus mtspSolveNearestNeighbor(const MtspDistanceMatrixDescriptor *matrix,
                                    const MtspNearestNeighborOptionsDescriptor *options,
                                    MtspSolutionDescriptor *output_descriptor) {
    return SolveWith(matrix, options, output_descriptor, &mtsp::ValidateNearestNeighborOptions,
                     [](const mtsp::DistanceMatrix &distance_matrix,
                        const MtspNearestNeighborOptionsDescriptor &opts) {
                         mtsp::search_result_t result{};
                         result.route = mtsp::BuildNearestNeighborTour(distance_matrix, opts.start_city);
                         result.cost = mtsp::ComputeTourCost(result.route, distance_matrix);
                         return result;
                     });
}

MtspStatus mtspSolve(const MtspDistanceMatrixDescriptor *matrix,
                     const MtspAlgorithm algorithm,
                     const char *params_json,
                     MtspSolutionDescriptor *output_descriptor) {
    last_error_message.clear();
    switch (algorithm) {
        case MTSP_ALGORITHM_HILL_CLIMBING:
            return SolveFromJson<MtspHillClimbingOptionsDescriptor>(
                matrix, params_json, output_descriptor,
                &mtsp::ParseHillClimbingOptions, &mtspSolveHillClimbing);
        case MTSP_ALGORITHM_SIMULATED_ANNEALING:
            return SolveFromJson<MtspSimulatedAnnealingOptionsDescriptor>(
                matrix, params_json, output_descriptor,
                &mtsp::ParseSimulatedAnnealingOptions, &mtspSolveSimulatedAnnealing);
        case MTSP_ALGORITHM_TABU_SEARCH:
            return SolveFromJson<MtspTabuSearchOptionsDescriptor>(
                matrix, params_json, output_descriptor,
                &mtsp::ParseTabuSearchOptions, &mtspSolveTabuSearch);
        case MTSP_ALGORITHM_GRASP:
            return SolveFromJson<MtspGraspOptionsDescriptor>(
                matrix, params_json, output_descriptor,
                &mtsp::ParseGraspOptions, &mtspSolveGrasp);
        case MTSP_ALGORITHM_GENETIC:
            return SolveFromJson<MtspGeneticOptionsDescriptor>(
                matrix, params_json, output_descriptor,
                &mtsp::ParseGeneticOptions, &mtspSolveGenetic);
        case MTSP_ALGORITHM_NEAREST_NEIGHBOR:
            return SolveFromJson<MtspNearestNeighborOptionsDescriptor>(
                matrix, params_json, output_descriptor,
                &mtsp::ParseNearestNeighborOptions, &mtspSolveNearestNeighbor);
    }
    if (output_descriptor != nullptr) {
        *output_descriptor = MtspSolutionDescriptor{};
    }
    return Fail(MTSP_STATUS_ERROR_INVALID_CONFIG,
                "unknown algorithm " + std::to_string(static_cast<int>(algorithm)));
}

MtspStatus mtspComputeTourCost(const MtspDistanceMatrixDescriptor *matrix,
                               const cityid_t *route,
                               const size_t num_cities,
                               cost_t *cost) {
    last_error_message.clear();
    if (matrix == nullptr || route == nullptr || cost == nullptr) {
        return Fail(MTSP_STATUS_ERROR_INVALID_ARG, "null argument");
    }
    std::string why{};
    if (const auto status = mtsp::ValidateDistanceMatrix(*matrix, &why); status != MTSP_STATUS_SUCCESS) {
        return Fail(status, why);
    }

    try {
        mtsp::Route tour(route, route + num_cities);
        if (!mtsp::IsValidPermutation(tour, matrix->num_cities)) {
            return Fail(MTSP_STATUS_ERROR_INVALID_ARG, "route is not a permutation of the matrix cities");
        }
        const mtsp::DistanceMatrix distance_matrix = mtsp::DistanceMatrix::FromDescriptor(*matrix);
        *cost = mtsp::ComputeTourCost(tour, distance_matrix);
    } catch (const std::bad_alloc &) {
        return Fail(MTSP_STATUS_OUT_OF_MEMORY, "out of memory");
    }
    return MTSP_STATUS_SUCCESS;
}

void mtspDisposeSolution(MtspSolutionDescriptor *solution) {
    if (solution == nullptr) {
        return;
    }
    delete[] solution->route;
    delete[] solution->meta_json;
    *solution = MtspSolutionDescriptor{};
}

const char *mtspStatusToString(const MtspStatus status) {
    switch (status) {
        case MTSP_STATUS_SUCCESS:
            return "success";
        case MTSP_STATUS_ERROR_INVALID_MATRIX:
            return "invalid distance matrix";
        case MTSP_STATUS_ERROR_INVALID_ARG:
            return "invalid argument";
        case MTSP_STATUS_ERROR_INVALID_CONFIG:
            return "invalid configuration";
        case MTSP_STATUS_OUT_OF_MEMORY:
            return "out of memory";
        case MTSP_STATUS_ERROR_INTERNAL:
            return "internal error";
    }
    return "unknown status";
}

const char *mtspGetLastErrorMessage() {
    return last_error_message.c_str();
}
