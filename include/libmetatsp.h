#pragma once

#ifndef __cplusplus
#include <stdint.h>
#include <stddef.h>
#else
#include <cstdint>
#include <cstddef>
#endif


#define MTSP_EXPORT extern "C"

typedef enum MtspResult {
    MTSP_STATUS_SUCCESS = 0, /**< Operation completed successfully. */
    MTSP_STATUS_ERROR_INVALID_MATRIX = 1, /**< The input distance matrix is invalid. */
    MTSP_STATUS_ERROR_INVALID_ARG = 2, /**< Invalid argument provided. */
    MTSP_STATUS_ERROR_INVALID_CONFIG = 3, /**< A solver parameter is unknown or outside its domain. */
    MTSP_STATUS_OUT_OF_MEMORY = 4, /**< Out of memory. */
    MTSP_STATUS_ERROR_INTERNAL = 5 /**< An internal error occurred. */
} MtspStatus;

typedef double cost_t;
typedef uint32_t cityid_t;

/**
 * Row-major n x n table of travel costs. costs[i * num_cities + j] is the cost of travelling
 * directly from city i to city j. The table may be asymmetric. Entries must be finite and non-negative;
 * the diagonal is never read.
 */
typedef struct MtspDistanceMatrixDescriptor {
    /**
     * The num_cities * num_cities cost entries.
     */
    const cost_t *costs{};

    /**
     * The number of cities.
     */
    size_t num_cities{};
} MtspDistanceMatrixDescriptor;

/**
 * The local move applied to a tour when generating a neighbor.
 */
typedef enum MtspNeighborhood {
    /**
     * Exchange the cities at two positions.
     */
    MTSP_NEIGHBORHOOD_SWAP = 0,

    /**
     * Remove the city at one position and re-insert it at another.
     */
    MTSP_NEIGHBORHOOD_INSERT = 1,

    /**
     * Reverse a contiguous segment of the tour (2-Opt).
     */
    MTSP_NEIGHBORHOOD_TWO_OPT = 2
} MtspNeighborhood;

/**
 * Parent selection scheme of the genetic algorithm.
 */
typedef enum MtspSelection {
    MTSP_SELECTION_TOURNAMENT = 0, /**< Best of tournament_size distinct individuals. */
    MTSP_SELECTION_ROULETTE = 1, /**< Probability proportional to 1 / cost. */
    MTSP_SELECTION_RANKING = 2 /**< Probability proportional to rank (worst = 1, best = N). */
} MtspSelection;

/**
 * What the tabu search memory records for every accepted step.
 */
typedef enum MtspTabuKey {
    MTSP_TABU_KEY_MOVE = 0, /**< The pair of tour positions the move touched. */
    MTSP_TABU_KEY_ROUTE = 1 /**< The complete route the move produced. */
} MtspTabuKey;

/**
 * Crossover operator of the genetic algorithm.
 */
typedef enum MtspCrossover {
    MTSP_CROSSOVER_OX = 0, /**< Order crossover. */
    MTSP_CROSSOVER_PMX = 1, /**< Partially matched crossover. */
    MTSP_CROSSOVER_CX = 2 /**< Cycle crossover. */
} MtspCrossover;

/**
 * Selects the solver for the configuration-map entry point mtspSolve.
 */
typedef enum MtspAlgorithm {
    MTSP_ALGORITHM_HILL_CLIMBING = 0,
    MTSP_ALGORITHM_SIMULATED_ANNEALING = 1,
    MTSP_ALGORITHM_TABU_SEARCH = 2,
    MTSP_ALGORITHM_GRASP = 3,
    MTSP_ALGORITHM_GENETIC = 4,
    MTSP_ALGORITHM_NEAREST_NEIGHBOR = 5
} MtspAlgorithm;

/**
 * Multistart hill climbing configuration.
 */
typedef struct MtspHillClimbingOptionsDescriptor {
    /**
     * The seed for the random number generator
     */
    uint64_t seed{};

    /**
     * The number of independent trajectories, each from a fresh random tour.
     */
    uint32_t n_starts = 10;

    /**
     * The maximum number of neighbors generated per trajectory.
     */
    uint64_t max_iter = 500;

    /**
     * A trajectory stops after this many consecutive non-improving neighbors.
     */
    uint64_t stop_no_improve = 50;

    MtspNeighborhood neighborhood_type = MTSP_NEIGHBORHOOD_SWAP;

    /**
     * Whether candidate costs are computed incrementally (O(1)) instead of by a full tour sum (O(n)).
     */
    bool use_delta = false;
} MtspHillClimbingOptionsDescriptor;

/**
 * Simulated annealing configuration. The temperature starts at T0 and is multiplied by alpha after
 * every iteration; the search stops once it drops to T_min or after max_iter iterations.
 */
typedef struct MtspSimulatedAnnealingOptionsDescriptor {
    /**
     * The seed for the random number generator
     */
    uint64_t seed{};

    double T0 = 1000.0;

    double T_min = 1.0;

    /**
     * Geometric cooling factor, 0 < alpha < 1.
     */
    double alpha = 0.99;

    uint64_t max_iter = 5000;

    MtspNeighborhood neighborhood_type = MTSP_NEIGHBORHOOD_SWAP;

    /**
     * Whether candidate costs are computed incrementally (O(1)) instead of by a full tour sum (O(n)).
     */
    bool use_delta = false;
} MtspSimulatedAnnealingOptionsDescriptor;

/**
 * Tabu search configuration.
 */
typedef struct MtspTabuSearchOptionsDescriptor {
    /**
     * The seed for the random number generator
     */
    uint64_t seed{};

    /**
     * The maximum number of iterations.
     */
    uint64_t max_iter = 2000;

    /**
     * The search stops after this many consecutive iterations without a new best tour.
     */
    uint64_t stop_no_improve = 200;

    /**
     * The number of most recent moves (or routes) that are forbidden. Must be at least 1.
     */
    uint32_t tabu_tenure = 10;

    MtspNeighborhood neighborhood_type = MTSP_NEIGHBORHOOD_TWO_OPT;

    /**
     * The number of candidate moves sampled per iteration.
     */
    uint32_t n_neighbors = 30;

    /**
     * Whether the memory forbids recently used position pairs or recently visited routes.
     */
    MtspTabuKey tabu_key = MTSP_TABU_KEY_MOVE;
} MtspTabuSearchOptionsDescriptor;

/**
 * GRASP configuration: greedy randomized construction followed by hill climbing refinement.
 */
typedef struct MtspGraspOptionsDescriptor {
    /**
     * The seed for the random number generator
     */
    uint64_t seed{};

    /**
     * Restricted candidate list width in [0, 1]. 0 is pure nearest neighbor, 1 is uniform random.
     */
    double alpha = 0.3;

    /**
     * The number of construct-then-refine rounds.
     */
    uint32_t iterations = 100;

    /**
     * The move used by the refinement phase.
     */
    MtspNeighborhood neighborhood_type = MTSP_NEIGHBORHOOD_SWAP;

    uint64_t ihc_max_iter = 300;

    uint64_t ihc_stop_no_improve = 100;

    bool use_delta = true;
} MtspGraspOptionsDescriptor;

/**
 * Genetic algorithm configuration.
 */
typedef struct MtspGeneticOptionsDescriptor {
    /**
     * The seed for the random number generator
     */
    uint64_t seed{};

    /**
     * The number of individuals per generation. Must be at least 2.
     */
    uint32_t population_size = 80;

    uint32_t generations = 300;

    MtspSelection selection = MTSP_SELECTION_TOURNAMENT;

    /**
     * The number of distinct individuals drawn per tournament.
     * Only applicable if selection is MTSP_SELECTION_TOURNAMENT.
     */
    uint32_t tournament_size = 3;

    MtspCrossover crossover = MTSP_CROSSOVER_OX;

    /**
     * The move applied to a child when it mutates.
     */
    MtspNeighborhood mutation_type = MTSP_NEIGHBORHOOD_SWAP;

    /**
     * The probability in [0, 1] that a child is mutated.
     */
    double mutation_prob = 0.1;
} MtspGeneticOptionsDescriptor;

/**
 * Nearest neighbor configuration.
 */
typedef struct MtspNearestNeighborOptionsDescriptor {
    /**
     * The city the tour starts from.
     */
    uint32_t start_city = 0;
} MtspNearestNeighborOptionsDescriptor;

typedef struct MtspSolutionDescriptor {
    /**
     * The best tour found, as a permutation of the city indices 0 .. num_cities - 1.
     */
    cityid_t *route{};

    /**
     * The number of elements in the route array.
     * An implicit wrap-around edge is assumed from route[n-1] to route[0].
     */
    size_t num_cities{};

    /**
     * The cost of the route including the final wrap-around edge.
     */
    cost_t cost{};

    /**
     * Wall-clock time spent in the solver call.
     */
    double runtime_seconds{};

    /**
     * Null-terminated JSON object echoing the effective parameters of the call (defaults included).
     */
    char *meta_json{};
} MtspSolutionDescriptor;

/**
 * Runs multistart hill climbing.
 * @param matrix the input distance matrix
 * @param options options to configure the solver
 * @param output_descriptor the output descriptor to write the solution to
 * @return the result status of the operation
 */
MTSP_EXPORT MtspStatus mtspSolveHillClimbing(const MtspDistanceMatrixDescriptor *matrix,
                                             const MtspHillClimbingOptionsDescriptor *options,
                                             MtspSolutionDescriptor *output_descriptor);

/**
 * Runs simulated annealing from a random tour.
 */
MTSP_EXPORT MtspStatus mtspSolveSimulatedAnnealing(const MtspDistanceMatrixDescriptor *matrix,
                                                   const MtspSimulatedAnnealingOptionsDescriptor *options,
                                                   MtspSolutionDescriptor *output_descriptor);

/**
 * Runs tabu search from a random tour.
 */
MTSP_EXPORT MtspStatus mtspSolveTabuSearch(const MtspDistanceMatrixDescriptor *matrix,
                                           const MtspTabuSearchOptionsDescriptor *options,
                                           MtspSolutionDescriptor *output_descriptor);

/**
 * Runs GRASP.
 */
MTSP_EXPORT MtspStatus mtspSolveGrasp(const MtspDistanceMatrixDescriptor *matrix,
                                      const MtspGraspOptionsDescriptor *options,
                                      MtspSolutionDescriptor *output_descriptor);

/**
 * Runs the genetic algorithm.
 */
MTSP_EXPORT MtspStatus mtspSolveGenetic(const MtspDistanceMatrixDescriptor *matrix,
                                        const MtspGeneticOptionsDescriptor *options,
                                        MtspSolutionDescriptor *output_descriptor);

/**
 * Builds the deterministic nearest neighbor tour.
 */
MTSP_EXPORT MtspStatus mtspSolveNearestNeighbor(const MtspDistanceMatrixDescriptor *matrix,
                                                const MtspNearestNeighborOptionsDescriptor *options,
                                                MtspSolutionDescriptor *output_descriptor);

/**
 * Runs the chosen solver with parameters given as a JSON object of named options, e.g.
 * {"neighborhood_type": "two_opt", "tabu_tenure": 15}. Missing options take their defaults;
 * unknown option names and unknown operator names are configuration errors.
 * @param matrix the input distance matrix
 * @param algorithm the solver to run
 * @param params_json null-terminated JSON object, or null for all defaults
 * @param output_descriptor the output descriptor to write the solution to
 * @return the result status of the operation
 */
MTSP_EXPORT MtspStatus mtspSolve(const MtspDistanceMatrixDescriptor *matrix,
                                 MtspAlgorithm algorithm,
                                 const char *params_json,
                                 MtspSolutionDescriptor *output_descriptor);

/**
 * Computes the closed tour length of route, including the edge from route[n-1] back to route[0].
 * @param matrix the input distance matrix
 * @param route a permutation of 0 .. matrix->num_cities - 1
 * @param num_cities the number of elements in route
 * @param cost receives the tour length
 * @return the result status of the operation
 */
MTSP_EXPORT MtspStatus mtspComputeTourCost(const MtspDistanceMatrixDescriptor *matrix,
                                           const cityid_t *route,
                                           size_t num_cities,
                                           cost_t *cost);

/**
 * Releases the memory the solver allocated inside a solution descriptor and resets it.
 */
MTSP_EXPORT void mtspDisposeSolution(MtspSolutionDescriptor *solution);

/**
 * Returns a static, human-readable name for a status code.
 */
MTSP_EXPORT const char *mtspStatusToString(MtspStatus status);

/**
 * Returns a description of the last failed call on the calling thread, or an empty string.
 */
MTSP_EXPORT const char *mtspGetLastErrorMessage();
