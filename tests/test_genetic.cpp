#include <gtest/gtest.h>

#include "distance_matrix.h"
#include "genetic.h"

#include <libmetatsp.h>

#include <algorithm>
#include <random>
#include <string>
#include <vector>

using namespace mtsp;

static DistanceMatrix createIntegerMatrix(const size_t n, const uint64_t seed) {
    Rng rng{seed};
    std::uniform_int_distribution<int> dist(1, 60);
    DistanceMatrix matrix{n};
    for (city_idx i = 0; i < static_cast<city_idx>(n); ++i) {
        for (city_idx j = 0; j < static_cast<city_idx>(n); ++j) {
            if (i != j) {
                matrix.set_cost(i, j, static_cast<cost_t>(dist(rng)));
            }
        }
    }
    matrix.refresh_symmetry();
    return matrix;
}

TEST(GeneticTest, BestEverTraceNeverIncreases) {
    const DistanceMatrix matrix = createIntegerMatrix(20, 1);
    for (const auto selection: {MTSP_SELECTION_TOURNAMENT, MTSP_SELECTION_ROULETTE, MTSP_SELECTION_RANKING}) {
        for (const auto crossover: {MTSP_CROSSOVER_OX, MTSP_CROSSOVER_PMX, MTSP_CROSSOVER_CX}) {
            MtspGeneticOptionsDescriptor options{};
            options.seed = 5;
            options.population_size = 30;
            options.generations = 60;
            options.selection = selection;
            options.crossover = crossover;
            options.mutation_type = MTSP_NEIGHBORHOOD_TWO_OPT;
            options.mutation_prob = 0.3;

            Rng rng{options.seed};
            std::vector<cost_t> trace{};
            const search_result_t result = RunGenetic(matrix, options, rng, &trace);

            ASSERT_EQ(trace.size(), options.generations);
            for (size_t k = 1; k < trace.size(); ++k) {
                ASSERT_LE(trace[k], trace[k - 1]) << "generation " << k;
            }
            EXPECT_DOUBLE_EQ(trace.back(), result.cost);
            EXPECT_TRUE(IsValidPermutation(result.route, 20));
            EXPECT_DOUBLE_EQ(result.cost, ComputeTourCost(result.route, matrix));
        }
    }
}

TEST(GeneticTest, BestIndividualSurvivesIntoNextGeneration) {
    const DistanceMatrix matrix = createIntegerMatrix(12, 4);
    for (const auto crossover: {MTSP_CROSSOVER_OX, MTSP_CROSSOVER_PMX, MTSP_CROSSOVER_CX}) {
        MtspGeneticOptionsDescriptor options{};
        options.seed = 21;
        options.population_size = 6;
        options.generations = 40;
        options.selection = MTSP_SELECTION_ROULETTE;
        options.crossover = crossover;
        options.mutation_type = MTSP_NEIGHBORHOOD_SWAP;
        // every child is disturbed, so only the elite can carry the best route over
        options.mutation_prob = 1.0;

        Rng rng{options.seed};
        std::vector<generation_snapshot_t> generations{};
        const search_result_t result = RunGenetic(matrix, options, rng, nullptr, &generations);
        ASSERT_EQ(generations.size(), options.generations + 1);

        for (size_t k = 0; k < generations.size(); ++k) {
            const generation_snapshot_t &current = generations[k];
            ASSERT_EQ(current.population.size(), options.population_size);
            for (size_t p = 0; p < current.population.size(); ++p) {
                ASSERT_DOUBLE_EQ(current.costs[p], ComputeTourCost(current.population[p], matrix));
            }
            if (k == 0) {
                continue;
            }

            const generation_snapshot_t &previous = generations[k - 1];
            const auto previous_best = std::ranges::min_element(previous.costs);
            const Route &previous_best_route =
                    previous.population[static_cast<size_t>(previous_best - previous.costs.begin())];

            EXPECT_LE(std::ranges::min(current.costs), *previous_best) << "generation " << k;
            EXPECT_NE(std::ranges::find(current.population, previous_best_route), current.population.end())
                << "best route of generation " << k - 1 << " is missing from generation " << k;
        }
        EXPECT_DOUBLE_EQ(std::ranges::min(generations.back().costs), result.cost);
    }
}

TEST(GeneticTest, ZeroGenerationsReturnsBestOfInitialPopulation) {
    const DistanceMatrix matrix = createIntegerMatrix(8, 2);
    MtspGeneticOptionsDescriptor options{};
    options.seed = 9;
    options.population_size = 10;
    options.generations = 0;

    Rng replay{options.seed};
    cost_t best_initial = COST_POSITIVE_INFINITY;
    for (uint32_t k = 0; k < options.population_size; ++k) {
        best_initial = std::min(best_initial, ComputeTourCost(GenerateRandomTour(8, replay), matrix));
    }

    Rng rng{options.seed};
    const search_result_t result = RunGenetic(matrix, options, rng);
    EXPECT_DOUBLE_EQ(result.cost, best_initial);
}

TEST(GeneticTest, SameSeedSameResult) {
    const DistanceMatrix matrix = createIntegerMatrix(15, 3);
    MtspGeneticOptionsDescriptor options{};
    options.seed = 77;
    options.generations = 40;

    Rng rng_a{options.seed};
    Rng rng_b{options.seed};
    EXPECT_EQ(RunGenetic(matrix, options, rng_a).route, RunGenetic(matrix, options, rng_b).route);
}

TEST(GeneticTest, RejectsBadOptions) {
    MtspGeneticOptionsDescriptor options{};
    EXPECT_EQ(ValidateGeneticOptions(options, 10), MTSP_STATUS_SUCCESS);

    options.population_size = 1;
    EXPECT_EQ(ValidateGeneticOptions(options, 10), MTSP_STATUS_ERROR_INVALID_CONFIG);
    options.population_size = 80;

    options.tournament_size = 81;
    EXPECT_EQ(ValidateGeneticOptions(options, 10), MTSP_STATUS_ERROR_INVALID_CONFIG);
    options.tournament_size = 3;

    options.mutation_prob = 1.5;
    EXPECT_EQ(ValidateGeneticOptions(options, 10), MTSP_STATUS_ERROR_INVALID_CONFIG);
    options.mutation_prob = 0.1;

    options.crossover = static_cast<MtspCrossover>(9);
    std::string why{};
    EXPECT_EQ(ValidateGeneticOptions(options, 10, &why), MTSP_STATUS_ERROR_INVALID_CONFIG);
    EXPECT_NE(why.find("crossover"), std::string::npos);
}
