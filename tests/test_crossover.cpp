#include <gtest/gtest.h>

#include "distance_matrix.h"
#include "genetic.h"

#include <vector>

using namespace mtsp;

TEST(CrossoverTest, OrderCrossoverKeepsSliceAndFillsInParent2Order) {
    const Route parent1{0, 1, 2, 3, 4, 5, 6, 7};
    const Route parent2{7, 6, 5, 4, 3, 2, 1, 0};

    // slice [2, 5) = {2, 3, 4}; the rest is written from position 5 onwards, wrapping,
    // in the order 7, 6, 5, 1, 0
    const Route child = CrossoverOX(parent1, parent2, {.begin = 2, .end = 5});
    EXPECT_EQ(child, (Route{1, 0, 2, 3, 4, 7, 6, 5}));
}

TEST(CrossoverTest, PartiallyMatchedCrossoverFollowsMapping) {
    const Route parent1{1, 2, 3, 4, 5, 6, 7, 8, 0};
    const Route parent2{4, 5, 2, 1, 8, 7, 6, 0, 3};

    // slice [3, 7) copies 4 5 6 7 from parent1; displaced parent2 cities 1 and 8 follow the mapping
    const Route child = CrossoverPMX(parent1, parent2, {.begin = 3, .end = 7});
    EXPECT_EQ(child, (Route{1, 8, 2, 4, 5, 6, 7, 0, 3}));
    EXPECT_TRUE(IsValidPermutation(child, 9));
}

TEST(CrossoverTest, CycleCrossoverTakesCycleThroughFirstPosition) {
    const Route parent1{0, 1, 2, 3, 4, 5, 6, 7};
    const Route parent2{1, 2, 0, 4, 3, 6, 7, 5};

    // the cycle through index 0 is {0, 1, 2}
    const Route child = CrossoverCX(parent1, parent2);
    EXPECT_EQ(child, (Route{0, 1, 2, 4, 3, 6, 7, 5}));
}

TEST(CrossoverTest, IdenticalParents) {
    Rng rng{17};
    for (size_t n = 4; n <= 40; n += 6) {
        const Route parent = GenerateRandomTour(n, rng);
        EXPECT_EQ(Crossover(MTSP_CROSSOVER_PMX, parent, parent, rng), parent) << "n " << n;
        EXPECT_EQ(Crossover(MTSP_CROSSOVER_CX, parent, parent, rng), parent) << "n " << n;

        // OX restarts parent2's order after the slice, so the child is only guaranteed to be a permutation
        EXPECT_TRUE(IsValidPermutation(Crossover(MTSP_CROSSOVER_OX, parent, parent, rng), n)) << "n " << n;
    }
}

TEST(CrossoverTest, ChildrenArePermutations) {
    Rng rng{23};
    for (size_t n = 4; n <= 60; ++n) {
        for (int trial = 0; trial < 200; ++trial) {
            const Route parent1 = GenerateRandomTour(n, rng);
            const Route parent2 = GenerateRandomTour(n, rng);
            for (const auto type: {MTSP_CROSSOVER_OX, MTSP_CROSSOVER_PMX, MTSP_CROSSOVER_CX}) {
                ASSERT_TRUE(IsValidPermutation(Crossover(type, parent1, parent2, rng), n))
                    << "crossover " << type << " n " << n;
            }
        }
    }
}

TEST(SelectionTest, TournamentOfWholePopulationPicksTheBest) {
    Rng rng{1};
    const std::vector<cost_t> costs{40, 10, 30, 20};
    for (int trial = 0; trial < 100; ++trial) {
        EXPECT_EQ(SelectTournament(costs, costs.size(), rng), 1u);
    }
}

TEST(SelectionTest, RouletteFavorsCheapIndividuals) {
    Rng rng{2};
    const std::vector<cost_t> costs{1, 100};
    int cheap = 0;
    constexpr int draws = 10000;
    for (int trial = 0; trial < draws; ++trial) {
        cheap += SelectRoulette(costs, rng) == 0 ? 1 : 0;
    }
    // weights 1 and 1/100
    EXPECT_GT(cheap, draws * 95 / 100);
}

TEST(SelectionTest, RankingUsesRanksNotCosts) {
    Rng rng{3};
    const std::vector<cost_t> costs{1000, 1, 500};
    std::vector<int> counts(3, 0);
    constexpr int draws = 60000;
    for (int trial = 0; trial < draws; ++trial) {
        ++counts[SelectRanking(costs, rng)];
    }
    // rank weights 3 : 2 : 1 for the indices 1, 2, 0
    EXPECT_NEAR(counts[1] / static_cast<double>(draws), 3.0 / 6, 0.02);
    EXPECT_NEAR(counts[2] / static_cast<double>(draws), 2.0 / 6, 0.02);
    EXPECT_NEAR(counts[0] / static_cast<double>(draws), 1.0 / 6, 0.02);
}

TEST(SelectionTest, SliceEndpointsAreDistinctAndOrdered) {
    Rng rng{4};
    for (int trial = 0; trial < 1000; ++trial) {
        const slice_t slice = SampleSlice(5, rng);
        EXPECT_LT(slice.begin, slice.end);
        EXPECT_GE(slice.begin, 0);
        EXPECT_LE(slice.end, 4);
    }
}
