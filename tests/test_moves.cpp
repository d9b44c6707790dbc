#include <gtest/gtest.h>

#include "distance_matrix.h"
#include "moves.h"

#include <algorithm>
#include <cmath>
#include <random>
#include <string>
#include <vector>

using namespace mtsp;

// Random matrix with integer valued entries in [1, 100].
static DistanceMatrix createRandomMatrix(const size_t n, const bool symmetric, Rng &rng) {
    std::uniform_int_distribution<int> dist(1, 100);
    DistanceMatrix matrix{n};
    for (city_idx i = 0; i < static_cast<city_idx>(n); ++i) {
        for (city_idx j = symmetric ? i + 1 : 0; j < static_cast<city_idx>(n); ++j) {
            if (i == j) {
                continue;
            }
            const auto cost = static_cast<cost_t>(dist(rng));
            matrix.set_cost(i, j, cost);
            if (symmetric) {
                matrix.set_cost(j, i, cost);
            }
        }
    }
    matrix.refresh_symmetry();
    return matrix;
}

static void expectDeltaMatchesFullCost(const bool symmetric, const MtspNeighborhood type) {
    Rng rng{42};
    for (size_t n = MIN_CITIES_FOR_MOVES; n <= 200; n += (n < 12 ? 1 : 17)) {
        SCOPED_TRACE("n = " + std::to_string(n));
        const DistanceMatrix matrix = createRandomMatrix(n, symmetric, rng);
        ASSERT_EQ(matrix.is_symmetric(), symmetric);

        for (size_t trial = 0; trial < 10000; ++trial) {
            const Route tour = GenerateRandomTour(n, rng);
            const move_t move = SampleMove(type, n, rng);
            const cost_t before = ComputeTourCost(tour, matrix);
            const cost_t delta = ComputeMoveDelta(tour, matrix, move);

            Route moved = tour;
            ApplyMove(moved, move);
            const cost_t after = ComputeTourCost(moved, matrix);

            ASSERT_NEAR(before + delta, after, 1e-6 * std::max<cost_t>(1, after))
                << "move (" << move.i << ", " << move.j << ")";
            ASSERT_TRUE(IsValidPermutation(moved, n));
        }
    }
}

TEST(MoveDeltaTest, SwapSymmetric) {
    expectDeltaMatchesFullCost(true, MTSP_NEIGHBORHOOD_SWAP);
}

TEST(MoveDeltaTest, SwapAsymmetric) {
    expectDeltaMatchesFullCost(false, MTSP_NEIGHBORHOOD_SWAP);
}

TEST(MoveDeltaTest, InsertSymmetric) {
    expectDeltaMatchesFullCost(true, MTSP_NEIGHBORHOOD_INSERT);
}

TEST(MoveDeltaTest, InsertAsymmetric) {
    expectDeltaMatchesFullCost(false, MTSP_NEIGHBORHOOD_INSERT);
}

TEST(MoveDeltaTest, TwoOptSymmetric) {
    expectDeltaMatchesFullCost(true, MTSP_NEIGHBORHOOD_TWO_OPT);
}

TEST(MoveDeltaTest, TwoOptAsymmetric) {
    expectDeltaMatchesFullCost(false, MTSP_NEIGHBORHOOD_TWO_OPT);
}

// Every position pair on a small tour, including both wrap-around corners.
TEST(MoveDeltaTest, ExhaustivePairsOnSmallTours) {
    Rng rng{7};
    for (const bool symmetric: {true, false}) {
        for (size_t n = 4; n <= 7; ++n) {
            const DistanceMatrix matrix = createRandomMatrix(n, symmetric, rng);
            const Route tour = GenerateRandomTour(n, rng);
            const cost_t before = ComputeTourCost(tour, matrix);

            for (const auto type: {MTSP_NEIGHBORHOOD_SWAP, MTSP_NEIGHBORHOOD_INSERT, MTSP_NEIGHBORHOOD_TWO_OPT}) {
                for (tour_idx i = 0; i < static_cast<tour_idx>(n); ++i) {
                    for (tour_idx j = 0; j < static_cast<tour_idx>(n); ++j) {
                        if (i == j || (type != MTSP_NEIGHBORHOOD_INSERT && i > j)) {
                            continue;
                        }
                        const move_t move{.type = type, .i = i, .j = j};
                        Route moved = tour;
                        ApplyMove(moved, move);
                        EXPECT_DOUBLE_EQ(before + ComputeMoveDelta(tour, matrix, move), ComputeTourCost(moved, matrix))
                            << "type " << type << " n " << n << " move (" << i << ", " << j << ")";
                    }
                }
            }
        }
    }
}

TEST(MoveApplyTest, SwapExchangesPositions) {
    Route tour{0, 1, 2, 3, 4};
    ApplyMove(tour, {.type = MTSP_NEIGHBORHOOD_SWAP, .i = 1, .j = 3});
    EXPECT_EQ(tour, (Route{0, 3, 2, 1, 4}));
}

TEST(MoveApplyTest, TwoOptReversesHalfOpenSegment) {
    Route tour{0, 1, 2, 3, 4, 5};
    ApplyMove(tour, {.type = MTSP_NEIGHBORHOOD_TWO_OPT, .i = 1, .j = 4});
    EXPECT_EQ(tour, (Route{0, 3, 2, 1, 4, 5}));
}

TEST(MoveApplyTest, InsertMovesCityForward) {
    Route tour{0, 1, 2, 3, 4};
    ApplyMove(tour, {.type = MTSP_NEIGHBORHOOD_INSERT, .i = 1, .j = 3});
    EXPECT_EQ(tour, (Route{0, 2, 3, 1, 4}));
}

TEST(MoveApplyTest, InsertMovesCityBackward) {
    Route tour{0, 1, 2, 3, 4};
    ApplyMove(tour, {.type = MTSP_NEIGHBORHOOD_INSERT, .i = 4, .j = 0});
    EXPECT_EQ(tour, (Route{4, 0, 1, 2, 3}));
}

TEST(MoveSampleTest, NormalizesPairsExceptInsert) {
    Rng rng{3};
    bool saw_backward_insert = false;
    for (int trial = 0; trial < 1000; ++trial) {
        const move_t swap = SampleMove(MTSP_NEIGHBORHOOD_SWAP, 10, rng);
        const move_t two_opt = SampleMove(MTSP_NEIGHBORHOOD_TWO_OPT, 10, rng);
        const move_t insert = SampleMove(MTSP_NEIGHBORHOOD_INSERT, 10, rng);
        EXPECT_LT(swap.i, swap.j);
        EXPECT_LT(two_opt.i, two_opt.j);
        EXPECT_NE(insert.i, insert.j);
        saw_backward_insert |= insert.i > insert.j;
        for (const move_t &move: {swap, two_opt, insert}) {
            EXPECT_GE(move.i, 0);
            EXPECT_LT(move.j, 10);
        }
    }
    EXPECT_TRUE(saw_backward_insert);
}

TEST(MoveNeighborTest, CandidateDoesNotAliasCurrentTour) {
    Rng rng{11};
    const DistanceMatrix matrix = createRandomMatrix(12, true, rng);
    const Route tour = GenerateRandomTour(12, rng);
    const Route snapshot = tour;
    const cost_t cost = ComputeTourCost(tour, matrix);

    for (const auto mode: {CostMode::Delta, CostMode::Full}) {
        const neighbor_t neighbor = GenerateNeighbor(tour, cost, matrix, MTSP_NEIGHBORHOOD_TWO_OPT, mode, rng);
        EXPECT_EQ(tour, snapshot);
        EXPECT_TRUE(IsValidPermutation(neighbor.route, 12));
        EXPECT_NEAR(neighbor.cost, ComputeTourCost(neighbor.route, matrix), 1e-9);
    }
}

TEST(CostReconcilerTest, RecomputesAfterTooManyDirtyUpdates) {
    Rng rng{5};
    const DistanceMatrix matrix = createRandomMatrix(8, true, rng);
    const Route tour = GenerateRandomTour(8, rng);
    const cost_t exact = ComputeTourCost(tour, matrix);

    CostReconciler reconciler{};
    cost_t drifting = exact + 0.5;
    for (size_t k = 0; k < MAX_DIRTY_COST_UPDATES; ++k) {
        reconciler.on_delta_update(tour, matrix, drifting);
    }
    EXPECT_DOUBLE_EQ(drifting, exact + 0.5);

    reconciler.on_delta_update(tour, matrix, drifting);
    EXPECT_DOUBLE_EQ(drifting, exact);
}

TEST(DistanceMatrixTest, TourCostIncludesClosingEdge) {
    const DistanceMatrix matrix = DistanceMatrix::FromRows({
        {0, 1, 10},
        {10, 0, 2},
        {3, 10, 0},
    });
    EXPECT_FALSE(matrix.is_symmetric());
    EXPECT_DOUBLE_EQ(ComputeTourCost({0, 1, 2}, matrix), 6);
    EXPECT_DOUBLE_EQ(ComputeTourCost({0, 2, 1}, matrix), 30);
}

TEST(DistanceMatrixTest, PermutationCheck) {
    EXPECT_TRUE(IsValidPermutation({2, 0, 1}, 3));
    EXPECT_FALSE(IsValidPermutation({0, 0, 1}, 3));
    EXPECT_FALSE(IsValidPermutation({0, 1}, 3));
    EXPECT_FALSE(IsValidPermutation({0, 1, 3}, 3));
}

TEST(DistanceMatrixTest, RejectsTablesTooLargeToIndex) {
    const cost_t costs[4]{0, 1, 1, 0};
    std::string why{};
    EXPECT_EQ(ValidateDistanceMatrix({.costs = costs, .num_cities = 2}, &why), MTSP_STATUS_SUCCESS);

    const size_t side = (size_t{1} << (4 * sizeof(size_t))) + 1;
    EXPECT_EQ(ValidateDistanceMatrix({.costs = costs, .num_cities = side}, &why), MTSP_STATUS_ERROR_INVALID_MATRIX);
    EXPECT_NE(why.find("size_t"), std::string::npos);
}
