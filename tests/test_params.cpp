#include <gtest/gtest.h>

#include "params.h"

#include <libmetatsp.h>

#include <nlohmann/json.hpp>

#include <string>

using namespace mtsp;
using nlohmann::json;

TEST(ParamsTest, MissingOptionsKeepDefaults) {
    MtspTabuSearchOptionsDescriptor options{};
    ASSERT_EQ(ParseTabuSearchOptions(json::object(), options), MTSP_STATUS_SUCCESS);
    EXPECT_EQ(options.max_iter, 2000u);
    EXPECT_EQ(options.stop_no_improve, 200u);
    EXPECT_EQ(options.tabu_tenure, 10u);
    EXPECT_EQ(options.neighborhood_type, MTSP_NEIGHBORHOOD_TWO_OPT);
    EXPECT_EQ(options.n_neighbors, 30u);
    EXPECT_EQ(options.tabu_key, MTSP_TABU_KEY_MOVE);

    ASSERT_EQ(ParseTabuSearchOptions(json(nullptr), options), MTSP_STATUS_SUCCESS);
    EXPECT_EQ(options.tabu_tenure, 10u);
}

TEST(ParamsTest, NamedOptionsOverrideDefaults) {
    MtspGeneticOptionsDescriptor options{};
    const json params = {
        {"population_size", 50},
        {"selection", "ranking"},
        {"crossover", "PMX"},
        {"mutation_type", "insert"},
        {"mutation_prob", 0.25},
        {"seed", 7},
    };
    ASSERT_EQ(ParseGeneticOptions(params, options), MTSP_STATUS_SUCCESS);
    EXPECT_EQ(options.population_size, 50u);
    EXPECT_EQ(options.selection, MTSP_SELECTION_RANKING);
    EXPECT_EQ(options.crossover, MTSP_CROSSOVER_PMX);
    EXPECT_EQ(options.mutation_type, MTSP_NEIGHBORHOOD_INSERT);
    EXPECT_DOUBLE_EQ(options.mutation_prob, 0.25);
    EXPECT_EQ(options.seed, 7u);
    EXPECT_EQ(options.generations, 300u);
}

TEST(ParamsTest, IntegersAreAcceptedForFloatingPointOptions) {
    MtspSimulatedAnnealingOptionsDescriptor options{};
    ASSERT_EQ(ParseSimulatedAnnealingOptions({{"T0", 500}, {"use_delta", true}}, options), MTSP_STATUS_SUCCESS);
    EXPECT_DOUBLE_EQ(options.T0, 500);
    EXPECT_TRUE(options.use_delta);
}

TEST(ParamsTest, UnknownOperatorNamesAreRejected) {
    std::string why{};

    MtspHillClimbingOptionsDescriptor hill_climbing{};
    EXPECT_EQ(ParseHillClimbingOptions({{"neighborhood_type", "three_opt"}}, hill_climbing, &why),
              MTSP_STATUS_ERROR_INVALID_CONFIG);
    EXPECT_NE(why.find("neighborhood_type"), std::string::npos);

    MtspGeneticOptionsDescriptor genetic{};
    EXPECT_EQ(ParseGeneticOptions({{"selection", "elitist"}}, genetic), MTSP_STATUS_ERROR_INVALID_CONFIG);
    EXPECT_EQ(ParseGeneticOptions({{"crossover", "ox"}}, genetic), MTSP_STATUS_ERROR_INVALID_CONFIG);
}

TEST(ParamsTest, UnknownOptionNamesAreRejected) {
    std::string why{};
    MtspGraspOptionsDescriptor options{};
    EXPECT_EQ(ParseGraspOptions({{"alpha", 0.2}, {"iteration", 10}}, options, &why),
              MTSP_STATUS_ERROR_INVALID_CONFIG);
    EXPECT_NE(why.find("iteration"), std::string::npos);
}

TEST(ParamsTest, WronglyTypedValuesAreRejected) {
    MtspTabuSearchOptionsDescriptor options{};
    EXPECT_EQ(ParseTabuSearchOptions({{"tabu_tenure", -1}}, options), MTSP_STATUS_ERROR_INVALID_CONFIG);
    EXPECT_EQ(ParseTabuSearchOptions({{"tabu_tenure", 2.5}}, options), MTSP_STATUS_ERROR_INVALID_CONFIG);
    EXPECT_EQ(ParseTabuSearchOptions({{"tabu_tenure", "10"}}, options), MTSP_STATUS_ERROR_INVALID_CONFIG);
    EXPECT_EQ(ParseTabuSearchOptions({{"tabu_tenure", 5000000000ull}}, options), MTSP_STATUS_ERROR_INVALID_CONFIG);
    EXPECT_EQ(ParseTabuSearchOptions(json::array({1, 2}), options), MTSP_STATUS_ERROR_INVALID_CONFIG);

    MtspGraspOptionsDescriptor grasp{};
    EXPECT_EQ(ParseGraspOptions({{"use_delta", 1}}, grasp), MTSP_STATUS_ERROR_INVALID_CONFIG);
    EXPECT_EQ(ParseGraspOptions({{"alpha", "0.3"}}, grasp), MTSP_STATUS_ERROR_INVALID_CONFIG);
}

TEST(ParamsTest, DescribeUsesParserNames) {
    MtspGeneticOptionsDescriptor options{};
    options.crossover = MTSP_CROSSOVER_CX;
    const json described = DescribeOptions(options);
    EXPECT_EQ(described.at("crossover").get<std::string>(), "CX");
    EXPECT_EQ(described.at("selection").get<std::string>(), "tournament");
    EXPECT_EQ(described.at("tournament_size").get<uint32_t>(), 3u);

    // the description parses back to the same options
    MtspGeneticOptionsDescriptor parsed{};
    parsed.crossover = MTSP_CROSSOVER_OX;
    ASSERT_EQ(ParseGeneticOptions(described, parsed), MTSP_STATUS_SUCCESS);
    EXPECT_EQ(parsed.crossover, MTSP_CROSSOVER_CX);
}

TEST(ParamsTest, NamesRoundTrip) {
    for (const auto type: {MTSP_NEIGHBORHOOD_SWAP, MTSP_NEIGHBORHOOD_INSERT, MTSP_NEIGHBORHOOD_TWO_OPT}) {
        MtspNeighborhood parsed{};
        ASSERT_EQ(ParseNeighborhood(NeighborhoodName(type), parsed), MTSP_STATUS_SUCCESS);
        EXPECT_EQ(parsed, type);
    }
    EXPECT_STREQ(AlgorithmName(MTSP_ALGORITHM_GRASP), "grasp");
}

TEST(ParamsTest, TabuKeySelectsRouteMemory) {
    MtspTabuSearchOptionsDescriptor options{};
    ASSERT_EQ(ParseTabuSearchOptions({{"tabu_key", "route"}}, options), MTSP_STATUS_SUCCESS);
    EXPECT_EQ(options.tabu_key, MTSP_TABU_KEY_ROUTE);
    EXPECT_EQ(DescribeOptions(options).at("tabu_key").get<std::string>(), "route");

    std::string why{};
    EXPECT_EQ(ParseTabuSearchOptions({{"tabu_key", "city"}}, options, &why), MTSP_STATUS_ERROR_INVALID_CONFIG);
    EXPECT_NE(why.find("tabu_key"), std::string::npos);
    EXPECT_EQ(ParseTabuSearchOptions({{"tabu_key", 1}}, options), MTSP_STATUS_ERROR_INVALID_CONFIG);
}
