#pragma once

#include "libmetatsp.h"

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

namespace mtsp {
    [[nodiscard]] const char *NeighborhoodName(MtspNeighborhood neighborhood);

    [[nodiscard]] const char *SelectionName(MtspSelection selection);

    [[nodiscard]] const char *CrossoverName(MtspCrossover crossover);

    [[nodiscard]] const char *TabuKeyName(MtspTabuKey tabu_key);

    [[nodiscard]] const char *AlgorithmName(MtspAlgorithm algorithm);

    /// Maps "swap", "insert", "two_opt" to the enum; anything else is a configuration error.
    [[nodiscard]] MtspStatus ParseNeighborhood(std::string_view name, MtspNeighborhood &neighborhood);

    /// Maps "tournament", "roulette", "ranking" to the enum; anything else is a configuration error.
    [[nodiscard]] MtspStatus ParseSelection(std::string_view name, MtspSelection &selection);

    /// Maps "OX", "PMX", "CX" to the enum; anything else is a configuration error.
    [[nodiscard]] MtspStatus ParseCrossover(std::string_view name, MtspCrossover &crossover);

    /// Maps "move", "route" to the enum; anything else is a configuration error.
    [[nodiscard]] MtspStatus ParseTabuKey(std::string_view name, MtspTabuKey &tabu_key);

    /// The Parse*Options functions overwrite the options named in params and leave every other member at
    /// its current (default) value. params must be a JSON object (or null for no overrides); unknown names,
    /// wrongly typed values and unknown operator names yield MTSP_STATUS_ERROR_INVALID_CONFIG.
    [[nodiscard]] MtspStatus ParseHillClimbingOptions(const nlohmann::json &params,
                                                      MtspHillClimbingOptionsDescriptor &options,
                                                      std::string *why = nullptr);

    [[nodiscard]] MtspStatus ParseSimulatedAnnealingOptions(const nlohmann::json &params,
                                                            MtspSimulatedAnnealingOptionsDescriptor &options,
                                                            std::string *why = nullptr);

    [[nodiscard]] MtspStatus ParseTabuSearchOptions(const nlohmann::json &params,
                                                    MtspTabuSearchOptionsDescriptor &options,
                                                    std::string *why = nullptr);

    [[nodiscard]] MtspStatus ParseGraspOptions(const nlohmann::json &params,
                                               MtspGraspOptionsDescriptor &options,
                                               std::string *why = nullptr);

    [[nodiscard]] MtspStatus ParseGeneticOptions(const nlohmann::json &params,
                                                 MtspGeneticOptionsDescriptor &options,
                                                 std::string *why = nullptr);

    [[nodiscard]] MtspStatus ParseNearestNeighborOptions(const nlohmann::json &params,
                                                         MtspNearestNeighborOptionsDescriptor &options,
                                                         std::string *why = nullptr);

    /// The Describe functions render the effective options with the same names the parser accepts.
    [[nodiscard]] nlohmann::json DescribeOptions(const MtspHillClimbingOptionsDescriptor &options);

    [[nodiscard]] nlohmann::json DescribeOptions(const MtspSimulatedAnnealingOptionsDescriptor &options);

    [[nodiscard]] nlohmann::json DescribeOptions(const MtspTabuSearchOptionsDescriptor &options);

    [[nodiscard]] nlohmann::json DescribeOptions(const MtspGraspOptionsDescriptor &options);

    [[nodiscard]] nlohmann::json DescribeOptions(const MtspGeneticOptionsDescriptor &options);

    [[nodiscard]] nlohmann::json DescribeOptions(const MtspNearestNeighborOptionsDescriptor &options);
}
