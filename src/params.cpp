#include "params.h"

#include <limits>
#include <set>
#include <type_traits>

namespace mtsp {
    namespace {
        using nlohmann::json;

        /// Reads named options out of a JSON object, remembering which names were consumed
        /// and the first error encountered.
        class OptionReader {
            const json &params;
            std::string *why;
            std::set<std::string> consumed{};
            MtspStatus status = MTSP_STATUS_SUCCESS;

            void fail(const std::string &message) {
                if (status == MTSP_STATUS_SUCCESS) {
                    status = MTSP_STATUS_ERROR_INVALID_CONFIG;
                    if (why) *why = message;
                }
            }

            [[nodiscard]] const json *lookup(const char *name) {
                consumed.insert(name);
                if (status != MTSP_STATUS_SUCCESS || params.is_null()) {
                    return nullptr;
                }
                const auto it = params.find(name);
                return it == params.end() ? nullptr : &*it;
            }

        public:
            OptionReader(const json &params, std::string *why)
                : params(params), why(why) {
                if (!params.is_null() && !params.is_object()) {
                    fail("parameters must be a JSON object");
                }
            }

            template<typename T>
                requires std::is_unsigned_v<T> && (!std::is_same_v<T, bool>)
            void read(const char *name, T &field) {
                const json *value = lookup(name);
                if (value == nullptr) {
                    return;
                }
                if (!value->is_number_integer()
                    || (!value->is_number_unsigned() && value->get<int64_t>() < 0)
                    || value->get<uint64_t>() > std::numeric_limits<T>::max()) {
                    fail(std::string("option '") + name + "' must be a non-negative integer, got " + value->dump());
                    return;
                }
                field = static_cast<T>(value->get<uint64_t>());
            }

            void read(const char *name, double &field) {
                const json *value = lookup(name);
                if (value == nullptr) {
                    return;
                }
                if (!value->is_number()) {
                    fail(std::string("option '") + name + "' must be a number, got " + value->dump());
                    return;
                }
                field = value->get<double>();
            }

            void read(const char *name, bool &field) {
                const json *value = lookup(name);
                if (value == nullptr) {
                    return;
                }
                if (!value->is_boolean()) {
                    fail(std::string("option '") + name + "' must be a boolean, got " + value->dump());
                    return;
                }
                field = value->get<bool>();
            }

            template<typename E>
                requires std::is_enum_v<E>
            void read(const char *name, E &field, MtspStatus (*parse)(std::string_view, E &)) {
                const json *value = lookup(name);
                if (value == nullptr) {
                    return;
                }
                if (!value->is_string() || parse(value->get<std::string>(), field) != MTSP_STATUS_SUCCESS) {
                    fail(std::string("option '") + name + "' has unknown value " + value->dump());
                }
            }

            /// Reports names in params that no read call asked for.
            [[nodiscard]] MtspStatus finish() {
                if (status == MTSP_STATUS_SUCCESS && params.is_object()) {
                    for (auto it = params.begin(); it != params.end(); ++it) {
                        if (!consumed.contains(it.key())) {
                            fail("unknown option '" + it.key() + "'");
                            break;
                        }
                    }
                }
                return status;
            }
        };
    }

    const char *NeighborhoodName(const MtspNeighborhood neighborhood) {
        switch (neighborhood) {
            case MTSP_NEIGHBORHOOD_SWAP:
                return "swap";
            case MTSP_NEIGHBORHOOD_INSERT:
                return "insert";
            case MTSP_NEIGHBORHOOD_TWO_OPT:
                return "two_opt";
        }
        return "unknown";
    }

    const char *SelectionName(const MtspSelection selection) {
        switch (selection) {
            case MTSP_SELECTION_TOURNAMENT:
                return "tournament";
            case MTSP_SELECTION_ROULETTE:
                return "roulette";
            case MTSP_SELECTION_RANKING:
                return "ranking";
        }
        return "unknown";
    }

    const char *CrossoverName(const MtspCrossover crossover) {
        switch (crossover) {
            case MTSP_CROSSOVER_OX:
                return "OX";
            case MTSP_CROSSOVER_PMX:
                return "PMX";
            case MTSP_CROSSOVER_CX:
                return "CX";
        }
        return "unknown";
    }

    const char *TabuKeyName(const MtspTabuKey tabu_key) {
        switch (tabu_key) {
            case MTSP_TABU_KEY_MOVE:
                return "move";
            case MTSP_TABU_KEY_ROUTE:
                return "route";
        }
        return "unknown";
    }

    const char *AlgorithmName(const MtspAlgorithm algorithm) {
        switch (algorithm) {
            case MTSP_ALGORITHM_HILL_CLIMBING:
                return "hill_climbing";
            case MTSP_ALGORITHM_SIMULATED_ANNEALING:
                return "simulated_annealing";
            case MTSP_ALGORITHM_TABU_SEARCH:
                return "tabu_search";
            case MTSP_ALGORITHM_GRASP:
                return "grasp";
            case MTSP_ALGORITHM_GENETIC:
                return "genetic";
            case MTSP_ALGORITHM_NEAREST_NEIGHBOR:
                return "nearest_neighbor";
        }
        return "unknown";
    }

    MtspStatus ParseNeighborhood(const std::string_view name, MtspNeighborhood &neighborhood) {
        for (const auto candidate: {MTSP_NEIGHBORHOOD_SWAP, MTSP_NEIGHBORHOOD_INSERT, MTSP_NEIGHBORHOOD_TWO_OPT}) {
            if (name == NeighborhoodName(candidate)) {
                neighborhood = candidate;
                return MTSP_STATUS_SUCCESS;
            }
        }
        return MTSP_STATUS_ERROR_INVALID_CONFIG;
    }

    MtspStatus ParseSelection(const std::string_view name, MtspSelection &selection) {
        for (const auto candidate: {MTSP_SELECTION_TOURNAMENT, MTSP_SELECTION_ROULETTE, MTSP_SELECTION_RANKING}) {
            if (name == SelectionName(candidate)) {
                selection = candidate;
                return MTSP_STATUS_SUCCESS;
            }
        }
        return MTSP_STATUS_ERROR_INVALID_CONFIG;
    }

    MtspStatus ParseCrossover(const std::string_view name, MtspCrossover &crossover) {
        for (const auto candidate: {MTSP_CROSSOVER_OX, MTSP_CROSSOVER_PMX, MTSP_CROSSOVER_CX}) {
            if (name == CrossoverName(candidate)) {
                crossover = candidate;
                return MTSP_STATUS_SUCCESS;
            }
        }
        return MTSP_STATUS_ERROR_INVALID_CONFIG;
    }

    MtspStatus ParseTabuKey(const std::string_view name, MtspTabuKey &tabu_key) {
        for (const auto candidate: {MTSP_TABU_KEY_MOVE, MTSP_TABU_KEY_ROUTE}) {
            if (name == TabuKeyName(candidate)) {
                tabu_key = candidate;
                return MTSP_STATUS_SUCCESS;
            }
        }
        return MTSP_STATUS_ERROR_INVALID_CONFIG;
    }

    MtspStatus ParseHillClimbingOptions(const nlohmann::json &params, MtspHillClimbingOptionsDescriptor &options,
                                        std::string *why) {
        OptionReader reader{params, why};
        reader.read("seed", options.seed);
        reader.read("n_starts", options.n_starts);
        reader.read("max_iter", options.max_iter);
        reader.read("stop_no_improve", options.stop_no_improve);
        reader.read("neighborhood_type", options.neighborhood_type, &ParseNeighborhood);
        reader.read("use_delta", options.use_delta);
        return reader.finish();
    }

    MtspStatus ParseSimulatedAnnealingOptions(const nlohmann::json &params,
                                              MtspSimulatedAnnealingOptionsDescriptor &options, std::string *why) {
        OptionReader reader{params, why};
        reader.read("seed", options.seed);
        reader.read("T0", options.T0);
        reader.read("T_min", options.T_min);
        reader.read("alpha", options.alpha);
        reader.read("max_iter", options.max_iter);
        reader.read("neighborhood_type", options.neighborhood_type, &ParseNeighborhood);
        reader.read("use_delta", options.use_delta);
        return reader.finish();
    }

    MtspStatus ParseTabuSearchOptions(const nlohmann::json &params, MtspTabuSearchOptionsDescriptor &options,
                                      std::string *why) {
        OptionReader reader{params, why};
        reader.read("seed", options.seed);
        reader.read("max_iter", options.max_iter);
        reader.read("stop_no_improve", options.stop_no_improve);
        reader.read("tabu_tenure", options.tabu_tenure);
        reader.read("neighborhood_type", options.neighborhood_type, &ParseNeighborhood);
        reader.read("n_neighbors", options.n_neighbors);
        reader.read("tabu_key", options.tabu_key, &ParseTabuKey);
        return reader.finish();
    }

    MtspStatus ParseGraspOptions(const nlohmann::json &params, MtspGraspOptionsDescriptor &options,
                                 std::string *why) {
        OptionReader reader{params, why};
        reader.read("seed", options.seed);
        reader.read("alpha", options.alpha);
        reader.read("iterations", options.iterations);
        reader.read("neighborhood_type", options.neighborhood_type, &ParseNeighborhood);
        reader.read("ihc_max_iter", options.ihc_max_iter);
        reader.read("ihc_stop_no_improve", options.ihc_stop_no_improve);
        reader.read("use_delta", options.use_delta);
        return reader.finish();
    }

    MtspStatus ParseGeneticOptions(const nlohmann::json &params, MtspGeneticOptionsDescriptor &options,
                                   std::string *why) {
        OptionReader reader{params, why};
        reader.read("seed", options.seed);
        reader.read("population_size", options.population_size);
        reader.read("generations", options.generations);
        reader.read("selection", options.selection, &ParseSelection);
        reader.read("tournament_size", options.tournament_size);
        reader.read("crossover", options.crossover, &ParseCrossover);
        reader.read("mutation_type", options.mutation_type, &ParseNeighborhood);
        reader.read("mutation_prob", options.mutation_prob);
        return reader.finish();
    }

    MtspStatus ParseNearestNeighborOptions(const nlohmann::json &params,
                                           MtspNearestNeighborOptionsDescriptor &options, std::string *why) {
        OptionReader reader{params, why};
        reader.read("start_city", options.start_city);
        return reader.finish();
    }

    nlohmann::json DescribeOptions(const MtspHillClimbingOptionsDescriptor &options) {
        return {
            {"seed", options.seed},
            {"n_starts", options.n_starts},
            {"max_iter", options.max_iter},
            {"stop_no_improve", options.stop_no_improve},
            {"neighborhood_type", NeighborhoodName(options.neighborhood_type)},
            {"use_delta", options.use_delta},
        };
    }

    nlohmann::json DescribeOptions(const MtspSimulatedAnnealingOptionsDescriptor &options) {
        return {
            {"seed", options.seed},
            {"T0", options.T0},
            {"T_min", options.T_min},
            {"alpha", options.alpha},
            {"max_iter", options.max_iter},
            {"neighborhood_type", NeighborhoodName(options.neighborhood_type)},
            {"use_delta", options.use_delta},
        };
    }

    nlohmann::json DescribeOptions(const MtspTabuSearchOptionsDescriptor &options) {
        return {
            {"seed", options.seed},
            {"max_iter", options.max_iter},
            {"stop_no_improve", options.stop_no_improve},
            {"tabu_tenure", options.tabu_tenure},
            {"neighborhood_type", NeighborhoodName(options.neighborhood_type)},
            {"n_neighbors", options.n_neighbors},
            {"tabu_key", TabuKeyName(options.tabu_key)},
        };
    }

    nlohmann::json DescribeOptions(const MtspGraspOptionsDescriptor &options) {
        return {
            {"seed", options.seed},
            {"alpha", options.alpha},
            {"iterations", options.iterations},
            {"neighborhood_type", NeighborhoodName(options.neighborhood_type)},
            {"ihc_max_iter", options.ihc_max_iter},
            {"ihc_stop_no_improve", options.ihc_stop_no_improve},
            {"use_delta", options.use_delta},
        };
    }

    nlohmann::json DescribeOptions(const MtspGeneticOptionsDescriptor &options) {
        return {
            {"seed", options.seed},
            {"population_size", options.population_size},
            {"generations", options.generations},
            {"selection", SelectionName(options.selection)},
            {"tournament_size", options.tournament_size},
            {"crossover", CrossoverName(options.crossover)},
            {"mutation_type", NeighborhoodName(options.mutation_type)},
            {"mutation_prob", options.mutation_prob},
        };
    }

    nlohmann::json DescribeOptions(const MtspNearestNeighborOptionsDescriptor &options) {
        return {
            {"start_city", options.start_city},
        };
    }
}
