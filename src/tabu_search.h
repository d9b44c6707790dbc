#pragma once

#include "common.h"
#include "distance_matrix.h"
#include "moves.h"

#include <algorithm>
#include <deque>
#include <string>
#include <utility>

namespace mtsp {
    /// Describes a tabu entry: the pair of tour positions touched by an accepted move.
    struct tabu_key_t {
        tour_idx i;
        tour_idx j;

        bool operator==(const tabu_key_t &other) const {
            return i == other.i && j == other.j;
        }

        bool operator!=(const tabu_key_t &other) const {
            return !(*this == other);
        }
    };

    [[nodiscard]] inline tabu_key_t TabuKeyOf(const move_t &move) {
        return {move.i, move.j};
    }

    /// Bounded FIFO of the most recently accepted keys. Key is tabu_key_t or a whole Route.
    template<typename Key = tabu_key_t>
    class TabuMemory {
        std::deque<Key> entries;
        size_t tenure;

    public:
        explicit TabuMemory(const size_t tenure)
            : tenure(tenure) {
        }

        /// Records key, evicting the oldest entry when the memory already holds tenure entries.
        void push(Key key) {
            if (tenure == 0) {
                return;
            }
            if (entries.size() >= tenure) {
                entries.pop_front();
            }
            entries.push_back(std::move(key));
        }

        [[nodiscard]] bool contains(const Key &key) const {
            return std::ranges::find(entries, key) != entries.end();
        }

        [[nodiscard]] size_t size() const {
            return entries.size();
        }

        [[nodiscard]] size_t capacity() const {
            return tenure;
        }
    };

    /// A candidate may be taken unless its key is tabu; the aspiration criterion lifts the ban
    /// when the candidate beats the best cost seen so far.
    template<typename Key>
    [[nodiscard]] bool IsCandidateAdmissible(const TabuMemory<Key> &memory, const Key &key,
                                             const cost_t candidate_cost, const cost_t best_cost) {
        const bool better_than_global_best = candidate_cost < best_cost;
        return better_than_global_best || !memory.contains(key);
    }

    [[nodiscard]] bool IsValidTabuKey(MtspTabuKey tabu_key);

    [[nodiscard]] MtspStatus ValidateTabuSearchOptions(const MtspTabuSearchOptionsDescriptor &options,
                                                       size_t num_cities, std::string *why = nullptr);

    /// Runs tabu search from a random tour and returns the best tour seen. options.tabu_key picks
    /// whether the memory holds position pairs or visited routes.
    [[nodiscard]] search_result_t RunTabuSearch(const DistanceMatrix &matrix,
                                                const MtspTabuSearchOptionsDescriptor &options, Rng &rng);
}
