#pragma once

#include "common.h"

#include <memory>
#include <string>

namespace mtsp {
    class DistanceMatrix {
        std::unique_ptr<cost_t[]> distances;
        size_t num_cities;
        bool symmetric;

    public:
        explicit DistanceMatrix(size_t num_cities);

        DistanceMatrix(const DistanceMatrix &) = delete;

        DistanceMatrix &operator=(const DistanceMatrix &) = delete;

        DistanceMatrix(DistanceMatrix &&other) noexcept;

        /// Copies a caller supplied row-major table. The descriptor must have passed ValidateDistanceMatrix.
        [[nodiscard]] static DistanceMatrix FromDescriptor(const MtspDistanceMatrixDescriptor &descriptor);

        /// Builds a matrix from nested rows; used by tests and the benchmark driver.
        [[nodiscard]] static DistanceMatrix FromRows(const std::vector<std::vector<cost_t>> &rows);

        [[nodiscard]] FORCE_INLINE cost_t get_cost(const city_idx from, const city_idx to) const {
            return distances[from * static_cast<city_idx>(num_cities) + to];
        }

        void set_cost(city_idx from, city_idx to, cost_t cost);

        [[nodiscard]] size_t size() const {
            return num_cities;
        }

        /// Whether d[i][j] == d[j][i] for every pair. Computed once, when the matrix is filled.
        [[nodiscard]] bool is_symmetric() const {
            return symmetric;
        }

        /// Re-evaluates symmetry after set_cost calls.
        void refresh_symmetry();
    };

    /// Checks the caller's descriptor: non-null table, at least one city, finite non-negative entries.
    [[nodiscard]] MtspStatus ValidateDistanceMatrix(const MtspDistanceMatrixDescriptor &descriptor,
                                                    std::string *why = nullptr);

    /// O(n) closed tour length, including the wrap-around edge. The ground truth for every incremental update.
    [[nodiscard]] cost_t ComputeTourCost(const Route &tour, const DistanceMatrix &matrix);

    /// Whether tour is a permutation of 0 .. num_cities - 1.
    [[nodiscard]] bool IsValidPermutation(const Route &tour, size_t num_cities);

    /// Uniformly random permutation of 0 .. num_cities - 1.
    [[nodiscard]] Route GenerateRandomTour(size_t num_cities, Rng &rng);
}
