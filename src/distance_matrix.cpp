#include "distance_matrix.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <sstream>

namespace mtsp {
    DistanceMatrix::DistanceMatrix(const size_t num_cities)
        : distances(std::make_unique<cost_t[]>(num_cities * num_cities)),
          num_cities(num_cities),
          symmetric(true) {
        std::fill_n(distances.get(), num_cities * num_cities, 0.0);
    }

    DistanceMatrix::DistanceMatrix(DistanceMatrix &&other) noexcept
        : distances(std::move(other.distances)),
          num_cities(other.num_cities),
          symmetric(other.symmetric) {
        other.num_cities = 0;
    }

    DistanceMatrix DistanceMatrix::FromDescriptor(const MtspDistanceMatrixDescriptor &descriptor) {
        DistanceMatrix mat{descriptor.num_cities};
        std::copy_n(descriptor.costs, descriptor.num_cities * descriptor.num_cities, mat.distances.get());
        mat.refresh_symmetry();
        return mat;
    }

    DistanceMatrix DistanceMatrix::FromRows(const std::vector<std::vector<cost_t>> &rows) {
        DistanceMatrix mat{rows.size()};
        for (size_t i = 0; i < rows.size(); ++i) {
            for (size_t j = 0; j < rows[i].size() && j < rows.size(); ++j) {
                mat.distances[i * rows.size() + j] = rows[i][j];
            }
        }
        mat.refresh_symmetry();
        return mat;
    }

    void DistanceMatrix::set_cost(const city_idx from, const city_idx to, const cost_t cost) {
        distances[from * static_cast<city_idx>(num_cities) + to] = cost;
    }

    void DistanceMatrix::refresh_symmetry() {
        symmetric = true;
        for (size_t i = 0; i < num_cities && symmetric; ++i) {
            for (size_t j = i + 1; j < num_cities; ++j) {
                if (distances[i * num_cities + j] != distances[j * num_cities + i]) {
                    symmetric = false;
                    break;
                }
            }
        }
    }

    MtspStatus ValidateDistanceMatrix(const MtspDistanceMatrixDescriptor &descriptor, std::string *why) {
        if (descriptor.costs == nullptr || descriptor.num_cities == 0) {
            if (why) *why = "distance matrix is empty";
            return MTSP_STATUS_ERROR_INVALID_MATRIX;
        }
        const size_t n = descriptor.num_cities;
        if (n > std::numeric_limits<size_t>::max() / n) {
            if (why) {
                std::ostringstream msg;
                msg << "distance matrix with " << n << " cities has more entries than size_t can index";
                *why = msg.str();
            }
            return MTSP_STATUS_ERROR_INVALID_MATRIX;
        }
        for (size_t i = 0; i < n; ++i) {
            for (size_t j = 0; j < n; ++j) {
                if (i == j) {
                    continue;
                }
                const cost_t cost = descriptor.costs[i * n + j];
                if (!std::isfinite(cost) || cost < 0) {
                    if (why) {
                        std::ostringstream msg;
                        msg << "distance matrix entry (" << i << ", " << j << ") = " << cost
                                << " is negative or not finite";
                        *why = msg.str();
                    }
                    return MTSP_STATUS_ERROR_INVALID_MATRIX;
                }
            }
        }
        return MTSP_STATUS_SUCCESS;
    }

    cost_t ComputeTourCost(const Route &tour, const DistanceMatrix &matrix) {
        cost_t cost = 0;
        const size_t n = tour.size();
        if (n == 0) {
            return cost;
        }
        for (size_t i = 0; i + 1 < n; ++i) {
            cost += matrix.get_cost(tour[i], tour[i + 1]);
        }
        cost += matrix.get_cost(tour[n - 1], tour[0]);
        return cost;
    }

    bool IsValidPermutation(const Route &tour, const size_t num_cities) {
        if (tour.size() != num_cities) {
            return false;
        }
        std::vector<bool> seen(num_cities, false);
        for (const city_idx city: tour) {
            if (city < 0 || static_cast<size_t>(city) >= num_cities || seen[city]) {
                return false;
            }
            seen[city] = true;
        }
        return true;
    }

    Route GenerateRandomTour(const size_t num_cities, Rng &rng) {
        Route tour(num_cities);
        std::iota(tour.begin(), tour.end(), 0);
        std::ranges::shuffle(tour, rng);
        return tour;
    }
}
