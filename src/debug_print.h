#pragma once

#include "common.h"
#include "distance_matrix.h"

#include <iomanip>
#include <iostream>

namespace mtsp {
    /// Prints the distance matrix to the console. Useful for debugging.
    inline void PrintDistanceMatrix(const DistanceMatrix &matrix, std::ostream &out = std::cout) {
        const auto printBorder = [&matrix, &out] {
            out << "+";
            for (size_t i = 0; i < matrix.size(); ++i) {
                out << "--------"; // allow 7 chars per number
            }
            out << "+" << std::endl;
        };
        printBorder();
        for (city_idx i = 0; i < static_cast<city_idx>(matrix.size()); ++i) {
            out << "|";
            for (city_idx j = 0; j < static_cast<city_idx>(matrix.size()); ++j) {
                out << std::fixed << std::setprecision(1) << std::setw(7) << matrix.get_cost(i, j) << " ";
            }
            out << "|" << std::endl;
        }
        printBorder();
    }

    /// Prints a tour as "0 -> 4 -> 1 -> 0 (cost)".
    inline void PrintRoute(const Route &tour, const cost_t cost, std::ostream &out = std::cout) {
        for (const city_idx city: tour) {
            out << city << " -> ";
        }
        if (!tour.empty()) {
            out << tour.front();
        }
        out << " (" << std::fixed << std::setprecision(2) << cost << ")" << std::endl;
    }
}
