/*
 * Copyright (c) 2025 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cmath>
#include <utility>
#include <vector>

#include "spdlog/spdlog.h"

#include "numquad/base_integrator.hpp"
#include "numquad/field.hpp"
#include "numquad/settings.hpp"
#include "numquad/trapezoid_integrator.hpp"

namespace integration {

/**
 * @brief Largest maximal iteration count of the Romberg method.
 */
inline constexpr int romberg_max_iterations_count = 32;

/**
 * @brief Romberg integrator.
 *
 * Builds the Richardson extrapolation tableau row by row. Row i starts with the trapezoid stage i and its column j is
 *
 *   T[i][j] = T[i][j-1] + (T[i][j-1] - T[i-1][j-1]) / (4^j - 1).
 *
 * Only two rows are kept, the diagonal element of the newest row is the current estimate.
 *
 * @tparam T Numeric domain.
 */
template <typename T>
class RombergIntegrator : public BaseIntegrator<T> {
public:
    /**
     * @brief Default accuracies, minimal iteration count 3, maximal iteration count 32.
     */
    RombergIntegrator() : RombergIntegrator(default_min_iterations_count, romberg_max_iterations_count) {}

    RombergIntegrator(int minimal_iteration_count, int maximal_iteration_count)
        : RombergIntegrator(make_settings(minimal_iteration_count, maximal_iteration_count)) {}

    RombergIntegrator(double relative_accuracy,
                      double absolute_accuracy,
                      int minimal_iteration_count,
                      int maximal_iteration_count)
        : RombergIntegrator(
              make_settings(relative_accuracy, absolute_accuracy, minimal_iteration_count, maximal_iteration_count)) {}

    /**
     * @throws errors::InvalidIterationBounds if the bounds are inconsistent or the maximal count exceeds 32.
     */
    explicit RombergIntegrator(Settings settings) : BaseIntegrator<T>(settings) {
        settings.validate(romberg_max_iterations_count);
    }

protected:
    T run(Context<T> &context) const override;
};

template <typename T>
T RombergIntegrator<T>::run(Context<T> &context) const {
    const std::size_t m = static_cast<std::size_t>(this->maximal_iteration_count()) + 1;
    std::vector<T> previous_row(m, field::Traits<T>::zero());
    std::vector<T> current_row(m, field::Traits<T>::zero());

    TrapezoidStage<T> trapezoid;
    utils::Incrementor &iterations = context.iterations();

    current_row[0] = trapezoid.stage(context, 0);
    iterations.increment();
    T olds = current_row[0];
    while (true) {
        const int i = iterations.count();

        std::swap(previous_row, current_row);
        current_row[0] = trapezoid.stage(context, i);
        iterations.increment();
        for (int j = 1; j <= i; ++j) {
            const double r = std::ldexp(1.0, 2 * j) - 1.0;
            const T t_ijm1 = current_row[j - 1];
            current_row[j] = t_ijm1 + (t_ijm1 - previous_row[j - 1]) / r;
        }

        const T s = current_row[i];
        if (i >= this->minimal_iteration_count() && context.converged(s, olds)) {
            spdlog::trace("Romberg tableau reached row {}", i);
            return s;
        }
        olds = s;
    }
}

}; /* namespace integration */
