/*
 * Copyright (c) 2025 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "numquad/base_integrator.hpp"
#include "numquad/field.hpp"
#include "numquad/settings.hpp"
#include "numquad/trapezoid_integrator.hpp"

namespace integration {

/**
 * @brief Iterative Simpson integrator.
 *
 * Each estimate combines two consecutive trapezoid stages, s = (4 t_i - t_{i-1}) / 3, which is Simpson's rule on
 * 2^i panels. The maximal iteration count is capped at 64 like the trapezoid rule it builds on.
 *
 * @tparam T Numeric domain.
 */
template <typename T>
class SimpsonIntegrator : public BaseIntegrator<T> {
public:
    SimpsonIntegrator() : SimpsonIntegrator(default_min_iterations_count, trapezoid_max_iterations_count) {}

    SimpsonIntegrator(int minimal_iteration_count, int maximal_iteration_count)
        : SimpsonIntegrator(make_settings(minimal_iteration_count, maximal_iteration_count)) {}

    SimpsonIntegrator(double relative_accuracy,
                      double absolute_accuracy,
                      int minimal_iteration_count,
                      int maximal_iteration_count)
        : SimpsonIntegrator(
              make_settings(relative_accuracy, absolute_accuracy, minimal_iteration_count, maximal_iteration_count)) {}

    /**
     * @throws errors::InvalidIterationBounds if the bounds are inconsistent or the maximal count exceeds 64.
     */
    explicit SimpsonIntegrator(Settings settings) : BaseIntegrator<T>(settings) {
        settings.validate(trapezoid_max_iterations_count);
    }

protected:
    T run(Context<T> &context) const override;
};

template <typename T>
T SimpsonIntegrator<T>::run(Context<T> &context) const {
    TrapezoidStage<T> trapezoid;
    utils::Incrementor &iterations = context.iterations();

    if (this->minimal_iteration_count() == 1) {
        const T s0 = trapezoid.stage(context, 0);
        const T s1 = trapezoid.stage(context, 1);
        return (s1 * 4.0 - s0) / 3.0;
    }

    T olds = field::Traits<T>::zero();
    T oldt = trapezoid.stage(context, 0);
    while (true) {
        iterations.increment();
        const int i = iterations.count();
        const T t = trapezoid.stage(context, i);
        const T s = (t * 4.0 - oldt) / 3.0;
        if (i >= this->minimal_iteration_count() && context.converged(s, olds)) {
            return s;
        }
        olds = s;
        oldt = t;
    }
}

}; /* namespace integration */
