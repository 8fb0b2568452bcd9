/*
 * Copyright (c) 2025 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cmath>
#include <cstdint>

#include "numquad/base_integrator.hpp"
#include "numquad/field.hpp"
#include "numquad/settings.hpp"

namespace integration {

/**
 * @brief Incremental trapezoid rule.
 *
 * Stage 0 is the single panel estimate (b - a) (f(a) + f(b)) / 2. Stage n >= 1 halves the panels of stage n - 1 and
 * only evaluates the 2^(n-1) new midpoints, reusing the previous stage value. Stages must be computed in order.
 *
 * @tparam T Numeric domain.
 */
template <typename T>
class TrapezoidStage {
public:
    TrapezoidStage() : s_(field::Traits<T>::zero()) {}

    /**
     * @brief Compute the next refinement of the trapezoid estimate.
     *
     * @param context Run providing bounds and counted evaluations.
     * @param n       Stage index, one more than the previous call (0 for the first).
     *
     * @return Trapezoid estimate with 2^n panels.
     */
    T stage(Context<T> &context, int n);

private:
    T s_;
};

/**
 * @brief Number of iterations supported by trapezoid based methods (2^63 panels at most).
 */
inline constexpr int trapezoid_max_iterations_count = 64;

/**
 * @brief Iterative trapezoid integrator.
 *
 * Doubles the number of panels at each iteration until two consecutive estimates agree.
 *
 * @tparam T Numeric domain.
 */
template <typename T>
class TrapezoidIntegrator : public BaseIntegrator<T> {
public:
    /**
     * @brief Default accuracies, minimal iteration count 3, maximal iteration count 64.
     */
    TrapezoidIntegrator() : TrapezoidIntegrator(default_min_iterations_count, trapezoid_max_iterations_count) {}

    TrapezoidIntegrator(int minimal_iteration_count, int maximal_iteration_count)
        : TrapezoidIntegrator(make_settings(minimal_iteration_count, maximal_iteration_count)) {}

    TrapezoidIntegrator(double relative_accuracy,
                        double absolute_accuracy,
                        int minimal_iteration_count,
                        int maximal_iteration_count)
        : TrapezoidIntegrator(
              make_settings(relative_accuracy, absolute_accuracy, minimal_iteration_count, maximal_iteration_count)) {}

    /**
     * @throws errors::InvalidIterationBounds if the bounds are inconsistent or the maximal count exceeds 64.
     */
    explicit TrapezoidIntegrator(Settings settings) : BaseIntegrator<T>(settings) {
        settings.validate(trapezoid_max_iterations_count);
    }

protected:
    T run(Context<T> &context) const override;
};

template <typename T>
T TrapezoidStage<T>::stage(Context<T> &context, int n) {
    const T &min = context.lower();
    const T &max = context.upper();
    const T diff = max - min;

    if (n == 0) {
        s_ = diff * 0.5 * (context.value(min) + context.value(max));
        return s_;
    }

    const std::uint64_t np = std::uint64_t(1) << (n - 1);
    const T spacing = diff / std::ldexp(1.0, n - 1);
    T x = min + spacing * 0.5;
    T sum = field::Traits<T>::zero();
    for (std::uint64_t i = 0; i < np; ++i) {
        sum = sum + context.value(x);
        x = x + spacing;
    }
    s_ = (s_ + sum * spacing) * 0.5;

    return s_;
}

template <typename T>
T TrapezoidIntegrator<T>::run(Context<T> &context) const {
    TrapezoidStage<T> trapezoid;
    utils::Incrementor &iterations = context.iterations();

    T oldt = trapezoid.stage(context, 0);
    iterations.increment();
    while (true) {
        const int i = iterations.count();
        const T t = trapezoid.stage(context, i);
        if (i >= this->minimal_iteration_count() && context.converged(t, oldt)) {
            return t;
        }
        oldt = t;
        iterations.increment();
    }
}

}; /* namespace integration */
