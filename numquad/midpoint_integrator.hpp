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
 * @brief Largest maximal iteration count of the midpoint method (2^63 new points at most in one stage).
 */
inline constexpr int midpoint_max_iterations_count = 64;

/**
 * @brief Iterative midpoint integrator.
 *
 * Starts from (b - a) f((a + b) / 2). Stage n samples the 2^(n-1) midpoints of the panels of width
 * (b - a) / 2^(n-1) and averages their sum with the previous estimate:
 *
 *   t_n = (t_{n-1} + spacing * sum) / 2.
 *
 * @tparam T Numeric domain.
 */
template <typename T>
class MidPointIntegrator : public BaseIntegrator<T> {
public:
    /**
     * @brief Default accuracies, minimal iteration count 3, maximal iteration count 64.
     */
    MidPointIntegrator() : MidPointIntegrator(default_min_iterations_count, midpoint_max_iterations_count) {}

    MidPointIntegrator(int minimal_iteration_count, int maximal_iteration_count)
        : MidPointIntegrator(make_settings(minimal_iteration_count, maximal_iteration_count)) {}

    MidPointIntegrator(double relative_accuracy,
                       double absolute_accuracy,
                       int minimal_iteration_count,
                       int maximal_iteration_count)
        : MidPointIntegrator(
              make_settings(relative_accuracy, absolute_accuracy, minimal_iteration_count, maximal_iteration_count)) {}

    /**
     * @throws errors::InvalidIterationBounds if the bounds are inconsistent or the maximal count exceeds 64.
     */
    explicit MidPointIntegrator(Settings settings) : BaseIntegrator<T>(settings) {
        settings.validate(midpoint_max_iterations_count);
    }

protected:
    T run(Context<T> &context) const override;

private:
    /**
     * @brief Refine the previous estimate with the midpoints of stage n.
     *
     * @param context  Run providing counted evaluations.
     * @param n        Stage index, at least 1.
     * @param previous Estimate of stage n - 1.
     * @param min      Lower bound.
     * @param diff     Interval length.
     */
    static T stage(Context<T> &context, int n, const T &previous, const T &min, const T &diff);
};

template <typename T>
T MidPointIntegrator<T>::run(Context<T> &context) const {
    const T min = context.lower();
    const T diff = context.upper() - min;
    const T mid_point = min + diff * 0.5;
    utils::Incrementor &iterations = context.iterations();

    T oldt = diff * context.value(mid_point);
    while (true) {
        iterations.increment();
        const int i = iterations.count();
        const T t = stage(context, i, oldt, min, diff);
        if (i >= this->minimal_iteration_count() && context.converged(t, oldt)) {
            return t;
        }
        oldt = t;
    }
}

template <typename T>
T MidPointIntegrator<T>::stage(Context<T> &context, int n, const T &previous, const T &min, const T &diff) {
    const std::uint64_t np = std::uint64_t(1) << (n - 1);
    const T spacing = diff / std::ldexp(1.0, n - 1);

    T sum = field::Traits<T>::zero();
    T x = min + spacing * 0.5;
    for (std::uint64_t i = 0; i < np; ++i) {
        sum = sum + context.value(x);
        x = x + spacing;
    }

    return (previous + sum * spacing) * 0.5;
}

}; /* namespace integration */
