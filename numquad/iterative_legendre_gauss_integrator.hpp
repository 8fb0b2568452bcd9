/*
 * Copyright (c) 2025 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <algorithm>
#include <cmath>
#include <memory>
#include <utility>

#include "spdlog/spdlog.h"

#include "numquad/base_integrator.hpp"
#include "numquad/errors.hpp"
#include "numquad/field.hpp"
#include "numquad/gauss_integrator.hpp"
#include "numquad/gauss_integrator_factory.hpp"
#include "numquad/settings.hpp"

namespace integration {

/**
 * @brief Adaptive composite Gauss-Legendre integrator.
 *
 * Iteration k splits [a, b] into n_k equal sub-intervals and applies a fixed order Gauss-Legendre rule on each of
 * them. n starts at 1, then 2, and grows with the observed error:
 *
 *   n' = max(floor(n * min(4, (delta / limit)^(0.5 / points))), n + 1).
 *
 * @tparam T Numeric domain.
 */
template <typename T>
class IterativeLegendreGaussIntegrator : public BaseIntegrator<T> {
public:
    using Factory = gauss::GaussIntegratorFactory<T>;

    /**
     * @param number_of_points Order of the Gauss-Legendre rule used on each sub-interval.
     * @param settings         Accuracy and iteration bounds.
     * @param factory          Source of the Gauss-Legendre rules, may be shared with other integrators.
     *
     * @throws errors::InvalidOrder if number_of_points <= 0.
     * @throws errors::InvalidIterationBounds if the iteration bounds are inconsistent.
     */
    IterativeLegendreGaussIntegrator(int number_of_points, Settings settings, std::shared_ptr<Factory> factory)
        : BaseIntegrator<T>(std::move(settings)), factory_(std::move(factory)), number_of_points_(number_of_points) {
        if (number_of_points <= 0) {
            throw errors::InvalidOrder(number_of_points);
        }
        if (!factory_) {
            factory_ = std::make_shared<Factory>();
        }
    }

    IterativeLegendreGaussIntegrator(int number_of_points, Settings settings)
        : IterativeLegendreGaussIntegrator(number_of_points, std::move(settings), nullptr) {}

    explicit IterativeLegendreGaussIntegrator(int number_of_points)
        : IterativeLegendreGaussIntegrator(number_of_points, Settings{}) {}

    IterativeLegendreGaussIntegrator(int number_of_points, double relative_accuracy, double absolute_accuracy)
        : IterativeLegendreGaussIntegrator(number_of_points, make_settings(relative_accuracy, absolute_accuracy)) {}

    IterativeLegendreGaussIntegrator(int number_of_points, int minimal_iteration_count, int maximal_iteration_count)
        : IterativeLegendreGaussIntegrator(number_of_points,
                                           make_settings(minimal_iteration_count, maximal_iteration_count)) {}

    IterativeLegendreGaussIntegrator(int number_of_points,
                                     double relative_accuracy,
                                     double absolute_accuracy,
                                     int minimal_iteration_count,
                                     int maximal_iteration_count)
        : IterativeLegendreGaussIntegrator(
              number_of_points,
              make_settings(relative_accuracy, absolute_accuracy, minimal_iteration_count, maximal_iteration_count)) {}

    int number_of_points() const noexcept { return number_of_points_; }

    const std::shared_ptr<Factory> &factory() const noexcept { return factory_; }

protected:
    T run(Context<T> &context) const override;

private:
    /**
     * @brief Composite estimate over n equal sub-intervals.
     */
    T stage(Context<T> &context, int n) const;

    std::shared_ptr<Factory> factory_;
    int number_of_points_;
};

template <typename T>
T IterativeLegendreGaussIntegrator<T>::run(Context<T> &context) const {
    using F = field::Traits<T>;
    utils::Incrementor &iterations = context.iterations();

    T oldt = stage(context, 1);
    int n = 2;
    while (true) {
        const T t = stage(context, n);

        const double delta = F::real(F::abs(T(t - oldt)));
        const double limit =
            std::max(this->absolute_accuracy(),
                     F::real(T(F::abs(oldt) + F::abs(t))) * 0.5 * this->relative_accuracy());

        if (iterations.count() + 1 >= this->minimal_iteration_count() && delta <= limit) {
            spdlog::debug("Iterative Legendre-Gauss converged with {} sub-intervals", n);
            return t;
        }

        const double ratio = std::min(4.0, std::pow(delta / limit, 0.5 / number_of_points_));
        n = std::max(static_cast<int>(ratio * n), n + 1);
        oldt = t;
        iterations.increment();
    }
}

template <typename T>
T IterativeLegendreGaussIntegrator<T>::stage(Context<T> &context, int n) const {
    const T &min = context.lower();
    const T step = (context.upper() - min) / static_cast<double>(n);

    T sum = field::Traits<T>::zero();
    for (int i = 0; i < n; ++i) {
        const T a = min + step * static_cast<double>(i);
        const T b = a + step;
        const gauss::GaussIntegrator<T> g = factory_->legendre(number_of_points_, a, b);
        sum = sum + g.integrate([&context](T x) { return context.value(x); });
    }

    return sum;
}

}; /* namespace integration */
