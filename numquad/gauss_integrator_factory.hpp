/*
 * Copyright (c) 2025 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <type_traits>
#include <utility>

#include <boost/multiprecision/cpp_bin_float.hpp>

#include "numquad/converting_rule_factory.hpp"
#include "numquad/gauss_integrator.hpp"
#include "numquad/hermite_rule_factory.hpp"
#include "numquad/laguerre_rule_factory.hpp"
#include "numquad/legendre_rule_factory.hpp"
#include "numquad/rule.hpp"

namespace gauss {

/**
 * @brief Builds Gauss integrators for the supported weight functions.
 *
 * Each family has its own rule factory, so rules are computed once per order and shared by all the integrators built
 * by this factory. The factory may be used from several threads at once.
 *
 * @tparam T Numeric domain.
 */
template <typename T>
class GaussIntegratorFactory {
public:
    GaussIntegratorFactory();

    /**
     * @brief Gauss-Legendre integrator of f(x) over [-1, 1].
     *
     * @param number_of_points Order of the rule.
     *
     * @throws errors::InvalidOrder if the order is not in [1, 1000].
     */
    GaussIntegrator<T> legendre(int number_of_points) { return GaussIntegrator<T>(legendre_.get_rule(number_of_points)); }

    /**
     * @brief Gauss-Legendre integrator of f(x) over [lower, upper].
     *
     * @param number_of_points Order of the rule.
     * @param lower            Lower bound.
     * @param upper            Upper bound.
     *
     * @throws errors::InvalidOrder if the order is not in [1, 1000].
     */
    GaussIntegrator<T> legendre(int number_of_points, const T &lower, const T &upper) {
        return GaussIntegrator<T>(transform(legendre_.get_rule(number_of_points), lower, upper));
    }

    /**
     * @brief Gauss-Legendre integrator over [-1, 1] with nodes and weights computed with 50 decimal digits.
     */
    template <typename U = T, typename = std::enable_if_t<std::is_same_v<U, double>>>
    GaussIntegrator<T> legendre_high_precision(int number_of_points) {
        return GaussIntegrator<T>(legendre_high_precision_->get_rule(number_of_points));
    }

    /**
     * @brief Gauss-Legendre integrator over [lower, upper] with nodes and weights computed with 50 decimal digits.
     */
    template <typename U = T, typename = std::enable_if_t<std::is_same_v<U, double>>>
    GaussIntegrator<T> legendre_high_precision(int number_of_points, const T &lower, const T &upper) {
        return GaussIntegrator<T>(transform(legendre_high_precision_->get_rule(number_of_points), lower, upper));
    }

    /**
     * @brief Gauss-Hermite integrator of f(x) exp(-x^2) over the real line.
     *
     * @throws errors::InvalidOrder if the order is not in [1, 1000].
     */
    SymmetricGaussIntegrator<T> hermite(int number_of_points) {
        return SymmetricGaussIntegrator<T>(hermite_.get_rule(number_of_points));
    }

    /**
     * @brief Gauss-Laguerre integrator of f(x) exp(-x) over [0, +inf).
     *
     * @throws errors::InvalidOrder if the order is not in [1, 1000].
     */
    GaussIntegrator<T> laguerre(int number_of_points) {
        return GaussIntegrator<T>(laguerre_.get_rule(number_of_points));
    }

private:
    /**
     * @brief Map a rule on [-1, 1] to [a, b].
     */
    static Rule<T> transform(Rule<T> rule, const T &a, const T &b);

    LegendreRuleFactory<T> legendre_;

    /**
     * @brief Only set for T = double.
     */
    std::unique_ptr<RuleFactory<T>> legendre_high_precision_;

    HermiteRuleFactory<T> hermite_;

    LaguerreRuleFactory<T> laguerre_;
};

template <typename T>
GaussIntegratorFactory<T>::GaussIntegratorFactory() {
    if constexpr (std::is_same_v<T, double>) {
        using Precise = boost::multiprecision::cpp_bin_float_50;
        legendre_high_precision_ = std::make_unique<ConvertingRuleFactory<Precise, double>>(
            std::make_unique<LegendreRuleFactory<Precise>>());
    }
}

template <typename T>
Rule<T> GaussIntegratorFactory<T>::transform(Rule<T> rule, const T &a, const T &b) {
    const T scale = (b - a) * 0.5;
    const T shift = a + scale;

    for (std::size_t i = 0; i < rule.points.size(); ++i) {
        rule.points[i] = rule.points[i] * scale + shift;
        rule.weights[i] = rule.weights[i] * scale;
    }

    return rule;
}

}; /* namespace gauss */
