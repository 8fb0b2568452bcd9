/*
 * Copyright (c) 2025 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <utility>
#include <vector>

#include "spdlog/spdlog.h"

#include "numquad/field.hpp"
#include "numquad/rule.hpp"
#include "numquad/rule_factory.hpp"

namespace gauss {

/**
 * @brief Gauss-Legendre rules, integrating f(x) over [-1, 1].
 *
 * Nodes are the roots of the Legendre polynomial P_n. With x a node, the weight is 2 (1 - x^2) / (n P_{n-1}(x))^2.
 * An n-point rule is exact for polynomials of degree up to 2n - 1.
 *
 * @tparam T Numeric domain of nodes and weights.
 */
template <typename T>
class LegendreRuleFactory : public RuleFactory<T> {
public:
    LegendreRuleFactory() = default;

protected:
    using typename RuleFactory<T>::Evaluation;

    Rule<T> compute_rule(int number_of_points) override;

private:
    /**
     * @brief Values of P_{n-1}, P_n and P_n' at one point.
     */
    struct Values {
        T p_prev;
        T p;
        T dp;
    };

    /**
     * @brief Evaluate the Legendre polynomial of the given degree and its derivative.
     *
     * Uses (k + 1) P_{k+1}(x) = (2k + 1) x P_k(x) - k P_{k-1}(x) and P_{k+1}'(x) = (k + 1) P_k(x) + x P_k'(x).
     *
     * @param degree Polynomial degree, at least 1.
     * @param x      Evaluation point.
     *
     * @return P_{degree-1}(x), P_degree(x) and P_degree'(x).
     */
    static Values evaluate(int degree, const T &x);
};

template <typename T>
Rule<T> LegendreRuleFactory<T>::compute_rule(int number_of_points) {
    using F = field::Traits<T>;

    if (number_of_points == 1) {
        return {{F::zero()}, {T(2.0)}};
    }

    spdlog::debug("Computing Legendre rule with {} points", number_of_points);

    const int n = number_of_points;
    std::vector<T> points = this->find_roots(n, [n](const T &x) -> Evaluation {
        const Values v = evaluate(n, x);
        return {v.p, v.dp};
    });
    this->enforce_symmetry(points);

    std::vector<T> weights(n, F::zero());
    const int limit = (n + 1) / 2;
    for (int i = 0; i < limit; ++i) {
        const T x = points[i];
        const Values v = evaluate(n, x);
        const T d = v.p_prev * static_cast<double>(n);
        const T w = (F::one() - x * x) * 2.0 / (d * d);
        weights[i] = w;
        weights[n - 1 - i] = w;
    }

    return {std::move(points), std::move(weights)};
}

template <typename T>
typename LegendreRuleFactory<T>::Values LegendreRuleFactory<T>::evaluate(int degree, const T &x) {
    using F = field::Traits<T>;

    T p_prev = F::one();
    T p = x;
    T dp = F::one();
    for (int k = 1; k < degree; ++k) {
        const T p_next = (p * x * static_cast<double>(2 * k + 1) - p_prev * static_cast<double>(k)) /
                         static_cast<double>(k + 1);
        dp = p * static_cast<double>(k + 1) + dp * x;
        p_prev = p;
        p = p_next;
    }

    return {p_prev, p, dp};
}

}; /* namespace gauss */
