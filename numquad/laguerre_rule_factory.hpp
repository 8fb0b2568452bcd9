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
 * @brief Gauss-Laguerre rules, integrating f(x) exp(-x) over [0, +inf).
 *
 * Nodes are the roots of the Laguerre polynomial L_n, all positive. With x a node, the weight is
 * x / ((n + 1) L_{n+1}(x))^2. The rule is not symmetric.
 *
 * The largest nodes grow like 4n, so the recurrence is rescaled as it goes and the weights of the outermost nodes
 * underflow to zero for large orders.
 *
 * @tparam T Numeric domain of nodes and weights.
 */
template <typename T>
class LaguerreRuleFactory : public RuleFactory<T> {
public:
    LaguerreRuleFactory() = default;

protected:
    using typename RuleFactory<T>::Evaluation;

    Rule<T> compute_rule(int number_of_points) override;

private:
    /**
     * @brief L_n and L_n' at one point, both divided by rescale_threshold^scale.
     */
    struct Values {
        T l;
        T dl;
        int scale;
    };

    /**
     * @brief Evaluate the Laguerre polynomial of the given degree and its derivative.
     *
     * Uses (k + 1) L_{k+1}(x) = (2k + 1 - x) L_k(x) - k L_{k-1}(x) and L_{k+1}'(x) = L_k'(x) - L_k(x).
     */
    static Values evaluate(int degree, const T &x);
};

template <typename T>
Rule<T> LaguerreRuleFactory<T>::compute_rule(int number_of_points) {
    using F = field::Traits<T>;

    if (number_of_points == 1) {
        return {{F::one()}, {F::one()}};
    }

    spdlog::debug("Computing Laguerre rule with {} points", number_of_points);

    const int n = number_of_points;
    std::vector<T> points = this->find_roots(n, [n](const T &x) -> Evaluation {
        const Values v = evaluate(n, x);
        return {v.l, v.dl};
    });

    std::vector<T> weights(n, F::zero());
    for (int i = 0; i < n; ++i) {
        const T &x = points[i];
        const Values v = evaluate(n + 1, x);
        const T d = v.l * static_cast<double>(n + 1);
        T w = x / (d * d);
        for (int k = 0; k < v.scale; ++k) {
            w = w * (RuleFactory<T>::rescale_factor * RuleFactory<T>::rescale_factor);
        }
        weights[i] = w;
    }

    return {std::move(points), std::move(weights)};
}

template <typename T>
typename LaguerreRuleFactory<T>::Values LaguerreRuleFactory<T>::evaluate(int degree, const T &x) {
    using F = field::Traits<T>;

    T l_prev = F::one();
    T l = F::one() - x;
    T dl = -F::one();
    constexpr double threshold = RuleFactory<T>::rescale_threshold;
    constexpr double factor = RuleFactory<T>::rescale_factor;
    int scale = 0;
    for (int k = 1; k < degree; ++k) {
        const T l_next = (l * (static_cast<double>(2 * k + 1) - x) - l_prev * static_cast<double>(k)) /
                         static_cast<double>(k + 1);
        const T dl_next = dl - l;
        l_prev = l;
        l = l_next;
        dl = dl_next;
        if (F::real(F::abs(l)) > threshold || F::real(F::abs(dl)) > threshold) {
            l_prev = l_prev * factor;
            l = l * factor;
            dl = dl * factor;
            ++scale;
        }
    }

    return {l, dl, scale};
}

}; /* namespace gauss */
