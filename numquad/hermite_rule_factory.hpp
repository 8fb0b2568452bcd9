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
 * @brief Gauss-Hermite rules, integrating f(x) exp(-x^2) over the whole real line.
 *
 * The coefficients of the physicists' Hermite polynomials grow very fast, so the polynomials are normalized with
 * respect to their scalar product:
 *
 *   H_0(x) = pi^(-1/4), H_1(x) = sqrt(2) pi^(-1/4) x,
 *   H_{j+1}(x) = x sqrt(2 / (j + 1)) H_j(x) - sqrt(j / (j + 1)) H_{j-1}(x),
 *
 * for which H_n'(x) = sqrt(2n) H_{n-1}(x). With x a node, the weight is 2 / (sqrt(2n) H_{n-1}(x))^2.
 *
 * Away from the origin the normalized polynomials still grow like exp(x^2 / 2), so the recurrence is rescaled as it
 * goes and the weights of the outermost nodes may underflow to zero for large orders.
 *
 * @tparam T Numeric domain of nodes and weights.
 */
template <typename T>
class HermiteRuleFactory : public RuleFactory<T> {
public:
    HermiteRuleFactory();

protected:
    using typename RuleFactory<T>::Evaluation;

    Rule<T> compute_rule(int number_of_points) override;

private:
    /**
     * @brief Values of H_{n-1} and H_n at one point, both divided by rescale_threshold^scale.
     */
    struct Values {
        T h_prev;
        T h;
        int scale;
    };

    /**
     * @brief Evaluate the normalized Hermite polynomials of degree n - 1 and n.
     *
     * @param degree Polynomial degree n, at least 1.
     * @param x      Evaluation point.
     */
    Values evaluate(int degree, const T &x) const;

    /**
     * @brief pi^(1/2).
     */
    T sqrt_pi_;

    /**
     * @brief pi^(-1/4), value of H_0.
     */
    T h_0_;

    /**
     * @brief sqrt(2) pi^(-1/4), leading coefficient of H_1.
     */
    T h_1_;
};

template <typename T>
HermiteRuleFactory<T>::HermiteRuleFactory() {
    using F = field::Traits<T>;
    sqrt_pi_ = F::sqrt(F::pi());
    h_0_ = F::one() / F::sqrt(sqrt_pi_);
    h_1_ = h_0_ * F::sqrt(T(2.0));
}

template <typename T>
Rule<T> HermiteRuleFactory<T>::compute_rule(int number_of_points) {
    using F = field::Traits<T>;

    if (number_of_points == 1) {
        return {{F::zero()}, {sqrt_pi_}};
    }

    spdlog::debug("Computing Hermite rule with {} points", number_of_points);

    const int n = number_of_points;
    const T sqrt_two_n = F::sqrt(T(2.0 * n));

    std::vector<T> points = this->find_roots(n, [this, n, &sqrt_two_n](const T &x) -> Evaluation {
        const Values v = evaluate(n, x);
        return {v.h, T(sqrt_two_n * v.h_prev)};
    });
    this->enforce_symmetry(points);

    std::vector<T> weights(n, F::zero());
    const int limit = (n + 1) / 2;
    for (int i = 0; i < limit; ++i) {
        const Values v = evaluate(n, points[i]);
        const T d = sqrt_two_n * v.h_prev;
        T w = T(2.0) / (d * d);
        for (int k = 0; k < v.scale; ++k) {
            w = w * (this->rescale_factor * this->rescale_factor);
        }
        weights[i] = w;
        weights[n - 1 - i] = w;
    }

    return {std::move(points), std::move(weights)};
}

template <typename T>
typename HermiteRuleFactory<T>::Values HermiteRuleFactory<T>::evaluate(int degree, const T &x) const {
    using F = field::Traits<T>;

    T h_prev = h_0_;
    T h = h_1_ * x;
    int scale = 0;
    for (int j = 1; j < degree; ++j) {
        const T jp1 = T(static_cast<double>(j + 1));
        const T h_next = x * h * F::sqrt(T(2.0) / jp1) - h_prev * F::sqrt(T(static_cast<double>(j)) / jp1);
        h_prev = h;
        h = h_next;
        if (F::real(F::abs(h)) > this->rescale_threshold) {
            h = h * this->rescale_factor;
            h_prev = h_prev * this->rescale_factor;
            ++scale;
        }
    }

    return {h_prev, h, scale};
}

}; /* namespace gauss */
