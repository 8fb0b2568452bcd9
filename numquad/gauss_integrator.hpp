/*
 * Copyright (c) 2025 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>
#include <utility>
#include <vector>

#include "numquad/errors.hpp"
#include "numquad/field.hpp"
#include "numquad/rule.hpp"

namespace gauss {

/**
 * @brief Weighted sum of function values at fixed nodes.
 *
 * The integral is approximated by sum(w_i * f(x_i)). The sum is accumulated with Kahan compensation, which keeps the
 * rounding error independent of the number of nodes. Which integral is approximated (interval, weight function)
 * depends only on the rule the integrator is built from.
 *
 * @tparam T Numeric domain.
 */
template <typename T>
class GaussIntegrator {
public:
    using Function = std::function<T(T)>;

    /**
     * @brief Build an integrator from nodes and weights.
     *
     * @param points  Integration nodes, strictly increasing.
     * @param weights Weights of the nodes.
     *
     * @throws errors::MismatchedDimensions if the arrays differ in length.
     * @throws errors::NotSorted if the nodes are not strictly increasing.
     */
    GaussIntegrator(std::vector<T> points, std::vector<T> weights);

    /**
     * @brief Build an integrator from a rule.
     *
     * @param rule Nodes and weights.
     *
     * @throws errors::MismatchedDimensions if the arrays differ in length.
     * @throws errors::NotSorted if the nodes are not strictly increasing.
     */
    explicit GaussIntegrator(Rule<T> rule) : GaussIntegrator(std::move(rule.points), std::move(rule.weights)) {}

    virtual ~GaussIntegrator() = default;

    /**
     * @brief Integrate a function with the stored rule.
     *
     * @param f Function to integrate.
     *
     * @return Approximated integral.
     */
    virtual T integrate(const Function &f) const;

    int number_of_points() const noexcept { return static_cast<int>(points_.size()); }

    const T &point(int index) const { return points_.at(index); }

    const T &weight(int index) const { return weights_.at(index); }

protected:
    std::vector<T> points_;
    std::vector<T> weights_;
};

/**
 * @brief Gauss integrator specialized for rules symmetric about zero.
 *
 * Nodes are evaluated pairwise, f(x_i) + f(-x_i), which halves the number of multiplications by weights and keeps
 * odd integrands exactly cancelled. Intended for Gauss-Hermite rules.
 *
 * @tparam T Numeric domain.
 */
template <typename T>
class SymmetricGaussIntegrator : public GaussIntegrator<T> {
public:
    using typename GaussIntegrator<T>::Function;

    SymmetricGaussIntegrator(std::vector<T> points, std::vector<T> weights)
        : GaussIntegrator<T>(std::move(points), std::move(weights)) {}

    explicit SymmetricGaussIntegrator(Rule<T> rule) : GaussIntegrator<T>(std::move(rule)) {}

    T integrate(const Function &f) const override;
};

template <typename T>
GaussIntegrator<T>::GaussIntegrator(std::vector<T> points, std::vector<T> weights)
    : points_(std::move(points)), weights_(std::move(weights)) {
    if (points_.size() != weights_.size()) {
        throw errors::MismatchedDimensions(points_.size(), weights_.size());
    }
    for (std::size_t i = 1; i < points_.size(); ++i) {
        if (points_[i - 1] >= points_[i]) {
            throw errors::NotSorted(
                i, field::Traits<T>::real(points_[i - 1]), field::Traits<T>::real(points_[i]));
        }
    }
}

template <typename T>
T GaussIntegrator<T>::integrate(const Function &f) const {
    T s = field::Traits<T>::zero();
    T c = field::Traits<T>::zero();
    for (std::size_t i = 0; i < points_.size(); ++i) {
        const T y = weights_[i] * f(points_[i]) - c;
        const T t = s + y;
        c = (t - s) - y;
        s = t;
    }
    return s;
}

template <typename T>
T SymmetricGaussIntegrator<T>::integrate(const Function &f) const {
    const int n = this->number_of_points();
    if (n == 1) {
        return this->weights_[0] * f(field::Traits<T>::zero());
    }

    const int i_max = n / 2;
    T s = field::Traits<T>::zero();
    T c = field::Traits<T>::zero();
    for (int i = 0; i < i_max; ++i) {
        const T p = this->points_[i];
        const T f_1 = f(p);
        const T f_2 = f(-p);
        const T y = this->weights_[i] * (f_1 + f_2) - c;
        const T t = s + y;
        c = (t - s) - y;
        s = t;
    }

    if (n % 2 != 0) {
        const T y = this->weights_[i_max] * f(field::Traits<T>::zero()) - c;
        s = s + y;
    }

    return s;
}

}; /* namespace gauss */
