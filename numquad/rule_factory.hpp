/*
 * Copyright (c) 2025 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <algorithm>
#include <functional>
#include <limits>
#include <map>
#include <mutex>
#include <utility>
#include <vector>

#include "spdlog/spdlog.h"

#include "numquad/errors.hpp"
#include "numquad/field.hpp"
#include "numquad/incrementor.hpp"
#include "numquad/rule.hpp"

namespace gauss {

/**
 * @brief Base class of factories computing Gauss quadrature rules of a given order.
 *
 * Rules are computed once per order and cached for the lifetime of the factory. The cache is guarded by a recursive
 * mutex: computing the rule of order n typically needs the rule of order n - 1 (see find_roots), which re-enters
 * get_rule on the same thread while the lock is held. Orders strictly decrease along that recursion, so it always
 * terminates.
 *
 * get_rule may be called concurrently from several threads on the same factory.
 *
 * @tparam T Numeric domain of nodes and weights.
 */
template <typename T>
class RuleFactory {
public:
    /**
     * @brief Largest supported order.
     */
    static constexpr int max_order = 1000;

    /**
     * @brief Maximal number of Aberth iterations before giving up.
     */
    static constexpr int max_root_iterations = 1000;

    /**
     * @brief Magnitude above which polynomial recurrences are rescaled by rescale_factor.
     */
    static constexpr double rescale_threshold = 1.0e100;

    static constexpr double rescale_factor = 1.0e-100;

    /**
     * @brief Largest correction, in ulps of the largest root, accepted when the Aberth iteration stops improving.
     */
    static constexpr double stagnation_ulps = 16.0;

    /**
     * @brief Value of a polynomial and of its derivative at one point.
     *
     * Both may carry the same arbitrary positive scale factor, only their ratio is used.
     */
    struct Evaluation {
        T value;
        T derivative;
    };

    /**
     * @brief Evaluates P(x) and P'(x) of an orthogonal polynomial.
     */
    using PolynomialFunction = std::function<Evaluation(const T &)>;

    virtual ~RuleFactory() = default;

    RuleFactory(const RuleFactory &) = delete;

    RuleFactory &operator=(const RuleFactory &) = delete;

    /**
     * @brief Get the rule of the given order.
     *
     * The returned rule is a copy: modifying it does not affect the cache.
     *
     * @param number_of_points Order of the rule.
     *
     * @return Nodes (sorted in increasing order) and weights.
     *
     * @throws errors::InvalidOrder if number_of_points is not in [1, max_order].
     * @throws errors::RootFindingDidNotConverge if the nodes cannot be computed.
     */
    Rule<T> get_rule(int number_of_points);

    /**
     * @brief Number of rules currently cached.
     */
    std::size_t cached_rules() const;

protected:
    RuleFactory() = default;

    /**
     * @brief Compute the rule of the given order.
     *
     * Called with the cache lock held, at most once per order.
     *
     * @param number_of_points Order of the rule, in [1, max_order].
     *
     * @return Computed rule.
     */
    virtual Rule<T> compute_rule(int number_of_points) = 0;

    /**
     * @brief Compute all roots of a polynomial of degree n at once with the Aberth method.
     *
     * Initial guesses are 0 for n = 1 and -1, +1 for n = 2. For larger n they come from the nodes of the rule of order
     * n - 1 (computed first if needed): its two extreme nodes plus the n - 2 midpoints between consecutive nodes.
     *
     * Each sweep moves root i by P / (P' - P sum_{j != i} 1 / (x_i - x_j)), using the already moved roots j < i. The
     * iteration stops when the largest correction is no more than one ulp of the largest root, or when it stops
     * decreasing while below stagnation_ulps ulps (rounding noise).
     *
     * @param n          Number of roots.
     * @param polynomial Function evaluating P(x) and P'(x).
     *
     * @return Roots in increasing order.
     *
     * @throws errors::RootFindingDidNotConverge after max_root_iterations iterations, or if a correction is not finite.
     */
    std::vector<T> find_roots(int n, const PolynomialFunction &polynomial);

    /**
     * @brief Make roots of an even or odd polynomial exactly symmetric about zero.
     *
     * @param roots Sorted roots, modified in place.
     */
    static void enforce_symmetry(std::vector<T> &roots);

private:
    std::map<int, Rule<T>> rules_;

    mutable std::recursive_mutex m_;
};

template <typename T>
Rule<T> RuleFactory<T>::get_rule(int number_of_points) {
    if (number_of_points <= 0) {
        throw errors::InvalidOrder(number_of_points);
    }
    if (number_of_points > max_order) {
        throw errors::InvalidOrder(number_of_points, max_order);
    }

    std::lock_guard<std::recursive_mutex> lock(m_);

    auto it = rules_.find(number_of_points);
    if (it == rules_.end()) {
        Rule<T> rule = compute_rule(number_of_points);
        it = rules_.emplace(number_of_points, std::move(rule)).first;
    }

    return it->second;
}

template <typename T>
std::size_t RuleFactory<T>::cached_rules() const {
    std::lock_guard<std::recursive_mutex> lock(m_);
    return rules_.size();
}

template <typename T>
std::vector<T> RuleFactory<T>::find_roots(int n, const PolynomialFunction &polynomial) {
    using F = field::Traits<T>;

    std::vector<T> roots(n, F::zero());

    if (n == 1) {
        roots[0] = F::zero();
    } else if (n == 2) {
        roots[0] = -F::one();
        roots[1] = F::one();
    } else {
        /* may recursively compute all lower orders */
        const std::vector<T> previous = get_rule(n - 1).points;

        roots[0] = previous[0];
        for (int i = 1; i < n - 1; ++i) {
            roots[i] = (previous[i - 1] + previous[i]) * 0.5;
        }
        roots[n - 1] = previous[n - 2];
    }

    utils::Incrementor incrementor(max_root_iterations,
                                   [](int limit) { throw errors::RootFindingDidNotConverge(limit); });

    std::vector<Evaluation> values;
    values.reserve(n);
    double last_max_offset = std::numeric_limits<double>::infinity();
    while (true) {
        incrementor.increment();

        values.clear();
        for (int i = 0; i < n; ++i) {
            values.push_back(polynomial(roots[i]));
        }

        T max_offset = F::zero();
        for (int i = 0; i < n; ++i) {
            T sum = F::zero();
            for (int j = 0; j < n; ++j) {
                if (j != i) {
                    sum = sum + F::one() / (roots[i] - roots[j]);
                }
            }
            const Evaluation &v = values[i];
            const T offset = v.value / (v.derivative - v.value * sum);
            if (!F::is_finite(offset)) {
                throw errors::RootFindingDidNotConverge(incrementor.count());
            }
            const T abs_offset = F::abs(offset);
            if (abs_offset > max_offset) {
                max_offset = abs_offset;
            }
            roots[i] = roots[i] - offset;
        }

        T tol = F::zero();
        for (const T &r : roots) {
            const T u = F::ulp(r);
            if (u > tol) {
                tol = u;
            }
        }

        if (max_offset <= tol) {
            break;
        }
        const double largest = F::real(max_offset);
        if (largest >= last_max_offset && largest <= stagnation_ulps * F::real(tol)) {
            break;
        }
        last_max_offset = largest;
    }

    spdlog::trace("Found {} roots in {} Aberth iterations", n, incrementor.count());

    std::sort(roots.begin(), roots.end());

    return roots;
}

template <typename T>
void RuleFactory<T>::enforce_symmetry(std::vector<T> &roots) {
    const int n = static_cast<int>(roots.size());

    for (int i = 0; i < n / 2; ++i) {
        const int idx = n - i - 1;
        const T c = (roots[i] - roots[idx]) * 0.5;
        roots[i] = c;
        roots[idx] = -c;
    }

    if (n % 2 != 0) {
        roots[n / 2] = field::Traits<T>::zero();
    }
}

}; /* namespace gauss */
