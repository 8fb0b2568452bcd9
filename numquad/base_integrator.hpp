/*
 * Copyright (c) 2025 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <exception>
#include <functional>
#include <utility>

#include "spdlog/spdlog.h"

#include "numquad/errors.hpp"
#include "numquad/field.hpp"
#include "numquad/incrementor.hpp"
#include "numquad/settings.hpp"

namespace integration {

/**
 * @brief State of a single integration run.
 *
 * Holds the integrand, the bounds and two counters: one for iterations (throwing errors::TooManyIterations) and one
 * for integrand evaluations (throwing errors::TooManyEvaluations). Every evaluation goes through value(), which is
 * counted before the integrand is called, so the evaluation counter bounds the actual number of calls.
 *
 * @tparam T Numeric domain.
 */
template <typename T>
class Context {
public:
    using Function = std::function<T(T)>;

    /**
     * @brief Validate the arguments and prepare fresh counters.
     *
     * @param settings Accuracy and iteration bounds of the run.
     * @param max_eval Maximal number of integrand evaluations.
     * @param f        Integrand.
     * @param lower    Lower bound.
     * @param upper    Upper bound.
     *
     * @throws errors::NullIntegrand if f is empty.
     * @throws errors::InvalidInterval if lower >= upper.
     */
    Context(const Settings &settings, int max_eval, Function f, T lower, T upper);

    /**
     * @brief Evaluate the integrand at a point.
     *
     * @throws errors::TooManyEvaluations if the evaluation budget is exhausted.
     */
    T value(const T &x) {
        evaluations_.increment();
        return f_(x);
    }

    /**
     * @brief Shared stopping rule of the iterative methods.
     *
     * @param s    Newest estimate.
     * @param olds Previous estimate.
     *
     * @return True if the two estimates agree within the absolute or the relative accuracy.
     */
    bool converged(const T &s, const T &olds) const;

    const T &lower() const noexcept { return lower_; }

    const T &upper() const noexcept { return upper_; }

    const Settings &settings() const noexcept { return settings_; }

    utils::Incrementor &iterations() noexcept { return iterations_; }

    const utils::Incrementor &iterations() const noexcept { return iterations_; }

    const utils::Incrementor &evaluations() const noexcept { return evaluations_; }

private:
    const Settings &settings_;
    Function f_;
    T lower_;
    T upper_;
    utils::Incrementor iterations_;
    utils::Incrementor evaluations_;
};

/**
 * @brief Base class of iterative univariate integrators.
 *
 * Owns the immutable settings, performs the common checks of an integration run and records the iteration and
 * evaluation counts of the last run. Concrete methods only implement run().
 *
 * An integrator instance must not be used from several threads at once.
 *
 * @tparam T Numeric domain.
 */
template <typename T>
class BaseIntegrator {
public:
    using Function = typename Context<T>::Function;

    virtual ~BaseIntegrator() = default;

    /**
     * @brief Integrate a function over an interval.
     *
     * @param max_eval Maximal number of integrand evaluations.
     * @param f        Integrand.
     * @param lower    Lower bound.
     * @param upper    Upper bound, strictly greater than lower.
     *
     * @return Estimated integral.
     *
     * @throws errors::NullIntegrand if f is empty.
     * @throws errors::InvalidInterval if lower >= upper.
     * @throws errors::TooManyEvaluations if more than max_eval evaluations are needed.
     * @throws errors::TooManyIterations if the estimate does not converge within the maximal iteration count.
     */
    T integrate(int max_eval, const Function &f, const T &lower, const T &upper);

    double relative_accuracy() const noexcept { return settings_.relative_accuracy; }

    double absolute_accuracy() const noexcept { return settings_.absolute_accuracy; }

    int minimal_iteration_count() const noexcept { return settings_.minimal_iteration_count; }

    int maximal_iteration_count() const noexcept { return settings_.maximal_iteration_count; }

    const Settings &settings() const noexcept { return settings_; }

    /**
     * @brief Number of iterations performed by the last run.
     */
    int iterations() const noexcept { return iterations_; }

    /**
     * @brief Number of integrand evaluations performed by the last run.
     */
    int evaluations() const noexcept { return evaluations_; }

protected:
    /**
     * @brief Store and check settings.
     *
     * @throws errors::InvalidIterationBounds if the iteration bounds are inconsistent.
     */
    explicit BaseIntegrator(Settings settings) : settings_(std::move(settings)) { settings_.validate(); }

    /**
     * @brief Refine the estimate until convergence.
     *
     * @param context State of the current run.
     *
     * @return Estimated integral.
     */
    virtual T run(Context<T> &context) const = 0;

private:
    Settings settings_;
    int iterations_ = 0;
    int evaluations_ = 0;
};

template <typename T>
Context<T>::Context(const Settings &settings, int max_eval, Function f, T lower, T upper)
    : settings_(settings),
      f_(std::move(f)),
      lower_(std::move(lower)),
      upper_(std::move(upper)),
      iterations_(settings.maximal_iteration_count, [](int limit) { throw errors::TooManyIterations(limit); }),
      evaluations_(max_eval, [](int limit) { throw errors::TooManyEvaluations(limit); }) {
    if (!f_) {
        throw errors::NullIntegrand();
    }
    if (!(lower_ < upper_)) {
        throw errors::InvalidInterval(field::Traits<T>::real(lower_), field::Traits<T>::real(upper_));
    }
}

template <typename T>
bool Context<T>::converged(const T &s, const T &olds) const {
    using F = field::Traits<T>;

    const double delta = F::real(F::abs(T(s - olds)));
    const double r_limit = F::real(T(F::abs(olds) + F::abs(s))) * 0.5 * settings_.relative_accuracy;
    return delta <= r_limit || delta <= settings_.absolute_accuracy;
}

template <typename T>
T BaseIntegrator<T>::integrate(int max_eval, const Function &f, const T &lower, const T &upper) {
    Context<T> context(settings_, max_eval, f, lower, upper);

    try {
        const T result = run(context);
        iterations_ = context.iterations().count();
        evaluations_ = context.evaluations().count();
        spdlog::debug("Integration converged after {} iterations and {} evaluations", iterations_, evaluations_);
        return result;
    } catch (const std::exception &) {
        iterations_ = context.iterations().count();
        evaluations_ = context.evaluations().count();
        throw;
    }
}

}; /* namespace integration */
