/*
 * Copyright (c) 2025 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace errors {

/**
 * @brief Message keys identifying the kind of failure.
 *
 * Every exception thrown by the library carries one of these keys together with the numeric values the message
 * refers to, so callers can react on the failure kind without parsing the message text.
 */
enum class Format {
    number_too_small_bound_excluded,
    number_too_large_bound_excluded,
    number_too_large,
    number_of_points,
    null_not_allowed,
    endpoints_not_an_interval,
    dimensions_mismatch,
    not_strictly_increasing_sequence,
    max_count_exceeded,
    max_evaluations_exceeded,
    max_iterations_exceeded,
    root_finding_did_not_converge,
};

/**
 * @brief Build the human readable message for a key and its context values.
 *
 * @param format  Message key.
 * @param context Values referenced by the message, in the order the message uses them.
 *
 * @return Formatted message.
 */
std::string format_message(Format format, const std::vector<double> &context);

/**
 * @brief Base class of all configuration errors (bad arguments detected before any work is done).
 */
class IllegalArgument : public std::invalid_argument {
public:
    IllegalArgument(Format format, std::vector<double> context);

    /**
     * @brief Message key of the failure.
     */
    Format format() const noexcept { return format_; }

    /**
     * @brief Numeric context of the failure (offending value first, then the bound it violates).
     */
    const std::vector<double> &context() const noexcept { return context_; }

private:
    Format format_;
    std::vector<double> context_;
};

/**
 * @brief Base class of all errors detected while a computation is running.
 */
class IllegalState : public std::runtime_error {
public:
    IllegalState(Format format, std::vector<double> context);

    Format format() const noexcept { return format_; }

    const std::vector<double> &context() const noexcept { return context_; }

private:
    Format format_;
    std::vector<double> context_;
};

/**
 * @brief Minimal or maximal iteration counts are inconsistent.
 */
class InvalidIterationBounds : public IllegalArgument {
public:
    /**
     * @param format Either number_too_small_bound_excluded or number_too_large_bound_excluded.
     * @param value  Offending count.
     * @param bound  Bound the count violates.
     */
    InvalidIterationBounds(Format format, int value, int bound);
};

/**
 * @brief No integrand was supplied.
 */
class NullIntegrand : public IllegalArgument {
public:
    NullIntegrand();
};

/**
 * @brief Integration bounds do not describe a non-empty interval.
 */
class InvalidInterval : public IllegalArgument {
public:
    InvalidInterval(double lower, double upper);
};

/**
 * @brief Quadrature order (number of points) outside of the supported range.
 */
class InvalidOrder : public IllegalArgument {
public:
    /**
     * @brief Order is not strictly positive.
     */
    explicit InvalidOrder(int order);

    /**
     * @brief Order is larger than the supported maximum.
     */
    InvalidOrder(int order, int max_order);
};

/**
 * @brief Nodes and weights arrays differ in length.
 */
class MismatchedDimensions : public IllegalArgument {
public:
    MismatchedDimensions(std::size_t points, std::size_t weights);
};

/**
 * @brief Nodes are not strictly increasing.
 */
class NotSorted : public IllegalArgument {
public:
    /**
     * @param index    Index of the first node that breaks the ordering.
     * @param previous Node before it.
     * @param current  Offending node.
     */
    NotSorted(std::size_t index, double previous, double current);
};

/**
 * @brief A bounded counter was asked to go past its maximal count.
 */
class MaxCountExceeded : public IllegalState {
public:
    explicit MaxCountExceeded(int limit);

    /**
     * @brief Maximal count that was exceeded.
     */
    int limit() const noexcept { return limit_; }

protected:
    MaxCountExceeded(Format format, int limit);

private:
    int limit_;
};

/**
 * @brief Integrand evaluation budget exhausted.
 */
class TooManyEvaluations : public MaxCountExceeded {
public:
    explicit TooManyEvaluations(int limit);
};

/**
 * @brief Iteration budget exhausted before the convergence test succeeded.
 */
class TooManyIterations : public MaxCountExceeded {
public:
    explicit TooManyIterations(int limit);
};

/**
 * @brief Aberth iteration did not settle within its iteration budget.
 */
class RootFindingDidNotConverge : public MaxCountExceeded {
public:
    explicit RootFindingDidNotConverge(int limit);
};

}; /* namespace errors */
