/*
 * Copyright (c) 2025 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <limits>

namespace integration {

/**
 * @brief Default relative accuracy.
 */
inline constexpr double default_relative_accuracy = 1.0e-6;

/**
 * @brief Default absolute accuracy.
 */
inline constexpr double default_absolute_accuracy = 1.0e-15;

/**
 * @brief Default minimal number of iterations.
 */
inline constexpr int default_min_iterations_count = 3;

/**
 * @brief Default maximal number of iterations.
 */
inline constexpr int default_max_iterations_count = std::numeric_limits<int>::max();

/**
 * @brief Accuracy and iteration bounds of an iterative integrator.
 *
 * The integration stops as soon as, after at least minimal_iteration_count iterations, two consecutive estimates are
 * closer than absolute_accuracy or than relative_accuracy times their mean magnitude.
 */
struct Settings {
    double relative_accuracy = default_relative_accuracy;
    double absolute_accuracy = default_absolute_accuracy;
    int minimal_iteration_count = default_min_iterations_count;
    int maximal_iteration_count = default_max_iterations_count;

    /**
     * @brief Check iteration bounds.
     *
     * @throws errors::InvalidIterationBounds if minimal_iteration_count <= 0 or
     *         maximal_iteration_count <= minimal_iteration_count.
     */
    void validate() const;

    /**
     * @brief Check iteration bounds against a method specific cap.
     *
     * @param max_iterations_cap Largest maximal_iteration_count the method supports.
     *
     * @throws errors::InvalidIterationBounds if the bounds are inconsistent or maximal_iteration_count exceeds the cap.
     */
    void validate(int max_iterations_cap) const;
};

/**
 * @brief Settings with the given accuracies and default iteration bounds.
 */
Settings make_settings(double relative_accuracy, double absolute_accuracy);

/**
 * @brief Settings with default accuracies and the given iteration bounds.
 */
Settings make_settings(int minimal_iteration_count, int maximal_iteration_count);

/**
 * @brief Settings with all four values given.
 */
Settings make_settings(double relative_accuracy,
                       double absolute_accuracy,
                       int minimal_iteration_count,
                       int maximal_iteration_count);

}; /* namespace integration */
