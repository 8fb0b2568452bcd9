/*
 * Copyright (c) 2025 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "numquad/settings.hpp"
#include "numquad/errors.hpp"

namespace integration {

void Settings::validate() const {
    if (minimal_iteration_count <= 0) {
        throw errors::InvalidIterationBounds(
            errors::Format::number_too_small_bound_excluded, minimal_iteration_count, 0);
    }
    if (maximal_iteration_count <= minimal_iteration_count) {
        throw errors::InvalidIterationBounds(
            errors::Format::number_too_small_bound_excluded, maximal_iteration_count, minimal_iteration_count);
    }
}

void Settings::validate(int max_iterations_cap) const {
    validate();
    if (maximal_iteration_count > max_iterations_cap) {
        throw errors::InvalidIterationBounds(
            errors::Format::number_too_large_bound_excluded, maximal_iteration_count, max_iterations_cap);
    }
}

Settings make_settings(double relative_accuracy, double absolute_accuracy) {
    Settings settings;
    settings.relative_accuracy = relative_accuracy;
    settings.absolute_accuracy = absolute_accuracy;
    return settings;
}

Settings make_settings(int minimal_iteration_count, int maximal_iteration_count) {
    Settings settings;
    settings.minimal_iteration_count = minimal_iteration_count;
    settings.maximal_iteration_count = maximal_iteration_count;
    return settings;
}

Settings make_settings(double relative_accuracy,
                       double absolute_accuracy,
                       int minimal_iteration_count,
                       int maximal_iteration_count) {
    return {relative_accuracy, absolute_accuracy, minimal_iteration_count, maximal_iteration_count};
}

}; /* namespace integration */
