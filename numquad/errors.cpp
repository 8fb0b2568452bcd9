/*
 * Copyright (c) 2025 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <string>
#include <utility>
#include <vector>

#include "spdlog/fmt/fmt.h"

#include "numquad/errors.hpp"

namespace errors {

/**
 * @brief Fetch a context value, tolerating short context vectors.
 */
static double arg(const std::vector<double> &context, std::size_t i) { return i < context.size() ? context[i] : 0.0; }

std::string format_message(Format format, const std::vector<double> &context) {
    switch (format) {
    case Format::number_too_small_bound_excluded:
        return fmt::format("{} is smaller than, or equal to, the minimum ({})", arg(context, 0), arg(context, 1));
    case Format::number_too_large_bound_excluded:
        return fmt::format("{} is larger than, or equal to, the maximum ({})", arg(context, 0), arg(context, 1));
    case Format::number_too_large:
        return fmt::format("{} is larger than the maximum ({})", arg(context, 0), arg(context, 1));
    case Format::number_of_points:
        return fmt::format("number of points ({}) must be positive", arg(context, 0));
    case Format::null_not_allowed:
        return "null is not allowed";
    case Format::endpoints_not_an_interval:
        return fmt::format("endpoints do not specify an interval: [{}, {}]", arg(context, 0), arg(context, 1));
    case Format::dimensions_mismatch:
        return fmt::format("dimension mismatch {} != {}", arg(context, 0), arg(context, 1));
    case Format::not_strictly_increasing_sequence:
        return fmt::format("points {} and {} are not strictly increasing ({} >= {})",
                           arg(context, 0) - 1,
                           arg(context, 0),
                           arg(context, 1),
                           arg(context, 2));
    case Format::max_count_exceeded:
        return fmt::format("maximal count ({}) exceeded", arg(context, 0));
    case Format::max_evaluations_exceeded:
        return fmt::format("maximal count ({}) exceeded: evaluations", arg(context, 0));
    case Format::max_iterations_exceeded:
        return fmt::format("maximal count ({}) exceeded: iterations", arg(context, 0));
    case Format::root_finding_did_not_converge:
        return fmt::format("root finding did not converge within {} iterations", arg(context, 0));
    default:
        return "unknown error";
    }
}

IllegalArgument::IllegalArgument(Format format, std::vector<double> context)
    : std::invalid_argument(format_message(format, context)), format_(format), context_(std::move(context)) {}

IllegalState::IllegalState(Format format, std::vector<double> context)
    : std::runtime_error(format_message(format, context)), format_(format), context_(std::move(context)) {}

InvalidIterationBounds::InvalidIterationBounds(Format format, int value, int bound)
    : IllegalArgument(format, {static_cast<double>(value), static_cast<double>(bound)}) {}

NullIntegrand::NullIntegrand() : IllegalArgument(Format::null_not_allowed, {}) {}

InvalidInterval::InvalidInterval(double lower, double upper)
    : IllegalArgument(Format::endpoints_not_an_interval, {lower, upper}) {}

InvalidOrder::InvalidOrder(int order) : IllegalArgument(Format::number_of_points, {static_cast<double>(order)}) {}

InvalidOrder::InvalidOrder(int order, int max_order)
    : IllegalArgument(Format::number_too_large, {static_cast<double>(order), static_cast<double>(max_order)}) {}

MismatchedDimensions::MismatchedDimensions(std::size_t points, std::size_t weights)
    : IllegalArgument(Format::dimensions_mismatch, {static_cast<double>(points), static_cast<double>(weights)}) {}

NotSorted::NotSorted(std::size_t index, double previous, double current)
    : IllegalArgument(Format::not_strictly_increasing_sequence, {static_cast<double>(index), previous, current}) {}

MaxCountExceeded::MaxCountExceeded(int limit) : MaxCountExceeded(Format::max_count_exceeded, limit) {}

MaxCountExceeded::MaxCountExceeded(Format format, int limit)
    : IllegalState(format, {static_cast<double>(limit)}), limit_(limit) {}

TooManyEvaluations::TooManyEvaluations(int limit) : MaxCountExceeded(Format::max_evaluations_exceeded, limit) {}

TooManyIterations::TooManyIterations(int limit) : MaxCountExceeded(Format::max_iterations_exceeded, limit) {}

RootFindingDidNotConverge::RootFindingDidNotConverge(int limit)
    : MaxCountExceeded(Format::root_finding_did_not_converge, limit) {}

}; /* namespace errors */
