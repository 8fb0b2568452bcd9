/*
 * Copyright (c) 2025 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <cmath>
#include <memory>
#include <numbers>
#include <stdexcept>
#include <utility>

#include "absl/flags/flag.h"
#include "absl/flags/parse.h"
#include "spdlog/spdlog.h"

#include "numquad/base_integrator.hpp"
#include "numquad/errors.hpp"
#include "numquad/flags.hpp"
#include "numquad/iterative_legendre_gauss_integrator.hpp"
#include "numquad/midpoint_integrator.hpp"
#include "numquad/romberg_integrator.hpp"
#include "numquad/settings.hpp"
#include "numquad/simpson_integrator.hpp"
#include "numquad/trapezoid_integrator.hpp"

/* Define cli args */
ABSL_FLAG(cli::Method, method, cli::Method::romberg, "Integration method");
ABSL_FLAG(cli::Integrand, function, cli::Integrand::sin, "Integrand");
ABSL_FLAG(double, lower, 0.0, "Lower bound");
ABSL_FLAG(double, upper, std::numbers::pi, "Upper bound");
ABSL_FLAG(int, max_eval, 1000000, "Maximal number of integrand evaluations");
ABSL_FLAG(double, relative_accuracy, integration::default_relative_accuracy, "Relative accuracy");
ABSL_FLAG(double, absolute_accuracy, integration::default_absolute_accuracy, "Absolute accuracy");
ABSL_FLAG(int, min_iterations, integration::default_min_iterations_count, "Minimal number of iterations");
ABSL_FLAG(int, max_iterations, 0, "Maximal number of iterations (0 for the method default)");
ABSL_FLAG(int, points, 5, "Gauss-Legendre order of the legendre_gauss method");
ABSL_FLAG(spdlog::level::level_enum, verbosity, spdlog::level::info, "Logging verbosity");

namespace {

using Function = integration::BaseIntegrator<double>::Function;

/**
 * @brief Integrand and its primitive.
 */
std::pair<Function, Function> make_integrand(cli::Integrand integrand) {
    switch (integrand) {
    case cli::Integrand::sin:
        return {[](double x) { return std::sin(x); }, [](double x) { return -std::cos(x); }};
    case cli::Integrand::square:
        return {[](double x) { return x * x; }, [](double x) { return x * x * x / 3.0; }};
    case cli::Integrand::inverse_quadratic:
        return {[](double x) { return 1.0 / (1.0 + x * x); }, [](double x) { return std::atan(x); }};
    case cli::Integrand::exp:
        return {[](double x) { return std::exp(x); }, [](double x) { return std::exp(x); }};
    default:
        throw std::invalid_argument("unknown integrand");
    }
}

std::unique_ptr<integration::BaseIntegrator<double>> make_integrator(cli::Method method,
                                                                      integration::Settings settings,
                                                                      int points) {
    switch (method) {
    case cli::Method::romberg:
        if (settings.maximal_iteration_count <= 0) {
            settings.maximal_iteration_count = integration::romberg_max_iterations_count;
        }
        return std::make_unique<integration::RombergIntegrator<double>>(settings);
    case cli::Method::midpoint:
        if (settings.maximal_iteration_count <= 0) {
            settings.maximal_iteration_count = integration::midpoint_max_iterations_count;
        }
        return std::make_unique<integration::MidPointIntegrator<double>>(settings);
    case cli::Method::trapezoid:
        if (settings.maximal_iteration_count <= 0) {
            settings.maximal_iteration_count = integration::trapezoid_max_iterations_count;
        }
        return std::make_unique<integration::TrapezoidIntegrator<double>>(settings);
    case cli::Method::simpson:
        if (settings.maximal_iteration_count <= 0) {
            settings.maximal_iteration_count = integration::trapezoid_max_iterations_count;
        }
        return std::make_unique<integration::SimpsonIntegrator<double>>(settings);
    case cli::Method::legendre_gauss:
        if (settings.maximal_iteration_count <= 0) {
            settings.maximal_iteration_count = integration::default_max_iterations_count;
        }
        return std::make_unique<integration::IterativeLegendreGaussIntegrator<double>>(points, settings);
    default:
        throw std::invalid_argument("unknown method");
    }
}

}; /* namespace */

int main(int argc, char *argv[]) {
    absl::ParseCommandLine(argc, argv);

    auto method = absl::GetFlag(FLAGS_method);
    auto function = absl::GetFlag(FLAGS_function);
    auto lower = absl::GetFlag(FLAGS_lower);
    auto upper = absl::GetFlag(FLAGS_upper);
    auto max_eval = absl::GetFlag(FLAGS_max_eval);
    auto points = absl::GetFlag(FLAGS_points);
    auto verbosity = absl::GetFlag(FLAGS_verbosity);

    integration::Settings settings;
    settings.relative_accuracy = absl::GetFlag(FLAGS_relative_accuracy);
    settings.absolute_accuracy = absl::GetFlag(FLAGS_absolute_accuracy);
    settings.minimal_iteration_count = absl::GetFlag(FLAGS_min_iterations);
    settings.maximal_iteration_count = absl::GetFlag(FLAGS_max_iterations);

    spdlog::set_level(verbosity);

    spdlog::info("Parameters:");
    spdlog::info("\tmethod: {}", cli::AbslUnparseFlag(method));
    spdlog::info("\tfunction: {}", cli::AbslUnparseFlag(function));
    spdlog::info("\tinterval: [{}, {}]", lower, upper);
    spdlog::info("\tmax_eval: {}", max_eval);
    spdlog::info("\trelative_accuracy: {}", settings.relative_accuracy);
    spdlog::info("\tabsolute_accuracy: {}", settings.absolute_accuracy);

    try {
        auto [f, primitive] = make_integrand(function);
        auto integrator = make_integrator(method, settings, points);

        const double result = integrator->integrate(max_eval, f, lower, upper);
        const double expected = primitive(upper) - primitive(lower);

        spdlog::info("Result: {:.17g}", result);
        spdlog::info("\texpected: {:.17g}", expected);
        spdlog::info("\terror: {:.3e}", std::abs(result - expected));
        spdlog::info("\titerations: {}", integrator->iterations());
        spdlog::info("\tevaluations: {}", integrator->evaluations());
    } catch (const errors::MaxCountExceeded &e) {
        spdlog::error("Integration did not converge: {}", e.what());
        return 2;
    } catch (const std::invalid_argument &e) {
        spdlog::error("Invalid parameters: {}", e.what());
        return 1;
    }

    return 0;
}
