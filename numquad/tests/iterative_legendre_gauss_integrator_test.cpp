/*
 * Copyright (c) 2025 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "numquad/iterative_legendre_gauss_integrator.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <memory>
#include <numbers>
#include <random>
#include <vector>

#include <boost/multiprecision/cpp_bin_float.hpp>

#include "numquad/errors.hpp"
#include "numquad/field.hpp"
#include "numquad/gauss_integrator_factory.hpp"

using boost::multiprecision::cpp_bin_float_50;

namespace {

/**
 * @brief Exact integral of a polynomial given by its coefficients (lowest degree first).
 */
double exact_integration(const std::vector<double> &coeffs, double a, double b) {
    double yb = coeffs.back() / static_cast<double>(coeffs.size());
    double ya = yb;
    for (int i = static_cast<int>(coeffs.size()) - 2; i >= 0; --i) {
        yb = yb * b + coeffs[i] / (i + 1);
        ya = ya * a + coeffs[i] / (i + 1);
    }
    return yb * b - ya * a;
}

double evaluate(const std::vector<double> &coeffs, double x) {
    double y = 0;
    for (auto it = coeffs.rbegin(); it != coeffs.rend(); ++it) {
        y = y * x + *it;
    }
    return y;
}

}; /* namespace */

/**
 * Tests that a constant is integrated exactly by the first stage.
 */
TEST(IterativeLegendreGaussIntegrator, Constant) {
    integration::IterativeLegendreGaussIntegrator<double> integrator(5, 1, 10);

    const double result = integrator.integrate(1000, [](double x) { return 3.0; }, 1.0, 4.0);

    ASSERT_NEAR(9.0, result, 1.0e-14);
    ASSERT_EQ(0, integrator.iterations());
    /* stage 1 and stage 2 */
    ASSERT_EQ(15, integrator.evaluations());
}

/**
 * Tests the integral of sin over [0, pi] and [-pi/3, 0].
 */
TEST(IterativeLegendreGaussIntegrator, Sin) {
    integration::IterativeLegendreGaussIntegrator<double> integrator(5, 1.0e-14, 1.0e-10, 2, 15);
    auto f = [](double x) { return std::sin(x); };

    double expected = 2.0;
    double tolerance = std::max(integrator.absolute_accuracy(), std::abs(expected * integrator.relative_accuracy()));
    double result = integrator.integrate(10000, f, 0.0, std::numbers::pi);
    ASSERT_NEAR(expected, result, tolerance);

    expected = -0.5;
    tolerance = std::max(integrator.absolute_accuracy(), std::abs(expected * integrator.relative_accuracy()));
    result = integrator.integrate(10000, f, -std::numbers::pi / 3.0, 0.0);
    ASSERT_NEAR(expected, result, tolerance);
}

/**
 * Tests that n point rules integrate random polynomials of degree up to 2n - 1 exactly.
 */
TEST(IterativeLegendreGaussIntegrator, ExactIntegration) {
    std::mt19937 generator(86343623);
    std::uniform_real_distribution<double> distribution(-1.0, 1.0);

    for (int n = 2; n < 6; ++n) {
        integration::IterativeLegendreGaussIntegrator<double> integrator(
            n,
            integration::default_relative_accuracy,
            integration::default_absolute_accuracy,
            integration::default_min_iterations_count,
            64);

        for (int degree = 0; degree <= 2 * n - 1; ++degree) {
            for (int i = 0; i < 10; ++i) {
                std::vector<double> coeffs(degree + 1);
                for (auto &c : coeffs) {
                    c = distribution(generator);
                }

                const double result =
                    integrator.integrate(10000, [&coeffs](double x) { return evaluate(coeffs, x); }, -5.0, 15.0);
                const double reference = exact_integration(coeffs, -5.0, 15.0);

                ASSERT_NEAR(reference, result, 1.0e-12 * (1.0 + std::abs(reference))) << n << " " << degree << " " << i;
            }
        }
    }
}

/**
 * Tests a wide normal density with a loose accuracy and a small budget.
 */
TEST(IterativeLegendreGaussIntegrator, NormalDistributionWithLargeSigma) {
    const double sigma = 1000;
    const double factor = 1 / (sigma * std::sqrt(2 * std::numbers::pi));
    auto normal = [factor, sigma](double x) { return factor * std::exp(-0.5 * (x / sigma) * (x / sigma)); };

    integration::IterativeLegendreGaussIntegrator<double> integrator(5, 1.0e-2, 1.0e-2);

    const double s = integrator.integrate(50, normal, -5000.0, 5000.0);

    ASSERT_NEAR(1.0, s, 1.0e-5);
}

/**
 * Tests a discontinuous integrand: the evaluation budget stops the refinement, splitting at the jump converges fast.
 */
TEST(IterativeLegendreGaussIntegrator, Discontinuity) {
    const double value = 0.2;
    auto f = [value](double x) { return (x >= 0 && x <= 5) ? value : 0.0; };
    integration::IterativeLegendreGaussIntegrator<double> integrator(5, 3, 100);
    const double max_x = 0.32462367623786328;

    try {
        integrator.integrate(1000, f, -10.0, max_x);
        FAIL() << "expected errors::TooManyEvaluations";
    } catch (const errors::MaxCountExceeded &e) {
        ASSERT_EQ(1000, e.limit());
        ASSERT_EQ(errors::Format::max_evaluations_exceeded, e.format());
    }

    const double sum_1 = integrator.integrate(1000, f, -10.0, 0.0);
    const int evaluations_1 = integrator.evaluations();
    const double sum_2 = integrator.integrate(1000, f, 0.0, max_x);
    const int evaluations_2 = integrator.evaluations();

    ASSERT_NEAR(max_x * value, sum_1 + sum_2, 1.0e-7);
    ASSERT_LT(evaluations_1 + evaluations_2, 200);
}

/**
 * Tests order validation.
 */
TEST(IterativeLegendreGaussIntegrator, InvalidOrder) {
    EXPECT_THROW(integration::IterativeLegendreGaussIntegrator<double>(0), errors::InvalidOrder);
    EXPECT_THROW(integration::IterativeLegendreGaussIntegrator<double>(-2, 1.0e-6, 1.0e-15), errors::InvalidOrder);
    EXPECT_THROW(integration::IterativeLegendreGaussIntegrator<double>(5, 0, 10), errors::InvalidIterationBounds);
}

/**
 * Tests sharing one rule factory between integrators.
 */
TEST(IterativeLegendreGaussIntegrator, SharedFactory) {
    auto factory = std::make_shared<gauss::GaussIntegratorFactory<double>>();

    integration::IterativeLegendreGaussIntegrator<double> first(4, integration::Settings{}, factory);
    integration::IterativeLegendreGaussIntegrator<double> second(4, integration::make_settings(1.0e-10, 1.0e-14), factory);

    ASSERT_EQ(factory, first.factory());
    ASSERT_EQ(factory, second.factory());
    ASSERT_EQ(4, first.number_of_points());

    auto f = [](double x) { return std::exp(x); };
    ASSERT_NEAR(std::exp(1.0) - 1.0, first.integrate(10000, f, 0.0, 1.0), 1.0e-6);
    ASSERT_NEAR(std::exp(1.0) - 1.0, second.integrate(10000, f, 0.0, 1.0), 1.0e-9);

    integration::IterativeLegendreGaussIntegrator<double> own(4);
    ASSERT_NE(nullptr, own.factory());
    ASSERT_NE(factory, own.factory());
}

/**
 * Tests the integrator over a multiprecision domain.
 */
TEST(IterativeLegendreGaussIntegrator, Multiprecision) {
    using T = cpp_bin_float_50;
    using F = field::Traits<T>;
    integration::IterativeLegendreGaussIntegrator<T> integrator(5, 1, 10);

    const T result = integrator.integrate(1000, [](T x) -> T { return T(7); }, T(-1), T(2));

    ASSERT_LT(F::real(F::abs(T(result - 21))), 1.0e-45);
    ASSERT_EQ(0, integrator.iterations());
}
