/*
 * Copyright (c) 2025 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "numquad/gauss_integrator.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <vector>

#include "numquad/errors.hpp"
#include "numquad/hermite_rule_factory.hpp"
#include "numquad/rule.hpp"

/**
 * Tests integration with a hand written rule (two point Gauss-Legendre).
 */
TEST(GaussIntegrator, TwoPointRule) {
    const double p = 1.0 / std::sqrt(3.0);
    gauss::GaussIntegrator<double> integrator({-p, p}, {1.0, 1.0});

    ASSERT_EQ(2, integrator.number_of_points());
    ASSERT_EQ(-p, integrator.point(0));
    ASSERT_EQ(1.0, integrator.weight(1));

    ASSERT_NEAR(2.0, integrator.integrate([](double x) { return 1.0; }), 1.0e-15);
    ASSERT_NEAR(0.0, integrator.integrate([](double x) { return x; }), 1.0e-15);
    ASSERT_NEAR(2.0 / 3.0, integrator.integrate([](double x) { return x * x; }), 1.0e-15);
    ASSERT_NEAR(0.0, integrator.integrate([](double x) { return x * x * x; }), 1.0e-15);
}

/**
 * Tests construction from a rule.
 */
TEST(GaussIntegrator, FromRule) {
    gauss::Rule<double> rule{{0.0, 1.0, 2.0}, {0.5, 1.0, 0.5}};

    gauss::GaussIntegrator<double> integrator(rule);

    ASSERT_EQ(3, integrator.number_of_points());
    ASSERT_EQ(4.0, integrator.integrate([](double x) { return x + 1.0; }));
}

/**
 * Tests that nodes and weights of different lengths are rejected.
 */
TEST(GaussIntegrator, MismatchedDimensions) {
    EXPECT_THROW(gauss::GaussIntegrator<double>({0.0, 1.0}, {1.0}), errors::MismatchedDimensions);
    EXPECT_THROW(gauss::SymmetricGaussIntegrator<double>({-1.0, 1.0}, {1.0, 1.0, 1.0}), errors::MismatchedDimensions);
}

/**
 * Tests that nodes must be strictly increasing.
 */
TEST(GaussIntegrator, NotSorted) {
    EXPECT_THROW(gauss::GaussIntegrator<double>({0.0, 2.0, 1.0}, {1.0, 1.0, 1.0}), errors::NotSorted);
    EXPECT_THROW(gauss::GaussIntegrator<double>({0.0, 1.0, 1.0}, {1.0, 1.0, 1.0}), errors::NotSorted);

    try {
        gauss::GaussIntegrator<double> integrator({0.0, 1.0, 3.0, 2.0}, {1.0, 1.0, 1.0, 1.0});
        FAIL() << "expected errors::NotSorted";
    } catch (const errors::NotSorted &e) {
        ASSERT_EQ(3.0, e.context()[0]);
        ASSERT_EQ(3.0, e.context()[1]);
        ASSERT_EQ(2.0, e.context()[2]);
    }
}

/**
 * Tests that many tiny contributions are not lost next to a large one.
 */
TEST(GaussIntegrator, CompensatedSummation) {
    const int n = 1000000;
    std::vector<double> points(n);
    std::vector<double> weights(n, 1.0e-16);
    for (int i = 0; i < n; ++i) {
        points[i] = i;
    }
    weights[0] = 1.0;

    gauss::GaussIntegrator<double> integrator(points, weights);

    const double result = integrator.integrate([](double x) { return 1.0; });

    ASSERT_NEAR(1.0 + (n - 1) * 1.0e-16, result, 1.0e-15);
}

/**
 * Tests that odd functions cancel exactly with a symmetric rule.
 */
TEST(SymmetricGaussIntegrator, OddFunction) {
    gauss::HermiteRuleFactory<double> factory;

    for (int n = 1; n <= 12; ++n) {
        gauss::SymmetricGaussIntegrator<double> integrator(factory.get_rule(n));

        ASSERT_EQ(0.0, integrator.integrate([](double x) { return x * x * x; })) << n;
        ASSERT_EQ(0.0, integrator.integrate([](double x) { return std::sin(x); })) << n;
    }
}

/**
 * Tests that the symmetric integrator agrees with the general one.
 */
TEST(SymmetricGaussIntegrator, MatchesGeneralIntegrator) {
    gauss::HermiteRuleFactory<double> factory;
    auto f = [](double x) { return std::cos(x) + x * x; };

    for (int n = 1; n <= 12; ++n) {
        gauss::GaussIntegrator<double> general(factory.get_rule(n));
        gauss::SymmetricGaussIntegrator<double> symmetric(factory.get_rule(n));

        ASSERT_NEAR(general.integrate(f), symmetric.integrate(f), 1.0e-14) << n;
    }
}
