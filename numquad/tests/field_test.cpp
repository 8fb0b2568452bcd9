/*
 * Copyright (c) 2025 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "numquad/field.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <numbers>

#include <boost/multiprecision/cpp_bin_float.hpp>

#include "numquad/derivative.hpp"

using boost::multiprecision::cpp_bin_float_50;

/**
 * Tests double traits.
 */
TEST(Field, DoubleTraits) {
    using F = field::Traits<double>;

    ASSERT_EQ(0.0, F::zero());
    ASSERT_EQ(1.0, F::one());
    ASSERT_EQ(std::numbers::pi, F::pi());
    ASSERT_EQ(3.0, F::sqrt(9.0));
    ASSERT_EQ(2.5, F::abs(-2.5));
    ASSERT_EQ(-2.5, F::real(-2.5));
}

/**
 * Tests unit in the last place of doubles.
 */
TEST(Field, DoubleUlp) {
    using F = field::Traits<double>;

    ASSERT_EQ(std::numeric_limits<double>::epsilon(), F::ulp(1.0));
    ASSERT_EQ(std::numeric_limits<double>::epsilon(), F::ulp(-1.0));
    ASSERT_EQ(std::numeric_limits<double>::denorm_min(), F::ulp(0.0));
    ASSERT_EQ(2.0 * std::numeric_limits<double>::epsilon(), F::ulp(3.0));
    ASSERT_GT(F::ulp(std::numeric_limits<double>::max()), 0.0);
    ASSERT_TRUE(std::isinf(F::ulp(std::numeric_limits<double>::infinity())));
}

/**
 * Tests multiprecision traits.
 */
TEST(Field, MultiprecisionTraits) {
    using F = field::Traits<cpp_bin_float_50>;

    const cpp_bin_float_50 two = F::sqrt(cpp_bin_float_50(2));
    const cpp_bin_float_50 error = F::abs(cpp_bin_float_50(two * two - 2));

    ASSERT_LT(F::real(error), 1.0e-48);
    ASSERT_NEAR(std::numbers::pi, F::real(F::pi()), 1.0e-15);
    ASSERT_EQ(0.0, F::real(F::zero()));
    ASSERT_EQ(1.0, F::real(F::one()));
}

/**
 * Tests unit in the last place of multiprecision numbers.
 */
TEST(Field, MultiprecisionUlp) {
    using F = field::Traits<cpp_bin_float_50>;

    const cpp_bin_float_50 one = F::one();
    const cpp_bin_float_50 ulp = F::ulp(one);

    ASSERT_GT(F::real(ulp), 0.0);
    ASSERT_LT(F::real(ulp), 1.0e-45);
    ASSERT_TRUE(cpp_bin_float_50(one + ulp) != one);
    ASSERT_TRUE(ulp == cpp_bin_float_50(ldexp(one, 1 - std::numeric_limits<cpp_bin_float_50>::digits)));
    ASSERT_TRUE(F::ulp(cpp_bin_float_50(-4)) == cpp_bin_float_50(ulp * 4));
    ASSERT_GT(F::real(F::ulp(F::zero())), 0.0);
}

/**
 * Tests detection of infinities and NaN in every domain.
 */
TEST(Field, IsFinite) {
    using MP = field::Traits<cpp_bin_float_50>;
    using DF = field::Traits<field::Derivative1<double>>;

    ASSERT_TRUE(field::Traits<double>::is_finite(1.0e300));
    ASSERT_FALSE(field::Traits<double>::is_finite(std::numeric_limits<double>::infinity()));
    ASSERT_FALSE(field::Traits<double>::is_finite(std::numeric_limits<double>::quiet_NaN()));

    ASSERT_TRUE(MP::is_finite(MP::pi()));
    ASSERT_FALSE(MP::is_finite(std::numeric_limits<cpp_bin_float_50>::infinity()));
    ASSERT_FALSE(MP::is_finite(std::numeric_limits<cpp_bin_float_50>::quiet_NaN()));

    ASSERT_TRUE(DF::is_finite(field::Derivative1<double>(1.0, 2.0)));
    ASSERT_FALSE(DF::is_finite(field::Derivative1<double>(1.0, std::numeric_limits<double>::infinity())));
    ASSERT_FALSE(DF::is_finite(field::Derivative1<double>(std::numeric_limits<double>::quiet_NaN(), 0.0)));
}

/**
 * Tests derivative propagation through arithmetic.
 */
TEST(Derivative, Arithmetic) {
    using D = field::Derivative1<double>;

    const D x = D::variable(3.0);

    const D square = x * x;
    ASSERT_EQ(9.0, square.value());
    ASSERT_EQ(6.0, square.derivative());

    const D inverse = 1.0 / x;
    ASSERT_DOUBLE_EQ(1.0 / 3.0, inverse.value());
    ASSERT_DOUBLE_EQ(-1.0 / 9.0, inverse.derivative());

    const D affine = x * 2.0 + 1.0 - x;
    ASSERT_EQ(4.0, affine.value());
    ASSERT_EQ(1.0, affine.derivative());

    const D negated = -x;
    ASSERT_EQ(-3.0, negated.value());
    ASSERT_EQ(-1.0, negated.derivative());
}

/**
 * Tests derivative propagation through elementary functions.
 */
TEST(Derivative, Functions) {
    using D = field::Derivative1<double>;

    const D x = D::variable(0.5);

    ASSERT_DOUBLE_EQ(std::sqrt(0.5), field::sqrt(x).value());
    ASSERT_DOUBLE_EQ(0.5 / std::sqrt(0.5), field::sqrt(x).derivative());
    ASSERT_DOUBLE_EQ(std::cos(0.5), field::sin(x).derivative());
    ASSERT_DOUBLE_EQ(-std::sin(0.5), field::cos(x).derivative());
    ASSERT_DOUBLE_EQ(std::exp(0.5), field::exp(x).derivative());
    ASSERT_DOUBLE_EQ(2.0, field::log(x).derivative());
    ASSERT_DOUBLE_EQ(1.0, field::abs(x).derivative());
    ASSERT_DOUBLE_EQ(-1.0, field::abs(D::variable(-0.5)).derivative());
    ASSERT_DOUBLE_EQ(0.5, field::abs(D::variable(-0.5)).value());
}

/**
 * Tests that comparisons and traits only look at the value.
 */
TEST(Derivative, Traits) {
    using D = field::Derivative1<double>;
    using F = field::Traits<D>;

    const D a(1.0, 5.0);
    const D b(1.0, -5.0);
    const D c(2.0, 0.0);

    ASSERT_TRUE(a == b);
    ASSERT_TRUE(a < c);
    ASSERT_TRUE(c >= b);
    ASSERT_EQ(1.0, F::real(a));
    ASSERT_EQ(std::numeric_limits<double>::epsilon(), F::ulp(a).value());
    ASSERT_EQ(0.0, F::ulp(a).derivative());
    ASSERT_EQ(std::numbers::pi, F::pi().value());
    ASSERT_EQ(0.0, F::pi().derivative());
}
