/*
 * Copyright (c) 2025 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cmath>
#include <limits>
#include <numbers>
#include <type_traits>

#include <boost/math/constants/constants.hpp>
#include <boost/math/special_functions/ulp.hpp>
#include <boost/multiprecision/number.hpp>

namespace field {

/**
 * @brief Numeric domain the integration algorithms are written against.
 *
 * A domain type T supports +, -, *, / with itself and with double, unary minus, ordering comparisons and construction
 * from double. Traits<T> supplies the remaining operations:
 *
 * - zero(), one(), pi(): field constants at the precision of T,
 * - sqrt(x), abs(x),
 * - real(x): the real part as a double, used for reporting and for mixed double arithmetic,
 * - ulp(x): distance from |x| to the next representable value of larger magnitude,
 * - is_finite(x): false for infinities and NaN.
 *
 * @tparam T      Domain type.
 * @tparam Enable SFINAE hook for partial specializations.
 */
template <typename T, typename Enable = void>
struct Traits;

/**
 * @brief Builtin floating point types.
 */
template <typename T>
struct Traits<T, std::enable_if_t<std::is_floating_point_v<T>>> {
    static T zero() noexcept { return T(0); }

    static T one() noexcept { return T(1); }

    static T pi() noexcept { return std::numbers::pi_v<T>; }

    static T sqrt(T x) { return std::sqrt(x); }

    static T abs(T x) { return std::abs(x); }

    static double real(T x) noexcept { return static_cast<double>(x); }

    static bool is_finite(T x) noexcept { return std::isfinite(x); }

    static T ulp(T x) {
        x = std::abs(x);
        if (!std::isfinite(x)) {
            return x;
        }
        if (x == std::numeric_limits<T>::max()) {
            return x - std::nextafter(x, T(0));
        }
        return std::nextafter(x, std::numeric_limits<T>::infinity()) - x;
    }
};

/**
 * @brief Boost.Multiprecision numbers (e.g. cpp_bin_float_50).
 *
 * Results are always materialized into the number type so that expression templates never escape.
 */
template <typename Backend, boost::multiprecision::expression_template_option ET>
struct Traits<boost::multiprecision::number<Backend, ET>> {
    using Number = boost::multiprecision::number<Backend, ET>;

    static Number zero() { return Number(0); }

    static Number one() { return Number(1); }

    static Number pi() { return boost::math::constants::pi<Number>(); }

    static Number sqrt(const Number &x) { return Number(boost::multiprecision::sqrt(x)); }

    static Number abs(const Number &x) { return Number(boost::multiprecision::abs(x)); }

    static double real(const Number &x) { return x.template convert_to<double>(); }

    static bool is_finite(const Number &x) { return static_cast<bool>(boost::multiprecision::isfinite(x)); }

    static Number ulp(const Number &x) {
        if (x == 0) {
            return std::numeric_limits<Number>::min();
        }
        return Number(boost::math::ulp(x));
    }
};

}; /* namespace field */
