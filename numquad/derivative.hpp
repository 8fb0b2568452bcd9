/*
 * Copyright (c) 2025 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cmath>

#include "numquad/field.hpp"

namespace field {

/**
 * @brief Number carrying a value and its first derivative with respect to one free parameter.
 *
 * Arithmetic follows the chain rule, so any computation written against the field traits also propagates the
 * derivative of its result. Ordering comparisons only look at the value.
 *
 * @tparam U Underlying domain type (must itself have field::Traits).
 */
template <typename U>
class Derivative1 {
public:
    Derivative1() : value_(Traits<U>::zero()), derivative_(Traits<U>::zero()) {}

    /**
     * @brief Constant (zero derivative).
     */
    Derivative1(double constant) : value_(constant), derivative_(Traits<U>::zero()) {}

    Derivative1(U value, U derivative) : value_(value), derivative_(derivative) {}

    /**
     * @brief Build the free parameter itself (derivative one).
     *
     * @param value Value of the parameter.
     */
    static Derivative1 variable(U value) { return Derivative1(value, Traits<U>::one()); }

    const U &value() const noexcept { return value_; }

    const U &derivative() const noexcept { return derivative_; }

    Derivative1 operator-() const { return Derivative1(-value_, -derivative_); }

    Derivative1 &operator+=(const Derivative1 &other) {
        value_ = value_ + other.value_;
        derivative_ = derivative_ + other.derivative_;
        return *this;
    }

    Derivative1 &operator-=(const Derivative1 &other) {
        value_ = value_ - other.value_;
        derivative_ = derivative_ - other.derivative_;
        return *this;
    }

    Derivative1 &operator*=(const Derivative1 &other) {
        derivative_ = derivative_ * other.value_ + value_ * other.derivative_;
        value_ = value_ * other.value_;
        return *this;
    }

    Derivative1 &operator/=(const Derivative1 &other) {
        const U inv = Traits<U>::one() / other.value_;
        derivative_ = (derivative_ - value_ * inv * other.derivative_) * inv;
        value_ = value_ * inv;
        return *this;
    }

    friend Derivative1 operator+(Derivative1 a, const Derivative1 &b) { return a += b; }

    friend Derivative1 operator-(Derivative1 a, const Derivative1 &b) { return a -= b; }

    friend Derivative1 operator*(Derivative1 a, const Derivative1 &b) { return a *= b; }

    friend Derivative1 operator/(Derivative1 a, const Derivative1 &b) { return a /= b; }

    friend bool operator==(const Derivative1 &a, const Derivative1 &b) { return a.value_ == b.value_; }

    friend bool operator!=(const Derivative1 &a, const Derivative1 &b) { return a.value_ != b.value_; }

    friend bool operator<(const Derivative1 &a, const Derivative1 &b) { return a.value_ < b.value_; }

    friend bool operator<=(const Derivative1 &a, const Derivative1 &b) { return a.value_ <= b.value_; }

    friend bool operator>(const Derivative1 &a, const Derivative1 &b) { return a.value_ > b.value_; }

    friend bool operator>=(const Derivative1 &a, const Derivative1 &b) { return a.value_ >= b.value_; }

private:
    U value_;
    U derivative_;
};

/**
 * @brief Elementary functions, found by argument dependent lookup.
 */
template <typename U>
Derivative1<U> sqrt(const Derivative1<U> &x) {
    const U s = Traits<U>::sqrt(x.value());
    return Derivative1<U>(s, x.derivative() / (s * 2.0));
}

template <typename U>
Derivative1<U> abs(const Derivative1<U> &x) {
    return x.value() < Traits<U>::zero() ? -x : x;
}

template <typename U>
Derivative1<U> sin(const Derivative1<U> &x) {
    using std::cos;
    using std::sin;
    return Derivative1<U>(sin(x.value()), x.derivative() * cos(x.value()));
}

template <typename U>
Derivative1<U> cos(const Derivative1<U> &x) {
    using std::cos;
    using std::sin;
    return Derivative1<U>(cos(x.value()), -(x.derivative() * sin(x.value())));
}

template <typename U>
Derivative1<U> exp(const Derivative1<U> &x) {
    using std::exp;
    const U e = exp(x.value());
    return Derivative1<U>(e, x.derivative() * e);
}

template <typename U>
Derivative1<U> log(const Derivative1<U> &x) {
    using std::log;
    return Derivative1<U>(log(x.value()), x.derivative() / x.value());
}

/**
 * @brief Differentiable numbers: constants and comparisons come from the value part.
 */
template <typename U>
struct Traits<Derivative1<U>> {
    static Derivative1<U> zero() { return Derivative1<U>(); }

    static Derivative1<U> one() { return Derivative1<U>(Traits<U>::one(), Traits<U>::zero()); }

    static Derivative1<U> pi() { return Derivative1<U>(Traits<U>::pi(), Traits<U>::zero()); }

    static Derivative1<U> sqrt(const Derivative1<U> &x) { return field::sqrt(x); }

    static Derivative1<U> abs(const Derivative1<U> &x) { return field::abs(x); }

    static double real(const Derivative1<U> &x) { return Traits<U>::real(x.value()); }

    static bool is_finite(const Derivative1<U> &x) {
        return Traits<U>::is_finite(x.value()) && Traits<U>::is_finite(x.derivative());
    }

    static Derivative1<U> ulp(const Derivative1<U> &x) {
        return Derivative1<U>(Traits<U>::ulp(x.value()), Traits<U>::zero());
    }
};

}; /* namespace field */
