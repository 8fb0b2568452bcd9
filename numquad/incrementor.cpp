/*
 * Copyright (c) 2025 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <limits>
#include <stdexcept>
#include <utility>

#include "numquad/errors.hpp"
#include "numquad/incrementor.hpp"

namespace utils {

/**
 * @brief Default exhaustion behaviour: report the generic max count error.
 */
static void throw_max_count_exceeded(int maximal_count) { throw errors::MaxCountExceeded(maximal_count); }

Incrementor::Incrementor() : Incrementor(std::numeric_limits<int>::max()) {}

Incrementor::Incrementor(int maximal_count) : Incrementor(maximal_count, throw_max_count_exceeded) {}

Incrementor::Incrementor(int maximal_count, MaxCountExceededCallback callback)
    : maximal_count_(maximal_count), count_(0), callback_(std::move(callback)) {
    if (maximal_count < 0) {
        throw std::invalid_argument("maximal count must be non-negative");
    }
    if (!callback_) {
        throw std::invalid_argument("max count exceeded callback must be set");
    }
}

Incrementor Incrementor::with_maximal_count(int maximal_count) const { return Incrementor(maximal_count, callback_); }

Incrementor Incrementor::with_callback(MaxCountExceededCallback callback) const {
    return Incrementor(maximal_count_, std::move(callback));
}

void Incrementor::increment(int value) {
    if (value < 0) {
        throw std::invalid_argument("increment must be non-negative");
    }
    if (!can_increment(value)) {
        callback_(maximal_count_);
        /* callbacks are required to throw, make sure the counter never goes past its bound */
        throw errors::MaxCountExceeded(maximal_count_);
    }
    count_ += value;
}

}; /* namespace utils */
