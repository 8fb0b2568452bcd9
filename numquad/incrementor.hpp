/*
 * Copyright (c) 2025 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>

namespace utils {

/**
 * @brief Bounded counter used to cap iterations and function evaluations.
 *
 * Incrementing past the maximal count does not change the counter: the configured callback is invoked instead and is
 * expected to throw.
 */
class Incrementor {
public:
    /**
     * @brief Callback invoked when the maximal count would be exceeded.
     *
     * The argument is the maximal count. The callback must not return normally.
     */
    using MaxCountExceededCallback = std::function<void(int)>;

    /**
     * @brief Construct a counter with no practical limit.
     */
    Incrementor();

    /**
     * @brief Construct a counter throwing errors::MaxCountExceeded when exhausted.
     *
     * @param maximal_count Maximal number of increments allowed.
     */
    explicit Incrementor(int maximal_count);

    /**
     * @brief Construct a counter with a custom exhaustion callback.
     *
     * @param maximal_count Maximal number of increments allowed.
     * @param callback      Called with the maximal count when incrementing would exceed it.
     *
     * @throws std::invalid_argument if maximal_count is negative.
     */
    Incrementor(int maximal_count, MaxCountExceededCallback callback);

    /**
     * @brief Return a fresh counter (count 0) with a new maximal count and the same callback.
     *
     * @param maximal_count New maximal count.
     *
     * @return Reconfigured counter.
     */
    Incrementor with_maximal_count(int maximal_count) const;

    /**
     * @brief Return a fresh counter (count 0) with the same maximal count and a new callback.
     *
     * @param callback New exhaustion callback.
     *
     * @return Reconfigured counter.
     */
    Incrementor with_callback(MaxCountExceededCallback callback) const;

    /**
     * @brief Add one to the count.
     *
     * @throws whatever the callback throws if the count would exceed the maximal count.
     */
    void increment() { increment(1); }

    /**
     * @brief Add a value to the count.
     *
     * @param value Non-negative amount to add.
     *
     * @throws whatever the callback throws if the count would exceed the maximal count.
     */
    void increment(int value);

    /**
     * @brief Check whether value more increments are allowed.
     */
    bool can_increment(int value = 1) const noexcept { return count_ <= maximal_count_ - value; }

    /**
     * @brief Reset the count to zero.
     */
    void reset() noexcept { count_ = 0; }

    int count() const noexcept { return count_; }

    int maximal_count() const noexcept { return maximal_count_; }

private:
    int maximal_count_;
    int count_;
    MaxCountExceededCallback callback_;
};

}; /* namespace utils */
