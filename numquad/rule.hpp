/*
 * Copyright (c) 2025 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vector>

namespace gauss {

/**
 * @brief Quadrature rule: nodes and their weights, as two parallel sequences of equal length.
 *
 * @tparam T Numeric domain of nodes and weights.
 */
template <typename T>
struct Rule {
    std::vector<T> points;
    std::vector<T> weights;
};

}; /* namespace gauss */
