/*
 * Copyright (c) 2025 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <utility>
#include <vector>

#include "spdlog/spdlog.h"

#include "numquad/rule.hpp"
#include "numquad/rule_factory.hpp"

namespace gauss {

/**
 * @brief Rule factory computing rules in a more precise domain and rounding them to the target domain.
 *
 * Nodes and weights are obtained with full Source precision (including the root finding), so the converted rule is
 * accurate to the last bit of T.
 *
 * @tparam Source Domain the rules are computed in (e.g. boost::multiprecision::cpp_bin_float_50).
 * @tparam T      Domain of the returned rules, explicitly convertible from Source.
 */
template <typename Source, typename T>
class ConvertingRuleFactory : public RuleFactory<T> {
public:
    /**
     * @param source Factory computing the rules in the Source domain.
     */
    explicit ConvertingRuleFactory(std::unique_ptr<RuleFactory<Source>> source) : source_(std::move(source)) {}

protected:
    Rule<T> compute_rule(int number_of_points) override {
        spdlog::debug("Converting rule with {} points", number_of_points);

        const Rule<Source> rule = source_->get_rule(number_of_points);

        std::vector<T> points;
        std::vector<T> weights;
        points.reserve(rule.points.size());
        weights.reserve(rule.weights.size());
        for (std::size_t i = 0; i < rule.points.size(); ++i) {
            points.push_back(static_cast<T>(rule.points[i]));
            weights.push_back(static_cast<T>(rule.weights[i]));
        }

        return {std::move(points), std::move(weights)};
    }

private:
    std::unique_ptr<RuleFactory<Source>> source_;
};

}; /* namespace gauss */
