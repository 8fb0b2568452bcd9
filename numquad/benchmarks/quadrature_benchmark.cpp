/*
 * Copyright (c) 2025 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "numquad/legendre_rule_factory.hpp"

#include <benchmark/benchmark.h>

#include <cmath>
#include <limits>
#include <numbers>

#include "numquad/gauss_integrator.hpp"
#include "numquad/iterative_legendre_gauss_integrator.hpp"
#include "numquad/midpoint_integrator.hpp"
#include "numquad/romberg_integrator.hpp"
#include "numquad/rule.hpp"

static void BM_LegendreRuleCold(benchmark::State &state) {
    const int n = static_cast<int>(state.range(0));

    for (auto _ : state) {
        gauss::LegendreRuleFactory<double> factory;
        gauss::Rule<double> rule = factory.get_rule(n);
        benchmark::DoNotOptimize(rule.points.data());
        benchmark::ClobberMemory();
    }
}

static void BM_LegendreRuleCached(benchmark::State &state) {
    const int n = static_cast<int>(state.range(0));
    gauss::LegendreRuleFactory<double> factory;
    factory.get_rule(n);

    for (auto _ : state) {
        gauss::Rule<double> rule = factory.get_rule(n);
        benchmark::DoNotOptimize(rule.points.data());
        benchmark::ClobberMemory();
    }
}

static void BM_GaussIntegrate(benchmark::State &state) {
    gauss::LegendreRuleFactory<double> factory;
    gauss::GaussIntegrator<double> integrator(factory.get_rule(static_cast<int>(state.range(0))));

    for (auto _ : state) {
        double result = integrator.integrate([](double x) { return std::sin(x); });
        benchmark::DoNotOptimize(result);
    }
}

static void BM_RombergSin(benchmark::State &state) {
    integration::RombergIntegrator<double> integrator;

    for (auto _ : state) {
        double result = integrator.integrate(1000, [](double x) { return std::sin(x); }, 0.0, std::numbers::pi);
        benchmark::DoNotOptimize(result);
    }
}

static void BM_MidPointSin(benchmark::State &state) {
    integration::MidPointIntegrator<double> integrator(1.0e-4, 1.0e-15, 3, 64);

    for (auto _ : state) {
        double result = integrator.integrate(
            std::numeric_limits<int>::max(), [](double x) { return std::sin(x); }, 0.0, std::numbers::pi);
        benchmark::DoNotOptimize(result);
    }
}

static void BM_IterativeLegendreGaussSin(benchmark::State &state) {
    integration::IterativeLegendreGaussIntegrator<double> integrator(static_cast<int>(state.range(0)), 1.0e-12, 1.0e-15);

    for (auto _ : state) {
        double result = integrator.integrate(100000, [](double x) { return std::sin(x); }, 0.0, std::numbers::pi);
        benchmark::DoNotOptimize(result);
    }
}

BENCHMARK(BM_LegendreRuleCold)->Arg(8)->Arg(32)->Arg(128);
BENCHMARK(BM_LegendreRuleCached)->Arg(8)->Arg(32)->Arg(128);
BENCHMARK(BM_GaussIntegrate)->Arg(8)->Arg(32)->Arg(128);
BENCHMARK(BM_RombergSin);
BENCHMARK(BM_MidPointSin);
BENCHMARK(BM_IterativeLegendreGaussSin)->Arg(3)->Arg(5)->Arg(10);

BENCHMARK_MAIN();
