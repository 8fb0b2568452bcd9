/*
 * Copyright (c) 2025 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "numquad/flags.hpp"

#include <gtest/gtest.h>

#include <string>

/**
 * Tests parsing of the logging verbosity.
 */
TEST(Flags, Verbosity) {
    spdlog::level::level_enum level = spdlog::level::info;
    std::string error;

    ASSERT_TRUE(spdlog::level::AbslParseFlag("debug", &level, &error));
    ASSERT_EQ(spdlog::level::debug, level);
    ASSERT_TRUE(spdlog::level::AbslParseFlag("off", &level, &error));
    ASSERT_EQ(spdlog::level::off, level);

    ASSERT_FALSE(spdlog::level::AbslParseFlag("loud", &level, &error));
    ASSERT_EQ("Invalid verbosity loud", error);
    ASSERT_EQ(spdlog::level::off, level);

    ASSERT_EQ("trace", spdlog::level::AbslUnparseFlag(spdlog::level::trace));
    ASSERT_EQ("err", spdlog::level::AbslUnparseFlag(spdlog::level::err));
}

/**
 * Tests parsing of the integration method.
 */
TEST(Flags, Method) {
    cli::Method method = cli::Method::romberg;
    std::string error;

    ASSERT_TRUE(cli::AbslParseFlag("legendre_gauss", &method, &error));
    ASSERT_EQ(cli::Method::legendre_gauss, method);
    ASSERT_TRUE(cli::AbslParseFlag("midpoint", &method, &error));
    ASSERT_EQ(cli::Method::midpoint, method);

    ASSERT_FALSE(cli::AbslParseFlag("gauss", &method, &error));
    ASSERT_EQ("Invalid method gauss", error);
    ASSERT_EQ("simpson", cli::AbslUnparseFlag(cli::Method::simpson));
}

/**
 * Tests parsing of the builtin integrand.
 */
TEST(Flags, Integrand) {
    cli::Integrand integrand = cli::Integrand::sin;
    std::string error;

    ASSERT_TRUE(cli::AbslParseFlag("inverse_quadratic", &integrand, &error));
    ASSERT_EQ(cli::Integrand::inverse_quadratic, integrand);
    ASSERT_EQ("exp", cli::AbslUnparseFlag(cli::Integrand::exp));

    ASSERT_FALSE(cli::AbslParseFlag("cube", &integrand, &error));
    ASSERT_EQ("Invalid function cube", error);
}
