/*
 * Copyright (c) 2025 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <string>
#include <utility>

#include "spdlog/fmt/fmt.h"

#include "numquad/flags.hpp"

namespace {

template <typename Enum>
using Names = std::pair<const char *, Enum>;

constexpr Names<spdlog::level::level_enum> level_names[] = {
    {"trace", spdlog::level::trace},
    {"debug", spdlog::level::debug},
    {"info", spdlog::level::info},
    {"warn", spdlog::level::warn},
    {"err", spdlog::level::err},
    {"critical", spdlog::level::critical},
    {"off", spdlog::level::off},
};

constexpr Names<cli::Method> method_names[] = {
    {"romberg", cli::Method::romberg},
    {"midpoint", cli::Method::midpoint},
    {"trapezoid", cli::Method::trapezoid},
    {"simpson", cli::Method::simpson},
    {"legendre_gauss", cli::Method::legendre_gauss},
};

constexpr Names<cli::Integrand> integrand_names[] = {
    {"sin", cli::Integrand::sin},
    {"square", cli::Integrand::square},
    {"inverse_quadratic", cli::Integrand::inverse_quadratic},
    {"exp", cli::Integrand::exp},
};

/**
 * @brief Look a flag value up in a name table.
 */
template <typename Enum, std::size_t N>
bool parse(const Names<Enum> (&names)[N], absl::string_view text, Enum *value, std::string *error, const char *what) {
    for (const auto &[name, enum_value] : names) {
        if (text == name) {
            *value = enum_value;
            return true;
        }
    }
    *error = fmt::format("Invalid {} {}", what, std::string(text));
    return false;
}

template <typename Enum, std::size_t N>
std::string unparse(const Names<Enum> (&names)[N], Enum value) {
    for (const auto &[name, enum_value] : names) {
        if (enum_value == value) {
            return name;
        }
    }
    return "unknown";
}

}; /* namespace */

namespace spdlog::level {

bool AbslParseFlag(absl::string_view text, level_enum *level, std::string *error) {
    return parse(level_names, text, level, error, "verbosity");
}

std::string AbslUnparseFlag(level_enum level) { return unparse(level_names, level); }

}; /* namespace spdlog::level */

namespace cli {

bool AbslParseFlag(absl::string_view text, Method *method, std::string *error) {
    return parse(method_names, text, method, error, "method");
}

std::string AbslUnparseFlag(Method method) { return unparse(method_names, method); }

bool AbslParseFlag(absl::string_view text, Integrand *integrand, std::string *error) {
    return parse(integrand_names, text, integrand, error, "function");
}

std::string AbslUnparseFlag(Integrand integrand) { return unparse(integrand_names, integrand); }

}; /* namespace cli */
