/*
 * options.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-22

Description: Scheduler runtime options

**************************************************/

#include "options.hpp"

#include <charconv>
#include <cstdlib>
#include <stdexcept>
#include <system_error>

#include <spdlog/fmt/fmt.h>

namespace rota {

namespace {
auto parseUnsigned(const std::string& variable, std::string_view text)
    -> std::uint64_t {
    std::uint64_t value = 0;
    const auto* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (ec != std::errc() || ptr != end || text.empty()) {
        throw std::invalid_argument(fmt::format(
            "{} must be an unsigned integer, got '{}'", variable, text));
    }
    return value;
}
}  // namespace

void SchedulerOptions::validate() const {
    if (maxTotalWeight == 0) {
        throw std::invalid_argument("maxTotalWeight must be greater than 0");
    }
    if (maxTotalWeight > algorithm::kMaxCycleLength) {
        throw std::invalid_argument(
            fmt::format("maxTotalWeight {} is above the maximum cycle length {}",
                        maxTotalWeight, algorithm::kMaxCycleLength));
    }
    if (defaultWeight == 0) {
        throw std::invalid_argument("defaultWeight must be greater than 0");
    }
    if (defaultWeight > maxTotalWeight) {
        throw std::invalid_argument(
            fmt::format("defaultWeight {} is above maxTotalWeight {}",
                        defaultWeight, maxTotalWeight));
    }
}

auto SchedulerOptions::fromEnvironment(std::string_view prefix)
    -> SchedulerOptions {
    SchedulerOptions options;
    const std::string base(prefix);

    if (const char* value = std::getenv((base + "NAME").c_str())) {
        options.name = value;
    }

    const std::string maxVar = base + "MAX_TOTAL_WEIGHT";
    if (const char* value = std::getenv(maxVar.c_str())) {
        options.maxTotalWeight = parseUnsigned(maxVar, value);
    }

    const std::string weightVar = base + "DEFAULT_WEIGHT";
    if (const char* value = std::getenv(weightVar.c_str())) {
        options.defaultWeight = parseUnsigned(weightVar, value);
    }

    options.validate();
    return options;
}

}  // namespace rota
