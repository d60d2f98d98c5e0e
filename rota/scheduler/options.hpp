#ifndef ROTA_SCHEDULER_OPTIONS_HPP
#define ROTA_SCHEDULER_OPTIONS_HPP

#include <cstdint>
#include <string>
#include <string_view>

#include "rota/algorithm/smooth_wrr.hpp"

namespace rota {

/**
 * @brief Default cap on the total weight, hence on the cycle length
 * (16M slots, 64 MiB of cycle)
 */
inline constexpr std::uint64_t kDefaultMaxTotalWeight = std::uint64_t{1} << 24;

/**
 * @brief Runtime configuration of a WrrScheduler.
 */
struct SchedulerOptions {
    std::string name = "wrr";  ///< Shown in log messages.
    std::uint64_t maxTotalWeight = kDefaultMaxTotalWeight;
    algorithm::Weight defaultWeight = 1;  ///< Used by insert(item).

    /**
     * @brief Checks the option values
     * @throws std::invalid_argument if maxTotalWeight is zero or above
     * algorithm::kMaxCycleLength, or defaultWeight is zero or above
     * maxTotalWeight
     */
    void validate() const;

    /**
     * @brief Default options overlaid with <prefix>NAME,
     * <prefix>MAX_TOTAL_WEIGHT and <prefix>DEFAULT_WEIGHT
     * @throws std::invalid_argument on malformed numbers or invalid values
     */
    static auto fromEnvironment(std::string_view prefix = "ROTA_")
        -> SchedulerOptions;
};

}  // namespace rota

#endif  // ROTA_SCHEDULER_OPTIONS_HPP
