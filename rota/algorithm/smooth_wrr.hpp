#ifndef ROTA_ALGORITHM_SMOOTH_WRR_HPP
#define ROTA_ALGORITHM_SMOOTH_WRR_HPP

#include <cstddef>
#include <cstdint>
#include <limits>
#include <source_location>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

namespace rota::algorithm {

/**
 * @brief Integer share of an entry; must be at least 1 to be scheduled
 */
using Weight = std::uint64_t;

/**
 * @brief Position of an entry inside a weight table, as stored in a cycle
 */
using SlotIndex = std::uint32_t;

/**
 * @brief Hard upper bound for a cycle length (every slot must be addressable
 * by a SlotIndex)
 */
inline constexpr std::uint64_t kMaxCycleLength =
    std::numeric_limits<SlotIndex>::max();

/**
 * @brief Base exception class for weight-related errors
 */
class WeightError : public std::runtime_error {
public:
    explicit WeightError(
        const std::string& message,
        const std::source_location& loc = std::source_location::current());
};

/**
 * @brief Raised when a weight is zero
 */
class InvalidWeight : public WeightError {
public:
    explicit InvalidWeight(
        const std::string& message,
        const std::source_location& loc = std::source_location::current())
        : WeightError(message, loc) {}
};

/**
 * @brief Raised when a weight or the total weight does not fit the cycle
 * length limit
 */
class CapacityExceeded : public WeightError {
public:
    explicit CapacityExceeded(
        const std::string& message,
        const std::source_location& loc = std::source_location::current())
        : WeightError(message, loc) {}
};

/**
 * @brief Checks a single weight against the scheduling rules
 * @param weight Weight to check
 * @param limit Largest accepted weight
 * @throws InvalidWeight if weight is zero
 * @throws CapacityExceeded if weight is above limit
 */
void validateWeight(Weight weight, std::uint64_t limit);

/**
 * @brief Sums a weight table, validating every element
 * @param weights Weights in insertion order
 * @param limit Largest accepted total
 * @return The total weight, which is also the cycle length
 * @throws InvalidWeight if any weight is zero
 * @throws CapacityExceeded if the total is above limit or overflows
 */
[[nodiscard]] auto checkedTotalWeight(std::span<const Weight> weights,
                                      std::uint64_t limit) -> std::uint64_t;

/**
 * @brief Stateful smooth weighted round-robin picker.
 *
 * Each call to next() adds every weight to its node's running counter,
 * picks the node with the largest counter and charges it the total weight.
 * Ties go to the node that was added first. After totalWeight() calls all
 * counters are back to zero, so the picker is periodic.
 *
 * Not thread-safe; WrrScheduler uses it off to the side to expand a weight
 * table into a full cycle.
 */
class SmoothWeightedRoundRobin {
public:
    SmoothWeightedRoundRobin() = default;

    /**
     * @brief Builds a picker over a weight table
     * @throws InvalidWeight, CapacityExceeded as checkedTotalWeight()
     */
    explicit SmoothWeightedRoundRobin(std::span<const Weight> weights);

    /**
     * @brief Appends a node; counters of existing nodes are kept
     * @throws InvalidWeight if weight is zero
     * @throws CapacityExceeded if the total would exceed kMaxCycleLength
     */
    void add(Weight weight);

    /**
     * @brief Advances one tick and returns the picked node index
     * @throws WeightError if no node was added
     */
    [[nodiscard]] auto next() -> std::size_t;

    /**
     * @brief Sets every counter back to zero
     */
    void reset() noexcept;

    [[nodiscard]] auto size() const noexcept -> std::size_t {
        return nodes_.size();
    }
    [[nodiscard]] auto empty() const noexcept -> bool {
        return nodes_.empty();
    }
    [[nodiscard]] auto totalWeight() const noexcept -> std::uint64_t {
        return totalWeight_;
    }

private:
    struct Node {
        Weight weight;
        std::int64_t current;
    };

    std::vector<Node> nodes_;
    std::uint64_t totalWeight_ = 0;
};

/**
 * @brief Expands a weight table into one full interleaved cycle.
 *
 * The result has length sum(weights) and index i occurs exactly weights[i]
 * times. The same table in the same order always yields the same cycle.
 *
 * @param weights Weights in insertion order; empty yields an empty cycle
 * @param limit Largest accepted cycle length, at most kMaxCycleLength
 * @return Entry indices, one per unit of weight
 * @throws InvalidWeight if any weight is zero
 * @throws CapacityExceeded if the total weight is above limit
 * @throws std::invalid_argument if limit is above kMaxCycleLength
 */
[[nodiscard]] auto generateSmoothCycle(std::span<const Weight> weights,
                                       std::uint64_t limit = kMaxCycleLength)
    -> std::vector<SlotIndex>;

}  // namespace rota::algorithm

#endif  // ROTA_ALGORITHM_SMOOTH_WRR_HPP
