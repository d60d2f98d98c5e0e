#ifndef ROTA_SCHEDULER_SCHEDULE_HPP
#define ROTA_SCHEDULER_SCHEDULE_HPP

#include <cstdint>
#include <memory>
#include <span>
#include <utility>
#include <vector>

#include "rota/algorithm/smooth_wrr.hpp"
#include "rota/scheduler/entry.hpp"

namespace rota {

/**
 * @brief Immutable published state of a scheduler: the entry table it was
 * built from and one full interleaved cycle over it.
 *
 * A Schedule is never modified after build(); writers replace it as a whole.
 *
 * @tparam T Payload type
 */
template <typename T>
class Schedule {
public:
    using EntryPtr = std::shared_ptr<const Entry<T>>;

    /**
     * @brief Empty schedule of the given generation
     */
    explicit Schedule(std::uint64_t generation = 0) noexcept
        : generation_(generation) {}

    /**
     * @brief Generates the cycle for an entry table
     * @param entries Entry table in insertion order
     * @param limit Largest accepted total weight
     * @param generation Generation number of the new schedule
     * @throws algorithm::InvalidWeight if an entry has weight zero
     * @throws algorithm::CapacityExceeded if the total weight is above limit
     */
    [[nodiscard]] static auto build(std::vector<EntryPtr> entries,
                                    std::uint64_t limit,
                                    std::uint64_t generation)
        -> std::shared_ptr<const Schedule> {
        std::vector<Weight> weights;
        weights.reserve(entries.size());
        for (const auto& entry : entries) {
            weights.push_back(entry->weight());
        }

        auto schedule = std::make_shared<Schedule>(generation);
        schedule->cycle_ = algorithm::generateSmoothCycle(weights, limit);
        schedule->totalWeight_ = schedule->cycle_.size();
        schedule->entries_ = std::move(entries);
        return schedule;
    }

    /**
     * @brief Entry at a cursor position, wrapped around the cycle length
     * @pre !empty()
     */
    [[nodiscard]] auto at(std::uint64_t position) const noexcept
        -> const EntryPtr& {
        return entries_[cycle_[position % cycle_.size()]];
    }

    [[nodiscard]] auto empty() const noexcept -> bool {
        return cycle_.empty();
    }

    /**
     * @brief Cycle length, equal to the total weight
     */
    [[nodiscard]] auto length() const noexcept -> std::size_t {
        return cycle_.size();
    }

    /**
     * @brief Number of entries
     */
    [[nodiscard]] auto size() const noexcept -> std::size_t {
        return entries_.size();
    }

    [[nodiscard]] auto totalWeight() const noexcept -> std::uint64_t {
        return totalWeight_;
    }

    [[nodiscard]] auto generation() const noexcept -> std::uint64_t {
        return generation_;
    }

    [[nodiscard]] auto entries() const noexcept -> std::span<const EntryPtr> {
        return entries_;
    }

    [[nodiscard]] auto cycle() const noexcept
        -> std::span<const algorithm::SlotIndex> {
        return cycle_;
    }

private:
    std::vector<EntryPtr> entries_;
    std::vector<algorithm::SlotIndex> cycle_;
    std::uint64_t totalWeight_ = 0;
    std::uint64_t generation_;
};

}  // namespace rota

#endif  // ROTA_SCHEDULER_SCHEDULE_HPP
