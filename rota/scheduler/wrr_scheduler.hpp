/*
 * wrr_scheduler.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-22

Description: Concurrent smooth weighted round-robin scheduler

**************************************************/

#ifndef ROTA_SCHEDULER_WRR_SCHEDULER_HPP
#define ROTA_SCHEDULER_WRR_SCHEDULER_HPP

#include <atomic>
#include <concepts>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <memory>
#include <mutex>
#include <ranges>
#include <stdexcept>
#include <string_view>
#include <utility>
#include <vector>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include "rota/algorithm/smooth_wrr.hpp"
#include "rota/async/lock.hpp"
#include "rota/scheduler/entry.hpp"
#include "rota/scheduler/options.hpp"
#include "rota/scheduler/schedule.hpp"
#include "rota/type/noncopyable.hpp"

namespace rota {

/**
 * @brief Concurrent weighted round-robin scheduler.
 *
 * Writers rebuild the whole cycle off to the side and publish it with a
 * single pointer swap under the exclusive side of @p Lock. Readers take the
 * shared side only long enough to read one slot, and pick their slot with an
 * atomic fetch-and-add on a cursor that lives for the whole scheduler.
 *
 * Each insertion costs one regeneration, O(entries * total weight), so batch
 * insertions with insertMany() where possible.
 *
 * @code
 * rota::WrrScheduler<std::string> scheduler;
 * scheduler.insertMany({{"a", 1}, {"b", 2}});
 * scheduler.insert("c", 3);
 * if (auto picked = scheduler.select()) {
 *     route(picked->data());
 * }
 * @endcode
 *
 * @tparam T Payload type, treated as an opaque value
 * @tparam Lock Readers-writer lock guarding the published schedule
 */
template <typename T, async::SharedLock Lock = async::StdSharedMutex>
class WrrScheduler : public NonCopyable {
public:
    using value_type = T;
    using EntryType = Entry<T>;
    using ScheduleType = Schedule<T>;
    /**
     * @brief Reference to a selected entry; stays valid after later
     * mutations for as long as the caller holds it
     */
    using ItemRef = std::shared_ptr<const EntryType>;
    using SchedulePtr = std::shared_ptr<const ScheduleType>;

    WrrScheduler() : WrrScheduler(SchedulerOptions{}) {}

    /**
     * @throws std::invalid_argument if options fail validation
     */
    explicit WrrScheduler(SchedulerOptions options)
        : options_(std::move(options)),
          schedule_(std::make_shared<const ScheduleType>()) {
        options_.validate();
    }

    /**
     * @brief Appends one entry and publishes the new cycle
     * @throws algorithm::InvalidWeight if weight is zero
     * @throws algorithm::CapacityExceeded if the total weight would exceed
     * options().maxTotalWeight
     */
    void insert(T item, Weight weight) {
        std::lock_guard writer(writeMutex_);
        auto next = entries_;
        next.push_back(std::make_shared<const EntryType>(std::move(item), weight));
        publish(std::move(next), "insert");
    }

    /**
     * @brief Appends one entry with options().defaultWeight
     */
    void insert(T item) { insert(std::move(item), options_.defaultWeight); }

    /**
     * @brief Appends a batch of entries with a single regeneration.
     *
     * Elements may be Entry<T> or (payload, weight) pairs. Either every
     * element is added or, on exception, none is. An empty batch changes
     * nothing.
     *
     * @throws algorithm::InvalidWeight if any weight is zero or negative
     * @throws algorithm::CapacityExceeded if the total weight would exceed
     * options().maxTotalWeight
     */
    template <std::ranges::input_range R>
        requires std::constructible_from<EntryType,
                                         std::ranges::range_reference_t<R>>
    void insertMany(R&& batch) {
        std::vector<EntryPtr> added;
        if constexpr (std::ranges::sized_range<R>) {
            added.reserve(std::ranges::size(batch));
        }
        for (auto&& element : batch) {
            added.push_back(std::make_shared<const EntryType>(
                std::forward<decltype(element)>(element)));
        }
        if (added.empty()) {
            return;
        }

        std::lock_guard writer(writeMutex_);
        auto next = entries_;
        next.insert(next.end(), std::make_move_iterator(added.begin()),
                    std::make_move_iterator(added.end()));
        publish(std::move(next), "insertMany");
    }

    void insertMany(std::initializer_list<std::pair<T, Weight>> batch) {
        insertMany(std::views::all(batch));
    }

    /**
     * @brief Replaces the weight of the entry at index.
     *
     * The entry is rebuilt with the same payload; references obtained before
     * the call keep reporting the old weight.
     *
     * @throws std::out_of_range if index is not below size()
     * @throws algorithm::InvalidWeight, algorithm::CapacityExceeded as insert()
     */
    void updateWeight(std::size_t index, Weight weight)
        requires std::copy_constructible<T>
    {
        std::lock_guard writer(writeMutex_);
        checkIndex(index);
        auto next = entries_;
        next[index] =
            std::make_shared<const EntryType>(next[index]->data(), weight);
        publish(std::move(next), "updateWeight");
    }

    /**
     * @brief Removes the entry at index; later entries move down by one
     * @throws std::out_of_range if index is not below size()
     */
    void remove(std::size_t index) {
        std::lock_guard writer(writeMutex_);
        checkIndex(index);
        auto next = entries_;
        next.erase(next.begin() + static_cast<std::ptrdiff_t>(index));
        publish(std::move(next), "remove");
    }

    /**
     * @brief Removes every entry whose payload satisfies predicate
     * @return Number of removed entries; nothing is published when zero
     */
    template <std::predicate<const T&> P>
    auto removeIf(P&& predicate) -> std::size_t {
        std::lock_guard writer(writeMutex_);
        auto next = entries_;
        const auto removed = std::erase_if(next, [&](const EntryPtr& entry) {
            return std::invoke(predicate, entry->data());
        });
        if (removed != 0) {
            publish(std::move(next), "removeIf");
        }
        return removed;
    }

    /**
     * @brief Drops every entry and restarts the cursor at zero
     */
    void clear() {
        std::lock_guard writer(writeMutex_);
        auto empty =
            std::make_shared<const ScheduleType>(schedule_->generation() + 1);
        SchedulePtr previous;
        {
            async::ScopedLock lock(publishLock_);
            previous = std::exchange(schedule_, std::move(empty));
            cursor_->store(0, std::memory_order_relaxed);
        }
        entries_.clear();
        spdlog::info("[{}] cleared {} entries (generation {})", options_.name,
                     previous->size(), previous->generation() + 1);
    }

    /**
     * @brief Picks the next entry of the published cycle
     * @return The entry, or nullptr if the scheduler holds no entry (the
     * cursor is not advanced in that case)
     */
    [[nodiscard]] auto select() const -> ItemRef {
        async::ScopedSharedLock lock(publishLock_);
        const auto& schedule = *schedule_;
        if (schedule.empty()) {
            return nullptr;
        }
        return schedule.at(cursor_->fetch_add(1, std::memory_order_relaxed));
    }

    /**
     * @brief Performs n selections
     * @return The picked entries; empty if the scheduler holds no entry
     */
    [[nodiscard]] auto selectMany(std::size_t n) const -> std::vector<ItemRef> {
        std::vector<ItemRef> picked;
        picked.reserve(n);
        for (std::size_t i = 0; i < n; ++i) {
            auto item = select();
            if (!item) {
                break;
            }
            picked.push_back(std::move(item));
        }
        return picked;
    }

    /**
     * @brief The currently published schedule
     */
    [[nodiscard]] auto snapshot() const -> SchedulePtr {
        async::ScopedSharedLock lock(publishLock_);
        return schedule_;
    }

    [[nodiscard]] auto size() const -> std::size_t {
        return snapshot()->size();
    }

    [[nodiscard]] auto empty() const -> bool { return snapshot()->empty(); }

    [[nodiscard]] auto totalWeight() const -> std::uint64_t {
        return snapshot()->totalWeight();
    }

    /**
     * @brief Number of successful mutations since construction
     */
    [[nodiscard]] auto generation() const -> std::uint64_t {
        return snapshot()->generation();
    }

    /**
     * @brief Number of successful selections since construction or the last
     * clear()
     */
    [[nodiscard]] auto cursor() const noexcept -> std::uint64_t {
        return cursor_->load(std::memory_order_relaxed);
    }

    [[nodiscard]] auto options() const noexcept -> const SchedulerOptions& {
        return options_;
    }

private:
    using EntryPtr = typename ScheduleType::EntryPtr;

    void checkIndex(std::size_t index) const {
        if (index >= entries_.size()) {
            throw std::out_of_range(fmt::format(
                "Index {} out of range (size: {})", index, entries_.size()));
        }
    }

    // Caller holds writeMutex_. Nothing changes unless the build succeeds.
    void publish(std::vector<EntryPtr> next, std::string_view operation) {
        SchedulePtr schedule;
        try {
            schedule = ScheduleType::build(next, options_.maxTotalWeight,
                                           schedule_->generation() + 1);
        } catch (const algorithm::WeightError& e) {
            spdlog::warn("[{}] {} rejected: {}", options_.name, operation,
                         e.what());
            throw;
        }

        SchedulePtr previous;
        {
            async::ScopedLock lock(publishLock_);
            previous = std::exchange(schedule_, schedule);
        }
        entries_ = std::move(next);

        spdlog::debug("[{}] {} published generation {}: {} entries, cycle "
                      "length {}",
                      options_.name, operation, schedule->generation(),
                      schedule->size(), schedule->length());
    }

    SchedulerOptions options_;

    // Weighted set; only touched by writers under writeMutex_
    std::mutex writeMutex_;
    std::vector<EntryPtr> entries_;

    mutable Lock publishLock_;
    SchedulePtr schedule_;

    mutable async::CacheAligned<std::atomic<std::uint64_t>> cursor_;
};

/**
 * @brief Scheduler whose waiters are parked by the OS
 */
template <typename T>
using BlockingWrrScheduler = WrrScheduler<T, async::StdSharedMutex>;

/**
 * @brief Scheduler whose waiters spin and yield instead of parking
 */
template <typename T>
using SpinningWrrScheduler = WrrScheduler<T, async::SharedSpinlock>;

#ifdef ROTA_USE_BOOST_LOCKS
template <typename T>
using BoostWrrScheduler = WrrScheduler<T, async::BoostSharedMutex>;
#endif

}  // namespace rota

#endif  // ROTA_SCHEDULER_WRR_SCHEDULER_HPP
