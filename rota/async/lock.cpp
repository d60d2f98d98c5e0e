/*
 * lock.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-2-13

Description: Readers-writer locks used to publish schedules

**************************************************/

#include "lock.hpp"

namespace rota::async {

namespace {
// Spin briefly, then give the core back to the OS scheduler.
inline void backoff(std::uint32_t &spins, std::uint32_t limit) noexcept {
    if (spins < limit) {
        ROTA_CPU_RELAX();
        ++spins;
    } else {
        std::this_thread::yield();
        spins = 0;
    }
}
}  // namespace

void SharedSpinlock::lock() noexcept {
    std::uint32_t spins = 0;

    // Claim the writer slot first so that new readers start backing off
    while (writer_.test_and_set(std::memory_order_seq_cst)) {
        backoff(spins, SPIN_COUNT);
    }

    // Then drain the readers that were already inside
    spins = 0;
    while (readers_.load(std::memory_order_seq_cst) != 0) {
        backoff(spins, SPIN_COUNT);
    }
}

void SharedSpinlock::unlock() noexcept {
    writer_.clear(std::memory_order_release);
}

auto SharedSpinlock::tryLock() noexcept -> bool {
    if (writer_.test_and_set(std::memory_order_seq_cst)) {
        return false;
    }
    if (readers_.load(std::memory_order_seq_cst) != 0) {
        writer_.clear(std::memory_order_release);
        return false;
    }
    return true;
}

void SharedSpinlock::lockShared() noexcept {
    std::uint32_t spins = 0;
    for (;;) {
        while (writer_.test(std::memory_order_relaxed)) {
            backoff(spins, SPIN_COUNT);
        }

        readers_.fetch_add(1, std::memory_order_seq_cst);
        if (!writer_.test(std::memory_order_seq_cst)) {
            return;
        }

        // A writer slipped in between the check and the increment
        readers_.fetch_sub(1, std::memory_order_release);
    }
}

void SharedSpinlock::unlockShared() noexcept {
    readers_.fetch_sub(1, std::memory_order_release);
}

auto SharedSpinlock::tryLockShared() noexcept -> bool {
    if (writer_.test(std::memory_order_relaxed)) {
        return false;
    }
    readers_.fetch_add(1, std::memory_order_seq_cst);
    if (!writer_.test(std::memory_order_seq_cst)) {
        return true;
    }
    readers_.fetch_sub(1, std::memory_order_release);
    return false;
}

}  // namespace rota::async
