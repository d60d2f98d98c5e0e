/*
 * lock.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-2-13

Description: Readers-writer locks used to publish schedules

**************************************************/

#ifndef ROTA_ASYNC_LOCK_HPP
#define ROTA_ASYNC_LOCK_HPP

#include <atomic>
#include <concepts>
#include <cstdint>
#include <shared_mutex>
#include <thread>
#include <utility>
#include <version>

#ifdef __cpp_lib_hardware_interference_size
#include <new>
#define ROTA_CACHE_LINE_SIZE std::hardware_destructive_interference_size
#else
#define ROTA_CACHE_LINE_SIZE 64
#endif

#ifdef ROTA_USE_BOOST_LOCKS
#include <boost/thread/shared_mutex.hpp>
#endif

#include "rota/type/noncopyable.hpp"

// Architecture-specific CPU relax instruction
#if defined(_MSC_VER)
#include <intrin.h>
#define ROTA_CPU_RELAX() _mm_pause()
#elif defined(__i386__) || defined(__x86_64__)
#define ROTA_CPU_RELAX() asm volatile("pause\n" : : : "memory")
#elif defined(__aarch64__) || defined(__arm__)
#define ROTA_CPU_RELAX() asm volatile("yield\n" : : : "memory")
#else
#define ROTA_CPU_RELAX() std::this_thread::yield()
#endif

namespace rota::async {

/**
 * @brief Lock concept, defines the basic requirements for a lock type
 */
template <typename T>
concept Lock = requires(T lock) {
    { lock.lock() } -> std::same_as<void>;
    { lock.unlock() } -> std::same_as<void>;
};

/**
 * @brief SharedLock concept, a Lock that can also be held by many readers
 */
template <typename T>
concept SharedLock = Lock<T> && requires(T lock) {
    { lock.lockShared() } -> std::same_as<void>;
    { lock.unlockShared() } -> std::same_as<void>;
};

// A cache line padding helper class to avoid false sharing
template <typename T>
struct alignas(ROTA_CACHE_LINE_SIZE) CacheAligned {
    T value{};

    CacheAligned() noexcept = default;
    explicit CacheAligned(const T &v) noexcept : value(v) {}

    T *operator->() noexcept { return &value; }
    const T *operator->() const noexcept { return &value; }
};

/**
 * @brief Thread-blocking readers-writer lock on top of std::shared_mutex.
 *
 * Waiters are parked by the OS until the lock becomes available.
 */
class StdSharedMutex : public NonCopyable {
    std::shared_mutex mutex_;

public:
    StdSharedMutex() = default;

    void lock() { mutex_.lock(); }
    void unlock() { mutex_.unlock(); }
    [[nodiscard]] auto tryLock() -> bool { return mutex_.try_lock(); }

    void lockShared() { mutex_.lock_shared(); }
    void unlockShared() { mutex_.unlock_shared(); }
    [[nodiscard]] auto tryLockShared() -> bool {
        return mutex_.try_lock_shared();
    }
};

/**
 * @brief Writer-preferring readers-writer spinlock.
 *
 * Waiters never park: they spin with a CPU relax hint and hand the core back
 * to the OS scheduler between attempts once spinning has gone on for a while.
 * A writer announces itself before draining readers, so new readers back off
 * and a pending writer cannot be starved by a steady stream of readers.
 */
class SharedSpinlock : public NonCopyable {
    alignas(ROTA_CACHE_LINE_SIZE) std::atomic_flag writer_ = ATOMIC_FLAG_INIT;
    alignas(ROTA_CACHE_LINE_SIZE) std::atomic<std::uint32_t> readers_{0};

    static constexpr std::uint32_t SPIN_COUNT = 64;

public:
    SharedSpinlock() noexcept = default;

    /**
     * @brief Acquires exclusive ownership, waiting for active readers to leave
     */
    void lock() noexcept;

    /**
     * @brief Releases exclusive ownership
     */
    void unlock() noexcept;

    /**
     * @brief Tries to acquire exclusive ownership without waiting
     * @return true if no writer held the lock and no reader was active
     */
    [[nodiscard]] auto tryLock() noexcept -> bool;

    /**
     * @brief Acquires shared ownership; waits while a writer holds or awaits
     * the lock
     */
    void lockShared() noexcept;

    /**
     * @brief Releases shared ownership
     */
    void unlockShared() noexcept;

    [[nodiscard]] auto tryLockShared() noexcept -> bool;

    /**
     * @brief Number of readers currently inside the lock
     */
    [[nodiscard]] auto readerCount() const noexcept -> std::uint32_t {
        return readers_.load(std::memory_order_relaxed);
    }
};

#ifdef ROTA_USE_BOOST_LOCKS
/**
 * @brief Wrapper around boost::shared_mutex
 */
class BoostSharedMutex : public NonCopyable {
    boost::shared_mutex mutex_;

public:
    BoostSharedMutex() = default;

    void lock() { mutex_.lock(); }
    void unlock() { mutex_.unlock(); }
    bool tryLock() { return mutex_.try_lock(); }

    void lockShared() { mutex_.lock_shared(); }
    void unlockShared() { mutex_.unlock_shared(); }
    bool tryLockShared() { return mutex_.try_lock_shared(); }
};
#endif

/**
 * @brief Scoped lock for any lock type satisfying the Lock concept
 * @tparam Mutex The lock type satisfying the Lock concept
 */
template <Lock Mutex>
class ScopedLock : public NonCopyable {
    Mutex &mutex_;
    bool locked_{true};

public:
    /**
     * @brief Constructs the scoped lock and acquires the provided mutex
     * @param mutex The mutex to lock
     */
    explicit ScopedLock(Mutex &mutex) noexcept(noexcept(mutex.lock()))
        : mutex_(mutex) {
        mutex_.lock();
    }

    ~ScopedLock() noexcept(noexcept(std::declval<Mutex>().unlock())) {
        if (locked_) {
            mutex_.unlock();
        }
    }

    /**
     * @brief Explicitly unlocks the guarded mutex
     */
    void unlock() noexcept(noexcept(std::declval<Mutex>().unlock())) {
        if (locked_) {
            mutex_.unlock();
            locked_ = false;
        }
    }
};

/**
 * @brief Scoped shared (reader) lock for any SharedLock
 */
template <SharedLock Mutex>
class ScopedSharedLock : public NonCopyable {
    Mutex &mutex_;
    bool locked_{true};

public:
    explicit ScopedSharedLock(Mutex &mutex) noexcept(
        noexcept(mutex.lockShared()))
        : mutex_(mutex) {
        mutex_.lockShared();
    }

    ~ScopedSharedLock() noexcept(
        noexcept(std::declval<Mutex>().unlockShared())) {
        if (locked_) {
            mutex_.unlockShared();
        }
    }

    void unlock() noexcept(noexcept(std::declval<Mutex>().unlockShared())) {
        if (locked_) {
            mutex_.unlockShared();
            locked_ = false;
        }
    }
};

}  // namespace rota::async

#endif  // ROTA_ASYNC_LOCK_HPP
