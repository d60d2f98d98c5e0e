/*
 * noncopyable.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2023-3-29

Description: Base classes that forbid copying (and moving) of lock-holding
             types.

**************************************************/

#ifndef ROTA_TYPE_NONCOPYABLE_HPP
#define ROTA_TYPE_NONCOPYABLE_HPP

#ifdef ROTA_USE_BOOST
#include <boost/core/noncopyable.hpp>
#endif

namespace rota {

/**
 * @brief Base class for types that must not be copied or moved.
 *
 * Locks and schedulers own atomics and OS primitives whose address is part
 * of their identity, so derived classes are pinned in place.
 */
class NonCopyable
#ifdef ROTA_USE_BOOST
    : private boost::noncopyable
#endif
{
protected:
    NonCopyable() = default;
    ~NonCopyable() = default;

#ifndef ROTA_USE_BOOST
public:
    NonCopyable(const NonCopyable&) = delete;
    auto operator=(const NonCopyable&) -> NonCopyable& = delete;
#endif

public:
    NonCopyable(NonCopyable&&) = delete;
    auto operator=(NonCopyable&&) -> NonCopyable& = delete;
};

}  // namespace rota

#endif  // ROTA_TYPE_NONCOPYABLE_HPP
