/**
 * @file NonCopyable.hpp
 * @brief CRTP base classes that delete copy (and optionally move) operations.
 *
 * @version 0.1.0
 * @copyright MIT License
 */
#pragma once

#ifndef APHAL_CORE_NON_COPYABLE_HPP
    #define APHAL_CORE_NON_COPYABLE_HPP

namespace aphal::core {

/**
 * @brief Inherit (privately) to disable copy construction and assignment.
 * @tparam Derived The CRTP derived class.
 */
template <typename Derived>
class NonCopyable {
protected:
    NonCopyable()  = default;
    ~NonCopyable() = default;

    NonCopyable(const NonCopyable &)            = delete;
    NonCopyable &operator=(const NonCopyable &)  = delete;

    NonCopyable(NonCopyable &&)                 = default;
    NonCopyable &operator=(NonCopyable &&)       = default;
};

/**
 * @brief Inherit to pin an object in place: no copy, no move.
 *
 * Used by owners whose address is captured by asynchronous callbacks.
 * @tparam Derived The CRTP derived class.
 */
template <typename Derived>
class NonMovable {
protected:
    NonMovable()  = default;
    ~NonMovable() = default;

    NonMovable(const NonMovable &)            = delete;
    NonMovable &operator=(const NonMovable &)  = delete;
    NonMovable(NonMovable &&)                 = delete;
    NonMovable &operator=(NonMovable &&)       = delete;
};

} // namespace aphal::core

#endif // APHAL_CORE_NON_COPYABLE_HPP
