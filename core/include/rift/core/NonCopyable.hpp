/**
 * @file NonCopyable.hpp
 * @brief CRTP base class that deletes copy operations.
 *
 * Owners of simulation state (registries, schedulers, sessions) derive from
 * it so that a world can be moved into place but never silently duplicated.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef RIFT_CORE_NON_COPYABLE_HPP
    #define RIFT_CORE_NON_COPYABLE_HPP

namespace rift::core {

/**
 * @brief Inherit (publicly) to disable copy construction and assignment.
 * @tparam Derived The CRTP derived class.
 */
template <typename Derived>
class NonCopyable {
protected:
    NonCopyable()  = default;
    ~NonCopyable() = default;

    NonCopyable(const NonCopyable&)            = delete;
    NonCopyable& operator=(const NonCopyable&)  = delete;

    NonCopyable(NonCopyable&&)                 = default;
    NonCopyable& operator=(NonCopyable&&)       = default;
};

} // namespace rift::core

#endif // RIFT_CORE_NON_COPYABLE_HPP
