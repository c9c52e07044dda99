/**
 * @file SystemScheduler.hpp
 * @brief Fixed-tick sequential scheduler ordered by system priority.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef RIFT_ECS_SYSTEMSCHEDULER_HPP
    #define RIFT_ECS_SYSTEMSCHEDULER_HPP

#include <rift/ecs/System.hpp>
#include <rift/core/Expected.hpp>
#include <rift/core/NonCopyable.hpp>
#include <rift/core/Types.hpp>

#include <memory>
#include <string_view>
#include <vector>

namespace rift::ecs {

/**
 * @class SystemScheduler
 * @brief Owns the registered systems and runs them once per tick.
 *
 * @par Ordering
 * Systems execute sequentially in ascending priority.  Ties are broken by
 * registration order, so later systems always observe the writes of earlier
 * ones (collision sees post-movement positions).
 *
 * @par Mutation
 * A tick runs inside a single Registry::IterationScope: structural changes
 * requested by any system are applied after the last system returns.
 */
class SystemScheduler final : public core::NonCopyable<SystemScheduler>
{
public:
    SystemScheduler();
    ~SystemScheduler();

    SystemScheduler(SystemScheduler&&) noexcept;
    SystemScheduler& operator=(SystemScheduler&&) noexcept;

    // --------------------------------------------------------------------- //
    //  Registration                                                          //
    // --------------------------------------------------------------------- //

    /**
     * @brief Registers a system instance.
     * @param system Owning pointer to the system.
     * @return kInvalidArgument for a null system, kAlreadyExists for a
     *         duplicate name, kOutOfRange past kMaxSystems.
     */
    [[nodiscard]] core::Expected<void> registerSystem(std::unique_ptr<ISystem> system);

    /** @brief Enables or disables a system by name. */
    [[nodiscard]] core::Expected<void> setEnabled(std::string_view name, bool enabled);

    [[nodiscard]] bool isEnabled(std::string_view name) const noexcept;

    /** @brief Returns the system registered under @p name, or nullptr. */
    [[nodiscard]] ISystem* find(std::string_view name) const noexcept;

    // --------------------------------------------------------------------- //
    //  Execution                                                             //
    // --------------------------------------------------------------------- //

    /**
     * @brief Runs all enabled systems for one tick in priority order.
     * @param registry Entity store the systems operate on.
     * @param dt       Fixed delta-time.
     */
    void tick(Registry& registry, core::f32 dt);

    /** @brief Names of the registered systems in execution order. */
    [[nodiscard]] std::vector<std::string_view> executionOrder() const;

    /** @brief Returns the number of registered systems. */
    [[nodiscard]] core::u32 systemCount() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace rift::ecs

#endif // RIFT_ECS_SYSTEMSCHEDULER_HPP
