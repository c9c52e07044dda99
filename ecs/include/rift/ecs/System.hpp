/**
 * @file System.hpp
 * @brief System descriptor and interface.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef RIFT_ECS_SYSTEM_HPP
    #define RIFT_ECS_SYSTEM_HPP

#include <rift/ecs/Archetype.hpp>
#include <rift/core/Types.hpp>

#include <string_view>

namespace rift::ecs {

class Registry;
class Query;

/**
 * @struct SystemDescriptor
 * @brief Declares a system's identity, ordering and component requirements.
 *
 * Systems run in ascending @c priority; equal priorities keep registration
 * order.  The scheduler hands each system the entities whose archetype
 * contains @c required and none of @c excluded.
 */
struct SystemDescriptor
{
    std::string_view name;
    core::i32        priority{0};
    Archetype        required{};
    Archetype        excluded{};
};

/**
 * @class ISystem
 * @brief Abstract base for all ECS systems.
 *
 * Systems hold no entity state: everything lives in components.  They may
 * hold references to engine services (collision engine, configuration).
 */
class ISystem
{
public:
    virtual ~ISystem() = default;

    /** @brief Returns the static descriptor for this system. */
    [[nodiscard]] virtual const SystemDescriptor& descriptor() const noexcept = 0;

    /**
     * @brief Executes the system logic for one tick.
     * @param registry Entity store (structural mutations are deferred).
     * @param entities Entities matching the descriptor.
     * @param dt       Fixed delta-time in seconds.
     */
    virtual void update(Registry& registry, const Query& entities, core::f32 dt) = 0;
};

} // namespace rift::ecs

#endif // RIFT_ECS_SYSTEM_HPP
