/**
 * @file Registry.inl
 * @brief Typed component access for Registry.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef RIFT_ECS_REGISTRY_INL
    #define RIFT_ECS_REGISTRY_INL

#include <string>
#include <utility>

namespace rift::ecs {

template <Component T>
core::Expected<void> Registry::addComponent(EntityId id, const T& value)
{
    if (!isAlive(id))
    {
        return core::makeError(core::ErrorCode::kInvalidEntity,
                               "addComponent<" + std::string{toString(kComponentIdOf<T>)} +
                               ">: stale entity " + toString(id));
    }

    if (isDeferring())
    {
        defer([this, id, value] {
            if (isAlive(id))
            {
                _pools.pool<T>()[id.slot()] = value;
                attach(id, kComponentIdOf<T>);
            }
        });
        return {};
    }

    _pools.pool<T>()[id.slot()] = value;
    attach(id, kComponentIdOf<T>);
    return {};
}

template <Component T>
core::Expected<void> Registry::removeComponent(EntityId id)
{
    return removeComponent(id, kComponentIdOf<T>);
}

template <Component T>
T* Registry::getComponent(EntityId id)
{
    if (!hasComponent(id, kComponentIdOf<T>))
    {
        return nullptr;
    }
    return &_pools.pool<T>()[id.slot()];
}

template <Component T>
const T* Registry::getComponent(EntityId id) const
{
    if (!hasComponent(id, kComponentIdOf<T>))
    {
        return nullptr;
    }
    return &_pools.pool<T>()[id.slot()];
}

template <Component T>
bool Registry::hasComponent(EntityId id) const noexcept
{
    return hasComponent(id, kComponentIdOf<T>);
}

template <Component... Ts, typename Fn>
void Registry::each(Fn&& fn)
{
    IterationScope scope{*this};
    const Query entities = query(Archetype::of<Ts...>());
    for (EntityId id : entities)
    {
        fn(id, *getComponent<Ts>(id)...);
    }
}

} // namespace rift::ecs

#endif // RIFT_ECS_REGISTRY_INL
