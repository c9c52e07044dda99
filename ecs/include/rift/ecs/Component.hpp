/**
 * @file Component.hpp
 * @brief Component identifiers and compile-time type mapping.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef RIFT_ECS_COMPONENT_HPP
    #define RIFT_ECS_COMPONENT_HPP

#include <rift/core/Types.hpp>

#include <concepts>
#include <string_view>

namespace rift::ecs {

/**
 * @enum ComponentId
 * @brief Compile-time enumeration of all known component types.
 *
 * Adding a new component requires appending to this enum, declaring the
 * struct in Components.hpp and specialising ComponentTraits for it.
 */
enum class ComponentId : core::u16
{
    Transform    = 0,
    Hitbox       = 1,
    Body         = 2,
    Character    = 3,
    PlayerInput  = 4,
    Owner        = 5,
    Replicated   = 6,
    Interpolated = 7,

    Count
};

/** @brief Human-readable component name (logs, test output). */
[[nodiscard]] constexpr std::string_view toString(ComponentId id) noexcept
{
    switch (id)
    {
        case ComponentId::Transform:    return "Transform";
        case ComponentId::Hitbox:       return "Hitbox";
        case ComponentId::Body:         return "Body";
        case ComponentId::Character:    return "Character";
        case ComponentId::PlayerInput:  return "PlayerInput";
        case ComponentId::Owner:        return "Owner";
        case ComponentId::Replicated:   return "Replicated";
        case ComponentId::Interpolated: return "Interpolated";
        case ComponentId::Count:        break;
    }
    return "Unknown";
}

/**
 * @struct ComponentTraits
 * @brief Maps a component struct to its ComponentId.
 *
 * Specialised next to each component definition.
 */
template <typename T>
struct ComponentTraits;

/** @brief True when @p T has a ComponentTraits specialisation. */
template <typename T>
concept Component = requires {
    { ComponentTraits<T>::kId } -> std::convertible_to<ComponentId>;
};

/** @brief ComponentId of @p T. */
template <Component T>
inline constexpr ComponentId kComponentIdOf = ComponentTraits<T>::kId;

} // namespace rift::ecs

#endif // RIFT_ECS_COMPONENT_HPP
