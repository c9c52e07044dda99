/**
 * @file Archetype.hpp
 * @brief Archetype definition: a unique set of component types.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef RIFT_ECS_ARCHETYPE_HPP
    #define RIFT_ECS_ARCHETYPE_HPP

#include <rift/ecs/Component.hpp>
#include <rift/core/Types.hpp>

#include <bitset>
#include <cstddef>
#include <initializer_list>
#include <span>

namespace rift::ecs {

/**
 * @class Archetype
 * @brief Describes a unique combination of component types.
 *
 * Internally a fixed-size bitset where bit N corresponds to
 * @c ComponentId(N).  Entities sharing the same Archetype are grouped
 * together by the Registry.  Also used as the required/excluded sets of a
 * query.
 */
class Archetype final
{
public:
    static constexpr core::usize kMaxComponents =
        static_cast<core::usize>(ComponentId::Count);

    static_assert(kMaxComponents <= 64, "Archetype masks are hashed as 64-bit words");

    using Mask = std::bitset<kMaxComponents>;

    /** @brief Default-constructs an empty archetype. */
    Archetype() noexcept = default;

    /**
     * @brief Constructs from a list of component IDs.
     * @param ids Span of component IDs that define this archetype.
     */
    explicit Archetype(std::span<const ComponentId> ids) noexcept;

    Archetype(std::initializer_list<ComponentId> ids) noexcept;

    /** @brief Archetype made of the components @p Ts. */
    template <Component... Ts>
    [[nodiscard]] static Archetype of() noexcept;

    /** @brief Adds a component to the archetype. */
    void add(ComponentId id) noexcept;

    /** @brief Removes a component from the archetype. */
    void remove(ComponentId id) noexcept;

    /** @brief Tests whether the archetype contains a given component. */
    [[nodiscard]] bool has(ComponentId id) const noexcept;

    /** @brief Tests whether this archetype is a superset of @p other. */
    [[nodiscard]] bool contains(const Archetype& other) const noexcept;

    /** @brief Tests whether the two archetypes share at least one component. */
    [[nodiscard]] bool intersects(const Archetype& other) const noexcept;

    /** @brief Returns the raw bitmask. */
    [[nodiscard]] const Mask& mask() const noexcept;

    /** @brief Returns the bitmask as an integer key. */
    [[nodiscard]] core::u64 bits() const noexcept;

    /** @brief Returns the number of component types in this archetype. */
    [[nodiscard]] core::usize count() const noexcept;

    [[nodiscard]] bool empty() const noexcept;

    /** @brief Equality. */
    [[nodiscard]] bool operator==(const Archetype& other) const noexcept;

private:
    Mask _mask{};
};

} // namespace rift::ecs

#include "Archetype.inl"

#endif // RIFT_ECS_ARCHETYPE_HPP
