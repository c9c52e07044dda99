/**
 * @file Archetype.inl
 * @brief Inline implementations for Archetype.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef RIFT_ECS_ARCHETYPE_INL
    #define RIFT_ECS_ARCHETYPE_INL

namespace rift::ecs {

inline Archetype::Archetype(std::span<const ComponentId> ids) noexcept
{
    for (auto id : ids)
    {
        _mask.set(static_cast<core::usize>(id));
    }
}

inline Archetype::Archetype(std::initializer_list<ComponentId> ids) noexcept
{
    for (auto id : ids)
    {
        _mask.set(static_cast<core::usize>(id));
    }
}

template <Component... Ts>
inline Archetype Archetype::of() noexcept
{
    Archetype archetype;
    (archetype.add(kComponentIdOf<Ts>), ...);
    return archetype;
}

inline void Archetype::add(ComponentId id) noexcept
{
    _mask.set(static_cast<core::usize>(id));
}

inline void Archetype::remove(ComponentId id) noexcept
{
    _mask.reset(static_cast<core::usize>(id));
}

inline bool Archetype::has(ComponentId id) const noexcept
{
    return _mask.test(static_cast<core::usize>(id));
}

inline bool Archetype::contains(const Archetype& other) const noexcept
{
    return (_mask & other._mask) == other._mask;
}

inline bool Archetype::intersects(const Archetype& other) const noexcept
{
    return (_mask & other._mask).any();
}

inline const Archetype::Mask& Archetype::mask() const noexcept
{
    return _mask;
}

inline core::u64 Archetype::bits() const noexcept
{
    return static_cast<core::u64>(_mask.to_ullong());
}

inline core::usize Archetype::count() const noexcept
{
    return _mask.count();
}

inline bool Archetype::empty() const noexcept
{
    return _mask.none();
}

inline bool Archetype::operator==(const Archetype& other) const noexcept
{
    return _mask == other._mask;
}

} // namespace rift::ecs

#endif // RIFT_ECS_ARCHETYPE_INL
