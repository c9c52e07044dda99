/**
 * @file CollisionLayers.hpp
 * @brief Static symmetric layer-vs-layer collision matrix.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef RIFT_PHYSICS_COLLISIONLAYERS_HPP
    #define RIFT_PHYSICS_COLLISIONLAYERS_HPP

#include <rift/core/Constants.hpp>
#include <rift/core/Expected.hpp>
#include <rift/core/Types.hpp>

#include <array>

namespace rift::physics {

/**
 * @class CollisionLayers
 * @brief One bit per layer pair.  Every pair collides by default.
 */
class CollisionLayers final
{
public:
    static constexpr core::u32 kLayerCount = core::kCollisionLayerCount;

    CollisionLayers() noexcept { _rows.fill(kAllLayers); }

    /**
     * @brief Enables or disables collisions between two layers (both ways).
     * @return kOutOfRange when a layer index is not below kLayerCount.
     */
    [[nodiscard]] core::Expected<void> setCollides(core::u8 a, core::u8 b, bool enabled)
    {
        if (a >= kLayerCount || b >= kLayerCount)
        {
            return core::makeError(core::ErrorCode::kOutOfRange, "Collision layer out of range");
        }
        setBit(a, b, enabled);
        setBit(b, a, enabled);
        return {};
    }

    /** @brief Out-of-range layers never collide. */
    [[nodiscard]] bool collides(core::u8 a, core::u8 b) const noexcept
    {
        if (a >= kLayerCount || b >= kLayerCount)
        {
            return false;
        }
        return (_rows[a] >> b) & 1u;
    }

private:
    using Row = core::u16;
    static_assert(sizeof(Row) * 8 >= kLayerCount);

    static constexpr Row kAllLayers = static_cast<Row>((1u << kLayerCount) - 1u);

    void setBit(core::u8 row, core::u8 column, bool enabled) noexcept
    {
        if (enabled)
            _rows[row] = static_cast<Row>(_rows[row] | (1u << column));
        else
            _rows[row] = static_cast<Row>(_rows[row] & ~(1u << column));
    }

    std::array<Row, kLayerCount> _rows{};
};

} // namespace rift::physics

#endif // RIFT_PHYSICS_COLLISIONLAYERS_HPP
