/**
 * @file CollisionDetector.cpp
 * @brief Narrow-phase AABB test.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <rift/physics/CollisionDetector.hpp>

#include <algorithm>

namespace rift::physics {

CollisionResult CollisionDetector::testAABBvsAABB(const math::AABBf& a,
                                                  const math::AABBf& b) noexcept
{
    CollisionResult result{};

    if (!a.overlaps(b))
    {
        return result;
    }

    result.colliding = true;

    const core::f32 overlapX = std::min(a.max.x, b.max.x) - std::max(a.min.x, b.min.x);
    const core::f32 overlapY = std::min(a.max.y, b.max.y) - std::max(a.min.y, b.min.y);

    const auto ca = a.center();
    const auto cb = b.center();

    if (overlapX <= overlapY)
    {
        result.contact.normal           = math::Vec2f{(ca.x < cb.x) ? -1.0f : 1.0f, 0.0f};
        result.contact.penetrationDepth = overlapX;
    }
    else
    {
        result.contact.normal           = math::Vec2f{0.0f, (ca.y < cb.y) ? -1.0f : 1.0f};
        result.contact.penetrationDepth = overlapY;
    }

    result.contact.position = (ca + cb) * 0.5f;
    return result;
}

} // namespace rift::physics
