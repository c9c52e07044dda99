/**
 * @file Interpolator.hpp
 * @brief Snapshot interpolation for entities the client does not control.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef RIFT_NET_NETCODE_INTERPOLATOR_HPP
    #define RIFT_NET_NETCODE_INTERPOLATOR_HPP

#include <rift/ecs/Components.hpp>
#include <rift/core/NonCopyable.hpp>
#include <rift/core/Types.hpp>

#include <deque>
#include <optional>
#include <unordered_map>

namespace rift::net::netcode {

struct InterpolationSample
{
    /// Server time of the snapshot, in seconds.
    core::f64      time{0.0};
    ecs::Transform transform{};
};

/**
 * @class Interpolator
 * @brief Per-entity sample buffers rendered a fixed delay behind the
 *        estimated server time.
 *
 * The rendered transform blends linearly between the two samples that
 * bracket (server time - delay).  Outside the buffered range it holds the
 * oldest or newest sample: nothing is ever extrapolated.
 */
class Interpolator final : public core::NonCopyable<Interpolator>
{
public:
    /**
     * @param delaySeconds Rendering delay behind the server clock.
     * @param capacity     Samples kept per entity.
     */
    explicit Interpolator(core::f64 delaySeconds, core::u32 capacity = 32);
    ~Interpolator();

    /**
     * @brief Adds a sample.  Samples not newer than the entity's latest one
     *        are ignored.
     */
    void push(core::u32 entityId, core::f64 time, const ecs::Transform& transform);

    /**
     * @brief Transform to display at @p serverTime.
     * @return std::nullopt when the entity has no sample.
     */
    [[nodiscard]] std::optional<ecs::Transform> sample(core::u32 entityId, core::f64 serverTime) const;

    void remove(core::u32 entityId);
    void clear() noexcept;

    [[nodiscard]] core::usize sampleCount(core::u32 entityId) const noexcept;
    [[nodiscard]] core::f64   delay() const noexcept { return _delay; }

private:
    core::f64                                                     _delay;
    core::u32                                                     _capacity;
    std::unordered_map<core::u32, std::deque<InterpolationSample>> _samples;
};

} // namespace rift::net::netcode

#endif // RIFT_NET_NETCODE_INTERPOLATOR_HPP
