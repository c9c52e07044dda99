/**
 * @file Interpolator.cpp
 * @brief Interpolator implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <rift/net/netcode/Interpolator.hpp>

#include <algorithm>
#include <iterator>

namespace rift::net::netcode {

namespace {

[[nodiscard]] ecs::Transform blend(const ecs::Transform& a, const ecs::Transform& b, core::f32 t) noexcept
{
    ecs::Transform out;
    out.position = math::lerp(a.position, b.position, t);
    out.velocity = math::lerp(a.velocity, b.velocity, t);
    out.rotation = a.rotation + (b.rotation - a.rotation) * t;
    out.scale    = math::lerp(a.scale, b.scale, t);
    return out;
}

} // namespace

Interpolator::Interpolator(core::f64 delaySeconds, core::u32 capacity)
    : _delay{std::max(delaySeconds, 0.0)}
    , _capacity{std::max<core::u32>(capacity, 2)}
{}

Interpolator::~Interpolator() = default;

void Interpolator::push(core::u32 entityId, core::f64 time, const ecs::Transform& transform)
{
    auto& samples = _samples[entityId];
    if (!samples.empty() && time <= samples.back().time)
    {
        return;
    }
    if (samples.size() >= _capacity)
    {
        samples.pop_front();
    }
    samples.push_back({time, transform});
}

std::optional<ecs::Transform> Interpolator::sample(core::u32 entityId, core::f64 serverTime) const
{
    const auto it = _samples.find(entityId);
    if (it == _samples.end() || it->second.empty())
    {
        return std::nullopt;
    }

    const auto& samples   = it->second;
    const core::f64 render = serverTime - _delay;

    if (render <= samples.front().time)
    {
        return samples.front().transform;
    }
    if (render >= samples.back().time)
    {
        return samples.back().transform;
    }

    // First sample strictly after the render time; its predecessor brackets it.
    const auto next = std::ranges::upper_bound(samples, render, {}, &InterpolationSample::time);
    const auto prev = std::prev(next);
    const core::f64 span = next->time - prev->time;
    const auto t = static_cast<core::f32>((render - prev->time) / span);
    return blend(prev->transform, next->transform, t);
}

void Interpolator::remove(core::u32 entityId)
{
    _samples.erase(entityId);
}

void Interpolator::clear() noexcept
{
    _samples.clear();
}

core::usize Interpolator::sampleCount(core::u32 entityId) const noexcept
{
    const auto it = _samples.find(entityId);
    return it == _samples.end() ? 0 : it->second.size();
}

} // namespace rift::net::netcode
