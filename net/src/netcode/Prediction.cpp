/**
 * @file Prediction.cpp
 * @brief Client-side prediction history implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <rift/net/netcode/Prediction.hpp>
#include <rift/core/Assert.hpp>

#include <algorithm>

namespace rift::net::netcode {

Prediction::Prediction(core::u32 limit)
    : _limit{std::clamp<core::u32>(limit, 1, core::kPredictionHistorySize)}
{}

Prediction::~Prediction() = default;

void Prediction::push(const PredictedInput& input)
{
    RIFT_ASSERT(_buffer.isEmpty() || input.sequence > _buffer.back().sequence);

    if (_buffer.size() >= _limit)
    {
        _buffer.dropFront(1);
    }
    _buffer.push(input);
}

void Prediction::discardBefore(core::Sequence sequence)
{
    core::usize count = 0;
    while (count < _buffer.size() && _buffer[count].sequence < sequence)
    {
        ++count;
    }
    _buffer.dropFront(count);
}

core::usize Prediction::indexOf(core::Sequence sequence) const noexcept
{
    // Sequences are strictly increasing: binary search over logical indices.
    core::usize lo = 0;
    core::usize hi = _buffer.size();
    while (lo < hi)
    {
        const core::usize mid = lo + (hi - lo) / 2;
        if (_buffer[mid].sequence < sequence)
        {
            lo = mid + 1;
        }
        else
        {
            hi = mid;
        }
    }
    return (lo < _buffer.size() && _buffer[lo].sequence == sequence) ? lo : _buffer.size();
}

PredictedInput* Prediction::find(core::Sequence sequence) noexcept
{
    const auto index = indexOf(sequence);
    return index < _buffer.size() ? &_buffer[index] : nullptr;
}

const PredictedInput* Prediction::find(core::Sequence sequence) const noexcept
{
    const auto index = indexOf(sequence);
    return index < _buffer.size() ? &_buffer[index] : nullptr;
}

PredictedInput& Prediction::operator[](core::usize index) { return _buffer[index]; }
const PredictedInput& Prediction::operator[](core::usize index) const { return _buffer[index]; }

core::u32 Prediction::pendingCount() const noexcept
{
    return static_cast<core::u32>(_buffer.size());
}

void Prediction::clear() noexcept
{
    _buffer.clear();
}

} // namespace rift::net::netcode
