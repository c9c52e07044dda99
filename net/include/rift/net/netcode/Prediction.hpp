/**
 * @file Prediction.hpp
 * @brief Client-side prediction history for inputs awaiting server ack.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef RIFT_NET_NETCODE_PREDICTION_HPP
    #define RIFT_NET_NETCODE_PREDICTION_HPP

#include <rift/net/protocol/Messages.hpp>
#include <rift/container/RingBuffer.hpp>
#include <rift/ecs/Components.hpp>
#include <rift/core/Constants.hpp>
#include <rift/core/NonCopyable.hpp>
#include <rift/core/Types.hpp>

namespace rift::net::netcode {

/**
 * @struct PredictedState
 * @brief State of the locally controlled entity after one predicted tick.
 */
struct PredictedState
{
    ecs::Transform transform{};
    ecs::Body      body{};
    ecs::Character character{};
};

/**
 * @struct PredictedInput
 * @brief An input frame and the state it produced, kept for re-simulation.
 */
struct PredictedInput
{
    core::Sequence         sequence{0};
    protocol::InputCommand command{};
    PredictedState         result{};
};

/**
 * @class Prediction
 * @brief Ring of predicted inputs, oldest first.
 *
 * Holds at most @c limit entries (bounded by kPredictionHistorySize); the
 * oldest entry is evicted when a new one does not fit.
 */
class Prediction final : public core::NonCopyable<Prediction>
{
public:
    using Buffer = container::RingBuffer<PredictedInput, core::kPredictionHistorySize>;

    explicit Prediction(core::u32 limit = core::kPredictionHistorySize);
    ~Prediction();

    /** @brief Stores a new predicted input.  Sequences must increase. */
    void push(const PredictedInput& input);

    /** @brief Drops every entry with a sequence below @p sequence. */
    void discardBefore(core::Sequence sequence);

    [[nodiscard]] PredictedInput*       find(core::Sequence sequence) noexcept;
    [[nodiscard]] const PredictedInput* find(core::Sequence sequence) const noexcept;

    /** @brief Entry at @p index, 0 being the oldest. */
    [[nodiscard]] PredictedInput&       operator[](core::usize index);
    [[nodiscard]] const PredictedInput& operator[](core::usize index) const;

    [[nodiscard]] core::u32 pendingCount() const noexcept;
    [[nodiscard]] core::u32 limit() const noexcept { return _limit; }

    void clear() noexcept;

private:
    [[nodiscard]] core::usize indexOf(core::Sequence sequence) const noexcept;

    core::u32 _limit;
    Buffer    _buffer;
};

} // namespace rift::net::netcode

#endif // RIFT_NET_NETCODE_PREDICTION_HPP
