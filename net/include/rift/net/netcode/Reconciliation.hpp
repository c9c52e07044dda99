/**
 * @file Reconciliation.hpp
 * @brief Client reconciliation: corrects the predicted present against
 *        authoritative state and re-applies unacknowledged inputs.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef RIFT_NET_NETCODE_RECONCILIATION_HPP
    #define RIFT_NET_NETCODE_RECONCILIATION_HPP

#include <rift/net/netcode/Prediction.hpp>
#include <rift/core/NonCopyable.hpp>
#include <rift/core/Types.hpp>

#include <functional>

namespace rift::net::netcode {

/** @brief Outcome of one reconcile() call. */
struct ReconcileResult
{
    bool      diverged{false};
    /// Inputs re-simulated to rebuild the predicted present.
    core::u32 replayed{0};
    core::f32 positionError{0.0f};
    core::f32 velocityError{0.0f};
};

/**
 * @class Reconciliation
 * @brief Compares the prediction recorded for the server-acknowledged input
 *        with the authoritative state.
 *
 * Position and velocity are checked separately, each against the same
 * epsilon.  Within tolerance the history is left untouched and nothing is
 * replayed.  Otherwise the authoritative state is adopted as the result of
 * the acknowledged input, and every later input is re-simulated in order,
 * overwriting its recorded result.
 */
class Reconciliation final : public core::NonCopyable<Reconciliation>
{
public:
    /** @brief Writes a state into the local world. */
    using ApplyStateCallback = std::function<void(const PredictedState&)>;

    /** @brief Runs one local tick for @p command and returns the result. */
    using ResimulateCallback = std::function<PredictedState(const protocol::InputCommand&)>;

    Reconciliation(Prediction& prediction, core::f32 epsilon);
    ~Reconciliation();

    /**
     * @brief Performs reconciliation.
     * @param authoritative State of the controlled entity in the snapshot.
     *                      Its action buffer is ignored: the client's own
     *                      buffer at @p ackedSequence is kept.
     * @param ackedSequence Last input the server applied (0 = none yet).
     */
    ReconcileResult reconcile(const PredictedState& authoritative,
                              core::Sequence ackedSequence,
                              const ApplyStateCallback& applyState,
                              const ResimulateCallback& resimulate);

    [[nodiscard]] core::f32 epsilon() const noexcept { return _epsilon; }

private:
    Prediction& _prediction;
    core::f32   _epsilon;
};

} // namespace rift::net::netcode

#endif // RIFT_NET_NETCODE_RECONCILIATION_HPP
