/**
 * @file Reconciliation.cpp
 * @brief Reconciliation implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <rift/net/netcode/Reconciliation.hpp>
#include <rift/core/Log.hpp>

#include <string>

namespace rift::net::netcode {

Reconciliation::Reconciliation(Prediction& prediction, core::f32 epsilon)
    : _prediction{prediction}
    , _epsilon{epsilon}
{}

Reconciliation::~Reconciliation() = default;

ReconcileResult Reconciliation::reconcile(const PredictedState& authoritative,
                                          core::Sequence ackedSequence,
                                          const ApplyStateCallback& applyState,
                                          const ResimulateCallback& resimulate)
{
    ReconcileResult result;
    _prediction.discardBefore(ackedSequence);

    PredictedState corrected = authoritative;
    auto* acked = _prediction.find(ackedSequence);
    if (acked)
    {
        result.positionError = math::distance(acked->result.transform.position, authoritative.transform.position);
        result.velocityError = math::distance(acked->result.transform.velocity, authoritative.transform.velocity);
        if (result.positionError <= _epsilon && result.velocityError <= _epsilon)
        {
            return result;
        }
        corrected.character.actions = acked->result.character.actions;
        acked->result               = corrected;
    }
    else if (_prediction.pendingCount() == 0)
    {
        // Nothing predicted past the ack: the authoritative state is the present.
        applyState(authoritative);
        return result;
    }

    result.diverged = true;
    applyState(corrected);

    for (core::usize i = 0; i < _prediction.pendingCount(); ++i)
    {
        auto& entry = _prediction[i];
        if (entry.sequence <= ackedSequence)
        {
            continue;
        }
        entry.result = resimulate(entry.command);
        ++result.replayed;
    }

    core::Log::debug("NET", "ReconciliationDivergence at input " + std::to_string(ackedSequence) +
                                ": position error " + std::to_string(result.positionError) +
                                ", velocity error " + std::to_string(result.velocityError) +
                                ", replayed " + std::to_string(result.replayed));
    return result;
}

} // namespace rift::net::netcode
