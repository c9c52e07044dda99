/**
 * @file Session.cpp
 * @brief Session implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <rift/net/session/Session.hpp>

#include <algorithm>

namespace rift::net::session {

Session::Session(core::ClientId clientId, core::Tick currentTick)
    : _clientId{clientId}
    , _lastActivity{currentTick}
{}

Session::~Session() = default;

core::ClientId Session::clientId() const noexcept               { return _clientId; }
SessionState   Session::state() const noexcept                  { return _state; }
void           Session::setState(SessionState s) noexcept       { _state = s; }
void           Session::bindEntity(ecs::EntityId e) noexcept    { _entity = e; }
ecs::EntityId  Session::boundEntity() const noexcept            { return _entity; }

bool Session::pushInput(const protocol::InputCommand& command)
{
    if (command.sequence <= _lastInput.sequence)
    {
        return false;
    }

    const auto it = std::ranges::lower_bound(_inputs, command.sequence, {}, &protocol::InputCommand::sequence);
    if (it != _inputs.end() && it->sequence == command.sequence)
    {
        return false;
    }
    if (_inputs.size() >= core::kMaxBufferedInputs)
    {
        return false;
    }
    _inputs.insert(it, command);
    return true;
}

protocol::InputCommand Session::nextInput()
{
    if (_inputs.empty())
    {
        protocol::InputCommand repeat = _lastInput;
        repeat.actionFlags = ecs::kActionNone;
        return repeat;
    }
    _lastInput = _inputs.front();
    _inputs.pop_front();
    return _lastInput;
}

core::usize    Session::pendingInputs() const noexcept       { return _inputs.size(); }
core::Sequence Session::lastAppliedSequence() const noexcept { return _lastInput.sequence; }

void Session::acknowledgeSnapshot(core::Tick tick) noexcept
{
    _ackedTick = std::max(_ackedTick, tick);
}

core::Tick Session::ackedTick() const noexcept { return _ackedTick; }

void Session::markFullSnapshot(core::Tick tick) noexcept { _lastFullSnapshot = tick; }

std::optional<core::Tick> Session::lastFullSnapshot() const noexcept { return _lastFullSnapshot; }

core::u32 Session::recordMalformed() noexcept { return ++_malformed; }
core::u32 Session::consecutiveMalformed() const noexcept { return _malformed; }

void Session::touch(core::Tick tick) noexcept
{
    _lastActivity = tick;
    _malformed    = 0;
}

core::Tick Session::lastActivity() const noexcept { return _lastActivity; }

} // namespace rift::net::session
