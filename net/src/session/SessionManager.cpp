/**
 * @file SessionManager.cpp
 * @brief SessionManager implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <rift/net/session/SessionManager.hpp>
#include <rift/core/Log.hpp>

#include <map>
#include <string>

namespace rift::net::session {

struct SessionManager::Impl
{
    core::u32                                         maxSessions{core::kMaxSessions};
    std::map<core::ClientId, std::unique_ptr<Session>> sessions;
};

SessionManager::SessionManager(core::u32 maxSessions)
    : _impl{std::make_unique<Impl>()}
{
    _impl->maxSessions = maxSessions;
}

SessionManager::~SessionManager() = default;

core::Expected<Session*> SessionManager::connect(core::ClientId clientId, core::Tick tick)
{
    if (_impl->sessions.contains(clientId))
    {
        return core::makeError(core::ErrorCode::kAlreadyExists,
                               "Session already exists for client " + std::to_string(clientId));
    }
    if (_impl->sessions.size() >= _impl->maxSessions)
    {
        return core::makeError(core::ErrorCode::kOutOfRange, "Server full");
    }

    auto session = std::make_unique<Session>(clientId, tick);
    session->setState(SessionState::Connected);
    auto* ptr = session.get();
    _impl->sessions.emplace(clientId, std::move(session));
    core::Log::info("NET", "Client " + std::to_string(clientId) + " connected");
    return ptr;
}

core::Expected<void> SessionManager::disconnect(core::ClientId clientId)
{
    auto it = _impl->sessions.find(clientId);
    if (it == _impl->sessions.end())
    {
        return core::makeError(core::ErrorCode::kNotFound,
                               "No session for client " + std::to_string(clientId));
    }
    it->second->setState(SessionState::Disconnected);
    _impl->sessions.erase(it);
    core::Log::info("NET", "Client " + std::to_string(clientId) + " disconnected");
    return {};
}

Session* SessionManager::find(core::ClientId clientId) noexcept
{
    auto it = _impl->sessions.find(clientId);
    return (it != _impl->sessions.end()) ? it->second.get() : nullptr;
}

const Session* SessionManager::find(core::ClientId clientId) const noexcept
{
    auto it = _impl->sessions.find(clientId);
    return (it != _impl->sessions.end()) ? it->second.get() : nullptr;
}

void SessionManager::forEach(const std::function<void(Session&)>& callback)
{
    for (auto& [id, session] : _impl->sessions)
    {
        callback(*session);
    }
}

core::u32 SessionManager::reapTimedOut(core::Tick currentTick, core::u32 timeoutTicks,
                                       const std::function<void(Session&)>& onReaped)
{
    core::u32 reaped = 0;
    for (auto it = _impl->sessions.begin(); it != _impl->sessions.end(); )
    {
        const core::Tick idle = currentTick - it->second->lastActivity();
        if (idle > timeoutTicks)
        {
            it->second->setState(SessionState::Disconnected);
            if (onReaped)
            {
                onReaped(*it->second);
            }
            core::Log::info("NET", "Client " + std::to_string(it->first) + " timed out after " +
                                       std::to_string(idle) + " ticks");
            it = _impl->sessions.erase(it);
            ++reaped;
        }
        else
        {
            ++it;
        }
    }
    return reaped;
}

bool SessionManager::contains(core::ClientId clientId) const noexcept
{
    return _impl->sessions.contains(clientId);
}

core::u32 SessionManager::activeCount() const noexcept
{
    return static_cast<core::u32>(_impl->sessions.size());
}

} // namespace rift::net::session
