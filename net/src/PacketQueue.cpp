/**
 * @file PacketQueue.cpp
 * @brief PacketQueue implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <rift/net/PacketQueue.hpp>

#include <iterator>

namespace rift::net {

void PacketQueue::push(Datagram datagram)
{
    std::lock_guard<std::mutex> lock{_mutex};
    _queue.push_back(std::move(datagram));
}

bool PacketQueue::pop(Datagram& out)
{
    std::lock_guard<std::mutex> lock{_mutex};
    if (_queue.empty())
    {
        return false;
    }
    out = std::move(_queue.front());
    _queue.pop_front();
    return true;
}

std::vector<Datagram> PacketQueue::drain()
{
    std::lock_guard<std::mutex> lock{_mutex};
    std::vector<Datagram> out{std::make_move_iterator(_queue.begin()),
                              std::make_move_iterator(_queue.end())};
    _queue.clear();
    return out;
}

bool PacketQueue::empty() const noexcept
{
    std::lock_guard<std::mutex> lock{_mutex};
    return _queue.empty();
}

core::u32 PacketQueue::size() const noexcept
{
    std::lock_guard<std::mutex> lock{_mutex};
    return static_cast<core::u32>(_queue.size());
}

void PacketQueue::clear()
{
    std::lock_guard<std::mutex> lock{_mutex};
    _queue.clear();
}

} // namespace rift::net
