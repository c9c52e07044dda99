/**
 * @file PacketQueue.hpp
 * @brief Thread-safe FIFO of inbound datagrams.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef RIFT_NET_PACKETQUEUE_HPP
    #define RIFT_NET_PACKETQUEUE_HPP

#include <rift/core/Types.hpp>
#include <rift/core/NonCopyable.hpp>

#include <deque>
#include <mutex>
#include <vector>

namespace rift::net {

/**
 * @struct Datagram
 * @brief Raw bytes received from (or addressed to) one peer.
 *
 * On the client side @c clientId is unused and left at kNoClient.
 */
struct Datagram
{
    core::ClientId          clientId{core::kNoClient};
    std::vector<core::byte> bytes;
};

/**
 * @class PacketQueue
 * @brief Mutex-protected queue filled by a transport's receiver and drained
 *        by the tick loop.  Arrival order is preserved.
 */
class PacketQueue final : public core::NonCopyable<PacketQueue>
{
public:
    PacketQueue() = default;
    ~PacketQueue() = default;

    /** @brief Pushes a datagram into the queue. */
    void push(Datagram datagram);

    /**
     * @brief Pops the oldest datagram.
     * @param[out] out Filled with the datagram if available.
     * @return @c true if a datagram was dequeued.
     */
    bool pop(Datagram& out);

    /** @brief Removes and returns every queued datagram, oldest first. */
    [[nodiscard]] std::vector<Datagram> drain();

    [[nodiscard]] bool empty() const noexcept;
    [[nodiscard]] core::u32 size() const noexcept;

    /** @brief Discards all queued datagrams. */
    void clear();

private:
    mutable std::mutex   _mutex;
    std::deque<Datagram> _queue;
};

} // namespace rift::net

#endif // RIFT_NET_PACKETQUEUE_HPP
