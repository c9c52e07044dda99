/**
 * @file UdpTransport.cpp
 * @brief POSIX UDP socket transport implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <rift/net/transport/UdpTransport.hpp>
#include <rift/core/Constants.hpp>
#include <rift/core/Log.hpp>

#include <cerrno>
#include <cstring>
#include <functional>
#include <map>
#include <mutex>
#include <thread>

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace rift::net::transport {

namespace {

constexpr int kPollTimeoutMs = 20;

[[nodiscard]] std::string lastError()
{
    return std::strerror(errno);
}

[[nodiscard]] core::Expected<int> openSocket()
{
    const int fd = ::socket(AF_INET, SOCK_DGRAM, 0);
    if (fd < 0)
    {
        return core::makeError(core::ErrorCode::kIoError, "socket() failed: " + lastError());
    }
    const int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags < 0 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0)
    {
        ::close(fd);
        return core::makeError(core::ErrorCode::kIoError, "fcntl(O_NONBLOCK) failed: " + lastError());
    }
    return fd;
}

/** @brief Address key used to map peers to client ids. */
[[nodiscard]] core::u64 endpointKey(const sockaddr_in& addr) noexcept
{
    return (static_cast<core::u64>(addr.sin_addr.s_addr) << 16) | addr.sin_port;
}

/**
 * @brief Receiver loop: waits on @p fd and hands every datagram to
 *        @p onDatagram until a stop is requested.
 */
void receiveLoop(std::stop_token stop, int fd,
                 const std::function<void(const sockaddr_in&, std::vector<core::byte>)>& onDatagram)
{
    std::vector<core::byte> buffer(core::kMaxDatagramSize);

    while (!stop.stop_requested())
    {
        pollfd pfd{fd, POLLIN, 0};
        const int ready = ::poll(&pfd, 1, kPollTimeoutMs);
        if (ready <= 0)
        {
            continue;
        }

        for (;;)
        {
            sockaddr_in from{};
            socklen_t fromLen = sizeof(from);
            const auto received = ::recvfrom(fd, buffer.data(), buffer.size(), 0,
                                             reinterpret_cast<sockaddr*>(&from), &fromLen);
            if (received < 0)
            {
                if (errno != EWOULDBLOCK && errno != EAGAIN && errno != ECONNREFUSED)
                {
                    core::Log::warn("NET", "recvfrom() failed: " + lastError());
                }
                break;
            }
            onDatagram(from, {buffer.begin(), buffer.begin() + received});
        }
    }
}

} // namespace

// ========================================================================== //
//  Server                                                                    //
// ========================================================================== //

struct UdpServerTransport::Impl
{
    core::u16    port;
    int          fd{-1};
    PacketQueue  inbox;
    std::jthread receiver;

    std::mutex                             peersMutex;
    std::map<core::u64, core::ClientId>    idByEndpoint;
    std::map<core::ClientId, sockaddr_in>  endpointById;
    core::ClientId                         nextClient{1};

    explicit Impl(core::u16 p) : port{p} {}

    core::ClientId resolve(const sockaddr_in& from)
    {
        std::lock_guard<std::mutex> lock{peersMutex};
        const auto key = endpointKey(from);
        if (const auto it = idByEndpoint.find(key); it != idByEndpoint.end())
        {
            return it->second;
        }
        const core::ClientId id = nextClient++;
        idByEndpoint.emplace(key, id);
        endpointById.emplace(id, from);
        return id;
    }
};

UdpServerTransport::UdpServerTransport(core::u16 port)
    : _impl{std::make_unique<Impl>(port)}
{}

UdpServerTransport::~UdpServerTransport()
{
    close();
}

core::Expected<void> UdpServerTransport::open()
{
    if (_impl->fd >= 0)
    {
        return core::makeError(core::ErrorCode::kInvalidState, "Socket already open");
    }
    _impl->fd = RIFT_TRY(openSocket());

    sockaddr_in addr{};
    addr.sin_family      = AF_INET;
    addr.sin_port        = htons(_impl->port);
    addr.sin_addr.s_addr = INADDR_ANY;

    if (::bind(_impl->fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0)
    {
        const auto reason = lastError();
        ::close(_impl->fd);
        _impl->fd = -1;
        return core::makeError(core::ErrorCode::kIoError,
                               "bind() to port " + std::to_string(_impl->port) + " failed: " + reason);
    }

    socklen_t len = sizeof(addr);
    if (::getsockname(_impl->fd, reinterpret_cast<sockaddr*>(&addr), &len) == 0)
    {
        _impl->port = ntohs(addr.sin_port);
    }

    Impl* impl = _impl.get();
    _impl->receiver = std::jthread{[impl](std::stop_token stop) {
        receiveLoop(stop, impl->fd, [impl](const sockaddr_in& from, std::vector<core::byte> bytes) {
            impl->inbox.push(Datagram{impl->resolve(from), std::move(bytes)});
        });
    }};

    core::Log::info("NET", "UDP server bound to port " + std::to_string(_impl->port));
    return {};
}

void UdpServerTransport::close()
{
    if (_impl->receiver.joinable())
    {
        _impl->receiver.request_stop();
        _impl->receiver.join();
    }
    if (_impl->fd >= 0)
    {
        ::close(_impl->fd);
        _impl->fd = -1;
    }
}

core::Expected<void> UdpServerTransport::sendToClient(core::ClientId client,
                                                      std::span<const core::byte> bytes)
{
    if (_impl->fd < 0)
    {
        return core::makeError(core::ErrorCode::kInvalidState, "Socket not open");
    }

    sockaddr_in addr{};
    {
        std::lock_guard<std::mutex> lock{_impl->peersMutex};
        const auto it = _impl->endpointById.find(client);
        if (it == _impl->endpointById.end())
        {
            return core::makeError(core::ErrorCode::kNotConnected,
                                   "Unknown UDP client " + std::to_string(client));
        }
        addr = it->second;
    }

    const auto sent = ::sendto(_impl->fd, bytes.data(), bytes.size(), 0,
                               reinterpret_cast<const sockaddr*>(&addr), sizeof(addr));
    if (sent < 0)
    {
        return core::makeError(core::ErrorCode::kIoError, "sendto() failed: " + lastError());
    }
    return {};
}

void UdpServerTransport::broadcast(std::span<const core::byte> bytes)
{
    std::vector<core::ClientId> clients;
    {
        std::lock_guard<std::mutex> lock{_impl->peersMutex};
        for (const auto& [id, addr] : _impl->endpointById)
        {
            clients.push_back(id);
        }
    }
    for (const auto id : clients)
    {
        if (auto sent = sendToClient(id, bytes); !sent)
        {
            core::Log::warn("NET", "Broadcast to client " + std::to_string(id) +
                                       " failed: " + sent.error().message());
        }
    }
}

std::vector<Datagram> UdpServerTransport::receive()
{
    return _impl->inbox.drain();
}

void UdpServerTransport::forget(core::ClientId client)
{
    std::lock_guard<std::mutex> lock{_impl->peersMutex};
    const auto it = _impl->endpointById.find(client);
    if (it == _impl->endpointById.end())
    {
        return;
    }
    _impl->idByEndpoint.erase(endpointKey(it->second));
    _impl->endpointById.erase(it);
}

std::string_view UdpServerTransport::name() const noexcept
{
    return "UdpServerTransport";
}

core::u16 UdpServerTransport::port() const noexcept
{
    return _impl->port;
}

// ========================================================================== //
//  Client                                                                    //
// ========================================================================== //

struct UdpClientTransport::Impl
{
    std::string  host;
    core::u16    port;
    int          fd{-1};
    PacketQueue  inbox;
    std::jthread receiver;

    Impl(std::string h, core::u16 p) : host{std::move(h)}, port{p} {}
};

UdpClientTransport::UdpClientTransport(std::string host, core::u16 port)
    : _impl{std::make_unique<Impl>(std::move(host), port)}
{}

UdpClientTransport::~UdpClientTransport()
{
    close();
}

core::Expected<void> UdpClientTransport::open()
{
    if (_impl->fd >= 0)
    {
        return core::makeError(core::ErrorCode::kInvalidState, "Socket already open");
    }

    addrinfo hints{};
    hints.ai_family   = AF_INET;
    hints.ai_socktype = SOCK_DGRAM;
    addrinfo* resolved = nullptr;
    const auto service = std::to_string(_impl->port);
    if (const int rc = ::getaddrinfo(_impl->host.c_str(), service.c_str(), &hints, &resolved); rc != 0)
    {
        return core::makeError(core::ErrorCode::kIoError,
                               "Cannot resolve " + _impl->host + ": " + ::gai_strerror(rc));
    }
    sockaddr_in server{};
    std::memcpy(&server, resolved->ai_addr, sizeof(server));
    ::freeaddrinfo(resolved);

    _impl->fd = RIFT_TRY(openSocket());
    if (::connect(_impl->fd, reinterpret_cast<const sockaddr*>(&server), sizeof(server)) < 0)
    {
        const auto reason = lastError();
        ::close(_impl->fd);
        _impl->fd = -1;
        return core::makeError(core::ErrorCode::kIoError, "connect() failed: " + reason);
    }

    Impl* impl = _impl.get();
    _impl->receiver = std::jthread{[impl](std::stop_token stop) {
        receiveLoop(stop, impl->fd, [impl](const sockaddr_in&, std::vector<core::byte> bytes) {
            impl->inbox.push(Datagram{core::kNoClient, std::move(bytes)});
        });
    }};

    core::Log::info("NET", "UDP client targeting " + _impl->host + ":" + service);
    return {};
}

void UdpClientTransport::close()
{
    if (_impl->receiver.joinable())
    {
        _impl->receiver.request_stop();
        _impl->receiver.join();
    }
    if (_impl->fd >= 0)
    {
        ::close(_impl->fd);
        _impl->fd = -1;
    }
}

core::Expected<void> UdpClientTransport::send(std::span<const core::byte> bytes)
{
    if (_impl->fd < 0)
    {
        return core::makeError(core::ErrorCode::kInvalidState, "Socket not open");
    }
    if (::send(_impl->fd, bytes.data(), bytes.size(), 0) < 0)
    {
        return core::makeError(core::ErrorCode::kIoError, "send() failed: " + lastError());
    }
    return {};
}

std::vector<std::vector<core::byte>> UdpClientTransport::receive()
{
    std::vector<std::vector<core::byte>> out;
    for (auto& datagram : _impl->inbox.drain())
    {
        out.push_back(std::move(datagram.bytes));
    }
    return out;
}

std::string_view UdpClientTransport::name() const noexcept
{
    return "UdpClientTransport";
}

} // namespace rift::net::transport
