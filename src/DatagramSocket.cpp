#include "beaconpp/DatagramSocket.hpp"
#include "beaconpp/SocketDisposedException.hpp"
#include "beaconpp/SocketException.hpp"

#include <algorithm>
#include <mutex>
#include <utility>
#include <vector>

using namespace beaconpp;

namespace
{

sockaddr_in6 mapToIPv6(const sockaddr_in& addr4)
{
    sockaddr_in6 addr6{};
    addr6.sin6_family = AF_INET6;
    addr6.sin6_port = addr4.sin_port;
    addr6.sin6_addr.s6_addr[10] = 0xff;
    addr6.sin6_addr.s6_addr[11] = 0xff;
    std::memcpy(&addr6.sin6_addr.s6_addr[12], &addr4.sin_addr.s_addr, sizeof(addr4.sin_addr.s_addr));
    return addr6;
}

sockaddr_in unmapToIPv4(const sockaddr_in6& addr6)
{
    sockaddr_in addr4{};
    addr4.sin_family = AF_INET;
    addr4.sin_port = addr6.sin6_port;
    std::memcpy(&addr4.sin_addr.s_addr, addr6.sin6_addr.s6_addr + 12, sizeof(addr4.sin_addr.s_addr));
    return addr4;
}

} // namespace

DatagramSocket::DatagramSocket(const Port localPort, const std::string_view localAddress, const bool reuseAddress,
                               const bool dualStack, const int wakeIntervalMillis)
    : _wakeIntervalMillis(wakeIntervalMillis)
{
    if (wakeIntervalMillis <= 0)
        throw SocketException("DatagramSocket: wake interval must be positive.");

    // AI_PASSIVE with an empty host yields the wildcard address of each family.
    const auto localAddrInfoPtr =
        internal::resolveAddress(localAddress, localPort, AF_UNSPEC, SOCK_DGRAM, IPPROTO_UDP, AI_PASSIVE);

    // Dual-stack prefers IPv6 candidates; otherwise IPv4 goes first, IPv6 only as fallback.
    std::vector<addrinfo*> sorted;
    const int preferred = dualStack ? AF_INET6 : AF_INET;
    for (addrinfo* p = localAddrInfoPtr.get(); p; p = p->ai_next)
        if (p->ai_family == preferred)
            sorted.push_back(p);
    for (addrinfo* p = localAddrInfoPtr.get(); p; p = p->ai_next)
        if (p->ai_family != preferred)
            sorted.push_back(p);

    for (const auto* p : sorted)
    {
        _sockFd = ::socket(p->ai_family, p->ai_socktype, p->ai_protocol);
        if (_sockFd != INVALID_SOCKET)
        {
            _family = p->ai_family;
            break;
        }
    }

    if (_sockFd == INVALID_SOCKET)
        internal::throwLastSockError();

    try
    {
        if (_family == AF_INET6)
            setOption(IPPROTO_IPV6, IPV6_V6ONLY, dualStack ? 0 : 1);

        setOption(SOL_SOCKET, SO_REUSEADDR, reuseAddress ? 1 : 0);

        bind(localAddress, localPort);
    }
    catch (const SocketException&)
    {
        cleanupAndRethrow();
    }
}

DatagramSocket::~DatagramSocket() noexcept
{
    try
    {
        close();
    }
    catch (const SocketException&)
    {
        // Suppressed to keep the destructor noexcept.
    }
}

void DatagramSocket::cleanupAndRethrow()
{
    internal::tryCloseNoexcept(_sockFd);
    _sockFd = INVALID_SOCKET;
    _closed.store(true, std::memory_order_release);
    throw;
}

void DatagramSocket::close()
{
    if (_closed.exchange(true, std::memory_order_acq_rel))
        return;

    // Wakes a reader blocked in poll(). Unconnected UDP sockets report ENOTCONN here on some
    // platforms while still waking the reader, so the result carries no information.
    static_cast<void>(ShutdownSocket(_sockFd));

    std::unique_lock lock(_fdMutex);
    internal::closeOrThrow(std::exchange(_sockFd, INVALID_SOCKET));
}

void DatagramSocket::bind(const std::string_view localAddress, const Port localPort)
{
    const auto result = internal::resolveAddress(localAddress, localPort, _family, SOCK_DGRAM, IPPROTO_UDP, AI_PASSIVE);

    for (const addrinfo* p = result.get(); p != nullptr; p = p->ai_next)
    {
        if (::bind(_sockFd, p->ai_addr,
#ifdef _WIN32
                   static_cast<int>(p->ai_addrlen)
#else
                   p->ai_addrlen
#endif
                       ) == 0)
        {
            return;
        }
    }

    internal::throwLastSockError();
}

// NOLINTNEXTLINE(readability-make-member-function-const) - changes socket state
void DatagramSocket::setOption(const int level, const int optName, const int value)
{
    if (::setsockopt(_sockFd, level, optName,
#ifdef _WIN32
                     reinterpret_cast<const char*>(&value),
#else
                     &value,
#endif
                     static_cast<socklen_t>(sizeof(value))) < 0)
    {
        internal::throwLastSockError();
    }
}

int DatagramSocket::getOption(const int level, const int optName) const
{
    std::shared_lock lock(_fdMutex);
    if (_sockFd == INVALID_SOCKET)
        throw SocketDisposedException("DatagramSocket::getOption(): socket is not open.");

    int value = 0;
    auto len = static_cast<socklen_t>(sizeof(value));
    if (::getsockopt(_sockFd, level, optName,
#ifdef _WIN32
                     reinterpret_cast<char*>(&value),
#else
                     &value,
#endif
                     &len) < 0)
    {
        internal::throwLastSockError();
    }
    return value;
}

bool DatagramSocket::getReuseAddress() const
{
    return getOption(SOL_SOCKET, SO_REUSEADDR) != 0;
}

std::size_t DatagramSocket::receive(DatagramPacket& packet) const
{
    if (packet.buffer.empty())
        throw SocketException("DatagramSocket::receive(): packet buffer has no capacity.");

    const std::size_t capacity = (std::min) (packet.size(), MaxUdpPayloadIPv6);

    for (;;)
    {
        // The lock is dropped between poll slices so close() can take the descriptor away.
        std::shared_lock lock(_fdMutex);
        if (isClosed())
            throw SocketDisposedException("DatagramSocket::receive(): socket closed while waiting for a datagram.");

        pollfd pfd{};
        pfd.fd = _sockFd;
        pfd.events = POLLIN;

        const int rc = PollSocket(&pfd, 1, _wakeIntervalMillis);
        if (rc == 0)
            continue;
        if (rc < 0)
        {
            const int err = GetSocketError();
#ifndef _WIN32
            if (err == EINTR)
                continue;
#endif
            throw SocketException(err, SocketErrorMessage(err));
        }

        if (isClosed())
            throw SocketDisposedException("DatagramSocket::receive(): socket closed while waiting for a datagram.");

        sockaddr_storage src{};
        auto srcLen = static_cast<socklen_t>(sizeof(src));

        int flags = 0;
#ifndef _WIN32
        flags = MSG_DONTWAIT;
#endif

        const auto n = ::recvfrom(_sockFd,
#ifdef _WIN32
                                  reinterpret_cast<char*>(packet.buffer.data()), static_cast<int>(capacity),
#else
                                  packet.buffer.data(), capacity,
#endif
                                  flags, reinterpret_cast<sockaddr*>(&src), &srcLen);

        if (n == SOCKET_ERROR)
        {
            const int err = GetSocketError();
#ifdef _WIN32
            if (err == WSAEWOULDBLOCK)
                continue;
#else
            // NOLINTNEXTLINE
            if (err == EINTR || err == EAGAIN || err == EWOULDBLOCK)
                continue;
#endif
            throw SocketException(err, SocketErrorMessage(err));
        }

        const auto received = (std::min) (static_cast<std::size_t>(n), capacity);
        packet.resize(received);

        if (srcLen == 0 || (src.ss_family != AF_INET && src.ss_family != AF_INET6))
        {
            packet.address.clear();
            packet.port = 0;
        }
        else
        {
            internal::resolveNumericHostPort(reinterpret_cast<const sockaddr*>(&src), srcLen, packet.address,
                                             packet.port);
        }

        return received;
    }
}

bool DatagramSocket::hasPendingData(const int timeoutMillis) const
{
    std::shared_lock lock(_fdMutex);
    if (isClosed())
        throw SocketDisposedException("DatagramSocket::hasPendingData(): socket is not open.");

    pollfd pfd{};
    pfd.fd = _sockFd;
    pfd.events = POLLIN;

    for (;;)
    {
        const int rc = PollSocket(&pfd, 1, timeoutMillis);
        if (rc > 0)
            return (pfd.revents & POLLIN) != 0;
        if (rc == 0)
            return false;

        const int err = GetSocketError();
#ifndef _WIN32
        if (err == EINTR)
            continue;
#endif
        throw SocketException(err, SocketErrorMessage(err));
    }
}

void DatagramSocket::writeTo(const std::string_view host, const Port port, const std::span<const std::byte> data) const
{
    int flags = 0;
#ifdef AI_V4MAPPED
    if (_family == AF_INET6)
        flags |= AI_V4MAPPED;
#endif

    const auto addrInfo = internal::resolveAddress(host, port, _family, SOCK_DGRAM, IPPROTO_UDP, flags);
    const addrinfo* ai = addrInfo.get();

    std::shared_lock lock(_fdMutex);
    sendLocked(ai->ai_addr, static_cast<socklen_t>(ai->ai_addrlen), data);
}

void DatagramSocket::writeTo(const sockaddr_storage& addr, const socklen_t addrLen,
                             const std::span<const std::byte> data) const
{
    const auto* dest = reinterpret_cast<const sockaddr*>(&addr);
    auto destLen = addrLen;

    sockaddr_in6 mapped{};
    sockaddr_in unmapped{};

    if (_family == AF_INET6 && addr.ss_family == AF_INET)
    {
        mapped = mapToIPv6(*reinterpret_cast<const sockaddr_in*>(&addr));
        dest = reinterpret_cast<const sockaddr*>(&mapped);
        destLen = static_cast<socklen_t>(sizeof(mapped));
    }
    else if (_family == AF_INET && addr.ss_family == AF_INET6)
    {
        const auto& addr6 = *reinterpret_cast<const sockaddr_in6*>(&addr);
        if (!IN6_IS_ADDR_V4MAPPED(&addr6.sin6_addr))
            throw SocketException("DatagramSocket::writeTo(): IPv6 destination on an IPv4 socket.");
        unmapped = unmapToIPv4(addr6);
        dest = reinterpret_cast<const sockaddr*>(&unmapped);
        destLen = static_cast<socklen_t>(sizeof(unmapped));
    }

    std::shared_lock lock(_fdMutex);
    sendLocked(dest, destLen, data);
}

void DatagramSocket::sendLocked(const sockaddr* addr, const socklen_t addrLen, const std::span<const std::byte> data) const
{
    if (isClosed())
        throw SocketDisposedException("DatagramSocket::writeTo(): socket is not open.");

    if (data.size() > MaxUdpPayloadIPv6)
        throw SocketException("DatagramSocket::writeTo(): payload exceeds a single datagram.");

    internal::sendExactTo(_sockFd, data.data(), data.size(), addr, addrLen);
}

Port DatagramSocket::getLocalPort() const
{
    std::shared_lock lock(_fdMutex);
    if (isClosed())
        throw SocketDisposedException("DatagramSocket::getLocalPort(): socket is not open.");

    sockaddr_storage addr{};
    auto len = static_cast<socklen_t>(sizeof(addr));
    if (::getsockname(_sockFd, reinterpret_cast<sockaddr*>(&addr), &len) == SOCKET_ERROR)
        internal::throwLastSockError();

    return portFromSockaddr(reinterpret_cast<const sockaddr*>(&addr));
}

std::string DatagramSocket::getLocalIp() const
{
    std::shared_lock lock(_fdMutex);
    if (isClosed())
        throw SocketDisposedException("DatagramSocket::getLocalIp(): socket is not open.");

    sockaddr_storage addr{};
    auto len = static_cast<socklen_t>(sizeof(addr));
    if (::getsockname(_sockFd, reinterpret_cast<sockaddr*>(&addr), &len) == SOCKET_ERROR)
        internal::throwLastSockError();

    return ipFromSockaddr(reinterpret_cast<const sockaddr*>(&addr));
}
