/**
 * @file common.hpp
 * @brief Common platform and utility includes for beaconpp.
 */

#pragma once

#include "SocketException.hpp"

#include <cstddef> // std::size_t
#include <cstdint>
#include <cstdlib> // std::strtoul
#include <cstring> // Use std::memset()
#include <limits>
#include <memory>
#include <source_location>
#include <string>
#include <string_view>

#ifdef _WIN32

// Do not reorder includes here, because Windows headers have specific order requirements.
// clang-format off
#include <winsock2.h> // Must come first: socket, bind, recvfrom, sendto, etc.
#include <ws2tcpip.h> // TCP/IP functions: getaddrinfo, getnameinfo, inet_ntop, inet_pton
#include <windows.h>  // General Windows headers (e.g., FormatMessageA)
// clang-format on

#ifdef _MSC_VER
#pragma comment(lib, "Ws2_32.lib") // Winsock library
#endif

#else

// Assuming Linux
#include <arpa/inet.h>  //inet_ntop, inet_pton
#include <cerrno>       //errno
#include <netdb.h>      //addrinfo
#include <netinet/in.h> //sockaddr_in, sockaddr_in6
#include <poll.h>       //poll
#include <sys/socket.h> //socket
#include <sys/types.h>  //socket
#include <unistd.h>     //close

#endif

/**
 * @defgroup beaconpp beaconpp: UDP service-discovery responder
 * @brief All core classes and functions of the beaconpp discovery library.
 *
 * beaconpp listens on a UDP port for "who is X?" probes broadcast by clients on the local
 * network and answers each one, unicast, with a JSON descriptor of the local service.
 *
 * Example usage:
 * @code
 * #include <beaconpp/UdpServer.hpp>
 * @endcode
 */

/**
 * @defgroup core Core Utilities and Types
 * @ingroup beaconpp
 * @brief Platform abstractions, type aliases and address helpers used across beaconpp.
 */

/**
 * @defgroup internal Internal Helpers
 * @ingroup beaconpp
 * @brief Implementation-only utilities for internal use.
 *
 * @warning Do not rely on this module from user code. It is subject to change without notice.
 */

/**
 * @defgroup udp UDP Sockets
 * @ingroup beaconpp
 * @brief The datagram socket the responder reads probes from and writes replies to.
 */

/**
 * @defgroup discovery Discovery Pipeline
 * @ingroup beaconpp
 * @brief Decoding, responder matching, dispatch and reply sending.
 */

/**
 * @defgroup exceptions Exception Classes
 * @ingroup beaconpp
 * @brief Exception types used in beaconpp for error handling.
 */

/**
 * @defgroup utils Utility Functions
 * @ingroup beaconpp
 * @brief Public helpers for formatting and parsing endpoint text.
 *
 * @see formatEndpoint()
 * @see parseEndpoint()
 */

/**
 * @namespace beaconpp
 * @brief Service-discovery responder built on a small cross-platform UDP socket layer.
 *
 * Features:
 * - Exception-based error handling (SocketException)
 * - RAII-compliant resource management
 * - Support for both IPv4 and IPv6 endpoints
 * - Cross-platform compatibility (Windows/Unix)
 *
 * @note Unless a class documents otherwise, instances are not thread-safe.
 */
namespace beaconpp
{
#ifdef _WIN32

typedef long ssize_t;

inline int InitSockets()
{
    WSADATA WSAData;
    return WSAStartup(MAKEWORD(2, 2), &WSAData);
}

inline int CleanupSockets()
{
    return WSACleanup();
}

inline int GetSocketError()
{
    return WSAGetLastError();
}

// NOLINTNEXTLINE(misc-const-correctness) - changes socket state
inline int CloseSocket(SOCKET fd)
{
    return closesocket(fd);
}

inline int ShutdownSocket(SOCKET fd)
{
    return shutdown(fd, SD_BOTH);
}

inline int PollSocket(pollfd* fds, const unsigned long count, const int timeoutMillis)
{
    return WSAPoll(fds, count, timeoutMillis);
}

#define BEACONPP_DISPOSED_CODE WSAENOTSOCK

#else

typedef int SOCKET;
constexpr SOCKET INVALID_SOCKET = -1;
constexpr SOCKET SOCKET_ERROR = -1;

#define BEACONPP_DISPOSED_CODE EBADF

constexpr int InitSockets()
{
    return 0;
}
constexpr int CleanupSockets()
{
    return 0;
}
inline int GetSocketError()
{
    return errno;
}
inline int CloseSocket(const SOCKET fd)
{
    return close(fd);
}
inline int ShutdownSocket(const SOCKET fd)
{
    return shutdown(fd, SHUT_RDWR);
}
inline int PollSocket(pollfd* fds, const nfds_t count, const int timeoutMillis)
{
    return poll(fds, count, timeoutMillis);
}

#endif

/**
 * @brief Convert a socket-related error code to a human-readable message.
 *
 * @details
 * Produces best-effort text for errors reported via errno / WSAGetLastError() and, when
 * @p gaiStrerror is true, for EAI_* codes returned by getaddrinfo/getnameinfo.
 *
 * @param[in] error       Numeric error code.
 * @param[in] gaiStrerror True if @p error is an address-resolution (EAI_*) code.
 * @return A human-readable description, or an empty string when @p error is zero.
 *
 * @note Never throws.
 */
std::string SocketErrorMessage(int error, bool gaiStrerror = false);

/**
 * @typedef Port
 * @brief Type alias representing a UDP port number.
 * @ingroup core
 */
using Port = std::uint16_t;

/**
 * @brief Well-known UDP port discovery clients probe.
 * @ingroup core
 */
inline constexpr Port DefaultDiscoveryPort = 7359;

/**
 * @brief Maximum UDP payload size (in bytes) that is safely valid across common platforms.
 * @ingroup core
 *
 * 65507 bytes is the IPv4 limit (65535 minus the 8-byte UDP header and the 20-byte IPv4 header).
 * A probe is always a single datagram, so this is also the size of the receive buffer.
 */
inline constexpr std::size_t MaxDatagramPayloadSafe = 65507;

/**
 * @brief Maximum UDP payload size (in bytes) over IPv6.
 * @ingroup core
 */
inline constexpr std::size_t MaxUdpPayloadIPv6 = 65527;

/**
 * @brief Extracts the IP address from a socket address structure as a string.
 *
 * IPv4-mapped IPv6 addresses (`::ffff:a.b.c.d`) are reported in dotted IPv4 form when
 * @p convertIPv4Mapped is true.
 *
 * @throws SocketException if the address family is unsupported or conversion fails.
 */
std::string ipFromSockaddr(const sockaddr* addr, bool convertIPv4Mapped = true);

/**
 * @brief Extracts the port number (host byte order) from a socket address structure.
 *
 * @throws SocketException if the address family is unsupported.
 */
Port portFromSockaddr(const sockaddr* addr);

/**
 * @brief Formats a numeric host and port as endpoint text.
 * @ingroup utils
 *
 * Produces `"192.0.2.10:7359"` for IPv4 hosts and `"[fe80::1]:7359"` for IPv6 hosts, the form
 * handed to responders as the remote endpoint of a probe and accepted by parseEndpoint().
 *
 * @param[in] host Numeric IPv4 or IPv6 address.
 * @param[in] port Port in host byte order.
 * @return Endpoint text.
 */
std::string formatEndpoint(std::string_view host, Port port);

/**
 * @brief Parses endpoint text into a socket address.
 * @ingroup utils
 *
 * Accepts `"a.b.c.d:port"`, `"[v6addr]:port"` and, for compatibility, un-bracketed IPv6 where
 * the last `:` separates the port. Host and port must be numeric; no DNS lookup is performed.
 *
 * @param[in]  text Endpoint text, e.g. the output of formatEndpoint().
 * @param[out] addr Receives the resolved address.
 * @return Length of the meaningful part of @p addr.
 *
 * @throws SocketException if the text is malformed or the host is not a numeric address.
 */
socklen_t parseEndpoint(const std::string& text, sockaddr_storage& addr);

} // namespace beaconpp

namespace beaconpp::internal
{

/**
 * @brief Custom deleter for `addrinfo*` pointers returned by getaddrinfo().
 * @ingroup internal
 */
struct AddrinfoDeleter
{
    void operator()(addrinfo* p) const noexcept
    {
        if (p)
            freeaddrinfo(p);
    }
};

/**
 * @brief Smart pointer that manages `addrinfo*` resources returned by getaddrinfo().
 * @ingroup internal
 */
using AddrinfoPtr = std::unique_ptr<addrinfo, AddrinfoDeleter>;

/**
 * @brief Resolves a hostname and port into a list of usable socket addresses.
 * @ingroup internal
 *
 * @param host     Host name or numeric address; empty selects the wildcard (with AI_PASSIVE)
 *                 or loopback address.
 * @param port     Port in host byte order.
 * @param family   AF_INET, AF_INET6 or AF_UNSPEC.
 * @param socktype SOCK_DGRAM for UDP.
 * @param protocol IPPROTO_UDP or 0.
 * @param flags    getaddrinfo() flags (AI_PASSIVE, AI_NUMERICHOST, ...).
 * @return Owning pointer to the resolved list. Never null.
 *
 * @throws SocketException if resolution fails.
 */
[[nodiscard]] inline AddrinfoPtr resolveAddress(const std::string_view host, const Port port, const int family,
                                                const int socktype, const int protocol, const int flags = 0)
{
    addrinfo hints{};
    hints.ai_family = family;
    hints.ai_socktype = socktype;
    hints.ai_protocol = protocol;
    hints.ai_flags = flags;

    const std::string hostStr(host);
    const std::string portStr = std::to_string(port);

    addrinfo* raw = nullptr;
    if (const int ret = ::getaddrinfo(hostStr.empty() ? nullptr : hostStr.c_str(), portStr.c_str(), &hints, &raw);
        ret != 0)
    {
        throw SocketException(ret, SocketErrorMessage(ret, true));
    }

    return AddrinfoPtr{raw};
}

/**
 * @brief Sends an entire datagram to a specific destination.
 * @ingroup internal
 *
 * @throws SocketException if sendto() fails or the datagram was only partially sent.
 */
void sendExactTo(SOCKET fd, const void* data, std::size_t size, const sockaddr* addr, socklen_t addrLen);

/**
 * @brief Closes a socket descriptor without throwing.
 * @ingroup internal
 *
 * @return `true` if the descriptor was invalid or closed successfully.
 */
inline bool tryCloseNoexcept(const SOCKET fd) noexcept
{
    if (fd == INVALID_SOCKET)
        return true;
    return CloseSocket(fd) == 0;
}

/**
 * @brief Closes a socket descriptor, throwing on failure.
 * @ingroup internal
 *
 * @throws SocketException if the close fails.
 */
inline void closeOrThrow(const SOCKET fd)
{
    if (fd == INVALID_SOCKET)
        return;
    if (CloseSocket(fd) != 0)
    {
        const int error = GetSocketError();
        throw SocketException(error, SocketErrorMessage(error));
    }
}

/**
 * @brief Throws a SocketException for the calling thread's last socket error.
 * @ingroup internal
 *
 * When `BEACONPP_INCLUDE_ERROR_CONTEXT` is enabled the message carries the call site.
 */
[[noreturn]] inline void throwLastSockError(const std::source_location& loc = std::source_location::current())
{
    const int err = GetSocketError();
#if BEACONPP_INCLUDE_ERROR_CONTEXT
    std::string msg = SocketErrorMessage(err);
    msg.append(" [at ")
        .append(loc.file_name())
        .append(":")
        .append(std::to_string(loc.line()))
        .append(" ")
        .append(loc.function_name())
        .append("]");
    throw SocketException(err, std::move(msg));
#else
    (void) loc;
    throw SocketException(err, SocketErrorMessage(err));
#endif
}

/**
 * @brief Resolve numeric host and port from a socket address.
 * @ingroup internal
 *
 * @details
 * Calls `getnameinfo()` with `NI_NUMERICHOST | NI_NUMERICSERV` so no DNS lookup happens.
 * IPv4-mapped IPv6 senders are reported in dotted IPv4 form.
 *
 * @param[in]  sa   Pointer to a valid `sockaddr`.
 * @param[in]  len  Size of the structure pointed to by @p sa.
 * @param[out] host Receives the numeric host string.
 * @param[out] port Receives the port.
 *
 * @throws SocketException If `getnameinfo()` fails.
 */
inline void resolveNumericHostPort(const sockaddr* sa, const socklen_t len, std::string& host, Port& port)
{
    if (sa->sa_family == AF_INET6 &&
        IN6_IS_ADDR_V4MAPPED(&reinterpret_cast<const sockaddr_in6*>(sa)->sin6_addr))
    {
        host = ipFromSockaddr(sa, true);
        port = portFromSockaddr(sa);
        return;
    }

    char hostBuf[NI_MAXHOST]{};
    char servBuf[NI_MAXSERV]{};

    int flags = NI_NUMERICHOST | NI_NUMERICSERV;
#ifdef NI_NUMERICSCOPE
    flags |= NI_NUMERICSCOPE; // ensure scope id stays numeric on IPv6 link-local
#endif

    if (const int ret = ::getnameinfo(sa, len, hostBuf, sizeof(hostBuf), servBuf, sizeof(servBuf), flags); ret != 0)
    {
        throw SocketException(ret, SocketErrorMessage(ret, true));
    }

    const auto raw = std::strtoul(servBuf, nullptr, 10);
    if (raw > static_cast<unsigned long>((std::numeric_limits<Port>::max)()))
        throw SocketException("Port out of range for Port type.");

    host.assign(hostBuf);
    port = static_cast<Port>(raw);
}

} // namespace beaconpp::internal
