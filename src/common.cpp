#include "beaconpp/common.hpp"

#include <system_error>

using namespace beaconpp;

std::string beaconpp::SocketErrorMessage(int error, [[maybe_unused]] const bool gaiStrerror /* = false */)
{
    if (error == 0)
        return {};

    // Some APIs return negative errno-like values.
    if (error < 0)
        error = -error;

#ifdef _WIN32
    if (gaiStrerror)
    {
        if (const char* m = ::gai_strerrorA(error); m && *m)
            return {m}; // gai_strerrorA uses a static buffer
    }

    {
        LPSTR buffer = nullptr;
        constexpr DWORD flags =
            FORMAT_MESSAGE_ALLOCATE_BUFFER | FORMAT_MESSAGE_FROM_SYSTEM | FORMAT_MESSAGE_IGNORE_INSERTS;
        constexpr DWORD lang = MAKELANGID(LANG_NEUTRAL, SUBLANG_DEFAULT);

        const DWORD size = ::FormatMessageA(flags, nullptr, static_cast<DWORD>(error), lang,
                                            reinterpret_cast<LPSTR>(&buffer), 0, nullptr);

        if (size != 0 && buffer)
        {
            std::string msg(buffer, size);
            ::LocalFree(buffer);

            while (!msg.empty() && (msg.back() == '\r' || msg.back() == '\n' || msg.back() == ' ' || msg.back() == '.'))
                msg.pop_back();

            if (!msg.empty())
                return msg;
        }
    }
#else
    if (gaiStrerror)
    {
        if (const char* m = ::gai_strerror(error); m && *m)
            return {m};
    }
#endif

    try
    {
        if (std::string m = std::system_category().message(error); !m.empty())
            return m;
    }
    catch (const std::exception&)
    {
        // fall through to the numeric form
    }

    return "Unknown error " + std::to_string(error);
}

std::string beaconpp::ipFromSockaddr(const sockaddr* addr, const bool convertIPv4Mapped)
{
    char buf[INET6_ADDRSTRLEN] = {};

    if (addr->sa_family == AF_INET)
    {
        const auto* sa = reinterpret_cast<const sockaddr_in*>(addr);
        if (!inet_ntop(AF_INET, &sa->sin_addr, buf, sizeof(buf)))
            internal::throwLastSockError();
    }
    else if (addr->sa_family == AF_INET6)
    {
        const auto* sa6 = reinterpret_cast<const sockaddr_in6*>(addr);

        if (convertIPv4Mapped && IN6_IS_ADDR_V4MAPPED(&sa6->sin6_addr))
        {
            const uint8_t* b = &sa6->sin6_addr.s6_addr[12];
            return std::to_string(b[0]) + '.' + std::to_string(b[1]) + '.' + std::to_string(b[2]) + '.' +
                   std::to_string(b[3]);
        }

        if (!inet_ntop(AF_INET6, &sa6->sin6_addr, buf, sizeof(buf)))
            internal::throwLastSockError();
    }
    else
    {
        throw SocketException("Unsupported address family in ipFromSockaddr");
    }

    return {buf};
}

Port beaconpp::portFromSockaddr(const sockaddr* addr)
{
    switch (addr->sa_family)
    {
        case AF_INET:
            return ntohs(reinterpret_cast<const sockaddr_in*>(addr)->sin_port);

        case AF_INET6:
            return ntohs(reinterpret_cast<const sockaddr_in6*>(addr)->sin6_port);

        default:
            throw SocketException("Unsupported address family in portFromSockaddr");
    }
}

std::string beaconpp::formatEndpoint(const std::string_view host, const Port port)
{
    std::string text;
    if (host.find(':') != std::string_view::npos)
    {
        text.reserve(host.size() + 8);
        text.append("[").append(host).append("]");
    }
    else
    {
        text.assign(host);
    }
    return text.append(":").append(std::to_string(port));
}

socklen_t beaconpp::parseEndpoint(const std::string& text, sockaddr_storage& addr)
{
    std::memset(&addr, 0, sizeof(addr));

    // Last ':' separates the port, so un-bracketed IPv6 hosts still parse.
    const auto pos = text.rfind(':');
    if (pos == std::string::npos || pos == 0 || pos + 1 == text.size())
        throw SocketException("Invalid endpoint format: " + text);

    std::string host = text.substr(0, pos);
    if (host.size() >= 2 && host.front() == '[' && host.back() == ']')
        host = host.substr(1, host.size() - 2);
    if (host.empty())
        throw SocketException("Invalid endpoint format: " + text);

    const std::string portText = text.substr(pos + 1);
    if (portText.find_first_not_of("0123456789") != std::string::npos || portText.size() > 5)
        throw SocketException("Invalid endpoint port: " + text);

    const auto raw = std::strtoul(portText.c_str(), nullptr, 10);
    if (raw > static_cast<unsigned long>((std::numeric_limits<Port>::max)()))
        throw SocketException("Invalid endpoint port: " + text);

    const auto res = internal::resolveAddress(host, static_cast<Port>(raw), AF_UNSPEC, SOCK_DGRAM, IPPROTO_UDP,
                                              AI_NUMERICHOST | AI_NUMERICSERV);

    std::memcpy(&addr, res->ai_addr, res->ai_addrlen);
    return static_cast<socklen_t>(res->ai_addrlen);
}

void internal::sendExactTo(const SOCKET fd, const void* data, std::size_t size, const sockaddr* addr,
                           const socklen_t addrLen)
{
    if (fd == INVALID_SOCKET)
        throw SocketException("sendExactTo(): invalid socket");

    int flags = 0;
#ifndef _WIN32
    flags = MSG_NOSIGNAL;
#endif

    const auto sent = ::sendto(fd,
#ifdef _WIN32
                               static_cast<const char*>(data), static_cast<int>(size),
#else
                               data, size,
#endif
                               flags, addr, addrLen);

    if (sent == SOCKET_ERROR)
        throwLastSockError();

    if (static_cast<std::size_t>(sent) != size)
        throw SocketException("sendExactTo(): partial datagram was sent.");
}
