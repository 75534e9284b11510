#include "beaconpp/ReplySender.hpp"
#include "beaconpp/SocketException.hpp"
#include "beaconpp/TextEncoding.hpp"

#include <stdexcept>
#include <utility>

using namespace beaconpp;

ReplySender::ReplySender(std::shared_ptr<Logger> logger, EndpointParser parser)
    : _logger(std::move(logger)), _parser(std::move(parser))
{
    if (!_logger)
        throw std::invalid_argument("ReplySender: logger must not be null");
    if (!_parser)
        throw std::invalid_argument("ReplySender: endpoint parser must not be empty");
}

void ReplySender::attach(std::shared_ptr<DatagramSocket> socket)
{
    const std::lock_guard lock(_mutex);
    _socket = std::move(socket);
}

std::shared_ptr<DatagramSocket> ReplySender::socket() const
{
    std::shared_ptr<DatagramSocket> current;
    {
        const std::lock_guard lock(_mutex);
        current = _socket;
    }
    if (!current)
        throw SocketException("ReplySender: no socket attached; the server has not been started.");
    return current;
}

void ReplySender::sendTo(const std::string_view text, const std::string& address, const Port port) const
{
    if (text.empty())
        throw std::invalid_argument("ReplySender::sendTo(): text must not be empty");

    const auto bytes = encodeText(text, TextEncoding::Utf8);
    sendTo(bytes, address, port);
}

void ReplySender::sendTo(const std::span<const std::byte> bytes, const std::string& address, const Port port) const
{
    if (bytes.empty())
        throw std::invalid_argument("ReplySender::sendTo(): bytes must not be empty");
    if (address.empty())
        throw std::invalid_argument("ReplySender::sendTo(): address must not be empty");

    socket()->writeTo(address, port, bytes);
}

void ReplySender::sendTo(const std::span<const std::byte> bytes, const std::string& remoteEndpoint) const
{
    if (bytes.empty())
        throw std::invalid_argument("ReplySender::sendTo(): bytes must not be empty");
    if (remoteEndpoint.empty())
        throw std::invalid_argument("ReplySender::sendTo(): remoteEndpoint must not be empty");

    try
    {
        sockaddr_storage addr{};
        const socklen_t addrLen = _parser(remoteEndpoint, addr);

        socket()->writeTo(addr, addrLen, bytes);

        _logger->info("Udp message sent to " + remoteEndpoint);
    }
    catch (const std::exception& ex)
    {
        _logger->error("Error sending message to " + remoteEndpoint, ex);
    }
}
