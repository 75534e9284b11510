/**
 * @file ReplySender.hpp
 * @brief Sends replies through the responder's socket.
 */

#pragma once

#include "common.hpp"
#include "DatagramSocket.hpp"
#include "Logger.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <span>
#include <string>
#include <string_view>

namespace beaconpp
{

/**
 * @brief Turns endpoint text into a socket address; returns the address length.
 * @ingroup discovery
 *
 * Must throw if the text cannot be parsed. The default is parseEndpoint().
 */
using EndpointParser = std::function<socklen_t(const std::string& text, sockaddr_storage& addr)>;

/**
 * @class ReplySender
 * @ingroup discovery
 * @brief Writes datagrams on the socket the probes arrived on.
 *
 * @details
 * The socket is attached when the server starts and stays attached after it stops, so a responder
 * still running at that point gets a SocketDisposedException, which the endpoint overload logs.
 * All overloads are safe to call from several threads at once.
 *
 * Argument errors (empty payload, empty address) are programming errors and throw
 * `std::invalid_argument` from every overload. Transmission failures propagate from the
 * address/port overloads but are logged and swallowed by the endpoint overload, which is the one
 * responders use: discovery replies are best-effort.
 */
class ReplySender
{
  public:
    /**
     * @throws std::invalid_argument if @p logger is null or @p parser is empty.
     */
    explicit ReplySender(std::shared_ptr<Logger> logger, EndpointParser parser = &parseEndpoint);

    /**
     * @brief Sets the socket replies go out on.
     */
    void attach(std::shared_ptr<DatagramSocket> socket);

    /**
     * @brief UTF-8 encodes @p text and sends it to @p address : @p port.
     *
     * @throws std::invalid_argument if @p text or @p address is empty.
     * @throws SocketException if no socket is attached or transmission fails.
     */
    void sendTo(std::string_view text, const std::string& address, Port port) const;

    /**
     * @brief Sends @p bytes to @p address : @p port. UDP gives no delivery confirmation.
     *
     * @throws std::invalid_argument if @p bytes or @p address is empty.
     * @throws SocketException if no socket is attached or transmission fails.
     */
    void sendTo(std::span<const std::byte> bytes, const std::string& address, Port port) const;

    /**
     * @brief Sends @p bytes to the endpoint described by @p remoteEndpoint; fire-and-forget.
     *
     * Logs an info entry on success and an error entry on any failure; the caller is never told
     * whether the datagram went out.
     *
     * @throws std::invalid_argument if @p bytes or @p remoteEndpoint is empty.
     */
    void sendTo(std::span<const std::byte> bytes, const std::string& remoteEndpoint) const;

  private:
    [[nodiscard]] std::shared_ptr<DatagramSocket> socket() const;

    std::shared_ptr<Logger> _logger;
    EndpointParser _parser;
    mutable std::mutex _mutex;
    std::shared_ptr<DatagramSocket> _socket;
};

} // namespace beaconpp
