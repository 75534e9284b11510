/**
 * @file DatagramPacket.hpp
 * @brief UDP datagram packet class for beaconpp.
 */

#pragma once

#include "common.hpp"

#include <cstddef>
#include <span>
#include <string>
#include <vector>

namespace beaconpp
{

/**
 * @class DatagramPacket
 * @ingroup udp
 * @brief A received UDP datagram: payload bytes plus the sender's numeric address and port.
 *
 * Prepare a packet with a buffer large enough for the biggest datagram you accept and pass it to
 * DatagramSocket::receive(). On return the buffer is shrunk to the received payload and
 * `address`/`port` identify the sender.
 *
 * @code
 * beaconpp::DatagramPacket packet(beaconpp::MaxDatagramPayloadSafe);
 * socket.receive(packet);
 * std::cout << "Received " << packet.size() << " bytes from " << packet.endpoint() << std::endl;
 * @endcode
 */
class DatagramPacket
{
  public:
    /**
     * @brief Payload bytes. Sized to the receive capacity before a receive, to the payload after.
     */
    std::vector<std::byte> buffer;

    /**
     * @brief Numeric sender address (IPv4 dotted or IPv6 text).
     */
    std::string address{};

    /**
     * @brief Sender UDP port. `0` means no sender was recorded.
     */
    Port port = 0;

    /**
     * @brief Construct an empty DatagramPacket with a specified buffer size.
     * @param size Initial size of the buffer (default: 0).
     */
    explicit DatagramPacket(const std::size_t size = 0) : buffer(size) {}

    DatagramPacket(const DatagramPacket&) = default;
    DatagramPacket(DatagramPacket&&) noexcept = default;
    DatagramPacket& operator=(const DatagramPacket&) = default;
    DatagramPacket& operator=(DatagramPacket&&) noexcept = default;

    /**
     * @brief Resize the packet's buffer.
     * @param newSize The new size for the buffer.
     */
    void resize(const std::size_t newSize) { buffer.resize(newSize); }

    /**
     * @brief Number of valid bytes in the buffer.
     */
    [[nodiscard]] std::size_t size() const noexcept { return buffer.size(); }

    /**
     * @brief Read-only view over the payload.
     */
    [[nodiscard]] std::span<const std::byte> bytes() const noexcept { return buffer; }

    /**
     * @brief Sender as endpoint text (see formatEndpoint()).
     */
    [[nodiscard]] std::string endpoint() const { return formatEndpoint(address, port); }
};

} // namespace beaconpp
