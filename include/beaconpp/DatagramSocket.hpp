/**
 * @file DatagramSocket.hpp
 * @brief UDP datagram socket abstraction for beaconpp.
 */

#pragma once

#include "common.hpp"
#include "DatagramPacket.hpp"

#include <atomic>
#include <cstddef>
#include <shared_mutex>
#include <span>
#include <string>
#include <string_view>

namespace beaconpp
{

/**
 * @brief Default upper bound, in milliseconds, on how long a pending receive takes to notice close().
 * @ingroup udp
 */
inline constexpr int DefaultWakeIntervalMillis = 250;

/**
 * @class DatagramSocket
 * @ingroup udp
 * @brief Bound UDP socket supporting one concurrent reader, any number of concurrent writers,
 *        and a close() that may be called from any thread.
 *
 * @details
 * The socket is created and bound in the constructor. It is meant to be shared (through a
 * `std::shared_ptr`) between the thread that reads probes and the threads that send replies.
 *
 * ### Closing while in use
 * close() marks the socket closed, shuts it down to wake a reader blocked in the kernel, and
 * then releases the descriptor once no receive or send is still using it. A receive() that is
 * waiting when this happens throws SocketDisposedException; so does any later call. Where the
 * platform does not wake the reader on shutdown, the reader still observes the close within
 * `wakeIntervalMillis`.
 *
 * ### Example
 * @code
 * auto socket = std::make_shared<DatagramSocket>(DefaultDiscoveryPort);
 * DatagramPacket packet(MaxDatagramPayloadSafe);
 * socket->receive(packet);
 * socket->writeTo(packet.address, packet.port, packet.bytes());
 * @endcode
 */
class DatagramSocket
{
  public:
    /**
     * @brief Creates a UDP socket and binds it to a local address and port.
     *
     * @param localPort          Port to bind; `0` lets the OS choose (see getLocalPort()).
     * @param localAddress       Local address to bind; empty binds the wildcard address.
     * @param reuseAddress       Enables `SO_REUSEADDR` before binding.
     * @param dualStack          Prefer an IPv6 socket that also accepts IPv4 (mapped) datagrams.
     *                           When false, an IPv4 wildcard socket is preferred.
     * @param wakeIntervalMillis Upper bound on the time a pending receive needs to observe close().
     *
     * @throws SocketException if the socket cannot be created, configured, or bound.
     */
    explicit DatagramSocket(Port localPort, std::string_view localAddress = "", bool reuseAddress = true,
                            bool dualStack = false, int wakeIntervalMillis = DefaultWakeIntervalMillis);

    /**
     * @brief Closes the socket. Errors during close are suppressed.
     */
    ~DatagramSocket() noexcept;

    DatagramSocket(const DatagramSocket&) = delete;
    DatagramSocket& operator=(const DatagramSocket&) = delete;
    DatagramSocket(DatagramSocket&&) = delete;
    DatagramSocket& operator=(DatagramSocket&&) = delete;

    /**
     * @brief Closes the socket. Idempotent and safe to call while another thread is receiving.
     *
     * Blocks until in-progress socket calls on other threads have left the descriptor.
     *
     * @throws SocketException if the operating system reports an error releasing the descriptor.
     */
    void close();

    /**
     * @brief Whether close() has been called.
     */
    [[nodiscard]] bool isClosed() const noexcept { return _closed.load(std::memory_order_acquire); }

    /**
     * @brief Waits for the next datagram and reads it into @p packet.
     *
     * `packet.size()` on entry is the capacity; a longer datagram is truncated. On return the
     * buffer holds the payload and `address`/`port` identify the sender.
     *
     * @return Number of payload bytes received.
     *
     * @throws SocketDisposedException if the socket is closed before or while waiting.
     * @throws SocketException on any other receive failure.
     */
    std::size_t receive(DatagramPacket& packet) const;

    /**
     * @brief Waits up to @p timeoutMillis for a datagram to become readable.
     *
     * @return `true` if a datagram is ready, `false` on timeout.
     *
     * @throws SocketDisposedException if the socket is closed.
     * @throws SocketException if polling fails.
     */
    [[nodiscard]] bool hasPendingData(int timeoutMillis) const;

    /**
     * @brief Sends one datagram to a host and port.
     *
     * @p host may be a numeric address or a name; it is resolved for this socket's address family.
     *
     * @throws SocketDisposedException if the socket is closed.
     * @throws SocketException if resolution or transmission fails.
     */
    void writeTo(std::string_view host, Port port, std::span<const std::byte> data) const;

    /**
     * @brief Sends one datagram to a resolved address.
     *
     * IPv4 destinations are mapped when this is an IPv6 dual-stack socket.
     *
     * @throws SocketDisposedException if the socket is closed.
     * @throws SocketException if the address family does not fit the socket or transmission fails.
     */
    void writeTo(const sockaddr_storage& addr, socklen_t addrLen, std::span<const std::byte> data) const;

    /**
     * @brief The port this socket is bound to.
     * @throws SocketException if the socket is closed or getsockname() fails.
     */
    [[nodiscard]] Port getLocalPort() const;

    /**
     * @brief The local IP this socket is bound to (wildcard address if bound to all interfaces).
     * @throws SocketException if the socket is closed or getsockname() fails.
     */
    [[nodiscard]] std::string getLocalIp() const;

    /**
     * @brief Whether `SO_REUSEADDR` is enabled on the socket.
     */
    [[nodiscard]] bool getReuseAddress() const;

  private:
    void bind(std::string_view localAddress, Port localPort);
    void setOption(int level, int optName, int value);
    [[nodiscard]] int getOption(int level, int optName) const;
    void cleanupAndRethrow();
    void sendLocked(const sockaddr* addr, socklen_t addrLen, std::span<const std::byte> data) const;

    SOCKET _sockFd = INVALID_SOCKET;      ///< Descriptor; released only by close() under the exclusive lock.
    int _family = AF_UNSPEC;              ///< Family the socket was created with.
    int _wakeIntervalMillis;              ///< Poll slice used by receive().
    std::atomic<bool> _closed{false};     ///< Set once by close().
    mutable std::shared_mutex _fdMutex;   ///< Shared by socket calls, exclusive while releasing the descriptor.
};

} // namespace beaconpp
