/**
 * @file UdpServer.hpp
 * @brief Discovery responder: owns the socket, the receive loop and the responder pipeline.
 */

#pragma once

#include "common.hpp"
#include "DatagramSocket.hpp"
#include "Dispatcher.hpp"
#include "Logger.hpp"
#include "ReplySender.hpp"
#include "ResponderRegistry.hpp"
#include "ServerHost.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <span>
#include <string>
#include <string_view>
#include <thread>

namespace beaconpp
{

/**
 * @brief Lifecycle state of a UdpServer. `Stopped` is terminal.
 * @ingroup discovery
 */
enum class ServerState : std::uint8_t
{
    Created,
    Running,
    Stopped
};

/**
 * @struct UdpServerOptions
 * @ingroup discovery
 * @brief Socket settings applied by UdpServer::start().
 */
struct UdpServerOptions
{
    std::string bindAddress{}; ///< Local address; empty binds the wildcard.
    bool reuseAddress = true;  ///< `SO_REUSEADDR` before bind.
    bool dualStack = false;    ///< Bind `::` with IPv4-mapped traffic instead of `0.0.0.0`.

    /// Largest datagram read in full; longer ones are truncated.
    std::size_t receiveBufferSize = MaxDatagramPayloadSafe;

    /// Upper bound on how long stop() waits for the receive loop to notice the close.
    int wakeIntervalMillis = DefaultWakeIntervalMillis;
};

/**
 * @class UdpServer
 * @ingroup discovery
 * @brief Listens for discovery probes on a UDP port and answers them.
 *
 * @details
 * Two responders are registered at construction, in priority order:
 * - a substring match on DiscoveryPhrase;
 * - an exact match (after trimming) on LegacyDiscoveryPhrase.
 *
 * Both answer with the JSON description produced by DiscoveryResponder.
 *
 * `start()` binds the socket and runs the receive loop on a background thread. Each matching
 * datagram is handed to its responder through the Executor without waiting, so a slow reply never
 * delays the next receive. `stop()` closes the socket, which ends the loop within one wake
 * interval; handlers already running are not awaited and find the socket closed if they try to
 * reply.
 *
 * A server is single-use: once stopped it cannot be restarted.
 *
 * @code
 * auto logger = std::make_shared<beaconpp::ConsoleLogger>();
 * auto host = std::make_shared<beaconpp::StaticServerHost>("http://192.168.1.20:8096", "abc123", "Living Room");
 * beaconpp::UdpServer server(logger, host);
 * server.start(beaconpp::DefaultDiscoveryPort);
 * // ...
 * server.stop();
 * @endcode
 */
class UdpServer
{
  public:
    /**
     * @param logger   Operational log for the loop, the responders and the sender.
     * @param host     The service being advertised.
     * @param options  Socket settings used by start().
     * @param executor Where responders run; defaults to one detached thread per datagram.
     *
     * @throws std::invalid_argument if @p logger or @p host is null, or @p executor is empty.
     */
    UdpServer(std::shared_ptr<Logger> logger, std::shared_ptr<ServerHost> host, UdpServerOptions options = {},
              Executor executor = detachedThreadExecutor());

    /**
     * @brief Disposes the server. Never throws.
     *
     * A subclass that overrides receiveDatagram() must call dispose() from its own destructor.
     */
    virtual ~UdpServer() noexcept;

    UdpServer(const UdpServer&) = delete;
    UdpServer& operator=(const UdpServer&) = delete;
    UdpServer(UdpServer&&) = delete;
    UdpServer& operator=(UdpServer&&) = delete;

    /**
     * @brief Binds to @p port and starts the receive loop.
     *
     * @param port Local port; `0` picks an ephemeral port (see getLocalPort()).
     *
     * @throws SocketException if the server was already started or stopped, or if the socket cannot
     *         be created or bound (e.g. the port is in use).
     */
    void start(Port port);

    /**
     * @brief Closes the socket and waits for the receive loop to exit.
     *
     * Does not wait for responders already launched. Calling stop() on a server that never started
     * only moves it to `Stopped`.
     *
     * @throws std::system_error if the receive thread cannot be joined.
     */
    void stop();

    /**
     * @brief stop() that may be called any number of times and never throws. Failures are logged.
     */
    void dispose() noexcept;

    /**
     * @brief UTF-8 encodes @p text and sends it to @p address : @p port.
     * @throws std::invalid_argument if @p text or @p address is empty.
     * @throws SocketException if the server is not running or transmission fails.
     */
    void sendTo(std::string_view text, const std::string& address, Port port) const;

    /**
     * @brief Sends @p bytes to @p address : @p port.
     * @throws std::invalid_argument if @p bytes or @p address is empty.
     * @throws SocketException if the server is not running or transmission fails.
     */
    void sendTo(std::span<const std::byte> bytes, const std::string& address, Port port) const;

    /**
     * @brief Sends @p bytes to @p remoteEndpoint; failures are logged, not thrown.
     * @throws std::invalid_argument if @p bytes or @p remoteEndpoint is empty.
     */
    void sendTo(std::span<const std::byte> bytes, const std::string& remoteEndpoint) const;

    /**
     * @brief Port the socket is bound to.
     * @throws SocketException if the server is not running.
     */
    [[nodiscard]] Port getLocalPort() const;

    [[nodiscard]] ServerState state() const noexcept { return _state.load(std::memory_order_acquire); }

  protected:
    /**
     * @brief Waits for the next datagram on @p socket; called by the receive loop only.
     *
     * The default reads from the socket. Any exception other than SocketDisposedException is
     * logged by the loop, which then carries on.
     */
    virtual void receiveDatagram(const DatagramSocket& socket, DatagramPacket& packet);

  private:
    void receiveLoop(std::shared_ptr<DatagramSocket> socket);
    void onDatagramReceived(const DatagramPacket& packet) const;

    std::shared_ptr<Logger> _logger;
    std::shared_ptr<ServerHost> _host;
    UdpServerOptions _options;
    std::shared_ptr<ReplySender> _sender;
    std::shared_ptr<const ResponderRegistry> _registry;
    Dispatcher _dispatcher;

    mutable std::mutex _lifecycleMutex;
    std::atomic<ServerState> _state{ServerState::Created};
    std::atomic<bool> _stopped{false};
    std::shared_ptr<DatagramSocket> _socket;
    std::thread _receiveThread;
};

} // namespace beaconpp
