#include "beaconpp/UdpServer.hpp"
#include "beaconpp/DiscoveryResponder.hpp"
#include "beaconpp/SocketDisposedException.hpp"
#include "beaconpp/SocketException.hpp"

#include <exception>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

using namespace beaconpp;

namespace
{

template <typename T> std::shared_ptr<T> requireNonNull(std::shared_ptr<T> ptr, const char* what)
{
    if (!ptr)
        throw std::invalid_argument(std::string("UdpServer: ") + what + " must not be null");
    return ptr;
}

std::shared_ptr<const ResponderRegistry> buildRegistry(const std::shared_ptr<ServerHost>& host,
                                                       const std::shared_ptr<ReplySender>& sender,
                                                       const std::shared_ptr<Logger>& logger)
{
    auto registry = std::make_shared<ResponderRegistry>();
    const DiscoveryResponder responder(host, sender, logger);
    registry->add(std::string(DiscoveryPhrase), MatchKind::Substring, responder);
    registry->add(std::string(LegacyDiscoveryPhrase), MatchKind::Exact, responder);
    return registry;
}

} // namespace

UdpServer::UdpServer(std::shared_ptr<Logger> logger, std::shared_ptr<ServerHost> host, UdpServerOptions options,
                     Executor executor)
    : _logger(requireNonNull(std::move(logger), "logger")), _host(requireNonNull(std::move(host), "host")),
      _options(std::move(options)), _sender(std::make_shared<ReplySender>(_logger)),
      _registry(buildRegistry(_host, _sender, _logger)), _dispatcher(_registry, _logger, std::move(executor))
{
    if (_options.receiveBufferSize == 0)
        throw std::invalid_argument("UdpServer: receiveBufferSize must be greater than zero");
}

UdpServer::~UdpServer() noexcept
{
    dispose();
}

void UdpServer::start(const Port port)
{
    const std::lock_guard lock(_lifecycleMutex);

    switch (_state.load(std::memory_order_acquire))
    {
        case ServerState::Running:
            throw SocketException("UdpServer::start(): server is already running.");
        case ServerState::Stopped:
            throw SocketException("UdpServer::start(): server has been stopped and cannot be restarted.");
        case ServerState::Created:
            break;
    }

    auto socket = std::make_shared<DatagramSocket>(port, _options.bindAddress, _options.reuseAddress,
                                                   _options.dualStack, _options.wakeIntervalMillis);
    _sender->attach(socket);

    try
    {
        _receiveThread = std::thread(&UdpServer::receiveLoop, this, socket);
    }
    catch (const std::system_error&)
    {
        socket->close();
        throw SocketException("UdpServer::start(): unable to launch the receive thread.", std::current_exception());
    }

    _socket = std::move(socket);
    _state.store(ServerState::Running, std::memory_order_release);
    _logger->debug("Udp server listening on " + formatEndpoint(_socket->getLocalIp(), _socket->getLocalPort()));
}

void UdpServer::stop()
{
    std::shared_ptr<DatagramSocket> socket;
    std::thread receiveThread;
    {
        const std::lock_guard lock(_lifecycleMutex);
        _stopped.store(true, std::memory_order_release);
        _state.store(ServerState::Stopped, std::memory_order_release);
        socket = std::move(_socket);
        receiveThread = std::move(_receiveThread);
    }

    if (socket)
    {
        try
        {
            socket->close();
        }
        catch (const SocketException& ex)
        {
            _logger->error("Error closing udp socket", ex);
        }
    }

    if (receiveThread.joinable())
    {
        // A responder run inline on the loop thread may stop the server.
        if (receiveThread.get_id() == std::this_thread::get_id())
            receiveThread.detach();
        else
            receiveThread.join();
    }
}

void UdpServer::dispose() noexcept
{
    try
    {
        stop();
    }
    catch (const std::exception& ex)
    {
        _logger->error("Error disposing udp server", ex);
    }
}

void UdpServer::sendTo(const std::string_view text, const std::string& address, const Port port) const
{
    _sender->sendTo(text, address, port);
}

void UdpServer::sendTo(const std::span<const std::byte> bytes, const std::string& address, const Port port) const
{
    _sender->sendTo(bytes, address, port);
}

void UdpServer::sendTo(const std::span<const std::byte> bytes, const std::string& remoteEndpoint) const
{
    _sender->sendTo(bytes, remoteEndpoint);
}

Port UdpServer::getLocalPort() const
{
    const std::lock_guard lock(_lifecycleMutex);
    if (!_socket)
        throw SocketException("UdpServer::getLocalPort(): server is not running.");
    return _socket->getLocalPort();
}

void UdpServer::receiveLoop(const std::shared_ptr<DatagramSocket> socket)
{
    DatagramPacket packet(_options.receiveBufferSize);

    while (!_stopped.load(std::memory_order_acquire))
    {
        try
        {
            packet.resize(_options.receiveBufferSize);
            receiveDatagram(*socket, packet);
            onDatagramReceived(packet);
        }
        catch (const SocketDisposedException&)
        {
            break;
        }
        catch (const std::exception& ex)
        {
            _logger->error("Error in receive loop", ex);
        }
    }
}

void UdpServer::receiveDatagram(const DatagramSocket& socket, DatagramPacket& packet)
{
    socket.receive(packet);
}

void UdpServer::onDatagramReceived(const DatagramPacket& packet) const
{
    if (packet.port == 0)
        return;

    try
    {
        _dispatcher.dispatch(InboundMessage{packet.buffer, packet.endpoint()});
    }
    catch (const std::exception& ex)
    {
        _logger->error("Error handling UDP message", ex);
    }
}
