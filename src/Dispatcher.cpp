#include "beaconpp/Dispatcher.hpp"

#include <stdexcept>
#include <thread>
#include <utility>

using namespace beaconpp;

Executor beaconpp::detachedThreadExecutor()
{
    return [](std::function<void()> task) { std::thread(std::move(task)).detach(); };
}

Dispatcher::Dispatcher(std::shared_ptr<const ResponderRegistry> registry, std::shared_ptr<Logger> logger,
                       Executor executor)
    : _registry(std::move(registry)), _logger(std::move(logger)), _executor(std::move(executor))
{
    if (!_registry)
        throw std::invalid_argument("Dispatcher: registry must not be null");
    if (!_logger)
        throw std::invalid_argument("Dispatcher: logger must not be null");
    if (!_executor)
        throw std::invalid_argument("Dispatcher: executor must not be empty");
}

std::optional<DispatchSelection> Dispatcher::select(const std::span<const std::byte> bytes) const
{
    for (const auto encoding : DecodingOrder)
    {
        if (auto match = _registry->lookup(decodeText(bytes, encoding)))
            return DispatchSelection{std::move(*match), encoding};
    }
    return std::nullopt;
}

bool Dispatcher::dispatch(const InboundMessage& message) const
{
    auto selection = select(message.bytes);
    if (!selection)
        return false;

    // The task owns copies of everything it touches, so it may outlive this Dispatcher.
    _executor(
        [handler = selection->match.entry->handler, text = std::move(selection->match.matchedText),
         endpoint = message.remoteEndpoint, encoding = selection->encoding, logger = _logger]
        {
            try
            {
                handler(text, endpoint, encoding);
            }
            catch (const std::exception& ex)
            {
                logger->error("Error in responder for " + endpoint, ex);
            }
            catch (...)
            {
                logger->error("Error in responder for " + endpoint + ": unknown exception");
            }
        });

    return true;
}
