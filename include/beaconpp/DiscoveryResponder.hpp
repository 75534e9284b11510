/**
 * @file DiscoveryResponder.hpp
 * @brief Answers discovery probes with the advertised service description.
 */

#pragma once

#include "Logger.hpp"
#include "ReplySender.hpp"
#include "ServerHost.hpp"
#include "TextEncoding.hpp"

#include <memory>
#include <string>

namespace beaconpp
{

/**
 * @class DiscoveryResponder
 * @ingroup discovery
 * @brief Responder handler registered for both discovery phrases.
 *
 * @details
 * Builds a DiscoveryReply from the ServerHost, serializes it as JSON, encodes the JSON in the
 * encoding the probe was decoded with and sends it back to the sender. When the host has no
 * reachable address a warning is logged and nothing is sent.
 *
 * A probe of the form `phrase|argument` additionally asks the host to treat `argument` as a
 * loopback alias. That request is honoured whether or not a reply went out.
 *
 * Copies share the host, sender and logger, so the handler can be stored in a `std::function`.
 */
class DiscoveryResponder
{
  public:
    /**
     * @throws std::invalid_argument if any argument is null.
     */
    DiscoveryResponder(std::shared_ptr<ServerHost> host, std::shared_ptr<ReplySender> sender,
                       std::shared_ptr<Logger> logger);

    void operator()(const std::string& matchedText, const std::string& remoteEndpoint, TextEncoding encoding) const;

  private:
    std::shared_ptr<ServerHost> _host;
    std::shared_ptr<ReplySender> _sender;
    std::shared_ptr<Logger> _logger;
};

} // namespace beaconpp
